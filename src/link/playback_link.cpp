#include "earshot/link/playback_link.hpp"
#include "earshot/core/logging.hpp"
#include "earshot/core/text.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <utility>
#include <vector>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <cerrno>
  #include <arpa/inet.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <unistd.h>
#endif

#ifdef _WIN32
static void closesock(socket_t s) { ::closesocket(s); }
static std::string lastSocketError() { return "WSA error " + std::to_string(WSAGetLastError()); }
#else
static void closesock(socket_t s) { ::close(s); }
static std::string lastSocketError() { return std::strerror(errno); }
#endif

namespace earshot {

static const char* kTag = "Playback Link";

static std::string timestamp() { return std::to_string((double)std::time(nullptr)); }

// Constructor
PlaybackLink::PlaybackLink(std::string bind_ip, int port, VoiceState& state, SelfSpeechFilter* filter)
    : bind_ip_(std::move(bind_ip)), port_(port), state_(state), filter_(filter) {}

// Destructor
PlaybackLink::~PlaybackLink() { stop(); }

// Starts the receive thread
void PlaybackLink::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&PlaybackLink::run, this);
}

// Stops the receive thread. The thread may already have exited on a socket error.
void PlaybackLink::stop() {
    running_ = false;

    const socket_t s = sock_.exchange(kInvalidSocket);
    if (s != kInvalidSocket) {
#ifdef _WIN32
        ::shutdown(s, SD_BOTH);
#else
        ::shutdown(s, SHUT_RDWR);
#endif
        closesock(s);
    }

    if (thread_.joinable()) thread_.join();
}

bool PlaybackLink::handleMessage(const std::string& msg) {
    const std::string trimmed = collapseWhitespace(msg);
    const std::string command = toLower(trimmed.substr(0, trimmed.find(' ')));

    if (command == "speaking_start") {
        const size_t space = trimmed.find(' ');
        if (filter_) {
            if (space != std::string::npos) filter_->notePlaybackText(trimmed.substr(space + 1));
            else filter_->clearPlaybackText();
        }
        state_.setSpeaking(true);
        logDebug(kTag, "Assistant speaking");
        return true;
    }

    if (command == "speaking_end") {
        if (filter_) filter_->clearPlaybackText();
        state_.setSpeaking(false);
        logDebug(kTag, "Assistant finished speaking");
        return true;
    }

    logWarn(kTag, "Unknown message: " + trimmed);
    return false;
}

// Asks the player to cut the current audio
void PlaybackLink::stopImmediately() {
    const std::string msg = std::string("{\"type\":\"stop_playback\",\"ts\":") + timestamp() + "}";
    if (!sendToActive(msg)) logWarn(kTag, "No player to send stop_playback to");
    state_.setSpeaking(false);
}

// Hands a finished utterance to the conversation layer
bool PlaybackLink::sendUtterance(const std::string& identity, const std::string& text) {
    const std::string msg = std::string("{\"type\":\"utterance\",\"identity\":\"") + jsonEscape(identity) +
                            "\",\"text\":\"" + jsonEscape(text) + "\",\"ts\":" + timestamp() + "}";
    return sendToActive(msg);
}

// Lets the player know the conversation session is over
bool PlaybackLink::sendSessionDone() {
    const std::string msg = std::string("{\"type\":\"session_done\",\"ts\":") + timestamp() + "}";
    return sendToActive(msg);
}

std::string PlaybackLink::jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += (char)c;
                }
        }
    }
    return out;
}

// Remembers who to answer. The player may restart on a new port at any time.
void PlaybackLink::onDatagram(const std::string& senderIp, uint16_t senderPort, const std::string& msg) {
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        client_ = Endpoint{senderIp, senderPort};
        has_client_ = true;
    }
    handleMessage(msg);
}

static bool toSockaddr(const std::string& ip, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return ::inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
}

bool PlaybackLink::sendTo(const std::string& ip, uint16_t port, const std::string& payload) {
    const socket_t s = sock_.load();
    if (s == kInvalidSocket) return false;

    sockaddr_in to;
    if (!toSockaddr(ip, port, to)) return false;

    const auto sent = ::sendto(s, payload.data(), (int)payload.size(), 0,
                               reinterpret_cast<const sockaddr*>(&to), (int)sizeof(to));
    return sent == (decltype(sent))payload.size();
}

bool PlaybackLink::sendToActive(const std::string& payload) {
    Endpoint target;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (!has_client_) return false;
        target = client_;
    }
    return sendTo(target.ip, target.port, payload);
}

// Creates the UDP socket bound to bind_ip_:port_, or kInvalidSocket after logging why not
socket_t PlaybackLink::bindSocket() {
    sockaddr_in local;
    if (!toSockaddr(bind_ip_, static_cast<uint16_t>(port_), local)) {
        logError(kTag, "invalid bind ip: " + bind_ip_);
        return kInvalidSocket;
    }

    const socket_t s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s == kInvalidSocket) {
        logError(kTag, "socket() failed: " + lastSocketError());
        return kInvalidSocket;
    }

    const int reuse = 1;
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse));

    if (::bind(s, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0) {
        logError(kTag, "bind() to " + bind_ip_ + ":" + std::to_string(port_) + " failed: " + lastSocketError());
        closesock(s);
        return kInvalidSocket;
    }
    return s;
}

// Thread function: applies speaking notifications until stop() closes the socket
void PlaybackLink::run() {
#ifdef _WIN32
    WSADATA wsa{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0) {
        logError(kTag, "WSAStartup failed");
        running_ = false;
        return;
    }
#endif

    const socket_t s = bindSocket();
    if (s != kInvalidSocket) {
        sock_ = s;
        logInfo(kTag, "Listening on " + bind_ip_ + ":" + std::to_string(port_));

        std::vector<char> datagram(2048);
        while (running_.load()) {
            sockaddr_in from{};
            socklen_t fromLen = sizeof(from);
            const auto n = ::recvfrom(s, datagram.data(), (int)datagram.size(), 0,
                                      reinterpret_cast<sockaddr*>(&from), &fromLen);
            if (n <= 0) break;

            char sender[INET_ADDRSTRLEN] = "127.0.0.1";
            ::inet_ntop(AF_INET, &from.sin_addr, sender, sizeof(sender));
            onDatagram(sender, ntohs(from.sin_port), std::string(datagram.data(), (size_t)n));
        }

        const socket_t left = sock_.exchange(kInvalidSocket);
        if (left != kInvalidSocket) closesock(left);
    }
    running_ = false;

#ifdef _WIN32
    WSACleanup();
#endif
}

}
