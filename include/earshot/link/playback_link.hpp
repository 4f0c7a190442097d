#ifndef EARSHOT_PLAYBACK_LINK_HPP
#define EARSHOT_PLAYBACK_LINK_HPP

#include "earshot/capture/playback_control.hpp"
#include "earshot/capture/voice_state.hpp"
#include "earshot/filter/self_speech_filter.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#ifdef _WIN32
  #include <winsock2.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
#endif

namespace earshot {

// UDP link to the text-to-speech player process.
//
// Inbound datagrams (plain text):
//   "speaking_start"          the player started producing audio
//   "speaking_start <text>"   same, with the text being spoken
//   "speaking_end"            playback finished
// Outbound datagrams (JSON) go to whichever client spoke last:
//   {"type":"stop_playback","ts":...}
//   {"type":"utterance","identity":"...","text":"...","ts":...}
//   {"type":"session_done","ts":...}
class PlaybackLink : public PlaybackControl {
public:
    PlaybackLink(std::string bind_ip, int port, VoiceState& state, SelfSpeechFilter* filter = nullptr);
    ~PlaybackLink() override;

    PlaybackLink(const PlaybackLink&) = delete;
    PlaybackLink& operator=(const PlaybackLink&) = delete;

    void start();
    void stop();

    // Applies one inbound message. Returns false for messages it does not understand.
    bool handleMessage(const std::string& msg);

    void stopImmediately() override;

    bool sendUtterance(const std::string& identity, const std::string& text);
    bool sendSessionDone();

    bool sendTo(const std::string& ip, uint16_t port, const std::string& payload);
    bool sendToActive(const std::string& payload);

    static std::string jsonEscape(const std::string& s);

private:
    struct Endpoint {
        std::string ip;
        uint16_t port = 0;
    };

    void run();
    socket_t bindSocket();
    void onDatagram(const std::string& senderIp, uint16_t senderPort, const std::string& msg);

    std::string bind_ip_;
    int port_;
    VoiceState& state_;
    SelfSpeechFilter* filter_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<socket_t> sock_{kInvalidSocket};

    std::mutex client_mutex_;
    Endpoint client_;           // last sender, replies go here
    bool has_client_ = false;
};

}

#endif
