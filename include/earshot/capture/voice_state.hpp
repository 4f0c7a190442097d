#ifndef EARSHOT_VOICE_STATE_HPP
#define EARSHOT_VOICE_STATE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <utility>

namespace earshot {

using SteadyClock = std::chrono::steady_clock;

struct ConversationSession {
    std::string activeIdentity;               // empty while idle
    SteadyClock::time_point lastInteraction{};
    std::chrono::milliseconds timeout{30000};

    bool isActive() const { return !activeIdentity.empty(); }
};

// State shared by the capture loop, the interrupt monitor and the playback link.
// The speaking flag and the conversation session sit behind one mutex.
class VoiceState {
public:
    VoiceState() = default;

    VoiceState(const VoiceState&) = delete;
    VoiceState& operator=(const VoiceState&) = delete;

    bool isSpeaking() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return speaking_;
    }

    void setSpeaking(bool speaking) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            speaking_ = speaking;
        }
        cv_.notify_all();
    }

    // Returns true as soon as the assistant is speaking, false when the timeout passes first
    template <typename Rep, typename Period>
    bool waitForSpeaking(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return speaking_; });
    }

    // Runs fn(session) under the state lock. fn must not block.
    template <typename Fn>
    auto withSession(Fn&& fn) -> decltype(fn(std::declval<ConversationSession&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(session_);
    }

    ConversationSession sessionSnapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool speaking_ = false;
    ConversationSession session_;
};

}

#endif
