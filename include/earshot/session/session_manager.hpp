#ifndef EARSHOT_SESSION_MANAGER_HPP
#define EARSHOT_SESSION_MANAGER_HPP

#include "earshot/capture/voice_state.hpp"
#include "earshot/env/environment_profile.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace earshot {

struct TriggerEntry {
    std::string identity;
    std::vector<std::string> phrases;   // canonical phrase first, then common mishearings
};

// Trigger-phrase gate with a single conversation session.
//
// While idle only a trigger phrase opens a session. While a session is active every
// non-empty utterance continues it, end phrases close it, and inactivity longer than the
// timeout expires it before the next utterance is looked at. A trigger phrase for another
// identity during an active session does not switch speakers.
class SessionManager {
public:
    using Clock = std::function<SteadyClock::time_point()>;

    static std::vector<TriggerEntry> defaultTriggers();

    struct Config {
        std::chrono::milliseconds timeout{30000};
        std::vector<TriggerEntry> triggers = defaultTriggers();

        std::vector<std::string> endPhrases = {
            "goodbye", "bye", "see you later", "talk to you later", "that's all",
            "thanks", "thank you", "stop", "exit", "done", "finished",
            "end conversation", "go away",
        };
        // During word games "done" and "finished" are answers, not goodbyes
        std::vector<std::string> wordGameEndPhrases = {
            "goodbye", "bye", "see you later", "talk to you later", "exit",
            "end conversation", "go away",
        };
    };

    // An empty clock means SteadyClock::now
    SessionManager(VoiceState& state, Config config, Clock clock = Clock());

    // Identity that owns the conversation after this utterance, empty when none does
    std::string onUtterance(const std::string& text, ListenMode mode = ListenMode::Normal);

    // Current identity, expiring the session first when it has timed out
    std::string activeIdentity();
    bool isActive() { return !activeIdentity().empty(); }

    void endSession();

    std::string matchTrigger(const std::string& text) const;
    bool isEndOfSession(const std::string& text, ListenMode mode) const;

private:
    VoiceState& state_;
    Config config_;
    Clock clock_;
};

}

#endif
