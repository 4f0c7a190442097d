#include "earshot/session/session_manager.hpp"
#include "earshot/core/logging.hpp"
#include "earshot/core/text.hpp"

#include <utility>

namespace earshot {

std::vector<TriggerEntry> SessionManager::defaultTriggers() {
    return {
        {"sophia", {"miley", "hey miley", "hi miley", "hello miley", "miley cyrus", "mily", "mailey"}},
        {"eladriel", {"dino", "hey dino", "hi dino", "hello dino", "dinosaur", "deeno", "dinah"}},
        {"parent", {"assistant", "hey assistant", "hi assistant", "hello assistant", "ai assistant", "hey ai", "computer"}},
    };
}

static bool expired(const ConversationSession& s, SteadyClock::time_point now) {
    return s.isActive() && now - s.lastInteraction > s.timeout;
}

// Constructor
SessionManager::SessionManager(VoiceState& state, Config config, Clock clock)
    : state_(state), config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return SteadyClock::now(); };
}

std::string SessionManager::matchTrigger(const std::string& text) const {
    for (const auto& entry : config_.triggers) {
        for (const auto& phrase : entry.phrases) {
            if (containsPhrase(text, phrase)) return entry.identity;
        }
    }
    return {};
}

bool SessionManager::isEndOfSession(const std::string& text, ListenMode mode) const {
    const auto& phrases = mode == ListenMode::WordGame ? config_.wordGameEndPhrases : config_.endPhrases;
    for (const auto& phrase : phrases) {
        if (containsPhrase(text, phrase)) return true;
    }
    return false;
}

std::string SessionManager::onUtterance(const std::string& text, ListenMode mode) {
    const SteadyClock::time_point now = clock_();
    const bool hasText = !normalizeText(text).empty();
    const bool endRequested = hasText && isEndOfSession(text, mode);
    const std::string trigger = hasText ? matchTrigger(text) : std::string();

    std::string expiredIdentity;
    std::string endedIdentity;
    bool started = false;

    const std::string identity = state_.withSession([&](ConversationSession& s) -> std::string {
        if (expired(s, now)) {
            expiredIdentity = s.activeIdentity;
            s = ConversationSession{};
        }

        if (!hasText) return s.activeIdentity;

        if (s.isActive()) {
            if (endRequested) {
                endedIdentity = s.activeIdentity;
                s = ConversationSession{};
                return {};
            }
            s.lastInteraction = now;
            return s.activeIdentity;
        }

        if (trigger.empty()) return {};

        s.activeIdentity = trigger;
        s.lastInteraction = now;
        s.timeout = config_.timeout;
        started = true;
        return trigger;
    });

    if (!expiredIdentity.empty()) logInfo("Session", "Conversation with " + expiredIdentity + " timed out");
    if (!endedIdentity.empty()) logInfo("Session", "Ended conversation with " + endedIdentity);
    if (started) logInfo("Session", "Trigger phrase heard, started conversation with " + identity);
    if (!started && !identity.empty() && !trigger.empty() && trigger != identity) {
        logInfo("Session", "Ignoring trigger for " + trigger + " during conversation with " + identity);
    }
    return identity;
}

std::string SessionManager::activeIdentity() {
    const SteadyClock::time_point now = clock_();
    std::string expiredIdentity;

    const std::string identity = state_.withSession([&](ConversationSession& s) -> std::string {
        if (expired(s, now)) {
            expiredIdentity = s.activeIdentity;
            s = ConversationSession{};
        }
        return s.activeIdentity;
    });

    if (!expiredIdentity.empty()) logInfo("Session", "Conversation with " + expiredIdentity + " timed out");
    return identity;
}

void SessionManager::endSession() {
    std::string endedIdentity = state_.withSession([](ConversationSession& s) -> std::string {
        std::string id = s.activeIdentity;
        s = ConversationSession{};
        return id;
    });
    if (!endedIdentity.empty()) logInfo("Session", "Ended conversation with " + endedIdentity);
}

}
