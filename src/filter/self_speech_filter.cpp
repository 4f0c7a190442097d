#include "earshot/filter/self_speech_filter.hpp"
#include "earshot/core/logging.hpp"
#include "earshot/core/text.hpp"

#include <utility>

namespace earshot {

std::vector<std::string> SelfSpeechFilter::defaultFingerprints() {
    return {
        "smile brightens up my camera sensors",
        "automatic conversation mode activated",
        "i'm listening",
        "say goodbye to end",
        "timeout after",
        "minute of silence",
        "camera sensors",
        "conversation mode",
        "listening for speech",
        "let me know",
        "i'm here to help",
        "here to help you",
        "what you're curious about",
        "have in mind",
        "you'd like to",
        "feel free to share",
        "dive into it together",
        "specific topic",
        "explore or learn",
        "what you'd like to know",
        "i'll do my best",
        "to assist you",
        "assist you",
        "help you",
        "love seeing your face",
        "means adventure time",
        "look who's here",
        "you spelled",
        "you're doing amazing",
        "roar-some job",
        "spelling champion",
        "great job",
        "try again",
        "keep going",
        "almost there",
    };
}

// Constructor
SelfSpeechFilter::SelfSpeechFilter(Config config) : config_(std::move(config)) {
    for (const auto& f : config_.fingerprints) {
        std::string n = normalizeText(f);
        if (!n.empty()) normalizedFingerprints_.push_back(std::move(n));
    }
    logDebug("Self Speech", "Catalog " + config_.catalogVersion + " loaded with " +
             std::to_string(normalizedFingerprints_.size()) + " fingerprints");
}

bool SelfSpeechFilter::isSelfSpeech(const std::string& text) const {
    const std::string normalized = normalizeText(text);
    if (normalized.empty()) return false;

    for (const auto& f : normalizedFingerprints_) {
        if (containsPhrase(normalized, f)) {
            logInfo("Self Speech", "Ignored assistant phrase '" + f + "' in: " + text);
            return true;
        }
    }

    if (matchesPlayback(normalized)) {
        logInfo("Self Speech", "Ignored echo of playback text: " + text);
        return true;
    }

    if (wordCount(normalized) > config_.maxHumanWords) {
        logInfo("Self Speech", "Ignored long fragment (" + std::to_string(wordCount(normalized)) + " words)");
        return true;
    }

    return false;
}

void SelfSpeechFilter::notePlaybackText(const std::string& text) {
    std::lock_guard<std::mutex> lock(playback_mutex_);
    lastPlayback_ = normalizeText(text);
}

void SelfSpeechFilter::clearPlaybackText() {
    std::lock_guard<std::mutex> lock(playback_mutex_);
    lastPlayback_.clear();
}

bool SelfSpeechFilter::matchesPlayback(const std::string& normalized) const {
    if (wordCount(normalized) < config_.minPlaybackMatchWords) return false;

    std::lock_guard<std::mutex> lock(playback_mutex_);
    if (lastPlayback_.empty()) return false;
    return containsPhrase(lastPlayback_, normalized);
}

}
