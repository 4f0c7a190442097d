#ifndef EARSHOT_SELF_SPEECH_FILTER_HPP
#define EARSHOT_SELF_SPEECH_FILTER_HPP

#include <mutex>
#include <string>
#include <vector>

namespace earshot {

// Heuristic echo rejection for transcribed fragments. Rules, first match wins:
//   1. the fragment contains a catalogued assistant phrase
//   2. the fragment is a piece of the text most recently handed to playback
//   3. the fragment is longer than maxHumanWords
class SelfSpeechFilter {
public:
    static std::vector<std::string> defaultFingerprints();

    struct Config {
        std::string catalogVersion = "builtin-1";
        std::vector<std::string> fingerprints = defaultFingerprints();
        int maxHumanWords = 15;
        int minPlaybackMatchWords = 2;
    };

    explicit SelfSpeechFilter(Config config);

    bool isSelfSpeech(const std::string& text) const;

    // Remembers what the assistant is about to say
    void notePlaybackText(const std::string& text);
    void clearPlaybackText();

    const Config& config() const { return config_; }

private:
    bool matchesPlayback(const std::string& normalized) const;

    Config config_;
    std::vector<std::string> normalizedFingerprints_;

    mutable std::mutex playback_mutex_;
    std::string lastPlayback_;
};

}

#endif
