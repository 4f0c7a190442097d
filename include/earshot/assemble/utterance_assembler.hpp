#ifndef EARSHOT_UTTERANCE_ASSEMBLER_HPP
#define EARSHOT_UTTERANCE_ASSEMBLER_HPP

#include "earshot/audio/utterance_buffer.hpp"
#include "earshot/env/environment_profile.hpp"
#include "earshot/stt/speech_to_text.hpp"

#include <string>
#include <utility>
#include <vector>

namespace earshot {

// Turns the retained segments of one utterance into its final transcript.
//
// The joined audio is transcribed as a whole first, trying each language hint of the mode
// for up to `attempts` rounds. Only when that yields nothing are the segments transcribed
// one by one and their texts joined. The result is lower-cased, whitespace-collapsed and
// run through the repair table, which holds known chunk-boundary artifacts.
class UtteranceAssembler {
public:
    using RepairTable = std::vector<std::pair<std::string, std::string>>;

    static RepairTable defaultRepairs();

    struct Config {
        int attempts = 3;
        int retryDelayMs = 200;

        std::vector<std::string> defaultHints = {"en-US", "en-GB", "en-AU"};
        std::vector<std::string> intlHints = {"fil-PH", "en-US"};

        RepairTable repairs = defaultRepairs();
    };

    UtteranceAssembler(SpeechToText& stt, Config config);

    // Empty only when neither strategy produced any text. Never throws.
    std::string assemble(const UtteranceBuffer& buffer, ListenMode mode = ListenMode::Normal);

    const std::vector<std::string>& languageHints(ListenMode mode) const;

    std::string cleanText(const std::string& text) const;

private:
    std::string transcribeCombined(const UtteranceBuffer& buffer, ListenMode mode);
    std::string transcribeEachSegment(const UtteranceBuffer& buffer, ListenMode mode);
    std::string tryTranscribe(const std::vector<int16_t>& pcm, int sampleRate, const std::string& hint);

    SpeechToText& stt_;
    Config config_;
};

}

#endif
