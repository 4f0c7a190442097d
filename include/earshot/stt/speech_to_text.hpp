#ifndef EARSHOT_SPEECH_TO_TEXT_HPP
#define EARSHOT_SPEECH_TO_TEXT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace earshot {

class SpeechToText {
public:
    virtual ~SpeechToText() = default;

    // Returns the recognized text, empty when nothing was understood.
    // Throws TranscriptionError when the backend itself fails.
    virtual std::string transcribe(const std::vector<int16_t>& pcmMono, int sampleRate,
                                   const std::string& languageHint) = 0;
};

}

#endif
