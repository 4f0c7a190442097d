#ifndef EARSHOT_WHISPER_STT_HPP
#define EARSHOT_WHISPER_STT_HPP

#include "earshot/stt/speech_to_text.hpp"

#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

namespace earshot {

class WhisperSTT : public SpeechToText {
public:
    struct Config {
        std::string modelPath = "models/whisper/ggml-base.en-q5_1.bin";
        int threads = 4;
        bool useGpu = false;
        float noSpeechThreshold = 0.6f;
    };

    explicit WhisperSTT(Config config);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::string transcribe(const std::vector<int16_t>& pcmMono, int sampleRate,
                           const std::string& languageHint) override;

    // "en-US" -> "en", "fil-PH" -> "tl"
    static std::string whisperLanguage(const std::string& languageHint);

private:
    Config config_;
    whisper_context* context_ = nullptr;
    std::mutex mutex_;
};

}

#endif
