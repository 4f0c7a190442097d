#include "earshot/stt/whisper_stt.hpp"
#include "earshot/core/errors.hpp"
#include "earshot/core/text.hpp"

#include <whisper.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace earshot {

static constexpr int kWhisperSampleRate = WHISPER_SAMPLE_RATE;

// Linear resampling of int16 PCM to float at the whisper sample rate
static std::vector<float> toWhisperInput(const std::vector<int16_t>& pcm, int sampleRate) {
    if (sampleRate == kWhisperSampleRate || sampleRate <= 0) {
        std::vector<float> out(pcm.size());
        for (size_t i = 0; i < pcm.size(); ++i) out[i] = (float)pcm[i] / 32768.0f;
        return out;
    }

    const double ratio = (double)sampleRate / kWhisperSampleRate;
    const size_t n = (size_t)std::floor(pcm.size() / ratio);
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        const double pos = i * ratio;
        const size_t i0 = (size_t)pos;
        const size_t i1 = std::min(i0 + 1, pcm.size() - 1);
        const double frac = pos - i0;
        out[i] = (float)(((1.0 - frac) * pcm[i0] + frac * pcm[i1]) / 32768.0);
    }
    return out;
}

// Whisper marks non-speech as "[BLANK_AUDIO]", "(wind blowing)" and similar
static std::string stripAnnotations(const std::string& text) {
    std::string out;
    int depth = 0;
    for (char c : text) {
        if (c == '[' || c == '(') { ++depth; continue; }
        if ((c == ']' || c == ')') && depth > 0) { --depth; continue; }
        if (depth == 0) out += c;
    }
    return collapseWhitespace(out);
}

// Constructor
WhisperSTT::WhisperSTT(Config config) : config_(std::move(config)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.useGpu;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + config_.modelPath);
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

std::string WhisperSTT::whisperLanguage(const std::string& languageHint) {
    const std::string hint = toLower(languageHint);
    const std::string base = hint.substr(0, hint.find_first_of("-_"));
    if (base.empty()) return "en";
    if (base == "fil") return "tl";
    return base;
}

// Converts mono PCM into text (std::string)
std::string WhisperSTT::transcribe(const std::vector<int16_t>& pcmMono, int sampleRate, const std::string& languageHint) {
    if (pcmMono.empty()) return {};

    const std::vector<float> input = toWhisperInput(pcmMono, sampleRate);
    const std::string language = whisperLanguage(languageHint);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = language.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.single_segment = true;

    params.no_speech_thold = config_.noSpeechThreshold;

    std::lock_guard<std::mutex> lock(mutex_);

    const int rc = whisper_full(context_, params, input.data(), (int)input.size());
    if (rc != 0) throw TranscriptionError("whisper_full failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text(context_, i);
    return stripAnnotations(out);
}

}
