#include "earshot/capture/capture_engine.hpp"
#include "earshot/audio/utterance_buffer.hpp"
#include "earshot/core/errors.hpp"
#include "earshot/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace earshot {

static std::string secs(double s) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1fs", s);
    return buf;
}

// Constructor
CaptureEngine::CaptureEngine(const EnvironmentProfile& profile,
                             AudioSource& source,
                             SpeechToText& stt,
                             const SelfSpeechFilter& filter,
                             const IncompleteSentenceDetector& incomplete,
                             UtteranceAssembler& assembler,
                             VoiceState& state,
                             Config config)
    : profile_(profile),
      source_(source),
      stt_(stt),
      filter_(filter),
      incomplete_(incomplete),
      assembler_(assembler),
      state_(state),
      config_(std::move(config)) {
    if (config_.normalChunkSec <= 0.0 || config_.wordGameChunkSec <= 0.0 ||
        config_.intlGameChunkSec <= 0.0 || config_.interruptChunkSec <= 0.0) {
        throw std::invalid_argument("CaptureEngine: chunk durations must be positive");
    }
}

double CaptureEngine::chunkDuration(ListenMode mode) const {
    double base = config_.normalChunkSec;
    switch (mode) {
        case ListenMode::Normal: base = config_.normalChunkSec; break;
        case ListenMode::WordGame: base = config_.wordGameChunkSec; break;
        case ListenMode::IntlGame: base = config_.intlGameChunkSec; break;
        case ListenMode::InterruptCheck: base = config_.interruptChunkSec; break;
    }
    return base * profile_.chunkDurationMultiplier;
}

int CaptureEngine::calibratedThreshold(ListenMode mode) {
    const int threshold = profile_.effectiveThreshold(mode);
    if (!config_.calibrate || profile_.calibrationDuration <= 0.0) return threshold;

    const AudioSegment ambient = source_.read(profile_.calibrationDuration);
    const int measured = (int)std::lround(segmentRms(ambient) * config_.ambientFactor *
                                          profile_.modeMultipliers.forMode(mode));
    logDebug("Capture", "Calibrated ambient threshold " + std::to_string(measured) +
             " (profile " + std::to_string(threshold) + ")");
    return std::max(threshold, measured);
}

std::string CaptureEngine::transcribeChunk(const AudioSegment& segment, int threshold, const std::string& hint) {
    if (segment.empty() || segmentRms(segment) < threshold) return {};

    try {
        return stt_.transcribe(toMono(segment), segment.sampleRate, hint);
    } catch (const TranscriptionError& e) {
        logDebug("Capture", std::string("Chunk transcription failed: ") + e.what());
    } catch (const std::exception& e) {
        logWarn("Capture", std::string("Chunk transcription threw: ") + e.what());
    }
    return {};
}

std::string CaptureEngine::listen(double timeoutSec, double silenceThresholdSec, double maxTotalSec, ListenMode mode) {
    if (state_.isSpeaking()) {
        logInfo("Capture", "Assistant is speaking, not listening");
        return {};
    }

    source_.open();

    const double chunk = chunkDuration(mode);
    const double silenceLimit = silenceThresholdSec * profile_.silenceToleranceMultiplier;
    const int threshold = calibratedThreshold(mode);
    const std::string hint = assembler_.languageHints(mode).front();

    logInfo("Capture", std::string("Listening for human speech (mode ") + toString(mode) +
            ", max " + secs(maxTotalSec) + ", chunk " + secs(chunk) + ", threshold " + std::to_string(threshold) + ")");

    UtteranceBuffer buffer;
    double elapsed = 0.0;
    double silence = 0.0;
    bool humanSpeech = false;
    size_t graceGrantedAt = 0;   // buffer size when the last grace period was granted

    while (elapsed < maxTotalSec) {
        if (state_.isSpeaking()) {
            logInfo("Capture", "Assistant started speaking, stopping capture");
            return {};
        }

        AudioSegment segment = source_.read(chunk);
        const double offset = elapsed;
        elapsed += chunk;

        const std::string text = transcribeChunk(segment, threshold, hint);
        if (text.empty()) {
            silence += chunk;
            if (humanSpeech) logDebug("Capture", "Silence: " + secs(silence) + " of " + secs(silenceLimit));
        } else if (filter_.isSelfSpeech(text)) {
            silence += chunk;
        } else {
            logInfo("Capture", "Human speech detected: '" + text + "'");
            buffer.append(std::move(segment), text, offset);
            silence = 0.0;
            humanSpeech = true;
        }

        if (humanSpeech && silence >= silenceLimit) {
            const bool canExtend = graceGrantedAt != buffer.size() && silence < 2.0 * silenceLimit;
            if (canExtend && incomplete_.isIncomplete(buffer.lastText())) {
                logInfo("Capture", "Sentence looks unfinished ('" + buffer.lastText() + "'), waiting for more");
                graceGrantedAt = buffer.size();
                silence = 0.0;
                continue;
            }
            logInfo("Capture", "Human finished speaking after " + secs(elapsed));
            break;
        }

        if (!humanSpeech && timeoutSec > 0.0 && elapsed >= timeoutSec) {
            logInfo("Capture", "No human speech within " + secs(timeoutSec));
            return {};
        }
    }

    if (buffer.empty()) {
        logInfo("Capture", "No human speech detected");
        return {};
    }

    buffer.freeze();
    return assembler_.assemble(buffer, mode);
}

}
