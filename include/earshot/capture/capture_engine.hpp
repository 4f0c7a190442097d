#ifndef EARSHOT_CAPTURE_ENGINE_HPP
#define EARSHOT_CAPTURE_ENGINE_HPP

#include "earshot/assemble/utterance_assembler.hpp"
#include "earshot/audio/audio_source.hpp"
#include "earshot/capture/voice_state.hpp"
#include "earshot/env/environment_profile.hpp"
#include "earshot/filter/incomplete_sentence.hpp"
#include "earshot/filter/self_speech_filter.hpp"
#include "earshot/stt/speech_to_text.hpp"

#include <string>

namespace earshot {

// Chunked capture loop with self-speech rejection and silence endpointing.
//
// Every chunk is gated on energy, transcribed, and checked against the self-speech filter.
// Human fragments go into the utterance buffer. Once silence after human speech reaches
// silenceThreshold * profile.silenceToleranceMultiplier the utterance is finalized, unless the
// last fragment ends on an incomplete-sentence opener, which buys one grace period.
class CaptureEngine {
public:
    struct Config {
        // Base chunk durations (seconds), scaled by profile.chunkDurationMultiplier
        double normalChunkSec = 0.6;
        double wordGameChunkSec = 0.3;
        double intlGameChunkSec = 0.4;
        double interruptChunkSec = 0.2;

        // Read calibrationDuration of ambient audio before each listen
        bool calibrate = true;
        double ambientFactor = 1.5;
    };

    CaptureEngine(const EnvironmentProfile& profile,
                  AudioSource& source,
                  SpeechToText& stt,
                  const SelfSpeechFilter& filter,
                  const IncompleteSentenceDetector& incomplete,
                  UtteranceAssembler& assembler,
                  VoiceState& state,
                  Config config);

    // Returns the finished utterance, or an empty string when no human speech was captured,
    // the assistant started speaking, or transcription failed throughout.
    // Throws AudioSourceUnavailable when the capture device cannot be used.
    std::string listen(double timeoutSec, double silenceThresholdSec, double maxTotalSec,
                       ListenMode mode = ListenMode::Normal);

    double chunkDuration(ListenMode mode) const;

    const EnvironmentProfile& profile() const { return profile_; }

private:
    int calibratedThreshold(ListenMode mode);
    std::string transcribeChunk(const AudioSegment& segment, int threshold, const std::string& hint);

    EnvironmentProfile profile_;
    AudioSource& source_;
    SpeechToText& stt_;
    const SelfSpeechFilter& filter_;
    const IncompleteSentenceDetector& incomplete_;
    UtteranceAssembler& assembler_;
    VoiceState& state_;
    Config config_;
};

}

#endif
