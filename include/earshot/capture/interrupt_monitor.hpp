#ifndef EARSHOT_INTERRUPT_MONITOR_HPP
#define EARSHOT_INTERRUPT_MONITOR_HPP

#include "earshot/audio/audio_source.hpp"
#include "earshot/capture/playback_control.hpp"
#include "earshot/capture/voice_state.hpp"
#include "earshot/env/environment_profile.hpp"
#include "earshot/filter/self_speech_filter.hpp"
#include "earshot/stt/speech_to_text.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace earshot {

// Listens in short, sensitive chunks while the assistant is speaking and cuts playback
// when a cancellation phrase is heard.
class InterruptMonitor {
public:
    struct Config {
        std::vector<std::string> phrases = {
            "stop", "stop talking", "wait", "hold on", "be quiet", "quiet",
            "pause", "cancel", "never mind", "enough", "shush",
        };
        double chunkSec = 0.2;          // scaled by profile.chunkDurationMultiplier
        std::string languageHint = "en-US";
        int idlePollMs = 100;
    };

    InterruptMonitor(const EnvironmentProfile& profile,
                     AudioSource& source,
                     SpeechToText& stt,
                     const SelfSpeechFilter& filter,
                     VoiceState& state,
                     PlaybackControl& playback,
                     Config config);
    ~InterruptMonitor();

    InterruptMonitor(const InterruptMonitor&) = delete;
    InterruptMonitor& operator=(const InterruptMonitor&) = delete;

    void start();
    void stop();

    // Captures while the assistant speaks. Returns the cancellation phrase that stopped
    // playback, or an empty string when speaking ended on its own.
    std::string checkWhileSpeaking();

    // Cancellation phrase contained in text, empty when none
    std::string matchPhrase(const std::string& text) const;

private:
    void run();

    EnvironmentProfile profile_;
    AudioSource& source_;
    SpeechToText& stt_;
    const SelfSpeechFilter& filter_;
    VoiceState& state_;
    PlaybackControl& playback_;
    Config config_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
};

}

#endif
