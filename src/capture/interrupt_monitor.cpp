#include "earshot/capture/interrupt_monitor.hpp"
#include "earshot/core/errors.hpp"
#include "earshot/core/logging.hpp"
#include "earshot/core/text.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace earshot {

// Constructor
InterruptMonitor::InterruptMonitor(const EnvironmentProfile& profile,
                                   AudioSource& source,
                                   SpeechToText& stt,
                                   const SelfSpeechFilter& filter,
                                   VoiceState& state,
                                   PlaybackControl& playback,
                                   Config config)
    : profile_(profile),
      source_(source),
      stt_(stt),
      filter_(filter),
      state_(state),
      playback_(playback),
      config_(std::move(config)) {
    if (config_.chunkSec <= 0.0) throw std::invalid_argument("InterruptMonitor: chunkSec must be positive");
}

// Destructor
InterruptMonitor::~InterruptMonitor() { stop(); }

// Starts the monitor thread
void InterruptMonitor::start() {
    if (running_.exchange(true)) return;
    stopRequested_ = false;
    thread_ = std::thread(&InterruptMonitor::run, this);
}

// Stops the monitor thread. A chunk read in progress finishes first.
void InterruptMonitor::stop() {
    if (!running_.exchange(false)) return;
    stopRequested_ = true;
    if (thread_.joinable()) thread_.join();
}

std::string InterruptMonitor::matchPhrase(const std::string& text) const {
    for (const auto& phrase : config_.phrases) {
        if (containsPhrase(text, phrase)) return phrase;
    }
    return {};
}

std::string InterruptMonitor::checkWhileSpeaking() {
    const double chunk = config_.chunkSec * profile_.chunkDurationMultiplier;
    const int threshold = profile_.effectiveThreshold(ListenMode::InterruptCheck);

    while (!stopRequested_.load() && state_.isSpeaking()) {
        const AudioSegment segment = source_.read(chunk);
        if (segment.empty() || segmentRms(segment) < threshold) continue;

        std::string text;
        try {
            text = stt_.transcribe(toMono(segment), segment.sampleRate, config_.languageHint);
        } catch (const TranscriptionError& e) {
            logDebug("Interrupt", std::string("Chunk transcription failed: ") + e.what());
            continue;
        }
        if (text.empty() || filter_.isSelfSpeech(text)) continue;

        const std::string phrase = matchPhrase(text);
        if (phrase.empty()) continue;

        logInfo("Interrupt", "Cancellation phrase '" + phrase + "' heard, stopping playback");
        playback_.stopImmediately();
        state_.setSpeaking(false);
        return phrase;
    }
    return {};
}

// Thread function: waits for the assistant to speak, then watches for cancellation phrases
void InterruptMonitor::run() {
    logInfo("Interrupt", "Monitor running");

    while (running_.load()) {
        if (!state_.waitForSpeaking(std::chrono::milliseconds(config_.idlePollMs))) continue;

        try {
            checkWhileSpeaking();
        } catch (const AudioSourceUnavailable& e) {
            logError("Interrupt", std::string("Audio source failed: ") + e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.idlePollMs * 10));
        } catch (const std::exception& e) {
            logError("Interrupt", std::string("Check failed: ") + e.what());
        }
    }

    logInfo("Interrupt", "Monitor stopped");
}

}
