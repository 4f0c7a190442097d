#include "earshot/audio/portaudio_source.hpp"
#include "earshot/capture/capture_engine.hpp"
#include "earshot/capture/interrupt_monitor.hpp"
#include "earshot/core/config.hpp"
#include "earshot/core/errors.hpp"
#include "earshot/core/logging.hpp"
#include "earshot/env/environment_profile.hpp"
#include "earshot/link/playback_link.hpp"
#include "earshot/session/session_manager.hpp"
#include "earshot/stt/whisper_stt.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

using namespace earshot;

static std::atomic<bool> g_quit{false};

static void on_signal(int) { g_quit = true; }

// Capture device plus everything reading from it
struct CapturePipeline {
    std::unique_ptr<PortAudioSource> source;
    std::unique_ptr<CaptureEngine> engine;
    std::unique_ptr<InterruptMonitor> monitor;
};

static CapturePipeline buildPipeline(const AppConfig& config, int deviceIndex, const EnvironmentProfile& profile,
                                     SpeechToText& stt, const SelfSpeechFilter& filter,
                                     const IncompleteSentenceDetector& incomplete, UtteranceAssembler& assembler,
                                     VoiceState& state, PlaybackControl& playback) {
    PortAudioSource::Config audio = config.audio;
    audio.deviceIndex = deviceIndex;

    CapturePipeline p;
    p.source = std::make_unique<PortAudioSource>(audio);
    p.engine = std::make_unique<CaptureEngine>(profile, *p.source, stt, filter, incomplete, assembler, state, config.capture);
    p.monitor = std::make_unique<InterruptMonitor>(profile, *p.source, stt, filter, state, playback, config.interrupt);
    return p;
}

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config/earshot.yaml";

    AppConfig config;
    try {
        config = loadConfig(configPath);
    } catch (const ConfigError& e) {
        logError("Main", e.what());
        return 1;
    }
    setLogLevel(parseLogLevel(config.logLevel));

    const EnvironmentProfile& profile = probe();

    // STT model init
    std::unique_ptr<WhisperSTT> stt;
    try {
        stt = std::make_unique<WhisperSTT>(config.whisper);
    } catch (const std::exception& e) {
        logError("Whisper STT", e.what());
        return 1;
    }

    VoiceState state;
    SelfSpeechFilter filter(config.selfSpeech);
    IncompleteSentenceDetector incomplete(config.openers, config.openerLocale);
    UtteranceAssembler assembler(*stt, config.assembler);
    SessionManager sessions(state, config.session);

    PlaybackLink link(config.link.bindIp, config.link.port, state, &filter);
    if (config.link.enabled) link.start();

    int deviceIndex = config.audio.deviceIndex;
    CapturePipeline pipeline = buildPipeline(config, deviceIndex, profile, *stt, filter, incomplete, assembler, state, link);
    pipeline.monitor->start();

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    logInfo("Main", "Backend running... Press Ctrl+C to quit.");

    while (!g_quit.load()) {
        // The interrupt monitor owns the microphone while the player is speaking
        if (state.isSpeaking()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        std::string text;
        try {
            text = pipeline.engine->listen(config.listen.timeoutSec, config.listen.silenceThresholdSec,
                                           config.listen.maxTotalSec, ListenMode::Normal);
        } catch (const AudioSourceUnavailable& e) {
            logError("Main", std::string("Audio source unavailable: ") + e.what());
            pipeline.monitor->stop();

            if (deviceIndex >= 0) {
                logWarn("Main", "Falling back to the default input device");
                deviceIndex = -1;
            } else {
                std::this_thread::sleep_for(std::chrono::seconds(2));
            }
            pipeline = buildPipeline(config, deviceIndex, profile, *stt, filter, incomplete, assembler, state, link);
            pipeline.monitor->start();
            continue;
        }

        if (text.empty()) continue;

        const bool wasActive = sessions.isActive();
        const std::string identity = sessions.onUtterance(text);

        if (identity.empty()) {
            if (wasActive) link.sendSessionDone();
            else logInfo("Main", "No trigger phrase in: '" + text + "'");
            continue;
        }

        logInfo("Main", identity + ": " + text);
        link.sendUtterance(identity, text);
    }

    pipeline.monitor->stop();
    link.stop();
    return 0;
}
