#ifndef EARSHOT_CONFIG_HPP
#define EARSHOT_CONFIG_HPP

#include "earshot/assemble/utterance_assembler.hpp"
#include "earshot/audio/portaudio_source.hpp"
#include "earshot/capture/capture_engine.hpp"
#include "earshot/capture/interrupt_monitor.hpp"
#include "earshot/filter/incomplete_sentence.hpp"
#include "earshot/filter/self_speech_filter.hpp"
#include "earshot/session/session_manager.hpp"
#include "earshot/stt/whisper_stt.hpp"

#include <string>

namespace earshot {

struct AppConfig {
    std::string logLevel = "info";

    PortAudioSource::Config audio;
    WhisperSTT::Config whisper;
    CaptureEngine::Config capture;

    struct Listen {
        double timeoutSec = 15.0;
        double silenceThresholdSec = 2.5;
        double maxTotalSec = 45.0;
    } listen;

    SelfSpeechFilter::Config selfSpeech;

    std::string openerLocale = "en";
    IncompleteSentenceDetector::OpenerTable openers = IncompleteSentenceDetector::defaultOpeners();

    UtteranceAssembler::Config assembler;
    SessionManager::Config session;
    InterruptMonitor::Config interrupt;

    struct Link {
        bool enabled = true;
        std::string bindIp = "127.0.0.1";
        int port = 3939;
    } link;
};

// Keys missing from the document keep their defaults. Throws ConfigError on unreadable
// files, malformed YAML or values of the wrong type.
AppConfig loadConfig(const std::string& path);
AppConfig parseConfig(const std::string& yamlText);

}

#endif
