#include "earshot/core/config.hpp"
#include "earshot/core/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cmath>
#include <string>

namespace earshot {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
    const YAML::Node value = node[key];
    if (!value.IsDefined() || value.IsNull()) return;
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

// Durations and buffer sizes of zero would stall the capture loops
template <typename T>
void readPositive(const YAML::Node& node, const char* key, T& out) {
    T value = out;
    read(node, key, value);
    if (!(value > 0)) throw ConfigError(std::string("config key '") + key + "': must be greater than zero");
    out = value;
}

void readAudio(const YAML::Node& n, PortAudioSource::Config& c) {
    if (!n) return;
    readPositive(n, "sample_rate", c.sampleRate);
    readPositive(n, "channels", c.channels);
    readPositive(n, "frames_per_buffer", c.framesPerBuffer);
    read(n, "device_index", c.deviceIndex);
}

void readWhisper(const YAML::Node& n, WhisperSTT::Config& c) {
    if (!n) return;
    read(n, "model_path", c.modelPath);
    read(n, "threads", c.threads);
    read(n, "use_gpu", c.useGpu);
    read(n, "no_speech_threshold", c.noSpeechThreshold);
}

void readCapture(const YAML::Node& n, CaptureEngine::Config& c) {
    if (!n) return;
    const YAML::Node chunk = n["chunk_sec"];
    if (chunk) {
        readPositive(chunk, "normal", c.normalChunkSec);
        readPositive(chunk, "word_game", c.wordGameChunkSec);
        readPositive(chunk, "intl_game", c.intlGameChunkSec);
        readPositive(chunk, "interrupt_check", c.interruptChunkSec);
    }
    read(n, "calibrate", c.calibrate);
    read(n, "ambient_factor", c.ambientFactor);
}

void readListen(const YAML::Node& n, AppConfig::Listen& c) {
    if (!n) return;
    read(n, "timeout_sec", c.timeoutSec);
    read(n, "silence_threshold_sec", c.silenceThresholdSec);
    read(n, "max_total_sec", c.maxTotalSec);
}

void readSelfSpeech(const YAML::Node& n, SelfSpeechFilter::Config& c) {
    if (!n) return;
    read(n, "catalog_version", c.catalogVersion);
    read(n, "fingerprints", c.fingerprints);
    read(n, "max_human_words", c.maxHumanWords);
    read(n, "min_playback_match_words", c.minPlaybackMatchWords);
}

void readOpeners(const YAML::Node& n, AppConfig& c) {
    if (!n) return;
    read(n, "locale", c.openerLocale);
    const YAML::Node table = n["openers"];
    if (!table) return;
    if (!table.IsMap()) throw ConfigError("config key 'openers': expected a map of locale to phrases");

    for (const auto& entry : table) {
        try {
            c.openers[entry.first.as<std::string>()] = entry.second.as<std::vector<std::string>>();
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("config key 'openers': ") + e.what());
        }
    }
}

void readAssembler(const YAML::Node& n, UtteranceAssembler::Config& c) {
    if (!n) return;
    read(n, "attempts", c.attempts);
    read(n, "retry_delay_ms", c.retryDelayMs);
    read(n, "default_hints", c.defaultHints);
    read(n, "intl_hints", c.intlHints);

    const YAML::Node repairs = n["repairs"];
    if (!repairs) return;
    if (!repairs.IsSequence()) throw ConfigError("config key 'repairs': expected a list of {from, to}");

    c.repairs.clear();
    for (const auto& r : repairs) {
        std::string from;
        std::string to;
        read(r, "from", from);
        read(r, "to", to);
        if (from.empty()) throw ConfigError("config key 'repairs': entry without 'from'");
        c.repairs.emplace_back(from, to);
    }
}

void readSession(const YAML::Node& n, SessionManager::Config& c) {
    if (!n) return;

    double timeoutSec = c.timeout.count() / 1000.0;
    read(n, "timeout_sec", timeoutSec);
    c.timeout = std::chrono::milliseconds((long long)std::llround(timeoutSec * 1000.0));

    read(n, "end_phrases", c.endPhrases);
    read(n, "word_game_end_phrases", c.wordGameEndPhrases);

    const YAML::Node triggers = n["triggers"];
    if (!triggers) return;
    if (!triggers.IsSequence()) throw ConfigError("config key 'triggers': expected a list of {identity, phrases}");

    c.triggers.clear();
    for (const auto& t : triggers) {
        TriggerEntry entry;
        read(t, "identity", entry.identity);
        read(t, "phrases", entry.phrases);
        if (entry.identity.empty() || entry.phrases.empty()) {
            throw ConfigError("config key 'triggers': each entry needs an identity and phrases");
        }
        c.triggers.push_back(std::move(entry));
    }
}

void readInterrupt(const YAML::Node& n, InterruptMonitor::Config& c) {
    if (!n) return;
    read(n, "phrases", c.phrases);
    readPositive(n, "chunk_sec", c.chunkSec);
    read(n, "language_hint", c.languageHint);
    read(n, "idle_poll_ms", c.idlePollMs);
}

void readLink(const YAML::Node& n, AppConfig::Link& c) {
    if (!n) return;
    read(n, "enabled", c.enabled);
    read(n, "bind_ip", c.bindIp);
    read(n, "port", c.port);
}

AppConfig fromNode(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) throw ConfigError("config root must be a map");

    read(root, "log_level", config.logLevel);
    readAudio(root["audio"], config.audio);
    readWhisper(root["whisper"], config.whisper);
    readCapture(root["capture"], config.capture);
    readListen(root["listen"], config.listen);
    readSelfSpeech(root["self_speech"], config.selfSpeech);
    readOpeners(root["incomplete_sentence"], config);
    readAssembler(root["assembler"], config.assembler);
    readSession(root["session"], config.session);
    readInterrupt(root["interrupt"], config.interrupt);
    readLink(root["playback_link"], config.link);
    return config;
}

}

AppConfig loadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot load " + path + ": " + e.what());
    }
    return fromNode(root);
}

AppConfig parseConfig(const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("cannot parse config: ") + e.what());
    }
    return fromNode(root);
}

}
