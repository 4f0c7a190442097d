#include "earshot/assemble/utterance_assembler.hpp"
#include "earshot/core/errors.hpp"
#include "earshot/core/logging.hpp"
#include "earshot/core/text.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace earshot {

UtteranceAssembler::RepairTable UtteranceAssembler::defaultRepairs() {
    return {
        {"filipina", "filipino"},
        {"philipino", "filipino"},
        {"philippino", "filipino"},
        {"tagalog", "filipino"},
        {"ready ready", "ready"},
        {"done done", "done"},
        {"check check", "check"},
    };
}

// Constructor
UtteranceAssembler::UtteranceAssembler(SpeechToText& stt, Config config)
    : stt_(stt), config_(std::move(config)) {
    if (config_.attempts < 1) config_.attempts = 1;
    if (config_.defaultHints.empty()) config_.defaultHints.push_back("en-US");
    if (config_.intlHints.empty()) config_.intlHints = config_.defaultHints;
}

const std::vector<std::string>& UtteranceAssembler::languageHints(ListenMode mode) const {
    return mode == ListenMode::IntlGame ? config_.intlHints : config_.defaultHints;
}

std::string UtteranceAssembler::cleanText(const std::string& text) const {
    std::string cleaned = collapseWhitespace(toLower(text));
    cleaned = applyReplacements(cleaned, config_.repairs);
    return collapseWhitespace(cleaned);
}

std::string UtteranceAssembler::assemble(const UtteranceBuffer& buffer, ListenMode mode) {
    if (buffer.empty()) return {};

    logInfo("Assembler", "Processing " + std::to_string(buffer.size()) + " human speech chunks...");

    std::string text = transcribeCombined(buffer, mode);
    if (text.empty()) {
        logWarn("Assembler", "Combined audio gave no text, transcribing chunks individually");
        text = transcribeEachSegment(buffer, mode);
    }

    if (text.empty()) {
        logInfo("Assembler", "Could not understand human speech after all attempts");
        return {};
    }

    const std::string cleaned = cleanText(text);
    logInfo("Assembler", "Final human speech: '" + cleaned + "'");
    return cleaned;
}

std::string UtteranceAssembler::tryTranscribe(const std::vector<int16_t>& pcm, int sampleRate, const std::string& hint) {
    try {
        return collapseWhitespace(stt_.transcribe(pcm, sampleRate, hint));
    } catch (const TranscriptionError& e) {
        logWarn("Assembler", "Recognition failed (" + hint + "): " + e.what());
    } catch (const std::exception& e) {
        logError("Assembler", "Recognition threw (" + hint + "): " + e.what());
    }
    return {};
}

std::string UtteranceAssembler::transcribeCombined(const UtteranceBuffer& buffer, ListenMode mode) {
    const std::vector<int16_t> pcm = buffer.combinedPcm();
    const std::vector<std::string>& hints = languageHints(mode);

    for (int attempt = 0; attempt < config_.attempts; ++attempt) {
        for (const auto& hint : hints) {
            std::string text = tryTranscribe(pcm, buffer.sampleRate(), hint);
            if (!text.empty()) {
                logInfo("Assembler", "Human speech (" + hint + ", attempt " + std::to_string(attempt + 1) + "): '" + text + "'");
                return text;
            }
        }

        if (attempt + 1 < config_.attempts && config_.retryDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.retryDelayMs));
        }
    }
    return {};
}

std::string UtteranceAssembler::transcribeEachSegment(const UtteranceBuffer& buffer, ListenMode mode) {
    const std::string& hint = languageHints(mode).front();

    std::string joined;
    for (const auto& segment : buffer.segments()) {
        const std::string text = tryTranscribe(toMono(segment), segment.sampleRate, hint);
        if (text.empty()) continue;
        if (!joined.empty()) joined += ' ';
        joined += text;
    }
    return collapseWhitespace(joined);
}

}
