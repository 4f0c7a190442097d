#include "earshot/core/config.hpp"
#include "earshot/core/errors.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace earshot;

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    const AppConfig c = parseConfig("");

    EXPECT_EQ(c.logLevel, "info");
    EXPECT_EQ(c.audio.sampleRate, 16000);
    EXPECT_DOUBLE_EQ(c.listen.timeoutSec, 15.0);
    EXPECT_DOUBLE_EQ(c.listen.silenceThresholdSec, 2.5);
    EXPECT_DOUBLE_EQ(c.listen.maxTotalSec, 45.0);
    EXPECT_EQ(c.session.timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(c.session.triggers.size(), 3u);
    EXPECT_EQ(c.assembler.attempts, 3);
    EXPECT_EQ(c.selfSpeech.maxHumanWords, 15);
    EXPECT_EQ(c.link.port, 3939);
}

TEST(ConfigTest, OverridesValues) {
    const AppConfig c = parseConfig(R"(
log_level: debug
capture:
  chunk_sec:
    word_game: 0.25
  calibrate: false
listen:
  silence_threshold_sec: 1.5
session:
  timeout_sec: 12.5
  triggers:
    - identity: robot
      phrases: [hey robot]
assembler:
  repairs:
    - { from: colour, to: color }
incomplete_sentence:
  locale: fil
  openers:
    fil: [ano ang]
playback_link:
  port: 4000
)");

    EXPECT_EQ(c.logLevel, "debug");
    EXPECT_DOUBLE_EQ(c.capture.wordGameChunkSec, 0.25);
    EXPECT_DOUBLE_EQ(c.capture.normalChunkSec, 0.6);
    EXPECT_FALSE(c.capture.calibrate);
    EXPECT_DOUBLE_EQ(c.listen.silenceThresholdSec, 1.5);
    EXPECT_EQ(c.session.timeout, std::chrono::milliseconds(12500));
    ASSERT_EQ(c.session.triggers.size(), 1u);
    EXPECT_EQ(c.session.triggers[0].identity, "robot");
    ASSERT_EQ(c.assembler.repairs.size(), 1u);
    EXPECT_EQ(c.assembler.repairs[0].second, "color");
    EXPECT_EQ(c.openerLocale, "fil");
    EXPECT_EQ(c.openers.at("fil").front(), "ano ang");
    EXPECT_FALSE(c.openers.at("en").empty());
    EXPECT_EQ(c.link.port, 4000);
}

TEST(ConfigTest, WrongTypeIsConfigError) {
    EXPECT_THROW(parseConfig("listen:\n  timeout_sec: soon\n"), ConfigError);
    EXPECT_THROW(parseConfig("session:\n  triggers: sophia\n"), ConfigError);
}

TEST(ConfigTest, NonPositiveDurationsAreConfigError) {
    EXPECT_THROW(parseConfig("capture:\n  chunk_sec:\n    normal: 0\n"), ConfigError);
    EXPECT_THROW(parseConfig("capture:\n  chunk_sec:\n    word_game: -0.3\n"), ConfigError);
    EXPECT_THROW(parseConfig("capture:\n  chunk_sec:\n    interrupt_check: 0.0\n"), ConfigError);
    EXPECT_THROW(parseConfig("interrupt:\n  chunk_sec: 0\n"), ConfigError);
    EXPECT_THROW(parseConfig("audio:\n  frames_per_buffer: 0\n"), ConfigError);
    EXPECT_THROW(parseConfig("audio:\n  sample_rate: -16000\n"), ConfigError);
}

TEST(ConfigTest, MalformedYamlIsConfigError) {
    EXPECT_THROW(parseConfig("listen: [1, 2"), ConfigError);
    EXPECT_THROW(parseConfig("- just\n- a list\n"), ConfigError);
}

TEST(ConfigTest, MissingFileIsConfigError) {
    EXPECT_THROW(loadConfig("/nonexistent/earshot.yaml"), ConfigError);
}

TEST(ConfigTest, ShippedConfigLoads) {
    const AppConfig c = loadConfig(std::string(EARSHOT_SOURCE_DIR) + "/config/earshot.yaml");

    EXPECT_EQ(c.selfSpeech.catalogVersion, "2024-11-03");
    EXPECT_EQ(c.selfSpeech.fingerprints.size(), SelfSpeechFilter::defaultFingerprints().size());
    EXPECT_EQ(c.assembler.repairs, UtteranceAssembler::defaultRepairs());
    EXPECT_EQ(c.interrupt.phrases, InterruptMonitor::Config{}.phrases);
    EXPECT_EQ(c.session.endPhrases, SessionManager::Config{}.endPhrases);
    EXPECT_EQ(c.openers, IncompleteSentenceDetector::defaultOpeners());
}
