#include "earshot/capture/capture_engine.hpp"
#include "earshot/core/errors.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace earshot;
using earshot::test::FakeStt;
using earshot::test::ScriptedSource;
using earshot::test::makeSegment;
using earshot::test::silence;

namespace {

// "Other" host: threshold 250, 0.6 s chunks, no tolerance scaling
class CaptureEngineTest : public ::testing::Test {
protected:
    CaptureEngineTest()
        : filter(SelfSpeechFilter::Config{}),
          assembler(stt, assemblerConfig()) {
        stt.words = {
            {1000, "how far is"},
            {1100, "the moon"},
            {1200, "great job sophia"},
            {1300, "what time is it"},
            {1400, "one"},
            {1500, "two"},
            {100, "mumble"},
            {500, "hello there"},
            {700, "turn on the lights"},
        };
    }

    static UtteranceAssembler::Config assemblerConfig() {
        UtteranceAssembler::Config c;
        c.retryDelayMs = 0;
        return c;
    }

    CaptureEngine engine(bool calibrate = false, HostCategory host = HostCategory::Other) {
        CaptureEngine::Config c;
        c.calibrate = calibrate;
        return CaptureEngine(profileFor(host), source, stt, filter, incomplete, assembler, state, c);
    }

    ScriptedSource source;
    FakeStt stt;
    SelfSpeechFilter filter;
    IncompleteSentenceDetector incomplete;
    UtteranceAssembler assembler;
    VoiceState state;
};

}

TEST_F(CaptureEngineTest, ChunkDurationFollowsModeAndProfile) {
    CaptureEngine e = engine();
    EXPECT_DOUBLE_EQ(e.chunkDuration(ListenMode::Normal), 0.6);
    EXPECT_DOUBLE_EQ(e.chunkDuration(ListenMode::WordGame), 0.3);
    EXPECT_DOUBLE_EQ(e.chunkDuration(ListenMode::IntlGame), 0.4);
    EXPECT_DOUBLE_EQ(e.chunkDuration(ListenMode::InterruptCheck), 0.2);

    CaptureEngine pi5(profileFor(HostCategory::RaspberryPi5), source, stt, filter, incomplete, assembler, state,
                      CaptureEngine::Config{});
    EXPECT_DOUBLE_EQ(pi5.chunkDuration(ListenMode::Normal), 0.72);
}

TEST_F(CaptureEngineTest, ReturnsEmptyWhileAssistantSpeaks) {
    state.setSpeaking(true);
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(5.0, 1.0, 10.0), "");
    EXPECT_EQ(stt.calls(), 0);
    EXPECT_EQ(source.reads(), 0);
}

TEST_F(CaptureEngineTest, FinalizesAfterSilence) {
    source.script = {makeSegment(1300), silence(), silence(), makeSegment(1400)};
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(5.0, 1.0, 10.0), "what time is it");
    EXPECT_EQ(source.reads(), 3);
}

TEST_F(CaptureEngineTest, DropsSelfSpeechBeforeHumanSpeech) {
    source.script = {makeSegment(1200), makeSegment(1300), silence(), silence()};
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(5.0, 1.0, 10.0), "what time is it");
}

TEST_F(CaptureEngineTest, SelfSpeechCountsAsSilence) {
    source.script = {makeSegment(1300), makeSegment(1200), makeSegment(1200), makeSegment(1400)};
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(5.0, 1.0, 10.0), "what time is it");
    EXPECT_EQ(source.reads(), 3);
}

TEST_F(CaptureEngineTest, WaitsOutIncompleteSentence) {
    source.script = {makeSegment(1000), silence(), silence(), makeSegment(1100), silence(), silence()};
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(5.0, 1.0, 10.0), "how far is the moon");
    EXPECT_EQ(source.reads(), 6);
}

TEST_F(CaptureEngineTest, GraceIsGrantedOncePerFragment) {
    source.script = {makeSegment(1000)};
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(5.0, 1.0, 10.0), "how far is");
    EXPECT_EQ(source.reads(), 5);
}

TEST_F(CaptureEngineTest, TimesOutWithoutSpeech) {
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(2.0, 1.0, 10.0), "");
    EXPECT_EQ(source.reads(), 4);
    EXPECT_EQ(stt.calls(), 0);
}

TEST_F(CaptureEngineTest, MaxTotalTimeKeepsPartialUtterance) {
    source.script = {makeSegment(1400), makeSegment(1500), makeSegment(1400), makeSegment(1500),
                     makeSegment(1400), makeSegment(1500), makeSegment(1400)};
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(0.0, 1.0, 2.8), "one two one two one");
    EXPECT_EQ(source.reads(), 5);
}

TEST_F(CaptureEngineTest, TranscriptionFailuresReadAsSilence) {
    stt.throwAll = true;
    source.script = {makeSegment(1300), makeSegment(1300)};
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(1.5, 1.0, 10.0), "");
    EXPECT_EQ(source.reads(), 3);
}

TEST_F(CaptureEngineTest, UnavailableSourcePropagates) {
    source.failOpen = true;
    CaptureEngine e = engine();

    EXPECT_THROW(e.listen(5.0, 1.0, 10.0), AudioSourceUnavailable);
}

TEST_F(CaptureEngineTest, AbortsWhenAssistantStartsSpeaking) {
    source.script = {makeSegment(1300)};
    source.onRead = [this](int n) {
        if (n == 2) state.setSpeaking(true);
    };
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(5.0, 1.0, 10.0), "");
    EXPECT_EQ(source.reads(), 2);
}

TEST_F(CaptureEngineTest, QuietChunksAreNotTranscribed) {
    source.script = {makeSegment(100), makeSegment(100)};
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(1.2, 1.0, 10.0), "");
    EXPECT_EQ(stt.calls(), 0);
}

TEST_F(CaptureEngineTest, CalibrationRaisesThreshold) {
    // Ambient RMS 400 * 1.5 lifts the gate from 250 to 600
    source.script = {makeSegment(400, 0.8), makeSegment(500), makeSegment(700), silence(), silence()};
    CaptureEngine e = engine(true);

    EXPECT_EQ(e.listen(5.0, 1.0, 10.0), "turn on the lights");
    EXPECT_EQ(stt.calls(), 2);
    EXPECT_EQ(source.reads(), 5);
}

TEST_F(CaptureEngineTest, WordGameUsesLowerThreshold) {
    // 220 is below the normal gate (250) but above the word game gate (200)
    stt.words[220] = "cat";
    source.script = {makeSegment(220, 0.3), silence(0.3), silence(0.3), silence(0.3), silence(0.3)};
    CaptureEngine e = engine();

    EXPECT_EQ(e.listen(5.0, 1.0, 10.0, ListenMode::WordGame), "cat");
}

// Pi 5: 0.72 s chunks, silence tolerance scaled by 1.3
TEST_F(CaptureEngineTest, Pi5FinalizesAtScaledSilenceLimit) {
    source.script = {makeSegment(1400, 0.72), silence(0.72), silence(0.72), makeSegment(1500, 0.72)};
    CaptureEngine e = engine(false, HostCategory::RaspberryPi5);

    // 1.44 s of silence passes the 1.3 s limit
    EXPECT_EQ(e.listen(5.0, 1.0, 10.0), "one");
    EXPECT_EQ(source.reads(), 3);
}

TEST_F(CaptureEngineTest, Pi5ToleranceKeepsListeningThroughPause) {
    // 1.44 s would end the utterance at an unscaled 1.2 s threshold, the Pi 5 limit is 1.56 s
    source.script = {makeSegment(1400, 0.72), silence(0.72), silence(0.72), makeSegment(1500, 0.72),
                     silence(0.72), silence(0.72), silence(0.72)};
    CaptureEngine e = engine(false, HostCategory::RaspberryPi5);

    EXPECT_EQ(e.listen(5.0, 1.2, 10.0), "one two");
    EXPECT_EQ(source.reads(), 7);
}

TEST_F(CaptureEngineTest, Pi5WordGameScalesChunkAndTolerance) {
    source.script = {makeSegment(1400, 0.36), silence(0.36), silence(0.36), silence(0.36),
                     makeSegment(1500, 0.36)};
    CaptureEngine e = engine(false, HostCategory::RaspberryPi5);

    EXPECT_DOUBLE_EQ(e.chunkDuration(ListenMode::WordGame), 0.36);
    EXPECT_EQ(e.listen(5.0, 1.0, 10.0, ListenMode::WordGame), "one two");
    EXPECT_EQ(source.reads(), 9);
}

TEST_F(CaptureEngineTest, RejectsNonPositiveChunkDurations) {
    CaptureEngine::Config c;
    c.wordGameChunkSec = 0.0;
    EXPECT_THROW(CaptureEngine(profileFor(HostCategory::Other), source, stt, filter, incomplete, assembler, state, c),
                 std::invalid_argument);

    c = CaptureEngine::Config{};
    c.normalChunkSec = -0.6;
    EXPECT_THROW(CaptureEngine(profileFor(HostCategory::Other), source, stt, filter, incomplete, assembler, state, c),
                 std::invalid_argument);
}
