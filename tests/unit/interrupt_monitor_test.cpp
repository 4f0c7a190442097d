#include "earshot/capture/interrupt_monitor.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace earshot;
using earshot::test::FakePlayback;
using earshot::test::FakeStt;
using earshot::test::ScriptedSource;
using earshot::test::makeSegment;

namespace {

// "Other" host: interrupt gate is round(250 * 0.65) = 163
class InterruptMonitorTest : public ::testing::Test {
protected:
    InterruptMonitorTest() : filter(SelfSpeechFilter::Config{}) {
        stt.words = {
            {150, "stop"},
            {300, "great job stop"},
            {400, "what is that"},
            {500, "hey please stop"},
            {600, "hold on a second"},
        };
    }

    InterruptMonitor::Config config() {
        InterruptMonitor::Config c;
        c.idlePollMs = 5;
        return c;
    }

    ScriptedSource source;
    FakeStt stt;
    SelfSpeechFilter filter;
    VoiceState state;
    FakePlayback playback;
};

}

TEST_F(InterruptMonitorTest, MatchesCancellationPhrases) {
    InterruptMonitor monitor(profileFor(HostCategory::Other), source, stt, filter, state, playback, config());
    EXPECT_EQ(monitor.matchPhrase("please stop"), "stop");
    EXPECT_EQ(monitor.matchPhrase("Hold on!"), "hold on");
    EXPECT_EQ(monitor.matchPhrase("stopwatch"), "");
    EXPECT_EQ(monitor.matchPhrase(""), "");
}

TEST_F(InterruptMonitorTest, StopsPlaybackOnCancellationPhrase) {
    state.setSpeaking(true);
    source.script = {makeSegment(150, 0.2), makeSegment(300, 0.2), makeSegment(400, 0.2), makeSegment(500, 0.2)};
    InterruptMonitor monitor(profileFor(HostCategory::Other), source, stt, filter, state, playback, config());

    EXPECT_EQ(monitor.checkWhileSpeaking(), "stop");
    EXPECT_EQ(playback.stops.load(), 1);
    EXPECT_FALSE(state.isSpeaking());
    EXPECT_EQ(source.reads(), 4);
    // The quiet chunk never reaches the recognizer
    EXPECT_EQ(stt.calls(), 3);
}

TEST_F(InterruptMonitorTest, ReturnsWhenSpeakingEnds) {
    state.setSpeaking(true);
    source.script = {makeSegment(400, 0.2)};
    source.onRead = [this](int n) {
        if (n == 3) state.setSpeaking(false);
    };
    InterruptMonitor monitor(profileFor(HostCategory::Other), source, stt, filter, state, playback, config());

    EXPECT_EQ(monitor.checkWhileSpeaking(), "");
    EXPECT_EQ(playback.stops.load(), 0);
    EXPECT_EQ(source.reads(), 3);
}

TEST_F(InterruptMonitorTest, IdleWhileAssistantIsSilent) {
    InterruptMonitor monitor(profileFor(HostCategory::Other), source, stt, filter, state, playback, config());
    EXPECT_EQ(monitor.checkWhileSpeaking(), "");
    EXPECT_EQ(source.reads(), 0);
}

TEST_F(InterruptMonitorTest, BackgroundThreadInterruptsPlayback) {
    source.script = {makeSegment(600, 0.2)};
    InterruptMonitor monitor(profileFor(HostCategory::Other), source, stt, filter, state, playback, config());
    monitor.start();

    state.setSpeaking(true);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (playback.stops.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    monitor.stop();

    EXPECT_EQ(playback.stops.load(), 1);
    EXPECT_FALSE(state.isSpeaking());
}

TEST_F(InterruptMonitorTest, RejectsNonPositiveChunk) {
    InterruptMonitor::Config c = config();
    c.chunkSec = 0.0;
    EXPECT_THROW(InterruptMonitor(profileFor(HostCategory::Other), source, stt, filter, state, playback, c),
                 std::invalid_argument);
}
