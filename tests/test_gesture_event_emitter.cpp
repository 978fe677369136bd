/**
 * @file test_gesture_event_emitter.cpp
 * @brief Tick-level tests of the stability + cooldown + dispatch chain
 *
 * The clock is driven explicitly; every tick passes its own timestamp.
 */

#include <gtest/gtest.h>
#include <fingerlaunch/gesture/GestureEventEmitter.hpp>
#include <fingerlaunch/gesture/FingerStateExtractor.hpp>
#include <fingerlaunch/core/exception.h>
#include <fingerlaunch/core/Logger.hpp>

#include "mock_capabilities.hpp"
#include "temp_directory.hpp"

#include <fstream>
#include <sstream>
#include <vector>

using namespace fingerlaunch;
using namespace fingerlaunch::gesture;
using action::ActionDescriptor;
using action::ActionMapping;

namespace {

Timestamp at(double s) {
    return Timestamp(std::chrono::round<Clock::duration>(Seconds(s)));
}

} // namespace

class GestureEventEmitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);

        url_opener_ = std::make_shared<MockUrlOpener>();
        launcher_ = std::make_shared<MockProcessLauncher>();
        speech_ = std::make_shared<MockSpeechEngine>();
        bin_ = tmp_.makeDirectory("bin");

        action::CapabilitySet caps;
        caps.url_opener = url_opener_;
        caps.process_launcher = launcher_;
        caps.speech_engine = speech_;
        dispatcher_ = std::make_unique<action::ActionDispatcher>(
            caps,
            std::make_unique<action::ExecutableResolver>(
                action::ProgramLookupTable{}, std::vector<action::ExecutableResolver::Path>{bin_}, "linux"));
        dispatcher_->setVoiceFeedback(false);
    }

    std::unique_ptr<GestureEventEmitter> makeEmitter(int stable_frames, double cooldown, ActionMapping mapping) {
        GestureConfig config;
        config.stable_frames = stable_frames;
        config.cooldown_seconds = cooldown;
        return std::make_unique<GestureEventEmitter>(config, std::move(mapping), *dispatcher_);
    }

    TempDirectory tmp_;
    action::ExecutableResolver::Path bin_;
    std::shared_ptr<MockUrlOpener> url_opener_;
    std::shared_ptr<MockProcessLauncher> launcher_;
    std::shared_ptr<MockSpeechEngine> speech_;
    std::unique_ptr<action::ActionDispatcher> dispatcher_;
};

/**
 * Test 1: STABLE_FRAMES=3, COOLDOWN=2.0, {2: OpenUrl}
 */
TEST_F(GestureEventEmitterTest, StableGestureFiresThenCoolsDown) {
    auto emitter = makeEmitter(3, 2.0, {{2, ActionDescriptor::openUrl("https://example.com")}});

    EXPECT_FALSE(emitter->processCount(2, at(0.0)).event.has_value());
    EXPECT_FALSE(emitter->processCount(2, at(0.1)).event.has_value());

    auto tick = emitter->processCount(2, at(0.2));
    ASSERT_TRUE(tick.event.has_value());
    EXPECT_EQ(tick.event->count, 2);
    EXPECT_EQ(tick.event->timestamp, at(0.2));
    EXPECT_TRUE(tick.acted);
    ASSERT_EQ(url_opener_->calls.size(), 1u);
    EXPECT_EQ(url_opener_->calls[0], "https://example.com");

    EXPECT_FALSE(emitter->cooldown().allow(at(2.1)));
    EXPECT_TRUE(emitter->cooldown().allow(at(2.2)));

    // Release, then show the same gesture again inside the cooldown window
    emitter->processCount(std::nullopt, at(0.5));
    for (double t : {1.0, 1.1, 1.2}) {
        auto again = emitter->processCount(2, at(t));
        EXPECT_FALSE(again.event.has_value()) << "t=" << t;
        EXPECT_FALSE(again.acted);
    }
    EXPECT_TRUE(emitter->stability().isStable());
    EXPECT_EQ(url_opener_->calls.size(), 1u);
    EXPECT_EQ(emitter->actedCount(), 1u);
}

/**
 * Test 2: [None, 1 x 6] with STABLE_FRAMES=6 triggers once, on the 6th 1
 */
TEST_F(GestureEventEmitterTest, FiresOnceOnSixthTick) {
    auto emitter = makeEmitter(6, 3.0, {{1, ActionDescriptor::openUrl("https://www.youtube.com/")}});

    std::vector<std::optional<FingerCount>> ticks = {std::nullopt, 1, 1, 1, 1, 1, 1};
    int fired_at = -1;
    int fire_count = 0;
    for (size_t i = 0; i < ticks.size(); ++i) {
        auto tick = emitter->processCount(ticks[i], at(0.03 * static_cast<double>(i)));
        if (tick.event) {
            ++fire_count;
            fired_at = static_cast<int>(i);
        }
    }
    EXPECT_EQ(fire_count, 1);
    EXPECT_EQ(fired_at, 6);
    EXPECT_EQ(url_opener_->calls.size(), 1u);
}

/**
 * Test 3: NoOp and unmapped counts never advance the cooldown
 */
TEST_F(GestureEventEmitterTest, UnmappedCountNeverRecordsCooldown) {
    auto emitter = makeEmitter(2, 3.0, {{0, ActionDescriptor::noop()}});

    for (int i = 0; i < 50; ++i) {
        auto tick = emitter->processCount(3, at(0.1 * i));
        EXPECT_FALSE(tick.acted);
        if (i >= 1) {
            // Stable and cooldown open: an event is emitted every tick, none acted
            EXPECT_TRUE(tick.event.has_value());
        }
    }
    EXPECT_FALSE(emitter->cooldown().lastTriggerTime().has_value());

    for (int i = 0; i < 10; ++i) {
        emitter->processCount(0, at(10.0 + 0.1 * i));
    }
    EXPECT_FALSE(emitter->cooldown().lastTriggerTime().has_value());
    EXPECT_EQ(emitter->actedCount(), 0u);
}

TEST_F(GestureEventEmitterTest, UnmappedCountReportedOncePerHold) {
    auto& logger = core::Logger::getInstance();
    ASSERT_TRUE(logger.initializeWithTimestamp((tmp_.path() / "log").string(), core::LogLevel::INFO));
    logger.setConsoleOutput(false);

    auto emitter = makeEmitter(3, 2.0, {{1, ActionDescriptor::openUrl("https://example.com")}});
    for (int i = 0; i < 3; ++i) {
        emitter->processCount(1, at(0.1 * i));
    }
    ASSERT_EQ(url_opener_->calls.size(), 1u);

    // 2 becomes stable at 0.5 while the cooldown is still closed
    int unmapped_events = 0;
    for (int i = 3; i <= 30; ++i) {
        if (emitter->processCount(2, at(0.1 * i)).event) {
            ++unmapped_events;
        }
    }
    EXPECT_GT(unmapped_events, 1);

    // A new hold is reported again
    emitter->processCount(std::nullopt, at(3.1));
    for (int i = 32; i <= 34; ++i) {
        emitter->processCount(2, at(0.1 * i));
    }

    logger.flush();
    std::ifstream in(logger.getCurrentLogFile());
    std::stringstream content;
    content << in.rdbuf();
    logger.closeLogFile();
    logger.setConsoleOutput(true);
    logger.setLevel(core::LogLevel::WARNING);

    const std::string text = content.str();
    const std::string needle = "No action mapped for 2 fingers";
    size_t reports = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++reports;
    }
    EXPECT_EQ(reports, 2u);
}

/**
 * Test 4: Unresolvable OpenProgram retries on the next stable tick
 */
TEST_F(GestureEventEmitterTest, UnresolvableProgramAllowsImmediateRetry) {
    auto emitter = makeEmitter(2, 3.0, {{4, ActionDescriptor::openProgram("files")}});

    emitter->processCount(4, at(0.0));
    auto first = emitter->processCount(4, at(0.1));
    ASSERT_TRUE(first.event.has_value());
    EXPECT_FALSE(first.acted);
    EXPECT_FALSE(emitter->cooldown().lastTriggerTime().has_value());
    EXPECT_EQ(emitter->stability().consecutiveTicks(), 2);

    // The program appears; the very next tick succeeds
    tmp_.makeExecutable("bin/files");
    auto second = emitter->processCount(4, at(0.2));
    ASSERT_TRUE(second.event.has_value());
    EXPECT_TRUE(second.acted);
    ASSERT_EQ(launcher_->launches.size(), 1u);
    EXPECT_EQ(launcher_->launches[0].first, (bin_ / "files").string());
    EXPECT_EQ(*emitter->cooldown().lastTriggerTime(), at(0.2));
}

/**
 * Test 5: A failed capability call does not consume the cooldown
 */
TEST_F(GestureEventEmitterTest, CapabilityFaultDoesNotRecordCooldown) {
    url_opener_->fail = true;
    auto emitter = makeEmitter(1, 2.0, {{1, ActionDescriptor::openUrl("https://example.com")}});

    EXPECT_FALSE(emitter->processCount(1, at(0.0)).acted);
    EXPECT_FALSE(emitter->processCount(1, at(0.1)).acted);
    EXPECT_EQ(url_opener_->calls.size(), 2u);

    url_opener_->fail = false;
    EXPECT_TRUE(emitter->processCount(1, at(0.2)).acted);
    EXPECT_FALSE(emitter->processCount(1, at(0.3)).acted);
}

/**
 * Test 6: Held gesture repeats each time the cooldown expires
 */
TEST_F(GestureEventEmitterTest, HeldGestureRepeatsAfterCooldown) {
    auto emitter = makeEmitter(3, 2.0, {{5, ActionDescriptor::sayText("hi")}});

    std::vector<double> fired;
    for (int i = 0; i <= 50; ++i) {
        const double t = 0.1 * i;
        auto tick = emitter->processCount(5, at(t));
        if (tick.acted) {
            fired.push_back(t);
        }
    }

    ASSERT_EQ(fired.size(), 3u);
    EXPECT_NEAR(fired[0], 0.2, 1e-9);
    EXPECT_NEAR(fired[1], 2.2, 1e-9);
    EXPECT_NEAR(fired[2], 4.2, 1e-9);
    EXPECT_EQ(emitter->stability().consecutiveTicks(), 51);
}

/**
 * Test 7: At most one event per tick, even with a zero cooldown
 */
TEST_F(GestureEventEmitterTest, OneEventPerTick) {
    auto emitter = makeEmitter(1, 0.0, {{2, ActionDescriptor::openUrl("https://example.com")}});
    for (int i = 0; i < 5; ++i) {
        emitter->processCount(2, at(0.0));
    }
    EXPECT_EQ(url_opener_->calls.size(), 5u);
}

/**
 * Test 8: Observation path extracts the count
 */
TEST_F(GestureEventEmitterTest, ProcessObservation) {
    auto emitter = makeEmitter(1, 2.0, {{5, ActionDescriptor::openUrl("https://example.com")}});

    HandObservation hand;
    hand.handedness = Handedness::Right;
    hand.landmarks.assign(kNumHandLandmarks, cv::Point3f(0.5f, 0.6f, 0.0f));
    hand.landmarks[FingerStateExtractor::kThumbTip].x = 0.4f;
    for (int tip : {FingerStateExtractor::kIndexTip, FingerStateExtractor::kMiddleTip,
                    FingerStateExtractor::kRingTip, FingerStateExtractor::kPinkyTip}) {
        hand.landmarks[tip].y = 0.2f;
    }

    auto tick = emitter->process(hand, at(0.0));
    ASSERT_TRUE(tick.finger_state.has_value());
    EXPECT_EQ(tick.finger_state->count, 5);
    EXPECT_TRUE(tick.acted);

    auto none = emitter->process(std::nullopt, at(0.1));
    EXPECT_FALSE(none.finger_state.has_value());
    EXPECT_EQ(none.stability.consecutive_ticks, 0);
}

/**
 * Test 9: Event callback sees every event with its acted flag
 */
TEST_F(GestureEventEmitterTest, CallbackReceivesEvents) {
    auto emitter = makeEmitter(1, 1.0, {{1, ActionDescriptor::openUrl("https://example.com")}});

    std::vector<std::pair<FingerCount, bool>> seen;
    emitter->setEventCallback([&seen](const GestureEvent& event, bool acted) {
        seen.emplace_back(event.count, acted);
    });

    emitter->processCount(1, at(0.0));   // acted
    emitter->processCount(1, at(0.5));   // cooling down, no event
    emitter->processCount(3, at(0.6));   // unmapped, wait for cooldown
    emitter->processCount(3, at(1.0));   // unmapped event, not acted

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], std::make_pair(1, true));
    EXPECT_EQ(seen[1], std::make_pair(3, false));
}

/**
 * Test 10: Voice confirmation after an acted dispatch
 */
TEST_F(GestureEventEmitterTest, AnnouncesActedGesture) {
    dispatcher_->setVoiceFeedback(true);
    auto emitter = makeEmitter(1, 1.0, {{1, ActionDescriptor::openUrl("https://example.com")},
                                         {0, ActionDescriptor::noop()}});

    emitter->processCount(1, at(0.0));
    emitter->processCount(0, at(5.0));

    ASSERT_EQ(speech_->spoken.size(), 1u);
    EXPECT_EQ(speech_->spoken[0], "Opening website.");
}

TEST_F(GestureEventEmitterTest, RejectsInvalidConfig) {
    EXPECT_THROW(makeEmitter(0, 1.0, {}), core::Exception);
    EXPECT_THROW(makeEmitter(3, -1.0, {}), core::Exception);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
