/**
 * @file test_finger_state_extractor.cpp
 * @brief Unit tests for FingerStateExtractor
 *
 * Validates:
 * - Thumb rule per handedness (mirrored camera convention)
 * - Tip-above-PIP rule for index..pinky
 * - Left/right symmetry of mirrored hands
 * - Tolerance to missing or non-finite landmarks
 */

#include <gtest/gtest.h>
#include <fingerlaunch/gesture/FingerStateExtractor.hpp>

#include <limits>

using namespace fingerlaunch::gesture;

namespace {

/**
 * @brief Synthetic hand: every landmark at the image centre, then tips moved
 */
HandObservation makeHand(Handedness handedness, bool thumb,
                         bool index, bool middle, bool ring, bool pinky) {
    HandObservation hand;
    hand.handedness = handedness;
    hand.landmarks.assign(kNumHandLandmarks, cv::Point3f(0.5f, 0.5f, 0.0f));

    // Thumb IP stays at x=0.5; the tip moves outward for this hand's side
    const float outward = (handedness == Handedness::Left) ? 0.1f : -0.1f;
    hand.landmarks[FingerStateExtractor::kThumbTip].x = thumb ? 0.5f + outward : 0.5f - outward;

    auto setFinger = [&hand](int tip, bool extended) {
        hand.landmarks[tip - FingerStateExtractor::kPipOffset].y = 0.6f;
        hand.landmarks[tip].y = extended ? 0.3f : 0.8f;
    };
    setFinger(FingerStateExtractor::kIndexTip, index);
    setFinger(FingerStateExtractor::kMiddleTip, middle);
    setFinger(FingerStateExtractor::kRingTip, ring);
    setFinger(FingerStateExtractor::kPinkyTip, pinky);
    return hand;
}

HandObservation mirror(const HandObservation& hand) {
    HandObservation mirrored = hand;
    for (auto& p : mirrored.landmarks) {
        p.x = 1.0f - p.x;
    }
    if (hand.handedness == Handedness::Left) {
        mirrored.handedness = Handedness::Right;
    } else if (hand.handedness == Handedness::Right) {
        mirrored.handedness = Handedness::Left;
    }
    return mirrored;
}

} // namespace

/**
 * Test 1: Open and closed hands
 */
TEST(FingerStateExtractorTest, OpenHandCountsFive) {
    auto state = FingerStateExtractor::extract(makeHand(Handedness::Right, true, true, true, true, true));
    EXPECT_EQ(state.count, 5);
    EXPECT_EQ(state.fingers, (FingerVector{{1, 1, 1, 1, 1}}));
}

TEST(FingerStateExtractorTest, FistCountsZero) {
    auto state = FingerStateExtractor::extract(makeHand(Handedness::Right, false, false, false, false, false));
    EXPECT_EQ(state.count, 0);
    EXPECT_EQ(state.fingers, (FingerVector{{0, 0, 0, 0, 0}}));
}

/**
 * Test 2: Count equals the sum of the finger vector
 */
TEST(FingerStateExtractorTest, CountMatchesVector) {
    auto state = FingerStateExtractor::extract(makeHand(Handedness::Left, false, true, true, false, false));
    EXPECT_EQ(state.count, 2);
    EXPECT_EQ(state.fingers, (FingerVector{{0, 1, 1, 0, 0}}));

    state = FingerStateExtractor::extract(makeHand(Handedness::Right, true, false, false, false, true));
    EXPECT_EQ(state.count, 2);
    EXPECT_EQ(state.fingers, (FingerVector{{1, 0, 0, 0, 1}}));
}

/**
 * Test 3: Thumb rule depends on handedness
 */
TEST(FingerStateExtractorTest, ThumbRuleRightHand) {
    std::vector<cv::Point3f> lm(kNumHandLandmarks, cv::Point3f(0.5f, 0.5f, 0.0f));
    lm[FingerStateExtractor::kThumbTip].x = 0.4f;
    EXPECT_TRUE(FingerStateExtractor::isThumbExtended(lm, Handedness::Right));
    EXPECT_FALSE(FingerStateExtractor::isThumbExtended(lm, Handedness::Left));

    lm[FingerStateExtractor::kThumbTip].x = 0.6f;
    EXPECT_FALSE(FingerStateExtractor::isThumbExtended(lm, Handedness::Right));
    EXPECT_TRUE(FingerStateExtractor::isThumbExtended(lm, Handedness::Left));
}

TEST(FingerStateExtractorTest, UnknownHandednessUsesRightRule) {
    std::vector<cv::Point3f> lm(kNumHandLandmarks, cv::Point3f(0.5f, 0.5f, 0.0f));
    lm[FingerStateExtractor::kThumbTip].x = 0.4f;
    EXPECT_TRUE(FingerStateExtractor::isThumbExtended(lm, Handedness::Unknown));
    lm[FingerStateExtractor::kThumbTip].x = 0.6f;
    EXPECT_FALSE(FingerStateExtractor::isThumbExtended(lm, Handedness::Unknown));
}

TEST(FingerStateExtractorTest, ThumbTipLevelWithJointIsNotExtended) {
    std::vector<cv::Point3f> lm(kNumHandLandmarks, cv::Point3f(0.5f, 0.5f, 0.0f));
    EXPECT_FALSE(FingerStateExtractor::isThumbExtended(lm, Handedness::Right));
    EXPECT_FALSE(FingerStateExtractor::isThumbExtended(lm, Handedness::Left));
}

/**
 * Test 4: Mirrored hand with swapped label gives the same state
 */
TEST(FingerStateExtractorTest, HandednessSymmetry) {
    const HandObservation combos[] = {
        makeHand(Handedness::Right, true, true, true, true, true),
        makeHand(Handedness::Right, true, false, false, false, false),
        makeHand(Handedness::Right, false, true, true, false, false),
        makeHand(Handedness::Left, true, true, false, false, true),
        makeHand(Handedness::Left, false, false, false, false, false),
    };

    for (const auto& hand : combos) {
        auto original = FingerStateExtractor::extract(hand);
        auto mirrored = FingerStateExtractor::extract(mirror(hand));
        EXPECT_EQ(original.count, mirrored.count);
        EXPECT_EQ(original.fingers, mirrored.fingers);
    }
}

TEST(FingerStateExtractorTest, SwappingLabelOnlyFlipsThumb) {
    auto right = makeHand(Handedness::Right, true, true, true, false, false);
    auto relabeled = right;
    relabeled.handedness = Handedness::Left;

    auto a = FingerStateExtractor::extract(right);
    auto b = FingerStateExtractor::extract(relabeled);
    EXPECT_EQ(a.fingers[0], 1);
    EXPECT_EQ(b.fingers[0], 0);
    for (size_t i = 1; i < a.fingers.size(); ++i) {
        EXPECT_EQ(a.fingers[i], b.fingers[i]);
    }
}

/**
 * Test 5: Malformed landmarks only affect the fingers that use them
 */
TEST(FingerStateExtractorTest, EmptyLandmarksGiveZero) {
    HandObservation hand;
    hand.handedness = Handedness::Right;
    auto state = FingerStateExtractor::extract(hand);
    EXPECT_EQ(state.count, 0);
}

TEST(FingerStateExtractorTest, TruncatedLandmarksKeepAvailableFingers) {
    auto hand = makeHand(Handedness::Right, true, true, true, true, true);
    hand.landmarks.resize(13);  // up to the middle finger tip

    auto state = FingerStateExtractor::extract(hand);
    EXPECT_EQ(state.fingers, (FingerVector{{1, 1, 1, 0, 0}}));
    EXPECT_EQ(state.count, 3);
}

TEST(FingerStateExtractorTest, NonFiniteLandmarkIsNotExtended) {
    auto hand = makeHand(Handedness::Right, true, true, true, true, true);
    hand.landmarks[FingerStateExtractor::kRingTip].y = std::numeric_limits<float>::quiet_NaN();
    hand.landmarks[FingerStateExtractor::kThumbIp].x = std::numeric_limits<float>::infinity();

    auto state = FingerStateExtractor::extract(hand);
    EXPECT_EQ(state.fingers, (FingerVector{{0, 1, 1, 0, 1}}));
    EXPECT_EQ(state.count, 3);
}

TEST(FingerStateExtractorTest, OutOfRangeTipIndexIsNotExtended) {
    std::vector<cv::Point3f> lm(kNumHandLandmarks, cv::Point3f(0.5f, 0.1f, 0.0f));
    EXPECT_FALSE(FingerStateExtractor::isFingerExtended(lm, 42));
    EXPECT_FALSE(FingerStateExtractor::isFingerExtended(lm, 1));
}

/**
 * Test 6: Pre-reduced finger vectors
 */
TEST(FingerStateExtractorTest, FromFingerVectorNormalizesEntries) {
    auto state = FingerStateExtractor::fromFingerVector(FingerVector{{1, 0, 7, 0, 1}});
    EXPECT_EQ(state.count, 3);
    EXPECT_EQ(state.fingers, (FingerVector{{1, 0, 1, 0, 1}}));
    EXPECT_EQ(finger_vector_to_string(state.fingers), "[1, 0, 1, 0, 1]");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
