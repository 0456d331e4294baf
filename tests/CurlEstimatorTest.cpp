#include <gtest/gtest.h>
#include "FakePorts.hpp"
#include "coach/CurlEstimator.hpp"

using namespace coach;
using namespace coach::testing;

TEST(CurlEstimatorTest, StraightFingerIsZero) {
    auto curl = CurlEstimator::computeCurl(Finger::Index, makeFingerJoints(Finger::Index, 0.0f));
    ASSERT_TRUE(curl.has_value());
    EXPECT_NEAR(*curl, 0.0f, 1e-3f);
}

TEST(CurlEstimatorTest, FoldedFingerIsOne) {
    auto curl = CurlEstimator::computeCurl(Finger::Middle, makeFingerJoints(Finger::Middle, 1.0f));
    ASSERT_TRUE(curl.has_value());
    EXPECT_NEAR(*curl, 1.0f, 1e-3f);
}

TEST(CurlEstimatorTest, IntermediateValues) {
    for (float expected : {0.25f, 0.5f, 0.8f}) {
        auto curl = CurlEstimator::computeCurl(Finger::Ring, makeFingerJoints(Finger::Ring, expected));
        ASSERT_TRUE(curl.has_value());
        EXPECT_NEAR(*curl, expected, 1e-3f);
    }
}

TEST(CurlEstimatorTest, ThumbUsesItsOwnFoldedAngle) {
    auto curl = CurlEstimator::computeCurl(Finger::Thumb, makeFingerJoints(Finger::Thumb, 0.6f));
    ASSERT_TRUE(curl.has_value());
    EXPECT_NEAR(*curl, 0.6f, 1e-3f);
}

TEST(CurlEstimatorTest, DegenerateSegmentHasNoCurl) {
    CurlEstimator::FingerJoints joints{};
    EXPECT_FALSE(CurlEstimator::computeCurl(Finger::Index, joints).has_value());
}

TEST(CurlEstimatorTest, NeutralBeforeFirstObservation) {
    CurlEstimator estimator;
    EXPECT_FALSE(estimator.hasObserved(Finger::Pinky));
    EXPECT_FLOAT_EQ(estimator.update(Finger::Pinky, std::nullopt), NEUTRAL_CURL);
}

TEST(CurlEstimatorTest, DropoutHoldsLastValue) {
    CurlEstimator estimator;
    estimator.update(Finger::Index, makeFingerJoints(Finger::Index, 0.9f));

    float held = estimator.update(Finger::Index, std::nullopt);
    EXPECT_NEAR(held, 0.9f, 1e-3f);
    EXPECT_TRUE(estimator.hasObserved(Finger::Index));

    // A degenerate frame is a dropout too
    held = estimator.update(Finger::Index, CurlEstimator::FingerJoints{});
    EXPECT_NEAR(held, 0.9f, 1e-3f);
}

TEST(CurlEstimatorTest, SampleReadsEveryFinger) {
    FakeHand hand;
    hand.setCurls({0.1f, 0.2f, 0.5f, 0.7f, 0.95f});

    CurlEstimator estimator;
    HandSnapshot snap = estimator.sample(hand);

    EXPECT_TRUE(snap.tracked);
    EXPECT_NEAR(snap.curls[0], 0.1f, 1e-3f);
    EXPECT_NEAR(snap.curls[1], 0.2f, 1e-3f);
    EXPECT_NEAR(snap.curls[2], 0.5f, 1e-3f);
    EXPECT_NEAR(snap.curls[3], 0.7f, 1e-3f);
    EXPECT_NEAR(snap.curls[4], 0.95f, 1e-3f);
    for (size_t i = 0; i < FINGER_COUNT; ++i) {
        EXPECT_TRUE(snap.directions[i].has_value());
        EXPECT_TRUE(snap.tips[i].has_value());
        EXPECT_TRUE(snap.bases[i].has_value());
    }
    EXPECT_NEAR(snap.bases[fingerIndex(Finger::Middle)]->x, 0.0f, 1e-6f);
    ASSERT_TRUE(snap.palmForward.has_value());
    EXPECT_NEAR(snap.palmForward->z, 1.0f, 1e-4f);
}

TEST(CurlEstimatorTest, SampleHoldsDroppedFinger) {
    FakeHand hand;
    hand.setCurl(Finger::Middle, 0.8f);

    CurlEstimator estimator;
    estimator.sample(hand);

    hand.dropFinger(Finger::Middle);
    HandSnapshot snap = estimator.sample(hand);
    EXPECT_NEAR(snap.curls[fingerIndex(Finger::Middle)], 0.8f, 1e-3f);
    EXPECT_FALSE(snap.tips[fingerIndex(Finger::Middle)].has_value());
}

TEST(CurlEstimatorTest, UntrackedHandKeepsHeldCurls) {
    FakeHand hand;
    hand.setCurl(Finger::Index, 0.4f);

    CurlEstimator estimator;
    estimator.sample(hand);

    hand.tracked = false;
    hand.setCurl(Finger::Index, 1.0f);
    HandSnapshot snap = estimator.sample(hand);
    EXPECT_FALSE(snap.tracked);
    EXPECT_NEAR(snap.curls[fingerIndex(Finger::Index)], 0.4f, 1e-3f);
    EXPECT_FALSE(snap.palmForward.has_value());
}

TEST(CurlEstimatorTest, ResetForgetsObservations) {
    CurlEstimator estimator;
    estimator.update(Finger::Thumb, makeFingerJoints(Finger::Thumb, 0.2f));
    estimator.reset();
    EXPECT_FALSE(estimator.hasObserved(Finger::Thumb));
    EXPECT_FLOAT_EQ(estimator.getCurl(Finger::Thumb), NEUTRAL_CURL);
}
