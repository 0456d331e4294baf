#include <gtest/gtest.h>
#include "coach/FeedbackMessages.hpp"

using namespace coach;

TEST(FeedbackMessagesTest, FingerListJoinsWithAnd) {
    EXPECT_EQ(FeedbackMessages::fingerList({}), "");
    EXPECT_EQ(FeedbackMessages::fingerList({Finger::Index}), "index");
    EXPECT_EQ(FeedbackMessages::fingerList({Finger::Index, Finger::Middle}), "index and middle");
    EXPECT_EQ(FeedbackMessages::fingerList({Finger::Index, Finger::Middle, Finger::Ring}),
              "index, middle and ring");
}

TEST(FeedbackMessagesTest, RemainingAdjustments) {
    EXPECT_EQ(FeedbackMessages::remainingAdjustments(1), "Only 1 adjustment left");
    EXPECT_EQ(FeedbackMessages::remainingAdjustments(3), "3 fingers left");
}

TEST(FeedbackMessagesTest, CorrectionDependsOnSeverity) {
    EXPECT_EQ(FeedbackMessages::correction(Finger::Ring, FingerErrorType::NeedsFist, Severity::Major),
              "Close your ring into a fist");
    EXPECT_EQ(FeedbackMessages::correction(Finger::Ring, FingerErrorType::NeedsFist, Severity::Minor),
              "Close your ring a bit more");
}

TEST(FeedbackMessagesTest, TrajectoryLettersMatchWithSuffix) {
    EXPECT_EQ(FeedbackMessages::gestureDirectionHint("J_Right").rfind("Draw a J", 0), 0u);
    EXPECT_EQ(FeedbackMessages::gestureDirectionHint("z").rfind("Draw a Z", 0), 0u);
    EXPECT_FALSE(FeedbackMessages::trajectoryHint("J").empty());
    EXPECT_TRUE(FeedbackMessages::trajectoryHint("HELLO").empty());
}

TEST(FeedbackMessagesTest, HintsMatchWholeWords) {
    EXPECT_EQ(FeedbackMessages::gestureDirectionHint("thank_you"), "Move your hand forward from your chin.");
    EXPECT_EQ(FeedbackMessages::gestureDirectionHint("Good Morning"), "Move your hand forward from your chin.");
    // NO must not match inside another word
    EXPECT_TRUE(FeedbackMessages::gestureDirectionHint("NOTHING").empty());
    EXPECT_TRUE(FeedbackMessages::gestureDirectionHint("").empty());
}

TEST(FeedbackMessagesTest, DirectionDescription) {
    EXPECT_EQ(FeedbackMessages::directionDescription({0.0f, 1.0f, 0.0f}), "up");
    EXPECT_EQ(FeedbackMessages::directionDescription({0.0f, -2.0f, 0.0f}), "down");
    EXPECT_EQ(FeedbackMessages::directionDescription({1.0f, 0.0f, 1.0f}), "to the right and forward");
    EXPECT_TRUE(FeedbackMessages::directionDescription({0.0f, 0.0f, 0.0f}).empty());
}

TEST(FeedbackMessagesTest, DirectionIssueFallsBackToVector) {
    EXPECT_EQ(FeedbackMessages::inProgress(DynamicMovementIssue::DirectionWrong, "WAVE", {-1.0f, 0.0f, 0.0f}),
              "Move your hand to the left.");
    EXPECT_EQ(FeedbackMessages::inProgress(DynamicMovementIssue::DirectionWrong, "WAVE", {}),
              "Adjust the direction of the movement.");
}

TEST(FeedbackMessagesTest, ParseFailureReasonFromEnumName) {
    EXPECT_EQ(FeedbackMessages::parseFailureReason("SPEED_TOO_LOW"), FailureReason::SpeedTooLow);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("direction_changes_insufficient"),
              FailureReason::DirectionChangesInsufficient);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("OUT_OF_ZONE"), FailureReason::OutOfZone);
}

TEST(FeedbackMessagesTest, ParseFailureReasonFromText) {
    EXPECT_EQ(FeedbackMessages::parseFailureReason("Hand pose lost"), FailureReason::PoseLost);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("Movement too slow"), FailureReason::SpeedTooLow);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("Speed too high"), FailureReason::SpeedTooHigh);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("Distance too short"), FailureReason::DistanceTooShort);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("Wrong direction"), FailureReason::DirectionWrong);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("Not enough direction changes"),
              FailureReason::DirectionChangesInsufficient);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("Time exceeded"), FailureReason::Timeout);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("Hand outside zone"), FailureReason::OutOfZone);
    EXPECT_EQ(FeedbackMessages::parseFailureReason("something odd"), FailureReason::Unknown);
    EXPECT_EQ(FeedbackMessages::parseFailureReason(""), FailureReason::Unknown);
}

TEST(FeedbackMessagesTest, ParseFailedPhase) {
    EXPECT_EQ(FeedbackMessages::parseFailedPhase("Initial pose"), GesturePhase::Start);
    EXPECT_EQ(FeedbackMessages::parseFailedPhase("final"), GesturePhase::End);
    EXPECT_EQ(FeedbackMessages::parseFailedPhase("moving"), GesturePhase::Move);
    EXPECT_EQ(FeedbackMessages::parseFailedPhase(""), GesturePhase::Move);
}

TEST(FeedbackMessagesTest, FailedMessageUsesPhase) {
    const std::string early = FeedbackMessages::failed(FailureReason::PoseLost, GesturePhase::Start, "J", {});
    EXPECT_NE(early.find("too early"), std::string::npos);

    const std::string during = FeedbackMessages::failed(FailureReason::PoseLost, GesturePhase::Move, "J", {});
    EXPECT_NE(during.find("lost the hand shape"), std::string::npos);
}

TEST(FeedbackMessagesTest, TroubleshootingQuotesMetrics) {
    DynamicMetrics metrics;
    metrics.averageSpeed = 0.05f;
    metrics.directionChanges = 1;

    EXPECT_EQ(FeedbackMessages::troubleshooting(FailureReason::SpeedTooLow, GesturePhase::Move, metrics, "J", {}),
              "Move faster (speed: 0.05 m/s).");
    EXPECT_EQ(FeedbackMessages::troubleshooting(FailureReason::DirectionChangesInsufficient, GesturePhase::Move,
                                                metrics, "Z", {}),
              "Add more changes of direction (1 detected).");
    EXPECT_EQ(FeedbackMessages::troubleshooting(FailureReason::PoseLost, GesturePhase::End, metrics, "J", {}),
              "Keep the correct hand shape at the end.");
}

TEST(FeedbackMessagesTest, FailureReasonToIssue) {
    EXPECT_EQ(FeedbackMessages::failureReasonToIssue(FailureReason::SpeedTooHigh), DynamicMovementIssue::TooFast);
    EXPECT_EQ(FeedbackMessages::failureReasonToIssue(FailureReason::OutOfZone), DynamicMovementIssue::DirectionWrong);
    EXPECT_EQ(FeedbackMessages::failureReasonToIssue(FailureReason::PoseLost), DynamicMovementIssue::None);
}
