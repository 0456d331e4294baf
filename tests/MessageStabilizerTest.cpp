#include <gtest/gtest.h>
#include <algorithm>
#include "FakePorts.hpp"
#include "coach/FeedbackMessages.hpp"
#include "coach/MessageStabilizer.hpp"

using namespace coach;
using namespace coach::testing;

namespace {

FingerError makeError(Finger finger, FingerErrorType type, Severity severity, float expected = 0.5f) {
    FingerError e;
    e.finger = finger;
    e.errorType = type;
    e.severity = severity;
    e.expectedValue = expected;
    e.message = FeedbackMessages::correction(finger, type, severity);
    return e;
}

StaticGestureResult resultWith(std::vector<FingerError> errors) {
    StaticGestureResult r;
    r.perFingerErrors = std::move(errors);
    r.updateAggregates();
    return r;
}

bool contains(const std::vector<std::string>& list, const std::string& text) {
    return std::find(list.begin(), list.end(), text) != list.end();
}

} // namespace

TEST(MessageStabilizerTest, ScenarioC_GroupedCurveRanksAboveMinorSpread) {
    auto result = resultWith({
        makeError(Finger::Index, FingerErrorType::NeedsCurve, Severity::Major),
        makeError(Finger::Middle, FingerErrorType::NeedsCurve, Severity::Major),
        makeError(Finger::Ring, FingerErrorType::NeedsCurve, Severity::Major),
        makeError(Finger::Pinky, FingerErrorType::SpreadTooWide, Severity::Minor),
    });

    MessageStabilizer stabilizer;
    auto ranked = stabilizer.rankCandidates(result, "C");

    ASSERT_FALSE(ranked.empty());
    EXPECT_EQ(ranked[0].text, "Curve: index, middle and ring");
    EXPECT_EQ(ranked[0].severityWeight, 3);
    EXPECT_EQ(ranked[0].affectedCount, 3);

    auto spread = std::find_if(ranked.begin(), ranked.end(),
                               [](const MessageCandidate& c) { return c.text == "Bring together: pinky"; });
    ASSERT_NE(spread, ranked.end());
    EXPECT_EQ(spread->severityWeight, 2);
    EXPECT_GT(spread - ranked.begin(), 0);
}

TEST(MessageStabilizerTest, CandidatesAreCapped) {
    auto result = resultWith({
        makeError(Finger::Thumb, FingerErrorType::NeedsExtend, Severity::Major),
        makeError(Finger::Index, FingerErrorType::NeedsCurve, Severity::Major),
        makeError(Finger::Middle, FingerErrorType::NeedsFist, Severity::Major),
        makeError(Finger::Ring, FingerErrorType::TooMuchCurl, Severity::Major),
        makeError(Finger::Pinky, FingerErrorType::SpreadTooNarrow, Severity::Minor),
    });

    MessageStabilizer stabilizer;
    auto texts = stabilizer.buildCandidates(result, "X");
    EXPECT_EQ(texts.size(), MAX_FEEDBACK_MESSAGES);
}

TEST(MessageStabilizerTest, MinorOnlyAddsHoldSteady) {
    auto result = resultWith({makeError(Finger::Index, FingerErrorType::NeedsCurve, Severity::Minor)});

    MessageStabilizer stabilizer;
    auto texts = stabilizer.buildCandidates(result, "C");
    EXPECT_EQ(texts[0], "Curve: index");
    EXPECT_TRUE(contains(texts, FeedbackMessages::holdSteady()));
    EXPECT_TRUE(contains(texts, FeedbackMessages::remainingAdjustments(1)));
}

TEST(MessageStabilizerTest, NoErrorsButNoMatchAsksToRetry) {
    MessageStabilizer stabilizer;
    auto texts = stabilizer.buildCandidates(resultWith({}), "B");
    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0], FeedbackMessages::notFullyRecognized("B"));
}

TEST(MessageStabilizerTest, CustomMessageIsItsOwnCandidate) {
    auto error = makeError(Finger::Thumb, FingerErrorType::TooExtended, Severity::Major);
    error.message = "Tuck your thumb across your palm";
    error.hasCustomMessage = true;

    MessageStabilizer stabilizer;
    auto texts = stabilizer.buildCandidates(resultWith({error}), "B");
    EXPECT_EQ(texts[0], "Tuck your thumb across your palm");
}

TEST(MessageStabilizerTest, LegacyTooExtendedRoutesByExpectedShape) {
    EXPECT_EQ(MessageStabilizer::routeLegacyTooExtended(0.875f), MessageAction::Close);
    EXPECT_EQ(MessageStabilizer::routeLegacyTooExtended(0.5f), MessageAction::Curve);
    EXPECT_EQ(MessageStabilizer::routeLegacyTooExtended(0.1f), MessageAction::Bend);

    auto result = resultWith({makeError(Finger::Index, FingerErrorType::TooExtended, Severity::Major, 0.875f)});
    MessageStabilizer stabilizer;
    EXPECT_EQ(stabilizer.buildCandidates(result, "S")[0], "Close: index");
}

TEST(MessageStabilizerTest, EntryNeedsUninterruptedProposals) {
    MessageStabilizer stabilizer;

    EXPECT_TRUE(stabilizer.applyHysteresis({"A"}, at(0.0f)).empty());
    EXPECT_TRUE(stabilizer.applyHysteresis({"A"}, at(0.1f)).empty());
    EXPECT_EQ(stabilizer.applyHysteresis({"A"}, at(0.3f)), std::vector<std::string>{"A"});

    MessageStabilizer interrupted;
    interrupted.applyHysteresis({"A"}, at(0.0f));
    interrupted.applyHysteresis({"B"}, at(0.1f));
    interrupted.applyHysteresis({"A"}, at(0.2f));
    EXPECT_FALSE(contains(interrupted.applyHysteresis({"A"}, at(0.3f)), "A"));
    EXPECT_TRUE(contains(interrupted.applyHysteresis({"A"}, at(0.5f)), "A"));
}

TEST(MessageStabilizerTest, ExitAfterAbsenceDelay) {
    MessageStabilizer stabilizer;
    stabilizer.applyHysteresis({"A"}, at(0.0f));
    stabilizer.applyHysteresis({"A"}, at(0.3f));

    EXPECT_EQ(stabilizer.applyHysteresis({"B"}, at(0.35f)), std::vector<std::string>{"A"});
    EXPECT_EQ(stabilizer.applyHysteresis({"B"}, at(0.65f)), (std::vector<std::string>{"B", "A"}));
    EXPECT_EQ(stabilizer.applyHysteresis({"B"}, at(0.8f)), std::vector<std::string>{"B"});
    EXPECT_EQ(stabilizer.getWindowCount(), 1u);
}

TEST(MessageStabilizerTest, FlickeringCandidateNeverShows) {
    MessageStabilizer stabilizer;
    stabilizer.applyHysteresis({"steady"}, at(0.0f));

    for (int i = 1; i <= 20; ++i) {
        float t = 0.1f * static_cast<float>(i);
        std::vector<std::string> candidates{"steady"};
        if (i % 2 == 0) candidates.push_back("flicker");
        auto stable = stabilizer.applyHysteresis(candidates, at(t));
        EXPECT_FALSE(contains(stable, "flicker")) << "t=" << t;
    }
}

TEST(MessageStabilizerTest, EmptyOutcomeKeepsPreviousSet) {
    MessageStabilizer stabilizer;
    stabilizer.applyHysteresis({"A"}, at(0.0f));
    stabilizer.applyHysteresis({"A"}, at(0.3f));

    EXPECT_EQ(stabilizer.applyHysteresis({}, at(2.0f)), std::vector<std::string>{"A"});
    EXPECT_EQ(stabilizer.getStableMessages(), std::vector<std::string>{"A"});
}

TEST(MessageStabilizerTest, StabilizeWritesSummary) {
    auto result = resultWith({
        makeError(Finger::Index, FingerErrorType::NeedsFist, Severity::Major),
        makeError(Finger::Middle, FingerErrorType::NeedsFist, Severity::Major),
    });

    MessageStabilizer stabilizer;
    std::string first = stabilizer.stabilize(result, "S", at(0.0f));
    EXPECT_EQ(first, FeedbackMessages::adjustHand("S"));
    EXPECT_EQ(result.summaryMessage, first);

    std::string later = stabilizer.stabilize(result, "S", at(0.3f));
    EXPECT_EQ(later, "Close: index and middle\n2 fingers left");
}

TEST(MessageStabilizerTest, MatchClearsWindows) {
    auto errors = resultWith({makeError(Finger::Index, FingerErrorType::NeedsFist, Severity::Major)});
    MessageStabilizer stabilizer;
    stabilizer.stabilize(errors, "S", at(0.0f));
    stabilizer.stabilize(errors, "S", at(0.3f));
    ASSERT_GT(stabilizer.getWindowCount(), 0u);

    auto match = StaticGestureResult::success();
    EXPECT_EQ(stabilizer.stabilize(match, "S", at(0.4f)), FeedbackMessages::signCorrect("S"));
    EXPECT_EQ(stabilizer.getWindowCount(), 0u);
    EXPECT_TRUE(stabilizer.getStableMessages().empty());
}
