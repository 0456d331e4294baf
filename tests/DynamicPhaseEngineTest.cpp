#include <gtest/gtest.h>
#include <algorithm>
#include "FakePorts.hpp"
#include "coach/DynamicPhaseEngine.hpp"
#include "coach/FeedbackMessages.hpp"

using namespace coach;
using namespace coach::testing;

namespace {

DynamicPhaseEngine::Config seeded() {
    DynamicPhaseEngine::Config config;
    config.seed = 42;
    return config;
}

DynamicGestureDefinition slowWave() {
    DynamicGestureDefinition def;
    def.gestureName = "HELLO";
    def.minSpeed = 0.12f;
    def.minDistance = 0.10f;
    return def;
}

DynamicMetrics goodMotion() {
    DynamicMetrics m;
    m.averageSpeed = 0.2f;
    m.maxSpeed = 0.3f;
    m.totalDistance = 0.2f;
    m.duration = 0.8f;
    m.directionAlignment = 0.9f;
    m.totalRotation = 90.0f;
    m.circularityScore = 0.9f;
    m.directionChanges = 4;
    return m;
}

void startAttempt(DynamicPhaseEngine& engine, const std::string& name, TimePoint now) {
    engine.notifyIdle(name);
    ASSERT_TRUE(engine.notifyStartDetected(name));
    ASSERT_TRUE(engine.analyzeProgress(name, 0.1f, goodMotion(), nullptr, now));
}

} // namespace

TEST(DynamicPhaseEngineTest, ScenarioD_SlowMovementReportsTooSlow) {
    DynamicPhaseEngine engine(seeded());
    auto def = slowWave();
    engine.notifyIdle(def.gestureName);
    ASSERT_TRUE(engine.notifyStartDetected(def.gestureName));

    DynamicMetrics metrics = goodMotion();
    metrics.averageSpeed = 0.2f * def.minSpeed;
    metrics.handShapeStable = true;

    ASSERT_TRUE(engine.analyzeProgress(def.gestureName, 0.3f, metrics, &def, at(0.0f)));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::InProgress);
    EXPECT_EQ(engine.getCurrentIssue(), DynamicMovementIssue::TooSlow);
    EXPECT_EQ(engine.getCurrentMessage(),
              FeedbackMessages::inProgress(DynamicMovementIssue::TooSlow, def.gestureName, def.primaryDirection));
}

TEST(DynamicPhaseEngineTest, ProgressWithoutMetricsReportsNoIssue) {
    DynamicPhaseEngine engine(seeded());
    auto def = slowWave();
    engine.notifyIdle(def.gestureName);
    ASSERT_TRUE(engine.notifyStartDetected(def.gestureName));

    ASSERT_TRUE(engine.analyzeProgress(def.gestureName, 0.3f, std::nullopt, &def, at(0.0f)));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::InProgress);
    EXPECT_EQ(engine.getCurrentIssue(), DynamicMovementIssue::None);
    EXPECT_EQ(engine.getCurrentMessage(),
              FeedbackMessages::inProgress(DynamicMovementIssue::None, def.gestureName, def.primaryDirection));
}

TEST(DynamicPhaseEngineTest, IssuePriorityOrder) {
    MovementRequirements req;
    req.expectedMinSpeed = 0.1f;
    req.expectedMaxSpeed = 0.3f;
    req.expectedMinDistance = 0.1f;
    req.requiresDirection = true;
    req.minDirectionAlignment = 0.7f;
    req.requiresRotation = true;
    req.minRotationAngle = 60.0f;
    req.requiresCircular = true;
    req.minCircularityScore = 0.6f;
    req.requiresDirectionChanges = true;
    req.requiredDirectionChanges = 3;

    DynamicMetrics m;
    m.handShapeStable = false;
    m.averageSpeed = 0.01f;
    m.maxSpeed = 1.0f;
    m.directionAlignment = 0.0f;
    m.duration = 1.0f;
    m.totalDistance = 0.0f;
    m.totalRotation = 0.0f;
    m.circularityScore = 0.0f;
    m.directionChanges = 0;

    using Issue = DynamicMovementIssue;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), Issue::StartPoseDegrading);
    m.handShapeStable = true;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), Issue::TooSlow);
    m.averageSpeed = 0.1f;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), Issue::TooFast);
    m.maxSpeed = 0.3f;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), Issue::DirectionWrong);
    m.directionAlignment = 0.9f;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), Issue::TooShort);
    m.totalDistance = 0.1f;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), Issue::RotationInsufficient);
    m.totalRotation = 45.0f;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), Issue::NotCircular);
    m.circularityScore = 0.5f;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), Issue::NeedMoreDirectionChanges);
    m.directionChanges = 3;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), Issue::None);
}

TEST(DynamicPhaseEngineTest, ShortDistanceIgnoredEarlyInTheMovement) {
    MovementRequirements req;
    req.expectedMinDistance = 0.2f;

    DynamicMetrics m;
    m.duration = 0.2f;
    m.totalDistance = 0.0f;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), DynamicMovementIssue::None);
    m.duration = 0.5f;
    EXPECT_EQ(DynamicPhaseEngine::detectMovementIssue(m, req), DynamicMovementIssue::TooShort);
}

TEST(DynamicPhaseEngineTest, RequirementsFromDefinition) {
    auto def = slowWave();
    def.requiresRotation = true;
    auto req = MovementRequirements::fromDefinition(def);
    EXPECT_FLOAT_EQ(req.expectedMinSpeed, 0.12f);
    EXPECT_FLOAT_EQ(req.expectedMaxSpeed, 0.36f);
    EXPECT_TRUE(req.requiresRotation);
    EXPECT_FALSE(req.requiresCircular);
}

TEST(DynamicPhaseEngineTest, TerminalPhasesOnlyFromMotion) {
    DynamicPhaseEngine engine(seeded());
    DynamicMetrics metrics = goodMotion();

    EXPECT_FALSE(engine.notifyCompleted("J", metrics));
    EXPECT_FALSE(engine.notifyFailed("J", FailureReason::Timeout, GesturePhase::Move, metrics));
    EXPECT_FALSE(engine.analyzeProgress("J", 0.5f, metrics, nullptr, at(0.0f)));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::Idle);

    ASSERT_TRUE(engine.notifyStartDetected("J"));
    EXPECT_FALSE(engine.notifyCompleted("J", metrics));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::StartDetected);

    ASSERT_TRUE(engine.analyzeProgress("J", 0.5f, metrics, nullptr, at(0.1f)));
    ASSERT_TRUE(engine.notifyCompleted("J", metrics));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::Completed);
    EXPECT_TRUE(engine.isTerminal());

    // Terminal phases need an explicit way out
    EXPECT_FALSE(engine.notifyStartDetected("J"));
    EXPECT_FALSE(engine.analyzeProgress("J", 0.5f, metrics, nullptr, at(0.2f)));
    EXPECT_FALSE(engine.notifyFailed("J", FailureReason::Timeout, GesturePhase::Move, metrics));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::Completed);

    engine.notifyIdle("J");
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::Idle);
    EXPECT_EQ(engine.getCurrentMessage(), FeedbackMessages::idlePhase("J"));
}

TEST(DynamicPhaseEngineTest, RepeatedStartIsAccepted) {
    DynamicPhaseEngine engine(seeded());
    ASSERT_TRUE(engine.notifyStartDetected("Z"));
    EXPECT_TRUE(engine.notifyStartDetected("Z"));
    EXPECT_EQ(engine.drainPhaseChanges().size(), 1u);
}

TEST(DynamicPhaseEngineTest, ProgressCrossesNearCompletionBothWays) {
    DynamicPhaseEngine engine(seeded());
    startAttempt(engine, "Z", at(0.0f));

    engine.analyzeProgress("Z", 0.85f, goodMotion(), nullptr, at(0.1f));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::NearCompletion);
    const std::string encouragement = engine.getCurrentMessage();
    const auto& variants = FeedbackMessages::nearCompletionVariants();
    EXPECT_NE(std::find(variants.begin(), variants.end(), encouragement), variants.end());

    engine.analyzeProgress("Z", 0.6f, goodMotion(), nullptr, at(0.7f));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::InProgress);

    // Same encouragement while it is still held
    engine.analyzeProgress("Z", 0.9f, goodMotion(), nullptr, at(1.3f));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::NearCompletion);
    EXPECT_EQ(engine.getCurrentMessage(), encouragement);
}

TEST(DynamicPhaseEngineTest, ChangedIssueUpdatesMessageImmediately) {
    DynamicPhaseEngine engine(seeded());
    auto def = slowWave();
    startAttempt(engine, def.gestureName, at(0.0f));

    DynamicMetrics slow = goodMotion();
    slow.averageSpeed = 0.01f;
    engine.analyzeProgress(def.gestureName, 0.3f, slow, &def, at(0.1f));
    EXPECT_EQ(engine.getCurrentIssue(), DynamicMovementIssue::TooSlow);
    const std::string slowMessage = engine.getCurrentMessage();

    engine.analyzeProgress(def.gestureName, 0.35f, slow, &def, at(0.2f));
    EXPECT_EQ(engine.getCurrentMessage(), slowMessage);

    DynamicMetrics lostShape = goodMotion();
    lostShape.handShapeStable = false;
    engine.analyzeProgress(def.gestureName, 0.4f, lostShape, &def, at(0.25f));
    EXPECT_EQ(engine.getCurrentIssue(), DynamicMovementIssue::StartPoseDegrading);
    EXPECT_EQ(engine.getCurrentMessage(), "Keep the hand shape.");
}

TEST(DynamicPhaseEngineTest, FailureMessageFollowsReason) {
    DynamicPhaseEngine engine(seeded());
    startAttempt(engine, "HELLO", at(0.0f));

    ASSERT_TRUE(engine.notifyFailed("HELLO", FailureReason::SpeedTooLow, GesturePhase::Move, goodMotion()));
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::Failed);
    EXPECT_EQ(engine.getCurrentIssue(), DynamicMovementIssue::TooSlow);
    EXPECT_NE(engine.getCurrentMessage().find("too slow"), std::string::npos);
}

TEST(DynamicPhaseEngineTest, ResumeAfterFailure) {
    DynamicPhaseEngine engine(seeded());
    EXPECT_FALSE(engine.resumeAfterFailure());

    startAttempt(engine, "J", at(0.0f));
    engine.notifyFailed("J", FailureReason::PoseLost, GesturePhase::Move, goodMotion());
    ASSERT_TRUE(engine.resumeAfterFailure());
    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::InProgress);
    EXPECT_EQ(engine.getCurrentIssue(), DynamicMovementIssue::None);
    EXPECT_EQ(engine.getActiveGestureName(), "J");
}

TEST(DynamicPhaseEngineTest, ResetClearsEverything) {
    DynamicPhaseEngine engine(seeded());
    startAttempt(engine, "J", at(0.0f));
    engine.reset();

    EXPECT_EQ(engine.getPhase(), DynamicFeedbackPhase::Idle);
    EXPECT_TRUE(engine.getActiveGestureName().empty());
    EXPECT_TRUE(engine.getCurrentMessage().empty());
    EXPECT_EQ(engine.getCurrentIssue(), DynamicMovementIssue::None);
}

TEST(DynamicPhaseEngineTest, PhaseChangesAreQueuedInOrder) {
    DynamicPhaseEngine engine(seeded());
    engine.notifyIdle("Z");
    engine.notifyStartDetected("Z");
    engine.analyzeProgress("Z", 0.2f, goodMotion(), nullptr, at(0.0f));
    engine.notifyCompleted("Z", goodMotion());

    auto changes = engine.drainPhaseChanges();
    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].from, DynamicFeedbackPhase::Idle);
    EXPECT_EQ(changes[0].to, DynamicFeedbackPhase::StartDetected);
    EXPECT_EQ(changes[1].to, DynamicFeedbackPhase::InProgress);
    EXPECT_EQ(changes[2].to, DynamicFeedbackPhase::Completed);
    EXPECT_EQ(changes[2].message, FeedbackMessages::completed());
    EXPECT_EQ(changes[2].gestureName, "Z");

    EXPECT_TRUE(engine.drainPhaseChanges().empty());
}
