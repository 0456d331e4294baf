#pragma once

#include "FeedbackData.hpp"
#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace coach {

/**
 * Movement thresholds checked by DynamicPhaseEngine::detectMovementIssue.
 */
struct MovementRequirements {
    float expectedMinSpeed = 0.0f;
    float expectedMaxSpeed = 0.0f;      // 0 disables TooFast
    float expectedMinDistance = 0.0f;

    bool requiresDirection = false;
    float minDirectionAlignment = 0.5f;

    bool requiresRotation = false;
    float minRotationAngle = 0.0f;

    bool requiresCircular = false;
    float minCircularityScore = 0.0f;

    bool requiresDirectionChanges = false;
    int requiredDirectionChanges = 0;

    static MovementRequirements fromDefinition(const DynamicGestureDefinition& def);
};

struct PhaseChange {
    DynamicFeedbackPhase from = DynamicFeedbackPhase::Idle;
    DynamicFeedbackPhase to = DynamicFeedbackPhase::Idle;
    std::string gestureName;
    std::string message;
};

/**
 * DynamicPhaseEngine: feedback state machine for motion gestures.
 *
 * Phases: Idle → StartDetected → InProgress ⇄ NearCompletion → Completed | Failed
 *
 * - Completed/Failed are reachable only from InProgress/NearCompletion
 * - Out-of-order events are rejected and leave the phase unchanged
 * - Leaving a terminal phase needs reset(), notifyIdle() or resumeAfterFailure()
 *
 * Phase changes are queued and drained by the owner (no callbacks).
 */
class DynamicPhaseEngine {
public:
    struct Config {
        float nearCompletionThreshold = NEAR_COMPLETION_THRESHOLD;
        float messageCooldown = DYNAMIC_MESSAGE_COOLDOWN_S;
        float nearCompletionMessageHold = NEAR_COMPLETION_MESSAGE_HOLD_S;
        uint32_t seed = 0;   // 0 = random_device
    };

    DynamicPhaseEngine();
    explicit DynamicPhaseEngine(const Config& config);

    /**
     * Waiting for the starting hand shape of gestureName. Allowed from any phase.
     */
    void notifyIdle(const std::string& gestureName);

    /**
     * Idle → StartDetected
     */
    bool notifyStartDetected(const std::string& gestureName);

    /**
     * StartDetected/InProgress/NearCompletion → InProgress or NearCompletion.
     * Detects at most one movement issue when both a definition and metrics are known.
     * Progress without metrics only advances the phase.
     */
    bool analyzeProgress(const std::string& gestureName, float progress,
                         const std::optional<DynamicMetrics>& metrics,
                         const DynamicGestureDefinition* definition, TimePoint now);

    /**
     * InProgress/NearCompletion → Completed
     */
    bool notifyCompleted(const std::string& gestureName, const DynamicMetrics& metrics);

    /**
     * InProgress/NearCompletion → Failed
     */
    bool notifyFailed(const std::string& gestureName, FailureReason reason, GesturePhase failedPhase,
                      const DynamicMetrics& metrics, const DynamicGestureDefinition* definition = nullptr);

    /**
     * Failed → InProgress, used when the learner still holds the start pose.
     */
    bool resumeAfterFailure();

    /**
     * Back to Idle, clearing issue, cooldown and active gesture.
     */
    void reset();

    /**
     * At most one issue, in strict priority order.
     */
    [[nodiscard]] static DynamicMovementIssue detectMovementIssue(const DynamicMetrics& metrics,
                                                                  const MovementRequirements& requirements);

    [[nodiscard]] DynamicFeedbackPhase getPhase() const { return phase_; }
    [[nodiscard]] DynamicMovementIssue getCurrentIssue() const { return currentIssue_; }
    [[nodiscard]] const std::string& getCurrentMessage() const { return currentMessage_; }
    [[nodiscard]] const std::string& getActiveGestureName() const { return activeGesture_; }
    [[nodiscard]] bool isTerminal() const {
        return phase_ == DynamicFeedbackPhase::Completed || phase_ == DynamicFeedbackPhase::Failed;
    }
    [[nodiscard]] bool isInMotion() const {
        return phase_ == DynamicFeedbackPhase::InProgress || phase_ == DynamicFeedbackPhase::NearCompletion;
    }

    std::vector<PhaseChange> drainPhaseChanges();

private:
    Config config_;
    std::mt19937 rng_;

    DynamicFeedbackPhase phase_ = DynamicFeedbackPhase::Idle;
    DynamicMovementIssue currentIssue_ = DynamicMovementIssue::None;
    DynamicMovementIssue lastReportedIssue_ = DynamicMovementIssue::None;
    std::optional<TimePoint> lastMessageTime_;
    std::string currentMessage_;
    std::string activeGesture_;

    std::string nearCompletionMessage_;
    std::optional<TimePoint> nearCompletionMessageTime_;

    std::vector<PhaseChange> pendingChanges_;

    void setPhase(DynamicFeedbackPhase phase, const std::string& message);
    bool shouldUpdateMessage(DynamicMovementIssue issue, DynamicFeedbackPhase target, TimePoint now) const;
    const std::string& pickNearCompletionMessage(TimePoint now);
    void rejectEvent(const char* event, const std::string& gestureName) const;
};

} // namespace coach
