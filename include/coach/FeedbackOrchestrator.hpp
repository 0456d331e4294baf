#pragma once

#include "CurlEstimator.hpp"
#include "DynamicPhaseEngine.hpp"
#include "FeedbackEvent.hpp"
#include "HandTracking.hpp"
#include "MessageStabilizer.hpp"
#include "ProfileRegistry.hpp"
#include "StaticPoseEvaluator.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace coach {

struct SignTarget {
    std::string name;
    bool requiresMovement = false;
};

struct FeedbackConfig {
    float analysisInterval = ANALYSIS_INTERVAL_S;
    float successDisplayDuration = SUCCESS_DISPLAY_DURATION_S;
    float errorMessageHoldMin = ERROR_MESSAGE_HOLD_MIN_S;
    float errorMessageHoldMax = ERROR_MESSAGE_HOLD_MAX_S;
    float dynamicSuccessHoldDuration = DYNAMIC_SUCCESS_HOLD_S;
    uint32_t seed = 0;   // 0 = random_device

    StaticPoseEvaluator::Config evaluator;
    MessageStabilizer::Config stabilizer;
    DynamicPhaseEngine::Config dynamic;
};

/**
 * FeedbackOrchestrator: owns the visible feedback state of one practice session.
 *
 * Static signs: the pose is evaluated at most once per analysisInterval and
 * analysis pauses while a confirmed success is displayed.
 *
 * Dynamic signs: outcome messages are latched. Completed holds for
 * dynamicSuccessHoldDuration then re-arms to Idle. Failed holds for a random
 * duration in [errorMessageHoldMin, errorMessageHoldMax], then resumes
 * InProgress if the start pose is still valid, else re-arms to Idle.
 *
 * The per-finger overlay is visible only while the dynamic phase is Idle.
 *
 * Driven by exactly one thread. Output goes to an event queue drained by the host.
 */
class FeedbackOrchestrator {
public:
    FeedbackOrchestrator(const ProfileRegistry& profiles,
                         const DynamicGestureRegistry& dynamicGestures,
                         const HandTrackingSource& tracking,
                         std::vector<const StaticGestureRecognizerPort*> staticRecognizers,
                         const DynamicGestureRecognizerPort* dynamicRecognizer,
                         const FeedbackConfig& config = {});

    // Non-copyable
    FeedbackOrchestrator(const FeedbackOrchestrator&) = delete;
    FeedbackOrchestrator& operator=(const FeedbackOrchestrator&) = delete;

    void setActive(bool active, TimePoint now);

    /**
     * Select the sign to practice (nullopt = none). Clears windows and timers.
     */
    void setCurrentSign(const std::optional<SignTarget>& sign, TimePoint now);

    /**
     * Once per frame: latch expiry, success pause, debounced static analysis.
     */
    void tick(TimePoint now);

    // Static recognizer events
    void onStaticGestureDetected(const std::string& signName, TimePoint now);
    void onStaticGestureEnded(const std::string& signName, TimePoint now);

    // Dynamic recognizer events
    void onDynamicStarted(const std::string& gestureName, TimePoint now);
    void onDynamicProgress(const std::string& gestureName, float progress,
                           const std::optional<DynamicMetrics>& metrics, TimePoint now);
    void onDynamicNearCompletion(const std::string& gestureName, float progress, TimePoint now);
    void onDynamicCompleted(const DynamicGestureResult& result, TimePoint now);
    void onDynamicFailed(const DynamicGestureResult& result, TimePoint now);

    /**
     * Hand all events produced since the last call to the host.
     */
    std::vector<FeedbackEvent> drainEvents();

    [[nodiscard]] bool isActive() const { return active_; }
    [[nodiscard]] FeedbackState getState() const { return state_; }
    [[nodiscard]] DynamicFeedbackPhase getPhase() const { return engine_.getPhase(); }
    [[nodiscard]] bool isOverlayVisible() const { return overlayVisible_; }
    [[nodiscard]] const std::string& getCurrentMessage() const { return message_; }
    [[nodiscard]] const std::optional<SignTarget>& getCurrentSign() const { return currentSign_; }
    [[nodiscard]] const StaticGestureResult& getLastStaticResult() const { return lastStaticResult_; }
    [[nodiscard]] const std::optional<DynamicGestureResult>& getLastDynamicResult() const { return lastDynamicResult_; }
    [[nodiscard]] bool isMessageLatched(TimePoint now) const { return latchUntil_ && now < *latchUntil_; }

private:
    const ProfileRegistry& profiles_;
    const DynamicGestureRegistry& dynamicGestures_;
    const HandTrackingSource& tracking_;
    std::vector<const StaticGestureRecognizerPort*> staticRecognizers_;
    const DynamicGestureRecognizerPort* dynamicRecognizer_;
    FeedbackConfig config_;

    CurlEstimator curlEstimator_;
    StaticPoseEvaluator evaluator_;
    MessageStabilizer stabilizer_;
    DynamicPhaseEngine engine_;
    std::mt19937 rng_;

    bool active_ = false;
    std::optional<SignTarget> currentSign_;
    FeedbackState state_ = FeedbackState::Inactive;
    std::string message_;
    bool overlayVisible_ = true;

    std::optional<TimePoint> lastAnalysis_;
    std::optional<TimePoint> successEnd_;
    std::optional<TimePoint> latchUntil_;
    bool lastDynamicMessageWasError_ = false;
    bool pendingResetToIdle_ = false;
    std::optional<DynamicMetrics> lastMetrics_;

    StaticGestureResult lastStaticResult_;
    std::optional<DynamicGestureResult> lastDynamicResult_;
    std::set<std::string> reportedGaps_;

    std::vector<FeedbackEvent> events_;

    void analyzeCurrentPose(TimePoint now);
    [[nodiscard]] bool isGestureCurrentlyDetected() const;
    [[nodiscard]] bool inSuccessWindow(TimePoint now) const;
    void enterSuccess(TimePoint until, const std::string& signName, bool dynamic);

    void handleLatchExpired();
    void forceDynamicIdle();
    void syncPhaseChanges();

    void clearTimers();
    float randomErrorHold();
    const DynamicGestureDefinition* findDefinition(const std::string& gestureName);

    void setState(FeedbackState newState);
    void updateMessage(const std::string& message);
    void setOverlayVisible(bool visible);
    void reportConfigurationGap(const std::string& what, const std::string& name);
};

} // namespace coach
