#include "coach/DynamicPhaseEngine.hpp"
#include "coach/FeedbackMessages.hpp"
#include "coach/Logger.hpp"

namespace coach {

namespace {

const LogChannel logger("DynamicPhaseEngine");

std::mt19937 makeRng(uint32_t seed) {
    if (seed != 0) return std::mt19937(seed);
    std::random_device rd;
    return std::mt19937(rd());
}

} // namespace

MovementRequirements MovementRequirements::fromDefinition(const DynamicGestureDefinition& def) {
    MovementRequirements req;
    req.expectedMinSpeed = def.minSpeed;
    req.expectedMaxSpeed = def.effectiveMaxSpeed();
    req.expectedMinDistance = def.minDistance;
    req.requiresDirection = def.requiresDirection;
    req.minDirectionAlignment = def.minDirectionAlignment;
    req.requiresRotation = def.requiresRotation;
    req.minRotationAngle = def.minRotationAngle;
    req.requiresCircular = def.requiresCircularMotion;
    req.minCircularityScore = def.minCircularityScore;
    req.requiresDirectionChanges = def.requiresDirectionChange;
    req.requiredDirectionChanges = def.requiredDirectionChanges;
    return req;
}

DynamicPhaseEngine::DynamicPhaseEngine() : DynamicPhaseEngine(Config{}) {}

DynamicPhaseEngine::DynamicPhaseEngine(const Config& config)
    : config_(config), rng_(makeRng(config.seed)) {
}

// ═══════════════════════════════════════════════════════════
// Movement issues
// ═══════════════════════════════════════════════════════════

DynamicMovementIssue DynamicPhaseEngine::detectMovementIssue(const DynamicMetrics& metrics,
                                                             const MovementRequirements& req) {
    // Continuing is pointless once the shape is lost
    if (!metrics.handShapeStable)
        return DynamicMovementIssue::StartPoseDegrading;

    if (metrics.averageSpeed < req.expectedMinSpeed * 0.5f)
        return DynamicMovementIssue::TooSlow;

    if (req.expectedMaxSpeed > 0.0f && metrics.maxSpeed > req.expectedMaxSpeed * 1.5f)
        return DynamicMovementIssue::TooFast;

    if (req.requiresDirection && metrics.directionAlignment < req.minDirectionAlignment)
        return DynamicMovementIssue::DirectionWrong;

    if (metrics.duration > 0.3f && metrics.totalDistance < req.expectedMinDistance * 0.5f)
        return DynamicMovementIssue::TooShort;

    if (req.requiresRotation && metrics.totalRotation < req.minRotationAngle * 0.7f)
        return DynamicMovementIssue::RotationInsufficient;

    if (req.requiresCircular && metrics.circularityScore < req.minCircularityScore * 0.7f)
        return DynamicMovementIssue::NotCircular;

    if (req.requiresDirectionChanges && metrics.directionChanges < req.requiredDirectionChanges)
        return DynamicMovementIssue::NeedMoreDirectionChanges;

    return DynamicMovementIssue::None;
}

// ═══════════════════════════════════════════════════════════
// Events
// ═══════════════════════════════════════════════════════════

void DynamicPhaseEngine::notifyIdle(const std::string& gestureName) {
    activeGesture_ = gestureName;
    currentIssue_ = DynamicMovementIssue::None;
    setPhase(DynamicFeedbackPhase::Idle, FeedbackMessages::idlePhase(gestureName));
}

bool DynamicPhaseEngine::notifyStartDetected(const std::string& gestureName) {
    if (phase_ == DynamicFeedbackPhase::StartDetected && activeGesture_ == gestureName) {
        return true;
    }
    if (phase_ != DynamicFeedbackPhase::Idle) {
        rejectEvent("start", gestureName);
        return false;
    }

    activeGesture_ = gestureName;
    currentIssue_ = DynamicMovementIssue::None;
    lastReportedIssue_ = DynamicMovementIssue::None;
    lastMessageTime_.reset();
    setPhase(DynamicFeedbackPhase::StartDetected, FeedbackMessages::startDetected());
    return true;
}

bool DynamicPhaseEngine::analyzeProgress(const std::string& gestureName, float progress,
                                         const std::optional<DynamicMetrics>& metrics,
                                         const DynamicGestureDefinition* definition, TimePoint now) {
    if (phase_ != DynamicFeedbackPhase::StartDetected && !isInMotion()) {
        // Progress outside an attempt is expected noise from the recognizer
        logger.debug("ignoring progress for '", gestureName, "' in ", getPhaseName(phase_));
        return false;
    }

    activeGesture_ = gestureName;

    const DynamicFeedbackPhase target = progress >= config_.nearCompletionThreshold
        ? DynamicFeedbackPhase::NearCompletion
        : DynamicFeedbackPhase::InProgress;

    DynamicMovementIssue issue = DynamicMovementIssue::None;
    math::Vec3 expectedDirection;
    if (definition) {
        expectedDirection = definition->primaryDirection;
        if (metrics) {
            issue = detectMovementIssue(*metrics, MovementRequirements::fromDefinition(*definition));
        }
    }
    currentIssue_ = issue;

    std::string message = target == DynamicFeedbackPhase::NearCompletion
        ? pickNearCompletionMessage(now)
        : FeedbackMessages::inProgress(issue, gestureName, expectedDirection);

    if (shouldUpdateMessage(issue, target, now)) {
        setPhase(target, message);
        lastReportedIssue_ = issue;
        lastMessageTime_ = now;
    } else if (phase_ != target) {
        setPhase(target, message);
    }
    return true;
}

bool DynamicPhaseEngine::notifyCompleted(const std::string& gestureName, const DynamicMetrics& metrics) {
    if (!isInMotion()) {
        rejectEvent("completed", gestureName);
        return false;
    }

    activeGesture_ = gestureName;
    currentIssue_ = DynamicMovementIssue::None;
    logger.debug("'", gestureName, "' completed in ", metrics.duration, "s, distance ",
                 metrics.totalDistance, "m");
    setPhase(DynamicFeedbackPhase::Completed, FeedbackMessages::completed());
    return true;
}

bool DynamicPhaseEngine::notifyFailed(const std::string& gestureName, FailureReason reason,
                                      GesturePhase failedPhase, const DynamicMetrics& metrics,
                                      const DynamicGestureDefinition* definition) {
    if (!isInMotion()) {
        rejectEvent("failed", gestureName);
        return false;
    }

    activeGesture_ = gestureName;
    currentIssue_ = FeedbackMessages::failureReasonToIssue(reason);
    math::Vec3 expectedDirection = definition ? definition->primaryDirection : math::Vec3{};
    logger.debug("'", gestureName, "' failed: ", getFailureReasonName(reason),
                 " (", getGesturePhaseName(failedPhase), ") speed=", metrics.averageSpeed);
    setPhase(DynamicFeedbackPhase::Failed,
             FeedbackMessages::failed(reason, failedPhase, gestureName, expectedDirection));
    return true;
}

bool DynamicPhaseEngine::resumeAfterFailure() {
    if (phase_ != DynamicFeedbackPhase::Failed) {
        rejectEvent("resume", activeGesture_);
        return false;
    }
    currentIssue_ = DynamicMovementIssue::None;
    lastReportedIssue_ = DynamicMovementIssue::None;
    lastMessageTime_.reset();
    setPhase(DynamicFeedbackPhase::InProgress, FeedbackMessages::inProgress(DynamicMovementIssue::None,
                                                                            activeGesture_, {}));
    return true;
}

void DynamicPhaseEngine::reset() {
    setPhase(DynamicFeedbackPhase::Idle, "");
    currentIssue_ = DynamicMovementIssue::None;
    lastReportedIssue_ = DynamicMovementIssue::None;
    lastMessageTime_.reset();
    nearCompletionMessage_.clear();
    nearCompletionMessageTime_.reset();
    activeGesture_.clear();
}

std::vector<PhaseChange> DynamicPhaseEngine::drainPhaseChanges() {
    std::vector<PhaseChange> out;
    out.swap(pendingChanges_);
    return out;
}

// ═══════════════════════════════════════════════════════════
// Internals
// ═══════════════════════════════════════════════════════════

void DynamicPhaseEngine::setPhase(DynamicFeedbackPhase phase, const std::string& message) {
    const DynamicFeedbackPhase previous = phase_;
    phase_ = phase;
    currentMessage_ = message;

    if (previous != phase) {
        logger.info(getPhaseName(previous), " → ", getPhaseName(phase),
                    activeGesture_.empty() ? "" : " ('" + activeGesture_ + "')");
        pendingChanges_.push_back({previous, phase, activeGesture_, message});
    }
}

bool DynamicPhaseEngine::shouldUpdateMessage(DynamicMovementIssue issue, DynamicFeedbackPhase target,
                                             TimePoint now) const {
    if (issue != lastReportedIssue_) return true;

    // Same issue: respect the cooldown
    if (lastMessageTime_ && now - *lastMessageTime_ < toDuration(config_.messageCooldown)) return false;

    return phase_ != target;
}

const std::string& DynamicPhaseEngine::pickNearCompletionMessage(TimePoint now) {
    const bool fresh = nearCompletionMessageTime_ &&
        now - *nearCompletionMessageTime_ < toDuration(config_.nearCompletionMessageHold);
    if (fresh && !nearCompletionMessage_.empty()) return nearCompletionMessage_;

    const auto& variants = FeedbackMessages::nearCompletionVariants();
    std::uniform_int_distribution<size_t> pick(0, variants.size() - 1);
    nearCompletionMessage_ = variants[pick(rng_)];
    nearCompletionMessageTime_ = now;
    return nearCompletionMessage_;
}

void DynamicPhaseEngine::rejectEvent(const char* event, const std::string& gestureName) const {
    logger.warn("rejecting '", event, "' for '", gestureName,
                "' in phase ", getPhaseName(phase_));
}

} // namespace coach
