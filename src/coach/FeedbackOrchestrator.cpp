#include "coach/FeedbackOrchestrator.hpp"
#include "coach/FeedbackMessages.hpp"
#include "coach/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace coach {

namespace {

const LogChannel logger("FeedbackOrchestrator");

std::mt19937 makeRng(uint32_t seed) {
    if (seed != 0) return std::mt19937(seed);
    std::random_device rd;
    return std::mt19937(rd());
}

DynamicPhaseEngine::Config engineConfig(const FeedbackConfig& config) {
    DynamicPhaseEngine::Config out = config.dynamic;
    if (out.seed == 0 && config.seed != 0) {
        out.seed = config.seed + 1;
    }
    return out;
}

} // namespace

FeedbackOrchestrator::FeedbackOrchestrator(const ProfileRegistry& profiles,
                                           const DynamicGestureRegistry& dynamicGestures,
                                           const HandTrackingSource& tracking,
                                           std::vector<const StaticGestureRecognizerPort*> staticRecognizers,
                                           const DynamicGestureRecognizerPort* dynamicRecognizer,
                                           const FeedbackConfig& config)
    : profiles_(profiles)
    , dynamicGestures_(dynamicGestures)
    , tracking_(tracking)
    , staticRecognizers_(std::move(staticRecognizers))
    , dynamicRecognizer_(dynamicRecognizer)
    , config_(config)
    , evaluator_(config.evaluator)
    , stabilizer_(config.stabilizer)
    , engine_(engineConfig(config))
    , rng_(makeRng(config.seed)) {
    staticRecognizers_.erase(std::remove(staticRecognizers_.begin(), staticRecognizers_.end(), nullptr),
                             staticRecognizers_.end());

    if (config_.errorMessageHoldMax < config_.errorMessageHoldMin) {
        logger.warn("errorMessageHoldMax < errorMessageHoldMin, swapping");
        std::swap(config_.errorMessageHoldMin, config_.errorMessageHoldMax);
    }

    logger.info(profiles_.size(), " profiles, ", dynamicGestures_.size(),
                " dynamic gestures, ", staticRecognizers_.size(), " static recognizers");
}

// ═══════════════════════════════════════════════════════════
// Session control
// ═══════════════════════════════════════════════════════════

void FeedbackOrchestrator::setActive(bool active, TimePoint now) {
    (void)now;
    if (active == active_) return;

    active_ = active;
    stabilizer_.clear();
    clearTimers();

    if (active_) {
        const bool dynamic = currentSign_ && currentSign_->requiresMovement;
        engine_.reset();
        if (dynamic) engine_.notifyIdle(currentSign_->name);
        syncPhaseChanges();
        setOverlayVisible(true);

        setState(FeedbackState::Waiting);
        updateMessage(currentSign_ ? FeedbackMessages::practiceSign(currentSign_->name)
                                   : FeedbackMessages::noSignSelected());
        events_.push_back(AudioCueRequested{AudioCue::StartPractice});
    } else {
        engine_.reset();
        syncPhaseChanges();
        curlEstimator_.reset();
        setState(FeedbackState::Inactive);
        updateMessage("");
    }
}

void FeedbackOrchestrator::setCurrentSign(const std::optional<SignTarget>& sign, TimePoint now) {
    (void)now;
    currentSign_ = sign;
    stabilizer_.clear();
    clearTimers();
    lastStaticResult_ = StaticGestureResult{};
    lastDynamicResult_.reset();
    engine_.reset();

    std::string message;
    if (!sign) {
        message = FeedbackMessages::noSignSelected();
    } else if (sign->requiresMovement) {
        if (!dynamicGestures_.contains(sign->name)) {
            reportConfigurationGap("dynamic gesture definition", sign->name);
        }
        engine_.notifyIdle(sign->name);
        message = engine_.getCurrentMessage();
    } else {
        if (!profiles_.contains(sign->name)) {
            reportConfigurationGap("constraint profile", sign->name);
        }
        message = FeedbackMessages::makeSign(sign->name);
    }

    logger.info("current sign ",
                sign ? "'" + sign->name + "'" + (sign->requiresMovement ? " (dynamic)" : "") : "none");

    syncPhaseChanges();
    setOverlayVisible(true);
    if (active_) {
        setState(FeedbackState::Waiting);
        updateMessage(message);
    }
}

void FeedbackOrchestrator::tick(TimePoint now) {
    if (!active_) return;

    if (pendingResetToIdle_ && latchUntil_ && now >= *latchUntil_) {
        handleLatchExpired();
    }

    // Nothing to analyze while a confirmed success is on screen
    if (state_ == FeedbackState::Success && inSuccessWindow(now)) return;

    if (lastAnalysis_ && now - *lastAnalysis_ < toDuration(config_.analysisInterval)) return;
    lastAnalysis_ = now;

    if (currentSign_ && !currentSign_->requiresMovement) {
        analyzeCurrentPose(now);
    }
}

// ═══════════════════════════════════════════════════════════
// Static signs
// ═══════════════════════════════════════════════════════════

void FeedbackOrchestrator::analyzeCurrentPose(TimePoint now) {
    const std::string& signName = currentSign_->name;
    const HandSnapshot hand = curlEstimator_.sample(tracking_);
    const bool detected = isGestureCurrentlyDetected();

    const ConstraintProfile* profile = profiles_.find(signName);
    if (!profile) {
        reportConfigurationGap("constraint profile", signName);
        if (detected) {
            lastStaticResult_ = StaticGestureResult::success();
            lastStaticResult_.summaryMessage = FeedbackMessages::signCorrect(signName);
            events_.push_back(StaticAnalysis{signName, lastStaticResult_});
            enterSuccess(now + toDuration(config_.successDisplayDuration), signName, false);
            updateMessage(lastStaticResult_.summaryMessage);
        } else {
            setState(FeedbackState::Waiting);
            updateMessage(FeedbackMessages::adjustHand(signName));
        }
        return;
    }

    if (!hand.tracked && !detected) {
        setState(FeedbackState::Waiting);
        updateMessage(FeedbackMessages::handNotTracked());
        return;
    }

    StaticGestureResult result = evaluator_.evaluate(*profile, hand, detected);
    stabilizer_.stabilize(result, signName, now);
    lastStaticResult_ = result;
    events_.push_back(StaticAnalysis{signName, result});

    if (result.isMatchGlobal) {
        enterSuccess(now + toDuration(config_.successDisplayDuration), signName, false);
    } else if (result.majorErrorCount > 0) {
        setState(FeedbackState::ShowingErrors);
    } else if (result.minorErrorCount > 0) {
        setState(FeedbackState::PartialMatch);
    } else {
        setState(FeedbackState::Waiting);
    }
    updateMessage(result.summaryMessage);
}

bool FeedbackOrchestrator::isGestureCurrentlyDetected() const {
    if (!currentSign_) return false;

    for (const auto* recognizer : staticRecognizers_) {
        // A recognizer armed for another sign says nothing about this one
        if (recognizer->getTargetSign() != currentSign_->name) continue;
        if (recognizer->isPerformed()) return true;
    }
    return false;
}

bool FeedbackOrchestrator::inSuccessWindow(TimePoint now) const {
    return successEnd_ && now < *successEnd_;
}

void FeedbackOrchestrator::enterSuccess(TimePoint until, const std::string& signName, bool dynamic) {
    const bool announce = state_ != FeedbackState::Success;
    stabilizer_.clear();
    successEnd_ = until;
    setState(FeedbackState::Success);

    if (announce) {
        events_.push_back(AudioCueRequested{AudioCue::Success});
        events_.push_back(GestureSucceeded{signName, dynamic});
    }
}

void FeedbackOrchestrator::onStaticGestureDetected(const std::string& signName, TimePoint now) {
    if (!active_ || !currentSign_) return;
    if (state_ == FeedbackState::Success && inSuccessWindow(now)) return;

    if (signName != currentSign_->name) {
        logger.debug("ignoring detection of '", signName, "' while practicing '",
                     currentSign_->name, "'");
        return;
    }

    lastStaticResult_ = StaticGestureResult::success();
    lastStaticResult_.summaryMessage = FeedbackMessages::signCorrect(signName);
    events_.push_back(StaticAnalysis{signName, lastStaticResult_});

    enterSuccess(now + toDuration(config_.successDisplayDuration), signName, false);
    updateMessage(lastStaticResult_.summaryMessage);
    lastAnalysis_.reset();
}

void FeedbackOrchestrator::onStaticGestureEnded(const std::string& signName, TimePoint now) {
    if (!active_ || !currentSign_ || signName != currentSign_->name) return;

    if (state_ == FeedbackState::Success && !inSuccessWindow(now)) {
        setState(FeedbackState::Waiting);
        updateMessage(FeedbackMessages::makeSign(signName));
    }
}

// ═══════════════════════════════════════════════════════════
// Dynamic signs
// ═══════════════════════════════════════════════════════════

void FeedbackOrchestrator::onDynamicStarted(const std::string& gestureName, TimePoint now) {
    if (!active_ || !currentSign_ || !currentSign_->requiresMovement) return;

    if (gestureName != currentSign_->name) {
        logger.debug("ignoring start of '", gestureName, "' while practicing '",
                     currentSign_->name, "'");
        return;
    }

    if (state_ == FeedbackState::Success && inSuccessWindow(now)) {
        logger.debug("start of '", gestureName, "' ignored during success display");
        return;
    }
    if (isMessageLatched(now)) {
        logger.debug("start of '", gestureName, "' ignored while a message is latched");
        return;
    }

    if (!engine_.notifyStartDetected(gestureName)) {
        syncPhaseChanges();
        return;
    }
    syncPhaseChanges();
    lastMetrics_.reset();

    setState(FeedbackState::InProgress);
    const std::string hint = FeedbackMessages::trajectoryHint(gestureName);
    updateMessage(hint.empty() ? engine_.getCurrentMessage() : hint);
}

void FeedbackOrchestrator::onDynamicProgress(const std::string& gestureName, float progress,
                                             const std::optional<DynamicMetrics>& metrics, TimePoint now) {
    if (!active_) return;

    if (metrics) lastMetrics_ = metrics;
    const bool canEmit = !isMessageLatched(now);

    if (!engine_.analyzeProgress(gestureName, progress, metrics, findDefinition(gestureName), now)) {
        syncPhaseChanges();
        return;
    }
    syncPhaseChanges();

    const DynamicMovementIssue issue = engine_.getCurrentIssue();
    std::string message = engine_.getCurrentMessage();
    if (issue == DynamicMovementIssue::None) {
        const std::string hint = FeedbackMessages::gestureDirectionHint(gestureName);
        if (!hint.empty()) {
            const int percent = static_cast<int>(std::round(math::clamp01(progress) * 100.0f));
            message = hint + " (" + std::to_string(percent) + "%)";
        }
    }

    if (!canEmit) return;

    if (state_ != FeedbackState::InProgress) setState(FeedbackState::InProgress);

    if (issue != DynamicMovementIssue::None) {
        // Keep the correction readable before the next one replaces it
        latchUntil_ = now + toDuration(randomErrorHold());
        lastDynamicMessageWasError_ = true;
        pendingResetToIdle_ = false;
    }
    updateMessage(message);
}

void FeedbackOrchestrator::onDynamicNearCompletion(const std::string& gestureName, float progress,
                                                   TimePoint now) {
    if (!active_) return;

    logger.debug("'", gestureName, "' near completion (",
                 static_cast<int>(progress * 100.0f), "%)");

    if (engine_.isInMotion() && engine_.getPhase() != DynamicFeedbackPhase::NearCompletion) {
        onDynamicProgress(gestureName, progress, lastMetrics_, now);
    }
}

void FeedbackOrchestrator::onDynamicCompleted(const DynamicGestureResult& result, TimePoint now) {
    if (!active_) return;

    if (!engine_.notifyCompleted(result.gestureName, result.metrics)) {
        syncPhaseChanges();
        return;
    }
    syncPhaseChanges();

    lastDynamicResult_ = result;
    const TimePoint holdUntil = now + toDuration(config_.dynamicSuccessHoldDuration);
    latchUntil_ = holdUntil;
    lastDynamicMessageWasError_ = false;
    pendingResetToIdle_ = true;

    enterSuccess(holdUntil, result.gestureName, true);
    updateMessage(engine_.getCurrentMessage());
}

void FeedbackOrchestrator::onDynamicFailed(const DynamicGestureResult& result, TimePoint now) {
    if (!active_) return;

    if (!engine_.notifyFailed(result.gestureName, result.failureReason, result.failedPhase, result.metrics,
                              findDefinition(result.gestureName))) {
        syncPhaseChanges();
        return;
    }
    syncPhaseChanges();

    lastDynamicResult_ = result;
    if (lastDynamicResult_->troubleshootingMessage.empty()) {
        const auto* def = findDefinition(result.gestureName);
        lastDynamicResult_->troubleshootingMessage = FeedbackMessages::troubleshooting(
            result.failureReason, result.failedPhase, result.metrics, result.gestureName,
            def ? def->primaryDirection : math::Vec3{});
    }

    latchUntil_ = now + toDuration(randomErrorHold());
    lastDynamicMessageWasError_ = true;
    pendingResetToIdle_ = true;

    setState(FeedbackState::ShowingErrors);
    events_.push_back(AudioCueRequested{AudioCue::Error});
    updateMessage(engine_.getCurrentMessage());
}

void FeedbackOrchestrator::handleLatchExpired() {
    pendingResetToIdle_ = false;

    if (!lastDynamicMessageWasError_) {
        forceDynamicIdle();
        return;
    }

    const bool startPoseHeld = dynamicRecognizer_ && dynamicRecognizer_->isStartPoseValid();
    if (!startPoseHeld || engine_.getPhase() != DynamicFeedbackPhase::Failed) {
        forceDynamicIdle();
        return;
    }

    engine_.resumeAfterFailure();
    syncPhaseChanges();
    setState(FeedbackState::InProgress);
    updateMessage(engine_.getCurrentMessage());
}

void FeedbackOrchestrator::forceDynamicIdle() {
    engine_.reset();
    if (currentSign_ && currentSign_->requiresMovement) {
        engine_.notifyIdle(currentSign_->name);
    }
    syncPhaseChanges();
    setOverlayVisible(true);

    latchUntil_.reset();
    successEnd_.reset();
    lastDynamicMessageWasError_ = false;

    setState(FeedbackState::Waiting);
    updateMessage(currentSign_ ? engine_.getCurrentMessage() : FeedbackMessages::noSignSelected());
}

void FeedbackOrchestrator::syncPhaseChanges() {
    for (auto& change : engine_.drainPhaseChanges()) {
        setOverlayVisible(change.to == DynamicFeedbackPhase::Idle);
        events_.push_back(DynamicPhaseChanged{std::move(change.gestureName), change.from, change.to,
                                              std::move(change.message)});
    }
}

// ═══════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════

std::vector<FeedbackEvent> FeedbackOrchestrator::drainEvents() {
    std::vector<FeedbackEvent> out;
    out.swap(events_);
    return out;
}

void FeedbackOrchestrator::clearTimers() {
    lastAnalysis_.reset();
    successEnd_.reset();
    latchUntil_.reset();
    lastDynamicMessageWasError_ = false;
    pendingResetToIdle_ = false;
}

float FeedbackOrchestrator::randomErrorHold() {
    std::uniform_real_distribution<float> hold(config_.errorMessageHoldMin, config_.errorMessageHoldMax);
    return hold(rng_);
}

const DynamicGestureDefinition* FeedbackOrchestrator::findDefinition(const std::string& gestureName) {
    const DynamicGestureDefinition* def = dynamicGestures_.find(gestureName);
    if (!def) reportConfigurationGap("dynamic gesture definition", gestureName);
    return def;
}

void FeedbackOrchestrator::setState(FeedbackState newState) {
    if (newState == state_) return;

    logger.debug(getFeedbackStateName(state_), " → ", getFeedbackStateName(newState));
    events_.push_back(StateChanged{state_, newState});
    state_ = newState;
}

void FeedbackOrchestrator::updateMessage(const std::string& message) {
    if (message == message_) return;

    message_ = message;
    events_.push_back(MessageChanged{message_, state_});
}

void FeedbackOrchestrator::setOverlayVisible(bool visible) {
    if (visible == overlayVisible_) return;

    overlayVisible_ = visible;
    events_.push_back(OverlayVisibilityChanged{visible});
}

void FeedbackOrchestrator::reportConfigurationGap(const std::string& what, const std::string& name) {
    // Once per name, the lookup runs every tick
    if (!reportedGaps_.insert(what + ":" + name).second) return;
    logger.warn("no ", what, " for '", name, "', using generic feedback");
}

} // namespace coach
