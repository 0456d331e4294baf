#include "coach/StaticPoseEvaluator.hpp"
#include "coach/FeedbackMessages.hpp"
#include "coach/Logger.hpp"
#include <algorithm>

namespace coach {

namespace {

const LogChannel logger("StaticPoseEvaluator");

FingerError makeError(const FingerConstraint& constraint, Finger finger, FingerErrorType type,
                      Severity severity, float current, float expected) {
    FingerError error;
    error.finger = finger;
    error.errorType = type;
    error.severity = severity;
    error.currentValue = current;
    error.expectedValue = expected;

    const std::string& custom = constraint.messages.forType(type);
    if (!custom.empty()) {
        error.message = custom;
        error.hasCustomMessage = true;
    } else {
        error.message = FeedbackMessages::correction(finger, type, severity);
    }
    return error;
}

} // namespace

float StaticPoseEvaluator::effectiveTolerance(Finger finger) const {
    float tolerance = std::max(config_.curlTolerance * 0.5f, config_.minEffectiveTolerance);
    if (finger == Finger::Thumb) {
        tolerance = std::max(tolerance, config_.thumbMinEffectiveTolerance);
    }
    return tolerance;
}

Severity StaticPoseEvaluator::gradeDeviation(Finger finger, float deviation) const {
    Severity severity = Severity::None;
    if (deviation > config_.majorDeviation) {
        severity = Severity::Major;
    } else if (deviation > config_.minorDeviation) {
        severity = Severity::Minor;
    }

    if (finger == Finger::Thumb && severity == Severity::Major &&
        deviation < config_.thumbMajorDowngradeBelow) {
        severity = Severity::Minor;
    }
    return severity;
}

float StaticPoseEvaluator::signedSpreadAngle(const math::Vec3& dirA, const math::Vec3& dirB,
                                             const math::Vec3& baseA, const math::Vec3& baseB) {
    const float angle = math::angleDeg(dirA, dirB);
    const math::Vec3 lateral = baseB - baseA;
    return (dirB - dirA).dot(lateral) < 0.0f ? -angle : angle;
}

StaticGestureResult StaticPoseEvaluator::evaluate(const ConstraintProfile& profile,
                                                  const HandSnapshot& hand,
                                                  bool isExternallyConfirmedMatch) const {
    if (isExternallyConfirmedMatch) {
        return StaticGestureResult::success();
    }

    StaticGestureResult result;

    for (Finger finger : ALL_FINGERS) {
        const auto& constraint = profile.getConstraint(finger);
        if (!constraint.curl.enabled) continue;
        evaluateCurl(constraint, hand.curls[fingerIndex(finger)], result);
    }

    evaluateSpread(profile, hand, result);
    evaluateThumbTouch(profile.thumb, hand, result);
    evaluateOrientation(profile, hand, result);

    result.updateAggregates();
    return result;
}

void StaticPoseEvaluator::evaluateCurl(const FingerConstraint& constraint, float curl,
                                       StaticGestureResult& result) const {
    const Finger finger = constraint.finger;
    const float tolerance = effectiveTolerance(finger);
    const float lo = std::max(0.0f, constraint.curl.minCurl - tolerance);
    const float hi = std::min(1.0f, constraint.curl.maxCurl + tolerance);

    float deviation = 0.0f;
    FingerErrorType type = FingerErrorType::None;
    if (curl < lo) {
        deviation = lo - curl;
        type = FingerErrorType::TooExtended;
    } else if (curl > hi) {
        deviation = curl - hi;
        type = FingerErrorType::TooCurled;
    } else {
        return;
    }

    Severity severity = std::min(gradeDeviation(finger, deviation), constraint.curl.severityIfOutOfRange);
    if (severity == Severity::None) return;

    // Prefer the shape vocabulary when the author declared a target state
    if (constraint.hasDeclaredState()) {
        FingerErrorType semantic = semanticErrorType(shapeStateFromCurl(curl), constraint.getExpectedState());
        if (semantic != FingerErrorType::None) {
            type = semantic;
        }
    }

    result.perFingerErrors.push_back(
        makeError(constraint, finger, type, severity, curl, constraint.curl.midpoint()));

    logger.debug(getFingerName(finger), " ", getErrorTypeName(type),
                 " curl=", curl, " range=[", lo, ", ", hi, "] dev=", deviation,
                 " ", getSeverityName(severity));
}

void StaticPoseEvaluator::evaluateSpread(const ConstraintProfile& profile, const HandSnapshot& hand,
                                         StaticGestureResult& result) const {
    for (size_t i = 0; i + 1 < FINGER_COUNT; ++i) {
        const Finger finger = ALL_FINGERS[i];
        const auto& constraint = profile.getConstraint(finger);
        if (!constraint.spread.enabled) continue;

        const auto& dirA = hand.directions[i];
        const auto& dirB = hand.directions[i + 1];
        const auto& baseA = hand.bases[i];
        const auto& baseB = hand.bases[i + 1];
        if (!dirA || !dirB || !baseA || !baseB) continue;

        float angle = signedSpreadAngle(*dirA, *dirB, *baseA, *baseB);
        if (angle >= constraint.spread.minAngle && angle <= constraint.spread.maxAngle) continue;

        FingerErrorType type = angle < constraint.spread.minAngle ? FingerErrorType::SpreadTooNarrow
                                                                  : FingerErrorType::SpreadTooWide;
        float expected = (constraint.spread.minAngle + constraint.spread.maxAngle) * 0.5f;
        result.perFingerErrors.push_back(
            makeError(constraint, finger, type, constraint.spread.severity, angle, expected));
    }
}

void StaticPoseEvaluator::evaluateThumbTouch(const ThumbConstraint& thumb, const HandSnapshot& hand,
                                             StaticGestureResult& result) const {
    const auto& thumbTip = hand.tips[fingerIndex(Finger::Thumb)];
    if (!thumbTip) return;

    for (Finger target : {Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky}) {
        if (!thumb.shouldTouch(target)) continue;

        const auto& targetTip = hand.tips[fingerIndex(target)];
        if (!targetTip) continue;

        // A clearly extended target finger is corrected first, not blamed on the thumb
        if (hand.curls[fingerIndex(target)] < config_.touchTargetMaxCurl) continue;

        float dist = math::distance(*thumbTip, *targetTip);
        if (dist <= config_.touchMaxDistance) continue;

        FingerError error;
        error.finger = Finger::Thumb;
        error.errorType = FingerErrorType::ShouldTouch;
        error.severity = Severity::Major;
        error.currentValue = dist;
        error.expectedValue = 0.0f;
        error.message = FeedbackMessages::touchWithThumb(target);
        result.perFingerErrors.push_back(std::move(error));
    }
}

void StaticPoseEvaluator::evaluateOrientation(const ConstraintProfile& profile, const HandSnapshot& hand,
                                              StaticGestureResult& result) const {
    if (!profile.checkOrientation || !hand.palmForward) return;
    if (profile.expectedPalmDirection.sqrLength() < 1e-4f) return;

    float angle = math::angleDeg(*hand.palmForward, profile.expectedPalmDirection);
    if (angle <= profile.orientationToleranceDeg) return;

    FingerError error;
    error.finger = Finger::Thumb;
    error.errorType = FingerErrorType::RotationWrong;
    error.severity = Severity::Minor;
    error.currentValue = angle;
    error.expectedValue = 0.0f;
    error.message = FeedbackMessages::correction(Finger::Thumb, FingerErrorType::RotationWrong, Severity::Minor);
    result.perFingerErrors.push_back(std::move(error));
}

} // namespace coach
