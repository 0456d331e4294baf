#pragma once

#include "ConstraintProfile.hpp"
#include "FeedbackData.hpp"
#include "HandTracking.hpp"

namespace coach {

/**
 * StaticPoseEvaluator: explains why a hand shape does not match a profile.
 *
 * Never decides a match on its own. The recognizer's verdict is passed in
 * and short-circuits the evaluation.
 *
 * Curl deviations are graded in three bands:
 *   deviation <= minorDeviation           -> not reported (jitter)
 *   minorDeviation < dev <= majorDeviation -> Minor
 *   dev > majorDeviation                  -> Major
 */
class StaticPoseEvaluator {
public:
    struct Config {
        float curlTolerance = DEFAULT_CURL_TOLERANCE;
        float minEffectiveTolerance = MIN_EFFECTIVE_TOLERANCE;
        float thumbMinEffectiveTolerance = THUMB_MIN_EFFECTIVE_TOLERANCE;
        float majorDeviation = MAJOR_DEVIATION;
        float minorDeviation = MINOR_DEVIATION;
        float thumbMajorDowngradeBelow = THUMB_MAJOR_DOWNGRADE_BELOW;
        float touchMaxDistance = TOUCH_MAX_DISTANCE_M;
        float touchTargetMaxCurl = TOUCH_TARGET_MAX_CURL;
    };

    StaticPoseEvaluator() = default;
    explicit StaticPoseEvaluator(const Config& config) : config_(config) {}

    [[nodiscard]] StaticGestureResult evaluate(const ConstraintProfile& profile,
                                               const HandSnapshot& hand,
                                               bool isExternallyConfirmedMatch) const;

    /**
     * Effective tolerance added on both sides of a finger's curl range.
     */
    [[nodiscard]] float effectiveTolerance(Finger finger) const;

    /**
     * Severity band of a curl deviation (before the constraint's cap).
     */
    [[nodiscard]] Severity gradeDeviation(Finger finger, float deviation) const;

    /**
     * Angle in degrees between two neighbouring fingers. Positive when the
     * tips diverge along the line joining their bases, negative when the
     * fingers cross.
     */
    [[nodiscard]] static float signedSpreadAngle(const math::Vec3& dirA, const math::Vec3& dirB,
                                                 const math::Vec3& baseA, const math::Vec3& baseB);

    [[nodiscard]] const Config& getConfig() const { return config_; }

private:
    Config config_;

    void evaluateCurl(const FingerConstraint& constraint, float curl, StaticGestureResult& result) const;
    void evaluateSpread(const ConstraintProfile& profile, const HandSnapshot& hand, StaticGestureResult& result) const;
    void evaluateThumbTouch(const ThumbConstraint& thumb, const HandSnapshot& hand, StaticGestureResult& result) const;
    void evaluateOrientation(const ConstraintProfile& profile, const HandSnapshot& hand, StaticGestureResult& result) const;
};

} // namespace coach
