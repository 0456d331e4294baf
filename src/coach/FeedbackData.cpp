#include "coach/FeedbackData.hpp"
#include "coach/FeedbackMessages.hpp"
#include "math/Vec3.hpp"

namespace coach {

void StaticGestureResult::updateAggregates() {
    majorErrorCount = 0;
    minorErrorCount = 0;
    for (const auto& error : perFingerErrors) {
        if (error.severity == Severity::Major) majorErrorCount++;
        else if (error.severity == Severity::Minor) minorErrorCount++;
    }

    matchScore = math::clamp01(1.0f - 0.3f * static_cast<float>(majorErrorCount)
                                    - 0.1f * static_cast<float>(minorErrorCount));
    isNearMatch = majorErrorCount == 0 && minorErrorCount > 0;
}

const FingerError* StaticGestureResult::getErrorForFinger(Finger finger) const {
    const FingerError* worst = nullptr;
    for (const auto& error : perFingerErrors) {
        if (error.finger != finger || error.severity == Severity::None) continue;
        if (!worst || error.severity > worst->severity) {
            worst = &error;
        }
    }
    return worst;
}

Severity StaticGestureResult::getSeverityForFinger(Finger finger) const {
    const FingerError* error = getErrorForFinger(finger);
    return error ? error->severity : Severity::None;
}

StaticGestureResult StaticGestureResult::success() {
    StaticGestureResult result;
    result.isMatchGlobal = true;
    result.matchScore = 1.0f;
    return result;
}

DynamicGestureResult DynamicGestureResult::success(const std::string& name, const DynamicMetrics& metrics) {
    DynamicGestureResult result;
    result.gestureName = name;
    result.isSuccess = true;
    result.metrics = metrics;
    return result;
}

DynamicGestureResult DynamicGestureResult::failure(const std::string& name, FailureReason reason,
                                                   GesturePhase phase, const DynamicMetrics& metrics) {
    DynamicGestureResult result;
    result.gestureName = name;
    result.isSuccess = false;
    result.failureReason = reason;
    result.failedPhase = phase;
    result.metrics = metrics;
    result.troubleshootingMessage = FeedbackMessages::troubleshooting(reason, phase, metrics, name);
    return result;
}

} // namespace coach
