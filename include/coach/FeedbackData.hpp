#pragma once

#include "Types.hpp"
#include "math/Vec3.hpp"
#include <string>
#include <vector>

namespace coach {

struct FingerError {
    Finger finger = Finger::Index;
    FingerErrorType errorType = FingerErrorType::None;
    Severity severity = Severity::None;
    float currentValue = 0.0f;
    float expectedValue = 0.0f;
    std::string message;
    bool hasCustomMessage = false;   // message came from the profile author
};

/**
 * Outcome of one static evaluation. Value type, produced fresh per call.
 * isMatchGlobal comes from the external recognizer only.
 */
struct StaticGestureResult {
    bool isMatchGlobal = false;
    std::vector<FingerError> perFingerErrors;
    int majorErrorCount = 0;
    int minorErrorCount = 0;
    float matchScore = 0.0f;
    bool isNearMatch = false;
    std::string summaryMessage;

    /**
     * Recompute counts, matchScore and isNearMatch from perFingerErrors.
     */
    void updateAggregates();

    /**
     * Most severe error reported for the finger (first one on ties), or nullptr.
     */
    [[nodiscard]] const FingerError* getErrorForFinger(Finger finger) const;

    [[nodiscard]] Severity getSeverityForFinger(Finger finger) const;

    static StaticGestureResult success();
};

/**
 * Motion summary produced by the motion tracker each tick.
 */
struct DynamicMetrics {
    float averageSpeed = 0.0f;       // m/s
    float maxSpeed = 0.0f;           // m/s
    float totalDistance = 0.0f;      // m
    float duration = 0.0f;           // s
    int directionChanges = 0;
    float totalRotation = 0.0f;      // deg
    float circularityScore = 0.0f;   // 0..1
    math::Vec3 netDisplacement;
    float directionAlignment = 1.0f; // cosine with the primary direction
    float pathStraightness = 0.0f;   // 0..1
    bool handShapeStable = true;
};

/**
 * Requirements of one motion gesture, looked up by name.
 */
struct DynamicGestureDefinition {
    std::string gestureName;
    std::string description;

    math::Vec3 primaryDirection{0.0f, 0.0f, 1.0f};
    float directionToleranceDeg = 45.0f;
    bool requiresDirection = false;
    float minDirectionAlignment = 0.5f;

    float minSpeed = 0.12f;
    float maxSpeed = 0.0f;            // 0 = 3 x minSpeed
    float minDistance = 0.08f;
    float minDuration = 0.4f;
    float maxDuration = 3.0f;

    bool requiresDirectionChange = false;
    int requiredDirectionChanges = 0;

    bool requiresRotation = false;
    float minRotationAngle = 30.0f;

    bool requiresCircularMotion = false;
    float minCircularityScore = 0.6f;

    [[nodiscard]] float effectiveMaxSpeed() const {
        return maxSpeed > 0.0f ? maxSpeed : minSpeed * 3.0f;
    }
};

struct DynamicGestureResult {
    std::string gestureName;
    bool isSuccess = false;
    FailureReason failureReason = FailureReason::None;
    GesturePhase failedPhase = GesturePhase::None;
    DynamicMetrics metrics;
    std::string troubleshootingMessage;

    static DynamicGestureResult success(const std::string& name, const DynamicMetrics& metrics);
    static DynamicGestureResult failure(const std::string& name, FailureReason reason,
                                        GesturePhase phase, const DynamicMetrics& metrics);
};

} // namespace coach
