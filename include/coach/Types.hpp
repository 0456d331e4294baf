#pragma once

#include <array>
#include <chrono>
#include <cstddef>

namespace coach {

// ============================================================
// Constants - Feedback Configuration
// ============================================================

constexpr size_t FINGER_COUNT = 5;
constexpr size_t JOINTS_PER_FINGER = 4;    // Proximal, Intermediate, Distal, Tip

// Curl estimation
constexpr float NEUTRAL_CURL = 0.5f;            // Returned until a finger was seen once
constexpr float CURL_STRAIGHT_ANGLE_DEG = 180.0f;
constexpr float CURL_FOLDED_ANGLE_DEG = 60.0f;
constexpr float THUMB_FOLDED_ANGLE_DEG = 50.0f;

// Finger shape buckets
constexpr float CURVED_STATE_MIN_CURL = 0.30f;  // below: Extended
constexpr float CLOSED_STATE_MIN_CURL = 0.72f;  // above: Closed

// Static evaluation
constexpr float DEFAULT_CURL_TOLERANCE = 0.10f;
constexpr float MIN_EFFECTIVE_TOLERANCE = 0.08f;
constexpr float THUMB_MIN_EFFECTIVE_TOLERANCE = 0.12f;
constexpr float MAJOR_DEVIATION = 0.18f;
constexpr float MINOR_DEVIATION = 0.08f;
constexpr float THUMB_MAJOR_DOWNGRADE_BELOW = 0.25f;
constexpr float TOUCH_MAX_DISTANCE_M = 0.03f;    // 3 cm
constexpr float TOUCH_TARGET_MAX_CURL = 0.25f;   // target finger must be clearly extended
constexpr float SPREAD_ANGLE_LIMIT_DEG = 30.0f;  // spread bounds live in [-limit, limit]

// Message hysteresis
constexpr size_t MAX_FEEDBACK_MESSAGES = 3;
constexpr float MESSAGE_ENTER_DELAY_S = 0.25f;
constexpr float MESSAGE_EXIT_DELAY_S = 0.45f;   // exit > enter

// Dynamic gestures
constexpr float NEAR_COMPLETION_THRESHOLD = 0.80f;
constexpr float DYNAMIC_MESSAGE_COOLDOWN_S = 0.5f;
constexpr float NEAR_COMPLETION_MESSAGE_HOLD_S = 2.0f;

// Orchestrator timing
constexpr float ANALYSIS_INTERVAL_S = 0.2f;
constexpr float SUCCESS_DISPLAY_DURATION_S = 3.0f;
constexpr float ERROR_MESSAGE_HOLD_MIN_S = 1.0f;
constexpr float ERROR_MESSAGE_HOLD_MAX_S = 1.3f;
constexpr float DYNAMIC_SUCCESS_HOLD_S = 3.0f;

// Host
constexpr int TICK_RATE_HZ = 30;

// ============================================================
// Time
// ============================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::duration<float>;

inline Clock::duration toDuration(float seconds) {
    return std::chrono::duration_cast<Clock::duration>(Seconds(seconds));
}

inline float secondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Seconds>(to - from).count();
}

// ============================================================
// Enumerations
// ============================================================

enum class Finger {
    Thumb = 0,
    Index = 1,
    Middle = 2,
    Ring = 3,
    Pinky = 4
};

constexpr std::array<Finger, FINGER_COUNT> ALL_FINGERS = {
    Finger::Thumb, Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky
};

constexpr size_t fingerIndex(Finger finger) { return static_cast<size_t>(finger); }

// Ordered: comparisons are meaningful
enum class Severity {
    None = 0,
    Minor = 1,
    Major = 2
};

enum class FingerShapeState {
    Extended,
    Curved,
    Closed
};

enum class FingerErrorType {
    None,

    // Semantic shape transitions
    NeedsCurve,     // Extended -> Curved
    NeedsFist,      // Extended/Curved -> Closed
    TooMuchCurl,    // Closed -> Curved
    NeedsExtend,    // Curved/Closed -> Extended

    // Positional
    SpreadTooNarrow,
    SpreadTooWide,
    ShouldTouch,
    ShouldNotTouch,
    ThumbPositionWrong,
    RotationWrong,

    // Generic curl errors, used when no shape state is declared
    TooExtended,
    TooCurled
};

enum class DynamicFeedbackPhase {
    Idle,
    StartDetected,
    InProgress,
    NearCompletion,
    Completed,
    Failed
};

enum class DynamicMovementIssue {
    None,
    DirectionWrong,
    TooFast,
    TooSlow,
    TooShort,
    NotContinuous,
    NotCircular,
    NeedMoreDirectionChanges,
    RotationInsufficient,
    StartPoseDegrading
};

enum class FeedbackState {
    Inactive,
    Waiting,
    ShowingErrors,
    PartialMatch,
    Success,
    InProgress
};

enum class FailureReason {
    None,
    PoseLost,
    SpeedTooLow,
    SpeedTooHigh,
    DistanceTooShort,
    DirectionWrong,
    DirectionChangesInsufficient,
    RotationInsufficient,
    NotCircular,
    Timeout,
    EndPoseMismatch,
    TrackingLost,
    OutOfZone,
    Unknown
};

enum class GesturePhase {
    None,
    Start,
    Move,
    End
};

// ============================================================
// Helpers
// ============================================================

inline FingerShapeState shapeStateFromCurl(float curl) {
    if (curl < CURVED_STATE_MIN_CURL) return FingerShapeState::Extended;
    if (curl > CLOSED_STATE_MIN_CURL) return FingerShapeState::Closed;
    return FingerShapeState::Curved;
}

/**
 * Semantic correction needed to move a finger from its current shape
 * to the expected one. None when both states agree.
 */
FingerErrorType semanticErrorType(FingerShapeState current, FingerShapeState expected);

[[nodiscard]] const char* getFingerName(Finger finger);
[[nodiscard]] const char* getSeverityName(Severity severity);
[[nodiscard]] const char* getShapeStateName(FingerShapeState state);
[[nodiscard]] const char* getErrorTypeName(FingerErrorType type);
[[nodiscard]] const char* getPhaseName(DynamicFeedbackPhase phase);
[[nodiscard]] const char* getIssueName(DynamicMovementIssue issue);
[[nodiscard]] const char* getFeedbackStateName(FeedbackState state);
[[nodiscard]] const char* getFailureReasonName(FailureReason reason);
[[nodiscard]] const char* getGesturePhaseName(GesturePhase phase);

} // namespace coach
