#include "coach/Types.hpp"

namespace coach {

FingerErrorType semanticErrorType(FingerShapeState current, FingerShapeState expected) {
    if (current == expected) return FingerErrorType::None;

    switch (expected) {
        case FingerShapeState::Curved:
            return current == FingerShapeState::Extended ? FingerErrorType::NeedsCurve
                                                         : FingerErrorType::TooMuchCurl;
        case FingerShapeState::Closed:
            return FingerErrorType::NeedsFist;
        case FingerShapeState::Extended:
            return FingerErrorType::NeedsExtend;
    }
    return FingerErrorType::None;
}

const char* getFingerName(Finger finger) {
    switch (finger) {
        case Finger::Thumb:  return "thumb";
        case Finger::Index:  return "index";
        case Finger::Middle: return "middle";
        case Finger::Ring:   return "ring";
        case Finger::Pinky:  return "pinky";
    }
    return "finger";
}

const char* getSeverityName(Severity severity) {
    switch (severity) {
        case Severity::None:  return "NONE";
        case Severity::Minor: return "MINOR";
        case Severity::Major: return "MAJOR";
    }
    return "NONE";
}

const char* getShapeStateName(FingerShapeState state) {
    switch (state) {
        case FingerShapeState::Extended: return "EXTENDED";
        case FingerShapeState::Curved:   return "CURVED";
        case FingerShapeState::Closed:   return "CLOSED";
    }
    return "unknown";
}

const char* getErrorTypeName(FingerErrorType type) {
    switch (type) {
        case FingerErrorType::None:               return "NONE";
        case FingerErrorType::NeedsCurve:         return "NEEDS_CURVE";
        case FingerErrorType::NeedsFist:          return "NEEDS_FIST";
        case FingerErrorType::TooMuchCurl:        return "TOO_MUCH_CURL";
        case FingerErrorType::NeedsExtend:        return "NEEDS_EXTEND";
        case FingerErrorType::SpreadTooNarrow:    return "SPREAD_TOO_NARROW";
        case FingerErrorType::SpreadTooWide:      return "SPREAD_TOO_WIDE";
        case FingerErrorType::ShouldTouch:        return "SHOULD_TOUCH";
        case FingerErrorType::ShouldNotTouch:     return "SHOULD_NOT_TOUCH";
        case FingerErrorType::ThumbPositionWrong: return "THUMB_POSITION_WRONG";
        case FingerErrorType::RotationWrong:      return "ROTATION_WRONG";
        case FingerErrorType::TooExtended:        return "TOO_EXTENDED";
        case FingerErrorType::TooCurled:          return "TOO_CURLED";
    }
    return "unknown";
}

const char* getPhaseName(DynamicFeedbackPhase phase) {
    switch (phase) {
        case DynamicFeedbackPhase::Idle:           return "IDLE";
        case DynamicFeedbackPhase::StartDetected:  return "START_DETECTED";
        case DynamicFeedbackPhase::InProgress:     return "IN_PROGRESS";
        case DynamicFeedbackPhase::NearCompletion: return "NEAR_COMPLETION";
        case DynamicFeedbackPhase::Completed:      return "COMPLETED";
        case DynamicFeedbackPhase::Failed:         return "FAILED";
    }
    return "unknown";
}

const char* getIssueName(DynamicMovementIssue issue) {
    switch (issue) {
        case DynamicMovementIssue::None:                     return "NONE";
        case DynamicMovementIssue::DirectionWrong:           return "DIRECTION_WRONG";
        case DynamicMovementIssue::TooFast:                  return "TOO_FAST";
        case DynamicMovementIssue::TooSlow:                  return "TOO_SLOW";
        case DynamicMovementIssue::TooShort:                 return "TOO_SHORT";
        case DynamicMovementIssue::NotContinuous:            return "NOT_CONTINUOUS";
        case DynamicMovementIssue::NotCircular:              return "NOT_CIRCULAR";
        case DynamicMovementIssue::NeedMoreDirectionChanges: return "NEED_MORE_DIRECTION_CHANGES";
        case DynamicMovementIssue::RotationInsufficient:     return "ROTATION_INSUFFICIENT";
        case DynamicMovementIssue::StartPoseDegrading:       return "START_POSE_DEGRADING";
    }
    return "unknown";
}

const char* getFeedbackStateName(FeedbackState state) {
    switch (state) {
        case FeedbackState::Inactive:      return "INACTIVE";
        case FeedbackState::Waiting:       return "WAITING";
        case FeedbackState::ShowingErrors: return "SHOWING_ERRORS";
        case FeedbackState::PartialMatch:  return "PARTIAL_MATCH";
        case FeedbackState::Success:       return "SUCCESS";
        case FeedbackState::InProgress:    return "IN_PROGRESS";
    }
    return "unknown";
}

const char* getFailureReasonName(FailureReason reason) {
    switch (reason) {
        case FailureReason::None:                         return "NONE";
        case FailureReason::PoseLost:                     return "POSE_LOST";
        case FailureReason::SpeedTooLow:                  return "SPEED_TOO_LOW";
        case FailureReason::SpeedTooHigh:                 return "SPEED_TOO_HIGH";
        case FailureReason::DistanceTooShort:             return "DISTANCE_TOO_SHORT";
        case FailureReason::DirectionWrong:               return "DIRECTION_WRONG";
        case FailureReason::DirectionChangesInsufficient: return "DIRECTION_CHANGES_INSUFFICIENT";
        case FailureReason::RotationInsufficient:         return "ROTATION_INSUFFICIENT";
        case FailureReason::NotCircular:                  return "NOT_CIRCULAR";
        case FailureReason::Timeout:                      return "TIMEOUT";
        case FailureReason::EndPoseMismatch:              return "END_POSE_MISMATCH";
        case FailureReason::TrackingLost:                 return "TRACKING_LOST";
        case FailureReason::OutOfZone:                    return "OUT_OF_ZONE";
        case FailureReason::Unknown:                      return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* getGesturePhaseName(GesturePhase phase) {
    switch (phase) {
        case GesturePhase::None:  return "NONE";
        case GesturePhase::Start: return "START";
        case GesturePhase::Move:  return "MOVE";
        case GesturePhase::End:   return "END";
    }
    return "NONE";
}

} // namespace coach
