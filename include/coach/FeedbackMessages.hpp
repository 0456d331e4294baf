#pragma once

#include "FeedbackData.hpp"
#include "Types.hpp"
#include <string>
#include <vector>

namespace coach {

/**
 * FeedbackMessages: English wording of every user-facing string.
 * Stateless; all helpers are static.
 */
class FeedbackMessages {
public:
    // ═══ Static shape feedback ═══

    /**
     * Correction for one finger error. Minor severity uses a softer tone.
     */
    static std::string correction(Finger finger, FingerErrorType type, Severity severity = Severity::Major);

    static std::string touchWithThumb(Finger target);

    /**
     * "index", "index and middle", "index, middle and ring"
     */
    static std::string fingerList(const std::vector<Finger>& fingers);

    static std::string holdSteady();
    static std::string remainingAdjustments(int count);
    static std::string notFullyRecognized(const std::string& signName);
    static std::string adjustHand(const std::string& signName);
    static std::string makeSign(const std::string& signName);
    static std::string practiceSign(const std::string& signName);
    static std::string signCorrect(const std::string& signName);
    static std::string noSignSelected();
    static std::string handNotTracked();

    // ═══ Dynamic gestures ═══

    static std::string idlePhase(const std::string& gestureName);
    static std::string startDetected();
    static std::string inProgress(DynamicMovementIssue issue, const std::string& gestureName,
                                  const math::Vec3& expectedDirection);
    static const std::vector<std::string>& nearCompletionVariants();
    static std::string completed();
    static std::string failed(FailureReason reason, GesturePhase phase,
                              const std::string& gestureName, const math::Vec3& expectedDirection = {});
    static std::string troubleshooting(FailureReason reason, GesturePhase phase, const DynamicMetrics& metrics,
                                       const std::string& gestureName, const math::Vec3& expectedDirection = {});

    /**
     * "up and to the right", empty for a degenerate vector.
     */
    static std::string directionDescription(const math::Vec3& direction);

    /**
     * How to trace a known gesture (J, Z, HELLO, ...). Empty when unknown.
     */
    static std::string gestureDirectionHint(const std::string& gestureName);

    /**
     * Short tracing hint shown while a trajectory letter is in progress. Empty when unknown.
     */
    static std::string trajectoryHint(const std::string& gestureName);

    // ═══ Parsing of recognizer failure text ═══

    static FailureReason parseFailureReason(const std::string& text);
    static GesturePhase parseFailedPhase(const std::string& text);
    static DynamicMovementIssue failureReasonToIssue(FailureReason reason);
};

} // namespace coach
