#include "coach/FeedbackMessages.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace coach {

namespace {

std::string toUpper(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

/**
 * Split an upper-case gesture name into words ("THANK_YOU" -> THANK, YOU).
 */
std::vector<std::string> tokenize(const std::string& upper) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : upper) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current += c;
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

struct GestureHint {
    const char* key;
    const char* hint;
};

// Order matters: first matching word wins
const GestureHint GESTURE_HINTS[] = {
    // Communication
    {"HELLO",     "Wave your hand from side to side, like greeting someone."},
    {"BYE",       "Wave your hand from side to side, like saying goodbye."},
    {"YES",       "Move your fist down and up, like nodding."},
    {"NO",        "Move your fingers from side to side, like shaking your head."},
    {"THANK",     "Move your hand forward from your chin."},
    {"PLEASE",    "Make a circle over your chest."},
    {"GOOD",      "Move your hand forward from your chin."},
    {"BAD",       "Move your hand down from your chin."},
    // Colors
    {"BLUE",      "Twist the B hand to the right."},
    {"GREEN",     "Move the G forward and back."},
    {"YELLOW",    "Twist the Y hand outward."},
    {"PURPLE",    "Shake the P from side to side."},
    {"ORANGE",    "Squeeze your hand in front of your chin."},
    {"BROWN",     "Slide the B down your cheek."},
    {"PINK",      "Slide the P down across your lips."},
    {"WHITE",     "Pull your hand out from your chest while closing your fingers."},
    {"BLACK",     "Slide your index finger across your forehead."},
    {"RED",       "Slide your index finger down from your lips."},
    {"GRAY",      "Move both hands back and forth, crossing them."},
    // Days
    {"MONDAY",    "Make a small circle with the M."},
    {"TUESDAY",   "Make a small circle with the T."},
    {"WEDNESDAY", "Make a small circle with the W."},
    {"THURSDAY",  "Make a small circle with the H."},
    {"FRIDAY",    "Make a small circle with the F."},
    {"SATURDAY",  "Make a small circle with the S."},
    {"SUNDAY",    "Move both hands down and outward, opening them."},
    // Verbs
    {"EAT",       "Bring your closed hand to your mouth repeatedly."},
    {"DRINK",     "Bring your hand to your mouth as if holding a cup."},
    {"SLEEP",     "Draw your open hand down your face while closing your fingers."},
    {"READ",      "Move the V fingers across your palm from side to side."},
    {"WRITE",     "Pretend to write on your open palm."},
    {"DRAW",      "Move your pinky in a zigzag over your palm."},
    {"PLAY",      "Shake both hands with thumbs and pinkies extended."},
    {"HURT",      "Twist both index fingers toward each other repeatedly."},
    {"GET",       "Pull both hands toward you while closing your fingers."},
    {"TAP",       "Tap down with your index finger repeatedly."},
};

const char* const TRACE_J = "Draw a J with your pinky: move down and curve to the left.";
const char* const TRACE_Z = "Draw a Z with your index finger: right, diagonal down-left, and right.";

std::string formatFloat(float value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Static shape feedback
// ═══════════════════════════════════════════════════════════

std::string FeedbackMessages::correction(Finger finger, FingerErrorType type, Severity severity) {
    const std::string name = getFingerName(finger);
    const bool minor = severity == Severity::Minor;

    switch (type) {
        case FingerErrorType::NeedsCurve:
            return minor ? "Curve your " + name + " a bit more"
                         : "Curve your " + name + " (don't make a fist)";
        case FingerErrorType::NeedsFist:
            return minor ? "Close your " + name + " a bit more"
                         : "Close your " + name + " into a fist";
        case FingerErrorType::TooMuchCurl:
            return minor ? "Relax your " + name + " a bit"
                         : "Relax your " + name + ", don't make a fist";
        case FingerErrorType::NeedsExtend:
            return minor ? "Straighten your " + name + " a bit"
                         : "Straighten your " + name + " fully";
        case FingerErrorType::TooExtended:
            return minor ? "Bend your " + name + " a bit more"
                         : "Bend your " + name;
        case FingerErrorType::TooCurled:
            return minor ? "Straighten your " + name + " a bit"
                         : "Straighten your " + name;
        case FingerErrorType::SpreadTooNarrow:
            return minor ? "Spread your fingers a bit more" : "Spread your fingers";
        case FingerErrorType::SpreadTooWide:
            return minor ? "Bring your fingers a bit closer" : "Bring your fingers together";
        case FingerErrorType::ThumbPositionWrong:
            return minor ? "Adjust your thumb slightly" : "Adjust your thumb position";
        case FingerErrorType::ShouldTouch:
            return minor ? "Bring your " + name + " closer" : "Touch with your " + name;
        case FingerErrorType::ShouldNotTouch:
            return minor ? "Separate your " + name + " slightly" : "Separate your " + name;
        case FingerErrorType::RotationWrong:
            return minor ? "Rotate your hand slightly" : "Rotate your hand";
        case FingerErrorType::None:
            break;
    }
    return minor ? "Adjust your " + name + " slightly" : "Adjust your " + name;
}

std::string FeedbackMessages::touchWithThumb(Finger target) {
    return std::string("Touch your thumb to your ") + getFingerName(target);
}

std::string FeedbackMessages::fingerList(const std::vector<Finger>& fingers) {
    std::string out;
    for (size_t i = 0; i < fingers.size(); ++i) {
        if (i > 0) {
            out += (i + 1 == fingers.size()) ? " and " : ", ";
        }
        out += getFingerName(fingers[i]);
    }
    return out;
}

std::string FeedbackMessages::holdSteady() {
    return "Almost: hold the sign steady for 0.5 s";
}

std::string FeedbackMessages::remainingAdjustments(int count) {
    if (count == 1) return "Only 1 adjustment left";
    return std::to_string(count) + " fingers left";
}

std::string FeedbackMessages::notFullyRecognized(const std::string& signName) {
    return "'" + signName + "' not fully recognized, hold still and try again";
}

std::string FeedbackMessages::adjustHand(const std::string& signName) {
    return "Adjust your hand for '" + signName + "'...";
}

std::string FeedbackMessages::makeSign(const std::string& signName) {
    return "Make the sign '" + signName + "'...";
}

std::string FeedbackMessages::practiceSign(const std::string& signName) {
    return "Practice '" + signName + "'...";
}

std::string FeedbackMessages::signCorrect(const std::string& signName) {
    return "Correct! '" + signName + "' detected";
}

std::string FeedbackMessages::noSignSelected() {
    return "No sign selected...";
}

std::string FeedbackMessages::handNotTracked() {
    return "Show your hand to the sensors";
}

// ═══════════════════════════════════════════════════════════
// Dynamic gestures
// ═══════════════════════════════════════════════════════════

std::string FeedbackMessages::idlePhase(const std::string& gestureName) {
    return "Place your hand for '" + gestureName + "'.";
}

std::string FeedbackMessages::startDetected() {
    return "Good! Now start the movement.";
}

std::string FeedbackMessages::inProgress(DynamicMovementIssue issue, const std::string& gestureName,
                                         const math::Vec3& expectedDirection) {
    switch (issue) {
        case DynamicMovementIssue::DirectionWrong: {
            std::string specific = gestureDirectionHint(gestureName);
            if (!specific.empty()) return specific;
            std::string dir = directionDescription(expectedDirection);
            if (!dir.empty()) return "Move your hand " + dir + ".";
            return "Adjust the direction of the movement.";
        }
        case DynamicMovementIssue::TooFast:                  return "Slow down.";
        case DynamicMovementIssue::TooSlow:                  return "Move faster.";
        case DynamicMovementIssue::TooShort:                 return "Make the movement bigger.";
        case DynamicMovementIssue::NotContinuous:            return "Don't stop, keep moving.";
        case DynamicMovementIssue::NotCircular:              return "Make the movement more circular.";
        case DynamicMovementIssue::NeedMoreDirectionChanges: return "Move from side to side more times.";
        case DynamicMovementIssue::RotationInsufficient:     return "Rotate your wrist more.";
        case DynamicMovementIssue::StartPoseDegrading:       return "Keep the hand shape.";
        case DynamicMovementIssue::None:                     break;
    }
    return "Keep going.";
}

const std::vector<std::string>& FeedbackMessages::nearCompletionVariants() {
    static const std::vector<std::string> variants = {
        "Almost!",
        "Finish the movement.",
        "Just a little more.",
        "Nearly there."
    };
    return variants;
}

std::string FeedbackMessages::completed() {
    return "Movement recognized!";
}

std::string FeedbackMessages::failed(FailureReason reason, GesturePhase phase,
                                     const std::string& gestureName, const math::Vec3& expectedDirection) {
    std::string explanation;
    if (reason == FailureReason::DirectionWrong) {
        std::string specific = gestureDirectionHint(gestureName);
        std::string dir = directionDescription(expectedDirection);
        if (!specific.empty()) {
            explanation = "The direction was not right. " + specific;
        } else if (!dir.empty()) {
            explanation = "The direction was not right. Move your hand " + dir;
        } else {
            explanation = "The direction of the movement was not right";
        }
    } else {
        switch (reason) {
            case FailureReason::SpeedTooLow:      explanation = "The gesture was too slow"; break;
            case FailureReason::SpeedTooHigh:     explanation = "The gesture was too fast"; break;
            case FailureReason::DistanceTooShort: explanation = "The movement was too short"; break;
            case FailureReason::DirectionChangesInsufficient:
                explanation = "There were not enough changes of direction"; break;
            case FailureReason::RotationInsufficient:
                explanation = "You did not rotate your wrist enough"; break;
            case FailureReason::NotCircular:      explanation = "The movement was not circular enough"; break;
            case FailureReason::Timeout:          explanation = "The gesture took too long"; break;
            case FailureReason::PoseLost:
                explanation = phase == GesturePhase::Start
                    ? "You started moving too early"
                    : "You lost the hand shape during the movement";
                break;
            case FailureReason::EndPoseMismatch:  explanation = "The final pose was not right"; break;
            case FailureReason::TrackingLost:     explanation = "Keep your hand visible to the sensors"; break;
            case FailureReason::OutOfZone:        explanation = "Your hand left the tracking zone"; break;
            case FailureReason::Unknown:          explanation = "The gesture '" + gestureName + "' was not completed"; break;
            default:                              explanation = "Try the gesture '" + gestureName + "' again"; break;
        }
    }
    return explanation + ". Try again keeping the hand shape.";
}

std::string FeedbackMessages::troubleshooting(FailureReason reason, GesturePhase phase, const DynamicMetrics& metrics,
                                              const std::string& gestureName, const math::Vec3& expectedDirection) {
    std::string when;
    switch (phase) {
        case GesturePhase::Start: when = " at the start"; break;
        case GesturePhase::Move:  when = " during the movement"; break;
        case GesturePhase::End:   when = " at the end"; break;
        case GesturePhase::None:  break;
    }

    switch (reason) {
        case FailureReason::DirectionWrong: {
            std::string specific = gestureDirectionHint(gestureName);
            if (!specific.empty()) return specific;
            std::string dir = directionDescription(expectedDirection);
            if (!dir.empty()) return "Move your hand " + dir + ".";
            return "Adjust the direction of the movement for '" + gestureName + "'.";
        }
        case FailureReason::PoseLost:
            return "Keep the correct hand shape" + when + ".";
        case FailureReason::SpeedTooLow:
            return "Move faster (speed: " + formatFloat(metrics.averageSpeed, 2) + " m/s).";
        case FailureReason::SpeedTooHigh:
            return "Move slower and with control.";
        case FailureReason::DistanceTooShort:
            return "Make a wider movement (distance: " + formatFloat(metrics.totalDistance, 2) + " m).";
        case FailureReason::DirectionChangesInsufficient:
            return "Add more changes of direction (" + std::to_string(metrics.directionChanges) + " detected).";
        case FailureReason::RotationInsufficient:
            return "Rotate your wrist more (" + formatFloat(metrics.totalRotation, 0) + " deg detected).";
        case FailureReason::NotCircular:
            return "Make the movement more circular.";
        case FailureReason::Timeout:
            return "Complete the gesture faster.";
        case FailureReason::EndPoseMismatch:
            return "Finish with the correct hand shape.";
        case FailureReason::TrackingLost:
            return "Keep your hand visible to the sensors.";
        case FailureReason::OutOfZone:
            return "Keep your hand in the zone in front of you.";
        case FailureReason::Unknown:
            return "Adjust the movement for '" + gestureName + "'.";
        case FailureReason::None:
            break;
    }
    return "Try '" + gestureName + "' again.";
}

std::string FeedbackMessages::directionDescription(const math::Vec3& direction) {
    if (direction.sqrLength() < 0.01f) return {};

    math::Vec3 dir = direction.normalized();
    std::vector<std::string> parts;

    if (dir.y > 0.4f) parts.emplace_back("up");
    else if (dir.y < -0.4f) parts.emplace_back("down");

    if (dir.x > 0.4f) parts.emplace_back("to the right");
    else if (dir.x < -0.4f) parts.emplace_back("to the left");

    if (dir.z > 0.4f) parts.emplace_back("forward");
    else if (dir.z < -0.4f) parts.emplace_back("toward you");

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += " and ";
        out += parts[i];
    }
    return out;
}

std::string FeedbackMessages::gestureDirectionHint(const std::string& gestureName) {
    if (gestureName.empty()) return {};

    const std::string upper = toUpper(gestureName);
    const auto tokens = tokenize(upper);
    if (tokens.empty()) return {};

    // Trajectory letters also match with suffixes ("J_Right", "Z_Move")
    if (tokens.front() == "J") return TRACE_J;
    if (tokens.front() == "Z") return TRACE_Z;

    for (const auto& rule : GESTURE_HINTS) {
        if (std::find(tokens.begin(), tokens.end(), rule.key) != tokens.end()) {
            return rule.hint;
        }
    }
    return {};
}

std::string FeedbackMessages::trajectoryHint(const std::string& gestureName) {
    const auto tokens = tokenize(toUpper(gestureName));
    if (tokens.empty()) return {};
    if (tokens.front() == "J") return "Draw a J with your pinky: move down and finish curving";
    if (tokens.front() == "Z") return "Draw a Z with your index finger: three quick strokes";
    return {};
}

// ═══════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════

FailureReason FeedbackMessages::parseFailureReason(const std::string& text) {
    if (text.empty()) return FailureReason::Unknown;

    // Exact enum names first ("SPEED_TOO_LOW")
    const std::string upper = toUpper(text);
    for (int i = static_cast<int>(FailureReason::None); i <= static_cast<int>(FailureReason::Unknown); ++i) {
        auto reason = static_cast<FailureReason>(i);
        if (upper == getFailureReasonName(reason)) return reason;
    }

    const std::string lower = toLower(text);

    if (contains(lower, "pose") && contains(lower, "lost")) return FailureReason::PoseLost;

    if (contains(lower, "speed") || contains(lower, "slow") || contains(lower, "fast")) {
        if (contains(lower, "low") || contains(lower, "slow")) return FailureReason::SpeedTooLow;
        if (contains(lower, "high") || contains(lower, "fast")) return FailureReason::SpeedTooHigh;
    }

    if (contains(lower, "distance") || contains(lower, "short")) return FailureReason::DistanceTooShort;

    if (contains(lower, "direction")) {
        if (contains(lower, "change") || contains(lower, "insufficient")) {
            return FailureReason::DirectionChangesInsufficient;
        }
        return FailureReason::DirectionWrong;
    }

    if (contains(lower, "rotation") || contains(lower, "twist")) return FailureReason::RotationInsufficient;
    if (contains(lower, "circular") || contains(lower, "circle")) return FailureReason::NotCircular;
    if (contains(lower, "timeout") || contains(lower, "time") || contains(lower, "exceeded")) return FailureReason::Timeout;
    if (contains(lower, "tracking") || contains(lower, "visible")) return FailureReason::TrackingLost;
    if (contains(lower, "zone") || contains(lower, "outside")) return FailureReason::OutOfZone;
    if (contains(lower, "final") || contains(lower, "end") || contains(lower, "requirement")) {
        return FailureReason::EndPoseMismatch;
    }

    return FailureReason::Unknown;
}

GesturePhase FeedbackMessages::parseFailedPhase(const std::string& text) {
    if (text.empty()) return GesturePhase::Move;

    const std::string lower = toLower(text);
    if (contains(lower, "initial") || contains(lower, "start")) return GesturePhase::Start;
    if (contains(lower, "final") || contains(lower, "end") || contains(lower, "complete")) return GesturePhase::End;
    return GesturePhase::Move;
}

DynamicMovementIssue FeedbackMessages::failureReasonToIssue(FailureReason reason) {
    switch (reason) {
        case FailureReason::SpeedTooLow:                  return DynamicMovementIssue::TooSlow;
        case FailureReason::SpeedTooHigh:                 return DynamicMovementIssue::TooFast;
        case FailureReason::DistanceTooShort:             return DynamicMovementIssue::TooShort;
        case FailureReason::DirectionWrong:               return DynamicMovementIssue::DirectionWrong;
        case FailureReason::DirectionChangesInsufficient: return DynamicMovementIssue::NeedMoreDirectionChanges;
        case FailureReason::RotationInsufficient:         return DynamicMovementIssue::RotationInsufficient;
        case FailureReason::NotCircular:                  return DynamicMovementIssue::NotCircular;
        case FailureReason::OutOfZone:                    return DynamicMovementIssue::DirectionWrong;
        case FailureReason::Timeout:                      return DynamicMovementIssue::TooSlow;
        default:                                          return DynamicMovementIssue::None;
    }
}

} // namespace coach
