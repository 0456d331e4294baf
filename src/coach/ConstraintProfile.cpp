#include "coach/ConstraintProfile.hpp"
#include "coach/Logger.hpp"
#include <algorithm>
#include <utility>

namespace coach {

namespace {

const LogChannel logger("ConstraintProfile");

} // namespace

CurlConstraint CurlConstraint::range(float minCurl, float maxCurl) {
    CurlConstraint c;
    c.minCurl = minCurl;
    c.maxCurl = maxCurl;
    return c;
}

CurlConstraint CurlConstraint::disabled() {
    CurlConstraint c;
    c.enabled = false;
    return c;
}

const std::string& MessageOverrides::forType(FingerErrorType type) const {
    switch (type) {
        case FingerErrorType::NeedsCurve:  if (!needsCurve.empty()) return needsCurve; break;
        case FingerErrorType::NeedsFist:   if (!needsFist.empty()) return needsFist; break;
        case FingerErrorType::TooMuchCurl: if (!tooMuchCurl.empty()) return tooMuchCurl; break;
        case FingerErrorType::NeedsExtend: if (!needsExtend.empty()) return needsExtend; break;
        case FingerErrorType::TooExtended: if (!tooExtended.empty()) return tooExtended; break;
        case FingerErrorType::TooCurled:   if (!tooCurled.empty()) return tooCurled; break;
        default: break;
    }
    return generic;
}

bool ThumbConstraint::shouldTouch(Finger target) const {
    switch (target) {
        case Finger::Index:  return shouldTouchIndex;
        case Finger::Middle: return shouldTouchMiddle;
        case Finger::Ring:   return shouldTouchRing;
        case Finger::Pinky:  return shouldTouchPinky;
        default: return false;
    }
}

const FingerConstraint& ConstraintProfile::getConstraint(Finger finger) const {
    switch (finger) {
        case Finger::Thumb:  return thumb;
        case Finger::Index:  return index;
        case Finger::Middle: return middle;
        case Finger::Ring:   return ring;
        case Finger::Pinky:  return pinky;
    }
    return index;
}

FingerConstraint& ConstraintProfile::getConstraint(Finger finger) {
    return const_cast<FingerConstraint&>(std::as_const(*this).getConstraint(finger));
}

bool ConstraintProfile::normalize() {
    bool clean = true;
    for (Finger finger : ALL_FINGERS) {
        auto& curl = getConstraint(finger).curl;
        if (curl.minCurl > curl.maxCurl) {
            logger.warn("'", signName, "' ", getFingerName(finger),
                        " has inverted curl range [", curl.minCurl, ", ", curl.maxCurl, "], swapping");
            std::swap(curl.minCurl, curl.maxCurl);
            clean = false;
        }
        float lo = std::clamp(curl.minCurl, 0.0f, 1.0f);
        float hi = std::clamp(curl.maxCurl, 0.0f, 1.0f);
        if (lo != curl.minCurl || hi != curl.maxCurl) {
            logger.warn("'", signName, "' ", getFingerName(finger),
                        " curl range clamped to [0, 1]");
            curl.minCurl = lo;
            curl.maxCurl = hi;
            clean = false;
        }

        auto& spread = getConstraint(finger).spread;
        if (spread.minAngle > spread.maxAngle) {
            logger.warn("'", signName, "' ", getFingerName(finger),
                        " has inverted spread range [", spread.minAngle, ", ", spread.maxAngle, "], swapping");
            std::swap(spread.minAngle, spread.maxAngle);
            clean = false;
        }
        lo = std::clamp(spread.minAngle, -SPREAD_ANGLE_LIMIT_DEG, SPREAD_ANGLE_LIMIT_DEG);
        hi = std::clamp(spread.maxAngle, -SPREAD_ANGLE_LIMIT_DEG, SPREAD_ANGLE_LIMIT_DEG);
        if (lo != spread.minAngle || hi != spread.maxAngle) {
            logger.warn("'", signName, "' ", getFingerName(finger), " spread range clamped to [",
                        -SPREAD_ANGLE_LIMIT_DEG, ", ", SPREAD_ANGLE_LIMIT_DEG, "]");
            spread.minAngle = lo;
            spread.maxAngle = hi;
            clean = false;
        }
    }
    return clean;
}

} // namespace coach
