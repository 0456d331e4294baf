#include "coach/CurlEstimator.hpp"

namespace coach {

namespace {

const math::Vec3 PALM_FORWARD_AXIS{0.0f, 0.0f, 1.0f};

std::optional<math::Vec3> segmentDirection(const math::Vec3& from, const math::Vec3& to) {
    math::Vec3 delta = to - from;
    if (delta.sqrLength() < math::EPSILON * math::EPSILON) return std::nullopt;
    return delta.normalized();
}

} // namespace

CurlEstimator::CurlEstimator() {
    reset();
}

void CurlEstimator::reset() {
    lastValid_.fill(std::nullopt);
}

std::optional<float> CurlEstimator::computeCurl(Finger finger, const FingerJoints& joints) {
    auto proxToInter = segmentDirection(joints[0], joints[1]);
    auto interToDistal = segmentDirection(joints[1], joints[2]);
    auto distalToTip = segmentDirection(joints[2], joints[3]);
    if (!proxToInter || !interToDistal || !distalToTip) return std::nullopt;

    // Angles are measured against the reversed incoming segment:
    // a straight finger gives 180 deg, a folded joint approaches 0.
    if (finger == Finger::Thumb) {
        float angle = math::angleDeg(-*proxToInter, *distalToTip);
        return math::clamp01(math::inverseLerp(CURL_STRAIGHT_ANGLE_DEG, THUMB_FOLDED_ANGLE_DEG, angle));
    }

    float angle1 = math::angleDeg(-*proxToInter, *interToDistal);
    float angle2 = math::angleDeg(-*interToDistal, *distalToTip);
    float average = (angle1 + angle2) * 0.5f;
    return math::clamp01(math::inverseLerp(CURL_STRAIGHT_ANGLE_DEG, CURL_FOLDED_ANGLE_DEG, average));
}

float CurlEstimator::update(Finger finger, const std::optional<FingerJoints>& joints) {
    auto& held = lastValid_[fingerIndex(finger)];
    if (joints) {
        if (auto curl = computeCurl(finger, *joints)) {
            held = *curl;
        }
    }
    return held.value_or(NEUTRAL_CURL);
}

float CurlEstimator::getCurl(Finger finger) const {
    return lastValid_[fingerIndex(finger)].value_or(NEUTRAL_CURL);
}

bool CurlEstimator::hasObserved(Finger finger) const {
    return lastValid_[fingerIndex(finger)].has_value();
}

HandSnapshot CurlEstimator::sample(const HandTrackingSource& source) {
    HandSnapshot snapshot;
    snapshot.tracked = source.isTracked();

    for (Finger finger : ALL_FINGERS) {
        const size_t idx = fingerIndex(finger);

        FingerJoints joints;
        bool complete = snapshot.tracked;
        for (size_t s = 0; complete && s < JOINTS_PER_FINGER; ++s) {
            auto pose = source.tryGetJointPose(jointId(finger, static_cast<JointSegment>(s)));
            if (!pose) {
                complete = false;
                break;
            }
            joints[s] = pose->position;
        }

        if (complete) {
            snapshot.curls[idx] = update(finger, joints);
            snapshot.directions[idx] = segmentDirection(joints[0], joints[3]);
            snapshot.tips[idx] = joints[3];
            snapshot.bases[idx] = joints[0];
        } else {
            snapshot.curls[idx] = update(finger, std::nullopt);
        }
    }

    if (snapshot.tracked) {
        if (auto palm = source.tryGetJointPose(PALM_JOINT_ID)) {
            math::Vec3 forward = palm->rotation.rotate(PALM_FORWARD_AXIS);
            if (forward.sqrLength() > 1e-4f) {
                snapshot.palmForward = forward.normalized();
            }
        }
    }

    return snapshot;
}

} // namespace coach
