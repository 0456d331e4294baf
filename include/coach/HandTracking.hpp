#pragma once

#include "Types.hpp"
#include "math/Vec3.hpp"
#include <array>
#include <optional>
#include <string>

namespace coach {

/**
 * Joint layout of one tracked hand.
 * Finger joints are numbered finger * 4 + segment, the palm follows them.
 */
enum class JointSegment {
    Proximal = 0,
    Intermediate = 1,
    Distal = 2,
    Tip = 3
};

constexpr int PALM_JOINT_ID = static_cast<int>(FINGER_COUNT * JOINTS_PER_FINGER); // 20
constexpr int JOINT_COUNT = PALM_JOINT_ID + 1;

constexpr int jointId(Finger finger, JointSegment segment) {
    return static_cast<int>(fingerIndex(finger) * JOINTS_PER_FINGER) + static_cast<int>(segment);
}

struct Pose {
    math::Vec3 position;    // meters, common tracking frame
    math::Quat rotation;
};

/**
 * Source of joint poses for the hand being coached.
 * tryGetJointPose returns nullopt while a joint is not tracked.
 */
class HandTrackingSource {
public:
    virtual ~HandTrackingSource() = default;

    [[nodiscard]] virtual std::optional<Pose> tryGetJointPose(int jointId) const = 0;
    [[nodiscard]] virtual bool isTracked() const = 0;
};

/**
 * Authoritative static-sign match signal (one per tracked hand).
 */
class StaticGestureRecognizerPort {
public:
    virtual ~StaticGestureRecognizerPort() = default;

    [[nodiscard]] virtual bool isPerformed() const = 0;
    [[nodiscard]] virtual std::string getTargetSign() const = 0;
};

/**
 * Query side of the motion-gesture recognizer. Its events are delivered
 * to FeedbackOrchestrator::onDynamic* by the host.
 */
class DynamicGestureRecognizerPort {
public:
    virtual ~DynamicGestureRecognizerPort() = default;

    [[nodiscard]] virtual bool isStartPoseValid() const = 0;
};

/**
 * One consistent view of the hand, taken once per tick.
 * All evaluation of a tick runs on the same snapshot.
 */
struct HandSnapshot {
    bool tracked = false;
    std::array<float, FINGER_COUNT> curls{};
    std::array<std::optional<math::Vec3>, FINGER_COUNT> directions;  // proximal -> tip, unit
    std::array<std::optional<math::Vec3>, FINGER_COUNT> tips;
    std::array<std::optional<math::Vec3>, FINGER_COUNT> bases;      // proximal joint
    std::optional<math::Vec3> palmForward;

    HandSnapshot() { curls.fill(NEUTRAL_CURL); }
};

} // namespace coach
