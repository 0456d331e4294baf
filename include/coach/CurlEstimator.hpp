#pragma once

#include "HandTracking.hpp"
#include <array>
#include <optional>

namespace coach {

/**
 * CurlEstimator: normalized per-finger flexion (0 = straight, 1 = folded).
 *
 * Joint dropouts hold the last valid value of that finger so a single
 * missing frame never shows up as a correction. Before the first valid
 * observation a finger reports NEUTRAL_CURL.
 */
class CurlEstimator {
public:
    using FingerJoints = std::array<math::Vec3, JOINTS_PER_FINGER>;

    CurlEstimator();

    /**
     * Pure geometry. Returns nullopt if a segment has zero length.
     * @param joints proximal, intermediate, distal, tip positions
     */
    [[nodiscard]] static std::optional<float> computeCurl(Finger finger, const FingerJoints& joints);

    /**
     * Feed one observation (nullopt = dropout) and return the held curl.
     */
    float update(Finger finger, const std::optional<FingerJoints>& joints);

    /**
     * Query every finger joint and the palm once and build the tick snapshot.
     */
    HandSnapshot sample(const HandTrackingSource& source);

    [[nodiscard]] float getCurl(Finger finger) const;
    [[nodiscard]] bool hasObserved(Finger finger) const;

    void reset();

private:
    std::array<std::optional<float>, FINGER_COUNT> lastValid_;
};

} // namespace coach
