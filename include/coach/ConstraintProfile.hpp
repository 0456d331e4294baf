#pragma once

#include "Types.hpp"
#include "math/Vec3.hpp"
#include <optional>
#include <string>

namespace coach {

/**
 * Accepted curl range of one finger.
 * Invariant: 0 <= minCurl <= maxCurl <= 1
 */
struct CurlConstraint {
    float minCurl = 0.0f;
    float maxCurl = 1.0f;
    bool enabled = true;
    Severity severityIfOutOfRange = Severity::Major;   // upper bound for reported severity

    float midpoint() const { return (minCurl + maxCurl) * 0.5f; }

    static CurlConstraint range(float minCurl, float maxCurl);
    static CurlConstraint extended() { return range(0.0f, 0.25f); }
    static CurlConstraint curled() { return range(0.7f, 1.0f); }
    static CurlConstraint partiallyCurled() { return range(0.3f, 0.7f); }
    static CurlConstraint disabled();
};

/**
 * Accepted angle (degrees) between this finger and the next one
 * (thumb-index, index-middle, ...). The pinky has no neighbour.
 */
struct SpreadConstraint {
    float minAngle = -15.0f;
    float maxAngle = 15.0f;
    bool enabled = false;
    Severity severity = Severity::Minor;
};

/**
 * Optional author-supplied wording. Empty strings mean "use the dictionary".
 */
struct MessageOverrides {
    std::string needsCurve;
    std::string needsFist;
    std::string tooMuchCurl;
    std::string needsExtend;
    std::string tooExtended;
    std::string tooCurled;
    std::string generic;

    [[nodiscard]] const std::string& forType(FingerErrorType type) const;
};

struct FingerConstraint {
    Finger finger = Finger::Index;
    CurlConstraint curl;
    SpreadConstraint spread;
    std::optional<FingerShapeState> expectedState;   // derived from the curl midpoint if unset
    MessageOverrides messages;

    FingerConstraint() = default;
    explicit FingerConstraint(Finger f) : finger(f) {}
    FingerConstraint(Finger f, CurlConstraint c) : finger(f), curl(c) {}

    [[nodiscard]] FingerShapeState getExpectedState() const {
        return expectedState ? *expectedState : shapeStateFromCurl(curl.midpoint());
    }

    [[nodiscard]] bool hasDeclaredState() const { return expectedState.has_value(); }
};

/**
 * Thumb: curl constraint plus contact and placement predicates.
 */
struct ThumbConstraint : FingerConstraint {
    bool shouldTouchIndex = false;
    bool shouldTouchMiddle = false;
    bool shouldTouchRing = false;
    bool shouldTouchPinky = false;
    bool shouldBeOverFingers = false;
    bool shouldBeBesideFingers = false;

    ThumbConstraint() : FingerConstraint(Finger::Thumb) {}
    explicit ThumbConstraint(CurlConstraint c) : FingerConstraint(Finger::Thumb, c) {}

    [[nodiscard]] bool shouldTouch(Finger target) const;
};

/**
 * Declarative description of one static hand shape.
 * Built once at startup and treated as immutable after registration.
 */
struct ConstraintProfile {
    std::string signName;
    std::string description;

    ThumbConstraint thumb;
    FingerConstraint index{Finger::Index};
    FingerConstraint middle{Finger::Middle};
    FingerConstraint ring{Finger::Ring};
    FingerConstraint pinky{Finger::Pinky};

    bool checkOrientation = false;
    math::Vec3 expectedPalmDirection{0.0f, 0.0f, 1.0f};   // palm forward
    float orientationToleranceDeg = 45.0f;

    [[nodiscard]] const FingerConstraint& getConstraint(Finger finger) const;
    FingerConstraint& getConstraint(Finger finger);

    /**
     * Swap inverted ranges and clamp to [0, 1]. Returns false if anything had to be fixed.
     */
    bool normalize();
};

} // namespace coach
