#include "coach/ProfileLibrary.hpp"
#include "coach/Logger.hpp"

namespace coach {

namespace {

const LogChannel logger("ProfileLibrary");

} // namespace

namespace profiles {

namespace {

constexpr float EXTENDED_MIN = 0.0f;
constexpr float EXTENDED_MAX = 0.45f;
constexpr float CURLED_MIN = 0.55f;
constexpr float CURLED_MAX = 1.0f;
constexpr float PARTIAL_MIN = 0.3f;
constexpr float PARTIAL_MAX = 0.65f;
constexpr float FULL_CURL_MIN = 0.85f;
constexpr float FULL_CURL_MAX = 1.0f;
constexpr float TIP_CURL_MIN = 0.45f;
constexpr float TIP_CURL_MAX = 0.75f;

CurlConstraint curl(float minCurl, float maxCurl, Severity cap = Severity::Major) {
    CurlConstraint c = CurlConstraint::range(minCurl, maxCurl);
    c.severityIfOutOfRange = cap;
    return c;
}

CurlConstraint extended(Severity cap = Severity::Major) { return curl(EXTENDED_MIN, EXTENDED_MAX, cap); }
CurlConstraint curled(Severity cap = Severity::Major) { return curl(CURLED_MIN, CURLED_MAX, cap); }

ConstraintProfile makeProfile(const char* name, const char* description) {
    ConstraintProfile p;
    p.signName = name;
    p.description = description;
    return p;
}

void keepTogether(FingerConstraint& finger) {
    finger.spread.enabled = true;
    finger.spread.minAngle = -2.0f;
    finger.spread.maxAngle = 8.0f;
    finger.spread.severity = Severity::Minor;
    finger.messages.generic = "Keep your fingers together";
}

void spreadApart(FingerConstraint& finger) {
    finger.spread.enabled = true;
    finger.spread.minAngle = 8.0f;
    finger.spread.maxAngle = SPREAD_ANGLE_LIMIT_DEG;
    finger.spread.severity = Severity::Minor;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Letters
// ═══════════════════════════════════════════════════════════

ConstraintProfile letterA() {
    auto p = makeProfile("A", "Fist with the thumb straight beside the fingers");
    p.thumb.curl = curl(EXTENDED_MIN, 0.35f, Severity::Minor);
    p.thumb.shouldBeBesideFingers = true;
    p.thumb.messages.generic = "Keep your thumb straight beside the fist, not on top";

    for (Finger f : {Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky}) {
        auto& c = p.getConstraint(f);
        c.curl = curl(FULL_CURL_MIN, FULL_CURL_MAX);
        c.expectedState = FingerShapeState::Closed;
    }
    return p;
}

ConstraintProfile letterB() {
    auto p = makeProfile("B", "Fingers extended together, thumb across the palm");
    p.thumb.curl = curl(0.5f, CURLED_MAX, Severity::Minor);
    p.thumb.messages.tooExtended = "Tuck your thumb firmly across your palm";

    for (Finger f : {Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky}) {
        auto& c = p.getConstraint(f);
        c.curl = extended();
        c.expectedState = FingerShapeState::Extended;
    }
    keepTogether(p.index);
    keepTogether(p.middle);
    keepTogether(p.ring);
    return p;
}

ConstraintProfile letterC() {
    auto p = makeProfile("C", "Hand curved in a C shape");
    p.thumb.curl = curl(0.2f, 0.5f);
    p.thumb.messages.generic = "Curve your thumb to close the C";

    p.index.curl = curl(PARTIAL_MIN, PARTIAL_MAX);
    p.middle.curl = curl(PARTIAL_MIN, PARTIAL_MAX);
    p.ring.curl = curl(PARTIAL_MIN, PARTIAL_MAX, Severity::Minor);
    p.pinky.curl = curl(PARTIAL_MIN, PARTIAL_MAX, Severity::Minor);
    for (Finger f : {Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky}) {
        p.getConstraint(f).expectedState = FingerShapeState::Curved;
    }
    return p;
}

ConstraintProfile letterE() {
    auto p = makeProfile("E", "Fingertips curled to the palm, not a full fist");
    p.thumb.curl = curl(PARTIAL_MIN, 0.7f, Severity::Minor);
    p.thumb.messages.tooExtended = "Fold your thumb under the fingers";

    for (Finger f : {Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky}) {
        auto& c = p.getConstraint(f);
        c.curl = curl(TIP_CURL_MIN, TIP_CURL_MAX);
        c.expectedState = FingerShapeState::Curved;
        c.messages.tooMuchCurl = "Don't make a full fist, only curl the tips";
    }
    return p;
}

ConstraintProfile letterF() {
    auto p = makeProfile("F", "Index and thumb form a circle, other fingers extended");
    p.thumb.curl = curl(PARTIAL_MIN, 0.6f);
    p.thumb.shouldTouchIndex = true;

    p.index.curl = curl(PARTIAL_MIN, 0.6f);
    p.index.messages.generic = "Curve your index to meet the thumb tip";

    p.middle.curl = extended();
    p.ring.curl = extended();
    p.pinky.curl = extended();
    spreadApart(p.middle);
    spreadApart(p.ring);
    return p;
}

ConstraintProfile letterI() {
    auto p = makeProfile("I", "Pinky extended, other fingers closed");
    p.thumb.curl = curl(PARTIAL_MIN, CURLED_MAX, Severity::Minor);
    p.thumb.shouldBeOverFingers = true;

    p.index.curl = curled();
    p.middle.curl = curled();
    p.ring.curl = curled();
    p.pinky.curl = extended();
    p.pinky.messages.tooCurled = "Raise your pinky straight up";
    return p;
}

ConstraintProfile letterL() {
    auto p = makeProfile("L", "Thumb and index extended in an L");
    p.thumb.curl = curl(EXTENDED_MIN, 0.35f);
    p.thumb.messages.tooCurled = "Stretch your thumb out to the side";

    p.index.curl = extended();
    p.middle.curl = curled();
    p.ring.curl = curled();
    p.pinky.curl = curled(Severity::Minor);
    return p;
}

ConstraintProfile letterO() {
    auto p = makeProfile("O", "All fingertips meet the thumb in an O");
    p.thumb.curl = curl(PARTIAL_MIN, 0.7f);
    p.thumb.shouldTouchIndex = true;

    p.index.curl = curl(PARTIAL_MIN, 0.7f);
    p.middle.curl = curl(PARTIAL_MIN, 0.7f);
    p.ring.curl = curl(PARTIAL_MIN, 0.7f, Severity::Minor);
    p.pinky.curl = curl(PARTIAL_MIN, 0.7f, Severity::Minor);
    for (Finger f : {Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky}) {
        p.getConstraint(f).expectedState = FingerShapeState::Curved;
    }
    return p;
}

ConstraintProfile letterS() {
    auto p = makeProfile("S", "Closed fist with the thumb across the fingers");
    p.thumb.curl = curl(PARTIAL_MIN, 0.7f);
    p.thumb.shouldBeOverFingers = true;
    p.thumb.messages.generic = "Cross your thumb over the front of your fingers";

    for (Finger f : {Finger::Index, Finger::Middle, Finger::Ring, Finger::Pinky}) {
        auto& c = p.getConstraint(f);
        c.curl = curl(FULL_CURL_MIN, FULL_CURL_MAX);
        c.expectedState = FingerShapeState::Closed;
    }
    return p;
}

ConstraintProfile letterV() {
    auto p = makeProfile("V", "Index and middle extended and spread");
    p.thumb.curl = curl(PARTIAL_MIN, CURLED_MAX, Severity::Minor);

    p.index.curl = extended();
    spreadApart(p.index);
    p.index.messages.generic = "Open your index and middle into a V";
    p.middle.curl = extended();
    p.ring.curl = curled();
    p.pinky.curl = curled(Severity::Minor);
    return p;
}

ConstraintProfile letterY() {
    auto p = makeProfile("Y", "Thumb and pinky extended");
    p.thumb.curl = curl(EXTENDED_MIN, 0.35f);
    p.thumb.messages.tooCurled = "Stretch your thumb out";

    p.index.curl = curled();
    p.middle.curl = curled();
    p.ring.curl = curled();
    p.pinky.curl = extended();
    return p;
}

// ═══════════════════════════════════════════════════════════
// Digits
// ═══════════════════════════════════════════════════════════

ConstraintProfile digit1() {
    auto p = makeProfile("1", "Index extended, other fingers closed");
    p.thumb.curl = curl(PARTIAL_MIN, CURLED_MAX, Severity::Minor);
    p.thumb.messages.tooExtended = "Tuck your thumb against the palm";

    p.index.curl = extended();
    p.middle.curl = curled();
    p.ring.curl = curled(Severity::Minor);
    p.pinky.curl = curled(Severity::Minor);
    return p;
}

ConstraintProfile digit2() {
    auto p = makeProfile("2", "Index and middle extended (V shape)");
    p.thumb.curl = curl(0.35f, CURLED_MAX, Severity::Minor);
    p.thumb.messages.tooExtended = "Tuck your thumb against the palm";

    p.index.curl = extended();
    p.middle.curl = extended();
    p.ring.curl = curled();
    p.pinky.curl = curled(Severity::Minor);
    return p;
}

ConstraintProfile digit3() {
    auto p = makeProfile("3", "Thumb, index and middle extended");
    p.thumb.curl = curl(EXTENDED_MIN, 0.35f);
    p.thumb.messages.generic = "Stretch your thumb out completely";

    p.index.curl = extended();
    p.middle.curl = extended();
    p.ring.curl = curled();
    p.pinky.curl = curled(Severity::Minor);
    return p;
}

ConstraintProfile digit5() {
    auto p = makeProfile("5", "Open hand, all fingers spread");
    p.thumb.curl = curl(EXTENDED_MIN, 0.35f);
    for (Finger f : ALL_FINGERS) {
        auto& c = p.getConstraint(f);
        if (f != Finger::Thumb) c.curl = extended();
        if (f != Finger::Pinky) spreadApart(c);
    }
    return p;
}

// ═══════════════════════════════════════════════════════════
// Motion gestures
// ═══════════════════════════════════════════════════════════

DynamicGestureDefinition gestureJ() {
    DynamicGestureDefinition def;
    def.gestureName = "J";
    def.description = "Pinky traces a J: down, then hooking towards the body";
    def.primaryDirection = {0.0f, -1.0f, 0.0f};
    def.requiresDirection = true;
    def.minDirectionAlignment = 0.3f;
    def.minSpeed = 0.1f;
    def.minDistance = 0.08f;
    def.minDuration = 0.4f;
    def.maxDuration = 2.5f;
    def.requiresRotation = true;
    def.minRotationAngle = 45.0f;
    return def;
}

DynamicGestureDefinition gestureZ() {
    DynamicGestureDefinition def;
    def.gestureName = "Z";
    def.description = "Index draws a Z: right, diagonal down-left, right";
    def.primaryDirection = {1.0f, 0.0f, 0.0f};
    def.minSpeed = 0.12f;
    def.minDistance = 0.12f;
    def.minDuration = 0.5f;
    def.maxDuration = 3.0f;
    def.requiresDirectionChange = true;
    def.requiredDirectionChanges = 2;
    return def;
}

std::vector<ConstraintProfile> allStaticProfiles() {
    return {letterA(), letterB(), letterC(), letterE(), letterF(), letterI(), letterL(), letterO(),
            letterS(), letterV(), letterY(), digit1(), digit2(), digit3(), digit5()};
}

std::vector<DynamicGestureDefinition> allDynamicGestures() {
    return {gestureJ(), gestureZ()};
}

size_t registerBuiltins(ProfileRegistry& profiles, DynamicGestureRegistry& gestures) {
    size_t added = 0;
    for (auto& profile : allStaticProfiles()) {
        if (profiles.contains(profile.signName)) continue;
        if (profiles.registerProfile(std::move(profile))) added++;
    }
    for (auto& def : allDynamicGestures()) {
        if (gestures.contains(def.gestureName)) continue;
        if (gestures.registerDefinition(std::move(def))) added++;
    }
    logger.info("registered ", added, " built-in presets");
    return added;
}

} // namespace profiles
} // namespace coach
