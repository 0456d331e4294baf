#pragma once

#include "ConstraintProfile.hpp"
#include "FeedbackData.hpp"
#include "ProfileRegistry.hpp"
#include <vector>

namespace coach {

/**
 * Built-in ASL presets.
 *
 * Curl ranges (0 = straight, 1 = folded):
 * - extended   0.00 - 0.45
 * - curled     0.55 - 1.00
 * - partial    0.30 - 0.65
 * - full curl  0.85 - 1.00  (A, S: closed fist)
 * - tip curl   0.45 - 0.75  (E: fingertips only, must not read as a fist)
 */
namespace profiles {

ConstraintProfile letterA();
ConstraintProfile letterB();
ConstraintProfile letterC();
ConstraintProfile letterE();
ConstraintProfile letterF();
ConstraintProfile letterI();
ConstraintProfile letterL();
ConstraintProfile letterO();
ConstraintProfile letterS();
ConstraintProfile letterV();
ConstraintProfile letterY();

ConstraintProfile digit1();
ConstraintProfile digit2();
ConstraintProfile digit3();
ConstraintProfile digit5();

DynamicGestureDefinition gestureJ();
DynamicGestureDefinition gestureZ();

std::vector<ConstraintProfile> allStaticProfiles();
std::vector<DynamicGestureDefinition> allDynamicGestures();

/**
 * Register every preset. Entries already present (e.g. from the YAML file) win.
 * @return number of presets added
 */
size_t registerBuiltins(ProfileRegistry& profiles, DynamicGestureRegistry& gestures);

} // namespace profiles

} // namespace coach
