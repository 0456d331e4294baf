#include <gtest/gtest.h>
#include <stdexcept>
#include "coach/ConfigLoader.hpp"

using namespace coach;

namespace {

std::string yaml(const std::string& body) {
    return "%YAML:1.0\n---\n" + body;
}

} // namespace

TEST(ConfigLoaderTest, EmptyDocumentGivesDefaults) {
    AppConfig config = ConfigLoader::loadString(yaml("logLevel: \"info\"\n"));

    EXPECT_EQ(config.logLevel, "info");
    EXPECT_TRUE(config.startActive);
    EXPECT_FALSE(config.initialSign.has_value());
    EXPECT_FLOAT_EQ(config.feedback.analysisInterval, ANALYSIS_INTERVAL_S);
    EXPECT_FLOAT_EQ(config.feedback.errorMessageHoldMax, ERROR_MESSAGE_HOLD_MAX_S);
    EXPECT_EQ(config.feedback.stabilizer.maxMessages, MAX_FEEDBACK_MESSAGES);
    EXPECT_EQ(config.osc.listenPort, 9000);
    EXPECT_TRUE(config.profiles.empty());
}

TEST(ConfigLoaderTest, OverridesAndInitialSign) {
    AppConfig config = ConfigLoader::loadString(yaml(
        "logLevel: \"debug\"\n"
        "tickRateHz: 60\n"
        "startActive: 0\n"
        "sign:\n"
        "  name: \"J\"\n"
        "  requiresMovement: 1\n"
        "osc:\n"
        "  listenPort: 7000\n"
        "  targetHost: \"10.0.0.2\"\n"
        "feedback:\n"
        "  analysisInterval: 0.1\n"
        "  seed: 99\n"
        "  majorDeviation: 0.25\n"
        "  maxMessages: 2\n"
        "  nearCompletionThreshold: 0.9\n"));

    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_FLOAT_EQ(config.tickRateHz, 60.0f);
    EXPECT_FALSE(config.startActive);
    ASSERT_TRUE(config.initialSign.has_value());
    EXPECT_EQ(config.initialSign->name, "J");
    EXPECT_TRUE(config.initialSign->requiresMovement);

    EXPECT_EQ(config.osc.listenPort, 7000);
    EXPECT_EQ(config.osc.targetHost, "10.0.0.2");
    EXPECT_EQ(config.osc.targetPort, 9001);

    EXPECT_FLOAT_EQ(config.feedback.analysisInterval, 0.1f);
    EXPECT_EQ(config.feedback.seed, 99u);
    EXPECT_FLOAT_EQ(config.feedback.evaluator.majorDeviation, 0.25f);
    EXPECT_FLOAT_EQ(config.feedback.evaluator.minorDeviation, MINOR_DEVIATION);
    EXPECT_EQ(config.feedback.stabilizer.maxMessages, 2u);
    EXPECT_FLOAT_EQ(config.feedback.dynamic.nearCompletionThreshold, 0.9f);
}

TEST(ConfigLoaderTest, ProfileWithConstraints) {
    AppConfig config = ConfigLoader::loadString(yaml(
        "profiles:\n"
        "  - name: \"K\"\n"
        "    checkOrientation: 1\n"
        "    palmDirection: [ 0.0, 1.0, 0.0 ]\n"
        "    fingers:\n"
        "      thumb:\n"
        "        min: 0.2\n"
        "        max: 0.6\n"
        "        touch: [ \"middle\" ]\n"
        "      index:\n"
        "        min: 0.0\n"
        "        max: 0.4\n"
        "        state: \"extended\"\n"
        "        spread: { min: 5.0, max: 30.0, severity: \"minor\" }\n"
        "      ring:\n"
        "        min: 0.9\n"
        "        max: 0.6\n"
        "        severity: \"minor\"\n"
        "        messages:\n"
        "          generic: \"Fold the ring finger\"\n"));

    ASSERT_EQ(config.profiles.size(), 1u);
    const ConstraintProfile& k = config.profiles[0];
    EXPECT_EQ(k.signName, "K");
    EXPECT_TRUE(k.checkOrientation);
    EXPECT_FLOAT_EQ(k.expectedPalmDirection.y, 1.0f);

    EXPECT_TRUE(k.thumb.shouldTouch(Finger::Middle));
    EXPECT_FALSE(k.thumb.shouldTouch(Finger::Index));
    EXPECT_FLOAT_EQ(k.thumb.curl.minCurl, 0.2f);

    EXPECT_EQ(k.index.getExpectedState(), FingerShapeState::Extended);
    EXPECT_TRUE(k.index.spread.enabled);
    EXPECT_FLOAT_EQ(k.index.spread.maxAngle, 30.0f);
    EXPECT_EQ(k.index.spread.severity, Severity::Minor);

    // Inverted range is normalized on load
    EXPECT_FLOAT_EQ(k.ring.curl.minCurl, 0.6f);
    EXPECT_FLOAT_EQ(k.ring.curl.maxCurl, 0.9f);
    EXPECT_EQ(k.ring.curl.severityIfOutOfRange, Severity::Minor);
    EXPECT_EQ(k.ring.messages.generic, "Fold the ring finger");
}

TEST(ConfigLoaderTest, DynamicGestureDirectionIsNormalized) {
    AppConfig config = ConfigLoader::loadString(yaml(
        "dynamicGestures:\n"
        "  - name: \"PUSH\"\n"
        "    primaryDirection: [ 0.0, 0.0, 4.0 ]\n"
        "    requiresDirection: 1\n"
        "    minSpeed: 0.2\n"));

    ASSERT_EQ(config.dynamicGestures.size(), 1u);
    const auto& push = config.dynamicGestures[0];
    EXPECT_EQ(push.gestureName, "PUSH");
    EXPECT_TRUE(push.requiresDirection);
    EXPECT_FLOAT_EQ(push.primaryDirection.z, 1.0f);
    EXPECT_FLOAT_EQ(push.effectiveMaxSpeed(), 0.6f);
}

TEST(ConfigLoaderTest, InvalidValuesThrow) {
    EXPECT_THROW(ConfigLoader::loadString(yaml("osc:\n  listenPort: 70000\n")), std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadString(yaml("feedback:\n  maxMessages: 0\n")), std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadString(yaml("feedback:\n  seed: -1\n")), std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadString(yaml("feedback:\n  minorDeviation: 0.5\n")), std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadString(yaml("tickRateHz: \"fast\"\n")), std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadString(yaml("profiles:\n  - description: \"nameless\"\n")), std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadString(yaml(
                     "profiles:\n  - name: \"X\"\n    fingers:\n      index:\n        severity: \"huge\"\n")),
                 std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadString(yaml(
                     "profiles:\n  - name: \"X\"\n    fingers:\n      thumb:\n        touch: [ \"thumb\" ]\n")),
                 std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadString(yaml(
                     "dynamicGestures:\n  - name: \"X\"\n    minDuration: 3.0\n    maxDuration: 1.0\n")),
                 std::runtime_error);
}

TEST(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(ConfigLoader::loadFile("/nonexistent/signcoach.yaml"), std::runtime_error);
}

TEST(ConfigLoaderTest, ParseEnums) {
    EXPECT_EQ(ConfigLoader::parseSeverity("Major"), Severity::Major);
    EXPECT_EQ(ConfigLoader::parseShapeState("CURVED"), FingerShapeState::Curved);
    EXPECT_EQ(ConfigLoader::parseFinger("pinky"), Finger::Pinky);
    EXPECT_THROW((void)ConfigLoader::parseFinger("toe"), std::runtime_error);
}

TEST(ConfigLoaderTest, ShippedConfigurationLoads) {
    AppConfig config = ConfigLoader::loadFile(std::string(COACH_CONFIG_DIR) + "/signcoach.yaml");

    ASSERT_TRUE(config.initialSign.has_value());
    EXPECT_EQ(config.initialSign->name, "A");
    ASSERT_EQ(config.profiles.size(), 1u);
    EXPECT_EQ(config.profiles[0].signName, "W");
    EXPECT_TRUE(config.profiles[0].thumb.shouldTouch(Finger::Pinky));
    EXPECT_EQ(config.profiles[0].pinky.messages.needsFist, "Fold your pinky down under the thumb");
    ASSERT_EQ(config.dynamicGestures.size(), 1u);
    EXPECT_EQ(config.dynamicGestures[0].gestureName, "NO");
}
