#include "coach/ConfigLoader.hpp"
#include "coach/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace coach {

namespace {

const LogChannel logger("ConfigLoader");

bool has(const cv::FileNode& node, const char* key) {
    const cv::FileNode n = node[key];
    return !n.empty() && !n.isNone();
}

void readFloat(const cv::FileNode& node, const char* key, float& out) {
    if (!has(node, key)) return;
    const cv::FileNode n = node[key];
    if (!n.isReal() && !n.isInt()) {
        throw std::runtime_error(std::string("ConfigLoader: '") + key + "' must be a number");
    }
    out = static_cast<float>(n.real());
}

void readInt(const cv::FileNode& node, const char* key, int& out) {
    if (!has(node, key)) return;
    const cv::FileNode n = node[key];
    if (!n.isInt()) {
        throw std::runtime_error(std::string("ConfigLoader: '") + key + "' must be an integer");
    }
    out = static_cast<int>(n);
}

void readBool(const cv::FileNode& node, const char* key, bool& out) {
    int value = out ? 1 : 0;
    readInt(node, key, value);
    out = value != 0;
}

void readString(const cv::FileNode& node, const char* key, std::string& out) {
    if (!has(node, key)) return;
    const cv::FileNode n = node[key];
    if (!n.isString()) {
        throw std::runtime_error(std::string("ConfigLoader: '") + key + "' must be a string");
    }
    out = n.string();
}

void readVec3(const cv::FileNode& node, const char* key, math::Vec3& out) {
    if (!has(node, key)) return;
    const cv::FileNode n = node[key];
    if (!n.isSeq() || n.size() != 3) {
        throw std::runtime_error(std::string("ConfigLoader: '") + key + "' must be a sequence of 3 numbers");
    }
    out = {static_cast<float>(n[0].real()), static_cast<float>(n[1].real()), static_cast<float>(n[2].real())};
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Entry points
// ═══════════════════════════════════════════════════════════

AppConfig ConfigLoader::loadFile(const std::string& path) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("ConfigLoader: cannot parse " + path + ": " + e.what());
    }
    if (!fs.isOpened()) {
        throw std::runtime_error("ConfigLoader: cannot open " + path);
    }

    logger.info("reading ", path);
    return load(fs);
}

AppConfig ConfigLoader::loadString(const std::string& yaml) {
    cv::FileStorage fs;
    try {
        fs.open(yaml, cv::FileStorage::READ | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_YAML);
    } catch (const cv::Exception& e) {
        throw std::runtime_error(std::string("ConfigLoader: cannot parse YAML: ") + e.what());
    }
    if (!fs.isOpened()) {
        throw std::runtime_error("ConfigLoader: cannot parse YAML");
    }
    return load(fs);
}

AppConfig ConfigLoader::load(const cv::FileStorage& fs) {
    AppConfig config;
    const cv::FileNode root = fs.root();

    readString(root, "logLevel", config.logLevel);
    readFloat(root, "tickRateHz", config.tickRateHz);
    readBool(root, "startActive", config.startActive);
    if (config.tickRateHz <= 0.0f) {
        throw std::runtime_error("ConfigLoader: tickRateHz must be positive");
    }

    if (has(root, "sign")) {
        const cv::FileNode signNode = root["sign"];
        SignTarget sign;
        readString(signNode, "name", sign.name);
        readBool(signNode, "requiresMovement", sign.requiresMovement);
        if (!sign.name.empty()) config.initialSign = sign;
    }

    if (has(root, "feedback")) config.feedback = loadFeedbackConfig(root["feedback"]);
    if (has(root, "osc")) config.osc = loadOscConfig(root["osc"]);
    if (has(root, "profiles")) config.profiles = loadProfiles(root["profiles"]);
    if (has(root, "dynamicGestures")) config.dynamicGestures = loadDynamicGestures(root["dynamicGestures"]);

    logger.info(config.profiles.size(), " profiles, ",
                config.dynamicGestures.size(), " dynamic gestures from configuration");
    return config;
}

// ═══════════════════════════════════════════════════════════
// Sections
// ═══════════════════════════════════════════════════════════

FeedbackConfig ConfigLoader::loadFeedbackConfig(const cv::FileNode& node, const FeedbackConfig& defaults) {
    FeedbackConfig config = defaults;

    readFloat(node, "analysisInterval", config.analysisInterval);
    readFloat(node, "successDisplayDuration", config.successDisplayDuration);
    readFloat(node, "errorMessageHoldMin", config.errorMessageHoldMin);
    readFloat(node, "errorMessageHoldMax", config.errorMessageHoldMax);
    readFloat(node, "dynamicSuccessHoldDuration", config.dynamicSuccessHoldDuration);

    int seed = static_cast<int>(config.seed);
    readInt(node, "seed", seed);
    if (seed < 0) throw std::runtime_error("ConfigLoader: seed must not be negative");
    config.seed = static_cast<uint32_t>(seed);

    readFloat(node, "curlTolerance", config.evaluator.curlTolerance);
    readFloat(node, "minEffectiveTolerance", config.evaluator.minEffectiveTolerance);
    readFloat(node, "thumbMinEffectiveTolerance", config.evaluator.thumbMinEffectiveTolerance);
    readFloat(node, "majorDeviation", config.evaluator.majorDeviation);
    readFloat(node, "minorDeviation", config.evaluator.minorDeviation);
    readFloat(node, "touchMaxDistance", config.evaluator.touchMaxDistance);

    readFloat(node, "messageEnterDelay", config.stabilizer.messageEnterDelay);
    readFloat(node, "messageExitDelay", config.stabilizer.messageExitDelay);
    int maxMessages = static_cast<int>(config.stabilizer.maxMessages);
    readInt(node, "maxMessages", maxMessages);
    if (maxMessages < 1) throw std::runtime_error("ConfigLoader: maxMessages must be at least 1");
    config.stabilizer.maxMessages = static_cast<size_t>(maxMessages);

    readFloat(node, "nearCompletionThreshold", config.dynamic.nearCompletionThreshold);
    readFloat(node, "dynamicMessageCooldown", config.dynamic.messageCooldown);
    readFloat(node, "nearCompletionMessageHold", config.dynamic.nearCompletionMessageHold);

    if (config.evaluator.minorDeviation > config.evaluator.majorDeviation) {
        throw std::runtime_error("ConfigLoader: minorDeviation must not exceed majorDeviation");
    }
    return config;
}

OscConfig ConfigLoader::loadOscConfig(const cv::FileNode& node) {
    OscConfig config;
    readInt(node, "listenPort", config.listenPort);
    readString(node, "targetHost", config.targetHost);
    readInt(node, "targetPort", config.targetPort);

    for (int port : {config.listenPort, config.targetPort}) {
        if (port <= 0 || port > 65535) {
            throw std::runtime_error("ConfigLoader: invalid OSC port " + std::to_string(port));
        }
    }
    return config;
}

std::vector<ConstraintProfile> ConfigLoader::loadProfiles(const cv::FileNode& node) {
    if (!node.isSeq()) throw std::runtime_error("ConfigLoader: 'profiles' must be a sequence");

    std::vector<ConstraintProfile> out;
    for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it) {
        out.push_back(loadProfile(*it));
    }
    return out;
}

std::vector<DynamicGestureDefinition> ConfigLoader::loadDynamicGestures(const cv::FileNode& node) {
    if (!node.isSeq()) throw std::runtime_error("ConfigLoader: 'dynamicGestures' must be a sequence");

    std::vector<DynamicGestureDefinition> out;
    for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it) {
        out.push_back(loadDynamicGesture(*it));
    }
    return out;
}

// ═══════════════════════════════════════════════════════════
// Profiles
// ═══════════════════════════════════════════════════════════

ConstraintProfile ConfigLoader::loadProfile(const cv::FileNode& node) {
    ConstraintProfile profile;
    readString(node, "name", profile.signName);
    if (profile.signName.empty()) {
        throw std::runtime_error("ConfigLoader: profile without a name");
    }
    readString(node, "description", profile.description);
    readBool(node, "checkOrientation", profile.checkOrientation);
    readVec3(node, "palmDirection", profile.expectedPalmDirection);
    readFloat(node, "orientationTolerance", profile.orientationToleranceDeg);

    const cv::FileNode fingers = node["fingers"];
    if (has(node, "fingers")) {
        if (has(fingers, "thumb")) loadThumb(fingers["thumb"], profile.thumb);
        if (has(fingers, "index")) loadFinger(fingers["index"], profile.index);
        if (has(fingers, "middle")) loadFinger(fingers["middle"], profile.middle);
        if (has(fingers, "ring")) loadFinger(fingers["ring"], profile.ring);
        if (has(fingers, "pinky")) loadFinger(fingers["pinky"], profile.pinky);
    }

    profile.normalize();
    return profile;
}

void ConfigLoader::loadFinger(const cv::FileNode& node, FingerConstraint& finger) {
    readBool(node, "enabled", finger.curl.enabled);
    readFloat(node, "min", finger.curl.minCurl);
    readFloat(node, "max", finger.curl.maxCurl);

    std::string text;
    readString(node, "severity", text);
    if (!text.empty()) finger.curl.severityIfOutOfRange = parseSeverity(text);

    text.clear();
    readString(node, "state", text);
    if (!text.empty()) finger.expectedState = parseShapeState(text);

    if (has(node, "spread")) {
        const cv::FileNode spread = node["spread"];
        finger.spread.enabled = true;
        readBool(spread, "enabled", finger.spread.enabled);
        readFloat(spread, "min", finger.spread.minAngle);
        readFloat(spread, "max", finger.spread.maxAngle);
        text.clear();
        readString(spread, "severity", text);
        if (!text.empty()) finger.spread.severity = parseSeverity(text);
    }

    if (has(node, "messages")) {
        const cv::FileNode messages = node["messages"];
        auto& m = finger.messages;
        readString(messages, "needsCurve", m.needsCurve);
        readString(messages, "needsFist", m.needsFist);
        readString(messages, "tooMuchCurl", m.tooMuchCurl);
        readString(messages, "needsExtend", m.needsExtend);
        readString(messages, "tooExtended", m.tooExtended);
        readString(messages, "tooCurled", m.tooCurled);
        readString(messages, "generic", m.generic);
    }
}

void ConfigLoader::loadThumb(const cv::FileNode& node, ThumbConstraint& thumb) {
    loadFinger(node, thumb);
    readBool(node, "overFingers", thumb.shouldBeOverFingers);
    readBool(node, "besideFingers", thumb.shouldBeBesideFingers);

    if (!has(node, "touch")) return;
    const cv::FileNode touch = node["touch"];
    if (!touch.isSeq()) throw std::runtime_error("ConfigLoader: thumb 'touch' must be a sequence");

    for (cv::FileNodeIterator it = touch.begin(); it != touch.end(); ++it) {
        switch (parseFinger((*it).string())) {
            case Finger::Index:  thumb.shouldTouchIndex = true; break;
            case Finger::Middle: thumb.shouldTouchMiddle = true; break;
            case Finger::Ring:   thumb.shouldTouchRing = true; break;
            case Finger::Pinky:  thumb.shouldTouchPinky = true; break;
            case Finger::Thumb:
                throw std::runtime_error("ConfigLoader: the thumb cannot touch itself");
        }
    }
}

DynamicGestureDefinition ConfigLoader::loadDynamicGesture(const cv::FileNode& node) {
    DynamicGestureDefinition def;
    readString(node, "name", def.gestureName);
    if (def.gestureName.empty()) {
        throw std::runtime_error("ConfigLoader: dynamic gesture without a name");
    }
    readString(node, "description", def.description);
    readVec3(node, "primaryDirection", def.primaryDirection);
    readFloat(node, "directionTolerance", def.directionToleranceDeg);
    readBool(node, "requiresDirection", def.requiresDirection);
    readFloat(node, "minDirectionAlignment", def.minDirectionAlignment);
    readFloat(node, "minSpeed", def.minSpeed);
    readFloat(node, "maxSpeed", def.maxSpeed);
    readFloat(node, "minDistance", def.minDistance);
    readFloat(node, "minDuration", def.minDuration);
    readFloat(node, "maxDuration", def.maxDuration);
    readBool(node, "requiresDirectionChange", def.requiresDirectionChange);
    readInt(node, "requiredDirectionChanges", def.requiredDirectionChanges);
    readBool(node, "requiresRotation", def.requiresRotation);
    readFloat(node, "minRotationAngle", def.minRotationAngle);
    readBool(node, "requiresCircularMotion", def.requiresCircularMotion);
    readFloat(node, "minCircularityScore", def.minCircularityScore);

    if (def.minDuration > def.maxDuration) {
        throw std::runtime_error("ConfigLoader: '" + def.gestureName + "' minDuration exceeds maxDuration");
    }
    def.primaryDirection = def.primaryDirection.normalized();
    return def;
}

// ═══════════════════════════════════════════════════════════
// Enum parsing
// ═══════════════════════════════════════════════════════════

Severity ConfigLoader::parseSeverity(const std::string& text) {
    const std::string t = lower(text);
    if (t == "none") return Severity::None;
    if (t == "minor") return Severity::Minor;
    if (t == "major") return Severity::Major;
    throw std::runtime_error("ConfigLoader: unknown severity '" + text + "'");
}

FingerShapeState ConfigLoader::parseShapeState(const std::string& text) {
    const std::string t = lower(text);
    if (t == "extended") return FingerShapeState::Extended;
    if (t == "curved") return FingerShapeState::Curved;
    if (t == "closed") return FingerShapeState::Closed;
    throw std::runtime_error("ConfigLoader: unknown finger state '" + text + "'");
}

Finger ConfigLoader::parseFinger(const std::string& text) {
    const std::string t = lower(text);
    for (Finger finger : ALL_FINGERS) {
        if (t == getFingerName(finger)) return finger;
    }
    throw std::runtime_error("ConfigLoader: unknown finger '" + text + "'");
}

} // namespace coach
