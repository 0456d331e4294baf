#pragma once

#include "ConstraintProfile.hpp"
#include "FeedbackData.hpp"
#include "FeedbackOrchestrator.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace coach {

struct OscConfig {
    int listenPort = 9000;              // tracker / recognizer input
    std::string targetHost = "127.0.0.1";
    int targetPort = 9001;              // renderer / audio output
};

/**
 * Everything the host reads at startup.
 */
struct AppConfig {
    FeedbackConfig feedback;
    OscConfig osc;
    std::string logLevel = "info";
    float tickRateHz = TICK_RATE_HZ;
    bool startActive = true;
    std::optional<SignTarget> initialSign;

    std::vector<ConstraintProfile> profiles;
    std::vector<DynamicGestureDefinition> dynamicGestures;
};

/**
 * ConfigLoader: YAML configuration via cv::FileStorage.
 *
 * Every key is optional and falls back to the compiled-in default.
 * Throws std::runtime_error if the source cannot be parsed or a value is invalid.
 *
 * Booleans are written as 0/1.
 */
class ConfigLoader {
public:
    static AppConfig loadFile(const std::string& path);

    /**
     * Parse YAML text held in memory.
     */
    static AppConfig loadString(const std::string& yaml);

    static AppConfig load(const cv::FileStorage& fs);

    static FeedbackConfig loadFeedbackConfig(const cv::FileNode& node, const FeedbackConfig& defaults = {});
    static OscConfig loadOscConfig(const cv::FileNode& node);
    static std::vector<ConstraintProfile> loadProfiles(const cv::FileNode& node);
    static std::vector<DynamicGestureDefinition> loadDynamicGestures(const cv::FileNode& node);

    [[nodiscard]] static Severity parseSeverity(const std::string& text);
    [[nodiscard]] static FingerShapeState parseShapeState(const std::string& text);
    [[nodiscard]] static Finger parseFinger(const std::string& text);

private:
    static ConstraintProfile loadProfile(const cv::FileNode& node);
    static void loadFinger(const cv::FileNode& node, FingerConstraint& finger);
    static void loadThumb(const cv::FileNode& node, ThumbConstraint& thumb);
    static DynamicGestureDefinition loadDynamicGesture(const cv::FileNode& node);
};

} // namespace coach
