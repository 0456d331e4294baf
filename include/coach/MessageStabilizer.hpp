#pragma once

#include "FeedbackData.hpp"
#include "Types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace coach {

/**
 * Correction verbs used to group fingers into one sentence.
 * Declaration order is the tie-break order of the candidates.
 */
enum class MessageAction {
    Curve = -2,
    Release = -1,
    Close = 0,
    Straighten = 1,
    Bend = 2,
    Join = 3,
    Separate = 4
};

struct MessageCandidate {
    std::string text;
    int severityWeight = 0;   // 3 major, 2 minor-only, 1 supplementary
    int affectedCount = 0;
    int order = 0;
};

/**
 * MessageStabilizer: per-frame error sets -> short, stable message list.
 *
 * 1. Group fingers by the action they need ("Curve: index and middle")
 * 2. Rank by (severityWeight desc, affectedCount desc, order asc)
 * 3. Deduplicate and cap at maxMessages
 * 4. Enter/exit hysteresis per message text
 *
 * A message becomes visible after being proposed on every call for
 * enterDelay, and stays visible until absent for exitDelay.
 */
class MessageStabilizer {
public:
    struct Config {
        float messageEnterDelay = MESSAGE_ENTER_DELAY_S;
        float messageExitDelay = MESSAGE_EXIT_DELAY_S;
        size_t maxMessages = MAX_FEEDBACK_MESSAGES;
    };

    MessageStabilizer() = default;
    explicit MessageStabilizer(const Config& config) : config_(config) {}

    /**
     * All candidates for one result, sorted by rank. No hysteresis.
     */
    [[nodiscard]] std::vector<MessageCandidate> rankCandidates(const StaticGestureResult& result,
                                                               const std::string& signName) const;

    /**
     * Ranked, deduplicated and capped candidate texts.
     */
    [[nodiscard]] std::vector<std::string> buildCandidates(const StaticGestureResult& result,
                                                           const std::string& signName) const;

    /**
     * Run the enter/exit windows on this call's candidates.
     * An empty outcome keeps the previous stable set.
     */
    std::vector<std::string> applyHysteresis(const std::vector<std::string>& candidates, TimePoint now);

    /**
     * Full pipeline for one analysis. Writes result.summaryMessage and returns it.
     * A confirmed match clears every window.
     */
    std::string stabilize(StaticGestureResult& result, const std::string& signName, TimePoint now);

    /**
     * Drop all windows and the retained stable set.
     */
    void clear();

    [[nodiscard]] const std::vector<std::string>& getStableMessages() const { return lastStable_; }
    [[nodiscard]] size_t getWindowCount() const { return windows_.size(); }
    [[nodiscard]] const Config& getConfig() const { return config_; }

    static MessageAction routeLegacyTooExtended(float expectedValue);
    static const char* getActionPrefix(MessageAction action);

private:
    struct MessageWindow {
        TimePoint firstSeen;
        TimePoint lastSeen;
        bool isActive = false;
        bool seenLastCall = false;
    };

    Config config_;
    std::vector<std::pair<std::string, MessageWindow>> windows_;   // insertion order
    std::vector<std::string> lastStable_;

    MessageWindow* findWindow(const std::string& text);
};

} // namespace coach
