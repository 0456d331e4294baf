#include "coach/MessageStabilizer.hpp"
#include "coach/FeedbackMessages.hpp"
#include "coach/Logger.hpp"
#include <algorithm>
#include <array>

namespace coach {

namespace {

const LogChannel logger("MessageStabilizer");

constexpr int ORDER_CUSTOM = 20;
constexpr int ORDER_HOLD_STEADY = 40;
constexpr int ORDER_PROGRESS = 50;
constexpr int ORDER_RETRY = 60;

constexpr std::array<MessageAction, 7> ACTION_ORDER = {
    MessageAction::Curve, MessageAction::Release, MessageAction::Close, MessageAction::Straighten,
    MessageAction::Bend, MessageAction::Join, MessageAction::Separate
};

int weightFor(Severity severity) {
    return severity == Severity::Major ? 3 : 2;
}

} // namespace

MessageAction MessageStabilizer::routeLegacyTooExtended(float expectedValue) {
    switch (shapeStateFromCurl(expectedValue)) {
        case FingerShapeState::Curved: return MessageAction::Curve;
        case FingerShapeState::Closed: return MessageAction::Close;
        case FingerShapeState::Extended: break;
    }
    return MessageAction::Bend;
}

const char* MessageStabilizer::getActionPrefix(MessageAction action) {
    switch (action) {
        case MessageAction::Curve:      return "Curve";
        case MessageAction::Release:    return "Relax";
        case MessageAction::Close:      return "Close";
        case MessageAction::Straighten: return "Straighten";
        case MessageAction::Bend:       return "Bend";
        case MessageAction::Join:       return "Bring together";
        case MessageAction::Separate:   return "Spread";
    }
    return "Adjust";
}

std::vector<MessageCandidate> MessageStabilizer::rankCandidates(const StaticGestureResult& result,
                                                                const std::string& signName) const {
    std::vector<MessageCandidate> candidates;

    // Bucket per action, in finger order. Index = action order + 2.
    std::array<std::vector<Finger>, ACTION_ORDER.size()> buckets;
    std::array<bool, ACTION_ORDER.size()> bucketHasMajor{};
    auto bucketFor = [](MessageAction action) {
        return static_cast<size_t>(static_cast<int>(action) + 2);
    };

    int majorFingers = 0;
    int minorFingers = 0;

    for (Finger finger : ALL_FINGERS) {
        const FingerError* error = result.getErrorForFinger(finger);
        if (!error) continue;

        if (error->severity == Severity::Major) majorFingers++;
        else minorFingers++;

        if (error->hasCustomMessage) {
            candidates.push_back({error->message, weightFor(error->severity), 1, ORDER_CUSTOM});
            continue;
        }

        MessageAction action;
        switch (error->errorType) {
            case FingerErrorType::NeedsCurve:      action = MessageAction::Curve; break;
            case FingerErrorType::TooMuchCurl:     action = MessageAction::Release; break;
            case FingerErrorType::NeedsFist:       action = MessageAction::Close; break;
            case FingerErrorType::NeedsExtend:     action = MessageAction::Straighten; break;
            case FingerErrorType::TooCurled:       action = MessageAction::Straighten; break;
            case FingerErrorType::TooExtended:     action = routeLegacyTooExtended(error->expectedValue); break;
            case FingerErrorType::SpreadTooWide:   action = MessageAction::Join; break;
            case FingerErrorType::SpreadTooNarrow: action = MessageAction::Separate; break;
            default: {
                std::string text = !error->message.empty()
                    ? error->message
                    : FeedbackMessages::correction(finger, error->errorType, error->severity);
                candidates.push_back({std::move(text), weightFor(error->severity), 1, ORDER_CUSTOM});
                continue;
            }
        }

        const size_t b = bucketFor(action);
        buckets[b].push_back(finger);
        if (error->severity == Severity::Major) bucketHasMajor[b] = true;
    }

    for (MessageAction action : ACTION_ORDER) {
        const size_t b = bucketFor(action);
        if (buckets[b].empty()) continue;

        MessageCandidate candidate;
        candidate.text = std::string(getActionPrefix(action)) + ": " + FeedbackMessages::fingerList(buckets[b]);
        candidate.severityWeight = bucketHasMajor[b] ? 3 : 2;
        candidate.affectedCount = static_cast<int>(buckets[b].size());
        candidate.order = static_cast<int>(action);
        candidates.push_back(std::move(candidate));
    }

    const int totalIssues = majorFingers + minorFingers;
    if (majorFingers == 0 && totalIssues > 0) {
        candidates.push_back({FeedbackMessages::holdSteady(), 1, totalIssues, ORDER_HOLD_STEADY});
    }

    if (totalIssues > 0) {
        candidates.push_back({FeedbackMessages::remainingAdjustments(totalIssues),
                              majorFingers > 0 ? 2 : 1, totalIssues, ORDER_PROGRESS});
    } else {
        // Recognizer says no, evaluator found nothing: ask for another attempt
        candidates.push_back({FeedbackMessages::notFullyRecognized(signName), 1, 1, ORDER_RETRY});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const MessageCandidate& a, const MessageCandidate& b) {
                         if (a.severityWeight != b.severityWeight) return a.severityWeight > b.severityWeight;
                         if (a.affectedCount != b.affectedCount) return a.affectedCount > b.affectedCount;
                         return a.order < b.order;
                     });
    return candidates;
}

std::vector<std::string> MessageStabilizer::buildCandidates(const StaticGestureResult& result,
                                                            const std::string& signName) const {
    std::vector<std::string> texts;
    for (const auto& candidate : rankCandidates(result, signName)) {
        if (std::find(texts.begin(), texts.end(), candidate.text) != texts.end()) continue;
        texts.push_back(candidate.text);
        if (texts.size() >= config_.maxMessages) break;
    }
    return texts;
}

MessageStabilizer::MessageWindow* MessageStabilizer::findWindow(const std::string& text) {
    auto it = std::find_if(windows_.begin(), windows_.end(),
                           [&](const auto& entry) { return entry.first == text; });
    return it != windows_.end() ? &it->second : nullptr;
}

std::vector<std::string> MessageStabilizer::applyHysteresis(const std::vector<std::string>& candidates,
                                                            TimePoint now) {
    const auto enterDelay = toDuration(config_.messageEnterDelay);
    const auto exitDelay = toDuration(config_.messageExitDelay);

    // Candidates in rank order, then messages only known from earlier calls
    std::vector<std::string> ordered = candidates;
    for (const auto& entry : windows_) {
        if (std::find(ordered.begin(), ordered.end(), entry.first) == ordered.end()) {
            ordered.push_back(entry.first);
        }
    }

    std::vector<std::string> stable;
    std::vector<std::string> expired;

    for (const auto& text : ordered) {
        const bool seenNow = std::find(candidates.begin(), candidates.end(), text) != candidates.end();

        MessageWindow* window = findWindow(text);
        if (!window) {
            if (!seenNow) continue;
            windows_.emplace_back(text, MessageWindow{now, now, false, false});
            window = &windows_.back().second;
        }

        if (seenNow) {
            // Entry requires an uninterrupted run of proposals
            if (!window->isActive && !window->seenLastCall) {
                window->firstSeen = now;
            }
            window->lastSeen = now;
            if (!window->isActive && now - window->firstSeen >= enterDelay) {
                window->isActive = true;
            }
        } else if (window->isActive && now - window->lastSeen >= exitDelay) {
            window->isActive = false;
        }
        window->seenLastCall = seenNow;

        if (window->isActive) {
            stable.push_back(text);
        } else if (!seenNow && now - window->lastSeen >= exitDelay) {
            expired.push_back(text);
        }
    }

    for (const auto& text : expired) {
        windows_.erase(std::remove_if(windows_.begin(), windows_.end(),
                                      [&](const auto& entry) { return entry.first == text; }),
                       windows_.end());
    }

    if (stable.empty() && !lastStable_.empty()) {
        return lastStable_;
    }
    if (!stable.empty()) {
        lastStable_ = stable;
    }
    return stable;
}

std::string MessageStabilizer::stabilize(StaticGestureResult& result, const std::string& signName, TimePoint now) {
    if (result.isMatchGlobal) {
        clear();
        result.summaryMessage = FeedbackMessages::signCorrect(signName);
        return result.summaryMessage;
    }

    auto stable = applyHysteresis(buildCandidates(result, signName), now);

    std::string summary;
    if (!stable.empty()) {
        for (size_t i = 0; i < stable.size(); ++i) {
            if (i > 0) summary += "\n";
            summary += stable[i];
        }
    } else if (result.perFingerErrors.empty()) {
        summary = FeedbackMessages::notFullyRecognized(signName);
    } else {
        summary = FeedbackMessages::adjustHand(signName);
    }

    result.summaryMessage = summary;
    return summary;
}

void MessageStabilizer::clear() {
    if (!windows_.empty()) {
        logger.debug("clearing ", windows_.size(), " message windows");
    }
    windows_.clear();
    lastStable_.clear();
}

} // namespace coach
