#pragma once

#include "FeedbackData.hpp"
#include "Types.hpp"
#include <string>
#include <variant>

namespace coach {

struct StateChanged {
    FeedbackState from;
    FeedbackState to;
};

struct MessageChanged {
    std::string message;
    FeedbackState state;
};

struct OverlayVisibilityChanged {
    bool visible;
};

/**
 * Per-finger overlay data for the renderer, one per static analysis.
 */
struct StaticAnalysis {
    std::string signName;
    StaticGestureResult result;
};

struct DynamicPhaseChanged {
    std::string gestureName;
    DynamicFeedbackPhase from;
    DynamicFeedbackPhase to;
    std::string message;
};

struct GestureSucceeded {
    std::string signName;
    bool dynamic;
};

enum class AudioCue {
    StartPractice,
    Success,
    Error
};

struct AudioCueRequested {
    AudioCue cue;
};

/**
 * Everything the orchestrator tells its collaborators. Drained by the host.
 */
using FeedbackEvent = std::variant<StateChanged, MessageChanged, OverlayVisibilityChanged, StaticAnalysis,
                                   DynamicPhaseChanged, GestureSucceeded, AudioCueRequested>;

inline const char* getAudioCueName(AudioCue cue) {
    switch (cue) {
        case AudioCue::StartPractice: return "start";
        case AudioCue::Success:       return "success";
        case AudioCue::Error:         return "error";
    }
    return "unknown";
}

} // namespace coach
