#pragma once

#include <lo/lo.h>
#include <string>
#include <vector>
#include "coach/FeedbackEvent.hpp"

namespace net {

/**
 * OscFeedbackPublisher: forwards orchestrator events to the renderer and audio client.
 *
 * - /feedback/state s                 state name
 * - /feedback/message ss              message, state name
 * - /feedback/overlay i               overlay visible
 * - /feedback/fingers siiiiif         sign, severity per finger (thumb..pinky), match score
 * - /feedback/phase ssss              gesture, from, to, message
 * - /feedback/success si              sign, dynamic
 * - /feedback/audio s                 cue name
 */
class OscFeedbackPublisher {
public:
    OscFeedbackPublisher(const std::string& host, int port);
    ~OscFeedbackPublisher();

    OscFeedbackPublisher(const OscFeedbackPublisher&) = delete;
    OscFeedbackPublisher& operator=(const OscFeedbackPublisher&) = delete;

    bool start();

    void publish(const coach::FeedbackEvent& event);
    void publish(const std::vector<coach::FeedbackEvent>& events);

    [[nodiscard]] size_t getSentCount() const { return _sent; }
    [[nodiscard]] size_t getFailedCount() const { return _failed; }

private:
    void send(const coach::StateChanged& e);
    void send(const coach::MessageChanged& e);
    void send(const coach::OverlayVisibilityChanged& e);
    void send(const coach::StaticAnalysis& e);
    void send(const coach::DynamicPhaseChanged& e);
    void send(const coach::GestureSucceeded& e);
    void send(const coach::AudioCueRequested& e);

    void dispatch(const char* path, lo_message msg);

    std::string _host;
    int _port;
    lo_address _loAddress = nullptr;

    size_t _sent = 0;
    size_t _failed = 0;
};

} // namespace net
