#include "net/OscFeedbackPublisher.hpp"
#include "coach/Logger.hpp"
#include <variant>

namespace net {

using coach::LogChannel;

namespace {

const LogChannel logger("OscFeedbackPublisher");

} // namespace

OscFeedbackPublisher::OscFeedbackPublisher(const std::string& host, int port)
    : _host(host), _port(port) {
}

OscFeedbackPublisher::~OscFeedbackPublisher() {
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

bool OscFeedbackPublisher::start() {
    if (_loAddress) return true;

    const std::string port = std::to_string(_port);
    _loAddress = lo_address_new(_host.c_str(), port.c_str());
    if (!_loAddress) {
        logger.error("Failed to create LO address for ", _host, ":", _port);
        return false;
    }

    logger.info("sending to ", _host, ":", _port);
    return true;
}

void OscFeedbackPublisher::publish(const coach::FeedbackEvent& event) {
    if (!_loAddress) return;
    std::visit([this](const auto& e) { send(e); }, event);
}

void OscFeedbackPublisher::publish(const std::vector<coach::FeedbackEvent>& events) {
    for (const auto& event : events) {
        publish(event);
    }
}

void OscFeedbackPublisher::send(const coach::StateChanged& e) {
    lo_message msg = lo_message_new();
    lo_message_add_string(msg, coach::getFeedbackStateName(e.to));
    dispatch("/feedback/state", msg);
}

void OscFeedbackPublisher::send(const coach::MessageChanged& e) {
    lo_message msg = lo_message_new();
    lo_message_add_string(msg, e.message.c_str());
    lo_message_add_string(msg, coach::getFeedbackStateName(e.state));
    dispatch("/feedback/message", msg);
}

void OscFeedbackPublisher::send(const coach::OverlayVisibilityChanged& e) {
    lo_message msg = lo_message_new();
    lo_message_add_int32(msg, e.visible ? 1 : 0);
    dispatch("/feedback/overlay", msg);
}

void OscFeedbackPublisher::send(const coach::StaticAnalysis& e) {
    // Renderer colours each finger by severity (0 none, 1 minor, 2 major)
    lo_message msg = lo_message_new();
    lo_message_add_string(msg, e.signName.c_str());
    for (coach::Finger finger : coach::ALL_FINGERS) {
        lo_message_add_int32(msg, static_cast<int32_t>(e.result.getSeverityForFinger(finger)));
    }
    lo_message_add_float(msg, e.result.matchScore);
    dispatch("/feedback/fingers", msg);
}

void OscFeedbackPublisher::send(const coach::DynamicPhaseChanged& e) {
    lo_message msg = lo_message_new();
    lo_message_add_string(msg, e.gestureName.c_str());
    lo_message_add_string(msg, coach::getPhaseName(e.from));
    lo_message_add_string(msg, coach::getPhaseName(e.to));
    lo_message_add_string(msg, e.message.c_str());
    dispatch("/feedback/phase", msg);
}

void OscFeedbackPublisher::send(const coach::GestureSucceeded& e) {
    lo_message msg = lo_message_new();
    lo_message_add_string(msg, e.signName.c_str());
    lo_message_add_int32(msg, e.dynamic ? 1 : 0);
    dispatch("/feedback/success", msg);
}

void OscFeedbackPublisher::send(const coach::AudioCueRequested& e) {
    lo_message msg = lo_message_new();
    lo_message_add_string(msg, coach::getAudioCueName(e.cue));
    dispatch("/feedback/audio", msg);
}

void OscFeedbackPublisher::dispatch(const char* path, lo_message msg) {
    int ret = lo_send_message(_loAddress, path, msg);
    if (ret == -1) {
        _failed++;
        logger.error("Failed to send ", path, ": ", lo_address_errstr(_loAddress));
    } else {
        _sent++;
    }
    lo_message_free(msg);
}

} // namespace net
