#include "net/OscInputServer.hpp"
#include "coach/FeedbackMessages.hpp"
#include "coach/Logger.hpp"

namespace net {

using coach::LogChannel;

namespace {

const LogChannel logger("OscInputServer");

OscInputServer* self(void* user) {
    return static_cast<OscInputServer*>(user);
}

std::string str(lo_arg* arg) {
    return std::string(&arg->s);
}

coach::FailureReason reasonFromInt(int value) {
    if (value < 0 || value > static_cast<int>(coach::FailureReason::Unknown)) {
        return coach::FailureReason::Unknown;
    }
    return static_cast<coach::FailureReason>(value);
}

coach::GesturePhase phaseFromInt(int value) {
    if (value < 0 || value > static_cast<int>(coach::GesturePhase::End)) {
        return coach::GesturePhase::None;
    }
    return static_cast<coach::GesturePhase>(value);
}

} // namespace

OscInputServer::OscInputServer(int port) : _port(port) {
}

OscInputServer::~OscInputServer() {
    stop();
}

bool OscInputServer::start() {
    if (_server) return true;

    const std::string port = std::to_string(_port);
    _server = lo_server_new(port.c_str(), &OscInputServer::errorHandler);
    if (!_server) {
        logger.error("Failed to open UDP port ", _port);
        return false;
    }

    lo_server_add_method(_server, "/hand/tracked", "i", &OscInputServer::trackedHandler, this);
    lo_server_add_method(_server, "/hand/joint", "iffffffff", &OscInputServer::jointHandler, this);
    lo_server_add_method(_server, "/sign/target", "s", &OscInputServer::targetHandler, this);
    lo_server_add_method(_server, "/sign/performed", "si", &OscInputServer::performedHandler, this);
    lo_server_add_method(_server, "/dynamic/startpose", "i", &OscInputServer::startPoseHandler, this);
    lo_server_add_method(_server, "/dynamic/started", "s", &OscInputServer::startedHandler, this);
    lo_server_add_method(_server, "/dynamic/progress", "sf", &OscInputServer::progressHandler, this);
    lo_server_add_method(_server, "/dynamic/progress", "sfffffiffffi", &OscInputServer::progressHandler, this);
    lo_server_add_method(_server, "/dynamic/near", "sf", &OscInputServer::nearHandler, this);
    lo_server_add_method(_server, "/dynamic/completed", "s", &OscInputServer::completedHandler, this);
    lo_server_add_method(_server, "/dynamic/failed", "sii", &OscInputServer::failedHandler, this);
    lo_server_add_method(_server, "/dynamic/failed", "sss", &OscInputServer::failedHandler, this);
    lo_server_add_method(_server, "/coach/active", "i", &OscInputServer::activeHandler, this);
    lo_server_add_method(_server, "/coach/sign", "si", &OscInputServer::signHandler, this);

    logger.info("listening on port ", _port);
    return true;
}

void OscInputServer::stop() {
    if (!_server) return;
    lo_server_free(_server);
    _server = nullptr;
    logger.info("stopped.");
}

int OscInputServer::poll() {
    if (!_server) return 0;

    _handled = 0;
    // Drain the socket, 0 ms timeout
    while (lo_server_recv_noblock(_server, 0) > 0) {
    }
    return _handled;
}

void OscInputServer::deliver(coach::FeedbackOrchestrator& orchestrator, coach::TimePoint now) {
    while (!_events.empty()) {
        InputEvent event = std::move(_events.front());
        _events.pop_front();

        switch (event.type) {
            case InputEvent::Type::SessionActive:
                orchestrator.setActive(event.flag, now);
                break;
            case InputEvent::Type::SignSelected:
                if (event.name.empty()) {
                    orchestrator.setCurrentSign(std::nullopt, now);
                } else {
                    orchestrator.setCurrentSign(coach::SignTarget{event.name, event.flag}, now);
                }
                break;
            case InputEvent::Type::StaticDetected:
                orchestrator.onStaticGestureDetected(event.name, now);
                break;
            case InputEvent::Type::StaticEnded:
                orchestrator.onStaticGestureEnded(event.name, now);
                break;
            case InputEvent::Type::DynamicStarted:
                orchestrator.onDynamicStarted(event.name, now);
                break;
            case InputEvent::Type::DynamicProgress:
                orchestrator.onDynamicProgress(event.name, event.progress, event.metrics, now);
                break;
            case InputEvent::Type::DynamicNear:
                orchestrator.onDynamicNearCompletion(event.name, event.progress, now);
                break;
            case InputEvent::Type::DynamicCompleted:
                orchestrator.onDynamicCompleted(
                    coach::DynamicGestureResult::success(event.name, event.metrics.value_or(coach::DynamicMetrics{})),
                    now);
                break;
            case InputEvent::Type::DynamicFailed:
                orchestrator.onDynamicFailed(
                    coach::DynamicGestureResult::failure(event.name, event.reason, event.phase,
                                                        event.metrics.value_or(coach::DynamicMetrics{})),
                    now);
                break;
        }
    }
}

std::optional<coach::Pose> OscInputServer::tryGetJointPose(int jointId) const {
    if (!_tracked || jointId < 0 || jointId >= coach::JOINT_COUNT) return std::nullopt;
    return _joints[static_cast<size_t>(jointId)];
}

// ═══════════════════════════════════════════════════════════
// Decoded messages
// ═══════════════════════════════════════════════════════════

void OscInputServer::onTracked(bool tracked) {
    if (tracked == _tracked) return;
    _tracked = tracked;
    if (!tracked) {
        // Stale joints must not survive a tracking loss
        _joints.fill(std::nullopt);
    }
    logger.debug("hand ", tracked ? "tracked" : "lost");
}

void OscInputServer::onJoint(int jointId, const coach::Pose& pose) {
    if (jointId < 0 || jointId >= coach::JOINT_COUNT) {
        logger.warn("ignoring joint id ", jointId);
        return;
    }
    _joints[static_cast<size_t>(jointId)] = pose;
}

void OscInputServer::onTargetSign(const std::string& sign) {
    if (sign == _targetSign) return;
    _targetSign = sign;
    _performed = false;
}

void OscInputServer::onPerformed(const std::string& sign, bool performed) {
    if (sign != _targetSign) {
        onTargetSign(sign);
    }
    if (performed == _performed) return;

    _performed = performed;
    InputEvent event;
    event.type = performed ? InputEvent::Type::StaticDetected : InputEvent::Type::StaticEnded;
    event.name = sign;
    _events.push_back(std::move(event));
}

void OscInputServer::onStartPose(bool valid) {
    _startPoseValid = valid;
}

void OscInputServer::onDynamicStarted(const std::string& name) {
    _lastMetricsGesture = name;
    _lastMetrics.reset();

    InputEvent event;
    event.type = InputEvent::Type::DynamicStarted;
    event.name = name;
    _events.push_back(std::move(event));
}

void OscInputServer::onDynamicProgress(const std::string& name, float progress,
                                       const std::optional<coach::DynamicMetrics>& metrics) {
    if (metrics) {
        _lastMetricsGesture = name;
        _lastMetrics = *metrics;
    }

    InputEvent event;
    event.type = InputEvent::Type::DynamicProgress;
    event.name = name;
    event.progress = progress;
    // Progress without metrics only moves the phase forward
    event.metrics = metrics;
    _events.push_back(std::move(event));
}

void OscInputServer::onDynamicNear(const std::string& name, float progress) {
    InputEvent event;
    event.type = InputEvent::Type::DynamicNear;
    event.name = name;
    event.progress = progress;
    _events.push_back(std::move(event));
}

void OscInputServer::onDynamicCompleted(const std::string& name) {
    InputEvent event;
    event.type = InputEvent::Type::DynamicCompleted;
    event.name = name;
    if (name == _lastMetricsGesture) event.metrics = _lastMetrics;
    _events.push_back(std::move(event));
}

void OscInputServer::onDynamicFailed(const std::string& name, coach::FailureReason reason,
                                     coach::GesturePhase phase) {
    InputEvent event;
    event.type = InputEvent::Type::DynamicFailed;
    event.name = name;
    event.reason = reason;
    event.phase = phase;
    if (name == _lastMetricsGesture) event.metrics = _lastMetrics;
    _events.push_back(std::move(event));
}

void OscInputServer::onSessionActive(bool active) {
    InputEvent event;
    event.type = InputEvent::Type::SessionActive;
    event.flag = active;
    _events.push_back(std::move(event));
}

void OscInputServer::onSignSelected(const std::string& sign, bool requiresMovement) {
    InputEvent event;
    event.type = InputEvent::Type::SignSelected;
    event.name = sign;
    event.flag = requiresMovement;
    _events.push_back(std::move(event));
}

// ═══════════════════════════════════════════════════════════
// liblo callbacks
// ═══════════════════════════════════════════════════════════

void OscInputServer::errorHandler(int num, const char* msg, const char* path) {
    logger.error("liblo error ", num, " in ", path ? path : "(none)", ": ", msg ? msg : "");
}

int OscInputServer::trackedHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    self(user)->_handled++;
    self(user)->onTracked(argv[0]->i != 0);
    return 0;
}

int OscInputServer::jointHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    coach::Pose pose;
    pose.position = {argv[1]->f, argv[2]->f, argv[3]->f};
    pose.rotation = {argv[4]->f, argv[5]->f, argv[6]->f, argv[7]->f};
    self(user)->_handled++;
    self(user)->onJoint(argv[0]->i, pose);
    return 0;
}

int OscInputServer::targetHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    self(user)->_handled++;
    self(user)->onTargetSign(str(argv[0]));
    return 0;
}

int OscInputServer::performedHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    self(user)->_handled++;
    self(user)->onPerformed(str(argv[0]), argv[1]->i != 0);
    return 0;
}

int OscInputServer::startPoseHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    self(user)->_handled++;
    self(user)->onStartPose(argv[0]->i != 0);
    return 0;
}

int OscInputServer::startedHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    self(user)->_handled++;
    self(user)->onDynamicStarted(str(argv[0]));
    return 0;
}

int OscInputServer::progressHandler(const char*, const char*, lo_arg** argv, int argc, lo_message, void* user) {
    std::optional<coach::DynamicMetrics> metrics;
    if (argc >= 12) {
        coach::DynamicMetrics m;
        m.averageSpeed = argv[2]->f;
        m.maxSpeed = argv[3]->f;
        m.totalDistance = argv[4]->f;
        m.duration = argv[5]->f;
        m.directionChanges = argv[6]->i;
        m.totalRotation = argv[7]->f;
        m.circularityScore = argv[8]->f;
        m.directionAlignment = argv[9]->f;
        m.pathStraightness = argv[10]->f;
        m.handShapeStable = argv[11]->i != 0;
        metrics = m;
    }
    self(user)->_handled++;
    self(user)->onDynamicProgress(str(argv[0]), argv[1]->f, metrics);
    return 0;
}

int OscInputServer::nearHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    self(user)->_handled++;
    self(user)->onDynamicNear(str(argv[0]), argv[1]->f);
    return 0;
}

int OscInputServer::completedHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    self(user)->_handled++;
    self(user)->onDynamicCompleted(str(argv[0]));
    return 0;
}

int OscInputServer::failedHandler(const char*, const char* types, lo_arg** argv, int, lo_message, void* user) {
    coach::FailureReason reason;
    coach::GesturePhase phase;
    if (types[1] == 's') {
        // Free-form text from recognizers that only report a reason string
        reason = coach::FeedbackMessages::parseFailureReason(str(argv[1]));
        phase = coach::FeedbackMessages::parseFailedPhase(str(argv[2]));
    } else {
        reason = reasonFromInt(argv[1]->i);
        phase = phaseFromInt(argv[2]->i);
    }
    self(user)->_handled++;
    self(user)->onDynamicFailed(str(argv[0]), reason, phase);
    return 0;
}

int OscInputServer::activeHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    self(user)->_handled++;
    self(user)->onSessionActive(argv[0]->i != 0);
    return 0;
}

int OscInputServer::signHandler(const char*, const char*, lo_arg** argv, int, lo_message, void* user) {
    self(user)->_handled++;
    self(user)->onSignSelected(str(argv[0]), argv[1]->i != 0);
    return 0;
}

} // namespace net
