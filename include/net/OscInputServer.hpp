#pragma once

#include <array>
#include <deque>
#include <lo/lo.h>
#include <optional>
#include <string>
#include "coach/FeedbackData.hpp"
#include "coach/FeedbackOrchestrator.hpp"
#include "coach/HandTracking.hpp"

namespace net {

/**
 * Event received over OSC, delivered to the orchestrator on the tick thread.
 */
struct InputEvent {
    enum class Type {
        SessionActive,
        SignSelected,
        StaticDetected,
        StaticEnded,
        DynamicStarted,
        DynamicProgress,
        DynamicNear,
        DynamicCompleted,
        DynamicFailed
    };

    Type type = Type::DynamicStarted;
    std::string name;
    bool flag = false;                  // SessionActive: active, SignSelected: requiresMovement
    float progress = 0.0f;
    std::optional<coach::DynamicMetrics> metrics;   // empty for progress sent without metrics
    coach::FailureReason reason = coach::FailureReason::Unknown;
    coach::GesturePhase phase = coach::GesturePhase::None;
};

/**
 * OscInputServer: receives tracking and recognizer data from the XR client.
 *
 * Messages:
 * - /hand/tracked i                  hand visible
 * - /hand/joint iffffffff            joint id, position xyz, rotation wxyz
 * - /sign/target s                   sign the static recognizer is armed for
 * - /sign/performed si               sign, performed flag
 * - /dynamic/startpose i             start pose valid
 * - /dynamic/started s
 * - /dynamic/progress sf[ffffiffffi] name, progress, optional metrics
 * - /dynamic/near sf
 * - /dynamic/completed s
 * - /dynamic/failed sii | sss        name, reason, phase
 * - /coach/active i
 * - /coach/sign si                   sign, requires movement
 *
 * Single-threaded: poll() is called from the tick loop and never blocks.
 */
class OscInputServer : public coach::HandTrackingSource,
                       public coach::StaticGestureRecognizerPort,
                       public coach::DynamicGestureRecognizerPort {
public:
    explicit OscInputServer(int port);
    ~OscInputServer() override;

    OscInputServer(const OscInputServer&) = delete;
    OscInputServer& operator=(const OscInputServer&) = delete;

    /**
     * Open the UDP port and register handlers. Returns false on failure.
     */
    bool start();
    void stop();

    /**
     * Handle every datagram already received.
     * @return number of messages handled
     */
    int poll();

    /**
     * Forward queued events to the orchestrator in arrival order.
     */
    void deliver(coach::FeedbackOrchestrator& orchestrator, coach::TimePoint now);

    // HandTrackingSource
    [[nodiscard]] std::optional<coach::Pose> tryGetJointPose(int jointId) const override;
    [[nodiscard]] bool isTracked() const override { return _tracked; }

    // StaticGestureRecognizerPort
    [[nodiscard]] bool isPerformed() const override { return _performed; }
    [[nodiscard]] std::string getTargetSign() const override { return _targetSign; }

    // DynamicGestureRecognizerPort
    [[nodiscard]] bool isStartPoseValid() const override { return _startPoseValid; }

    // Decoded message handlers, also used directly by tests
    void onTracked(bool tracked);
    void onJoint(int jointId, const coach::Pose& pose);
    void onTargetSign(const std::string& sign);
    void onPerformed(const std::string& sign, bool performed);
    void onStartPose(bool valid);
    void onDynamicStarted(const std::string& name);
    void onDynamicProgress(const std::string& name, float progress, const std::optional<coach::DynamicMetrics>& metrics);
    void onDynamicNear(const std::string& name, float progress);
    void onDynamicCompleted(const std::string& name);
    void onDynamicFailed(const std::string& name, coach::FailureReason reason, coach::GesturePhase phase);
    void onSessionActive(bool active);
    void onSignSelected(const std::string& sign, bool requiresMovement);

    [[nodiscard]] size_t getPendingEventCount() const { return _events.size(); }
    [[nodiscard]] const std::deque<InputEvent>& getPendingEvents() const { return _events; }

private:
    static void errorHandler(int num, const char* msg, const char* path);

    static int trackedHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int jointHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int targetHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int performedHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int startPoseHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int startedHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int progressHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int nearHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int completedHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int failedHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int activeHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);
    static int signHandler(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg, void* user);

    int _port;
    lo_server _server = nullptr;
    int _handled = 0;

    bool _tracked = false;
    std::array<std::optional<coach::Pose>, coach::JOINT_COUNT> _joints;
    std::string _targetSign;
    bool _performed = false;
    bool _startPoseValid = false;

    std::string _lastMetricsGesture;
    std::optional<coach::DynamicMetrics> _lastMetrics;

    std::deque<InputEvent> _events;
};

} // namespace net
