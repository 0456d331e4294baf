#include "coach/ConfigLoader.hpp"
#include "coach/FeedbackOrchestrator.hpp"
#include "coach/Logger.hpp"
#include "coach/ProfileLibrary.hpp"
#include "coach/ProfileRegistry.hpp"
#include "coach/Types.hpp"
#include "net/OscFeedbackPublisher.hpp"
#include "net/OscInputServer.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

using coach::Logger;

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const std::string configPath = argc > 1 ? argv[1] : "config/signcoach.yaml";

    coach::AppConfig config;
    try {
        config = coach::ConfigLoader::loadFile(configPath);
    } catch (const std::exception& e) {
        Logger::error("Configuration error: ", e.what());
        return 1;
    }
    Logger::setLevel(Logger::parseLevel(config.logLevel));

    Logger::info("Starting SignCoach...");

    // 1. Profiles: configuration first, built-ins fill the gaps
    coach::ProfileRegistry profiles;
    coach::DynamicGestureRegistry gestures;
    for (auto& profile : config.profiles) {
        profiles.registerProfile(std::move(profile));
    }
    for (auto& def : config.dynamicGestures) {
        gestures.registerDefinition(std::move(def));
    }
    coach::profiles::registerBuiltins(profiles, gestures);

    // 2. Network
    net::OscInputServer input(config.osc.listenPort);
    if (!input.start()) {
        return 1;
    }
    net::OscFeedbackPublisher publisher(config.osc.targetHost, config.osc.targetPort);
    if (!publisher.start()) {
        return 1;
    }

    // 3. Feedback
    coach::FeedbackOrchestrator orchestrator(profiles, gestures, input, {&input}, &input, config.feedback);

    auto now = coach::Clock::now();
    if (config.initialSign) {
        orchestrator.setCurrentSign(config.initialSign, now);
    }
    if (config.startActive) {
        orchestrator.setActive(true, now);
    }
    publisher.publish(orchestrator.drainEvents());

    Logger::info("Service running at ", config.tickRateHz, " Hz. Press Ctrl+C to exit.");

    // Main loop: poll input, tick, publish
    const auto tickPeriod = std::chrono::duration_cast<coach::Clock::duration>(
        coach::Seconds(1.0f / config.tickRateHz));
    auto nextTick = coach::Clock::now();

    while (g_running) {
        now = coach::Clock::now();

        input.poll();
        input.deliver(orchestrator, now);
        orchestrator.tick(now);
        publisher.publish(orchestrator.drainEvents());

        nextTick += tickPeriod;
        if (nextTick < now) {
            // Fell behind (e.g. suspended), don't try to catch up
            nextTick = now + tickPeriod;
        }
        std::this_thread::sleep_until(nextTick);
    }

    Logger::info("Interrupt received. Shutting down...");
    orchestrator.setActive(false, coach::Clock::now());
    publisher.publish(orchestrator.drainEvents());
    input.stop();

    Logger::info("Sent ", publisher.getSentCount(), " messages (", publisher.getFailedCount(), " failed)");
    Logger::info("Service stopped cleanly.");
    return 0;
}
