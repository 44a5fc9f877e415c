#include "core/Logger.hpp"
#include "core/Types.hpp"
#include "core/PostureConfig.hpp"
#include "core/ProcessingLoop.hpp"
#include "net/OscReceiver.hpp"
#include "net/OscSender.hpp"
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    core::Logger::info("Interrupt signal (", signum, ") received. Shutting down...");
    g_running = false;
}

namespace {

std::string configPath(int argc, char** argv) {
    if (argc > 1) return argv[1];
    const char* env = std::getenv("POSTURE_CONFIG");
    return env ? env : "";
}

} // namespace

int main(int argc, char** argv) {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    core::Logger::info("Starting PostureTrackingService...");

    core::AppConfig config;
    const std::string path = configPath(argc, argv);
    try {
        if (path.empty()) {
            config.classifier.validate();
            config.service.validate();
            core::Logger::info("No config file given, using defaults");
        } else {
            config = core::loadConfig(path);
        }
    } catch (const core::ConfigurationError& e) {
        core::Logger::error("Invalid configuration: ", e.what());
        return EXIT_FAILURE;
    }

    // log_level was validated with the rest of the service config
    core::LogLevel level = core::LogLevel::INFO;
    if (core::Logger::parseLevel(config.service.logLevel, level)) {
        core::Logger::setLevel(level);
    }

    // Outer Loop for auto-restart
    while (g_running) {
        try {
            // 1. Queues
            auto inputQueue = std::make_shared<core::InputQueue>();
            auto outputQueue = std::make_shared<core::OutputQueue>();

            // 2. Start OSC Sender
            net::OscSender oscSender(outputQueue, config.service.targetHost,
                                     config.service.targetPort, config.service.maxLatencyMs);
            oscSender.start();

            // 3. Start Processing Loop
            core::ProcessingLoop processingLoop(inputQueue, outputQueue,
                                                config.classifier, config.service);
            processingLoop.start();

            // 4. Start OSC Receiver last so no sample waits on an idle consumer
            net::OscReceiver oscReceiver(inputQueue, config.service.listenPort);
            oscReceiver.start();

            core::Logger::info("Service running. Press Ctrl+C to exit.");

            // Main loop (Orchestrator)
            while (g_running) {
                if (oscReceiver.hasError() || oscSender.hasError()) {
                    core::Logger::warn("OSC endpoint reported critical error. Restarting service...");
                    break; // Break inner loop to trigger restart
                }

                std::this_thread::sleep_for(std::chrono::seconds(1));
            }

            // Shutdown: producer first, so nothing is queued after its consumer stops
            core::Logger::info("Stopping modules...");
            oscReceiver.stop();
            processingLoop.stop();
            oscSender.stop();

            if (!g_running) {
                break; // Exit outer loop if user requested shutdown
            }

            core::Logger::info("Restarting in 5 seconds...");
            std::this_thread::sleep_for(std::chrono::seconds(5));

        } catch (const std::exception& e) {
            core::Logger::error("Fatal error in service loop: ", e.what());
            if (g_running) {
                core::Logger::info("Retrying in 5 seconds...");
                std::this_thread::sleep_for(std::chrono::seconds(5));
            }
        }
    }

    core::Logger::info("Service stopped cleanly.");
    return 0;
}
