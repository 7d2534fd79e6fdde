/**
 * @file main.cpp
 * @brief NAO Bridge - Entry Point
 *
 * Usage: nao_bridge [config_dir] [--fake-robot] [--ip HOST] [--port N]
 *                   [--websocket-port N] [--with-joints-data] [--with-audio-data]
 */

#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <string>

#include "nao_bridge/core.hpp"

using namespace nao_bridge;
using namespace nao_bridge::config;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    LOG_INFO("Received signal {}, shutting down...", signal);
    g_running = false;
}

namespace {

struct CommandLine {
    std::string config_dir = "config";
    bool fake_robot = false;
    std::string ip;
    int robot_port = 0;
    int websocket_port = 0;
    bool with_joints = false;
    bool with_audio = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [config_dir] [--fake-robot] [--ip HOST] [--port N]"
                 " [--websocket-port N] [--with-joints-data] [--with-audio-data]"
              << std::endl;
}

bool parseInt(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string text;
        if (arg == "--fake-robot") {
            cmd.fake_robot = true;
        } else if (arg == "--with-joints-data") {
            cmd.with_joints = true;
        } else if (arg == "--with-audio-data") {
            cmd.with_audio = true;
        } else if (arg == "--ip") {
            if (!value(cmd.ip)) return false;
        } else if (arg == "--port") {
            if (!value(text) || !parseInt(text, cmd.robot_port)) return false;
        } else if (arg == "--websocket-port") {
            if (!value(text) || !parseInt(text, cmd.websocket_port)) return false;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] != '-') {
            cmd.config_dir = arg;
        } else {
            std::cerr << "Unknown option " << arg << std::endl;
            return false;
        }
    }
    return true;
}

void applyOverrides(const CommandLine& cmd, BridgeConfig& cfg) {
    if (!cmd.ip.empty()) {
        cfg.backend.robot_host = cmd.ip;
        cfg.backend.mode = BackendMode::LIVE;
    }
    if (cmd.fake_robot) {
        cfg.backend.mode = BackendMode::SIMULATED;
    }
    if (cmd.robot_port > 0) {
        cfg.backend.robot_port = cmd.robot_port;
    }
    if (cmd.websocket_port > 0) {
        cfg.server.port = cmd.websocket_port;
    }
    if (cmd.with_joints) {
        cfg.streams.joints_enabled = true;
    }
    if (cmd.with_audio) {
        cfg.streams.audio_enabled = true;
    }
}

std::unique_ptr<backend::IRobotBackend> createBackend(const BridgeConfig& cfg) {
    if (cfg.backend.mode == BackendMode::LIVE) {
        return std::make_unique<backend::LiveBackend>(cfg.backend);
    }
    return std::make_unique<backend::SimulatedBackend>(cfg.simulation);
}

} // namespace

int main(int argc, char* argv[]) {
    // Setup signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 1;
    }

    // Initialize logging (basic setup, will reconfigure after loading config)
    Logger::init("logs/nao_bridge.log", "debug");

    LOG_INFO("========================================");
    LOG_INFO("NAO Bridge v1.0.0");
    LOG_INFO("========================================");
    LOG_INFO("Config directory: {}", cmd.config_dir);

    // Load configuration
    auto& config = ConfigManager::instance();
    if (!config.loadAll(cmd.config_dir)) {
        LOG_ERROR("Failed to load configuration files");
        LOG_ERROR("Make sure bridge_config.yaml exists in: {}", cmd.config_dir);
        return 1;
    }
    applyOverrides(cmd, config.mutableBridgeConfig());
    const BridgeConfig& cfg = config.bridgeConfig();

    // Reconfigure logger based on loaded config
    Logger::reset();
    Logger::init(
        cfg.logging.file_enabled ? cfg.logging.file : std::string(),
        cfg.logging.level,
        static_cast<size_t>(cfg.logging.max_size_mb) * 1024 * 1024,
        static_cast<size_t>(cfg.logging.max_files),
        cfg.logging.console_enabled
    );

    LOG_INFO("Configuration loaded successfully");
    LOG_INFO("Backend: {}{}", toString(cfg.backend.mode),
             cfg.backend.mode == BackendMode::LIVE
                 ? " (" + cfg.backend.robot_host + ":" + std::to_string(cfg.backend.robot_port) + ")"
                 : std::string());
    LOG_INFO("Streams: touch={} joints={} audio={}", cfg.streams.touch_enabled,
             cfg.streams.joints_enabled, cfg.streams.audio_enabled);

    robot::RobotSession session(createBackend(cfg), cfg.session);

    if (cfg.session.connect_on_startup) {
        auto connected = session.connect();
        if (connected.ok()) {
            LOG_INFO("Robot connected: {}", connected.value().dump());
        } else if (connected.error().fatal) {
            LOG_ERROR("Robot link cannot be established: {}", connected.error().message);
            LOG_ERROR("Restart the bridge once the robot is reachable");
        } else {
            LOG_WARN("Robot not connected yet ({}), will retry on first client",
                     connected.error().message);
        }
    }

    server::ConnectionServer server(session, cfg.server, cfg.streams, cfg.session);
    if (!server.start()) {
        LOG_ERROR("Failed to start message server");
        return 1;
    }

    LOG_INFO("Press Ctrl+C to exit");

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // Shutdown
    LOG_INFO("Stopping server...");
    server.stop();
    session.disconnect();

    LOG_INFO("NAO Bridge shutdown complete");
    return 0;
}
