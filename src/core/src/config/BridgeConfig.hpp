/**
 * @file BridgeConfig.hpp
 * @brief Bridge configuration data structures
 */

#pragma once

#include <string>
#include <cstdint>

namespace nao_bridge {
namespace config {

/**
 * Which backend variant the robot session is built on
 */
enum class BackendMode : uint8_t {
    SIMULATED = 0,
    LIVE
};

inline std::string toString(BackendMode mode) {
    switch (mode) {
        case BackendMode::SIMULATED: return "simulated";
        case BackendMode::LIVE:      return "live";
        default:                     return "unknown";
    }
}

/**
 * Live backend (remote robot link) configuration
 */
struct BackendConfig {
    BackendMode mode = BackendMode::SIMULATED;
    std::string robot_host;
    int robot_port = 9559;          // RPC port, events on robot_port + 1
    int connect_attempts = 10;
    int connect_timeout_ms = 1000;
    int call_timeout_ms = 60000;
    int link_loss_timeouts = 3;     // consecutive RPC timeouts treated as link loss
    int joints_period_ms = 200;
    std::string audio_client_name = "NaoBridge";
};

/**
 * Simulated backend timings
 */
struct SimulationConfig {
    int connect_delay_ms = 200;
    int posture_duration_ms = 800;
    int behavior_duration_ms = 5000;
    int joints_period_ms = 200;
    int audio_period_ms = 100;
    int touch_period_ms = 0;        // 0 = touch only injected programmatically
};

/**
 * WebSocket message server configuration
 */
struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    int port = 8002;
    int io_threads = 2;
    int worker_threads = 4;
    int max_frame_bytes = 1024 * 1024;
    std::string log_forward_level = "info";   // lowest level pushed to clients, "off" disables
};

/**
 * Stream activation flags
 */
struct StreamsConfig {
    bool touch_enabled = true;
    bool joints_enabled = false;
    bool audio_enabled = false;
};

/**
 * Robot session lifecycle policy
 */
struct SessionConfig {
    bool connect_on_startup = true;
    bool release_when_idle = true;
    bool prepare_robot_on_client = true;
    double posture_speed = 0.8;
    int posture_max_tries = 3;
};

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/nao_bridge.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool console_enabled = true;
    bool file_enabled = true;
};

/**
 * Complete bridge configuration
 */
struct BridgeConfig {
    std::string version = "1.0.0";
    BackendConfig backend;
    SimulationConfig simulation;
    ServerConfig server;
    StreamsConfig streams;
    SessionConfig session;
    LoggingConfig logging;
};

} // namespace config
} // namespace nao_bridge
