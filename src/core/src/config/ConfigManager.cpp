/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace nao_bridge {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadBridgeConfig(const std::string& filepath) {
    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Bridge config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading bridge config from: {}", filepath);
        YAML::Node root = YAML::LoadFile(filepath);
        return applyDocument(root, filepath);

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in bridge config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading bridge config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadBridgeConfigFromString(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        return applyDocument(root, "<memory>");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in bridge config: {}", e.what());
        return false;
    }
}

bool ConfigManager::applyDocument(const YAML::Node& root, const std::string& source) {
    std::lock_guard<std::mutex> lock(m_mutex);

    YAML::Node bridge = root["bridge"];
    if (!bridge) {
        LOG_ERROR("Missing 'bridge' section in {}", source);
        return false;
    }

    BridgeConfig cfg;

    try {
        cfg.version = bridge["version"].as<std::string>("1.0.0");

        // Backend settings
        if (bridge["backend"]) {
            auto backend = bridge["backend"];
            std::string mode = backend["mode"].as<std::string>("simulated");
            if (mode == "live") {
                cfg.backend.mode = BackendMode::LIVE;
            } else if (mode == "simulated" || mode == "fake") {
                cfg.backend.mode = BackendMode::SIMULATED;
            } else {
                LOG_ERROR("Unknown backend mode '{}' (expected live or simulated)", mode);
                return false;
            }
            cfg.backend.robot_host = backend["robot_host"].as<std::string>("");
            cfg.backend.robot_port = backend["robot_port"].as<int>(9559);
            cfg.backend.connect_attempts = backend["connect_attempts"].as<int>(10);
            cfg.backend.connect_timeout_ms = backend["connect_timeout_ms"].as<int>(1000);
            cfg.backend.call_timeout_ms = backend["call_timeout_ms"].as<int>(60000);
            cfg.backend.link_loss_timeouts = backend["link_loss_timeouts"].as<int>(3);
            cfg.backend.joints_period_ms = backend["joints_period_ms"].as<int>(200);
            cfg.backend.audio_client_name = backend["audio_client_name"].as<std::string>("NaoBridge");
        }

        // Simulation settings
        if (bridge["simulation"]) {
            auto sim = bridge["simulation"];
            cfg.simulation.connect_delay_ms = sim["connect_delay_ms"].as<int>(200);
            cfg.simulation.posture_duration_ms = sim["posture_duration_ms"].as<int>(800);
            cfg.simulation.behavior_duration_ms = sim["behavior_duration_ms"].as<int>(5000);
            cfg.simulation.joints_period_ms = sim["joints_period_ms"].as<int>(200);
            cfg.simulation.audio_period_ms = sim["audio_period_ms"].as<int>(100);
            cfg.simulation.touch_period_ms = sim["touch_period_ms"].as<int>(0);
        }

        // Server settings
        if (bridge["server"]) {
            auto server = bridge["server"];
            cfg.server.bind_address = server["bind_address"].as<std::string>("0.0.0.0");
            cfg.server.port = server["port"].as<int>(8002);
            cfg.server.io_threads = server["io_threads"].as<int>(2);
            cfg.server.worker_threads = server["worker_threads"].as<int>(4);
            cfg.server.max_frame_bytes = server["max_frame_bytes"].as<int>(1024 * 1024);
            cfg.server.log_forward_level = server["log_forward_level"].as<std::string>("info");
        }

        // Stream activation
        if (bridge["streams"]) {
            auto streams = bridge["streams"];
            cfg.streams.touch_enabled = streams["touch_enabled"].as<bool>(true);
            cfg.streams.joints_enabled = streams["joints_enabled"].as<bool>(false);
            cfg.streams.audio_enabled = streams["audio_enabled"].as<bool>(false);
        }

        // Session policy
        if (bridge["session"]) {
            auto session = bridge["session"];
            cfg.session.connect_on_startup = session["connect_on_startup"].as<bool>(true);
            cfg.session.release_when_idle = session["release_when_idle"].as<bool>(true);
            cfg.session.prepare_robot_on_client = session["prepare_robot_on_client"].as<bool>(true);
            cfg.session.posture_speed = session["posture_speed"].as<double>(0.8);
            cfg.session.posture_max_tries = session["posture_max_tries"].as<int>(3);
        }

        // Logging settings
        if (bridge["logging"]) {
            auto logging = bridge["logging"];
            cfg.logging.level = logging["level"].as<std::string>("info");
            cfg.logging.file = logging["file"].as<std::string>("logs/nao_bridge.log");
            cfg.logging.max_size_mb = logging["max_size_mb"].as<int>(10);
            cfg.logging.max_files = logging["max_files"].as<int>(5);
            cfg.logging.console_enabled = logging["console_enabled"].as<bool>(true);
            cfg.logging.file_enabled = logging["file_enabled"].as<bool>(true);
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Invalid value in {}: {}", source, e.what());
        return false;
    }

    if (cfg.server.port <= 0 || cfg.server.port > 65535) {
        LOG_ERROR("Invalid server port {}", cfg.server.port);
        return false;
    }
    if (cfg.backend.mode == BackendMode::LIVE &&
        (cfg.backend.robot_port <= 0 || cfg.backend.robot_port >= 65535)) {
        LOG_ERROR("Invalid robot port {}", cfg.backend.robot_port);
        return false;
    }
    if (cfg.server.log_forward_level != "off" &&
        spdlog::level::from_str(cfg.server.log_forward_level) == spdlog::level::off) {
        LOG_ERROR("Invalid log_forward_level '{}'", cfg.server.log_forward_level);
        return false;
    }
    if (cfg.server.io_threads < 1 || cfg.server.worker_threads < 1) {
        LOG_ERROR("Server needs at least one I/O thread and one worker thread");
        return false;
    }

    m_bridge_config = cfg;
    m_loaded = true;

    LOG_INFO("Bridge config loaded: version {}, backend {}", cfg.version, toString(cfg.backend.mode));
    return true;
}

bool ConfigManager::loadAll(const std::string& config_dir) {
    return loadBridgeConfig(config_dir + "/bridge_config.yaml");
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_bridge_config = BridgeConfig{};
    m_loaded = false;
}

std::string ConfigManager::bridgeConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& c = m_bridge_config;

    json j;
    j["version"] = c.version;

    j["backend"] = {
        {"mode", toString(c.backend.mode)},
        {"robot_host", c.backend.robot_host},
        {"robot_port", c.backend.robot_port},
        {"connect_attempts", c.backend.connect_attempts},
        {"connect_timeout_ms", c.backend.connect_timeout_ms},
        {"call_timeout_ms", c.backend.call_timeout_ms}
    };

    j["server"] = {
        {"bind_address", c.server.bind_address},
        {"port", c.server.port},
        {"io_threads", c.server.io_threads},
        {"worker_threads", c.server.worker_threads},
        {"log_forward_level", c.server.log_forward_level}
    };

    j["streams"] = {
        {"touch_enabled", c.streams.touch_enabled},
        {"joints_enabled", c.streams.joints_enabled},
        {"audio_enabled", c.streams.audio_enabled}
    };

    j["session"] = {
        {"connect_on_startup", c.session.connect_on_startup},
        {"release_when_idle", c.session.release_when_idle},
        {"prepare_robot_on_client", c.session.prepare_robot_on_client}
    };

    j["logging"] = {
        {"level", c.logging.level},
        {"file", c.logging.file}
    };

    return j.dump();
}

} // namespace config
} // namespace nao_bridge
