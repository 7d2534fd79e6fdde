/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include <string>
#include <mutex>
#include "BridgeConfig.hpp"

namespace YAML {
class Node;
}

namespace nao_bridge {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Loads bridge_config.yaml. Missing keys keep their defaults.
 * Thread-safe for reading after initialization.
 */
class ConfigManager {
public:
    /**
     * Get singleton instance
     */
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load bridge configuration from YAML file
     * @param filepath Path to bridge_config.yaml
     * @return true if loaded successfully
     */
    bool loadBridgeConfig(const std::string& filepath);

    /**
     * Load bridge configuration from a YAML document held in memory
     */
    bool loadBridgeConfigFromString(const std::string& yaml);

    /**
     * Load all configuration files from a directory
     * @param config_dir Path to config directory
     * @return true if all configs loaded successfully
     */
    bool loadAll(const std::string& config_dir = "config");

    /**
     * Get bridge configuration (const reference)
     */
    const BridgeConfig& bridgeConfig() const { return m_bridge_config; }

    /**
     * Mutable access for command-line overrides applied after loading
     */
    BridgeConfig& mutableBridgeConfig() { return m_bridge_config; }

    /**
     * Restore defaults (tests)
     */
    void reset();

    bool isLoaded() const { return m_loaded; }

    /**
     * Get configuration as JSON (for diagnostics over the message server)
     */
    std::string bridgeConfigToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    bool applyDocument(const YAML::Node& root, const std::string& source);

    BridgeConfig m_bridge_config;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace nao_bridge
