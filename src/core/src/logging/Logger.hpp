/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/dist_sink.h>
#include <memory>
#include <string>

namespace nao_bridge {

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file (empty disables the file sink)
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     * @param console Enable colored console output
     */
    static void init(const std::string& log_file = "logs/nao_bridge.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5,
                     bool console = true);

    /**
     * Drop the current logger so the next init() builds a new one
     * (used after the configuration has been loaded)
     */
    static void reset();

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Attach an extra sink at runtime (thread-safe, survives reset/init)
     */
    static void addSink(const spdlog::sink_ptr& sink);
    static void removeSink(const spdlog::sink_ptr& sink);

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static std::shared_ptr<spdlog::sinks::dist_sink_mt> s_runtimeSinks;
    static bool s_initialized;
};

} // namespace nao_bridge

// Convenience macros
#define LOG_TRACE(...) ::nao_bridge::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::nao_bridge::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::nao_bridge::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::nao_bridge::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::nao_bridge::Logger::get()->error(__VA_ARGS__)
