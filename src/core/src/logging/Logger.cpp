/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include <vector>
#include <mutex>
#include <filesystem>
#include <iostream>

namespace nao_bridge {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
std::shared_ptr<spdlog::sinks::dist_sink_mt> Logger::s_runtimeSinks =
    std::make_shared<spdlog::sinks::dist_sink_mt>();
bool Logger::s_initialized = false;

namespace {
std::mutex g_loggerMutex;

spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info")  return spdlog::level::info;
    if (level == "warn")  return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}
} // namespace

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files,
                  bool console) {
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }

        if (!log_file.empty()) {
            std::filesystem::path log_path(log_file);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_size, max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger file sink failed, console only: " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Logger directory creation failed, console only: " << ex.what() << std::endl;
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    sinks.push_back(s_runtimeSinks);

    s_logger = std::make_shared<spdlog::logger>("nao_bridge", sinks.begin(), sinks.end());
    s_logger->set_level(parseLevel(level));

    // Flush on warn or above
    s_logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(s_logger);
    s_initialized = true;
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    if (s_logger) {
        s_logger->flush();
    }
    s_initialized = false;
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(g_loggerMutex);
        if (s_initialized) {
            return s_logger;
        }
    }
    init(); // Initialize with defaults
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    return s_logger;
}

void Logger::addSink(const spdlog::sink_ptr& sink) {
    s_runtimeSinks->add_sink(sink);
}

void Logger::removeSink(const spdlog::sink_ptr& sink) {
    s_runtimeSinks->remove_sink(sink);
}

} // namespace nao_bridge
