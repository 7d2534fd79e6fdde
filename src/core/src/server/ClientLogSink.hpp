/**
 * @file ClientLogSink.hpp
 * @brief spdlog sink pushing log lines to WebSocket clients as "log" events
 */

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <spdlog/sinks/base_sink.h>

namespace nao_bridge {
namespace server {

/**
 * Client Log Sink
 *
 * Each record becomes {"stream-kind": "log", "event-payload": {log, logLevel}}
 * and is handed to the broadcast function. The broadcast function runs
 * inside the logger and must not log itself.
 */
class ClientLogSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    using Broadcast = std::function<void(const std::string& frame)>;

    explicit ClientLogSink(Broadcast broadcast);

    /// Level names as clients expect them: DEBUG, INFO, WARNING, ERROR, CRITICAL
    static std::string levelName(spdlog::level::level_enum level);

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    Broadcast m_broadcast;
};

} // namespace server
} // namespace nao_bridge
