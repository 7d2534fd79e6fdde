/**
 * @file ClientLogSink.cpp
 * @brief Log forwarding sink
 */

#include "ClientLogSink.hpp"
#include "Envelope.hpp"

namespace nao_bridge {
namespace server {

ClientLogSink::ClientLogSink(Broadcast broadcast)
    : m_broadcast(std::move(broadcast))
{
}

std::string ClientLogSink::levelName(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:
        case spdlog::level::debug:    return "DEBUG";
        case spdlog::level::info:     return "INFO";
        case spdlog::level::warn:     return "WARNING";
        case spdlog::level::err:      return "ERROR";
        case spdlog::level::critical: return "CRITICAL";
        default:                      return "NOTSET";
    }
}

void ClientLogSink::sink_it_(const spdlog::details::log_msg& msg) {
    if (!m_broadcast) return;

    json payload = {
        {"log", std::string(msg.payload.data(), msg.payload.size())},
        {"logLevel", levelName(msg.level)}
    };
    m_broadcast(makeEvent("log", payload).dump(-1, ' ', false, json::error_handler_t::replace));
}

} // namespace server
} // namespace nao_bridge
