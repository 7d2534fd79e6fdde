/**
 * @file ConnectionServer.hpp
 * @brief WebSocket message server (Boost.Beast) in front of the shared RobotSession
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "../robot/RobotSession.hpp"
#include "../config/BridgeConfig.hpp"

namespace nao_bridge {
namespace server {

/**
 * Connection Server
 *
 * Provides:
 * - WebSocket acceptor on bind_address:port, io_threads I/O threads
 * - One CommandDispatcher per connection around one shared RobotSession
 * - Per-connection worker strand: commands run one at a time, in order,
 *   off the I/O threads
 * - Per-connection write queue: replies and stream events interleave;
 *   joints and audio keep only the newest unsent frame
 * - Log lines at or above log_forward_level pushed to clients as "log" events
 */
class ConnectionServer {
public:
    ConnectionServer(robot::RobotSession& session,
                     const config::ServerConfig& server,
                     const config::StreamsConfig& streams,
                     const config::SessionConfig& sessionConfig);

    /**
     * Destructor - stops server if running
     */
    ~ConnectionServer();

    // Non-copyable
    ConnectionServer(const ConnectionServer&) = delete;
    ConnectionServer& operator=(const ConnectionServer&) = delete;

    /**
     * Bind, listen and start the I/O threads
     * @return true if started successfully
     */
    bool start();

    /**
     * Close every connection and stop the threads.
     * Queued commands finish first. A stopped server is not restarted.
     */
    void stop();

    bool isRunning() const;

    /**
     * Bound port (differs from the configured one when it was 0)
     */
    uint16_t port() const;

    size_t connectionCount() const;

    /**
     * Get server statistics
     */
    struct Stats {
        uint64_t connections_accepted = 0;
        uint64_t connections_closed = 0;
        uint64_t frames_received = 0;
        uint64_t frames_sent = 0;
        uint64_t frames_dropped = 0;   // joints / audio frames replaced by a newer one
        uint64_t frames_queued = 0;    // frames waiting to be written, all connections
    };
    Stats getStats() const;

private:
    // Boost.Asio context, acceptor, threads (implementation in .cpp)
    struct Impl;
    class Connection;

    std::unique_ptr<Impl> m_impl;
};

} // namespace server
} // namespace nao_bridge
