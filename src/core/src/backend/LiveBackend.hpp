/**
 * @file LiveBackend.hpp
 * @brief Robot backend talking to the robot-side agent over ZeroMQ
 *
 * - RPC port (DEALER -> agent ROUTER): JSON {id, service, method, args}
 * - Event port = RPC port + 1 (SUB <- agent PUB): [topic, msgpack body]
 * - Joints are polled over RPC, touch and audio arrive on the event port
 */

#pragma once

#include "IRobotBackend.hpp"
#include "BehaviorCatalog.hpp"
#include "../config/BridgeConfig.hpp"
#include <array>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace nao_bridge {
namespace backend {

/**
 * Link health shared by every LiveBackend of the process.
 *
 * Once a transport initialisation fails fatally the flag stays latched:
 * the robot-side session cannot be re-created without restarting the process.
 */
class LinkHealth {
public:
    static std::shared_ptr<LinkHealth> processWide();

    bool isLatched() const;
    std::string reason() const;
    void latch(const std::string& reason);

    /// Clear the latch (tests only)
    void reset();

private:
    mutable std::mutex m_mutex;
    bool m_latched = false;
    std::string m_reason;
};

class LiveBackend : public IRobotBackend {
public:
    explicit LiveBackend(const config::BackendConfig& config,
                         std::shared_ptr<LinkHealth> health = LinkHealth::processWide());
    ~LiveBackend() override;

    LiveBackend(const LiveBackend&) = delete;
    LiveBackend& operator=(const LiveBackend&) = delete;

    // ========================================================================
    // IRobotBackend
    // ========================================================================

    ConnectOutcome connect() override;
    void disconnect() override;
    bool isConnected() const override { return m_connected; }

    robot::ActionOutcome invoke(robot::ActionKind kind, const json& params) override;
    CatalogOutcome fetchCatalog(robot::CatalogKind kind) override;

    SubscribeOutcome subscribe(robot::StreamKind kind, robot::StreamSink sink) override;
    void unsubscribe(robot::StreamKind kind) override;

    void setLinkLostCallback(LinkLostCallback cb) override;

    std::string getBackendName() const override { return "LiveBackend"; }
    bool isSimulation() const override { return false; }
    std::string getEndpoint() const override;

    // ========================================================================
    // Link
    // ========================================================================

    /**
     * One remote call through the RPC channel
     * @param timeout_ms 0 uses the configured call timeout
     */
    robot::Outcome<json> call(const std::string& service, const std::string& method,
                              const json& args = json::array(), int timeout_ms = 0);

    uint64_t callsSent() const { return m_callsSent; }

private:
    // ZeroMQ sockets and I/O thread (implementation in .cpp)
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    bool openLink(std::string& error);
    void closeLink();
    void ioLoop();
    void handleEvent(const std::string& topic, const void* data, size_t size);
    void noteTimeout(const std::string& what);
    void fireLinkLost(const std::string& reason);

    void emit(robot::StreamKind kind, robot::StreamEvent event);
    void startJointsPolling();
    void stopJointsPolling();
    void jointsLoop();

    static size_t indexOf(robot::StreamKind kind) { return static_cast<size_t>(kind); }

    config::BackendConfig m_config;
    std::shared_ptr<LinkHealth> m_health;

    std::atomic<bool> m_connected{false};
    std::atomic<int> m_consecutiveTimeouts{0};
    std::atomic<bool> m_linkLostFired{false};
    std::atomic<uint64_t> m_callsSent{0};

    // Stream sinks
    std::mutex m_sinkMutex;
    std::array<robot::StreamSink, robot::STREAM_KIND_COUNT> m_sinks;
    std::array<std::atomic<uint64_t>, robot::STREAM_KIND_COUNT> m_sequences{};

    // Joints polling
    std::mutex m_jointsMutex;
    std::condition_variable m_jointsCv;
    std::thread m_jointsThread;
    bool m_jointsRunning = false;
    std::vector<std::string> m_jointNames;

    // packages2, parsed once per connection
    std::mutex m_catalogMutex;
    std::optional<std::vector<InstalledBehavior>> m_installed;

    LinkLostCallback m_linkLostCallback;
    std::mutex m_callbackMutex;
};

} // namespace backend
} // namespace nao_bridge
