/**
 * @file SimulatedBackend.hpp
 * @brief Robot backend that never touches hardware
 *
 * Keeps a simulated robot state (language, eyes, posture, breathing,
 * awareness, running behaviors), serves fixed catalogs and produces
 * synthetic joints / audio / touch streams.
 */

#pragma once

#include "IRobotBackend.hpp"
#include "../config/BridgeConfig.hpp"
#include <array>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>

namespace nao_bridge {
namespace backend {

class SimulatedBackend : public IRobotBackend {
public:
    explicit SimulatedBackend(const config::SimulationConfig& config = config::SimulationConfig{});
    ~SimulatedBackend() override;

    SimulatedBackend(const SimulatedBackend&) = delete;
    SimulatedBackend& operator=(const SimulatedBackend&) = delete;

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

    std::string getBackendName() const override { return "SimulatedBackend"; }
    bool isSimulation() const override { return true; }
    std::string getEndpoint() const override { return "simulated"; }

    // ========================================================================
    // Simulation controls
    // ========================================================================

    /// Emit a touch event on the touch stream (no-op if nobody subscribed)
    void injectTouch(const std::string& part, bool touched);

    /// Pretend the link dropped: fires the link-lost callback
    void simulateLinkLoss(const std::string& reason);

    /// Make the next invoke of this kind fail with ActionError
    void failNextAction(robot::ActionKind kind, const std::string& reason);

    /// Make connect fail until cleared (fatal or retryable)
    void setConnectFailure(bool enabled, bool fatal = false);

    /// Make subscribing to this stream kind fail with SubscribeError
    void setStreamAvailable(robot::StreamKind kind, bool available);

    json getSimulatedState() const;
    bool isBehaviorRunning(const std::string& name) const;

    int connectCalls() const { return m_connectCalls; }
    int catalogFetches() const { return m_catalogFetches; }

    /// Joint names reported by the simulated body
    static const std::vector<std::string>& jointNames();

private:
    // One producer thread per stream kind
    struct StreamWorker {
        std::thread thread;
        bool running = false;
        robot::StreamSink sink;
    };

    void startWorker(robot::StreamKind kind);
    void stopWorker(robot::StreamKind kind);
    void jointsLoop();
    void audioLoop();
    void touchLoop();

    void emit(robot::StreamKind kind, robot::StreamEvent event);

    /// Sleep for duration_ms unless disconnected; returns false if interrupted
    bool simulateDuration(int duration_ms);

    robot::ActionOutcome applyAction(robot::ActionKind kind, const json& params);
    robot::ActionOutcome startBehavior(const std::string& name);
    robot::ActionOutcome runBehavior(const std::string& name);
    robot::ActionOutcome stopBehavior(const std::string& name);
    void pruneFinishedBehaviors();

    static int64_t nowMs();

    config::SimulationConfig m_config;
    std::atomic<bool> m_connected{false};

    // Simulated robot state
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::string m_language = "English";
    std::string m_eyesColor = "white";
    std::string m_posture = "Crouch";
    bool m_awake = false;
    bool m_speaking = false;
    bool m_awarenessEnabled = false;
    std::string m_engagementMode = "Unengaged";
    std::string m_trackingMode = "Head";
    std::set<std::string> m_breathingChains;
    std::map<std::string, std::chrono::steady_clock::time_point> m_runningBehaviors;
    std::map<robot::ActionKind, std::string> m_pendingFailures;
    bool m_failConnect = false;
    bool m_failConnectFatal = false;

    // Streams
    std::mutex m_streamMutex;
    std::condition_variable m_streamCv;
    std::array<StreamWorker, robot::STREAM_KIND_COUNT> m_workers;
    std::array<bool, robot::STREAM_KIND_COUNT> m_streamAvailable{{true, true, true}};
    std::array<std::atomic<uint64_t>, robot::STREAM_KIND_COUNT> m_sequences{};
    // Held from sequence assignment through delivery so sinks see sequences in order
    std::array<std::mutex, robot::STREAM_KIND_COUNT> m_emitMutexes;

    LinkLostCallback m_linkLostCallback;
    std::mutex m_callbackMutex;

    std::atomic<int> m_connectCalls{0};
    std::atomic<int> m_catalogFetches{0};

    static constexpr int AUDIO_SAMPLE_RATE = 16000;
    static constexpr double AUDIO_TONE_HZ = 440.0;
    static constexpr double JOINT_SWING_HZ = 0.25;
};

} // namespace backend
} // namespace nao_bridge
