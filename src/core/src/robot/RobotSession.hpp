/**
 * @file RobotSession.hpp
 * @brief Robot session - single façade over one backend and the stream multiplexer
 *
 * The session owns the connection state machine, gates every operation
 * on being connected, caches the behavior catalogs, serializes posture
 * changes and tracks which dances / reactions / body actions it started.
 */

#pragma once

#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <future>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>
#include "RobotTypes.hpp"
#include "RobotError.hpp"
#include "../backend/IRobotBackend.hpp"
#include "../stream/StreamMultiplexer.hpp"
#include "../config/BridgeConfig.hpp"

namespace nao_bridge {
namespace robot {

using json = nlohmann::json;
using CatalogOutcome = Outcome<std::vector<CatalogEntry>>;
using StreamOutcome = Outcome<bool>;
using NamesOutcome = Outcome<std::vector<std::string>>;

class RobotSession {
public:
    using LinkLostHandler = std::function<void(const std::string& reason)>;

    explicit RobotSession(std::unique_ptr<backend::IRobotBackend> backend,
                          const config::SessionConfig& config = config::SessionConfig{});
    ~RobotSession();

    RobotSession(const RobotSession&) = delete;
    RobotSession& operator=(const RobotSession&) = delete;

    // ========================================================================
    // Connection
    // ========================================================================

    /**
     * Connect the backend. Concurrent callers share one attempt.
     * A fatal failure is remembered and returned without a new attempt.
     */
    Outcome<json> connect();

    /**
     * Tear down all stream subscriptions and disconnect the backend
     */
    void disconnect();

    ConnectionState getState() const;
    bool isConnected() const { return getState() == ConnectionState::CONNECTED; }
    std::optional<RobotError> lastError() const;

    /// {connected, state, fakeRobot, backend, endpoint[, lastError]}
    json getStateInfo() const;

    /// Called (from a backend thread) after the session dropped to Failed
    void setLinkLostHandler(LinkLostHandler handler);

    backend::IRobotBackend& backend() { return *m_backend; }
    stream::StreamMultiplexer& multiplexer() { return m_multiplexer; }

    // ========================================================================
    // Speech, posture, LEDs, awareness
    // ========================================================================

    ActionOutcome setTtsLanguage(const std::string& language);
    ActionOutcome say(const std::string& text);
    ActionOutcome stopSay();

    ActionOutcome wakeUp();
    ActionOutcome rest();
    ActionOutcome standUp();
    ActionOutcome sitDown();

    ActionOutcome changeEyesColor(const std::string& color);
    ActionOutcome setBasicAwarenessState(bool enabled, const std::string& engagementMode,
                                         const std::string& trackingMode);
    ActionOutcome setBreathingEnabled(bool enabled, const std::string& chainName);

    // ========================================================================
    // Behaviors
    // ========================================================================

    CatalogOutcome getDanceBehaviors();
    ActionOutcome dance(const std::string& danceId);
    ActionOutcome stopDance(const std::string& danceId);

    /// Reaction type ids (Happy, Proud, ...); the behaviors behind each stay internal
    NamesOutcome getExpressiveReactionTypes();
    ActionOutcome expressiveReaction(const std::string& reactionType);
    ActionOutcome stopExpressiveReaction(const std::string& reactionType);

    CatalogOutcome getBodyActionBehaviors();
    ActionOutcome bodyAction(const std::string& bodyActionId);
    ActionOutcome stopBodyAction(const std::string& bodyActionId);

    /// Run a behavior by name and wait for it to finish
    ActionOutcome runBehavior(const std::string& name);
    ActionOutcome stopBehavior(const std::string& name);

    // ========================================================================
    // Streams
    // ========================================================================

    /**
     * Subscribe a consumer to a stream. The backend stream is started with
     * the first subscriber of a kind.
     */
    StreamOutcome subscribeStream(StreamKind kind, const stream::ConsumerId& consumer,
                                  stream::EventHandler handler);

    /**
     * Unsubscribe a consumer. The backend stream is stopped with the last
     * subscriber of a kind. Allowed in any state.
     */
    void unsubscribeStream(StreamKind kind, const stream::ConsumerId& consumer);
    void unsubscribeAll(const stream::ConsumerId& consumer);

    // ========================================================================
    // Interaction lifecycle
    // ========================================================================

    /// Eyes cyan, wake up, breathe
    ActionOutcome prepareForInteraction();

    /// Eyes white, stop breathing, rest
    ActionOutcome resetAfterInteraction();

private:
    // Behavior kinds started through the catalogs
    enum class Track : uint8_t { DANCE = 0, REACTION, BODY_ACTION };

    template <typename T>
    bool checkConnected(Outcome<T>& out, const char* operation) const;

    ActionOutcome invokeChecked(ActionKind kind, const json& params);
    ActionOutcome runPosture(ActionKind kind, const json& params, const char* label);
    CatalogOutcome catalog(CatalogKind kind);

    ActionOutcome startTracked(Track track, const std::string& id, const std::string& behaviorName);
    ActionOutcome stopTracked(Track track, CatalogKind catalogKind, const std::string& id,
                              const char* what);

    void handleLinkLost(const std::string& reason);
    void stopBackendStreams();
    void syncStreamsWithLink();

    static size_t indexOf(StreamKind kind) { return static_cast<size_t>(kind); }

    std::unique_ptr<backend::IRobotBackend> m_backend;
    config::SessionConfig m_config;
    stream::StreamMultiplexer m_multiplexer;

    // Connection state, posture flag, tracked behaviors
    mutable std::mutex m_mutex;
    ConnectionState m_state = ConnectionState::DISCONNECTED;
    std::optional<RobotError> m_lastError;
    json m_connectInfo;
    std::shared_future<Outcome<json>> m_pendingConnect;
    bool m_postureInFlight = false;
    std::string m_postureLabel;
    std::array<std::map<std::string, std::string>, 3> m_active;   // id -> behavior name
    std::mt19937 m_rng;
    LinkLostHandler m_linkLostHandler;

    // Catalog cache (fetch happens under this mutex)
    std::mutex m_catalogMutex;
    std::array<std::optional<std::vector<CatalogEntry>>, 3> m_catalogs;

    // Backend stream subscription bookkeeping. Backend calls are made under
    // m_streamMutex, so link loss never takes it: it bumps m_linkEpoch and the
    // next stream operation forgets the backend streams of the lost link.
    std::mutex m_streamMutex;
    std::array<bool, STREAM_KIND_COUNT> m_backendStreams{{false, false, false}};
    uint64_t m_streamEpoch = 0;
    std::atomic<uint64_t> m_linkEpoch{0};

    friend class PostureGuard;
};

} // namespace robot
} // namespace nao_bridge
