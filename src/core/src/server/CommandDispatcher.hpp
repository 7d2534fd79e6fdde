/**
 * @file CommandDispatcher.hpp
 * @brief Per-connection command dispatch: request frame -> RobotSession -> reply frame
 */

#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <functional>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "Envelope.hpp"
#include "../robot/RobotSession.hpp"
#include "../config/BridgeConfig.hpp"

namespace nao_bridge {
namespace server {

using json = nlohmann::json;

/**
 * Handler function type for one command.
 * Takes the request parameters and returns the result payload or an error.
 */
using CommandHandler = std::function<robot::ActionOutcome(const json& parameters)>;

/**
 * Delivery class of an outbound frame.
 * ORDERED frames (replies, state, touch, log) are written in order and never
 * dropped. A LATEST_* frame still waiting to be written is replaced by the
 * next frame of the same class.
 */
enum class FrameClass : uint8_t {
    ORDERED = 0,
    LATEST_JOINTS,
    LATEST_AUDIO
};

/// Class of the frames carrying a stream kind
inline FrameClass frameClassOf(robot::StreamKind kind) {
    switch (kind) {
        case robot::StreamKind::JOINTS: return FrameClass::LATEST_JOINTS;
        case robot::StreamKind::AUDIO:  return FrameClass::LATEST_AUDIO;
        default:                        return FrameClass::ORDERED;
    }
}

/**
 * Outbound frame path of the owning connection (thread-safe, non-blocking)
 */
using FrameSink = std::function<void(const std::string& frame, FrameClass frameClass)>;

/**
 * Command Dispatcher
 *
 * One instance per network connection. Parses and validates request
 * frames, calls the shared RobotSession and serializes the reply.
 * The only state kept across commands is the connection's stream
 * subscriptions, which are torn down by teardown().
 */
class CommandDispatcher {
public:
    /**
     * @param session Shared robot session
     * @param streams Which streams may be subscribed
     * @param sink Receives unsolicited event frames
     * @param consumerId Multiplexer consumer id (generated when empty)
     */
    CommandDispatcher(robot::RobotSession& session,
                      const config::StreamsConfig& streams,
                      FrameSink sink,
                      std::string consumerId = "");

    /**
     * Destructor - tears down the connection's subscriptions
     */
    ~CommandDispatcher();

    // Non-copyable
    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    /**
     * Process one request frame
     * @param raw Raw JSON text
     * @return Serialized reply frame (always exactly one)
     */
    std::string handleFrame(const std::string& raw);

    /**
     * Register (or replace) the handler of a command
     */
    void registerHandler(const std::string& commandName, CommandHandler handler);

    bool hasHandler(const std::string& commandName) const;

    /**
     * Subscribe this connection to a stream; events go to the frame sink
     */
    robot::StreamOutcome subscribe(robot::StreamKind kind);

    /**
     * Unsubscribe this connection from a stream (no-op if not subscribed)
     */
    void unsubscribe(robot::StreamKind kind);

    /**
     * Unsolicited "state" event frame
     */
    std::string stateEvent() const;

    /**
     * Drop every subscription of this connection. Idempotent.
     */
    void teardown();

    const std::string& consumerId() const { return m_consumerId; }
    std::vector<robot::StreamKind> activeStreams() const;

    /**
     * Get dispatcher statistics
     */
    struct Stats {
        uint64_t commands_received = 0;
        uint64_t errors = 0;
        uint64_t events_sent = 0;
        int64_t start_time = 0;
    };
    Stats getStats() const;

    /**
     * Wire payload of a stream event
     *   touch:  {part, touched, state, sequence, timestamp}
     *   joints: {jointsNames, jointsAngles, sequence, timestamp}
     *   audio:  {rate, channels, nbSamplesPerChannel, data (base64), sequence, timestamp}
     */
    static json eventPayload(const robot::StreamEvent& event);

    static std::string encodeBase64(const std::vector<uint8_t>& data);

private:
    void registerBuiltins();
    void registerStreamCommands(robot::StreamKind kind, const std::string& suffix);

    void forwardEvent(const robot::StreamEvent& event);
    bool isEnabled(robot::StreamKind kind) const;

    robot::ActionOutcome handlePing(const json& parameters);
    robot::ActionOutcome handleGetState(const json& parameters);

    robot::RobotSession& m_session;
    config::StreamsConfig m_streams;
    FrameSink m_sink;
    std::string m_consumerId;

    // Command handlers
    std::unordered_map<std::string, CommandHandler> m_handlers;
    mutable std::mutex m_handlers_mutex;

    // Active subscriptions of this connection
    mutable std::mutex m_subscriptions_mutex;
    bool m_subscribed[robot::STREAM_KIND_COUNT] = {false, false, false};

    // Statistics
    std::atomic<uint64_t> m_commands{0};
    std::atomic<uint64_t> m_errors{0};
    std::atomic<uint64_t> m_events{0};
    int64_t m_start_time = 0;
};

} // namespace server
} // namespace nao_bridge
