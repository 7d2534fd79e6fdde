/**
 * @file CommandDispatcher.cpp
 * @brief Command dispatcher implementation
 */

#include "CommandDispatcher.hpp"
#include "../config/ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

namespace nao_bridge {
namespace server {

using robot::ActionOutcome;
using robot::ErrorKind;
using robot::RobotError;
using robot::StreamKind;

namespace {

// Raised by the parameter helpers, turned into an InvalidParameters reply
class InvalidParameter : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const json& findParameter(const json& params, const char* field) {
    auto it = params.find(field);
    if (it == params.end() || it->is_null()) {
        throw InvalidParameter(std::string("Missing parameter '") + field + "'");
    }
    return *it;
}

std::string requireString(const json& params, const char* field) {
    const json& value = findParameter(params, field);
    if (!value.is_string()) {
        throw InvalidParameter(std::string("Parameter '") + field + "' must be a string");
    }
    return value.get<std::string>();
}

bool requireBool(const json& params, const char* field) {
    const json& value = findParameter(params, field);
    if (!value.is_boolean()) {
        throw InvalidParameter(std::string("Parameter '") + field + "' must be a boolean");
    }
    return value.get<bool>();
}

std::string requireOneOf(const json& params, const char* field,
                         const std::vector<std::string>& allowed) {
    std::string value = requireString(params, field);
    if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
        std::string list;
        for (const auto& a : allowed) {
            if (!list.empty()) list += ", ";
            list += a;
        }
        throw InvalidParameter(std::string("Parameter '") + field + "' must be one of: " + list);
    }
    return value;
}

const std::vector<std::string> EYE_COLORS = {
    "white", "red", "green", "blue", "yellow", "magenta", "cyan"
};
const std::vector<std::string> ENGAGEMENT_MODES = {
    "Unengaged", "FullyEngaged", "SemiEngaged"
};
const std::vector<std::string> TRACKING_MODES = {
    "Head", "BodyRotation", "WholeBody", "MoveContextually"
};
const std::vector<std::string> BREATHING_CHAINS = {
    "Body", "Legs", "Arms", "LArm", "RArm", "Head"
};

ActionOutcome fromCatalog(const robot::CatalogOutcome& out) {
    if (!out.ok()) {
        return ActionOutcome::failure(out.error());
    }
    return ActionOutcome::success(json(out.value()));
}

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string serialize(const json& frame) {
    // Strings coming back from the robot are not guaranteed to be valid UTF-8
    return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

CommandDispatcher::CommandDispatcher(robot::RobotSession& session,
                                     const config::StreamsConfig& streams,
                                     FrameSink sink,
                                     std::string consumerId)
    : m_session(session)
    , m_streams(streams)
    , m_sink(std::move(sink))
    , m_consumerId(std::move(consumerId))
    , m_start_time(nowMs())
{
    if (m_consumerId.empty()) {
        m_consumerId = "connection-" + CommandRequest::generateId();
    }
    registerBuiltins();
    LOG_DEBUG("CommandDispatcher created for {}", m_consumerId);
}

CommandDispatcher::~CommandDispatcher() {
    teardown();
}

void CommandDispatcher::registerHandler(const std::string& commandName, CommandHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    m_handlers[commandName] = std::move(handler);
}

bool CommandDispatcher::hasHandler(const std::string& commandName) const {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    return m_handlers.count(commandName) > 0;
}

void CommandDispatcher::registerBuiltins() {
    auto& s = m_session;

    registerHandler("Ping", [this](const json& p) { return handlePing(p); });
    registerHandler("GetState", [this](const json& p) { return handleGetState(p); });
    registerHandler("Connect", [&s](const json&) { return s.connect(); });

    // Speech
    registerHandler("SetTTSLanguage", [&s](const json& p) {
        return s.setTtsLanguage(requireString(p, "language"));
    });
    registerHandler("Say", [&s](const json& p) {
        return s.say(requireString(p, "text"));
    });
    registerHandler("StopSay", [&s](const json&) { return s.stopSay(); });

    // Posture
    registerHandler("WakeUp", [&s](const json&) { return s.wakeUp(); });
    registerHandler("Rest", [&s](const json&) { return s.rest(); });
    registerHandler("StandUp", [&s](const json&) { return s.standUp(); });
    registerHandler("SitDown", [&s](const json&) { return s.sitDown(); });

    // LEDs, awareness, breathing
    registerHandler("ChangeEyesColor", [&s](const json& p) {
        return s.changeEyesColor(requireOneOf(p, "color", EYE_COLORS));
    });
    registerHandler("SetBasicAwarenessState", [&s](const json& p) {
        bool enabled = requireBool(p, "enabled");
        std::string engagement = requireOneOf(p, "engagementMode", ENGAGEMENT_MODES);
        std::string tracking = requireOneOf(p, "trackingMode", TRACKING_MODES);
        return s.setBasicAwarenessState(enabled, engagement, tracking);
    });
    registerHandler("SetBreathingEnabled", [&s](const json& p) {
        bool enabled = requireBool(p, "enabled");
        return s.setBreathingEnabled(enabled, requireOneOf(p, "chainName", BREATHING_CHAINS));
    });

    // Catalog behaviors
    registerHandler("GetDanceBehaviors", [&s](const json&) {
        return fromCatalog(s.getDanceBehaviors());
    });
    registerHandler("Dance", [&s](const json& p) {
        return s.dance(requireString(p, "danceId"));
    });
    registerHandler("StopDance", [&s](const json& p) {
        return s.stopDance(requireString(p, "danceId"));
    });

    registerHandler("GetExpressiveReactionTypes", [&s](const json&) {
        auto types = s.getExpressiveReactionTypes();
        if (!types.ok()) {
            return ActionOutcome::failure(types.error());
        }
        return ActionOutcome::success(json(types.value()));
    });
    registerHandler("ExpressiveReaction", [&s](const json& p) {
        return s.expressiveReaction(requireString(p, "reactionType"));
    });
    registerHandler("StopExpressiveReaction", [&s](const json& p) {
        return s.stopExpressiveReaction(requireString(p, "reactionType"));
    });

    registerHandler("GetBodyActionBehaviors", [&s](const json&) {
        return fromCatalog(s.getBodyActionBehaviors());
    });
    registerHandler("BodyAction", [&s](const json& p) {
        return s.bodyAction(requireString(p, "bodyActionId"));
    });
    registerHandler("StopBodyAction", [&s](const json& p) {
        return s.stopBodyAction(requireString(p, "bodyActionId"));
    });

    // Raw behavior access
    registerHandler("RunBehavior", [&s](const json& p) {
        return s.runBehavior(requireString(p, "name"));
    });
    registerHandler("StopBehavior", [&s](const json& p) {
        return s.stopBehavior(requireString(p, "name"));
    });

    // Streams
    registerStreamCommands(StreamKind::TOUCH, "Touch");
    registerStreamCommands(StreamKind::JOINTS, "Joints");
    registerStreamCommands(StreamKind::AUDIO, "Audio");

    // Free text from older clients, only logged
    registerHandler("GenericNao", [this](const json& p) {
        std::string text = requireString(p, "text");
        LOG_INFO("GenericNao from {}: {}", m_consumerId, text);
        return ActionOutcome::success(json());
    });
}

void CommandDispatcher::registerStreamCommands(StreamKind kind, const std::string& suffix) {
    registerHandler("Subscribe" + suffix, [this, kind](const json&) {
        auto out = subscribe(kind);
        if (!out.ok()) {
            return ActionOutcome::failure(out.error());
        }
        return ActionOutcome::success({{"subscribed", robot::toString(kind)}});
    });
    registerHandler("Unsubscribe" + suffix, [this, kind](const json&) {
        unsubscribe(kind);
        return ActionOutcome::success({{"unsubscribed", robot::toString(kind)}});
    });
}

// ============================================================================
// Dispatch
// ============================================================================

std::string CommandDispatcher::handleFrame(const std::string& raw) {
    m_commands++;

    CommandRequest request;
    std::string parseError;
    if (!CommandRequest::parse(raw, request, parseError)) {
        m_errors++;
        if (request.requestId.empty()) {
            request.requestId = CommandRequest::generateId();
        }
        LOG_WARN("Rejected frame from {}: {}", m_consumerId, parseError);
        return serialize(makeErrorReply(request.requestId,
                                        RobotError{ErrorKind::INVALID_PARAMETERS, parseError, false}));
    }
    if (request.requestId.empty()) {
        request.requestId = CommandRequest::generateId();
    }

    LOG_DEBUG("{} -> {} [{}]", m_consumerId, request.commandName, request.requestId);

    CommandHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        auto it = m_handlers.find(request.commandName);
        if (it != m_handlers.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        m_errors++;
        LOG_WARN("Unknown command from {}: {}", m_consumerId, request.commandName);
        return serialize(makeErrorReply(request.requestId,
            RobotError{ErrorKind::UNKNOWN_COMMAND, "Unknown command: " + request.commandName, false}));
    }

    ActionOutcome outcome = ActionOutcome::failure(ErrorKind::ACTION_ERROR, "Command not executed");
    try {
        outcome = handler(request.parameters);
    } catch (const InvalidParameter& e) {
        outcome = ActionOutcome::failure(ErrorKind::INVALID_PARAMETERS, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Handler error for {}: {}", request.commandName, e.what());
        outcome = ActionOutcome::failure(ErrorKind::ACTION_ERROR, e.what());
    }

    if (!outcome.ok()) {
        m_errors++;
        LOG_DEBUG("{} [{}] failed: {} ({})", request.commandName, request.requestId,
                  robot::toString(outcome.error().kind), outcome.error().message);
        return serialize(makeErrorReply(request.requestId, outcome.error()));
    }
    return serialize(makeReply(request.requestId, outcome.value()));
}

// ============================================================================
// Built-in handlers
// ============================================================================

ActionOutcome CommandDispatcher::handlePing(const json&) {
    auto stats = getStats();
    return ActionOutcome::success({
        {"pong", true},
        {"consumer", m_consumerId},
        {"uptime_ms", nowMs() - stats.start_time},
        {"stats", {
            {"commands_received", stats.commands_received},
            {"errors", stats.errors},
            {"events_sent", stats.events_sent}
        }}
    });
}

ActionOutcome CommandDispatcher::handleGetState(const json&) {
    json state = m_session.getStateInfo();

    json subscriptions = json::array();
    for (auto kind : activeStreams()) {
        subscriptions.push_back(robot::toString(kind));
    }
    state["subscriptions"] = subscriptions;

    auto mux = m_session.multiplexer().getStats();
    state["streams"] = {
        {"published", mux.published},
        {"delivered", mux.delivered},
        {"dropped", mux.dropped}
    };

    try {
        state["config"] = json::parse(config::ConfigManager::instance().bridgeConfigToJson());
    } catch (const json::exception& e) {
        LOG_WARN("Config dump unavailable: {}", e.what());
    }
    return ActionOutcome::success(state);
}

// ============================================================================
// Streams
// ============================================================================

bool CommandDispatcher::isEnabled(StreamKind kind) const {
    switch (kind) {
        case StreamKind::TOUCH:  return m_streams.touch_enabled;
        case StreamKind::JOINTS: return m_streams.joints_enabled;
        case StreamKind::AUDIO:  return m_streams.audio_enabled;
        default:                 return false;
    }
}

robot::StreamOutcome CommandDispatcher::subscribe(StreamKind kind) {
    if (!isEnabled(kind)) {
        return robot::StreamOutcome::failure(ErrorKind::SUBSCRIBE_ERROR,
            robot::toString(kind) + " stream is disabled by configuration");
    }

    auto out = m_session.subscribeStream(kind, m_consumerId,
        [this](const robot::StreamEvent& event) { forwardEvent(event); });
    if (out.ok()) {
        std::lock_guard<std::mutex> lock(m_subscriptions_mutex);
        m_subscribed[static_cast<size_t>(kind)] = true;
        LOG_DEBUG("{} subscribed to {}", m_consumerId, robot::toString(kind));
    }
    return out;
}

void CommandDispatcher::unsubscribe(StreamKind kind) {
    m_session.unsubscribeStream(kind, m_consumerId);
    std::lock_guard<std::mutex> lock(m_subscriptions_mutex);
    m_subscribed[static_cast<size_t>(kind)] = false;
}

void CommandDispatcher::teardown() {
    {
        std::lock_guard<std::mutex> lock(m_subscriptions_mutex);
        bool any = false;
        for (bool s : m_subscribed) any = any || s;
        if (!any) return;
        for (bool& s : m_subscribed) s = false;
    }
    m_session.unsubscribeAll(m_consumerId);
    LOG_DEBUG("{} subscriptions torn down", m_consumerId);
}

std::vector<StreamKind> CommandDispatcher::activeStreams() const {
    std::lock_guard<std::mutex> lock(m_subscriptions_mutex);
    std::vector<StreamKind> kinds;
    for (int i = 0; i < robot::STREAM_KIND_COUNT; ++i) {
        if (m_subscribed[i]) kinds.push_back(static_cast<StreamKind>(i));
    }
    return kinds;
}

void CommandDispatcher::forwardEvent(const robot::StreamEvent& event) {
    try {
        m_sink(serialize(makeEvent(robot::toString(event.kind()), eventPayload(event))),
               frameClassOf(event.kind()));
        m_events++;
    } catch (const std::exception& e) {
        LOG_WARN("Dropping {} event for {}: {}", robot::toString(event.kind()), m_consumerId, e.what());
    }
}

std::string CommandDispatcher::stateEvent() const {
    return serialize(makeEvent("state", m_session.getStateInfo()));
}

CommandDispatcher::Stats CommandDispatcher::getStats() const {
    Stats stats;
    stats.commands_received = m_commands;
    stats.errors = m_errors;
    stats.events_sent = m_events;
    stats.start_time = m_start_time;
    return stats;
}

// ============================================================================
// Event payloads
// ============================================================================

json CommandDispatcher::eventPayload(const robot::StreamEvent& event) {
    json payload;
    if (auto touch = std::get_if<robot::TouchEvent>(&event.data)) {
        payload = {
            {"part", touch->part},
            {"touched", touch->state == 1},
            {"state", touch->state}
        };
    } else if (auto joints = std::get_if<robot::JointsFrame>(&event.data)) {
        payload = {
            {"jointsNames", joints->names},
            {"jointsAngles", joints->angles}
        };
    } else if (auto audio = std::get_if<robot::AudioFrame>(&event.data)) {
        payload = {
            {"rate", audio->sampleRate},
            {"channels", audio->channels},
            {"nbSamplesPerChannel", audio->samplesPerChannel},
            {"data", encodeBase64(audio->payload)}
        };
    }
    payload["sequence"] = event.sequence;
    payload["timestamp"] = event.timestamp;
    return payload;
}

std::string CommandDispatcher::encodeBase64(const std::vector<uint8_t>& data) {
    using namespace boost::archive::iterators;
    using Base64It = base64_from_binary<transform_width<std::vector<uint8_t>::const_iterator, 6, 8>>;

    std::string encoded(Base64It(data.begin()), Base64It(data.end()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

} // namespace server
} // namespace nao_bridge
