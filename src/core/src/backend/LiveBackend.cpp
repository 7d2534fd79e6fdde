/**
 * @file LiveBackend.cpp
 * @brief ZeroMQ link to the robot-side agent
 *
 * Only the I/O thread touches the sockets. Callers queue a serialized
 * request and wait on a future that the I/O thread fulfils when the reply
 * with the same id arrives.
 */

#include "LiveBackend.hpp"
#include "protocol/LinkMessages.hpp"
#include "../logging/Logger.hpp"
#include <zmq.hpp>
#include <algorithm>
#include <chrono>
#include <deque>
#include <future>
#include <map>

namespace nao_bridge {
namespace backend {

using robot::ActionKind;
using robot::ActionOutcome;
using robot::ErrorKind;
using robot::StreamEvent;
using robot::StreamKind;
using namespace protocol;

// ============================================================================
// LinkHealth
// ============================================================================

std::shared_ptr<LinkHealth> LinkHealth::processWide() {
    static std::shared_ptr<LinkHealth> health = std::make_shared<LinkHealth>();
    return health;
}

bool LinkHealth::isLatched() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_latched;
}

std::string LinkHealth::reason() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reason;
}

void LinkHealth::latch(const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_latched) {
        m_latched = true;
        m_reason = reason;
    }
}

void LinkHealth::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_latched = false;
    m_reason.clear();
}

// ============================================================================
// Impl (pimpl - owns ZeroMQ context, sockets and the I/O thread)
// ============================================================================

struct LiveBackend::Impl {
    zmq::context_t context{1};
    std::unique_ptr<zmq::socket_t> rpcSocket;     // DEALER
    std::unique_ptr<zmq::socket_t> eventSocket;   // SUB

    std::thread ioThread;
    std::atomic<bool> running{false};

    // Requests waiting to be written by the I/O thread
    std::mutex outboundMutex;
    std::deque<std::string> outbound;

    // Requests waiting for a reply
    std::mutex pendingMutex;
    std::map<uint64_t, std::promise<RpcReply>> pending;
    std::atomic<uint64_t> nextId{1};

    static constexpr int POLL_MS = 10;

    void failPending(const std::string& reason) {
        std::lock_guard<std::mutex> lock(pendingMutex);
        for (auto& entry : pending) {
            RpcReply reply;
            reply.id = entry.first;
            reply.ok = false;
            reply.error = reason;
            entry.second.set_value(reply);
        }
        pending.clear();
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

LiveBackend::LiveBackend(const config::BackendConfig& config, std::shared_ptr<LinkHealth> health)
    : m_impl(std::make_unique<Impl>())
    , m_config(config)
    , m_health(std::move(health))
{
    LOG_INFO("LiveBackend created for {}", getEndpoint());
}

LiveBackend::~LiveBackend() {
    disconnect();
}

std::string LiveBackend::getEndpoint() const {
    return m_config.robot_host + ":" + std::to_string(m_config.robot_port);
}

void LiveBackend::setLinkLostCallback(LinkLostCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_linkLostCallback = std::move(cb);
}

// ============================================================================
// Connection
// ============================================================================

ConnectOutcome LiveBackend::connect() {
    if (m_health->isLatched()) {
        LOG_ERROR("LiveBackend: link previously failed fatally ({}), restart required",
                  m_health->reason());
        return ConnectOutcome::failure(ErrorKind::CONNECT_ERROR, m_health->reason(), true);
    }
    if (m_connected) {
        return ConnectOutcome::success({{"backend", getBackendName()}, {"endpoint", getEndpoint()}});
    }
    if (m_config.robot_host.empty()) {
        return ConnectOutcome::failure(ErrorKind::CONNECT_ERROR, "No robot host configured");
    }

    std::string error;
    if (!openLink(error)) {
        const std::string reason = "Transport initialisation failed: " + error;
        m_health->latch(reason);
        LOG_ERROR("LiveBackend: {}", reason);
        return ConnectOutcome::failure(ErrorKind::CONNECT_ERROR, reason, true);
    }

    const int attempts = std::max(1, m_config.connect_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        LOG_INFO("LiveBackend: connecting to {} (attempt {}/{})", getEndpoint(), attempt, attempts);

        auto services = call("ServiceDirectory", "services", json::array(), m_config.connect_timeout_ms);
        if (services.ok()) {
            m_consecutiveTimeouts = 0;
            m_linkLostFired = false;
            m_connected = true;
            const size_t count = services.value().is_array() ? services.value().size() : 0;
            LOG_INFO("LiveBackend: connected to {} ({} services)", getEndpoint(), count);
            return ConnectOutcome::success({
                {"backend", getBackendName()},
                {"endpoint", getEndpoint()},
                {"services", count}
            });
        }

        if (services.error().fatal) {
            const std::string reason = "Robot session initialisation failed: " + services.error().message;
            m_health->latch(reason);
            closeLink();
            LOG_ERROR("LiveBackend: {}", reason);
            return ConnectOutcome::failure(ErrorKind::CONNECT_ERROR, reason, true);
        }

        LOG_WARN("LiveBackend: attempt {} failed: {}", attempt, services.error().message);
    }

    closeLink();
    return ConnectOutcome::failure(ErrorKind::CONNECT_ERROR,
        "Could not reach robot at " + getEndpoint() + " after " +
        std::to_string(attempts) + " attempts");
}

void LiveBackend::disconnect() {
    stopJointsPolling();

    bool audioActive = false;
    {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        audioActive = static_cast<bool>(m_sinks[indexOf(StreamKind::AUDIO)]);
        m_sinks.fill(nullptr);
    }
    if (audioActive && m_connected) {
        auto r = call("ALAudioDevice", "unsubscribe", json::array({m_config.audio_client_name}),
                      m_config.connect_timeout_ms);
        if (!r.ok()) {
            LOG_WARN("LiveBackend: audio unsubscribe failed: {}", r.error().message);
        }
    }

    const bool wasConnected = m_connected.exchange(false);
    closeLink();

    {
        std::lock_guard<std::mutex> lock(m_catalogMutex);
        m_installed.reset();
    }

    if (wasConnected) {
        LOG_INFO("LiveBackend: disconnected from {}", getEndpoint());
    }
}

bool LiveBackend::openLink(std::string& error) {
    closeLink();

    try {
        const std::string rpcAddress = "tcp://" + m_config.robot_host + ":" +
                                       std::to_string(m_config.robot_port);
        const std::string eventAddress = "tcp://" + m_config.robot_host + ":" +
                                         std::to_string(m_config.robot_port + 1);

        m_impl->rpcSocket = std::make_unique<zmq::socket_t>(m_impl->context, zmq::socket_type::dealer);
        m_impl->rpcSocket->set(zmq::sockopt::linger, 0);
        m_impl->rpcSocket->connect(rpcAddress);

        m_impl->eventSocket = std::make_unique<zmq::socket_t>(m_impl->context, zmq::socket_type::sub);
        m_impl->eventSocket->set(zmq::sockopt::linger, 0);
        m_impl->eventSocket->set(zmq::sockopt::subscribe, Topics::TOUCH);
        m_impl->eventSocket->set(zmq::sockopt::subscribe, Topics::AUDIO);
        m_impl->eventSocket->connect(eventAddress);

        LOG_DEBUG("LiveBackend: RPC {} events {}", rpcAddress, eventAddress);
    } catch (const zmq::error_t& e) {
        error = e.what();
        m_impl->rpcSocket.reset();
        m_impl->eventSocket.reset();
        return false;
    }

    m_impl->running = true;
    m_impl->ioThread = std::thread(&LiveBackend::ioLoop, this);
    return true;
}

void LiveBackend::closeLink() {
    m_impl->running = false;
    if (m_impl->ioThread.joinable()) {
        if (m_impl->ioThread.get_id() == std::this_thread::get_id()) {
            m_impl->ioThread.detach();
        } else {
            m_impl->ioThread.join();
        }
    }

    try {
        if (m_impl->rpcSocket) m_impl->rpcSocket->close();
        if (m_impl->eventSocket) m_impl->eventSocket->close();
    } catch (const zmq::error_t& e) {
        LOG_WARN("LiveBackend: error closing sockets: {}", e.what());
    }
    m_impl->rpcSocket.reset();
    m_impl->eventSocket.reset();

    {
        std::lock_guard<std::mutex> lock(m_impl->outboundMutex);
        m_impl->outbound.clear();
    }
    m_impl->failPending("Robot link closed");
}

// ============================================================================
// I/O thread
// ============================================================================

void LiveBackend::ioLoop() {
    LOG_DEBUG("LiveBackend I/O thread started");

    while (m_impl->running) {
        try {
            // Write queued requests
            std::deque<std::string> toSend;
            {
                std::lock_guard<std::mutex> lock(m_impl->outboundMutex);
                toSend.swap(m_impl->outbound);
            }
            for (const auto& data : toSend) {
                zmq::message_t msg(data.data(), data.size());
                m_impl->rpcSocket->send(msg, zmq::send_flags::none);
            }

            zmq::pollitem_t items[] = {
                {m_impl->rpcSocket->handle(), 0, ZMQ_POLLIN, 0},
                {m_impl->eventSocket->handle(), 0, ZMQ_POLLIN, 0}
            };
            zmq::poll(items, 2, std::chrono::milliseconds(Impl::POLL_MS));

            // RPC replies
            if (items[0].revents & ZMQ_POLLIN) {
                zmq::message_t msg;
                while (m_impl->rpcSocket->recv(msg, zmq::recv_flags::dontwait)) {
                    RpcReply reply;
                    try {
                        reply = json::parse(msg.to_string()).get<RpcReply>();
                    } catch (const json::exception& e) {
                        LOG_WARN("LiveBackend: malformed reply dropped: {}", e.what());
                        continue;
                    }

                    std::lock_guard<std::mutex> lock(m_impl->pendingMutex);
                    auto it = m_impl->pending.find(reply.id);
                    if (it == m_impl->pending.end()) {
                        LOG_DEBUG("LiveBackend: late reply {} dropped", reply.id);
                        continue;
                    }
                    it->second.set_value(reply);
                    m_impl->pending.erase(it);
                }
            }

            // Stream events
            if (items[1].revents & ZMQ_POLLIN) {
                zmq::message_t topic;
                while (m_impl->eventSocket->recv(topic, zmq::recv_flags::dontwait)) {
                    zmq::message_t body;
                    if (!topic.more() || !m_impl->eventSocket->recv(body, zmq::recv_flags::none)) {
                        LOG_WARN("LiveBackend: event without body dropped");
                        continue;
                    }
                    // Drain any extra frames of this message
                    while (body.more()) {
                        zmq::message_t extra;
                        if (!m_impl->eventSocket->recv(extra, zmq::recv_flags::none)) break;
                        body.swap(extra);
                    }
                    handleEvent(topic.to_string(), body.data(), body.size());
                }
            }

        } catch (const zmq::error_t& e) {
            if (!m_impl->running) break;
            LOG_ERROR("LiveBackend: ZMQ error in I/O thread: {}", e.what());
            m_impl->running = false;
            m_impl->failPending(std::string("Robot link error: ") + e.what());
            fireLinkLost(std::string("transport error: ") + e.what());
            break;
        }
    }

    LOG_DEBUG("LiveBackend I/O thread stopped");
}

void LiveBackend::handleEvent(const std::string& topic, const void* data, size_t size) {
    StreamEvent event;

    if (topic == Topics::TOUCH) {
        auto message = unpackMessage<TouchMessage>(data, size);
        if (!message) {
            LOG_WARN("LiveBackend: undecodable touch event ({} bytes)", size);
            return;
        }
        if (message->state != 0 && message->state != 1) {
            LOG_WARN("LiveBackend: touch event {} with invalid state {} dropped",
                     message->part, message->state);
            return;
        }
        event.data = robot::TouchEvent{message->part, message->state};
        emit(StreamKind::TOUCH, std::move(event));

    } else if (topic == Topics::AUDIO) {
        auto message = unpackMessage<AudioMessage>(data, size);
        if (!message) {
            LOG_WARN("LiveBackend: undecodable audio frame ({} bytes)", size);
            return;
        }
        robot::AudioFrame frame;
        frame.sampleRate = message->sampleRate;
        frame.channels = message->channels;
        frame.samplesPerChannel = message->samplesPerChannel;
        frame.payload.assign(message->buffer.begin(), message->buffer.end());
        event.data = std::move(frame);
        emit(StreamKind::AUDIO, std::move(event));

    } else {
        LOG_TRACE("LiveBackend: ignoring topic {}", topic);
    }
}

void LiveBackend::emit(StreamKind kind, StreamEvent event) {
    robot::StreamSink sink;
    {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        sink = m_sinks[indexOf(kind)];
    }
    if (!sink) {
        return;
    }
    event.sequence = ++m_sequences[indexOf(kind)];
    event.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    sink(event);
}

// ============================================================================
// RPC
// ============================================================================

robot::Outcome<json> LiveBackend::call(const std::string& service, const std::string& method,
                                       const json& args, int timeout_ms) {
    if (!m_impl->running) {
        return robot::Outcome<json>::failure(ErrorKind::ACTION_ERROR, "Robot link not open");
    }

    RpcRequest request;
    request.id = m_impl->nextId++;
    request.service = service;
    request.method = method;
    request.args = args.is_array() ? args : json::array({args});

    std::future<RpcReply> reply;
    {
        std::lock_guard<std::mutex> lock(m_impl->pendingMutex);
        reply = m_impl->pending[request.id].get_future();
    }
    {
        std::lock_guard<std::mutex> lock(m_impl->outboundMutex);
        m_impl->outbound.push_back(json(request).dump());
    }
    m_callsSent++;
    LOG_TRACE("LiveBackend: -> {}.{} #{}", service, method, request.id);

    const int timeout = timeout_ms > 0 ? timeout_ms : m_config.call_timeout_ms;
    if (reply.wait_for(std::chrono::milliseconds(timeout)) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(m_impl->pendingMutex);
            m_impl->pending.erase(request.id);
        }
        const std::string what = service + "." + method;
        if (m_connected) {
            noteTimeout(what);
        }
        return robot::Outcome<json>::failure(ErrorKind::ACTION_ERROR,
            what + " timed out after " + std::to_string(timeout) + " ms");
    }

    m_consecutiveTimeouts = 0;
    RpcReply result = reply.get();
    if (!result.ok) {
        return robot::Outcome<json>::failure(ErrorKind::ACTION_ERROR,
            service + "." + method + " failed: " + result.error, result.fatal);
    }
    return robot::Outcome<json>::success(result.result);
}

void LiveBackend::noteTimeout(const std::string& what) {
    const int count = ++m_consecutiveTimeouts;
    LOG_WARN("LiveBackend: {} timed out ({} in a row)", what, count);
    if (count >= m_config.link_loss_timeouts) {
        fireLinkLost(std::to_string(count) + " consecutive call timeouts");
    }
}

void LiveBackend::fireLinkLost(const std::string& reason) {
    if (m_linkLostFired.exchange(true)) {
        return;
    }
    m_connected = false;
    LOG_ERROR("LiveBackend: link to {} lost: {}", getEndpoint(), reason);

    LinkLostCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        cb = m_linkLostCallback;
    }
    if (cb) {
        cb(reason);
    }
}

// ============================================================================
// Actions
// ============================================================================

ActionOutcome LiveBackend::invoke(ActionKind kind, const json& params) {
    if (!m_connected) {
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR, "Robot link not connected");
    }

    LOG_DEBUG("LiveBackend: {} {}", robot::toString(kind), params.dump());

    robot::Outcome<json> result = robot::Outcome<json>::success();
    try {
        switch (kind) {
            case ActionKind::SET_TTS_LANGUAGE:
                result = call("ALTextToSpeech", "setLanguage", json::array({params.at("language")}));
                break;

            case ActionKind::SAY:
                result = call("ALAnimatedSpeech", "say", json::array({params.at("text")}));
                break;

            case ActionKind::STOP_SAY:
                result = call("ALTextToSpeech", "stopAll");
                break;

            case ActionKind::WAKE_UP:
                result = call("ALMotion", "wakeUp");
                break;

            case ActionKind::REST:
                result = call("ALMotion", "rest");
                break;

            case ActionKind::GO_TO_POSTURE: {
                const std::string posture = params.at("posture").get<std::string>();
                result = call("ALRobotPosture", "setMaxTryNumber", json::array({params.value("maxTries", 3)}));
                if (!result.ok()) break;
                result = call("ALRobotPosture", "goToPosture", json::array({posture, params.value("speed", 0.8)}));
                if (result.ok() && result.value().is_boolean() && !result.value().get<bool>()) {
                    return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                                  "Posture " + posture + " not reached");
                }
                break;
            }

            case ActionKind::CHANGE_EYES_COLOR:
                result = call("ALLeds", "fadeRGB", json::array({"FaceLeds", params.at("color"), 0}));
                break;

            case ActionKind::SET_BASIC_AWARENESS: {
                result = call("ALBasicAwareness", "setEngagementMode", json::array({params.at("engagementMode")}));
                if (!result.ok()) break;
                result = call("ALBasicAwareness", "setTrackingMode", json::array({params.at("trackingMode")}));
                if (!result.ok()) break;
                const bool enabled = params.at("enabled").get<bool>();
                result = call("ALBasicAwareness", enabled ? "startAwareness" : "stopAwareness");
                break;
            }

            case ActionKind::SET_BREATHING:
                result = call("ALMotion", "setBreathEnabled",
                              json::array({params.at("chainName"), params.at("enabled")}));
                break;

            case ActionKind::START_BEHAVIOR:
                result = call("ALBehaviorManager", "startBehavior", json::array({params.at("name")}));
                break;

            case ActionKind::RUN_BEHAVIOR:
                result = call("ALBehaviorManager", "runBehavior", json::array({params.at("name")}));
                break;

            case ActionKind::STOP_BEHAVIOR:
                result = call("ALBehaviorManager", "stopBehavior", json::array({params.at("name")}));
                break;

            default:
                return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                              "Unsupported action " + robot::toString(kind));
        }
    } catch (const json::exception& e) {
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                      std::string("Bad parameters: ") + e.what());
    }

    if (!result.ok()) {
        return ActionOutcome::failure(result.error());
    }
    return ActionOutcome::success({
        {"action", robot::toString(kind)},
        {"result", result.value()}
    });
}

// ============================================================================
// Catalogs
// ============================================================================

CatalogOutcome LiveBackend::fetchCatalog(robot::CatalogKind kind) {
    if (!m_connected) {
        return CatalogOutcome::failure(ErrorKind::ACTION_ERROR, "Robot link not connected");
    }

    std::lock_guard<std::mutex> lock(m_catalogMutex);
    if (!m_installed) {
        auto packages = call("PackageManager", "packages2");
        if (!packages.ok()) {
            return CatalogOutcome::failure(packages.error());
        }
        m_installed = parseInstalledBehaviors(packages.value());
    }
    return CatalogOutcome::success(buildCatalog(kind, *m_installed));
}

// ============================================================================
// Streams
// ============================================================================

SubscribeOutcome LiveBackend::subscribe(StreamKind kind, robot::StreamSink sink) {
    if (!m_connected) {
        return SubscribeOutcome::failure(ErrorKind::SUBSCRIBE_ERROR, "Robot link not connected");
    }

    switch (kind) {
        case StreamKind::TOUCH:
            // The agent always publishes head touch events
            break;

        case StreamKind::JOINTS: {
            std::lock_guard<std::mutex> lock(m_jointsMutex);
            if (m_jointNames.empty()) {
                auto names = call("ALMotion", "getBodyNames", json::array({"Body"}));
                if (!names.ok()) {
                    return SubscribeOutcome::failure(ErrorKind::SUBSCRIBE_ERROR, names.error().message);
                }
                try {
                    m_jointNames = names.value().get<std::vector<std::string>>();
                } catch (const json::exception& e) {
                    return SubscribeOutcome::failure(ErrorKind::SUBSCRIBE_ERROR,
                                                     std::string("Bad body names: ") + e.what());
                }
            }
            break;
        }

        case StreamKind::AUDIO: {
            auto prefs = call("ALAudioDevice", "setClientPreferences",
                              json::array({m_config.audio_client_name, 16000, 3, 0}));
            if (!prefs.ok()) {
                return SubscribeOutcome::failure(ErrorKind::SUBSCRIBE_ERROR, prefs.error().message);
            }
            auto sub = call("ALAudioDevice", "subscribe", json::array({m_config.audio_client_name}));
            if (!sub.ok()) {
                return SubscribeOutcome::failure(ErrorKind::SUBSCRIBE_ERROR, sub.error().message);
            }
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        m_sinks[indexOf(kind)] = std::move(sink);
    }
    if (kind == StreamKind::JOINTS) {
        startJointsPolling();
    }

    LOG_INFO("LiveBackend: {} stream subscribed", robot::toString(kind));
    return SubscribeOutcome::success(true);
}

void LiveBackend::unsubscribe(StreamKind kind) {
    bool wasActive = false;
    {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        wasActive = static_cast<bool>(m_sinks[indexOf(kind)]);
        m_sinks[indexOf(kind)] = nullptr;
    }

    if (kind == StreamKind::JOINTS) {
        stopJointsPolling();
    }
    if (kind == StreamKind::AUDIO && wasActive && m_connected) {
        auto r = call("ALAudioDevice", "unsubscribe", json::array({m_config.audio_client_name}));
        if (!r.ok()) {
            LOG_WARN("LiveBackend: audio unsubscribe failed: {}", r.error().message);
        }
    }
    if (wasActive) {
        LOG_INFO("LiveBackend: {} stream unsubscribed", robot::toString(kind));
    }
}

void LiveBackend::startJointsPolling() {
    std::lock_guard<std::mutex> lock(m_jointsMutex);
    if (m_jointsRunning) {
        return;
    }
    m_jointsRunning = true;
    m_jointsThread = std::thread(&LiveBackend::jointsLoop, this);
}

void LiveBackend::stopJointsPolling() {
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(m_jointsMutex);
        if (!m_jointsRunning) {
            return;
        }
        m_jointsRunning = false;
        thread = std::move(m_jointsThread);
    }
    m_jointsCv.notify_all();

    if (thread.joinable()) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
}

void LiveBackend::jointsLoop() {
    const auto period = std::chrono::milliseconds(std::max(1, m_config.joints_period_ms));
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(m_jointsMutex);
        names = m_jointNames;
    }

    std::unique_lock<std::mutex> lock(m_jointsMutex);
    while (m_jointsRunning) {
        m_jointsCv.wait_for(lock, period, [this]() { return !m_jointsRunning; });
        if (!m_jointsRunning) break;
        lock.unlock();

        auto angles = call("ALMotion", "getAngles", json::array({"Body", false}));
        if (angles.ok()) {
            robot::JointsFrame frame;
            frame.names = names;
            try {
                frame.angles = angles.value().get<std::vector<float>>();
            } catch (const json::exception& e) {
                LOG_WARN("LiveBackend: bad joint angles: {}", e.what());
            }
            if (frame.isValid() && !frame.angles.empty()) {
                StreamEvent event;
                event.data = std::move(frame);
                emit(StreamKind::JOINTS, std::move(event));
            }
        } else {
            LOG_DEBUG("LiveBackend: joints poll failed: {}", angles.error().message);
        }

        lock.lock();
    }
}

} // namespace backend
} // namespace nao_bridge
