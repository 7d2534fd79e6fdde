/**
 * @file RobotSession.cpp
 * @brief Robot session implementation
 */

#include "RobotSession.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>

namespace nao_bridge {
namespace robot {

/**
 * Clears the posture-in-flight flag on every exit path
 */
class PostureGuard {
public:
    explicit PostureGuard(RobotSession& session) : m_session(session) {}
    ~PostureGuard() {
        std::lock_guard<std::mutex> lock(m_session.m_mutex);
        m_session.m_postureInFlight = false;
        m_session.m_postureLabel.clear();
    }

    PostureGuard(const PostureGuard&) = delete;
    PostureGuard& operator=(const PostureGuard&) = delete;

private:
    RobotSession& m_session;
};

RobotSession::RobotSession(std::unique_ptr<backend::IRobotBackend> backend,
                           const config::SessionConfig& config)
    : m_backend(std::move(backend))
    , m_config(config)
    , m_rng(std::random_device{}())
{
    m_backend->setLinkLostCallback([this](const std::string& reason) {
        handleLinkLost(reason);
    });
    LOG_INFO("RobotSession created on {} ({})", m_backend->getBackendName(),
             m_backend->isSimulation() ? "simulated" : "live");
}

RobotSession::~RobotSession() {
    m_backend->setLinkLostCallback(nullptr);
    disconnect();
}

// ============================================================================
// Connection
// ============================================================================

Outcome<json> RobotSession::connect() {
    std::promise<Outcome<json>> promise;
    std::shared_future<Outcome<json>> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == ConnectionState::CONNECTED) {
            return Outcome<json>::success(m_connectInfo);
        }
        if (m_state == ConnectionState::FAILED && m_lastError && m_lastError->fatal) {
            LOG_WARN("Connect refused: previous fatal error ({})", m_lastError->message);
            return Outcome<json>::failure(*m_lastError);
        }
        if (m_state == ConnectionState::CONNECTING) {
            pending = m_pendingConnect;
        } else {
            m_state = ConnectionState::CONNECTING;
            m_pendingConnect = promise.get_future().share();
        }
    }

    if (pending.valid()) {
        LOG_DEBUG("Connect already in progress, waiting for its outcome");
        return pending.get();
    }

    LOG_INFO("Connecting to robot via {} ({})", m_backend->getBackendName(), m_backend->getEndpoint());

    Outcome<json> outcome = Outcome<json>::failure(ErrorKind::CONNECT_ERROR, "Connect not attempted");
    try {
        outcome = m_backend->connect();
    } catch (const std::exception& e) {
        outcome = Outcome<json>::failure(ErrorKind::CONNECT_ERROR,
                                         std::string("Backend connect threw: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (outcome.ok()) {
            m_state = ConnectionState::CONNECTED;
            m_connectInfo = outcome.value();
            m_lastError.reset();
            LOG_INFO("Robot session connected");
        } else {
            m_state = ConnectionState::FAILED;
            m_lastError = outcome.error();
            if (outcome.error().fatal) {
                LOG_ERROR("Robot connection failed (fatal, restart required): {}",
                          outcome.error().message);
            } else {
                LOG_ERROR("Robot connection failed: {}", outcome.error().message);
            }
        }
        m_pendingConnect = std::shared_future<Outcome<json>>();
    }

    promise.set_value(outcome);
    return outcome;
}

void RobotSession::disconnect() {
    stopBackendStreams();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& active : m_active) {
            active.clear();
        }
    }

    m_backend->disconnect();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == ConnectionState::CONNECTED) {
        LOG_INFO("Robot session disconnected");
    }
    // A fatal failure stays visible so later connects keep refusing
    if (m_state != ConnectionState::FAILED || !m_lastError || !m_lastError->fatal) {
        m_state = ConnectionState::DISCONNECTED;
    }
}

void RobotSession::stopBackendStreams() {
    m_multiplexer.clear();

    std::lock_guard<std::mutex> lock(m_streamMutex);
    syncStreamsWithLink();
    for (int i = 0; i < STREAM_KIND_COUNT; ++i) {
        if (m_backendStreams[i]) {
            m_backend->unsubscribe(static_cast<StreamKind>(i));
            m_backendStreams[i] = false;
        }
    }
}

ConnectionState RobotSession::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::optional<RobotError> RobotSession::lastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

json RobotSession::getStateInfo() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    json info = {
        {"connected", m_state == ConnectionState::CONNECTED},
        {"state", toString(m_state)},
        {"fakeRobot", m_backend->isSimulation()},
        {"backend", m_backend->getBackendName()},
        {"endpoint", m_backend->getEndpoint()}
    };
    if (m_lastError) {
        info["lastError"] = errorToJson(*m_lastError);
    }
    return info;
}

void RobotSession::setLinkLostHandler(LinkLostHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_linkLostHandler = std::move(handler);
}

void RobotSession::handleLinkLost(const std::string& reason) {
    LinkLostHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != ConnectionState::CONNECTED) {
            return;
        }
        m_state = ConnectionState::FAILED;
        RobotError error;
        error.kind = ErrorKind::CONNECT_ERROR;
        error.message = "Robot link lost: " + reason;
        m_lastError = error;
        for (auto& active : m_active) {
            active.clear();
        }
        handler = m_linkLostHandler;
    }

    LOG_ERROR("Robot link lost ({}), session failed", reason);

    // The backend is unreachable: drop the consumers, do not call back into it.
    // This may run inside a backend call made under m_streamMutex.
    m_linkEpoch++;
    m_multiplexer.clear();

    if (handler) {
        handler(reason);
    }
}

// ============================================================================
// Helpers
// ============================================================================

template <typename T>
bool RobotSession::checkConnected(Outcome<T>& out, const char* operation) const {
    if (getState() == ConnectionState::CONNECTED) {
        return true;
    }
    LOG_WARN("{} rejected: robot not connected", operation);
    out = Outcome<T>::failure(ErrorKind::NOT_CONNECTED,
                              std::string("Robot not connected, cannot ") + operation);
    return false;
}

ActionOutcome RobotSession::invokeChecked(ActionKind kind, const json& params) {
    try {
        auto outcome = m_backend->invoke(kind, params);
        if (!outcome.ok()) {
            LOG_WARN("{} failed: {}", toString(kind), outcome.error().message);
        }
        return outcome;
    } catch (const std::exception& e) {
        LOG_ERROR("{} threw: {}", toString(kind), e.what());
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR, e.what());
    }
}

ActionOutcome RobotSession::runPosture(ActionKind kind, const json& params, const char* label) {
    auto out = ActionOutcome::success();
    if (!checkConnected(out, label)) return out;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_postureInFlight) {
            LOG_WARN("{} rejected: {} in progress", label, m_postureLabel);
            return ActionOutcome::failure(ErrorKind::BUSY,
                                          std::string(label) + " rejected, " + m_postureLabel +
                                          " in progress");
        }
        m_postureInFlight = true;
        m_postureLabel = label;
    }

    PostureGuard guard(*this);
    LOG_INFO("Posture: {}", label);
    return invokeChecked(kind, params);
}

// ============================================================================
// Speech, posture, LEDs, awareness
// ============================================================================

ActionOutcome RobotSession::setTtsLanguage(const std::string& language) {
    auto out = ActionOutcome::success();
    if (!checkConnected(out, "set TTS language")) return out;
    return invokeChecked(ActionKind::SET_TTS_LANGUAGE, {{"language", language}});
}

ActionOutcome RobotSession::say(const std::string& text) {
    auto out = ActionOutcome::success();
    if (!checkConnected(out, "say")) return out;
    return invokeChecked(ActionKind::SAY, {{"text", text}});
}

ActionOutcome RobotSession::stopSay() {
    auto out = ActionOutcome::success();
    if (!checkConnected(out, "stop saying")) return out;
    return invokeChecked(ActionKind::STOP_SAY, json::object());
}

ActionOutcome RobotSession::wakeUp() {
    return runPosture(ActionKind::WAKE_UP, json::object(), "wake up");
}

ActionOutcome RobotSession::rest() {
    return runPosture(ActionKind::REST, json::object(), "rest");
}

ActionOutcome RobotSession::standUp() {
    return runPosture(ActionKind::GO_TO_POSTURE, {
        {"posture", "Stand"},
        {"speed", m_config.posture_speed},
        {"maxTries", m_config.posture_max_tries}
    }, "stand up");
}

ActionOutcome RobotSession::sitDown() {
    return runPosture(ActionKind::GO_TO_POSTURE, {
        {"posture", "Sit"},
        {"speed", m_config.posture_speed},
        {"maxTries", m_config.posture_max_tries}
    }, "sit down");
}

ActionOutcome RobotSession::changeEyesColor(const std::string& color) {
    auto out = ActionOutcome::success();
    if (!checkConnected(out, "change eyes color")) return out;
    return invokeChecked(ActionKind::CHANGE_EYES_COLOR, {{"color", color}});
}

ActionOutcome RobotSession::setBasicAwarenessState(bool enabled, const std::string& engagementMode,
                                                   const std::string& trackingMode) {
    auto out = ActionOutcome::success();
    if (!checkConnected(out, "set basic awareness")) return out;
    return invokeChecked(ActionKind::SET_BASIC_AWARENESS, {
        {"enabled", enabled},
        {"engagementMode", engagementMode},
        {"trackingMode", trackingMode}
    });
}

ActionOutcome RobotSession::setBreathingEnabled(bool enabled, const std::string& chainName) {
    auto out = ActionOutcome::success();
    if (!checkConnected(out, "set breathing")) return out;
    return invokeChecked(ActionKind::SET_BREATHING, {
        {"enabled", enabled},
        {"chainName", chainName}
    });
}

// ============================================================================
// Catalogs
// ============================================================================

CatalogOutcome RobotSession::catalog(CatalogKind kind) {
    auto out = CatalogOutcome::success();
    if (!checkConnected(out, "fetch catalog")) return out;

    std::lock_guard<std::mutex> lock(m_catalogMutex);
    auto& cached = m_catalogs[static_cast<size_t>(kind)];
    if (cached) {
        return CatalogOutcome::success(*cached);
    }

    CatalogOutcome fetched = CatalogOutcome::failure(ErrorKind::ACTION_ERROR, "Catalog not fetched");
    try {
        fetched = m_backend->fetchCatalog(kind);
    } catch (const std::exception& e) {
        fetched = CatalogOutcome::failure(ErrorKind::ACTION_ERROR, e.what());
    }
    if (!fetched.ok()) {
        LOG_ERROR("Failed to fetch {} catalog: {}", toString(kind), fetched.error().message);
        return fetched;
    }

    cached = fetched.value();
    LOG_INFO("Cached {} catalog ({} entries)", toString(kind), cached->size());
    return fetched;
}

CatalogOutcome RobotSession::getDanceBehaviors() {
    return catalog(CatalogKind::DANCES);
}

NamesOutcome RobotSession::getExpressiveReactionTypes() {
    auto entries = catalog(CatalogKind::EXPRESSIVE_REACTIONS);
    if (!entries.ok()) {
        return NamesOutcome::failure(entries.error());
    }
    std::vector<std::string> types;
    types.reserve(entries.value().size());
    for (const auto& entry : entries.value()) {
        types.push_back(entry.id);
    }
    return NamesOutcome::success(std::move(types));
}

CatalogOutcome RobotSession::getBodyActionBehaviors() {
    return catalog(CatalogKind::BODY_ACTIONS);
}

// ============================================================================
// Behaviors
// ============================================================================

namespace {

const CatalogEntry* findEntry(const std::vector<CatalogEntry>& entries, const std::string& id) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&id](const CatalogEntry& e) { return e.id == id; });
    return it == entries.end() ? nullptr : &*it;
}

} // namespace

ActionOutcome RobotSession::startTracked(Track track, const std::string& id,
                                         const std::string& behaviorName) {
    auto outcome = invokeChecked(ActionKind::START_BEHAVIOR, {{"name", behaviorName}});
    if (!outcome.ok()) {
        return outcome;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active[static_cast<size_t>(track)][id] = behaviorName;
    }
    return ActionOutcome::success({
        {"id", id},
        {"behavior", behaviorName},
        {"started", true}
    });
}

ActionOutcome RobotSession::stopTracked(Track track, CatalogKind catalogKind, const std::string& id,
                                        const char* what) {
    auto entries = catalog(catalogKind);
    if (!entries.ok()) {
        return ActionOutcome::failure(entries.error());
    }
    if (!findEntry(entries.value(), id)) {
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                      std::string(what) + " '" + id + "' not found");
    }

    std::string behaviorName;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& active = m_active[static_cast<size_t>(track)];
        auto it = active.find(id);
        if (it != active.end()) {
            behaviorName = it->second;
        }
    }

    if (behaviorName.empty()) {
        LOG_DEBUG("{} '{}' not running, nothing to stop", what, id);
        return ActionOutcome::success({{"id", id}, {"stopped", false}});
    }

    auto outcome = invokeChecked(ActionKind::STOP_BEHAVIOR, {{"name", behaviorName}});
    if (!outcome.ok()) {
        return outcome;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active[static_cast<size_t>(track)].erase(id);
    }
    return ActionOutcome::success({{"id", id}, {"behavior", behaviorName}, {"stopped", true}});
}

ActionOutcome RobotSession::dance(const std::string& danceId) {
    auto entries = getDanceBehaviors();
    if (!entries.ok()) return ActionOutcome::failure(entries.error());

    const CatalogEntry* entry = findEntry(entries.value(), danceId);
    if (!entry) {
        LOG_WARN("Dance '{}' not found", danceId);
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR, "Dance '" + danceId + "' not found");
    }
    LOG_INFO("Starting dance '{}'", danceId);
    return startTracked(Track::DANCE, danceId, entry->behaviorName);
}

ActionOutcome RobotSession::stopDance(const std::string& danceId) {
    return stopTracked(Track::DANCE, CatalogKind::DANCES, danceId, "Dance");
}

ActionOutcome RobotSession::expressiveReaction(const std::string& reactionType) {
    auto entries = catalog(CatalogKind::EXPRESSIVE_REACTIONS);
    if (!entries.ok()) return ActionOutcome::failure(entries.error());

    const CatalogEntry* entry = findEntry(entries.value(), reactionType);
    if (!entry) {
        LOG_WARN("Reaction type '{}' not found", reactionType);
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                      "Reaction type '" + reactionType + "' not found");
    }
    if (entry->behaviors.empty()) {
        LOG_WARN("No behaviors installed for reaction type '{}'", reactionType);
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                      "No behaviors for reaction type '" + reactionType + "'");
    }

    std::string behaviorName;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::uniform_int_distribution<size_t> pick(0, entry->behaviors.size() - 1);
        behaviorName = entry->behaviors[pick(m_rng)];
    }
    LOG_INFO("Expressive reaction '{}' -> {}", reactionType, behaviorName);
    return startTracked(Track::REACTION, reactionType, behaviorName);
}

ActionOutcome RobotSession::stopExpressiveReaction(const std::string& reactionType) {
    return stopTracked(Track::REACTION, CatalogKind::EXPRESSIVE_REACTIONS, reactionType,
                       "Reaction type");
}

ActionOutcome RobotSession::bodyAction(const std::string& bodyActionId) {
    auto entries = getBodyActionBehaviors();
    if (!entries.ok()) return ActionOutcome::failure(entries.error());

    const CatalogEntry* entry = findEntry(entries.value(), bodyActionId);
    if (!entry) {
        LOG_WARN("Body action '{}' not found", bodyActionId);
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                      "Body action '" + bodyActionId + "' not found");
    }
    LOG_INFO("Starting body action '{}'", bodyActionId);
    return startTracked(Track::BODY_ACTION, bodyActionId, entry->behaviorName);
}

ActionOutcome RobotSession::stopBodyAction(const std::string& bodyActionId) {
    return stopTracked(Track::BODY_ACTION, CatalogKind::BODY_ACTIONS, bodyActionId, "Body action");
}

ActionOutcome RobotSession::runBehavior(const std::string& name) {
    auto out = ActionOutcome::success();
    if (!checkConnected(out, "run behavior")) return out;
    LOG_INFO("Running behavior '{}'", name);
    return invokeChecked(ActionKind::RUN_BEHAVIOR, {{"name", name}});
}

ActionOutcome RobotSession::stopBehavior(const std::string& name) {
    auto out = ActionOutcome::success();
    if (!checkConnected(out, "stop behavior")) return out;

    auto outcome = invokeChecked(ActionKind::STOP_BEHAVIOR, {{"name", name}});
    if (outcome.ok()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& active : m_active) {
            for (auto it = active.begin(); it != active.end();) {
                it = it->second == name ? active.erase(it) : std::next(it);
            }
        }
    }
    return outcome;
}

// ============================================================================
// Streams
// ============================================================================

StreamOutcome RobotSession::subscribeStream(StreamKind kind, const stream::ConsumerId& consumer,
                                            stream::EventHandler handler) {
    auto out = StreamOutcome::success(true);
    if (!checkConnected(out, "subscribe")) return out;

    std::lock_guard<std::mutex> lock(m_streamMutex);
    syncStreamsWithLink();
    const uint64_t epoch = m_streamEpoch;
    if (!m_backendStreams[indexOf(kind)]) {
        backend::SubscribeOutcome started = backend::SubscribeOutcome::failure(
            ErrorKind::SUBSCRIBE_ERROR, "Stream not started");
        try {
            started = m_backend->subscribe(kind, [this](const StreamEvent& event) {
                m_multiplexer.publish(event);
            });
        } catch (const std::exception& e) {
            started = backend::SubscribeOutcome::failure(ErrorKind::SUBSCRIBE_ERROR, e.what());
        }
        if (!started.ok()) {
            LOG_ERROR("Failed to start {} stream: {}", toString(kind), started.error().message);
            return StreamOutcome::failure(ErrorKind::SUBSCRIBE_ERROR, started.error().message);
        }
        if (m_linkEpoch != epoch) {
            LOG_WARN("Robot link lost while starting {} stream", toString(kind));
            return StreamOutcome::failure(ErrorKind::SUBSCRIBE_ERROR,
                                          "Robot link lost while starting " + toString(kind) + " stream");
        }
        m_backendStreams[indexOf(kind)] = true;
        LOG_INFO("Backend {} stream started", toString(kind));
    }

    m_multiplexer.subscribe(kind, consumer, std::move(handler));

    // A link loss racing with the subscription may have cleared the multiplexer first
    if (m_linkEpoch != epoch) {
        m_multiplexer.unsubscribe(kind, consumer);
        return StreamOutcome::failure(ErrorKind::SUBSCRIBE_ERROR,
                                      "Robot link lost while subscribing to " + toString(kind));
    }
    return StreamOutcome::success(true);
}

void RobotSession::unsubscribeStream(StreamKind kind, const stream::ConsumerId& consumer) {
    std::lock_guard<std::mutex> lock(m_streamMutex);
    syncStreamsWithLink();
    m_multiplexer.unsubscribe(kind, consumer);

    if (m_backendStreams[indexOf(kind)] && m_multiplexer.subscriberCount(kind) == 0) {
        m_backend->unsubscribe(kind);
        m_backendStreams[indexOf(kind)] = false;
        LOG_INFO("Backend {} stream stopped", toString(kind));
    }
}

void RobotSession::unsubscribeAll(const stream::ConsumerId& consumer) {
    std::lock_guard<std::mutex> lock(m_streamMutex);
    syncStreamsWithLink();
    m_multiplexer.unsubscribeAll(consumer);

    for (int i = 0; i < STREAM_KIND_COUNT; ++i) {
        auto kind = static_cast<StreamKind>(i);
        if (m_backendStreams[i] && m_multiplexer.subscriberCount(kind) == 0) {
            m_backend->unsubscribe(kind);
            m_backendStreams[i] = false;
            LOG_INFO("Backend {} stream stopped", toString(kind));
        }
    }
}

void RobotSession::syncStreamsWithLink() {
    // m_streamMutex held
    const uint64_t epoch = m_linkEpoch;
    if (m_streamEpoch != epoch) {
        m_backendStreams.fill(false);
        m_streamEpoch = epoch;
    }
}

// ============================================================================
// Interaction lifecycle
// ============================================================================

ActionOutcome RobotSession::prepareForInteraction() {
    LOG_INFO("Preparing robot for interaction");
    auto eyes = changeEyesColor("cyan");
    if (!eyes.ok()) return eyes;
    auto awake = wakeUp();
    if (!awake.ok()) return awake;
    auto breathing = setBreathingEnabled(true, "Body");
    if (!breathing.ok()) return breathing;
    return ActionOutcome::success({{"prepared", true}});
}

ActionOutcome RobotSession::resetAfterInteraction() {
    LOG_INFO("Resetting robot after interaction");
    // Every step is attempted; the first failure is reported
    std::optional<RobotError> firstError;
    for (auto outcome : {changeEyesColor("white"),
                         setBreathingEnabled(false, "Body"),
                         rest()}) {
        if (!outcome.ok() && !firstError) {
            firstError = outcome.error();
        }
    }
    if (firstError) {
        return ActionOutcome::failure(*firstError);
    }
    return ActionOutcome::success({{"reset", true}});
}

} // namespace robot
} // namespace nao_bridge
