/**
 * @file SimulatedBackend.cpp
 * @brief Simulated robot: deterministic timings, synthetic streams
 */

#include "SimulatedBackend.hpp"
#include "BehaviorCatalog.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace nao_bridge {
namespace backend {

using robot::ActionKind;
using robot::ActionOutcome;
using robot::ErrorKind;
using robot::StreamKind;
using robot::StreamEvent;

namespace {

constexpr double TWO_PI = 6.283185307179586;

size_t indexOf(StreamKind kind) {
    return static_cast<size_t>(kind);
}

const char* const TOUCH_PARTS[] = {
    "FrontTactilTouched", "MiddleTactilTouched", "RearTactilTouched"
};

} // namespace

const std::vector<std::string>& SimulatedBackend::jointNames() {
    static const std::vector<std::string> names = {
        "HeadYaw", "HeadPitch",
        "LShoulderPitch", "LShoulderRoll", "LElbowYaw", "LElbowRoll", "LWristYaw", "LHand",
        "LHipYawPitch", "LHipRoll", "LHipPitch", "LKneePitch", "LAnklePitch", "LAnkleRoll",
        "RHipYawPitch", "RHipRoll", "RHipPitch", "RKneePitch", "RAnklePitch", "RAnkleRoll",
        "RShoulderPitch", "RShoulderRoll", "RElbowYaw", "RElbowRoll", "RWristYaw", "RHand"
    };
    return names;
}

SimulatedBackend::SimulatedBackend(const config::SimulationConfig& config)
    : m_config(config) {
    LOG_INFO("SimulatedBackend created (connect delay {} ms, posture {} ms, behavior {} ms)",
             m_config.connect_delay_ms, m_config.posture_duration_ms,
             m_config.behavior_duration_ms);
}

SimulatedBackend::~SimulatedBackend() {
    disconnect();
}

// ============================================================================
// Connection
// ============================================================================

ConnectOutcome SimulatedBackend::connect() {
    m_connectCalls++;

    if (m_config.connect_delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(m_config.connect_delay_ms));
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_failConnect) {
            LOG_WARN("SimulatedBackend: connect failure requested (fatal={})", m_failConnectFatal);
            return ConnectOutcome::failure(ErrorKind::CONNECT_ERROR,
                                           "Simulated robot refused the connection",
                                           m_failConnectFatal);
        }
    }

    m_connected = true;
    LOG_INFO("SimulatedBackend: connected");
    return ConnectOutcome::success({
        {"backend", getBackendName()},
        {"endpoint", getEndpoint()}
    });
}

void SimulatedBackend::disconnect() {
    for (int i = 0; i < robot::STREAM_KIND_COUNT; ++i) {
        stopWorker(static_cast<StreamKind>(i));
    }

    bool wasConnected = m_connected.exchange(false);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_runningBehaviors.clear();
        m_speaking = false;
    }
    m_cv.notify_all();

    if (wasConnected) {
        LOG_INFO("SimulatedBackend: disconnected");
    }
}

void SimulatedBackend::setLinkLostCallback(LinkLostCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_linkLostCallback = std::move(cb);
}

void SimulatedBackend::simulateLinkLoss(const std::string& reason) {
    if (!m_connected.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_speaking = false;
    }
    m_cv.notify_all();
    LOG_WARN("SimulatedBackend: link lost ({})", reason);

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
// Test controls
// ============================================================================

void SimulatedBackend::failNextAction(ActionKind kind, const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pendingFailures[kind] = reason;
}

void SimulatedBackend::setConnectFailure(bool enabled, bool fatal) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failConnect = enabled;
    m_failConnectFatal = fatal;
}

void SimulatedBackend::setStreamAvailable(StreamKind kind, bool available) {
    std::lock_guard<std::mutex> lock(m_streamMutex);
    m_streamAvailable[indexOf(kind)] = available;
}

json SimulatedBackend::getSimulatedState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto now = std::chrono::steady_clock::now();
    json running = json::array();
    for (const auto& [name, expiry] : m_runningBehaviors) {
        if (expiry > now) running.push_back(name);
    }
    return {
        {"language", m_language},
        {"eyesColor", m_eyesColor},
        {"posture", m_posture},
        {"awake", m_awake},
        {"speaking", m_speaking},
        {"awareness", {
            {"enabled", m_awarenessEnabled},
            {"engagementMode", m_engagementMode},
            {"trackingMode", m_trackingMode}
        }},
        {"breathingChains", m_breathingChains},
        {"runningBehaviors", running}
    };
}

bool SimulatedBackend::isBehaviorRunning(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_runningBehaviors.find(name);
    return it != m_runningBehaviors.end() && it->second > std::chrono::steady_clock::now();
}

// ============================================================================
// Actions
// ============================================================================

ActionOutcome SimulatedBackend::invoke(ActionKind kind, const json& params) {
    if (!m_connected) {
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR, "Simulated robot is not connected");
    }

    LOG_DEBUG("SimulatedBackend: {} {}", robot::toString(kind), params.dump());

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pendingFailures.find(kind);
        if (it != m_pendingFailures.end()) {
            std::string reason = it->second;
            m_pendingFailures.erase(it);
            LOG_WARN("SimulatedBackend: {} failed ({})", robot::toString(kind), reason);
            return ActionOutcome::failure(ErrorKind::ACTION_ERROR, reason);
        }
    }

    try {
        return applyAction(kind, params);
    } catch (const json::exception& e) {
        LOG_ERROR("SimulatedBackend: bad parameters for {}: {}", robot::toString(kind), e.what());
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                      std::string("Bad parameters: ") + e.what());
    }
}

ActionOutcome SimulatedBackend::applyAction(ActionKind kind, const json& params) {
    json payload = {{"action", robot::toString(kind)}};

    switch (kind) {
        case ActionKind::SET_TTS_LANGUAGE: {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_language = params.at("language").get<std::string>();
            payload["result"] = m_language;
            break;
        }

        case ActionKind::SAY: {
            const std::string text = params.at("text").get<std::string>();
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_speaking = true;
            }
            // Rough speaking time, interrupted by disconnect
            bool finished = simulateDuration(static_cast<int>(std::min<size_t>(text.size() * 10, 2000)));
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_speaking = false;
            }
            if (!finished) {
                return ActionOutcome::failure(ErrorKind::ACTION_ERROR, "Connection closed while speaking");
            }
            payload["result"] = true;
            break;
        }

        case ActionKind::STOP_SAY: {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_speaking = false;
            payload["result"] = true;
            break;
        }

        case ActionKind::WAKE_UP:
        case ActionKind::REST:
        case ActionKind::GO_TO_POSTURE: {
            if (!simulateDuration(m_config.posture_duration_ms)) {
                return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                              "Connection closed during posture change");
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            if (kind == ActionKind::WAKE_UP) {
                m_awake = true;
                m_posture = "StandInit";
            } else if (kind == ActionKind::REST) {
                m_awake = false;
                m_posture = "Crouch";
                m_breathingChains.clear();
            } else {
                m_awake = true;
                m_posture = params.at("posture").get<std::string>();
            }
            payload["result"] = true;
            payload["posture"] = m_posture;
            break;
        }

        case ActionKind::CHANGE_EYES_COLOR: {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_eyesColor = params.at("color").get<std::string>();
            payload["result"] = m_eyesColor;
            break;
        }

        case ActionKind::SET_BASIC_AWARENESS: {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_awarenessEnabled = params.at("enabled").get<bool>();
            m_engagementMode = params.at("engagementMode").get<std::string>();
            m_trackingMode = params.at("trackingMode").get<std::string>();
            payload["result"] = m_awarenessEnabled;
            break;
        }

        case ActionKind::SET_BREATHING: {
            std::lock_guard<std::mutex> lock(m_mutex);
            const bool enabled = params.at("enabled").get<bool>();
            const std::string chain = params.at("chainName").get<std::string>();
            if (enabled) {
                m_breathingChains.insert(chain);
            } else {
                m_breathingChains.erase(chain);
            }
            payload["result"] = enabled;
            break;
        }

        case ActionKind::START_BEHAVIOR:
            return startBehavior(params.at("name").get<std::string>());

        case ActionKind::RUN_BEHAVIOR:
            return runBehavior(params.at("name").get<std::string>());

        case ActionKind::STOP_BEHAVIOR:
            return stopBehavior(params.at("name").get<std::string>());

        default:
            return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                          "Unsupported action " + robot::toString(kind));
    }

    return ActionOutcome::success(payload);
}

bool SimulatedBackend::simulateDuration(int duration_ms) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (duration_ms > 0) {
        m_cv.wait_for(lock, std::chrono::milliseconds(duration_ms),
                      [this]() { return !m_connected; });
    }
    return m_connected;
}

void SimulatedBackend::pruneFinishedBehaviors() {
    auto now = std::chrono::steady_clock::now();
    for (auto it = m_runningBehaviors.begin(); it != m_runningBehaviors.end();) {
        if (it->second <= now) {
            it = m_runningBehaviors.erase(it);
        } else {
            ++it;
        }
    }
}

ActionOutcome SimulatedBackend::startBehavior(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    pruneFinishedBehaviors();
    m_runningBehaviors[name] = std::chrono::steady_clock::now() +
                               std::chrono::milliseconds(m_config.behavior_duration_ms);
    LOG_INFO("SimulatedBackend: behavior '{}' started", name);
    return ActionOutcome::success({
        {"action", robot::toString(ActionKind::START_BEHAVIOR)},
        {"result", true},
        {"behavior", name}
    });
}

ActionOutcome SimulatedBackend::runBehavior(const std::string& name) {
    std::unique_lock<std::mutex> lock(m_mutex);
    pruneFinishedBehaviors();
    const auto expiry = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(m_config.behavior_duration_ms);
    m_runningBehaviors[name] = expiry;
    LOG_INFO("SimulatedBackend: running behavior '{}'", name);

    bool interrupted = m_cv.wait_until(lock, expiry, [this, &name, expiry]() {
        auto it = m_runningBehaviors.find(name);
        return !m_connected || it == m_runningBehaviors.end() || it->second != expiry;
    });

    auto it = m_runningBehaviors.find(name);
    if (it != m_runningBehaviors.end() && it->second == expiry) {
        m_runningBehaviors.erase(it);
    }

    if (!m_connected) {
        return ActionOutcome::failure(ErrorKind::ACTION_ERROR,
                                      "Connection closed while running " + name);
    }

    return ActionOutcome::success({
        {"action", robot::toString(ActionKind::RUN_BEHAVIOR)},
        {"result", true},
        {"behavior", name},
        {"stopped", interrupted}
    });
}

ActionOutcome SimulatedBackend::stopBehavior(const std::string& name) {
    bool wasRunning = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pruneFinishedBehaviors();
        wasRunning = m_runningBehaviors.erase(name) > 0;
    }
    m_cv.notify_all();

    LOG_INFO("SimulatedBackend: behavior '{}' stopped (was running: {})", name, wasRunning);
    return ActionOutcome::success({
        {"action", robot::toString(ActionKind::STOP_BEHAVIOR)},
        {"result", true},
        {"behavior", name}
    });
}

// ============================================================================
// Catalogs
// ============================================================================

CatalogOutcome SimulatedBackend::fetchCatalog(robot::CatalogKind kind) {
    if (!m_connected) {
        return CatalogOutcome::failure(ErrorKind::ACTION_ERROR, "Simulated robot is not connected");
    }
    m_catalogFetches++;
    return CatalogOutcome::success(simulatedCatalog(kind));
}

// ============================================================================
// Streams
// ============================================================================

SubscribeOutcome SimulatedBackend::subscribe(StreamKind kind, robot::StreamSink sink) {
    if (!m_connected) {
        return SubscribeOutcome::failure(ErrorKind::SUBSCRIBE_ERROR,
                                         "Simulated robot is not connected");
    }
    {
        std::lock_guard<std::mutex> lock(m_streamMutex);
        if (!m_streamAvailable[indexOf(kind)]) {
            return SubscribeOutcome::failure(ErrorKind::SUBSCRIBE_ERROR,
                                             "Stream " + robot::toString(kind) + " unavailable");
        }
        auto& worker = m_workers[indexOf(kind)];
        if (worker.running) {
            worker.sink = std::move(sink);
            return SubscribeOutcome::success(true);
        }
        worker.sink = std::move(sink);
    }

    startWorker(kind);
    LOG_INFO("SimulatedBackend: {} stream started", robot::toString(kind));
    return SubscribeOutcome::success(true);
}

void SimulatedBackend::unsubscribe(StreamKind kind) {
    stopWorker(kind);
}

void SimulatedBackend::startWorker(StreamKind kind) {
    std::lock_guard<std::mutex> lock(m_streamMutex);
    auto& worker = m_workers[indexOf(kind)];
    worker.running = true;

    switch (kind) {
        case StreamKind::JOINTS:
            worker.thread = std::thread(&SimulatedBackend::jointsLoop, this);
            break;
        case StreamKind::AUDIO:
            worker.thread = std::thread(&SimulatedBackend::audioLoop, this);
            break;
        case StreamKind::TOUCH:
            // Touch is event driven; the cycling thread only runs when configured
            if (m_config.touch_period_ms > 0) {
                worker.thread = std::thread(&SimulatedBackend::touchLoop, this);
            }
            break;
    }
}

void SimulatedBackend::stopWorker(StreamKind kind) {
    std::thread thread;
    {
        std::lock_guard<std::mutex> lock(m_streamMutex);
        auto& worker = m_workers[indexOf(kind)];
        if (!worker.running) {
            return;
        }
        worker.running = false;
        worker.sink = nullptr;
        thread = std::move(worker.thread);
    }
    m_streamCv.notify_all();

    if (thread.joinable()) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
    LOG_INFO("SimulatedBackend: {} stream stopped", robot::toString(kind));
}

void SimulatedBackend::emit(StreamKind kind, StreamEvent event) {
    robot::StreamSink sink;
    {
        std::lock_guard<std::mutex> lock(m_streamMutex);
        const auto& worker = m_workers[indexOf(kind)];
        if (!worker.running || !worker.sink) {
            return;
        }
        sink = worker.sink;
    }
    if (!m_connected) {
        return;
    }

    std::lock_guard<std::mutex> emitLock(m_emitMutexes[indexOf(kind)]);
    event.sequence = ++m_sequences[indexOf(kind)];
    event.timestamp = nowMs();
    sink(event);
}

void SimulatedBackend::injectTouch(const std::string& part, bool touched) {
    StreamEvent event;
    event.data = robot::TouchEvent{part, touched ? 1 : 0};
    emit(StreamKind::TOUCH, std::move(event));
}

void SimulatedBackend::jointsLoop() {
    const auto period = std::chrono::milliseconds(std::max(1, m_config.joints_period_ms));
    const auto& names = jointNames();
    const auto start = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(m_streamMutex);
    auto& worker = m_workers[indexOf(StreamKind::JOINTS)];
    while (worker.running) {
        m_streamCv.wait_for(lock, period, [&worker]() { return !worker.running; });
        if (!worker.running) break;
        lock.unlock();

        const double t = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        robot::JointsFrame frame;
        frame.names = names;
        frame.angles.reserve(names.size());
        for (size_t i = 0; i < names.size(); ++i) {
            // Each joint swings with its own phase, +-0.3 rad
            frame.angles.push_back(static_cast<float>(
                0.3 * std::sin(TWO_PI * JOINT_SWING_HZ * t + 0.25 * static_cast<double>(i))));
        }

        StreamEvent event;
        event.data = std::move(frame);
        emit(StreamKind::JOINTS, std::move(event));

        lock.lock();
    }
}

void SimulatedBackend::audioLoop() {
    const int period_ms = std::max(1, m_config.audio_period_ms);
    const int samples = AUDIO_SAMPLE_RATE * period_ms / 1000;
    double phase = 0.0;

    std::unique_lock<std::mutex> lock(m_streamMutex);
    auto& worker = m_workers[indexOf(StreamKind::AUDIO)];
    while (worker.running) {
        m_streamCv.wait_for(lock, std::chrono::milliseconds(period_ms),
                            [&worker]() { return !worker.running; });
        if (!worker.running) break;
        lock.unlock();

        robot::AudioFrame frame;
        frame.sampleRate = AUDIO_SAMPLE_RATE;
        frame.channels = 1;
        frame.samplesPerChannel = samples;
        frame.payload.resize(static_cast<size_t>(samples) * 2);
        for (int i = 0; i < samples; ++i) {
            // 16-bit little-endian PCM tone
            auto sample = static_cast<int16_t>(8000.0 * std::sin(phase));
            frame.payload[2 * i] = static_cast<uint8_t>(sample & 0xFF);
            frame.payload[2 * i + 1] = static_cast<uint8_t>((sample >> 8) & 0xFF);
            phase += TWO_PI * AUDIO_TONE_HZ / AUDIO_SAMPLE_RATE;
            if (phase > TWO_PI) phase -= TWO_PI;
        }

        StreamEvent event;
        event.data = std::move(frame);
        emit(StreamKind::AUDIO, std::move(event));

        lock.lock();
    }
}

void SimulatedBackend::touchLoop() {
    const auto period = std::chrono::milliseconds(m_config.touch_period_ms);
    size_t step = 0;

    std::unique_lock<std::mutex> lock(m_streamMutex);
    auto& worker = m_workers[indexOf(StreamKind::TOUCH)];
    while (worker.running) {
        m_streamCv.wait_for(lock, period, [&worker]() { return !worker.running; });
        if (!worker.running) break;
        lock.unlock();

        // Press then release each head sensor in turn
        const char* part = TOUCH_PARTS[(step / 2) % 3];
        injectTouch(part, step % 2 == 0);
        ++step;

        lock.lock();
    }
}

int64_t SimulatedBackend::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace backend
} // namespace nao_bridge
