/**
 * @file test_live_backend.cpp
 * @brief ZeroMQ robot link tests against an in-process fake agent
 */

#include <gtest/gtest.h>
#include <zmq.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <vector>
#include "backend/LiveBackend.hpp"
#include "backend/protocol/LinkMessages.hpp"
#include "logging/Logger.hpp"

using namespace nao_bridge;
using namespace nao_bridge::backend;
using robot::ActionKind;
using robot::ErrorKind;
using robot::StreamEvent;
using robot::StreamKind;

namespace {

/**
 * Robot-side agent stand-in: ROUTER on the RPC port, PUB on RPC port + 1.
 * Unknown methods answer {ok: true, result: null}.
 */
class FakeAgent {
public:
    using Handler = std::function<protocol::RpcReply(const json& args)>;

    FakeAgent() {
        for (int attempt = 0; attempt < 20 && m_port == 0; ++attempt) {
            zmq::socket_t router(m_context, zmq::socket_type::router);
            router.set(zmq::sockopt::linger, 0);
            router.bind("tcp://127.0.0.1:*");
            const std::string endpoint = router.get(zmq::sockopt::last_endpoint);
            const int port = std::stoi(endpoint.substr(endpoint.rfind(':') + 1));

            zmq::socket_t pub(m_context, zmq::socket_type::pub);
            pub.set(zmq::sockopt::linger, 0);
            try {
                pub.bind("tcp://127.0.0.1:" + std::to_string(port + 1));
            } catch (const zmq::error_t&) {
                continue;
            }
            m_router = std::move(router);
            m_pub = std::move(pub);
            m_port = port;
        }

        on("ServiceDirectory", "services", [](const json&) {
            return ok(json::array({"ALMotion", "ALTextToSpeech"}));
        });
    }

    ~FakeAgent() {
        stop();
    }

    static protocol::RpcReply ok(const json& result = nullptr) {
        protocol::RpcReply reply;
        reply.ok = true;
        reply.result = result;
        return reply;
    }

    static protocol::RpcReply fail(const std::string& error, bool fatal = false) {
        protocol::RpcReply reply;
        reply.ok = false;
        reply.error = error;
        reply.fatal = fatal;
        return reply;
    }

    /// Register a handler (before start)
    void on(const std::string& service, const std::string& method, Handler handler) {
        m_handlers[service + "." + method] = std::move(handler);
    }

    /// Never answer this method (before start)
    void silence(const std::string& service, const std::string& method) {
        m_silent.insert(service + "." + method);
    }

    void start() {
        m_running = true;
        m_thread = std::thread(&FakeAgent::loop, this);
    }

    void stop() {
        m_running = false;
        if (m_thread.joinable()) m_thread.join();
    }

    int port() const { return m_port; }

    /// Publish an event (test thread only)
    template <typename T>
    void publish(const std::string& topic, const T& message) {
        const std::string body = protocol::packMessage(message);
        m_pub.send(zmq::buffer(topic), zmq::send_flags::sndmore);
        m_pub.send(zmq::buffer(body), zmq::send_flags::none);
    }

    std::vector<protocol::RpcRequest> requests() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    int count(const std::string& service, const std::string& method) {
        int n = 0;
        for (const auto& r : requests()) {
            if (r.service == service && r.method == method) ++n;
        }
        return n;
    }

private:
    void loop() {
        while (m_running) {
            zmq::pollitem_t items[] = {{m_router.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, 1, std::chrono::milliseconds(10));
            if (!(items[0].revents & ZMQ_POLLIN)) continue;

            zmq::message_t identity;
            zmq::message_t payload;
            if (!m_router.recv(identity, zmq::recv_flags::none)) continue;
            if (!m_router.recv(payload, zmq::recv_flags::none)) continue;

            auto request = json::parse(payload.to_string()).get<protocol::RpcRequest>();
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_requests.push_back(request);
            }

            const std::string key = request.service + "." + request.method;
            if (m_silent.count(key)) continue;

            auto it = m_handlers.find(key);
            protocol::RpcReply reply = it != m_handlers.end() ? it->second(request.args) : ok();
            reply.id = request.id;

            const std::string data = json(reply).dump();
            m_router.send(identity, zmq::send_flags::sndmore);
            m_router.send(zmq::buffer(data), zmq::send_flags::none);
        }
    }

    zmq::context_t m_context{1};
    zmq::socket_t m_router;
    zmq::socket_t m_pub;
    int m_port = 0;

    std::map<std::string, Handler> m_handlers;
    std::set<std::string> m_silent;

    std::thread m_thread;
    std::atomic<bool> m_running{false};

    std::mutex m_mutex;
    std::vector<protocol::RpcRequest> m_requests;
};

template <typename Pred>
bool waitUntil(Pred pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

class LiveBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_live_backend.log", "debug");
        health = std::make_shared<LinkHealth>();

        ASSERT_NE(agent.port(), 0);
        config.mode = config::BackendMode::LIVE;
        config.robot_host = "127.0.0.1";
        config.robot_port = agent.port();
        config.connect_attempts = 2;
        config.connect_timeout_ms = 500;
        config.call_timeout_ms = 1000;
        config.link_loss_timeouts = 3;
        config.joints_period_ms = 20;
    }

    FakeAgent agent;
    config::BackendConfig config;
    std::shared_ptr<LinkHealth> health;
};

TEST_F(LiveBackendTest, EmptyHostIsRetryableConnectError) {
    config.robot_host.clear();
    LiveBackend backend(config, health);

    auto out = backend.connect();
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.error().kind, ErrorKind::CONNECT_ERROR);
    EXPECT_FALSE(out.error().fatal);
    EXPECT_FALSE(health->isLatched());
}

TEST_F(LiveBackendTest, ConnectHandshake) {
    agent.start();
    LiveBackend backend(config, health);

    auto out = backend.connect();
    ASSERT_TRUE(out.ok()) << out.error().message;
    EXPECT_TRUE(backend.isConnected());
    EXPECT_FALSE(backend.isSimulation());
    EXPECT_EQ(out.value()["backend"], "LiveBackend");
    EXPECT_EQ(out.value()["services"], 2);
    EXPECT_EQ(agent.count("ServiceDirectory", "services"), 1);

    backend.disconnect();
    EXPECT_FALSE(backend.isConnected());
}

TEST_F(LiveBackendTest, UnreachableAgentIsRetryable) {
    config.connect_timeout_ms = 100;
    agent.silence("ServiceDirectory", "services");
    agent.start();
    LiveBackend backend(config, health);

    auto out = backend.connect();
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.error().kind, ErrorKind::CONNECT_ERROR);
    EXPECT_FALSE(out.error().fatal);
    EXPECT_FALSE(health->isLatched());
}

TEST_F(LiveBackendTest, FatalReplyLatchesLinkHealth) {
    agent.on("ServiceDirectory", "services", [](const json&) {
        return FakeAgent::fail("qi session could not start", true);
    });
    agent.start();
    LiveBackend backend(config, health);

    auto first = backend.connect();
    ASSERT_FALSE(first.ok());
    EXPECT_TRUE(first.error().fatal);
    EXPECT_TRUE(health->isLatched());
    EXPECT_EQ(agent.count("ServiceDirectory", "services"), 1);

    // No further attempt reaches the agent
    auto second = backend.connect();
    ASSERT_FALSE(second.ok());
    EXPECT_TRUE(second.error().fatal);
    EXPECT_EQ(agent.count("ServiceDirectory", "services"), 1);

    // The latch is shared with any other backend using the same health
    LiveBackend other(config, health);
    EXPECT_TRUE(other.connect().error().fatal);
}

TEST_F(LiveBackendTest, InvokeMapsToRobotServices) {
    agent.on("ALRobotPosture", "goToPosture", [](const json&) { return FakeAgent::ok(true); });
    agent.start();
    LiveBackend backend(config, health);
    ASSERT_TRUE(backend.connect().ok());

    auto say = backend.invoke(ActionKind::SAY, {{"text", "hello"}});
    ASSERT_TRUE(say.ok()) << say.error().message;
    EXPECT_EQ(say.value()["action"], "SAY");

    auto posture = backend.invoke(ActionKind::GO_TO_POSTURE,
                                  {{"posture", "Sit"}, {"speed", 0.8}, {"maxTries", 3}});
    ASSERT_TRUE(posture.ok());
    EXPECT_EQ(posture.value()["result"], true);

    ASSERT_TRUE(backend.invoke(ActionKind::SET_BASIC_AWARENESS, {
        {"enabled", true}, {"engagementMode", "Unengaged"}, {"trackingMode", "Head"}
    }).ok());

    auto requests = agent.requests();
    auto find = [&requests](const std::string& service, const std::string& method) {
        for (const auto& r : requests) {
            if (r.service == service && r.method == method) return std::optional<protocol::RpcRequest>(r);
        }
        return std::optional<protocol::RpcRequest>();
    };

    auto sayRequest = find("ALAnimatedSpeech", "say");
    ASSERT_TRUE(sayRequest.has_value());
    EXPECT_EQ(sayRequest->args, json::array({"hello"}));

    auto tries = find("ALRobotPosture", "setMaxTryNumber");
    ASSERT_TRUE(tries.has_value());
    EXPECT_EQ(tries->args, json::array({3}));

    auto goTo = find("ALRobotPosture", "goToPosture");
    ASSERT_TRUE(goTo.has_value());
    EXPECT_EQ(goTo->args[0], "Sit");

    EXPECT_TRUE(find("ALBasicAwareness", "setEngagementMode").has_value());
    EXPECT_TRUE(find("ALBasicAwareness", "setTrackingMode").has_value());
    EXPECT_TRUE(find("ALBasicAwareness", "startAwareness").has_value());
}

TEST_F(LiveBackendTest, UnreachedPostureIsActionError) {
    agent.on("ALRobotPosture", "goToPosture", [](const json&) { return FakeAgent::ok(false); });
    agent.start();
    LiveBackend backend(config, health);
    ASSERT_TRUE(backend.connect().ok());

    auto out = backend.invoke(ActionKind::GO_TO_POSTURE, {{"posture", "Stand"}});
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.error().kind, ErrorKind::ACTION_ERROR);
}

TEST_F(LiveBackendTest, RemoteErrorIsActionError) {
    agent.on("ALLeds", "fadeRGB", [](const json&) { return FakeAgent::fail("no such led group"); });
    agent.start();
    LiveBackend backend(config, health);
    ASSERT_TRUE(backend.connect().ok());

    auto out = backend.invoke(ActionKind::CHANGE_EYES_COLOR, {{"color", "red"}});
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.error().kind, ErrorKind::ACTION_ERROR);
    EXPECT_NE(out.error().message.find("no such led group"), std::string::npos);
    EXPECT_TRUE(backend.isConnected());
}

TEST_F(LiveBackendTest, TimeoutLeavesLinkUsable) {
    config.call_timeout_ms = 100;
    agent.silence("ALMotion", "wakeUp");
    agent.start();
    LiveBackend backend(config, health);
    ASSERT_TRUE(backend.connect().ok());

    auto out = backend.invoke(ActionKind::WAKE_UP, json::object());
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.error().kind, ErrorKind::ACTION_ERROR);
    EXPECT_NE(out.error().message.find("timed out"), std::string::npos);

    EXPECT_TRUE(backend.isConnected());
    EXPECT_TRUE(backend.invoke(ActionKind::REST, json::object()).ok());
}

TEST_F(LiveBackendTest, RepeatedTimeoutsReportLinkLoss) {
    config.call_timeout_ms = 50;
    config.link_loss_timeouts = 2;
    agent.silence("ALMotion", "wakeUp");
    agent.start();
    LiveBackend backend(config, health);

    std::atomic<int> fired{0};
    backend.setLinkLostCallback([&fired](const std::string&) { fired++; });
    ASSERT_TRUE(backend.connect().ok());

    EXPECT_FALSE(backend.invoke(ActionKind::WAKE_UP, json::object()).ok());
    EXPECT_EQ(fired.load(), 0);
    EXPECT_FALSE(backend.invoke(ActionKind::WAKE_UP, json::object()).ok());

    EXPECT_EQ(fired.load(), 1);
    EXPECT_FALSE(backend.isConnected());
    EXPECT_FALSE(health->isLatched());
}

TEST_F(LiveBackendTest, CatalogsFromInstalledPackages) {
    agent.on("PackageManager", "packages2", [](const json&) {
        return FakeAgent::ok(json::array({
            {
                {"uuid", "thriller-dance"},
                {"elems", {
                    {"names", {{"en_US", "The thriller dance"}}},
                    {"descriptions", {{"en_US", "Nao dances on thriller."}}},
                    {"contents", {{"behaviors", json::array({json{{"path", "."}}})}}}
                }}
            },
            {
                {"uuid", "dialog_move_arms"},
                {"elems", {
                    {"names", {{"en_US", "Arms"}}},
                    {"descriptions", {{"en_US", ""}}},
                    {"contents", {{"behaviors", json::array({
                        json{{"path", "animations/UpRArm"}, {"langToName", {{"en_US", "UpRArm"}}}}
                    })}}}
                }}
            }
        }));
    });
    agent.start();
    LiveBackend backend(config, health);
    ASSERT_TRUE(backend.connect().ok());

    auto dances = backend.fetchCatalog(robot::CatalogKind::DANCES);
    ASSERT_TRUE(dances.ok()) << dances.error().message;
    ASSERT_EQ(dances.value().size(), 1u);
    EXPECT_EQ(dances.value()[0].id, "thriller-dance");

    auto actions = backend.fetchCatalog(robot::CatalogKind::BODY_ACTIONS);
    ASSERT_TRUE(actions.ok());
    ASSERT_EQ(actions.value().size(), 1u);
    EXPECT_EQ(actions.value()[0].behaviorName, "dialog_move_arms/animations/UpRArm");

    // packages2 is read once per connection
    EXPECT_EQ(agent.count("PackageManager", "packages2"), 1);
}

TEST_F(LiveBackendTest, TouchAndAudioEvents) {
    agent.start();
    LiveBackend backend(config, health);
    ASSERT_TRUE(backend.connect().ok());

    std::mutex mutex;
    std::vector<StreamEvent> touches;
    std::vector<StreamEvent> audio;
    ASSERT_TRUE(backend.subscribe(StreamKind::TOUCH, [&](const StreamEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        touches.push_back(e);
    }).ok());
    ASSERT_TRUE(backend.subscribe(StreamKind::AUDIO, [&](const StreamEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        audio.push_back(e);
    }).ok());
    EXPECT_EQ(agent.count("ALAudioDevice", "subscribe"), 1);

    protocol::TouchMessage touch{"RearTactilTouched", 1};
    protocol::AudioMessage frame;
    frame.samplesPerChannel = 2;
    frame.buffer = {0x01, 0x00, 0xFF, 0x7F};

    // PUB/SUB needs a moment to join; keep publishing until both arrive
    ASSERT_TRUE(waitUntil([&]() {
        agent.publish(protocol::Topics::TOUCH, touch);
        agent.publish(protocol::Topics::AUDIO, frame);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        std::lock_guard<std::mutex> lock(mutex);
        return !touches.empty() && !audio.empty();
    }));

    std::lock_guard<std::mutex> lock(mutex);
    const auto& t = std::get<robot::TouchEvent>(touches.front().data);
    EXPECT_EQ(t.part, "RearTactilTouched");
    EXPECT_EQ(t.state, 1);
    EXPECT_EQ(touches.front().sequence, 1u);

    const auto& a = std::get<robot::AudioFrame>(audio.front().data);
    EXPECT_EQ(a.sampleRate, 16000);
    EXPECT_EQ(a.samplesPerChannel, 2);
    EXPECT_EQ(a.payload, (std::vector<uint8_t>{0x01, 0x00, 0xFF, 0x7F}));
}

TEST_F(LiveBackendTest, TouchWithInvalidStateIsDropped) {
    agent.start();
    LiveBackend backend(config, health);
    ASSERT_TRUE(backend.connect().ok());

    std::mutex mutex;
    std::vector<StreamEvent> touches;
    ASSERT_TRUE(backend.subscribe(StreamKind::TOUCH, [&](const StreamEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        touches.push_back(e);
    }).ok());

    protocol::TouchMessage invalid{"FrontTactilTouched", 2};
    protocol::TouchMessage negative{"FrontTactilTouched", -1};
    protocol::TouchMessage released{"MiddleTactilTouched", 0};

    // Each round sends the invalid states ahead of the valid one
    ASSERT_TRUE(waitUntil([&]() {
        agent.publish(protocol::Topics::TOUCH, invalid);
        agent.publish(protocol::Topics::TOUCH, negative);
        agent.publish(protocol::Topics::TOUCH, released);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        std::lock_guard<std::mutex> lock(mutex);
        return !touches.empty();
    }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    std::lock_guard<std::mutex> lock(mutex);
    for (size_t i = 0; i < touches.size(); ++i) {
        const auto& t = std::get<robot::TouchEvent>(touches[i].data);
        EXPECT_EQ(t.part, "MiddleTactilTouched");
        EXPECT_EQ(t.state, 0);
        EXPECT_EQ(touches[i].sequence, i + 1);
    }
}

TEST_F(LiveBackendTest, JointsArePolled) {
    agent.on("ALMotion", "getBodyNames", [](const json&) {
        return FakeAgent::ok(json::array({"HeadYaw", "HeadPitch"}));
    });
    agent.on("ALMotion", "getAngles", [](const json&) {
        return FakeAgent::ok(json::array({0.25, -0.5}));
    });
    agent.start();
    LiveBackend backend(config, health);
    ASSERT_TRUE(backend.connect().ok());

    std::mutex mutex;
    std::vector<StreamEvent> events;
    ASSERT_TRUE(backend.subscribe(StreamKind::JOINTS, [&](const StreamEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(e);
    }).ok());

    ASSERT_TRUE(waitUntil([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return events.size() >= 2;
    }));
    backend.unsubscribe(StreamKind::JOINTS);

    std::lock_guard<std::mutex> lock(mutex);
    const auto& frame = std::get<robot::JointsFrame>(events.front().data);
    ASSERT_EQ(frame.names.size(), 2u);
    EXPECT_EQ(frame.names[1], "HeadPitch");
    EXPECT_FLOAT_EQ(frame.angles[1], -0.5f);
    EXPECT_EQ(events[1].sequence, events[0].sequence + 1);
}

TEST_F(LiveBackendTest, SubscribeRequiresConnection) {
    LiveBackend backend(config, health);
    auto out = backend.subscribe(StreamKind::TOUCH, [](const StreamEvent&) {});
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.error().kind, ErrorKind::SUBSCRIBE_ERROR);
}
