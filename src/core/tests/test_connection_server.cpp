/**
 * @file test_connection_server.cpp
 * @brief WebSocket message server tests with a synchronous Beast client
 */

#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <spdlog/logger.h>
#include <vector>
#include "server/ConnectionServer.hpp"
#include "server/ClientLogSink.hpp"
#include "backend/SimulatedBackend.hpp"
#include "logging/Logger.hpp"

using namespace nao_bridge;
using namespace nao_bridge::server;
using backend::SimulatedBackend;
using robot::StreamKind;
using json = nlohmann::json;

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

template <typename Pred>
bool waitUntil(Pred pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/**
 * Blocking WebSocket client
 */
class Client {
public:
    /// receiveBuffer > 0 shrinks the socket buffer so an idle reader backs up the server
    explicit Client(uint16_t port, int receiveBuffer = 0) : m_ws(m_ioc) {
        auto& socket = m_ws.next_layer();
        socket.open(tcp::v4());
        if (receiveBuffer > 0) {
            socket.set_option(net::socket_base::receive_buffer_size(receiveBuffer));
        }
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        m_ws.handshake("127.0.0.1:" + std::to_string(port), "/");
    }

    void sendRaw(const std::string& text) {
        m_ws.text(true);
        m_ws.write(net::buffer(text));
    }

    void send(const std::string& command, const json& parameters = json::object(),
              const std::string& requestId = "") {
        json frame = {{"command-name", command}, {"parameters", parameters}};
        if (!requestId.empty()) frame["request-id"] = requestId;
        sendRaw(frame.dump());
    }

    json receive() {
        beast::flat_buffer buffer;
        m_ws.read(buffer);
        return json::parse(beast::buffers_to_string(buffer.data()));
    }

    /// Next frame that is a reply (stream events skipped)
    json receiveReply() {
        for (;;) {
            json frame = receive();
            if (!frame.contains("stream-kind")) return frame;
        }
    }

    /// Read until the server ends the connection; false if a frame arrives instead
    bool expectClosed() {
        beast::flat_buffer buffer;
        beast::error_code ec;
        m_ws.read(buffer, ec);
        return static_cast<bool>(ec);
    }

    void close() {
        beast::error_code ec;
        m_ws.close(websocket::close_code::normal, ec);
    }

private:
    net::io_context m_ioc;
    websocket::stream<tcp::socket> m_ws;
};

} // namespace

class ConnectionServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_connection_server.log", "debug");

        simConfig.connect_delay_ms = 0;
        simConfig.posture_duration_ms = 20;
        simConfig.behavior_duration_ms = 2000;

        serverConfig.bind_address = "127.0.0.1";
        serverConfig.port = 0;
        serverConfig.io_threads = 2;
        serverConfig.worker_threads = 2;
        serverConfig.log_forward_level = "off";

        streams.touch_enabled = true;
        streams.joints_enabled = false;
        streams.audio_enabled = false;
    }

    void TearDown() override {
        server.reset();
        session.reset();
    }

    void startServer() {
        auto backend = std::make_unique<SimulatedBackend>(simConfig);
        sim = backend.get();
        session = std::make_unique<robot::RobotSession>(std::move(backend), sessionConfig);
        server = std::make_unique<ConnectionServer>(*session, serverConfig, streams, sessionConfig);
        ASSERT_TRUE(server->start());
    }

    config::SimulationConfig simConfig;
    config::ServerConfig serverConfig;
    config::StreamsConfig streams;
    config::SessionConfig sessionConfig;

    SimulatedBackend* sim = nullptr;
    std::unique_ptr<robot::RobotSession> session;
    std::unique_ptr<ConnectionServer> server;
};

TEST_F(ConnectionServerTest, StartsOnEphemeralPort) {
    startServer();
    EXPECT_TRUE(server->isRunning());
    EXPECT_NE(server->port(), 0);
    EXPECT_EQ(server->connectionCount(), 0u);

    server->stop();
    EXPECT_FALSE(server->isRunning());
    EXPECT_FALSE(server->start());
}

TEST_F(ConnectionServerTest, PortInUseFailsToStart) {
    startServer();
    config::ServerConfig clash = serverConfig;
    clash.port = server->port();

    ConnectionServer second(*session, clash, streams, sessionConfig);
    EXPECT_FALSE(second.start());
}

TEST_F(ConnectionServerTest, FirstFrameIsStateAndRobotIsPrepared) {
    startServer();
    Client client(server->port());

    json state = client.receive();
    EXPECT_EQ(state["stream-kind"], "state");
    EXPECT_TRUE(state["event-payload"]["connected"].get<bool>());
    EXPECT_TRUE(state["event-payload"]["fakeRobot"].get<bool>());

    auto sim_state = sim->getSimulatedState();
    EXPECT_EQ(sim_state["eyesColor"], "cyan");
    EXPECT_TRUE(sim_state["awake"].get<bool>());
    EXPECT_EQ(server->connectionCount(), 1u);

    client.close();
}

TEST_F(ConnectionServerTest, PingReply) {
    startServer();
    Client client(server->port());
    client.receive();

    client.send("Ping", json::object(), "ping-1");
    json reply = client.receiveReply();
    EXPECT_EQ(reply["request-id"], "ping-1");
    EXPECT_TRUE(reply["result"]["pong"].get<bool>());

    client.close();
}

TEST_F(ConnectionServerTest, MalformedFrameGetsErrorReply) {
    startServer();
    Client client(server->port());
    client.receive();

    client.sendRaw("definitely not json");
    json reply = client.receiveReply();
    EXPECT_EQ(reply["error"]["kind"], "InvalidParameters");

    // The connection stays usable
    client.send("Ping", json::object(), "after-error");
    EXPECT_EQ(client.receiveReply()["request-id"], "after-error");
    client.close();
}

TEST_F(ConnectionServerTest, RepliesKeepRequestOrder) {
    startServer();
    Client client(server->port());
    client.receive();

    // The first command is the slowest; replies must still come back in order
    client.send("Say", {{"text", std::string(20, 'a')}}, "1");
    client.send("GenericNao", {{"text", "x"}}, "2");
    client.send("ChangeEyesColor", {{"color", "red"}}, "3");
    client.send("Unknown", json::object(), "4");
    client.send("Ping", json::object(), "5");

    for (int i = 1; i <= 5; ++i) {
        json reply = client.receiveReply();
        EXPECT_EQ(reply["request-id"], std::to_string(i));
    }
    EXPECT_EQ(sim->getSimulatedState()["eyesColor"], "red");

    client.close();
}

TEST_F(ConnectionServerTest, TouchEventsArePushed) {
    startServer();
    Client client(server->port());
    client.receive();

    ASSERT_TRUE(waitUntil([this]() {
        return session->multiplexer().subscriberCount(StreamKind::TOUCH) == 1;
    }));

    sim->injectTouch("MiddleTactilTouched", true);
    json event = client.receive();
    EXPECT_EQ(event["stream-kind"], "touch");
    EXPECT_EQ(event["event-payload"]["part"], "MiddleTactilTouched");
    EXPECT_TRUE(event["event-payload"]["touched"].get<bool>());

    client.close();
}

TEST_F(ConnectionServerTest, IdleReaderKeepsOnlyLatestJointsFrame) {
    streams.touch_enabled = false;
    streams.joints_enabled = true;
    simConfig.joints_period_ms = 1;
    startServer();

    Client client(server->port(), 4096);
    EXPECT_EQ(client.receive()["stream-kind"], "state");

    // Never read again: once the socket backs up, newer joints frames replace the pending one
    ASSERT_TRUE(waitUntil([this]() { return server->getStats().frames_dropped > 0; }, 20000));

    for (int i = 0; i < 20; ++i) {
        EXPECT_LE(server->getStats().frames_queued, 2u);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_GT(server->getStats().frames_dropped, 0u);
}

TEST_F(ConnectionServerTest, LogLinesArePushedToClients) {
    serverConfig.log_forward_level = "info";
    startServer();
    Client client(server->port());
    EXPECT_EQ(client.receive()["stream-kind"], "state");

    client.send("Dance", {{"danceId", "eagle-dance"}}, "dance");

    bool sawLog = false;
    bool sawReply = false;
    for (int i = 0; i < 50 && !(sawLog && sawReply); ++i) {
        json frame = client.receive();
        if (frame.value("stream-kind", "") == "log") {
            const auto& payload = frame["event-payload"];
            if (payload["log"].get<std::string>().find("Starting dance 'eagle-dance'") != std::string::npos) {
                EXPECT_EQ(payload["logLevel"], "INFO");
                sawLog = true;
            }
        } else if (frame.value("request-id", "") == "dance") {
            EXPECT_FALSE(frame.contains("error"));
            sawReply = true;
        }
    }
    EXPECT_TRUE(sawLog);
    EXPECT_TRUE(sawReply);

    client.close();
}

TEST(ClientLogSinkTest, RecordBecomesLogEvent) {
    std::vector<std::string> frames;
    auto sink = std::make_shared<ClientLogSink>([&frames](const std::string& frame) {
        frames.push_back(frame);
    });
    sink->set_level(spdlog::level::warn);
    spdlog::logger logger("client_log_sink_test", sink);
    logger.set_level(spdlog::level::trace);

    logger.info("not forwarded");
    logger.warn("battery at {}%", 12);

    ASSERT_EQ(frames.size(), 1u);
    json event = json::parse(frames[0]);
    EXPECT_EQ(event["stream-kind"], "log");
    EXPECT_EQ(event["event-payload"]["log"], "battery at 12%");
    EXPECT_EQ(event["event-payload"]["logLevel"], "WARNING");

    EXPECT_EQ(ClientLogSink::levelName(spdlog::level::debug), "DEBUG");
    EXPECT_EQ(ClientLogSink::levelName(spdlog::level::critical), "CRITICAL");
}

TEST_F(ConnectionServerTest, DisabledStreamRejected) {
    startServer();
    Client client(server->port());
    client.receive();

    client.send("SubscribeAudio", json::object(), "audio");
    json reply = client.receiveReply();
    EXPECT_EQ(reply["error"]["kind"], "SubscribeError");

    client.close();
}

TEST_F(ConnectionServerTest, RobotReleasedWhenLastClientLeaves) {
    startServer();
    auto first = std::make_unique<Client>(server->port());
    first->receive();
    auto second = std::make_unique<Client>(server->port());
    second->receive();
    EXPECT_EQ(server->connectionCount(), 2u);
    EXPECT_EQ(sim->connectCalls(), 1);

    first->close();
    first.reset();
    ASSERT_TRUE(waitUntil([this]() { return server->connectionCount() == 1; }));
    EXPECT_TRUE(session->isConnected());

    second->close();
    second.reset();
    ASSERT_TRUE(waitUntil([this]() { return server->connectionCount() == 0; }));
    ASSERT_TRUE(waitUntil([this]() { return !session->isConnected(); }));

    auto state = sim->getSimulatedState();
    EXPECT_EQ(state["eyesColor"], "white");
    EXPECT_EQ(state["posture"], "Crouch");
    EXPECT_EQ(session->multiplexer().subscriberCount(StreamKind::TOUCH), 0u);

    EXPECT_EQ(server->getStats().connections_accepted, 2u);
    EXPECT_EQ(server->getStats().connections_closed, 2u);
}

TEST_F(ConnectionServerTest, RobotKeptWhenReleaseDisabled) {
    sessionConfig.release_when_idle = false;
    startServer();
    {
        Client client(server->port());
        client.receive();
        client.close();
    }
    ASSERT_TRUE(waitUntil([this]() { return server->connectionCount() == 0; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_TRUE(session->isConnected());
}

TEST_F(ConnectionServerTest, LinkLossClosesClients) {
    startServer();
    Client client(server->port());
    client.receive();

    sim->simulateLinkLoss("cable pulled");

    json state = client.receive();
    EXPECT_EQ(state["stream-kind"], "state");
    EXPECT_FALSE(state["event-payload"]["connected"].get<bool>());
    EXPECT_EQ(state["event-payload"]["lastError"]["kind"], "ConnectError");

    EXPECT_TRUE(client.expectClosed());
    ASSERT_TRUE(waitUntil([this]() { return server->connectionCount() == 0; }));

    // A new client reconnects the robot
    Client again(server->port());
    EXPECT_TRUE(again.receive()["event-payload"]["connected"].get<bool>());
    again.close();
}

TEST_F(ConnectionServerTest, StopClosesClients) {
    startServer();
    Client client(server->port());
    client.receive();

    server->stop();
    EXPECT_TRUE(client.expectClosed());
    EXPECT_EQ(server->connectionCount(), 0u);
    EXPECT_FALSE(session->isConnected());
}

TEST_F(ConnectionServerTest, UnreachableRobotStillServesClients) {
    startServer();
    sim->setConnectFailure(true, true);

    Client client(server->port());
    json state = client.receive();
    EXPECT_FALSE(state["event-payload"]["connected"].get<bool>());
    EXPECT_TRUE(state["event-payload"]["lastError"]["fatal"].get<bool>());

    client.send("Say", {{"text", "hello"}}, "say");
    json reply = client.receiveReply();
    EXPECT_EQ(reply["error"]["kind"], "NotConnected");

    client.close();
}
