/**
 * @file ConnectionServer.cpp
 * @brief WebSocket message server implementation
 *
 * Uses Boost.Beast on a Boost.Asio io_context.
 * Read path: async_read (socket strand) -> post to worker strand -> dispatcher
 * Write path: sendFrame -> post to socket strand -> write queue -> async_write
 *
 * The write queue holds at most one unsent joints frame and one unsent audio
 * frame; a newer one takes its place. Replies, state, touch and log frames
 * are never dropped.
 */

#include "ConnectionServer.hpp"
#include "ClientLogSink.hpp"
#include "CommandDispatcher.hpp"
#include "Envelope.hpp"
#include "../logging/Logger.hpp"
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace nao_bridge {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using robot::StreamKind;

// ============================================================================
// Impl (pimpl - owns Boost.Asio context, acceptor and threads)
// ============================================================================

struct ConnectionServer::Impl {
    robot::RobotSession& session;
    config::ServerConfig serverConfig;
    config::StreamsConfig streams;
    config::SessionConfig sessionConfig;

    // Declared before ioContext: strands of live connections outlive the context
    net::thread_pool workers;
    net::io_context ioContext;
    tcp::acceptor acceptor;
    std::vector<std::thread> ioThreads;
    std::atomic<bool> running{false};
    bool stopped = false;
    uint16_t boundPort = 0;

    // Robot lifecycle (connect / prepare / release) is serialized
    std::mutex lifecycleMutex;
    bool robotPrepared = false;

    mutable std::mutex connectionsMutex;
    std::condition_variable connectionsCv;
    std::map<uint64_t, std::shared_ptr<Connection>> connections;
    std::atomic<uint64_t> nextId{1};

    // Statistics
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> closed{0};
    std::atomic<uint64_t> framesReceived{0};
    std::atomic<uint64_t> framesSent{0};
    std::atomic<uint64_t> framesDropped{0};
    std::atomic<uint64_t> framesQueued{0};

    // Log lines pushed to clients, null when forwarding is off
    std::shared_ptr<ClientLogSink> logSink;

    Impl(robot::RobotSession& s, const config::ServerConfig& server,
         const config::StreamsConfig& st, const config::SessionConfig& sc)
        : session(s)
        , serverConfig(server)
        , streams(st)
        , sessionConfig(sc)
        , workers(static_cast<std::size_t>(std::max(1, server.worker_threads)))
        , acceptor(net::make_strand(ioContext))
    {}

    static constexpr int STOP_TIMEOUT_MS = 5000;

    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    void registerConnection(const std::shared_ptr<Connection>& connection);
    void connectionClosed(uint64_t id);

    void ensureRobotReady();
    void releaseRobot();
    void onLinkLost(const std::string& reason);
    void broadcastLog(const std::string& frame);
};

// ============================================================================
// Connection
// ============================================================================

class ConnectionServer::Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket&& socket, Impl& server, uint64_t id)
        : m_ws(std::move(socket))
        , m_server(server)
        , m_id(id)
        , m_worker(net::make_strand(server.workers.get_executor()))
    {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(m_ws).socket().remote_endpoint(ec);
        m_remote = ec ? std::string("unknown")
                      : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    uint64_t id() const { return m_id; }

    void run() {
        net::dispatch(m_ws.get_executor(),
                      beast::bind_front_handler(&Connection::onRun, shared_from_this()));
    }

    /**
     * Queue a text frame. Thread-safe.
     */
    void sendFrame(std::string frame, FrameClass frameClass = FrameClass::ORDERED) {
        auto self = shared_from_this();
        net::post(m_ws.get_executor(), [self, frame = std::move(frame), frameClass]() mutable {
            self->enqueue(std::move(frame), frameClass);
        });
    }

    /**
     * Log frames are only sent once the client got its first state frame
     */
    bool acceptsLogs() const { return m_logsEnabled && !m_closed; }

    /**
     * Close once every queued frame has been written. Thread-safe.
     */
    void close() {
        auto self = shared_from_this();
        net::post(m_ws.get_executor(), [self]() {
            if (self->m_closeRequested || self->m_closed) return;
            self->m_closeRequested = true;
            if (self->m_writeQueue.empty()) {
                self->doClose();
            }
        });
    }

    /**
     * Close without flushing the write queue. Thread-safe.
     */
    void abort() {
        auto self = shared_from_this();
        net::post(m_ws.get_executor(), [self]() { self->onClosed(); });
    }

    /**
     * Server shutdown path: threads are already stopped
     */
    void shutdown() {
        m_closed = true;
        if (m_dispatcher) {
            m_dispatcher->teardown();
        }
        beast::get_lowest_layer(m_ws).close();
    }

private:
    void onRun() {
        m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        m_ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "nao_bridge");
        }));
        m_ws.read_message_max(m_server.serverConfig.max_frame_bytes);
        m_ws.async_accept(beast::bind_front_handler(&Connection::onAccept, shared_from_this()));
    }

    void onAccept(beast::error_code ec) {
        if (ec) {
            LOG_WARN("WebSocket handshake with {} failed: {}", m_remote, ec.message());
            return;
        }

        LOG_INFO("Client {} connected (connection {})", m_remote, m_id);

        std::weak_ptr<Connection> weak = shared_from_this();
        m_dispatcher = std::make_unique<CommandDispatcher>(
            m_server.session, m_server.streams,
            [weak](const std::string& frame, FrameClass frameClass) {
                if (auto self = weak.lock()) {
                    self->sendFrame(frame, frameClass);
                }
            },
            "connection-" + std::to_string(m_id));

        m_server.registerConnection(shared_from_this());

        // Runs before any command of this connection
        auto self = shared_from_this();
        net::post(m_worker, [self]() { self->onboard(); });

        doRead();
    }

    // Worker strand
    void onboard() {
        if (m_closed) return;

        m_server.ensureRobotReady();
        sendFrame(m_dispatcher->stateEvent());
        m_logsEnabled = true;

        if (!m_server.session.isConnected()) {
            return;
        }

        auto autoSubscribe = [this](StreamKind kind, bool enabled) {
            if (!enabled) return;
            auto out = m_dispatcher->subscribe(kind);
            if (!out.ok()) {
                LOG_WARN("Auto-subscribe {} for {} failed: {}", robot::toString(kind),
                         m_remote, out.error().message);
            }
        };
        autoSubscribe(StreamKind::TOUCH, m_server.streams.touch_enabled);
        autoSubscribe(StreamKind::JOINTS, m_server.streams.joints_enabled);
        autoSubscribe(StreamKind::AUDIO, m_server.streams.audio_enabled);
    }

    // Worker strand
    void execute(const std::string& raw) {
        if (m_closed) return;
        sendFrame(m_dispatcher->handleFrame(raw));
    }

    void doRead() {
        m_ws.async_read(m_buffer,
                        beast::bind_front_handler(&Connection::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed) {
                LOG_DEBUG("Read from {} ended: {}", m_remote, ec.message());
            }
            onClosed();
            return;
        }

        std::string raw = beast::buffers_to_string(m_buffer.data());
        m_buffer.consume(m_buffer.size());
        m_server.framesReceived++;
        LOG_TRACE("Received from {}: {}", m_remote, raw);

        auto self = shared_from_this();
        net::post(m_worker, [self, raw = std::move(raw)]() { self->execute(raw); });

        doRead();
    }

    // Socket strand
    void enqueue(std::string frame, FrameClass frameClass) {
        if (m_closeRequested || m_closed) return;

        if (frameClass != FrameClass::ORDERED && m_writeQueue.size() > 1) {
            // The front frame is being written; only the ones behind it may be replaced
            auto it = std::find_if(std::next(m_writeQueue.begin()), m_writeQueue.end(),
                                   [frameClass](const Outbound& o) { return o.frameClass == frameClass; });
            if (it != m_writeQueue.end()) {
                it->text = std::move(frame);
                m_server.framesDropped++;
                return;
            }
        }

        m_writeQueue.push_back(Outbound{std::move(frame), frameClass});
        m_server.framesQueued++;
        if (m_writeQueue.size() > 1) return;
        doWrite();
    }

    void doWrite() {
        m_ws.text(true);
        m_ws.async_write(net::buffer(m_writeQueue.front().text),
                         beast::bind_front_handler(&Connection::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (m_closed) return;   // queue already cleared
        if (ec) {
            LOG_DEBUG("Write to {} failed: {}", m_remote, ec.message());
            onClosed();
            return;
        }

        m_server.framesSent++;
        m_server.framesQueued--;
        m_writeQueue.pop_front();

        if (!m_writeQueue.empty()) {
            doWrite();
        } else if (m_closeRequested) {
            doClose();
        }
    }

    void doClose() {
        auto self = shared_from_this();
        m_ws.async_close(websocket::close_code::normal, [self](beast::error_code) {
            self->onClosed();
        });
    }

    // Socket strand
    void onClosed() {
        if (m_closed.exchange(true)) return;

        m_server.closed++;
        m_server.framesQueued -= m_writeQueue.size();
        m_writeQueue.clear();
        beast::get_lowest_layer(m_ws).close();
        LOG_INFO("Client {} disconnected (connection {})", m_remote, m_id);

        // Queued commands see m_closed and are skipped
        auto self = shared_from_this();
        net::post(m_worker, [self]() {
            if (self->m_dispatcher) {
                self->m_dispatcher->teardown();
            }
            self->m_server.connectionClosed(self->m_id);
        });
    }

    websocket::stream<beast::tcp_stream> m_ws;
    Impl& m_server;
    uint64_t m_id;
    std::string m_remote;
    net::strand<net::thread_pool::executor_type> m_worker;
    std::unique_ptr<CommandDispatcher> m_dispatcher;
    beast::flat_buffer m_buffer;

    struct Outbound {
        std::string text;
        FrameClass frameClass;
    };

    // Socket strand only
    std::deque<Outbound> m_writeQueue;
    bool m_closeRequested = false;

    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_logsEnabled{false};
};

// ============================================================================
// Impl
// ============================================================================

void ConnectionServer::Impl::doAccept() {
    acceptor.async_accept(net::make_strand(ioContext),
                          [this](beast::error_code ec, tcp::socket socket) {
                              onAccept(ec, std::move(socket));
                          });
}

void ConnectionServer::Impl::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) return;
        LOG_WARN("Accept failed: {}", ec.message());
    } else {
        accepted++;
        std::make_shared<Connection>(std::move(socket), *this, nextId++)->run();
    }

    if (running && acceptor.is_open()) {
        doAccept();
    }
}

void ConnectionServer::Impl::registerConnection(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(connectionsMutex);
    connections[connection->id()] = connection;
}

void ConnectionServer::Impl::connectionClosed(uint64_t id) {
    bool last = false;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        connections.erase(id);
        last = connections.empty();
    }
    connectionsCv.notify_all();
    if (last) {
        releaseRobot();
    }
}

void ConnectionServer::Impl::ensureRobotReady() {
    std::lock_guard<std::mutex> lock(lifecycleMutex);

    if (!session.isConnected()) {
        auto out = session.connect();
        if (!out.ok()) {
            LOG_WARN("Robot not available: {}{}", out.error().message,
                     out.error().fatal ? " (restart required)" : "");
            return;
        }
    }

    if (!robotPrepared && sessionConfig.prepare_robot_on_client) {
        robotPrepared = true;
        auto prepared = session.prepareForInteraction();
        if (!prepared.ok()) {
            LOG_WARN("Robot preparation failed: {}", prepared.error().message);
        }
    }
}

void ConnectionServer::Impl::releaseRobot() {
    std::lock_guard<std::mutex> lock(lifecycleMutex);
    {
        std::lock_guard<std::mutex> connectionsLock(connectionsMutex);
        if (!connections.empty()) return;   // a new client arrived meanwhile
    }

    if (robotPrepared && session.isConnected()) {
        auto reset = session.resetAfterInteraction();
        if (!reset.ok()) {
            LOG_WARN("Robot reset failed: {}", reset.error().message);
        }
    }
    robotPrepared = false;

    if (sessionConfig.release_when_idle) {
        LOG_INFO("No client left, releasing robot");
        session.disconnect();
    }
}

void ConnectionServer::Impl::onLinkLost(const std::string& reason) {
    // Called from a backend thread: hand over to the I/O threads
    net::post(ioContext, [this, reason]() {
        LOG_WARN("Robot link lost ({}), closing all connections", reason);

        std::string frame = makeEvent("state", session.getStateInfo()).dump();

        std::vector<std::shared_ptr<Connection>> snapshot;
        {
            std::lock_guard<std::mutex> lock(connectionsMutex);
            for (auto& entry : connections) {
                snapshot.push_back(entry.second);
            }
        }
        for (auto& connection : snapshot) {
            connection->sendFrame(frame);
            connection->close();
        }
    });
}

void ConnectionServer::Impl::broadcastLog(const std::string& frame) {
    // Runs inside the logger: no logging here
    std::vector<std::shared_ptr<Connection>> targets;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        for (auto& entry : connections) {
            if (entry.second->acceptsLogs()) {
                targets.push_back(entry.second);
            }
        }
    }
    for (auto& connection : targets) {
        connection->sendFrame(frame);
    }
}

// ============================================================================
// ConnectionServer
// ============================================================================

ConnectionServer::ConnectionServer(robot::RobotSession& session,
                                   const config::ServerConfig& server,
                                   const config::StreamsConfig& streams,
                                   const config::SessionConfig& sessionConfig)
    : m_impl(std::make_unique<Impl>(session, server, streams, sessionConfig))
{
    LOG_DEBUG("ConnectionServer created for {}:{}", server.bind_address, server.port);
}

ConnectionServer::~ConnectionServer() {
    stop();
}

bool ConnectionServer::start() {
    if (m_impl->running) {
        LOG_WARN("ConnectionServer already running");
        return true;
    }
    if (m_impl->stopped) {
        LOG_ERROR("ConnectionServer cannot be restarted after stop()");
        return false;
    }

    const auto& cfg = m_impl->serverConfig;
    try {
        tcp::endpoint endpoint(net::ip::make_address(cfg.bind_address),
                               static_cast<unsigned short>(cfg.port));
        m_impl->acceptor.open(endpoint.protocol());
        m_impl->acceptor.set_option(net::socket_base::reuse_address(true));
        m_impl->acceptor.bind(endpoint);
        m_impl->acceptor.listen(net::socket_base::max_listen_connections);
        m_impl->boundPort = m_impl->acceptor.local_endpoint().port();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Failed to start message server on {}:{}: {}", cfg.bind_address, cfg.port, e.what());
        beast::error_code ignored;
        m_impl->acceptor.close(ignored);
        return false;
    }

    Impl* impl = m_impl.get();
    m_impl->session.setLinkLostHandler([impl](const std::string& reason) {
        impl->onLinkLost(reason);
    });

    auto forwardLevel = spdlog::level::from_str(cfg.log_forward_level);
    if (forwardLevel != spdlog::level::off) {
        m_impl->logSink = std::make_shared<ClientLogSink>([impl](const std::string& frame) {
            impl->broadcastLog(frame);
        });
        m_impl->logSink->set_level(forwardLevel);
        Logger::addSink(m_impl->logSink);
    }

    m_impl->running = true;
    m_impl->doAccept();

    int threads = std::max(1, cfg.io_threads);
    for (int i = 0; i < threads; ++i) {
        m_impl->ioThreads.emplace_back([impl]() {
            try {
                impl->ioContext.run();
            } catch (const std::exception& e) {
                LOG_ERROR("Message server I/O error: {}", e.what());
            }
        });
    }

    LOG_INFO("Message server listening on ws://{}:{} ({} I/O threads, {} workers)",
             cfg.bind_address, m_impl->boundPort, threads, std::max(1, cfg.worker_threads));
    return true;
}

void ConnectionServer::stop() {
    if (!m_impl->running.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping message server...");
    Impl* impl = m_impl.get();
    impl->stopped = true;
    if (impl->logSink) {
        Logger::removeSink(impl->logSink);
        impl->logSink.reset();
    }
    impl->session.setLinkLostHandler(nullptr);

    net::post(impl->acceptor.get_executor(), [impl]() {
        beast::error_code ignored;
        impl->acceptor.close(ignored);
    });

    // Regular close path: teardown and robot release run on the workers
    std::vector<std::shared_ptr<Connection>> open;
    {
        std::lock_guard<std::mutex> lock(impl->connectionsMutex);
        for (auto& entry : impl->connections) {
            open.push_back(entry.second);
        }
    }
    for (auto& connection : open) {
        connection->abort();
    }
    open.clear();
    size_t lingering = 0;
    {
        std::unique_lock<std::mutex> lock(impl->connectionsMutex);
        impl->connectionsCv.wait_for(lock, std::chrono::milliseconds(Impl::STOP_TIMEOUT_MS),
                                     [impl]() { return impl->connections.empty(); });
        lingering = impl->connections.size();
    }
    if (lingering > 0) {
        LOG_WARN("{} connections did not close in time", lingering);
    }

    impl->ioContext.stop();
    for (auto& thread : impl->ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    impl->ioThreads.clear();

    // No stop(): join waits for queued commands so no handler outlives the pool
    impl->workers.join();

    beast::error_code ignored;
    impl->acceptor.close(ignored);

    std::map<uint64_t, std::shared_ptr<Connection>> remaining;
    {
        std::lock_guard<std::mutex> lock(impl->connectionsMutex);
        remaining.swap(impl->connections);
    }
    for (auto& entry : remaining) {
        entry.second->shutdown();
    }
    if (!remaining.empty()) {
        impl->releaseRobot();
    }

    LOG_INFO("Message server stopped");
}

bool ConnectionServer::isRunning() const {
    return m_impl->running;
}

uint16_t ConnectionServer::port() const {
    return m_impl->boundPort;
}

size_t ConnectionServer::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_impl->connectionsMutex);
    return m_impl->connections.size();
}

ConnectionServer::Stats ConnectionServer::getStats() const {
    Stats stats;
    stats.connections_accepted = m_impl->accepted;
    stats.connections_closed = m_impl->closed;
    stats.frames_received = m_impl->framesReceived;
    stats.frames_sent = m_impl->framesSent;
    stats.frames_dropped = m_impl->framesDropped;
    stats.frames_queued = m_impl->framesQueued;
    return stats;
}

} // namespace server
} // namespace nao_bridge
