/**
 * @file StreamChannel.hpp
 * @brief Delivery channel for one (stream kind, consumer) pair
 *
 * Each channel owns a worker thread and a queue:
 * - TOUCH: unbounded FIFO, nothing is dropped
 * - JOINTS / AUDIO: depth-1 slot, a new event replaces the pending one
 */

#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <memory>
#include <string>
#include <functional>
#include "../robot/RobotTypes.hpp"

namespace nao_bridge {
namespace stream {

using ConsumerId = std::string;
using EventHandler = std::function<void(const robot::StreamEvent&)>;

/**
 * Counters shared between the multiplexer and its channels
 */
struct StreamCounters {
    std::atomic<uint64_t> published{0};
    std::atomic<uint64_t> delivered{0};
    std::atomic<uint64_t> dropped{0};
};

class StreamChannel : public std::enable_shared_from_this<StreamChannel> {
public:
    StreamChannel(robot::StreamKind kind, ConsumerId consumer, EventHandler handler,
                  std::shared_ptr<StreamCounters> counters);
    ~StreamChannel();

    StreamChannel(const StreamChannel&) = delete;
    StreamChannel& operator=(const StreamChannel&) = delete;

    /**
     * Start the worker thread (the thread keeps the channel alive until it exits)
     */
    void start();

    /**
     * Queue an event. Never blocks on the handler.
     */
    void push(const robot::StreamEvent& event);

    /**
     * Stop delivery. Waits for an in-flight delivery to finish unless called
     * from this channel's own handler, in which case the pending queue is
     * discarded and the worker exits once the handler returns.
     */
    void close();

    robot::StreamKind kind() const { return m_kind; }
    const ConsumerId& consumer() const { return m_consumer; }
    bool isBounded() const { return m_bounded; }
    size_t pending() const;

private:
    void run();

    const robot::StreamKind m_kind;
    const ConsumerId m_consumer;
    const bool m_bounded;
    EventHandler m_handler;
    std::shared_ptr<StreamCounters> m_counters;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<robot::StreamEvent> m_queue;
    bool m_closed = false;
    std::thread m_thread;
};

} // namespace stream
} // namespace nao_bridge
