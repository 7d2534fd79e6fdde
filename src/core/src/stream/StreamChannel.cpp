/**
 * @file StreamChannel.cpp
 * @brief Per-consumer delivery worker
 */

#include "StreamChannel.hpp"
#include "../logging/Logger.hpp"

namespace nao_bridge {
namespace stream {

StreamChannel::StreamChannel(robot::StreamKind kind, ConsumerId consumer, EventHandler handler,
                             std::shared_ptr<StreamCounters> counters)
    : m_kind(kind)
    , m_consumer(std::move(consumer))
    , m_bounded(kind != robot::StreamKind::TOUCH)
    , m_handler(std::move(handler))
    , m_counters(std::move(counters))
{
}

StreamChannel::~StreamChannel() {
    // Only reached after the worker exited (it holds a reference while running)
    if (m_thread.joinable()) {
        m_thread.detach();
    }
}

void StreamChannel::start() {
    auto self = shared_from_this();
    m_thread = std::thread([self]() { self->run(); });
}

void StreamChannel::push(const robot::StreamEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        if (m_bounded && !m_queue.empty()) {
            // Freshness over completeness
            m_queue.pop_front();
            m_counters->dropped++;
        }
        m_queue.push_back(event);
    }
    m_cv.notify_one();
}

void StreamChannel::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        m_queue.clear();
    }
    m_cv.notify_all();

    if (!m_thread.joinable()) {
        return;
    }
    if (m_thread.get_id() == std::this_thread::get_id()) {
        // Closed from our own handler: let the worker run out on its own
        m_thread.detach();
    } else {
        m_thread.join();
    }
    LOG_DEBUG("Stream channel {}/{} closed", robot::toString(m_kind), m_consumer);
}

size_t StreamChannel::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void StreamChannel::run() {
    LOG_DEBUG("Stream channel {}/{} started", robot::toString(m_kind), m_consumer);

    while (true) {
        robot::StreamEvent event;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_closed || !m_queue.empty(); });
            if (m_closed) {
                break;
            }
            event = std::move(m_queue.front());
            m_queue.pop_front();
        }

        try {
            m_handler(event);
            m_counters->delivered++;
        } catch (const std::exception& e) {
            LOG_ERROR("Stream handler {}/{} threw: {}", robot::toString(m_kind), m_consumer, e.what());
        }
    }
}

} // namespace stream
} // namespace nao_bridge
