/**
 * @file StreamMultiplexer.hpp
 * @brief Fans backend stream events out to per-consumer delivery channels
 */

#pragma once

#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "StreamChannel.hpp"

namespace nao_bridge {
namespace stream {

/**
 * Stream Multiplexer
 *
 * Owns one StreamChannel per (kind, consumer). A slow consumer only
 * delays its own channel; publish() never waits on a handler.
 * At most one channel exists per (kind, consumer): subscribing again
 * replaces the handler.
 */
class StreamMultiplexer {
public:
    struct Stats {
        uint64_t published = 0;
        uint64_t delivered = 0;
        uint64_t dropped = 0;
    };

    StreamMultiplexer();
    ~StreamMultiplexer();

    StreamMultiplexer(const StreamMultiplexer&) = delete;
    StreamMultiplexer& operator=(const StreamMultiplexer&) = delete;

    /**
     * Register (or replace) the handler of a consumer for one stream kind
     */
    void subscribe(robot::StreamKind kind, const ConsumerId& consumer, EventHandler handler);

    /**
     * Remove a consumer's channel. Synchronous: once this returns the
     * handler is not called again.
     * @return true if a channel existed
     */
    bool unsubscribe(robot::StreamKind kind, const ConsumerId& consumer);

    /**
     * Remove every channel of a consumer
     * @return kinds that were removed
     */
    std::vector<robot::StreamKind> unsubscribeAll(const ConsumerId& consumer);

    /**
     * Remove every channel of every consumer
     */
    void clear();

    /**
     * Hand an event to every channel of its kind
     */
    void publish(const robot::StreamEvent& event);

    size_t subscriberCount(robot::StreamKind kind) const;
    bool isSubscribed(robot::StreamKind kind, const ConsumerId& consumer) const;

    Stats getStats() const;

private:
    using ChannelMap = std::map<ConsumerId, std::shared_ptr<StreamChannel>>;

    static size_t indexOf(robot::StreamKind kind) { return static_cast<size_t>(kind); }

    mutable std::mutex m_mutex;
    std::array<ChannelMap, robot::STREAM_KIND_COUNT> m_channels;
    std::shared_ptr<StreamCounters> m_counters;
};

} // namespace stream
} // namespace nao_bridge
