/**
 * @file StreamMultiplexer.cpp
 * @brief Stream multiplexer implementation
 */

#include "StreamMultiplexer.hpp"
#include "../logging/Logger.hpp"

namespace nao_bridge {
namespace stream {

using robot::StreamKind;

StreamMultiplexer::StreamMultiplexer()
    : m_counters(std::make_shared<StreamCounters>())
{
}

StreamMultiplexer::~StreamMultiplexer() {
    clear();
}

void StreamMultiplexer::subscribe(StreamKind kind, const ConsumerId& consumer, EventHandler handler) {
    auto channel = std::make_shared<StreamChannel>(kind, consumer, std::move(handler), m_counters);
    channel->start();

    std::shared_ptr<StreamChannel> replaced;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& slot = m_channels[indexOf(kind)][consumer];
        replaced = std::move(slot);
        slot = channel;
    }

    if (replaced) {
        replaced->close();
        LOG_DEBUG("Replaced {} handler of consumer {}", robot::toString(kind), consumer);
    } else {
        LOG_DEBUG("Consumer {} subscribed to {}", consumer, robot::toString(kind));
    }
}

bool StreamMultiplexer::unsubscribe(StreamKind kind, const ConsumerId& consumer) {
    std::shared_ptr<StreamChannel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& channels = m_channels[indexOf(kind)];
        auto it = channels.find(consumer);
        if (it == channels.end()) {
            return false;
        }
        channel = std::move(it->second);
        channels.erase(it);
    }

    channel->close();
    LOG_DEBUG("Consumer {} unsubscribed from {}", consumer, robot::toString(kind));
    return true;
}

std::vector<StreamKind> StreamMultiplexer::unsubscribeAll(const ConsumerId& consumer) {
    std::vector<StreamKind> removed;
    std::vector<std::shared_ptr<StreamChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = 0; i < m_channels.size(); ++i) {
            auto it = m_channels[i].find(consumer);
            if (it != m_channels[i].end()) {
                channels.push_back(std::move(it->second));
                removed.push_back(static_cast<StreamKind>(i));
                m_channels[i].erase(it);
            }
        }
    }

    for (auto& channel : channels) {
        channel->close();
    }
    return removed;
}

void StreamMultiplexer::clear() {
    std::vector<std::shared_ptr<StreamChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& map : m_channels) {
            for (auto& entry : map) {
                channels.push_back(std::move(entry.second));
            }
            map.clear();
        }
    }

    for (auto& channel : channels) {
        channel->close();
    }
    if (!channels.empty()) {
        LOG_INFO("Stream multiplexer cleared ({} channels)", channels.size());
    }
}

void StreamMultiplexer::publish(const robot::StreamEvent& event) {
    std::vector<std::shared_ptr<StreamChannel>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto& channels = m_channels[indexOf(event.kind())];
        targets.reserve(channels.size());
        for (const auto& entry : channels) {
            targets.push_back(entry.second);
        }
    }

    m_counters->published++;
    for (auto& channel : targets) {
        channel->push(event);
    }
}

size_t StreamMultiplexer::subscriberCount(StreamKind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels[indexOf(kind)].size();
}

bool StreamMultiplexer::isSubscribed(StreamKind kind, const ConsumerId& consumer) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels[indexOf(kind)].count(consumer) > 0;
}

StreamMultiplexer::Stats StreamMultiplexer::getStats() const {
    Stats stats;
    stats.published = m_counters->published;
    stats.delivered = m_counters->delivered;
    stats.dropped = m_counters->dropped;
    return stats;
}

} // namespace stream
} // namespace nao_bridge
