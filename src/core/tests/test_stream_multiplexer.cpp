/**
 * @file test_stream_multiplexer.cpp
 * @brief Stream multiplexer tests
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>
#include "stream/StreamMultiplexer.hpp"
#include "logging/Logger.hpp"

using namespace nao_bridge;
using namespace nao_bridge::stream;
using robot::StreamEvent;
using robot::StreamKind;

namespace {

StreamEvent touchEvent(uint64_t sequence, int state = 1) {
    StreamEvent event;
    event.sequence = sequence;
    event.data = robot::TouchEvent{"FrontTactilTouched", state};
    return event;
}

StreamEvent jointsEvent(uint64_t sequence) {
    StreamEvent event;
    event.sequence = sequence;
    event.data = robot::JointsFrame{{"HeadYaw"}, {0.1f * static_cast<float>(sequence)}};
    return event;
}

StreamEvent audioEvent(uint64_t sequence) {
    StreamEvent event;
    event.sequence = sequence;
    robot::AudioFrame frame;
    frame.samplesPerChannel = 2;
    frame.payload = {1, 2, 3, 4};
    event.data = frame;
    return event;
}

/// Collects delivered sequence numbers
class Recorder {
public:
    EventHandler handler() {
        return [this](const StreamEvent& event) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_sequences.push_back(event.sequence);
            m_cv.notify_all();
        };
    }

    bool waitFor(size_t count, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this, count]() { return m_sequences.size() >= count; });
    }

    std::vector<uint64_t> sequences() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sequences;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<uint64_t> m_sequences;
};

/// Blocks the handler until released
class Gate {
public:
    void open() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = true;
        m_cv.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]() { return m_open; });
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open = false;
};

} // namespace

class StreamMultiplexerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_stream_multiplexer.log", "debug");
    }
};

TEST_F(StreamMultiplexerTest, TouchDeliveredInOrderWithoutLoss) {
    StreamMultiplexer mux;
    Recorder recorder;
    mux.subscribe(StreamKind::TOUCH, "client-a", recorder.handler());

    for (uint64_t i = 1; i <= 200; ++i) {
        mux.publish(touchEvent(i, static_cast<int>(i % 2)));
    }

    ASSERT_TRUE(recorder.waitFor(200));
    auto sequences = recorder.sequences();
    ASSERT_EQ(sequences.size(), 200u);
    for (size_t i = 0; i < sequences.size(); ++i) {
        EXPECT_EQ(sequences[i], i + 1);
    }

    auto stats = mux.getStats();
    EXPECT_EQ(stats.published, 200u);
    EXPECT_EQ(stats.dropped, 0u);
}

TEST_F(StreamMultiplexerTest, EventsOnlyReachTheirKind) {
    StreamMultiplexer mux;
    Recorder touch;
    Recorder joints;
    mux.subscribe(StreamKind::TOUCH, "client", touch.handler());
    mux.subscribe(StreamKind::JOINTS, "client", joints.handler());

    mux.publish(touchEvent(1));
    mux.publish(audioEvent(1));

    ASSERT_TRUE(touch.waitFor(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(touch.sequences().size(), 1u);
    EXPECT_TRUE(joints.sequences().empty());
}

TEST_F(StreamMultiplexerTest, SlowJointsConsumerKeepsOnlyLatest) {
    Gate gate;
    std::atomic<bool> firstEntered{false};
    std::mutex mutex;
    std::vector<uint64_t> seen;
    StreamMultiplexer mux;

    mux.subscribe(StreamKind::JOINTS, "slow", [&](const StreamEvent& event) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(event.sequence);
        }
        if (!firstEntered.exchange(true)) {
            gate.wait();
        }
    });

    mux.publish(jointsEvent(1));
    while (!firstEntered) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    // Handler is blocked on event 1: 2..10 compete for the single slot
    for (uint64_t i = 2; i <= 10; ++i) {
        mux.publish(jointsEvent(i));
    }
    gate.open();

    for (int i = 0; i < 200; ++i) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (seen.size() >= 2) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], 1u);
    EXPECT_EQ(seen[1], 10u);
    EXPECT_EQ(mux.getStats().dropped, 8u);
}

TEST_F(StreamMultiplexerTest, SlowConsumerDoesNotStallOthers) {
    Gate gate;
    Recorder fast;
    Recorder fastTouch;
    StreamMultiplexer mux;

    mux.subscribe(StreamKind::AUDIO, "slow", [&gate](const StreamEvent&) { gate.wait(); });
    mux.subscribe(StreamKind::AUDIO, "fast", fast.handler());
    mux.subscribe(StreamKind::TOUCH, "slow", fastTouch.handler());

    mux.publish(audioEvent(1));
    mux.publish(touchEvent(1));

    EXPECT_TRUE(fast.waitFor(1));
    EXPECT_TRUE(fastTouch.waitFor(1));

    gate.open();
}

TEST_F(StreamMultiplexerTest, ResubscribeReplacesHandler) {
    StreamMultiplexer mux;
    Recorder first;
    Recorder second;

    mux.subscribe(StreamKind::TOUCH, "client", first.handler());
    mux.subscribe(StreamKind::TOUCH, "client", second.handler());
    EXPECT_EQ(mux.subscriberCount(StreamKind::TOUCH), 1u);

    mux.publish(touchEvent(1));
    ASSERT_TRUE(second.waitFor(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(first.sequences().empty());
    EXPECT_EQ(second.sequences().size(), 1u);
}

TEST_F(StreamMultiplexerTest, UnsubscribeIsSynchronous) {
    StreamMultiplexer mux;
    std::atomic<int> calls{0};
    std::atomic<bool> unsubscribed{false};
    std::atomic<bool> lateCall{false};

    mux.subscribe(StreamKind::TOUCH, "client", [&](const StreamEvent&) {
        if (unsubscribed) lateCall = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        calls++;
    });

    for (uint64_t i = 1; i <= 50; ++i) {
        mux.publish(touchEvent(i));
    }
    EXPECT_TRUE(mux.unsubscribe(StreamKind::TOUCH, "client"));
    unsubscribed = true;

    int callsAtUnsubscribe = calls.load();
    for (uint64_t i = 51; i <= 60; ++i) {
        mux.publish(touchEvent(i));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_FALSE(lateCall);
    EXPECT_EQ(calls.load(), callsAtUnsubscribe);
    EXPECT_FALSE(mux.isSubscribed(StreamKind::TOUCH, "client"));
}

TEST_F(StreamMultiplexerTest, UnsubscribeUnknownConsumer) {
    StreamMultiplexer mux;
    EXPECT_FALSE(mux.unsubscribe(StreamKind::JOINTS, "nobody"));
}

TEST_F(StreamMultiplexerTest, UnsubscribeFromOwnHandler) {
    StreamMultiplexer mux;
    std::atomic<int> calls{0};

    mux.subscribe(StreamKind::TOUCH, "self-removing", [&](const StreamEvent&) {
        calls++;
        mux.unsubscribe(StreamKind::TOUCH, "self-removing");
    });

    mux.publish(touchEvent(1));
    mux.publish(touchEvent(2));
    mux.publish(touchEvent(3));

    for (int i = 0; i < 100 && mux.isSubscribed(StreamKind::TOUCH, "self-removing"); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_FALSE(mux.isSubscribed(StreamKind::TOUCH, "self-removing"));
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(StreamMultiplexerTest, UnsubscribeAllRemovesEveryKind) {
    StreamMultiplexer mux;
    Recorder recorder;
    mux.subscribe(StreamKind::TOUCH, "client", recorder.handler());
    mux.subscribe(StreamKind::AUDIO, "client", recorder.handler());
    mux.subscribe(StreamKind::AUDIO, "other", recorder.handler());

    auto removed = mux.unsubscribeAll("client");
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_EQ(mux.subscriberCount(StreamKind::TOUCH), 0u);
    EXPECT_EQ(mux.subscriberCount(StreamKind::AUDIO), 1u);
    EXPECT_TRUE(mux.isSubscribed(StreamKind::AUDIO, "other"));
}

TEST_F(StreamMultiplexerTest, ClearDropsEverything) {
    StreamMultiplexer mux;
    Recorder recorder;
    mux.subscribe(StreamKind::TOUCH, "a", recorder.handler());
    mux.subscribe(StreamKind::JOINTS, "b", recorder.handler());

    mux.clear();
    mux.publish(touchEvent(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_EQ(mux.subscriberCount(StreamKind::TOUCH), 0u);
    EXPECT_EQ(mux.subscriberCount(StreamKind::JOINTS), 0u);
    EXPECT_TRUE(recorder.sequences().empty());
}

TEST_F(StreamMultiplexerTest, HandlerExceptionDoesNotStopChannel) {
    StreamMultiplexer mux;
    Recorder recorder;
    auto record = recorder.handler();

    mux.subscribe(StreamKind::TOUCH, "client", [&](const StreamEvent& event) {
        if (event.sequence == 1) {
            throw std::runtime_error("handler failure");
        }
        record(event);
    });

    mux.publish(touchEvent(1));
    mux.publish(touchEvent(2));

    ASSERT_TRUE(recorder.waitFor(1));
    EXPECT_EQ(recorder.sequences().front(), 2u);
}

TEST_F(StreamMultiplexerTest, PublishWithoutSubscribers) {
    StreamMultiplexer mux;
    mux.publish(jointsEvent(1));
    EXPECT_EQ(mux.getStats().published, 1u);
    EXPECT_EQ(mux.getStats().delivered, 0u);
}
