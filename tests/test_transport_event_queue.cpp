#include <gtest/gtest.h>
#include "transport_event_queue.h"
#include <atomic>
#include <chrono>
#include <map>
#include <stdexcept>
#include <mutex>
#include <thread>
#include <vector>

using namespace whisp;
using namespace std::chrono_literals;

TEST(TransportEventQueueTest, InlineDispatchWithoutLanes) {
    std::thread::id handler_thread;
    int handled = 0;
    TransportEventQueue queue(0, 16, [&](const TransportEvent& event) {
        handler_thread = std::this_thread::get_id();
        EXPECT_EQ(event.type, TransportEventType::PULL_REQUEST);
        ++handled;
    });

    EXPECT_TRUE(queue.post(TransportEvent::pull_request(1, 2, 0, 5)));
    EXPECT_EQ(handled, 1);
    EXPECT_EQ(handler_thread, std::this_thread::get_id());
    EXPECT_EQ(queue.lane_count(), 0u);
    queue.drain();
}

TEST(TransportEventQueueTest, EventFactoriesFillFields) {
    TransportEvent announce = TransportEvent::announce(4, 9, FileKind::AVATAR, 123, "me.png");
    EXPECT_EQ(announce.type, TransportEventType::ANNOUNCE);
    EXPECT_EQ(announce.key(), TransportKey(4, 9));
    EXPECT_EQ(announce.kind, FileKind::AVATAR);
    EXPECT_EQ(announce.file_size, 123u);
    EXPECT_EQ(announce.file_name, "me.png");

    TransportEvent chunk = TransportEvent::chunk(4, 9, 100, {1, 2, 3});
    EXPECT_EQ(chunk.type, TransportEventType::CHUNK);
    EXPECT_EQ(chunk.position, 100u);
    EXPECT_EQ(chunk.length, 3u);
    EXPECT_EQ(chunk.data.size(), 3u);
}

TEST(TransportEventQueueTest, PreservesOrderPerKey) {
    std::mutex mutex;
    std::map<FileHandle, std::vector<uint64_t>> seen;

    TransportEventQueue queue(4, 8, [&](const TransportEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        seen[event.file_handle].push_back(event.position);
    });

    const int events_per_key = 200;
    for (int i = 0; i < events_per_key; ++i) {
        for (FileHandle handle = 0; handle < 6; ++handle) {
            ASSERT_TRUE(queue.post(TransportEvent::pull_request(1, handle, i, 1)));
        }
    }
    queue.drain();

    ASSERT_EQ(seen.size(), 6u);
    for (const auto& entry : seen) {
        ASSERT_EQ(entry.second.size(), static_cast<size_t>(events_per_key));
        for (int i = 0; i < events_per_key; ++i) {
            EXPECT_EQ(entry.second[i], static_cast<uint64_t>(i));
        }
    }
    EXPECT_EQ(queue.pending(), 0u);
}

TEST(TransportEventQueueTest, PostBlocksWhileLaneIsFull) {
    std::mutex gate;
    std::unique_lock<std::mutex> hold(gate);
    std::atomic<int> handled{0};

    TransportEventQueue queue(1, 1, [&](const TransportEvent&) {
        std::lock_guard<std::mutex> lock(gate);
        ++handled;
    });

    // First event occupies the worker, second fills the lane
    ASSERT_TRUE(queue.post(TransportEvent::pull_request(1, 1, 0, 1)));
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(queue.post(TransportEvent::pull_request(1, 1, 1, 1)));

    std::atomic<bool> third_posted{false};
    std::thread producer([&]() {
        queue.post(TransportEvent::pull_request(1, 1, 2, 1));
        third_posted = true;
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(third_posted.load());

    hold.unlock();
    producer.join();
    queue.drain();

    EXPECT_TRUE(third_posted.load());
    EXPECT_EQ(handled.load(), 3);
}

TEST(TransportEventQueueTest, StopRejectsFurtherEvents) {
    std::atomic<int> handled{0};
    TransportEventQueue queue(2, 4, [&](const TransportEvent&) { ++handled; });

    EXPECT_TRUE(queue.is_running());
    queue.stop();
    EXPECT_FALSE(queue.is_running());
    EXPECT_FALSE(queue.post(TransportEvent::pull_request(1, 1, 0, 1)));
    EXPECT_EQ(handled.load(), 0);

    // Second stop is a no-op
    queue.stop();
    queue.drain();
}

TEST(TransportEventQueueTest, HandlerExceptionsDoNotKillWorker) {
    std::atomic<int> handled{0};
    TransportEventQueue queue(1, 4, [&](const TransportEvent& event) {
        ++handled;
        if (event.position == 0) {
            throw std::runtime_error("handler failure");
        }
    });

    queue.post(TransportEvent::pull_request(1, 1, 0, 1));
    queue.post(TransportEvent::pull_request(1, 1, 1, 1));
    queue.drain();

    EXPECT_EQ(handled.load(), 2);
}

TEST(TransportEventQueueTest, ZeroCapacityBecomesOne) {
    TransportEventQueue queue(1, 0, [](const TransportEvent&) {});
    EXPECT_EQ(queue.capacity(), 1u);
}
