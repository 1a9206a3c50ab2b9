// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for mfg::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO order through push/pop and try_pop
//   - drain() hands over everything queued, oldest first
//   - Blocking pop() wakes when another thread pushes
//   - Many command threads pushing while one telemetry thread drains: every
//     item arrives exactly once (the IpcServer usage pattern)
// =============================================================================

#include "mfg/concurrent/thread_safe_queue.hpp"
#include "mfg/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  mfg::ThreadSafeQueue<int> queue;
};

TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST_F(ThreadSafeQueueTest, PopReturnsItemsInPushOrder) {
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 25; ++i) {
    EXPECT_EQ(queue.pop(), i);
  }
  for (int i = 25; i < 50; ++i) {
    auto item = queue.try_pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, i);
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// drain() is what the IPC loop calls between polls: one lock, everything out.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, DrainTakesEverythingOldestFirst) {
  queue.push(7);
  queue.push(8);
  queue.push(9);

  auto drained = queue.drain();

  ASSERT_EQ(drained.size(), 3u);
  EXPECT_EQ(drained[0], 7);
  EXPECT_EQ(drained[1], 8);
  EXPECT_EQ(drained[2], 9);
  EXPECT_TRUE(queue.empty());
  EXPECT_TRUE(queue.drain().empty());
}

TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// Several producers, one draining consumer. Nothing lost, nothing doubled.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushWithSingleDrainer) {
  constexpr int kProducers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::vector<int> all;
  std::thread drainer([this, &all] {
    while (static_cast<int>(all.size()) < kTotalItems) {
      for (int item : queue.drain()) {
        all.push_back(item);
      }
      std::this_thread::yield();
    }
  });

  for (auto& t : producers) t.join();
  drainer.join();

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  std::sort(all.begin(), all.end());
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}

TEST(ThreadSafeQueueEventTest, CarriesEventVariantByValue) {
  mfg::ThreadSafeQueue<mfg::Event> events;

  mfg::StockReceivedEvent received;
  received.lot.id = 12;
  received.lot.batch_no = "SUG-01";
  received.sequence_id = 3;
  events.push(received);

  mfg::OrderUpdateEvent update;
  update.order.order_no = "MO-20250101000000-0001";
  events.push(update);

  auto drained = events.drain();
  ASSERT_EQ(drained.size(), 2u);

  const auto* first = std::get_if<mfg::StockReceivedEvent>(&drained[0]);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->lot.id, 12u);
  EXPECT_EQ(first->lot.batch_no, "SUG-01");

  const auto* second = std::get_if<mfg::OrderUpdateEvent>(&drained[1]);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->order.order_no, "MO-20250101000000-0001");
}
