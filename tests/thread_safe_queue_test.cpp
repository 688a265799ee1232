// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for autotrader::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering
//   - try_pop() on empty and non-empty queues
//   - No lost or duplicated items under concurrent producers and consumers
// =============================================================================

#include "autotrader/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  autotrader::ThreadSafeQueue<int> queue;
};

TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  for (int i = 0; i < 5; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 5u);

  for (int i = 0; i < 5; ++i) {
    auto v = queue.try_pop();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, i);
  }
  EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueueMoveTest, MoveOnlyValues) {
  autotrader::ThreadSafeQueue<std::unique_ptr<std::string>> q;
  q.push(std::make_unique<std::string>("telemetry"));

  auto v = q.try_pop();
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(**v, "telemetry");
}

// -----------------------------------------------------------------------------
// 2. Four producers and two consumers: every item delivered exactly once.
// Why: The orchestrator thread pushes while the control thread drains.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 1000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(p * kPerProducer + i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> seen(2);
  std::vector<std::thread> consumers;
  for (int c = 0; c < 2; ++c) {
    consumers.emplace_back([this, c, &consumed, &seen] {
      while (consumed.load() < kTotal) {
        if (auto v = queue.try_pop()) {
          seen[c].push_back(*v);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::set<int> all;
  for (const auto& s : seen) {
    all.insert(s.begin(), s.end());
  }
  EXPECT_EQ(static_cast<int>(all.size()), kTotal);
  EXPECT_TRUE(queue.empty());
}
