// =============================================================================
// concurrency_test.cpp
// =============================================================================
// Multi-threaded tests for optimistic commits.
//
// Validates:
//   - Concurrent issuance against shared lots never double-spends: every
//     unit consumed belongs to exactly one successful issue
//   - Lots never go negative and the balance law holds afterwards
//   - Document numbers stay unique across threads
//   - runTransaction retries conflicts and gives up after max attempts
// =============================================================================

#include "engine_fixture.hpp"

#include "mfg/concurrent/document_number_generator.hpp"
#include "mfg/errors/errors.hpp"
#include "mfg/store/unit_of_work.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace mfg_test;

class ConcurrentIssueTest : public EngineFixture {
 protected:
  mfg::domain::EngineConfig config() const override {
    auto cfg = offlineConfig();
    cfg.max_allocation_retries = 100;
    return cfg;
  }
};

TEST_F(ConcurrentIssueTest, NoDoubleSpendUnderContention) {
  constexpr int kThreads = 8;
  constexpr int kOrdersPerThread = 5;
  constexpr double kPerOrder = 3.0;

  // 25 orders' worth of stock for 40 orders.
  receive(kMaterialA, "A-1", 30, "2025-02-01");
  receive(kMaterialA, "A-2", 25, "2025-03-01");
  receive(kMaterialA, "A-3", 20, std::nullopt);

  const auto bom = activeBom(mfg::domain::BomType::Cutting, kCutSheet,
                             {line(kMaterialA, kPerOrder)});

  std::vector<mfg::domain::OrderId> order_ids;
  for (int i = 0; i < kThreads * kOrdersPerThread; ++i) {
    order_ids.push_back(createOrder(bom.id, 1).id);
  }

  std::atomic<int> issued{0};
  std::atomic<int> short_of_stock{0};
  std::atomic<int> conflicts{0};
  std::atomic<bool> go{false};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      for (int i = 0; i < kOrdersPerThread; ++i) {
        const auto id = order_ids[t * kOrdersPerThread + i];
        try {
          service().issueMaterials(id, "worker-" + std::to_string(t));
          issued.fetch_add(1);
        } catch (const mfg::InsufficientStockError&) {
          short_of_stock.fetch_add(1);
        } catch (const mfg::ConcurrencyConflictError&) {
          conflicts.fetch_add(1);
        }
      }
    });
  }
  go.store(true);
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(issued + short_of_stock + conflicts, kThreads * kOrdersPerThread);
  EXPECT_LE(issued.load(), 25);

  const double consumed = 75.0 - ledger().balance(kMaterialA);
  EXPECT_NEAR(consumed, issued.load() * kPerOrder, 1e-6);
  EXPECT_NEAR(ledger().netQuantity(kMaterialA), ledger().balance(kMaterialA),
              1e-6);

  for (const auto& lot : ledger().lots(kMaterialA, kMain)) {
    EXPECT_GE(lot.remain, 0.0) << "lot " << lot.id;
  }

  int in_progress = 0;
  for (const auto id : order_ids) {
    const auto order = engine->orders().getOrder(id);
    if (order.status == mfg::domain::OrderStatus::InProgress) {
      ++in_progress;
      EXPECT_EQ(engine->orders().issuesOf(id).size(), 1u);
    } else {
      EXPECT_EQ(order.status, mfg::domain::OrderStatus::Confirmed);
      EXPECT_TRUE(engine->orders().issuesOf(id).empty());
    }
  }
  EXPECT_EQ(in_progress, issued.load());

  // With this much retry headroom every shortfall is a real one.
  if (short_of_stock.load() > 0) {
    EXPECT_LT(ledger().balance(kMaterialA), kPerOrder + 1e-9);
  }
}

TEST_F(ConcurrentIssueTest, SameOrderIssuedOnlyOnce) {
  receive(kMaterialA, "A-1", 100, std::nullopt);
  const auto bom = activeBom(mfg::domain::BomType::Cutting, kCutSheet,
                             {line(kMaterialA, 1)});
  const auto order = createOrder(bom.id, 10);

  std::atomic<int> succeeded{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 6; ++t) {
    threads.emplace_back([&] {
      try {
        service().issueMaterials(order.id, "worker");
        succeeded.fetch_add(1);
      } catch (const mfg::InvalidStateTransitionError&) {
        rejected.fetch_add(1);
      } catch (const mfg::ConcurrencyConflictError&) {
        rejected.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(succeeded.load(), 1);
  EXPECT_EQ(rejected.load(), 5);
  EXPECT_DOUBLE_EQ(ledger().balance(kMaterialA), 90.0);
  EXPECT_EQ(engine->orders().issuesOf(order.id).size(), 1u);
}

TEST(DocumentNumberConcurrencyTest, NumbersAreUniqueAcrossThreads) {
  mfg::SimulationTimeProvider clock(date("2025-01-10"));
  mfg::DocumentNumberGenerator numbers(clock);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;
  std::vector<std::vector<std::string>> produced(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        produced[t].push_back(numbers.next("MO"));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::string> all;
  for (const auto& batch : produced) {
    all.insert(batch.begin(), batch.end());
  }
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(numbers.issuedCount(), all.size());
  EXPECT_EQ(*all.begin(), "MO-20250110000000-0000");
}

TEST(RunTransactionTest, RetriesConflictsThenGivesUp) {
  int attempts = 0;
  const int value = mfg::runTransaction(3, "flaky", [&] {
    if (++attempts < 3) {
      throw mfg::ConcurrencyConflictError("stale");
    }
    return 42;
  });
  EXPECT_EQ(value, 42);
  EXPECT_EQ(attempts, 3);

  attempts = 0;
  EXPECT_THROW(mfg::runTransaction(2, "hopeless",
                                   [&]() -> int {
                                     ++attempts;
                                     throw mfg::ConcurrencyConflictError("x");
                                   }),
               mfg::ConcurrencyConflictError);
  EXPECT_EQ(attempts, 2);

  attempts = 0;
  EXPECT_THROW(mfg::runTransaction(5, "invalid",
                                   [&]() -> int {
                                     ++attempts;
                                     throw mfg::ValidationError("bad");
                                   }),
               mfg::ValidationError);
  EXPECT_EQ(attempts, 1);
}
