// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for mfg::EventBus.
//
// Validates:
//   - Generic subscription receives every event kind
//   - Typed subscription receives only its kind, with the payload intact
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A subscriber may publish from inside its callback without deadlock
//
// All tests are single-threaded. Cross-thread delivery (command thread to
// IPC thread) goes through ThreadSafeQueue and is covered there.
// =============================================================================

#include "mfg/eventbus/event_bus.hpp"
#include "mfg/events/event.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  mfg::EventBus bus;

  static mfg::OrderUpdateEvent makeOrderUpdate(
      const std::string& order_no, mfg::domain::OrderStatus status) {
    mfg::OrderUpdateEvent e;
    e.order.order_no = order_no;
    e.order.status = status;
    return e;
  }

  static mfg::StockReceivedEvent makeStockReceived(const std::string& batch) {
    mfg::StockReceivedEvent e;
    e.lot.batch_no = batch;
    e.lot.quantity = 10.0;
    return e;
  }
};

TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const mfg::Event&) { ++call_count; });

  bus.publish(makeOrderUpdate("MO-1", mfg::domain::OrderStatus::Confirmed));
  bus.publish(makeStockReceived("B-1"));
  bus.publish(mfg::MaterialsIssuedEvent{});
  bus.publish(mfg::ProductionCompletedEvent{});
  bus.publish(mfg::BomStatusChangedEvent{});

  EXPECT_EQ(call_count, 5);
}

TEST_F(EventBusTest, TypedSubscriberFiltersByKind) {
  std::vector<std::string> order_numbers;
  bus.subscribe<mfg::OrderUpdateEvent>(
      [&order_numbers](const mfg::OrderUpdateEvent& e) {
        order_numbers.push_back(e.order.order_no);
      });

  bus.publish(makeStockReceived("B-1"));
  bus.publish(makeOrderUpdate("MO-7", mfg::domain::OrderStatus::InProgress));
  bus.publish(mfg::ProductionCompletedEvent{});

  ASSERT_EQ(order_numbers.size(), 1u);
  EXPECT_EQ(order_numbers[0], "MO-7");
}

TEST_F(EventBusTest, TypedSubscriberSeesPayload) {
  mfg::OrderUpdateEvent seen;
  bus.subscribe<mfg::OrderUpdateEvent>(
      [&seen](const mfg::OrderUpdateEvent& e) { seen = e; });

  auto event = makeOrderUpdate("MO-9", mfg::domain::OrderStatus::Completed);
  event.previous_status = mfg::domain::OrderStatus::InProgress;
  event.order.produced_qty = 42.5;
  event.sequence_id = 17;
  bus.publish(event);

  EXPECT_EQ(seen.order.order_no, "MO-9");
  EXPECT_EQ(seen.order.status, mfg::domain::OrderStatus::Completed);
  ASSERT_TRUE(seen.previous_status.has_value());
  EXPECT_EQ(*seen.previous_status, mfg::domain::OrderStatus::InProgress);
  EXPECT_DOUBLE_EQ(seen.order.produced_qty, 42.5);
  EXPECT_EQ(seen.sequence_id, 17u);
}

TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int a = 0;
  int b = 0;
  bus.subscribe([&a](const mfg::Event&) { ++a; });
  bus.subscribe<mfg::StockReceivedEvent>(
      [&b](const mfg::StockReceivedEvent&) { ++b; });

  bus.publish(makeStockReceived("B-2"));

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe([&calls](const mfg::Event&) { ++calls; });

  bus.publish(makeStockReceived("B-1"));
  bus.unsubscribe(id);
  bus.publish(makeStockReceived("B-2"));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnsubscribeUnknownIdIsNoOp) {
  bus.subscribe([](const mfg::Event&) {});
  bus.unsubscribe(9999);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_THROW(bus.publish(makeStockReceived("B-1")));
}

// -----------------------------------------------------------------------------
// publish() calls out without holding the bus lock, so a callback can
// publish a follow-up event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int completions = 0;
  bus.subscribe<mfg::OrderUpdateEvent>([this](const mfg::OrderUpdateEvent& e) {
    if (e.order.status == mfg::domain::OrderStatus::Completed) {
      mfg::ProductionCompletedEvent done;
      done.order_no = e.order.order_no;
      bus.publish(done);
    }
  });
  bus.subscribe<mfg::ProductionCompletedEvent>(
      [&completions](const mfg::ProductionCompletedEvent&) { ++completions; });

  bus.publish(makeOrderUpdate("MO-3", mfg::domain::OrderStatus::Completed));

  EXPECT_EQ(completions, 1);
}
