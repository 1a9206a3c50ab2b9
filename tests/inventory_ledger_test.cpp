// =============================================================================
// inventory_ledger_test.cpp
// =============================================================================
// Tests for mfg::InventoryLedger.
//
// Validates:
//   1. Stock receipt validation against master data
//   2. Balance law: sum of signed quantities == sum of live remains
//   3. Lot breakdown grouping and expiry classification
//   4. Expiry report horizon and ordering
//   5. Movement history and production impact
// =============================================================================

#include "engine_fixture.hpp"

#include "mfg/errors/errors.hpp"

#include <gtest/gtest.h>

using namespace mfg_test;
using mfg::domain::ExpiryStatus;
using mfg::domain::MovementType;

class InventoryLedgerTest : public EngineFixture {};

// -----------------------------------------------------------------------------
// 1. Receipt validation
// -----------------------------------------------------------------------------
TEST_F(InventoryLedgerTest, ReceiveCreatesStockInLot) {
  const auto lot = receive(kMaterialA, "B-001", 12.5, "2025-06-30");

  EXPECT_GT(lot.id, 0u);
  EXPECT_EQ(lot.movement, MovementType::StockIn);
  EXPECT_DOUBLE_EQ(lot.quantity, 12.5);
  EXPECT_DOUBLE_EQ(lot.remain, 12.5);
  EXPECT_EQ(lot.uom, "KG");
  EXPECT_EQ(lot.created_by, "tester");
  EXPECT_EQ(lot.source_ref, "GRN-TEST");
  ASSERT_TRUE(lot.expiry.has_value());
  EXPECT_EQ(lot.expiry->toString(), "2025-06-30");
  EXPECT_EQ(lot.created_at_ms, clock.now_ms());
  EXPECT_EQ(ledger().size(), 1u);
}

TEST_F(InventoryLedgerTest, ReceiveRejectsInvalidRequests) {
  EXPECT_THROW(receive(999, "B", 1, std::nullopt), mfg::NotFoundError);
  EXPECT_THROW(receive(kService, "B", 1, std::nullopt), mfg::ValidationError);
  EXPECT_THROW(receive(kUnapproved, "B", 1, std::nullopt),
               mfg::ValidationError);
  EXPECT_THROW(receive(kMaterialA, "B", 1, std::nullopt, 99),
               mfg::NotFoundError);
  EXPECT_THROW(receive(kMaterialA, "B", 1, std::nullopt, kInactive),
               mfg::ValidationError);
  EXPECT_THROW(receive(kMaterialA, "B", 0, std::nullopt), mfg::ValidationError);
  EXPECT_THROW(receive(kMaterialA, "B", -2, std::nullopt),
               mfg::ValidationError);
  EXPECT_THROW(receive(kMaterialA, "", 1, std::nullopt), mfg::ValidationError);

  EXPECT_EQ(ledger().size(), 0u);
}

// -----------------------------------------------------------------------------
// 2. Balances
// -----------------------------------------------------------------------------
TEST_F(InventoryLedgerTest, BalancePerWarehouseAndOverall) {
  receive(kMaterialA, "B-001", 10, "2025-06-30");
  receive(kMaterialA, "B-002", 4, std::nullopt);
  receive(kMaterialA, "B-003", 6, std::nullopt, kFinished);
  receive(kMaterialB, "B-100", 3, std::nullopt);

  EXPECT_DOUBLE_EQ(ledger().balance(kMaterialA, kMain), 14.0);
  EXPECT_DOUBLE_EQ(ledger().balance(kMaterialA, kFinished), 6.0);
  EXPECT_DOUBLE_EQ(ledger().balance(kMaterialA), 20.0);
  EXPECT_DOUBLE_EQ(ledger().balance(kMaterialB), 3.0);
  EXPECT_DOUBLE_EQ(ledger().balance(kBox), 0.0);
}

TEST_F(InventoryLedgerTest, BalanceLawHoldsAfterIssuance) {
  receive(kMaterialA, "B-001", 10, "2025-06-30");
  receive(kMaterialA, "B-002", 10, "2025-03-31");
  const auto bom = activeBom(mfg::domain::BomType::Cutting, kCutSheet,
                             {line(kMaterialA, 1.5)});
  const auto order = createOrder(bom.id, 8);
  service().issueMaterials(order.id, "operator");

  EXPECT_DOUBLE_EQ(ledger().balance(kMaterialA), 8.0);
  EXPECT_NEAR(ledger().netQuantity(kMaterialA), ledger().balance(kMaterialA),
              1e-9);
  EXPECT_NEAR(ledger().netQuantity(kMaterialA, kMain),
              ledger().balance(kMaterialA, kMain), 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Lot breakdown
// -----------------------------------------------------------------------------
TEST_F(InventoryLedgerTest, LotBreakdownGroupsAndClassifies) {
  const auto today = date("2025-01-10");
  receive(kMaterialA, "B-OK", 5, "2025-12-31");
  receive(kMaterialA, "B-CRIT", 2, "2025-01-15");
  receive(kMaterialA, "B-CRIT", 3, "2025-01-15");
  receive(kMaterialA, "B-WARN", 1, "2025-02-01");
  receive(kMaterialA, "B-OLD", 4, "2025-01-01");
  receive(kMaterialA, "B-NONE", 7, std::nullopt);

  const auto rows = ledger().lotBreakdown(kMaterialA, kMain, today);

  ASSERT_EQ(rows.size(), 5u);
  EXPECT_EQ(rows[0].batch_no, "B-OLD");
  EXPECT_EQ(rows[0].status, ExpiryStatus::Expired);
  EXPECT_EQ(rows[1].batch_no, "B-CRIT");
  EXPECT_EQ(rows[1].status, ExpiryStatus::Critical);
  EXPECT_DOUBLE_EQ(rows[1].available_qty, 5.0);
  EXPECT_EQ(rows[1].lot_count, 2);
  EXPECT_EQ(rows[2].batch_no, "B-WARN");
  EXPECT_EQ(rows[2].status, ExpiryStatus::Warning);
  EXPECT_EQ(rows[3].batch_no, "B-OK");
  EXPECT_EQ(rows[3].status, ExpiryStatus::Ok);
  EXPECT_EQ(rows[4].batch_no, "B-NONE");
  EXPECT_FALSE(rows[4].expiry.has_value());
  EXPECT_EQ(rows[4].status, ExpiryStatus::Ok);
}

// -----------------------------------------------------------------------------
// 4. Expiry report
// -----------------------------------------------------------------------------
TEST_F(InventoryLedgerTest, ExpiryReportCoversHorizonSoonestFirst) {
  const auto today = date("2025-01-10");
  receive(kMaterialB, "B-20D", 3, "2025-01-30");
  receive(kMaterialA, "B-OLD", 4, "2025-01-01");
  receive(kMaterialA, "B-5D", 2, "2025-01-15", kFinished);
  receive(kMaterialA, "B-90D", 9, "2025-04-10");
  receive(kMaterialA, "B-NONE", 1, std::nullopt);

  const auto rows = ledger().expiryReport(30, today);

  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].batch_no, "B-OLD");
  EXPECT_EQ(rows[0].status, ExpiryStatus::Expired);
  EXPECT_EQ(rows[0].days_to_expiry, -9);
  EXPECT_EQ(rows[1].batch_no, "B-5D");
  EXPECT_EQ(rows[1].status, ExpiryStatus::Critical);
  EXPECT_EQ(rows[1].warehouse_name, "Finished Goods");
  EXPECT_EQ(rows[2].batch_no, "B-20D");
  EXPECT_EQ(rows[2].status, ExpiryStatus::Warning);
  EXPECT_EQ(rows[2].product_name, "Material B");
  EXPECT_EQ(rows[2].days_to_expiry, 20);

  EXPECT_EQ(ledger().expiryReport(0, today).size(), 1u);
  EXPECT_THROW(ledger().expiryReport(-1, today), mfg::ValidationError);
}

// -----------------------------------------------------------------------------
// 5. Movements and production impact
// -----------------------------------------------------------------------------
TEST_F(InventoryLedgerTest, MovementsAreNewestFirst) {
  const auto first = receive(kMaterialA, "B-001", 5, std::nullopt);
  clock.advance_days(1);
  const auto second = receive(kMaterialA, "B-002", 5, std::nullopt, kFinished);
  receive(kMaterialB, "B-003", 5, std::nullopt);

  const auto all = ledger().movements(kMaterialA);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].id, second.id);
  EXPECT_EQ(all[1].id, first.id);

  const auto main_only = ledger().movements(kMaterialA, kMain);
  ASSERT_EQ(main_only.size(), 1u);
  EXPECT_EQ(main_only[0].id, first.id);
}

TEST_F(InventoryLedgerTest, ProductionImpactNetsProducedAgainstConsumed) {
  receive(kMaterialA, "B-001", 50, "2025-06-30");
  receive(kMaterialB, "B-002", 50, "2025-06-30");
  const auto bom = activeBom(mfg::domain::BomType::Kitting, kKit,
                             {line(kMaterialA, 2), line(kMaterialB, 0.5)});
  const auto order = createOrder(bom.id, 10);
  service().issueMaterials(order.id, "operator");
  complete(order.id, 10, "KIT-001");

  const auto rows =
      ledger().productionImpact(date("2025-01-01"), date("2025-01-31"));

  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].product_id, kMaterialA);
  EXPECT_DOUBLE_EQ(rows[0].consumed, 20.0);
  EXPECT_DOUBLE_EQ(rows[0].net_change, -20.0);
  EXPECT_EQ(rows[1].product_id, kKit);
  EXPECT_DOUBLE_EQ(rows[1].produced, 10.0);
  EXPECT_DOUBLE_EQ(rows[1].net_change, 10.0);
  EXPECT_EQ(rows[1].product_name, "Kit");
  EXPECT_EQ(rows[2].product_id, kMaterialB);
  EXPECT_DOUBLE_EQ(rows[2].net_change, -5.0);

  EXPECT_TRUE(
      ledger()
          .productionImpact(date("2025-02-01"), date("2025-02-28"))
          .empty());
  EXPECT_THROW(
      ledger().productionImpact(date("2025-01-31"), date("2025-01-01")),
      mfg::ValidationError);
}

TEST_F(InventoryLedgerTest, AvailabilityComparesDemandWithStock) {
  receive(kMaterialA, "B-001", 10, std::nullopt);

  const auto rows = ledger().availability(
      {{kMaterialA, 10.0}, {kMaterialB, 1.0}}, kMain, date("2025-01-10"));

  ASSERT_EQ(rows.size(), 2u);
  EXPECT_TRUE(rows[0].sufficient);
  EXPECT_DOUBLE_EQ(rows[0].available, 10.0);
  EXPECT_FALSE(rows[1].sufficient);
  EXPECT_DOUBLE_EQ(rows[1].available, 0.0);
  EXPECT_EQ(rows[1].material_name, "Material B");
}
