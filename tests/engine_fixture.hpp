#pragma once

// =============================================================================
// engine_fixture.hpp
// =============================================================================
// Shared fixture for tests that need the whole component graph: a
// ManufacturingEngine without IPC, on a simulation clock pinned to
// 2025-01-10, with a small master-data catalogue.
//
//   Products                         Warehouses
//     1  RM-A   Material A   KG         1  Main Store        (entity 7)
//     2  RM-B   Material B   KG         2  Finished Goods    (entity 7)
//     3  PK-BOX Box          PCS        3  Old Store         (inactive)
//    10  FG-KIT Kit          PCS
//    11  FG-CUT Cut Sheet    PCS
//    20  SV-QA  QA Service   HR   (service)
//    21  RM-NEW Unapproved   KG   (not approved)
// =============================================================================

#include "mfg/domain/engine_config.hpp"
#include "mfg/engine/manufacturing_engine.hpp"
#include "mfg/time/calendar_date.hpp"
#include "mfg/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mfg_test {

constexpr mfg::domain::ProductId kMaterialA = 1;
constexpr mfg::domain::ProductId kMaterialB = 2;
constexpr mfg::domain::ProductId kBox = 3;
constexpr mfg::domain::ProductId kKit = 10;
constexpr mfg::domain::ProductId kCutSheet = 11;
constexpr mfg::domain::ProductId kService = 20;
constexpr mfg::domain::ProductId kUnapproved = 21;

constexpr mfg::domain::WarehouseId kMain = 1;
constexpr mfg::domain::WarehouseId kFinished = 2;
constexpr mfg::domain::WarehouseId kInactive = 3;

inline mfg::CalendarDate date(const std::string& iso) {
  return mfg::CalendarDate::parse(iso);
}

inline mfg::domain::EngineConfig offlineConfig() {
  mfg::domain::EngineConfig config;
  config.ipc_cmd_endpoint.clear();
  config.ipc_pub_endpoint.clear();
  return config;
}

inline mfg::domain::BomLine line(mfg::domain::ProductId material,
                                 double qty_per_unit,
                                 double scrap_rate_pct = 0.0) {
  mfg::domain::BomLine l;
  l.material_id = material;
  l.qty_per_unit = qty_per_unit;
  l.scrap_rate_pct = scrap_rate_pct;
  return l;
}

class EngineFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    engine = std::make_unique<mfg::ManufacturingEngine>(config(), clock);

    auto& master = engine->masterData();
    master.upsertProduct({kMaterialA, "RM-A", "Material A", "KG", false, true});
    master.upsertProduct({kMaterialB, "RM-B", "Material B", "KG", false, true});
    master.upsertProduct({kBox, "PK-BOX", "Box", "PCS", false, true});
    master.upsertProduct({kKit, "FG-KIT", "Kit", "PCS", false, true});
    master.upsertProduct(
        {kCutSheet, "FG-CUT", "Cut Sheet", "PCS", false, true});
    master.upsertProduct({kService, "SV-QA", "QA Service", "HR", true, true});
    master.upsertProduct(
        {kUnapproved, "RM-NEW", "Unapproved", "KG", false, false});

    master.upsertWarehouse({kMain, "Main Store", 7, true});
    master.upsertWarehouse({kFinished, "Finished Goods", 7, true});
    master.upsertWarehouse({kInactive, "Old Store", 7, false});
  }

  virtual mfg::domain::EngineConfig config() const { return offlineConfig(); }

  mfg::domain::LedgerEntry receive(mfg::domain::ProductId product,
                                   const std::string& batch,
                                   double quantity,
                                   std::optional<std::string> expiry,
                                   mfg::domain::WarehouseId warehouse = kMain) {
    mfg::StockReceiptRequest request;
    request.product_id = product;
    request.warehouse_id = warehouse;
    request.batch_no = batch;
    request.quantity = quantity;
    if (expiry) {
      request.expiry = date(*expiry);
    }
    request.source_ref = "GRN-TEST";
    return engine->receiveStock(request, "tester");
  }

  mfg::domain::BomHeader activeBom(mfg::domain::BomType type,
                                   mfg::domain::ProductId output,
                                   std::vector<mfg::domain::BomLine> lines) {
    mfg::BomDraft draft;
    draft.name = std::string("Test ") + mfg::domain::toString(type);
    draft.type = type;
    draft.output_product_id = output;
    draft.lines = std::move(lines);
    auto bom = engine->createBom(draft, "tester");
    return engine->updateBomStatus(bom.id, mfg::domain::BomStatus::Active,
                                   "tester");
  }

  mfg::domain::ManufacturingOrder createOrder(
      mfg::domain::BomId bom_id,
      double planned_qty,
      mfg::domain::WarehouseId source = kMain,
      mfg::domain::WarehouseId target = kFinished) {
    mfg::CreateOrderRequest request;
    request.bom_id = bom_id;
    request.planned_qty = planned_qty;
    request.source_warehouse_id = source;
    request.target_warehouse_id = target;
    return service().createOrder(request, "planner");
  }

  mfg::CompletionResult complete(
      mfg::domain::OrderId order_id,
      double produced_qty,
      const std::string& batch,
      std::optional<mfg::CalendarDate> expiry = std::nullopt) {
    mfg::CompleteOrderRequest request;
    request.order_id = order_id;
    request.produced_qty = produced_qty;
    request.batch_no = batch;
    request.quality_status = mfg::domain::QualityStatus::Passed;
    request.expiry = expiry;
    return service().completeOrder(request, "operator");
  }

  mfg::ManufacturingOrderService& service() { return engine->orderService(); }
  mfg::InventoryLedger& ledger() { return engine->ledger(); }

  mfg::SimulationTimeProvider clock{mfg::CalendarDate::fromYmd(2025, 1, 10)};
  std::unique_ptr<mfg::ManufacturingEngine> engine;
};

}  // namespace mfg_test
