#pragma once

#include "mfg/domain/bom.hpp"
#include "mfg/domain/identifiers.hpp"
#include "mfg/domain/order_status.hpp"
#include "mfg/master/i_master_data_registry.hpp"
#include "mfg/production/order_repository.hpp"
#include "mfg/time/calendar_date.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mfg {

// Orders whose order_date falls in the range.
struct ProductionSummary {
  int total_orders{0};
  int confirmed_orders{0};
  int in_progress_orders{0};
  int completed_orders{0};
  int cancelled_orders{0};
  double total_output{0.0};
  double avg_lead_time_days{0.0};  // completion_date - order_date, completed
  double completion_rate_pct{0.0};
};

struct DailyProductionRow {
  CalendarDate date;
  domain::BomType bom_type{domain::BomType::Kitting};
  double quantity{0.0};
};

struct MaterialConsumptionRow {
  domain::ProductId material_id{};
  std::string material_name;
  double total_consumed{0.0};
  std::string uom;
  int order_count{0};
  double avg_daily{0.0};
};

struct StatusCountRow {
  domain::OrderStatus status{domain::OrderStatus::Confirmed};
  int count{0};
};

struct EfficiencyRow {
  domain::BomType bom_type{domain::BomType::Kitting};
  double efficiency_pct{0.0};  // mean of produced / planned * 100
  int completed_orders{0};
};

enum class ActivityType { OrderCreated, MaterialsIssued, ProductionCompleted };

std::string toString(ActivityType type);

struct ActivityRow {
  ActivityType type{ActivityType::OrderCreated};
  std::string reference;  // order, issue or receipt number
  std::int64_t timestamp_ms{0};
  std::string actor;
};

// -----------------------------------------------------------------------------
// ProductionReports - date-ranged aggregates over the order store
// -----------------------------------------------------------------------------
//
// Read-only. Every range is inclusive on both ends; to < from is a
// ValidationError. Results are advisory snapshots: each call reads the
// repository once and does not hold any lock across rows.
// -----------------------------------------------------------------------------
class ProductionReports {
 public:
  ProductionReports(const OrderRepository& orders,
                    const IMasterDataRegistry& master_data);

  ProductionSummary summary(CalendarDate from, CalendarDate to) const;

  // Receipt quantity per receipt day and BOM type, by date then type.
  std::vector<DailyProductionRow> dailyProduction(CalendarDate from,
                                                  CalendarDate to) const;

  // Issued quantity per material, largest first. avg_daily divides by the
  // number of days in the range.
  std::vector<MaterialConsumptionRow> materialConsumption(
      CalendarDate from,
      CalendarDate to,
      std::optional<domain::WarehouseId> warehouse_id = std::nullopt) const;

  // Statuses with at least one order, in lifecycle order.
  std::vector<StatusCountRow> statusDistribution(CalendarDate from,
                                                 CalendarDate to) const;

  // Completed orders by completion_date.
  std::vector<EfficiencyRow> efficiencyByType(CalendarDate from,
                                              CalendarDate to) const;

  // Newest first.
  std::vector<ActivityRow> recentActivities(std::size_t limit) const;

 private:
  const OrderRepository& orders_;
  const IMasterDataRegistry& master_data_;
};

}  // namespace mfg
