#include "mfg/reporting/production_reports.hpp"
#include "mfg/errors/errors.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace mfg {

namespace {

void requireRange(CalendarDate from, CalendarDate to) {
  if (to < from) {
    throw ValidationError("Report range ends (" + to.toString() +
                          ") before it starts (" + from.toString() + ")");
  }
}

bool inRange(CalendarDate date, CalendarDate from, CalendarDate to) {
  return from <= date && date <= to;
}

}  // namespace

std::string toString(ActivityType type) {
  switch (type) {
    case ActivityType::OrderCreated:
      return "Order Created";
    case ActivityType::MaterialsIssued:
      return "Materials Issued";
    case ActivityType::ProductionCompleted:
      return "Production Completed";
  }
  return "UNKNOWN";
}

ProductionReports::ProductionReports(const OrderRepository& orders,
                                     const IMasterDataRegistry& master_data)
    : orders_(orders), master_data_(master_data) {}

ProductionSummary ProductionReports::summary(CalendarDate from,
                                             CalendarDate to) const {
  requireRange(from, to);

  OrderFilter filter;
  filter.from = from;
  filter.to = to;

  ProductionSummary result;
  int lead_time_samples = 0;
  double lead_time_total = 0.0;

  for (const auto& order : orders_.listOrders(filter)) {
    ++result.total_orders;
    result.total_output += order.produced_qty;
    switch (order.status) {
      case domain::OrderStatus::Confirmed:
        ++result.confirmed_orders;
        break;
      case domain::OrderStatus::InProgress:
        ++result.in_progress_orders;
        break;
      case domain::OrderStatus::Completed:
        ++result.completed_orders;
        if (order.completion_date) {
          lead_time_total += daysBetween(order.order_date,
                                         *order.completion_date);
          ++lead_time_samples;
        }
        break;
      case domain::OrderStatus::Cancelled:
        ++result.cancelled_orders;
        break;
    }
  }

  if (lead_time_samples > 0) {
    result.avg_lead_time_days = lead_time_total / lead_time_samples;
  }
  if (result.total_orders > 0) {
    result.completion_rate_pct =
        result.completed_orders * 100.0 / result.total_orders;
  }
  return result;
}

std::vector<DailyProductionRow> ProductionReports::dailyProduction(
    CalendarDate from, CalendarDate to) const {
  requireRange(from, to);

  std::map<std::pair<CalendarDate, domain::BomType>, double> totals;
  for (const auto& receipt : orders_.receipts()) {
    const CalendarDate day = CalendarDate::fromEpochMs(receipt.received_at_ms);
    if (!inRange(day, from, to)) {
      continue;
    }
    auto order = orders_.findOrder(receipt.order_id);
    if (!order) {
      continue;
    }
    totals[{day, order->bom_type}] += receipt.quantity;
  }

  std::vector<DailyProductionRow> rows;
  rows.reserve(totals.size());
  for (const auto& [key, quantity] : totals) {
    rows.push_back(DailyProductionRow{key.first, key.second, quantity});
  }
  return rows;
}

std::vector<MaterialConsumptionRow> ProductionReports::materialConsumption(
    CalendarDate from,
    CalendarDate to,
    std::optional<domain::WarehouseId> warehouse_id) const {
  requireRange(from, to);

  // Issue headers in range (and warehouse) keyed by id.
  std::map<domain::IssueId, domain::OrderId> issues_in_range;
  for (const auto& issue : orders_.issues()) {
    if (issue.status != "CONFIRMED") {
      continue;
    }
    if (warehouse_id && issue.warehouse_id != *warehouse_id) {
      continue;
    }
    const CalendarDate day = CalendarDate::fromEpochMs(issue.issued_at_ms);
    if (inRange(day, from, to)) {
      issues_in_range.emplace(issue.id, issue.order_id);
    }
  }

  struct Accumulator {
    double total{0.0};
    std::set<domain::OrderId> orders;
  };
  std::map<std::pair<domain::ProductId, std::string>, Accumulator> by_material;

  for (const auto& detail : orders_.issueDetails()) {
    auto it = issues_in_range.find(detail.issue_id);
    if (it == issues_in_range.end()) {
      continue;
    }
    auto& acc = by_material[{detail.material_id, detail.uom}];
    acc.total += detail.quantity;
    acc.orders.insert(it->second);
  }

  const double days = static_cast<double>(daysBetween(from, to) + 1);

  std::vector<MaterialConsumptionRow> rows;
  rows.reserve(by_material.size());
  for (const auto& [key, acc] : by_material) {
    MaterialConsumptionRow row;
    row.material_id = key.first;
    row.material_name = productName(master_data_, key.first);
    row.total_consumed = acc.total;
    row.uom = key.second;
    row.order_count = static_cast<int>(acc.orders.size());
    row.avg_daily = acc.total / days;
    rows.push_back(std::move(row));
  }

  std::stable_sort(rows.begin(), rows.end(),
                   [](const MaterialConsumptionRow& a,
                      const MaterialConsumptionRow& b) {
                     return a.total_consumed > b.total_consumed;
                   });
  return rows;
}

std::vector<StatusCountRow> ProductionReports::statusDistribution(
    CalendarDate from, CalendarDate to) const {
  requireRange(from, to);

  OrderFilter filter;
  filter.from = from;
  filter.to = to;

  std::map<domain::OrderStatus, int> counts;
  for (const auto& order : orders_.listOrders(filter)) {
    ++counts[order.status];
  }

  std::vector<StatusCountRow> rows;
  for (const auto& [status, count] : counts) {
    rows.push_back(StatusCountRow{status, count});
  }
  return rows;
}

std::vector<EfficiencyRow> ProductionReports::efficiencyByType(
    CalendarDate from, CalendarDate to) const {
  requireRange(from, to);

  OrderFilter filter;
  filter.status = domain::OrderStatus::Completed;

  std::map<domain::BomType, std::pair<double, int>> acc;
  for (const auto& order : orders_.listOrders(filter)) {
    if (!order.completion_date ||
        !inRange(*order.completion_date, from, to)) {
      continue;
    }
    const double pct = order.planned_qty > 0.0
                           ? order.produced_qty / order.planned_qty * 100.0
                           : 0.0;
    auto& [sum, n] = acc[order.bom_type];
    sum += pct;
    ++n;
  }

  std::vector<EfficiencyRow> rows;
  for (const auto& [type, sum_n] : acc) {
    rows.push_back(EfficiencyRow{type, sum_n.first / sum_n.second,
                                 sum_n.second});
  }
  return rows;
}

std::vector<ActivityRow> ProductionReports::recentActivities(
    std::size_t limit) const {
  std::vector<ActivityRow> rows;

  for (const auto& order : orders_.listOrders()) {
    rows.push_back(ActivityRow{ActivityType::OrderCreated, order.order_no,
                               order.created_at_ms, order.created_by});
  }
  for (const auto& issue : orders_.issues()) {
    rows.push_back(ActivityRow{ActivityType::MaterialsIssued, issue.issue_no,
                               issue.issued_at_ms, issue.issued_by});
  }
  for (const auto& receipt : orders_.receipts()) {
    rows.push_back(ActivityRow{ActivityType::ProductionCompleted,
                               receipt.receipt_no, receipt.received_at_ms,
                               receipt.created_by});
  }

  // Same timestamp: later lifecycle step first.
  std::sort(rows.begin(), rows.end(),
            [](const ActivityRow& a, const ActivityRow& b) {
              return std::tie(b.timestamp_ms, b.type, b.reference) <
                     std::tie(a.timestamp_ms, a.type, a.reference);
            });

  if (rows.size() > limit) {
    rows.resize(limit);
  }
  return rows;
}

}  // namespace mfg
