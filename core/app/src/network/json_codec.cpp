#include "mfg/network/json_codec.hpp"

namespace mfg {

using nlohmann::json;

json dateToJson(const std::optional<CalendarDate>& date) {
  if (!date) {
    return nullptr;
  }
  return date->toString();
}

void to_json(json& j, const CalendarDate& date) { j = date.toString(); }

void to_json(json& j, const RequirementLine& line) {
  j = json{{"material_id", line.material_id},
           {"required_qty", line.required_qty},
           {"uom", line.uom},
           {"material_type", domain::toString(line.material_type)}};
}

void to_json(json& j, const BomUsage& usage) {
  j = json{{"bom_id", usage.bom_id},
           {"bom_code", usage.bom_code},
           {"bom_name", usage.bom_name},
           {"bom_status", domain::toString(usage.bom_status)},
           {"output_product_id", usage.output_product_id},
           {"output_product_name", usage.output_product_name},
           {"qty_per_unit", usage.qty_per_unit},
           {"uom", usage.uom},
           {"material_type", domain::toString(usage.material_type)}};
}

void to_json(json& j, const MaterialUsageRow& row) {
  json types = json::array();
  for (auto type : row.bom_types) {
    types.push_back(domain::toString(type));
  }
  j = json{{"material_id", row.material_id},
           {"material_name", row.material_name},
           {"usage_count", row.usage_count},
           {"total_qty_per_unit", row.total_qty_per_unit},
           {"bom_types", std::move(types)}};
}

void to_json(json& j, const LotBreakdownRow& row) {
  j = json{{"batch_no", row.batch_no},
           {"expiry", dateToJson(row.expiry)},
           {"available_qty", row.available_qty},
           {"expiry_status", domain::toString(row.status)},
           {"lot_count", row.lot_count}};
}

void to_json(json& j, const ExpiryReportRow& row) {
  j = json{{"product_id", row.product_id},
           {"product_name", row.product_name},
           {"batch_no", row.batch_no},
           {"warehouse_id", row.warehouse_id},
           {"warehouse_name", row.warehouse_name},
           {"quantity", row.quantity},
           {"expiry", row.expiry},
           {"expiry_status", domain::toString(row.status)},
           {"days_to_expiry", row.days_to_expiry}};
}

void to_json(json& j, const ProductionImpactRow& row) {
  j = json{{"product_id", row.product_id},
           {"product_name", row.product_name},
           {"produced", row.produced},
           {"consumed", row.consumed},
           {"net_change", row.net_change}};
}

void to_json(json& j, const AvailabilityRow& row) {
  j = json{{"material_id", row.material_id},
           {"material_name", row.material_name},
           {"required", row.required},
           {"available", row.available},
           {"sufficient", row.sufficient}};
}

void to_json(json& j, const PreviewTake& take) {
  j = json{{"lot_id", take.lot_id},
           {"batch_no", take.batch_no},
           {"quantity", take.quantity},
           {"expiry", dateToJson(take.expiry)},
           {"expiry_status", domain::toString(take.expiry_status)}};
}

void to_json(json& j, const AllocationPreview& preview) {
  j = json{{"material_id", preview.material_id},
           {"warehouse_id", preview.warehouse_id},
           {"requested", preview.requested},
           {"available", preview.available},
           {"shortfall", preview.shortfall},
           {"sufficient", preview.sufficient()},
           {"takes", preview.takes}};
}

void to_json(json& j, const BatchSource& source) {
  j = json{{"material_id", source.material_id},
           {"material_name", source.material_name},
           {"quantity", source.quantity},
           {"source_batch_no", source.source_batch_no},
           {"source_expiry", dateToJson(source.source_expiry)}};
}

void to_json(json& j, const BatchLocation& location) {
  j = json{{"warehouse_id", location.warehouse_id},
           {"warehouse_name", location.warehouse_name},
           {"remaining_qty", location.remaining_qty},
           {"status", toString(location.status)}};
}

void to_json(json& j, const BatchInfo& info) {
  j = json{{"batch_no", info.batch_no},
           {"product_id", info.product_id},
           {"product_name", info.product_name},
           {"product_code", info.product_code},
           {"produced_qty", info.produced_qty},
           {"uom", info.uom},
           {"expiry", dateToJson(info.expiry)},
           {"first_received_at_ms", info.first_received_at_ms},
           {"warehouse_id", info.warehouse_id},
           {"warehouse_name", info.warehouse_name}};
}

void to_json(json& j, const ProducedBatch& batch) {
  j = json{{"batch_no", batch.batch_no},
           {"receipt_no", batch.receipt_no},
           {"received_at_ms", batch.received_at_ms},
           {"product_name", batch.product_name},
           {"quantity", batch.quantity},
           {"quality_status", domain::toString(batch.quality_status)}};
}

void to_json(json& j, const IssuedMaterialLine& line) {
  j = json{{"material_id", line.material_id},
           {"material_name", line.material_name},
           {"quantity", line.quantity},
           {"uom", line.uom}};
}

void to_json(json& j, const IssueResult& result) {
  j = json{{"issue_no", result.issue_no},
           {"issue_id", result.issue_id},
           {"group_id", result.group_id},
           {"materials", result.materials}};
}

void to_json(json& j, const CompletionResult& result) {
  j = json{{"receipt_no", result.receipt_no},
           {"batch_no", result.batch_no},
           {"quantity", result.quantity},
           {"expiry", dateToJson(result.expiry)},
           {"lot_id", result.lot_id}};
}

void to_json(json& j, const OrderDetail& detail) {
  j = json{{"order", detail.order},
           {"requirements", detail.requirements},
           {"issues", detail.issues},
           {"issue_details", detail.issue_details},
           {"receipts", detail.receipts}};
}

void to_json(json& j, const RequirementAvailability& row) {
  j = json{{"material_id", row.line.material_id},
           {"material_name", row.material_name},
           {"material_type", domain::toString(row.line.material_type)},
           {"required_qty", row.line.required_qty},
           {"uom", row.line.uom},
           {"available", row.available},
           {"sufficient", row.sufficient}};
}

void to_json(json& j, const ProductionSummary& summary) {
  j = json{{"total_orders", summary.total_orders},
           {"confirmed_orders", summary.confirmed_orders},
           {"in_progress_orders", summary.in_progress_orders},
           {"completed_orders", summary.completed_orders},
           {"cancelled_orders", summary.cancelled_orders},
           {"total_output", summary.total_output},
           {"avg_lead_time_days", summary.avg_lead_time_days},
           {"completion_rate_pct", summary.completion_rate_pct}};
}

void to_json(json& j, const DailyProductionRow& row) {
  j = json{{"date", row.date},
           {"bom_type", domain::toString(row.bom_type)},
           {"quantity", row.quantity}};
}

void to_json(json& j, const MaterialConsumptionRow& row) {
  j = json{{"material_id", row.material_id},
           {"material_name", row.material_name},
           {"total_consumed", row.total_consumed},
           {"uom", row.uom},
           {"order_count", row.order_count},
           {"avg_daily", row.avg_daily}};
}

void to_json(json& j, const StatusCountRow& row) {
  j = json{{"status", domain::toString(row.status)}, {"count", row.count}};
}

void to_json(json& j, const EfficiencyRow& row) {
  j = json{{"bom_type", domain::toString(row.bom_type)},
           {"efficiency_pct", row.efficiency_pct},
           {"completed_orders", row.completed_orders}};
}

void to_json(json& j, const ActivityRow& row) {
  j = json{{"activity", toString(row.type)},
           {"reference", row.reference},
           {"timestamp_ms", row.timestamp_ms},
           {"actor", row.actor}};
}

namespace domain {

void to_json(json& j, const Product& product) {
  j = json{{"id", product.id},
           {"code", product.code},
           {"name", product.name},
           {"uom", product.uom},
           {"is_service", product.is_service},
           {"approved", product.approved}};
}

void to_json(json& j, const Warehouse& warehouse) {
  j = json{{"id", warehouse.id},
           {"name", warehouse.name},
           {"entity_id", warehouse.entity_id},
           {"active", warehouse.active}};
}

void to_json(json& j, const BomLine& line) {
  j = json{{"material_id", line.material_id},
           {"material_type", toString(line.material_type)},
           {"qty_per_unit", line.qty_per_unit},
           {"uom", line.uom},
           {"scrap_rate_pct", line.scrap_rate_pct}};
}

void to_json(json& j, const BomHeader& bom) {
  j = json{{"id", bom.id},
           {"code", bom.code},
           {"name", bom.name},
           {"type", toString(bom.type)},
           {"output_product_id", bom.output_product_id},
           {"output_qty", bom.output_qty},
           {"uom", bom.uom},
           {"status", toString(bom.status)},
           {"version", bom.version},
           {"effective_date", dateToJson(bom.effective_date)},
           {"notes", bom.notes},
           {"created_by", bom.created_by},
           {"updated_by", bom.updated_by},
           {"created_at_ms", bom.created_at_ms},
           {"lines", bom.lines}};
}

void to_json(json& j, const ManufacturingOrder& order) {
  j = json{{"id", order.id},
           {"order_no", order.order_no},
           {"entity_id", order.entity_id},
           {"bom_id", order.bom_id},
           {"bom_type", toString(order.bom_type)},
           {"product_id", order.product_id},
           {"planned_qty", order.planned_qty},
           {"produced_qty", order.produced_qty},
           {"uom", order.uom},
           {"source_warehouse_id", order.source_warehouse_id},
           {"target_warehouse_id", order.target_warehouse_id},
           {"status", toString(order.status)},
           {"priority", toString(order.priority)},
           {"order_date", order.order_date},
           {"scheduled_date", dateToJson(order.scheduled_date)},
           {"completion_date", dateToJson(order.completion_date)},
           {"notes", order.notes},
           {"created_by", order.created_by},
           {"updated_by", order.updated_by},
           {"created_at_ms", order.created_at_ms},
           {"updated_at_ms", order.updated_at_ms},
           {"version", order.version}};
}

void to_json(json& j, const MaterialRequirement& requirement) {
  j = json{{"id", requirement.id},
           {"order_id", requirement.order_id},
           {"material_id", requirement.material_id},
           {"material_type", toString(requirement.material_type)},
           {"required_qty", requirement.required_qty},
           {"issued_qty", requirement.issued_qty},
           {"uom", requirement.uom},
           {"warehouse_id", requirement.warehouse_id},
           {"status", toString(requirement.status)}};
}

void to_json(json& j, const LedgerEntry& entry) {
  j = json{{"id", entry.id},
           {"movement", toString(entry.movement)},
           {"product_id", entry.product_id},
           {"warehouse_id", entry.warehouse_id},
           {"batch_no", entry.batch_no},
           {"quantity", entry.quantity},
           {"remain", entry.remain},
           {"uom", entry.uom},
           {"expiry", dateToJson(entry.expiry)},
           {"source_lot_id", entry.source_lot_id},
           {"group_id", entry.group_id},
           {"source_ref", entry.source_ref},
           {"created_by", entry.created_by},
           {"created_at_ms", entry.created_at_ms}};
}

void to_json(json& j, const MaterialIssue& issue) {
  j = json{{"id", issue.id},
           {"issue_no", issue.issue_no},
           {"order_id", issue.order_id},
           {"warehouse_id", issue.warehouse_id},
           {"group_id", issue.group_id},
           {"status", issue.status},
           {"issued_by", issue.issued_by},
           {"issued_at_ms", issue.issued_at_ms}};
}

void to_json(json& j, const IssueDetail& detail) {
  j = json{{"id", detail.id},
           {"issue_id", detail.issue_id},
           {"order_id", detail.order_id},
           {"material_id", detail.material_id},
           {"lot_id", detail.lot_id},
           {"batch_no", detail.batch_no},
           {"quantity", detail.quantity},
           {"uom", detail.uom}};
}

void to_json(json& j, const ProductionReceipt& receipt) {
  j = json{{"id", receipt.id},
           {"receipt_no", receipt.receipt_no},
           {"order_id", receipt.order_id},
           {"product_id", receipt.product_id},
           {"quantity", receipt.quantity},
           {"uom", receipt.uom},
           {"batch_no", receipt.batch_no},
           {"warehouse_id", receipt.warehouse_id},
           {"expiry", dateToJson(receipt.expiry)},
           {"quality_status", toString(receipt.quality_status)},
           {"notes", receipt.notes},
           {"group_id", receipt.group_id},
           {"created_by", receipt.created_by},
           {"received_at_ms", receipt.received_at_ms}};
}

void to_json(json& j, const GenealogyLink& link) {
  j = json{{"output_order_id", link.output_order_id},
           {"consumed_lot_id", link.consumed_lot_id},
           {"material_id", link.material_id},
           {"source_batch_no", link.source_batch_no},
           {"source_expiry", dateToJson(link.source_expiry)},
           {"quantity", link.quantity},
           {"group_id", link.group_id}};
}

}  // namespace domain
}  // namespace mfg
