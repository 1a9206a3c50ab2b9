#pragma once

#include "mfg/bom/bom_explosion.hpp"
#include "mfg/bom/bom_registry.hpp"
#include "mfg/domain/bom.hpp"
#include "mfg/domain/genealogy_link.hpp"
#include "mfg/domain/ledger_entry.hpp"
#include "mfg/domain/manufacturing_order.hpp"
#include "mfg/domain/master_data.hpp"
#include "mfg/domain/material_issue.hpp"
#include "mfg/domain/production_receipt.hpp"
#include "mfg/genealogy/genealogy_tracker.hpp"
#include "mfg/inventory/fefo_allocator.hpp"
#include "mfg/inventory/inventory_ledger.hpp"
#include "mfg/production/manufacturing_order_service.hpp"
#include "mfg/reporting/production_reports.hpp"
#include "mfg/time/calendar_date.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

// -----------------------------------------------------------------------------
// JSON encoding of domain values
// -----------------------------------------------------------------------------
//
// nlohmann::json ADL hooks, one per value type that crosses the IPC
// boundary (command replies and PUB telemetry). Encoding only: requests are
// decoded field by field by the engine dispatcher, which knows which fields
// are optional for which command.
//
// Conventions:
//   dates          "YYYY-MM-DD", null when absent
//   enums          their upper-case wire names ("IN_PROGRESS", "KITTING")
//   timestamps     epoch milliseconds
// -----------------------------------------------------------------------------

namespace mfg {

nlohmann::json dateToJson(const std::optional<CalendarDate>& date);

void to_json(nlohmann::json& j, const CalendarDate& date);

void to_json(nlohmann::json& j, const RequirementLine& line);
void to_json(nlohmann::json& j, const BomUsage& usage);
void to_json(nlohmann::json& j, const MaterialUsageRow& row);

void to_json(nlohmann::json& j, const LotBreakdownRow& row);
void to_json(nlohmann::json& j, const ExpiryReportRow& row);
void to_json(nlohmann::json& j, const ProductionImpactRow& row);
void to_json(nlohmann::json& j, const AvailabilityRow& row);
void to_json(nlohmann::json& j, const PreviewTake& take);
void to_json(nlohmann::json& j, const AllocationPreview& preview);

void to_json(nlohmann::json& j, const BatchSource& source);
void to_json(nlohmann::json& j, const BatchLocation& location);
void to_json(nlohmann::json& j, const BatchInfo& info);
void to_json(nlohmann::json& j, const ProducedBatch& batch);

void to_json(nlohmann::json& j, const IssuedMaterialLine& line);
void to_json(nlohmann::json& j, const IssueResult& result);
void to_json(nlohmann::json& j, const CompletionResult& result);
void to_json(nlohmann::json& j, const OrderDetail& detail);
void to_json(nlohmann::json& j, const RequirementAvailability& row);

void to_json(nlohmann::json& j, const ProductionSummary& summary);
void to_json(nlohmann::json& j, const DailyProductionRow& row);
void to_json(nlohmann::json& j, const MaterialConsumptionRow& row);
void to_json(nlohmann::json& j, const StatusCountRow& row);
void to_json(nlohmann::json& j, const EfficiencyRow& row);
void to_json(nlohmann::json& j, const ActivityRow& row);

namespace domain {

void to_json(nlohmann::json& j, const Product& product);
void to_json(nlohmann::json& j, const Warehouse& warehouse);
void to_json(nlohmann::json& j, const BomLine& line);
void to_json(nlohmann::json& j, const BomHeader& bom);
void to_json(nlohmann::json& j, const ManufacturingOrder& order);
void to_json(nlohmann::json& j, const MaterialRequirement& requirement);
void to_json(nlohmann::json& j, const LedgerEntry& entry);
void to_json(nlohmann::json& j, const MaterialIssue& issue);
void to_json(nlohmann::json& j, const IssueDetail& detail);
void to_json(nlohmann::json& j, const ProductionReceipt& receipt);
void to_json(nlohmann::json& j, const GenealogyLink& link);

}  // namespace domain
}  // namespace mfg
