#pragma once

#include "mfg/concurrent/id_generator.hpp"
#include "mfg/domain/bom.hpp"
#include "mfg/domain/manufacturing_order.hpp"
#include "mfg/domain/material_issue.hpp"
#include "mfg/domain/order_status.hpp"
#include "mfg/domain/production_receipt.hpp"
#include "mfg/time/calendar_date.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mfg {

class UnitOfWork;

// Every field is optional; an empty filter lists all orders.
struct OrderFilter {
  std::optional<domain::OrderStatus> status;
  std::optional<domain::BomType> bom_type;
  std::optional<CalendarDate> from;  // order_date >= from
  std::optional<CalendarDate> to;    // order_date <= to
  std::string search;                // substring of order_no
};

// -----------------------------------------------------------------------------
// OrderRepository - store for orders and the documents they own
// -----------------------------------------------------------------------------
//
// @brief  Holds manufacturing orders, their material requirements, material
//         issues with their details, and production receipts.
//
// @details
// Read access is public and returns copies. Write access is private and
// reserved to UnitOfWork (friend), which applies staged rows only after
// validating the order versions it observed. That keeps "order row changed"
// and "lot decremented" inside the same commit critical section.
//
// Thread model:
//   shared_mutex: queries share, UnitOfWork::commit() excludes.
//
// Ownership:
//   Owned by ManufacturingEngine via std::unique_ptr.
// -----------------------------------------------------------------------------
class OrderRepository {
 public:
  OrderRepository() = default;

  OrderRepository(const OrderRepository&) = delete;
  OrderRepository& operator=(const OrderRepository&) = delete;

  std::optional<domain::ManufacturingOrder> findOrder(domain::OrderId id) const;
  std::optional<domain::ManufacturingOrder> findOrderByNo(
      const std::string& order_no) const;

  // Throws NotFoundError for an unknown id.
  domain::ManufacturingOrder getOrder(domain::OrderId id) const;

  // Newest first (creation time, then id).
  std::vector<domain::ManufacturingOrder> listOrders(
      const OrderFilter& filter = {}) const;

  // Requirements of one order, in BOM line order.
  std::vector<domain::MaterialRequirement> requirementsOf(
      domain::OrderId order_id) const;

  std::vector<domain::MaterialIssue> issuesOf(domain::OrderId order_id) const;
  std::vector<domain::IssueDetail> issueDetailsOf(
      domain::OrderId order_id) const;
  std::vector<domain::ProductionReceipt> receiptsOf(
      domain::OrderId order_id) const;
  std::vector<domain::ProductionReceipt> receiptsByBatch(
      const std::string& batch_no) const;

  std::vector<domain::MaterialIssue> issues() const;
  std::vector<domain::IssueDetail> issueDetails() const;
  std::vector<domain::ProductionReceipt> receipts() const;

  std::size_t orderCount() const;

 private:
  friend class UnitOfWork;

  // Caller holds mutex_ exclusively.
  domain::ManufacturingOrder* findOrderLocked(domain::OrderId id);
  bool orderNoTakenLocked(const std::string& order_no) const;
  void insertOrderLocked(domain::ManufacturingOrder order);
  void insertRequirementLocked(domain::MaterialRequirement requirement);
  domain::MaterialRequirement* findRequirementLocked(domain::RequirementId id);

  mutable std::shared_mutex mutex_;

  std::map<domain::OrderId, domain::ManufacturingOrder> orders_;
  std::unordered_map<std::string, domain::OrderId> order_no_index_;
  std::map<domain::RequirementId, domain::MaterialRequirement> requirements_;
  std::vector<domain::MaterialIssue> issues_;
  std::vector<domain::IssueDetail> issue_details_;
  std::vector<domain::ProductionReceipt> receipts_;

  IdGenerator order_ids_;
  IdGenerator requirement_ids_;
  IdGenerator issue_ids_;
  IdGenerator issue_detail_ids_;
  IdGenerator receipt_ids_;
};

}  // namespace mfg
