#pragma once

#include "mfg/domain/genealogy_link.hpp"
#include "mfg/domain/ledger_entry.hpp"
#include "mfg/domain/manufacturing_order.hpp"
#include "mfg/domain/material_issue.hpp"
#include "mfg/domain/production_receipt.hpp"
#include "mfg/errors/errors.hpp"

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace mfg {

class GenealogyTracker;
class InventoryLedger;
class OrderRepository;

// -----------------------------------------------------------------------------
// UnitOfWork - staged, all-or-nothing write set across the three stores
// -----------------------------------------------------------------------------
//
// @brief  Collects every row a command wants to write (lot decrements, new
//         ledger rows, order / requirement changes, issues, receipts,
//         genealogy links) and applies them in one critical section, or not
//         at all.
//
// @details
// Optimistic concurrency:
//   Planning happens outside any lock, against snapshots. Every staged
//   change records the version it was planned against:
//     - a lot decrement carries the lot version FEFO observed,
//     - an order update carries the order version the handler read.
//   commit() takes the ledger, order and genealogy locks (std::scoped_lock,
//   so the acquisition order cannot deadlock against another commit), then
//   validates:
//     1. every decremented lot still has the observed version,
//     2. every lot's remain covers the sum of this unit's decrements on it,
//     3. every updated order still has the observed version,
//     4. no new order reuses an existing order number.
//   Only if all hold are the changes applied; lot and order versions are
//   bumped. Any failure throws ConcurrencyConflictError with nothing
//   applied.
//
// Rollback:
//   Nothing reaches a store before commit(), so destroying an uncommitted
//   unit (exception unwind, early return) is the rollback.
//
// Row ids:
//   Drawn from the owning store's IdGenerator at staging time, so staged
//   rows can reference each other (issue detail -> issue) before commit.
//
// Thread model:
//   A UnitOfWork belongs to the thread running one command; it is not
//   shared. commit() is safe against concurrent commits and readers.
// -----------------------------------------------------------------------------
class UnitOfWork {
 public:
  UnitOfWork(InventoryLedger& ledger,
             OrderRepository& orders,
             GenealogyTracker& genealogy);

  UnitOfWork(const UnitOfWork&) = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;

  // Decrement lot.remain by quantity at commit, provided the lot is still
  // at observed_version.
  void stageLotDecrement(domain::LotId lot_id,
                         std::uint64_t observed_version,
                         double quantity);

  // Appends a new ledger row at commit. Assigns and returns its id.
  domain::LotId stageLedgerEntry(domain::LedgerEntry entry);

  // Sum of decrements staged against the lot so far.
  double stagedDecrement(domain::LotId lot_id) const;

  // Inserts a new order and its requirements at commit. Assigns ids, sets
  // requirement.order_id, returns the order id.
  domain::OrderId stageNewOrder(
      domain::ManufacturingOrder order,
      std::vector<domain::MaterialRequirement> requirements);

  // Replaces the stored order at commit if it is still at order.version.
  // The stored copy gets version + 1.
  void stageOrderUpdate(domain::ManufacturingOrder order);

  // Replaces a stored requirement. Its order must also be staged through
  // stageOrderUpdate() so the order version guards it.
  void stageRequirementUpdate(domain::MaterialRequirement requirement);

  domain::IssueId stageIssue(domain::MaterialIssue issue);
  void stageIssueDetail(domain::IssueDetail detail);
  domain::ReceiptId stageReceipt(domain::ProductionReceipt receipt);
  void stageGenealogyLink(domain::GenealogyLink link);

  // Validate and apply. Throws ConcurrencyConflictError (nothing applied)
  // or std::logic_error if called twice.
  void commit();

  bool committed() const { return committed_; }
  bool empty() const;

  const std::vector<domain::LedgerEntry>& stagedEntries() const {
    return new_entries_;
  }

 private:
  struct LotDecrement {
    domain::LotId lot_id;
    std::uint64_t observed_version;
    double quantity;
  };

  void validateLocked();
  void applyLocked();
  void requireOpen() const;

  InventoryLedger& ledger_;
  OrderRepository& orders_;
  GenealogyTracker& genealogy_;

  std::vector<LotDecrement> decrements_;
  std::map<domain::LotId, double> decrement_totals_;
  std::vector<domain::LedgerEntry> new_entries_;

  std::vector<domain::ManufacturingOrder> new_orders_;
  std::vector<domain::MaterialRequirement> new_requirements_;
  std::map<domain::OrderId, domain::ManufacturingOrder> order_updates_;
  std::vector<domain::MaterialRequirement> requirement_updates_;
  std::vector<domain::MaterialIssue> issues_;
  std::vector<domain::IssueDetail> issue_details_;
  std::vector<domain::ProductionReceipt> receipts_;
  std::vector<domain::GenealogyLink> links_;

  bool committed_{false};
};

// -----------------------------------------------------------------------------
// runTransaction(max_attempts, label, body)
// -----------------------------------------------------------------------------
// @brief  Runs body() and retries it when it throws ConcurrencyConflictError,
//         up to max_attempts runs in total.
//
// @details
// body must build a fresh UnitOfWork, re-read everything it plans against,
// and commit. Every other exception propagates on the first throw: a
// validation failure or a real stock shortage does not get better by
// retrying. After the last attempt the conflict is rethrown unchanged.
// -----------------------------------------------------------------------------
template <typename Body>
auto runTransaction(int max_attempts, const std::string& label, Body&& body)
    -> decltype(body()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return body();
    } catch (const ConcurrencyConflictError& e) {
      if (attempt >= max_attempts) {
        std::cerr << "[UnitOfWork] " << label << " gave up after " << attempt
                  << " attempt(s): " << e.what() << "\n";
        throw;
      }
      std::cerr << "[UnitOfWork] " << label << " conflict on attempt "
                << attempt << "/" << max_attempts << ", retrying: "
                << e.what() << "\n";
    }
  }
}

}  // namespace mfg
