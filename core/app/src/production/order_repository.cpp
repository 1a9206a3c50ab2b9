#include "mfg/production/order_repository.hpp"
#include "mfg/errors/errors.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

namespace mfg {

std::optional<domain::ManufacturingOrder> OrderRepository::findOrder(
    domain::OrderId id) const {
  std::shared_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::ManufacturingOrder> OrderRepository::findOrderByNo(
    const std::string& order_no) const {
  std::shared_lock lock(mutex_);
  auto it = order_no_index_.find(order_no);
  if (it == order_no_index_.end()) {
    return std::nullopt;
  }
  return orders_.at(it->second);
}

domain::ManufacturingOrder OrderRepository::getOrder(domain::OrderId id) const {
  auto order = findOrder(id);
  if (!order) {
    throw NotFoundError("Unknown manufacturing order id " +
                        std::to_string(id));
  }
  return *order;
}

std::vector<domain::ManufacturingOrder> OrderRepository::listOrders(
    const OrderFilter& filter) const {
  std::vector<domain::ManufacturingOrder> result;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, order] : orders_) {
      if (filter.status && order.status != *filter.status) continue;
      if (filter.bom_type && order.bom_type != *filter.bom_type) continue;
      if (filter.from && order.order_date < *filter.from) continue;
      if (filter.to && order.order_date > *filter.to) continue;
      if (!filter.search.empty() &&
          order.order_no.find(filter.search) == std::string::npos) {
        continue;
      }
      result.push_back(order);
    }
  }
  std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) {
      return a.created_at_ms > b.created_at_ms;
    }
    return a.id > b.id;
  });
  return result;
}

std::vector<domain::MaterialRequirement> OrderRepository::requirementsOf(
    domain::OrderId order_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::MaterialRequirement> result;
  for (const auto& [id, requirement] : requirements_) {
    if (requirement.order_id == order_id) {
      result.push_back(requirement);
    }
  }
  return result;
}

std::vector<domain::MaterialIssue> OrderRepository::issuesOf(
    domain::OrderId order_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::MaterialIssue> result;
  std::copy_if(issues_.begin(), issues_.end(), std::back_inserter(result),
               [&](const auto& i) { return i.order_id == order_id; });
  return result;
}

std::vector<domain::IssueDetail> OrderRepository::issueDetailsOf(
    domain::OrderId order_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::IssueDetail> result;
  std::copy_if(issue_details_.begin(), issue_details_.end(),
               std::back_inserter(result),
               [&](const auto& d) { return d.order_id == order_id; });
  return result;
}

std::vector<domain::ProductionReceipt> OrderRepository::receiptsOf(
    domain::OrderId order_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::ProductionReceipt> result;
  std::copy_if(receipts_.begin(), receipts_.end(), std::back_inserter(result),
               [&](const auto& r) { return r.order_id == order_id; });
  return result;
}

std::vector<domain::ProductionReceipt> OrderRepository::receiptsByBatch(
    const std::string& batch_no) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::ProductionReceipt> result;
  std::copy_if(receipts_.begin(), receipts_.end(), std::back_inserter(result),
               [&](const auto& r) { return r.batch_no == batch_no; });
  return result;
}

std::vector<domain::MaterialIssue> OrderRepository::issues() const {
  std::shared_lock lock(mutex_);
  return issues_;
}

std::vector<domain::IssueDetail> OrderRepository::issueDetails() const {
  std::shared_lock lock(mutex_);
  return issue_details_;
}

std::vector<domain::ProductionReceipt> OrderRepository::receipts() const {
  std::shared_lock lock(mutex_);
  return receipts_;
}

std::size_t OrderRepository::orderCount() const {
  std::shared_lock lock(mutex_);
  return orders_.size();
}

domain::ManufacturingOrder* OrderRepository::findOrderLocked(
    domain::OrderId id) {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

bool OrderRepository::orderNoTakenLocked(const std::string& order_no) const {
  return order_no_index_.count(order_no) != 0;
}

void OrderRepository::insertOrderLocked(domain::ManufacturingOrder order) {
  order_no_index_[order.order_no] = order.id;
  const domain::OrderId id = order.id;
  orders_.emplace(id, std::move(order));
}

void OrderRepository::insertRequirementLocked(
    domain::MaterialRequirement requirement) {
  const domain::RequirementId id = requirement.id;
  requirements_.emplace(id, std::move(requirement));
}

domain::MaterialRequirement* OrderRepository::findRequirementLocked(
    domain::RequirementId id) {
  auto it = requirements_.find(id);
  return it == requirements_.end() ? nullptr : &it->second;
}

}  // namespace mfg
