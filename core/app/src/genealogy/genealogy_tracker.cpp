#include "mfg/genealogy/genealogy_tracker.hpp"
#include "mfg/errors/errors.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <utility>

namespace mfg {

GenealogyTracker::GenealogyTracker(const InventoryLedger& ledger,
                                   const OrderRepository& orders,
                                   const BomRegistry& boms,
                                   const IMasterDataRegistry& master_data,
                                   const ITimeProvider& time_provider)
    : ledger_(ledger),
      orders_(orders),
      boms_(boms),
      master_data_(master_data),
      time_provider_(time_provider) {}

std::vector<domain::GenealogyLink> GenealogyTracker::linksFor(
    domain::OrderId order_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::GenealogyLink> result;
  for (const auto& link : links_) {
    if (link.output_order_id == order_id) {
      result.push_back(link);
    }
  }
  return result;
}

std::optional<CalendarDate> GenealogyTracker::inheritedExpiry(
    domain::OrderId order_id) const {
  std::shared_lock lock(mutex_);
  std::optional<CalendarDate> earliest;
  for (const auto& link : links_) {
    if (link.output_order_id != order_id || !link.source_expiry) {
      continue;
    }
    if (!earliest || *link.source_expiry < *earliest) {
      earliest = link.source_expiry;
    }
  }
  return earliest;
}

std::vector<BomUsage> GenealogyTracker::whereUsed(
    domain::ProductId product_id) const {
  return boms_.whereUsed(product_id);
}

// -----------------------------------------------------------------------------
// sourcesOf(): receipt(batch) -> order -> links
// -----------------------------------------------------------------------------
std::vector<BatchSource> GenealogyTracker::sourcesOf(
    const std::string& batch_no) const {
  std::vector<BatchSource> result;
  for (const auto& receipt : orders_.receiptsByBatch(batch_no)) {
    for (const auto& link : linksFor(receipt.order_id)) {
      BatchSource source;
      source.material_id = link.material_id;
      source.material_name = productName(master_data_, link.material_id);
      source.quantity = link.quantity;
      source.source_batch_no = link.source_batch_no;
      source.source_expiry = link.source_expiry;
      result.push_back(std::move(source));
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const auto& a, const auto& b) {
                     return a.material_name < b.material_name;
                   });
  return result;
}

// -----------------------------------------------------------------------------
// locationsOf(): live lots of the batch, grouped by (warehouse, status)
// -----------------------------------------------------------------------------
std::vector<BatchLocation> GenealogyTracker::locationsOf(
    const std::string& batch_no) const {
  const CalendarDate today = CalendarDate::fromEpochMs(time_provider_.now_ms());

  std::map<std::pair<domain::WarehouseId, BatchLocationStatus>, double> grouped;
  for (const auto& lot : ledger_.lotsByBatch(batch_no)) {
    if (lot.deleted || lot.remain <= domain::kQuantityEpsilon) {
      continue;
    }
    const auto status = (lot.expiry && *lot.expiry < today)
                            ? BatchLocationStatus::Expired
                            : BatchLocationStatus::Available;
    grouped[{lot.warehouse_id, status}] += lot.remain;
  }

  std::vector<BatchLocation> result;
  result.reserve(grouped.size());
  for (const auto& [key, quantity] : grouped) {
    BatchLocation location;
    location.warehouse_id = key.first;
    location.warehouse_name = warehouseName(master_data_, key.first);
    location.remaining_qty = quantity;
    location.status = key.second;
    result.push_back(std::move(location));
  }
  return result;
}

std::optional<BatchInfo> GenealogyTracker::batchInfo(
    const std::string& batch_no) const {
  std::optional<BatchInfo> info;
  for (const auto& lot : ledger_.lotsByBatch(batch_no)) {
    if (lot.movement != domain::MovementType::ProductionIn) {
      continue;
    }
    if (!info) {
      info.emplace();
      info->batch_no = batch_no;
      info->product_id = lot.product_id;
      info->uom = lot.uom;
      info->expiry = lot.expiry;
      info->first_received_at_ms = lot.created_at_ms;
      info->warehouse_id = lot.warehouse_id;
    }
    info->produced_qty += lot.quantity;
    info->first_received_at_ms =
        std::min(info->first_received_at_ms, lot.created_at_ms);
  }

  if (info) {
    if (auto product = master_data_.findProduct(info->product_id)) {
      info->product_name = product->name;
      info->product_code = product->code;
    }
    info->warehouse_name = warehouseName(master_data_, info->warehouse_id);
  }
  return info;
}

std::vector<ProducedBatch> GenealogyTracker::batchesProducedBy(
    const std::string& order_no) const {
  auto order = orders_.findOrderByNo(order_no);
  if (!order) {
    throw NotFoundError("Unknown manufacturing order " + order_no);
  }

  std::vector<ProducedBatch> result;
  for (const auto& receipt : orders_.receiptsOf(order->id)) {
    ProducedBatch batch;
    batch.batch_no = receipt.batch_no;
    batch.receipt_no = receipt.receipt_no;
    batch.received_at_ms = receipt.received_at_ms;
    batch.product_name = productName(master_data_, receipt.product_id);
    batch.quantity = receipt.quantity;
    batch.quality_status = receipt.quality_status;
    result.push_back(std::move(batch));
  }
  return result;
}

std::size_t GenealogyTracker::linkCount() const {
  std::shared_lock lock(mutex_);
  return links_.size();
}

void GenealogyTracker::appendLocked(domain::GenealogyLink link) {
  links_.push_back(std::move(link));
}

}  // namespace mfg
