#include "mfg/master/i_master_data_registry.hpp"
#include "mfg/errors/errors.hpp"

#include <algorithm>
#include <mutex>
#include <string>

namespace mfg {

void InMemoryMasterDataRegistry::upsertProduct(const domain::Product& product) {
  if (product.id == 0) {
    throw ValidationError("Product id must be non-zero");
  }
  std::unique_lock lock(mutex_);
  products_[product.id] = product;
}

void InMemoryMasterDataRegistry::upsertWarehouse(
    const domain::Warehouse& warehouse) {
  if (warehouse.id == 0) {
    throw ValidationError("Warehouse id must be non-zero");
  }
  std::unique_lock lock(mutex_);
  warehouses_[warehouse.id] = warehouse;
}

std::optional<domain::Product> InMemoryMasterDataRegistry::findProduct(
    domain::ProductId id) const {
  std::shared_lock lock(mutex_);
  auto it = products_.find(id);
  if (it == products_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Warehouse> InMemoryMasterDataRegistry::findWarehouse(
    domain::WarehouseId id) const {
  std::shared_lock lock(mutex_);
  auto it = warehouses_.find(id);
  if (it == warehouses_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Product> InMemoryMasterDataRegistry::products() const {
  std::vector<domain::Product> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(products_.size());
    for (const auto& [id, product] : products_) {
      result.push_back(product);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.id < b.id; });
  return result;
}

std::vector<domain::Warehouse> InMemoryMasterDataRegistry::warehouses() const {
  std::vector<domain::Warehouse> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(warehouses_.size());
    for (const auto& [id, warehouse] : warehouses_) {
      result.push_back(warehouse);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.id < b.id; });
  return result;
}

std::string productName(const IMasterDataRegistry& registry,
                        domain::ProductId id) {
  auto product = registry.findProduct(id);
  return product ? product->name : "#" + std::to_string(id);
}

std::string warehouseName(const IMasterDataRegistry& registry,
                          domain::WarehouseId id) {
  auto warehouse = registry.findWarehouse(id);
  return warehouse ? warehouse->name : "#" + std::to_string(id);
}

}  // namespace mfg
