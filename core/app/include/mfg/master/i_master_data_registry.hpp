#pragma once

#include "mfg/domain/master_data.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mfg {

// -----------------------------------------------------------------------------
// IMasterDataRegistry - product and warehouse lookup interface
// -----------------------------------------------------------------------------
//
// @brief  Read-only view of the master data the engine validates against:
//         product uom / service / approval flags and warehouse ownership /
//         active flags.
//
// @details
// Product and warehouse maintenance belongs to another system. The engine
// only needs lookups by id and the full lists (for names in reports), so
// the interface is kept to those four calls. A deployment backed by a real
// ERP implements it over that system's API.
//
// Thread model:
//   Implementations MUST be safe for concurrent reads: command handlers on
//   several threads look up products at the same time.
//
// Ownership:
//   Components hold a const reference. The owner (ManufacturingEngine, a
//   test fixture) must keep the registry alive for their lifetime.
// -----------------------------------------------------------------------------
class IMasterDataRegistry {
 public:
  virtual ~IMasterDataRegistry() = default;

  virtual std::optional<domain::Product> findProduct(
      domain::ProductId id) const = 0;

  virtual std::optional<domain::Warehouse> findWarehouse(
      domain::WarehouseId id) const = 0;

  virtual std::vector<domain::Product> products() const = 0;

  virtual std::vector<domain::Warehouse> warehouses() const = 0;
};

// -----------------------------------------------------------------------------
// InMemoryMasterDataRegistry - map-backed registry for tests and the demo
// -----------------------------------------------------------------------------
//
// @brief  Holds products and warehouses in hash maps guarded by a
//         shared_mutex. Populated from the seed file by mfg_engine and
//         directly by test fixtures.
//
// Thread model: upsert*() takes an exclusive lock, lookups a shared lock.
// -----------------------------------------------------------------------------
class InMemoryMasterDataRegistry final : public IMasterDataRegistry {
 public:
  // Inserts or replaces. Throws ValidationError on id 0.
  void upsertProduct(const domain::Product& product);
  void upsertWarehouse(const domain::Warehouse& warehouse);

  std::optional<domain::Product> findProduct(
      domain::ProductId id) const override;
  std::optional<domain::Warehouse> findWarehouse(
      domain::WarehouseId id) const override;
  std::vector<domain::Product> products() const override;
  std::vector<domain::Warehouse> warehouses() const override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::ProductId, domain::Product> products_;
  std::unordered_map<domain::WarehouseId, domain::Warehouse> warehouses_;
};

// Display name helpers used by queries and telemetry. Unknown ids render as
// "#<id>" rather than failing: a read model should not throw over a label.
std::string productName(const IMasterDataRegistry& registry,
                        domain::ProductId id);
std::string warehouseName(const IMasterDataRegistry& registry,
                          domain::WarehouseId id);

}  // namespace mfg
