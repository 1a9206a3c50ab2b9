#pragma once

#include "mfg/domain/identifiers.hpp"

#include <cstdint>
#include <string>

namespace mfg {
namespace domain {

// Header of one issuance event. Every issue the engine commits is CONFIRMED;
// a failed issuance leaves no header behind.
struct MaterialIssue {
  IssueId id{};
  std::string issue_no;  // MI-YYYYMMDDHHMMSS-NNNN
  OrderId order_id{};
  WarehouseId warehouse_id{};
  std::string group_id;
  std::string status{"CONFIRMED"};
  std::string issued_by;
  std::int64_t issued_at_ms{0};
};

// Which lot satisfied how much of one material for an issue.
struct IssueDetail {
  IssueDetailId id{};
  IssueId issue_id{};
  OrderId order_id{};
  ProductId material_id{};
  LotId lot_id{};
  std::string batch_no;
  double quantity{0.0};
  std::string uom;
};

}  // namespace domain
}  // namespace mfg
