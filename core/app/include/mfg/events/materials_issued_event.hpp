#pragma once

#include "mfg/domain/material_issue.hpp"
#include "mfg/events/event_types.hpp"

#include <string>
#include <vector>

namespace mfg {

// -----------------------------------------------------------------------------
// MaterialsIssuedEvent
// -----------------------------------------------------------------------------
// Responsibility: One committed issuance: the issue header and every lot
// consumption it wrote. Published after commit by
// ManufacturingOrderService::issueMaterials().
// -----------------------------------------------------------------------------
struct MaterialsIssuedEvent {
  domain::MaterialIssue issue;
  std::string order_no;
  std::vector<domain::IssueDetail> details;
  TimestampMs timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace mfg
