#pragma once

#include "mfg/domain/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace mfg {

// -----------------------------------------------------------------------------
// ConfigLoader - reads EngineConfig from a JSON document
// -----------------------------------------------------------------------------
//
// @brief  Turns a JSON file (or an already-parsed document) into an
//         EngineConfig.
//
// @details
// Every key is optional; absent keys keep the EngineConfig defaults. Unknown
// keys are ignored with a warning so a config written for a newer build
// still loads. Anything present but unusable (wrong JSON type, negative
// thresholds, critical > warning, empty prefix) raises ValidationError and
// the engine refuses to start.
//
// Example:
//   {
//     "max_allocation_retries": 3,
//     "allow_expired_issue": true,
//     "expiry_critical_days": 7,
//     "expiry_warning_days": 30,
//     "require_active_bom": true,
//     "numbering": { "order_prefix": "MO", "issue_prefix": "MI",
//                    "receipt_prefix": "PR" },
//     "ipc": { "cmd_endpoint": "tcp://127.0.0.1:5555",
//              "pub_endpoint": "tcp://127.0.0.1:5556" }
//   }
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  // Throws ValidationError if the file cannot be opened or parsed.
  static domain::EngineConfig load(const std::string& path);

  static domain::EngineConfig fromJson(const nlohmann::json& doc);
};

}  // namespace mfg
