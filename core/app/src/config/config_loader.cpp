#include "mfg/config/config_loader.hpp"
#include "mfg/errors/errors.hpp"

#include <fstream>
#include <iostream>
#include <set>

namespace mfg {

namespace {

const std::set<std::string> kKnownKeys = {
    "max_allocation_retries", "allow_expired_issue", "expiry_critical_days",
    "expiry_warning_days",    "require_active_bom",  "numbering",
    "ipc",
};

// Reads doc[key] into `out` when present. nlohmann's type_error is rethrown
// as ValidationError naming the key.
template <typename T>
void readOptional(const nlohmann::json& doc, const char* key, T& out) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::type_error& e) {
    throw ValidationError(std::string("Config key '") + key +
                          "' has the wrong type: " + e.what());
  }
}

const nlohmann::json* readSection(const nlohmann::json& doc, const char* key) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ValidationError(std::string("Config section '") + key +
                          "' must be an object");
  }
  return &*it;
}

void validate(const domain::EngineConfig& cfg) {
  if (cfg.max_allocation_retries < 1) {
    throw ValidationError("max_allocation_retries must be >= 1");
  }
  if (cfg.expiry_critical_days < 0 || cfg.expiry_warning_days < 0) {
    throw ValidationError("Expiry thresholds must be non-negative");
  }
  if (cfg.expiry_critical_days > cfg.expiry_warning_days) {
    throw ValidationError(
        "expiry_critical_days must not exceed expiry_warning_days");
  }
  if (cfg.order_prefix.empty() || cfg.issue_prefix.empty() ||
      cfg.receipt_prefix.empty()) {
    throw ValidationError("Document number prefixes must not be empty");
  }
}

}  // namespace

domain::EngineConfig ConfigLoader::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ValidationError("Cannot open config file: " + path);
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError("Malformed config file " + path + ": " + e.what());
  }

  std::cout << "[ConfigLoader] Loaded " << path << std::endl;
  return fromJson(doc);
}

domain::EngineConfig ConfigLoader::fromJson(const nlohmann::json& doc) {
  if (!doc.is_object()) {
    throw ValidationError("Config root must be a JSON object");
  }

  for (const auto& item : doc.items()) {
    if (kKnownKeys.count(item.key()) == 0) {
      std::cerr << "[ConfigLoader] WARNING: ignoring unknown key '"
                << item.key() << "'" << std::endl;
    }
  }

  domain::EngineConfig cfg;
  readOptional(doc, "max_allocation_retries", cfg.max_allocation_retries);
  readOptional(doc, "allow_expired_issue", cfg.allow_expired_issue);
  readOptional(doc, "expiry_critical_days", cfg.expiry_critical_days);
  readOptional(doc, "expiry_warning_days", cfg.expiry_warning_days);
  readOptional(doc, "require_active_bom", cfg.require_active_bom);

  if (const auto* numbering = readSection(doc, "numbering")) {
    readOptional(*numbering, "order_prefix", cfg.order_prefix);
    readOptional(*numbering, "issue_prefix", cfg.issue_prefix);
    readOptional(*numbering, "receipt_prefix", cfg.receipt_prefix);
  }

  if (const auto* ipc = readSection(doc, "ipc")) {
    readOptional(*ipc, "cmd_endpoint", cfg.ipc_cmd_endpoint);
    readOptional(*ipc, "pub_endpoint", cfg.ipc_pub_endpoint);
  }

  validate(cfg);
  return cfg;
}

}  // namespace mfg
