#pragma once

#include <chronicle/schema/primitives.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Schema type: audit event.
// Audit workflow: the logical content a caller submits for appending. The
// engine assigns chain position and hashes.
namespace chronicle::schema {

struct audit_event final {
  std::string actor_id;
  std::string action;
  std::string resource_type;
  std::string resource_id;
  nlohmann::json payload = nlohmann::json::object();
  std::optional<timestamp_microseconds_t> timestamp;
};

}  // namespace chronicle::schema
