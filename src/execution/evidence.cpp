#include <spdlog/spdlog.h>
#include <chronicle/crypto/hash.hpp>
#include <chronicle/execution/evidence.hpp>

using namespace chronicle::schema;

namespace chronicle::execution {

namespace {

nlohmann::json optional_timestamp(
    const std::optional<timestamp_microseconds_t>& value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

nlohmann::json optional_text(const std::optional<std::string>& value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

nlohmann::json entry_json(const audit_entry_t& entry) {
  auto payload = nlohmann::json::parse(entry.payload, nullptr, false);
  if (payload.is_discarded()) {
    // Keep undecodable payloads verbatim so the package still shows them.
    payload = entry.payload;
  }
  return nlohmann::json{
      {"chain_id", entry.chain_id},
      {"sequence", entry.sequence},
      {"timestamp", entry.timestamp},
      {"actor_id", entry.actor_id},
      {"action", entry.action},
      {"resource_type", entry.resource_type},
      {"resource_id", entry.resource_id},
      {"payload", std::move(payload)},
      {"previous_hash", to_hex(entry.previous_hash)},
      {"entry_hash", to_hex(entry.entry_hash)},
  };
}

}  // namespace

evidence_package_t export_package(const store_t& storage,
                                  const evidence_request& request,
                                  const timestamp_microseconds_t exported_at) {
  auto package = evidence_package_t{};
  package.chain_id = request.chain_id;
  package.exported_at = exported_at;
  package.from_timestamp = request.from_timestamp;
  package.to_timestamp = request.to_timestamp;
  package.resource_type = request.resource_type;
  package.resource_id = request.resource_id;

  if (request.chain_id.empty()) {
    package.code = error_code::invalid_argument;
    package.log = "chain_id is required";
    return package;
  }
  const auto from = request.from_sequence.value_or(0);
  const auto to = request.to_sequence.value_or(storage::kOpenEnded);
  if (from > to) {
    package.code = error_code::invalid_argument;
    package.log = "sequence window is inverted";
    return package;
  }

  auto oversized = false;
  auto outcome = storage.for_each_in_range(
      request.chain_id, from, to, [&](const audit_entry_t& entry) {
        if (request.from_timestamp &&
            entry.timestamp < *request.from_timestamp) {
          return true;
        }
        if (request.to_timestamp && entry.timestamp > *request.to_timestamp) {
          return true;
        }
        if ((request.resource_type &&
             entry.resource_type != *request.resource_type) ||
            (request.resource_id &&
             entry.resource_id != *request.resource_id)) {
          return true;
        }
        if (package.entries.size() == kMaxPackageEntries) {
          oversized = true;
          return false;
        }
        package.entries.push_back(entry);
        return true;
      });

  if (outcome.status == storage::store_status::corrupt_record) {
    package.code = error_code::chain_integrity_error;
    package.log = outcome.error;
    package.entries.clear();
    return package;
  }
  if (!outcome.ok()) {
    package.code = error_code::store_unavailable;
    package.log = outcome.error;
    package.entries.clear();
    return package;
  }
  if (oversized) {
    package.code = error_code::invalid_argument;
    package.log = "window exceeds " + std::to_string(kMaxPackageEntries) +
                  " entries; narrow the request";
    package.entries.clear();
    return package;
  }

  package.package_hash = compute_package_hash(package);
  spdlog::info("Exported evidence package for chain '{}': {} entries, hash {}",
               package.chain_id, package.entries.size(),
               to_hex(package.package_hash));
  return package;
}

nlohmann::json package_body(const evidence_package_t& value) {
  auto entries = nlohmann::json::array();
  for (const auto& entry : value.entries) {
    entries.push_back(entry_json(entry));
  }
  return nlohmann::json{
      {"version", value.version},
      {"chain_id", value.chain_id},
      {"exported_at", value.exported_at},
      {"date_range",
       {{"start", optional_timestamp(value.from_timestamp)},
        {"end", optional_timestamp(value.to_timestamp)}}},
      {"resource",
       {{"type", optional_text(value.resource_type)},
        {"id", optional_text(value.resource_id)}}},
      {"entry_count", value.entries.size()},
      {"entries", std::move(entries)},
  };
}

nlohmann::json to_json(const evidence_package_t& value) {
  auto body = package_body(value);
  body["package_hash"] = to_hex(value.package_hash);
  return body;
}

hash32_t compute_package_hash(const evidence_package_t& value) {
  auto text = package_body(value).dump();
  return crypto::sha256(make_bytes_view(text));
}

}  // namespace chronicle::execution
