#include <chronicle/rpc/convert.hpp>

using namespace chronicle::schema;

namespace chronicle::rpc {

namespace {

std::string hash_bytes(const hash32_t& hash) {
  return make_string(bytes_view_t{hash.data(), hash.size()});
}

chronicle::audit::v1::VerificationStatus to_proto_status(
    const verification_status status) {
  using enum verification_status;
  switch (status) {
    case valid:
      return chronicle::audit::v1::VERIFICATION_STATUS_VALID;
    case broken:
      return chronicle::audit::v1::VERIFICATION_STATUS_BROKEN;
    case error:
    default:
      return chronicle::audit::v1::VERIFICATION_STATUS_ERROR;
  }
}

}  // namespace

void to_proto(const audit_entry_t& source,
              chronicle::audit::v1::AuditEntry* destination) {
  destination->set_chain_id(source.chain_id);
  destination->set_sequence(source.sequence);
  destination->set_timestamp(source.timestamp);
  destination->set_actor_id(source.actor_id);
  destination->set_action(source.action);
  destination->set_resource_type(source.resource_type);
  destination->set_resource_id(source.resource_id);
  destination->set_payload_json(source.payload);
  destination->set_previous_hash(hash_bytes(source.previous_hash));
  destination->set_entry_hash(hash_bytes(source.entry_hash));
}

void to_proto(const checkpoint_t& source,
              chronicle::audit::v1::Checkpoint* destination) {
  destination->set_chain_id(source.chain_id);
  destination->set_sequence(source.sequence);
  destination->set_root_hash(hash_bytes(source.root_hash));
  destination->set_merkle_root(hash_bytes(source.merkle_root));
  destination->set_created_at(source.created_at);
  destination->set_exported(source.exported);
  if (source.exported_at) {
    destination->set_exported_at(*source.exported_at);
  }
  destination->set_export_destination(source.export_destination);
  destination->set_export_attempts(source.export_attempts);
}

void to_proto(const inclusion_proof_t& source,
              chronicle::audit::v1::InclusionProof* destination) {
  destination->set_leaf_index(source.leaf_index);
  destination->set_tree_size(source.tree_size);
  destination->set_merkle_root(hash_bytes(source.merkle_root));
  for (const auto& sibling : source.path) {
    destination->add_path(hash_bytes(sibling));
  }
  if (source.checkpoint_sequence) {
    destination->set_checkpoint_sequence(*source.checkpoint_sequence);
  }
}

void to_proto(const verification_result_t& source,
              chronicle::audit::v1::VerifyResponse* destination) {
  destination->set_code(static_cast<uint32_t>(source.code));
  destination->set_status(to_proto_status(source.status));
  if (source.covered) {
    destination->set_first_sequence(source.covered->first);
    destination->set_last_sequence(source.covered->last);
  }
  destination->set_entries_checked(source.entries_checked);
  if (source.first_bad_sequence) {
    destination->set_first_bad_sequence(*source.first_bad_sequence);
  }
  if (source.reason != integrity_failure::none) {
    destination->set_reason(std::string{to_string(source.reason)});
  }
  destination->set_tip_hash(hash_bytes(source.tip_hash));
  destination->set_cancelled(source.cancelled);
  destination->set_detail(source.detail);
}

void to_proto(const chain_status_t& source,
              chronicle::audit::v1::ChainStatusResponse* destination) {
  destination->set_code(static_cast<uint32_t>(source.code));
  destination->set_chain_id(source.chain_id);
  destination->set_length(source.length);
  destination->set_tip_hash(hash_bytes(source.tip_hash));
  if (source.created_at) {
    destination->set_created_at(*source.created_at);
  }
  if (source.latest_checkpoint) {
    to_proto(*source.latest_checkpoint,
             destination->mutable_latest_checkpoint());
  }
  to_proto(source.verification, destination->mutable_verification());
}

std::optional<audit_event> to_event(
    const chronicle::audit::v1::AppendRequest& request,
    std::string& error) {
  auto event = audit_event{};
  event.actor_id = request.actor_id();
  event.action = request.action();
  event.resource_type = request.resource_type();
  event.resource_id = request.resource_id();
  if (request.has_timestamp()) {
    event.timestamp = request.timestamp();
  }
  if (!request.payload_json().empty()) {
    event.payload = nlohmann::json::parse(request.payload_json(), nullptr, false);
    if (event.payload.is_discarded()) {
      error = "payload_json is not valid JSON";
      return std::nullopt;
    }
  }
  return event;
}

query_filter to_filter(const chronicle::audit::v1::QueryRequest& request) {
  auto filter = query_filter{};
  if (request.has_chain_id()) {
    filter.chain_id = request.chain_id();
  }
  if (request.has_actor_id()) {
    filter.actor_id = request.actor_id();
  }
  if (request.has_resource_type()) {
    filter.resource_type = request.resource_type();
  }
  if (request.has_resource_id()) {
    filter.resource_id = request.resource_id();
  }
  if (request.has_from_timestamp()) {
    filter.from_timestamp = request.from_timestamp();
  }
  if (request.has_to_timestamp()) {
    filter.to_timestamp = request.to_timestamp();
  }
  filter.page_size = request.page_size();
  filter.page_token = make_bytes(request.page_token());
  return filter;
}

evidence_request to_evidence_request(
    const chronicle::audit::v1::ExportPackageRequest& request) {
  auto converted = evidence_request{};
  converted.chain_id = request.chain_id();
  if (request.has_from_sequence()) {
    converted.from_sequence = request.from_sequence();
  }
  if (request.has_to_sequence()) {
    converted.to_sequence = request.to_sequence();
  }
  if (request.has_from_timestamp()) {
    converted.from_timestamp = request.from_timestamp();
  }
  if (request.has_to_timestamp()) {
    converted.to_timestamp = request.to_timestamp();
  }
  if (request.has_resource_type()) {
    converted.resource_type = request.resource_type();
  }
  if (request.has_resource_id()) {
    converted.resource_id = request.resource_id();
  }
  return converted;
}

grpc::Status to_grpc_status(const error_code code, const std::string& log) {
  auto message = std::string{to_string(code)};
  if (!log.empty()) {
    message += ": " + log;
  }
  switch (code) {
    case error_code::ok:
    case error_code::chain_integrity_error:
    case error_code::genesis_missing:
    case error_code::unknown_predecessor:
    case error_code::checkpoint_export_failure:
      return grpc::Status::OK;
    case error_code::serialization_error:
    case error_code::invalid_argument:
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message};
    case error_code::concurrent_append_conflict:
      return grpc::Status{grpc::StatusCode::ABORTED, message};
    case error_code::store_unavailable:
      return grpc::Status{grpc::StatusCode::UNAVAILABLE, message};
    case error_code::chain_empty:
      return grpc::Status{grpc::StatusCode::FAILED_PRECONDITION, message};
    case error_code::not_found:
      return grpc::Status{grpc::StatusCode::NOT_FOUND, message};
  }
  return grpc::Status{grpc::StatusCode::UNKNOWN, message};
}

}  // namespace chronicle::rpc
