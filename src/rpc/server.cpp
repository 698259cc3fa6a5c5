#include <spdlog/spdlog.h>
#include <algorithm>
#include <chronicle/execution/evidence.hpp>
#include <chronicle/rpc/convert.hpp>
#include <chronicle/rpc/server.hpp>

using namespace chronicle::rpc;
using namespace chronicle::schema;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const error_code code,
                                 const std::string& log) {
  return finish(context, to_grpc_status(code, log));
}

}  // namespace

listener::listener(chronicle::execution::append_engine& append_engine,
                   chronicle::execution::verification_engine& verification_engine,
                   chronicle::execution::checkpoint_manager& checkpoint_manager,
                   const chronicle::execution::store_t& storage,
                   rate_limiter& verify_limiter,
                   chronicle::execution::time_source_t clock)
    : append_engine_{append_engine},
      verification_engine_{verification_engine},
      checkpoint_manager_{checkpoint_manager},
      storage_{storage},
      verify_limiter_{verify_limiter},
      clock_{std::move(clock)} {}

void listener::stop() {
  stop_source_.request_stop();
}

grpc::ServerUnaryReactor* listener::Append(
    grpc::CallbackServerContext* context,
    const chronicle::audit::v1::AppendRequest* request,
    chronicle::audit::v1::AppendResponse* response) {
  auto error = std::string{};
  auto event = to_event(*request, error);
  if (!event) {
    response->set_code(static_cast<uint32_t>(error_code::serialization_error));
    response->set_log(error);
    return finish(context, error_code::serialization_error, error);
  }

  auto result = append_engine_.append(request->chain_id(), *event);
  response->set_code(static_cast<uint32_t>(result.code));
  response->set_log(result.log);
  response->set_attempts(result.attempts);
  if (result.entry) {
    to_proto(*result.entry, response->mutable_entry());
  }
  return finish(context, result.code, result.log);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const chronicle::audit::v1::QueryRequest* request,
    chronicle::audit::v1::QueryResponse* response) {
  auto page = storage_.query(to_filter(*request));
  response->set_code(static_cast<uint32_t>(page.code));
  response->set_log(page.log);
  for (const auto& entry : page.entries) {
    to_proto(entry, response->add_entries());
  }
  response->set_next_page_token(make_string(page.next_page_token));
  return finish(context, page.code, page.log);
}

grpc::ServerUnaryReactor* listener::Verify(
    grpc::CallbackServerContext* context,
    const chronicle::audit::v1::VerifyRequest* request,
    chronicle::audit::v1::VerifyResponse* response) {
  if (!verify_limiter_.try_acquire(request->chain_id())) {
    spdlog::warn("Throttled verification of chain '{}'", request->chain_id());
    return finish(context, grpc::Status{grpc::StatusCode::RESOURCE_EXHAUSTED,
                                        "verification rate limit exceeded"});
  }

  auto anchor = std::optional<checkpoint_t>{};
  if (!request->checkpoint_artifact().empty()) {
    auto error = std::string{};
    anchor = chronicle::execution::parse_artifact(
        request->checkpoint_artifact(), error);
    if (!anchor) {
      response->set_code(static_cast<uint32_t>(error_code::invalid_argument));
      response->set_detail(error);
      return finish(context, error_code::invalid_argument, error);
    }
  }

  auto result = verification_engine_.verify(request->chain_id(), anchor,
                                            stop_source_.get_token());
  if (!result.valid()) {
    spdlog::warn("Verification of chain '{}' reported {} at seq {}: {}",
                 request->chain_id(), to_string(result.code),
                 result.first_bad_sequence.value_or(0), result.detail);
  }
  to_proto(result, response);
  return finish(context, result.code, result.detail);
}

grpc::ServerUnaryReactor* listener::Checkpoint(
    grpc::CallbackServerContext* context,
    const chronicle::audit::v1::CheckpointRequest* request,
    chronicle::audit::v1::CheckpointResponse* response) {
  auto result = checkpoint_manager_.checkpoint(request->chain_id());
  response->set_code(static_cast<uint32_t>(result.code));
  response->set_log(result.log);
  if (result.checkpoint) {
    to_proto(*result.checkpoint, response->mutable_checkpoint());
  }
  response->set_created(result.created);
  response->set_retried_exports(result.retried_exports);
  for (const auto& stale : result.stale) {
    to_proto(stale, response->add_stale());
  }
  return finish(context, result.code, result.log);
}

grpc::ServerUnaryReactor* listener::ListCheckpoints(
    grpc::CallbackServerContext* context,
    const chronicle::audit::v1::ListCheckpointsRequest* request,
    chronicle::audit::v1::ListCheckpointsResponse* response) {
  auto listing = checkpoint_manager_.list_checkpoints(request->chain_id());
  auto code = listing.ok() ? error_code::ok : error_code::store_unavailable;
  response->set_code(static_cast<uint32_t>(code));
  response->set_log(listing.error);
  for (const auto& value : listing.value) {
    to_proto(value, response->add_checkpoints());
  }
  return finish(context, code, listing.error);
}

grpc::ServerUnaryReactor* listener::ChainStatus(
    grpc::CallbackServerContext* context,
    const chronicle::audit::v1::ChainStatusRequest* request,
    chronicle::audit::v1::ChainStatusResponse* response) {
  auto status = verification_engine_.chain_status(request->chain_id());
  to_proto(status, response);
  return finish(context, status.code, status.verification.detail);
}

grpc::ServerUnaryReactor* listener::ExportPackage(
    grpc::CallbackServerContext* context,
    const chronicle::audit::v1::ExportPackageRequest* request,
    chronicle::audit::v1::ExportPackageResponse* response) {
  auto package = chronicle::execution::export_package(
      storage_, to_evidence_request(*request), clock_());
  response->set_code(static_cast<uint32_t>(package.code));
  response->set_log(package.log);
  if (package.code == error_code::ok) {
    response->set_package_json(chronicle::execution::to_json(package).dump());
    response->set_package_hash(make_string(
        bytes_view_t{package.package_hash.data(), package.package_hash.size()}));
    response->set_entry_count(package.entries.size());
  }
  return finish(context, package.code, package.log);
}

grpc::ServerUnaryReactor* listener::LookupEntry(
    grpc::CallbackServerContext* context,
    const chronicle::audit::v1::LookupEntryRequest* request,
    chronicle::audit::v1::LookupEntryResponse* response) {
  const auto& raw = request->entry_hash();
  auto hash = std::optional<hash32_t>{};
  if (raw.size() == 32) {
    hash = hash32_t{};
    std::copy(std::begin(raw), std::end(raw), std::begin(*hash));
  } else {
    hash = try_make_hash32(raw);
  }
  if (!hash) {
    response->set_code(static_cast<uint32_t>(error_code::invalid_argument));
    response->set_log("entry_hash must be 32 raw or 64 hex-encoded bytes");
    return finish(context, error_code::invalid_argument, response->log());
  }

  auto found = verification_engine_.lookup(request->chain_id(), *hash);
  response->set_code(static_cast<uint32_t>(found.code));
  response->set_log(found.log);
  if (found.entry) {
    to_proto(*found.entry, response->mutable_entry());
  }
  response->set_hash_verified(found.hash_verified);
  if (found.proof) {
    to_proto(*found.proof, response->mutable_proof());
  }
  return finish(context, found.code, found.log);
}
