#pragma once

#include <chronicle/audit/v1/audit.pb.h>
#include <grpcpp/support/status.h>
#include <chronicle/schema/audit_entry.hpp>
#include <chronicle/schema/audit_event.hpp>
#include <chronicle/schema/chain_status.hpp>
#include <chronicle/schema/checkpoint.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/evidence_package.hpp>
#include <chronicle/schema/inclusion_proof.hpp>
#include <chronicle/schema/query_filter.hpp>
#include <chronicle/schema/verification_result.hpp>
#include <optional>
#include <string>

// Wire mapping between the AuditTrail protobuf messages and the schema types.
namespace chronicle::rpc {

void to_proto(const chronicle::schema::audit_entry_t& source,
              chronicle::audit::v1::AuditEntry* destination);

void to_proto(const chronicle::schema::checkpoint_t& source,
              chronicle::audit::v1::Checkpoint* destination);

void to_proto(const chronicle::schema::inclusion_proof_t& source,
              chronicle::audit::v1::InclusionProof* destination);

void to_proto(const chronicle::schema::verification_result_t& source,
              chronicle::audit::v1::VerifyResponse* destination);

void to_proto(const chronicle::schema::chain_status_t& source,
              chronicle::audit::v1::ChainStatusResponse* destination);

/// Build the event of an append request. Returns std::nullopt and fills
/// `error` when the payload is not JSON.
std::optional<chronicle::schema::audit_event> to_event(
    const chronicle::audit::v1::AppendRequest& request,
    std::string& error);

chronicle::schema::query_filter to_filter(
    const chronicle::audit::v1::QueryRequest& request);

chronicle::schema::evidence_request to_evidence_request(
    const chronicle::audit::v1::ExportPackageRequest& request);

/// Transport status for a result code. Integrity verdicts and pending
/// exports are outcomes rather than call failures and map to OK; the
/// numeric code travels in the response either way.
grpc::Status to_grpc_status(chronicle::schema::error_code code,
                            const std::string& log);

}  // namespace chronicle::rpc
