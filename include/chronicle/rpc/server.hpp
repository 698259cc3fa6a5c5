#pragma once

#include <chronicle/audit/v1/audit.grpc.pb.h>
#include <chronicle/execution/append_engine.hpp>
#include <chronicle/execution/checkpoint_manager.hpp>
#include <chronicle/execution/verification_engine.hpp>
#include <chronicle/rpc/rate_limiter.hpp>
#include <stop_token>

namespace chronicle::rpc {

/// Callback listener serving the AuditTrail service.
///
/// Quick reference:
/// - Append: link one event onto a chain.
/// - Query: filtered, paginated reads.
/// - Verify: chain walk from genesis or an exported checkpoint; rate limited
///   per chain.
/// - Checkpoint/ListCheckpoints: witness the tip and list witnesses.
/// - ChainStatus: length, tip, latest checkpoint and verdict.
/// - ExportPackage: sealed evidence package of a chain window.
/// - LookupEntry: inclusion check for an entry hash.
struct listener final : public chronicle::audit::v1::AuditTrail::CallbackService {
  listener(chronicle::execution::append_engine& append_engine,
           chronicle::execution::verification_engine& verification_engine,
           chronicle::execution::checkpoint_manager& checkpoint_manager,
           const chronicle::execution::store_t& storage,
           rate_limiter& verify_limiter,
           chronicle::execution::time_source_t clock =
               chronicle::execution::system_now);

  virtual grpc::ServerUnaryReactor* Append(
      grpc::CallbackServerContext* context,
      const chronicle::audit::v1::AppendRequest* request,
      chronicle::audit::v1::AppendResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const chronicle::audit::v1::QueryRequest* request,
      chronicle::audit::v1::QueryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Verify(
      grpc::CallbackServerContext* context,
      const chronicle::audit::v1::VerifyRequest* request,
      chronicle::audit::v1::VerifyResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Checkpoint(
      grpc::CallbackServerContext* context,
      const chronicle::audit::v1::CheckpointRequest* request,
      chronicle::audit::v1::CheckpointResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListCheckpoints(
      grpc::CallbackServerContext* context,
      const chronicle::audit::v1::ListCheckpointsRequest* request,
      chronicle::audit::v1::ListCheckpointsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ChainStatus(
      grpc::CallbackServerContext* context,
      const chronicle::audit::v1::ChainStatusRequest* request,
      chronicle::audit::v1::ChainStatusResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ExportPackage(
      grpc::CallbackServerContext* context,
      const chronicle::audit::v1::ExportPackageRequest* request,
      chronicle::audit::v1::ExportPackageResponse* response) override final;

  virtual grpc::ServerUnaryReactor* LookupEntry(
      grpc::CallbackServerContext* context,
      const chronicle::audit::v1::LookupEntryRequest* request,
      chronicle::audit::v1::LookupEntryResponse* response) override final;

  /// Cancel in-flight verifications. Called once on shutdown.
  void stop();

  chronicle::execution::append_engine& append_engine_;
  chronicle::execution::verification_engine& verification_engine_;
  chronicle::execution::checkpoint_manager& checkpoint_manager_;
  const chronicle::execution::store_t& storage_;
  rate_limiter& verify_limiter_;
  chronicle::execution::time_source_t clock_;
  std::stop_source stop_source_;
};

}  // namespace chronicle::rpc
