#pragma once

#include <tendermint/abci/types.grpc.pb.h>
#include <timelock/execution/engine.hpp>

namespace timelock::abci {

/// ABCI callback listener used by CometBFT to drive application execution.
///
/// Quick reference (ABCI++):
/// - Echo/Flush: liveness and flush barriers.
/// - Info/InitChain: handshake and initial app hash exchange.
/// - CheckTx: mempool admission checks; no state mutation.
/// - PrepareProposal: proposer-side tx selection/filtering.
/// - ProcessProposal: validator-side proposal accept/reject decision.
/// - FinalizeBlock: execute block and return tx results + app_hash(state_root).
/// - Commit: persist finalized state.
/// - Snapshot methods: state sync is not offered; lists are empty and offers
///   are rejected.
/// - Vote extensions: unused; empty extension, always accepted.
struct listener final : public tendermint::abci::ABCI::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(timelock::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestEcho* request,
      tendermint::abci::ResponseEcho* response) override final;

  virtual grpc::ServerUnaryReactor* Flush(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestFlush* request,
      tendermint::abci::ResponseFlush* response) override final;

  /// Return app metadata used during node/app handshake.
  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestInfo* request,
      tendermint::abci::ResponseInfo* response) override final;

  /// Mempool admission check for a single tx (decode/validate only).
  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestCheckTx* request,
      tendermint::abci::ResponseCheckTx* response) override final;

  /// Execute read query against committed state.
  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestQuery* request,
      tendermint::abci::ResponseQuery* response) override final;

  /// Persist finalized state after FinalizeBlock.
  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestCommit* request,
      tendermint::abci::ResponseCommit* response) override final;

  virtual grpc::ServerUnaryReactor* InitChain(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestInitChain* request,
      tendermint::abci::ResponseInitChain* response) override final;

  virtual grpc::ServerUnaryReactor* ListSnapshots(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestListSnapshots* request,
      tendermint::abci::ResponseListSnapshots* response) override final;

  virtual grpc::ServerUnaryReactor* OfferSnapshot(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestOfferSnapshot* request,
      tendermint::abci::ResponseOfferSnapshot* response) override final;

  virtual grpc::ServerUnaryReactor* LoadSnapshotChunk(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestLoadSnapshotChunk* request,
      tendermint::abci::ResponseLoadSnapshotChunk* response) override final;

  virtual grpc::ServerUnaryReactor* ApplySnapshotChunk(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestApplySnapshotChunk* request,
      tendermint::abci::ResponseApplySnapshotChunk* response) override final;

  /// Proposer-side tx list preparation under max-bytes and validity checks.
  virtual grpc::ServerUnaryReactor* PrepareProposal(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestPrepareProposal* request,
      tendermint::abci::ResponsePrepareProposal* response) override final;

  /// Validator-side proposal validation; returns ACCEPT or REJECT.
  virtual grpc::ServerUnaryReactor* ProcessProposal(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestProcessProposal* request,
      tendermint::abci::ResponseProcessProposal* response) override final;

  virtual grpc::ServerUnaryReactor* ExtendVote(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestExtendVote* request,
      tendermint::abci::ResponseExtendVote* response) override final;

  virtual grpc::ServerUnaryReactor* VerifyVoteExtension(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestVerifyVoteExtension* request,
      tendermint::abci::ResponseVerifyVoteExtension* response) override final;

  /// Execute ordered block transactions at the block time and return tx
  /// results + app_hash.
  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestFinalizeBlock* request,
      tendermint::abci::ResponseFinalizeBlock* response) override final;

  /// Backing execution engine implementing deterministic state machine rules.
  timelock::execution::engine& execution_engine_;
};

}  // namespace timelock::abci
