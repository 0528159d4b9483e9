#include <spdlog/spdlog.h>
#include <timelock/abci/server.hpp>
#include <string>
#include <vector>

using namespace timelock::abci;
using namespace timelock::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

template <typename Destination>
void populate_events(const std::vector<transaction_event_t>& events,
                     Destination* destination) {
  for (const auto& event : events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

void populate_exec_tx_result(const transaction_result_t& source,
                             tendermint::abci::ExecTxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  populate_events(source.events, destination);
}

}  // namespace

listener::listener(timelock::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Echo(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestEcho* request,
    tendermint::abci::ResponseEcho* response) {
  response->set_message(request->message());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Flush(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestFlush* /*request*/,
    tendermint::abci::ResponseFlush* /*response*/) {
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestInfo* /*request*/,
    tendermint::abci::ResponseInfo* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  if (info.last_block_height > 0) {
    response->set_last_block_app_hash(
        make_string(bytes_view_t{info.last_block_state_root}));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestCheckTx* request,
    tendermint::abci::ResponseCheckTx* response) {
  auto tx = make_bytes(request->tx());
  auto check =
      execution_engine_.check_transaction(bytes_view_t{tx.data(), tx.size()});
  response->set_code(check.code);
  response->set_data(make_string(check.data));
  response->set_log(check.log);
  response->set_info(check.info);
  response->set_gas_wanted(check.gas_wanted);
  response->set_gas_used(check.gas_used);
  response->set_codespace(check.codespace);
  if (check.code != 0) {
    spdlog::warn("CheckTx rejected transaction: {} ({})", check.info,
                 check.log);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestQuery* request,
    tendermint::abci::ResponseQuery* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(),
                                       bytes_view_t{data.data(), data.size()});
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestCommit* /*request*/,
    tendermint::abci::ResponseCommit* response) {
  auto commit = execution_engine_.commit();
  response->set_retain_height(commit.retain_height);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::InitChain(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestInitChain* request,
    tendermint::abci::ResponseInitChain* response) {
  spdlog::info("InitChain for chain '{}' at initial height {}",
               request->chain_id(), request->initial_height());
  auto info = execution_engine_.info();
  response->set_app_hash(make_string(bytes_view_t{info.last_block_state_root}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListSnapshots(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestListSnapshots* /*request*/,
    tendermint::abci::ResponseListSnapshots* /*response*/) {
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::OfferSnapshot(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestOfferSnapshot* request,
    tendermint::abci::ResponseOfferSnapshot* response) {
  spdlog::debug("Rejecting snapshot offer at height {}",
                request->snapshot().height());
  response->set_result(tendermint::abci::ResponseOfferSnapshot_Result_REJECT);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::LoadSnapshotChunk(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestLoadSnapshotChunk* /*request*/,
    tendermint::abci::ResponseLoadSnapshotChunk* /*response*/) {
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ApplySnapshotChunk(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestApplySnapshotChunk* /*request*/,
    tendermint::abci::ResponseApplySnapshotChunk* response) {
  response->set_result(
      tendermint::abci::ResponseApplySnapshotChunk_Result_REJECT_SNAPSHOT);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::PrepareProposal(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestPrepareProposal* request,
    tendermint::abci::ResponsePrepareProposal* response) {
  auto total_size = int64_t{};
  auto max_bytes = request->max_tx_bytes();
  for (const auto& tx : request->txs()) {
    auto tx_bytes = make_bytes(tx);
    auto check = execution_engine_.check_transaction(
        bytes_view_t{tx_bytes.data(), tx_bytes.size()});
    if (check.code != 0) {
      continue;
    }
    auto next_size = total_size + static_cast<int64_t>(tx.size());
    if (max_bytes > 0 && next_size > max_bytes) {
      break;
    }
    total_size = next_size;
    *response->add_txs() = tx;
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ProcessProposal(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestProcessProposal* request,
    tendermint::abci::ResponseProcessProposal* response) {
  for (const auto& tx : request->txs()) {
    auto tx_bytes = make_bytes(tx);
    auto tx_result = execution_engine_.process_proposal_transaction(
        bytes_view_t{tx_bytes.data(), tx_bytes.size()});
    if (tx_result.code != 0) {
      response->set_status(
          tendermint::abci::ResponseProcessProposal_ProposalStatus_REJECT);
      return finish_ok(context);
    }
  }
  response->set_status(
      tendermint::abci::ResponseProcessProposal_ProposalStatus_ACCEPT);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ExtendVote(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestExtendVote* /*request*/,
    tendermint::abci::ResponseExtendVote* response) {
  response->set_vote_extension("");
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::VerifyVoteExtension(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestVerifyVoteExtension* /*request*/,
    tendermint::abci::ResponseVerifyVoteExtension* response) {
  response->set_status(
      tendermint::abci::ResponseVerifyVoteExtension_VerifyStatus_ACCEPT);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const tendermint::abci::RequestFinalizeBlock* request,
    tendermint::abci::ResponseFinalizeBlock* response) {
  auto txs = std::vector<bytes_t>{};
  txs.reserve(request->txs_size());
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }

  auto execution = execution_engine_.finalize_block(
      static_cast<uint64_t>(request->height()), request->time().seconds(), txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_exec_tx_result(tx_result, response->add_tx_results());
  }
  response->set_app_hash(make_string(bytes_view_t{execution.state_root}));
  return finish_ok(context);
}
