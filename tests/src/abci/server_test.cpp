#include <gtest/gtest.h>
#include <timelock/abci/server.hpp>
#include <timelock/runtime/addresses.hpp>
#include <timelock/schema/query_error_code.hpp>
#include <timelock/testing/execution_fixture.hpp>

#include <string>

namespace {

timelock::schema::transaction_t allocate_vault(
    timelock::testing::execution_fixture& fixture,
    const uint64_t nonce,
    const uint8_t seed) {
  return timelock::testing::make_transaction(
      fixture.chain_id(), nonce, timelock::testing::make_hash(seed),
      timelock::schema::allocate_account_t{
          .account =
              timelock::testing::make_hash(static_cast<uint8_t>(seed + 100)),
          .owner_program = timelock::runtime::vault_program_id()});
}

std::string signed_wire(timelock::testing::execution_fixture& fixture,
                        const uint64_t nonce,
                        const uint8_t seed) {
  auto tx = timelock::testing::sign_transaction(
      allocate_vault(fixture, nonce, seed), timelock::testing::make_seed(seed));
  return timelock::schema::make_string(
      timelock::testing::encode_transaction(tx));
}

}  // namespace

TEST(abci_server, echo_and_info_report_application_metadata) {
  auto fixture = timelock::testing::execution_fixture{"timelock_abci_info"};
  auto listener = timelock::abci::listener{fixture.engine()};

  auto echo_request = tendermint::abci::RequestEcho{};
  echo_request.set_message("ping");
  auto echo_response = tendermint::abci::ResponseEcho{};
  auto echo_context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Echo(&echo_context, &echo_request, &echo_response),
            nullptr);
  EXPECT_EQ(echo_response.message(), "ping");

  auto request = tendermint::abci::RequestInfo{};
  auto response = tendermint::abci::ResponseInfo{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Info(&context, &request, &response), nullptr);
  EXPECT_EQ(response.data(), "timelock-vault");
  EXPECT_EQ(response.last_block_height(), 0);
  EXPECT_TRUE(response.last_block_app_hash().empty());
}

TEST(abci_server, check_tx_maps_result_codes) {
  auto fixture = timelock::testing::execution_fixture{"timelock_abci_check"};
  auto listener = timelock::abci::listener{fixture.engine()};

  {
    auto request = tendermint::abci::RequestCheckTx{};
    request.set_tx(signed_wire(fixture, 1, 0x11));
    auto response = tendermint::abci::ResponseCheckTx{};
    auto context = grpc::CallbackServerContext{};
    ASSERT_NE(listener.CheckTx(&context, &request, &response), nullptr);
    EXPECT_EQ(response.code(), 0u);
    EXPECT_EQ(response.gas_wanted(), 1000);
  }
  {
    auto unsigned_tx = timelock::testing::encode_transaction(
        allocate_vault(fixture, 1, 0x12));
    auto request = tendermint::abci::RequestCheckTx{};
    request.set_tx(timelock::schema::make_string(unsigned_tx));
    auto response = tendermint::abci::ResponseCheckTx{};
    auto context = grpc::CallbackServerContext{};
    ASSERT_NE(listener.CheckTx(&context, &request, &response), nullptr);
    EXPECT_EQ(response.code(),
              static_cast<uint32_t>(timelock::schema::transaction_error_code::
                                        signature_verification_failed));
    EXPECT_EQ(response.codespace(), "timelock.checktx");
    EXPECT_EQ(response.info(), "signature_verification_failed");
  }
}

TEST(abci_server, prepare_proposal_filters_invalid_and_respects_max_bytes) {
  auto fixture = timelock::testing::execution_fixture{"timelock_abci_prepare"};
  auto listener = timelock::abci::listener{fixture.engine()};

  auto tx_1 = signed_wire(fixture, 1, 0x21);
  auto tx_2 = signed_wire(fixture, 1, 0x22);

  auto request = tendermint::abci::RequestPrepareProposal{};
  request.set_max_tx_bytes(static_cast<int64_t>(tx_1.size()));
  *request.add_txs() = std::string{"\xFF\x00\x01", 3};
  *request.add_txs() = tx_1;
  *request.add_txs() = tx_2;

  auto response = tendermint::abci::ResponsePrepareProposal{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.PrepareProposal(&context, &request, &response), nullptr);
  ASSERT_EQ(response.txs_size(), 1);
  EXPECT_EQ(response.txs(0), tx_1);
}

TEST(abci_server, process_proposal_rejects_invalid_and_accepts_valid) {
  auto fixture = timelock::testing::execution_fixture{"timelock_abci_process"};
  auto listener = timelock::abci::listener{fixture.engine()};

  {
    auto request = tendermint::abci::RequestProcessProposal{};
    *request.add_txs() = signed_wire(fixture, 1, 0x31);
    *request.add_txs() = std::string{"\xAA\xBB\xCC", 3};
    auto response = tendermint::abci::ResponseProcessProposal{};
    auto context = grpc::CallbackServerContext{};
    ASSERT_NE(listener.ProcessProposal(&context, &request, &response), nullptr);
    EXPECT_EQ(response.status(),
              tendermint::abci::ResponseProcessProposal_ProposalStatus_REJECT);
  }
  {
    auto request = tendermint::abci::RequestProcessProposal{};
    *request.add_txs() = signed_wire(fixture, 1, 0x32);
    auto response = tendermint::abci::ResponseProcessProposal{};
    auto context = grpc::CallbackServerContext{};
    ASSERT_NE(listener.ProcessProposal(&context, &request, &response), nullptr);
    EXPECT_EQ(response.status(),
              tendermint::abci::ResponseProcessProposal_ProposalStatus_ACCEPT);
  }
}

TEST(abci_server, finalize_block_and_commit_advance_the_app_hash) {
  auto fixture = timelock::testing::execution_fixture{"timelock_abci_finalize"};
  auto listener = timelock::abci::listener{fixture.engine()};

  auto request = tendermint::abci::RequestFinalizeBlock{};
  request.set_height(1);
  request.mutable_time()->set_seconds(1'700'000'000);
  *request.add_txs() = signed_wire(fixture, 1, 0x41);
  *request.add_txs() = signed_wire(fixture, 5, 0x42);

  auto response = tendermint::abci::ResponseFinalizeBlock{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.FinalizeBlock(&context, &request, &response), nullptr);
  ASSERT_EQ(response.tx_results_size(), 2);
  EXPECT_EQ(response.tx_results(0).code(), 0u);
  EXPECT_EQ(response.tx_results(0).gas_used(), 750);
  EXPECT_EQ(response.tx_results(1).code(),
            static_cast<uint32_t>(
                timelock::schema::transaction_error_code::invalid_nonce));
  EXPECT_EQ(response.tx_results(1).codespace(), "timelock.host");
  ASSERT_EQ(response.app_hash().size(), 32u);

  auto commit_request = tendermint::abci::RequestCommit{};
  auto commit_response = tendermint::abci::ResponseCommit{};
  auto commit_context = grpc::CallbackServerContext{};
  ASSERT_NE(
      listener.Commit(&commit_context, &commit_request, &commit_response),
      nullptr);
  EXPECT_EQ(commit_response.retain_height(), 0);

  auto info_request = tendermint::abci::RequestInfo{};
  auto info_response = tendermint::abci::ResponseInfo{};
  auto info_context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Info(&info_context, &info_request, &info_response),
            nullptr);
  EXPECT_EQ(info_response.last_block_height(), 1);
  EXPECT_EQ(info_response.last_block_app_hash(), response.app_hash());
}

TEST(abci_server, query_forwards_path_and_error_codes) {
  auto fixture = timelock::testing::execution_fixture{"timelock_abci_query"};
  auto listener = timelock::abci::listener{fixture.engine()};
  auto vault = timelock::testing::make_hash(9);

  auto request = tendermint::abci::RequestQuery{};
  request.set_path("/vault/authority");
  request.set_data(timelock::schema::make_string(
      timelock::testing::account_key(vault)));
  auto response = tendermint::abci::ResponseQuery{};
  auto context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Query(&context, &request, &response), nullptr);
  EXPECT_EQ(response.code(), 0u);
  auto authority = timelock::runtime::vault_authority(vault);
  EXPECT_EQ(timelock::schema::make_bytes(response.value()),
            timelock::schema::bytes_t(std::begin(authority),
                                      std::end(authority)));

  auto missing_request = tendermint::abci::RequestQuery{};
  missing_request.set_path("/state/vault");
  missing_request.set_data(request.data());
  auto missing = tendermint::abci::ResponseQuery{};
  auto missing_context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.Query(&missing_context, &missing_request, &missing),
            nullptr);
  EXPECT_EQ(missing.code(), static_cast<uint32_t>(
                                timelock::schema::query_error_code::not_found));
  EXPECT_EQ(missing.codespace(), "timelock.query");
}

TEST(abci_server, snapshots_are_not_offered) {
  auto fixture = timelock::testing::execution_fixture{"timelock_abci_snapshot"};
  auto listener = timelock::abci::listener{fixture.engine()};

  auto list_request = tendermint::abci::RequestListSnapshots{};
  auto list_response = tendermint::abci::ResponseListSnapshots{};
  auto list_context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.ListSnapshots(&list_context, &list_request, &list_response),
            nullptr);
  EXPECT_EQ(list_response.snapshots_size(), 0);

  auto offer_request = tendermint::abci::RequestOfferSnapshot{};
  offer_request.mutable_snapshot()->set_height(10);
  auto offer_response = tendermint::abci::ResponseOfferSnapshot{};
  auto offer_context = grpc::CallbackServerContext{};
  ASSERT_NE(
      listener.OfferSnapshot(&offer_context, &offer_request, &offer_response),
      nullptr);
  EXPECT_EQ(offer_response.result(),
            tendermint::abci::ResponseOfferSnapshot_Result_REJECT);

  auto apply_request = tendermint::abci::RequestApplySnapshotChunk{};
  auto apply_response = tendermint::abci::ResponseApplySnapshotChunk{};
  auto apply_context = grpc::CallbackServerContext{};
  ASSERT_NE(listener.ApplySnapshotChunk(&apply_context, &apply_request,
                                        &apply_response),
            nullptr);
  EXPECT_EQ(apply_response.result(),
            tendermint::abci::ResponseApplySnapshotChunk_Result_REJECT_SNAPSHOT);
}
