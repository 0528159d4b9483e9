#pragma once

#include <gtest/gtest.h>

#include <timelock/crypto/verify.hpp>
#include <timelock/execution/engine.hpp>
#include <timelock/runtime/addresses.hpp>
#include <timelock/schema/encoding/scale/encoder.hpp>
#include <timelock/schema/transaction.hpp>
#include <timelock/schema/vault_instruction.hpp>
#include <timelock/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

namespace timelock::testing {

using scale_encoder_t = timelock::schema::encoding::encoder<
    timelock::schema::encoding::scale_encoder_tag>;

inline timelock::schema::transaction_t make_transaction(
    const timelock::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const timelock::schema::account_id_t& signer,
    const timelock::schema::transaction_payload_t& payload) {
  return timelock::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = timelock::schema::ed25519_signature_t{}};
}

/// Sets signer from the seed and signs the envelope.
inline timelock::schema::transaction_t sign_transaction(
    timelock::schema::transaction_t tx,
    const timelock::crypto::ed25519_seed_t& seed) {
  auto encoder = scale_encoder_t{};
  auto signer = timelock::crypto::public_key_from_seed(seed);
  EXPECT_TRUE(signer.has_value());
  if (signer) {
    tx.signer = signer.value();
  }
  auto message = timelock::execution::make_signing_payload(encoder, tx);
  auto signature = timelock::crypto::sign(
      timelock::schema::bytes_view_t{message.data(), message.size()}, seed);
  EXPECT_TRUE(signature.has_value());
  if (signature) {
    tx.signature = signature.value();
  }
  return tx;
}

inline timelock::schema::bytes_t encode_transaction(
    const timelock::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline timelock::schema::bytes_t encode_instruction(
    const timelock::schema::vault_instruction_t& instruction) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(instruction);
}

inline timelock::schema::hash32_t chain_id_from_engine(
    timelock::execution::engine& engine) {
  const auto query = engine.query("/engine/info", {});
  EXPECT_EQ(query.code, 0u);
  auto encoder = scale_encoder_t{};
  const auto decoded = encoder.decode<std::tuple<
      int64_t, timelock::schema::hash32_t, timelock::schema::hash32_t>>(
      timelock::schema::bytes_view_t{query.value.data(), query.value.size()});
  return std::get<2>(decoded);
}

/// Run one transaction as its own block and commit it.
inline timelock::schema::transaction_result_t finalize_single(
    timelock::execution::engine& engine,
    const uint64_t height,
    const timelock::schema::timestamp_seconds_t block_time,
    const timelock::schema::transaction_t& tx) {
  auto block =
      engine.finalize_block(height, block_time, {encode_transaction(tx)});
  EXPECT_EQ(block.tx_results.size(), 1u);
  auto result = block.tx_results.front();
  (void)engine.commit();
  return result;
}

template <typename T>
std::optional<T> query_value(timelock::execution::engine& engine,
                             const std::string_view path,
                             const timelock::schema::bytes_t& key) {
  const auto result = engine.query(
      path, timelock::schema::bytes_view_t{key.data(), key.size()});
  if (result.code != 0) {
    return std::nullopt;
  }
  auto encoder = scale_encoder_t{};
  return encoder.try_decode<T>(
      timelock::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline timelock::schema::bytes_t account_key(
    const timelock::schema::account_id_t& id) {
  return timelock::schema::bytes_t{std::begin(id), std::end(id)};
}

inline std::vector<timelock::schema::account_id_t> create_vault_accounts(
    const timelock::schema::account_id_t& owner,
    const timelock::schema::account_id_t& vault) {
  return {owner, vault, timelock::runtime::system_program_id()};
}

inline std::vector<timelock::schema::account_id_t> deposit_accounts(
    const timelock::schema::account_id_t& depositor,
    const timelock::schema::account_id_t& vault,
    const timelock::schema::account_id_t& source,
    const timelock::schema::account_id_t& vault_token) {
  return {depositor,
          vault,
          source,
          vault_token,
          timelock::runtime::token_program_id(),
          timelock::runtime::system_program_id(),
          timelock::runtime::clock_sysvar_id()};
}

inline std::vector<timelock::schema::account_id_t> withdraw_accounts(
    const timelock::schema::account_id_t& caller,
    const timelock::schema::account_id_t& vault,
    const timelock::schema::account_id_t& destination,
    const timelock::schema::account_id_t& vault_token) {
  return {caller,
          vault,
          destination,
          vault_token,
          timelock::runtime::token_program_id(),
          timelock::runtime::clock_sysvar_id()};
}

inline std::vector<timelock::schema::account_id_t> emergency_withdraw_accounts(
    const timelock::schema::account_id_t& caller,
    const timelock::schema::account_id_t& vault,
    const timelock::schema::account_id_t& destination,
    const timelock::schema::account_id_t& vault_token,
    const timelock::schema::account_id_t& depositor) {
  return {caller,
          vault,
          destination,
          vault_token,
          timelock::runtime::token_program_id(),
          depositor};
}

}  // namespace timelock::testing
