#include <gtest/gtest.h>
#include <timelock/crypto/verify.hpp>
#include <timelock/execution/engine.hpp>
#include <timelock/runtime/addresses.hpp>
#include <timelock/schema/encoding/scale/encoder.hpp>
#include <timelock/schema/primitives.hpp>
#include <timelock/schema/transaction.hpp>
#include <timelock/schema/vault_instruction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef TIMELOCK_TRANSACTION_BUILDER_PATH
#define TIMELOCK_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = timelock::schema::encoding::encoder<
    timelock::schema::encoding::scale_encoder_tag>;

// RFC 8032 test 1.
constexpr auto kSeedHex =
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
constexpr auto kPublicKeyHex =
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
constexpr auto kVaultHex =
    "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_command(const std::string& builder,
                        const std::string_view command,
                        const std::string_view args) {
  auto line = shell_quote(builder) + " " + std::string{command} + " " +
              std::string{args};
  auto [exit_code, output] = run_capture(line);
  EXPECT_EQ(exit_code, 0) << "command failed: " << line << '\n' << output;
  return output;
}

/// Bytes from the "base64:" line of an encoded printout.
timelock::schema::bytes_t encoded_bytes(const std::string& output) {
  auto stream = std::istringstream{output};
  auto line = std::string{};
  while (std::getline(stream, line)) {
    constexpr auto kPrefix = std::string_view{"base64:"};
    if (line.starts_with(kPrefix)) {
      return timelock::schema::from_base64(
          trim_ascii_whitespace(line.substr(kPrefix.size())));
    }
  }
  ADD_FAILURE() << "no base64 line in output:\n" << output;
  return {};
}

timelock::schema::hash32_t hash_from_hex(const std::string_view hex) {
  auto hash = timelock::schema::try_make_hash32(hex);
  EXPECT_TRUE(hash.has_value());
  return hash.value_or(timelock::schema::hash32_t{});
}

}  // namespace

TEST(transaction_builder, query_keys_match_engine_routes) {
  auto builder = std::string{TIMELOCK_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};
  auto vault = hash_from_hex(kVaultHex);

  auto deposit_key = encoded_bytes(run_command(
      builder, "query-key",
      "--path /state/deposit --account-id " + std::string{kVaultHex} +
          " --deposit-id 7"));
  EXPECT_EQ(deposit_key, encoder.encode(std::tuple{vault, uint64_t{7}}));

  auto history_key = encoded_bytes(run_command(
      builder, "query-key", "--path /history/range --from-height 1 --to-height 100"));
  EXPECT_EQ(history_key, encoder.encode(std::tuple{uint64_t{1}, uint64_t{100}}));

  auto vault_key = encoded_bytes(run_command(
      builder, "query-key", "--path /state/vault --account-id " +
                                std::string{kVaultHex}));
  EXPECT_EQ(vault_key,
            timelock::schema::bytes_t(std::begin(vault), std::end(vault)));
}

TEST(transaction_builder, derives_keys_and_vault_authorities) {
  auto builder = std::string{TIMELOCK_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  EXPECT_EQ(trim_ascii_whitespace(run_command(
                builder, "public-key", "--seed " + std::string{kSeedHex})),
            kPublicKeyHex);

  auto authority = timelock::runtime::vault_authority(hash_from_hex(kVaultHex));
  EXPECT_EQ(trim_ascii_whitespace(run_command(
                builder, "vault-authority",
                "--account-id " + std::string{kVaultHex})),
            timelock::schema::to_hex(authority));

  auto chain_id = timelock::execution::make_chain_id("timelock-local");
  EXPECT_EQ(trim_ascii_whitespace(run_command(builder, "chain-id", "")),
            timelock::schema::to_hex(chain_id));
}

TEST(transaction_builder, signed_transactions_verify_against_the_seed) {
  auto builder = std::string{TIMELOCK_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto raw = encoded_bytes(run_command(
      builder, "transaction",
      "--payload invoke_vault --instruction deposit --amount 100 "
      "--unlock-time 1700000100 --tag Rent --nonce 3 --seed " +
          std::string{kSeedHex} + " --account " + std::string{kPublicKeyHex} +
          " " + std::string{kVaultHex}));
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode_exact<timelock::schema::transaction_t>(
      timelock::schema::bytes_view_t{raw.data(), raw.size()});
  ASSERT_TRUE(tx.has_value());
  EXPECT_EQ(tx->nonce, 3u);
  EXPECT_EQ(tx->signer, hash_from_hex(kPublicKeyHex));
  EXPECT_EQ(tx->chain_id, timelock::execution::make_chain_id("timelock-local"));

  ASSERT_TRUE(std::holds_alternative<timelock::schema::invoke_vault_t>(tx->payload));
  const auto& invoke = std::get<timelock::schema::invoke_vault_t>(tx->payload);
  ASSERT_EQ(invoke.accounts.size(), 2u);
  EXPECT_EQ(invoke.accounts[1], hash_from_hex(kVaultHex));
  EXPECT_EQ(invoke.instruction_data,
            encoder.encode(timelock::schema::vault_instruction_t{
                timelock::schema::deposit_tokens_t{
                    .amount = 100,
                    .unlock_time = 1'700'000'100,
                    .tag = timelock::schema::make_tag("Rent")}}));

  auto message = timelock::execution::make_signing_payload(encoder, tx.value());
  EXPECT_TRUE(timelock::crypto::verify_signature(
      timelock::schema::bytes_view_t{message.data(), message.size()}, tx->signer,
      tx->signature));
}

TEST(transaction_builder, instruction_command_matches_the_wire_encoding) {
  auto builder = std::string{TIMELOCK_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto encoder = encoder_t{};
  auto emergency = encoded_bytes(run_command(
      builder, "instruction", "--instruction emergency_withdraw --deposit-id 2"));
  EXPECT_EQ(emergency, encoder.encode(timelock::schema::vault_instruction_t{
                           timelock::schema::emergency_withdraw_t{
                               .deposit_id = 2}}));
}
