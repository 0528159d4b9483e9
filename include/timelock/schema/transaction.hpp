#pragma once
#include <timelock/schema/allocate_account.hpp>
#include <timelock/schema/invoke_vault.hpp>
#include <timelock/schema/mint_tokens.hpp>
#include <timelock/schema/open_token_account.hpp>
#include <timelock/schema/primitives.hpp>
#include <variant>

namespace timelock::schema {

using transaction_payload_t = std::variant<allocate_account_t,
                                           open_token_account_t,
                                           mint_tokens_t,
                                           invoke_vault_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  account_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace timelock::schema
