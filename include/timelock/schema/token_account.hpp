#pragma once
#include <timelock/schema/primitives.hpp>
#include <cstdint>

// Schema type: token account.
// Ledger workflow: balance record kept in the data of an account owned by the
// token program.
namespace timelock::schema {

template <uint16_t Version>
struct token_account;

template <>
struct token_account<1> final {
  uint16_t version{1};
  account_id_t mint{};
  account_id_t owner{};
  amount_t amount{};
};

using token_account_t = token_account<1>;

}  // namespace timelock::schema
