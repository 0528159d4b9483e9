#pragma once
#include <timelock/schema/primitives.hpp>
#include <cstdint>

// Schema type: open token account.
// Ledger workflow: creates a zero balance token account for `owner`.
namespace timelock::schema {

template <uint16_t Version>
struct open_token_account;

template <>
struct open_token_account<1> final {
  uint16_t version{1};
  account_id_t account{};
  account_id_t mint{};
  account_id_t owner{};
};

using open_token_account_t = open_token_account<1>;

}  // namespace timelock::schema
