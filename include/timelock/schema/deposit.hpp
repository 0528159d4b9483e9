#pragma once
#include <timelock/schema/primitives.hpp>
#include <cstdint>

// Schema type: deposit.
// Vault workflow: one time-locked unit of custody. Every field except
// `withdrawn` is fixed when the deposit is created, and `withdrawn` only ever
// moves from false to true.
namespace timelock::schema {

template <uint16_t Version>
struct deposit;

// Persisted positionally inside vault_state; carries no version field.
template <>
struct deposit<1> final {
  uint64_t id{};
  account_id_t depositor{};
  account_id_t token_mint{};
  amount_t amount{};
  timestamp_seconds_t unlock_time{};
  bool withdrawn{};
  tag_t tag{};
  timestamp_seconds_t created_at{};
};

using deposit_t = deposit<1>;

}  // namespace timelock::schema
