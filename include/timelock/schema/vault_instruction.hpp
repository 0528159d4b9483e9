#pragma once
#include <timelock/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: vault instruction.
// Vault workflow: the four request shapes accepted by the vault dispatcher.
// Positional accounts for each shape are documented on the struct.
namespace timelock::schema {

template <uint16_t Version>
struct create_vault;

/// Accounts: [owner (signer), vault, system program].
template <>
struct create_vault<1> final {
  uint16_t version{1};
};

template <uint16_t Version>
struct deposit_tokens;

/// Accounts: [depositor (signer), vault, source token account,
/// vault token account, token program, system program, clock sysvar].
template <>
struct deposit_tokens<1> final {
  uint16_t version{1};
  amount_t amount{};
  timestamp_seconds_t unlock_time{};
  tag_t tag{};
};

template <uint16_t Version>
struct withdraw;

/// Accounts: [depositor (signer), vault, destination token account,
/// vault token account, token program, clock sysvar].
template <>
struct withdraw<1> final {
  uint16_t version{1};
  uint64_t deposit_id{};
};

template <uint16_t Version>
struct emergency_withdraw;

/// Accounts: [emergency authority (signer), vault, destination token account,
/// vault token account, token program, depositor].
template <>
struct emergency_withdraw<1> final {
  uint16_t version{1};
  uint64_t deposit_id{};
};

using create_vault_t = create_vault<1>;
using deposit_tokens_t = deposit_tokens<1>;
using withdraw_t = withdraw<1>;
using emergency_withdraw_t = emergency_withdraw<1>;

using vault_instruction_t = std::variant<create_vault_t,
                                         deposit_tokens_t,
                                         withdraw_t,
                                         emergency_withdraw_t>;

}  // namespace timelock::schema
