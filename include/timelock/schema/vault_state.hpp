#pragma once
#include <timelock/schema/deposit.hpp>
#include <timelock/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: vault state.
// Vault workflow: the custody record stored in the vault account's data. It
// is decoded, mutated and re-encoded by every vault instruction.
namespace timelock::schema {

template <uint16_t Version>
struct vault_state;

// Layout: owner, deposit_count, length-prefixed deposits, guard, optional
// emergency authority. No version field is encoded.
template <>
struct vault_state<1> final {
  account_id_t owner{};
  uint64_t deposit_count{};
  std::vector<deposit_t> deposits;
  bool reentrancy_guard{};
  std::optional<account_id_t> emergency_authority{std::nullopt};
};

using vault_state_t = vault_state<1>;

}  // namespace timelock::schema
