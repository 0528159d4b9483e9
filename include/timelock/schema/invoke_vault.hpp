#pragma once
#include <timelock/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: invoke vault.
// Vault workflow: envelope for one vault instruction. `instruction_data` is
// decoded by the vault dispatcher, `accounts` is the positional account list.
namespace timelock::schema {

template <uint16_t Version>
struct invoke_vault;

template <>
struct invoke_vault<1> final {
  uint16_t version{1};
  std::vector<account_id_t> accounts;
  bytes_t instruction_data;
};

using invoke_vault_t = invoke_vault<1>;

}  // namespace timelock::schema
