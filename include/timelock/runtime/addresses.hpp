#pragma once

#include <timelock/schema/primitives.hpp>
#include <vector>

// Well-known program ids and program derived addresses.
namespace timelock::runtime {

using seeds_t = std::vector<timelock::schema::bytes_t>;

/// All zero id; owner of plain host accounts.
const timelock::schema::account_id_t& system_program_id();
const timelock::schema::account_id_t& vault_program_id();
const timelock::schema::account_id_t& token_program_id();
/// Account id callers pass to name the block clock.
const timelock::schema::account_id_t& clock_sysvar_id();

/// Address controlled by `program_id` for the given seeds. No private key
/// exists for the result; only the program itself can authorize as it.
timelock::schema::account_id_t derive_program_address(
    const timelock::schema::account_id_t& program_id,
    const seeds_t& seeds);

seeds_t vault_authority_seeds(const timelock::schema::account_id_t& vault);

/// Derived signer that owns the token accounts holding a vault's custody.
timelock::schema::account_id_t vault_authority(
    const timelock::schema::account_id_t& vault);

}  // namespace timelock::runtime
