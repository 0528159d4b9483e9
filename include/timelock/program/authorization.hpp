#pragma once

#include <timelock/runtime/invoke_context.hpp>
#include <timelock/schema/deposit.hpp>
#include <timelock/schema/primitives.hpp>
#include <timelock/schema/vault_state.hpp>

// Authorization predicates evaluated against the verified caller identity.
namespace timelock::program {

/// The account signed the enclosing transaction.
inline bool is_signer(const timelock::runtime::invoke_context& context,
                      const timelock::schema::account_id_t& account) {
  return context.is_signer(account);
}

/// The caller funded the deposit. The vault owner gets no special standing.
inline bool is_depositor_of_record(
    const timelock::schema::deposit_t& deposit,
    const timelock::schema::account_id_t& caller) {
  return deposit.depositor == caller;
}

inline bool is_emergency_authority(
    const timelock::schema::vault_state_t& vault,
    const timelock::schema::account_id_t& caller) {
  return vault.emergency_authority.has_value() &&
         vault.emergency_authority.value() == caller;
}

}  // namespace timelock::program
