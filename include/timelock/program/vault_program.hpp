#pragma once

#include <timelock/runtime/invoke_context.hpp>
#include <timelock/runtime/program_error.hpp>
#include <timelock/schema/primitives.hpp>
#include <timelock/schema/vault_instruction.hpp>
#include <optional>
#include <vector>

namespace timelock::program {

using account_list_t = std::vector<timelock::schema::account_id_t>;

/// Decode instruction bytes. Empty input, unknown variants, trailing bytes and
/// unsupported versions all yield std::nullopt.
std::optional<timelock::schema::vault_instruction_t> decode_instruction(
    timelock::runtime::encoder_t& encoder,
    const timelock::schema::bytes_view_t& instruction_data);

/// Dispatcher: decode then route to exactly one handler.
///
/// Runs against the caller's state directly; use `invoke` to get the
/// all-or-nothing behaviour.
timelock::runtime::program_result_t process_instruction(
    timelock::runtime::invoke_context& context,
    const account_list_t& accounts,
    const timelock::schema::bytes_view_t& instruction_data);

timelock::runtime::program_result_t process_create_vault(
    timelock::runtime::invoke_context& context,
    const account_list_t& accounts,
    const timelock::schema::create_vault_t& instruction);

timelock::runtime::program_result_t process_deposit(
    timelock::runtime::invoke_context& context,
    const account_list_t& accounts,
    const timelock::schema::deposit_tokens_t& instruction);

timelock::runtime::program_result_t process_withdraw(
    timelock::runtime::invoke_context& context,
    const account_list_t& accounts,
    const timelock::schema::withdraw_t& instruction);

timelock::runtime::program_result_t process_emergency_withdraw(
    timelock::runtime::invoke_context& context,
    const account_list_t& accounts,
    const timelock::schema::emergency_withdraw_t& instruction);

}  // namespace timelock::program
