#pragma once

#include <timelock/program/vault_program.hpp>
#include <timelock/runtime/invoke_context.hpp>
#include <timelock/runtime/program_error.hpp>
#include <timelock/schema/primitives.hpp>

namespace timelock::program {

/// Run `program_id` with its own call frame and transactional scope.
///
/// State written by the program, and the events it emitted, are kept only
/// when it returns success. Nested calls (from a transfer hook, for example)
/// go through here as well.
timelock::runtime::program_result_t invoke(
    timelock::runtime::invoke_context& context,
    const timelock::schema::account_id_t& program_id,
    const account_list_t& accounts,
    const timelock::schema::bytes_view_t& instruction_data);

}  // namespace timelock::program
