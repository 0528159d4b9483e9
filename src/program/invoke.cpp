#include <timelock/program/invoke.hpp>
#include <timelock/runtime/addresses.hpp>
#include <timelock/state/overlay.hpp>
#include <iterator>

using namespace timelock::schema;

namespace timelock::program {

runtime::program_result_t invoke(runtime::invoke_context& context,
                                 const account_id_t& program_id,
                                 const account_list_t& accounts,
                                 const bytes_view_t& instruction_data) {
  if (program_id != runtime::vault_program_id()) {
    return runtime::make_error(transaction_error_code::incorrect_program_id,
                               "unknown program id " + to_hex(program_id));
  }
  auto frame = runtime::program_frame{context, program_id};
  if (frame.error()) {
    return frame.error();
  }

  auto scope = timelock::state::transaction_scope{context.state()};
  auto events_before = context.events().size();
  auto result = process_instruction(context, accounts, instruction_data);
  if (result) {
    auto& events = context.events();
    events.erase(std::next(std::begin(events),
                           static_cast<std::ptrdiff_t>(events_before)),
                 std::end(events));
    return result;
  }
  scope.commit();
  return std::nullopt;
}

}  // namespace timelock::program
