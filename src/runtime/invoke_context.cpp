#include <timelock/runtime/invoke_context.hpp>
#include <timelock/schema/key/keys.hpp>
#include <fmt/format.h>
#include <utility>

namespace timelock::runtime {

invoke_context::invoke_context(encoder_t& encoder,
                               timelock::state::overlay& state,
                               timelock::ledger::token_ledger& ledger,
                               const timelock::schema::account_id_t& signer,
                               timelock::schema::timestamp_seconds_t now)
    : encoder_{encoder},
      state_{state},
      ledger_{ledger},
      signer_{signer},
      now_{now} {}

encoder_t& invoke_context::encoder() {
  return encoder_;
}

timelock::state::overlay& invoke_context::state() {
  return state_;
}

timelock::ledger::token_ledger& invoke_context::ledger() {
  return ledger_;
}

const timelock::schema::account_id_t& invoke_context::signer() const {
  return signer_;
}

bool invoke_context::is_signer(
    const timelock::schema::account_id_t& account) const {
  return account == signer_;
}

timelock::schema::timestamp_seconds_t invoke_context::now() const {
  return now_;
}

std::optional<timelock::schema::account_t> invoke_context::load_account(
    const timelock::schema::account_id_t& id) {
  auto key = timelock::schema::key::make_account_key(encoder_, id);
  return state_.try_load<encoder_t, timelock::schema::account_t>(
      encoder_, timelock::schema::bytes_view_t{key.data(), key.size()});
}

void invoke_context::store_account(const timelock::schema::account_t& account) {
  auto key = timelock::schema::key::make_account_key(encoder_, account.id);
  state_.store(encoder_,
               timelock::schema::bytes_view_t{key.data(), key.size()},
               account);
}

program_result_t invoke_context::push_program(
    const timelock::schema::account_id_t& program) {
  if (program_stack_.size() >= kMaxProgramDepth) {
    return make_error(
        timelock::schema::transaction_error_code::call_depth_exceeded,
        fmt::format("program call depth limit {} reached", kMaxProgramDepth));
  }
  program_stack_.push_back(program);
  return std::nullopt;
}

void invoke_context::pop_program() {
  if (!program_stack_.empty()) {
    program_stack_.pop_back();
  }
}

std::optional<timelock::schema::account_id_t> invoke_context::current_program()
    const {
  if (program_stack_.empty()) {
    return std::nullopt;
  }
  return program_stack_.back();
}

std::size_t invoke_context::depth() const {
  return program_stack_.size();
}

void invoke_context::emit(timelock::schema::transaction_event_t event) {
  events_.push_back(std::move(event));
}

std::vector<timelock::schema::transaction_event_t>& invoke_context::events() {
  return events_;
}

program_frame::program_frame(invoke_context& context,
                             const timelock::schema::account_id_t& program)
    : context_{context}, error_{context.push_program(program)} {}

program_frame::~program_frame() {
  if (!error_) {
    context_.pop_program();
  }
}

const program_result_t& program_frame::error() const {
  return error_;
}

}  // namespace timelock::runtime
