#pragma once

#include <timelock/runtime/program_error.hpp>
#include <timelock/schema/account.hpp>
#include <timelock/schema/encoding/scale/encoder.hpp>
#include <timelock/schema/primitives.hpp>
#include <timelock/schema/transaction_event.hpp>
#include <timelock/state/overlay.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace timelock::ledger {
class token_ledger;
}

namespace timelock::runtime {

using encoder_t = timelock::schema::encoding::encoder<
    timelock::schema::encoding::scale_encoder_tag>;

inline constexpr std::size_t kMaxProgramDepth = 4;

/// Per-transaction view handed to programs and the token ledger.
///
/// Carries the verified signer, the block time, the pending state overlay
/// and the program call stack used for derived authority and depth checks.
class invoke_context final {
 public:
  invoke_context(encoder_t& encoder,
                 timelock::state::overlay& state,
                 timelock::ledger::token_ledger& ledger,
                 const timelock::schema::account_id_t& signer,
                 timelock::schema::timestamp_seconds_t now);

  encoder_t& encoder();
  timelock::state::overlay& state();
  timelock::ledger::token_ledger& ledger();

  const timelock::schema::account_id_t& signer() const;
  bool is_signer(const timelock::schema::account_id_t& account) const;

  /// Block time in unix seconds. Constant for the whole transaction.
  timelock::schema::timestamp_seconds_t now() const;

  std::optional<timelock::schema::account_t> load_account(
      const timelock::schema::account_id_t& id);
  void store_account(const timelock::schema::account_t& account);

  /// Fails `call_depth_exceeded` beyond kMaxProgramDepth frames.
  program_result_t push_program(const timelock::schema::account_id_t& program);
  void pop_program();
  /// Innermost running program, if any.
  std::optional<timelock::schema::account_id_t> current_program() const;
  std::size_t depth() const;

  void emit(timelock::schema::transaction_event_t event);
  std::vector<timelock::schema::transaction_event_t>& events();

 private:
  encoder_t& encoder_;
  timelock::state::overlay& state_;
  timelock::ledger::token_ledger& ledger_;
  timelock::schema::account_id_t signer_;
  timelock::schema::timestamp_seconds_t now_{};
  std::vector<timelock::schema::account_id_t> program_stack_;
  std::vector<timelock::schema::transaction_event_t> events_;
};

/// Pushes a program frame for the lifetime of the object.
class program_frame final {
 public:
  program_frame(invoke_context& context,
                const timelock::schema::account_id_t& program);
  ~program_frame();

  program_frame(const program_frame&) = delete;
  program_frame& operator=(const program_frame&) = delete;

  /// Set when the push was refused; the frame is then inert.
  const program_result_t& error() const;

 private:
  invoke_context& context_;
  program_result_t error_;
};

}  // namespace timelock::runtime
