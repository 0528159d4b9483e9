#pragma once

#include <timelock/runtime/addresses.hpp>
#include <timelock/runtime/invoke_context.hpp>
#include <timelock/runtime/program_error.hpp>
#include <timelock/schema/primitives.hpp>
#include <timelock/schema/token_account.hpp>
#include <functional>
#include <optional>
#include <variant>

namespace timelock::ledger {

/// Conventional authority: the transaction signer owns the source account.
struct signer_authority final {
  timelock::schema::account_id_t id{};
};

/// Program controlled authority: `program_id` is the running program and the
/// seeds derive to the source account's owner.
struct derived_authority final {
  timelock::schema::account_id_t program_id{};
  timelock::runtime::seeds_t seeds;
};

using authority_t = std::variant<signer_authority, derived_authority>;

struct transfer_request final {
  timelock::schema::account_id_t from{};
  timelock::schema::account_id_t to{};
  timelock::schema::amount_t amount{};
  authority_t authority;
};

/// Runs after a transfer moved balances and before it returns. May call back
/// into programs through the context. An error fails the transfer.
using transfer_hook_t = std::function<timelock::runtime::program_result_t(
    timelock::runtime::invoke_context&,
    const transfer_request&)>;

/// Token balances kept in accounts owned by the token program.
class token_ledger final {
 public:
  /// Balance record, or std::nullopt when the account is missing, not owned
  /// by the token program, or undecodable.
  std::optional<timelock::schema::token_account_t> read_balance(
      timelock::runtime::invoke_context& context,
      const timelock::schema::account_id_t& account) const;

  timelock::runtime::program_result_t open_account(
      timelock::runtime::invoke_context& context,
      const timelock::schema::account_id_t& account,
      const timelock::schema::account_id_t& mint,
      const timelock::schema::account_id_t& owner) const;

  /// The transaction signer must be the mint.
  timelock::runtime::program_result_t mint_to(
      timelock::runtime::invoke_context& context,
      const timelock::schema::account_id_t& account,
      timelock::schema::amount_t amount) const;

  timelock::runtime::program_result_t transfer(
      timelock::runtime::invoke_context& context,
      const transfer_request& request) const;

  void set_transfer_hook(transfer_hook_t hook);

 private:
  timelock::runtime::program_result_t authorize(
      timelock::runtime::invoke_context& context,
      const timelock::schema::token_account_t& from,
      const authority_t& authority) const;

  void write_balance(timelock::runtime::invoke_context& context,
                     const timelock::schema::account_id_t& account,
                     const timelock::schema::token_account_t& balance) const;

  transfer_hook_t transfer_hook_;
};

}  // namespace timelock::ledger
