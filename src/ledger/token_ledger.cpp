#include <spdlog/spdlog.h>
#include <timelock/ledger/token_ledger.hpp>
#include <timelock/state/overlay.hpp>
#include <fmt/format.h>
#include <limits>
#include <utility>

using namespace timelock::schema;

namespace timelock::ledger {

std::optional<token_account_t> token_ledger::read_balance(
    runtime::invoke_context& context,
    const account_id_t& account) const {
  auto stored = context.load_account(account);
  if (!stored || stored->owner != runtime::token_program_id()) {
    return std::nullopt;
  }
  return context.encoder().try_decode_exact<token_account_t>(
      bytes_view_t{stored->data.data(), stored->data.size()});
}

runtime::program_result_t token_ledger::open_account(
    runtime::invoke_context& context,
    const account_id_t& account,
    const account_id_t& mint,
    const account_id_t& owner) const {
  if (context.load_account(account)) {
    return runtime::make_error(
        transaction_error_code::account_exists,
        fmt::format("account {} already exists", to_hex(account)));
  }
  auto balance = token_account_t{};
  balance.mint = mint;
  balance.owner = owner;
  balance.amount = 0;
  write_balance(context, account, balance);
  spdlog::debug("Opened token account {} for owner {}", to_hex(account),
                to_hex(owner));
  return std::nullopt;
}

runtime::program_result_t token_ledger::mint_to(
    runtime::invoke_context& context,
    const account_id_t& account,
    amount_t amount) const {
  auto balance = read_balance(context, account);
  if (!balance) {
    return runtime::make_error(transaction_error_code::ledger_invalid_account,
                               "mint target is not a token account");
  }
  if (!context.is_signer(balance->mint)) {
    return runtime::make_error(
        transaction_error_code::ledger_unauthorized_mint,
        "only the mint may issue tokens");
  }
  if (balance->amount > std::numeric_limits<amount_t>::max() - amount) {
    return runtime::make_error(transaction_error_code::ledger_overflow,
                               "mint would overflow balance");
  }
  balance->amount += amount;
  write_balance(context, account, *balance);
  return std::nullopt;
}

runtime::program_result_t token_ledger::transfer(
    runtime::invoke_context& context,
    const transfer_request& request) const {
  auto from = read_balance(context, request.from);
  auto to = read_balance(context, request.to);
  if (!from || !to) {
    return runtime::make_error(transaction_error_code::ledger_invalid_account,
                               "transfer accounts must be token accounts");
  }
  if (auto denied = authorize(context, *from, request.authority)) {
    return denied;
  }
  if (from->mint != to->mint) {
    return runtime::make_error(transaction_error_code::ledger_mint_mismatch,
                               "source and destination mints differ");
  }
  if (from->amount < request.amount) {
    return runtime::make_error(
        transaction_error_code::ledger_insufficient_funds,
        fmt::format("balance {} below transfer amount {}", from->amount,
                    request.amount));
  }

  auto frame = runtime::program_frame{context, runtime::token_program_id()};
  if (frame.error()) {
    return frame.error();
  }
  auto scope = timelock::state::transaction_scope{context.state()};

  if (request.from != request.to) {
    if (to->amount > std::numeric_limits<amount_t>::max() - request.amount) {
      return runtime::make_error(transaction_error_code::ledger_overflow,
                                 "transfer would overflow destination");
    }
    from->amount -= request.amount;
    to->amount += request.amount;
    write_balance(context, request.from, *from);
    write_balance(context, request.to, *to);
  }

  if (transfer_hook_) {
    if (auto hook_error = transfer_hook_(context, request)) {
      return hook_error;
    }
  }

  scope.commit();
  spdlog::debug("Transferred {} from {} to {}", request.amount,
                to_hex(request.from), to_hex(request.to));
  return std::nullopt;
}

void token_ledger::set_transfer_hook(transfer_hook_t hook) {
  transfer_hook_ = std::move(hook);
}

runtime::program_result_t token_ledger::authorize(
    runtime::invoke_context& context,
    const token_account_t& from,
    const authority_t& authority) const {
  auto result = runtime::program_result_t{};
  std::visit(
      overloaded{
          [&](const signer_authority& signer) {
            if (signer.id != from.owner) {
              result = runtime::make_error(
                  transaction_error_code::ledger_owner_mismatch,
                  "signer does not own the source account");
            } else if (!context.is_signer(signer.id)) {
              result = runtime::make_error(
                  transaction_error_code::missing_required_signature,
                  "source owner did not sign the transaction");
            }
          },
          [&](const derived_authority& derived) {
            auto caller = context.current_program();
            if (!caller || *caller != derived.program_id) {
              result = runtime::make_error(
                  transaction_error_code::missing_required_signature,
                  "derived authority used outside its program");
            } else if (runtime::derive_program_address(derived.program_id,
                                                       derived.seeds) !=
                       from.owner) {
              result = runtime::make_error(
                  transaction_error_code::ledger_owner_mismatch,
                  "derived authority does not own the source account");
            }
          }},
      authority);
  return result;
}

void token_ledger::write_balance(runtime::invoke_context& context,
                                 const account_id_t& account,
                                 const token_account_t& balance) const {
  auto stored = account_t{};
  stored.id = account;
  stored.owner = runtime::token_program_id();
  stored.data = context.encoder().encode(balance);
  context.store_account(stored);
}

}  // namespace timelock::ledger
