#include <spdlog/spdlog.h>
#include <timelock/ledger/token_ledger.hpp>
#include <timelock/program/authorization.hpp>
#include <timelock/program/vault_program.hpp>
#include <timelock/runtime/addresses.hpp>
#include <timelock/schema/account.hpp>
#include <timelock/schema/transaction_event.hpp>
#include <timelock/schema/transaction_event_attribute.hpp>
#include <timelock/schema/vault_state.hpp>
#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <utility>

using namespace timelock::schema;

namespace {

using timelock::runtime::make_error;
using timelock::runtime::program_result_t;

constexpr std::size_t kCreateVaultAccounts = 3;
constexpr std::size_t kDepositAccounts = 7;
constexpr std::size_t kWithdrawAccounts = 6;
constexpr std::size_t kEmergencyWithdrawAccounts = 6;

struct loaded_vault final {
  account_t account;
  vault_state_t state;
};

program_result_t require_accounts(
    const timelock::program::account_list_t& accounts,
    std::size_t count) {
  if (accounts.size() < count) {
    return make_error(transaction_error_code::not_enough_account_keys,
                      "expected " + std::to_string(count) + " accounts, got " +
                          std::to_string(accounts.size()));
  }
  return std::nullopt;
}

program_result_t require_signer(timelock::runtime::invoke_context& context,
                                const account_id_t& account) {
  if (!timelock::program::is_signer(context, account)) {
    return make_error(transaction_error_code::missing_required_signature,
                      "account " + to_hex(account) + " did not sign");
  }
  return std::nullopt;
}

program_result_t require_token_program(const account_id_t& account) {
  if (account != timelock::runtime::token_program_id()) {
    return make_error(transaction_error_code::incorrect_program_id,
                      "token program account mismatch");
  }
  return std::nullopt;
}

program_result_t require_clock(const account_id_t& account) {
  if (account != timelock::runtime::clock_sysvar_id()) {
    return make_error(transaction_error_code::invalid_argument,
                      "clock sysvar account mismatch");
  }
  return std::nullopt;
}

// The vault's token account must be held by the vault authority and, once a
// deposit exists, carry that deposit's mint.
program_result_t require_vault_token(
    timelock::runtime::invoke_context& context,
    const account_id_t& vault_id,
    const account_id_t& vault_token,
    const std::optional<account_id_t>& mint = std::nullopt) {
  auto balance = context.ledger().read_balance(context, vault_token);
  if (!balance) {
    return make_error(transaction_error_code::invalid_account_data,
                      "vault token account is not a token account");
  }
  if (balance->owner != timelock::runtime::vault_authority(vault_id)) {
    return make_error(transaction_error_code::invalid_argument,
                      "vault token account is not held by the vault");
  }
  if (mint && balance->mint != mint.value()) {
    return make_error(transaction_error_code::ledger_mint_mismatch,
                      "vault token account mint differs from the deposit");
  }
  return std::nullopt;
}

program_result_t load_vault_account(timelock::runtime::invoke_context& context,
                                    const account_id_t& vault_id,
                                    account_t& out) {
  auto account = context.load_account(vault_id);
  if (!account || account->owner != timelock::runtime::vault_program_id()) {
    return make_error(transaction_error_code::incorrect_program_id,
                      "vault account is not owned by the vault program");
  }
  out = std::move(account.value());
  return std::nullopt;
}

program_result_t load_vault(timelock::runtime::invoke_context& context,
                            const account_id_t& vault_id,
                            loaded_vault& out) {
  if (auto error = load_vault_account(context, vault_id, out.account)) {
    return error;
  }
  auto state = context.encoder().try_decode_exact<vault_state_t>(
      bytes_view_t{out.account.data.data(), out.account.data.size()});
  if (!state) {
    return make_error(transaction_error_code::invalid_account_data,
                      "vault data is not a vault record");
  }
  out.state = std::move(state.value());
  return std::nullopt;
}

void store_vault(timelock::runtime::invoke_context& context,
                 loaded_vault& vault) {
  vault.account.data = context.encoder().encode(vault.state);
  context.store_account(vault.account);
}

deposit_t* find_deposit(vault_state_t& vault, uint64_t deposit_id) {
  auto it = std::find_if(
      std::begin(vault.deposits), std::end(vault.deposits),
      [&](const deposit_t& deposit) { return deposit.id == deposit_id; });
  if (it == std::end(vault.deposits)) {
    return nullptr;
  }
  return &*it;
}

transaction_event_t make_event(
    std::string type,
    std::initializer_list<std::pair<std::string, std::string>> attributes) {
  auto event = transaction_event_t{};
  event.type = std::move(type);
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(
        transaction_event_attribute_t{.key = key, .value = value, .index = true});
  }
  return event;
}

}  // namespace

namespace timelock::program {

std::optional<vault_instruction_t> decode_instruction(
    runtime::encoder_t& encoder,
    const bytes_view_t& instruction_data) {
  if (instruction_data.empty()) {
    return std::nullopt;
  }
  auto instruction = encoder.try_decode_exact<vault_instruction_t>(
      instruction_data);
  if (!instruction) {
    return std::nullopt;
  }
  auto version = std::visit(
      [](const auto& value) -> uint16_t { return value.version; },
      instruction.value());
  if (version != 1) {
    return std::nullopt;
  }
  return instruction;
}

runtime::program_result_t process_instruction(
    runtime::invoke_context& context,
    const account_list_t& accounts,
    const bytes_view_t& instruction_data) {
  auto instruction = decode_instruction(context.encoder(), instruction_data);
  if (!instruction) {
    spdlog::debug("Rejecting undecodable vault instruction ({} bytes)",
                  instruction_data.size());
    return runtime::make_error(
        transaction_error_code::invalid_instruction_data,
        "instruction data is not a vault instruction");
  }

  auto result = runtime::program_result_t{};
  std::visit(
      overloaded{[&](const create_vault_t& value) {
                   result = process_create_vault(context, accounts, value);
                 },
                 [&](const deposit_tokens_t& value) {
                   result = process_deposit(context, accounts, value);
                 },
                 [&](const withdraw_t& value) {
                   result = process_withdraw(context, accounts, value);
                 },
                 [&](const emergency_withdraw_t& value) {
                   result =
                       process_emergency_withdraw(context, accounts, value);
                 }},
      instruction.value());
  return result;
}

runtime::program_result_t process_create_vault(
    runtime::invoke_context& context,
    const account_list_t& accounts,
    const create_vault_t&) {
  if (auto error = require_accounts(accounts, kCreateVaultAccounts)) {
    return error;
  }
  const auto& owner = accounts[0];
  const auto& vault_id = accounts[1];
  if (auto error = require_signer(context, owner)) {
    return error;
  }

  auto vault = loaded_vault{};
  if (auto error = load_vault_account(context, vault_id, vault.account)) {
    return error;
  }
  if (!vault.account.data.empty()) {
    return runtime::make_error(transaction_error_code::account_already_in_use,
                               "vault account already initialized");
  }

  vault.state.owner = owner;
  vault.state.deposit_count = 0;
  vault.state.reentrancy_guard = false;
  vault.state.emergency_authority = std::nullopt;
  store_vault(context, vault);

  context.emit(make_event(
      "vault_created", {{"vault", to_hex(vault_id)}, {"owner", to_hex(owner)}}));
  spdlog::info("Vault {} created for owner {}", to_hex(vault_id),
               to_hex(owner));
  return std::nullopt;
}

runtime::program_result_t process_deposit(
    runtime::invoke_context& context,
    const account_list_t& accounts,
    const deposit_tokens_t& instruction) {
  if (auto error = require_accounts(accounts, kDepositAccounts)) {
    return error;
  }
  const auto& depositor = accounts[0];
  const auto& vault_id = accounts[1];
  const auto& source = accounts[2];
  const auto& vault_token = accounts[3];
  if (auto error = require_signer(context, depositor)) {
    return error;
  }
  auto vault = loaded_vault{};
  if (auto error = load_vault(context, vault_id, vault)) {
    return error;
  }
  if (auto error = require_token_program(accounts[4])) {
    return error;
  }
  if (auto error = require_clock(accounts[6])) {
    return error;
  }
  auto source_balance = context.ledger().read_balance(context, source);
  if (!source_balance) {
    return runtime::make_error(transaction_error_code::invalid_account_data,
                               "source is not a token account");
  }
  if (auto error = require_vault_token(context, vault_id, vault_token)) {
    return error;
  }

  if (vault.state.reentrancy_guard) {
    return runtime::make_error(transaction_error_code::reentrancy_detected,
                               "vault operation already in progress");
  }
  vault.state.reentrancy_guard = true;

  if (instruction.amount == 0) {
    return runtime::make_error(transaction_error_code::invalid_amount,
                               "deposit amount must be positive");
  }
  auto now = context.now();
  if (instruction.unlock_time <= now) {
    return runtime::make_error(transaction_error_code::invalid_unlock_time,
                               "unlock time must be in the future");
  }
  if (source_balance->amount < instruction.amount) {
    return runtime::make_error(transaction_error_code::insufficient_funds,
                               "source balance below deposit amount");
  }

  auto deposit = deposit_t{};
  deposit.id = vault.state.deposit_count;
  deposit.depositor = depositor;
  deposit.token_mint = source_balance->mint;
  deposit.amount = instruction.amount;
  deposit.unlock_time = instruction.unlock_time;
  deposit.withdrawn = false;
  deposit.tag = instruction.tag;
  deposit.created_at = now;
  vault.state.deposits.push_back(deposit);
  if (vault.state.deposit_count == std::numeric_limits<uint64_t>::max()) {
    return runtime::make_error(transaction_error_code::math_overflow,
                               "deposit counter exhausted");
  }
  vault.state.deposit_count += 1;

  // Nested invocations triggered by the transfer must see the guard.
  store_vault(context, vault);
  if (auto error = context.ledger().transfer(
          context, ledger::transfer_request{
                       .from = source,
                       .to = vault_token,
                       .amount = instruction.amount,
                       .authority = ledger::signer_authority{depositor}})) {
    return error;
  }

  vault.state.reentrancy_guard = false;
  store_vault(context, vault);

  context.emit(make_event(
      "deposit_locked",
      {{"vault", to_hex(vault_id)},
       {"deposit_id", std::to_string(deposit.id)},
       {"amount", std::to_string(deposit.amount)},
       {"unlock_time", std::to_string(deposit.unlock_time)}}));
  spdlog::info("Deposit successful: {} tokens locked until timestamp {}",
               deposit.amount, deposit.unlock_time);
  return std::nullopt;
}

runtime::program_result_t process_withdraw(runtime::invoke_context& context,
                                           const account_list_t& accounts,
                                           const withdraw_t& instruction) {
  if (auto error = require_accounts(accounts, kWithdrawAccounts)) {
    return error;
  }
  const auto& caller = accounts[0];
  const auto& vault_id = accounts[1];
  const auto& destination = accounts[2];
  const auto& vault_token = accounts[3];
  if (auto error = require_signer(context, caller)) {
    return error;
  }
  auto vault = loaded_vault{};
  if (auto error = load_vault(context, vault_id, vault)) {
    return error;
  }
  if (auto error = require_token_program(accounts[4])) {
    return error;
  }
  if (auto error = require_clock(accounts[5])) {
    return error;
  }

  if (vault.state.reentrancy_guard) {
    return runtime::make_error(transaction_error_code::reentrancy_detected,
                               "vault operation already in progress");
  }
  vault.state.reentrancy_guard = true;

  auto* deposit = find_deposit(vault.state, instruction.deposit_id);
  if (deposit == nullptr) {
    return runtime::make_error(transaction_error_code::deposit_not_found,
                               "no deposit with id " +
                                   std::to_string(instruction.deposit_id));
  }
  if (!is_depositor_of_record(*deposit, caller)) {
    return runtime::make_error(transaction_error_code::unauthorized_withdrawal,
                               "caller is not the depositor of record");
  }
  if (deposit->withdrawn) {
    return runtime::make_error(transaction_error_code::already_withdrawn,
                               "deposit already withdrawn");
  }
  if (deposit->unlock_time > context.now()) {
    return runtime::make_error(transaction_error_code::unlock_time_not_reached,
                               "deposit unlocks at " +
                                   std::to_string(deposit->unlock_time));
  }
  if (auto error = require_vault_token(context, vault_id, vault_token,
                                       deposit->token_mint)) {
    return error;
  }

  deposit->withdrawn = true;
  auto amount = deposit->amount;
  store_vault(context, vault);
  if (auto error = context.ledger().transfer(
          context,
          ledger::transfer_request{
              .from = vault_token,
              .to = destination,
              .amount = amount,
              .authority = ledger::derived_authority{
                  runtime::vault_program_id(),
                  runtime::vault_authority_seeds(vault_id)}})) {
    return error;
  }

  vault.state.reentrancy_guard = false;
  store_vault(context, vault);

  context.emit(make_event("deposit_withdrawn",
                          {{"vault", to_hex(vault_id)},
                           {"deposit_id", std::to_string(instruction.deposit_id)},
                           {"amount", std::to_string(amount)}}));
  spdlog::info("Withdrawal successful: {} tokens from deposit {}", amount,
               instruction.deposit_id);
  return std::nullopt;
}

runtime::program_result_t process_emergency_withdraw(
    runtime::invoke_context& context,
    const account_list_t& accounts,
    const emergency_withdraw_t& instruction) {
  if (auto error = require_accounts(accounts, kEmergencyWithdrawAccounts)) {
    return error;
  }
  const auto& caller = accounts[0];
  const auto& vault_id = accounts[1];
  const auto& destination = accounts[2];
  const auto& vault_token = accounts[3];
  const auto& claimed_depositor = accounts[5];
  if (auto error = require_signer(context, caller)) {
    return error;
  }
  auto vault = loaded_vault{};
  if (auto error = load_vault(context, vault_id, vault)) {
    return error;
  }
  if (auto error = require_token_program(accounts[4])) {
    return error;
  }

  if (vault.state.reentrancy_guard) {
    return runtime::make_error(transaction_error_code::reentrancy_detected,
                               "vault operation already in progress");
  }
  vault.state.reentrancy_guard = true;

  if (!is_emergency_authority(vault.state, caller)) {
    return runtime::make_error(transaction_error_code::unauthorized_withdrawal,
                               "caller is not the emergency authority");
  }
  auto* deposit = find_deposit(vault.state, instruction.deposit_id);
  if (deposit == nullptr) {
    return runtime::make_error(transaction_error_code::deposit_not_found,
                               "no deposit with id " +
                                   std::to_string(instruction.deposit_id));
  }
  if (deposit->withdrawn) {
    return runtime::make_error(transaction_error_code::already_withdrawn,
                               "deposit already withdrawn");
  }
  // The destination account is not tied to this identity; only the mint is
  // checked by the ledger.
  if (!is_depositor_of_record(*deposit, claimed_depositor)) {
    return runtime::make_error(transaction_error_code::unauthorized_withdrawal,
                               "depositor account does not match deposit");
  }
  if (auto error = require_vault_token(context, vault_id, vault_token,
                                       deposit->token_mint)) {
    return error;
  }

  deposit->withdrawn = true;
  auto amount = deposit->amount;
  store_vault(context, vault);
  if (auto error = context.ledger().transfer(
          context,
          ledger::transfer_request{
              .from = vault_token,
              .to = destination,
              .amount = amount,
              .authority = ledger::derived_authority{
                  runtime::vault_program_id(),
                  runtime::vault_authority_seeds(vault_id)}})) {
    return error;
  }

  vault.state.reentrancy_guard = false;
  store_vault(context, vault);

  context.emit(make_event("deposit_emergency_withdrawn",
                          {{"vault", to_hex(vault_id)},
                           {"deposit_id", std::to_string(instruction.deposit_id)},
                           {"amount", std::to_string(amount)}}));
  spdlog::warn("Emergency withdrawal successful: {} tokens from deposit {}",
               amount, instruction.deposit_id);
  return std::nullopt;
}

}  // namespace timelock::program
