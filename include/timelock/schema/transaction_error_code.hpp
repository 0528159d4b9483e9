#pragma once

#include <timelock/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace timelock::schema {

enum class transaction_error_code : uint32_t {
  // Host envelope and account checks.
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  missing_required_signature = 6,
  incorrect_program_id = 7,
  not_enough_account_keys = 8,
  invalid_account_data = 9,
  invalid_argument = 10,
  account_exists = 11,
  call_depth_exceeded = 12,
  // Token ledger.
  ledger_invalid_account = 50,
  ledger_mint_mismatch = 51,
  ledger_owner_mismatch = 52,
  ledger_insufficient_funds = 53,
  ledger_overflow = 54,
  ledger_unauthorized_mint = 55,
  // Vault program.
  unlock_time_not_reached = 100,
  unauthorized_withdrawal = 101,
  deposit_not_found = 102,
  invalid_amount = 103,
  already_withdrawn = 104,
  invalid_unlock_time = 105,
  reentrancy_detected = 106,
  invalid_instruction_data = 107,
  account_already_in_use = 108,
  insufficient_funds = 109,
  math_overflow = 110,
};

using error_name_t = std::pair<std::string_view, transaction_error_code>;

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    error_name_t{"invalid_transaction",
                 transaction_error_code::invalid_transaction},
    error_name_t{"unsupported_transaction_version",
                 transaction_error_code::unsupported_transaction_version},
    error_name_t{"invalid_chain_id", transaction_error_code::invalid_chain_id},
    error_name_t{"invalid_nonce", transaction_error_code::invalid_nonce},
    error_name_t{"signature_verification_failed",
                 transaction_error_code::signature_verification_failed},
    error_name_t{"missing_required_signature",
                 transaction_error_code::missing_required_signature},
    error_name_t{"incorrect_program_id",
                 transaction_error_code::incorrect_program_id},
    error_name_t{"not_enough_account_keys",
                 transaction_error_code::not_enough_account_keys},
    error_name_t{"invalid_account_data",
                 transaction_error_code::invalid_account_data},
    error_name_t{"invalid_argument", transaction_error_code::invalid_argument},
    error_name_t{"account_exists", transaction_error_code::account_exists},
    error_name_t{"call_depth_exceeded",
                 transaction_error_code::call_depth_exceeded},
    error_name_t{"ledger_invalid_account",
                 transaction_error_code::ledger_invalid_account},
    error_name_t{"ledger_mint_mismatch",
                 transaction_error_code::ledger_mint_mismatch},
    error_name_t{"ledger_owner_mismatch",
                 transaction_error_code::ledger_owner_mismatch},
    error_name_t{"ledger_insufficient_funds",
                 transaction_error_code::ledger_insufficient_funds},
    error_name_t{"ledger_overflow", transaction_error_code::ledger_overflow},
    error_name_t{"ledger_unauthorized_mint",
                 transaction_error_code::ledger_unauthorized_mint},
    error_name_t{"unlock_time_not_reached",
                 transaction_error_code::unlock_time_not_reached},
    error_name_t{"unauthorized_withdrawal",
                 transaction_error_code::unauthorized_withdrawal},
    error_name_t{"deposit_not_found",
                 transaction_error_code::deposit_not_found},
    error_name_t{"invalid_amount", transaction_error_code::invalid_amount},
    error_name_t{"already_withdrawn",
                 transaction_error_code::already_withdrawn},
    error_name_t{"invalid_unlock_time",
                 transaction_error_code::invalid_unlock_time},
    error_name_t{"reentrancy_detected",
                 transaction_error_code::reentrancy_detected},
    error_name_t{"invalid_instruction_data",
                 transaction_error_code::invalid_instruction_data},
    error_name_t{"account_already_in_use",
                 transaction_error_code::account_already_in_use},
    error_name_t{"insufficient_funds",
                 transaction_error_code::insufficient_funds},
    error_name_t{"math_overflow", transaction_error_code::math_overflow}};

inline std::string_view error_name(const transaction_error_code code) {
  return to_string(code, kTransactionErrorCodeMappings)
      .value_or(std::string_view{"unknown"});
}

}  // namespace timelock::schema
