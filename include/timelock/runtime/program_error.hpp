#pragma once

#include <timelock/schema/transaction_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace timelock::runtime {

inline constexpr auto kHostCodespace = "timelock.host";
inline constexpr auto kLedgerCodespace = "timelock.ledger";
inline constexpr auto kVaultCodespace = "timelock.vault";

/// Terminal failure of a program or ledger call.
struct program_error final {
  timelock::schema::transaction_error_code code{};
  std::string log;
  std::string codespace;
};

/// Empty on success.
using program_result_t = std::optional<program_error>;

inline std::string codespace_for(
    const timelock::schema::transaction_error_code code) {
  auto value = static_cast<uint32_t>(code);
  if (value >= 100) {
    return kVaultCodespace;
  }
  if (value >= 50) {
    return kLedgerCodespace;
  }
  return kHostCodespace;
}

inline program_error make_error(const timelock::schema::transaction_error_code code,
                                std::string log) {
  return program_error{
      .code = code, .log = std::move(log), .codespace = codespace_for(code)};
}

}  // namespace timelock::runtime
