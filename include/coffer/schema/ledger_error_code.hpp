#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: ledger error code.
// Rejection taxonomy for ledger operations. Every code is a caller-correctable
// precondition violation; numeric values are stable.
namespace coffer::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  not_found = 1,
  unauthorized = 2,
  invalid_amount = 3,
  insufficient_balance = 4,
  transfer_failed = 5,
  balance_overflow = 6,
};

using ledger_error_code_name_t = std::pair<std::string_view, ledger_error_code>;

inline constexpr auto kLedgerErrorCodeNames = std::array{
    ledger_error_code_name_t{"ok", ledger_error_code::ok},
    ledger_error_code_name_t{"not_found", ledger_error_code::not_found},
    ledger_error_code_name_t{"unauthorized", ledger_error_code::unauthorized},
    ledger_error_code_name_t{"invalid_amount",
                             ledger_error_code::invalid_amount},
    ledger_error_code_name_t{"insufficient_balance",
                             ledger_error_code::insufficient_balance},
    ledger_error_code_name_t{"transfer_failed",
                             ledger_error_code::transfer_failed},
    ledger_error_code_name_t{"balance_overflow",
                             ledger_error_code::balance_overflow},
};

constexpr std::optional<ledger_error_code> try_make_ledger_error_code(
    const std::string_view name) {
  for (const auto& [candidate, code] : kLedgerErrorCodeNames) {
    if (candidate == name) {
      return code;
    }
  }
  return std::nullopt;
}

constexpr std::string_view to_string(const ledger_error_code code) {
  for (const auto& [name, candidate] : kLedgerErrorCodeNames) {
    if (candidate == code) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace coffer::schema
