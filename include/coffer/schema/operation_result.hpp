#pragma once

#include <coffer/schema/ledger_error_code.hpp>
#include <coffer/schema/ledger_event.hpp>
#include <coffer/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Outcome of a mutating ledger operation: typed code, diagnostics, the id a
// create assigned, and the events the operation emitted.
namespace coffer::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  ledger_error_code code{ledger_error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<vault_id_t> vault_id;
  std::vector<ledger_event_t> events;
};

using operation_result_t = operation_result<1>;

}  // namespace coffer::schema
