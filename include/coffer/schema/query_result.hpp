#pragma once

#include <coffer/schema/ledger_error_code.hpp>
#include <coffer/schema/vault_state.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: query result.
// Read API envelope for a single vault lookup.
namespace coffer::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  ledger_error_code code{ledger_error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<vault_state_t> vault;
};

using query_result_t = query_result<1>;

}  // namespace coffer::schema
