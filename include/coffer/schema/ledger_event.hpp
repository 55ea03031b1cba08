#pragma once
#include <coffer/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <variant>

// Schema type: ledger event.
// Audit notifications emitted once the triggering operation has succeeded.
namespace coffer::schema {

template <uint16_t Version>
struct vault_created;

template <>
struct vault_created<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  identity_t owner{};
};

template <uint16_t Version>
struct vault_deposited;

template <>
struct vault_deposited<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  identity_t owner{};
  amount_t amount{};
};

template <uint16_t Version>
struct vault_withdrawn;

template <>
struct vault_withdrawn<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  identity_t owner{};
  amount_t amount{};
};

using vault_created_t = vault_created<1>;
using vault_deposited_t = vault_deposited<1>;
using vault_withdrawn_t = vault_withdrawn<1>;

using ledger_event_t =
    std::variant<vault_created_t, vault_deposited_t, vault_withdrawn_t>;

inline std::string_view event_type(const ledger_event_t& event) {
  return std::visit(
      overloaded{
          [](const vault_created_t&) { return std::string_view{"VaultCreated"}; },
          [](const vault_deposited_t&) {
            return std::string_view{"VaultDeposited"};
          },
          [](const vault_withdrawn_t&) {
            return std::string_view{"VaultWithdrawn"};
          }},
      event);
}

inline vault_id_t event_vault_id(const ledger_event_t& event) {
  return std::visit([](const auto& value) { return value.vault_id; }, event);
}

}  // namespace coffer::schema
