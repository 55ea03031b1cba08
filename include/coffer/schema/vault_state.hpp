#pragma once
#include <coffer/schema/primitives.hpp>
#include <cstdint>

// Schema type: vault state.
// One isolated balance account. `id` and `owner` are fixed at creation; only
// `balance` changes afterwards.
namespace coffer::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  vault_id_t id{};
  identity_t owner{};
  amount_t balance{};
};

using vault_state_t = vault_state<1>;

}  // namespace coffer::schema
