#pragma once
#include <coffer/schema/primitives.hpp>
#include <cstdint>
#include <span>

namespace coffer::blake3 {

/// BLAKE3 digest of `bytes`; the ledger state root is built on it.
coffer::schema::hash32_t hash(const coffer::schema::bytes_view_t& bytes);

}  // namespace coffer::blake3
