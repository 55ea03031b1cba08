#pragma once

#include <boost/endian/conversion.hpp>
#include <coffer/schema/primitives.hpp>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <optional>
#include <string_view>

namespace coffer::persistence {

inline constexpr auto kVaultPrefix = std::string_view{"VAULT|"};
inline constexpr auto kEventPrefix = std::string_view{"EVENT|"};
inline constexpr auto kAuditNextKey = std::string_view{"SYS|AUDIT|NEXT"};

/// `prefix` followed by `index` as big-endian, so that key order matches
/// numeric order under a prefix scan.
inline coffer::schema::bytes_t make_indexed_key(const std::string_view prefix,
                                                const uint64_t index) {
  auto key = coffer::schema::make_bytes(prefix);
  const auto big = boost::endian::native_to_big(index);
  const auto* raw = reinterpret_cast<const uint8_t*>(&big);
  key.insert(std::end(key), raw, raw + sizeof(uint64_t));
  return key;
}

inline std::optional<uint64_t> parse_indexed_key(
    const std::string_view prefix,
    const coffer::schema::bytes_view_t& key) {
  if (key.size() != prefix.size() + sizeof(uint64_t) ||
      !coffer::schema::make_string_view(key).starts_with(prefix)) {
    return std::nullopt;
  }
  auto big = uint64_t{};
  std::memcpy(&big, key.data() + prefix.size(), sizeof(uint64_t));
  return boost::endian::big_to_native(big);
}

}  // namespace coffer::persistence
