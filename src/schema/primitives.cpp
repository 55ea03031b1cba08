#include <boost/algorithm/hex.hpp>
#include <coffer/common/critical.hpp>
#include <coffer/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>

namespace coffer::schema {

namespace {

// Accepts an optional 0x/0X prefix; digits may be either case.
std::optional<bytes_t> decode_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  try {
    boost::algorithm::unhex(std::begin(hex), std::end(hex),
                            std::back_inserter(decoded));
  } catch (const boost::algorithm::hex_decode_error&) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

hash32_t make_hash32(const bytes_t& bytes) {
  auto hash = hash32_t{};
  if (bytes.size() != hash.size()) {
    coffer::common::critical("hash32 requires exactly 32 bytes");
  }
  std::copy_n(std::begin(bytes), hash.size(), std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = decode_hex(hex);
  if (!decoded || decoded->size() != std::tuple_size_v<hash32_t>) {
    return std::nullopt;
  }
  return make_hash32(*decoded);
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  boost::algorithm::hex_lower(std::begin(bytes), std::end(bytes),
                              std::back_inserter(out));
  return out;
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  if (decimal.empty() ||
      !std::all_of(std::begin(decimal), std::end(decimal),
                   [](const char ch) { return ch >= '0' && ch <= '9'; })) {
    return std::nullopt;
  }
  // Parse wide so that values past 2^256 - 1 are detected, not wrapped.
  static const auto kMax =
      boost::multiprecision::cpp_int{std::numeric_limits<amount_t>::max()};
  auto value = boost::multiprecision::cpp_int{std::string{decimal}};
  if (value > kMax) {
    return std::nullopt;
  }
  return static_cast<amount_t>(value);
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace coffer::schema
