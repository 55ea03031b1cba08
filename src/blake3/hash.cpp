#include <blake3.h>
#include <coffer/blake3/hash.hpp>
#include <tuple>

namespace coffer::blake3 {

namespace {

coffer::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<coffer::schema::hash32_t>);
  auto output = coffer::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

coffer::schema::hash32_t hash(const coffer::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace coffer::blake3
