#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <coffer/common/critical.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace coffer::storage {

namespace detail {

using encoder_t = coffer::schema::encoding::scale_encoder_t;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline coffer::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const coffer::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

// Committed state is stored as the SCALE tuple (height, state_root).
inline coffer::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{state.height, state.state_root});
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  /// The open database; terminates when the handle was never opened or has
  /// been released.
  ROCKSDB_NAMESPACE::DB& handle() const {
    if (!database) {
      coffer::common::critical("RocksDB database is not initialized");
    }
    return *database;
  }

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const coffer::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const coffer::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  void put_all(const std::vector<key_value_entry_t>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const coffer::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const coffer::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
  void commit_by_prefix(const coffer::schema::bytes_view_t& prefix,
                        const std::vector<key_value_entry_t>& entries,
                        const std::vector<key_value_entry_t>& extra,
                        const committed_state& state) const;

 private:
  void stage_prefix_replacement(
      ROCKSDB_NAMESPACE::WriteBatch& batch,
      const coffer::schema::bytes_view_t& prefix,
      const std::vector<key_value_entry_t>& entries) const;
  static void stage_entries(ROCKSDB_NAMESPACE::WriteBatch& batch,
                            const std::vector<key_value_entry_t>& entries);
  void write(ROCKSDB_NAMESPACE::WriteBatch& batch) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const coffer::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = handle().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                             detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    coffer::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(coffer::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const coffer::schema::bytes_view_t& key,
                                       const T& value) const {
  auto encoded_value = encoder.encode(value);
  auto status = handle().Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(coffer::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    coffer::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace coffer::storage
