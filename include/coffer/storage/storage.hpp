#pragma once
#include <coffer/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace coffer::storage {

using key_value_entry_t =
    std::pair<coffer::schema::bytes_t, coffer::schema::bytes_t>;

/// Last checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  coffer::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const coffer::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const coffer::schema::bytes_view_t& key,
           const T& value) const;

  /// Load the most recent checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Write already-encoded entries in one atomic batch.
  void put_all(const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const coffer::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const coffer::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;

  /// Replace all entries under prefix, write `extra` and record `state` as the
  /// committed checkpoint. Either all of it becomes visible or none of it.
  void commit_by_prefix(const coffer::schema::bytes_view_t& prefix,
                        const std::vector<key_value_entry_t>& entries,
                        const std::vector<key_value_entry_t>& extra,
                        const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace coffer::storage
