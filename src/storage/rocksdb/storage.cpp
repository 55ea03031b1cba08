#include <coffer/common/critical.hpp>
#include <coffer/storage/rocksdb/storage.hpp>

namespace coffer::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    coffer::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto committed_raw = std::string{};
  auto status =
      handle().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load committed state: {}", status.ToString());
    coffer::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, coffer::schema::hash32_t>>(
          coffer::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    coffer::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  const auto encoded = detail::encode_committed_state(state);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto status =
      batch.Put(std::string{detail::kCommittedStateKey},
                detail::to_slice(coffer::schema::make_bytes_view(encoded)));
  if (!status.ok()) {
    coffer::common::critical("failed staging committed state");
  }
  write(batch);
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const coffer::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = coffer::schema::make_string(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      handle().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    coffer::common::critical("failed listing keys by prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::put_all(
    const std::vector<key_value_entry_t>& entries) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_entries(batch, entries);
  write(batch);
}

void storage<rocksdb_storage_tag>::replace_by_prefix(
    const coffer::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_prefix_replacement(batch, prefix, entries);
  write(batch);
}

void storage<rocksdb_storage_tag>::commit_by_prefix(
    const coffer::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries,
    const std::vector<key_value_entry_t>& extra,
    const committed_state& state) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_prefix_replacement(batch, prefix, entries);
  stage_entries(batch, extra);
  const auto encoded = detail::encode_committed_state(state);
  auto state_status =
      batch.Put(std::string{detail::kCommittedStateKey},
                detail::to_slice(coffer::schema::make_bytes_view(encoded)));
  if (!state_status.ok()) {
    coffer::common::critical("failed staging committed state");
  }
  write(batch);
}

void storage<rocksdb_storage_tag>::stage_prefix_replacement(
    ROCKSDB_NAMESPACE::WriteBatch& batch,
    const coffer::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  auto prefix_string = coffer::schema::make_string(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      handle().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};

  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    auto delete_status = batch.Delete(iterator->key());
    if (!delete_status.ok()) {
      coffer::common::critical("failed deleting key during prefix replacement");
    }
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    coffer::common::critical("failed scanning keys for prefix replacement");
  }

  stage_entries(batch, entries);
}

void storage<rocksdb_storage_tag>::stage_entries(
    ROCKSDB_NAMESPACE::WriteBatch& batch,
    const std::vector<key_value_entry_t>& entries) {
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(coffer::schema::make_bytes_view(key)),
                  detail::to_slice(coffer::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      coffer::common::critical("failed staging entry in write batch");
    }
  }
}

void storage<rocksdb_storage_tag>::write(
    ROCKSDB_NAMESPACE::WriteBatch& batch) const {
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = handle().Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit write batch: {}", status.ToString());
    coffer::common::critical("failed to commit write batch");
  }
}

}  // namespace coffer::storage
