#include <spdlog/spdlog.h>
#include <coffer/blake3/hash.hpp>
#include <coffer/persistence/checkpoint.hpp>
#include <coffer/persistence/keys.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>
#include <utility>
#include <vector>

using namespace coffer::schema;

namespace {

hash32_t hash_vaults(const std::vector<vault_state_t>& vaults) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(vaults);
  return coffer::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

}  // namespace

namespace coffer::persistence {

coffer::storage::committed_state save_checkpoint(
    const storage_t& storage,
    const coffer::ledger::vault_ledger& ledger,
    const std::vector<coffer::storage::key_value_entry_t>& extra) {
  const auto vaults = ledger.export_state();

  auto encoder = encoding::scale_encoder_t{};
  auto rows = std::vector<coffer::storage::key_value_entry_t>{};
  rows.reserve(vaults.size());
  for (const auto& vault : vaults) {
    rows.push_back({make_indexed_key(kVaultPrefix, vault.id),
                    encoder.encode(vault)});
  }
  const auto previous = storage.load_committed_state();
  const auto state = coffer::storage::committed_state{
      .height = previous ? previous->height + 1 : 1,
      .state_root = hash_vaults(vaults)};

  const auto prefix = make_bytes(kVaultPrefix);
  storage.commit_by_prefix(bytes_view_t{prefix.data(), prefix.size()}, rows,
                           extra, state);
  spdlog::info("Saved checkpoint {} with {} vault(s), state root {}",
               state.height, vaults.size(), to_hex(state.state_root));
  return state;
}

bool load_checkpoint(const storage_t& storage,
                     coffer::ledger::vault_ledger& ledger,
                     std::string& error) {
  const auto committed = storage.load_committed_state();
  if (!committed) {
    spdlog::info("No checkpoint found; starting with an empty ledger");
    return true;
  }

  const auto prefix = make_bytes(kVaultPrefix);
  const auto rows =
      storage.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()});

  auto encoder = encoding::scale_encoder_t{};
  auto vaults = std::vector<vault_state_t>{};
  vaults.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    const auto id =
        parse_indexed_key(kVaultPrefix, bytes_view_t{key.data(), key.size()});
    if (!id) {
      error = "malformed vault key";
      return false;
    }
    auto decoded = encoder.try_decode<vault_state_t>(
        bytes_view_t{value.data(), value.size()});
    if (!decoded) {
      error = "failed to decode vault " + std::to_string(*id);
      return false;
    }
    if (decoded->id != *id) {
      error = "vault row " + std::to_string(*id) + " carries id " +
              std::to_string(decoded->id);
      return false;
    }
    vaults.push_back(std::move(*decoded));
  }

  if (hash_vaults(vaults) != committed->state_root) {
    error = "vault rows do not match committed state root";
    spdlog::warn("Rejecting checkpoint {}: {}", committed->height, error);
    return false;
  }
  if (!ledger.load_state(std::move(vaults), error)) {
    spdlog::warn("Rejecting checkpoint {}: {}", committed->height, error);
    return false;
  }
  spdlog::info("Loaded checkpoint {} with state root {}", committed->height,
               to_hex(committed->state_root));
  return true;
}

}  // namespace coffer::persistence
