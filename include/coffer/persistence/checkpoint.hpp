#pragma once

#include <coffer/ledger/vault_ledger.hpp>
#include <coffer/storage/rocksdb/storage.hpp>
#include <string>
#include <vector>

namespace coffer::persistence {

using storage_t =
    coffer::storage::storage<coffer::storage::rocksdb_storage_tag>;

/// Persist every vault and the ledger's state root.
///
/// The vault rows, `extra` (typically staged audit entries) and the committed
/// state with the height advanced by one go to storage in a single write
/// batch, so a crash leaves either the previous checkpoint or this one.
/// Returns the committed state.
coffer::storage::committed_state save_checkpoint(
    const storage_t& storage,
    const coffer::ledger::vault_ledger& ledger,
    const std::vector<coffer::storage::key_value_entry_t>& extra = {});

/// Restore the ledger from the last checkpoint.
///
/// Returns true with the ledger untouched when no checkpoint exists. Returns
/// false with `error` set when the rows cannot be loaded or do not hash to the
/// committed state root; the ledger is not modified in that case.
bool load_checkpoint(const storage_t& storage,
                     coffer::ledger::vault_ledger& ledger,
                     std::string& error);

}  // namespace coffer::persistence
