#pragma once

#include <coffer/ledger/collaborators.hpp>
#include <coffer/schema/ledger_event.hpp>
#include <coffer/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <vector>

namespace coffer::persistence {

/// Append-only record of ledger events, numbered from 0.
///
/// Events handed to `sink()` are staged in memory. They reach storage either
/// through `flush()` or as the `extra` entries of a checkpoint commit, so that
/// the log never records an event whose vault state was not persisted with it.
class audit_log final {
 public:
  using storage_t =
      coffer::storage::storage<coffer::storage::rocksdb_storage_tag>;

  explicit audit_log(const storage_t& storage);

  /// Persist `event` and return its sequence number.
  uint64_t append(const coffer::schema::ledger_event_t& event);

  /// Committed events with sequence numbers in [from, to]; stops at the end
  /// of the log. Staged events are not visible.
  std::vector<coffer::schema::ledger_event_t> range(uint64_t from,
                                                    uint64_t to) const;

  /// Number of committed events.
  uint64_t size() const;

  /// Sink that stages every delivered event.
  coffer::ledger::event_sink_t sink();

  std::size_t staged() const;

  /// Rows for the staged events plus the advanced sequence counter. Pass them
  /// to a commit, then call `mark_committed()`.
  std::vector<coffer::storage::key_value_entry_t> staged_entries() const;
  void mark_committed();

  /// Write the staged events on their own, in one batch.
  void flush();

 private:
  const storage_t& storage_;
  uint64_t next_sequence_{};
  std::vector<coffer::schema::ledger_event_t> staged_;
};

}  // namespace coffer::persistence
