#include <spdlog/spdlog.h>
#include <coffer/persistence/audit_log.hpp>
#include <coffer/persistence/keys.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>

using namespace coffer::schema;

namespace coffer::persistence {

audit_log::audit_log(const storage_t& storage) : storage_{storage} {
  auto encoder = encoding::scale_encoder_t{};
  const auto key = make_bytes(kAuditNextKey);
  next_sequence_ =
      storage_.get<uint64_t>(encoder, bytes_view_t{key.data(), key.size()})
          .value_or(0);
  spdlog::debug("Audit log holds {} event(s)", next_sequence_);
}

uint64_t audit_log::append(const ledger_event_t& event) {
  const auto sequence = next_sequence_ + staged_.size();
  staged_.push_back(event);
  flush();
  return sequence;
}

std::vector<ledger_event_t> audit_log::range(const uint64_t from,
                                             const uint64_t to) const {
  auto events = std::vector<ledger_event_t>{};
  auto encoder = encoding::scale_encoder_t{};
  for (auto sequence = from; sequence <= to && sequence < next_sequence_;
       ++sequence) {
    const auto key = make_indexed_key(kEventPrefix, sequence);
    auto event = storage_.get<ledger_event_t>(
        encoder, bytes_view_t{key.data(), key.size()});
    if (!event) {
      spdlog::warn("Audit entry {} is missing", sequence);
      continue;
    }
    events.push_back(std::move(*event));
  }
  return events;
}

uint64_t audit_log::size() const {
  return next_sequence_;
}

coffer::ledger::event_sink_t audit_log::sink() {
  return [this](const ledger_event_t& event) { staged_.push_back(event); };
}

std::size_t audit_log::staged() const {
  return staged_.size();
}

std::vector<coffer::storage::key_value_entry_t> audit_log::staged_entries()
    const {
  auto encoder = encoding::scale_encoder_t{};
  auto entries = std::vector<coffer::storage::key_value_entry_t>{};
  entries.reserve(staged_.size() + 1);
  auto sequence = next_sequence_;
  for (const auto& event : staged_) {
    entries.push_back(
        {make_indexed_key(kEventPrefix, sequence++), encoder.encode(event)});
  }
  entries.push_back({make_bytes(kAuditNextKey), encoder.encode(sequence)});
  return entries;
}

void audit_log::mark_committed() {
  for (const auto& event : staged_) {
    spdlog::debug("Recorded {} for vault {} as audit entry {}",
                  event_type(event), event_vault_id(event), next_sequence_);
    ++next_sequence_;
  }
  staged_.clear();
}

void audit_log::flush() {
  if (staged_.empty()) {
    return;
  }
  storage_.put_all(staged_entries());
  mark_committed();
}

}  // namespace coffer::persistence
