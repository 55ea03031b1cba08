#pragma once

#include <coffer/ledger/collaborators.hpp>
#include <coffer/schema/ledger_event.hpp>
#include <coffer/schema/operation_result.hpp>
#include <coffer/schema/primitives.hpp>
#include <coffer/schema/query_result.hpp>
#include <coffer/schema/vault_state.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coffer::ledger {

/// Multi-tenant balance ledger.
///
/// Holds every vault in an append-only sequence indexed by id, plus an
/// owner -> ids index kept in step with every insert. Mutations are gated to
/// the vault owner; the caller identity is always an explicit argument.
///
/// Withdrawals decrement the balance before invoking the value-transfer
/// primitive. The primitive may re-enter the ledger on the same thread; a
/// nested call therefore observes the decremented balance. If the transfer
/// fails, every mutation made since the withdrawal began (nested ones
/// included) is undone from the journal and the withdrawal has no effect.
///
/// Events are delivered to the sink after the outermost operation completes,
/// in emission order. A sink may call back into the ledger; events of such
/// calls are queued behind the batch being delivered. If the sink throws, the
/// state change stands, the undelivered remainder of the batch is dropped and
/// the exception propagates to the caller of the outermost operation.
class vault_ledger final {
 public:
  explicit vault_ledger(value_transfer_t transfer = {},
                        event_sink_t sink = {});

  vault_ledger(const vault_ledger&) = delete;
  vault_ledger& operator=(const vault_ledger&) = delete;

  /// Open a vault owned by `caller`. The result carries the assigned id.
  coffer::schema::operation_result_t create_vault(
      const coffer::schema::identity_t& caller);

  /// Credit `amount` to a vault owned by `caller`.
  coffer::schema::operation_result_t deposit(
      const coffer::schema::identity_t& caller,
      coffer::schema::vault_id_t vault_id,
      const coffer::schema::amount_t& amount);

  /// Debit `amount` from a vault owned by `caller` and release it to `caller`
  /// through the value-transfer primitive.
  coffer::schema::operation_result_t withdraw(
      const coffer::schema::identity_t& caller,
      coffer::schema::vault_id_t vault_id,
      const coffer::schema::amount_t& amount);

  coffer::schema::query_result_t get_vault(
      coffer::schema::vault_id_t vault_id) const;

  uint64_t vault_count() const;

  /// Ids owned by `owner` in creation order; empty when it owns none.
  std::vector<coffer::schema::vault_id_t> vaults_owned_by(
      const coffer::schema::identity_t& owner) const;

  /// Sum of all balances, i.e. the value held in custody.
  coffer::schema::amount_t total_balance() const;

  /// BLAKE3 of the SCALE-encoded vault sequence.
  coffer::schema::hash32_t state_root() const;

  std::vector<coffer::schema::vault_state_t> export_state() const;

  /// Replace the ledger contents and rebuild the owner index.
  ///
  /// Ids must be dense and in order. On failure the ledger is unchanged and
  /// `error` holds the reason.
  bool load_state(std::vector<coffer::schema::vault_state_t> vaults,
                  std::string& error);

  void set_value_transfer(value_transfer_t transfer);
  void set_event_sink(event_sink_t sink);

 private:
  struct undo_append final {
    coffer::schema::identity_t owner;
  };
  struct undo_balance final {
    coffer::schema::vault_id_t vault_id{};
    coffer::schema::amount_t previous;
  };
  using undo_entry_t = std::variant<undo_append, undo_balance>;

  struct checkpoint final {
    std::size_t journal_size{};
    std::size_t pending_events{};
  };

  /// Run one operation under the lock and deliver staged events once the
  /// outermost operation returns.
  template <typename Fn>
  coffer::schema::operation_result_t run_operation(Fn&& fn);

  coffer::schema::operation_result_t check_owned(
      const coffer::schema::identity_t& caller,
      coffer::schema::vault_id_t vault_id,
      const coffer::schema::amount_t& amount,
      std::string_view codespace) const;

  void set_balance(coffer::schema::vault_id_t vault_id,
                   const coffer::schema::amount_t& balance);
  void emit(coffer::schema::ledger_event_t event,
            coffer::schema::operation_result_t& result);
  checkpoint make_checkpoint() const;
  void rollback_to(const checkpoint& mark);
  void finish_outermost();

  mutable std::recursive_mutex mutex_;
  std::vector<coffer::schema::vault_state_t> vaults_;
  std::map<coffer::schema::identity_t, std::vector<coffer::schema::vault_id_t>>
      vaults_by_owner_;
  value_transfer_t transfer_;
  event_sink_t sink_;
  uint32_t depth_{};
  bool delivering_{};
  std::vector<undo_entry_t> journal_;
  std::vector<coffer::schema::ledger_event_t> pending_events_;
};

}  // namespace coffer::ledger
