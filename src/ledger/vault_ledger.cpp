#include <spdlog/spdlog.h>
#include <coffer/blake3/hash.hpp>
#include <coffer/ledger/vault_ledger.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>
#include <iterator>
#include <limits>
#include <span>
#include <utility>

using namespace coffer::schema;

namespace {

constexpr auto kCreateCodespace = std::string_view{"coffer.create"};
constexpr auto kDepositCodespace = std::string_view{"coffer.deposit"};
constexpr auto kWithdrawCodespace = std::string_view{"coffer.withdraw"};
constexpr auto kQueryCodespace = std::string_view{"coffer.query"};

std::string short_identity(const identity_t& identity) {
  return to_hex(std::span{identity}.first<4>());
}

}  // namespace

namespace coffer::ledger {

vault_ledger::vault_ledger(value_transfer_t transfer, event_sink_t sink)
    : transfer_{std::move(transfer)}, sink_{std::move(sink)} {}

template <typename Fn>
operation_result_t vault_ledger::run_operation(Fn&& fn) {
  auto lock = std::scoped_lock{mutex_};
  const auto queued = pending_events_.size();
  ++depth_;
  auto result = operation_result_t{};
  try {
    result = fn();
  } catch (...) {
    --depth_;
    if (depth_ == 0) {
      journal_.clear();
      // Events queued before this call belong to a batch being delivered.
      pending_events_.erase(
          std::next(std::begin(pending_events_),
                    static_cast<std::ptrdiff_t>(queued)),
          std::end(pending_events_));
    }
    throw;
  }
  --depth_;
  if (depth_ == 0) {
    finish_outermost();
  }
  return result;
}

operation_result_t vault_ledger::create_vault(const identity_t& caller) {
  return run_operation([&] {
    auto result = operation_result_t{};
    result.codespace = std::string{kCreateCodespace};

    const auto vault_id = static_cast<vault_id_t>(vaults_.size());
    vaults_.push_back(vault_state_t{.id = vault_id, .owner = caller});
    vaults_by_owner_[caller].push_back(vault_id);
    journal_.push_back(undo_append{.owner = caller});

    result.vault_id = vault_id;
    emit(vault_created_t{.vault_id = vault_id, .owner = caller}, result);
    spdlog::debug("Created vault {} for owner {}", vault_id,
                  short_identity(caller));
    return result;
  });
}

operation_result_t vault_ledger::deposit(const identity_t& caller,
                                         const vault_id_t vault_id,
                                         const amount_t& amount) {
  return run_operation([&] {
    auto result = check_owned(caller, vault_id, amount, kDepositCodespace);
    if (result.code != ledger_error_code::ok) {
      spdlog::debug("Rejected deposit into vault {}: {}", vault_id,
                    to_string(result.code));
      return result;
    }

    const auto previous = vaults_[vault_id].balance;
    if (previous > std::numeric_limits<amount_t>::max() - amount) {
      result.code = ledger_error_code::balance_overflow;
      result.log = "deposit would overflow vault balance";
      spdlog::debug("Rejected deposit into vault {}: {}", vault_id,
                    to_string(result.code));
      return result;
    }

    set_balance(vault_id, previous + amount);
    emit(vault_deposited_t{
             .vault_id = vault_id, .owner = caller, .amount = amount},
         result);
    spdlog::debug("Deposited {} into vault {}", to_string(amount), vault_id);
    return result;
  });
}

operation_result_t vault_ledger::withdraw(const identity_t& caller,
                                          const vault_id_t vault_id,
                                          const amount_t& amount) {
  return run_operation([&] {
    auto result = check_owned(caller, vault_id, amount, kWithdrawCodespace);
    if (result.code == ledger_error_code::ok &&
        amount > vaults_[vault_id].balance) {
      result.code = ledger_error_code::insufficient_balance;
      result.log = "amount exceeds vault balance";
    }
    if (result.code != ledger_error_code::ok) {
      spdlog::debug("Rejected withdrawal from vault {}: {}", vault_id,
                    to_string(result.code));
      return result;
    }

    const auto mark = make_checkpoint();
    // The balance must be debited before the transfer runs: a re-entrant call
    // from the recipient has to see the reduced balance.
    set_balance(vault_id, vaults_[vault_id].balance - amount);

    auto transfer = transfer_;
    auto delivered = false;
    if (transfer) {
      try {
        delivered = transfer(caller, amount);
      } catch (...) {
        rollback_to(mark);
        spdlog::warn("Transfer of {} from vault {} threw; withdrawal rolled back",
                     to_string(amount), vault_id);
        throw;
      }
    }
    if (!delivered) {
      rollback_to(mark);
      result.code = ledger_error_code::transfer_failed;
      result.log = transfer ? "value transfer to caller failed"
                            : "no value transfer primitive installed";
      spdlog::warn("Transfer of {} from vault {} failed; withdrawal rolled back",
                   to_string(amount), vault_id);
      return result;
    }

    emit(vault_withdrawn_t{
             .vault_id = vault_id, .owner = caller, .amount = amount},
         result);
    spdlog::debug("Withdrew {} from vault {}", to_string(amount), vault_id);
    return result;
  });
}

query_result_t vault_ledger::get_vault(const vault_id_t vault_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.codespace = std::string{kQueryCodespace};
  if (vault_id >= vaults_.size()) {
    result.code = ledger_error_code::not_found;
    result.log = "vault " + std::to_string(vault_id) + " does not exist";
    return result;
  }
  result.vault = vaults_[vault_id];
  return result;
}

uint64_t vault_ledger::vault_count() const {
  auto lock = std::scoped_lock{mutex_};
  return vaults_.size();
}

std::vector<vault_id_t> vault_ledger::vaults_owned_by(
    const identity_t& owner) const {
  auto lock = std::scoped_lock{mutex_};
  auto owned = vaults_by_owner_.find(owner);
  if (owned == std::end(vaults_by_owner_)) {
    return {};
  }
  return owned->second;
}

amount_t vault_ledger::total_balance() const {
  auto lock = std::scoped_lock{mutex_};
  auto total = amount_t{};
  for (const auto& vault : vaults_) {
    total += vault.balance;
  }
  return total;
}

hash32_t vault_ledger::state_root() const {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(vaults_);
  return coffer::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

std::vector<vault_state_t> vault_ledger::export_state() const {
  auto lock = std::scoped_lock{mutex_};
  return vaults_;
}

bool vault_ledger::load_state(std::vector<vault_state_t> vaults,
                              std::string& error) {
  auto lock = std::scoped_lock{mutex_};
  if (depth_ != 0) {
    error = "cannot load state while an operation is in progress";
    return false;
  }
  for (std::size_t i = 0; i < vaults.size(); ++i) {
    if (vaults[i].id != i) {
      error = "vault at position " + std::to_string(i) + " has id " +
              std::to_string(vaults[i].id);
      return false;
    }
  }

  auto by_owner = std::map<identity_t, std::vector<vault_id_t>>{};
  for (const auto& vault : vaults) {
    by_owner[vault.owner].push_back(vault.id);
  }
  vaults_ = std::move(vaults);
  vaults_by_owner_ = std::move(by_owner);
  spdlog::info("Loaded {} vault(s) across {} owner(s)", vaults_.size(),
               vaults_by_owner_.size());
  return true;
}

void vault_ledger::set_value_transfer(value_transfer_t transfer) {
  auto lock = std::scoped_lock{mutex_};
  transfer_ = std::move(transfer);
}

void vault_ledger::set_event_sink(event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  sink_ = std::move(sink);
}

operation_result_t vault_ledger::check_owned(const identity_t& caller,
                                             const vault_id_t vault_id,
                                             const amount_t& amount,
                                             const std::string_view codespace)
    const {
  auto result = operation_result_t{};
  result.codespace = std::string{codespace};
  if (vault_id >= vaults_.size()) {
    result.code = ledger_error_code::not_found;
    result.log = "vault " + std::to_string(vault_id) + " does not exist";
  } else if (vaults_[vault_id].owner != caller) {
    result.code = ledger_error_code::unauthorized;
    result.log = "caller does not own vault " + std::to_string(vault_id);
  } else if (amount == 0) {
    result.code = ledger_error_code::invalid_amount;
    result.log = "amount must be positive";
  }
  return result;
}

void vault_ledger::set_balance(const vault_id_t vault_id,
                               const amount_t& balance) {
  journal_.push_back(
      undo_balance{.vault_id = vault_id, .previous = vaults_[vault_id].balance});
  vaults_[vault_id].balance = balance;
}

void vault_ledger::emit(ledger_event_t event, operation_result_t& result) {
  result.events.push_back(event);
  pending_events_.push_back(std::move(event));
}

vault_ledger::checkpoint vault_ledger::make_checkpoint() const {
  return checkpoint{.journal_size = journal_.size(),
                    .pending_events = pending_events_.size()};
}

void vault_ledger::rollback_to(const checkpoint& mark) {
  while (journal_.size() > mark.journal_size) {
    std::visit(
        overloaded{[&](const undo_append& entry) {
                     vaults_.pop_back();
                     auto owned = vaults_by_owner_.find(entry.owner);
                     owned->second.pop_back();
                     if (owned->second.empty()) {
                       vaults_by_owner_.erase(owned);
                     }
                   },
                   [&](const undo_balance& entry) {
                     vaults_[entry.vault_id].balance = entry.previous;
                   }},
        journal_.back());
    journal_.pop_back();
  }
  pending_events_.erase(
      std::next(std::begin(pending_events_),
                static_cast<std::ptrdiff_t>(mark.pending_events)),
      std::end(pending_events_));
}

void vault_ledger::finish_outermost() {
  journal_.clear();
  if (delivering_) {
    // A sink re-entered the ledger; the delivery loop below picks these up
    // after the events already queued.
    return;
  }
  if (!sink_) {
    pending_events_.clear();
    return;
  }

  auto sink = sink_;
  delivering_ = true;
  auto next = std::size_t{};
  try {
    while (next < pending_events_.size()) {
      auto event = pending_events_[next++];
      sink(event);
    }
  } catch (...) {
    spdlog::error("Event sink threw on event {} of {}; dropping the rest",
                  next, pending_events_.size());
    pending_events_.clear();
    delivering_ = false;
    throw;
  }
  pending_events_.clear();
  delivering_ = false;
}

}  // namespace coffer::ledger
