#pragma once

#include <coffer/schema/ledger_event.hpp>
#include <coffer/schema/primitives.hpp>
#include <functional>

namespace coffer::ledger {

/// Move `amount` out of ledger custody to `recipient`. Returns false when the
/// transfer did not happen. May synchronously call back into the ledger.
using value_transfer_t =
    std::function<bool(const coffer::schema::identity_t& recipient,
                       const coffer::schema::amount_t& amount)>;

/// Receives events of successfully completed operations, in order. May call
/// back into the ledger; a throw drops the rest of the current batch.
using event_sink_t =
    std::function<void(const coffer::schema::ledger_event_t& event)>;

}  // namespace coffer::ledger
