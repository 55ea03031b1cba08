#pragma once

#include <coffer/ledger/collaborators.hpp>
#include <coffer/schema/ledger_event.hpp>
#include <coffer/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace coffer::testing {

inline coffer::schema::identity_t make_identity(const uint8_t seed) {
  auto out = coffer::schema::identity_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Collects every event delivered to the sink it hands out.
class recording_sink final {
 public:
  coffer::ledger::event_sink_t sink() {
    return [this](const coffer::schema::ledger_event_t& event) {
      events_.push_back(event);
    };
  }

  const std::vector<coffer::schema::ledger_event_t>& events() const {
    return events_;
  }

 private:
  std::vector<coffer::schema::ledger_event_t> events_;
};

/// Value-transfer primitive that records each release and answers with a
/// configurable outcome.
class recording_transfer final {
 public:
  struct release final {
    coffer::schema::identity_t recipient{};
    coffer::schema::amount_t amount;
  };

  coffer::ledger::value_transfer_t transfer() {
    return [this](const coffer::schema::identity_t& recipient,
                  const coffer::schema::amount_t& amount) {
      releases_.push_back(release{.recipient = recipient, .amount = amount});
      return succeed_;
    };
  }

  void set_succeed(const bool succeed) { succeed_ = succeed; }

  const std::vector<release>& releases() const { return releases_; }

 private:
  bool succeed_{true};
  std::vector<release> releases_;
};

}  // namespace coffer::testing
