#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/schema/ledger_event.hpp>
#include <coffer/schema/vault_state.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <variant>
#include <vector>

namespace {

using encoder_t = coffer::schema::encoding::scale_encoder_t;

}  // namespace

TEST(encoding, vault_state_decodes_to_same_fields) {
  auto encoder = encoder_t{};
  const auto vault = coffer::schema::vault_state_t{
      .id = 12,
      .owner = coffer::testing::make_identity(3),
      .balance = std::numeric_limits<coffer::schema::amount_t>::max() - 1};

  const auto encoded = encoder.encode(vault);
  const auto decoded = encoder.decode<coffer::schema::vault_state_t>(
      coffer::schema::bytes_view_t{encoded.data(), encoded.size()});

  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.id, vault.id);
  EXPECT_EQ(decoded.owner, vault.owner);
  EXPECT_EQ(decoded.balance, vault.balance);
}

TEST(encoding, event_variant_keeps_alternative) {
  auto encoder = encoder_t{};
  const auto event = coffer::schema::ledger_event_t{
      coffer::schema::vault_withdrawn_t{
          .vault_id = 4,
          .owner = coffer::testing::make_identity(9),
          .amount = 15}};

  const auto encoded = encoder.encode(event);
  const auto decoded = encoder.decode<coffer::schema::ledger_event_t>(
      coffer::schema::bytes_view_t{encoded.data(), encoded.size()});

  ASSERT_TRUE(std::holds_alternative<coffer::schema::vault_withdrawn_t>(decoded));
  const auto& withdrawn = std::get<coffer::schema::vault_withdrawn_t>(decoded);
  EXPECT_EQ(withdrawn.vault_id, 4u);
  EXPECT_EQ(withdrawn.owner, coffer::testing::make_identity(9));
  EXPECT_EQ(withdrawn.amount, 15);
  EXPECT_EQ(coffer::schema::event_type(decoded), "VaultWithdrawn");
}

TEST(encoding, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(coffer::schema::vault_state_t{.id = 1});
  encoded.resize(encoded.size() / 2);

  auto decoded = encoder.try_decode<coffer::schema::vault_state_t>(
      coffer::schema::bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_FALSE(decoded.has_value());
}
