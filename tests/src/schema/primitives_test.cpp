#include <gtest/gtest.h>
#include <coffer/schema/ledger_error_code.hpp>
#include <coffer/schema/primitives.hpp>

#include <limits>
#include <string_view>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = coffer::schema::bytes_t(32, 0xAB);
  auto hash = coffer::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_accepts_prefixed_mixed_case_hex) {
  auto parsed = coffer::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191A1B1C1D1E1F20"});
  ASSERT_TRUE(parsed.has_value());
  const auto& hash = *parsed;
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
  EXPECT_EQ(coffer::schema::to_hex(hash),
            "0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(coffer::schema::try_make_hash32(std::string_view{"abcd"}));
  EXPECT_FALSE(coffer::schema::try_make_hash32(std::string_view{
      "zz02030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20"}));
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = coffer::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, try_make_amount_parses_decimal) {
  auto amount = coffer::schema::try_make_amount("1000000000000000000000");
  ASSERT_TRUE(amount.has_value());
  EXPECT_EQ(coffer::schema::to_string(*amount), "1000000000000000000000");
  EXPECT_EQ(coffer::schema::try_make_amount("0"), coffer::schema::amount_t{0});
}

TEST(primitives, try_make_amount_rejects_invalid_input) {
  EXPECT_FALSE(coffer::schema::try_make_amount(""));
  EXPECT_FALSE(coffer::schema::try_make_amount("-5"));
  EXPECT_FALSE(coffer::schema::try_make_amount("12a"));

  const auto max = std::numeric_limits<coffer::schema::amount_t>::max();
  auto text = coffer::schema::to_string(max);
  EXPECT_EQ(coffer::schema::try_make_amount(text), max);
  text.back() = static_cast<char>(text.back() + 1);
  EXPECT_FALSE(coffer::schema::try_make_amount(text));
}

TEST(ledger_error_code, names_are_stable) {
  using coffer::schema::ledger_error_code;
  EXPECT_EQ(coffer::schema::to_string(ledger_error_code::not_found),
            "not_found");
  EXPECT_EQ(coffer::schema::to_string(ledger_error_code::transfer_failed),
            "transfer_failed");
  EXPECT_EQ(
      coffer::schema::try_make_ledger_error_code("insufficient_balance"),
      ledger_error_code::insufficient_balance);
  EXPECT_FALSE(coffer::schema::try_make_ledger_error_code("bogus"));
  EXPECT_EQ(static_cast<uint32_t>(ledger_error_code::unauthorized), 2u);
  EXPECT_EQ(static_cast<uint32_t>(ledger_error_code::invalid_amount), 3u);
}
