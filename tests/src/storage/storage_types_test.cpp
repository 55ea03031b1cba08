#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/storage/rocksdb/storage.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = coffer::schema::encoding::scale_encoder_t;

struct storage_test : ::testing::Test {
  std::string db_path{coffer::testing::make_db_path("coffer_storage")};
  coffer::storage::storage<coffer::storage::rocksdb_storage_tag> storage{
      coffer::storage::make_storage<coffer::storage::rocksdb_storage_tag>(
          db_path)};

  ~storage_test() override {
    storage.database.reset();
    coffer::testing::remove_path(db_path);
  }
};

coffer::schema::bytes_view_t view(const coffer::schema::bytes_t& bytes) {
  return coffer::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = coffer::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.state_root, coffer::schema::make_zero_hash());

  auto entry = coffer::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST_F(storage_test, committed_state_round_trips) {
  EXPECT_FALSE(storage.load_committed_state().has_value());

  auto state = coffer::storage::committed_state{
      .height = 42, .state_root = coffer::testing::make_identity(10)};
  storage.save_committed_state(state);

  auto loaded = storage.load_committed_state();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->height, state.height);
  EXPECT_EQ(loaded->state_root, state.state_root);
}

TEST_F(storage_test, get_returns_nullopt_for_missing_key) {
  auto encoder = encoder_t{};
  auto key = coffer::schema::make_bytes(std::string_view{"missing"});
  EXPECT_FALSE(storage.get<uint64_t>(encoder, view(key)).has_value());

  storage.put(encoder, view(key), uint64_t{17});
  EXPECT_EQ(storage.get<uint64_t>(encoder, view(key)), uint64_t{17});
}

TEST_F(storage_test, replace_by_prefix_rewrites_selected_keyspace_only) {
  auto encoder = encoder_t{};
  auto a_prefix = coffer::schema::make_bytes(std::string_view{"A|"});
  auto b_prefix = coffer::schema::make_bytes(std::string_view{"B|"});

  auto a1 = coffer::schema::make_bytes(std::string_view{"A|one"});
  auto a2 = coffer::schema::make_bytes(std::string_view{"A|two"});
  auto b1 = coffer::schema::make_bytes(std::string_view{"B|one"});
  storage.put(encoder, view(a1), uint64_t{1});
  storage.put(encoder, view(a2), uint64_t{2});
  storage.put(encoder, view(b1), uint64_t{9});

  auto replacement = std::vector<coffer::storage::key_value_entry_t>{};
  auto a3 = coffer::schema::make_bytes(std::string_view{"A|three"});
  replacement.push_back({a3, encoder.encode(uint64_t{3})});
  storage.replace_by_prefix(view(a_prefix), replacement);

  auto a_rows = storage.list_by_prefix(view(a_prefix));
  ASSERT_EQ(a_rows.size(), 1u);
  EXPECT_EQ(a_rows[0].first, a3);
  auto a_value = encoder.try_decode<uint64_t>(view(a_rows[0].second));
  ASSERT_TRUE(a_value.has_value());
  EXPECT_EQ(a_value.value(), 3u);

  auto b_rows = storage.list_by_prefix(view(b_prefix));
  ASSERT_EQ(b_rows.size(), 1u);
  EXPECT_EQ(b_rows[0].first, b1);
  auto b_value = encoder.try_decode<uint64_t>(view(b_rows[0].second));
  ASSERT_TRUE(b_value.has_value());
  EXPECT_EQ(b_value.value(), 9u);
}

TEST_F(storage_test, commit_by_prefix_writes_rows_extras_and_state_together) {
  auto encoder = encoder_t{};
  auto rows_prefix = coffer::schema::make_bytes(std::string_view{"R|"});
  auto stale = coffer::schema::make_bytes(std::string_view{"R|stale"});
  storage.put(encoder, view(stale), uint64_t{1});
  storage.save_committed_state(coffer::storage::committed_state{.height = 4});

  auto fresh = coffer::schema::make_bytes(std::string_view{"R|fresh"});
  auto side = coffer::schema::make_bytes(std::string_view{"S|side"});
  auto root = coffer::testing::make_identity(7);
  storage.commit_by_prefix(
      view(rows_prefix), {{fresh, encoder.encode(uint64_t{2})}},
      {{side, encoder.encode(uint64_t{3})}},
      coffer::storage::committed_state{.height = 5, .state_root = root});

  auto rows = storage.list_by_prefix(view(rows_prefix));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].first, fresh);
  EXPECT_EQ(storage.get<uint64_t>(encoder, view(side)), uint64_t{3});

  auto committed = storage.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 5);
  EXPECT_EQ(committed->state_root, root);
}

TEST_F(storage_test, put_all_writes_every_entry) {
  auto encoder = encoder_t{};
  auto first = coffer::schema::make_bytes(std::string_view{"P|1"});
  auto second = coffer::schema::make_bytes(std::string_view{"P|2"});
  storage.put_all({{first, encoder.encode(uint64_t{10})},
                   {second, encoder.encode(uint64_t{20})}});

  EXPECT_EQ(storage.get<uint64_t>(encoder, view(first)), uint64_t{10});
  EXPECT_EQ(storage.get<uint64_t>(encoder, view(second)), uint64_t{20});
}
