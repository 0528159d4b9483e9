#include <gtest/gtest.h>
#include <timelock/schema/encoding/scale/encoder.hpp>
#include <timelock/schema/key/keys.hpp>
#include <timelock/testing/common.hpp>

#include <algorithm>

namespace {

using encoder_t = timelock::schema::encoding::encoder<
    timelock::schema::encoding::scale_encoder_tag>;

bool starts_with(const timelock::schema::bytes_t& value,
                 const timelock::schema::bytes_t& prefix) {
  return value.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(value));
}

}  // namespace

TEST(keys, account_and_nonce_keys_live_in_separate_keyspaces) {
  auto encoder = encoder_t{};
  auto id = timelock::testing::make_hash(3);
  auto account_key = timelock::schema::key::make_account_key(encoder, id);
  auto nonce_key = timelock::schema::key::make_nonce_key(encoder, id);
  EXPECT_NE(account_key, nonce_key);
  EXPECT_TRUE(starts_with(account_key,
                          timelock::schema::key::make_prefix_key(
                              encoder, timelock::schema::key::kAccountKeyPrefix)));
  EXPECT_FALSE(starts_with(
      nonce_key, timelock::schema::key::make_prefix_key(
                     encoder, timelock::schema::key::kAccountKeyPrefix)));
}

TEST(keys, history_key_parses_back_to_height_and_index) {
  auto encoder = encoder_t{};
  auto key = timelock::schema::key::make_history_key(encoder, 42, 3);
  EXPECT_TRUE(starts_with(key,
                          timelock::schema::key::make_prefix_key(
                              encoder, timelock::schema::key::kHistoryPrefix)));

  auto parsed = timelock::schema::key::parse_history_key(
      encoder, timelock::schema::bytes_view_t{key.data(), key.size()});
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->first, 42u);
  EXPECT_EQ(parsed->second, 3u);
}

TEST(keys, parse_history_key_rejects_other_keyspaces) {
  auto encoder = encoder_t{};
  auto key = timelock::schema::key::make_account_key(
      encoder, timelock::testing::make_hash(1));
  EXPECT_FALSE(timelock::schema::key::parse_history_key(
                   encoder,
                   timelock::schema::bytes_view_t{key.data(), key.size()})
                   .has_value());
}

TEST(keys, history_keys_sort_in_block_order) {
  auto encoder = encoder_t{};
  auto key = [&](uint64_t height, uint32_t index) {
    return timelock::schema::key::make_history_key(encoder, height, index);
  };
  // Little-endian encodings would put height 256 before height 1.
  EXPECT_LT(key(1, 0), key(256, 0));
  EXPECT_LT(key(255, 7), key(256, 0));
  EXPECT_LT(key(256, 0), key(256, 1));
  EXPECT_LT(key(1, 256), key(2, 0));

  auto high = key(256, 0);
  auto parsed = timelock::schema::key::parse_history_key(
      encoder, timelock::schema::bytes_view_t{high.data(), high.size()});
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->first, 256u);
  EXPECT_EQ(parsed->second, 0u);

  high.push_back(0);
  EXPECT_FALSE(timelock::schema::key::parse_history_key(
                   encoder,
                   timelock::schema::bytes_view_t{high.data(), high.size()})
                   .has_value());
}
