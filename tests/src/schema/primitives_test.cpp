#include <gtest/gtest.h>
#include <timelock/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, make_hash32_from_bytes_copies_input) {
  auto input = timelock::schema::bytes_t(32, 0xAB);
  auto hash = timelock::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_accepts_prefixed_hex) {
  auto hash = timelock::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(
      timelock::schema::try_make_hash32(std::string_view{"0102"}).has_value());
  auto short_bytes = timelock::schema::bytes_t(31, 0x00);
  EXPECT_FALSE(timelock::schema::try_make_hash32(
                   timelock::schema::bytes_view_t{short_bytes.data(),
                                                  short_bytes.size()})
                   .has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = timelock::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_round_trips_and_rejects_garbage) {
  auto payload = timelock::schema::bytes_t{0x00, 0x7F, 0x80, 0xFF};
  auto hex = timelock::schema::to_hex(payload);
  EXPECT_EQ(hex, "007f80ff");
  EXPECT_EQ(timelock::schema::from_hex(hex), payload);
  EXPECT_FALSE(timelock::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(timelock::schema::try_from_hex("zz").has_value());
}

TEST(primitives, base64_round_trips_bytes) {
  auto payload = timelock::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = timelock::schema::to_base64(payload);
  auto decoded = timelock::schema::from_base64(encoded);
  EXPECT_EQ(decoded, payload);
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  auto decoded = timelock::schema::try_from_base64("not base64***");
  EXPECT_FALSE(decoded.has_value());
}

TEST(primitives, make_tag_left_aligns_and_truncates) {
  auto rent = timelock::schema::make_tag("Rent");
  EXPECT_EQ(rent[0], 'R');
  EXPECT_EQ(rent[3], 't');
  EXPECT_EQ(rent[4], 0u);
  EXPECT_EQ(rent[31], 0u);

  auto long_label = std::string(40, 'x');
  auto truncated = timelock::schema::make_tag(long_label);
  EXPECT_EQ(truncated[31], 'x');
}
