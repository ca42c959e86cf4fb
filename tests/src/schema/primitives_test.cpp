#include <gtest/gtest.h>
#include <bounty/blake3/hash.hpp>
#include <bounty/schema/primitives.hpp>

#include <string>

TEST(primitives, to_hex_is_lowercase_without_prefix) {
  auto bytes = bounty::schema::bytes_t{0x00, 0x0A, 0xBC, 0xFF};
  EXPECT_EQ(bounty::schema::to_hex(bounty::schema::make_bytes_view(bytes)),
            "000abcff");
}

TEST(primitives, try_make_hash32_accepts_optional_prefix) {
  auto text = std::string{
      "0102030405060708090a0b0c0d0e0f10"
      "1112131415161718191A1B1C1D1E1F20"};
  auto hash = bounty::schema::try_make_hash32(text);
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_EQ(bounty::schema::try_make_hash32("0x" + text), hash);
  EXPECT_EQ(bounty::schema::to_hex(*hash), "0102030405060708090a0b0c0d0e0f10"
                                           "1112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_bad_input) {
  EXPECT_FALSE(bounty::schema::try_make_hash32("").has_value());
  EXPECT_FALSE(bounty::schema::try_make_hash32("abc").has_value());
  EXPECT_FALSE(
      bounty::schema::try_make_hash32(std::string(62, 'a')).has_value());
  EXPECT_FALSE(
      bounty::schema::try_make_hash32(std::string(64, 'g')).has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = bounty::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, string_byte_views_share_content) {
  auto text = std::string{"wager"};
  auto bytes = bounty::schema::make_bytes(text);
  EXPECT_EQ(bytes.size(), 5u);
  EXPECT_EQ(bounty::schema::make_string(bytes), text);
  EXPECT_EQ(bounty::schema::make_string_view(bytes), "wager");
}

TEST(blake3, empty_input_matches_reference_digest) {
  auto digest = bounty::blake3::hash(std::string_view{});
  EXPECT_EQ(bounty::schema::to_hex(digest),
            "af1349b9f5f9a1a6a0404dea36dcc949"
            "9bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3, string_and_byte_inputs_agree) {
  auto text = std::string_view{"dispute"};
  auto bytes = bounty::schema::make_bytes(text);
  EXPECT_EQ(bounty::blake3::hash(text),
            bounty::blake3::hash(bounty::schema::make_bytes_view(bytes)));
  EXPECT_NE(bounty::blake3::hash(text),
            bounty::blake3::hash(std::string_view{"disputes"}));
}
