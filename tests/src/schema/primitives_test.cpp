#include <gtest/gtest.h>
#include <schemata/common/critical.hpp>
#include <schemata/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = schemata::schema::bytes_t(32, 0xAB);
  auto hash = schemata::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = schemata::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = schemata::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = schemata::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = schemata::schema::to_hex(payload);
  EXPECT_EQ(encoded, "010203feff");
  EXPECT_EQ(schemata::schema::from_hex(encoded), payload);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(schemata::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(schemata::schema::try_from_hex("zz").has_value());
  EXPECT_FALSE(schemata::schema::try_make_hash32("0102").has_value());
}

TEST(primitives, critical_formats_and_stops_the_process) {
  EXPECT_DEATH(schemata::common::critical("routine '{}' at {}", "sum", 3), "");
  EXPECT_DEATH(schemata::schema::make_hash32(schemata::schema::bytes_t(31)),
               "");
}
