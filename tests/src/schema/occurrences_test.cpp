#include <gtest/gtest.h>
#include <schemata/schema/occurrences.hpp>

using namespace schemata::schema;

TEST(occurrences, once_requires_exactly_one) {
  EXPECT_FALSE(allows(occurrences_t::once, 0));
  EXPECT_TRUE(allows(occurrences_t::once, 1));
  EXPECT_FALSE(allows(occurrences_t::once, 2));
}

TEST(occurrences, none_or_once_accepts_zero_and_one) {
  EXPECT_TRUE(allows(occurrences_t::none_or_once, 0));
  EXPECT_TRUE(allows(occurrences_t::none_or_once, 1));
  EXPECT_FALSE(allows(occurrences_t::none_or_once, 2));
}

TEST(occurrences, open_ended_bounds) {
  EXPECT_FALSE(allows(occurrences_t::once_or_more, 0));
  EXPECT_TRUE(allows(occurrences_t::once_or_more, 1000));
  EXPECT_TRUE(allows(occurrences_t::none_or_more, 0));
  EXPECT_EQ(max_items(occurrences_t::none_or_more), 0xFFFF);
  EXPECT_FALSE(allows(occurrences_t::none_or_more, 0x10000));
}

TEST(occurrences, string_mappings_round_trip) {
  for (const auto& [name, value] : kOccurrencesMappings) {
    EXPECT_EQ(to_string(value), name);
    EXPECT_EQ(try_from_string<occurrences_t>(name), value);
  }
  EXPECT_FALSE(try_from_string<occurrences_t>("twice").has_value());
}

TEST(occurrences, unmapped_value_prints_fallback) {
  const auto stray = static_cast<occurrences_t>(9);
  EXPECT_EQ(to_string(stray), kUnknownName);
  EXPECT_EQ(to_string_or(stray, kOccurrencesMappings, "?"), "?");
  EXPECT_EQ(to_string_or(occurrences_t::once, kOccurrencesMappings, "?"),
            "once");
}
