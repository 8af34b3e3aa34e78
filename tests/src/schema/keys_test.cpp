#include <gtest/gtest.h>
#include <schemata/schema/keys.hpp>

#include <stdexcept>

using namespace schemata::schema;

static_assert(key_ranges_disjoint());
static_assert(kGsIssuedSupply.value == 2002);
static_assert(kOsInflationAllowance.value == 4200);

TEST(keys, families_own_their_registered_ranges) {
  EXPECT_TRUE(ranges_of(key_family_t::common).globals.contains(kGsSpec.value));
  EXPECT_TRUE(ranges_of(key_family_t::unique).globals.contains(kGsTokens.value));
  EXPECT_TRUE(
      ranges_of(key_family_t::inflatable).transitions.contains(kTsIssue.value));
  EXPECT_TRUE(
      ranges_of(key_family_t::collectible).globals.contains(kGsPrecision.value));
}

TEST(keys, constants_match_the_published_numbers) {
  EXPECT_EQ(kGsSpec.value, 2000);
  EXPECT_EQ(kGsTerms.value, 2001);
  EXPECT_EQ(kOsAsset.value, 4000);
  EXPECT_EQ(kTsTransfer.value, 10000);
  EXPECT_EQ(kGsMaxSupply.value, 2200);
  EXPECT_EQ(kTsIssue.value, 10200);
  EXPECT_EQ(kGsName.value, 3001);
}

TEST(keys, key_outside_family_range_throws) {
  EXPECT_THROW(make_global_key(key_family_t::common, 2100), std::out_of_range);
  EXPECT_THROW(make_assignment_key(key_family_t::unique, 4000),
               std::out_of_range);
  EXPECT_THROW(make_transition_key(key_family_t::collectible, 10200),
               std::out_of_range);
}

TEST(keys, typed_keys_order_by_value) {
  EXPECT_LT(kGsSpec, kGsTerms);
  EXPECT_EQ(make_global_key(key_family_t::common, 2002), kGsIssuedSupply);
}
