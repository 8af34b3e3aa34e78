#include <gtest/gtest.h>
#include <schemata/assets/asset_class.hpp>
#include <schemata/testing/assets.hpp>
#include <schemata/testing/contracts.hpp>

#include <set>

using namespace schemata::assets;
using schemata::contract::issue_error_code_t;
using schemata::testing::error_of;

TEST(asset_class, ships_four_classes_with_distinct_schemata) {
  auto classes = all_asset_classes();
  ASSERT_EQ(classes.size(), 4u);
  EXPECT_EQ(name_of(classes[0]), "NonInflatableAsset");
  EXPECT_EQ(name_of(classes[1]), "InflatableAsset");
  EXPECT_EQ(name_of(classes[2]), "CollectibleFungibleAsset");
  EXPECT_EQ(name_of(classes[3]), "UniqueDigitalAsset");

  auto ids = std::set<schemata::schema::schema_id_t>{};
  for (const auto& asset : classes) {
    ids.insert(schemata::schema::make_schema_id(kit_of(asset).schema));
  }
  EXPECT_EQ(ids.size(), 4u);
}

TEST(asset_class, schema_ids_are_stable_across_builds) {
  auto first = all_asset_classes();
  auto second = all_asset_classes();
  for (std::size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(schemata::schema::make_schema_id(kit_of(first[i]).schema),
              schemata::schema::make_schema_id(kit_of(second[i]).schema));
    EXPECT_EQ(schemata::schema::make_binding_id(kit_of(first[i]).binding),
              schemata::schema::make_binding_id(kit_of(second[i]).binding));
  }
}

TEST(asset_class, dispatches_matching_parameters) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = asset_class_t{fixed_fungible{}};
  auto result =
      issue(asset, issue_request_t{schemata::testing::make_fixed_params({10})});
  EXPECT_TRUE(std::holds_alternative<schemata::contract::issued_contract_t>(
      result));
}

TEST(asset_class, unique_token_needs_no_commitments) {
  auto asset = asset_class_t{unique_token{}};
  auto result =
      issue(asset, issue_request_t{schemata::testing::make_unique_params()});
  EXPECT_TRUE(std::holds_alternative<schemata::contract::issued_contract_t>(
      result));
}

TEST(asset_class, mismatched_parameters_are_rejected) {
  auto asset = asset_class_t{fixed_fungible{}};
  EXPECT_EQ(error_of(issue(asset, issue_request_t{
                                      schemata::testing::make_unique_params()})),
            issue_error_code_t::class_mismatch);
  auto inflatable = asset_class_t{inflatable_fungible{}};
  EXPECT_EQ(error_of(issue(inflatable,
                           issue_request_t{
                               schemata::testing::make_fixed_params({10})})),
            issue_error_code_t::class_mismatch);
}
