#include <gtest/gtest.h>
#include <schemata/assets/collectible_fungible.hpp>
#include <schemata/schema/asset_text.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/testing/assets.hpp>
#include <schemata/testing/contracts.hpp>

using namespace schemata::contract;
using namespace schemata::schema;
using schemata::assets::collectible_fungible;
using schemata::testing::error_of;
using schemata::testing::make_seal;
using schemata::testing::unwrap;

namespace {

schemata::assets::collectible_fungible_params_t make_params() {
  return schemata::assets::collectible_fungible_params_t{
      .name = "Collectible",
      .article = "The",
      .precision = precision_t::centi,
      .terms = schemata::testing::make_terms(),
      .allocations = {{.seal = make_seal(1), .amount = 700},
                      {.seal = make_seal(2), .amount = 300}},
      .timestamp = schemata::testing::kTimestamp};
}

}  // namespace

TEST(collectible_fungible, issues_a_valid_genesis) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = collectible_fungible{};
  auto issued = unwrap(asset.issue(make_params()));
  EXPECT_TRUE(schemata::assets::make_validator(asset.kit())
                  .validate_genesis(issued.genesis)
                  .valid());

  auto encoder = encoding::scale_encoder_t{};
  EXPECT_EQ(encoder.decode<asset_name_t>(issued.genesis.globals.at(kGsName)[0])
                .value,
            "Collectible");
  EXPECT_TRUE(issued.genesis.globals.contains(kGsArticle));
  EXPECT_FALSE(issued.genesis.globals.contains(kGsDetails));
}

TEST(collectible_fungible, transfer_conserves_amounts) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = collectible_fungible{};
  auto issued = unwrap(asset.issue(make_params()));
  auto prior = outputs_of(issued.genesis);
  auto first = opout_t{.op = issued.contract_id, .type = kOsAsset, .index = 0};
  auto second = opout_t{.op = issued.contract_id, .type = kOsAsset, .index = 1};
  auto validator = schemata::assets::make_validator(asset.kit());

  auto merged = unwrap(schemata::assets::make_transition_builder(
                           asset.kit(), issued.contract_id, "transfer")
                           .add_input(first, prior.at(first))
                           .add_input(second, prior.at(second))
                           .add_fungible_state("assetOwner", make_seal(5), 1000)
                           .build());
  EXPECT_TRUE(
      validator.validate_transition(merged, issued.contract_id, prior).valid());

  auto short_changed =
      unwrap(schemata::assets::make_transition_builder(
                 asset.kit(), issued.contract_id, "transfer")
                 .add_input(first, prior.at(first))
                 .add_input(second, prior.at(second))
                 .add_fungible_state("assetOwner", make_seal(5), 999)
                 .build());
  EXPECT_EQ(
      validator.validate_transition(short_changed, issued.contract_id, prior)
          .script_error(),
      std::string{"nonEqualAmounts"});
}

TEST(collectible_fungible, rejects_bad_article) {
  auto asset = collectible_fungible{};
  auto params = make_params();
  params.article = std::string{};
  EXPECT_EQ(error_of(asset.issue(params)), issue_error_code_t::invalid_name);
}

TEST(collectible_fungible, builder_refuses_a_spent_input_twice) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = collectible_fungible{};
  auto issued = unwrap(asset.issue(make_params()));
  auto prior = outputs_of(issued.genesis);
  auto first = opout_t{.op = issued.contract_id, .type = kOsAsset, .index = 0};
  auto result = schemata::assets::make_transition_builder(
                    asset.kit(), issued.contract_id, "transfer")
                    .add_input(first, prior.at(first))
                    .add_input(first, prior.at(first))
                    .build();
  ASSERT_TRUE(std::holds_alternative<issue_error_t>(result));
  EXPECT_EQ(std::get<issue_error_t>(result).code,
            issue_error_code_t::invalid_state);
}

TEST(collectible_fungible, builder_refuses_concealed_input) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = collectible_fungible{};
  auto issued = unwrap(asset.issue(make_params()));
  auto prior = outputs_of(issued.genesis);
  auto first = opout_t{.op = issued.contract_id, .type = kOsAsset, .index = 0};
  auto concealed = prior.at(first);
  concealed.state = conceal(concealed.state);
  auto result = schemata::assets::make_transition_builder(
                    asset.kit(), issued.contract_id, "transfer")
                    .add_input(first, concealed)
                    .add_fungible_state("assetOwner", make_seal(5), 700)
                    .build();
  ASSERT_TRUE(std::holds_alternative<issue_error_t>(result));
  EXPECT_EQ(std::get<issue_error_t>(result).code,
            issue_error_code_t::invalid_state);
}

TEST(collectible_fungible, unknown_transition_name_is_rejected) {
  auto asset = collectible_fungible{};
  auto result = schemata::assets::make_transition_builder(
                    asset.kit(), make_zero_hash(), "issue")
                    .build();
  ASSERT_TRUE(std::holds_alternative<issue_error_t>(result));
  EXPECT_EQ(std::get<issue_error_t>(result).code,
            issue_error_code_t::unknown_field);
}
