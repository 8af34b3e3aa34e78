#include <gtest/gtest.h>
#include <schemata/assets/unique_token.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/testing/assets.hpp>
#include <schemata/testing/contracts.hpp>

using namespace schemata::contract;
using namespace schemata::schema;
using schemata::assets::unique_token;
using schemata::testing::error_of;
using schemata::testing::make_seal;
using schemata::testing::make_unique_params;
using schemata::testing::unwrap;

namespace {

validation_status_t transfer(const unique_token& asset,
                             const issued_contract_t& issued,
                             const allocation_t& allocation) {
  auto input = opout_t{.op = issued.contract_id, .type = kOsAsset, .index = 0};
  auto prior = outputs_of(issued.genesis);
  auto transition =
      unwrap(schemata::assets::make_transition_builder(
                 asset.kit(), issued.contract_id, "transfer")
                 .add_input(input, prior.at(input))
                 .add_structured_state("assetOwner", make_seal(7), allocation)
                 .build());
  return schemata::assets::make_validator(asset.kit())
      .validate_transition(transition, issued.contract_id, prior);
}

}  // namespace

TEST(unique_token, issues_a_valid_genesis) {
  auto asset = unique_token{};
  auto issued = unwrap(asset.issue(make_unique_params()));
  EXPECT_TRUE(schemata::assets::make_validator(asset.kit())
                  .validate_genesis(issued.genesis)
                  .valid());
  EXPECT_FALSE(issued.genesis.globals.contains(kGsAttachmentTypes));

  const auto& owned = issued.genesis.assignments.at(kOsAsset);
  ASSERT_EQ(owned.size(), 1u);
  const auto& data = std::get<structured_state_t>(owned[0].state).data;
  // u32 token index followed by the u64 fraction
  ASSERT_EQ(data.size(), 12u);
  EXPECT_EQ(data[0], 1);
  EXPECT_EQ(data[4], 1);
}

TEST(unique_token, attachment_types_are_optional) {
  auto asset = unique_token{};
  auto params = make_unique_params();
  params.attachment_type = attachment_type_t{.id = 0, .name = "preview"};
  auto issued = unwrap(asset.issue(params));
  EXPECT_EQ(issued.genesis.globals.at(kGsAttachmentTypes).size(), 1u);
  EXPECT_TRUE(schemata::assets::make_validator(asset.kit())
                  .validate_genesis(issued.genesis)
                  .valid());
}

TEST(unique_token, genesis_allocation_must_name_the_token) {
  auto asset = unique_token{};
  auto issued = unwrap(asset.issue(make_unique_params()));
  auto genesis = issued.genesis;
  auto encoder = encoding::scale_encoder_t{};
  genesis.assignments[kOsAsset][0].state = structured_state_t{
      .data = encoder.encode(allocation_t{.token_index = 2, .fraction = 1})};
  auto status =
      schemata::assets::make_validator(asset.kit()).validate_genesis(genesis);
  EXPECT_EQ(status.script_error(), std::string{"unknownToken"});
}

TEST(unique_token, whole_token_transfer_is_valid) {
  auto asset = unique_token{};
  auto issued = unwrap(asset.issue(make_unique_params()));
  EXPECT_TRUE(
      transfer(asset, issued, allocation_t{.token_index = 1, .fraction = 1})
          .valid());
}

TEST(unique_token, transfer_of_another_token_fails) {
  auto asset = unique_token{};
  auto issued = unwrap(asset.issue(make_unique_params()));
  auto status =
      transfer(asset, issued, allocation_t{.token_index = 2, .fraction = 1});
  EXPECT_EQ(status.script_error(), std::string{"unknownToken"});
}

TEST(unique_token, fractional_transfer_fails) {
  auto asset = unique_token{};
  auto issued = unwrap(asset.issue(make_unique_params()));
  auto status =
      transfer(asset, issued, allocation_t{.token_index = 1, .fraction = 2});
  EXPECT_EQ(status.script_error(), std::string{"nonFractionalToken"});
}

TEST(unique_token, rejects_inconsistent_parameters) {
  auto asset = unique_token{};

  auto mismatch = make_unique_params();
  mismatch.allocation.token_index = 3;
  EXPECT_EQ(error_of(asset.issue(mismatch)), issue_error_code_t::token_mismatch);

  auto fractional = make_unique_params();
  fractional.allocation.fraction = 0;
  EXPECT_EQ(error_of(asset.issue(fractional)),
            issue_error_code_t::fractional_token);
}

TEST(unique_token, fungible_state_is_a_type_mismatch) {
  auto asset = unique_token{};
  auto result = schemata::assets::make_contract_builder(
                    asset.kit(), 1, std::string{schemata::assets::kDefaultIssuer})
                    .add_fungible_state("assetOwner", make_seal(1), 1)
                    .issue_contract();
  EXPECT_EQ(error_of(result), issue_error_code_t::type_mismatch);
}
