#include <gtest/gtest.h>
#include <schemata/assets/inflatable_fungible.hpp>
#include <schemata/schema/amount.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/testing/assets.hpp>
#include <schemata/testing/contracts.hpp>

#include <limits>

using namespace schemata::contract;
using namespace schemata::schema;
using schemata::assets::inflatable_fungible;
using schemata::testing::error_of;
using schemata::testing::make_inflatable_params;
using schemata::testing::make_seal;
using schemata::testing::unwrap;

namespace {

constexpr auto kIssued = uint64_t{1'000'000};
constexpr auto kAllowance = uint64_t{500'000};

opout_t allowance_of(const issued_contract_t& issued) {
  return opout_t{.op = issued.contract_id,
                 .type = kOsInflationAllowance,
                 .index = 0};
}

// Issues `amount` against the genesis allowance and returns the remainder,
// possibly zero, to the allowance owner.
transition_t inflate(const inflatable_fungible& asset,
                     const issued_contract_t& issued,
                     const uint64_t amount,
                     const uint64_t remainder) {
  return unwrap(
      schemata::assets::make_transition_builder(asset.kit(),
                                                issued.contract_id, "issue")
          .add_input(allowance_of(issued),
                     outputs_of(issued.genesis).at(allowance_of(issued)))
          .add_global_state("issuedSupply", amount_t{.value = amount})
          .add_fungible_state("assetOwner", make_seal(20), amount)
          .add_fungible_state("inflationAllowance", make_seal(21), remainder)
          .build());
}

validation_status_t check(const inflatable_fungible& asset,
                          const issued_contract_t& issued,
                          const transition_t& transition) {
  return schemata::assets::make_validator(asset.kit())
      .validate_transition(transition, issued.contract_id,
                           outputs_of(issued.genesis));
}

}  // namespace

TEST(inflatable_fungible, genesis_declares_max_supply) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, kAllowance)));
  auto encoder = encoding::scale_encoder_t{};
  EXPECT_EQ(encoder.decode<amount_t>(issued.genesis.globals.at(kGsMaxSupply)[0])
                .value,
            kIssued + kAllowance);
  EXPECT_TRUE(schemata::assets::make_validator(asset.kit())
                  .validate_genesis(issued.genesis)
                  .valid());
}

TEST(inflatable_fungible, genesis_max_supply_must_cover_allowance) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, kAllowance)));
  auto genesis = issued.genesis;
  auto encoder = encoding::scale_encoder_t{};
  genesis.globals[kGsMaxSupply] = {
      encoder.encode(amount_t{.value = kIssued + kAllowance - 1})};
  auto status =
      schemata::assets::make_validator(asset.kit()).validate_genesis(genesis);
  EXPECT_EQ(status.script_error(), std::string{"inflationMismatch"});
}

TEST(inflatable_fungible, genesis_with_zero_allowance_is_valid) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, 0)));
  EXPECT_EQ(issued.genesis.assignments.at(kOsInflationAllowance).size(), 1u);
  EXPECT_TRUE(schemata::assets::make_validator(asset.kit())
                  .validate_genesis(issued.genesis)
                  .valid());
}

TEST(inflatable_fungible, genesis_requires_an_allowance_output) {
  auto asset = inflatable_fungible{};
  auto params = make_inflatable_params(kIssued, 0);
  params.allowances.clear();
  EXPECT_EQ(error_of(asset.issue(params)), issue_error_code_t::no_allocations);
}

TEST(inflatable_fungible, genesis_without_allowance_fails_occurrences) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, 0)));
  auto genesis = issued.genesis;
  genesis.assignments.erase(kOsInflationAllowance);
  auto status =
      schemata::assets::make_validator(asset.kit()).validate_genesis(genesis);
  EXPECT_TRUE(status.contains(failure_kind_t::assignment_occurrence));
}

TEST(inflatable_fungible, issue_below_allowance_is_valid) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, kAllowance)));
  auto transition = inflate(asset, issued, 200'000, 300'000);
  EXPECT_TRUE(check(asset, issued, transition).valid());
}

TEST(inflatable_fungible, issue_of_whole_allowance_is_valid) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, kAllowance)));
  auto transition = inflate(asset, issued, kAllowance, 0);
  EXPECT_TRUE(check(asset, issued, transition).valid());
}

TEST(inflatable_fungible, issue_without_allowance_output_fails_occurrences) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, kAllowance)));
  auto transition = inflate(asset, issued, kAllowance, 0);
  transition.assignments.erase(kOsInflationAllowance);
  EXPECT_TRUE(check(asset, issued, transition)
                  .contains(failure_kind_t::assignment_occurrence));
}

TEST(inflatable_fungible, issue_beyond_allowance_fails) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, kAllowance)));
  auto transition = inflate(asset, issued, kAllowance + 1, 0);
  auto status = check(asset, issued, transition);
  EXPECT_EQ(status.script_error(), std::string{"inflationExceedsAllowance"});
}

TEST(inflatable_fungible, issue_must_return_unused_allowance) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, kAllowance)));
  auto transition = inflate(asset, issued, 200'000, 299'999);
  EXPECT_EQ(check(asset, issued, transition).script_error(),
            std::string{"inflationMismatch"});
}

TEST(inflatable_fungible, issued_supply_must_match_new_outputs) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, kAllowance)));
  auto transition = inflate(asset, issued, 200'000, 300'000);
  auto encoder = encoding::scale_encoder_t{};
  transition.globals[kGsIssuedSupply] = {
      encoder.encode(amount_t{.value = 200'001})};
  EXPECT_EQ(check(asset, issued, transition).script_error(),
            std::string{"inflationMismatch"});
}

TEST(inflatable_fungible, transfer_reuses_fixed_supply_rules) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = inflatable_fungible{};
  auto issued = unwrap(asset.issue(make_inflatable_params(kIssued, kAllowance)));
  auto input = opout_t{.op = issued.contract_id, .type = kOsAsset, .index = 0};
  auto transition =
      unwrap(schemata::assets::make_transition_builder(
                 asset.kit(), issued.contract_id, "transfer")
                 .add_input(input, outputs_of(issued.genesis).at(input))
                 .add_fungible_state("assetOwner", make_seal(30), 600'000)
                 .add_fungible_state("assetOwner", make_seal(31), 400'000)
                 .build());
  EXPECT_TRUE(check(asset, issued, transition).valid());
}

TEST(inflatable_fungible, max_supply_overflow_is_rejected) {
  auto asset = inflatable_fungible{};
  auto params = make_inflatable_params(std::numeric_limits<uint64_t>::max(), 1);
  EXPECT_EQ(error_of(asset.issue(params)), issue_error_code_t::supply_overflow);
}
