#include <gtest/gtest.h>
#include <schemata/assets/fixed_fungible.hpp>
#include <schemata/schema/amount.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/testing/assets.hpp>
#include <schemata/testing/contracts.hpp>

using namespace schemata::contract;
using namespace schemata::schema;
using schemata::assets::fixed_fungible;
using schemata::testing::make_fixed_params;
using schemata::testing::make_seal;
using schemata::testing::unwrap;

namespace {

constexpr auto kSupply = uint64_t{100'000'000'000};

struct issued_asset final {
  fixed_fungible asset;
  issued_contract_t issued;
};

issued_asset issue_fixed() {
  auto asset = fixed_fungible{};
  auto issued = unwrap(asset.issue(make_fixed_params({kSupply})));
  return issued_asset{.asset = std::move(asset), .issued = std::move(issued)};
}

opout_t first_output(const contract_id_t& contract_id) {
  return opout_t{.op = contract_id, .type = kOsAsset, .index = 0};
}

}  // namespace

TEST(validator, issued_genesis_is_valid) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto [asset, issued] = issue_fixed();
  auto status = schemata::assets::make_validator(asset.kit())
                    .validate_genesis(issued.genesis);
  EXPECT_TRUE(status.valid());
  EXPECT_EQ(issued.contract_id, make_contract_id(issued.genesis));
}

TEST(validator, genesis_for_another_schema_is_rejected) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto [asset, issued] = issue_fixed();
  auto genesis = issued.genesis;
  genesis.schema_id = make_zero_hash();
  auto status =
      schemata::assets::make_validator(asset.kit()).validate_genesis(genesis);
  EXPECT_TRUE(status.contains(failure_kind_t::schema_mismatch));
}

TEST(validator, genesis_occurrences_are_enforced) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto [asset, issued] = issue_fixed();
  auto validator = schemata::assets::make_validator(asset.kit());

  auto missing = issued.genesis;
  missing.globals.erase(kGsTerms);
  missing.assignments.erase(kOsAsset);
  auto status = validator.validate_genesis(missing);
  EXPECT_TRUE(status.contains(failure_kind_t::global_occurrence));
  EXPECT_TRUE(status.contains(failure_kind_t::assignment_occurrence));
  // shape failures keep the program from running
  EXPECT_FALSE(status.contains(failure_kind_t::script_failure));

  auto doubled = issued.genesis;
  doubled.globals[kGsTerms].push_back(doubled.globals[kGsTerms].front());
  EXPECT_TRUE(validator.validate_genesis(doubled).contains(
      failure_kind_t::global_occurrence));

  auto foreign = issued.genesis;
  foreign.globals[kGsMaxSupply].push_back(bytes_t(8));
  EXPECT_TRUE(validator.validate_genesis(foreign).contains(
      failure_kind_t::unknown_global_type));
}

TEST(validator, structured_state_in_fungible_slot_is_rejected) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto [asset, issued] = issue_fixed();
  auto genesis = issued.genesis;
  genesis.assignments[kOsAsset][0].state = structured_state_t{.data = {1}};
  auto status =
      schemata::assets::make_validator(asset.kit()).validate_genesis(genesis);
  EXPECT_TRUE(status.contains(failure_kind_t::state_kind_mismatch));
}

TEST(validator, tampered_opening_is_a_commitment_mismatch) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto [asset, issued] = issue_fixed();
  auto genesis = issued.genesis;
  auto& state = std::get<fungible_state_t>(genesis.assignments[kOsAsset][0].state);
  state.revealed->value += 1;
  auto status =
      schemata::assets::make_validator(asset.kit()).validate_genesis(genesis);
  EXPECT_TRUE(status.contains(failure_kind_t::commitment_mismatch));
}

TEST(validator, unexpected_metadata_is_rejected) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto [asset, issued] = issue_fixed();
  auto genesis = issued.genesis;
  genesis.metadata = {0x01};
  auto status =
      schemata::assets::make_validator(asset.kit()).validate_genesis(genesis);
  EXPECT_TRUE(status.contains(failure_kind_t::metadata_mismatch));
}

TEST(validator, transition_inputs_must_be_known) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto [asset, issued] = issue_fixed();
  auto prior = outputs_of(issued.genesis);
  auto transition =
      unwrap(schemata::assets::make_transition_builder(
                 asset.kit(), issued.contract_id, "transfer")
                 .add_input(first_output(issued.contract_id),
                            prior.at(first_output(issued.contract_id)))
                 .add_fungible_state("assetOwner", make_seal(9), kSupply)
                 .build());
  auto validator = schemata::assets::make_validator(asset.kit());
  EXPECT_TRUE(
      validator.validate_transition(transition, issued.contract_id, prior)
          .valid());

  auto status = validator.validate_transition(transition, issued.contract_id, {});
  EXPECT_TRUE(status.contains(failure_kind_t::missing_input));
  EXPECT_TRUE(status.contains(failure_kind_t::input_occurrence));
}

TEST(validator, transition_of_another_contract_is_rejected) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto [asset, issued] = issue_fixed();
  auto prior = outputs_of(issued.genesis);
  auto transition =
      unwrap(schemata::assets::make_transition_builder(
                 asset.kit(), issued.contract_id, "transfer")
                 .add_input(first_output(issued.contract_id),
                            prior.at(first_output(issued.contract_id)))
                 .add_fungible_state("assetOwner", make_seal(9), kSupply)
                 .build());
  auto validator = schemata::assets::make_validator(asset.kit());
  auto status =
      validator.validate_transition(transition, make_zero_hash(), prior);
  EXPECT_TRUE(status.contains(failure_kind_t::contract_mismatch));

  transition.transition_type = kTsIssue;
  status = validator.validate_transition(transition, issued.contract_id, prior);
  EXPECT_TRUE(status.contains(failure_kind_t::unknown_transition_type));
}

TEST(validator, spending_an_input_twice_is_rejected) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto [asset, issued] = issue_fixed();
  auto prior = outputs_of(issued.genesis);
  auto transition =
      unwrap(schemata::assets::make_transition_builder(
                 asset.kit(), issued.contract_id, "transfer")
                 .add_input(first_output(issued.contract_id),
                            prior.at(first_output(issued.contract_id)))
                 .add_fungible_state("assetOwner", make_seal(9), kSupply)
                 .build());
  transition.inputs.push_back(transition.inputs.front());
  auto status = schemata::assets::make_validator(asset.kit())
                    .validate_transition(transition, issued.contract_id, prior);
  EXPECT_TRUE(status.contains(failure_kind_t::input_occurrence));
}
