#include <gtest/gtest.h>
#include <schemata/assets/fixed_fungible.hpp>
#include <schemata/schema/amount.hpp>
#include <schemata/schema/asset_spec.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/schema/owned_state.hpp>
#include <schemata/testing/assets.hpp>
#include <schemata/testing/contracts.hpp>

#include <cstddef>
#include <limits>

using namespace schemata::contract;
using namespace schemata::schema;
using schemata::assets::fixed_fungible;
using schemata::testing::error_of;
using schemata::testing::make_fixed_params;
using schemata::testing::make_seal;
using schemata::testing::unwrap;

namespace {

constexpr auto kSupply = uint64_t{100'000'000'000};

transition_t transfer(const fixed_fungible& asset,
                      const issued_contract_t& issued,
                      const std::vector<uint64_t>& amounts) {
  auto input = opout_t{.op = issued.contract_id, .type = kOsAsset, .index = 0};
  auto builder = schemata::assets::make_transition_builder(
      asset.kit(), issued.contract_id, "transfer");
  builder.add_input(input, outputs_of(issued.genesis).at(input));
  auto seed = uint8_t{10};
  for (auto amount : amounts) {
    builder.add_fungible_state("assetOwner", make_seal(seed++), amount);
  }
  return unwrap(builder.build());
}

validation_status_t check(const fixed_fungible& asset,
                          const issued_contract_t& issued,
                          const transition_t& transition) {
  return schemata::assets::make_validator(asset.kit())
      .validate_transition(transition, issued.contract_id,
                           outputs_of(issued.genesis));
}

void set_issued_supply(genesis_t& genesis, const uint64_t value) {
  auto encoder = encoding::scale_encoder_t{};
  genesis.globals[kGsIssuedSupply] = {encoder.encode(amount_t{.value = value})};
}

// Recommits allocation `index` to `value` under its own blinding, so the
// opening stays consistent and only the amount changes.
void set_allocation(genesis_t& genesis,
                    const size_t index,
                    const uint64_t value) {
  auto& state = std::get<fungible_state_t>(
      genesis.assignments.at(kOsAsset).at(index).state);
  state = make_fungible_state(value, state.revealed->blinding);
}

}  // namespace

TEST(fixed_fungible, issues_a_valid_genesis) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = fixed_fungible{};
  auto issued = unwrap(asset.issue(make_fixed_params({kSupply})));
  EXPECT_EQ(issued.genesis.schema_id, make_schema_id(asset.schema()));
  ASSERT_EQ(issued.genesis.assignments.at(kOsAsset).size(), 1u);
  const auto& state = std::get<fungible_state_t>(
      issued.genesis.assignments.at(kOsAsset)[0].state);
  ASSERT_TRUE(state.revealed.has_value());
  EXPECT_EQ(state.revealed->value, kSupply);

  auto encoder = encoding::scale_encoder_t{};
  auto supply = encoder.decode<amount_t>(
      issued.genesis.globals.at(kGsIssuedSupply).front());
  EXPECT_EQ(supply.value, kSupply);
}

TEST(fixed_fungible, split_transfer_is_valid) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = fixed_fungible{};
  auto issued = unwrap(asset.issue(make_fixed_params({kSupply})));
  auto transition = transfer(asset, issued, {60'000'000'000, 40'000'000'000});
  auto status = check(asset, issued, transition);
  EXPECT_TRUE(status.valid());
}

TEST(fixed_fungible, unbalanced_transfer_fails_with_non_equal_amounts) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = fixed_fungible{};
  auto issued = unwrap(asset.issue(make_fixed_params({kSupply})));
  auto transition = transfer(asset, issued, {60'000'000'000, 39'999'999'999});
  auto status = check(asset, issued, transition);
  EXPECT_FALSE(status.valid());
  EXPECT_TRUE(status.contains(failure_kind_t::script_failure));
  EXPECT_EQ(status.script_error(), std::string{"nonEqualAmounts"});
}

TEST(fixed_fungible, inflated_transfer_fails_with_non_equal_amounts) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = fixed_fungible{};
  auto issued = unwrap(asset.issue(make_fixed_params({kSupply})));
  auto transition = transfer(asset, issued, {60'000'000'000, 40'000'000'001});
  EXPECT_EQ(check(asset, issued, transition).script_error(),
            std::string{"nonEqualAmounts"});
}

TEST(fixed_fungible, genesis_supply_must_match_allocations) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = fixed_fungible{};
  auto issued =
      unwrap(asset.issue(make_fixed_params({60'000'000'000, 40'000'000'000})));
  auto validator = schemata::assets::make_validator(asset.kit());
  EXPECT_TRUE(validator.validate_genesis(issued.genesis).valid());

  for (auto declared : {kSupply - 1, kSupply + 1}) {
    auto genesis = issued.genesis;
    set_issued_supply(genesis, declared);
    auto status = validator.validate_genesis(genesis);
    EXPECT_EQ(status.script_error(), std::string{"issuedMismatch"})
        << declared;
  }

  for (auto index : {size_t{0}, size_t{1}}) {
    const auto amount = index == 0 ? uint64_t{60'000'000'000}
                                   : uint64_t{40'000'000'000};
    for (auto value : {amount - 1, amount + 1}) {
      auto genesis = issued.genesis;
      set_allocation(genesis, index, value);
      ASSERT_TRUE(opening_consistent(
          genesis.assignments.at(kOsAsset).at(index).state));
      auto status = validator.validate_genesis(genesis);
      EXPECT_FALSE(status.contains(failure_kind_t::commitment_mismatch));
      EXPECT_EQ(status.script_error(), std::string{"issuedMismatch"})
          << index << ' ' << value;
    }
  }
}

TEST(fixed_fungible, contract_id_is_deterministic) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = fixed_fungible{};
  auto first = unwrap(asset.issue(make_fixed_params({kSupply})));
  auto second = unwrap(asset.issue(make_fixed_params({kSupply})));
  EXPECT_EQ(first.contract_id, second.contract_id);

  auto later = make_fixed_params({kSupply});
  later.timestamp += 1;
  EXPECT_NE(unwrap(asset.issue(later)).contract_id, first.contract_id);
}

TEST(fixed_fungible, contract_id_ignores_revealed_openings) {
  SCHEMATA_REQUIRE_SECP256K1();
  auto asset = fixed_fungible{};
  auto issued = unwrap(asset.issue(make_fixed_params({kSupply})));
  auto concealed = issued.genesis;
  for (auto& [type, items] : concealed.assignments) {
    for (auto& item : items) {
      item.state = conceal(item.state);
    }
  }
  EXPECT_EQ(make_contract_id(concealed), issued.contract_id);
}

TEST(fixed_fungible, rejects_bad_parameters_before_validation) {
  auto asset = fixed_fungible{};

  auto lower = make_fixed_params({1});
  lower.ticker = "test";
  EXPECT_EQ(error_of(asset.issue(lower)), issue_error_code_t::invalid_ticker);

  auto long_ticker = make_fixed_params({1});
  long_ticker.ticker = "ABCDEFGHI";
  EXPECT_EQ(error_of(asset.issue(long_ticker)),
            issue_error_code_t::invalid_ticker);

  auto unnamed = make_fixed_params({1});
  unnamed.name.clear();
  EXPECT_EQ(error_of(asset.issue(unnamed)), issue_error_code_t::invalid_name);

  auto empty_details = make_fixed_params({1});
  empty_details.details = std::string{};
  EXPECT_EQ(error_of(asset.issue(empty_details)),
            issue_error_code_t::invalid_details);

  EXPECT_EQ(error_of(asset.issue(make_fixed_params({}))),
            issue_error_code_t::no_allocations);

  EXPECT_EQ(error_of(asset.issue(make_fixed_params(
                {std::numeric_limits<uint64_t>::max(), 1}))),
            issue_error_code_t::supply_overflow);
}

TEST(fixed_fungible, builder_rejects_unknown_fields_and_types) {
  auto asset = fixed_fungible{};
  auto unknown = schemata::assets::make_contract_builder(
                     asset.kit(), 1, std::string{schemata::assets::kDefaultIssuer})
                     .add_global_state("maxSupply", amount_t{.value = 1})
                     .issue_contract();
  EXPECT_EQ(error_of(unknown), issue_error_code_t::unknown_field);

  auto mistyped = schemata::assets::make_contract_builder(
                      asset.kit(), 1, std::string{schemata::assets::kDefaultIssuer})
                      .add_global_state("issuedSupply", schemata::testing::make_terms())
                      .issue_contract();
  EXPECT_EQ(error_of(mistyped), issue_error_code_t::type_mismatch);
}
