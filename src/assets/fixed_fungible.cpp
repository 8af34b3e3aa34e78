#include <schemata/assets/checks.hpp>
#include <schemata/assets/fixed_fungible.hpp>
#include <schemata/iface/standard.hpp>
#include <schemata/programs/fungible_lib.hpp>
#include <schemata/programs/util_lib.hpp>
#include <schemata/schema/amount.hpp>
#include <schemata/schema/asset_spec.hpp>

using namespace schemata::schema;
using namespace schemata::contract;
using schemata::programs::error_code_t;

namespace schemata::assets {

namespace {

schema_config_t config() {
  const auto& lib = schemata::programs::fungible_lib();
  const auto genesis = entry_point_t{
      .lib = lib.name, .routine = std::string{schemata::programs::kGenesis}};
  const auto transfer = entry_point_t{
      .lib = lib.name, .routine = std::string{schemata::programs::kTransfer}};
  return schema_config_t{
      .name = std::string{fixed_fungible::kName},
      .developer = std::string{kDeveloper},
      .timestamp = kSchemaTimestamp,
      .globals = {{kGsSpec, "RGBContract.AssetSpec"},
                  {kGsTerms, "RGBContract.ContractTerms"},
                  {kGsIssuedSupply, "RGBContract.Amount"}},
      .owned = {{kOsAsset, owned_state_kind_t::fungible}},
      .genesis = {.globals = {{kGsSpec, occurrences_t::once},
                              {kGsTerms, occurrences_t::once},
                              {kGsIssuedSupply, occurrences_t::once}},
                  .assignments = {{kOsAsset, occurrences_t::once_or_more}},
                  .validator = genesis},
      .transitions = {{.key = kTsTransfer,
                       .inputs = {{kOsAsset, occurrences_t::once_or_more}},
                       .assignments = {{kOsAsset, occurrences_t::once_or_more}},
                       .validator = transfer}}};
}

}  // namespace

fixed_fungible::fixed_fungible()
    : kit_{make_kit(
          config(),
          {schemata::programs::util_lib(), schemata::programs::fungible_lib()},
          schemata::iface::rgb20(standard_types(), false),
          binding_fields_t{
              .global_state = {{"spec", kGsSpec},
                               {"terms", kGsTerms},
                               {"issuedSupply", kGsIssuedSupply}},
              .assignments = {{"assetOwner", kOsAsset}},
              .transitions = {{"transfer", kTsTransfer}},
              .errors = {error_code_t::issued_mismatch,
                         error_code_t::non_equal_amounts,
                         error_code_t::amount_overflow},
              .state_abi = util_state_abi()})} {}

issue_result_t fixed_fungible::issue(const fixed_fungible_params_t& params) const {
  if (auto error = check_ticker(params.ticker)) {
    return *error;
  }
  if (auto error = check_name(params.name)) {
    return *error;
  }
  if (auto error = check_details(params.details)) {
    return *error;
  }
  auto supply = total_supply(params.allocations);
  if (const auto* error = std::get_if<issue_error_t>(&supply)) {
    return *error;
  }

  auto builder = make_contract_builder(kit_, params.timestamp, params.issuer);
  builder
      .add_global_state("spec", asset_spec_t{.ticker = params.ticker,
                                             .name = params.name,
                                             .details = params.details,
                                             .precision = params.precision})
      .add_global_state("terms", params.terms)
      .add_global_state("issuedSupply",
                        amount_t{.value = std::get<uint64_t>(supply)});
  for (const auto& allocation : params.allocations) {
    builder.add_fungible_state("assetOwner", allocation.seal, allocation.amount);
  }
  return finish_issue(kit_, builder);
}

}  // namespace schemata::assets
