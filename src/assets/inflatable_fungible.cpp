#include <schemata/assets/checks.hpp>
#include <schemata/assets/inflatable_fungible.hpp>
#include <schemata/iface/standard.hpp>
#include <schemata/programs/fungible_lib.hpp>
#include <schemata/programs/inflatable_lib.hpp>
#include <schemata/programs/util_lib.hpp>
#include <schemata/schema/amount.hpp>
#include <schemata/schema/asset_spec.hpp>

#include <limits>

using namespace schemata::schema;
using namespace schemata::contract;
using schemata::programs::error_code_t;

namespace schemata::assets {

namespace {

entry_point_t entry(const schemata::vm::lib_t& lib,
                    const std::string_view routine) {
  return entry_point_t{.lib = lib.name, .routine = std::string{routine}};
}

// Transfers reuse the fixed supply program; genesis and issue add the
// allowance bookkeeping.
schema_config_t config() {
  const auto& fungible = schemata::programs::fungible_lib();
  const auto& inflatable = schemata::programs::inflatable_lib();
  return schema_config_t{
      .name = std::string{inflatable_fungible::kName},
      .developer = std::string{kDeveloper},
      .timestamp = kSchemaTimestamp,
      .globals = {{kGsSpec, "RGBContract.AssetSpec"},
                  {kGsTerms, "RGBContract.ContractTerms"},
                  {kGsIssuedSupply, "RGBContract.Amount"},
                  {kGsMaxSupply, "RGBContract.Amount"}},
      .owned = {{kOsAsset, owned_state_kind_t::fungible},
                {kOsInflationAllowance, owned_state_kind_t::fungible}},
      .genesis = {.globals = {{kGsSpec, occurrences_t::once},
                              {kGsTerms, occurrences_t::once},
                              {kGsIssuedSupply, occurrences_t::once},
                              {kGsMaxSupply, occurrences_t::once}},
                  .assignments = {{kOsAsset, occurrences_t::once_or_more},
                                  {kOsInflationAllowance,
                                   occurrences_t::once_or_more}},
                  .validator = entry(inflatable, schemata::programs::kGenesis)},
      .transitions = {
          {.key = kTsTransfer,
           .inputs = {{kOsAsset, occurrences_t::once_or_more}},
           .assignments = {{kOsAsset, occurrences_t::once_or_more}},
           .validator = entry(fungible, schemata::programs::kTransfer)},
          {.key = kTsIssue,
           .globals = {{kGsIssuedSupply, occurrences_t::once}},
           .inputs = {{kOsInflationAllowance, occurrences_t::once_or_more}},
           .assignments = {{kOsAsset, occurrences_t::once_or_more},
                           {kOsInflationAllowance,
                            occurrences_t::once_or_more}},
           .validator = entry(inflatable, schemata::programs::kIssue)}}};
}

}  // namespace

inflatable_fungible::inflatable_fungible()
    : kit_{make_kit(config(),
                    {schemata::programs::util_lib(),
                     schemata::programs::fungible_lib(),
                     schemata::programs::inflatable_lib()},
                    schemata::iface::rgb20(standard_types(), true),
                    binding_fields_t{
                        .global_state = {{"spec", kGsSpec},
                                         {"terms", kGsTerms},
                                         {"issuedSupply", kGsIssuedSupply},
                                         {"maxSupply", kGsMaxSupply}},
                        .assignments = {{"assetOwner", kOsAsset},
                                        {"inflationAllowance",
                                         kOsInflationAllowance}},
                        .transitions = {{"transfer", kTsTransfer},
                                        {"issue", kTsIssue}},
                        .errors = {error_code_t::issued_mismatch,
                                   error_code_t::non_equal_amounts,
                                   error_code_t::inflation_mismatch,
                                   error_code_t::inflation_exceeds_allowance,
                                   error_code_t::amount_overflow},
                        .state_abi = util_state_abi()})} {}

issue_result_t inflatable_fungible::issue(
    const inflatable_fungible_params_t& params) const {
  if (auto error = check_ticker(params.ticker)) {
    return *error;
  }
  if (auto error = check_name(params.name)) {
    return *error;
  }
  if (auto error = check_details(params.details)) {
    return *error;
  }
  auto issued = total_supply(params.allocations);
  if (const auto* error = std::get_if<issue_error_t>(&issued)) {
    return *error;
  }
  auto allowed = total_supply(params.allowances);
  if (const auto* error = std::get_if<issue_error_t>(&allowed)) {
    return *error;
  }
  const auto supply = std::get<uint64_t>(issued);
  const auto allowance = std::get<uint64_t>(allowed);
  if (allowance > std::numeric_limits<uint64_t>::max() - supply) {
    return issue_error_t{.code = issue_error_code_t::supply_overflow,
                         .message = "max supply exceeds 2^64 - 1"};
  }

  auto builder = make_contract_builder(kit_, params.timestamp, params.issuer);
  builder
      .add_global_state("spec", asset_spec_t{.ticker = params.ticker,
                                             .name = params.name,
                                             .details = params.details,
                                             .precision = params.precision})
      .add_global_state("terms", params.terms)
      .add_global_state("issuedSupply", amount_t{.value = supply})
      .add_global_state("maxSupply", amount_t{.value = supply + allowance});
  for (const auto& allocation : params.allocations) {
    builder.add_fungible_state("assetOwner", allocation.seal, allocation.amount);
  }
  for (const auto& allocation : params.allowances) {
    builder.add_fungible_state("inflationAllowance", allocation.seal,
                               allocation.amount);
  }
  return finish_issue(kit_, builder);
}

}  // namespace schemata::assets
