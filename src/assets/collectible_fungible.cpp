#include <schemata/assets/checks.hpp>
#include <schemata/assets/collectible_fungible.hpp>
#include <schemata/iface/standard.hpp>
#include <schemata/programs/fungible_lib.hpp>
#include <schemata/programs/util_lib.hpp>
#include <schemata/schema/amount.hpp>
#include <schemata/schema/asset_text.hpp>

using namespace schemata::schema;
using namespace schemata::contract;
using schemata::programs::error_code_t;

namespace schemata::assets {

namespace {

schema_config_t config() {
  const auto& lib = schemata::programs::fungible_lib();
  return schema_config_t{
      .name = std::string{collectible_fungible::kName},
      .developer = std::string{kDeveloper},
      .timestamp = kSchemaTimestamp,
      .globals = {{kGsArticle, "RGBContract.Article"},
                  {kGsName, "RGBContract.Name"},
                  {kGsDetails, "RGBContract.Details"},
                  {kGsPrecision, "RGBContract.Precision"},
                  {kGsTerms, "RGBContract.ContractTerms"},
                  {kGsIssuedSupply, "RGBContract.Amount"}},
      .owned = {{kOsAsset, owned_state_kind_t::fungible}},
      .genesis = {.globals = {{kGsArticle, occurrences_t::none_or_once},
                              {kGsName, occurrences_t::once},
                              {kGsDetails, occurrences_t::none_or_once},
                              {kGsPrecision, occurrences_t::once},
                              {kGsTerms, occurrences_t::once},
                              {kGsIssuedSupply, occurrences_t::once}},
                  .assignments = {{kOsAsset, occurrences_t::once_or_more}},
                  .validator = entry_point_t{
                      .lib = lib.name,
                      .routine = std::string{schemata::programs::kGenesis}}},
      .transitions = {{.key = kTsTransfer,
                       .inputs = {{kOsAsset, occurrences_t::once_or_more}},
                       .assignments = {{kOsAsset, occurrences_t::once_or_more}},
                       .validator = entry_point_t{
                           .lib = lib.name,
                           .routine = std::string{
                               schemata::programs::kTransfer}}}}};
}

}  // namespace

collectible_fungible::collectible_fungible()
    : kit_{make_kit(config(),
                    {schemata::programs::util_lib(),
                     schemata::programs::fungible_lib()},
                    schemata::iface::rgb25(standard_types()),
                    binding_fields_t{
                        .global_state = {{"article", kGsArticle},
                                         {"name", kGsName},
                                         {"details", kGsDetails},
                                         {"precision", kGsPrecision},
                                         {"terms", kGsTerms},
                                         {"issuedSupply", kGsIssuedSupply}},
                        .assignments = {{"assetOwner", kOsAsset}},
                        .transitions = {{"transfer", kTsTransfer}},
                        .errors = {error_code_t::issued_mismatch,
                                   error_code_t::non_equal_amounts,
                                   error_code_t::amount_overflow},
                        .state_abi = util_state_abi()})} {}

issue_result_t collectible_fungible::issue(
    const collectible_fungible_params_t& params) const {
  if (auto error = check_name(params.name)) {
    return *error;
  }
  if (auto error = check_details(params.details)) {
    return *error;
  }
  if (params.article) {
    if (auto error = check_name(*params.article)) {
      return *error;
    }
  }
  auto supply = total_supply(params.allocations);
  if (const auto* error = std::get_if<issue_error_t>(&supply)) {
    return *error;
  }

  auto builder = make_contract_builder(kit_, params.timestamp, params.issuer);
  builder.add_global_state("name", asset_name_t{.value = params.name})
      .add_global_state("precision", params.precision)
      .add_global_state("terms", params.terms)
      .add_global_state("issuedSupply",
                        amount_t{.value = std::get<uint64_t>(supply)});
  if (params.details) {
    builder.add_global_state("details",
                             asset_details_t{.value = *params.details});
  }
  if (params.article) {
    builder.add_global_state("article", article_t{.value = *params.article});
  }
  for (const auto& allocation : params.allocations) {
    builder.add_fungible_state("assetOwner", allocation.seal, allocation.amount);
  }
  return finish_issue(kit_, builder);
}

}  // namespace schemata::assets
