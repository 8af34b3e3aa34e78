#include <schemata/assets/checks.hpp>
#include <schemata/assets/unique_token.hpp>
#include <schemata/iface/standard.hpp>
#include <schemata/programs/unique_lib.hpp>
#include <schemata/schema/asset_spec.hpp>

#include <fmt/format.h>

using namespace schemata::schema;
using namespace schemata::contract;
using schemata::programs::error_code_t;

namespace schemata::assets {

namespace {

schema_config_t config() {
  const auto& lib = schemata::programs::unique_lib();
  return schema_config_t{
      .name = std::string{unique_token::kName},
      .developer = std::string{kDeveloper},
      .timestamp = kSchemaTimestamp,
      .globals = {{kGsSpec, "RGBContract.AssetSpec"},
                  {kGsTerms, "RGBContract.ContractTerms"},
                  {kGsTokens, "RGB21.TokenData"},
                  {kGsAttachmentTypes, "RGB21.AttachmentType"}},
      .owned = {{kOsAsset, owned_state_kind_t::structured, "RGB21.Allocation"}},
      .genesis = {.globals = {{kGsSpec, occurrences_t::once},
                              {kGsTerms, occurrences_t::once},
                              {kGsTokens, occurrences_t::once},
                              {kGsAttachmentTypes, occurrences_t::none_or_once}},
                  .assignments = {{kOsAsset, occurrences_t::once}},
                  .validator = entry_point_t{
                      .lib = lib.name,
                      .routine = std::string{schemata::programs::kGenesis}}},
      .transitions = {{.key = kTsTransfer,
                       .inputs = {{kOsAsset, occurrences_t::once}},
                       .assignments = {{kOsAsset, occurrences_t::once}},
                       .validator = entry_point_t{
                           .lib = lib.name,
                           .routine = std::string{
                               schemata::programs::kTransfer}}}}};
}

}  // namespace

unique_token::unique_token()
    : kit_{make_kit(config(), {schemata::programs::unique_lib()},
                    schemata::iface::rgb21(standard_types()),
                    binding_fields_t{
                        .global_state = {{"spec", kGsSpec},
                                         {"terms", kGsTerms},
                                         {"tokens", kGsTokens},
                                         {"attachmentTypes",
                                          kGsAttachmentTypes}},
                        .assignments = {{"assetOwner", kOsAsset}},
                        .transitions = {{"transfer", kTsTransfer}},
                        .errors = {error_code_t::non_fractional_token,
                                   error_code_t::unknown_token}})} {}

issue_result_t unique_token::issue(const unique_token_params_t& params) const {
  if (auto error = check_ticker(params.ticker)) {
    return *error;
  }
  if (auto error = check_name(params.name)) {
    return *error;
  }
  if (auto error = check_details(params.details)) {
    return *error;
  }
  if (params.allocation.token_index != params.token.index) {
    return issue_error_t{
        .code = issue_error_code_t::token_mismatch,
        .message = fmt::format("allocation names token {}, contract declares {}",
                               params.allocation.token_index,
                               params.token.index)};
  }
  if (params.allocation.fraction != 1) {
    return issue_error_t{
        .code = issue_error_code_t::fractional_token,
        .message = fmt::format("allocated fraction is {}, must be 1",
                               params.allocation.fraction)};
  }

  auto builder = make_contract_builder(kit_, params.timestamp, params.issuer);
  builder
      .add_global_state("spec",
                        asset_spec_t{.ticker = params.ticker,
                                     .name = params.name,
                                     .details = params.details,
                                     .precision = precision_t::indivisible})
      .add_global_state("terms", params.terms)
      .add_global_state("tokens", params.token)
      .add_structured_state("assetOwner", params.owner, params.allocation);
  if (params.attachment_type) {
    builder.add_global_state("attachmentTypes", *params.attachment_type);
  }
  return finish_issue(kit_, builder);
}

}  // namespace schemata::assets
