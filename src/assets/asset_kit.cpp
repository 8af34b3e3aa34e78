#include <schemata/assets/asset_kit.hpp>
#include <schemata/common/critical.hpp>
#include <schemata/iface/conformance.hpp>
#include <schemata/programs/util_lib.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace schemata::schema;
using namespace schemata::contract;

namespace schemata::assets {

asset_kit_t make_kit(const schema_config_t& config,
                     std::vector<schemata::vm::lib_t> scripts,
                     interface_t iface,
                     binding_fields_t fields) {
  auto kit = asset_kit_t{.types = standard_types(),
                         .scripts = std::move(scripts),
                         .iface = std::move(iface)};
  kit.schema = schema_builder{kit.types, kit.scripts}.build(config);

  auto& binding = kit.binding;
  binding.schema_id = make_schema_id(kit.schema);
  binding.iface_id = make_iface_id(kit.iface);
  binding.timestamp = config.timestamp;
  binding.developer = config.developer;
  binding.global_state = std::move(fields.global_state);
  binding.assignments = std::move(fields.assignments);
  binding.transitions = std::move(fields.transitions);
  for (auto code : fields.errors) {
    binding.errors.push_back(
        named_variant_t{.code = schemata::programs::code_of(code),
                        .name = std::string{schemata::programs::to_string(code)}});
  }
  binding.state_abi = fields.state_abi;

  if (auto mismatch = schemata::iface::check_conformance(
          kit.iface, kit.binding, kit.schema, kit.scripts)) {
    schemata::common::critical("'{}' does not implement '{}' ({} mismatches)",
                               kit.schema.name, kit.iface.name,
                               mismatch->mismatches.size());
  }
  spdlog::debug("asset class '{}' bound to '{}'", kit.schema.name,
                kit.iface.name);
  return kit;
}

state_abi_t util_state_abi() {
  const auto& util = schemata::programs::util_lib();
  return state_abi_t{
      .reg_input = schemata::vm::make_site(util, schemata::programs::kSumInputs),
      .reg_output =
          schemata::vm::make_site(util, schemata::programs::kSumOutputs),
      .calc_output =
          schemata::vm::make_site(util, schemata::programs::kSumOutputs),
      .calc_change =
          schemata::vm::make_site(util, schemata::programs::kCalcChange)};
}

contract_builder make_contract_builder(const asset_kit_t& kit,
                                       const timestamp_t timestamp,
                                       std::string issuer) {
  auto builder = contract_builder{kit.schema, kit.binding, kit.types};
  builder.set_timestamp(timestamp).set_issuer(std::move(issuer));
  return builder;
}

transition_builder make_transition_builder(
    const asset_kit_t& kit,
    const contract_id_t& contract_id,
    const std::string_view transition_name) {
  return transition_builder{kit.schema, kit.binding, kit.types, contract_id,
                            transition_name};
}

validator make_validator(const asset_kit_t& kit) {
  return validator{kit.schema, kit.binding, kit.scripts};
}

issue_result_t finish_issue(const asset_kit_t& kit,
                            const contract_builder& builder) {
  auto issued = builder.issue_contract();
  const auto* contract = std::get_if<issued_contract_t>(&issued);
  if (contract == nullptr) {
    return issued;
  }

  auto status = make_validator(kit).validate_genesis(contract->genesis);
  if (!status.valid()) {
    const auto& first = status.failures.front();
    return issue_error_t{
        .code = issue_error_code_t::validation_failed,
        .message = fmt::format("[{}] {}", first.error_name.value_or(
                                              std::string{to_string(first.kind)}),
                               first.message)};
  }
  return issued;
}

}  // namespace schemata::assets
