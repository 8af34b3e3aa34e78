#pragma once

#include <schemata/contract/contract_builder.hpp>
#include <schemata/contract/transition_builder.hpp>
#include <schemata/contract/validator.hpp>
#include <schemata/programs/errno.hpp>
#include <schemata/schema/interface.hpp>
#include <schemata/schema/interface_binding.hpp>
#include <schemata/schema/schema_builder.hpp>
#include <schemata/schema/type_catalog.hpp>
#include <schemata/vm/lib.hpp>

#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

namespace schemata::assets {

inline constexpr auto kDeveloper = std::string_view{"ssi:schemata"};
inline constexpr auto kSchemaTimestamp = schemata::schema::timestamp_t{1713343888};

/// Everything an asset class hands to the issuance layer.
struct asset_kit final {
  schemata::schema::type_catalog types;
  std::vector<schemata::vm::lib_t> scripts;
  schemata::schema::contract_schema_t schema;
  schemata::schema::interface_t iface;
  schemata::schema::interface_binding_t binding;
};

using asset_kit_t = asset_kit;

/// Field names of a binding, in interface terms.
struct binding_fields final {
  std::vector<schemata::schema::named_field<schemata::schema::global_state_type_t>>
      global_state;
  std::vector<schemata::schema::named_field<schemata::schema::assignment_type_t>>
      assignments;
  std::vector<schemata::schema::named_field<schemata::schema::transition_type_t>>
      transitions;
  std::vector<schemata::programs::error_code_t> errors;
  std::optional<schemata::schema::state_abi_t> state_abi;
};

using binding_fields_t = binding_fields;

/// Builds the schema from `config` and binds `iface` to it. Any
/// inconsistency is fatal: the shipped classes are fixed at build time.
asset_kit_t make_kit(const schemata::schema::schema_config_t& config,
                     std::vector<schemata::vm::lib_t> scripts,
                     schemata::schema::interface_t iface,
                     binding_fields_t fields);

/// State ABI over the shared arithmetic routines.
schemata::schema::state_abi_t util_state_abi();

schemata::contract::contract_builder make_contract_builder(
    const asset_kit_t& kit,
    schemata::schema::timestamp_t timestamp,
    std::string issuer);

schemata::contract::transition_builder make_transition_builder(
    const asset_kit_t& kit,
    const schemata::schema::contract_id_t& contract_id,
    std::string_view transition_name);

schemata::contract::validator make_validator(const asset_kit_t& kit);

/// Issues the genesis and runs it through the validator. A genesis the
/// schema rejects is reported as validation_failed.
schemata::contract::issue_result_t finish_issue(
    const asset_kit_t& kit,
    const schemata::contract::contract_builder& builder);

}  // namespace schemata::assets
