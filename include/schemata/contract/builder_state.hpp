#pragma once

#include <schemata/contract/issue_error.hpp>
#include <schemata/schema/contract_schema.hpp>
#include <schemata/schema/interface_binding.hpp>
#include <schemata/schema/operation.hpp>
#include <schemata/schema/seal.hpp>
#include <schemata/schema/type_catalog.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace schemata::contract {

/// An output waiting for its blinding factor: a fungible amount or the
/// encoded bytes of a structured value.
struct pending_output final {
  schemata::schema::assignment_type_t type;
  schemata::schema::seal_t seal;
  std::variant<uint64_t, schemata::schema::bytes_t> state;
};

using pending_output_t = pending_output;

using input_blindings_t =
    std::map<schemata::schema::assignment_type_t,
             std::vector<schemata::schema::blinding_t>>;

/// What genesis and transition builders have in common: resolving interface
/// names to schema slots, collecting state and picking blindings.
///
/// The first error is kept and every later call is a no-op, so a builder
/// chain reports the earliest problem.
class builder_state final {
 public:
  builder_state(schemata::schema::contract_schema_t schema,
                schemata::schema::interface_binding_t binding,
                schemata::schema::type_catalog catalog);

  void fail(issue_error_code_t code, std::string message);
  const std::optional<issue_error_t>& error() const;

  /// Global slot bound to `name` when its semantic type is `type_name`.
  std::optional<schemata::schema::global_state_type_t> global_slot(
      std::string_view name,
      std::string_view type_name);

  /// Owned slot bound to `name`. For structured slots `type_name` must match
  /// the slot's semantic type.
  std::optional<schemata::schema::assignment_type_t> owned_slot(
      std::string_view name,
      schemata::schema::owned_state_kind_t kind,
      std::string_view type_name = {});

  void add_global(schemata::schema::global_state_type_t type,
                  schemata::schema::bytes_t value);
  void add_output(pending_output_t output);

  const schemata::schema::global_values_t& globals() const;

  /// Outputs with their final states. Within each fungible type all but the
  /// last output get a blinding derived from `seed`; the last one balances
  /// the type against `inputs`, or against zero when there are none.
  schemata::schema::assignments_t assignments(
      const schemata::schema::hash32_t& seed,
      const input_blindings_t& inputs) const;

  const schemata::schema::contract_schema_t& schema() const;
  const schemata::schema::interface_binding_t& binding() const;

 private:
  bool failed() const;

  schemata::schema::contract_schema_t schema_;
  schemata::schema::interface_binding_t binding_;
  schemata::schema::type_catalog catalog_;
  schemata::schema::global_values_t globals_;
  std::vector<pending_output_t> outputs_;
  std::optional<issue_error_t> error_;
};

}  // namespace schemata::contract
