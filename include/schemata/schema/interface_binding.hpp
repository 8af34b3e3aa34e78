#pragma once
#include <schemata/schema/keys.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/vm/lib.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: interface binding.
// Implements an interface for one schema by mapping interface names to
// schema keys and numeric validation error codes to interface error names.
namespace schemata::schema {

template <typename Key>
struct named_field final {
  std::string name;
  Key key;
};

struct named_variant final {
  uint8_t code{};
  std::string name;
};

using named_variant_t = named_variant;

/// Optional entry points for reading and computing fungible state.
struct state_abi final {
  schemata::vm::lib_site_t reg_input;
  schemata::vm::lib_site_t reg_output;
  schemata::vm::lib_site_t calc_output;
  schemata::vm::lib_site_t calc_change;
};

using state_abi_t = state_abi;

template <uint16_t Version>
struct interface_binding;

template <>
struct interface_binding<1> final {
  uint16_t version{1};
  schema_id_t schema_id{};
  iface_id_t iface_id{};
  timestamp_t timestamp{};
  std::string developer;
  std::vector<named_field<global_state_type_t>> global_state;
  std::vector<named_field<assignment_type_t>> assignments;
  std::vector<named_field<transition_type_t>> transitions;
  std::vector<named_variant_t> errors;
  std::optional<state_abi_t> state_abi;
};

using interface_binding_t = interface_binding<1>;

binding_id_t make_binding_id(const interface_binding_t& binding);

std::optional<global_state_type_t> find_global(
    const interface_binding_t& binding,
    std::string_view name);
std::optional<assignment_type_t> find_assignment(
    const interface_binding_t& binding,
    std::string_view name);
std::optional<transition_type_t> find_transition(
    const interface_binding_t& binding,
    std::string_view name);
std::optional<std::string> error_name(const interface_binding_t& binding,
                                      uint8_t code);

}  // namespace schemata::schema
