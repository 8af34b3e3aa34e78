#pragma once

#include <schemata/schema/contract_schema.hpp>
#include <schemata/schema/enum_string.hpp>
#include <schemata/schema/interface_binding.hpp>
#include <schemata/schema/operation.hpp>
#include <schemata/vm/lib.hpp>
#include <schemata/vm/machine.hpp>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemata::contract {

enum class failure_kind_t : uint8_t {
  schema_mismatch = 0,
  contract_mismatch = 1,
  unknown_transition_type = 2,
  unknown_global_type = 3,
  unknown_assignment_type = 4,
  global_occurrence = 5,
  assignment_occurrence = 6,
  input_occurrence = 7,
  state_kind_mismatch = 8,
  commitment_mismatch = 9,
  metadata_mismatch = 10,
  missing_input = 11,
  script_failure = 12
};

inline constexpr auto kFailureKindMappings = std::array{
    std::pair<std::string_view, failure_kind_t>{
        "schema_mismatch", failure_kind_t::schema_mismatch},
    std::pair<std::string_view, failure_kind_t>{
        "contract_mismatch", failure_kind_t::contract_mismatch},
    std::pair<std::string_view, failure_kind_t>{
        "unknown_transition_type", failure_kind_t::unknown_transition_type},
    std::pair<std::string_view, failure_kind_t>{
        "unknown_global_type", failure_kind_t::unknown_global_type},
    std::pair<std::string_view, failure_kind_t>{
        "unknown_assignment_type", failure_kind_t::unknown_assignment_type},
    std::pair<std::string_view, failure_kind_t>{
        "global_occurrence", failure_kind_t::global_occurrence},
    std::pair<std::string_view, failure_kind_t>{
        "assignment_occurrence", failure_kind_t::assignment_occurrence},
    std::pair<std::string_view, failure_kind_t>{
        "input_occurrence", failure_kind_t::input_occurrence},
    std::pair<std::string_view, failure_kind_t>{
        "state_kind_mismatch", failure_kind_t::state_kind_mismatch},
    std::pair<std::string_view, failure_kind_t>{
        "commitment_mismatch", failure_kind_t::commitment_mismatch},
    std::pair<std::string_view, failure_kind_t>{
        "metadata_mismatch", failure_kind_t::metadata_mismatch},
    std::pair<std::string_view, failure_kind_t>{"missing_input",
                                                failure_kind_t::missing_input},
    std::pair<std::string_view, failure_kind_t>{
        "script_failure", failure_kind_t::script_failure},
};

inline constexpr std::string_view to_string(const failure_kind_t value) {
  return schemata::schema::to_string_or(value, kFailureKindMappings);
}

struct failure final {
  failure_kind_t kind;
  std::string message;
  // Set for script failures: the program's errno and its binding name.
  std::optional<uint8_t> error_code;
  std::optional<std::string> error_name;
};

using failure_t = failure;

struct validation_status final {
  std::vector<failure_t> failures;

  bool valid() const { return failures.empty(); }
  bool contains(failure_kind_t kind) const;
  /// Name of the first script failure, if any.
  std::optional<std::string> script_error() const;
};

using validation_status_t = validation_status;

/// Checks operations of one contract schema.
///
/// Shape checks run first and all their failures are reported. The
/// validation program of the operation runs only when the shape is sound;
/// its errno is translated to a name through the binding.
class validator final {
 public:
  validator(schemata::schema::contract_schema_t schema,
            schemata::schema::interface_binding_t binding,
            const std::vector<schemata::vm::lib_t>& scripts,
            schemata::vm::machine_config_t config = {});

  validation_status_t validate_genesis(
      const schemata::schema::genesis_t& genesis) const;

  /// `prior` holds the assignments the transition may spend, revealed.
  validation_status_t validate_transition(
      const schemata::schema::transition_t& transition,
      const schemata::schema::contract_id_t& contract_id,
      const std::map<schemata::schema::opout_t,
                     schemata::schema::assignment_t>& prior) const;

 private:
  void run(const std::optional<schemata::vm::lib_site_t>& entry,
           const schemata::vm::state_view_t& view,
           validation_status_t& status) const;

  schemata::schema::contract_schema_t schema_;
  schemata::schema::interface_binding_t binding_;
  schemata::vm::lib_registry_t registry_;
  schemata::vm::machine_config_t config_;
};

}  // namespace schemata::contract
