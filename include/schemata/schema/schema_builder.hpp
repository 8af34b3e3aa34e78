#pragma once
#include <schemata/schema/contract_schema.hpp>
#include <schemata/schema/enum_string.hpp>
#include <schemata/schema/type_catalog.hpp>
#include <schemata/vm/lib.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace schemata::schema {

/// Exported routine of a library, named symbolically.
struct entry_point final {
  std::string lib;
  std::string routine;
};

using entry_point_t = entry_point;

struct global_slot final {
  global_state_type_t key;
  std::string type_name;
  uint16_t max_items{1};
};

// type_name is only read for structured slots.
struct owned_slot final {
  assignment_type_t key;
  owned_state_kind_t kind{owned_state_kind_t::fungible};
  std::string type_name;
};

struct genesis_shape final {
  std::optional<std::string> metadata;
  std::vector<std::pair<global_state_type_t, occurrences_t>> globals;
  std::vector<std::pair<assignment_type_t, occurrences_t>> assignments;
  std::optional<entry_point_t> validator;
};

struct transition_shape final {
  transition_type_t key;
  std::optional<std::string> metadata;
  std::vector<std::pair<global_state_type_t, occurrences_t>> globals;
  std::vector<std::pair<assignment_type_t, occurrences_t>> inputs;
  std::vector<std::pair<assignment_type_t, occurrences_t>> assignments;
  std::optional<entry_point_t> validator;
};

/// Everything that differs between asset classes, as data.
struct schema_config final {
  std::string name;
  std::string developer;
  timestamp_t timestamp{};
  std::vector<global_slot> globals;
  std::vector<owned_slot> owned;
  genesis_shape genesis;
  std::vector<transition_shape> transitions;
};

using global_slot_t = global_slot;
using owned_slot_t = owned_slot;
using genesis_shape_t = genesis_shape;
using transition_shape_t = transition_shape;
using schema_config_t = schema_config;

enum class schema_error_code_t : uint8_t {
  duplicate_key = 0,
  unknown_key = 1,
  unresolved_type = 2,
  invalid_occurrence = 3,
  unknown_entry_point = 4,
  misaligned_entry_point = 5
};

inline constexpr auto kSchemaErrorCodeMappings = std::array{
    std::pair<std::string_view, schema_error_code_t>{
        "duplicate_key", schema_error_code_t::duplicate_key},
    std::pair<std::string_view, schema_error_code_t>{
        "unknown_key", schema_error_code_t::unknown_key},
    std::pair<std::string_view, schema_error_code_t>{
        "unresolved_type", schema_error_code_t::unresolved_type},
    std::pair<std::string_view, schema_error_code_t>{
        "invalid_occurrence", schema_error_code_t::invalid_occurrence},
    std::pair<std::string_view, schema_error_code_t>{
        "unknown_entry_point", schema_error_code_t::unknown_entry_point},
    std::pair<std::string_view, schema_error_code_t>{
        "misaligned_entry_point", schema_error_code_t::misaligned_entry_point},
};

inline constexpr std::string_view to_string(const schema_error_code_t value) {
  return to_string_or(value, kSchemaErrorCodeMappings);
}

struct schema_error final {
  schema_error_code_t code;
  std::string message;
};

using schema_error_t = schema_error;

/// Turns a schema_config_t into a contract schema.
///
/// Type names resolve through the catalog, entry points through the given
/// libraries. try_build() reports every problem it finds; build() treats any
/// problem as fatal.
class schema_builder final {
 public:
  schema_builder(const type_catalog& catalog,
                 std::vector<schemata::vm::lib_t> libs);

  std::optional<contract_schema_t> try_build(
      const schema_config_t& config,
      std::vector<schema_error_t>& errors) const;

  contract_schema_t build(const schema_config_t& config) const;

 private:
  const type_catalog& catalog_;
  std::vector<schemata::vm::lib_t> libs_;
};

}  // namespace schemata::schema
