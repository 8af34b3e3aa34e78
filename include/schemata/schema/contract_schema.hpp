#pragma once
#include <schemata/schema/keys.hpp>
#include <schemata/schema/occurrences.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/state_schema.hpp>
#include <schemata/vm/lib.hpp>

#include <map>
#include <optional>
#include <string>

// Schema type: contract schema.
// Everything a contract of one asset class may contain: its global and owned
// state slots, what genesis must declare, the transitions it accepts and the
// validation routine each of them runs.
namespace schemata::schema {

struct genesis_schema final {
  std::optional<sem_id_t> metadata;
  std::map<global_state_type_t, occurrences_t> globals;
  std::map<assignment_type_t, occurrences_t> assignments;
  std::optional<schemata::vm::lib_site_t> validator;
};

using genesis_schema_t = genesis_schema;

struct transition_schema final {
  std::optional<sem_id_t> metadata;
  std::map<global_state_type_t, occurrences_t> globals;
  // closed assignments
  std::map<assignment_type_t, occurrences_t> inputs;
  std::map<assignment_type_t, occurrences_t> assignments;
  std::optional<schemata::vm::lib_site_t> validator;
};

using transition_schema_t = transition_schema;

template <uint16_t Version>
struct contract_schema;

template <>
struct contract_schema<1> final {
  uint16_t version{1};
  std::string name;
  std::string developer;
  timestamp_t timestamp{};
  type_system_id_t type_system_id{};
  std::map<global_state_type_t, global_state_schema_t> global_types;
  std::map<assignment_type_t, owned_state_schema_t> owned_types;
  genesis_schema_t genesis;
  std::map<transition_type_t, transition_schema_t> transitions;
};

using contract_schema_t = contract_schema<1>;

schema_id_t make_schema_id(const contract_schema_t& schema);

}  // namespace schemata::schema
