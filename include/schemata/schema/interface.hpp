#pragma once
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/state_schema.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

// Schema type: interface.
// A reusable, schema independent view on contract state: named global
// fields, named assignments, named transitions and the error names a
// conforming contract may raise.
namespace schemata::schema {

struct iface_global final {
  std::optional<sem_id_t> sem_id;
  bool required{true};
  bool multiple{false};
};

struct iface_assignment final {
  owned_state_kind_t kind{owned_state_kind_t::any};
  std::optional<sem_id_t> sem_id;
  bool required{true};
};

struct iface_transition final {
  bool required{true};
};

using iface_global_t = iface_global;
using iface_assignment_t = iface_assignment;
using iface_transition_t = iface_transition;

template <uint16_t Version>
struct interface;

template <>
struct interface<1> final {
  uint16_t version{1};
  std::string name;
  std::map<std::string, iface_global_t> global_state;
  std::map<std::string, iface_assignment_t> assignments;
  std::map<std::string, iface_transition_t> transitions;
  // sorted
  std::vector<std::string> errors;
};

using interface_t = interface<1>;

iface_id_t make_iface_id(const interface_t& iface);

}  // namespace schemata::schema
