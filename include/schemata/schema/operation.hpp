#pragma once
#include <schemata/schema/keys.hpp>
#include <schemata/schema/owned_state.hpp>
#include <schemata/schema/primitives.hpp>

#include <compare>
#include <map>
#include <string>
#include <vector>

// Schema type: contract operations.
// Genesis creates a contract. A transition closes seals of earlier
// operations and assigns new state.
namespace schemata::schema {

using global_values_t = std::map<global_state_type_t, std::vector<bytes_t>>;
using assignments_t = std::map<assignment_type_t, std::vector<assignment_t>>;

/// Names one assignment created by an operation. The genesis operation id is
/// the contract id.
struct opout final {
  op_id_t op{};
  assignment_type_t type{};
  uint16_t index{};

  auto operator<=>(const opout&) const = default;
};

using opout_t = opout;

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  schema_id_t schema_id{};
  timestamp_t timestamp{};
  std::string issuer;
  bool testnet{true};
  bytes_t metadata;
  global_values_t globals;
  assignments_t assignments;
};

using genesis_t = genesis<1>;

template <uint16_t Version>
struct transition;

template <>
struct transition<1> final {
  uint16_t version{1};
  contract_id_t contract_id{};
  transition_type_t transition_type{};
  bytes_t metadata;
  global_values_t globals;
  std::vector<opout_t> inputs;
  assignments_t assignments;
};

using transition_t = transition<1>;

/// Ids commit to concealed states only, so revealing or hiding an amount
/// never changes them.
contract_id_t make_contract_id(const genesis_t& genesis);
op_id_t make_operation_id(const transition_t& transition);

/// All assignments created by an operation, keyed by the opout that spends
/// them later.
std::map<opout_t, assignment_t> outputs_of(const genesis_t& genesis);
std::map<opout_t, assignment_t> outputs_of(const transition_t& transition);

}  // namespace schemata::schema
