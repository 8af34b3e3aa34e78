#pragma once

#include <schemata/crypto/pedersen.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/seal.hpp>
#include <schemata/schema/state_schema.hpp>

#include <cstdint>
#include <optional>
#include <variant>

// Schema type: owned state and its assignment to a seal.
namespace schemata::schema {

struct revealed_value final {
  uint64_t value{};
  blinding_t blinding{};
};

using revealed_value_t = revealed_value;

// The commitment is the consensus part. The opening travels next to it on
// the client side and is dropped by conceal() before any id is computed.
struct fungible_state final {
  schemata::crypto::commitment_t commitment{};
  std::optional<revealed_value_t> revealed;
};

struct structured_state final {
  bytes_t data;
};

using fungible_state_t = fungible_state;
using structured_state_t = structured_state;
using owned_state_t = std::variant<fungible_state_t, structured_state_t>;

struct assignment final {
  seal_t seal;
  owned_state_t state;
};

using assignment_t = assignment;

fungible_state_t make_fungible_state(uint64_t value,
                                     const blinding_t& blinding);

owned_state_t conceal(const owned_state_t& state);

/// Check a revealed fungible opening against its commitment. Concealed and
/// structured states are trivially consistent.
bool opening_consistent(const owned_state_t& state);

inline owned_state_kind_t kind_of(const owned_state_t& state) {
  return std::holds_alternative<fungible_state_t>(state)
             ? owned_state_kind_t::fungible
             : owned_state_kind_t::structured;
}

}  // namespace schemata::schema
