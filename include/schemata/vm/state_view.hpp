#pragma once

#include <schemata/schema/owned_state.hpp>
#include <schemata/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <vector>

namespace schemata::vm {

/// The part of an operation a validation program may read.
///
/// `inputs` holds the states closed by the operation, `outputs` the states it
/// creates, `globals` the global state it declares. All are keyed by the raw
/// type number and keep operation order.
struct state_view final {
  std::map<uint16_t, std::vector<schemata::schema::bytes_t>> globals;
  std::map<uint16_t, std::vector<schemata::schema::owned_state_t>> inputs;
  std::map<uint16_t, std::vector<schemata::schema::owned_state_t>> outputs;
};

using state_view_t = state_view;

}  // namespace schemata::vm
