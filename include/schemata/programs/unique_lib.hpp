#pragma once

#include <schemata/programs/fungible_lib.hpp>
#include <schemata/vm/lib.hpp>

// Identity checks for unique tokens.
//
// genesis: the allocation output names the token declared in global state.
// transfer: the allocation output names the token of the spent allocation.
// Both require the allocated fraction to be exactly one.
namespace schemata::programs {

const schemata::vm::lib_t& unique_lib();

}  // namespace schemata::programs
