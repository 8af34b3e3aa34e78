#pragma once

#include <schemata/vm/lib.hpp>

#include <string_view>

// Supply checks for inflatable assets.
//
// genesis: everything the fixed supply genesis checks, plus the allowance
// outputs adding up to max supply minus issued supply.
// issue: the minted asset outputs add up to the issued supply global of the
// transition, the issuance does not exceed the consumed allowance (equal is
// allowed) and the allowance outputs carry exactly the remainder.
namespace schemata::programs {

inline constexpr auto kIssue = std::string_view{"issue"};

const schemata::vm::lib_t& inflatable_lib();

}  // namespace schemata::programs
