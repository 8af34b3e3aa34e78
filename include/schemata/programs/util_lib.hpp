#pragma once

#include <schemata/vm/lib.hpp>

#include <string_view>

// Shared arithmetic routines.
//
// sum_inputs and sum_outputs take the owned state type in a16[0] and leave
// the sum of the revealed amounts in a64[1]. calc_change leaves
// sum_inputs - sum_outputs in a64[1]. All of them clobber a16[1], a16[2],
// a64[0] and s16[0]; calc_change also clobbers a64[2]. An overflowing sum
// fails with amountOverflow, a negative change with nonEqualAmounts.
namespace schemata::programs {

inline constexpr auto kSumInputs = std::string_view{"sum_inputs"};
inline constexpr auto kSumOutputs = std::string_view{"sum_outputs"};
inline constexpr auto kCalcChange = std::string_view{"calc_change"};

const schemata::vm::lib_t& util_lib();

}  // namespace schemata::programs
