#pragma once

#include <schemata/vm/lib.hpp>

#include <string_view>

// Amount conservation for fixed supply assets.
//
// genesis: the asset outputs add up to the issued supply global and open to
// it with a zero total blinding. Leaves the issued supply in a64[3] and the
// asset type in a16[0].
// transfer: input and output commitments balance and the revealed input and
// output amounts are equal.
namespace schemata::programs {

inline constexpr auto kGenesis = std::string_view{"genesis"};
inline constexpr auto kTransfer = std::string_view{"transfer"};

const schemata::vm::lib_t& fungible_lib();

}  // namespace schemata::programs
