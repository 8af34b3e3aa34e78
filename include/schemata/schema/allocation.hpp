#pragma once

#include <schemata/schema/semantic_type.hpp>

#include <cstdint>

namespace schemata::schema {

// Owned state of a unique token. Encoded as the u32 token index at byte
// offset 0 followed by the u64 owned fraction at byte offset 4.
struct allocation final {
  uint32_t token_index{};
  uint64_t fraction{1};
};

using allocation_t = allocation;

inline constexpr auto kAllocationIndexOffset = uint16_t{0};
inline constexpr auto kAllocationFractionOffset = uint16_t{4};

template <>
struct semantic_type<allocation_t> {
  static constexpr std::string_view name = "RGB21.Allocation";
};

}  // namespace schemata::schema
