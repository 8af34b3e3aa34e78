#pragma once

#include <schemata/schema/semantic_type.hpp>

#include <cstdint>

namespace schemata::schema {

// Encodes as 8 little endian bytes, which is what validation programs read
// from offset 0.
struct amount final {
  uint64_t value{};
};

using amount_t = amount;

template <>
struct semantic_type<amount_t> {
  static constexpr std::string_view name = "RGBContract.Amount";
};

}  // namespace schemata::schema
