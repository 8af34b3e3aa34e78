#pragma once

#include <schemata/schema/enum_string.hpp>
#include <schemata/schema/primitives.hpp>

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: single-use seal definition.
// Names the transaction output whose spending closes the seal and so
// transfers the assignment it owns.
namespace schemata::schema {

enum class close_method_t : uint8_t { opret_first = 0, tapret_first = 1 };

inline constexpr auto kCloseMethodMappings = std::array{
    std::pair<std::string_view, close_method_t>{"opret_first",
                                                close_method_t::opret_first},
    std::pair<std::string_view, close_method_t>{"tapret_first",
                                                close_method_t::tapret_first},
};

template <>
inline std::optional<close_method_t> try_from_string<close_method_t>(
    const std::string_view value) {
  return from_string(value, kCloseMethodMappings);
}

inline constexpr std::string_view to_string(const close_method_t value) {
  return to_string_or(value, kCloseMethodMappings);
}

struct outpoint final {
  hash32_t txid{};
  uint32_t vout{};

  auto operator<=>(const outpoint&) const = default;
};

using outpoint_t = outpoint;

struct seal final {
  close_method_t method{close_method_t::tapret_first};
  outpoint_t outpoint;
  uint64_t blinding{};
};

using seal_t = seal;

}  // namespace schemata::schema
