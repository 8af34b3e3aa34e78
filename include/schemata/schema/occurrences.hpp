#pragma once

#include <schemata/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace schemata::schema {

enum class occurrences_t : uint8_t {
  once = 0,
  none_or_once = 1,
  once_or_more = 2,
  none_or_more = 3
};

inline constexpr auto kOccurrencesMappings = std::array{
    std::pair<std::string_view, occurrences_t>{"once", occurrences_t::once},
    std::pair<std::string_view, occurrences_t>{"none_or_once",
                                               occurrences_t::none_or_once},
    std::pair<std::string_view, occurrences_t>{"once_or_more",
                                               occurrences_t::once_or_more},
    std::pair<std::string_view, occurrences_t>{"none_or_more",
                                               occurrences_t::none_or_more},
};

template <>
inline std::optional<occurrences_t> try_from_string<occurrences_t>(
    const std::string_view value) {
  return from_string(value, kOccurrencesMappings);
}

inline constexpr std::string_view to_string(const occurrences_t value) {
  return to_string_or(value, kOccurrencesMappings);
}

constexpr uint16_t min_items(const occurrences_t value) {
  switch (value) {
    case occurrences_t::once:
    case occurrences_t::once_or_more:
      return 1;
    case occurrences_t::none_or_once:
    case occurrences_t::none_or_more:
      return 0;
  }
  return 0;
}

constexpr uint16_t max_items(const occurrences_t value) {
  switch (value) {
    case occurrences_t::once:
    case occurrences_t::none_or_once:
      return 1;
    case occurrences_t::once_or_more:
    case occurrences_t::none_or_more:
      return std::numeric_limits<uint16_t>::max();
  }
  return 0;
}

constexpr bool allows(const occurrences_t value, const std::size_t count) {
  return count >= min_items(value) && count <= max_items(value);
}

}  // namespace schemata::schema
