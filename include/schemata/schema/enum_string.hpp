#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace schemata::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

/// Name printed for a value that has no entry in its mapping table, e.g. a
/// byte decoded from an untrusted program or operation.
inline constexpr auto kUnknownName = std::string_view{"unknown"};

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view to_string_or(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings,
    const std::string_view fallback = kUnknownName) {
  return to_string(value, mappings).value_or(fallback);
}

// Specialized next to each enum that can be parsed from text.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace schemata::schema
