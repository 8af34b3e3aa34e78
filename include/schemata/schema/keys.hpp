#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <stdexcept>

// Numeric keys of global state, owned state and transition types.
//
// Every asset family owns a fixed range in each namespace. Keys are built
// through make_*_key so that a key outside its family range fails at compile
// time when used in a constant expression.
namespace schemata::schema {

template <typename Tag>
struct typed_key final {
  uint16_t value{};

  auto operator<=>(const typed_key&) const = default;
};

struct global_state_tag {};
struct assignment_tag {};
struct transition_tag {};

using global_state_type_t = typed_key<global_state_tag>;
using assignment_type_t = typed_key<assignment_tag>;
using transition_type_t = typed_key<transition_tag>;

enum class key_family_t : uint8_t {
  common = 0,
  unique = 1,
  inflatable = 2,
  collectible = 3
};

struct key_range final {
  uint16_t first{};
  uint16_t last{};

  constexpr bool contains(const uint16_t value) const {
    return value >= first && value <= last;
  }
  constexpr bool overlaps(const key_range& other) const {
    return first <= other.last && other.first <= last;
  }
};

struct family_ranges final {
  key_family_t family;
  key_range globals;
  key_range assignments;
  key_range transitions;
};

inline constexpr auto kKeyRegistry = std::array{
    family_ranges{key_family_t::common, {2000, 2099}, {4000, 4099},
                  {10000, 10099}},
    family_ranges{key_family_t::unique, {2100, 2199}, {4100, 4199},
                  {10100, 10199}},
    family_ranges{key_family_t::inflatable, {2200, 2299}, {4200, 4299},
                  {10200, 10299}},
    family_ranges{key_family_t::collectible, {3000, 3099}, {4300, 4399},
                  {10300, 10399}},
};

constexpr const family_ranges& ranges_of(const key_family_t family) {
  for (const auto& entry : kKeyRegistry) {
    if (entry.family == family) {
      return entry;
    }
  }
  throw std::out_of_range{"unregistered key family"};
}

constexpr bool key_ranges_disjoint() {
  for (std::size_t i = 0; i < kKeyRegistry.size(); ++i) {
    for (std::size_t j = i + 1; j < kKeyRegistry.size(); ++j) {
      const auto& a = kKeyRegistry[i];
      const auto& b = kKeyRegistry[j];
      if (a.globals.overlaps(b.globals) ||
          a.assignments.overlaps(b.assignments) ||
          a.transitions.overlaps(b.transitions)) {
        return false;
      }
    }
  }
  return true;
}

static_assert(key_ranges_disjoint(), "key families must not overlap");

constexpr global_state_type_t make_global_key(const key_family_t family,
                                              const uint16_t value) {
  if (!ranges_of(family).globals.contains(value)) {
    throw std::out_of_range{"global state key outside of its family range"};
  }
  return global_state_type_t{value};
}

constexpr assignment_type_t make_assignment_key(const key_family_t family,
                                                const uint16_t value) {
  if (!ranges_of(family).assignments.contains(value)) {
    throw std::out_of_range{"assignment key outside of its family range"};
  }
  return assignment_type_t{value};
}

constexpr transition_type_t make_transition_key(const key_family_t family,
                                                const uint16_t value) {
  if (!ranges_of(family).transitions.contains(value)) {
    throw std::out_of_range{"transition key outside of its family range"};
  }
  return transition_type_t{value};
}

// common
inline constexpr auto kGsSpec = make_global_key(key_family_t::common, 2000);
inline constexpr auto kGsTerms = make_global_key(key_family_t::common, 2001);
inline constexpr auto kGsIssuedSupply =
    make_global_key(key_family_t::common, 2002);
inline constexpr auto kOsAsset =
    make_assignment_key(key_family_t::common, 4000);
inline constexpr auto kTsTransfer =
    make_transition_key(key_family_t::common, 10000);

// unique
inline constexpr auto kGsTokens = make_global_key(key_family_t::unique, 2102);
inline constexpr auto kGsAttachmentTypes =
    make_global_key(key_family_t::unique, 2104);

// inflatable
inline constexpr auto kGsMaxSupply =
    make_global_key(key_family_t::inflatable, 2200);
inline constexpr auto kOsInflationAllowance =
    make_assignment_key(key_family_t::inflatable, 4200);
inline constexpr auto kTsIssue =
    make_transition_key(key_family_t::inflatable, 10200);

// collectible
inline constexpr auto kGsArticle =
    make_global_key(key_family_t::collectible, 3000);
inline constexpr auto kGsName = make_global_key(key_family_t::collectible, 3001);
inline constexpr auto kGsDetails =
    make_global_key(key_family_t::collectible, 3004);
inline constexpr auto kGsPrecision =
    make_global_key(key_family_t::collectible, 3005);

}  // namespace schemata::schema
