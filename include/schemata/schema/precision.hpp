#pragma once

#include <schemata/schema/enum_string.hpp>
#include <schemata/schema/semantic_type.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace schemata::schema {

/// Number of decimal digits after the point in a displayed amount.
enum class precision_t : uint8_t {
  indivisible = 0,
  deci = 1,
  centi = 2,
  milli = 3,
  deci_milli = 4,
  centi_milli = 5,
  micro = 6,
  deci_micro = 7,
  centi_micro = 8,
  nano = 9,
  deci_nano = 10,
  centi_nano = 11,
  pico = 12,
  deci_pico = 13,
  centi_pico = 14,
  femto = 15,
  deci_femto = 16,
  centi_femto = 17,
  atto = 18
};

inline constexpr auto kPrecisionMappings = std::array{
    std::pair<std::string_view, precision_t>{"indivisible",
                                             precision_t::indivisible},
    std::pair<std::string_view, precision_t>{"deci", precision_t::deci},
    std::pair<std::string_view, precision_t>{"centi", precision_t::centi},
    std::pair<std::string_view, precision_t>{"milli", precision_t::milli},
    std::pair<std::string_view, precision_t>{"deci_milli",
                                             precision_t::deci_milli},
    std::pair<std::string_view, precision_t>{"centi_milli",
                                             precision_t::centi_milli},
    std::pair<std::string_view, precision_t>{"micro", precision_t::micro},
    std::pair<std::string_view, precision_t>{"deci_micro",
                                             precision_t::deci_micro},
    std::pair<std::string_view, precision_t>{"centi_micro",
                                             precision_t::centi_micro},
    std::pair<std::string_view, precision_t>{"nano", precision_t::nano},
    std::pair<std::string_view, precision_t>{"deci_nano",
                                             precision_t::deci_nano},
    std::pair<std::string_view, precision_t>{"centi_nano",
                                             precision_t::centi_nano},
    std::pair<std::string_view, precision_t>{"pico", precision_t::pico},
    std::pair<std::string_view, precision_t>{"deci_pico",
                                             precision_t::deci_pico},
    std::pair<std::string_view, precision_t>{"centi_pico",
                                             precision_t::centi_pico},
    std::pair<std::string_view, precision_t>{"femto", precision_t::femto},
    std::pair<std::string_view, precision_t>{"deci_femto",
                                             precision_t::deci_femto},
    std::pair<std::string_view, precision_t>{"centi_femto",
                                             precision_t::centi_femto},
    std::pair<std::string_view, precision_t>{"atto", precision_t::atto},
};

template <>
inline std::optional<precision_t> try_from_string<precision_t>(
    const std::string_view value) {
  return from_string(value, kPrecisionMappings);
}

inline constexpr std::string_view to_string(const precision_t value) {
  return to_string_or(value, kPrecisionMappings);
}

template <>
struct semantic_type<precision_t> {
  static constexpr std::string_view name = "RGBContract.Precision";
};

}  // namespace schemata::schema
