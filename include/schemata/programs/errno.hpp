#pragma once

#include <schemata/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Failure codes the shipped validation programs leave in a8[0]. Bindings
// give them their interface names.
namespace schemata::programs {

enum class error_code_t : uint8_t {
  issued_mismatch = 0,
  non_equal_amounts = 1,
  inflation_mismatch = 2,
  inflation_exceeds_allowance = 3,
  amount_overflow = 4,
  non_fractional_token = 10,
  unknown_token = 11
};

inline constexpr auto kErrnoMappings = std::array{
    std::pair<std::string_view, error_code_t>{"issuedMismatch",
                                         error_code_t::issued_mismatch},
    std::pair<std::string_view, error_code_t>{"nonEqualAmounts",
                                         error_code_t::non_equal_amounts},
    std::pair<std::string_view, error_code_t>{"inflationMismatch",
                                         error_code_t::inflation_mismatch},
    std::pair<std::string_view, error_code_t>{
        "inflationExceedsAllowance", error_code_t::inflation_exceeds_allowance},
    std::pair<std::string_view, error_code_t>{"amountOverflow",
                                         error_code_t::amount_overflow},
    std::pair<std::string_view, error_code_t>{"nonFractionalToken",
                                         error_code_t::non_fractional_token},
    std::pair<std::string_view, error_code_t>{"unknownToken",
                                         error_code_t::unknown_token},
};

inline constexpr std::string_view to_string(const error_code_t value) {
  return schemata::schema::to_string_or(value, kErrnoMappings);
}

constexpr uint8_t code_of(const error_code_t value) {
  return static_cast<uint8_t>(value);
}

}  // namespace schemata::programs
