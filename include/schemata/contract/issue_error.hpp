#pragma once

#include <schemata/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace schemata::contract {

enum class issue_error_code_t : uint8_t {
  invalid_ticker = 0,
  invalid_name = 1,
  invalid_details = 2,
  no_allocations = 3,
  supply_overflow = 4,
  token_mismatch = 5,
  fractional_token = 6,
  class_mismatch = 7,
  unknown_field = 8,
  type_mismatch = 9,
  invalid_state = 10,
  validation_failed = 11
};

inline constexpr auto kIssueErrorCodeMappings = std::array{
    std::pair<std::string_view, issue_error_code_t>{
        "invalid_ticker", issue_error_code_t::invalid_ticker},
    std::pair<std::string_view, issue_error_code_t>{
        "invalid_name", issue_error_code_t::invalid_name},
    std::pair<std::string_view, issue_error_code_t>{
        "invalid_details", issue_error_code_t::invalid_details},
    std::pair<std::string_view, issue_error_code_t>{
        "no_allocations", issue_error_code_t::no_allocations},
    std::pair<std::string_view, issue_error_code_t>{
        "supply_overflow", issue_error_code_t::supply_overflow},
    std::pair<std::string_view, issue_error_code_t>{
        "token_mismatch", issue_error_code_t::token_mismatch},
    std::pair<std::string_view, issue_error_code_t>{
        "fractional_token", issue_error_code_t::fractional_token},
    std::pair<std::string_view, issue_error_code_t>{
        "class_mismatch", issue_error_code_t::class_mismatch},
    std::pair<std::string_view, issue_error_code_t>{
        "unknown_field", issue_error_code_t::unknown_field},
    std::pair<std::string_view, issue_error_code_t>{
        "type_mismatch", issue_error_code_t::type_mismatch},
    std::pair<std::string_view, issue_error_code_t>{
        "invalid_state", issue_error_code_t::invalid_state},
    std::pair<std::string_view, issue_error_code_t>{
        "validation_failed", issue_error_code_t::validation_failed},
};

inline constexpr std::string_view to_string(const issue_error_code_t value) {
  return schemata::schema::to_string_or(value, kIssueErrorCodeMappings);
}

/// Rejected parameters, reported before any validation program runs unless
/// the code is validation_failed.
struct issue_error final {
  issue_error_code_t code;
  std::string message;
};

using issue_error_t = issue_error;

}  // namespace schemata::contract
