#pragma once

#include <schemata/assets/params.hpp>
#include <schemata/contract/issue_error.hpp>

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

// Local pre-checks run before any contract material is built.
namespace schemata::assets {

/// 1 to 8 characters, an upper case letter first, then upper case letters
/// or digits.
std::optional<schemata::contract::issue_error_t> check_ticker(
    std::string_view ticker);

/// 1 to 40 printable ASCII characters.
std::optional<schemata::contract::issue_error_t> check_name(
    std::string_view name);

/// 1 to 255 bytes when present.
std::optional<schemata::contract::issue_error_t> check_details(
    const std::optional<std::string>& details);

/// Sum of the allocated amounts, or supply_overflow. An empty list is
/// no_allocations.
std::variant<uint64_t, schemata::contract::issue_error_t> total_supply(
    const std::vector<fungible_allocation_t>& allocations);

}  // namespace schemata::assets
