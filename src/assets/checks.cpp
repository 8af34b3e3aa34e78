#include <schemata/assets/checks.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <limits>

using schemata::contract::issue_error_code_t;
using schemata::contract::issue_error_t;

namespace schemata::assets {

namespace {

constexpr auto kMaxTickerLength = std::size_t{8};
constexpr auto kMaxNameLength = std::size_t{40};
constexpr auto kMaxDetailsLength = std::size_t{255};

constexpr bool is_upper(const char c) {
  return c >= 'A' && c <= 'Z';
}

constexpr bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

constexpr bool is_printable(const char c) {
  return c >= 0x20 && c <= 0x7e;
}

}  // namespace

std::optional<issue_error_t> check_ticker(const std::string_view ticker) {
  if (ticker.empty() || ticker.size() > kMaxTickerLength) {
    return issue_error_t{
        .code = issue_error_code_t::invalid_ticker,
        .message = fmt::format("ticker '{}' must have 1 to {} characters",
                               ticker, kMaxTickerLength)};
  }
  if (!is_upper(ticker.front()) ||
      !std::all_of(std::begin(ticker) + 1, std::end(ticker),
                   [](const char c) { return is_upper(c) || is_digit(c); })) {
    return issue_error_t{
        .code = issue_error_code_t::invalid_ticker,
        .message = fmt::format(
            "ticker '{}' must be upper case letters and digits, starting "
            "with a letter",
            ticker)};
  }
  return std::nullopt;
}

std::optional<issue_error_t> check_name(const std::string_view name) {
  if (name.empty() || name.size() > kMaxNameLength ||
      !std::all_of(std::begin(name), std::end(name), is_printable)) {
    return issue_error_t{
        .code = issue_error_code_t::invalid_name,
        .message = fmt::format(
            "name '{}' must have 1 to {} printable characters", name,
            kMaxNameLength)};
  }
  return std::nullopt;
}

std::optional<issue_error_t> check_details(
    const std::optional<std::string>& details) {
  if (details && (details->empty() || details->size() > kMaxDetailsLength)) {
    return issue_error_t{
        .code = issue_error_code_t::invalid_details,
        .message = fmt::format("details must have 1 to {} bytes, got {}",
                               kMaxDetailsLength, details->size())};
  }
  return std::nullopt;
}

std::variant<uint64_t, issue_error_t> total_supply(
    const std::vector<fungible_allocation_t>& allocations) {
  if (allocations.empty()) {
    return issue_error_t{.code = issue_error_code_t::no_allocations,
                         .message = "at least one allocation is required"};
  }
  auto total = uint64_t{0};
  for (const auto& allocation : allocations) {
    if (allocation.amount > std::numeric_limits<uint64_t>::max() - total) {
      return issue_error_t{.code = issue_error_code_t::supply_overflow,
                           .message = "allocated amounts exceed 2^64 - 1"};
    }
    total += allocation.amount;
  }
  return total;
}

}  // namespace schemata::assets
