#pragma once

#include <schemata/schema/allocation.hpp>
#include <schemata/schema/contract_terms.hpp>
#include <schemata/schema/precision.hpp>
#include <schemata/schema/seal.hpp>
#include <schemata/schema/token_data.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Human level issuance parameters, one struct per asset class.
namespace schemata::assets {

struct fungible_allocation final {
  schemata::schema::seal_t seal;
  uint64_t amount{};
};

using fungible_allocation_t = fungible_allocation;

inline constexpr auto kDefaultIssuer = std::string_view{"ssi:anonymous"};

struct fixed_fungible_params final {
  std::string ticker;
  std::string name;
  std::optional<std::string> details;
  schemata::schema::precision_t precision{
      schemata::schema::precision_t::indivisible};
  schemata::schema::contract_terms_t terms;
  std::vector<fungible_allocation_t> allocations;
  schemata::schema::timestamp_t timestamp{};
  std::string issuer{kDefaultIssuer};
};

// Max supply is the issued supply plus every inflation allowance.
struct inflatable_fungible_params final {
  std::string ticker;
  std::string name;
  std::optional<std::string> details;
  schemata::schema::precision_t precision{
      schemata::schema::precision_t::indivisible};
  schemata::schema::contract_terms_t terms;
  std::vector<fungible_allocation_t> allocations;
  std::vector<fungible_allocation_t> allowances;
  schemata::schema::timestamp_t timestamp{};
  std::string issuer{kDefaultIssuer};
};

struct collectible_fungible_params final {
  std::string name;
  std::optional<std::string> details;
  std::optional<std::string> article;
  schemata::schema::precision_t precision{
      schemata::schema::precision_t::indivisible};
  schemata::schema::contract_terms_t terms;
  std::vector<fungible_allocation_t> allocations;
  schemata::schema::timestamp_t timestamp{};
  std::string issuer{kDefaultIssuer};
};

struct unique_token_params final {
  std::string ticker;
  std::string name;
  std::optional<std::string> details;
  schemata::schema::contract_terms_t terms;
  schemata::schema::token_data_t token;
  std::optional<schemata::schema::attachment_type_t> attachment_type;
  schemata::schema::seal_t owner;
  schemata::schema::allocation_t allocation;
  schemata::schema::timestamp_t timestamp{};
  std::string issuer{kDefaultIssuer};
};

using fixed_fungible_params_t = fixed_fungible_params;
using inflatable_fungible_params_t = inflatable_fungible_params;
using collectible_fungible_params_t = collectible_fungible_params;
using unique_token_params_t = unique_token_params;

}  // namespace schemata::assets
