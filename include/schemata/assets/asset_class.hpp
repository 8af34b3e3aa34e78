#pragma once

#include <schemata/assets/collectible_fungible.hpp>
#include <schemata/assets/fixed_fungible.hpp>
#include <schemata/assets/inflatable_fungible.hpp>
#include <schemata/assets/unique_token.hpp>

#include <string_view>
#include <variant>
#include <vector>

namespace schemata::assets {

using asset_class_t = std::variant<fixed_fungible,
                                   inflatable_fungible,
                                   collectible_fungible,
                                   unique_token>;

using issue_request_t = std::variant<fixed_fungible_params_t,
                                     inflatable_fungible_params_t,
                                     collectible_fungible_params_t,
                                     unique_token_params_t>;

/// Every shipped asset class, in a fixed order.
std::vector<asset_class_t> all_asset_classes();

std::string_view name_of(const asset_class_t& asset);
const asset_kit_t& kit_of(const asset_class_t& asset);

/// Issues `request` with `asset`. Parameters of another class are rejected
/// with class_mismatch.
schemata::contract::issue_result_t issue(const asset_class_t& asset,
                                         const issue_request_t& request);

}  // namespace schemata::assets
