#include <schemata/assets/asset_class.hpp>

#include <fmt/format.h>

#include <type_traits>

using namespace schemata::contract;

namespace schemata::assets {

namespace {

template <typename Params>
constexpr std::string_view params_name() {
  if constexpr (std::is_same_v<Params, fixed_fungible_params_t>) {
    return fixed_fungible::kName;
  } else if constexpr (std::is_same_v<Params, inflatable_fungible_params_t>) {
    return inflatable_fungible::kName;
  } else if constexpr (std::is_same_v<Params, collectible_fungible_params_t>) {
    return collectible_fungible::kName;
  } else {
    return unique_token::kName;
  }
}

}  // namespace

std::vector<asset_class_t> all_asset_classes() {
  return {fixed_fungible{}, inflatable_fungible{}, collectible_fungible{},
          unique_token{}};
}

std::string_view name_of(const asset_class_t& asset) {
  return std::visit([](const auto& a) { return a.kName; }, asset);
}

const asset_kit_t& kit_of(const asset_class_t& asset) {
  return std::visit([](const auto& a) -> const asset_kit_t& { return a.kit(); },
                    asset);
}

issue_result_t issue(const asset_class_t& asset,
                     const issue_request_t& request) {
  return std::visit(
      overloaded{
          [](const fixed_fungible& a, const fixed_fungible_params_t& p) {
            return a.issue(p);
          },
          [](const inflatable_fungible& a,
             const inflatable_fungible_params_t& p) { return a.issue(p); },
          [](const collectible_fungible& a,
             const collectible_fungible_params_t& p) { return a.issue(p); },
          [](const unique_token& a, const unique_token_params_t& p) {
            return a.issue(p);
          },
          [](const auto& a, const auto& p) -> issue_result_t {
            using params_t = std::decay_t<decltype(p)>;
            return issue_error_t{
                .code = issue_error_code_t::class_mismatch,
                .message = fmt::format("{} cannot issue {} parameters",
                                       a.kName, params_name<params_t>())};
          }},
      asset, request);
}

}  // namespace schemata::assets
