#pragma once

#include <schemata/assets/asset_kit.hpp>
#include <schemata/assets/params.hpp>

#include <string_view>

namespace schemata::assets {

/// A single unique token (RGB21).
class unique_token final {
 public:
  static constexpr std::string_view kName = "UniqueDigitalAsset";

  unique_token();

  const schemata::schema::type_catalog& types() const { return kit_.types; }
  const std::vector<schemata::vm::lib_t>& scripts() const {
    return kit_.scripts;
  }
  const schemata::schema::contract_schema_t& schema() const {
    return kit_.schema;
  }
  const schemata::schema::interface_t& iface() const { return kit_.iface; }
  const schemata::schema::interface_binding_t& binding() const {
    return kit_.binding;
  }
  const asset_kit_t& kit() const { return kit_; }

  schemata::contract::issue_result_t issue(const unique_token_params_t& params) const;

 private:
  asset_kit_t kit_;
};

}  // namespace schemata::assets
