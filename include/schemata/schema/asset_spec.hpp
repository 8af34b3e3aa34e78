#pragma once

#include <schemata/schema/precision.hpp>
#include <schemata/schema/semantic_type.hpp>

#include <optional>
#include <string>

// Schema type: asset specification.
// Ticker, display name and precision of a fungible or unique asset.
namespace schemata::schema {

struct asset_spec final {
  std::string ticker;
  std::string name;
  std::optional<std::string> details;
  precision_t precision{precision_t::indivisible};
};

using asset_spec_t = asset_spec;

template <>
struct semantic_type<asset_spec_t> {
  static constexpr std::string_view name = "RGBContract.AssetSpec";
};

}  // namespace schemata::schema
