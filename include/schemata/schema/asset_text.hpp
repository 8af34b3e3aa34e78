#pragma once

#include <schemata/schema/semantic_type.hpp>

#include <string>

// Free text fields of the collectible asset schema.
namespace schemata::schema {

struct asset_name final {
  std::string value;
};

struct asset_details final {
  std::string value;
};

struct article final {
  std::string value;
};

using asset_name_t = asset_name;
using asset_details_t = asset_details;
using article_t = article;

template <>
struct semantic_type<asset_name_t> {
  static constexpr std::string_view name = "RGBContract.Name";
};

template <>
struct semantic_type<asset_details_t> {
  static constexpr std::string_view name = "RGBContract.Details";
};

template <>
struct semantic_type<article_t> {
  static constexpr std::string_view name = "RGBContract.Article";
};

}  // namespace schemata::schema
