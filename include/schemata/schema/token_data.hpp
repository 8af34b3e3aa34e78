#pragma once

#include <schemata/schema/attachment.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/semantic_type.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: unique token data.
// The token index is the first field so validation programs find it at byte
// offset 0 of the encoded value.
namespace schemata::schema {

struct embedded_media final {
  std::string type;
  bytes_t data;
};

using embedded_media_t = embedded_media;

struct token_data final {
  uint32_t index{};
  std::optional<std::string> ticker;
  std::optional<std::string> name;
  std::optional<std::string> details;
  std::optional<embedded_media_t> preview;
  std::optional<attachment_t> media;
};

using token_data_t = token_data;

struct attachment_type final {
  uint8_t id{};
  std::string name;
};

using attachment_type_t = attachment_type;

template <>
struct semantic_type<embedded_media_t> {
  static constexpr std::string_view name = "RGB21.EmbeddedMedia";
};

template <>
struct semantic_type<token_data_t> {
  static constexpr std::string_view name = "RGB21.TokenData";
};

template <>
struct semantic_type<attachment_type_t> {
  static constexpr std::string_view name = "RGB21.AttachmentType";
};

}  // namespace schemata::schema
