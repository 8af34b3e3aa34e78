#pragma once

#include <schemata/schema/primitives.hpp>
#include <schemata/schema/semantic_type.hpp>

#include <string>

// Schema type: attachment.
// Off-chain media referenced by MIME type and digest.
namespace schemata::schema {

struct attachment final {
  std::string type;
  hash32_t digest{};
};

using attachment_t = attachment;

template <>
struct semantic_type<attachment_t> {
  static constexpr std::string_view name = "RGBContract.Attachment";
};

}  // namespace schemata::schema
