#pragma once

#include <schemata/schema/attachment.hpp>
#include <schemata/schema/semantic_type.hpp>

#include <optional>
#include <string>

// Schema type: contract terms.
// Legal text of the contract with an optional media attachment.
namespace schemata::schema {

struct contract_terms final {
  std::string text;
  std::optional<attachment_t> media;
};

using contract_terms_t = contract_terms;

template <>
struct semantic_type<contract_terms_t> {
  static constexpr std::string_view name = "RGBContract.ContractTerms";
};

}  // namespace schemata::schema
