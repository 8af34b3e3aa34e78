#include <schemata/iface/standard.hpp>
#include <schemata/programs/errno.hpp>
#include <schemata/schema/allocation.hpp>
#include <schemata/schema/amount.hpp>
#include <schemata/schema/asset_spec.hpp>
#include <schemata/schema/asset_text.hpp>
#include <schemata/schema/contract_terms.hpp>
#include <schemata/schema/token_data.hpp>

#include <algorithm>
#include <initializer_list>

using namespace schemata::schema;
using schemata::programs::error_code_t;

namespace schemata::iface {

namespace {

template <typename T>
iface_global_t global_of(const type_catalog& catalog,
                         const bool required = true,
                         const bool multiple = false) {
  return iface_global_t{.sem_id = catalog.get(semantic_type_name_v<T>),
                        .required = required,
                        .multiple = multiple};
}

std::vector<std::string> errors_of(std::initializer_list<error_code_t> codes) {
  auto out = std::vector<std::string>{};
  for (auto code : codes) {
    out.emplace_back(schemata::programs::to_string(code));
  }
  std::sort(std::begin(out), std::end(out));
  return out;
}

}  // namespace

interface_t rgb20(const type_catalog& catalog, const bool inflatable) {
  auto iface = interface_t{};
  iface.name = inflatable ? "RGB20Inflatable" : "RGB20Fixed";
  iface.global_state.emplace("spec", global_of<asset_spec_t>(catalog));
  iface.global_state.emplace("terms", global_of<contract_terms_t>(catalog));
  iface.global_state.emplace("issuedSupply", global_of<amount_t>(catalog));
  iface.assignments.emplace(
      "assetOwner", iface_assignment_t{.kind = owned_state_kind_t::fungible});
  iface.transitions.emplace("transfer", iface_transition_t{});

  if (!inflatable) {
    iface.errors = errors_of({error_code_t::issued_mismatch,
                              error_code_t::non_equal_amounts,
                              error_code_t::amount_overflow});
    return iface;
  }

  iface.global_state.emplace("maxSupply", global_of<amount_t>(catalog));
  iface.assignments.emplace(
      "inflationAllowance",
      iface_assignment_t{.kind = owned_state_kind_t::fungible});
  iface.transitions.emplace("issue", iface_transition_t{});
  iface.errors = errors_of({error_code_t::issued_mismatch,
                            error_code_t::non_equal_amounts,
                            error_code_t::amount_overflow,
                            error_code_t::inflation_mismatch,
                            error_code_t::inflation_exceeds_allowance});
  return iface;
}

interface_t rgb21(const type_catalog& catalog) {
  auto iface = interface_t{};
  iface.name = "RGB21";
  iface.global_state.emplace("spec", global_of<asset_spec_t>(catalog));
  iface.global_state.emplace("terms", global_of<contract_terms_t>(catalog));
  iface.global_state.emplace("tokens", global_of<token_data_t>(catalog));
  iface.global_state.emplace("attachmentTypes",
                             global_of<attachment_type_t>(catalog, false));
  iface.assignments.emplace(
      "assetOwner",
      iface_assignment_t{
          .kind = owned_state_kind_t::structured,
          .sem_id = catalog.get(semantic_type_name_v<allocation_t>)});
  iface.transitions.emplace("transfer", iface_transition_t{});
  iface.errors = errors_of(
      {error_code_t::non_fractional_token, error_code_t::unknown_token});
  return iface;
}

interface_t rgb25(const type_catalog& catalog) {
  auto iface = interface_t{};
  iface.name = "RGB25";
  iface.global_state.emplace("name", global_of<asset_name_t>(catalog));
  iface.global_state.emplace("details",
                             global_of<asset_details_t>(catalog, false));
  iface.global_state.emplace("article", global_of<article_t>(catalog, false));
  iface.global_state.emplace("precision", global_of<precision_t>(catalog));
  iface.global_state.emplace("terms", global_of<contract_terms_t>(catalog));
  iface.global_state.emplace("issuedSupply", global_of<amount_t>(catalog));
  iface.assignments.emplace(
      "assetOwner", iface_assignment_t{.kind = owned_state_kind_t::fungible});
  iface.transitions.emplace("transfer", iface_transition_t{});
  iface.errors = errors_of({error_code_t::issued_mismatch,
                            error_code_t::non_equal_amounts,
                            error_code_t::amount_overflow});
  return iface;
}

}  // namespace schemata::iface
