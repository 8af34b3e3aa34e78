#pragma once

#include <schemata/contract/issue_error.hpp>
#include <schemata/contract/operation_builder.hpp>
#include <schemata/schema/operation.hpp>

#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace schemata::contract {

using transition_result_t =
    std::variant<schemata::schema::transition_t, issue_error_t>;

/// Builds a state transition of an existing contract.
///
/// Every input comes with the assignment it spends. Fungible inputs must be
/// revealed: their blindings are needed to balance the outputs of the same
/// type.
class transition_builder final
    : public operation_builder<transition_builder> {
 public:
  transition_builder(schemata::schema::contract_schema_t schema,
                     schemata::schema::interface_binding_t binding,
                     schemata::schema::type_catalog catalog,
                     const schemata::schema::contract_id_t& contract_id,
                     std::string_view transition_name);

  transition_builder& add_input(const schemata::schema::opout_t& opout,
                                const schemata::schema::assignment_t& prior);

  transition_result_t build() const;

 private:
  schemata::schema::contract_id_t contract_id_{};
  schemata::schema::transition_type_t transition_type_{};
  std::vector<schemata::schema::opout_t> inputs_;
  input_blindings_t input_blindings_;
};

}  // namespace schemata::contract
