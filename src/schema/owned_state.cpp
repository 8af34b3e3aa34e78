#include <schemata/schema/owned_state.hpp>

namespace schemata::schema {

fungible_state_t make_fungible_state(const uint64_t value,
                                     const blinding_t& blinding) {
  return fungible_state_t{
      .commitment = schemata::crypto::commit(value, blinding),
      .revealed = revealed_value_t{.value = value, .blinding = blinding}};
}

owned_state_t conceal(const owned_state_t& state) {
  return std::visit(
      overloaded{[](const fungible_state_t& value) -> owned_state_t {
                   return fungible_state_t{.commitment = value.commitment,
                                           .revealed = std::nullopt};
                 },
                 [](const structured_state_t& value) -> owned_state_t {
                   return value;
                 }},
      state);
}

bool opening_consistent(const owned_state_t& state) {
  const auto* fungible = std::get_if<fungible_state_t>(&state);
  if (fungible == nullptr || !fungible->revealed) {
    return true;
  }
  return schemata::crypto::verify_opening(fungible->commitment,
                                          fungible->revealed->value,
                                          fungible->revealed->blinding);
}

}  // namespace schemata::schema
