#pragma once

#include <schemata/contract/builder_state.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/schema/semantic_type.hpp>

#include <string_view>

namespace schemata::contract {

/// State setters shared by contract_builder and transition_builder. Values
/// are addressed by interface field name and checked against the semantic
/// type of the slot they land in.
template <typename Derived>
class operation_builder {
 public:
  template <typename T>
  Derived& add_global_state(const std::string_view name, const T& value) {
    auto key =
        state_.global_slot(name, schemata::schema::semantic_type_name_v<T>);
    if (key) {
      state_.add_global(*key, encoder_.encode(value));
    }
    return self();
  }

  Derived& add_fungible_state(const std::string_view name,
                              const schemata::schema::seal_t& seal,
                              const uint64_t value) {
    auto key =
        state_.owned_slot(name, schemata::schema::owned_state_kind_t::fungible);
    if (key) {
      state_.add_output(
          pending_output_t{.type = *key, .seal = seal, .state = value});
    }
    return self();
  }

  template <typename T>
  Derived& add_structured_state(const std::string_view name,
                                const schemata::schema::seal_t& seal,
                                const T& value) {
    auto key = state_.owned_slot(
        name, schemata::schema::owned_state_kind_t::structured,
        schemata::schema::semantic_type_name_v<T>);
    if (key) {
      state_.add_output(pending_output_t{
          .type = *key, .seal = seal, .state = encoder_.encode(value)});
    }
    return self();
  }

  /// Overrides the seed blindings are derived from.
  Derived& set_blinding_seed(const schemata::schema::hash32_t& seed) {
    seed_ = seed;
    return self();
  }

 protected:
  explicit operation_builder(builder_state state) : state_{std::move(state)} {}

  Derived& self() { return static_cast<Derived&>(*this); }

  builder_state state_;
  std::optional<schemata::schema::hash32_t> seed_;

 private:
  schemata::schema::encoding::scale_encoder_t encoder_;
};

}  // namespace schemata::contract
