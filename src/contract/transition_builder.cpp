#include <schemata/blake3/hash.hpp>
#include <schemata/contract/transition_builder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace schemata::schema;

namespace schemata::contract {

namespace {

constexpr auto kTransitionSeedContext =
    std::string_view{"schemata.transition-blinding-seed.v1"};

struct seed_source final {
  contract_id_t contract_id{};
  std::vector<opout_t> inputs;
};

}  // namespace

transition_builder::transition_builder(contract_schema_t schema,
                                       interface_binding_t binding,
                                       type_catalog catalog,
                                       const contract_id_t& contract_id,
                                       const std::string_view transition_name)
    : operation_builder{builder_state{std::move(schema), std::move(binding),
                                      std::move(catalog)}},
      contract_id_{contract_id} {
  auto type = find_transition(state_.binding(), transition_name);
  if (!type || !state_.schema().transitions.contains(*type)) {
    state_.fail(issue_error_code_t::unknown_field,
                fmt::format("no transition named '{}'", transition_name));
    return;
  }
  transition_type_ = *type;
}

transition_builder& transition_builder::add_input(const opout_t& opout,
                                                  const assignment_t& prior) {
  if (std::find(std::begin(inputs_), std::end(inputs_), opout) !=
      std::end(inputs_)) {
    state_.fail(issue_error_code_t::invalid_state,
                fmt::format("input {}:{}:{} spent twice", to_hex(opout.op),
                            opout.type.value, opout.index));
    return *this;
  }
  if (const auto* fungible = std::get_if<fungible_state_t>(&prior.state)) {
    if (!fungible->revealed || !opening_consistent(prior.state)) {
      state_.fail(issue_error_code_t::invalid_state,
                  fmt::format("fungible input of type {} is not revealed",
                              opout.type.value));
      return *this;
    }
    input_blindings_[opout.type].push_back(fungible->revealed->blinding);
  }
  inputs_.push_back(opout);
  return *this;
}

transition_result_t transition_builder::build() const {
  if (state_.error()) {
    return *state_.error();
  }

  auto transition = transition_t{};
  transition.contract_id = contract_id_;
  transition.transition_type = transition_type_;
  transition.globals = state_.globals();
  transition.inputs = inputs_;

  auto seed = seed_;
  if (!seed) {
    auto encoder = encoding::scale_encoder_t{};
    seed = schemata::blake3::tagged_hash(
        kTransitionSeedContext,
        encoder.encode(
            seed_source{.contract_id = contract_id_, .inputs = inputs_}));
  }
  transition.assignments = state_.assignments(*seed, input_blindings_);

  spdlog::debug("built transition {} of contract {}", transition_type_.value,
                to_hex(contract_id_));
  return transition;
}

}  // namespace schemata::contract
