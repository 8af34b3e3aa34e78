#include <schemata/contract/builder_state.hpp>
#include <schemata/crypto/pedersen.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace schemata::schema;

namespace schemata::contract {

builder_state::builder_state(contract_schema_t schema,
                             interface_binding_t binding,
                             type_catalog catalog)
    : schema_{std::move(schema)},
      binding_{std::move(binding)},
      catalog_{std::move(catalog)} {}

void builder_state::fail(const issue_error_code_t code, std::string message) {
  if (failed()) {
    return;
  }
  spdlog::debug("builder for '{}' rejected input [{}]: {}", schema_.name,
                to_string(code), message);
  error_ = issue_error_t{.code = code, .message = std::move(message)};
}

const std::optional<issue_error_t>& builder_state::error() const {
  return error_;
}

bool builder_state::failed() const {
  return error_.has_value();
}

std::optional<global_state_type_t> builder_state::global_slot(
    const std::string_view name,
    const std::string_view type_name) {
  if (failed()) {
    return std::nullopt;
  }
  auto key = find_global(binding_, name);
  if (!key) {
    fail(issue_error_code_t::unknown_field,
         fmt::format("no global state named '{}'", name));
    return std::nullopt;
  }
  auto slot = schema_.global_types.find(*key);
  if (slot == std::end(schema_.global_types)) {
    fail(issue_error_code_t::unknown_field,
         fmt::format("global '{}' is bound to an undeclared key {}", name,
                     key->value));
    return std::nullopt;
  }
  auto sem_id = catalog_.resolve(type_name);
  if (!sem_id || *sem_id != slot->second.sem_id) {
    fail(issue_error_code_t::type_mismatch,
         fmt::format("global '{}' does not hold {}", name, type_name));
    return std::nullopt;
  }
  return key;
}

std::optional<assignment_type_t> builder_state::owned_slot(
    const std::string_view name,
    const owned_state_kind_t kind,
    const std::string_view type_name) {
  if (failed()) {
    return std::nullopt;
  }
  auto key = find_assignment(binding_, name);
  if (!key) {
    fail(issue_error_code_t::unknown_field,
         fmt::format("no assignment named '{}'", name));
    return std::nullopt;
  }
  auto slot = schema_.owned_types.find(*key);
  if (slot == std::end(schema_.owned_types)) {
    fail(issue_error_code_t::unknown_field,
         fmt::format("assignment '{}' is bound to an undeclared key {}", name,
                     key->value));
    return std::nullopt;
  }
  if (kind_of(slot->second) != kind) {
    fail(issue_error_code_t::type_mismatch,
         fmt::format("assignment '{}' holds {} state", name,
                     to_string(kind_of(slot->second))));
    return std::nullopt;
  }
  const auto* structured = std::get_if<structured_state_schema>(&slot->second);
  if (structured != nullptr) {
    auto sem_id = catalog_.resolve(type_name);
    if (!sem_id || *sem_id != structured->sem_id) {
      fail(issue_error_code_t::type_mismatch,
           fmt::format("assignment '{}' does not hold {}", name, type_name));
      return std::nullopt;
    }
  }
  return key;
}

void builder_state::add_global(const global_state_type_t type, bytes_t value) {
  if (failed()) {
    return;
  }
  globals_[type].push_back(std::move(value));
}

void builder_state::add_output(pending_output_t output) {
  if (failed()) {
    return;
  }
  outputs_.push_back(std::move(output));
}

const global_values_t& builder_state::globals() const {
  return globals_;
}

assignments_t builder_state::assignments(const hash32_t& seed,
                                         const input_blindings_t& inputs) const {
  auto remaining = std::map<assignment_type_t, std::size_t>{};
  for (const auto& output : outputs_) {
    if (std::holds_alternative<uint64_t>(output.state)) {
      ++remaining[output.type];
    }
  }

  auto chosen = input_blindings_t{};
  auto out = assignments_t{};
  for (const auto& output : outputs_) {
    auto& items = out[output.type];
    if (const auto* data = std::get_if<bytes_t>(&output.state)) {
      items.push_back(assignment_t{.seal = output.seal,
                                   .state = structured_state_t{.data = *data}});
      continue;
    }

    auto& others = chosen[output.type];
    auto blinding = blinding_t{};
    if (--remaining[output.type] > 0) {
      blinding = schemata::crypto::derive_blinding(
          seed, fmt::format("{}", output.type.value), others.size());
    } else {
      auto consumed = inputs.find(output.type);
      blinding = schemata::crypto::balance_blinding(
          consumed == std::end(inputs)
              ? std::span<const blinding_t>{}
              : std::span<const blinding_t>{consumed->second},
          others);
    }
    others.push_back(blinding);
    items.push_back(assignment_t{
        .seal = output.seal,
        .state = make_fungible_state(std::get<uint64_t>(output.state),
                                     blinding)});
  }
  return out;
}

const contract_schema_t& builder_state::schema() const {
  return schema_;
}

const interface_binding_t& builder_state::binding() const {
  return binding_;
}

}  // namespace schemata::contract
