#include <schemata/contract/validator.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

using namespace schemata::schema;

namespace schemata::contract {

namespace {

class checker final {
 public:
  checker(const contract_schema_t& schema, validation_status_t& status)
      : schema_{schema}, status_{status} {}

  void fail(const failure_kind_t kind, std::string message) {
    status_.failures.push_back(
        failure_t{.kind = kind, .message = std::move(message)});
  }

  void metadata(const std::optional<sem_id_t>& expected,
                const bytes_t& metadata,
                const std::string_view where) {
    if (expected && metadata.empty()) {
      fail(failure_kind_t::metadata_mismatch,
           fmt::format("{} requires metadata", where));
    } else if (!expected && !metadata.empty()) {
      fail(failure_kind_t::metadata_mismatch,
           fmt::format("{} carries unexpected metadata", where));
    }
  }

  void globals(const global_values_t& values,
               const std::map<global_state_type_t, occurrences_t>& allowed,
               const std::string_view where) {
    for (const auto& [key, items] : values) {
      auto slot = schema_.global_types.find(key);
      if (slot == std::end(schema_.global_types) || !allowed.contains(key)) {
        fail(failure_kind_t::unknown_global_type,
             fmt::format("{} may not declare global state type {}", where,
                         key.value));
        continue;
      }
      if (items.size() > slot->second.max_items) {
        fail(failure_kind_t::global_occurrence,
             fmt::format("{}: global state type {} holds at most {} items",
                         where, key.value, slot->second.max_items));
      }
    }
    for (const auto& [key, occurrences] : allowed) {
      auto it = values.find(key);
      auto count = it == std::end(values) ? std::size_t{0} : it->second.size();
      if (!allows(occurrences, count)) {
        fail(failure_kind_t::global_occurrence,
             fmt::format("{}: global state type {} is {}, found {}", where,
                         key.value, to_string(occurrences), count));
      }
    }
  }

  void assignments(const assignments_t& values,
                   const std::map<assignment_type_t, occurrences_t>& allowed,
                   const std::string_view where) {
    for (const auto& [key, items] : values) {
      auto slot = schema_.owned_types.find(key);
      if (slot == std::end(schema_.owned_types) || !allowed.contains(key)) {
        fail(failure_kind_t::unknown_assignment_type,
             fmt::format("{} may not assign type {}", where, key.value));
        continue;
      }
      for (const auto& item : items) {
        state(slot->second, item.state, key, where);
      }
    }
    for (const auto& [key, occurrences] : allowed) {
      auto it = values.find(key);
      auto count = it == std::end(values) ? std::size_t{0} : it->second.size();
      if (!allows(occurrences, count)) {
        fail(failure_kind_t::assignment_occurrence,
             fmt::format("{}: assignment type {} is {}, found {}", where,
                         key.value, to_string(occurrences), count));
      }
    }
  }

  void state(const owned_state_schema_t& slot,
             const owned_state_t& value,
             const assignment_type_t key,
             const std::string_view where) {
    if (kind_of(slot) != kind_of(value)) {
      fail(failure_kind_t::state_kind_mismatch,
           fmt::format("{}: type {} holds {} state, found {}", where,
                       key.value, to_string(kind_of(slot)),
                       to_string(kind_of(value))));
      return;
    }
    if (!opening_consistent(value)) {
      fail(failure_kind_t::commitment_mismatch,
           fmt::format("{}: revealed amount of type {} does not open its "
                       "commitment",
                       where, key.value));
    }
  }

 private:
  const contract_schema_t& schema_;
  validation_status_t& status_;
};

void view_globals(const global_values_t& values, schemata::vm::state_view_t& view) {
  for (const auto& [key, items] : values) {
    view.globals.emplace(key.value, items);
  }
}

void view_outputs(const assignments_t& values, schemata::vm::state_view_t& view) {
  for (const auto& [key, items] : values) {
    auto& states = view.outputs[key.value];
    for (const auto& item : items) {
      states.push_back(item.state);
    }
  }
}

}  // namespace

bool validation_status::contains(const failure_kind_t kind) const {
  return std::any_of(std::begin(failures), std::end(failures),
                     [&](const failure_t& f) { return f.kind == kind; });
}

std::optional<std::string> validation_status::script_error() const {
  for (const auto& f : failures) {
    if (f.kind == failure_kind_t::script_failure && f.error_name) {
      return f.error_name;
    }
  }
  return std::nullopt;
}

validator::validator(contract_schema_t schema,
                     interface_binding_t binding,
                     const std::vector<schemata::vm::lib_t>& scripts,
                     schemata::vm::machine_config_t config)
    : schema_{std::move(schema)},
      binding_{std::move(binding)},
      registry_{schemata::vm::make_registry(scripts)},
      config_{config} {}

validation_status_t validator::validate_genesis(const genesis_t& genesis) const {
  auto status = validation_status_t{};
  auto check = checker{schema_, status};

  if (genesis.schema_id != make_schema_id(schema_)) {
    check.fail(failure_kind_t::schema_mismatch,
               fmt::format("genesis is not of schema '{}'", schema_.name));
  }
  check.metadata(schema_.genesis.metadata, genesis.metadata, "genesis");
  check.globals(genesis.globals, schema_.genesis.globals, "genesis");
  check.assignments(genesis.assignments, schema_.genesis.assignments,
                    "genesis");

  if (!status.valid()) {
    return status;
  }

  auto view = schemata::vm::state_view_t{};
  view_globals(genesis.globals, view);
  view_outputs(genesis.assignments, view);
  run(schema_.genesis.validator, view, status);
  return status;
}

validation_status_t validator::validate_transition(
    const transition_t& transition,
    const contract_id_t& contract_id,
    const std::map<opout_t, assignment_t>& prior) const {
  auto status = validation_status_t{};
  auto check = checker{schema_, status};

  if (transition.contract_id != contract_id) {
    check.fail(failure_kind_t::contract_mismatch,
               fmt::format("transition belongs to contract {}",
                           to_hex(transition.contract_id)));
  }
  auto shape = schema_.transitions.find(transition.transition_type);
  if (shape == std::end(schema_.transitions)) {
    check.fail(failure_kind_t::unknown_transition_type,
               fmt::format("schema '{}' has no transition type {}",
                           schema_.name, transition.transition_type.value));
    return status;
  }

  const auto where =
      fmt::format("transition {}", transition.transition_type.value);
  check.metadata(shape->second.metadata, transition.metadata, where);
  check.globals(transition.globals, shape->second.globals, where);
  check.assignments(transition.assignments, shape->second.assignments, where);

  auto view = schemata::vm::state_view_t{};
  auto spent = std::set<opout_t>{};
  auto counts = std::map<assignment_type_t, std::size_t>{};
  for (const auto& input : transition.inputs) {
    if (!spent.insert(input).second) {
      check.fail(failure_kind_t::input_occurrence,
                 fmt::format("{}: input {}:{} spent twice", where,
                             input.type.value, input.index));
      continue;
    }
    auto slot = schema_.owned_types.find(input.type);
    if (slot == std::end(schema_.owned_types) ||
        !shape->second.inputs.contains(input.type)) {
      check.fail(failure_kind_t::unknown_assignment_type,
                 fmt::format("{} may not spend type {}", where,
                             input.type.value));
      continue;
    }
    auto assignment = prior.find(input);
    if (assignment == std::end(prior)) {
      check.fail(failure_kind_t::missing_input,
                 fmt::format("{}: input {}:{} of {} is unknown", where,
                             input.type.value, input.index, to_hex(input.op)));
      continue;
    }
    check.state(slot->second, assignment->second.state, input.type, where);
    ++counts[input.type];
    view.inputs[input.type.value].push_back(assignment->second.state);
  }
  for (const auto& [key, occurrences] : shape->second.inputs) {
    auto it = counts.find(key);
    auto count = it == std::end(counts) ? std::size_t{0} : it->second;
    if (!allows(occurrences, count)) {
      check.fail(failure_kind_t::input_occurrence,
                 fmt::format("{}: input type {} is {}, found {}", where,
                             key.value, to_string(occurrences), count));
    }
  }

  if (!status.valid()) {
    return status;
  }

  view_globals(transition.globals, view);
  view_outputs(transition.assignments, view);
  run(shape->second.validator, view, status);
  return status;
}

void validator::run(const std::optional<schemata::vm::lib_site_t>& entry,
                    const schemata::vm::state_view_t& view,
                    validation_status_t& status) const {
  if (!entry) {
    return;
  }
  auto machine = schemata::vm::machine{registry_, config_};
  auto result = machine.execute(*entry, view);
  if (result.success) {
    spdlog::debug("'{}' script passed in {} steps", schema_.name,
                  result.steps);
    return;
  }

  auto failed = failure_t{.kind = failure_kind_t::script_failure,
                          .message = result.message,
                          .error_code = result.error_code};
  if (result.error_code) {
    failed.error_name = error_name(binding_, *result.error_code);
  }
  spdlog::warn("'{}' script failed with errno {} ({}): {}", schema_.name,
               result.error_code ? fmt::format("{}", *result.error_code)
                                 : std::string{"none"},
               failed.error_name.value_or("unnamed"), result.message);
  status.failures.push_back(std::move(failed));
}

}  // namespace schemata::contract
