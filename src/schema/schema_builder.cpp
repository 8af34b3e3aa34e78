#include <schemata/common/critical.hpp>
#include <schemata/schema/schema_builder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace schemata::schema {

namespace {

class checker final {
 public:
  checker(const type_catalog& catalog,
          const std::vector<schemata::vm::lib_t>& libs,
          std::vector<schema_error_t>& errors)
      : catalog_{catalog}, libs_{libs}, errors_{errors} {}

  void fail(const schema_error_code_t code, std::string message) {
    errors_.push_back(schema_error_t{.code = code, .message = std::move(message)});
  }

  std::optional<sem_id_t> resolve(const std::string& name,
                                  const std::string_view where) {
    auto id = catalog_.resolve(name);
    if (!id) {
      fail(schema_error_code_t::unresolved_type,
           fmt::format("{}: unknown semantic type '{}'", where, name));
    }
    return id;
  }

  std::optional<schemata::vm::lib_site_t> resolve(const entry_point_t& entry,
                                                  const std::string_view where) {
    auto lib = std::find_if(
        std::begin(libs_), std::end(libs_),
        [&](const schemata::vm::lib_t& candidate) {
          return candidate.name == entry.lib;
        });
    if (lib == std::end(libs_)) {
      fail(schema_error_code_t::unknown_entry_point,
           fmt::format("{}: no library named '{}'", where, entry.lib));
      return std::nullopt;
    }
    auto site = schemata::vm::try_make_site(*lib, entry.routine);
    if (!site) {
      fail(schema_error_code_t::unknown_entry_point,
           fmt::format("{}: library '{}' exports no routine '{}'", where,
                       entry.lib, entry.routine));
      return std::nullopt;
    }
    if (!schemata::vm::is_routine_start(*lib, site->offset)) {
      fail(schema_error_code_t::misaligned_entry_point,
           fmt::format("{}: {}.{} does not start an instruction", where,
                       entry.lib, entry.routine));
      return std::nullopt;
    }
    return site;
  }

  std::map<global_state_type_t, occurrences_t> globals(
      const contract_schema_t& schema,
      const std::vector<std::pair<global_state_type_t, occurrences_t>>& shape,
      const std::string_view where) {
    auto out = std::map<global_state_type_t, occurrences_t>{};
    for (const auto& [key, occurrences] : shape) {
      auto slot = schema.global_types.find(key);
      if (slot == std::end(schema.global_types)) {
        fail(schema_error_code_t::unknown_key,
             fmt::format("{}: global state type {} is not declared", where,
                         key.value));
        continue;
      }
      if (max_items(occurrences) > slot->second.max_items) {
        fail(schema_error_code_t::invalid_occurrence,
             fmt::format("{}: global state type {} allows {} items, slot "
                         "holds at most {}",
                         where, key.value, to_string(occurrences),
                         slot->second.max_items));
      }
      if (!out.emplace(key, occurrences).second) {
        fail(schema_error_code_t::duplicate_key,
             fmt::format("{}: global state type {} listed twice", where,
                         key.value));
      }
    }
    return out;
  }

  std::map<assignment_type_t, occurrences_t> assignments(
      const contract_schema_t& schema,
      const std::vector<std::pair<assignment_type_t, occurrences_t>>& shape,
      const std::string_view where) {
    auto out = std::map<assignment_type_t, occurrences_t>{};
    for (const auto& [key, occurrences] : shape) {
      if (!schema.owned_types.contains(key)) {
        fail(schema_error_code_t::unknown_key,
             fmt::format("{}: assignment type {} is not declared", where,
                         key.value));
        continue;
      }
      if (!out.emplace(key, occurrences).second) {
        fail(schema_error_code_t::duplicate_key,
             fmt::format("{}: assignment type {} listed twice", where,
                         key.value));
      }
    }
    return out;
  }

 private:
  const type_catalog& catalog_;
  const std::vector<schemata::vm::lib_t>& libs_;
  std::vector<schema_error_t>& errors_;
};

}  // namespace

schema_builder::schema_builder(const type_catalog& catalog,
                               std::vector<schemata::vm::lib_t> libs)
    : catalog_{catalog}, libs_{std::move(libs)} {}

std::optional<contract_schema_t> schema_builder::try_build(
    const schema_config_t& config,
    std::vector<schema_error_t>& errors) const {
  const auto reported = errors.size();
  auto check = checker{catalog_, libs_, errors};

  auto schema = contract_schema_t{};
  schema.name = config.name;
  schema.developer = config.developer;
  schema.timestamp = config.timestamp;
  schema.type_system_id = make_type_system_id(catalog_.type_system());

  for (const auto& slot : config.globals) {
    const auto where = fmt::format("global state type {}", slot.key.value);
    auto sem_id = check.resolve(slot.type_name, where);
    if (slot.max_items == 0) {
      check.fail(schema_error_code_t::invalid_occurrence,
                 fmt::format("{}: max_items must be positive", where));
    }
    auto inserted =
        schema.global_types
            .emplace(slot.key,
                     global_state_schema_t{.sem_id = sem_id.value_or(sem_id_t{}),
                                           .max_items = slot.max_items})
            .second;
    if (!inserted) {
      check.fail(schema_error_code_t::duplicate_key,
                 fmt::format("{}: declared twice", where));
    }
  }

  for (const auto& slot : config.owned) {
    const auto where = fmt::format("assignment type {}", slot.key.value);
    auto state = owned_state_schema_t{fungible_state_schema{}};
    if (slot.kind == owned_state_kind_t::structured) {
      auto sem_id = check.resolve(slot.type_name, where);
      state = structured_state_schema{.sem_id = sem_id.value_or(sem_id_t{})};
    } else if (slot.kind != owned_state_kind_t::fungible) {
      check.fail(schema_error_code_t::unresolved_type,
                 fmt::format("{}: owned state must be fungible or structured",
                             where));
    }
    if (!schema.owned_types.emplace(slot.key, state).second) {
      check.fail(schema_error_code_t::duplicate_key,
                 fmt::format("{}: declared twice", where));
    }
  }

  if (config.genesis.metadata) {
    schema.genesis.metadata = check.resolve(*config.genesis.metadata, "genesis");
  }
  schema.genesis.globals =
      check.globals(schema, config.genesis.globals, "genesis");
  schema.genesis.assignments =
      check.assignments(schema, config.genesis.assignments, "genesis");
  if (config.genesis.validator) {
    schema.genesis.validator = check.resolve(*config.genesis.validator, "genesis");
  }

  for (const auto& shape : config.transitions) {
    const auto where = fmt::format("transition {}", shape.key.value);
    auto transition = transition_schema_t{};
    if (shape.metadata) {
      transition.metadata = check.resolve(*shape.metadata, where);
    }
    transition.globals = check.globals(schema, shape.globals, where);
    transition.inputs = check.assignments(schema, shape.inputs, where);
    transition.assignments = check.assignments(schema, shape.assignments, where);
    if (shape.validator) {
      transition.validator = check.resolve(*shape.validator, where);
    }

    auto required_input = std::any_of(
        std::begin(transition.inputs), std::end(transition.inputs),
        [](const auto& input) { return min_items(input.second) > 0; });
    if (!required_input) {
      check.fail(schema_error_code_t::invalid_occurrence,
                 fmt::format("{}: closes no required input", where));
    }

    if (!schema.transitions.emplace(shape.key, std::move(transition)).second) {
      check.fail(schema_error_code_t::duplicate_key,
                 fmt::format("{}: declared twice", where));
    }
  }

  if (errors.size() != reported) {
    return std::nullopt;
  }
  spdlog::debug("built schema '{}' {}", schema.name,
                to_hex(make_schema_id(schema)));
  return schema;
}

contract_schema_t schema_builder::build(const schema_config_t& config) const {
  auto errors = std::vector<schema_error_t>{};
  auto schema = try_build(config, errors);
  if (!schema) {
    for (const auto& error : errors) {
      spdlog::error("{} [{}]: {}", config.name, to_string(error.code),
                    error.message);
    }
    schemata::common::critical("invalid schema configuration '{}'",
                               config.name);
  }
  return *schema;
}

}  // namespace schemata::schema
