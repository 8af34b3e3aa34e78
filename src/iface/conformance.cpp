#include <schemata/iface/conformance.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

using namespace schemata::schema;

namespace schemata::iface {

namespace {

class collector final {
 public:
  void add(const mismatch_kind_t kind,
           std::string field,
           std::string message) {
    mismatches_.push_back(mismatch_t{
        .kind = kind, .field = std::move(field), .message = std::move(message)});
  }

  std::optional<conformance_error_t> finish() {
    if (mismatches_.empty()) {
      return std::nullopt;
    }
    return conformance_error_t{.mismatches = std::move(mismatches_)};
  }

 private:
  std::vector<mismatch_t> mismatches_;
};

template <typename Key, typename Declared, typename CheckKey>
void check_fields(const std::map<std::string, Declared>& declared,
                  const std::vector<named_field<Key>>& bound,
                  const std::string_view space,
                  collector& out,
                  CheckKey&& check_key) {
  auto names = std::set<std::string>{};
  auto keys = std::set<Key>{};
  for (const auto& field : bound) {
    if (!names.insert(field.name).second) {
      out.add(mismatch_kind_t::duplicate_name, field.name,
              fmt::format("{} '{}' bound twice", space, field.name));
    }
    if (!keys.insert(field.key).second) {
      out.add(mismatch_kind_t::duplicate_key, field.name,
              fmt::format("{} key {} bound twice", space, field.key.value));
    }
    auto it = declared.find(field.name);
    if (it == std::end(declared)) {
      out.add(mismatch_kind_t::unknown_field, field.name,
              fmt::format("interface declares no {} '{}'", space, field.name));
      continue;
    }
    check_key(field, it->second);
  }
  for (const auto& [name, field] : declared) {
    if (field.required && !names.contains(name)) {
      out.add(mismatch_kind_t::missing_field, name,
              fmt::format("required {} '{}' is not bound", space, name));
    }
  }
}

void check_errors(const interface_t& iface,
                  const interface_binding_t& binding,
                  collector& out) {
  auto codes = std::set<uint8_t>{};
  auto names = std::set<std::string>{};
  for (const auto& variant : binding.errors) {
    if (!codes.insert(variant.code).second) {
      out.add(mismatch_kind_t::duplicate_error_code, variant.name,
              fmt::format("error code {} bound twice", variant.code));
    }
    if (!names.insert(variant.name).second) {
      out.add(mismatch_kind_t::duplicate_error_name, variant.name,
              fmt::format("error '{}' bound twice", variant.name));
    }
    if (std::find(std::begin(iface.errors), std::end(iface.errors),
                  variant.name) == std::end(iface.errors)) {
      out.add(mismatch_kind_t::unknown_error_name, variant.name,
              fmt::format("interface declares no error '{}'", variant.name));
    }
  }
}

void check_state_abi(const interface_binding_t& binding,
                     const std::vector<schemata::vm::lib_t>& scripts,
                     collector& out) {
  if (!binding.state_abi) {
    return;
  }
  auto registry = schemata::vm::make_registry(scripts);
  const auto sites = std::array{
      std::pair<std::string_view, schemata::vm::lib_site_t>{
          "reg_input", binding.state_abi->reg_input},
      std::pair<std::string_view, schemata::vm::lib_site_t>{
          "reg_output", binding.state_abi->reg_output},
      std::pair<std::string_view, schemata::vm::lib_site_t>{
          "calc_output", binding.state_abi->calc_output},
      std::pair<std::string_view, schemata::vm::lib_site_t>{
          "calc_change", binding.state_abi->calc_change},
  };
  for (const auto& [name, site] : sites) {
    auto lib = registry.find(site.lib_id);
    if (lib == std::end(registry)) {
      out.add(mismatch_kind_t::invalid_state_abi, std::string{name},
              fmt::format("{} names an unknown library", name));
      continue;
    }
    if (!schemata::vm::is_routine_start(lib->second, site.offset)) {
      out.add(mismatch_kind_t::invalid_state_abi, std::string{name},
              fmt::format("{} is not a routine start of '{}'", name,
                          lib->second.name));
    }
  }
}

void check_all(const interface_t& iface,
               const interface_binding_t& binding,
               const contract_schema_t& schema,
               collector& out) {
  if (binding.schema_id != make_schema_id(schema)) {
    out.add(mismatch_kind_t::schema_id, {},
            fmt::format("binding targets another schema than '{}'",
                        schema.name));
  }
  if (binding.iface_id != make_iface_id(iface)) {
    out.add(mismatch_kind_t::iface_id, {},
            fmt::format("binding targets another interface than '{}'",
                        iface.name));
  }

  check_fields(
      iface.global_state, binding.global_state, "global state", out,
      [&](const named_field<global_state_type_t>& field,
          const iface_global_t& declared) {
        auto slot = schema.global_types.find(field.key);
        if (slot == std::end(schema.global_types)) {
          out.add(mismatch_kind_t::unknown_key, field.name,
                  fmt::format("global state type {} is not in the schema",
                              field.key.value));
          return;
        }
        if (declared.sem_id && *declared.sem_id != slot->second.sem_id) {
          out.add(mismatch_kind_t::sem_type, field.name,
                  fmt::format("global '{}' has another semantic type",
                              field.name));
        }
        if (!declared.multiple && slot->second.max_items != 1) {
          out.add(mismatch_kind_t::multiplicity, field.name,
                  fmt::format("global '{}' is single but the slot holds {}",
                              field.name, slot->second.max_items));
        }
      });

  check_fields(
      iface.assignments, binding.assignments, "assignment", out,
      [&](const named_field<assignment_type_t>& field,
          const iface_assignment_t& declared) {
        auto slot = schema.owned_types.find(field.key);
        if (slot == std::end(schema.owned_types)) {
          out.add(mismatch_kind_t::unknown_key, field.name,
                  fmt::format("assignment type {} is not in the schema",
                              field.key.value));
          return;
        }
        auto kind = kind_of(slot->second);
        if (declared.kind != owned_state_kind_t::any && declared.kind != kind) {
          out.add(mismatch_kind_t::state_kind, field.name,
                  fmt::format("assignment '{}' is {} but the slot is {}",
                              field.name, to_string(declared.kind),
                              to_string(kind)));
          return;
        }
        const auto* structured =
            std::get_if<structured_state_schema>(&slot->second);
        if (structured != nullptr && declared.sem_id &&
            *declared.sem_id != structured->sem_id) {
          out.add(mismatch_kind_t::sem_type, field.name,
                  fmt::format("assignment '{}' has another semantic type",
                              field.name));
        }
      });

  check_fields(
      iface.transitions, binding.transitions, "transition", out,
      [&](const named_field<transition_type_t>& field,
          const iface_transition_t&) {
        if (!schema.transitions.contains(field.key)) {
          out.add(mismatch_kind_t::unknown_key, field.name,
                  fmt::format("transition type {} is not in the schema",
                              field.key.value));
        }
      });

  check_errors(iface, binding, out);
}

void log_result(const interface_t& iface,
                const contract_schema_t& schema,
                const std::optional<conformance_error_t>& result) {
  if (!result) {
    spdlog::debug("'{}' conforms to '{}'", schema.name, iface.name);
    return;
  }
  for (const auto& mismatch : result->mismatches) {
    spdlog::warn("'{}' does not conform to '{}': [{}] {}", schema.name,
                 iface.name, to_string(mismatch.kind), mismatch.message);
  }
}

}  // namespace

bool conformance_error::contains(const mismatch_kind_t kind) const {
  return std::any_of(std::begin(mismatches), std::end(mismatches),
                     [&](const mismatch_t& m) { return m.kind == kind; });
}

bool conformance_error::contains(const mismatch_kind_t kind,
                                 const std::string_view field) const {
  return std::any_of(std::begin(mismatches), std::end(mismatches),
                     [&](const mismatch_t& m) {
                       return m.kind == kind && m.field == field;
                     });
}

std::optional<conformance_error_t> check_conformance(
    const interface_t& iface,
    const interface_binding_t& binding,
    const contract_schema_t& schema) {
  auto out = collector{};
  check_all(iface, binding, schema, out);
  auto result = out.finish();
  log_result(iface, schema, result);
  return result;
}

std::optional<conformance_error_t> check_conformance(
    const interface_t& iface,
    const interface_binding_t& binding,
    const contract_schema_t& schema,
    const std::vector<schemata::vm::lib_t>& scripts) {
  auto out = collector{};
  check_all(iface, binding, schema, out);
  check_state_abi(binding, scripts, out);
  auto result = out.finish();
  log_result(iface, schema, result);
  return result;
}

}  // namespace schemata::iface
