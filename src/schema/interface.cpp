#include <schemata/blake3/hash.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/schema/interface.hpp>
#include <schemata/schema/interface_binding.hpp>

#include <algorithm>

namespace schemata::schema {

namespace {

template <typename Key>
std::optional<Key> find_key(const std::vector<named_field<Key>>& fields,
                            const std::string_view name) {
  auto it = std::find_if(std::begin(fields), std::end(fields),
                         [&](const auto& field) { return field.name == name; });
  if (it == std::end(fields)) {
    return std::nullopt;
  }
  return it->key;
}

}  // namespace

iface_id_t make_iface_id(const interface_t& iface) {
  auto encoder = encoding::scale_encoder_t{};
  return schemata::blake3::tagged_hash("schemata.interface.v1",
                                       encoder.encode(iface));
}

binding_id_t make_binding_id(const interface_binding_t& binding) {
  auto encoder = encoding::scale_encoder_t{};
  return schemata::blake3::tagged_hash("schemata.binding.v1",
                                       encoder.encode(binding));
}

std::optional<global_state_type_t> find_global(
    const interface_binding_t& binding,
    const std::string_view name) {
  return find_key(binding.global_state, name);
}

std::optional<assignment_type_t> find_assignment(
    const interface_binding_t& binding,
    const std::string_view name) {
  return find_key(binding.assignments, name);
}

std::optional<transition_type_t> find_transition(
    const interface_binding_t& binding,
    const std::string_view name) {
  return find_key(binding.transitions, name);
}

std::optional<std::string> error_name(const interface_binding_t& binding,
                                      const uint8_t code) {
  for (const auto& variant : binding.errors) {
    if (variant.code == code) {
      return variant.name;
    }
  }
  return std::nullopt;
}

}  // namespace schemata::schema
