#pragma once
#include <schemata/schema/enum_string.hpp>
#include <schemata/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

// Schema type: state slots.
// A global slot carries a semantic type and an item limit. An owned slot is
// either a fungible amount of a fixed width or structured data of a semantic
// type.
namespace schemata::schema {

enum class fungible_type_t : uint8_t { unsigned_64bit = 8 };

enum class owned_state_kind_t : uint8_t {
  any = 0,
  fungible = 1,
  structured = 2
};

inline constexpr auto kOwnedStateKindMappings = std::array{
    std::pair<std::string_view, owned_state_kind_t>{"any",
                                                    owned_state_kind_t::any},
    std::pair<std::string_view, owned_state_kind_t>{
        "fungible", owned_state_kind_t::fungible},
    std::pair<std::string_view, owned_state_kind_t>{
        "structured", owned_state_kind_t::structured},
};

inline constexpr std::string_view to_string(const owned_state_kind_t value) {
  return to_string_or(value, kOwnedStateKindMappings);
}

struct global_state_schema final {
  sem_id_t sem_id{};
  uint16_t max_items{1};
};

struct fungible_state_schema final {
  fungible_type_t type{fungible_type_t::unsigned_64bit};
};

struct structured_state_schema final {
  sem_id_t sem_id{};
};

using global_state_schema_t = global_state_schema;
using owned_state_schema_t =
    std::variant<fungible_state_schema, structured_state_schema>;

inline owned_state_kind_t kind_of(const owned_state_schema_t& schema) {
  return std::holds_alternative<fungible_state_schema>(schema)
             ? owned_state_kind_t::fungible
             : owned_state_kind_t::structured;
}

}  // namespace schemata::schema
