#pragma once

#include <schemata/schema/contract_schema.hpp>
#include <schemata/schema/enum_string.hpp>
#include <schemata/schema/interface.hpp>
#include <schemata/schema/interface_binding.hpp>
#include <schemata/vm/lib.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemata::iface {

enum class mismatch_kind_t : uint8_t {
  schema_id = 0,
  iface_id = 1,
  missing_field = 2,
  unknown_field = 3,
  unknown_key = 4,
  state_kind = 5,
  sem_type = 6,
  multiplicity = 7,
  duplicate_name = 8,
  duplicate_key = 9,
  duplicate_error_code = 10,
  duplicate_error_name = 11,
  unknown_error_name = 12,
  invalid_state_abi = 13
};

inline constexpr auto kMismatchKindMappings = std::array{
    std::pair<std::string_view, mismatch_kind_t>{"schema_id",
                                                 mismatch_kind_t::schema_id},
    std::pair<std::string_view, mismatch_kind_t>{"iface_id",
                                                 mismatch_kind_t::iface_id},
    std::pair<std::string_view, mismatch_kind_t>{
        "missing_field", mismatch_kind_t::missing_field},
    std::pair<std::string_view, mismatch_kind_t>{
        "unknown_field", mismatch_kind_t::unknown_field},
    std::pair<std::string_view, mismatch_kind_t>{"unknown_key",
                                                 mismatch_kind_t::unknown_key},
    std::pair<std::string_view, mismatch_kind_t>{"state_kind",
                                                 mismatch_kind_t::state_kind},
    std::pair<std::string_view, mismatch_kind_t>{"sem_type",
                                                 mismatch_kind_t::sem_type},
    std::pair<std::string_view, mismatch_kind_t>{
        "multiplicity", mismatch_kind_t::multiplicity},
    std::pair<std::string_view, mismatch_kind_t>{
        "duplicate_name", mismatch_kind_t::duplicate_name},
    std::pair<std::string_view, mismatch_kind_t>{
        "duplicate_key", mismatch_kind_t::duplicate_key},
    std::pair<std::string_view, mismatch_kind_t>{
        "duplicate_error_code", mismatch_kind_t::duplicate_error_code},
    std::pair<std::string_view, mismatch_kind_t>{
        "duplicate_error_name", mismatch_kind_t::duplicate_error_name},
    std::pair<std::string_view, mismatch_kind_t>{
        "unknown_error_name", mismatch_kind_t::unknown_error_name},
    std::pair<std::string_view, mismatch_kind_t>{
        "invalid_state_abi", mismatch_kind_t::invalid_state_abi},
};

inline constexpr std::string_view to_string(const mismatch_kind_t value) {
  return schemata::schema::to_string_or(value, kMismatchKindMappings);
}

struct mismatch final {
  mismatch_kind_t kind;
  std::string field;
  std::string message;
};

using mismatch_t = mismatch;

struct conformance_error final {
  std::vector<mismatch_t> mismatches;

  bool contains(mismatch_kind_t kind) const;
  bool contains(mismatch_kind_t kind, std::string_view field) const;
};

using conformance_error_t = conformance_error;

/// Check that `binding` legally implements `iface` for `schema`.
///
/// Returns nullopt when it does, otherwise every mismatch found. The overload
/// taking libraries also checks that state ABI sites land on routine starts.
std::optional<conformance_error_t> check_conformance(
    const schemata::schema::interface_t& iface,
    const schemata::schema::interface_binding_t& binding,
    const schemata::schema::contract_schema_t& schema);

std::optional<conformance_error_t> check_conformance(
    const schemata::schema::interface_t& iface,
    const schemata::schema::interface_binding_t& binding,
    const schemata::schema::contract_schema_t& schema,
    const std::vector<schemata::vm::lib_t>& scripts);

}  // namespace schemata::iface
