#pragma once

#include <schemata/schema/primitives.hpp>

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemata::vm {

/// Assembled bytecode library.
///
/// `imports` is the table `call` indexes into; `routines` names the exported
/// entry offsets. The id covers code and imports only, so renaming a routine
/// does not change it.
struct lib final {
  std::string name;
  schemata::schema::bytes_t code;
  std::vector<schemata::schema::lib_id_t> imports;
  std::map<std::string, uint16_t> routines;
};

using lib_t = lib;

/// A routine start inside a library.
struct lib_site final {
  schemata::schema::lib_id_t lib_id{};
  uint16_t offset{};

  auto operator<=>(const lib_site&) const = default;
};

using lib_site_t = lib_site;

using lib_registry_t = std::map<schemata::schema::lib_id_t, lib_t>;

schemata::schema::lib_id_t make_lib_id(const lib_t& lib);

/// Site of an exported routine, or nullopt when `routine` is not exported.
std::optional<lib_site_t> try_make_site(const lib_t& lib,
                                        std::string_view routine);
lib_site_t make_site(const lib_t& lib, std::string_view routine);

/// True when `offset` is exported and falls on an instruction boundary.
bool is_routine_start(const lib_t& lib, uint16_t offset);

lib_registry_t make_registry(const std::vector<lib_t>& libs);

/// Human readable listing, one line per instruction, routine names as labels.
std::vector<std::string> disassemble(const lib_t& lib);

}  // namespace schemata::vm
