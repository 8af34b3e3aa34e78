#include <schemata/blake3/hash.hpp>
#include <schemata/common/critical.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/vm/instruction.hpp>
#include <schemata/vm/lib.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace schemata::vm {

namespace {

constexpr auto kLibContext = std::string_view{"schemata.vm-lib.v1"};

}  // namespace

// The id commits to the code and the import table only, so renaming a
// library or its routines keeps its id.
schemata::schema::lib_id_t make_lib_id(const lib_t& lib) {
  auto encoder = schemata::schema::encoding::scale_encoder_t{};
  auto encoded = schemata::schema::bytes_t{};
  encoder.encode(lib.code, encoded);
  encoder.encode(lib.imports, encoded);
  return schemata::blake3::tagged_hash(kLibContext, encoded);
}

std::optional<lib_site_t> try_make_site(const lib_t& lib,
                                        const std::string_view routine) {
  auto it = lib.routines.find(std::string{routine});
  if (it == std::end(lib.routines)) {
    return std::nullopt;
  }
  return lib_site_t{.lib_id = make_lib_id(lib), .offset = it->second};
}

lib_site_t make_site(const lib_t& lib, const std::string_view routine) {
  auto site = try_make_site(lib, routine);
  if (!site) {
    schemata::common::critical("library '{}' exports no routine '{}'",
                               lib.name, routine);
  }
  return *site;
}

bool is_routine_start(const lib_t& lib, const uint16_t offset) {
  auto exported = std::any_of(
      std::begin(lib.routines), std::end(lib.routines),
      [&](const auto& routine) { return routine.second == offset; });
  if (!exported) {
    return false;
  }
  auto pc = std::size_t{0};
  while (pc < offset) {
    auto instruction = decode_instruction(lib.code, pc);
    if (!instruction) {
      return false;
    }
    pc += instruction->size;
  }
  return pc == offset && pc < lib.code.size();
}

lib_registry_t make_registry(const std::vector<lib_t>& libs) {
  auto registry = lib_registry_t{};
  for (const auto& lib : libs) {
    registry.emplace(make_lib_id(lib), lib);
  }
  return registry;
}

std::vector<std::string> disassemble(const lib_t& lib) {
  auto labels = std::map<uint16_t, std::string>{};
  for (const auto& [name, offset] : lib.routines) {
    labels.emplace(offset, name);
  }

  auto lines = std::vector<std::string>{};
  auto pc = std::size_t{0};
  while (pc < lib.code.size()) {
    auto label = labels.find(static_cast<uint16_t>(pc));
    if (label != std::end(labels)) {
      lines.push_back(fmt::format("{}:", label->second));
    }
    auto instruction = decode_instruction(lib.code, pc);
    if (!instruction) {
      lines.push_back(fmt::format("  0x{:04x}  .byte 0x{:02x}", pc,
                                  lib.code[pc]));
      ++pc;
      continue;
    }
    lines.push_back(fmt::format("  0x{:04x}  {}", pc, to_string(*instruction)));
    pc += instruction->size;
  }
  return lines;
}

}  // namespace schemata::vm
