#include <schemata/common/critical.hpp>
#include <schemata/vm/assembler.hpp>

#include <boost/endian/conversion.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace schemata::vm {

assembler::assembler(std::string name) : name_{std::move(name)} {}

assembler& assembler::import(const lib_t& lib) {
  auto id = make_lib_id(lib);
  if (std::find(std::begin(imports_), std::end(imports_), id) ==
      std::end(imports_)) {
    expect(imports_.size() < std::numeric_limits<uint8_t>::max(),
           "too many imports");
    imports_.push_back(id);
  }
  return *this;
}

assembler& assembler::entry(const std::string_view name) {
  label(name);
  expect(routines_.emplace(std::string{name}, here()).second,
         fmt::format("routine '{}' exported twice", name));
  return *this;
}

assembler& assembler::label(const std::string_view name) {
  auto& target = labels_[std::string{name}];
  expect(!target.position.has_value(),
         fmt::format("label '{}' defined twice", name));
  target.position = here();
  return *this;
}

assembler& assembler::fail() {
  return emit(instruction_t{.op = opcode_t::fail});
}

assembler& assembler::succ() {
  return emit(instruction_t{.op = opcode_t::succ});
}

assembler& assembler::ret() {
  return emit(instruction_t{.op = opcode_t::ret});
}

assembler& assembler::test() {
  return emit(instruction_t{.op = opcode_t::test});
}

assembler& assembler::jmp(const std::string_view target) {
  return emit_jump(opcode_t::jmp, target);
}

assembler& assembler::jif(const std::string_view target) {
  return emit_jump(opcode_t::jif, target);
}

assembler& assembler::routine(const std::string_view target) {
  return emit_jump(opcode_t::routine, target);
}

assembler& assembler::call(const lib_t& lib, const std::string_view routine) {
  auto id = make_lib_id(lib);
  auto import = std::find(std::begin(imports_), std::end(imports_), id);
  auto site = try_make_site(lib, routine);
  expect(import != std::end(imports_),
         fmt::format("call into '{}' which is not imported", lib.name));
  expect(site.has_value(),
         fmt::format("library '{}' exports no routine '{}'", lib.name, routine));
  if (import == std::end(imports_) || !site) {
    return *this;
  }
  return emit(instruction_t{
      .op = opcode_t::call,
      .import = static_cast<uint8_t>(std::distance(std::begin(imports_), import)),
      .offset = site->offset});
}

assembler& assembler::put(const reg_t dst, const uint64_t value) {
  expect(is_valid(dst) && is_arithmetic(dst.cls),
         "put needs an arithmetic register");
  expect(dst.cls == reg_class_t::a64 ||
             value < (uint64_t{1} << (8u * width_of(dst.cls))),
         fmt::format("immediate {} does not fit {}", value, to_string(dst.cls)));
  return emit(instruction_t{.op = opcode_t::put, .r0 = dst, .immediate = value});
}

assembler& assembler::cpy(const reg_t src, const reg_t dst) {
  expect(src.cls == dst.cls && is_arithmetic(src.cls),
         "cpy needs two registers of one arithmetic class");
  return emit(instruction_t{.op = opcode_t::cpy, .r0 = src, .r1 = dst});
}

assembler& assembler::add(const reg_t src, const reg_t dst) {
  expect(src.cls == dst.cls && is_arithmetic(src.cls),
         "add needs two registers of one arithmetic class");
  return emit(instruction_t{.op = opcode_t::add, .r0 = src, .r1 = dst});
}

assembler& assembler::sub(const reg_t src, const reg_t dst) {
  expect(src.cls == dst.cls && is_arithmetic(src.cls),
         "sub needs two registers of one arithmetic class");
  return emit(instruction_t{.op = opcode_t::sub, .r0 = src, .r1 = dst});
}

assembler& assembler::dec(const reg_t r) {
  expect(is_arithmetic(r.cls), "dec needs an arithmetic register");
  return emit(instruction_t{.op = opcode_t::dec, .r0 = r});
}

assembler& assembler::eq(const reg_t a, const reg_t b) {
  expect(a.cls == b.cls && is_arithmetic(a.cls),
         "eq needs two registers of one arithmetic class");
  return emit(instruction_t{.op = opcode_t::eq, .r0 = a, .r1 = b});
}

assembler& assembler::le(const reg_t a, const reg_t b) {
  expect(a.cls == b.cls && is_arithmetic(a.cls),
         "le needs two registers of one arithmetic class");
  return emit(instruction_t{.op = opcode_t::le, .r0 = a, .r1 = b});
}

assembler& assembler::extr(const reg_t src,
                           const reg_t dst,
                           const uint16_t offset) {
  expect(src.cls == reg_class_t::s16, "extr reads from a string register");
  expect(is_arithmetic(dst.cls), "extr writes to an arithmetic register");
  return emit(instruction_t{
      .op = opcode_t::extr, .r0 = dst, .s16 = src.index, .offset = offset});
}

assembler& assembler::cnp(const reg_t type, const reg_t dst) {
  return emit_state(opcode_t::cnp, type, dst);
}

assembler& assembler::cns(const reg_t type, const reg_t dst) {
  return emit_state(opcode_t::cns, type, dst);
}

assembler& assembler::cng(const reg_t type, const reg_t dst) {
  return emit_state(opcode_t::cng, type, dst);
}

assembler& assembler::ldp(const reg_t type, const reg_t index, const reg_t dst) {
  expect(dst.cls == reg_class_t::s16, "ldp loads into a string register");
  expect(type.cls == reg_class_t::a16 && index.cls == reg_class_t::a16,
         "ldp takes type and index in a16 registers");
  return emit(instruction_t{
      .op = opcode_t::ldp, .r0 = type, .r1 = index, .s16 = dst.index});
}

assembler& assembler::lds(const reg_t type, const reg_t index, const reg_t dst) {
  expect(dst.cls == reg_class_t::s16, "lds loads into a string register");
  expect(type.cls == reg_class_t::a16 && index.cls == reg_class_t::a16,
         "lds takes type and index in a16 registers");
  return emit(instruction_t{
      .op = opcode_t::lds, .r0 = type, .r1 = index, .s16 = dst.index});
}

assembler& assembler::ldg(const reg_t type, const reg_t index, const reg_t dst) {
  expect(dst.cls == reg_class_t::s16, "ldg loads into a string register");
  expect(type.cls == reg_class_t::a16 && index.cls == reg_class_t::a16,
         "ldg takes type and index in a16 registers");
  return emit(instruction_t{
      .op = opcode_t::ldg, .r0 = type, .r1 = index, .s16 = dst.index});
}

assembler& assembler::pcvs(const reg_t type) {
  expect(type.cls == reg_class_t::a16, "pcvs takes the type in a16");
  return emit(instruction_t{.op = opcode_t::pcvs, .r0 = type});
}

assembler& assembler::pcas(const reg_t type, const reg_t value) {
  expect(type.cls == reg_class_t::a16, "pcas takes the type in a16");
  expect(value.cls == reg_class_t::a64, "pcas takes the value in a64");
  return emit(instruction_t{.op = opcode_t::pcas, .r0 = type, .r1 = value});
}

std::optional<lib_t> assembler::try_assemble(
    std::vector<std::string>& errors) const {
  const auto reported = errors.size();
  errors.insert(std::end(errors), std::begin(errors_), std::end(errors_));

  auto code = code_;
  for (const auto& [name, target] : labels_) {
    if (!target.position) {
      errors.push_back(fmt::format("label '{}' is never defined", name));
      continue;
    }
    for (auto ref : target.refs) {
      boost::endian::store_little_u16(code.data() + ref, *target.position);
    }
  }

  if (errors.size() != reported) {
    return std::nullopt;
  }
  auto lib = lib_t{.name = name_,
                   .code = std::move(code),
                   .imports = imports_,
                   .routines = routines_};
  spdlog::debug("assembled library '{}': {} bytes, {} routines", lib.name,
                lib.code.size(), lib.routines.size());
  return lib;
}

lib_t assembler::assemble() const {
  auto errors = std::vector<std::string>{};
  auto lib = try_assemble(errors);
  if (!lib) {
    for (const auto& error : errors) {
      spdlog::error("{}: {}", name_, error);
    }
    schemata::common::critical("failed to assemble library '{}'", name_);
  }
  return *lib;
}

assembler& assembler::emit(const instruction_t& instruction) {
  const auto start = code_.size();
  encode_instruction(instruction, code_);
  expect(decode_instruction(code_, start).has_value(),
         fmt::format("malformed {} at 0x{:04x}", to_string(instruction.op),
                     start));
  expect(code_.size() <= std::numeric_limits<uint16_t>::max(),
         "library exceeds 64 KiB");
  return *this;
}

assembler& assembler::emit_jump(const opcode_t op,
                                const std::string_view target) {
  // The target operand starts right after the opcode byte.
  labels_[std::string{target}].refs.push_back(code_.size() + 1);
  return emit(instruction_t{.op = op});
}

assembler& assembler::emit_state(const opcode_t op,
                                 const reg_t type,
                                 const reg_t second) {
  expect(type.cls == reg_class_t::a16 && second.cls == reg_class_t::a16,
         fmt::format("{} takes a16 registers", to_string(op)));
  return emit(instruction_t{.op = op, .r0 = type, .r1 = second});
}

void assembler::expect(const bool condition, const std::string_view what) {
  if (!condition) {
    errors_.emplace_back(what);
  }
}

uint16_t assembler::here() {
  return static_cast<uint16_t>(code_.size());
}

}  // namespace schemata::vm
