#include <schemata/vm/instruction.hpp>

#include <boost/endian/conversion.hpp>
#include <fmt/format.h>

#include <array>
#include <limits>

namespace schemata::vm {

namespace {

std::optional<reg_t> read_reg(const schemata::schema::bytes_view_t& code,
                              const std::size_t at) {
  if (code[at] > static_cast<uint8_t>(reg_class_t::s16)) {
    return std::nullopt;
  }
  auto r = reg_t{static_cast<reg_class_t>(code[at]), code[at + 1]};
  if (!is_valid(r)) {
    return std::nullopt;
  }
  return r;
}

bool fits(const reg_class_t cls, const uint64_t value) {
  if (cls == reg_class_t::a64) {
    return true;
  }
  return value < (uint64_t{1} << (8u * width_of(cls)));
}

bool arithmetic(const std::optional<reg_t>& r) {
  return r.has_value() && is_arithmetic(r->cls);
}

bool of_class(const std::optional<reg_t>& r, const reg_class_t cls) {
  return r.has_value() && r->cls == cls;
}

void write_reg(const reg_t& r, schemata::schema::bytes_t& out) {
  out.push_back(static_cast<uint8_t>(r.cls));
  out.push_back(r.index);
}

void write_u16(const uint16_t value, schemata::schema::bytes_t& out) {
  auto buffer = std::array<uint8_t, 2>{};
  boost::endian::store_little_u16(buffer.data(), value);
  out.insert(std::end(out), std::begin(buffer), std::end(buffer));
}

void write_u64(const uint64_t value, schemata::schema::bytes_t& out) {
  auto buffer = std::array<uint8_t, 8>{};
  boost::endian::store_little_u64(buffer.data(), value);
  out.insert(std::end(out), std::begin(buffer), std::end(buffer));
}

std::string reg_name(const reg_t& r) {
  return fmt::format("{}[{}]", to_string(r.cls), r.index);
}

}  // namespace

std::optional<instruction_t> decode_instruction(
    const schemata::schema::bytes_view_t& code,
    const std::size_t pc) {
  if (pc >= code.size()) {
    return std::nullopt;
  }
  auto op = try_make_opcode(code[pc]);
  if (!op) {
    return std::nullopt;
  }
  auto instruction = instruction_t{.op = *op, .size = size_of(*op)};
  if (pc + instruction.size > code.size()) {
    return std::nullopt;
  }
  const auto* operands = code.data() + pc + 1;

  switch (*op) {
    case opcode_t::fail:
    case opcode_t::succ:
    case opcode_t::ret:
    case opcode_t::test:
      return instruction;

    case opcode_t::jmp:
    case opcode_t::jif:
    case opcode_t::routine:
      instruction.offset = boost::endian::load_little_u16(operands);
      return instruction;

    case opcode_t::call:
      instruction.import = operands[0];
      instruction.offset = boost::endian::load_little_u16(operands + 1);
      return instruction;

    case opcode_t::put: {
      auto dst = read_reg(code, pc + 1);
      if (!arithmetic(dst)) {
        return std::nullopt;
      }
      instruction.r0 = *dst;
      instruction.immediate = boost::endian::load_little_u64(operands + 2);
      if (!fits(dst->cls, instruction.immediate)) {
        return std::nullopt;
      }
      return instruction;
    }

    case opcode_t::cpy:
    case opcode_t::add:
    case opcode_t::sub:
    case opcode_t::eq:
    case opcode_t::le: {
      auto a = read_reg(code, pc + 1);
      auto b = read_reg(code, pc + 3);
      if (!arithmetic(a) || !arithmetic(b) || a->cls != b->cls) {
        return std::nullopt;
      }
      instruction.r0 = *a;
      instruction.r1 = *b;
      return instruction;
    }

    case opcode_t::dec: {
      auto r = read_reg(code, pc + 1);
      if (!arithmetic(r)) {
        return std::nullopt;
      }
      instruction.r0 = *r;
      return instruction;
    }

    case opcode_t::extr: {
      instruction.s16 = operands[0];
      auto dst = read_reg(code, pc + 2);
      if (instruction.s16 >= kStringRegisters || !arithmetic(dst)) {
        return std::nullopt;
      }
      instruction.r0 = *dst;
      instruction.offset = boost::endian::load_little_u16(operands + 3);
      return instruction;
    }

    case opcode_t::cnp:
    case opcode_t::cns:
    case opcode_t::cng: {
      auto type = read_reg(code, pc + 1);
      auto dst = read_reg(code, pc + 3);
      if (!of_class(type, reg_class_t::a16) ||
          !of_class(dst, reg_class_t::a16)) {
        return std::nullopt;
      }
      instruction.r0 = *type;
      instruction.r1 = *dst;
      return instruction;
    }

    case opcode_t::ldp:
    case opcode_t::lds:
    case opcode_t::ldg: {
      auto type = read_reg(code, pc + 1);
      auto index = read_reg(code, pc + 3);
      instruction.s16 = operands[4];
      if (!of_class(type, reg_class_t::a16) ||
          !of_class(index, reg_class_t::a16) ||
          instruction.s16 >= kStringRegisters) {
        return std::nullopt;
      }
      instruction.r0 = *type;
      instruction.r1 = *index;
      return instruction;
    }

    case opcode_t::pcvs: {
      auto type = read_reg(code, pc + 1);
      if (!of_class(type, reg_class_t::a16)) {
        return std::nullopt;
      }
      instruction.r0 = *type;
      return instruction;
    }

    case opcode_t::pcas: {
      auto type = read_reg(code, pc + 1);
      auto value = read_reg(code, pc + 3);
      if (!of_class(type, reg_class_t::a16) ||
          !of_class(value, reg_class_t::a64)) {
        return std::nullopt;
      }
      instruction.r0 = *type;
      instruction.r1 = *value;
      return instruction;
    }
  }
  return std::nullopt;
}

void encode_instruction(const instruction_t& instruction,
                        schemata::schema::bytes_t& out) {
  out.push_back(static_cast<uint8_t>(instruction.op));
  switch (instruction.op) {
    case opcode_t::fail:
    case opcode_t::succ:
    case opcode_t::ret:
    case opcode_t::test:
      break;
    case opcode_t::jmp:
    case opcode_t::jif:
    case opcode_t::routine:
      write_u16(instruction.offset, out);
      break;
    case opcode_t::call:
      out.push_back(instruction.import);
      write_u16(instruction.offset, out);
      break;
    case opcode_t::put:
      write_reg(instruction.r0, out);
      write_u64(instruction.immediate, out);
      break;
    case opcode_t::cpy:
    case opcode_t::add:
    case opcode_t::sub:
    case opcode_t::eq:
    case opcode_t::le:
    case opcode_t::cnp:
    case opcode_t::cns:
    case opcode_t::cng:
    case opcode_t::pcas:
      write_reg(instruction.r0, out);
      write_reg(instruction.r1, out);
      break;
    case opcode_t::dec:
    case opcode_t::pcvs:
      write_reg(instruction.r0, out);
      break;
    case opcode_t::extr:
      out.push_back(instruction.s16);
      write_reg(instruction.r0, out);
      write_u16(instruction.offset, out);
      break;
    case opcode_t::ldp:
    case opcode_t::lds:
    case opcode_t::ldg:
      write_reg(instruction.r0, out);
      write_reg(instruction.r1, out);
      out.push_back(instruction.s16);
      break;
  }
}

std::string to_string(const instruction_t& instruction) {
  const auto name = to_string(instruction.op);
  switch (instruction.op) {
    case opcode_t::fail:
    case opcode_t::succ:
    case opcode_t::ret:
    case opcode_t::test:
      return std::string{name};
    case opcode_t::jmp:
    case opcode_t::jif:
    case opcode_t::routine:
      return fmt::format("{} 0x{:04x}", name, instruction.offset);
    case opcode_t::call:
      return fmt::format("{} 0x{:04x}@{}", name, instruction.offset,
                         instruction.import);
    case opcode_t::put:
      return fmt::format("{} {}, {}", name, reg_name(instruction.r0),
                         instruction.immediate);
    case opcode_t::cpy:
    case opcode_t::add:
    case opcode_t::sub:
    case opcode_t::eq:
    case opcode_t::le:
    case opcode_t::cnp:
    case opcode_t::cns:
    case opcode_t::cng:
    case opcode_t::pcas:
      return fmt::format("{} {}, {}", name, reg_name(instruction.r0),
                         reg_name(instruction.r1));
    case opcode_t::dec:
    case opcode_t::pcvs:
      return fmt::format("{} {}", name, reg_name(instruction.r0));
    case opcode_t::extr:
      return fmt::format("{} s16[{}], {}, {}", name, instruction.s16,
                         reg_name(instruction.r0), instruction.offset);
    case opcode_t::ldp:
    case opcode_t::lds:
    case opcode_t::ldg:
      return fmt::format("{} {}, {}, s16[{}]", name, reg_name(instruction.r0),
                         reg_name(instruction.r1), instruction.s16);
  }
  return std::string{name};
}

}  // namespace schemata::vm
