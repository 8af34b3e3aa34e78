#pragma once

#include <schemata/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace schemata::vm {

enum class reg_class_t : uint8_t { a8 = 0, a16 = 1, a32 = 2, a64 = 3, s16 = 4 };

inline constexpr auto kRegClassMappings = std::array{
    std::pair<std::string_view, reg_class_t>{"a8", reg_class_t::a8},
    std::pair<std::string_view, reg_class_t>{"a16", reg_class_t::a16},
    std::pair<std::string_view, reg_class_t>{"a32", reg_class_t::a32},
    std::pair<std::string_view, reg_class_t>{"a64", reg_class_t::a64},
    std::pair<std::string_view, reg_class_t>{"s16", reg_class_t::s16},
};

inline constexpr std::string_view to_string(const reg_class_t value) {
  return schemata::schema::to_string_or(value, kRegClassMappings);
}

inline constexpr auto kArithmeticRegisters = uint8_t{32};
inline constexpr auto kStringRegisters = uint8_t{16};

struct reg final {
  reg_class_t cls{reg_class_t::a8};
  uint8_t index{};

  bool operator==(const reg&) const = default;
};

using reg_t = reg;

constexpr bool is_arithmetic(const reg_class_t cls) {
  return cls != reg_class_t::s16;
}

constexpr bool is_valid(const reg_t& r) {
  switch (r.cls) {
    case reg_class_t::a8:
    case reg_class_t::a16:
    case reg_class_t::a32:
    case reg_class_t::a64:
      return r.index < kArithmeticRegisters;
    case reg_class_t::s16:
      return r.index < kStringRegisters;
  }
  return false;
}

/// Width in bytes of an arithmetic register class.
constexpr uint8_t width_of(const reg_class_t cls) {
  switch (cls) {
    case reg_class_t::a8:
      return 1;
    case reg_class_t::a16:
      return 2;
    case reg_class_t::a32:
      return 4;
    case reg_class_t::a64:
      return 8;
    case reg_class_t::s16:
      return 0;
  }
  return 0;
}

constexpr reg_t a8(const uint8_t index) {
  return reg_t{reg_class_t::a8, index};
}
constexpr reg_t a16(const uint8_t index) {
  return reg_t{reg_class_t::a16, index};
}
constexpr reg_t a32(const uint8_t index) {
  return reg_t{reg_class_t::a32, index};
}
constexpr reg_t a64(const uint8_t index) {
  return reg_t{reg_class_t::a64, index};
}
constexpr reg_t s16(const uint8_t index) {
  return reg_t{reg_class_t::s16, index};
}

enum class opcode_t : uint8_t {
  // control flow
  fail = 0x00,
  succ = 0x01,
  jmp = 0x02,
  jif = 0x03,
  routine = 0x04,
  call = 0x05,
  ret = 0x06,
  test = 0x07,
  // arithmetic
  put = 0x10,
  cpy = 0x11,
  add = 0x12,
  sub = 0x13,
  dec = 0x14,
  eq = 0x15,
  le = 0x16,
  // bytes
  extr = 0x20,
  // contract state
  cnp = 0x30,
  cns = 0x31,
  cng = 0x32,
  ldp = 0x33,
  lds = 0x34,
  ldg = 0x35,
  pcvs = 0x36,
  pcas = 0x37
};

inline constexpr auto kOpcodeMappings = std::array{
    std::pair<std::string_view, opcode_t>{"fail", opcode_t::fail},
    std::pair<std::string_view, opcode_t>{"succ", opcode_t::succ},
    std::pair<std::string_view, opcode_t>{"jmp", opcode_t::jmp},
    std::pair<std::string_view, opcode_t>{"jif", opcode_t::jif},
    std::pair<std::string_view, opcode_t>{"routine", opcode_t::routine},
    std::pair<std::string_view, opcode_t>{"call", opcode_t::call},
    std::pair<std::string_view, opcode_t>{"ret", opcode_t::ret},
    std::pair<std::string_view, opcode_t>{"test", opcode_t::test},
    std::pair<std::string_view, opcode_t>{"put", opcode_t::put},
    std::pair<std::string_view, opcode_t>{"cpy", opcode_t::cpy},
    std::pair<std::string_view, opcode_t>{"add", opcode_t::add},
    std::pair<std::string_view, opcode_t>{"sub", opcode_t::sub},
    std::pair<std::string_view, opcode_t>{"dec", opcode_t::dec},
    std::pair<std::string_view, opcode_t>{"eq", opcode_t::eq},
    std::pair<std::string_view, opcode_t>{"le", opcode_t::le},
    std::pair<std::string_view, opcode_t>{"extr", opcode_t::extr},
    std::pair<std::string_view, opcode_t>{"cnp", opcode_t::cnp},
    std::pair<std::string_view, opcode_t>{"cns", opcode_t::cns},
    std::pair<std::string_view, opcode_t>{"cng", opcode_t::cng},
    std::pair<std::string_view, opcode_t>{"ldp", opcode_t::ldp},
    std::pair<std::string_view, opcode_t>{"lds", opcode_t::lds},
    std::pair<std::string_view, opcode_t>{"ldg", opcode_t::ldg},
    std::pair<std::string_view, opcode_t>{"pcvs", opcode_t::pcvs},
    std::pair<std::string_view, opcode_t>{"pcas", opcode_t::pcas},
};

inline constexpr std::string_view to_string(const opcode_t value) {
  return schemata::schema::to_string_or(value, kOpcodeMappings);
}

inline constexpr std::optional<opcode_t> try_make_opcode(const uint8_t byte) {
  for (const auto& [name, op] : kOpcodeMappings) {
    if (static_cast<uint8_t>(op) == byte) {
      return op;
    }
  }
  return std::nullopt;
}

/// Encoded size in bytes, opcode included.
constexpr uint16_t size_of(const opcode_t op) {
  switch (op) {
    case opcode_t::fail:
    case opcode_t::succ:
    case opcode_t::ret:
    case opcode_t::test:
      return 1;
    case opcode_t::jmp:
    case opcode_t::jif:
    case opcode_t::routine:
    case opcode_t::dec:
    case opcode_t::pcvs:
      return 3;
    case opcode_t::call:
      return 4;
    case opcode_t::cpy:
    case opcode_t::add:
    case opcode_t::sub:
    case opcode_t::eq:
    case opcode_t::le:
    case opcode_t::cnp:
    case opcode_t::cns:
    case opcode_t::cng:
    case opcode_t::pcas:
      return 5;
    case opcode_t::extr:
    case opcode_t::ldp:
    case opcode_t::lds:
    case opcode_t::ldg:
      return 6;
    case opcode_t::put:
      return 11;
  }
  return 0;
}

}  // namespace schemata::vm
