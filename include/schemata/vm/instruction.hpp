#pragma once

#include <schemata/schema/primitives.hpp>
#include <schemata/vm/opcode.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace schemata::vm {

/// One decoded instruction. Only the operands of `op` are meaningful.
///
/// Operand layout in the byte stream (registers take two bytes, class then
/// index; string registers in `s16` take one byte; integers are little
/// endian):
///
///   fail succ ret test        op
///   jmp jif routine           op u16:target
///   call                      op u8:import u16:offset
///   put                       op reg u64:value
///   cpy add sub eq le         op reg reg
///   dec                       op reg
///   extr                      op s16 reg u16:offset
///   cnp cns cng               op reg:type reg:dst
///   ldp lds ldg               op reg:type reg:index s16
///   pcvs                      op reg:type
///   pcas                      op reg:type reg:value
struct instruction final {
  opcode_t op{opcode_t::fail};
  reg_t r0{};
  reg_t r1{};
  uint8_t s16{};
  uint8_t import{};
  uint16_t offset{};
  uint64_t immediate{};
  uint16_t size{1};
};

using instruction_t = instruction;

/// Decode the instruction at `pc`. Returns nullopt on an unknown opcode, a
/// truncated operand, a register of the wrong class or an immediate wider
/// than its register.
std::optional<instruction_t> decode_instruction(
    const schemata::schema::bytes_view_t& code,
    std::size_t pc);

void encode_instruction(const instruction_t& instruction,
                        schemata::schema::bytes_t& out);

std::string to_string(const instruction_t& instruction);

}  // namespace schemata::vm
