#pragma once

#include <schemata/vm/instruction.hpp>
#include <schemata/vm/lib.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemata::vm {

/// Builds a library from symbolic instructions.
///
/// Jump targets name labels; a label used before it is defined is recorded
/// as a reference and patched by assemble(). entry() defines a label and
/// exports it as a routine. call() resolves the routine offset in an
/// imported library by name, so no offset is ever written by hand.
///
/// Operand errors do not stop the chain; they are collected and reported by
/// try_assemble().
class assembler final {
 public:
  explicit assembler(std::string name);

  assembler& import(const lib_t& lib);
  assembler& entry(std::string_view name);
  assembler& label(std::string_view name);

  assembler& fail();
  assembler& succ();
  assembler& ret();
  assembler& test();
  assembler& jmp(std::string_view target);
  assembler& jif(std::string_view target);
  assembler& routine(std::string_view target);
  assembler& call(const lib_t& lib, std::string_view routine);

  assembler& put(reg_t dst, uint64_t value);
  assembler& cpy(reg_t src, reg_t dst);
  /// dst = dst + src. Overflow clears st0 and resets dst.
  assembler& add(reg_t src, reg_t dst);
  /// dst = dst - src. Underflow clears st0 and resets dst.
  assembler& sub(reg_t src, reg_t dst);
  assembler& dec(reg_t r);
  assembler& eq(reg_t a, reg_t b);
  /// st0 = a <= b
  assembler& le(reg_t a, reg_t b);

  assembler& extr(reg_t src, reg_t dst, uint16_t offset);

  assembler& cnp(reg_t type, reg_t dst);
  assembler& cns(reg_t type, reg_t dst);
  assembler& cng(reg_t type, reg_t dst);
  assembler& ldp(reg_t type, reg_t index, reg_t dst);
  assembler& lds(reg_t type, reg_t index, reg_t dst);
  assembler& ldg(reg_t type, reg_t index, reg_t dst);
  assembler& pcvs(reg_t type);
  assembler& pcas(reg_t type, reg_t value);

  std::optional<lib_t> try_assemble(std::vector<std::string>& errors) const;
  lib_t assemble() const;

 private:
  struct label_t final {
    std::optional<uint16_t> position;
    std::vector<std::size_t> refs;
  };

  assembler& emit(const instruction_t& instruction);
  assembler& emit_jump(opcode_t op, std::string_view target);
  assembler& emit_state(opcode_t op, reg_t type, reg_t second);
  void expect(bool condition, std::string_view what);
  uint16_t here();

  std::string name_;
  schemata::schema::bytes_t code_;
  std::vector<schemata::schema::lib_id_t> imports_;
  std::map<std::string, uint16_t> routines_;
  std::map<std::string, label_t, std::less<>> labels_;
  std::vector<std::string> errors_;
};

}  // namespace schemata::vm
