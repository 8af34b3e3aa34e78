#include <gtest/gtest.h>
#include <schemata/vm/assembler.hpp>
#include <schemata/vm/instruction.hpp>

#include <boost/endian/conversion.hpp>

using namespace schemata::vm;

TEST(assembler, forward_labels_are_patched) {
  auto lib = assembler{"demo"}
                 .entry("main")
                 .jmp("done")
                 .put(a64(0), 1)
                 .label("done")
                 .succ()
                 .assemble();
  auto jump = decode_instruction(lib.code, 0);
  ASSERT_TRUE(jump.has_value());
  EXPECT_EQ(jump->op, opcode_t::jmp);
  EXPECT_EQ(jump->offset,
            size_of(opcode_t::jmp) + size_of(opcode_t::put));
  EXPECT_EQ(boost::endian::load_little_u16(lib.code.data() + 1), jump->offset);
}

TEST(assembler, entries_are_exported_routine_starts) {
  auto lib = assembler{"demo"}
                 .entry("first")
                 .put(a8(0), 1)
                 .ret()
                 .entry("second")
                 .succ()
                 .assemble();
  ASSERT_EQ(lib.routines.size(), 2u);
  EXPECT_EQ(lib.routines.at("first"), 0);
  EXPECT_EQ(lib.routines.at("second"),
            size_of(opcode_t::put) + size_of(opcode_t::ret));
  EXPECT_TRUE(is_routine_start(lib, lib.routines.at("second")));
  // inside the put operands
  EXPECT_FALSE(is_routine_start(lib, 1));
  // an instruction boundary that nobody exports
  EXPECT_FALSE(is_routine_start(lib, size_of(opcode_t::put)));
}

TEST(assembler, undefined_label_is_reported) {
  auto errors = std::vector<std::string>{};
  auto lib = assembler{"demo"}.entry("main").jif("nowhere").ret().try_assemble(
      errors);
  EXPECT_FALSE(lib.has_value());
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("nowhere"), std::string::npos);
}

TEST(assembler, operand_errors_are_collected) {
  auto errors = std::vector<std::string>{};
  auto lib = assembler{"demo"}
                 .entry("main")
                 .put(a8(0), 256)
                 .add(a16(0), a64(0))
                 .label("main")
                 .try_assemble(errors);
  EXPECT_FALSE(lib.has_value());
  EXPECT_GE(errors.size(), 3u);
}

TEST(assembler, call_requires_an_import) {
  auto callee = assembler{"callee"}.entry("one").succ().assemble();
  auto errors = std::vector<std::string>{};
  auto lib =
      assembler{"caller"}.entry("main").call(callee, "one").ret().try_assemble(
          errors);
  EXPECT_FALSE(lib.has_value());

  auto linked = assembler{"caller"}
                    .import(callee)
                    .entry("main")
                    .call(callee, "one")
                    .ret()
                    .assemble();
  ASSERT_EQ(linked.imports.size(), 1u);
  EXPECT_EQ(linked.imports[0], make_lib_id(callee));
  auto call = decode_instruction(linked.code, 0);
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->op, opcode_t::call);
  EXPECT_EQ(call->import, 0);
  EXPECT_EQ(call->offset, callee.routines.at("one"));
}

TEST(assembler, lib_id_ignores_routine_names) {
  auto a = assembler{"a"}.entry("x").succ().assemble();
  auto b = assembler{"b"}.entry("y").succ().assemble();
  auto c = assembler{"a"}.entry("x").fail().assemble();
  EXPECT_EQ(make_lib_id(a), make_lib_id(b));
  EXPECT_NE(make_lib_id(a), make_lib_id(c));
}

TEST(assembler, disassembly_labels_routines) {
  auto lib = assembler{"demo"}.entry("main").put(a64(1), 42).succ().assemble();
  auto lines = disassemble(lib);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "main:");
  EXPECT_NE(lines[1].find("put a64[1], 42"), std::string::npos);
  EXPECT_NE(lines[2].find("succ"), std::string::npos);
}
