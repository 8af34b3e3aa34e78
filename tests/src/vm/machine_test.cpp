#include <gtest/gtest.h>
#include <schemata/vm/assembler.hpp>
#include <schemata/vm/machine.hpp>

#include <limits>

using namespace schemata::vm;

namespace {

exec_result_t run(const lib_t& lib,
                  const state_view_t& state = {},
                  const machine_config_t config = {}) {
  auto registry = make_registry({lib});
  auto vm = machine{registry, config};
  return vm.execute(make_site(lib, "main"), state);
}

}  // namespace

TEST(machine, succ_halts_successfully) {
  auto result = run(assembler{"demo"}.entry("main").succ().assemble());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.steps, 1u);
  EXPECT_FALSE(result.error_code.has_value());
}

TEST(machine, fail_reports_errno_from_a8_0) {
  auto result = run(
      assembler{"demo"}.entry("main").put(a8(0), 7).fail().assemble());
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error_code.has_value());
  EXPECT_EQ(*result.error_code, 7);
}

TEST(machine, ret_on_empty_stack_follows_st0) {
  auto equal = run(assembler{"demo"}
                       .entry("main")
                       .put(a64(0), 5)
                       .put(a64(1), 5)
                       .eq(a64(0), a64(1))
                       .ret()
                       .assemble());
  EXPECT_TRUE(equal.success);

  auto unequal = run(assembler{"demo"}
                         .entry("main")
                         .put(a64(0), 5)
                         .put(a64(1), 6)
                         .eq(a64(0), a64(1))
                         .ret()
                         .assemble());
  EXPECT_FALSE(unequal.success);
}

TEST(machine, uninitialized_registers_never_compare_equal) {
  auto result =
      run(assembler{"demo"}.entry("main").eq(a64(0), a64(1)).ret().assemble());
  EXPECT_FALSE(result.success);
}

TEST(machine, add_overflow_clears_st0) {
  auto result = run(assembler{"demo"}
                        .entry("main")
                        .put(a64(0), std::numeric_limits<uint64_t>::max())
                        .put(a64(1), 1)
                        .add(a64(1), a64(0))
                        .ret()
                        .assemble());
  EXPECT_FALSE(result.success);

  auto narrow = run(assembler{"demo"}
                        .entry("main")
                        .put(a8(1), 200)
                        .put(a8(2), 56)
                        .add(a8(2), a8(1))
                        .ret()
                        .assemble());
  EXPECT_FALSE(narrow.success);
}

TEST(machine, sub_and_le) {
  auto result = run(assembler{"demo"}
                        .entry("main")
                        .put(a64(0), 10)
                        .put(a64(1), 4)
                        .sub(a64(1), a64(0))
                        .test()
                        .put(a64(2), 6)
                        .eq(a64(0), a64(2))
                        .test()
                        .le(a64(0), a64(2))
                        .ret()
                        .assemble());
  EXPECT_TRUE(result.success);

  auto underflow = run(assembler{"demo"}
                           .entry("main")
                           .put(a64(0), 3)
                           .put(a64(1), 4)
                           .sub(a64(1), a64(0))
                           .ret()
                           .assemble());
  EXPECT_FALSE(underflow.success);
}

TEST(machine, test_with_clear_st0_fails) {
  auto result = run(assembler{"demo"}
                        .entry("main")
                        .put(a8(0), 3)
                        .put(a64(0), 2)
                        .put(a64(1), 1)
                        .le(a64(0), a64(1))
                        .test()
                        .succ()
                        .assemble());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_code, uint8_t{3});
}

TEST(machine, complexity_limit_stops_loops) {
  auto lib = assembler{"demo"}.entry("main").label("loop").jmp("loop").assemble();
  auto result = run(lib, {}, machine_config_t{.complexity_limit = 100});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.steps, 100u);
}

TEST(machine, call_depth_is_bounded) {
  auto lib = assembler{"demo"}
                 .entry("main")
                 .label("again")
                 .routine("again")
                 .ret()
                 .assemble();
  auto result = run(lib, {}, machine_config_t{.max_call_depth = 4});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.steps, 5u);
}

TEST(machine, local_routine_returns_to_caller) {
  auto lib = assembler{"demo"}
                 .entry("main")
                 .routine("seven")
                 .put(a64(1), 7)
                 .eq(a64(0), a64(1))
                 .ret()
                 .label("seven")
                 .put(a64(0), 7)
                 .ret()
                 .assemble();
  EXPECT_TRUE(run(lib).success);
}

TEST(machine, calls_into_imported_library) {
  auto callee =
      assembler{"callee"}.entry("five").put(a64(0), 5).ret().assemble();
  auto caller = assembler{"caller"}
                    .import(callee)
                    .entry("main")
                    .call(callee, "five")
                    .put(a64(1), 5)
                    .eq(a64(0), a64(1))
                    .ret()
                    .assemble();
  auto registry = make_registry({caller, callee});
  auto vm = machine{registry};
  EXPECT_TRUE(vm.execute(make_site(caller, "main"), {}).success);

  auto alone = make_registry({caller});
  auto unlinked = machine{alone};
  EXPECT_FALSE(unlinked.execute(make_site(caller, "main"), {}).success);
}

TEST(machine, reads_structured_state_and_globals) {
  auto state = state_view_t{};
  state.outputs[4000].push_back(
      schemata::schema::structured_state_t{.data = {0x02, 0x01, 0x00, 0x00}});
  state.globals[2000].push_back({0x2A});
  state.globals[2000].push_back({0x2B});

  auto lib = assembler{"demo"}
                 .entry("main")
                 .put(a16(0), 4000)
                 .put(a16(1), 0)
                 .lds(a16(0), a16(1), s16(0))
                 .test()
                 .extr(s16(0), a32(0), 0)
                 .put(a32(1), 0x0102)
                 .eq(a32(0), a32(1))
                 .test()
                 .put(a16(2), 2000)
                 .cng(a16(2), a16(3))
                 .put(a16(4), 2)
                 .eq(a16(3), a16(4))
                 .test()
                 .put(a16(5), 1)
                 .ldg(a16(2), a16(5), s16(1))
                 .extr(s16(1), a8(1), 0)
                 .put(a8(2), 0x2B)
                 .eq(a8(1), a8(2))
                 .ret()
                 .assemble();
  EXPECT_TRUE(run(lib, state).success);
}

TEST(machine, missing_state_clears_st0) {
  auto lib = assembler{"demo"}
                 .entry("main")
                 .put(a16(0), 4000)
                 .put(a16(1), 0)
                 .ldp(a16(0), a16(1), s16(0))
                 .ret()
                 .assemble();
  EXPECT_FALSE(run(lib).success);
}

TEST(machine, extr_beyond_string_length_fails) {
  auto state = state_view_t{};
  state.globals[2000].push_back({0x01, 0x02});
  auto lib = assembler{"demo"}
                 .entry("main")
                 .put(a16(0), 2000)
                 .put(a16(1), 0)
                 .ldg(a16(0), a16(1), s16(0))
                 .extr(s16(0), a32(0), 0)
                 .ret()
                 .assemble();
  EXPECT_FALSE(run(lib, state).success);
}
