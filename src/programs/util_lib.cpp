#include <schemata/programs/errno.hpp>
#include <schemata/programs/util_lib.hpp>
#include <schemata/vm/assembler.hpp>

using namespace schemata::vm;

namespace schemata::programs {

namespace {

// Count with cnt, then walk the states from the last index down to zero.
void emit_sum(assembler& code,
              const std::string_view name,
              const bool inputs) {
  const auto loop = std::string{name} + ".loop";
  const auto done = std::string{name} + ".done";

  code.entry(name).put(a64(1), 0).put(a16(2), 0);
  if (inputs) {
    code.cnp(a16(0), a16(1));
  } else {
    code.cns(a16(0), a16(1));
  }
  code.label(loop).eq(a16(1), a16(2)).jif(done).dec(a16(1));
  if (inputs) {
    code.ldp(a16(0), a16(1), s16(0));
  } else {
    code.lds(a16(0), a16(1), s16(0));
  }
  code.test()
      .extr(s16(0), a64(0), 0)
      .test()
      .add(a64(0), a64(1))
      .jif(loop)
      .jmp("overflow")
      .label(done)
      .ret();
}

lib_t assemble_util() {
  auto code = assembler{"util"};
  emit_sum(code, kSumInputs, true);
  emit_sum(code, kSumOutputs, false);

  code.entry(kCalcChange)
      .routine(kSumOutputs)
      .cpy(a64(1), a64(2))
      .routine(kSumInputs)
      .sub(a64(2), a64(1))
      .jif("calc_change.done")
      .put(a8(0), code_of(error_code_t::non_equal_amounts))
      .fail()
      .label("calc_change.done")
      .ret();

  code.label("overflow")
      .put(a8(0), code_of(error_code_t::amount_overflow))
      .fail();
  return code.assemble();
}

}  // namespace

const lib_t& util_lib() {
  static const auto kLib = assemble_util();
  return kLib;
}

}  // namespace schemata::programs
