#include <schemata/programs/errno.hpp>
#include <schemata/programs/fungible_lib.hpp>
#include <schemata/programs/inflatable_lib.hpp>
#include <schemata/programs/util_lib.hpp>
#include <schemata/schema/keys.hpp>
#include <schemata/vm/assembler.hpp>

using namespace schemata::vm;
using namespace schemata::schema;

namespace schemata::programs {

namespace {

// a64[dst] = first item of the global state `key`.
void load_amount(assembler& code,
                 const global_state_type_t key,
                 const reg_t dst) {
  code.put(a16(3), key.value)
      .put(a16(4), 0)
      .ldg(a16(3), a16(4), s16(1))
      .test()
      .extr(s16(1), dst, 0)
      .test();
}

lib_t assemble_inflatable() {
  const auto& util = util_lib();
  const auto& fungible = fungible_lib();
  auto code = assembler{"inflatable"};
  code.import(util).import(fungible);

  code.entry(kGenesis).call(fungible, kGenesis).test().put(
      a8(0), code_of(error_code_t::inflation_mismatch));
  load_amount(code, kGsMaxSupply, a64(4));
  code.sub(a64(3), a64(4))
      .test()
      .put(a16(0), kOsInflationAllowance.value)
      .call(util, kSumOutputs)
      .eq(a64(1), a64(4))
      .test()
      .pcas(a16(0), a64(4))
      .ret();

  code.entry(kIssue).put(a8(0), code_of(error_code_t::inflation_mismatch));
  load_amount(code, kGsIssuedSupply, a64(3));
  code.put(a16(0), kOsAsset.value)
      .call(util, kSumOutputs)
      .eq(a64(1), a64(3))
      .test()
      .pcas(a16(0), a64(3))
      .test()
      .put(a8(0), code_of(error_code_t::inflation_exceeds_allowance))
      .put(a16(0), kOsInflationAllowance.value)
      .call(util, kSumInputs)
      .cpy(a64(1), a64(4))
      .le(a64(3), a64(4))
      .test()
      .put(a8(0), code_of(error_code_t::inflation_mismatch))
      .sub(a64(3), a64(4))
      .call(util, kSumOutputs)
      .eq(a64(1), a64(4))
      .ret();

  return code.assemble();
}

}  // namespace

const lib_t& inflatable_lib() {
  static const auto kLib = assemble_inflatable();
  return kLib;
}

}  // namespace schemata::programs
