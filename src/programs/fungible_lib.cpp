#include <schemata/programs/errno.hpp>
#include <schemata/programs/fungible_lib.hpp>
#include <schemata/programs/util_lib.hpp>
#include <schemata/schema/keys.hpp>
#include <schemata/vm/assembler.hpp>

using namespace schemata::vm;
using namespace schemata::schema;

namespace schemata::programs {

namespace {

lib_t assemble_fungible() {
  const auto& util = util_lib();
  auto code = assembler{"fungible"};
  code.import(util);

  code.entry(kGenesis)
      .put(a8(0), code_of(error_code_t::issued_mismatch))
      .put(a16(3), kGsIssuedSupply.value)
      .put(a16(4), 0)
      .ldg(a16(3), a16(4), s16(1))
      .test()
      .extr(s16(1), a64(3), 0)
      .test()
      .put(a16(0), kOsAsset.value)
      .call(util, kSumOutputs)
      .eq(a64(1), a64(3))
      .test()
      .pcas(a16(0), a64(3))
      .ret();

  code.entry(kTransfer)
      .put(a8(0), code_of(error_code_t::non_equal_amounts))
      .put(a16(0), kOsAsset.value)
      .pcvs(a16(0))
      .test()
      .call(util, kSumInputs)
      .cpy(a64(1), a64(2))
      .call(util, kSumOutputs)
      .eq(a64(1), a64(2))
      .ret();

  return code.assemble();
}

}  // namespace

const lib_t& fungible_lib() {
  static const auto kLib = assemble_fungible();
  return kLib;
}

}  // namespace schemata::programs
