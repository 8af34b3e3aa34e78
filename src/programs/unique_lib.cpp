#include <schemata/programs/errno.hpp>
#include <schemata/programs/unique_lib.hpp>
#include <schemata/schema/allocation.hpp>
#include <schemata/schema/keys.hpp>
#include <schemata/vm/assembler.hpp>

using namespace schemata::vm;
using namespace schemata::schema;

namespace schemata::programs {

namespace {

constexpr auto kCheckAllocation = std::string_view{"check_allocation"};

lib_t assemble_unique() {
  auto code = assembler{"unique"};

  // The token index is the first field of the token data.
  code.entry(kGenesis)
      .put(a8(0), code_of(error_code_t::unknown_token))
      .put(a16(3), kGsTokens.value)
      .put(a16(4), 0)
      .ldg(a16(3), a16(4), s16(1))
      .test()
      .extr(s16(1), a32(0), 0)
      .test()
      .jmp(kCheckAllocation);

  code.entry(kTransfer)
      .put(a8(0), code_of(error_code_t::unknown_token))
      .put(a16(0), kOsAsset.value)
      .put(a16(4), 0)
      .ldp(a16(0), a16(4), s16(1))
      .test()
      .extr(s16(1), a32(0), kAllocationIndexOffset)
      .test();
  // falls through

  code.label(kCheckAllocation)
      .put(a16(0), kOsAsset.value)
      .put(a16(4), 0)
      .lds(a16(0), a16(4), s16(1))
      .test()
      .extr(s16(1), a32(1), kAllocationIndexOffset)
      .test()
      .eq(a32(0), a32(1))
      .test()
      .put(a8(0), code_of(error_code_t::non_fractional_token))
      .extr(s16(1), a64(0), kAllocationFractionOffset)
      .test()
      .put(a64(1), 1)
      .eq(a64(0), a64(1))
      .ret();

  return code.assemble();
}

}  // namespace

const lib_t& unique_lib() {
  static const auto kLib = assemble_unique();
  return kLib;
}

}  // namespace schemata::programs
