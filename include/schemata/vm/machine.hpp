#pragma once

#include <schemata/vm/lib.hpp>
#include <schemata/vm/state_view.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace schemata::vm {

struct machine_config final {
  uint32_t complexity_limit{65536};
  uint8_t max_call_depth{32};
};

using machine_config_t = machine_config;

struct exec_result final {
  bool success{false};
  // Value of a8[0] when the program failed, the program's errno.
  std::optional<uint8_t> error_code;
  uint32_t steps{0};
  std::string message;
};

using exec_result_t = exec_result;

/// Register machine running validation programs.
///
/// Each execute() call owns a fresh register file, so a machine can be shared
/// across threads as long as the library registry is not modified.
///
/// A program halts successfully on `succ`, or on `ret` with an empty call
/// stack while st0 is set. It fails on `fail`, on `test` with st0 clear, on
/// `ret` with an empty stack and st0 clear, on a malformed instruction, and
/// when the complexity limit or call depth is exceeded.
class machine final {
 public:
  explicit machine(const lib_registry_t& libs, machine_config_t config = {});

  exec_result_t execute(const lib_site_t& entry, const state_view_t& state) const;

 private:
  const lib_registry_t& libs_;
  machine_config_t config_;
};

}  // namespace schemata::vm
