#include <schemata/crypto/pedersen.hpp>
#include <schemata/vm/instruction.hpp>
#include <schemata/vm/machine.hpp>

#include <boost/endian/conversion.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <limits>

namespace schemata::vm {

namespace {

struct registers_t final {
  std::array<std::array<std::optional<uint64_t>, kArithmeticRegisters>, 4> a;
  std::array<std::optional<schemata::schema::bytes_t>, kStringRegisters> s;
  bool st0{true};

  std::optional<uint64_t>& at(const reg_t& r) {
    return a[static_cast<std::size_t>(r.cls)][r.index];
  }
};

struct frame_t final {
  const lib_t* lib{nullptr};
  std::size_t pc{};
};

uint64_t max_value(const reg_class_t cls) {
  if (cls == reg_class_t::a64) {
    return std::numeric_limits<uint64_t>::max();
  }
  return (uint64_t{1} << (8u * width_of(cls))) - 1;
}

uint64_t load_little(const uint8_t* data, const uint8_t width) {
  switch (width) {
    case 1:
      return data[0];
    case 2:
      return boost::endian::load_little_u16(data);
    case 4:
      return boost::endian::load_little_u32(data);
    default:
      return boost::endian::load_little_u64(data);
  }
}

// Bytes a program sees for an owned state. A fungible state is exposed as
// its 8 byte little endian value followed by the 32 byte blinding, and only
// when the opening matches the commitment.
std::optional<schemata::schema::bytes_t> state_bytes(
    const schemata::schema::owned_state_t& state) {
  return std::visit(
      overloaded{
          [](const schemata::schema::fungible_state_t& value)
              -> std::optional<schemata::schema::bytes_t> {
            if (!value.revealed || !schemata::schema::opening_consistent(value)) {
              return std::nullopt;
            }
            auto out = schemata::schema::bytes_t(8);
            boost::endian::store_little_u64(out.data(), value.revealed->value);
            out.insert(std::end(out), std::begin(value.revealed->blinding),
                       std::end(value.revealed->blinding));
            return out;
          },
          [](const schemata::schema::structured_state_t& value)
              -> std::optional<schemata::schema::bytes_t> {
            return value.data;
          }},
      state);
}

template <typename T>
const std::vector<T>& states_of(const std::map<uint16_t, std::vector<T>>& all,
                                const uint16_t type) {
  static const auto kEmpty = std::vector<T>{};
  auto it = all.find(type);
  return it == std::end(all) ? kEmpty : it->second;
}

std::optional<std::vector<schemata::crypto::commitment_t>> commitments_of(
    const std::vector<schemata::schema::owned_state_t>& states) {
  auto out = std::vector<schemata::crypto::commitment_t>{};
  out.reserve(states.size());
  for (const auto& state : states) {
    const auto* fungible = std::get_if<schemata::schema::fungible_state_t>(&state);
    if (fungible == nullptr) {
      return std::nullopt;
    }
    out.push_back(fungible->commitment);
  }
  return out;
}

}  // namespace

machine::machine(const lib_registry_t& libs, machine_config_t config)
    : libs_{libs}, config_{config} {}

exec_result_t machine::execute(const lib_site_t& entry,
                               const state_view_t& state) const {
  auto result = exec_result_t{};
  auto regs = registers_t{};
  auto frames = std::vector<frame_t>{};

  auto halt = [&](const bool success, std::string message) {
    result.success = success;
    result.message = std::move(message);
    if (!success) {
      if (auto code = regs.at(a8(0)); code.has_value()) {
        result.error_code = static_cast<uint8_t>(*code);
      }
    }
    spdlog::debug("vm halted after {} steps: {} {}", result.steps,
                  success ? "success" : "failure", result.message);
    return result;
  };

  auto entry_lib = libs_.find(entry.lib_id);
  if (entry_lib == std::end(libs_)) {
    return halt(false, "entry point names an unknown library");
  }
  const auto* lib = &entry_lib->second;
  auto pc = std::size_t{entry.offset};

  while (true) {
    if (result.steps >= config_.complexity_limit) {
      return halt(false, "complexity limit exceeded");
    }
    ++result.steps;

    auto decoded = decode_instruction(lib->code, pc);
    if (!decoded) {
      return halt(false, fmt::format("invalid instruction at {}:0x{:04x}",
                                     lib->name, pc));
    }
    const auto& ins = *decoded;
    auto next = pc + ins.size;

    switch (ins.op) {
      case opcode_t::fail:
        regs.st0 = false;
        return halt(false, "fail");

      case opcode_t::succ:
        regs.st0 = true;
        return halt(true, {});

      case opcode_t::jmp:
        next = ins.offset;
        break;

      case opcode_t::jif:
        if (regs.st0) {
          next = ins.offset;
        }
        break;

      case opcode_t::routine:
        if (frames.size() >= config_.max_call_depth) {
          return halt(false, "call stack overflow");
        }
        frames.push_back(frame_t{.lib = lib, .pc = next});
        next = ins.offset;
        break;

      case opcode_t::call: {
        if (ins.import >= lib->imports.size()) {
          return halt(false, fmt::format("import {} out of range", ins.import));
        }
        auto callee = libs_.find(lib->imports[ins.import]);
        if (callee == std::end(libs_)) {
          return halt(false,
                      fmt::format("unresolved import {} of '{}'", ins.import,
                                  lib->name));
        }
        if (frames.size() >= config_.max_call_depth) {
          return halt(false, "call stack overflow");
        }
        frames.push_back(frame_t{.lib = lib, .pc = next});
        lib = &callee->second;
        next = ins.offset;
        break;
      }

      case opcode_t::ret:
        if (frames.empty()) {
          return halt(regs.st0, regs.st0 ? std::string{} : "st0 clear on return");
        }
        lib = frames.back().lib;
        next = frames.back().pc;
        frames.pop_back();
        break;

      case opcode_t::test:
        if (!regs.st0) {
          return halt(false, "test failed");
        }
        break;

      case opcode_t::put:
        regs.at(ins.r0) = ins.immediate;
        break;

      case opcode_t::cpy:
        regs.at(ins.r1) = regs.at(ins.r0);
        break;

      case opcode_t::add: {
        const auto src = regs.at(ins.r0);
        auto& dst = regs.at(ins.r1);
        if (!src || !dst || *dst > max_value(ins.r1.cls) - *src) {
          dst.reset();
          regs.st0 = false;
        } else {
          *dst += *src;
          regs.st0 = true;
        }
        break;
      }

      case opcode_t::sub: {
        const auto src = regs.at(ins.r0);
        auto& dst = regs.at(ins.r1);
        if (!src || !dst || *dst < *src) {
          dst.reset();
          regs.st0 = false;
        } else {
          *dst -= *src;
          regs.st0 = true;
        }
        break;
      }

      case opcode_t::dec: {
        auto& r = regs.at(ins.r0);
        if (!r || *r == 0) {
          r.reset();
          regs.st0 = false;
        } else {
          --*r;
          regs.st0 = true;
        }
        break;
      }

      case opcode_t::eq: {
        const auto a = regs.at(ins.r0);
        const auto b = regs.at(ins.r1);
        regs.st0 = a && b && *a == *b;
        break;
      }

      case opcode_t::le: {
        const auto a = regs.at(ins.r0);
        const auto b = regs.at(ins.r1);
        regs.st0 = a && b && *a <= *b;
        break;
      }

      case opcode_t::extr: {
        const auto& src = regs.s[ins.s16];
        auto& dst = regs.at(ins.r0);
        const auto width = width_of(ins.r0.cls);
        if (!src || std::size_t{ins.offset} + width > src->size()) {
          dst.reset();
          regs.st0 = false;
          break;
        }
        dst = load_little(src->data() + ins.offset, width);
        regs.st0 = true;
        break;
      }

      case opcode_t::cnp:
      case opcode_t::cns:
      case opcode_t::cng: {
        const auto type = regs.at(ins.r0);
        auto& dst = regs.at(ins.r1);
        if (!type) {
          dst.reset();
          regs.st0 = false;
          break;
        }
        const auto type_value = static_cast<uint16_t>(*type);
        auto count = std::size_t{0};
        if (ins.op == opcode_t::cnp) {
          count = states_of(state.inputs, type_value).size();
        } else if (ins.op == opcode_t::cns) {
          count = states_of(state.outputs, type_value).size();
        } else {
          count = states_of(state.globals, type_value).size();
        }
        if (count > max_value(reg_class_t::a16)) {
          dst.reset();
          regs.st0 = false;
          break;
        }
        dst = count;
        regs.st0 = true;
        break;
      }

      case opcode_t::ldp:
      case opcode_t::lds:
      case opcode_t::ldg: {
        const auto type = regs.at(ins.r0);
        const auto index = regs.at(ins.r1);
        auto& dst = regs.s[ins.s16];
        dst.reset();
        regs.st0 = false;
        if (!type || !index) {
          break;
        }
        const auto type_value = static_cast<uint16_t>(*type);
        if (ins.op == opcode_t::ldg) {
          const auto& items = states_of(state.globals, type_value);
          if (*index < items.size()) {
            dst = items[*index];
            regs.st0 = true;
          }
          break;
        }
        const auto& states = ins.op == opcode_t::ldp
                                 ? states_of(state.inputs, type_value)
                                 : states_of(state.outputs, type_value);
        if (*index < states.size()) {
          dst = state_bytes(states[*index]);
          regs.st0 = dst.has_value();
        }
        break;
      }

      case opcode_t::pcvs: {
        const auto type = regs.at(ins.r0);
        regs.st0 = false;
        if (!type) {
          break;
        }
        const auto type_value = static_cast<uint16_t>(*type);
        auto in = commitments_of(states_of(state.inputs, type_value));
        auto out = commitments_of(states_of(state.outputs, type_value));
        regs.st0 = in && out && schemata::crypto::verify_commit_sum(*in, *out);
        break;
      }

      case opcode_t::pcas: {
        const auto type = regs.at(ins.r0);
        const auto value = regs.at(ins.r1);
        regs.st0 = false;
        if (!type || !value) {
          break;
        }
        auto out = commitments_of(
            states_of(state.outputs, static_cast<uint16_t>(*type)));
        regs.st0 = out && schemata::crypto::verify_commit_value(*out, *value);
        break;
      }
    }

    pc = next;
  }
}

}  // namespace schemata::vm
