#pragma once

#include <schemata/schema/owned_state.hpp>
#include <schemata/schema/primitives.hpp>
#include <schemata/schema/seal.hpp>

#include <cstdint>

namespace schemata::testing {

inline schemata::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = schemata::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline schemata::schema::seal_t make_seal(const uint8_t seed,
                                          const uint32_t vout = 0) {
  return schemata::schema::seal_t{
      .method = schemata::schema::close_method_t::tapret_first,
      .outpoint = schemata::schema::outpoint_t{.txid = make_hash(seed),
                                               .vout = vout},
      .blinding = seed};
}

/// Blinding with a single low byte set, well below the group order.
inline schemata::schema::blinding_t make_blinding(const uint8_t value) {
  auto out = schemata::schema::blinding_t{};
  out[31] = value;
  return out;
}

}  // namespace schemata::testing
