#pragma once
#include <schemata/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

// Pedersen commitments over secp256k1: C = r*G + v*H.
//
// H is derived by try-and-increment from a BLAKE3 domain tag so nobody knows
// its discrete log relative to G. The point at infinity is encoded as 33 zero
// bytes, any other point in compressed SEC1 form.
namespace schemata::crypto {

using commitment_t = std::array<uint8_t, 33>;

/// True when the OpenSSL build provides secp256k1.
bool available();

commitment_t commit(uint64_t value, const schemata::schema::blinding_t& blinding);

/// Check whether `blinding` and `value` open `commitment`.
bool verify_opening(const commitment_t& commitment,
                    uint64_t value,
                    const schemata::schema::blinding_t& blinding);

/// Sum(inputs) == Sum(outputs). Both sides empty compares infinity with
/// infinity and holds.
bool verify_commit_sum(std::span<const commitment_t> inputs,
                       std::span<const commitment_t> outputs);

/// Sum(outputs) == value*H, i.e. the outputs open to `value` with a zero
/// total blinding.
bool verify_commit_value(std::span<const commitment_t> outputs, uint64_t value);

/// Deterministic blinding factor reduced modulo the group order.
schemata::schema::blinding_t derive_blinding(
    const schemata::schema::hash32_t& seed,
    std::string_view tag,
    uint64_t index);

/// Returns r with sum(inputs) == sum(others) + r modulo the group order.
schemata::schema::blinding_t balance_blinding(
    std::span<const schemata::schema::blinding_t> inputs,
    std::span<const schemata::schema::blinding_t> others);

}  // namespace schemata::crypto
