#include <schemata/blake3/hash.hpp>
#include <schemata/common/critical.hpp>
#include <schemata/crypto/pedersen.hpp>

#include <boost/endian/conversion.hpp>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>

namespace schemata::crypto {

namespace {

using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

constexpr auto kGeneratorContext =
    std::string_view{"schemata.pedersen.generator.v1"};
constexpr auto kBlindingContext =
    std::string_view{"schemata.pedersen.blinding.v1"};
constexpr auto kMaxGeneratorAttempts = uint32_t{256};

struct curve_t final {
  ec_group_ptr group{nullptr, EC_GROUP_free};
  ec_point_ptr h{nullptr, EC_POINT_free};
  bignum_ptr order{nullptr, BN_free};
};

curve_t make_curve() {
  auto curve = curve_t{};
  curve.group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
  if (!curve.group) {
    ERR_clear_error();
    return curve;
  }

  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  curve.order.reset(BN_new());
  if (!ctx || !curve.order ||
      EC_GROUP_get_order(curve.group.get(), curve.order.get(), ctx.get()) !=
          1) {
    curve.group.reset();
    return curve;
  }

  auto point = ec_point_ptr{EC_POINT_new(curve.group.get()), EC_POINT_free};
  auto x = bignum_ptr{BN_new(), BN_free};
  if (!point || !x) {
    curve.group.reset();
    return curve;
  }

  for (auto counter = uint32_t{0}; counter < kMaxGeneratorAttempts; ++counter) {
    auto tag = std::array<uint8_t, 4>{};
    boost::endian::store_little_u32(tag.data(), counter);
    auto digest = schemata::blake3::tagged_hash(kGeneratorContext, tag);
    if (BN_bin2bn(digest.data(), static_cast<int>(digest.size()), x.get()) ==
        nullptr) {
      break;
    }
    if (EC_POINT_set_compressed_coordinates(curve.group.get(), point.get(),
                                            x.get(), 0, ctx.get()) == 1) {
      curve.h = std::move(point);
      return curve;
    }
    // x had no square root, try the next candidate.
    ERR_clear_error();
  }

  curve.group.reset();
  return curve;
}

const curve_t& secp256k1() {
  static const auto curve = make_curve();
  if (!curve.group) {
    schemata::common::critical("secp256k1 is not available in this OpenSSL");
  }
  return curve;
}

bn_ctx_ptr make_ctx() {
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!ctx) {
    schemata::common::critical("failed to allocate BN_CTX");
  }
  return ctx;
}

bignum_ptr make_scalar(const schemata::schema::blinding_t& bytes,
                       BN_CTX* ctx) {
  const auto& curve = secp256k1();
  auto scalar = bignum_ptr{
      BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr),
      BN_free};
  if (!scalar || BN_nnmod(scalar.get(), scalar.get(), curve.order.get(),
                          ctx) != 1) {
    schemata::common::critical("failed to reduce blinding factor");
  }
  return scalar;
}

schemata::schema::blinding_t to_blinding(const BIGNUM* scalar) {
  auto out = schemata::schema::blinding_t{};
  if (BN_bn2binpad(scalar, out.data(), static_cast<int>(out.size())) !=
      static_cast<int>(out.size())) {
    schemata::common::critical("blinding factor does not fit in 32 bytes");
  }
  return out;
}

ec_point_ptr new_point() {
  auto point = ec_point_ptr{EC_POINT_new(secp256k1().group.get()),
                            EC_POINT_free};
  if (!point) {
    schemata::common::critical("failed to allocate EC_POINT");
  }
  return point;
}

ec_point_ptr commit_point(const uint64_t value,
                          const schemata::schema::blinding_t& blinding,
                          BN_CTX* ctx) {
  const auto& curve = secp256k1();
  auto r = make_scalar(blinding, ctx);
  auto v = bignum_ptr{BN_new(), BN_free};
  if (!v || BN_set_word(v.get(), value) != 1) {
    schemata::common::critical("failed to load committed value");
  }
  auto point = new_point();
  if (EC_POINT_mul(curve.group.get(), point.get(), r.get(), curve.h.get(),
                   v.get(), ctx) != 1) {
    schemata::common::critical("failed to compute commitment");
  }
  return point;
}

// Returns an empty pointer when the bytes are not a point on the curve.
ec_point_ptr decode_point(const commitment_t& commitment, BN_CTX* ctx) {
  const auto& curve = secp256k1();
  auto point = new_point();
  if (std::all_of(commitment.begin(), commitment.end(),
                  [](const uint8_t b) { return b == 0; })) {
    EC_POINT_set_to_infinity(curve.group.get(), point.get());
    return point;
  }
  if (EC_POINT_oct2point(curve.group.get(), point.get(), commitment.data(),
                         commitment.size(), ctx) != 1) {
    ERR_clear_error();
    return ec_point_ptr{nullptr, EC_POINT_free};
  }
  return point;
}

commitment_t encode_point(const EC_POINT* point, BN_CTX* ctx) {
  const auto& curve = secp256k1();
  auto out = commitment_t{};
  if (EC_POINT_is_at_infinity(curve.group.get(), point) == 1) {
    return out;
  }
  if (EC_POINT_point2oct(curve.group.get(), point,
                         POINT_CONVERSION_COMPRESSED, out.data(), out.size(),
                         ctx) != out.size()) {
    schemata::common::critical("failed to serialize commitment");
  }
  return out;
}

ec_point_ptr sum_points(std::span<const commitment_t> commitments,
                        BN_CTX* ctx) {
  const auto& curve = secp256k1();
  auto total = new_point();
  EC_POINT_set_to_infinity(curve.group.get(), total.get());
  for (const auto& commitment : commitments) {
    auto point = decode_point(commitment, ctx);
    if (!point) {
      return point;
    }
    if (EC_POINT_add(curve.group.get(), total.get(), total.get(), point.get(),
                     ctx) != 1) {
      schemata::common::critical("failed to add commitments");
    }
  }
  return total;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                              EC_GROUP_free};
    if (!group) {
      ERR_clear_error();
      return false;
    }
    return true;
  }();
  return available_now;
}

commitment_t commit(const uint64_t value,
                    const schemata::schema::blinding_t& blinding) {
  auto ctx = make_ctx();
  auto point = commit_point(value, blinding, ctx.get());
  return encode_point(point.get(), ctx.get());
}

bool verify_opening(const commitment_t& commitment,
                    const uint64_t value,
                    const schemata::schema::blinding_t& blinding) {
  return commit(value, blinding) == commitment;
}

bool verify_commit_sum(std::span<const commitment_t> inputs,
                       std::span<const commitment_t> outputs) {
  auto ctx = make_ctx();
  auto in = sum_points(inputs, ctx.get());
  auto out = sum_points(outputs, ctx.get());
  if (!in || !out) {
    return false;
  }
  return EC_POINT_cmp(secp256k1().group.get(), in.get(), out.get(),
                      ctx.get()) == 0;
}

bool verify_commit_value(std::span<const commitment_t> outputs,
                         const uint64_t value) {
  auto ctx = make_ctx();
  auto out = sum_points(outputs, ctx.get());
  if (!out) {
    return false;
  }
  auto expected = commit_point(value, schemata::schema::blinding_t{}, ctx.get());
  return EC_POINT_cmp(secp256k1().group.get(), out.get(), expected.get(),
                      ctx.get()) == 0;
}

schemata::schema::blinding_t derive_blinding(
    const schemata::schema::hash32_t& seed,
    const std::string_view tag,
    const uint64_t index) {
  auto index_bytes = std::array<uint8_t, 8>{};
  boost::endian::store_little_u64(index_bytes.data(), index);
  auto digest = schemata::blake3::hasher{kBlindingContext}
                    .update(seed)
                    .update(tag)
                    .update(index_bytes)
                    .finalize();
  auto ctx = make_ctx();
  auto scalar = make_scalar(digest, ctx.get());
  return to_blinding(scalar.get());
}

schemata::schema::blinding_t balance_blinding(
    std::span<const schemata::schema::blinding_t> inputs,
    std::span<const schemata::schema::blinding_t> others) {
  const auto& curve = secp256k1();
  auto ctx = make_ctx();
  auto total = bignum_ptr{BN_new(), BN_free};
  if (!total) {
    schemata::common::critical("failed to allocate BIGNUM");
  }
  BN_zero(total.get());
  for (const auto& blinding : inputs) {
    auto scalar = make_scalar(blinding, ctx.get());
    if (BN_mod_add(total.get(), total.get(), scalar.get(), curve.order.get(),
                   ctx.get()) != 1) {
      schemata::common::critical("failed to add blinding factors");
    }
  }
  for (const auto& blinding : others) {
    auto scalar = make_scalar(blinding, ctx.get());
    if (BN_mod_sub(total.get(), total.get(), scalar.get(), curve.order.get(),
                   ctx.get()) != 1) {
      schemata::common::critical("failed to subtract blinding factors");
    }
  }
  return to_blinding(total.get());
}

}  // namespace schemata::crypto
