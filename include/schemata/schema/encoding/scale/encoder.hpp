#pragma once
#include <schemata/common/critical.hpp>
#include <schemata/schema/encoding/encoder.hpp>
#include <schemata/schema/encoding/scale/contract_schema.hpp>
#include <schemata/schema/encoding/scale/contract_values.hpp>
#include <schemata/schema/encoding/scale/interface.hpp>
#include <schemata/schema/encoding/scale/interface_binding.hpp>
#include <schemata/schema/encoding/scale/keys.hpp>
#include <schemata/schema/encoding/scale/lib.hpp>
#include <schemata/schema/encoding/scale/occurrences.hpp>
#include <schemata/schema/encoding/scale/operation.hpp>
#include <schemata/schema/encoding/scale/owned_state.hpp>
#include <schemata/schema/encoding/scale/precision.hpp>
#include <schemata/schema/encoding/scale/seal.hpp>
#include <schemata/schema/encoding/scale/state_schema.hpp>
#include <schemata/schema/encoding/scale/type_catalog.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace schemata::schema::encoding {

// Every record carries an explicit encode/decode pair in
// encoding/scale/<record>.hpp, declared next to the record type so the codec
// finds it by argument dependent lookup. Field order there is the wire order.
struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  schemata::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, schemata::schema::bytes_t& out);

  template <typename T>
  T decode(const schemata::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const schemata::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
schemata::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    schemata::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        schemata::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const schemata::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    schemata::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const schemata::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace schemata::schema::encoding
