#pragma once
#include <schemata/schema/encoding/scale/keys.hpp>
#include <schemata/schema/encoding/scale/lib.hpp>
#include <schemata/schema/interface_binding.hpp>
#include <scale/scale.hpp>

namespace schemata::schema {

template <typename Key>
void encode(const named_field<Key>& o, ::scale::Encoder& encoder) {
  encode(o.name, encoder);
  encode(o.key, encoder);
}

template <typename Key>
void decode(named_field<Key>& o, ::scale::Decoder& decoder) {
  decode(o.name, decoder);
  decode(o.key, decoder);
}

void encode(const named_variant& o, ::scale::Encoder& encoder);
void decode(named_variant& o, ::scale::Decoder& decoder);

void encode(const state_abi& o, ::scale::Encoder& encoder);
void decode(state_abi& o, ::scale::Decoder& decoder);

void encode(const interface_binding<1>& o, ::scale::Encoder& encoder);
void decode(interface_binding<1>& o, ::scale::Decoder& decoder);

}  // namespace schemata::schema
