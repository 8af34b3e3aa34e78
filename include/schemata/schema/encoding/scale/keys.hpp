#pragma once
#include <schemata/schema/keys.hpp>
#include <scale/scale.hpp>

namespace schemata::schema {

template <typename Tag>
void encode(const typed_key<Tag>& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
}

template <typename Tag>
void decode(typed_key<Tag>& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
}

}  // namespace schemata::schema
