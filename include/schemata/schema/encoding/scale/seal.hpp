#pragma once

#include <schemata/schema/seal.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::schema,
                             close_method_t,
                             schemata::schema::close_method_t::opret_first,
                             schemata::schema::close_method_t::tapret_first)

namespace schemata::schema {

void encode(const outpoint& o, ::scale::Encoder& encoder);
void decode(outpoint& o, ::scale::Decoder& decoder);

void encode(const seal& o, ::scale::Encoder& encoder);
void decode(seal& o, ::scale::Decoder& decoder);

}  // namespace schemata::schema
