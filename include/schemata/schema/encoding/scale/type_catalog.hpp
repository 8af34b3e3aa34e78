#pragma once
#include <schemata/schema/type_catalog.hpp>
#include <scale/scale.hpp>

namespace schemata::schema {

void encode(const type_definition& o, ::scale::Encoder& encoder);
void decode(type_definition& o, ::scale::Decoder& decoder);

void encode(const type_system& o, ::scale::Encoder& encoder);
void decode(type_system& o, ::scale::Decoder& decoder);

}  // namespace schemata::schema
