#pragma once
#include <schemata/vm/lib.hpp>
#include <scale/scale.hpp>

namespace schemata::vm {

void encode(const lib& o, ::scale::Encoder& encoder);
void decode(lib& o, ::scale::Decoder& decoder);

void encode(const lib_site& o, ::scale::Encoder& encoder);
void decode(lib_site& o, ::scale::Decoder& decoder);

}  // namespace schemata::vm
