#pragma once
#include <schemata/schema/encoding/scale/keys.hpp>
#include <schemata/schema/encoding/scale/owned_state.hpp>
#include <schemata/schema/operation.hpp>
#include <scale/scale.hpp>

namespace schemata::schema {

void encode(const opout& o, ::scale::Encoder& encoder);
void decode(opout& o, ::scale::Decoder& decoder);

void encode(const genesis<1>& o, ::scale::Encoder& encoder);
void decode(genesis<1>& o, ::scale::Decoder& decoder);

void encode(const transition<1>& o, ::scale::Encoder& encoder);
void decode(transition<1>& o, ::scale::Decoder& decoder);

}  // namespace schemata::schema
