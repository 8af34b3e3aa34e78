#pragma once
#include <schemata/schema/encoding/scale/seal.hpp>
#include <schemata/schema/owned_state.hpp>
#include <scale/scale.hpp>

namespace schemata::schema {

void encode(const revealed_value& o, ::scale::Encoder& encoder);
void decode(revealed_value& o, ::scale::Decoder& decoder);

void encode(const fungible_state& o, ::scale::Encoder& encoder);
void decode(fungible_state& o, ::scale::Decoder& decoder);

void encode(const structured_state& o, ::scale::Encoder& encoder);
void decode(structured_state& o, ::scale::Decoder& decoder);

void encode(const assignment& o, ::scale::Encoder& encoder);
void decode(assignment& o, ::scale::Decoder& decoder);

}  // namespace schemata::schema
