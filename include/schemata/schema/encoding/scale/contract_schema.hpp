#pragma once
#include <schemata/schema/contract_schema.hpp>
#include <schemata/schema/encoding/scale/keys.hpp>
#include <schemata/schema/encoding/scale/lib.hpp>
#include <schemata/schema/encoding/scale/occurrences.hpp>
#include <schemata/schema/encoding/scale/state_schema.hpp>
#include <scale/scale.hpp>

namespace schemata::schema {

void encode(const genesis_schema& o, ::scale::Encoder& encoder);
void decode(genesis_schema& o, ::scale::Decoder& decoder);

void encode(const transition_schema& o, ::scale::Encoder& encoder);
void decode(transition_schema& o, ::scale::Decoder& decoder);

void encode(const contract_schema<1>& o, ::scale::Encoder& encoder);
void decode(contract_schema<1>& o, ::scale::Decoder& decoder);

}  // namespace schemata::schema
