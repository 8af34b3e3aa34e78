#pragma once
#include <schemata/schema/encoding/scale/state_schema.hpp>
#include <schemata/schema/interface.hpp>
#include <scale/scale.hpp>

namespace schemata::schema {

void encode(const iface_global& o, ::scale::Encoder& encoder);
void decode(iface_global& o, ::scale::Decoder& decoder);

void encode(const iface_assignment& o, ::scale::Encoder& encoder);
void decode(iface_assignment& o, ::scale::Decoder& decoder);

void encode(const iface_transition& o, ::scale::Encoder& encoder);
void decode(iface_transition& o, ::scale::Decoder& decoder);

void encode(const interface<1>& o, ::scale::Encoder& encoder);
void decode(interface<1>& o, ::scale::Decoder& decoder);

}  // namespace schemata::schema
