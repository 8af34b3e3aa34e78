#pragma once

#include <schemata/schema/state_schema.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::schema,
                             fungible_type_t,
                             schemata::schema::fungible_type_t::unsigned_64bit)

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::schema,
                             owned_state_kind_t,
                             schemata::schema::owned_state_kind_t::any,
                             schemata::schema::owned_state_kind_t::fungible,
                             schemata::schema::owned_state_kind_t::structured)

namespace schemata::schema {

void encode(const global_state_schema& o, ::scale::Encoder& encoder);
void decode(global_state_schema& o, ::scale::Decoder& decoder);

void encode(const fungible_state_schema& o, ::scale::Encoder& encoder);
void decode(fungible_state_schema& o, ::scale::Decoder& decoder);

void encode(const structured_state_schema& o, ::scale::Encoder& encoder);
void decode(structured_state_schema& o, ::scale::Decoder& decoder);

}  // namespace schemata::schema
