#pragma once
#include <schemata/schema/allocation.hpp>
#include <schemata/schema/amount.hpp>
#include <schemata/schema/asset_spec.hpp>
#include <schemata/schema/asset_text.hpp>
#include <schemata/schema/attachment.hpp>
#include <schemata/schema/contract_terms.hpp>
#include <schemata/schema/encoding/scale/precision.hpp>
#include <schemata/schema/token_data.hpp>
#include <scale/scale.hpp>

// Global and structured state values. Validation programs read some of these
// at fixed byte offsets, so the field order here is part of the state ABI.
namespace schemata::schema {

void encode(const amount& o, ::scale::Encoder& encoder);
void decode(amount& o, ::scale::Decoder& decoder);

void encode(const allocation& o, ::scale::Encoder& encoder);
void decode(allocation& o, ::scale::Decoder& decoder);

void encode(const attachment& o, ::scale::Encoder& encoder);
void decode(attachment& o, ::scale::Decoder& decoder);

void encode(const asset_spec& o, ::scale::Encoder& encoder);
void decode(asset_spec& o, ::scale::Decoder& decoder);

void encode(const asset_name& o, ::scale::Encoder& encoder);
void decode(asset_name& o, ::scale::Decoder& decoder);

void encode(const asset_details& o, ::scale::Encoder& encoder);
void decode(asset_details& o, ::scale::Decoder& decoder);

void encode(const article& o, ::scale::Encoder& encoder);
void decode(article& o, ::scale::Decoder& decoder);

void encode(const contract_terms& o, ::scale::Encoder& encoder);
void decode(contract_terms& o, ::scale::Decoder& decoder);

void encode(const embedded_media& o, ::scale::Encoder& encoder);
void decode(embedded_media& o, ::scale::Decoder& decoder);

void encode(const token_data& o, ::scale::Encoder& encoder);
void decode(token_data& o, ::scale::Decoder& decoder);

void encode(const attachment_type& o, ::scale::Encoder& encoder);
void decode(attachment_type& o, ::scale::Decoder& decoder);

}  // namespace schemata::schema
