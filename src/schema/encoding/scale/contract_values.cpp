#include <schemata/schema/encoding/scale/contract_values.hpp>

namespace schemata::schema {

void encode(const amount& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
}

void decode(amount& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
}

// token index at offset 0, fraction at offset 4
void encode(const allocation& o, ::scale::Encoder& encoder) {
  encode(o.token_index, encoder);
  encode(o.fraction, encoder);
}

void decode(allocation& o, ::scale::Decoder& decoder) {
  decode(o.token_index, decoder);
  decode(o.fraction, decoder);
}

void encode(const attachment& o, ::scale::Encoder& encoder) {
  encode(o.type, encoder);
  encode(o.digest, encoder);
}

void decode(attachment& o, ::scale::Decoder& decoder) {
  decode(o.type, decoder);
  decode(o.digest, decoder);
}

void encode(const asset_spec& o, ::scale::Encoder& encoder) {
  encode(o.ticker, encoder);
  encode(o.name, encoder);
  encode(o.details, encoder);
  encode(o.precision, encoder);
}

void decode(asset_spec& o, ::scale::Decoder& decoder) {
  decode(o.ticker, decoder);
  decode(o.name, decoder);
  decode(o.details, decoder);
  decode(o.precision, decoder);
}

void encode(const asset_name& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
}

void decode(asset_name& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
}

void encode(const asset_details& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
}

void decode(asset_details& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
}

void encode(const article& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
}

void decode(article& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
}

void encode(const contract_terms& o, ::scale::Encoder& encoder) {
  encode(o.text, encoder);
  encode(o.media, encoder);
}

void decode(contract_terms& o, ::scale::Decoder& decoder) {
  decode(o.text, decoder);
  decode(o.media, decoder);
}

void encode(const embedded_media& o, ::scale::Encoder& encoder) {
  encode(o.type, encoder);
  encode(o.data, encoder);
}

void decode(embedded_media& o, ::scale::Decoder& decoder) {
  decode(o.type, decoder);
  decode(o.data, decoder);
}

// index first, programs read it at offset 0
void encode(const token_data& o, ::scale::Encoder& encoder) {
  encode(o.index, encoder);
  encode(o.ticker, encoder);
  encode(o.name, encoder);
  encode(o.details, encoder);
  encode(o.preview, encoder);
  encode(o.media, encoder);
}

void decode(token_data& o, ::scale::Decoder& decoder) {
  decode(o.index, decoder);
  decode(o.ticker, decoder);
  decode(o.name, decoder);
  decode(o.details, decoder);
  decode(o.preview, decoder);
  decode(o.media, decoder);
}

void encode(const attachment_type& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
  encode(o.name, encoder);
}

void decode(attachment_type& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
  decode(o.name, decoder);
}

}  // namespace schemata::schema
