#include <schemata/schema/encoding/scale/operation.hpp>

namespace schemata::schema {

void encode(const opout& o, ::scale::Encoder& encoder) {
  encode(o.op, encoder);
  encode(o.type, encoder);
  encode(o.index, encoder);
}

void decode(opout& o, ::scale::Decoder& decoder) {
  decode(o.op, decoder);
  decode(o.type, decoder);
  decode(o.index, decoder);
}

void encode(const genesis<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.schema_id, encoder);
  encode(o.timestamp, encoder);
  encode(o.issuer, encoder);
  encode(o.testnet, encoder);
  encode(o.metadata, encoder);
  encode(o.globals, encoder);
  encode(o.assignments, encoder);
}

void decode(genesis<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.schema_id, decoder);
  decode(o.timestamp, decoder);
  decode(o.issuer, decoder);
  decode(o.testnet, decoder);
  decode(o.metadata, decoder);
  decode(o.globals, decoder);
  decode(o.assignments, decoder);
}

void encode(const transition<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.contract_id, encoder);
  encode(o.transition_type, encoder);
  encode(o.metadata, encoder);
  encode(o.globals, encoder);
  encode(o.inputs, encoder);
  encode(o.assignments, encoder);
}

void decode(transition<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.contract_id, decoder);
  decode(o.transition_type, decoder);
  decode(o.metadata, decoder);
  decode(o.globals, decoder);
  decode(o.inputs, decoder);
  decode(o.assignments, decoder);
}

}  // namespace schemata::schema
