#include <schemata/schema/encoding/scale/contract_schema.hpp>

namespace schemata::schema {

void encode(const genesis_schema& o, ::scale::Encoder& encoder) {
  encode(o.metadata, encoder);
  encode(o.globals, encoder);
  encode(o.assignments, encoder);
  encode(o.validator, encoder);
}

void decode(genesis_schema& o, ::scale::Decoder& decoder) {
  decode(o.metadata, decoder);
  decode(o.globals, decoder);
  decode(o.assignments, decoder);
  decode(o.validator, decoder);
}

void encode(const transition_schema& o, ::scale::Encoder& encoder) {
  encode(o.metadata, encoder);
  encode(o.globals, encoder);
  encode(o.inputs, encoder);
  encode(o.assignments, encoder);
  encode(o.validator, encoder);
}

void decode(transition_schema& o, ::scale::Decoder& decoder) {
  decode(o.metadata, decoder);
  decode(o.globals, decoder);
  decode(o.inputs, decoder);
  decode(o.assignments, decoder);
  decode(o.validator, decoder);
}

void encode(const contract_schema<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.developer, encoder);
  encode(o.timestamp, encoder);
  encode(o.type_system_id, encoder);
  encode(o.global_types, encoder);
  encode(o.owned_types, encoder);
  encode(o.genesis, encoder);
  encode(o.transitions, encoder);
}

void decode(contract_schema<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.developer, decoder);
  decode(o.timestamp, decoder);
  decode(o.type_system_id, decoder);
  decode(o.global_types, decoder);
  decode(o.owned_types, decoder);
  decode(o.genesis, decoder);
  decode(o.transitions, decoder);
}

}  // namespace schemata::schema
