#include <schemata/schema/encoding/scale/owned_state.hpp>

namespace schemata::schema {

void encode(const revealed_value& o, ::scale::Encoder& encoder) {
  encode(o.value, encoder);
  encode(o.blinding, encoder);
}

void decode(revealed_value& o, ::scale::Decoder& decoder) {
  decode(o.value, decoder);
  decode(o.blinding, decoder);
}

void encode(const fungible_state& o, ::scale::Encoder& encoder) {
  encode(o.commitment, encoder);
  encode(o.revealed, encoder);
}

void decode(fungible_state& o, ::scale::Decoder& decoder) {
  decode(o.commitment, decoder);
  decode(o.revealed, decoder);
}

void encode(const structured_state& o, ::scale::Encoder& encoder) {
  encode(o.data, encoder);
}

void decode(structured_state& o, ::scale::Decoder& decoder) {
  decode(o.data, decoder);
}

void encode(const assignment& o, ::scale::Encoder& encoder) {
  encode(o.seal, encoder);
  encode(o.state, encoder);
}

void decode(assignment& o, ::scale::Decoder& decoder) {
  decode(o.seal, decoder);
  decode(o.state, decoder);
}

}  // namespace schemata::schema
