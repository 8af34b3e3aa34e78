#include <schemata/schema/encoding/scale/seal.hpp>

namespace schemata::schema {

void encode(const outpoint& o, ::scale::Encoder& encoder) {
  encode(o.txid, encoder);
  encode(o.vout, encoder);
}

void decode(outpoint& o, ::scale::Decoder& decoder) {
  decode(o.txid, decoder);
  decode(o.vout, decoder);
}

void encode(const seal& o, ::scale::Encoder& encoder) {
  encode(o.method, encoder);
  encode(o.outpoint, encoder);
  encode(o.blinding, encoder);
}

void decode(seal& o, ::scale::Decoder& decoder) {
  decode(o.method, decoder);
  decode(o.outpoint, decoder);
  decode(o.blinding, decoder);
}

}  // namespace schemata::schema
