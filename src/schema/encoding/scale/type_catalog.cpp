#include <schemata/schema/encoding/scale/type_catalog.hpp>

namespace schemata::schema {

void encode(const type_definition& o, ::scale::Encoder& encoder) {
  encode(o.name, encoder);
  encode(o.layout, encoder);
}

void decode(type_definition& o, ::scale::Decoder& decoder) {
  decode(o.name, decoder);
  decode(o.layout, decoder);
}

void encode(const type_system& o, ::scale::Encoder& encoder) {
  encode(o.types, encoder);
}

void decode(type_system& o, ::scale::Decoder& decoder) {
  decode(o.types, decoder);
}

}  // namespace schemata::schema
