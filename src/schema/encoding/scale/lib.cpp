#include <schemata/schema/encoding/scale/lib.hpp>

namespace schemata::vm {

void encode(const lib& o, ::scale::Encoder& encoder) {
  encode(o.name, encoder);
  encode(o.code, encoder);
  encode(o.imports, encoder);
  encode(o.routines, encoder);
}

void decode(lib& o, ::scale::Decoder& decoder) {
  decode(o.name, decoder);
  decode(o.code, decoder);
  decode(o.imports, decoder);
  decode(o.routines, decoder);
}

void encode(const lib_site& o, ::scale::Encoder& encoder) {
  encode(o.lib_id, encoder);
  encode(o.offset, encoder);
}

void decode(lib_site& o, ::scale::Decoder& decoder) {
  decode(o.lib_id, decoder);
  decode(o.offset, decoder);
}

}  // namespace schemata::vm
