#include <schemata/schema/encoding/scale/state_schema.hpp>

namespace schemata::schema {

void encode(const global_state_schema& o, ::scale::Encoder& encoder) {
  encode(o.sem_id, encoder);
  encode(o.max_items, encoder);
}

void decode(global_state_schema& o, ::scale::Decoder& decoder) {
  decode(o.sem_id, decoder);
  decode(o.max_items, decoder);
}

void encode(const fungible_state_schema& o, ::scale::Encoder& encoder) {
  encode(o.type, encoder);
}

void decode(fungible_state_schema& o, ::scale::Decoder& decoder) {
  decode(o.type, decoder);
}

void encode(const structured_state_schema& o, ::scale::Encoder& encoder) {
  encode(o.sem_id, encoder);
}

void decode(structured_state_schema& o, ::scale::Decoder& decoder) {
  decode(o.sem_id, decoder);
}

}  // namespace schemata::schema
