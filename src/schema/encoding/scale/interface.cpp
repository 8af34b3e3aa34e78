#include <schemata/schema/encoding/scale/interface.hpp>

namespace schemata::schema {

void encode(const iface_global& o, ::scale::Encoder& encoder) {
  encode(o.sem_id, encoder);
  encode(o.required, encoder);
  encode(o.multiple, encoder);
}

void decode(iface_global& o, ::scale::Decoder& decoder) {
  decode(o.sem_id, decoder);
  decode(o.required, decoder);
  decode(o.multiple, decoder);
}

void encode(const iface_assignment& o, ::scale::Encoder& encoder) {
  encode(o.kind, encoder);
  encode(o.sem_id, encoder);
  encode(o.required, encoder);
}

void decode(iface_assignment& o, ::scale::Decoder& decoder) {
  decode(o.kind, decoder);
  decode(o.sem_id, decoder);
  decode(o.required, decoder);
}

void encode(const iface_transition& o, ::scale::Encoder& encoder) {
  encode(o.required, encoder);
}

void decode(iface_transition& o, ::scale::Decoder& decoder) {
  decode(o.required, decoder);
}

void encode(const interface<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.global_state, encoder);
  encode(o.assignments, encoder);
  encode(o.transitions, encoder);
  encode(o.errors, encoder);
}

void decode(interface<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.global_state, decoder);
  decode(o.assignments, decoder);
  decode(o.transitions, decoder);
  decode(o.errors, decoder);
}

}  // namespace schemata::schema
