#include <schemata/schema/encoding/scale/interface_binding.hpp>

namespace schemata::schema {

void encode(const named_variant& o, ::scale::Encoder& encoder) {
  encode(o.code, encoder);
  encode(o.name, encoder);
}

void decode(named_variant& o, ::scale::Decoder& decoder) {
  decode(o.code, decoder);
  decode(o.name, decoder);
}

void encode(const state_abi& o, ::scale::Encoder& encoder) {
  encode(o.reg_input, encoder);
  encode(o.reg_output, encoder);
  encode(o.calc_output, encoder);
  encode(o.calc_change, encoder);
}

void decode(state_abi& o, ::scale::Decoder& decoder) {
  decode(o.reg_input, decoder);
  decode(o.reg_output, decoder);
  decode(o.calc_output, decoder);
  decode(o.calc_change, decoder);
}

void encode(const interface_binding<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.schema_id, encoder);
  encode(o.iface_id, encoder);
  encode(o.timestamp, encoder);
  encode(o.developer, encoder);
  encode(o.global_state, encoder);
  encode(o.assignments, encoder);
  encode(o.transitions, encoder);
  encode(o.errors, encoder);
  encode(o.state_abi, encoder);
}

void decode(interface_binding<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.schema_id, decoder);
  decode(o.iface_id, decoder);
  decode(o.timestamp, decoder);
  decode(o.developer, decoder);
  decode(o.global_state, decoder);
  decode(o.assignments, decoder);
  decode(o.transitions, decoder);
  decode(o.errors, decoder);
  decode(o.state_abi, decoder);
}

}  // namespace schemata::schema
