#include <schemata/blake3/hash.hpp>
#include <schemata/schema/contract_schema.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>

namespace schemata::schema {

schema_id_t make_schema_id(const contract_schema_t& schema) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(schema);
  return schemata::blake3::tagged_hash("schemata.schema.v1", encoded);
}

}  // namespace schemata::schema
