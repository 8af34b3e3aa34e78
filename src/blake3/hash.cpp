#include <schemata/blake3/hash.hpp>

namespace schemata::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher::hasher(const std::string_view context) {
  blake3_hasher_init_derive_key_raw(&state_, context.data(), context.size());
}

hasher& hasher::update(const schemata::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

schemata::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = schemata::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

schemata::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

schemata::schema::hash32_t hash(const schemata::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

schemata::schema::hash32_t tagged_hash(
    const std::string_view context,
    const schemata::schema::bytes_view_t& bytes) {
  return hasher{context}.update(bytes).finalize();
}

}  // namespace schemata::blake3
