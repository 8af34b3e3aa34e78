#pragma once
#include <blake3.h>
#include <schemata/schema/primitives.hpp>
#include <string_view>

namespace schemata::blake3 {

/// Incremental BLAKE3 hasher.
///
/// Constructed with a context string it runs in derive-key mode, which is how
/// every content id in this library is domain separated.
class hasher final {
 public:
  hasher();
  explicit hasher(std::string_view context);

  hasher& update(const schemata::schema::bytes_view_t& bytes);
  hasher& update(std::string_view str);

  schemata::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

schemata::schema::hash32_t hash(const std::string_view& str);
schemata::schema::hash32_t hash(const schemata::schema::bytes_view_t& bytes);

/// Hash `bytes` in derive-key mode under `context`.
schemata::schema::hash32_t tagged_hash(
    std::string_view context,
    const schemata::schema::bytes_view_t& bytes);

}  // namespace schemata::blake3
