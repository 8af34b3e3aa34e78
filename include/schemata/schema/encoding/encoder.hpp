#pragma once
#include <schemata/schema/primitives.hpp>
#include <optional>
#include <span>

namespace schemata::schema::encoding {

// The encoding library is a build time choice. Callers name the tag once
// (see encoding/scale/encoder.hpp) and never touch the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  schemata::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, schemata::schema::bytes_t& out);

  template <typename T>
  T decode(const schemata::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const schemata::schema::bytes_view_t& bytes);
};

}  // namespace schemata::schema::encoding
