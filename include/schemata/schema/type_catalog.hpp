#pragma once
#include <schemata/schema/primitives.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace schemata::schema {

/// A named type and a textual description of its layout.
struct type_definition final {
  std::string name;
  std::string layout;
};

using type_definition_t = type_definition;

/// Frozen view of a catalog: (name, sem id) pairs ordered by name.
struct type_system final {
  std::vector<std::pair<std::string, sem_id_t>> types;
};

using type_system_t = type_system;

sem_id_t make_sem_id(const type_definition_t& definition);
type_system_id_t make_type_system_id(const type_system_t& system);

/// Registry resolving semantic type names to content derived ids.
///
/// The same (name, layout) pair always yields the same id, so catalogs built
/// independently agree on ids for the types they share.
class type_catalog final {
 public:
  /// Register a definition. Re-adding an identical definition is a no-op;
  /// returns false when the name is already bound to another layout.
  bool add(type_definition_t definition);

  std::optional<sem_id_t> resolve(std::string_view name) const;

  /// Like resolve() but an unknown name is fatal.
  sem_id_t get(std::string_view name) const;

  std::optional<std::string_view> name_of(const sem_id_t& id) const;

  bool contains(std::string_view name) const;
  std::size_t size() const;

  type_system_t type_system() const;

 private:
  struct entry_t final {
    type_definition_t definition;
    sem_id_t id{};
  };
  std::map<std::string, entry_t, std::less<>> types_;
};

/// Catalog holding every type the shipped schemata refer to.
type_catalog standard_types();

}  // namespace schemata::schema
