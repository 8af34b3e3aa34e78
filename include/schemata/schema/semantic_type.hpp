#pragma once

#include <string_view>

namespace schemata::schema {

/// Maps a C++ value type to the catalog name of its semantic type.
///
/// Every type stored as global or structured state specializes this so that
/// builders can check a value against the slot it is written to.
template <typename T>
struct semantic_type;

template <typename T>
inline constexpr std::string_view semantic_type_name_v =
    semantic_type<T>::name;

}  // namespace schemata::schema
