#pragma once

#include <schemata/schema/interface.hpp>
#include <schemata/schema/type_catalog.hpp>

// The interfaces the shipped asset classes implement. Semantic types are
// looked up in `catalog`, which must hold the standard types.
namespace schemata::iface {

/// RGB20 fungible asset. The inflatable flavour adds the max supply, the
/// inflation allowance and the issue transition.
schemata::schema::interface_t rgb20(const schemata::schema::type_catalog& catalog,
                                    bool inflatable);

/// RGB21 unique digital asset.
schemata::schema::interface_t rgb21(
    const schemata::schema::type_catalog& catalog);

/// RGB25 collectible fungible asset.
schemata::schema::interface_t rgb25(
    const schemata::schema::type_catalog& catalog);

}  // namespace schemata::iface
