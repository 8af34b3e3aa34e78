#pragma once

#include <schemata/schema/occurrences.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::schema,
                             occurrences_t,
                             schemata::schema::occurrences_t::once,
                             schemata::schema::occurrences_t::none_or_once,
                             schemata::schema::occurrences_t::once_or_more,
                             schemata::schema::occurrences_t::none_or_more)
