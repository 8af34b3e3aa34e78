#pragma once

#include <schemata/schema/precision.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(schemata::schema,
                             precision_t,
                             schemata::schema::precision_t::indivisible,
                             schemata::schema::precision_t::deci,
                             schemata::schema::precision_t::centi,
                             schemata::schema::precision_t::milli,
                             schemata::schema::precision_t::deci_milli,
                             schemata::schema::precision_t::centi_milli,
                             schemata::schema::precision_t::micro,
                             schemata::schema::precision_t::deci_micro,
                             schemata::schema::precision_t::centi_micro,
                             schemata::schema::precision_t::nano,
                             schemata::schema::precision_t::deci_nano,
                             schemata::schema::precision_t::centi_nano,
                             schemata::schema::precision_t::pico,
                             schemata::schema::precision_t::deci_pico,
                             schemata::schema::precision_t::centi_pico,
                             schemata::schema::precision_t::femto,
                             schemata::schema::precision_t::deci_femto,
                             schemata::schema::precision_t::centi_femto,
                             schemata::schema::precision_t::atto)
