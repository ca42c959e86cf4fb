#pragma once

#include <bounty/schema/proof_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    bounty::schema,
    proof_type_t,
    bounty::schema::proof_type_t::screenshot,
    bounty::schema::proof_type_t::video,
    bounty::schema::proof_type_t::replay,
    bounty::schema::proof_type_t::other)
