#pragma once

#include <bounty/schema/dispute_outcome.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    bounty::schema,
    dispute_outcome_t,
    bounty::schema::dispute_outcome_t::confirm_original,
    bounty::schema::dispute_outcome_t::reverse,
    bounty::schema::dispute_outcome_t::void_wager)
