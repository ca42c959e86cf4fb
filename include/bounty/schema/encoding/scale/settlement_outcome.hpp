#pragma once

#include <bounty/schema/settlement_outcome.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    bounty::schema,
    settlement_outcome_t,
    bounty::schema::settlement_outcome_t::agreed,
    bounty::schema::settlement_outcome_t::confirmed_by_opponent,
    bounty::schema::settlement_outcome_t::default_by_inaction,
    bounty::schema::settlement_outcome_t::dispute_confirmed,
    bounty::schema::settlement_outcome_t::dispute_reversed,
    bounty::schema::settlement_outcome_t::dispute_voided,
    bounty::schema::settlement_outcome_t::cancelled,
    bounty::schema::settlement_outcome_t::expired)
