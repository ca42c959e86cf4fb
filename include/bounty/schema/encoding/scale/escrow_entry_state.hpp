#pragma once

#include <bounty/schema/escrow_entry_state.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    bounty::schema,
    escrow_entry_state_t,
    bounty::schema::escrow_entry_state_t::pending,
    bounty::schema::escrow_entry_state_t::applied)
