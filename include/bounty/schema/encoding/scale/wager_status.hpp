#pragma once

#include <bounty/schema/wager_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    bounty::schema,
    wager_status_t,
    bounty::schema::wager_status_t::open,
    bounty::schema::wager_status_t::accepted,
    bounty::schema::wager_status_t::in_progress,
    bounty::schema::wager_status_t::pending_result,
    bounty::schema::wager_status_t::disputed,
    bounty::schema::wager_status_t::completed,
    bounty::schema::wager_status_t::expired,
    bounty::schema::wager_status_t::cancelled)
