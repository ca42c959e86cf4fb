#pragma once

#include <bounty/schema/dispute_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    bounty::schema,
    dispute_status_t,
    bounty::schema::dispute_status_t::open,
    bounty::schema::dispute_status_t::under_review,
    bounty::schema::dispute_status_t::resolved_confirm,
    bounty::schema::dispute_status_t::resolved_reverse,
    bounty::schema::dispute_status_t::resolved_void)
