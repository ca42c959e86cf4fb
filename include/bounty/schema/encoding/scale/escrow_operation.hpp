#pragma once

#include <bounty/schema/escrow_operation.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    bounty::schema,
    escrow_operation_t,
    bounty::schema::escrow_operation_t::hold,
    bounty::schema::escrow_operation_t::release,
    bounty::schema::escrow_operation_t::collect,
    bounty::schema::escrow_operation_t::refund)
