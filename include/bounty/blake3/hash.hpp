#pragma once
#include <bounty/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace bounty::blake3 {

bounty::schema::hash32_t hash(const std::string_view& str);
bounty::schema::hash32_t hash(const bounty::schema::bytes_view_t& bytes);

}  // namespace bounty::blake3
