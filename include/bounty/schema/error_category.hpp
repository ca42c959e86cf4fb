#pragma once

#include <bounty/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bounty::schema {

enum class error_category_t : uint8_t {
  none = 0,
  validation = 1,
  state_conflict = 2,
  escrow = 3,
  not_found = 4
};

inline constexpr auto kErrorCategoryMappings = std::array{
    std::pair<std::string_view, error_category_t>{"none",
                                                  error_category_t::none},
    std::pair<std::string_view, error_category_t>{
        "validation", error_category_t::validation},
    std::pair<std::string_view, error_category_t>{
        "state_conflict", error_category_t::state_conflict},
    std::pair<std::string_view, error_category_t>{"escrow",
                                                  error_category_t::escrow},
    std::pair<std::string_view, error_category_t>{
        "not_found", error_category_t::not_found}};

inline constexpr std::string_view to_string(const error_category_t value) {
  return to_string(value, kErrorCategoryMappings).value_or("unknown");
}

}  // namespace bounty::schema
