#pragma once

#include <bounty/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bounty::schema {

enum class proof_type_t : uint8_t {
  screenshot = 0,
  video = 1,
  replay = 2,
  other = 3
};

inline constexpr auto kProofTypeMappings = std::array{
    std::pair<std::string_view, proof_type_t>{"screenshot",
                                              proof_type_t::screenshot},
    std::pair<std::string_view, proof_type_t>{"video", proof_type_t::video},
    std::pair<std::string_view, proof_type_t>{"replay", proof_type_t::replay},
    std::pair<std::string_view, proof_type_t>{"other", proof_type_t::other}};

template <>
inline std::optional<proof_type_t> try_from_string<proof_type_t>(
    const std::string_view value) {
  return from_string(value, kProofTypeMappings);
}

inline constexpr std::string_view to_string(const proof_type_t value) {
  return to_string(value, kProofTypeMappings).value_or("unknown");
}

}  // namespace bounty::schema
