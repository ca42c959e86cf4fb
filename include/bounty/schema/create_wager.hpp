#pragma once
#include <bounty/schema/primitives.hpp>
#include <optional>
#include <string>

namespace bounty::schema {

template <uint16_t Version>
struct create_wager;

template <>
struct create_wager<1> final {
  uint16_t version{1};
  account_id_t creator{};
  amount_t stake_amount{};
  std::string game;
  std::optional<account_id_t> target_user;
  std::string title;
  std::string description;
};

using create_wager_t = create_wager<1>;

}  // namespace bounty::schema
