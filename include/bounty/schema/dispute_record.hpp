#pragma once
#include <bounty/schema/dispute_outcome.hpp>
#include <bounty/schema/dispute_status.hpp>
#include <bounty/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: dispute record.
// 1:1 with its wager. Only moderator assignment and the resolution fields
// change after creation.
namespace bounty::schema {

struct dispute_resolution_t final {
  dispute_outcome_t outcome{};
  account_id_t resolved_by{};
  std::string note;
  timestamp_milliseconds_t resolved_at{};
};

template <uint16_t Version>
struct dispute_record;

template <>
struct dispute_record<1> final {
  uint16_t version{1};
  dispute_id_t dispute_id{};
  wager_id_t wager_id{};
  account_id_t disputer{};
  // Winner claimed by the contested (first) proof.
  account_id_t contested_winner{};
  std::string reason;
  dispute_status_t status{dispute_status_t::open};
  std::optional<account_id_t> assigned_moderator;
  std::optional<dispute_resolution_t> resolution;
  timestamp_milliseconds_t opened_at{};
};

using dispute_record_t = dispute_record<1>;

}  // namespace bounty::schema
