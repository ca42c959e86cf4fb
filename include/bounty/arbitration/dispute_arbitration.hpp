#pragma once

#include <bounty/execution/state_machine.hpp>
#include <bounty/schema/dispute_outcome.hpp>
#include <bounty/schema/primitives.hpp>
#include <bounty/schema/wager_result.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bounty::arbitration {

/// Moderator assignment and the single resolution path for disputes.
class dispute_arbitration final {
 public:
  dispute_arbitration(bounty::execution::state_machine& machine,
                      std::vector<bounty::schema::account_id_t> moderators);

  /// Assign `moderator`, or the next pool member that is not a participant
  /// when none is given.
  bounty::schema::wager_result_t assign(
      const bounty::schema::dispute_id_t& dispute_id,
      const std::optional<bounty::schema::account_id_t>& moderator);

  bounty::schema::wager_result_t resolve(
      const bounty::schema::dispute_id_t& dispute_id,
      const bounty::schema::account_id_t& moderator,
      bounty::schema::dispute_outcome_t outcome,
      const std::string& note);

  const std::vector<bounty::schema::account_id_t>& moderators() const {
    return moderators_;
  }

 private:
  std::optional<bounty::schema::account_id_t> next_moderator(
      const bounty::schema::wager_state_t& wager);

  bounty::execution::state_machine& machine_;
  std::vector<bounty::schema::account_id_t> moderators_;
  std::atomic<uint64_t> cursor_{};
};

}  // namespace bounty::arbitration
