#include <spdlog/spdlog.h>
#include <bounty/arbitration/dispute_arbitration.hpp>

using namespace bounty::schema;

namespace bounty::arbitration {

dispute_arbitration::dispute_arbitration(
    bounty::execution::state_machine& machine,
    std::vector<account_id_t> moderators)
    : machine_{machine}, moderators_{std::move(moderators)} {
  if (moderators_.empty()) {
    spdlog::warn("No moderators configured; disputes need manual assignment");
  }
}

std::optional<account_id_t> dispute_arbitration::next_moderator(
    const wager_state_t& wager) {
  for (size_t attempt = 0; attempt < moderators_.size(); ++attempt) {
    auto index = cursor_.fetch_add(1) % moderators_.size();
    const auto& candidate = moderators_[index];
    if (!is_participant(wager, candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

wager_result_t dispute_arbitration::assign(
    const dispute_id_t& dispute_id,
    const std::optional<account_id_t>& moderator) {
  if (moderator.has_value()) {
    return machine_.assign_moderator(dispute_id, *moderator);
  }

  auto wager_id = machine_.find_wager_for_dispute(dispute_id);
  if (!wager_id) {
    auto result = wager_result_t{};
    result.code = wager_error_code::dispute_missing;
    result.category = category_of(result.code);
    result.log = "unknown dispute";
    return result;
  }
  auto current = machine_.get(*wager_id);
  if (!current.ok()) {
    return current;
  }
  auto candidate = next_moderator(current.snapshot->wager);
  if (!candidate) {
    auto result = wager_result_t{};
    result.code = wager_error_code::invalid_request;
    result.category = category_of(result.code);
    result.log = "no eligible moderator in the pool";
    return result;
  }
  return machine_.assign_moderator(dispute_id, *candidate);
}

wager_result_t dispute_arbitration::resolve(const dispute_id_t& dispute_id,
                                            const account_id_t& moderator,
                                            const dispute_outcome_t outcome,
                                            const std::string& note) {
  return machine_.resolve_dispute(dispute_id, moderator, outcome, note);
}

}  // namespace bounty::arbitration
