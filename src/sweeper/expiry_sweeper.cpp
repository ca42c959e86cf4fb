#include <spdlog/spdlog.h>
#include <bounty/sweeper/expiry_sweeper.hpp>
#include <chrono>

using namespace bounty::schema;

namespace bounty::sweeper {

expiry_sweeper::expiry_sweeper(bounty::store::wager_store& store,
                               bounty::execution::state_machine& machine,
                               sweeper_config config)
    : store_{store}, machine_{machine}, config_{config} {}

expiry_sweeper::~expiry_sweeper() {
  stop();
}

void expiry_sweeper::complete_pending(const wager_id_t& id,
                                      sweep_report& report) {
  auto result = machine_.finalize(id);
  if (result.ok() && result.snapshot && !result.events.empty()) {
    if (result.snapshot->wager.status == wager_status_t::expired) {
      ++report.expired;
    } else {
      ++report.finalized;
    }
  } else if (result.ok() ||
             result.category == error_category_t::state_conflict) {
    ++report.skipped;
  } else {
    ++report.failed;
    spdlog::warn("Sweeper could not complete settlement of wager {}: {} ({})",
                 to_hex(id), result.reason(), result.log);
  }
}

sweep_report expiry_sweeper::run_once() {
  auto report = sweep_report{};
  auto now = machine_.now();

  auto handled = uint64_t{};
  for (const auto& id : store_.list_wager_ids_by_status(wager_status_t::open)) {
    if (handled >= config_.batch_size) {
      break;
    }
    auto wager = store_.load_wager(id);
    if (!wager) {
      continue;
    }
    if (has_pending_settlement(*wager)) {
      ++handled;
      complete_pending(id, report);
      continue;
    }
    if (now <= wager->timeline.expires_at) {
      continue;
    }
    ++handled;
    auto result = machine_.expire(id);
    if (result.ok() && result.snapshot &&
        result.snapshot->wager.status == wager_status_t::expired &&
        !result.events.empty()) {
      ++report.expired;
    } else if (result.ok() ||
               result.category == error_category_t::state_conflict) {
      ++report.skipped;
    } else {
      ++report.failed;
      spdlog::warn("Sweeper could not expire wager {}: {} ({})", to_hex(id),
                   result.reason(), result.log);
    }
  }

  handled = 0;
  for (const auto& id :
       store_.list_wager_ids_by_status(wager_status_t::pending_result)) {
    if (handled >= config_.batch_size) {
      break;
    }
    auto wager = store_.load_wager(id);
    if (!wager) {
      continue;
    }
    if (has_pending_settlement(*wager)) {
      ++handled;
      complete_pending(id, report);
      continue;
    }
    if (!wager->timeline.result_submitted_at.has_value() ||
        now <= *wager->timeline.result_submitted_at +
                   machine_.config().dispute_window) {
      continue;
    }
    ++handled;
    auto result = machine_.finalize(id);
    if (result.ok() && !result.events.empty()) {
      ++report.finalized;
    } else if (result.ok() ||
               result.category == error_category_t::state_conflict) {
      ++report.skipped;
    } else {
      ++report.failed;
      spdlog::warn("Sweeper could not finalize wager {}: {} ({})",
                   to_hex(id), result.reason(), result.log);
    }
  }

  // Resolved disputes whose ledger calls did not all go through.
  handled = 0;
  for (const auto& id :
       store_.list_wager_ids_by_status(wager_status_t::disputed)) {
    if (handled >= config_.batch_size) {
      break;
    }
    auto wager = store_.load_wager(id);
    if (!wager || !has_pending_settlement(*wager)) {
      continue;
    }
    ++handled;
    complete_pending(id, report);
  }

  if (report.expired + report.finalized + report.skipped + report.failed >
      0) {
    spdlog::info(
        "Sweep finished: {} expired, {} finalized, {} skipped, {} failed",
        report.expired, report.finalized, report.skipped, report.failed);
  }
  return report;
}

void expiry_sweeper::start() {
  auto lock = std::scoped_lock{mutex_};
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_ = std::thread{[this] { run(); }};
  spdlog::info("Expiry sweeper started with a {} ms interval",
               config_.interval);
}

void expiry_sweeper::stop() {
  {
    auto lock = std::scoped_lock{mutex_};
    stopping_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    spdlog::info("Expiry sweeper stopped");
  }
}

void expiry_sweeper::run() {
  auto lock = std::unique_lock{mutex_};
  while (!stopping_) {
    lock.unlock();
    run_once();
    lock.lock();
    wake_.wait_for(lock, std::chrono::milliseconds(config_.interval),
                   [this] { return stopping_; });
  }
}

}  // namespace bounty::sweeper
