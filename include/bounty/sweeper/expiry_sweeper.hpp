#pragma once

#include <bounty/common/clock.hpp>
#include <bounty/execution/state_machine.hpp>
#include <bounty/store/wager_store.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace bounty::sweeper {

struct sweeper_config final {
  bounty::schema::duration_milliseconds_t interval{
      bounty::common::seconds(60)};
  // Upper bound on wagers handled per category per sweep.
  uint64_t batch_size{100};
};

struct sweep_report final {
  uint64_t expired{};
  uint64_t finalized{};
  // Due when listed but already moved on by another caller.
  uint64_t skipped{};
  uint64_t failed{};
};

/// Periodically expires stale OPEN wagers and settles undisputed
/// PENDING_RESULT wagers whose dispute window has closed. Settlements whose
/// ledger calls are still pending are completed on the same pass. Every
/// transition goes through the state machine; one wager failing does not stop
/// a sweep.
class expiry_sweeper final {
 public:
  expiry_sweeper(bounty::store::wager_store& store,
                 bounty::execution::state_machine& machine,
                 sweeper_config config);
  ~expiry_sweeper();

  expiry_sweeper(const expiry_sweeper&) = delete;
  expiry_sweeper& operator=(const expiry_sweeper&) = delete;

  /// Run one sweep on the calling thread.
  sweep_report run_once();

  void start();
  void stop();

 private:
  void run();
  void complete_pending(const bounty::schema::wager_id_t& id,
                        sweep_report& report);

  bounty::store::wager_store& store_;
  bounty::execution::state_machine& machine_;
  sweeper_config config_;
  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{};
  std::thread thread_;
};

}  // namespace bounty::sweeper
