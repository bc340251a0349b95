#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

#include "hearth/timedef.hpp"
#include "hearth/vector.hpp"
#include "hearth/worker-config.hpp"

namespace hearth {

// Forks and supervises worker processes from the primary process.
//
// Each worker slot runs 'workerMain(workerIndex)' in a forked child, whose return value is the child exit code.
// A worker that exits (whatever the reason) while the supervisor is not stopping is respawned in the same slot.
// Consecutive fast failures of a slot are delayed with an exponential backoff, and a slot failing more than
// WorkerConfig::maxConsecutiveFailures times in a row is abandoned.
//
// Not thread-safe, except requestStop() which may be called from any thread.
class WorkerSupervisor {
 public:
  using WorkerMain = std::function<int(uint32_t workerIndex)>;

  // Throws std::invalid_argument if the configuration is invalid or workerMain is empty.
  WorkerSupervisor(WorkerConfig config, WorkerMain workerMain);

  WorkerSupervisor(const WorkerSupervisor&) = delete;
  WorkerSupervisor(WorkerSupervisor&&) = delete;
  WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;
  WorkerSupervisor& operator=(WorkerSupervisor&&) = delete;

  ~WorkerSupervisor() = default;

  // Spawns all workers and supervises them until requestStop() is called or a termination signal is received
  // (see SignalHandler), then stops them (SIGTERM, then SIGKILL after WorkerConfig::stopTimeout).
  // Returns 0 after a requested stop, 1 if all worker slots have been abandoned.
  int run();

  // Asks run() to stop the workers and return. Safe to call from any thread.
  void requestStop() noexcept { _stopRequested.store(true, std::memory_order_release); }

  [[nodiscard]] uint32_t nbWorkers() const noexcept { return static_cast<uint32_t>(_slots.size()); }

  // Number of successful forks since construction (initial spawns and respawns).
  [[nodiscard]] uint64_t totalSpawns() const noexcept { return _totalSpawns; }

  // Delay before respawning a worker after its nbConsecutiveFailures-th consecutive fast failure:
  // min(initialRespawnDelay * 2^(nbConsecutiveFailures - 1), maxRespawnDelay), 0 if nbConsecutiveFailures is 0.
  [[nodiscard]] static std::chrono::milliseconds ComputeRespawnDelay(const WorkerConfig& config,
                                                                     uint32_t nbConsecutiveFailures) noexcept;

 private:
  struct WorkerSlot {
    pid_t pid{-1};
    SteadyTimePoint startTime;
    // Time at which a dead worker should be respawned.
    SteadyTimePoint respawnAt;
    uint32_t nbConsecutiveFailures{0};
    bool abandoned{false};
  };

  void spawn(uint32_t workerIndex);

  // Reaps exited workers and schedules their respawn.
  void reapExited(SteadyTimePoint now);

  void onWorkerFailure(uint32_t workerIndex, SteadyTimePoint now);

  void stopWorkers();

  [[nodiscard]] bool allAbandoned() const noexcept;

  [[nodiscard]] bool stopRequested() const noexcept;

  WorkerConfig _config;
  WorkerMain _workerMain;
  vector<WorkerSlot> _slots;
  uint64_t _totalSpawns{0};
  std::atomic<bool> _stopRequested{false};
};

}  // namespace hearth
