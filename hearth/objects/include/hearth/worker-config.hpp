#pragma once

#include <chrono>
#include <cstdint>

namespace hearth {

// Settings of the process supervisor forking the worker processes.
struct WorkerConfig {
  // Number of worker processes. 0 (default) means one per online CPU.
  uint32_t nbWorkers{0};

  // Delay before respawning a worker after its first fast failure. It doubles at each consecutive fast failure,
  // up to maxRespawnDelay.
  std::chrono::milliseconds initialRespawnDelay{std::chrono::milliseconds{100}};

  std::chrono::milliseconds maxRespawnDelay{std::chrono::seconds{10}};

  // A worker that ran at least this long before exiting is considered healthy: its failure count is reset.
  std::chrono::milliseconds stableUptime{std::chrono::seconds{30}};

  // A worker slot failing more than this number of times in a row is abandoned.
  uint32_t maxConsecutiveFailures{10};

  // Period at which the primary process reaps exited workers and respawns due ones.
  std::chrono::milliseconds monitorInterval{std::chrono::milliseconds{100}};

  // On stop, maximum duration granted to workers to exit after SIGTERM before they are killed with SIGKILL.
  std::chrono::milliseconds stopTimeout{std::chrono::seconds{10}};

  // Maximum drain period of a worker once asked to terminate. 0 means no limit.
  std::chrono::milliseconds drainTimeout{std::chrono::seconds{5}};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Number of worker processes that will actually be started (resolves 0 to the CPU count, at least 1).
  [[nodiscard]] uint32_t effectiveNbWorkers() const noexcept;

  WorkerConfig& withNbWorkers(uint32_t nbWorkers);

  WorkerConfig& withRespawnDelays(std::chrono::milliseconds initial, std::chrono::milliseconds max);

  WorkerConfig& withStableUptime(std::chrono::milliseconds stableUptime);

  WorkerConfig& withMaxConsecutiveFailures(uint32_t maxConsecutiveFailures);

  WorkerConfig& withMonitorInterval(std::chrono::milliseconds monitorInterval);

  WorkerConfig& withStopTimeout(std::chrono::milliseconds stopTimeout);

  WorkerConfig& withDrainTimeout(std::chrono::milliseconds drainTimeout);

  bool operator==(const WorkerConfig&) const noexcept = default;
};

}  // namespace hearth
