#include "hearth/worker-config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>

namespace hearth {

uint32_t WorkerConfig::effectiveNbWorkers() const noexcept {
  if (nbWorkers != 0) {
    return nbWorkers;
  }
  return std::max(1U, std::thread::hardware_concurrency());
}

WorkerConfig& WorkerConfig::withNbWorkers(uint32_t nbWorkers) {
  this->nbWorkers = nbWorkers;
  return *this;
}

WorkerConfig& WorkerConfig::withRespawnDelays(std::chrono::milliseconds initial, std::chrono::milliseconds max) {
  this->initialRespawnDelay = initial;
  this->maxRespawnDelay = max;
  return *this;
}

WorkerConfig& WorkerConfig::withStableUptime(std::chrono::milliseconds stableUptime) {
  this->stableUptime = stableUptime;
  return *this;
}

WorkerConfig& WorkerConfig::withMaxConsecutiveFailures(uint32_t maxConsecutiveFailures) {
  this->maxConsecutiveFailures = maxConsecutiveFailures;
  return *this;
}

WorkerConfig& WorkerConfig::withMonitorInterval(std::chrono::milliseconds monitorInterval) {
  this->monitorInterval = monitorInterval;
  return *this;
}

WorkerConfig& WorkerConfig::withStopTimeout(std::chrono::milliseconds stopTimeout) {
  this->stopTimeout = stopTimeout;
  return *this;
}

WorkerConfig& WorkerConfig::withDrainTimeout(std::chrono::milliseconds drainTimeout) {
  this->drainTimeout = drainTimeout;
  return *this;
}

void WorkerConfig::validate() const {
  if (initialRespawnDelay.count() < 0) {
    throw std::invalid_argument("initialRespawnDelay must be non-negative");
  }
  if (maxRespawnDelay < initialRespawnDelay) {
    throw std::invalid_argument("maxRespawnDelay must be >= initialRespawnDelay");
  }
  if (stableUptime.count() < 0) {
    throw std::invalid_argument("stableUptime must be non-negative");
  }
  if (monitorInterval.count() <= 0) {
    throw std::invalid_argument("monitorInterval must be > 0");
  }
  if (stopTimeout.count() < 0) {
    throw std::invalid_argument("stopTimeout must be non-negative");
  }
  if (drainTimeout.count() < 0) {
    throw std::invalid_argument("drainTimeout must be non-negative");
  }
}

}  // namespace hearth
