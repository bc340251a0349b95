#include "hearth/worker-supervisor.hpp"

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "hearth/log.hpp"
#include "hearth/signal-handler.hpp"
#include "hearth/timedef.hpp"
#include "hearth/worker-config.hpp"

namespace hearth {

namespace {

// Polling period of the stop sequence while waiting for workers to exit.
constexpr std::chrono::milliseconds kStopPollPeriod{5};

void LogExitStatus(uint32_t workerIndex, pid_t pid, int status) {
  if (WIFEXITED(status)) {
    log::debug("Worker {} (pid {}) exited with code {}", workerIndex, pid, WEXITSTATUS(status));
  } else if (WIFSIGNALED(status)) {
    log::debug("Worker {} (pid {}) killed by signal {}", workerIndex, pid, WTERMSIG(status));
  }
}

}  // namespace

WorkerSupervisor::WorkerSupervisor(WorkerConfig config, WorkerMain workerMain)
    : _config(std::move(config)), _workerMain(std::move(workerMain)) {
  _config.validate();
  if (!_workerMain) {
    throw std::invalid_argument("WorkerSupervisor requires a worker entry function");
  }
  _slots.resize(_config.effectiveNbWorkers());
}

std::chrono::milliseconds WorkerSupervisor::ComputeRespawnDelay(const WorkerConfig& config,
                                                                uint32_t nbConsecutiveFailures) noexcept {
  if (nbConsecutiveFailures == 0 || config.initialRespawnDelay.count() == 0) {
    return std::chrono::milliseconds{0};
  }
  auto delay = config.initialRespawnDelay;
  for (uint32_t failureNb = 1; failureNb < nbConsecutiveFailures; ++failureNb) {
    if (delay >= config.maxRespawnDelay / 2) {
      return config.maxRespawnDelay;
    }
    delay *= 2;
  }
  return std::min(delay, config.maxRespawnDelay);
}

int WorkerSupervisor::run() {
  log::info("Primary server process started (pid {}), spawning {} worker(s)", ::getpid(), _slots.size());

  for (uint32_t workerIndex = 0; workerIndex < _slots.size(); ++workerIndex) {
    spawn(workerIndex);
  }

  while (!stopRequested()) {
    const auto now = SteadyClock::now();
    reapExited(now);

    if (allAbandoned()) {
      log::critical("All {} worker slot(s) abandoned, giving up", _slots.size());
      return 1;
    }

    for (uint32_t workerIndex = 0; workerIndex < _slots.size(); ++workerIndex) {
      const WorkerSlot& slot = _slots[workerIndex];
      if (slot.pid == -1 && !slot.abandoned && now >= slot.respawnAt) {
        spawn(workerIndex);
      }
    }

    std::this_thread::sleep_for(_config.monitorInterval);
  }

  if (SignalHandler::IsStopRequested()) {
    log::warn("Signal {} received, gracefully shutting down with a max drain period of {}ms",
              SignalHandler::LastSignal(), SignalHandler::GetMaxDrainPeriod().count());
  }
  stopWorkers();
  log::info("Primary server process stopped");
  return 0;
}

void WorkerSupervisor::spawn(uint32_t workerIndex) {
  WorkerSlot& slot = _slots[workerIndex];

  // Make sure buffered logs are not written twice, by the primary and by the child.
  log::default_logger()->flush();

  const pid_t pid = ::fork();
  if (pid == -1) {
    const auto err = errno;
    log::error("fork failed for worker {} err={} ({})", workerIndex, err, std::strerror(err));
    slot.startTime = SteadyClock::now();
    onWorkerFailure(workerIndex, SteadyClock::now());
    return;
  }

  if (pid == 0) {
    // Child process: never returns to the caller.
    int exitCode = 1;
    try {
      exitCode = _workerMain(workerIndex);
    } catch (const std::exception& ex) {
      log::critical("Worker {} terminated with exception: {}", workerIndex, ex.what());
    } catch (...) {
      log::critical("Worker {} terminated with unknown exception", workerIndex);
    }
    log::default_logger()->flush();
    ::_exit(exitCode);
  }

  slot.pid = pid;
  slot.startTime = SteadyClock::now();
  ++_totalSpawns;
  log::debug("Spawned worker {} with pid {}", workerIndex, pid);
}

void WorkerSupervisor::reapExited(SteadyTimePoint now) {
  for (uint32_t workerIndex = 0; workerIndex < _slots.size(); ++workerIndex) {
    WorkerSlot& slot = _slots[workerIndex];
    if (slot.pid == -1) {
      continue;
    }
    int status = 0;
    const pid_t ret = ::waitpid(slot.pid, &status, WNOHANG);
    if (ret == 0) {
      // still running
      continue;
    }
    if (ret == -1) {
      const auto err = errno;
      if (err == EINTR) {
        continue;
      }
      log::error("waitpid failed for worker {} (pid {}) err={} ({})", workerIndex, slot.pid, err, std::strerror(err));
    } else {
      LogExitStatus(workerIndex, slot.pid, status);
    }
    log::warn("Worker {} died. Restarting...", slot.pid);
    slot.pid = -1;
    onWorkerFailure(workerIndex, now);
  }
}

void WorkerSupervisor::onWorkerFailure(uint32_t workerIndex, SteadyTimePoint now) {
  WorkerSlot& slot = _slots[workerIndex];
  if (now - slot.startTime >= _config.stableUptime) {
    slot.nbConsecutiveFailures = 0;
  }
  ++slot.nbConsecutiveFailures;
  if (slot.nbConsecutiveFailures > _config.maxConsecutiveFailures) {
    slot.abandoned = true;
    log::critical("Worker slot {} failed {} times in a row, abandoning it", workerIndex, slot.nbConsecutiveFailures);
    return;
  }
  const auto delay = ComputeRespawnDelay(_config, slot.nbConsecutiveFailures);
  slot.respawnAt = now + delay;
  if (delay.count() != 0) {
    log::info("Respawning worker slot {} in {} ms", workerIndex, delay.count());
  }
}

void WorkerSupervisor::stopWorkers() {
  uint32_t nbAlive = 0;
  for (const WorkerSlot& slot : _slots) {
    if (slot.pid != -1) {
      if (::kill(slot.pid, SIGTERM) == -1) {
        const auto err = errno;
        log::error("kill(SIGTERM) failed for pid {} err={} ({})", slot.pid, err, std::strerror(err));
      }
      ++nbAlive;
    }
  }
  if (nbAlive == 0) {
    return;
  }
  log::info("Stopping {} worker(s)", nbAlive);

  const auto deadline = SteadyClock::now() + _config.stopTimeout;
  while (nbAlive != 0 && SteadyClock::now() < deadline) {
    for (WorkerSlot& slot : _slots) {
      if (slot.pid == -1) {
        continue;
      }
      int status = 0;
      const pid_t ret = ::waitpid(slot.pid, &status, WNOHANG);
      if (ret == slot.pid || (ret == -1 && errno == ECHILD)) {
        slot.pid = -1;
        --nbAlive;
      }
    }
    if (nbAlive != 0) {
      std::this_thread::sleep_for(std::min(kStopPollPeriod, _config.monitorInterval));
    }
  }

  for (WorkerSlot& slot : _slots) {
    if (slot.pid == -1) {
      continue;
    }
    log::warn("Worker pid {} did not exit within {} ms, killing it", slot.pid, _config.stopTimeout.count());
    if (::kill(slot.pid, SIGKILL) == -1) {
      const auto err = errno;
      log::error("kill(SIGKILL) failed for pid {} err={} ({})", slot.pid, err, std::strerror(err));
    }
    int status = 0;
    while (::waitpid(slot.pid, &status, 0) == -1 && errno == EINTR) {
    }
    slot.pid = -1;
  }
}

bool WorkerSupervisor::allAbandoned() const noexcept {
  return std::ranges::all_of(_slots, [](const WorkerSlot& slot) { return slot.abandoned; });
}

bool WorkerSupervisor::stopRequested() const noexcept {
  return _stopRequested.load(std::memory_order_acquire) || SignalHandler::IsStopRequested();
}

}  // namespace hearth
