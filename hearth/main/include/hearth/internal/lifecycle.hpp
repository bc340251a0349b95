#pragma once

#include <atomic>
#include <cstdint>

#include "hearth/event-fd.hpp"
#include "hearth/timedef.hpp"

namespace hearth::internal {

// State of a running HttpServer, shared between the event loop thread and the threads calling beginDrain() / stop().
// All transitions requested from other threads are atomic and followed by a wakeup of the event loop.
struct Lifecycle {
  enum class State : uint8_t { Idle, Running, Draining, Stopping };

  Lifecycle() = default;

  Lifecycle(const Lifecycle&) = delete;
  Lifecycle(Lifecycle&&) = delete;
  Lifecycle& operator=(const Lifecycle&) = delete;
  Lifecycle& operator=(Lifecycle&&) = delete;

  ~Lifecycle() = default;

  void reset() noexcept {
    drainDeadlineRep.store(0, std::memory_order_relaxed);
    state.store(State::Idle, std::memory_order_release);
  }

  void enterRunning() noexcept {
    drainDeadlineRep.store(0, std::memory_order_relaxed);
    state.store(State::Running, std::memory_order_release);
  }

  // Atomically set state to Stopping if the server is Running or Draining.
  // Returns the previous state.
  State exchangeStopping() noexcept {
    State expected = state.load(std::memory_order_acquire);
    while ((expected == State::Running || expected == State::Draining) &&
           !state.compare_exchange_weak(expected, State::Stopping, std::memory_order_acq_rel)) {
    }
    return expected;
  }

  // Atomically set state to Draining only if current state is Running, with an optional deadline.
  // Returns the previous state.
  State exchangeDraining(SteadyTimePoint deadline, bool hasDeadline) noexcept {
    State expected = State::Running;
    if (state.compare_exchange_strong(expected, State::Draining, std::memory_order_acq_rel) && hasDeadline) {
      drainDeadlineRep.store(deadline.time_since_epoch().count(), std::memory_order_relaxed);
    }
    return expected;
  }

  // Sets the drain deadline if there was none, or if the new one is earlier.
  void shrinkDeadline(SteadyTimePoint deadline) noexcept {
    const auto newRep = deadline.time_since_epoch().count();
    auto currentRep = drainDeadlineRep.load(std::memory_order_relaxed);
    while ((currentRep == 0 || newRep < currentRep) &&
           !drainDeadlineRep.compare_exchange_weak(currentRep, newRep, std::memory_order_relaxed)) {
    }
  }

  [[nodiscard]] bool isIdle() const noexcept { return state.load(std::memory_order_acquire) == State::Idle; }
  [[nodiscard]] bool isRunning() const noexcept { return state.load(std::memory_order_acquire) == State::Running; }
  [[nodiscard]] bool isDraining() const noexcept { return state.load(std::memory_order_acquire) == State::Draining; }
  [[nodiscard]] bool isStopping() const noexcept { return state.load(std::memory_order_acquire) == State::Stopping; }
  [[nodiscard]] bool isActive() const noexcept { return state.load(std::memory_order_acquire) != State::Idle; }

  // Checked at the top of every request: new requests are refused while shutting down.
  [[nodiscard]] bool isShuttingDown() const noexcept {
    const auto current = state.load(std::memory_order_acquire);
    return current == State::Draining || current == State::Stopping;
  }

  [[nodiscard]] bool hasDeadline() const noexcept { return drainDeadlineRep.load(std::memory_order_relaxed) != 0; }

  [[nodiscard]] SteadyTimePoint deadline() const noexcept {
    return SteadyTimePoint(SteadyDuration(drainDeadlineRep.load(std::memory_order_relaxed)));
  }

  // Wakeup fd (eventfd) used to interrupt epoll_wait promptly when beginDrain() or stop() is invoked from another
  // thread.
  EventFd wakeupFd;
  std::atomic<State> state{State::Idle};
  // Drain deadline as a steady clock tick count, 0 when there is no deadline.
  std::atomic<SteadyDuration::rep> drainDeadlineRep{0};
};

}  // namespace hearth::internal
