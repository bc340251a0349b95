#pragma once

#include <sys/epoll.h>

#include <cstdint>
#include <span>

#include "hearth/base-fd.hpp"
#include "hearth/event.hpp"
#include "hearth/timedef.hpp"
#include "hearth/vector.hpp"

namespace hearth {

// Thin RAII wrapper over epoll.
//
// Design notes:
//  * The event buffer starts with kInitialCapacity (64) slots. On saturation (returned events == current capacity)
//    the capacity is doubled. It never shrinks, poll cost is independent of capacity.
//  * add()/mod()/del() return success/failure and log details on failure; caller decides policy
//    (e.g., drop connection / abort).
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  // Construct an EventLoop. initialCapacity of 0 is promoted to 1.
  // Throws std::system_error if epoll instance cannot be created.
  explicit EventLoop(SteadyDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) noexcept = default;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) noexcept = default;

  ~EventLoop() = default;

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring. Log on error.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns a span over an internal, reusable buffer, valid until next call to poll().
  //  - On success: a non-empty span of ready events.
  //  - On timeout or EINTR: an empty span with non-null data() pointer.
  //  - On unrecoverable poll failure (already logged): an empty span with nullptr data() pointer.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

 private:
  int _pollTimeoutMs;
  BaseFd _baseFd;
  vector<epoll_event> _epollEvents;
  vector<EventFd> _readyEvents;
};

}  // namespace hearth
