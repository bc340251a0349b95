#pragma once

#include "hearth/base-fd.hpp"

namespace hearth {

// Simple RAII class wrapping a non-blocking, close-on-exec eventfd, used to wake up an event loop from another thread.
class EventFd {
 public:
  // Throws std::system_error on failure.
  EventFd();

  // Send a wakeup event.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace hearth
