#include "hearth/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

#include "hearth/errno-throw.hpp"
#include "hearth/event.hpp"
#include "hearth/log.hpp"
#include "hearth/timedef.hpp"

namespace hearth {

namespace {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");
static_assert(EventEt == EPOLLET, "EventEt value mismatch");

int ToTimeoutMs(SteadyDuration pollTimeout) {
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(pollTimeout).count());
}

}  // namespace

EventLoop::EventLoop(SteadyDuration pollTimeout, uint32_t initialCapacity)
    : _pollTimeoutMs(ToTimeoutMs(pollTimeout)),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _epollEvents(std::max(1U, initialCapacity)) {
  // Reserved up front so that data() is never null, even for an empty result.
  _readyEvents.reserve(_epollEvents.size());
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  if (initialCapacity == 0) {
    log::warn("EventLoop constructed with initialCapacity=0; promoting to 1");
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    errno = err;
    return false;
  }
  return true;
}

bool EventLoop::mod(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    // EBADF or ENOENT can occur during races where a connection is concurrently closed; downgrade severity.
    if (err == EBADF || err == ENOENT) {
      log::warn("epoll_ctl MOD benign failure (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp,
                err, std::strerror(err));
    } else {
      log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
                 std::strerror(err));
    }
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    // DEL failures are usually benign if fd already closed
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  using SizeType = decltype(_epollEvents)::size_type;

  const auto capacityBeforePoll = static_cast<int>(_epollEvents.size());

  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), _epollEvents.data(), capacityBeforePoll, _pollTimeoutMs);

  _readyEvents.clear();
  if (nbReadyFds == -1) {
    if (errno == EINTR) {
      // Interrupted; treat as no events. Return an empty span with a valid data pointer.
      return {_readyEvents.data(), 0U};
    }
    const auto err = errno;
    log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", _pollTimeoutMs, err, std::strerror(err));
    return {};
  }

  for (SizeType idx = 0; std::cmp_less(idx, nbReadyFds); ++idx) {
    _readyEvents.push_back(EventFd{_epollEvents[idx].data.fd, static_cast<EventBmp>(_epollEvents[idx].events)});
  }

  // If saturated, grow buffer for subsequent polls.
  if (nbReadyFds == capacityBeforePoll) {
    const SizeType newCapacity = _epollEvents.size() * 2U;
    _epollEvents.resize(newCapacity);
    _readyEvents.reserve(newCapacity);
    log::debug("EventLoop capacity grown to {}", newCapacity);
  }

  return {_readyEvents.data(), _readyEvents.size()};
}

}  // namespace hearth
