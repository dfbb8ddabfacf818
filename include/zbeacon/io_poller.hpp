/**
 * @file io_poller.hpp
 * @brief Readiness poller over epoll (Linux) and kqueue (macOS, FreeBSD).
 *
 * Level-triggered: an fd stays ready for as long as it has unread data, so a
 * consumer may take one item per wakeup and be woken again for the rest.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef ZBEACON_IO_POLLER_HPP_
#define ZBEACON_IO_POLLER_HPP_

#include "zbeacon/platform.hpp"
#include "zbeacon/vocabulary.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <unistd.h>

#if defined(ZBEACON_PLATFORM_LINUX)
#include <sys/epoll.h>
#elif defined(ZBEACON_PLATFORM_MACOS) || defined(ZBEACON_PLATFORM_FREEBSD)
#include <sys/event.h>
#include <sys/time.h>
#endif

namespace zbeacon {

// ============================================================================
// Error Enum
// ============================================================================

enum class PollerError : uint8_t {
  kCreateFailed,
  kAddFailed,
  kRemoveFailed,
  kWaitFailed,
  kInterrupted  ///< EINTR -- caller should simply wait again.
};

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError    = 0x04,
  kHangup   = 0x08
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

struct PollResult {
  int32_t fd;
  uint8_t events;  // bitmask of IoEvent
};

// ============================================================================
// IoPoller
// ============================================================================

#ifndef ZBEACON_IO_POLLER_MAX_EVENTS
#define ZBEACON_IO_POLLER_MAX_EVENTS 8U
#endif

class IoPoller {
 public:
  IoPoller() noexcept;
  ~IoPoller();

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  bool IsValid() const noexcept { return poller_fd_ >= 0; }
  int32_t Fd() const noexcept { return poller_fd_; }

  /** @brief Add an fd to monitor with given events (kReadable, kWritable). */
  expected<void, PollerError> Add(int32_t fd, uint8_t events);

  /** @brief Remove an fd from monitoring. */
  expected<void, PollerError> Remove(int32_t fd);

  /**
   * @brief Wait for events.
   * @param timeout_ms  -1 for infinite, 0 for non-blocking.
   * @return Number of ready entries, readable through Results().
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1);

  /** @brief Results from the last Wait() call. */
  const PollResult* Results() const noexcept { return results_.data(); }

  /** @brief Events reported for @p fd by the last Wait(), 0 if none. */
  uint8_t EventsFor(int32_t fd) const noexcept {
    for (uint32_t i = 0; i < result_count_; ++i) {
      if (results_[i].fd == fd) return results_[i].events;
    }
    return 0;
  }

 private:
  int32_t poller_fd_;
  std::array<PollResult, ZBEACON_IO_POLLER_MAX_EVENTS> results_;
  uint32_t result_count_;
};

inline IoPoller::~IoPoller() {
  if (poller_fd_ >= 0) {
    ::close(poller_fd_);
  }
}

// ============================================================================
// Inline Implementation
// ============================================================================

#if defined(ZBEACON_PLATFORM_LINUX)

namespace detail {

inline uint32_t IoEventToEpoll(uint8_t events) {
  uint32_t ep = 0;
  if (events & static_cast<uint8_t>(IoEvent::kReadable)) {
    ep |= EPOLLIN;
  }
  if (events & static_cast<uint8_t>(IoEvent::kWritable)) {
    ep |= EPOLLOUT;
  }
  return ep;
}

inline uint8_t EpollToIoEvent(uint32_t ep) {
  uint8_t ev = 0;
  if (ep & EPOLLIN) {
    ev |= static_cast<uint8_t>(IoEvent::kReadable);
  }
  if (ep & EPOLLOUT) {
    ev |= static_cast<uint8_t>(IoEvent::kWritable);
  }
  if (ep & EPOLLERR) {
    ev |= static_cast<uint8_t>(IoEvent::kError);
  }
  if (ep & EPOLLHUP) {
    ev |= static_cast<uint8_t>(IoEvent::kHangup);
  }
  return ev;
}

}  // namespace detail

inline IoPoller::IoPoller() noexcept
    : poller_fd_(::epoll_create1(EPOLL_CLOEXEC)),
      results_{},
      result_count_(0) {}

inline expected<void, PollerError> IoPoller::Add(int32_t fd, uint8_t events) {
  struct epoll_event ev {};
  ev.events = detail::IoEventToEpoll(events);
  ev.data.fd = fd;
  if (::epoll_ctl(poller_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
    return expected<void, PollerError>::error(PollerError::kAddFailed);
  }
  return expected<void, PollerError>::success();
}

inline expected<void, PollerError> IoPoller::Remove(int32_t fd) {
  if (::epoll_ctl(poller_fd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
    return expected<void, PollerError>::error(PollerError::kRemoveFailed);
  }
  return expected<void, PollerError>::success();
}

inline expected<uint32_t, PollerError> IoPoller::Wait(int32_t timeout_ms) {
  struct epoll_event raw_events[ZBEACON_IO_POLLER_MAX_EVENTS];
  result_count_ = 0;

  int32_t n = ::epoll_wait(poller_fd_, raw_events,
                           static_cast<int32_t>(ZBEACON_IO_POLLER_MAX_EVENTS),
                           timeout_ms);
  if (n < 0) {
    return expected<uint32_t, PollerError>::error(
        errno == EINTR ? PollerError::kInterrupted : PollerError::kWaitFailed);
  }

  auto count = static_cast<uint32_t>(n);
  for (uint32_t i = 0; i < count; ++i) {
    results_[i].fd = raw_events[i].data.fd;
    results_[i].events = detail::EpollToIoEvent(raw_events[i].events);
  }
  result_count_ = count;
  return expected<uint32_t, PollerError>::success(count);
}

#elif defined(ZBEACON_PLATFORM_MACOS) || defined(ZBEACON_PLATFORM_FREEBSD)

inline IoPoller::IoPoller() noexcept
    : poller_fd_(::kqueue()), results_{}, result_count_(0) {}

inline expected<void, PollerError> IoPoller::Add(int32_t fd, uint8_t events) {
  std::array<struct kevent, 2> changes{};
  int32_t nchanges = 0;
  if (events & static_cast<uint8_t>(IoEvent::kReadable)) {
    EV_SET(&changes[nchanges], fd, EVFILT_READ, EV_ADD | EV_ENABLE, 0, 0,
           nullptr);
    ++nchanges;
  }
  if (events & static_cast<uint8_t>(IoEvent::kWritable)) {
    EV_SET(&changes[nchanges], fd, EVFILT_WRITE, EV_ADD | EV_ENABLE, 0, 0,
           nullptr);
    ++nchanges;
  }
  if (nchanges == 0) {
    return expected<void, PollerError>::error(PollerError::kAddFailed);
  }
  struct timespec ts = {0, 0};
  if (::kevent(poller_fd_, changes.data(), nchanges, nullptr, 0, &ts) < 0) {
    return expected<void, PollerError>::error(PollerError::kAddFailed);
  }
  return expected<void, PollerError>::success();
}

inline expected<void, PollerError> IoPoller::Remove(int32_t fd) {
  std::array<struct kevent, 2> changes{};
  // Filters that were never registered report ENOENT; that is not a failure.
  EV_SET(&changes[0], fd, EVFILT_READ, EV_DELETE, 0, 0, nullptr);
  EV_SET(&changes[1], fd, EVFILT_WRITE, EV_DELETE, 0, 0, nullptr);
  struct timespec ts = {0, 0};
  (void)::kevent(poller_fd_, changes.data(), 2, nullptr, 0, &ts);
  return expected<void, PollerError>::success();
}

inline expected<uint32_t, PollerError> IoPoller::Wait(int32_t timeout_ms) {
  struct kevent raw_events[ZBEACON_IO_POLLER_MAX_EVENTS];
  result_count_ = 0;

  struct timespec ts;
  struct timespec* ts_ptr = nullptr;
  if (timeout_ms >= 0) {
    ts.tv_sec = timeout_ms / 1000;
    ts.tv_nsec = (timeout_ms % 1000) * 1000000L;
    ts_ptr = &ts;
  }

  int32_t n = ::kevent(poller_fd_, nullptr, 0, raw_events,
                       static_cast<int32_t>(ZBEACON_IO_POLLER_MAX_EVENTS),
                       ts_ptr);
  if (n < 0) {
    return expected<uint32_t, PollerError>::error(
        errno == EINTR ? PollerError::kInterrupted : PollerError::kWaitFailed);
  }

  // Merge read/write filter events for the same fd into one PollResult
  uint32_t count = 0;
  for (int32_t i = 0; i < n; ++i) {
    int32_t fd = static_cast<int32_t>(raw_events[i].ident);
    uint8_t ev = 0;
    if (raw_events[i].filter == EVFILT_READ) {
      ev |= static_cast<uint8_t>(IoEvent::kReadable);
    }
    if (raw_events[i].filter == EVFILT_WRITE) {
      ev |= static_cast<uint8_t>(IoEvent::kWritable);
    }
    if (raw_events[i].flags & EV_ERROR) {
      ev |= static_cast<uint8_t>(IoEvent::kError);
    }
    if (raw_events[i].flags & EV_EOF) {
      ev |= static_cast<uint8_t>(IoEvent::kHangup);
    }

    bool merged = false;
    for (uint32_t j = 0; j < count; ++j) {
      if (results_[j].fd == fd) {
        results_[j].events |= ev;
        merged = true;
        break;
      }
    }
    if (!merged) {
      results_[count].fd = fd;
      results_[count].events = ev;
      ++count;
    }
  }
  result_count_ = count;
  return expected<uint32_t, PollerError>::success(count);
}

#else
#error "IoPoller: unsupported platform (requires Linux epoll or BSD kqueue)"
#endif

}  // namespace zbeacon

#endif  // ZBEACON_IO_POLLER_HPP_
