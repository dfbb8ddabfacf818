/**
 * @file channel.hpp
 * @brief Control channel between a Beacon and its agent thread.
 *
 * A Mailbox is one direction: an SPSC ring buffer plus a pipe(2) doorbell.
 * Every queued element is matched by one byte in the pipe, so the read end
 * is readable exactly while the mailbox holds elements and can sit in a
 * poller next to sockets. BeaconChannel pairs the command direction
 * (Beacon -> agent) with the event direction (agent -> Beacon).
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef ZBEACON_CHANNEL_HPP_
#define ZBEACON_CHANNEL_HPP_

#include "zbeacon/interface.hpp"
#include "zbeacon/platform.hpp"
#include "zbeacon/spsc_ringbuffer.hpp"
#include "zbeacon/vocabulary.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace zbeacon {

// ============================================================================
// Constants
// ============================================================================

/// Largest beacon payload or filter, in bytes.
static constexpr size_t kBeaconMax = 255U;

#ifndef ZBEACON_COMMAND_DEPTH
#define ZBEACON_COMMAND_DEPTH 64U
#endif

#ifndef ZBEACON_EVENT_DEPTH
#define ZBEACON_EVENT_DEPTH 64U
#endif

// ============================================================================
// BeaconPayload
// ============================================================================

/**
 * @brief Opaque byte string of at most kBeaconMax bytes.
 *
 * Used both for the transmitted announcement and for the receive filter.
 */
class BeaconPayload {
 public:
  BeaconPayload() noexcept : size_(0) {}

  /** @brief Replace the contents. @return false (unchanged) if too long. */
  bool Assign(const void* data, size_t len) noexcept {
    if (len > kBeaconMax) return false;
    if (len > 0) std::memcpy(bytes_.data(), data, len);
    size_ = static_cast<uint16_t>(len);
    return true;
  }

  void Clear() noexcept { size_ = 0; }

  const uint8_t* Data() const noexcept { return bytes_.data(); }
  size_t Size() const noexcept { return size_; }
  bool Empty() const noexcept { return size_ == 0; }

  bool Equals(const void* data, size_t len) const noexcept {
    return len == size_ && (len == 0 || std::memcmp(bytes_.data(), data, len) == 0);
  }

  /** @brief True if @p data begins with these bytes. */
  bool IsPrefixOf(const void* data, size_t len) const noexcept {
    return len >= size_ &&
           (size_ == 0 || std::memcmp(bytes_.data(), data, size_) == 0);
  }

 private:
  std::array<uint8_t, kBeaconMax> bytes_{};
  uint16_t size_;
};

// ============================================================================
// ControlCommand (Beacon -> agent)
// ============================================================================

enum class CommandType : uint8_t {
  kSetInterval = 0,
  kNoEcho,
  kPublish,
  kSilence,
  kSubscribe,
  kUnsubscribe,
  kTerminate
};

inline const char* CommandTypeName(CommandType type) noexcept {
  switch (type) {
    case CommandType::kSetInterval: return "SetInterval";
    case CommandType::kNoEcho:      return "NoEcho";
    case CommandType::kPublish:     return "Publish";
    case CommandType::kSilence:     return "Silence";
    case CommandType::kSubscribe:   return "Subscribe";
    case CommandType::kUnsubscribe: return "Unsubscribe";
    case CommandType::kTerminate:   return "Terminate";
    default:                        return "Unknown";
  }
}

struct ControlCommand {
  CommandType type = CommandType::kSilence;
  uint32_t interval_ms = 0;  ///< kSetInterval
  BeaconPayload payload;     ///< kPublish (announcement), kSubscribe (filter)

  static ControlCommand SetInterval(uint32_t ms) noexcept {
    ControlCommand cmd;
    cmd.type = CommandType::kSetInterval;
    cmd.interval_ms = ms;
    return cmd;
  }
  static ControlCommand NoEcho() noexcept { return Of(CommandType::kNoEcho); }
  static ControlCommand Publish(const BeaconPayload& payload) noexcept {
    ControlCommand cmd = Of(CommandType::kPublish);
    cmd.payload = payload;
    return cmd;
  }
  static ControlCommand Silence() noexcept { return Of(CommandType::kSilence); }
  static ControlCommand Subscribe(const BeaconPayload& filter) noexcept {
    ControlCommand cmd = Of(CommandType::kSubscribe);
    cmd.payload = filter;
    return cmd;
  }
  static ControlCommand Unsubscribe() noexcept {
    return Of(CommandType::kUnsubscribe);
  }
  static ControlCommand Terminate() noexcept {
    return Of(CommandType::kTerminate);
  }

 private:
  static ControlCommand Of(CommandType type) noexcept {
    ControlCommand cmd;
    cmd.type = type;
    return cmd;
  }
};

// ============================================================================
// AgentMessage (agent -> Beacon)
// ============================================================================

/** @brief A received beacon that passed the filter and echo checks. */
struct PeerAnnouncement {
  BeaconPayload data;
  Ipv4Text sender;  ///< dotted-decimal source address
  uint16_t sender_port = 0;
};

enum class AgentMessageKind : uint8_t {
  kReady = 0,     ///< startup done, binding valid
  kStartFailed,   ///< startup failed, error valid; the agent has exited
  kAnnouncement,  ///< announcement valid
  kTerminated     ///< Terminate acknowledged; nothing follows
};

struct AgentMessage {
  AgentMessageKind kind = AgentMessageKind::kTerminated;
  InterfaceBinding binding;
  BeaconError error = BeaconError::kNoInterface;
  PeerAnnouncement announcement;

  static AgentMessage Ready(const InterfaceBinding& binding) noexcept {
    AgentMessage msg;
    msg.kind = AgentMessageKind::kReady;
    msg.binding = binding;
    return msg;
  }
  static AgentMessage StartFailed(BeaconError error) noexcept {
    AgentMessage msg;
    msg.kind = AgentMessageKind::kStartFailed;
    msg.error = error;
    return msg;
  }
  static AgentMessage Announcement(const PeerAnnouncement& a) noexcept {
    AgentMessage msg;
    msg.kind = AgentMessageKind::kAnnouncement;
    msg.announcement = a;
    return msg;
  }
  static AgentMessage Terminated() noexcept {
    AgentMessage msg;
    msg.kind = AgentMessageKind::kTerminated;
    return msg;
  }
};

// ============================================================================
// Mailbox<T, Depth>
// ============================================================================

/**
 * @brief Bounded SPSC mailbox whose fill state is visible as fd readiness.
 *
 * Exactly one thread may Push and exactly one thread may TryPop / Pop.
 * Only Pop (with a timeout) and PushBlocking wait on the other side.
 */
template <typename T, size_t Depth>
class Mailbox {
 public:
  // A full mailbox must never leave the doorbell write blocked or failed.
  static_assert(Depth <= 512U, "Depth must not exceed the POSIX pipe minimum");

  Mailbox() noexcept {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    for (int32_t fd : pipe_fd_) {
      (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
      int32_t flags = ::fcntl(fd, F_GETFL, 0);
      if (flags >= 0) (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
  }

  ~Mailbox() {
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;

  bool IsValid() const noexcept { return pipe_fd_[0] >= 0; }

  /** @brief Readable while the mailbox is non-empty. */
  int32_t Fd() const noexcept { return pipe_fd_[0]; }

  /** @return false if the mailbox is full or invalid. */
  bool Push(const T& item) noexcept {
    if (!IsValid() || !queue_.Push(item)) return false;
    const uint8_t byte = 1;
    ssize_t n;
    do {
      n = ::write(pipe_fd_[1], &byte, 1);
    } while (n < 0 && errno == EINTR);
    return n == 1;
  }

  /**
   * @brief Push, yielding until the consumer makes room.
   * @return false only if the mailbox is invalid.
   */
  bool PushBlocking(const T& item) noexcept {
    while (!Push(item)) {
      if (!IsValid()) return false;
      std::this_thread::yield();
    }
    return true;
  }

  /** @brief Take the oldest element without waiting. */
  bool TryPop(T& out) noexcept {
    if (!IsValid()) return false;
    uint8_t byte = 0;
    ssize_t n;
    do {
      n = ::read(pipe_fd_[0], &byte, 1);
    } while (n < 0 && errno == EINTR);
    if (n != 1) return false;
    return queue_.Pop(out);
  }

  /**
   * @brief Take the oldest element, waiting up to @p timeout_ms.
   * @param timeout_ms  -1 waits forever, 0 does not wait.
   */
  bool Pop(T& out, int32_t timeout_ms) noexcept {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
    for (;;) {
      if (TryPop(out)) return true;
      if (!IsValid()) return false;

      int32_t wait_ms = -1;
      if (timeout_ms >= 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return false;
        wait_ms = static_cast<int32_t>(left);
      }
      struct pollfd pfd {};
      pfd.fd = pipe_fd_[0];
      pfd.events = POLLIN;
      int32_t rc = ::poll(&pfd, 1, wait_ms);
      if (rc < 0 && errno != EINTR) return false;
    }
  }

  size_t Size() const noexcept { return queue_.Size(); }
  static constexpr size_t Capacity() noexcept { return Depth; }

 private:
  SpscRingbuffer<T, Depth> queue_;
  int32_t pipe_fd_[2];
};

using CommandMailbox = Mailbox<ControlCommand, ZBEACON_COMMAND_DEPTH>;
using EventMailbox = Mailbox<AgentMessage, ZBEACON_EVENT_DEPTH>;

// ============================================================================
// BeaconChannel
// ============================================================================

/** @brief Both directions of the control channel. Shared by reference. */
struct BeaconChannel {
  CommandMailbox commands;  ///< Beacon pushes, agent pops
  EventMailbox events;      ///< agent pushes, Beacon pops

  bool IsValid() const noexcept {
    return commands.IsValid() && events.IsValid();
  }
};

}  // namespace zbeacon

#endif  // ZBEACON_CHANNEL_HPP_
