/**
 * @file beacon_agent.hpp
 * @brief Discovery agent: the UDP side of a beacon.
 *
 * The agent owns one UDP socket bound to the selected interface and runs a
 * single-threaded loop over two readiness sources, the command mailbox and
 * the socket:
 *
 *   - commands from the Beacon change the agent state, one per iteration;
 *   - received datagrams pass the filter and echo checks and go upstream;
 *   - while a payload is set it is sent every interval_ms.
 *
 * Construction is split from running. The constructor stores configuration
 * and never blocks, Init() registers the mailbox and sets up the socket,
 * Run() loops until Terminate. A socket that fails during Init() or a send
 * is recreated before the next beacon goes out. RunAgent() strings the three together with interface
 * resolution and the startup report, and is what a Beacon runs on its
 * thread.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef ZBEACON_BEACON_AGENT_HPP_
#define ZBEACON_BEACON_AGENT_HPP_

#include "zbeacon/channel.hpp"
#include "zbeacon/config.hpp"
#include "zbeacon/interface.hpp"
#include "zbeacon/io_poller.hpp"
#include "zbeacon/log.hpp"
#include "zbeacon/platform.hpp"
#include "zbeacon/socket.hpp"
#include "zbeacon/vocabulary.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>

namespace zbeacon {

// ============================================================================
// Constants
// ============================================================================

static constexpr uint32_t kDefaultIntervalMs = 1000U;
static constexpr uint8_t kDefaultMulticastTtl = 2U;

// ============================================================================
// Bind Strategy
// ============================================================================

enum class BindStrategy : uint8_t {
  kWildcard = 0,      ///< bind 0.0.0.0:port, send to the broadcast address
  kBroadcastAddress   ///< bind and send to the broadcast address
};

/** @brief Broadcast bind strategy for an OS family. */
inline BindStrategy SelectBindStrategy(PlatformFamily platform) noexcept {
  switch (platform) {
    case PlatformFamily::kWindows:
    case PlatformFamily::kMacOS:
    case PlatformFamily::kFreeBSD:
      return BindStrategy::kWildcard;
    default:
      return BindStrategy::kBroadcastAddress;
  }
}

// ============================================================================
// BeaconOptions
// ============================================================================

struct BeaconOptions {
  uint16_t port = 0;
  /// Announce target: the limited broadcast address selects broadcast
  /// mode, a 224.0.0.0/4 group selects multicast.
  Ipv4Text announce = "255.255.255.255";
  uint32_t interval_ms = kDefaultIntervalMs;
  bool noecho = false;
  uint8_t multicast_ttl = kDefaultMulticastTtl;
  PlatformFamily platform = CurrentPlatform();
  InterfaceResolverFn resolver = &ResolveHostInterface;
  void* resolver_context = nullptr;
  log::LogSinkFn log_sink = nullptr;
  void* log_context = nullptr;
};

/**
 * @brief Apply the [beacon] section of @p values onto @p options.
 *
 * Keys: port, announce, interval_ms, noecho, multicast_ttl. Missing keys
 * keep their current value. On kInvalidValue @p options is left untouched.
 */
inline expected<void, ConfigError> LoadBeaconOptions(const ConfigValues& values,
                                                     BeaconOptions& options) {
  static constexpr const char* kSection = "beacon";
  BeaconOptions out = options;

  if (values.Contains(kSection, "port")) {
    auto v = values.FindInt(kSection, "port");
    if (!v.has_value() || v.value() <= 0 || v.value() > 65535) {
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    out.port = static_cast<uint16_t>(v.value());
  }
  if (values.Contains(kSection, "announce")) {
    const char* text = values.Find(kSection, "announce");
    if (!ParseIpv4(text).has_value()) {
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    out.announce.assign(TruncateToCapacity, text);
  }
  if (values.Contains(kSection, "interval_ms")) {
    auto v = values.FindInt(kSection, "interval_ms");
    if (!v.has_value() || v.value() <= 0) {
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    out.interval_ms = static_cast<uint32_t>(v.value());
  }
  if (values.Contains(kSection, "noecho")) {
    auto v = values.FindBool(kSection, "noecho");
    if (!v.has_value()) {
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    out.noecho = v.value();
  }
  if (values.Contains(kSection, "multicast_ttl")) {
    auto v = values.FindInt(kSection, "multicast_ttl");
    if (!v.has_value() || v.value() < 1 || v.value() > 255) {
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    out.multicast_ttl = static_cast<uint8_t>(v.value());
  }

  options = out;
  return expected<void, ConfigError>::success();
}

/**
 * @brief Resolve the interface for @p options and mark the announce mode.
 * @return kInvalidAddress for a malformed announce address, otherwise the
 *         resolver's result.
 */
inline expected<InterfaceBinding, BeaconError> ResolveBinding(
    const BeaconOptions& options) {
  auto announce = ParseIpv4(options.announce.c_str());
  if (!announce.has_value()) {
    return expected<InterfaceBinding, BeaconError>::error(
        BeaconError::kInvalidAddress);
  }
  InterfaceResolverFn resolver =
      (options.resolver != nullptr) ? options.resolver : &ResolveHostInterface;
  auto binding = resolver(options.resolver_context);
  if (!binding.has_value()) return binding;
  binding.value().multicast = IsMulticastAddress(announce.value());
  return binding;
}

// ============================================================================
// BeaconAgent
// ============================================================================

/** @brief Counters kept by the agent thread. Read them after Run() returns. */
struct AgentStats {
  uint64_t sent = 0;           ///< beacons transmitted
  uint64_t send_failures = 0;  ///< sends that failed even after a socket reset
  uint64_t delivered = 0;      ///< announcements posted upstream
  uint64_t dropped = 0;        ///< announcements lost to a full event mailbox
};

class BeaconAgent {
 public:
  using Clock = std::chrono::steady_clock;

  BeaconAgent(const BeaconOptions& options, const InterfaceBinding& binding,
              BeaconChannel& channel) noexcept
      : options_(options),
        binding_(binding),
        channel_(channel),
        logger_("zbeacon.agent", options.log_sink, options.log_context),
        interval_ms_(options.interval_ms),
        noecho_(options.noecho),
        ping_at_(Clock::now()) {}

  BeaconAgent(const BeaconAgent&) = delete;
  BeaconAgent& operator=(const BeaconAgent&) = delete;

  /**
   * @brief Register the command mailbox and set up the UDP socket.
   *
   * Only a poller or channel failure is returned. A socket that cannot be
   * set up is logged and left closed; the first beacon send retries it.
   */
  expected<void, BeaconError> Init() {
    if (!poller_.IsValid() || !channel_.IsValid()) {
      logger_.Error("poller or channel unavailable");
      return expected<void, BeaconError>::error(BeaconError::kPollerFailed);
    }
    if (!poller_.Add(channel_.commands.Fd(),
                     static_cast<uint8_t>(IoEvent::kReadable))) {
      logger_.Error("cannot watch command mailbox");
      return expected<void, BeaconError>::error(BeaconError::kPollerFailed);
    }
    auto sock = InitSocket();
    if (!sock.has_value()) {
      logger_.Warn("socket setup failed (%s), retrying on first send",
                   BeaconErrorName(sock.get_error()));
    }
    return expected<void, BeaconError>::success();
  }

  /**
   * @brief Event loop. Returns once Terminate has been handled; the socket
   *        is closed and the acknowledgment posted by then.
   */
  void Run() {
    while (!terminated_) {
      auto waited = poller_.Wait(NextTimeoutMs());
      if (!waited.has_value()) {
        if (waited.get_error() == PollerError::kInterrupted) continue;
        logger_.Error("poller wait failed (errno %d), serving commands only",
                      errno);
        ServeCommandsUntilTerminated();
        break;
      }

      if ((poller_.EventsFor(channel_.commands.Fd()) &
           static_cast<uint8_t>(IoEvent::kReadable)) != 0) {
        HandleCommand();
      }
      if (!terminated_ && socket_.IsValid() &&
          poller_.EventsFor(socket_.Fd()) != 0) {
        ReceiveOnce();
      }
      if (transmitting_ && !terminated_ && Clock::now() >= ping_at_) {
        SendBeacon();
        ping_at_ = Clock::now() + std::chrono::milliseconds(interval_ms_);
      }
    }
    socket_.Close();
  }

  // --- State inspection (agent thread, or after Run() returned) ---

  const InterfaceBinding& Binding() const noexcept { return binding_; }
  const SocketAddress& Target() const noexcept { return target_; }
  const AgentStats& Stats() const noexcept { return stats_; }
  uint32_t IntervalMs() const noexcept { return interval_ms_; }
  bool IsTransmitting() const noexcept { return transmitting_; }
  bool IsNoEcho() const noexcept { return noecho_; }
  const BeaconPayload& Filter() const noexcept { return filter_; }
  bool IsTerminated() const noexcept { return terminated_; }
  int32_t SocketFd() const noexcept { return socket_.Fd(); }

  // --- Receive rules ---

  /**
   * @brief An empty filter accepts everything, otherwise a prefix match.
   *
   * Datagrams no longer than the filter are compared too: one shorter than
   * the filter is discarded rather than passed through unchecked.
   */
  static bool MatchesFilter(const BeaconPayload& filter, const void* data,
                            size_t len) noexcept {
    return filter.Empty() || filter.IsPrefixOf(data, len);
  }

  /** @brief True if @p data is our own payload and echo is suppressed. */
  static bool IsEcho(bool noecho, bool transmitting,
                     const BeaconPayload& payload, const void* data,
                     size_t len) noexcept {
    return noecho && transmitting && payload.Equals(data, len);
  }

  /**
   * @brief (Re)create the UDP socket. The old socket is closed first; the
   *        new one only replaces it once fully configured.
   */
  expected<void, BeaconError> InitSocket() {
    if (socket_.IsValid()) {
      if (!poller_.Remove(socket_.Fd())) {
        logger_.Warn("cannot unregister socket fd %d", socket_.Fd());
      }
      socket_.Close();
    }

    auto created = UdpSocket::Create();
    if (!created.has_value()) {
      logger_.Error("socket creation failed (errno %d)", errno);
      return expected<void, BeaconError>::error(BeaconError::kSocketFailed);
    }
    UdpSocket sock = static_cast<UdpSocket&&>(created.value());

    auto r = binding_.multicast ? ConfigureMulticast(sock)
                                : ConfigureBroadcast(sock);
    if (!r.has_value()) return r;

    if (!sock.SetNonBlocking(true)) {
      logger_.Error("cannot make socket non-blocking");
      return expected<void, BeaconError>::error(BeaconError::kSetOptFailed);
    }
    if (!poller_.Add(sock.Fd(), static_cast<uint8_t>(IoEvent::kReadable))) {
      logger_.Error("cannot watch socket fd %d", sock.Fd());
      return expected<void, BeaconError>::error(BeaconError::kPollerFailed);
    }
    socket_ = static_cast<UdpSocket&&>(sock);

    char target[SocketAddress::kIpv4StrLen] = {};
    (void)target_.ToString(target, sizeof(target));
    logger_.Debug("%s beacon on %s to %s:%u",
                  binding_.multicast ? "multicast" : "broadcast",
                  binding_.name.c_str(), target,
                  static_cast<unsigned>(target_.Port()));
    return expected<void, BeaconError>::success();
  }

 private:
  expected<void, BeaconError> ConfigureMulticast(UdpSocket& sock) {
    auto group = ParseIpv4(options_.announce.c_str());
    if (!group.has_value()) {
      return expected<void, BeaconError>::error(BeaconError::kInvalidAddress);
    }
    if (!sock.SetMulticastTtl(options_.multicast_ttl) ||
        !sock.SetMulticastLoop(true) ||
        !sock.JoinMulticastGroup(group.value()) ||
        !sock.SetReuseAddr(true)) {
      logger_.Error("multicast socket options failed (errno %d)", errno);
      return expected<void, BeaconError>::error(BeaconError::kSetOptFailed);
    }
    if (!sock.SetReusePort(true)) {
      logger_.Debug("SO_REUSEPORT unavailable");
    }
    if (!sock.Bind(SocketAddress::FromHost(binding_.address, options_.port))) {
      logger_.Error("bind %s:%u failed (errno %d)",
                    FormatIpv4(binding_.address).c_str(),
                    static_cast<unsigned>(options_.port), errno);
      return expected<void, BeaconError>::error(BeaconError::kBindFailed);
    }
    target_ = SocketAddress::FromHost(group.value(), options_.port);
    return expected<void, BeaconError>::success();
  }

  expected<void, BeaconError> ConfigureBroadcast(UdpSocket& sock) {
    if (!sock.SetBroadcast(true) || !sock.SetReuseAddr(true)) {
      logger_.Error("broadcast socket options failed (errno %d)", errno);
      return expected<void, BeaconError>::error(BeaconError::kSetOptFailed);
    }
    if (!sock.SetReusePort(true)) {
      logger_.Debug("SO_REUSEPORT unavailable");
    }
    SocketAddress local =
        (SelectBindStrategy(options_.platform) == BindStrategy::kWildcard)
            ? SocketAddress::Any(options_.port)
            : SocketAddress::FromHost(binding_.broadcast, options_.port);
    if (!sock.Bind(local)) {
      logger_.Error("bind %s:%u failed (errno %d)",
                    FormatIpv4(local.Ip()).c_str(),
                    static_cast<unsigned>(options_.port), errno);
      return expected<void, BeaconError>::error(BeaconError::kBindFailed);
    }
    target_ = SocketAddress::FromHost(binding_.broadcast, options_.port);
    return expected<void, BeaconError>::success();
  }

  int32_t NextTimeoutMs() const {
    if (!transmitting_) return -1;
    auto left = std::chrono::ceil<std::chrono::milliseconds>(ping_at_ -
                                                             Clock::now());
    return (left.count() > 0) ? static_cast<int32_t>(left.count()) : 0;
  }

  void HandleCommand() {
    ControlCommand cmd;
    if (channel_.commands.TryPop(cmd)) Apply(cmd);
  }

  void Apply(const ControlCommand& cmd) {
    switch (cmd.type) {
      case CommandType::kSetInterval:
        interval_ms_ = cmd.interval_ms;
        break;
      case CommandType::kNoEcho:
        noecho_ = true;
        break;
      case CommandType::kPublish:
        // An empty announcement is no announcement.
        transmit_ = cmd.payload;
        transmitting_ = !transmit_.Empty();
        ping_at_ = Clock::now();
        break;
      case CommandType::kSilence:
        transmit_.Clear();
        transmitting_ = false;
        break;
      case CommandType::kSubscribe:
        filter_ = cmd.payload;
        break;
      case CommandType::kUnsubscribe:
        filter_.Clear();
        break;
      case CommandType::kTerminate:
        terminated_ = true;
        if (!channel_.events.PushBlocking(AgentMessage::Terminated())) {
          logger_.Error("cannot post terminate acknowledgment");
        }
        return;
      default:
        logger_.Warn("unknown command 0x%02x ignored",
                     static_cast<unsigned>(cmd.type));
        return;
    }
    logger_.Debug("command %s", CommandTypeName(cmd.type));
  }

  void ServeCommandsUntilTerminated() {
    ControlCommand cmd;
    while (!terminated_) {
      if (channel_.commands.Pop(cmd, -1)) {
        Apply(cmd);
      } else if (!channel_.commands.IsValid()) {
        terminated_ = true;
      }
    }
  }

  void ReceiveOnce() {
    uint8_t buf[kBeaconMax];
    SocketAddress src;
    auto r = socket_.RecvFrom(buf, sizeof(buf), src);
    if (!r.has_value()) {
      if (r.get_error() != SocketError::kWouldBlock) {
        logger_.Warn("recv failed (errno %d)", errno);
      }
      return;
    }
    const size_t len = static_cast<size_t>(r.value());

    if (!MatchesFilter(filter_, buf, len)) return;
    if (IsEcho(noecho_, transmitting_, transmit_, buf, len)) return;

    PeerAnnouncement announcement;
    (void)announcement.data.Assign(buf, len);
    announcement.sender = FormatIpv4(src.Ip());
    announcement.sender_port = src.Port();
    if (channel_.events.Push(AgentMessage::Announcement(announcement))) {
      ++stats_.delivered;
    } else {
      ++stats_.dropped;
      logger_.Debug("event mailbox full, announcement from %s dropped",
                    announcement.sender.c_str());
    }
  }

  void SendBeacon() {
    if (socket_.SendTo(transmit_.Data(), transmit_.Size(), target_)) {
      ++stats_.sent;
      return;
    }
    logger_.Warn("beacon send failed (errno %d), resetting socket", errno);
    if (!InitSocket()) {
      ++stats_.send_failures;
      logger_.Error("socket reset failed, beacon not sent");
      return;
    }
    if (!socket_.SendTo(transmit_.Data(), transmit_.Size(), target_)) {
      ++stats_.send_failures;
      logger_.Error("beacon send failed after socket reset (errno %d)", errno);
      return;
    }
    ++stats_.sent;
  }

  const BeaconOptions options_;
  const InterfaceBinding binding_;
  BeaconChannel& channel_;
  log::Logger logger_;

  IoPoller poller_;
  UdpSocket socket_;
  SocketAddress target_;

  uint32_t interval_ms_;
  BeaconPayload transmit_;
  bool transmitting_ = false;
  bool noecho_;
  BeaconPayload filter_;
  Clock::time_point ping_at_;
  bool terminated_ = false;

  AgentStats stats_;
};

// ============================================================================
// RunAgent
// ============================================================================

/**
 * @brief Agent thread body: resolve, initialize, report, loop.
 *
 * Posts exactly one of kReady or kStartFailed. After kReady it runs until a
 * Terminate command and then posts kTerminated.
 */
inline void RunAgent(const BeaconOptions& options, BeaconChannel& channel) {
  log::Logger logger("zbeacon.agent", options.log_sink, options.log_context);

  auto binding = ResolveBinding(options);
  if (!binding.has_value()) {
    logger.Error("startup failed: %s", BeaconErrorName(binding.get_error()));
    if (!channel.events.PushBlocking(
            AgentMessage::StartFailed(binding.get_error()))) {
      logger.Error("cannot post startup report");
    }
    return;
  }

  BeaconAgent agent(options, binding.value(), channel);
  auto init = agent.Init();
  if (!init.has_value()) {
    logger.Error("startup failed: %s", BeaconErrorName(init.get_error()));
    if (!channel.events.PushBlocking(
            AgentMessage::StartFailed(init.get_error()))) {
      logger.Error("cannot post startup report");
    }
    return;
  }

  logger.Info("beacon agent up on %s (%s), port %u",
              binding.value().name.c_str(),
              FormatIpv4(binding.value().address).c_str(),
              static_cast<unsigned>(options.port));
  if (!channel.events.PushBlocking(AgentMessage::Ready(binding.value()))) {
    logger.Error("cannot post startup report");
    return;
  }
  agent.Run();
}

}  // namespace zbeacon

#endif  // ZBEACON_BEACON_AGENT_HPP_
