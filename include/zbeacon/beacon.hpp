/**
 * @file beacon.hpp
 * @brief Beacon: caller-side handle of a LAN discovery beacon.
 *
 * A Beacon runs a BeaconAgent on its own thread and talks to it through a
 * BeaconChannel. Start() blocks until the agent has reported its interface;
 * the configuration calls are one-way commands; Stop() blocks until the
 * agent has acknowledged Terminate and its thread has exited.
 *
 * Drive a Beacon from one thread. Announcements from peers arrive on
 * Channel(), whose Fd() can be polled next to the caller's own descriptors.
 *
 * @code
 *   zbeacon::BeaconOptions opts;
 *   zbeacon::Beacon beacon(opts);
 *   if (beacon.Start(9999)) {
 *     beacon.Publish("svc:7000", 8);
 *     beacon.Subscribe("svc:", 4);
 *     zbeacon::PeerAnnouncement peer;
 *     if (beacon.Recv(peer, 2000)) { ... }
 *   }
 * @endcode
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef ZBEACON_BEACON_HPP_
#define ZBEACON_BEACON_HPP_

#include "zbeacon/beacon_agent.hpp"
#include "zbeacon/channel.hpp"
#include "zbeacon/interface.hpp"
#include "zbeacon/log.hpp"
#include "zbeacon/vocabulary.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace zbeacon {

class Beacon {
 public:
  explicit Beacon(const BeaconOptions& options = BeaconOptions{})
      : options_(options),
        logger_("zbeacon", options.log_sink, options.log_context),
        channel_(std::make_unique<BeaconChannel>()) {}

  ~Beacon() { Stop(); }

  Beacon(const Beacon&) = delete;
  Beacon& operator=(const Beacon&) = delete;

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  /** @brief Start on the port from the options. */
  expected<void, BeaconError> Start() { return Start(options_.port); }

  /**
   * @brief Spawn the agent on @p port and wait for its startup report.
   * @return kAlreadyRunning, kChannelFailed, or the agent's startup error
   *         (kNoInterface when no usable interface exists).
   */
  expected<void, BeaconError> Start(uint16_t port) {
    if (running_) {
      logger_.Warn("start ignored, already running on port %u",
                   static_cast<unsigned>(options_.port));
      return expected<void, BeaconError>::error(BeaconError::kAlreadyRunning);
    }
    // A fresh channel per run: nothing from a previous agent leaks through.
    channel_ = std::make_unique<BeaconChannel>();
    if (!channel_->IsValid()) {
      logger_.Error("control channel creation failed (errno %d)", errno);
      return expected<void, BeaconError>::error(BeaconError::kChannelFailed);
    }

    options_.port = port;
    BeaconChannel* channel = channel_.get();
    const BeaconOptions agent_options = options_;
    agent_thread_ = std::thread(
        [agent_options, channel]() { RunAgent(agent_options, *channel); });

    AgentMessage msg;
    for (;;) {
      if (!channel_->events.Pop(msg, -1)) continue;
      if (msg.kind == AgentMessageKind::kReady) break;
      if (msg.kind == AgentMessageKind::kStartFailed) {
        agent_thread_.join();
        logger_.Error("beacon start on port %u failed: %s",
                      static_cast<unsigned>(port), BeaconErrorName(msg.error));
        return expected<void, BeaconError>::error(msg.error);
      }
    }

    binding_ = msg.binding;
    hostname_ = FormatIpv4(binding_.address);
    running_ = true;
    logger_.Info("beacon started on %s:%u", hostname_.c_str(),
                 static_cast<unsigned>(port));
    return expected<void, BeaconError>::success();
  }

  /**
   * @brief Terminate the agent and join its thread. Announcements still
   *        queued are discarded. Idempotent.
   */
  void Stop() {
    if (!running_) return;
    Send(ControlCommand::Terminate());

    AgentMessage msg;
    for (;;) {
      if (!channel_->events.Pop(msg, -1)) continue;
      if (msg.kind == AgentMessageKind::kTerminated) break;
    }
    agent_thread_.join();
    running_ = false;
    logger_.Info("beacon on %s:%u stopped", hostname_.c_str(),
                 static_cast<unsigned>(options_.port));
  }

  bool IsRunning() const noexcept { return running_; }

  // ==========================================================================
  // Commands
  // ==========================================================================

  void SetInterval(uint32_t interval_ms) {
    Send(ControlCommand::SetInterval(interval_ms));
  }

  /** @brief Stop delivering datagrams equal to our own payload. */
  void NoEcho() { Send(ControlCommand::NoEcho()); }

  /**
   * @brief Start announcing @p data now and every interval after. An empty
   *        payload announces nothing, like Silence().
   */
  void Publish(const void* data, size_t len) {
    BeaconPayload payload;
    if (!payload.Assign(data, len)) {
      logger_.Error("publish rejected: %zu bytes exceeds %zu", len, kBeaconMax);
      return;
    }
    Send(ControlCommand::Publish(payload));
  }

  void Silence() { Send(ControlCommand::Silence()); }

  /** @brief Deliver only datagrams starting with @p filter. */
  void Subscribe(const void* filter, size_t len) {
    BeaconPayload payload;
    if (!payload.Assign(filter, len)) {
      logger_.Error("subscribe rejected: %zu bytes exceeds %zu", len,
                    kBeaconMax);
      return;
    }
    Send(ControlCommand::Subscribe(payload));
  }

  void Unsubscribe() { Send(ControlCommand::Unsubscribe()); }

  // ==========================================================================
  // Inbound
  // ==========================================================================

  /**
   * @brief Agent-to-caller mailbox. Replaced by every Start(), so do not
   *        keep the reference across restarts.
   */
  EventMailbox& Channel() noexcept { return channel_->events; }

  /**
   * @brief Wait up to @p timeout_ms (-1 forever) for the next announcement.
   *        Other messages on the way are consumed.
   */
  bool Recv(PeerAnnouncement& out, int32_t timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
    AgentMessage msg;
    for (;;) {
      int32_t wait_ms = -1;
      if (timeout_ms >= 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now()).count();
        wait_ms = (left > 0) ? static_cast<int32_t>(left) : 0;
      }
      if (!channel_->events.Pop(msg, wait_ms)) return false;
      if (msg.kind == AgentMessageKind::kAnnouncement) {
        out = msg.announcement;
        return true;
      }
    }
  }

  // ==========================================================================
  // Accessors
  // ==========================================================================

  /** @brief Local interface address as reported at startup, "" if never started. */
  const char* Hostname() const noexcept { return hostname_.c_str(); }

  const InterfaceBinding& Binding() const noexcept { return binding_; }
  uint16_t Port() const noexcept { return options_.port; }

 private:
  void Send(const ControlCommand& cmd) {
    if (!running_) {
      logger_.Warn("%s dropped, beacon not running",
                   CommandTypeName(cmd.type));
      return;
    }
    if (!channel_->commands.PushBlocking(cmd)) {
      logger_.Error("%s lost, control channel invalid",
                    CommandTypeName(cmd.type));
    }
  }

  BeaconOptions options_;
  log::Logger logger_;
  std::unique_ptr<BeaconChannel> channel_;
  std::thread agent_thread_;
  bool running_ = false;
  InterfaceBinding binding_;
  Ipv4Text hostname_;
};

}  // namespace zbeacon

#endif  // ZBEACON_BEACON_HPP_
