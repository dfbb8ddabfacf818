/**
 * @file test_beacon.cpp
 * @brief Tests for beacon.hpp: the caller-side Beacon handle.
 */

#include <catch2/catch_test_macros.hpp>
#include "zbeacon/beacon.hpp"

#include <poll.h>

#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr uint32_t kLoopback = 0x7F000001U;

zbeacon::expected<zbeacon::InterfaceBinding, zbeacon::BeaconError>
LoopbackResolver(void* /*context*/) {
  zbeacon::InterfaceBinding binding;
  binding.name = "lo";
  binding.address = kLoopback;
  binding.netmask = 0xFFFFFFFFU;
  binding.network = kLoopback;
  binding.broadcast = kLoopback;
  return zbeacon::expected<zbeacon::InterfaceBinding,
                           zbeacon::BeaconError>::success(binding);
}

zbeacon::expected<zbeacon::InterfaceBinding, zbeacon::BeaconError>
NoInterfaceResolver(void* /*context*/) {
  return zbeacon::expected<zbeacon::InterfaceBinding,
                           zbeacon::BeaconError>::error(
      zbeacon::BeaconError::kNoInterface);
}

uint16_t FreeUdpPort() {
  auto sock = zbeacon::UdpSocket::Create();
  REQUIRE(sock.has_value());
  REQUIRE(sock.value().Bind(zbeacon::SocketAddress::FromHost(kLoopback, 0)));
  auto local = sock.value().LocalAddress();
  REQUIRE(local.has_value());
  return local.value().Port();
}

struct LogCapture {
  std::mutex mutex;
  std::vector<std::string> lines;

  static void Sink(zbeacon::log::Level /*level*/, const char* /*category*/,
                   const char* message, void* context) {
    auto* self = static_cast<LogCapture*>(context);
    std::lock_guard<std::mutex> lock(self->mutex);
    self->lines.emplace_back(message);
  }

  bool Contains(const char* needle) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& line : lines) {
      if (line.find(needle) != std::string::npos) return true;
    }
    return false;
  }
};

zbeacon::BeaconOptions LoopbackOptions(LogCapture* capture = nullptr) {
  zbeacon::BeaconOptions opts;
  opts.interval_ms = 50;
  opts.platform = zbeacon::PlatformFamily::kLinux;
  opts.resolver = &LoopbackResolver;
  if (capture != nullptr) {
    opts.log_sink = &LogCapture::Sink;
    opts.log_context = capture;
  }
  return opts;
}

std::string AsString(const zbeacon::BeaconPayload& p) {
  return std::string(reinterpret_cast<const char*>(p.Data()), p.Size());
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("beacon - Start reports the bound interface", "[beacon][lifecycle]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  REQUIRE_FALSE(beacon.IsRunning());
  REQUIRE(std::strcmp(beacon.Hostname(), "") == 0);

  const uint16_t port = FreeUdpPort();
  REQUIRE(beacon.Start(port).has_value());
  REQUIRE(beacon.IsRunning());
  REQUIRE(beacon.Port() == port);
  REQUIRE(std::strcmp(beacon.Hostname(), "127.0.0.1") == 0);
  REQUIRE(beacon.Binding().name == "lo");
  REQUIRE(beacon.Binding().address == kLoopback);

  beacon.Stop();
  REQUIRE_FALSE(beacon.IsRunning());
}

TEST_CASE("beacon - Start uses the port from the options", "[beacon][lifecycle]") {
  auto opts = LoopbackOptions();
  opts.port = FreeUdpPort();
  zbeacon::Beacon beacon(opts);
  REQUIRE(beacon.Start().has_value());
  REQUIRE(beacon.Port() == opts.port);
}

TEST_CASE("beacon - Start twice fails with kAlreadyRunning", "[beacon][lifecycle]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  const uint16_t port = FreeUdpPort();
  REQUIRE(beacon.Start(port).has_value());

  auto again = beacon.Start(port);
  REQUIRE_FALSE(again.has_value());
  REQUIRE(again.get_error() == zbeacon::BeaconError::kAlreadyRunning);
  REQUIRE(beacon.IsRunning());
}

TEST_CASE("beacon - Start without an interface fails with kNoInterface",
          "[beacon][lifecycle]") {
  auto opts = LoopbackOptions();
  opts.resolver = &NoInterfaceResolver;
  zbeacon::Beacon beacon(opts);

  auto r = beacon.Start(FreeUdpPort());
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == zbeacon::BeaconError::kNoInterface);
  REQUIRE_FALSE(beacon.IsRunning());
  REQUIRE(std::strcmp(beacon.Hostname(), "") == 0);
}

TEST_CASE("beacon - Start with a bad announce address fails",
          "[beacon][lifecycle]") {
  auto opts = LoopbackOptions();
  opts.announce = "255.255.255";
  zbeacon::Beacon beacon(opts);

  auto r = beacon.Start(FreeUdpPort());
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == zbeacon::BeaconError::kInvalidAddress);
}

TEST_CASE("beacon - Start succeeds while the port is taken",
          "[beacon][lifecycle]") {
  auto taken = zbeacon::UdpSocket::Create();
  REQUIRE(taken.has_value());
  REQUIRE(taken.value().Bind(zbeacon::SocketAddress::FromHost(kLoopback, 0)));
  const uint16_t port = taken.value().LocalAddress().value().Port();

  LogCapture capture;
  zbeacon::Beacon beacon(LoopbackOptions(&capture));
  REQUIRE(beacon.Start(port).has_value());
  REQUIRE(beacon.IsRunning());
  REQUIRE(capture.Contains("socket setup failed"));

  // Once the port is free the first beacon brings the socket up.
  taken.value().Close();
  beacon.Publish("late-bind", 9);

  zbeacon::PeerAnnouncement peer;
  REQUIRE(beacon.Recv(peer, 2000));
  REQUIRE(AsString(peer.data) == "late-bind");
  beacon.Stop();
  REQUIRE_FALSE(beacon.IsRunning());
}

TEST_CASE("beacon - Stop is idempotent and restart works", "[beacon][lifecycle]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  beacon.Stop();  // never started

  const uint16_t port = FreeUdpPort();
  REQUIRE(beacon.Start(port).has_value());
  beacon.Stop();
  beacon.Stop();
  REQUIRE_FALSE(beacon.IsRunning());

  REQUIRE(beacon.Start(port).has_value());
  REQUIRE(beacon.IsRunning());
  beacon.Stop();
}

TEST_CASE("beacon - destructor stops a running beacon", "[beacon][lifecycle]") {
  const uint16_t port = FreeUdpPort();
  {
    zbeacon::Beacon beacon(LoopbackOptions());
    REQUIRE(beacon.Start(port).has_value());
    beacon.Publish("bye", 3);
  }
  // The port is free again once the agent has closed its socket.
  auto sock = zbeacon::UdpSocket::Create();
  REQUIRE(sock.has_value());
  REQUIRE(sock.value().Bind(zbeacon::SocketAddress::FromHost(kLoopback, port)));
}

// ============================================================================
// Commands and Inbound Announcements
// ============================================================================

TEST_CASE("beacon - Publish and Recv own beacon", "[beacon][io]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  const uint16_t port = FreeUdpPort();
  REQUIRE(beacon.Start(port).has_value());

  beacon.Publish("svc:7000", 8);

  zbeacon::PeerAnnouncement peer;
  REQUIRE(beacon.Recv(peer, 2000));
  REQUIRE(AsString(peer.data) == "svc:7000");
  REQUIRE(peer.sender == "127.0.0.1");
  REQUIRE(peer.sender_port == port);
}

TEST_CASE("beacon - Recv times out when nothing arrives", "[beacon][io]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  REQUIRE(beacon.Start(FreeUdpPort()).has_value());

  zbeacon::PeerAnnouncement peer;
  auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(beacon.Recv(peer, 100));
  REQUIRE(std::chrono::steady_clock::now() - start >=
          std::chrono::milliseconds(90));
}

TEST_CASE("beacon - Channel fd becomes readable on announcement", "[beacon][io]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  REQUIRE(beacon.Start(FreeUdpPort()).has_value());
  beacon.Publish("poll-me", 7);

  struct pollfd pfd {};
  pfd.fd = beacon.Channel().Fd();
  pfd.events = POLLIN;
  REQUIRE(::poll(&pfd, 1, 2000) == 1);

  zbeacon::AgentMessage msg;
  REQUIRE(beacon.Channel().TryPop(msg));
  REQUIRE(msg.kind == zbeacon::AgentMessageKind::kAnnouncement);
  REQUIRE(AsString(msg.announcement.data) == "poll-me");
}

TEST_CASE("beacon - Subscribe filters own beacon", "[beacon][io]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  REQUIRE(beacon.Start(FreeUdpPort()).has_value());

  beacon.Subscribe("other:", 6);
  beacon.Publish("svc:1", 5);

  zbeacon::PeerAnnouncement peer;
  REQUIRE_FALSE(beacon.Recv(peer, 300));

  beacon.Unsubscribe();
  REQUIRE(beacon.Recv(peer, 2000));
  REQUIRE(AsString(peer.data) == "svc:1");
}

TEST_CASE("beacon - NoEcho hides own beacon", "[beacon][io]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  REQUIRE(beacon.Start(FreeUdpPort()).has_value());

  beacon.NoEcho();
  beacon.Publish("me", 2);

  zbeacon::PeerAnnouncement peer;
  REQUIRE_FALSE(beacon.Recv(peer, 300));
}

TEST_CASE("beacon - SetInterval and Silence", "[beacon][io]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  REQUIRE(beacon.Start(FreeUdpPort()).has_value());

  beacon.SetInterval(20);
  beacon.Publish("pulse", 5);

  zbeacon::PeerAnnouncement peer;
  int heard = 0;
  auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(300);
  while (std::chrono::steady_clock::now() < until) {
    if (beacon.Recv(peer, 50)) ++heard;
  }
  REQUIRE(heard >= 3);

  beacon.Silence();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  while (beacon.Recv(peer, 100)) {
  }
  REQUIRE_FALSE(beacon.Recv(peer, 300));
}

TEST_CASE("beacon - empty Publish announces nothing", "[beacon][io]") {
  zbeacon::Beacon beacon(LoopbackOptions());
  REQUIRE(beacon.Start(FreeUdpPort()).has_value());

  beacon.Publish("", 0);

  zbeacon::PeerAnnouncement peer;
  REQUIRE_FALSE(beacon.Recv(peer, 300));
}

TEST_CASE("beacon - oversized payload is rejected locally", "[beacon][io]") {
  LogCapture capture;
  zbeacon::Beacon beacon(LoopbackOptions(&capture));
  REQUIRE(beacon.Start(FreeUdpPort()).has_value());

  std::string big(zbeacon::kBeaconMax + 1, 'x');
  beacon.Publish(big.data(), big.size());
  beacon.Subscribe(big.data(), big.size());

  zbeacon::PeerAnnouncement peer;
  REQUIRE_FALSE(beacon.Recv(peer, 300));
  REQUIRE(capture.Contains("publish rejected"));
  REQUIRE(capture.Contains("subscribe rejected"));
}

TEST_CASE("beacon - commands before Start are dropped", "[beacon][io]") {
  LogCapture capture;
  zbeacon::Beacon beacon(LoopbackOptions(&capture));

  beacon.Publish("early", 5);
  beacon.SetInterval(10);
  REQUIRE(capture.Contains("Publish dropped"));
  REQUIRE(capture.Contains("SetInterval dropped"));

  REQUIRE(beacon.Start(FreeUdpPort()).has_value());
  zbeacon::PeerAnnouncement peer;
  REQUIRE_FALSE(beacon.Recv(peer, 200));
}

// ============================================================================
// Multicast
// ============================================================================

TEST_CASE("beacon - multicast group on loopback", "[beacon][multicast]") {
  auto opts = LoopbackOptions();
  opts.announce = "239.255.77.77";
  opts.multicast_ttl = 1;
  zbeacon::Beacon beacon(opts);

  auto r = beacon.Start(FreeUdpPort());
  if (!r.has_value()) {
    SKIP("multicast not available: " << zbeacon::BeaconErrorName(r.get_error()));
  }
  REQUIRE(beacon.Binding().multicast);
}
