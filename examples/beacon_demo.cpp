/**
 * @file beacon_demo.cpp
 * @brief LAN discovery demo: announce this host and list peers.
 *
 * Demonstrates:
 *   - Loading BeaconOptions from an INI, JSON or YAML file
 *   - Starting a Beacon and publishing a service announcement
 *   - Subscribing to a prefix so only matching peers are reported
 *   - Receiving announcements with a timeout
 *
 * Usage: beacon_demo [config.{ini,json,yaml}] [seconds]
 *
 *   [beacon]
 *   port = 9999
 *   interval_ms = 1000
 *   noecho = yes
 */

#include "zbeacon/beacon.hpp"
#include "zbeacon/config.hpp"
#include "zbeacon/log.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// ---------------------------------------------------------------------------

static constexpr uint16_t kDemoPort = 9999;
static constexpr const char* kPrefix = "zbeacon-demo:";

static bool LoadOptions(const char* path, zbeacon::BeaconOptions& opts) {
  zbeacon::ConfigValues values;
  auto loaded = zbeacon::LoadConfigFile(path, values);
  if (!loaded.has_value()) {
    ZBEACON_LOG_ERROR("demo", "cannot load %s: %s", path,
                      zbeacon::ConfigErrorName(loaded.get_error()));
    return false;
  }
  auto applied = zbeacon::LoadBeaconOptions(values, opts);
  if (!applied.has_value()) {
    ZBEACON_LOG_ERROR("demo", "invalid [beacon] section in %s", path);
    return false;
  }
  return true;
}

int main(int argc, char* argv[]) {
  zbeacon::log::Init();
  zbeacon::log::SetLevel(zbeacon::log::Level::kInfo);

  zbeacon::BeaconOptions opts;
  opts.port = kDemoPort;
  opts.noecho = true;
  if (argc > 1 && !LoadOptions(argv[1], opts)) {
    zbeacon::log::Shutdown();
    return 1;
  }
  const int seconds = (argc > 2) ? std::atoi(argv[2]) : 10;

  zbeacon::Beacon beacon(opts);
  auto started = beacon.Start();
  if (!started.has_value()) {
    ZBEACON_LOG_ERROR("demo", "start failed: %s",
                      zbeacon::BeaconErrorName(started.get_error()));
    zbeacon::log::Shutdown();
    return 1;
  }

  char announcement[zbeacon::kBeaconMax + 1];
  int n = std::snprintf(announcement, sizeof(announcement), "%s%s",
                        kPrefix, beacon.Hostname());
  if (n < 0 || static_cast<size_t>(n) >= sizeof(announcement)) {
    ZBEACON_LOG_ERROR("demo", "announcement too long");
    zbeacon::log::Shutdown();
    return 1;
  }

  beacon.Subscribe(kPrefix, std::strlen(kPrefix));
  beacon.Publish(announcement, static_cast<size_t>(n));
  ZBEACON_LOG_INFO("demo", "announcing '%s' on %s:%u for %d s", announcement,
                   beacon.Binding().name.c_str(),
                   static_cast<unsigned>(beacon.Port()), seconds);

  // -- Receive loop ---------------------------------------------------------

  uint32_t heard = 0;
  const auto until = std::chrono::steady_clock::now() +
                     std::chrono::seconds(seconds);
  zbeacon::PeerAnnouncement peer;
  while (std::chrono::steady_clock::now() < until) {
    if (!beacon.Recv(peer, 500)) continue;
    ++heard;
    std::printf("  %-15s:%-5u  %.*s\n", peer.sender.c_str(),
                static_cast<unsigned>(peer.sender_port),
                static_cast<int>(peer.data.Size()),
                reinterpret_cast<const char*>(peer.data.Data()));
  }

  beacon.Silence();
  beacon.Stop();
  ZBEACON_LOG_INFO("demo", "done, %u announcements received", heard);
  zbeacon::log::Shutdown();
  return 0;
}
