/**
 * @file test_channel.cpp
 * @brief Tests for channel.hpp: BeaconPayload, commands, Mailbox.
 */

#include <catch2/catch_test_macros.hpp>
#include "zbeacon/channel.hpp"

#include <poll.h>

#include <chrono>
#include <cstring>
#include <string>
#include <thread>

namespace {

bool IsReadable(int32_t fd) {
  struct pollfd pfd {};
  pfd.fd = fd;
  pfd.events = POLLIN;
  return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN) != 0;
}

}  // namespace

// ============================================================================
// BeaconPayload
// ============================================================================

TEST_CASE("channel - BeaconPayload accepts up to kBeaconMax bytes",
          "[channel][payload]") {
  zbeacon::BeaconPayload p;
  REQUIRE(p.Empty());

  std::string max(zbeacon::kBeaconMax, 'a');
  REQUIRE(p.Assign(max.data(), max.size()));
  REQUIRE(p.Size() == 255);
  REQUIRE(std::memcmp(p.Data(), max.data(), max.size()) == 0);
}

TEST_CASE("channel - BeaconPayload rejects oversized input unchanged",
          "[channel][payload]") {
  zbeacon::BeaconPayload p;
  REQUIRE(p.Assign("keep", 4));

  std::string big(zbeacon::kBeaconMax + 1, 'b');
  REQUIRE_FALSE(p.Assign(big.data(), big.size()));
  REQUIRE(p.Equals("keep", 4));
}

TEST_CASE("channel - BeaconPayload prefix and equality", "[channel][payload]") {
  zbeacon::BeaconPayload p;
  REQUIRE(p.Assign("ZRE", 3));

  REQUIRE(p.IsPrefixOf("ZRE\x01\x02", 5));
  REQUIRE(p.IsPrefixOf("ZRE", 3));
  REQUIRE_FALSE(p.IsPrefixOf("ZR", 2));
  REQUIRE_FALSE(p.IsPrefixOf("XRE1", 4));

  REQUIRE(p.Equals("ZRE", 3));
  REQUIRE_FALSE(p.Equals("ZRE1", 4));

  p.Clear();
  REQUIRE(p.Empty());
  REQUIRE(p.IsPrefixOf("anything", 8));
}

// ============================================================================
// ControlCommand / AgentMessage
// ============================================================================

TEST_CASE("channel - ControlCommand factories", "[channel][command]") {
  auto interval = zbeacon::ControlCommand::SetInterval(250);
  REQUIRE(interval.type == zbeacon::CommandType::kSetInterval);
  REQUIRE(interval.interval_ms == 250);

  zbeacon::BeaconPayload payload;
  REQUIRE(payload.Assign("hello", 5));
  auto publish = zbeacon::ControlCommand::Publish(payload);
  REQUIRE(publish.type == zbeacon::CommandType::kPublish);
  REQUIRE(publish.payload.Equals("hello", 5));

  auto subscribe = zbeacon::ControlCommand::Subscribe(payload);
  REQUIRE(subscribe.type == zbeacon::CommandType::kSubscribe);

  REQUIRE(zbeacon::ControlCommand::NoEcho().type == zbeacon::CommandType::kNoEcho);
  REQUIRE(zbeacon::ControlCommand::Silence().type == zbeacon::CommandType::kSilence);
  REQUIRE(zbeacon::ControlCommand::Unsubscribe().type ==
          zbeacon::CommandType::kUnsubscribe);
  REQUIRE(zbeacon::ControlCommand::Terminate().type ==
          zbeacon::CommandType::kTerminate);
}

TEST_CASE("channel - CommandTypeName", "[channel][command]") {
  REQUIRE(std::strcmp(zbeacon::CommandTypeName(zbeacon::CommandType::kPublish),
                      "Publish") == 0);
  REQUIRE(std::strcmp(zbeacon::CommandTypeName(
                          static_cast<zbeacon::CommandType>(0xEE)),
                      "Unknown") == 0);
}

TEST_CASE("channel - AgentMessage factories", "[channel][message]") {
  zbeacon::InterfaceBinding binding;
  binding.address = 0x0A000005U;
  auto ready = zbeacon::AgentMessage::Ready(binding);
  REQUIRE(ready.kind == zbeacon::AgentMessageKind::kReady);
  REQUIRE(ready.binding.address == 0x0A000005U);

  auto failed = zbeacon::AgentMessage::StartFailed(zbeacon::BeaconError::kNoInterface);
  REQUIRE(failed.kind == zbeacon::AgentMessageKind::kStartFailed);
  REQUIRE(failed.error == zbeacon::BeaconError::kNoInterface);

  zbeacon::PeerAnnouncement a;
  REQUIRE(a.data.Assign("peer", 4));
  a.sender.assign(zbeacon::TruncateToCapacity, "10.0.0.9");
  auto ann = zbeacon::AgentMessage::Announcement(a);
  REQUIRE(ann.kind == zbeacon::AgentMessageKind::kAnnouncement);
  REQUIRE(ann.announcement.sender == "10.0.0.9");

  REQUIRE(zbeacon::AgentMessage::Terminated().kind ==
          zbeacon::AgentMessageKind::kTerminated);
}

// ============================================================================
// Mailbox
// ============================================================================

TEST_CASE("channel - Mailbox construction", "[channel][mailbox]") {
  zbeacon::Mailbox<int, 8> box;
  REQUIRE(box.IsValid());
  REQUIRE(box.Fd() >= 0);
  REQUIRE(box.Capacity() == 8);
  REQUIRE(box.Size() == 0);
}

TEST_CASE("channel - Mailbox fd is readable exactly while non-empty",
          "[channel][mailbox]") {
  zbeacon::Mailbox<int, 8> box;
  REQUIRE_FALSE(IsReadable(box.Fd()));

  REQUIRE(box.Push(1));
  REQUIRE(box.Push(2));
  REQUIRE(IsReadable(box.Fd()));

  int v = 0;
  REQUIRE(box.TryPop(v));
  REQUIRE(v == 1);
  REQUIRE(IsReadable(box.Fd()));

  REQUIRE(box.TryPop(v));
  REQUIRE(v == 2);
  REQUIRE_FALSE(IsReadable(box.Fd()));
  REQUIRE_FALSE(box.TryPop(v));
}

TEST_CASE("channel - Mailbox full rejects push", "[channel][mailbox]") {
  zbeacon::Mailbox<int, 4> box;
  for (int i = 0; i < 4; ++i) REQUIRE(box.Push(i));
  REQUIRE_FALSE(box.Push(4));
  REQUIRE(box.Size() == 4);

  int v = -1;
  REQUIRE(box.TryPop(v));
  REQUIRE(v == 0);
  REQUIRE(box.Push(4));
}

TEST_CASE("channel - Mailbox Pop times out when empty", "[channel][mailbox]") {
  zbeacon::Mailbox<int, 4> box;
  int v = 0;
  auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(box.Pop(v, 30));
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(elapsed >= std::chrono::milliseconds(25));

  REQUIRE_FALSE(box.Pop(v, 0));
}

TEST_CASE("channel - Mailbox Pop wakes on cross-thread push",
          "[channel][mailbox]") {
  zbeacon::Mailbox<int, 4> box;
  bool pushed = false;
  std::thread producer([&box, &pushed]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pushed = box.Push(7);
  });

  int v = 0;
  bool popped = box.Pop(v, 2000);
  producer.join();
  REQUIRE(pushed);
  REQUIRE(popped);
  REQUIRE(v == 7);
}

TEST_CASE("channel - Mailbox PushBlocking waits for room", "[channel][mailbox]") {
  zbeacon::Mailbox<int, 4> box;
  for (int i = 0; i < 4; ++i) REQUIRE(box.Push(i));

  bool ordered = true;
  std::thread consumer([&box, &ordered]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    int v = 0;
    for (int i = 0; i < 5; ++i) {
      if (!box.Pop(v, 2000) || v != i) ordered = false;
    }
  });

  bool pushed = box.PushBlocking(4);
  consumer.join();
  REQUIRE(pushed);
  REQUIRE(ordered);
}

TEST_CASE("channel - Mailbox preserves order across threads",
          "[channel][mailbox][concurrent]") {
  constexpr int kCount = 5000;
  zbeacon::Mailbox<int, 16> box;

  std::thread producer([&box]() {
    for (int i = 0; i < kCount; ++i) {
      while (!box.Push(i)) std::this_thread::yield();
    }
  });

  bool ordered = true;
  for (int i = 0; i < kCount; ++i) {
    int v = -1;
    if (!box.Pop(v, 5000) || v != i) {
      ordered = false;
      break;
    }
  }
  producer.join();
  REQUIRE(ordered);
}

TEST_CASE("channel - BeaconChannel is valid on construction", "[channel]") {
  zbeacon::BeaconChannel channel;
  REQUIRE(channel.IsValid());
  REQUIRE(channel.commands.Fd() != channel.events.Fd());
}
