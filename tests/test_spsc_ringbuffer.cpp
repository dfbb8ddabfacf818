/**
 * @file test_spsc_ringbuffer.cpp
 * @brief Catch2 tests for zbeacon::SpscRingbuffer.
 */

#include <catch2/catch_test_macros.hpp>

#include "zbeacon/spsc_ringbuffer.hpp"

#include <cstdint>
#include <string>
#include <thread>

// ============================================================================
// Basic Push / Pop
// ============================================================================

TEST_CASE("SpscRingbuffer: push and pop single element", "[spsc]") {
  zbeacon::SpscRingbuffer<int, 8> rb;
  REQUIRE(rb.Push(42));

  int val = 0;
  REQUIRE(rb.Pop(val));
  REQUIRE(val == 42);
}

TEST_CASE("SpscRingbuffer: pop from empty returns false", "[spsc]") {
  zbeacon::SpscRingbuffer<int, 4> rb;
  int val = 0;
  REQUIRE_FALSE(rb.Pop(val));
  REQUIRE(rb.IsEmpty());
}

TEST_CASE("SpscRingbuffer: FIFO order", "[spsc]") {
  zbeacon::SpscRingbuffer<int, 8> rb;
  for (int i = 0; i < 5; ++i) REQUIRE(rb.Push(i));
  REQUIRE(rb.Size() == 5);
  for (int i = 0; i < 5; ++i) {
    int val = -1;
    REQUIRE(rb.Pop(val));
    REQUIRE(val == i);
  }
}

TEST_CASE("SpscRingbuffer: full buffer rejects push", "[spsc]") {
  zbeacon::SpscRingbuffer<int, 4> rb;
  for (int i = 0; i < 4; ++i) REQUIRE(rb.Push(i));
  REQUIRE(rb.IsFull());
  REQUIRE_FALSE(rb.Push(99));
  REQUIRE(rb.Capacity() == 4);

  int val = 0;
  REQUIRE(rb.Pop(val));
  REQUIRE(rb.Push(99));
}

TEST_CASE("SpscRingbuffer: wrap-around", "[spsc]") {
  zbeacon::SpscRingbuffer<int, 4> rb;
  int val = 0;
  for (int round = 0; round < 10; ++round) {
    REQUIRE(rb.Push(round));
    REQUIRE(rb.Push(round + 100));
    REQUIRE(rb.Pop(val));
    REQUIRE(val == round);
    REQUIRE(rb.Pop(val));
    REQUIRE(val == round + 100);
  }
  REQUIRE(rb.IsEmpty());
}

TEST_CASE("SpscRingbuffer: non-trivial element type", "[spsc]") {
  zbeacon::SpscRingbuffer<std::string, 4> rb;
  REQUIRE(rb.Push(std::string("hello")));
  std::string s("world");
  REQUIRE(rb.Push(s));

  std::string out;
  REQUIRE(rb.Pop(out));
  REQUIRE(out == "hello");
  REQUIRE(rb.Pop(out));
  REQUIRE(out == "world");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("SpscRingbuffer: concurrent producer and consumer", "[spsc][concurrent]") {
  constexpr uint32_t kCount = 100000;
  zbeacon::SpscRingbuffer<uint32_t, 64> rb;

  std::thread producer([&rb]() {
    for (uint32_t i = 0; i < kCount; ++i) {
      while (!rb.Push(i)) std::this_thread::yield();
    }
  });

  uint32_t expected_val = 0;
  bool ordered = true;
  while (expected_val < kCount) {
    uint32_t val = 0;
    if (rb.Pop(val)) {
      if (val != expected_val) ordered = false;
      ++expected_val;
    } else {
      std::this_thread::yield();
    }
  }
  producer.join();

  REQUIRE(ordered);
  REQUIRE(rb.IsEmpty());
}
