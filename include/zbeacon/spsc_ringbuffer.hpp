/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file spsc_ringbuffer.hpp
 * @brief Wait-free single-producer single-consumer ring buffer.
 *
 * Backing queue of each Mailbox direction. Fixed capacity, no allocation.
 */

#ifndef ZBEACON_SPSC_RINGBUFFER_HPP_
#define ZBEACON_SPSC_RINGBUFFER_HPP_

#include "zbeacon/platform.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace zbeacon {

/// @brief Lock-free, wait-free SPSC ring buffer.
///
/// @tparam T           Element type, default-constructible and assignable.
/// @tparam BufferSize  Capacity (must be a power of 2).
///
/// Thread safety:
///   - Exactly ONE producer thread may call Push.
///   - Exactly ONE consumer thread may call Pop.
///   - Size / IsEmpty / IsFull / Capacity may be called from either side.
template <typename T, size_t BufferSize = 16>
class SpscRingbuffer {
 public:
  static_assert(BufferSize != 0, "Buffer size cannot be zero.");
  static_assert((BufferSize & (BufferSize - 1)) == 0,
                "Buffer size must be a power of 2.");
  static_assert(std::is_default_constructible<T>::value,
                "Element type must be default-constructible.");

  SpscRingbuffer() noexcept = default;

  SpscRingbuffer(const SpscRingbuffer&) = delete;
  SpscRingbuffer& operator=(const SpscRingbuffer&) = delete;

  // ==== Producer API ====

  /// @return true if stored, false if the buffer is full.
  bool Push(const T& data) noexcept { return PushImpl(data); }
  bool Push(T&& data) noexcept { return PushImpl(std::move(data)); }

  // ==== Consumer API ====

  /// @param[out] data  Receives the oldest element.
  /// @return true if an element was taken, false if the buffer is empty.
  bool Pop(T& data) noexcept {
    const size_t cur_tail = tail_.value.load(std::memory_order_relaxed);
    const size_t cur_head = head_.value.load(std::memory_order_acquire);
    if (cur_tail == cur_head) {
      return false;
    }
    data = std::move(slots_[cur_tail & kMask]);
    tail_.value.store(cur_tail + 1, std::memory_order_release);
    return true;
  }

  // ==== Query API (either side) ====

  size_t Size() const noexcept {
    // tail first: head read later can only be larger
    const size_t cur_tail = tail_.value.load(std::memory_order_acquire);
    return head_.value.load(std::memory_order_acquire) - cur_tail;
  }

  bool IsEmpty() const noexcept { return Size() == 0; }
  bool IsFull() const noexcept { return Size() == BufferSize; }
  static constexpr size_t Capacity() noexcept { return BufferSize; }

 private:
  template <typename U>
  bool PushImpl(U&& data) noexcept {
    const size_t cur_head = head_.value.load(std::memory_order_relaxed);
    const size_t cur_tail = tail_.value.load(std::memory_order_acquire);
    if ((cur_head - cur_tail) == BufferSize) {
      return false;
    }
    slots_[cur_head & kMask] = std::forward<U>(data);
    head_.value.store(cur_head + 1, std::memory_order_release);
    return true;
  }

  static constexpr size_t kMask = BufferSize - 1U;

  // Cache-line padded atomic indices to avoid false sharing.
  struct alignas(kCacheLineSize) PaddedIndex {
    std::atomic<size_t> value{0};
  };

  PaddedIndex head_;                                // Producer writes
  PaddedIndex tail_;                                // Consumer writes
  alignas(kCacheLineSize) std::array<T, BufferSize> slots_{};
};

}  // namespace zbeacon

#endif  // ZBEACON_SPSC_RINGBUFFER_HPP_
