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
 * @file socket.hpp
 * @brief POSIX UDP socket RAII wrapper for broadcast and multicast beacons.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 * Provides UdpSocket with RAII fd ownership and the socket options a
 * beacon needs, and SocketAddress as a thin wrapper around sockaddr_in.
 * All errors are returned via zbeacon::expected<V,E>.
 */

#ifndef ZBEACON_SOCKET_HPP_
#define ZBEACON_SOCKET_HPP_

#include "zbeacon/platform.hpp"
#include "zbeacon/vocabulary.hpp"

#if ZBEACON_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace zbeacon {

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kBindFailed,
  kSendFailed,
  kRecvFailed,
  kSetOptFailed,
  kWouldBlock  ///< EAGAIN/EWOULDBLOCK -- transient, caller may retry.
};

// ============================================================================
// SocketAddress
// ============================================================================

/**
 * @brief IPv4 socket address (sockaddr_in).
 */
class SocketAddress {
 public:
  /// Longest dotted-decimal IPv4 string including the terminator.
  static constexpr size_t kIpv4StrLen = INET_ADDRSTRLEN;

  SocketAddress() noexcept {
    std::memset(&addr_, 0, sizeof(addr_));
    addr_.sin_family = AF_INET;
  }

  /**
   * @brief Create an IPv4 socket address from a dotted-decimal string and port.
   *
   * @param ip   Dotted-decimal IPv4 string (e.g. "127.0.0.1")
   * @param port Port number in host byte order
   * @return SocketAddress on success; kInvalidAddress on bad ip
   */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_port = htons(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /** @brief Build from an address and port, both in host byte order. */
  static SocketAddress FromHost(uint32_t ip, uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_addr.s_addr = htonl(ip);
    sa.addr_.sin_port = htons(port);
    return sa;
  }

  /** @brief INADDR_ANY with the given port. */
  static SocketAddress Any(uint16_t port) noexcept {
    return FromHost(INADDR_ANY, port);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  /** @brief Return the port in host byte order. */
  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /** @brief Return the IPv4 address in host byte order. */
  uint32_t Ip() const noexcept { return ntohl(addr_.sin_addr.s_addr); }

  /**
   * @brief Write the dotted-decimal address (no port) into @p buf.
   * @return false if @p len is too small.
   */
  bool ToString(char* buf, size_t len) const noexcept {
    return ::inet_ntop(AF_INET, &addr_.sin_addr, buf,
                       static_cast<socklen_t>(len)) != nullptr;
  }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// UdpSocket
// ============================================================================

/**
 * @brief RAII UDP datagram socket.
 *
 * Owns a file descriptor. Movable but not copyable.
 */
class UdpSocket {
 public:
  UdpSocket() noexcept : fd_(-1) {}

  ~UdpSocket() { Close(); }

  // Move-only ---------------------------------------------------------------
  UdpSocket(UdpSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  UdpSocket& operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  // Factory -----------------------------------------------------------------

  /**
   * @brief Create a UDP (SOCK_DGRAM, IPPROTO_UDP) socket.
   * @return UdpSocket on success, SocketError::kInvalidFd on failure.
   */
  static expected<UdpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
      return expected<UdpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
    return expected<UdpSocket, SocketError>::success(UdpSocket(fd));
  }

  // Operations --------------------------------------------------------------

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kBindFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<int32_t, SocketError> SendTo(const void* data, size_t len,
                                        const SocketAddress& dest) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::sendto(fd_, data, len, 0, dest.Raw(), dest.Size());
    if (n < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  /**
   * @brief Receive one datagram. Bytes beyond @p len are discarded by the
   *        kernel.
   */
  expected<int32_t, SocketError> RecvFrom(void* buf, size_t len,
                                          SocketAddress& src) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    socklen_t addr_len = src.Size();
    auto n = ::recvfrom(fd_, buf, len, 0, src.RawMut(), &addr_len);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      return expected<int32_t, SocketError>::error(SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<void, SocketError> SetNonBlocking(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    if (enable) {
      flags |= O_NONBLOCK;
    } else {
      flags &= ~O_NONBLOCK;
    }
    if (::fcntl(fd_, F_SETFL, flags) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> SetReuseAddr(bool enable) noexcept {
    return SetIntOpt(SOL_SOCKET, SO_REUSEADDR, enable ? 1 : 0);
  }

  /** @brief SO_REUSEPORT; kSetOptFailed where the platform lacks it. */
  expected<void, SocketError> SetReusePort(bool enable) noexcept {
#ifdef SO_REUSEPORT
    return SetIntOpt(SOL_SOCKET, SO_REUSEPORT, enable ? 1 : 0);
#else
    (void)enable;
    return expected<void, SocketError>::error(SocketError::kSetOptFailed);
#endif
  }

  expected<void, SocketError> SetBroadcast(bool enable) noexcept {
    return SetIntOpt(SOL_SOCKET, SO_BROADCAST, enable ? 1 : 0);
  }

  expected<void, SocketError> SetMulticastTtl(uint8_t ttl) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    // Linux accepts int or unsigned char; BSDs require unsigned char.
    unsigned char value = ttl;
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_TTL, &value,
                     static_cast<socklen_t>(sizeof(value))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> SetMulticastLoop(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    unsigned char value = enable ? 1 : 0;
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &value,
                     static_cast<socklen_t>(sizeof(value))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /**
   * @brief Join a multicast group on the wildcard interface.
   * @param group Group address in host byte order.
   */
  expected<void, SocketError> JoinMulticastGroup(uint32_t group) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    ip_mreq mreq{};
    mreq.imr_multiaddr.s_addr = htonl(group);
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq,
                     static_cast<socklen_t>(sizeof(mreq))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /** @brief Local address the socket is bound to (getsockname). */
  expected<SocketAddress, SocketError> LocalAddress() const noexcept {
    if (fd_ < 0) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidFd);
    }
    SocketAddress sa;
    socklen_t len = sa.Size();
    if (::getsockname(fd_, sa.RawMut(), &len) < 0) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidFd);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /** @brief Close the socket. Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  /** @brief Return the raw file descriptor. */
  int32_t Fd() const noexcept { return fd_; }

  /** @brief Check whether the socket holds a valid file descriptor. */
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  explicit UdpSocket(int32_t fd) noexcept : fd_(fd) {}

  expected<void, SocketError> SetIntOpt(int level, int name,
                                        int32_t value) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::setsockopt(fd_, level, name, &value,
                     static_cast<socklen_t>(sizeof(value))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  int32_t fd_;
};

}  // namespace zbeacon

#endif  // ZBEACON_HAS_NETWORK

#endif  // ZBEACON_SOCKET_HPP_
