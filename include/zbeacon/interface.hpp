/**
 * @file interface.hpp
 * @brief IPv4 interface enumeration and beacon interface selection.
 *
 * Enumeration (getifaddrs) and selection are separate steps: the OS call
 * produces an InterfaceList, SelectInterface() is a pure function over it.
 * All addresses are IPv4 in host byte order.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef ZBEACON_INTERFACE_HPP_
#define ZBEACON_INTERFACE_HPP_

#include "zbeacon/platform.hpp"
#include "zbeacon/socket.hpp"
#include "zbeacon/vocabulary.hpp"

#include <cstdint>
#include <cstring>

#include <ifaddrs.h>
#include <net/if.h>

namespace zbeacon {

// ============================================================================
// Constants
// ============================================================================

/// Interface names are at most IFNAMSIZ - 1 characters.
static constexpr size_t kIfNameMax = IFNAMSIZ - 1;
/// Dotted-decimal IPv4 text, without the terminator.
static constexpr size_t kIpv4TextMax = SocketAddress::kIpv4StrLen - 1;

#ifndef ZBEACON_MAX_INTERFACES
#define ZBEACON_MAX_INTERFACES 32U
#endif

#ifndef ZBEACON_MAX_IF_ADDRESSES
#define ZBEACON_MAX_IF_ADDRESSES 8U
#endif

using Ipv4Text = FixedString<kIpv4TextMax>;
using InterfaceName = FixedString<kIfNameMax>;

// ============================================================================
// IPv4 Helpers
// ============================================================================

inline bool IsLoopbackAddress(uint32_t ip) noexcept {
  return (ip >> 24) == 127U;
}

/** @brief 224.0.0.0/4. */
inline bool IsMulticastAddress(uint32_t ip) noexcept {
  return (ip >> 28) == 0xEU;
}

inline uint32_t NetworkAddress(uint32_t address, uint32_t netmask) noexcept {
  return address & netmask;
}

inline uint32_t BroadcastAddress(uint32_t address, uint32_t netmask) noexcept {
  return (address & netmask) | ~netmask;
}

/** @brief Parse dotted-decimal text. Empty optional on malformed input. */
inline optional<uint32_t> ParseIpv4(const char* text) noexcept {
  auto r = SocketAddress::FromIpv4(text, 0);
  if (!r.has_value()) return optional<uint32_t>();
  return optional<uint32_t>(r.value().Ip());
}

inline Ipv4Text FormatIpv4(uint32_t ip) noexcept {
  char buf[SocketAddress::kIpv4StrLen];
  Ipv4Text out;
  if (SocketAddress::FromHost(ip, 0).ToString(buf, sizeof(buf))) {
    out.assign(TruncateToCapacity, buf);
  }
  return out;
}

// ============================================================================
// Interface List
// ============================================================================

/// One address record of an interface; either field may be absent.
struct AddressEntry {
  bool has_address = false;
  uint32_t address = 0;
  bool has_netmask = false;
  uint32_t netmask = 0;
};

struct InterfaceCandidate {
  InterfaceName name;
  bool loopback = false;  ///< OS loopback flag (IFF_LOOPBACK)
  FixedVector<AddressEntry, ZBEACON_MAX_IF_ADDRESSES> addresses;
};

using InterfaceList = FixedVector<InterfaceCandidate, ZBEACON_MAX_INTERFACES>;

/**
 * @brief Interface the beacon is bound to. Fixed once the agent has started.
 */
struct InterfaceBinding {
  InterfaceName name;
  uint32_t address = 0;
  uint32_t netmask = 0;
  uint32_t network = 0;
  uint32_t broadcast = 0;
  bool multicast = false;  ///< announce target is a multicast group
};

// ============================================================================
// Selection
// ============================================================================

/**
 * @brief Pick the beacon interface: the first non-loopback interface, in
 *        list order, whose first complete address/netmask pair exists.
 *
 * @return kNoInterface if nothing qualifies.
 */
inline expected<InterfaceBinding, BeaconError> SelectInterface(
    const InterfaceList& interfaces) noexcept {
  for (const auto& candidate : interfaces) {
    if (candidate.addresses.empty()) continue;

    const AddressEntry* pair = nullptr;
    for (const auto& entry : candidate.addresses) {
      if (entry.has_address && entry.has_netmask) {
        pair = &entry;
        break;
      }
    }
    if (pair == nullptr) continue;
    if (candidate.loopback || IsLoopbackAddress(pair->address)) continue;

    InterfaceBinding binding;
    binding.name = candidate.name;
    binding.address = pair->address;
    binding.netmask = pair->netmask;
    binding.network = NetworkAddress(pair->address, pair->netmask);
    binding.broadcast = BroadcastAddress(pair->address, pair->netmask);
    return expected<InterfaceBinding, BeaconError>::success(binding);
  }
  return expected<InterfaceBinding, BeaconError>::error(
      BeaconError::kNoInterface);
}

// ============================================================================
// Enumeration
// ============================================================================

namespace detail {

inline InterfaceCandidate* FindOrAddCandidate(InterfaceList& list,
                                              const char* name) noexcept {
  for (auto& candidate : list) {
    if (candidate.name == name) return &candidate;
  }
  InterfaceCandidate fresh;
  fresh.name.assign(TruncateToCapacity, name);
  if (!list.push_back(fresh)) return nullptr;
  return &list[list.size() - 1];
}

inline uint32_t SockaddrIpv4(const struct sockaddr* sa) noexcept {
  const auto* sin = reinterpret_cast<const struct sockaddr_in*>(sa);
  return ntohl(sin->sin_addr.s_addr);
}

}  // namespace detail

/**
 * @brief Enumerate interfaces via getifaddrs(3).
 *
 * Per-address entries are grouped by interface name in first-seen order.
 * Interfaces without any IPv4 entry are kept with an empty address list.
 */
inline expected<InterfaceList, BeaconError> EnumerateInterfaces() noexcept {
  struct ifaddrs* head = nullptr;
  if (::getifaddrs(&head) != 0) {
    return expected<InterfaceList, BeaconError>::error(
        BeaconError::kNoInterface);
  }

  InterfaceList list;
  for (struct ifaddrs* ifa = head; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_name == nullptr) continue;
    InterfaceCandidate* candidate =
        detail::FindOrAddCandidate(list, ifa->ifa_name);
    if (candidate == nullptr) break;
    if ((ifa->ifa_flags & IFF_LOOPBACK) != 0) candidate->loopback = true;

    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    AddressEntry entry;
    entry.has_address = true;
    entry.address = detail::SockaddrIpv4(ifa->ifa_addr);
    if (ifa->ifa_netmask != nullptr) {
      entry.has_netmask = true;
      entry.netmask = detail::SockaddrIpv4(ifa->ifa_netmask);
    }
    (void)candidate->addresses.push_back(entry);
  }
  ::freeifaddrs(head);
  return expected<InterfaceList, BeaconError>::success(list);
}

/**
 * @brief Resolves the interface a beacon binds to.
 * @param context  User pointer from BeaconOptions.
 */
using InterfaceResolverFn =
    expected<InterfaceBinding, BeaconError> (*)(void* context);

/** @brief Default resolver: enumerate host interfaces, then select. */
inline expected<InterfaceBinding, BeaconError> ResolveHostInterface(
    void* /*context*/) noexcept {
  auto list = EnumerateInterfaces();
  if (!list.has_value()) {
    return expected<InterfaceBinding, BeaconError>::error(list.get_error());
  }
  return SelectInterface(list.value());
}

}  // namespace zbeacon

#endif  // ZBEACON_INTERFACE_HPP_
