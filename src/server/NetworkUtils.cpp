#include "NetworkUtils.hpp"

#include <net/if.h>

namespace tether {
namespace {
// Lower rank wins.
int privateRank(const string& address) {
  auto octets = split(address, '.');
  if (octets.size() != 4) {
    return -1;
  }
  int first, second;
  try {
    first = stoi(octets[0]);
    second = stoi(octets[1]);
  } catch (const std::logic_error&) {
    return -1;
  }
  if (first == 192 && second == 168) return 0;
  if (first == 10) return 1;
  if (first == 172 && second >= 16 && second <= 31) return 2;
  return -1;
}
}  // namespace

bool isPrivateIpv4(const string& address) { return privateRank(address) >= 0; }

string detectLanAddress() {
  struct ifaddrs* interfaces = NULL;
  if (getifaddrs(&interfaces) == -1) {
    LOG(WARNING) << "getifaddrs failed: " << strerror(errno);
    return "localhost";
  }

  string best;
  int bestRank = 3;
  string fallback;
  for (struct ifaddrs* it = interfaces; it != NULL; it = it->ifa_next) {
    if (it->ifa_addr == NULL || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if (it->ifa_flags & IFF_LOOPBACK) {
      continue;
    }
    char buffer[INET_ADDRSTRLEN];
    auto sin = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
    if (inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer)) == NULL) {
      continue;
    }
    string address(buffer);
    VLOG(1) << "Interface " << it->ifa_name << " has address " << address;
    int rank = privateRank(address);
    if (rank >= 0 && rank < bestRank) {
      best = address;
      bestRank = rank;
    } else if (fallback.empty()) {
      fallback = address;
    }
  }
  freeifaddrs(interfaces);

  if (!best.empty()) return best;
  if (!fallback.empty()) return fallback;
  return "localhost";
}
}  // namespace tether
