#ifndef __TETHER_NETWORK_UTILS__
#define __TETHER_NETWORK_UTILS__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Whether `address` (dotted IPv4) lies in 10/8, 172.16/12 or
 * 192.168/16.
 */
bool isPrivateIpv4(const string& address);

/**
 * @brief Picks the address a phone on the same network should dial.
 *
 * Prefers 192.168.x.x, then 10.x.x.x, then 172.16-31.x.x. Falls back to the
 * first non-loopback IPv4 address, and to localhost when nothing else is
 * up.
 */
string detectLanAddress();
}  // namespace tether

#endif  // __TETHER_NETWORK_UTILS__
