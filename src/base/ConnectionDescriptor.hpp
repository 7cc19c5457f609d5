#ifndef __TETHER_CONNECTION_DESCRIPTOR__
#define __TETHER_CONNECTION_DESCRIPTOR__

#include "Headers.hpp"

namespace tether {
enum class Scheme { WS, WSS };

inline string schemeName(Scheme scheme) {
  return scheme == Scheme::WSS ? "wss" : "ws";
}

/**
 * @brief Everything a client needs to reach and authenticate with a relay
 * host. Host is stored without IPv6 brackets.
 */
class ConnectionDescriptor {
 public:
  ConnectionDescriptor() : port(DEFAULT_RELAY_PORT), scheme(Scheme::WS) {}

  ConnectionDescriptor(const string &_host, int _port,
                       const string &_sessionToken, Scheme _scheme = Scheme::WS)
      : host(_host), port(_port), sessionToken(_sessionToken), scheme(_scheme) {}

  const string &getHost() const { return host; }

  int getPort() const { return port; }

  const string &getSessionToken() const { return sessionToken; }

  Scheme getScheme() const { return scheme; }

  bool isSecure() const { return scheme == Scheme::WSS; }

  bool operator==(const ConnectionDescriptor &other) const {
    return host == other.host && port == other.port &&
           sessionToken == other.sessionToken && scheme == other.scheme;
  }

  bool operator!=(const ConnectionDescriptor &other) const {
    return !(*this == other);
  }

 protected:
  string host;
  int port;
  string sessionToken;
  Scheme scheme;
};

// Never prints the token.
inline ostream &operator<<(ostream &os, const ConnectionDescriptor &self) {
  os << schemeName(self.getScheme()) << "://";
  if (self.getHost().find(':') != string::npos) {
    os << "[" << self.getHost() << "]";
  } else {
    os << self.getHost();
  }
  return os << ":" << self.getPort();
}
}  // namespace tether

#endif  // __TETHER_CONNECTION_DESCRIPTOR__
