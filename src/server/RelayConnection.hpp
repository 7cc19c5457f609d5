#ifndef __TETHER_RELAY_CONNECTION__
#define __TETHER_RELAY_CONNECTION__

#include "Headers.hpp"

namespace tether {
// WebSocket close codes used by the relay.
const int CLOSE_NORMAL = 1000;
const int CLOSE_GOING_AWAY = 1001;
const int CLOSE_POLICY_VIOLATION = 1008;

/**
 * @brief Server side of one client socket, as seen by the protocol logic.
 */
class RelayConnection {
 public:
  virtual ~RelayConnection() {}

  virtual const string& getId() const = 0;

  virtual const string& getPeerAddress() const = 0;

  /**
   * @brief Queues a text frame. Frames are written in call order. Does
   * nothing once the connection is closing.
   */
  virtual void send(const string& frame) = 0;

  /**
   * @brief Flushes queued frames, then closes with `code`.
   */
  virtual void close(int code, const string& reason) = 0;
};
}  // namespace tether

#endif  // __TETHER_RELAY_CONNECTION__
