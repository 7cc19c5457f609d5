#ifndef __TETHER_RELAY_PROTOCOL_HANDLER__
#define __TETHER_RELAY_PROTOCOL_HANDLER__

#include "Headers.hpp"
#include "MessageCodec.hpp"
#include "RelayConnection.hpp"
#include "ServerConfig.hpp"
#include "SessionRegistry.hpp"

namespace tether {
/**
 * @brief Server-side protocol logic, independent of the socket library.
 *
 * The transport calls in on open, on every text frame, on the auth deadline
 * and on close. Frames from one socket must be delivered in order, one at a
 * time.
 */
class RelayProtocolHandler {
 public:
  RelayProtocolHandler(shared_ptr<SessionRegistry> _registry,
                       const RelayServerConfig& _config);

  void onConnectionOpened(shared_ptr<RelayConnection> connection,
                          const string& upgradeToken);

  void onFrame(shared_ptr<RelayConnection> connection, const string& frame);

  /**
   * @brief Closes the socket if it still has not authenticated.
   */
  void onAuthDeadline(shared_ptr<RelayConnection> connection);

  void onConnectionClosed(const string& connectionId);

  shared_ptr<SessionRegistry> getRegistry() { return registry; }

  static vector<string> capabilities();

 protected:
  void handleUnauthenticated(shared_ptr<RelayConnection> connection,
                             const DecodeResult& decoded);
  void handleAuth(shared_ptr<RelayConnection> connection,
                  const Message& request);
  void handleCommand(shared_ptr<RelayConnection> connection,
                     const Message& request);
  void handleBadFrame(shared_ptr<RelayConnection> connection,
                      const DecodeResult& decoded);

  /**
   * @brief Stamps the socket's session id on `message` and queues it.
   */
  void send(const shared_ptr<RelayConnection>& connection, Message message);

  static void sendError(const shared_ptr<RelayConnection>& connection,
                        const optional<string>& requestId,
                        const optional<string>& sessionId,
                        const string& text);

  shared_ptr<SessionRegistry> registry;
  RelayServerConfig config;
};
}  // namespace tether

#endif  // __TETHER_RELAY_PROTOCOL_HANDLER__
