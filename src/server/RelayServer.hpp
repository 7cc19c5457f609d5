#ifndef __TETHER_RELAY_SERVER__
#define __TETHER_RELAY_SERVER__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "RelayProtocolHandler.hpp"
#include "RelaySession.hpp"
#include "ServerConfig.hpp"
#include "SessionRegistry.hpp"

namespace tether {
/**
 * @brief Accepts TCP connections on one port and routes them: WebSocket
 * upgrades on the relay paths become RelaySessions, `GET /health` and
 * `GET /status?key=` are answered with JSON, everything else gets 404.
 */
class RelayServer {
 public:
  explicit RelayServer(const RelayServerConfig& _config);

  ~RelayServer();

  /**
   * @brief Binds the listening socket and starts the I/O threads.
   * @throws std::runtime_error if the address cannot be bound.
   */
  void start();

  /**
   * @brief Stops accepting, closes every session and terminates running
   * commands. Idempotent.
   */
  void shutdown();

  /**
   * @brief The bound port, which differs from the configured one when the
   * configuration asked for port 0.
   */
  int getPort() const { return boundPort; }

  shared_ptr<SessionRegistry> getRegistry() { return registry; }

  json buildStatus(bool includeSessions);

  static json sessionsToJson(const vector<SessionSnapshot>& sessions);

 protected:
  friend class HttpSession;

  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  RelayServerConfig config;
  net::io_context ioc;
  net::executor_work_guard<net::io_context::executor_type> workGuard;
  tcp::acceptor acceptor;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<RelayProtocolHandler> handler;
  vector<shared_ptr<thread>> ioThreads;
  int boundPort;
  int64_t startedAtMs;
  atomic<bool> running;
};
}  // namespace tether

#endif  // __TETHER_RELAY_SERVER__
