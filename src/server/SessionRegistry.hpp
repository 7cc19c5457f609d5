#ifndef __TETHER_SESSION_REGISTRY__
#define __TETHER_SESSION_REGISTRY__

#include "CommandExecution.hpp"
#include "Headers.hpp"
#include "Message.hpp"
#include "RelayConnection.hpp"

namespace tether {
/**
 * @brief Read-only view of one socket for the status surface.
 */
struct SessionSnapshot {
  string connectionId;
  string sessionId;
  string peerAddress;
  string platform;
  string clientVersion;
  int64_t connectedAtMs = 0;
  int64_t authenticatedAtMs = 0;
  bool authenticated = false;
  bool executing = false;
  string runningCommand;
  optional<string> runningRequestId;
};

/**
 * @brief Owns the mapping from sockets to sessions. Every socket is
 * registered on open, authenticates at most once, and is removed on close,
 * which cancels its running command.
 *
 * All mutations are serialized on one mutex.
 */
class SessionRegistry {
 public:
  SessionRegistry() {}

  void addConnection(shared_ptr<RelayConnection> connection,
                     const string& upgradeToken);

  bool hasConnection(const string& connectionId);

  bool isAuthenticated(const string& connectionId);

  /**
   * @brief Token presented in the upgrade request (`?key=`), if any.
   */
  string getUpgradeToken(const string& connectionId);

  /**
   * @brief Binds a new session to an unauthenticated socket.
   * @return The session id, or nullopt if the socket is unknown or already
   * authenticated.
   */
  optional<string> authenticate(const string& connectionId,
                                const ClientInfo& clientInfo);

  optional<string> getSessionId(const string& connectionId);

  /**
   * @brief Counts a malformed frame on the socket.
   * @return The new count.
   */
  int recordMalformedFrame(const string& connectionId);

  /**
   * @brief Claims the socket's single execution slot. A settled execution
   * that has not been released yet does not hold it.
   * @return false if a command is already running or the socket is gone.
   */
  bool beginExecution(const string& connectionId,
                      shared_ptr<CommandExecution> execution);

  /**
   * @brief Releases the slot if it still holds `execution`.
   */
  void endExecution(const string& connectionId,
                    const shared_ptr<CommandExecution>& execution);

  /**
   * @brief The socket's running execution, or null once it has settled.
   */
  shared_ptr<CommandExecution> getExecution(const string& connectionId);

  /**
   * @brief Forgets the socket and cancels its running command. Idempotent.
   */
  void removeConnection(const string& connectionId);

  vector<SessionSnapshot> listSessions();

  int countAuthenticated();

  int countPending();

  /**
   * @brief Cancels every execution, closes every socket, and waits up to
   * `grace` per execution for the processes to be reaped.
   */
  void shutdown(chrono::milliseconds grace);

 protected:
  struct ConnectionState {
    shared_ptr<RelayConnection> connection;
    string upgradeToken;
    int64_t connectedAtMs = 0;
    int malformedFrames = 0;
    optional<string> sessionId;
    ClientInfo clientInfo;
    int64_t authenticatedAtMs = 0;
    shared_ptr<CommandExecution> execution;
  };

  recursive_mutex classMutex;
  unordered_map<string, ConnectionState> connections;
};
}  // namespace tether

#endif  // __TETHER_SESSION_REGISTRY__
