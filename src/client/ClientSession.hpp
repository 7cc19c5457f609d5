#ifndef __TETHER_CLIENT_SESSION__
#define __TETHER_CLIENT_SESSION__

#include "CommandParser.hpp"
#include "ConnectionDescriptor.hpp"
#include "Headers.hpp"
#include "Message.hpp"
#include "TerminalLog.hpp"
#include "TransportSession.hpp"

namespace tether {
enum class ClientState { DISCONNECTED, CONNECTING, CONNECTED, ERROR };

string clientStateName(ClientState state);

enum class SubmitResult { ACCEPTED, NOT_CONNECTED, BUSY, INVALID, SEND_FAILED };

string submitResultName(SubmitResult result);

/**
 * @brief What the relay told us when it accepted the auth.
 */
struct SessionInfo {
  string sessionId;
  string serverVersion;
  int protocolVersion = 0;
  vector<string> capabilities;
  int64_t lastConnectedAtMs = 0;
};

class ClientSessionListener {
 public:
  virtual ~ClientSessionListener() {}

  virtual void onStateChanged(ClientState state) {}

  virtual void onTerminalLine(const TerminalLine& line) {}

  virtual void onCommandFinished(const string& requestId, bool success) {}
};

/**
 * @brief Client connection state machine.
 *
 * Disconnected -> Connecting -> Connected -> Disconnected, with Error as the
 * sink for rejected authentication. At most one command is outstanding; it
 * ends when a terminal response for it arrives or the socket goes away.
 * Reconnecting is always explicit, through resume().
 */
class ClientSession {
 public:
  ClientSession(shared_ptr<TransportSession> _transport,
                const ClientInfo& _clientInfo,
                chrono::milliseconds _authTimeout =
                    chrono::seconds(CLIENT_CONNECT_TIMEOUT_SECONDS));

  ~ClientSession();

  /**
   * @brief Opens the transport and authenticates. Blocks until the relay
   * answers, the transport fails or the auth timeout passes.
   * @return true once Connected. false without any network effect if
   * already Connecting or Connected.
   */
  bool connect(const ConnectionDescriptor& descriptor);

  /**
   * @brief connect() to the last descriptor.
   */
  bool resume();

  void disconnect();

  SubmitResult submitCommand(const string& text,
                             const CommandOptions& options = CommandOptions());

  bool ping();

  /**
   * @return false if a command is still outstanding after `timeout`.
   */
  bool waitForIdle(chrono::milliseconds timeout);

  ClientState currentState();

  bool isExecuting();

  optional<ConnectionDescriptor> lastHost();

  optional<SessionInfo> session();

  string getLastError();

  TerminalLog& getTerminalLog() { return terminalLog; }

  void addListener(shared_ptr<ClientSessionListener> listener);

  void removeListener(shared_ptr<ClientSessionListener> listener);

 protected:
  class TransportObserver;

  void handleMessage(const Message& message);
  void handleAuthResult(const Message& message);
  void handleDecodeFailure(const string& raw, const string& reason);
  void handleTransportError(const string& cause);
  void handleClose(int code, const string& reason);

  void failConnect(const string& reason);
  void finishCommand(const Message& response, bool success);
  void resolveAuth(bool authenticated);

  void notifyState(ClientState newState);
  void emitLine(TerminalLineKind kind, const string& text);
  vector<shared_ptr<ClientSessionListener>> getListeners();

  shared_ptr<TransportSession> transport;
  shared_ptr<TransportObserver> observer;
  ClientInfo clientInfo;
  chrono::milliseconds authTimeout;

  recursive_mutex classMutex;
  condition_variable_any idleCondition;
  ClientState state;
  optional<ConnectionDescriptor> lastDescriptor;
  optional<SessionInfo> sessionInfo;
  bool executing;
  optional<string> pendingRequestId;
  string lastError;
  shared_ptr<promise<bool>> authPromise;

  TerminalLog terminalLog;
  mutex listenerMutex;
  vector<weak_ptr<ClientSessionListener>> listeners;
};
}  // namespace tether

#endif  // __TETHER_CLIENT_SESSION__
