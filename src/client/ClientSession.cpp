#include "ClientSession.hpp"

namespace tether {
namespace {
string describeHost(const ConnectionDescriptor& descriptor) {
  ostringstream ss;
  ss << descriptor;
  return ss.str();
}
}  // namespace

string clientStateName(ClientState state) {
  switch (state) {
    case ClientState::DISCONNECTED:
      return "Disconnected";
    case ClientState::CONNECTING:
      return "Connecting";
    case ClientState::CONNECTED:
      return "Connected";
    case ClientState::ERROR:
      return "Error";
  }
  return "Unknown";
}

string submitResultName(SubmitResult result) {
  switch (result) {
    case SubmitResult::ACCEPTED:
      return "Accepted";
    case SubmitResult::NOT_CONNECTED:
      return "NotConnected";
    case SubmitResult::BUSY:
      return "Busy";
    case SubmitResult::INVALID:
      return "Invalid";
    case SubmitResult::SEND_FAILED:
      return "SendFailed";
  }
  return "Unknown";
}

/**
 * @brief Forwards transport events to the session until detached. Holds a
 * raw pointer so the transport never keeps the session alive.
 */
class ClientSession::TransportObserver : public TransportListener {
 public:
  explicit TransportObserver(ClientSession* _owner) : owner(_owner) {}

  void detach() {
    lock_guard<recursive_mutex> guard(ownerMutex);
    owner = NULL;
  }

  void onMessage(const Message& message) override {
    lock_guard<recursive_mutex> guard(ownerMutex);
    if (owner) owner->handleMessage(message);
  }

  void onDecodeFailure(const string& raw, const string& reason) override {
    lock_guard<recursive_mutex> guard(ownerMutex);
    if (owner) owner->handleDecodeFailure(raw, reason);
  }

  void onError(const string& cause) override {
    lock_guard<recursive_mutex> guard(ownerMutex);
    if (owner) owner->handleTransportError(cause);
  }

  void onClose(int code, const string& reason) override {
    lock_guard<recursive_mutex> guard(ownerMutex);
    if (owner) owner->handleClose(code, reason);
  }

 protected:
  recursive_mutex ownerMutex;
  ClientSession* owner;
};

ClientSession::ClientSession(shared_ptr<TransportSession> _transport,
                             const ClientInfo& _clientInfo,
                             chrono::milliseconds _authTimeout)
    : transport(_transport),
      clientInfo(_clientInfo),
      authTimeout(_authTimeout),
      state(ClientState::DISCONNECTED),
      executing(false) {
  observer.reset(new TransportObserver(this));
  transport->addListener(observer);
}

ClientSession::~ClientSession() {
  observer->detach();
  transport->removeListener(observer);
  transport->disconnect();
}

bool ClientSession::connect(const ConnectionDescriptor& descriptor) {
  future<bool> authenticated;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (state == ClientState::CONNECTING || state == ClientState::CONNECTED) {
      VLOG(1) << "Ignoring connect while " << clientStateName(state);
      return false;
    }
    state = ClientState::CONNECTING;
    lastDescriptor = descriptor;
    sessionInfo.reset();
    lastError.clear();
    executing = false;
    pendingRequestId.reset();
    authPromise.reset(new promise<bool>());
    authenticated = authPromise->get_future();
  }
  notifyState(ClientState::CONNECTING);
  emitLine(TerminalLineKind::SYSTEM,
           "Connecting to " + describeHost(descriptor) + "...");

  if (!transport->connect(descriptor)) {
    failConnect("Cannot reach " + describeHost(descriptor));
    return authenticated.get();
  }

  AuthPayload auth;
  auth.token = descriptor.getSessionToken();
  auth.clientInfo = clientInfo;
  if (!transport->send(Message::create(auth))) {
    failConnect("Connection lost before authentication");
    return authenticated.get();
  }

  if (authenticated.wait_for(authTimeout) != future_status::ready) {
    LOG(WARNING) << "No auth_result within " << authTimeout.count() << " ms";
    failConnect("Authentication timed out");
    transport->disconnect();
  }
  return authenticated.get();
}

bool ClientSession::resume() {
  optional<ConnectionDescriptor> descriptor = lastHost();
  if (!descriptor) {
    LOG(WARNING) << "Nothing to resume";
    return false;
  }
  LOG(INFO) << "Resuming connection to " << *descriptor;
  return connect(*descriptor);
}

void ClientSession::disconnect() {
  ClientState previous;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    previous = state;
    state = ClientState::DISCONNECTED;
    executing = false;
    pendingRequestId.reset();
    resolveAuth(false);
  }
  transport->disconnect();
  idleCondition.notify_all();
  if (previous != ClientState::DISCONNECTED) {
    notifyState(ClientState::DISCONNECTED);
    emitLine(TerminalLineKind::SYSTEM, "Disconnected");
  }
}

SubmitResult ClientSession::submitCommand(const string& text,
                                          const CommandOptions& options) {
  optional<Message> request = CommandParser::parse(text, options);
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (state != ClientState::CONNECTED) {
      return SubmitResult::NOT_CONNECTED;
    }
    if (executing) {
      return SubmitResult::BUSY;
    }
    if (!request) {
      return SubmitResult::INVALID;
    }
    executing = true;
    pendingRequestId = request->requestId;
  }
  emitLine(TerminalLineKind::COMMAND, trim(text));

  if (!transport->send(*request)) {
    {
      lock_guard<recursive_mutex> guard(classMutex);
      if (pendingRequestId == request->requestId) {
        executing = false;
        pendingRequestId.reset();
      }
    }
    idleCondition.notify_all();
    emitLine(TerminalLineKind::ERROR, "Failed to send command");
    return SubmitResult::SEND_FAILED;
  }
  VLOG(1) << "Submitted " << messageTypeName(request->getType()) << " "
          << *request->requestId;
  return SubmitResult::ACCEPTED;
}

bool ClientSession::ping() {
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (state != ClientState::CONNECTED) {
      return false;
    }
  }
  PingPayload ping;
  ping.timestamp = currentTimeMillis();
  return transport->send(Message::create(ping));
}

bool ClientSession::waitForIdle(chrono::milliseconds timeout) {
  unique_lock<recursive_mutex> guard(classMutex);
  return idleCondition.wait_for(guard, timeout, [this]() { return !executing; });
}

ClientState ClientSession::currentState() {
  lock_guard<recursive_mutex> guard(classMutex);
  return state;
}

bool ClientSession::isExecuting() {
  lock_guard<recursive_mutex> guard(classMutex);
  return executing;
}

optional<ConnectionDescriptor> ClientSession::lastHost() {
  lock_guard<recursive_mutex> guard(classMutex);
  return lastDescriptor;
}

optional<SessionInfo> ClientSession::session() {
  lock_guard<recursive_mutex> guard(classMutex);
  return sessionInfo;
}

string ClientSession::getLastError() {
  lock_guard<recursive_mutex> guard(classMutex);
  return lastError;
}

void ClientSession::addListener(shared_ptr<ClientSessionListener> listener) {
  lock_guard<mutex> guard(listenerMutex);
  listeners.push_back(listener);
}

void ClientSession::removeListener(shared_ptr<ClientSessionListener> listener) {
  lock_guard<mutex> guard(listenerMutex);
  listeners.erase(
      remove_if(listeners.begin(), listeners.end(),
                [&listener](const weak_ptr<ClientSessionListener>& it) {
                  auto locked = it.lock();
                  return !locked || locked == listener;
                }),
      listeners.end());
}

void ClientSession::handleMessage(const Message& message) {
  MessageType type = message.getType();
  if (type == MessageType::AUTH_RESULT) {
    handleAuthResult(message);
    return;
  }
  if (currentState() != ClientState::CONNECTED) {
    if (type == MessageType::ERROR) {
      string text = message.get<ErrorPayload>()->message;
      LOG(WARNING) << "Relay error before authentication: " << text;
      lock_guard<recursive_mutex> guard(classMutex);
      lastError = text;
    } else {
      VLOG(1) << "Ignoring " << messageTypeName(type)
              << " while not connected";
    }
    return;
  }

  bool success = true;
  switch (type) {
    case MessageType::PING: {
      PongPayload pong;
      pong.timestamp = message.get<PingPayload>()->timestamp;
      if (!transport->send(Message::replyTo(message, pong))) {
        LOG(WARNING) << "Could not answer ping";
      }
      break;
    }
    case MessageType::PONG:
      VLOG(1) << "Got pong (" << message.get<PongPayload>()->timestamp
              << ")";
      break;
    case MessageType::ASSISTANT_OUTPUT: {
      auto payload = message.get<AssistantOutputPayload>();
      if (!payload->output.empty()) {
        emitLine(TerminalLineKind::OUTPUT, payload->output);
      }
      break;
    }
    case MessageType::ASSISTANT_ERROR:
      emitLine(TerminalLineKind::ERROR,
               message.get<AssistantErrorPayload>()->error);
      success = false;
      break;
    case MessageType::GIT_RESPONSE: {
      auto payload = message.get<GitResponsePayload>();
      if (payload->success) {
        emitLine(TerminalLineKind::OUTPUT,
                 payload->data.empty() ? "git " + payload->operation + ": ok"
                                       : payload->data);
      } else {
        emitLine(TerminalLineKind::ERROR, payload->data);
      }
      success = payload->success;
      break;
    }
    case MessageType::ERROR:
      emitLine(TerminalLineKind::ERROR, message.get<ErrorPayload>()->message);
      success = false;
      break;
    default:
      LOG(WARNING) << "Ignoring unexpected " << messageTypeName(type)
                   << " from relay";
      break;
  }
  if (message.isTerminalResponse()) {
    finishCommand(message, success);
  }
}

void ClientSession::handleAuthResult(const Message& message) {
  auto payload = message.get<AuthResultPayload>();
  ClientState newState;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (state != ClientState::CONNECTING) {
      LOG(WARNING) << "Unexpected auth_result while " << clientStateName(state);
      return;
    }
    if (message.status == ResponseStatus::SUCCESS) {
      SessionInfo info;
      info.sessionId = message.sessionId.value_or("");
      info.serverVersion = payload->serverVersion;
      info.protocolVersion = payload->protocolVersion;
      info.capabilities = payload->capabilities;
      info.lastConnectedAtMs = currentTimeMillis();
      sessionInfo = info;
      state = ClientState::CONNECTED;
    } else {
      lastError = "Authentication failed: " +
                  (payload->message.empty() ? string("rejected by relay")
                                            : payload->message);
      state = ClientState::ERROR;
    }
    newState = state;
    resolveAuth(newState == ClientState::CONNECTED);
  }

  notifyState(newState);
  if (newState == ClientState::CONNECTED) {
    LOG(INFO) << "Authenticated, session " << message.sessionId.value_or("?");
    emitLine(TerminalLineKind::SYSTEM,
             "Connected (server " + payload->serverVersion + ")");
  } else {
    LOG(WARNING) << getLastError();
    emitLine(TerminalLineKind::ERROR, getLastError());
    transport->disconnect();
  }
}

void ClientSession::handleDecodeFailure(const string& raw,
                                        const string& reason) {
  LOG(WARNING) << "Dropping undecodable frame: " << reason;
  VLOG(2) << "Frame: " << raw;
}

void ClientSession::handleTransportError(const string& cause) {
  LOG(WARNING) << "Transport error: " << cause;
  lock_guard<recursive_mutex> guard(classMutex);
  lastError = cause;
}

void ClientSession::handleClose(int code, const string& reason) {
  ClientState previous;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    previous = state;
  }
  if (previous == ClientState::CONNECTING) {
    string why = getLastError();
    failConnect(why.empty() ? "Connection closed (" + to_string(code) + ")"
                            : why);
    return;
  }
  if (previous != ClientState::CONNECTED) {
    return;
  }
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (state != ClientState::CONNECTED) {
      return;
    }
    state = ClientState::DISCONNECTED;
    executing = false;
    pendingRequestId.reset();
  }
  idleCondition.notify_all();
  notifyState(ClientState::DISCONNECTED);
  emitLine(TerminalLineKind::SYSTEM,
           "Disconnected (" + to_string(code) +
               (reason.empty() ? string() : ": " + reason) + ")");
}

void ClientSession::failConnect(const string& reason) {
  {
    lock_guard<recursive_mutex> guard(classMutex);
    resolveAuth(false);
    if (state != ClientState::CONNECTING) {
      return;
    }
    state = ClientState::DISCONNECTED;
    lastError = reason;
  }
  notifyState(ClientState::DISCONNECTED);
  emitLine(TerminalLineKind::ERROR, "Connection failed: " + reason);
}

void ClientSession::finishCommand(const Message& response, bool success) {
  string requestId;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (!executing) {
      VLOG(1) << "Response with no outstanding command";
      return;
    }
    // A stray error still ends the command; other responses must match.
    if (response.getType() != MessageType::ERROR && response.requestId &&
        pendingRequestId && *response.requestId != *pendingRequestId) {
      LOG(WARNING) << "Ignoring response for stale request "
                   << *response.requestId;
      return;
    }
    requestId = pendingRequestId.value_or("");
    executing = false;
    pendingRequestId.reset();
  }
  idleCondition.notify_all();
  for (auto& it : getListeners()) {
    it->onCommandFinished(requestId, success);
  }
}

void ClientSession::resolveAuth(bool authenticated) {
  if (authPromise) {
    authPromise->set_value(authenticated);
    authPromise.reset();
  }
}

vector<shared_ptr<ClientSessionListener>> ClientSession::getListeners() {
  lock_guard<mutex> guard(listenerMutex);
  vector<shared_ptr<ClientSessionListener>> live;
  for (auto& it : listeners) {
    auto locked = it.lock();
    if (locked) {
      live.push_back(locked);
    }
  }
  return live;
}

void ClientSession::notifyState(ClientState newState) {
  VLOG(1) << "Client state " << clientStateName(newState);
  for (auto& it : getListeners()) {
    it->onStateChanged(newState);
  }
}

void ClientSession::emitLine(TerminalLineKind kind, const string& text) {
  TerminalLine line = terminalLog.append(kind, text);
  for (auto& it : getListeners()) {
    it->onTerminalLine(line);
  }
}
}  // namespace tether
