#include "RelayProtocolHandler.hpp"

#include "AssistantCommand.hpp"
#include "GitCommand.hpp"

namespace tether {
RelayProtocolHandler::RelayProtocolHandler(
    shared_ptr<SessionRegistry> _registry, const RelayServerConfig& _config)
    : registry(_registry), config(_config) {}

vector<string> RelayProtocolHandler::capabilities() {
  return {"assistant_execute", "git_operation", "ping"};
}

void RelayProtocolHandler::onConnectionOpened(
    shared_ptr<RelayConnection> connection, const string& upgradeToken) {
  registry->addConnection(connection, upgradeToken);
}

void RelayProtocolHandler::onConnectionClosed(const string& connectionId) {
  registry->removeConnection(connectionId);
}

void RelayProtocolHandler::onAuthDeadline(
    shared_ptr<RelayConnection> connection) {
  if (!registry->hasConnection(connection->getId()) ||
      registry->isAuthenticated(connection->getId())) {
    return;
  }
  LOG(WARNING) << "Connection " << connection->getId() << " from "
               << connection->getPeerAddress()
               << " did not authenticate in time";
  sendError(connection, nullopt, nullopt, "Authentication timed out");
  connection->close(CLOSE_POLICY_VIOLATION, "authentication timed out");
  registry->removeConnection(connection->getId());
}

void RelayProtocolHandler::onFrame(shared_ptr<RelayConnection> connection,
                                   const string& frame) {
  const string& id = connection->getId();
  if (!registry->hasConnection(id)) {
    VLOG(1) << "Dropping frame for closed connection " << id;
    return;
  }
  DecodeResult decoded = MessageCodec::decode(frame);
  VLOG(2) << "Frame from " << id << ": " << decodeStatusName(decoded.status)
          << " " << decoded.typeName;

  if (!registry->isAuthenticated(id)) {
    handleUnauthenticated(connection, decoded);
    return;
  }

  if (decoded.status == DecodeStatus::UNKNOWN_TYPE) {
    VLOG(1) << "Ignoring message with unknown type '" << decoded.typeName
            << "' from " << id;
    return;
  }
  if (!decoded.ok()) {
    handleBadFrame(connection, decoded);
    return;
  }

  const Message& message = *decoded.message;
  switch (message.getType()) {
    case MessageType::AUTH:
      sendError(connection, message.requestId, registry->getSessionId(id),
                "Already authenticated");
      break;
    case MessageType::PING: {
      PongPayload pong;
      pong.timestamp = message.get<PingPayload>()->timestamp;
      send(connection, Message::replyTo(message, pong));
      break;
    }
    case MessageType::PONG:
      VLOG(1) << "Pong from " << id;
      break;
    case MessageType::ASSISTANT_EXECUTE:
    case MessageType::GIT_OPERATION:
      handleCommand(connection, message);
      break;
    default:
      LOG(WARNING) << "Ignoring server-bound " << decoded.typeName
                   << " message from " << id;
      break;
  }
}

void RelayProtocolHandler::handleUnauthenticated(
    shared_ptr<RelayConnection> connection, const DecodeResult& decoded) {
  const string& id = connection->getId();
  bool isAuth = decoded.typeName == messageTypeName(MessageType::AUTH);
  if (isAuth && decoded.ok()) {
    handleAuth(connection, *decoded.message);
    return;
  }
  if (isAuth) {
    LOG(WARNING) << "Malformed auth from " << id << ": " << decoded.reason;
    AuthResultPayload payload;
    payload.message = "Malformed auth message: " + decoded.reason;
    Message reply = Message::create(payload, ResponseStatus::ERROR);
    reply.requestId = decoded.requestId;
    connection->send(MessageCodec::encode(reply));
  } else {
    LOG(WARNING) << "Connection " << id << " sent '" << decoded.typeName
                 << "' before authenticating";
    sendError(connection, decoded.requestId, nullopt,
              "Authentication required");
  }
  connection->close(CLOSE_POLICY_VIOLATION, "authentication required");
  registry->removeConnection(id);
}

void RelayProtocolHandler::handleAuth(shared_ptr<RelayConnection> connection,
                                      const Message& request) {
  const string& id = connection->getId();
  const auto* auth = request.get<AuthPayload>();
  string token = auth->token;
  if (token.empty()) {
    token = registry->getUpgradeToken(id);
  }

  if (config.authMode == AuthMode::TOKEN &&
      !constantTimeEquals(token, config.token)) {
    LOG(WARNING) << "Rejected token from " << connection->getPeerAddress()
                 << " on connection " << id;
    AuthResultPayload payload;
    payload.message = "Invalid session token";
    connection->send(MessageCodec::encode(
        Message::replyTo(request, payload, ResponseStatus::ERROR)));
    connection->close(CLOSE_POLICY_VIOLATION, "authentication failed");
    registry->removeConnection(id);
    return;
  }

  auto sessionId = registry->authenticate(id, auth->clientInfo);
  if (!sessionId) {
    // Socket vanished while we were checking the token.
    return;
  }
  AuthResultPayload payload;
  payload.serverVersion = TETHER_VERSION;
  payload.capabilities = capabilities();
  Message reply = Message::replyTo(request, payload, ResponseStatus::SUCCESS);
  reply.sessionId = *sessionId;
  connection->send(MessageCodec::encode(reply));
}

void RelayProtocolHandler::handleCommand(
    shared_ptr<RelayConnection> connection, const Message& request) {
  const string& id = connection->getId();
  auto sessionId = registry->getSessionId(id);
  auto running = registry->getExecution(id);
  if (running) {
    LOG(INFO) << "Rejecting " << messageTypeName(request.getType())
              << " on " << id << ": " << running->describe()
              << " is still running";
    sendError(connection, request.requestId, sessionId,
              "A command is already running");
    return;
  }

  shared_ptr<RelayCommand> command;
  try {
    if (request.getType() == MessageType::ASSISTANT_EXECUTE) {
      command = AssistantCommand::create(request, config.execution);
    } else {
      command = GitCommand::create(request, config.execution);
    }
  } catch (const CommandRejected& cr) {
    LOG(INFO) << "Rejected command on " << id << ": " << cr.what();
    Message rejection =
        request.getType() == MessageType::ASSISTANT_EXECUTE
            ? AssistantCommand::makeRejection(request, cr.what())
            : GitCommand::makeRejection(request, cr.what());
    send(connection, rejection);
    return;
  }

  weak_ptr<RelayConnection> weakConnection = connection;
  MessageSink sink = [weakConnection, sessionId](const Message& message) {
    auto target = weakConnection.lock();
    if (!target) {
      return;
    }
    Message stamped = message;
    stamped.sessionId = sessionId;
    target->send(MessageCodec::encode(stamped));
  };
  auto execution = make_shared<CommandExecution>(
      command, config.execution.workingDirectory, sink,
      chrono::milliseconds(config.execution.killGraceMillis),
      chrono::milliseconds(config.execution.outputIdleFlushMillis));
  if (!registry->beginExecution(id, execution)) {
    sendError(connection, request.requestId, sessionId,
              "A command is already running");
    return;
  }
  auto weakRegistry = weak_ptr<SessionRegistry>(registry);
  execution->start([weakRegistry, id](shared_ptr<CommandExecution> finished) {
    auto target = weakRegistry.lock();
    if (target) {
      target->endExecution(id, finished);
    }
  });
}

void RelayProtocolHandler::handleBadFrame(
    shared_ptr<RelayConnection> connection, const DecodeResult& decoded) {
  const string& id = connection->getId();
  int count = registry->recordMalformedFrame(id);
  LOG(WARNING) << "Bad frame #" << count << " from " << id << ": "
               << decoded.reason;
  sendError(connection, decoded.requestId, registry->getSessionId(id),
            "Invalid message: " + decoded.reason);
  if (count > config.maxMalformedFrames) {
    LOG(WARNING) << "Closing " << id << " after " << count << " bad frames";
    connection->close(CLOSE_POLICY_VIOLATION, "too many malformed frames");
    registry->removeConnection(id);
  }
}

void RelayProtocolHandler::send(const shared_ptr<RelayConnection>& connection,
                                Message message) {
  message.sessionId = registry->getSessionId(connection->getId());
  connection->send(MessageCodec::encode(message));
}

void RelayProtocolHandler::sendError(
    const shared_ptr<RelayConnection>& connection,
    const optional<string>& requestId, const optional<string>& sessionId,
    const string& text) {
  ErrorPayload payload;
  payload.message = text;
  Message message = Message::create(payload, ResponseStatus::ERROR);
  message.requestId = requestId;
  message.sessionId = sessionId;
  connection->send(MessageCodec::encode(message));
}
}  // namespace tether
