#include "Message.hpp"

namespace tether {
namespace {
const map<MessageType, string> MESSAGE_TYPE_NAMES = {
    {MessageType::AUTH, "auth"},
    {MessageType::AUTH_RESULT, "auth_result"},
    {MessageType::ASSISTANT_EXECUTE, "assistant_execute"},
    {MessageType::ASSISTANT_OUTPUT, "assistant_output"},
    {MessageType::ASSISTANT_ERROR, "assistant_error"},
    {MessageType::GIT_OPERATION, "git_operation"},
    {MessageType::GIT_RESPONSE, "git_response"},
    {MessageType::PING, "ping"},
    {MessageType::PONG, "pong"},
    {MessageType::ERROR, "error"},
};

struct PayloadTypeVisitor {
  MessageType operator()(const AuthPayload&) const { return MessageType::AUTH; }
  MessageType operator()(const AuthResultPayload&) const {
    return MessageType::AUTH_RESULT;
  }
  MessageType operator()(const AssistantExecutePayload&) const {
    return MessageType::ASSISTANT_EXECUTE;
  }
  MessageType operator()(const AssistantOutputPayload&) const {
    return MessageType::ASSISTANT_OUTPUT;
  }
  MessageType operator()(const AssistantErrorPayload&) const {
    return MessageType::ASSISTANT_ERROR;
  }
  MessageType operator()(const GitOperationPayload&) const {
    return MessageType::GIT_OPERATION;
  }
  MessageType operator()(const GitResponsePayload&) const {
    return MessageType::GIT_RESPONSE;
  }
  MessageType operator()(const PingPayload&) const { return MessageType::PING; }
  MessageType operator()(const PongPayload&) const { return MessageType::PONG; }
  MessageType operator()(const ErrorPayload&) const {
    return MessageType::ERROR;
  }
};
}  // namespace

string messageTypeName(MessageType type) {
  auto it = MESSAGE_TYPE_NAMES.find(type);
  if (it == MESSAGE_TYPE_NAMES.end()) {
    STFATAL << "Unnamed message type: " << int(type);
  }
  return it->second;
}

optional<MessageType> messageTypeFromName(const string& name) {
  for (const auto& it : MESSAGE_TYPE_NAMES) {
    if (it.second == name) {
      return it.first;
    }
  }
  return nullopt;
}

MessageType payloadType(const Payload& payload) {
  return std::visit(PayloadTypeVisitor(), payload);
}

Message Message::create(Payload payload, ResponseStatus status) {
  Message message;
  message.payload = std::move(payload);
  message.status = status;
  message.timestampMs = currentTimeMillis();
  return message;
}

Message Message::replyTo(const Message& request, Payload payload,
                         ResponseStatus status) {
  Message message = create(std::move(payload), status);
  message.requestId = request.requestId;
  return message;
}

bool Message::isTerminalResponse() const {
  switch (getType()) {
    case MessageType::ASSISTANT_OUTPUT:
      return get<AssistantOutputPayload>()->status == OutputStatus::COMPLETED;
    case MessageType::ASSISTANT_ERROR:
    case MessageType::GIT_RESPONSE:
    case MessageType::ERROR:
      return true;
    default:
      return false;
  }
}
}  // namespace tether
