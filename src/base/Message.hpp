#ifndef __TETHER_MESSAGE__
#define __TETHER_MESSAGE__

#include "Headers.hpp"

namespace tether {
enum class MessageType {
  AUTH,
  AUTH_RESULT,
  ASSISTANT_EXECUTE,
  ASSISTANT_OUTPUT,
  ASSISTANT_ERROR,
  GIT_OPERATION,
  GIT_RESPONSE,
  PING,
  PONG,
  ERROR
};

string messageTypeName(MessageType type);
optional<MessageType> messageTypeFromName(const string& name);

enum class ResponseStatus { NONE, SUCCESS, ERROR };

struct ClientInfo {
  string platform;
  string version;
};

struct AuthPayload {
  string token;
  ClientInfo clientInfo;
};

// Success/failure travels in the envelope status.
struct AuthResultPayload {
  string serverVersion;
  int protocolVersion = PROTOCOL_VERSION;
  vector<string> capabilities;
  string message;
};

struct AssistantExecutePayload {
  string command;
  string mode;
  optional<int> timeoutSeconds;
};

enum class OutputStatus { RUNNING, COMPLETED };

struct AssistantOutputPayload {
  string output;
  OutputStatus status = OutputStatus::RUNNING;
};

struct AssistantErrorPayload {
  string error;
};

struct GitOperationPayload {
  string operation;
  map<string, string> options;
};

struct GitResponsePayload {
  string operation;
  string data;
  bool success = false;
};

struct PingPayload {
  int64_t timestamp = 0;
};

struct PongPayload {
  int64_t timestamp = 0;
};

struct ErrorPayload {
  string message;
};

typedef variant<AuthPayload, AuthResultPayload, AssistantExecutePayload,
                AssistantOutputPayload, AssistantErrorPayload,
                GitOperationPayload, GitResponsePayload, PingPayload,
                PongPayload, ErrorPayload>
    Payload;

MessageType payloadType(const Payload& payload);

/**
 * @brief One envelope on the relay socket. The payload alternative decides
 * the wire `type`.
 */
struct Message {
  Payload payload;
  ResponseStatus status = ResponseStatus::NONE;
  optional<string> sessionId;
  optional<string> requestId;
  int64_t timestampMs = 0;

  MessageType getType() const { return payloadType(payload); }

  template <typename T>
  const T* get() const {
    return std::get_if<T>(&payload);
  }

  /**
   * @brief Builds a message stamped with the current time.
   */
  static Message create(Payload payload,
                        ResponseStatus status = ResponseStatus::NONE);

  /**
   * @brief Builds a response carrying the request id of `request`, if any.
   */
  static Message replyTo(const Message& request, Payload payload,
                         ResponseStatus status = ResponseStatus::NONE);

  /**
   * @brief True for messages that end an outstanding command on the client.
   */
  bool isTerminalResponse() const;
};
}  // namespace tether

#endif  // __TETHER_MESSAGE__
