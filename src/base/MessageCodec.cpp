#include "MessageCodec.hpp"

#include "TimeUtils.hpp"

namespace tether {
namespace {
class PayloadError : public std::runtime_error {
 public:
  explicit PayloadError(const string& what) : std::runtime_error(what) {}
};

string optionalString(const json& object, const char* key,
                      const string& fallback = "") {
  if (!object.is_object()) {
    return fallback;
  }
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw PayloadError(string("field '") + key + "' must be a string");
  }
  return it->get<string>();
}

string requireString(const json& object, const char* key) {
  if (!object.is_object() || !object.contains(key)) {
    throw PayloadError(string("missing field '") + key + "'");
  }
  return optionalString(object, key);
}

// 2^63, the first double past the int64_t range.
const double INT64_BOUND = 9223372036854775808.0;

int64_t numberToInt64(const json& value, const string& field) {
  if (value.is_number_unsigned()) {
    if (value.get<uint64_t>() > uint64_t(INT64_MAX)) {
      throw PayloadError("field '" + field + "' is out of range");
    }
    return int64_t(value.get<uint64_t>());
  }
  if (value.is_number_integer()) {
    return value.get<int64_t>();
  }
  double number = value.get<double>();
  if (!std::isfinite(number) || number < -INT64_BOUND ||
      number >= INT64_BOUND) {
    throw PayloadError("field '" + field + "' is out of range");
  }
  return int64_t(number);
}

optional<int64_t> optionalInteger(const json& object, const char* key) {
  if (!object.is_object()) {
    return nullopt;
  }
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullopt;
  }
  if (it->is_number()) {
    return numberToInt64(*it, key);
  }
  if (it->is_string()) {
    const string& text = it->get_ref<const string&>();
    if (!text.empty() && all_of(text.begin(), text.end(), [](unsigned char c) {
          return isdigit(c);
        })) {
      try {
        return stoll(text);
      } catch (const std::out_of_range&) {
        throw PayloadError(string("field '") + key + "' is out of range");
      }
    }
  }
  throw PayloadError(string("field '") + key + "' must be an integer");
}

const json& requireObjectOrEmpty(const json& envelope, const json& empty) {
  auto it = envelope.find("data");
  if (it == envelope.end() || it->is_null()) {
    return empty;
  }
  if (!it->is_object()) {
    throw PayloadError("field 'data' must be an object");
  }
  return *it;
}

AuthPayload decodeAuth(const json& envelope, const json& data) {
  AuthPayload payload;
  payload.token = optionalString(data, "token");
  if (payload.token.empty()) {
    payload.token = optionalString(envelope, "token");
  }
  json clientInfo;
  if (data.contains("client_info")) {
    clientInfo = data["client_info"];
  } else if (envelope.contains("client_info")) {
    clientInfo = envelope["client_info"];
  }
  if (!clientInfo.is_null()) {
    if (!clientInfo.is_object()) {
      throw PayloadError("field 'client_info' must be an object");
    }
    payload.clientInfo.platform = optionalString(clientInfo, "platform");
    payload.clientInfo.version = optionalString(clientInfo, "version");
  }
  return payload;
}

AuthResultPayload decodeAuthResult(const json& data) {
  AuthResultPayload payload;
  payload.serverVersion = optionalString(data, "server_version");
  payload.message = optionalString(data, "message");
  auto protocolVersion = optionalInteger(data, "protocol_version");
  if (protocolVersion) {
    payload.protocolVersion = int(*protocolVersion);
  }
  if (data.contains("capabilities")) {
    const json& capabilities = data["capabilities"];
    if (!capabilities.is_array()) {
      throw PayloadError("field 'capabilities' must be an array");
    }
    for (const auto& it : capabilities) {
      if (!it.is_string()) {
        throw PayloadError("capabilities must be strings");
      }
      payload.capabilities.push_back(it.get<string>());
    }
  }
  return payload;
}

AssistantExecutePayload decodeAssistantExecute(const json& data) {
  AssistantExecutePayload payload;
  payload.command = requireString(data, "command");
  if (data.contains("options") && !data["options"].is_null()) {
    const json& options = data["options"];
    if (!options.is_object()) {
      throw PayloadError("field 'options' must be an object");
    }
    payload.mode = optionalString(options, "mode");
    auto timeout = optionalInteger(options, "timeoutSeconds");
    if (!timeout) {
      timeout = optionalInteger(options, "timeout");
    }
    if (timeout) {
      payload.timeoutSeconds = int(std::max<int64_t>(
          std::min<int64_t>(*timeout, INT32_MAX), INT32_MIN));
    }
  }
  return payload;
}

AssistantOutputPayload decodeAssistantOutput(const json& data) {
  AssistantOutputPayload payload;
  payload.output = optionalString(data, "output");
  string status = requireString(data, "status");
  if (status == "running") {
    payload.status = OutputStatus::RUNNING;
  } else if (status == "completed") {
    payload.status = OutputStatus::COMPLETED;
  } else {
    throw PayloadError("unknown output status '" + status + "'");
  }
  return payload;
}

GitOperationPayload decodeGitOperation(const json& data) {
  GitOperationPayload payload;
  payload.operation = requireString(data, "operation");
  if (data.contains("options") && !data["options"].is_null()) {
    const json& options = data["options"];
    if (!options.is_object()) {
      throw PayloadError("field 'options' must be an object");
    }
    for (auto it = options.begin(); it != options.end(); ++it) {
      if (it.value().is_string()) {
        payload.options[it.key()] = it.value().get<string>();
      } else if (it.value().is_primitive() && !it.value().is_null()) {
        payload.options[it.key()] = it.value().dump();
      } else {
        throw PayloadError("git option '" + it.key() + "' must be a scalar");
      }
    }
  }
  return payload;
}

GitResponsePayload decodeGitResponse(const json& data,
                                     ResponseStatus envelopeStatus) {
  GitResponsePayload payload;
  payload.operation = optionalString(data, "operation");
  payload.data = optionalString(data, "data");
  string status = optionalString(data, "status");
  if (status == "success") {
    payload.success = true;
  } else if (status == "error") {
    payload.success = false;
  } else if (status.empty() && envelopeStatus != ResponseStatus::NONE) {
    payload.success = envelopeStatus == ResponseStatus::SUCCESS;
  } else {
    throw PayloadError("git_response needs a success or error status");
  }
  return payload;
}

struct PayloadEncoder {
  json operator()(const AuthPayload& payload) const {
    return {{"token", payload.token},
            {"client_info",
             {{"platform", payload.clientInfo.platform},
              {"version", payload.clientInfo.version}}}};
  }
  json operator()(const AuthResultPayload& payload) const {
    json data = json::object();
    if (!payload.serverVersion.empty()) {
      data["server_version"] = payload.serverVersion;
      data["protocol_version"] = payload.protocolVersion;
      data["capabilities"] = payload.capabilities;
    }
    if (!payload.message.empty()) {
      data["message"] = payload.message;
    }
    return data;
  }
  json operator()(const AssistantExecutePayload& payload) const {
    json options = json::object();
    if (!payload.mode.empty()) {
      options["mode"] = payload.mode;
    }
    if (payload.timeoutSeconds) {
      options["timeoutSeconds"] = *payload.timeoutSeconds;
    }
    return {{"command", payload.command}, {"options", options}};
  }
  json operator()(const AssistantOutputPayload& payload) const {
    return {{"output", payload.output},
            {"status", payload.status == OutputStatus::COMPLETED ? "completed"
                                                                 : "running"}};
  }
  json operator()(const AssistantErrorPayload& payload) const {
    return {{"error", payload.error}};
  }
  json operator()(const GitOperationPayload& payload) const {
    return {{"operation", payload.operation}, {"options", payload.options}};
  }
  json operator()(const GitResponsePayload& payload) const {
    return {{"operation", payload.operation},
            {"data", payload.data},
            {"status", payload.success ? "success" : "error"}};
  }
  json operator()(const PingPayload& payload) const {
    return {{"timestamp", payload.timestamp}};
  }
  json operator()(const PongPayload& payload) const {
    return {{"timestamp", payload.timestamp}};
  }
  json operator()(const ErrorPayload& payload) const {
    return {{"message", payload.message}};
  }
};

string responseStatusName(ResponseStatus status) {
  return status == ResponseStatus::SUCCESS ? "success" : "error";
}
}  // namespace

string decodeStatusName(DecodeStatus status) {
  switch (status) {
    case DecodeStatus::OK:
      return "ok";
    case DecodeStatus::UNKNOWN_TYPE:
      return "unknown type";
    case DecodeStatus::MALFORMED_FRAME:
      return "malformed frame";
    case DecodeStatus::INVALID_PAYLOAD:
      return "invalid payload";
  }
  return "unknown";
}

json MessageCodec::toJson(const Message& message) {
  json envelope;
  envelope["type"] = messageTypeName(message.getType());
  envelope["data"] = std::visit(PayloadEncoder(), message.payload);
  if (message.status != ResponseStatus::NONE) {
    envelope["status"] = responseStatusName(message.status);
  }
  envelope["timestamp"] = formatTimestamp(
      message.timestampMs ? message.timestampMs : currentTimeMillis());
  if (message.sessionId) {
    envelope["session_id"] = *message.sessionId;
  }
  if (message.requestId) {
    envelope["request_id"] = *message.requestId;
  }
  return envelope;
}

string MessageCodec::encode(const Message& message) {
  return toJson(message).dump();
}

DecodeResult MessageCodec::decode(const string& frame, int64_t receivedAtMs) {
  json envelope = json::parse(frame, nullptr, false);
  if (envelope.is_discarded()) {
    DecodeResult result;
    result.status = DecodeStatus::MALFORMED_FRAME;
    result.reason = "frame is not valid json";
    return result;
  }
  return fromJson(envelope, receivedAtMs);
}

DecodeResult MessageCodec::fromJson(const json& envelope,
                                    int64_t receivedAtMs) {
  DecodeResult result;
  if (!envelope.is_object()) {
    result.status = DecodeStatus::MALFORMED_FRAME;
    result.reason = "frame is not a json object";
    return result;
  }
  auto typeIt = envelope.find("type");
  if (typeIt == envelope.end() || !typeIt->is_string()) {
    result.status = DecodeStatus::MALFORMED_FRAME;
    result.reason = "frame has no string type";
    return result;
  }
  result.typeName = typeIt->get<string>();

  try {
    auto requestIt = envelope.find("request_id");
    if (requestIt != envelope.end() && !requestIt->is_null()) {
      result.requestId = requestIt->is_string() ? requestIt->get<string>()
                                                : requestIt->dump();
    }

    auto type = messageTypeFromName(result.typeName);
    if (!type) {
      result.status = DecodeStatus::UNKNOWN_TYPE;
      result.reason = "unknown message type '" + result.typeName + "'";
      return result;
    }

    Message message;
    message.requestId = result.requestId;

    string status = optionalString(envelope, "status");
    if (status == "success") {
      message.status = ResponseStatus::SUCCESS;
    } else if (status == "error") {
      message.status = ResponseStatus::ERROR;
    } else if (!status.empty()) {
      throw PayloadError("unknown envelope status '" + status + "'");
    }

    string sessionId = optionalString(envelope, "session_id");
    if (!sessionId.empty()) {
      message.sessionId = sessionId;
    }

    message.timestampMs = receivedAtMs;
    auto timestampIt = envelope.find("timestamp");
    if (timestampIt != envelope.end() && !timestampIt->is_null()) {
      if (timestampIt->is_string()) {
        auto parsed = parseTimestamp(timestampIt->get<string>());
        if (!parsed) {
          throw PayloadError("unparseable timestamp");
        }
        message.timestampMs = *parsed;
      } else if (timestampIt->is_number()) {
        message.timestampMs = numberToInt64(*timestampIt, "timestamp");
      } else {
        throw PayloadError("timestamp must be a string or a number");
      }
    }

    json empty = json::object();
    const json& data = requireObjectOrEmpty(envelope, empty);
    switch (*type) {
      case MessageType::AUTH:
        message.payload = decodeAuth(envelope, data);
        break;
      case MessageType::AUTH_RESULT:
        if (message.status == ResponseStatus::NONE) {
          throw PayloadError("auth_result needs a status");
        }
        message.payload = decodeAuthResult(data);
        break;
      case MessageType::ASSISTANT_EXECUTE:
        message.payload = decodeAssistantExecute(data);
        break;
      case MessageType::ASSISTANT_OUTPUT:
        message.payload = decodeAssistantOutput(data);
        break;
      case MessageType::ASSISTANT_ERROR: {
        AssistantErrorPayload payload;
        payload.error = optionalString(data, "error");
        if (payload.error.empty()) {
          payload.error = requireString(data, "message");
        }
        message.payload = payload;
        break;
      }
      case MessageType::GIT_OPERATION:
        message.payload = decodeGitOperation(data);
        break;
      case MessageType::GIT_RESPONSE:
        message.payload = decodeGitResponse(data, message.status);
        break;
      case MessageType::PING: {
        PingPayload payload;
        payload.timestamp = optionalInteger(data, "timestamp").value_or(0);
        message.payload = payload;
        break;
      }
      case MessageType::PONG: {
        PongPayload payload;
        payload.timestamp = optionalInteger(data, "timestamp").value_or(0);
        message.payload = payload;
        break;
      }
      case MessageType::ERROR: {
        ErrorPayload payload;
        payload.message = optionalString(data, "message");
        message.payload = payload;
        break;
      }
    }
    result.status = DecodeStatus::OK;
    result.message = message;
  } catch (const PayloadError& pe) {
    result.status = DecodeStatus::INVALID_PAYLOAD;
    result.reason = pe.what();
  } catch (const json::exception& je) {
    result.status = DecodeStatus::INVALID_PAYLOAD;
    result.reason = je.what();
  }
  return result;
}
}  // namespace tether
