#include "AssistantCommand.hpp"

namespace tether {
namespace {
const size_t MAX_ERROR_DETAIL = 2048;
}

chrono::seconds AssistantCommand::resolveTimeout(
    const optional<int>& requested, const ExecutionConfig& config) {
  if (requested && *requested > 0 && *requested <= config.maxTimeoutSeconds) {
    return chrono::seconds(*requested);
  }
  return chrono::seconds(config.defaultTimeoutSeconds);
}

shared_ptr<AssistantCommand> AssistantCommand::create(
    const Message& request, const ExecutionConfig& config) {
  const auto* payload = request.get<AssistantExecutePayload>();
  if (!payload) {
    STFATAL << "Not an assistant_execute message: "
            << messageTypeName(request.getType());
  }
  string text = trim(payload->command);
  auto words = splitWhitespace(text);
  if (words.empty()) {
    throw CommandRejected("Empty command");
  }

  string mode = toLower(payload->mode);
  bool continueConversation = false;
  if (mode == "continue") {
    continueConversation = true;
  } else if (!mode.empty() && mode != "batch" && mode != "interactive") {
    throw CommandRejected("Unsupported mode: " + payload->mode);
  }

  vector<string> argv;
  const string& first = words[0];
  if (first == config.assistantBinary) {
    argv = words;
  } else if (first[0] == '/' ||
             find(config.shellPrefixes.begin(), config.shellPrefixes.end(),
                  first) != config.shellPrefixes.end()) {
    argv = {"/bin/sh", "-c", text};
  } else {
    argv.push_back(config.assistantBinary);
    if (continueConversation) {
      argv.push_back("--continue");
    }
    argv.push_back("-p");
    argv.push_back(text);
  }

  return shared_ptr<AssistantCommand>(new AssistantCommand(
      request.requestId, resolveTimeout(payload->timeoutSeconds, config),
      argv));
}

Message AssistantCommand::makeRejection(const Message& request,
                                        const string& reason) {
  AssistantErrorPayload payload;
  payload.error = reason;
  return Message::replyTo(request, payload, ResponseStatus::ERROR);
}

Message AssistantCommand::makeChunk(const string& chunk) const {
  AssistantOutputPayload payload;
  payload.output = chunk;
  payload.status = OutputStatus::RUNNING;
  return reply(payload);
}

Message AssistantCommand::makeResult(const ExecutionResult& result) const {
  if (!result.startError.empty()) {
    AssistantErrorPayload payload;
    payload.error = result.startError;
    return reply(payload, ResponseStatus::ERROR);
  }
  if (result.exitCode == 0) {
    AssistantOutputPayload payload;
    payload.output = result.output;
    payload.status = OutputStatus::COMPLETED;
    return reply(payload, ResponseStatus::SUCCESS);
  }
  AssistantErrorPayload payload;
  payload.error = "Command exited with status " + to_string(result.exitCode);
  string detail = trim(result.errorOutput);
  if (!detail.empty()) {
    if (detail.size() > MAX_ERROR_DETAIL) {
      detail = detail.substr(detail.size() - MAX_ERROR_DETAIL);
    }
    payload.error += ": " + detail;
  }
  return reply(payload, ResponseStatus::ERROR);
}

Message AssistantCommand::makeTimeout() const {
  AssistantErrorPayload payload;
  payload.error =
      "Command timed out after " + to_string(timeout.count()) + " seconds";
  return reply(payload, ResponseStatus::ERROR);
}

string AssistantCommand::describe() const {
  string joined;
  for (const auto& arg : argv) {
    if (!joined.empty()) joined += " ";
    joined += arg;
  }
  return "assistant[" + joined + "]";
}
}  // namespace tether
