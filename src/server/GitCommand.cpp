#include "GitCommand.hpp"

namespace tether {
namespace {
string option(const map<string, string>& options, const string& key) {
  auto it = options.find(key);
  return it == options.end() ? string() : it->second;
}

bool isTrue(const string& value) {
  string lowered = toLower(value);
  return lowered == "true" || lowered == "1" || lowered == "yes";
}
}  // namespace

shared_ptr<GitCommand> GitCommand::create(const Message& request,
                                          const ExecutionConfig& config) {
  const auto* payload = request.get<GitOperationPayload>();
  if (!payload) {
    STFATAL << "Not a git_operation message: "
            << messageTypeName(request.getType());
  }
  const string& operation = payload->operation;
  const auto& options = payload->options;
  vector<vector<string>> steps;

  if (operation == "status") {
    steps.push_back({"git", "status", "--porcelain"});
  } else if (operation == "diff") {
    vector<string> argv = {"git", "diff"};
    if (isTrue(option(options, "staged"))) {
      argv.push_back("--staged");
    }
    string file = option(options, "file");
    if (!file.empty()) {
      argv.push_back("--");
      argv.push_back(file);
    }
    steps.push_back(argv);
  } else if (operation == "log") {
    int limit = DEFAULT_LOG_LIMIT;
    string limitString = option(options, "limit");
    if (!limitString.empty()) {
      bool numeric = all_of(limitString.begin(), limitString.end(),
                            [](unsigned char c) { return isdigit(c); });
      if (!numeric || limitString.size() > 4) {
        throw CommandRejected("Invalid log limit: " + limitString);
      }
      limit = stoi(limitString);
      if (limit < 1 || limit > MAX_LOG_LIMIT) {
        throw CommandRejected("Log limit must be within 1.." +
                              to_string(MAX_LOG_LIMIT));
      }
    }
    steps.push_back({"git", "log", "--oneline", "-n", to_string(limit)});
  } else if (operation == "branch") {
    steps.push_back({"git", "branch", "-v"});
  } else if (operation == "commit") {
    string message = option(options, "message");
    if (trim(message).empty()) {
      throw CommandRejected("Commit message is required");
    }
    if (isTrue(option(options, "add_all"))) {
      steps.push_back({"git", "add", "."});
    }
    steps.push_back({"git", "commit", "-m", message});
  } else {
    throw CommandRejected("Unsupported git operation: " + operation);
  }

  return shared_ptr<GitCommand>(
      new GitCommand(request.requestId,
                     chrono::seconds(config.gitTimeoutSeconds), operation,
                     steps));
}

Message GitCommand::makeRejection(const Message& request,
                                  const string& reason) {
  const auto* payload = request.get<GitOperationPayload>();
  GitResponsePayload response;
  response.operation = payload ? payload->operation : "";
  response.data = reason;
  response.success = false;
  return Message::replyTo(request, response, ResponseStatus::ERROR);
}

Message GitCommand::response(const string& data, bool success) const {
  GitResponsePayload payload;
  payload.operation = operation;
  payload.data = data;
  payload.success = success;
  return reply(payload,
               success ? ResponseStatus::SUCCESS : ResponseStatus::ERROR);
}

Message GitCommand::makeResult(const ExecutionResult& result) const {
  if (!result.startError.empty()) {
    return response(
        "Failed to execute git " + operation + ": " + result.startError,
        false);
  }
  if (result.exitCode == 0) {
    return response(result.output, true);
  }
  if (operation == "commit" &&
      result.output.find("nothing to commit") != string::npos) {
    return response("No changes to commit", true);
  }
  bool addFailed = operation == "commit" && steps.size() > 1 &&
                   result.stepIndex == 0;
  string summary = addFailed ? string("Failed to add files")
                             : "Failed to execute git " + operation;
  summary += ": exit status " + to_string(result.exitCode);
  string detail = trim(result.output);
  if (!detail.empty()) {
    summary += "\n" + detail;
  }
  return response(summary, false);
}

Message GitCommand::makeTimeout() const {
  return response("git " + operation + " timed out after " +
                      to_string(timeout.count()) + " seconds",
                  false);
}
}  // namespace tether
