#include "CommandParser.hpp"

namespace tether {
namespace {
bool isNumber(const string& s) {
  return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) {
    return isdigit(c) != 0;
  });
}

void parseDiff(const vector<string>& args, GitOperationPayload* git) {
  bool pathsFollow = false;
  for (const auto& arg : args) {
    if (!pathsFollow && (arg == "--staged" || arg == "--cached")) {
      git->options["staged"] = "true";
    } else if (!pathsFollow && arg == "--") {
      pathsFollow = true;
    } else if (pathsFollow || !startsWith(arg, "-")) {
      if (git->options.find("file") == git->options.end()) {
        git->options["file"] = arg;
      }
    }
  }
}

void parseLog(const vector<string>& args, GitOperationPayload* git) {
  for (size_t a = 0; a < args.size(); a++) {
    const string& arg = args[a];
    if ((arg == "-n" || arg == "--limit" || arg == "--max-count") &&
        a + 1 < args.size()) {
      git->options["limit"] = args[++a];
    } else if (startsWith(arg, "--limit=")) {
      git->options["limit"] = arg.substr(8);
    } else if (startsWith(arg, "--max-count=")) {
      git->options["limit"] = arg.substr(12);
    } else if (startsWith(arg, "-n") && isNumber(arg.substr(2))) {
      git->options["limit"] = arg.substr(2);
    } else if (startsWith(arg, "-") && isNumber(arg.substr(1))) {
      git->options["limit"] = arg.substr(1);
    }
  }
}

void parseCommit(const vector<string>& args, GitOperationPayload* git) {
  for (size_t a = 0; a < args.size(); a++) {
    const string& arg = args[a];
    if (arg == "-a" || arg == "--all") {
      git->options["add_all"] = "true";
    } else if ((arg == "-m" || arg == "--message" || arg == "-am") &&
               a + 1 < args.size()) {
      if (arg == "-am") {
        git->options["add_all"] = "true";
      }
      git->options["message"] = args[++a];
    } else if (startsWith(arg, "--message=")) {
      git->options["message"] = arg.substr(10);
    } else if (startsWith(arg, "-m") && arg.size() > 2) {
      git->options["message"] = arg.substr(2);
    }
  }
}
}  // namespace

vector<string> CommandParser::tokenize(const string& text) {
  vector<string> tokens;
  string current;
  bool inToken = false;
  char quote = 0;
  for (size_t a = 0; a < text.size(); a++) {
    char c = text[a];
    if (quote) {
      if (c == quote) {
        quote = 0;
      } else if (c == '\\' && quote == '"' && a + 1 < text.size() &&
                 (text[a + 1] == '"' || text[a + 1] == '\\')) {
        current += text[++a];
      } else {
        current += c;
      }
    } else if (c == '\'' || c == '"') {
      quote = c;
      inToken = true;
    } else if (c == '\\' && a + 1 < text.size()) {
      current += text[++a];
      inToken = true;
    } else if (isspace((unsigned char)c)) {
      if (inToken) {
        tokens.push_back(current);
        current.clear();
        inToken = false;
      }
    } else {
      current += c;
      inToken = true;
    }
  }
  if (quote) {
    throw std::runtime_error("Unterminated quote in command");
  }
  if (inToken) {
    tokens.push_back(current);
  }
  return tokens;
}

optional<GitOperationPayload> CommandParser::parseGit(
    const vector<string>& tokens) {
  if (tokens.size() < 2 || tokens[0] != "git") {
    return nullopt;
  }
  GitOperationPayload git;
  git.operation = tokens[1];
  vector<string> args(tokens.begin() + 2, tokens.end());
  if (git.operation == "diff") {
    parseDiff(args, &git);
  } else if (git.operation == "log") {
    parseLog(args, &git);
  } else if (git.operation == "commit") {
    parseCommit(args, &git);
  }
  // Other operations carry no options; the server decides whether they are
  // supported.
  return git;
}

optional<Message> CommandParser::parse(const string& text,
                                       const CommandOptions& options) {
  string command = trim(text);
  if (command.empty()) {
    return nullopt;
  }

  optional<GitOperationPayload> git;
  if (startsWith(command, "git ")) {
    try {
      git = parseGit(tokenize(command));
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Cannot parse git command: " << re.what();
      return nullopt;
    }
  }

  Message request;
  if (git) {
    request = Message::create(*git);
  } else {
    AssistantExecutePayload execute;
    execute.command = command;
    execute.mode = options.mode;
    execute.timeoutSeconds = options.timeoutSeconds;
    request = Message::create(execute);
  }
  request.requestId = sole::uuid4().str();
  return request;
}
}  // namespace tether
