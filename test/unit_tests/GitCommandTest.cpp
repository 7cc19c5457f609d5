#include "CommandExecution.hpp"
#include "GitCommand.hpp"
#include "SubprocessUtils.hpp"
#include "TestHeaders.hpp"

using namespace tether;

namespace {
Message gitRequest(const string& operation,
                   const map<string, string>& options = {}) {
  GitOperationPayload payload;
  payload.operation = operation;
  payload.options = options;
  auto message = Message::create(payload);
  message.requestId = "git-1";
  return message;
}

void git(const string& repo, const vector<string>& args) {
  vector<string> argv = {"git"};
  argv.insert(argv.end(), args.begin(), args.end());
  auto result = SubprocessToString(argv, repo);
  if (result.exitCode != 0) {
    throw std::runtime_error("git " + args[0] + " failed: " + result.output);
  }
}

/**
 * @brief Sets an environment variable for the lifetime of the object.
 */
class ScopedEnv {
 public:
  ScopedEnv(const string& _name, const string& value) : name(_name) {
    const char* current = ::getenv(name.c_str());
    if (current) {
      previous = string(current);
    }
    ::setenv(name.c_str(), value.c_str(), 1);
  }

  ~ScopedEnv() {
    if (previous) {
      ::setenv(name.c_str(), previous->c_str(), 1);
    } else {
      ::unsetenv(name.c_str());
    }
  }

 protected:
  string name;
  optional<string> previous;
};

void writeFile(const string& path, const string& contents) {
  ofstream out(path);
  out << contents;
}

class TempRepo {
 public:
  TempRepo() : path(makeTempDirectory("tether_git")) {
    git(path, {"init", "-q"});
    git(path, {"config", "user.name", "Tether Test"});
    git(path, {"config", "user.email", "tether@example.com"});
    git(path, {"config", "commit.gpgsign", "false"});
    writeFile(path + "/README", "hello\n");
    git(path, {"add", "README"});
    git(path, {"commit", "-q", "-m", "Initial commit"});
  }

  ~TempRepo() { fs::remove_all(path); }

  Message run(const Message& request) {
    ExecutionConfig config;
    auto command = GitCommand::create(request, config);
    mutex resultMutex;
    vector<Message> messages;
    auto execution = make_shared<CommandExecution>(
        command, path,
        [&](const Message& message) {
          lock_guard<mutex> guard(resultMutex);
          messages.push_back(message);
        },
        chrono::milliseconds(200), chrono::milliseconds(250));
    execution->start(nullptr);
    if (!execution->waitFor(chrono::seconds(30))) {
      throw std::runtime_error("git did not finish");
    }
    lock_guard<mutex> guard(resultMutex);
    if (messages.size() != 1) {
      throw std::runtime_error("Expected one git response, got " +
                               to_string(messages.size()));
    }
    return messages[0];
  }

  string path;
};
}  // namespace

TEST_CASE("Git operations map to fixed argument lists", "[GitCommand]") {
  ExecutionConfig config;

  SECTION("status") {
    auto command = GitCommand::create(gitRequest("status"), config);
    REQUIRE(command->getSteps() ==
            vector<vector<string>>{{"git", "status", "--porcelain"}});
    REQUIRE_FALSE(command->streamsOutput());
    REQUIRE(command->getTimeout().count() == config.gitTimeoutSeconds);
    REQUIRE(command->getEnvironment() ==
            map<string, string>{{"LANGUAGE", ""}, {"LC_ALL", "C"}});
  }

  SECTION("diff with options") {
    auto command = GitCommand::create(
        gitRequest("diff", {{"staged", "true"}, {"file", "src/a b.cpp"}}),
        config);
    REQUIRE(command->getSteps() ==
            vector<vector<string>>{
                {"git", "diff", "--staged", "--", "src/a b.cpp"}});
  }

  SECTION("log limits") {
    REQUIRE(GitCommand::create(gitRequest("log"), config)->getSteps() ==
            vector<vector<string>>{{"git", "log", "--oneline", "-n", "10"}});
    REQUIRE(GitCommand::create(gitRequest("log", {{"limit", "3"}}), config)
                ->getSteps() ==
            vector<vector<string>>{{"git", "log", "--oneline", "-n", "3"}});
  }

  SECTION("branch") {
    REQUIRE(GitCommand::create(gitRequest("branch"), config)->getSteps() ==
            vector<vector<string>>{{"git", "branch", "-v"}});
  }

  SECTION("commit with add_all stages first") {
    auto command = GitCommand::create(
        gitRequest("commit", {{"message", "Fix it"}, {"add_all", "true"}}),
        config);
    REQUIRE(command->getSteps() ==
            vector<vector<string>>{{"git", "add", "."},
                                   {"git", "commit", "-m", "Fix it"}});
  }
}

TEST_CASE("Bad git requests are rejected", "[GitCommand]") {
  ExecutionConfig config;
  try {
    GitCommand::create(gitRequest("push"), config);
    FAIL("push was accepted");
  } catch (const CommandRejected& cr) {
    REQUIRE(string(cr.what()) == "Unsupported git operation: push");
  }
  REQUIRE_THROWS_AS(GitCommand::create(gitRequest("commit"), config),
                    CommandRejected);
  REQUIRE_THROWS_AS(
      GitCommand::create(gitRequest("commit", {{"message", "  "}}), config),
      CommandRejected);
  for (string limit : {"0", "-1", "abc", "1001", "99999"}) {
    REQUIRE_THROWS_AS(
        GitCommand::create(gitRequest("log", {{"limit", limit}}), config),
        CommandRejected);
  }

  auto rejection = GitCommand::makeRejection(gitRequest("push"),
                                             "Unsupported git operation: push");
  REQUIRE(rejection.getType() == MessageType::GIT_RESPONSE);
  REQUIRE(rejection.status == ResponseStatus::ERROR);
  REQUIRE(rejection.requestId == optional<string>("git-1"));
  auto payload = rejection.get<GitResponsePayload>();
  REQUIRE(payload->operation == "push");
  REQUIRE_FALSE(payload->success);
}

TEST_CASE("Git operations run in the working directory", "[GitCommand]") {
  TempRepo repo;

  SECTION("A clean tree has nothing to commit") {
    auto response =
        repo.run(gitRequest("commit", {{"message", "Nothing here"}}));
    REQUIRE(response.status == ResponseStatus::SUCCESS);
    REQUIRE(response.requestId == optional<string>("git-1"));
    auto payload = response.get<GitResponsePayload>();
    REQUIRE(payload->success);
    REQUIRE(payload->operation == "commit");
    REQUIRE(payload->data == "No changes to commit");
  }

  SECTION("The clean tree check ignores the server locale") {
    ScopedEnv language("LANGUAGE", "de:fr");
    ScopedEnv locale("LC_ALL", "de_DE.UTF-8");
    auto response =
        repo.run(gitRequest("commit", {{"message", "Nothing here"}}));
    REQUIRE(response.status == ResponseStatus::SUCCESS);
    REQUIRE(response.get<GitResponsePayload>()->data ==
            "No changes to commit");
  }

  SECTION("Status reports modified files") {
    writeFile(repo.path + "/README", "changed\n");
    auto response = repo.run(gitRequest("status"));
    auto payload = response.get<GitResponsePayload>();
    REQUIRE(payload->success);
    REQUIRE_THAT(payload->data, Catch::Matchers::ContainsSubstring("README"));
  }

  SECTION("Commit with add_all records new files") {
    writeFile(repo.path + "/NEW", "new\n");
    auto response = repo.run(gitRequest(
        "commit", {{"message", "Add NEW"}, {"add_all", "true"}}));
    REQUIRE(response.get<GitResponsePayload>()->success);

    auto log = repo.run(gitRequest("log", {{"limit", "1"}}));
    REQUIRE_THAT(log.get<GitResponsePayload>()->data,
                 Catch::Matchers::ContainsSubstring("Add NEW"));
  }

  SECTION("Failures carry the git output") {
    auto response = repo.run(gitRequest("diff", {{"file", "../../outside"}}));
    auto payload = response.get<GitResponsePayload>();
    REQUIRE_FALSE(payload->success);
    REQUIRE(response.status == ResponseStatus::ERROR);
    REQUIRE_THAT(payload->data,
                 Catch::Matchers::StartsWith("Failed to execute git diff"));
  }
}
