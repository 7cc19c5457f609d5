#include "AssistantCommand.hpp"
#include "CommandExecution.hpp"
#include "TestHeaders.hpp"

using namespace tether;

namespace {
Message assistantRequest(const string& command, const string& mode = "",
                         optional<int> timeoutSeconds = nullopt) {
  AssistantExecutePayload payload;
  payload.command = command;
  payload.mode = mode;
  payload.timeoutSeconds = timeoutSeconds;
  auto message = Message::create(payload);
  message.requestId = "req-1";
  return message;
}

ExecutionConfig testConfig() {
  ExecutionConfig config;
  config.shellPrefixes = {"echo", "printf", "sleep", "exit", "pwd"};
  config.killGraceMillis = 200;
  return config;
}

class CollectingSink {
 public:
  MessageSink sink() {
    return [this](const Message& message) {
      lock_guard<mutex> guard(sinkMutex);
      messages.push_back(message);
    };
  }

  vector<Message> get() {
    lock_guard<mutex> guard(sinkMutex);
    return messages;
  }

 protected:
  mutex sinkMutex;
  vector<Message> messages;
};

shared_ptr<CommandExecution> startExecution(
    const string& command, CollectingSink* collector,
    optional<int> timeoutSeconds = nullopt,
    chrono::milliseconds idleFlush = chrono::milliseconds(5000)) {
  auto config = testConfig();
  auto relayCommand =
      AssistantCommand::create(assistantRequest(command, "", timeoutSeconds),
                               config);
  auto execution = make_shared<CommandExecution>(
      relayCommand, GetTempDirectory(), collector->sink(),
      chrono::milliseconds(config.killGraceMillis), idleFlush);
  execution->start(nullptr);
  return execution;
}
}  // namespace

TEST_CASE("Assistant commands are routed by their first word",
          "[AssistantCommand]") {
  auto config = testConfig();

  SECTION("Shell prefixes run through /bin/sh") {
    auto command =
        AssistantCommand::create(assistantRequest("  echo hi  "), config);
    REQUIRE(command->getSteps() ==
            vector<vector<string>>{{"/bin/sh", "-c", "echo hi"}});
    REQUIRE(command->streamsOutput());
  }

  SECTION("Absolute paths run through /bin/sh") {
    auto command =
        AssistantCommand::create(assistantRequest("/usr/bin/env"), config);
    REQUIRE(command->getSteps() ==
            vector<vector<string>>{{"/bin/sh", "-c", "/usr/bin/env"}});
  }

  SECTION("The assistant binary runs directly") {
    auto command = AssistantCommand::create(
        assistantRequest("claude --version"), config);
    REQUIRE(command->getSteps() ==
            vector<vector<string>>{{"claude", "--version"}});
  }

  SECTION("Anything else is a prompt") {
    auto command = AssistantCommand::create(
        assistantRequest("explain the build"), config);
    REQUIRE(command->getSteps() ==
            vector<vector<string>>{{"claude", "-p", "explain the build"}});
  }

  SECTION("Continue mode resumes the conversation") {
    auto command = AssistantCommand::create(
        assistantRequest("and now the tests", "continue"), config);
    REQUIRE(command->getSteps() ==
            vector<vector<string>>{
                {"claude", "--continue", "-p", "and now the tests"}});
  }

  SECTION("The request id is carried") {
    auto command = AssistantCommand::create(assistantRequest("pwd"), config);
    REQUIRE(command->getRequestId() == optional<string>("req-1"));
  }
}

TEST_CASE("Bad assistant requests are rejected", "[AssistantCommand]") {
  auto config = testConfig();
  REQUIRE_THROWS_AS(AssistantCommand::create(assistantRequest("   "), config),
                    CommandRejected);
  REQUIRE_THROWS_AS(
      AssistantCommand::create(assistantRequest("echo hi", "turbo"), config),
      CommandRejected);

  auto rejection =
      AssistantCommand::makeRejection(assistantRequest(""), "Empty command");
  REQUIRE(rejection.getType() == MessageType::ASSISTANT_ERROR);
  REQUIRE(rejection.status == ResponseStatus::ERROR);
  REQUIRE(rejection.requestId == optional<string>("req-1"));
  REQUIRE(rejection.get<AssistantErrorPayload>()->error == "Empty command");
}

TEST_CASE("Requested timeouts are clamped", "[AssistantCommand]") {
  ExecutionConfig config;
  config.defaultTimeoutSeconds = 300;
  config.maxTimeoutSeconds = 1800;
  REQUIRE(AssistantCommand::resolveTimeout(nullopt, config).count() == 300);
  REQUIRE(AssistantCommand::resolveTimeout(60, config).count() == 60);
  REQUIRE(AssistantCommand::resolveTimeout(1800, config).count() == 1800);
  REQUIRE(AssistantCommand::resolveTimeout(1801, config).count() == 300);
  REQUIRE(AssistantCommand::resolveTimeout(0, config).count() == 300);
  REQUIRE(AssistantCommand::resolveTimeout(-5, config).count() == 300);
}

TEST_CASE("A short command produces one completed message",
          "[CommandExecution]") {
  CollectingSink collector;
  auto execution = startExecution("echo hi", &collector);
  REQUIRE(execution->waitFor(chrono::seconds(10)));
  REQUIRE(execution->getStatus() == ExecutionStatus::COMPLETED);

  auto messages = collector.get();
  REQUIRE(messages.size() == 1);
  REQUIRE(messages[0].getType() == MessageType::ASSISTANT_OUTPUT);
  REQUIRE(messages[0].status == ResponseStatus::SUCCESS);
  REQUIRE(messages[0].requestId == optional<string>("req-1"));
  auto payload = messages[0].get<AssistantOutputPayload>();
  REQUIRE(payload->output == "hi\n");
  REQUIRE(payload->status == OutputStatus::COMPLETED);
}

TEST_CASE("Output is streamed with the last chunk held back",
          "[CommandExecution]") {
  CollectingSink collector;
  auto execution =
      startExecution("printf first; sleep 1; printf second", &collector,
                     nullopt, chrono::milliseconds(100));
  REQUIRE(execution->waitFor(chrono::seconds(10)));

  auto messages = collector.get();
  REQUIRE(messages.size() == 2);
  auto running = messages[0].get<AssistantOutputPayload>();
  REQUIRE(running != nullptr);
  REQUIRE(running->status == OutputStatus::RUNNING);
  REQUIRE(running->output == "first");
  REQUIRE(messages[0].status == ResponseStatus::NONE);

  auto completed = messages[1].get<AssistantOutputPayload>();
  REQUIRE(completed != nullptr);
  REQUIRE(completed->status == OutputStatus::COMPLETED);
  REQUIRE(completed->output == "second");
  REQUIRE(messages[1].isTerminalResponse());
}

TEST_CASE("A failing command reports its exit status", "[CommandExecution]") {
  CollectingSink collector;
  auto execution = startExecution("echo partial; exit 3", &collector);
  REQUIRE(execution->waitFor(chrono::seconds(10)));
  REQUIRE(execution->getStatus() == ExecutionStatus::FAILED);

  auto messages = collector.get();
  REQUIRE(messages.size() == 2);
  REQUIRE(messages[0].get<AssistantOutputPayload>()->output == "partial\n");
  REQUIRE(messages[1].getType() == MessageType::ASSISTANT_ERROR);
  REQUIRE_THAT(messages[1].get<AssistantErrorPayload>()->error,
               Catch::Matchers::StartsWith("Command exited with status 3"));
}

TEST_CASE("A command that cannot start fails with an error",
          "[CommandExecution]") {
  auto config = testConfig();
  config.assistantBinary = "/nonexistent/tether-assistant";
  CollectingSink collector;
  auto command = AssistantCommand::create(
      assistantRequest("summarize the repo"), config);
  auto execution = make_shared<CommandExecution>(
      command, GetTempDirectory(), collector.sink(), chrono::milliseconds(200),
      chrono::milliseconds(250));
  execution->start(nullptr);
  REQUIRE(execution->waitFor(chrono::seconds(10)));
  REQUIRE(execution->getStatus() == ExecutionStatus::FAILED);

  auto messages = collector.get();
  REQUIRE(messages.size() == 1);
  REQUIRE(messages[0].getType() == MessageType::ASSISTANT_ERROR);
  REQUIRE(messages[0].status == ResponseStatus::ERROR);
}

TEST_CASE("Commands past their timeout are killed", "[CommandExecution]") {
  CollectingSink collector;
  auto start = chrono::steady_clock::now();
  auto execution = startExecution("sleep 5", &collector, 1);
  REQUIRE(waitUntil([&]() { return execution->getPid() > 0; },
                    chrono::seconds(5)));
  pid_t pid = execution->getPid();

  REQUIRE(execution->waitFor(chrono::seconds(10)));
  REQUIRE(chrono::steady_clock::now() - start < chrono::seconds(4));
  REQUIRE(execution->getStatus() == ExecutionStatus::TIMED_OUT);
  REQUIRE_FALSE(processExists(pid));

  auto messages = collector.get();
  REQUIRE(messages.size() == 1);
  REQUIRE(messages[0].getType() == MessageType::ASSISTANT_ERROR);
  REQUIRE(messages[0].get<AssistantErrorPayload>()->error ==
          "Command timed out after 1 seconds");
}

TEST_CASE("Cancelled executions emit nothing", "[CommandExecution]") {
  CollectingSink collector;
  auto config = testConfig();
  auto command =
      AssistantCommand::create(assistantRequest("sleep 5"), config);
  auto execution = make_shared<CommandExecution>(
      command, GetTempDirectory(), collector.sink(), chrono::milliseconds(200),
      chrono::milliseconds(250));
  atomic<bool> callbackRan(false);
  execution->start(
      [&callbackRan](shared_ptr<CommandExecution>) { callbackRan = true; });
  REQUIRE(waitUntil([&]() { return execution->getPid() > 0; },
                    chrono::seconds(5)));
  pid_t pid = execution->getPid();

  execution->cancel();
  execution->cancel();
  REQUIRE(execution->waitFor(chrono::seconds(5)));
  REQUIRE(execution->getStatus() == ExecutionStatus::CANCELLED);
  REQUIRE(callbackRan);
  REQUIRE_FALSE(processExists(pid));
  REQUIRE(collector.get().empty());
}

TEST_CASE("Execution status names", "[CommandExecution]") {
  REQUIRE(executionStatusName(ExecutionStatus::RUNNING) == "running");
  REQUIRE(executionStatusName(ExecutionStatus::TIMED_OUT) == "timed_out");
  REQUIRE(executionStatusName(ExecutionStatus::CANCELLED) == "cancelled");
}

TEST_CASE("The terminal message arrives after the status is settled",
          "[CommandExecution]") {
  auto config = testConfig();
  auto command = AssistantCommand::create(assistantRequest("echo hi"), config);
  auto seenSettled = make_shared<atomic<int>>(-1);
  // Assigned before start(), read only on the supervisor thread.
  weak_ptr<CommandExecution> weakExecution;
  auto execution = make_shared<CommandExecution>(
      command, GetTempDirectory(),
      [seenSettled, &weakExecution](const Message& message) {
        auto target = weakExecution.lock();
        if (target && message.isTerminalResponse()) {
          *seenSettled = target->isSettled() ? 1 : 0;
        }
      },
      chrono::milliseconds(200), chrono::milliseconds(5000));
  weakExecution = execution;
  REQUIRE_FALSE(execution->isSettled());
  execution->start(nullptr);
  REQUIRE(execution->waitFor(chrono::seconds(10)));
  REQUIRE(*seenSettled == 1);
  REQUIRE(execution->getStatus() == ExecutionStatus::COMPLETED);
}
