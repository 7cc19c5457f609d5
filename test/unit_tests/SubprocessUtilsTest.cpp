#include "SubprocessUtils.hpp"
#include "TestHeaders.hpp"

using namespace tether;

TEST_CASE("SubprocessToString captures stdout and the exit code",
          "[SubprocessUtils]") {
  auto result = SubprocessToString({"printf", "test123"});
  REQUIRE(result.exitCode == 0);
  REQUIRE(result.output == "test123");
}

TEST_CASE("SubprocessToString merges stderr", "[SubprocessUtils]") {
  auto result =
      SubprocessToString({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});
  REQUIRE(result.exitCode == 3);
  REQUIRE(result.output.find("out") != string::npos);
  REQUIRE(result.output.find("err") != string::npos);
}

TEST_CASE("SubprocessToString runs in the working directory",
          "[SubprocessUtils]") {
  string directory = makeTempDirectory("tether_subprocess");
  auto result = SubprocessToString({"pwd"}, directory);
  REQUIRE(result.exitCode == 0);
  REQUIRE(fs::equivalent(trim(result.output), directory));
  fs::remove_all(directory);
}

TEST_CASE("Environment overrides apply on top of the inherited environment",
          "[SubprocessUtils]") {
  ::setenv("TETHER_TEST_INHERITED", "parent", 1);
  ::setenv("TETHER_TEST_REPLACED", "parent", 1);
  vector<string> argv = {"/bin/sh", "-c",
                         "printf '%s|%s|%s' \"$TETHER_TEST_INHERITED\" "
                         "\"$TETHER_TEST_REPLACED\" \"$TETHER_TEST_ADDED\""};

  auto overridden = SubprocessToString(
      argv, "",
      {{"TETHER_TEST_REPLACED", "child"}, {"TETHER_TEST_ADDED", "new"}});
  REQUIRE(overridden.exitCode == 0);
  REQUIRE(overridden.output == "parent|child|new");

  auto plain = SubprocessToString(argv);
  REQUIRE(plain.output == "parent|parent|");

  ::unsetenv("TETHER_TEST_INHERITED");
  ::unsetenv("TETHER_TEST_REPLACED");
}

TEST_CASE("Spawning a missing program throws", "[SubprocessUtils]") {
  REQUIRE_THROWS_AS(ChildProcess::spawn({"/nonexistent/tether-binary"}),
                    std::runtime_error);
  REQUIRE_THROWS_AS(ChildProcess::spawn({}), std::runtime_error);
}

TEST_CASE("Spawning in a missing directory throws", "[SubprocessUtils]") {
  REQUIRE_THROWS_AS(ChildProcess::spawn({"true"}, "/nonexistent/directory"),
                    std::runtime_error);
}

TEST_CASE("Signalled children report 128 plus the signal",
          "[SubprocessUtils]") {
  auto result = SubprocessToString({"/bin/sh", "-c", "kill -9 $$"});
  REQUIRE(result.exitCode == 128 + SIGKILL);
}

TEST_CASE("Terminate kills the whole process group", "[SubprocessUtils]") {
  auto child = ChildProcess::spawn(
      {"/bin/sh", "-c", "sleep 30 & echo $!; wait"});
  string line;
  REQUIRE(waitUntil(
      [&]() {
        char buf[64];
        ssize_t n = ::read(child->getStdoutFd(), buf, sizeof(buf));
        if (n > 0) line.append(buf, n);
        return line.find('\n') != string::npos;
      },
      chrono::seconds(5)));
  pid_t grandchild = stoi(trim(line));
  REQUIRE(processExists(grandchild));

  auto start = chrono::steady_clock::now();
  child->terminate(chrono::milliseconds(500));
  REQUIRE_FALSE(processExists(child->getPid()));
  REQUIRE(chrono::steady_clock::now() - start < chrono::seconds(3));
  REQUIRE(waitUntil([grandchild]() { return !processExists(grandchild); },
                    chrono::seconds(2)));
}

TEST_CASE("Destroying a running child reaps it", "[SubprocessUtils]") {
  pid_t pid;
  {
    auto child = ChildProcess::spawn({"sleep", "30"});
    pid = child->getPid();
    REQUIRE(processExists(pid));
    REQUIRE(!child->hasLeaderExited());
  }
  REQUIRE(!processExists(pid));
}
