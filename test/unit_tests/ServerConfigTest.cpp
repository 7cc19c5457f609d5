#include "ServerConfig.hpp"
#include "TestHeaders.hpp"

using namespace tether;

namespace {
string writeConfig(const string& directory, const string& contents) {
  string path = directory + "/tetherserver.cfg";
  ofstream out(path);
  out << contents;
  return path;
}
}  // namespace

TEST_CASE("Config files overlay the defaults", "[ServerConfig]") {
  string directory = makeTempDirectory("tether_config");
  string path = writeConfig(directory,
                            "; relay settings\n"
                            "[Networking]\n"
                            "port = 9100\n"
                            "bind_ip = 127.0.0.1\n"
                            "public_host = relay.local\n"
                            "\n"
                            "[Auth]\n"
                            "token = from-file\n"
                            "mode = Open\n"
                            "\n"
                            "[Execution]\n"
                            "assistant = my-assistant\n"
                            "workdir = " +
                                directory +
                                "\n"
                                "default_timeout = 120\n"
                                "shell_prefixes = ls, make ,,npm\n"
                                "\n"
                                "[Debug]\n"
                                "verbose = 3\n"
                                "silent = 1\n");

  RelayServerConfig config;
  DebugConfig debug;
  loadServerConfigFile(path, &config, &debug);

  REQUIRE(config.port == 9100);
  REQUIRE(config.bindIp == "127.0.0.1");
  REQUIRE(config.publicHost == "relay.local");
  REQUIRE(config.token == "from-file");
  REQUIRE(config.authMode == AuthMode::OPEN);
  REQUIRE(config.execution.assistantBinary == "my-assistant");
  REQUIRE(config.execution.workingDirectory == directory);
  REQUIRE(config.execution.defaultTimeoutSeconds == 120);
  REQUIRE(config.execution.shellPrefixes ==
          vector<string>{"ls", "make", "npm"});
  REQUIRE(debug.verbose == optional<int>(3));
  REQUIRE(debug.silent);

  // Untouched keys keep their defaults.
  REQUIRE(config.ioThreads == 2);
  REQUIRE(config.execution.maxTimeoutSeconds == 1800);
  REQUIRE(config.authDeadlineSeconds == SERVER_AUTH_DEADLINE_SECONDS);
  REQUIRE_NOTHROW(validateServerConfig(config));

  fs::remove_all(directory);
}

TEST_CASE("Bad config files are rejected", "[ServerConfig]") {
  string directory = makeTempDirectory("tether_config");
  RelayServerConfig config;
  DebugConfig debug;

  REQUIRE_THROWS_AS(
      loadServerConfigFile(directory + "/missing.cfg", &config, &debug),
      std::runtime_error);
  REQUIRE_THROWS_AS(
      loadServerConfigFile(
          writeConfig(directory, "[Networking]\nport = 80x\n"), &config,
          &debug),
      std::runtime_error);
  REQUIRE_THROWS_AS(
      loadServerConfigFile(writeConfig(directory, "[Auth]\nmode = magic\n"),
                           &config, &debug),
      std::runtime_error);

  fs::remove_all(directory);
}

TEST_CASE("Validation catches unusable settings", "[ServerConfig]") {
  RelayServerConfig config;
  config.token = "abc";
  REQUIRE_NOTHROW(validateServerConfig(config));

  SECTION("Token mode needs a token") {
    config.token.clear();
    REQUIRE_THROWS_AS(validateServerConfig(config), std::runtime_error);
    config.authMode = AuthMode::OPEN;
    REQUIRE_NOTHROW(validateServerConfig(config));
  }

  SECTION("Port range") {
    config.port = 70000;
    REQUIRE_THROWS_AS(validateServerConfig(config), std::runtime_error);
    config.port = 0;
    REQUIRE_NOTHROW(validateServerConfig(config));
  }

  SECTION("Timeouts") {
    config.execution.defaultTimeoutSeconds = 4000;
    REQUIRE_THROWS_AS(validateServerConfig(config), std::runtime_error);
  }

  SECTION("Working directory must exist") {
    config.execution.workingDirectory = "/nonexistent/tether/workdir";
    REQUIRE_THROWS_AS(validateServerConfig(config), std::runtime_error);
  }
}

TEST_CASE("Auth mode names", "[ServerConfig]") {
  REQUIRE(parseAuthMode(" TOKEN ") == AuthMode::TOKEN);
  REQUIRE(parseAuthMode("open") == AuthMode::OPEN);
  REQUIRE(authModeName(AuthMode::OPEN) == "open");
  REQUIRE_THROWS_AS(parseAuthMode(""), std::runtime_error);
}
