#ifndef __TETHER_SERVER_CONFIG__
#define __TETHER_SERVER_CONFIG__

#include "Headers.hpp"

namespace tether {
enum class AuthMode { TOKEN, OPEN };

/**
 * @brief Limits and routing for relayed commands.
 */
struct ExecutionConfig {
  // First word that selects direct execution of the assistant CLI.
  string assistantBinary = "claude";
  // Empty means the server's own working directory.
  string workingDirectory;
  int defaultTimeoutSeconds = 300;
  int maxTimeoutSeconds = 1800;
  int gitTimeoutSeconds = 60;
  int killGraceMillis = 2000;
  // A held-back output chunk is released after this much silence.
  int outputIdleFlushMillis = 250;
  vector<string> shellPrefixes = {"ls", "pwd", "cat", "echo", "git"};
};

struct RelayServerConfig {
  string bindIp = "0.0.0.0";
  int port = DEFAULT_RELAY_PORT;
  // Host written into the pairing URI. Empty means autodetect.
  string publicHost;
  string token;
  AuthMode authMode = AuthMode::TOKEN;
  int authDeadlineSeconds = SERVER_AUTH_DEADLINE_SECONDS;
  int maxMalformedFrames = 5;
  int ioThreads = 2;
  ExecutionConfig execution;
};

/**
 * @brief Settings from the [Debug] section, consumed by the log setup.
 */
struct DebugConfig {
  optional<int> verbose;
  bool silent = false;
  string maxLogSize = "20971520";
};

/**
 * @brief Overlays an ini file on `config`. Keys that are absent leave the
 * current value untouched.
 * @throws std::runtime_error if the file cannot be read or a value is
 * invalid.
 */
void loadServerConfigFile(const string& path, RelayServerConfig* config,
                          DebugConfig* debugConfig);

/**
 * @brief Rejects configurations the server cannot run with.
 * @throws std::runtime_error describing the first problem found.
 */
void validateServerConfig(const RelayServerConfig& config);

string authModeName(AuthMode mode);
AuthMode parseAuthMode(const string& name);
}  // namespace tether

#endif  // __TETHER_SERVER_CONFIG__
