#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace tether {
namespace {
int parseInt(const char* section, const char* key, const char* value) {
  try {
    size_t consumed = 0;
    int result = stoi(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return result;
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid integer for [") + section +
                             "] " + key + ": " + value);
  }
}

void readInt(const CSimpleIniA& ini, const char* section, const char* key,
             int* target) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value) {
    *target = parseInt(section, key, value);
  }
}

void readString(const CSimpleIniA& ini, const char* section, const char* key,
                string* target) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value) {
    *target = string(value);
  }
}
}  // namespace

string authModeName(AuthMode mode) {
  return mode == AuthMode::OPEN ? "open" : "token";
}

AuthMode parseAuthMode(const string& name) {
  string lowered = toLower(trim(name));
  if (lowered == "token") {
    return AuthMode::TOKEN;
  }
  if (lowered == "open") {
    return AuthMode::OPEN;
  }
  throw std::runtime_error("Unknown auth mode: " + name);
}

void loadServerConfigFile(const string& path, RelayServerConfig* config,
                          DebugConfig* debugConfig) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  readInt(ini, "Networking", "port", &config->port);
  readString(ini, "Networking", "bind_ip", &config->bindIp);
  readString(ini, "Networking", "public_host", &config->publicHost);
  readInt(ini, "Networking", "io_threads", &config->ioThreads);

  readString(ini, "Auth", "token", &config->token);
  const char* mode = ini.GetValue("Auth", "mode", NULL);
  if (mode) {
    config->authMode = parseAuthMode(mode);
  }
  readInt(ini, "Auth", "deadline", &config->authDeadlineSeconds);
  readInt(ini, "Auth", "max_malformed_frames", &config->maxMalformedFrames);

  ExecutionConfig& execution = config->execution;
  readString(ini, "Execution", "assistant", &execution.assistantBinary);
  readString(ini, "Execution", "workdir", &execution.workingDirectory);
  readInt(ini, "Execution", "default_timeout",
          &execution.defaultTimeoutSeconds);
  readInt(ini, "Execution", "max_timeout", &execution.maxTimeoutSeconds);
  readInt(ini, "Execution", "git_timeout", &execution.gitTimeoutSeconds);
  readInt(ini, "Execution", "kill_grace_ms", &execution.killGraceMillis);
  const char* prefixes = ini.GetValue("Execution", "shell_prefixes", NULL);
  if (prefixes) {
    execution.shellPrefixes.clear();
    for (const auto& prefix : split(prefixes, ',')) {
      string trimmed = trim(prefix);
      if (!trimmed.empty()) {
        execution.shellPrefixes.push_back(trimmed);
      }
    }
  }

  if (debugConfig) {
    const char* verbose = ini.GetValue("Debug", "verbose", NULL);
    if (verbose) {
      debugConfig->verbose = parseInt("Debug", "verbose", verbose);
    }
    const char* silent = ini.GetValue("Debug", "silent", NULL);
    if (silent && atoi(silent) != 0) {
      debugConfig->silent = true;
    }
    const char* logsize = ini.GetValue("Debug", "logsize", NULL);
    if (logsize && atoi(logsize) != 0) {
      debugConfig->maxLogSize = string(logsize);
    }
  }
}

void validateServerConfig(const RelayServerConfig& config) {
  if (config.port < 0 || config.port > 65535) {
    throw std::runtime_error("Port out of range: " + to_string(config.port));
  }
  if (config.authMode == AuthMode::TOKEN && config.token.empty()) {
    throw std::runtime_error("Token auth requires a non-empty token");
  }
  if (config.ioThreads < 1) {
    throw std::runtime_error("io_threads must be at least 1");
  }
  const ExecutionConfig& execution = config.execution;
  if (execution.maxTimeoutSeconds < 1) {
    throw std::runtime_error("max_timeout must be positive");
  }
  if (execution.defaultTimeoutSeconds < 1 ||
      execution.defaultTimeoutSeconds > execution.maxTimeoutSeconds) {
    throw std::runtime_error("default_timeout must be within 1.." +
                             to_string(execution.maxTimeoutSeconds));
  }
  if (execution.gitTimeoutSeconds < 1) {
    throw std::runtime_error("git_timeout must be positive");
  }
  if (execution.assistantBinary.empty()) {
    throw std::runtime_error("assistant binary must not be empty");
  }
  if (!execution.workingDirectory.empty() &&
      !fs::is_directory(execution.workingDirectory)) {
    throw std::runtime_error("workdir is not a directory: " +
                             execution.workingDirectory);
  }
}
}  // namespace tether
