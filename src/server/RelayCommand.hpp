#ifndef __TETHER_RELAY_COMMAND__
#define __TETHER_RELAY_COMMAND__

#include "Headers.hpp"
#include "Message.hpp"

namespace tether {
/**
 * @brief Thrown while building a command from a request that cannot run.
 * The message is sent back to the client.
 */
class CommandRejected : public std::runtime_error {
 public:
  explicit CommandRejected(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief What happened to the processes of one command.
 */
struct ExecutionResult {
  // Exit status of the last process that ran.
  int exitCode = -1;
  // Index into getSteps() of the last process that ran.
  int stepIndex = 0;
  // Combined output of the last step, or the final held-back chunk for
  // streaming commands.
  string output;
  // Tail of stderr, streaming commands only.
  string errorOutput;
  // Set when a process could not be started.
  string startError;
};

/**
 * @brief A relayed request turned into one or more processes plus the
 * messages that report on them.
 */
class RelayCommand {
 public:
  RelayCommand(const optional<string>& _requestId, chrono::seconds _timeout)
      : requestId(_requestId), timeout(_timeout) {}

  virtual ~RelayCommand() {}

  /**
   * @brief Processes to run in order. A non-zero exit stops the chain.
   */
  virtual vector<vector<string>> getSteps() const = 0;

  /**
   * @brief Variables set on top of the server's environment for each step.
   */
  virtual map<string, string> getEnvironment() const { return {}; }

  /**
   * @brief True if output is forwarded while the command runs.
   */
  virtual bool streamsOutput() const = 0;

  virtual Message makeChunk(const string& chunk) const;

  virtual Message makeResult(const ExecutionResult& result) const = 0;

  virtual Message makeTimeout() const = 0;

  virtual string describe() const = 0;

  const optional<string>& getRequestId() const { return requestId; }

  chrono::seconds getTimeout() const { return timeout; }

 protected:
  Message reply(Payload payload,
                ResponseStatus status = ResponseStatus::NONE) const;

  optional<string> requestId;
  chrono::seconds timeout;
};
}  // namespace tether

#endif  // __TETHER_RELAY_COMMAND__
