#ifndef __TETHER_ASSISTANT_COMMAND__
#define __TETHER_ASSISTANT_COMMAND__

#include "Headers.hpp"
#include "RelayCommand.hpp"
#include "ServerConfig.hpp"

namespace tether {
/**
 * @brief Runs an `assistant_execute` request.
 *
 * Routing of the command text:
 *  - first word is the assistant binary: run it directly with the remaining
 *    words as arguments
 *  - first word is a configured shell prefix or an absolute path: run the
 *    whole text with `/bin/sh -c`
 *  - anything else is a prompt: `<assistant> -p <text>`, or
 *    `<assistant> --continue -p <text>` in `continue` mode
 */
class AssistantCommand : public RelayCommand {
 public:
  /**
   * @throws CommandRejected for empty commands and unknown modes.
   */
  static shared_ptr<AssistantCommand> create(const Message& request,
                                             const ExecutionConfig& config);

  /**
   * @brief Honours a requested timeout inside 1..max, else the default.
   */
  static chrono::seconds resolveTimeout(const optional<int>& requested,
                                        const ExecutionConfig& config);

  static Message makeRejection(const Message& request, const string& reason);

  vector<vector<string>> getSteps() const override { return {argv}; }

  bool streamsOutput() const override { return true; }

  Message makeChunk(const string& chunk) const override;

  Message makeResult(const ExecutionResult& result) const override;

  Message makeTimeout() const override;

  string describe() const override;

 protected:
  AssistantCommand(const optional<string>& _requestId,
                   chrono::seconds _timeout, const vector<string>& _argv)
      : RelayCommand(_requestId, _timeout), argv(_argv) {}

  vector<string> argv;
};
}  // namespace tether

#endif  // __TETHER_ASSISTANT_COMMAND__
