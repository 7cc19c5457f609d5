#ifndef __TETHER_GIT_COMMAND__
#define __TETHER_GIT_COMMAND__

#include "Headers.hpp"
#include "RelayCommand.hpp"
#include "ServerConfig.hpp"

namespace tether {
/**
 * @brief Runs a `git_operation` request in the configured working directory.
 * Output is collected (stdout and stderr combined) and returned in a single
 * `git_response`.
 */
class GitCommand : public RelayCommand {
 public:
  static const int DEFAULT_LOG_LIMIT = 10;
  static const int MAX_LOG_LIMIT = 1000;

  /**
   * @throws CommandRejected for unsupported operations or bad options.
   */
  static shared_ptr<GitCommand> create(const Message& request,
                                       const ExecutionConfig& config);

  static Message makeRejection(const Message& request, const string& reason);

  vector<vector<string>> getSteps() const override { return steps; }

  /**
   * @brief Untranslated messages, so "nothing to commit" can be matched.
   */
  map<string, string> getEnvironment() const override {
    return {{"LC_ALL", "C"}, {"LANGUAGE", ""}};
  }

  bool streamsOutput() const override { return false; }

  Message makeResult(const ExecutionResult& result) const override;

  Message makeTimeout() const override;

  string describe() const override { return "git[" + operation + "]"; }

 protected:
  GitCommand(const optional<string>& _requestId, chrono::seconds _timeout,
             const string& _operation, const vector<vector<string>>& _steps)
      : RelayCommand(_requestId, _timeout),
        operation(_operation),
        steps(_steps) {}

  Message response(const string& data, bool success) const;

  string operation;
  vector<vector<string>> steps;
};
}  // namespace tether

#endif  // __TETHER_GIT_COMMAND__
