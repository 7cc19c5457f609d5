#ifndef __TETHER_COMMAND_PARSER__
#define __TETHER_COMMAND_PARSER__

#include "Headers.hpp"
#include "Message.hpp"

namespace tether {
/**
 * @brief Per-request settings forwarded with assistant commands.
 */
struct CommandOptions {
  string mode;
  optional<int> timeoutSeconds;
};

/**
 * @brief Turns a line typed by the user into a request message.
 *
 * `git <operation> ...` becomes a git_operation with its flags mapped to
 * options; anything else is sent verbatim as an assistant_execute.
 */
class CommandParser {
 public:
  /**
   * @brief Splits on whitespace, honouring single quotes, double quotes and
   * backslash escapes.
   * @throws std::runtime_error on an unterminated quote.
   */
  static vector<string> tokenize(const string& text);

  /**
   * @return The request with a fresh request id, or nullopt for blank text
   * or text that cannot be tokenized.
   */
  static optional<Message> parse(const string& text,
                                 const CommandOptions& options);

  /**
   * @return nullopt unless `tokens` is `git <operation> ...`.
   */
  static optional<GitOperationPayload> parseGit(const vector<string>& tokens);
};
}  // namespace tether

#endif  // __TETHER_COMMAND_PARSER__
