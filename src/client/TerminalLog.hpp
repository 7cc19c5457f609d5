#ifndef __TETHER_TERMINAL_LOG__
#define __TETHER_TERMINAL_LOG__

#include "Headers.hpp"

namespace tether {
enum class TerminalLineKind { COMMAND, OUTPUT, ERROR, SYSTEM };

string terminalLineKindName(TerminalLineKind kind);

struct TerminalLine {
  int64_t id = 0;
  string text;
  TerminalLineKind kind = TerminalLineKind::SYSTEM;
  int64_t timestampMs = 0;
};

/**
 * @brief Bounded, thread-safe history of what the session showed the user.
 * The oldest lines are dropped once `capacity` is reached.
 */
class TerminalLog {
 public:
  explicit TerminalLog(size_t _capacity = 1000)
      : capacity(_capacity), nextId(1) {}

  TerminalLine append(TerminalLineKind kind, const string& text);

  vector<TerminalLine> getLines();

  size_t size();

  void clear();

 protected:
  mutex classMutex;
  size_t capacity;
  int64_t nextId;
  deque<TerminalLine> lines;
};
}  // namespace tether

#endif  // __TETHER_TERMINAL_LOG__
