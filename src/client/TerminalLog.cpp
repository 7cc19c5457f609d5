#include "TerminalLog.hpp"

namespace tether {
string terminalLineKindName(TerminalLineKind kind) {
  switch (kind) {
    case TerminalLineKind::COMMAND:
      return "command";
    case TerminalLineKind::OUTPUT:
      return "output";
    case TerminalLineKind::ERROR:
      return "error";
    case TerminalLineKind::SYSTEM:
      return "system";
  }
  return "unknown";
}

TerminalLine TerminalLog::append(TerminalLineKind kind, const string& text) {
  lock_guard<mutex> guard(classMutex);
  TerminalLine line;
  line.id = nextId++;
  line.text = text;
  line.kind = kind;
  line.timestampMs = currentTimeMillis();
  lines.push_back(line);
  while (lines.size() > capacity) {
    lines.pop_front();
  }
  return line;
}

vector<TerminalLine> TerminalLog::getLines() {
  lock_guard<mutex> guard(classMutex);
  return vector<TerminalLine>(lines.begin(), lines.end());
}

size_t TerminalLog::size() {
  lock_guard<mutex> guard(classMutex);
  return lines.size();
}

void TerminalLog::clear() {
  lock_guard<mutex> guard(classMutex);
  lines.clear();
}
}  // namespace tether
