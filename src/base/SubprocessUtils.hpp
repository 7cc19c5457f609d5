#ifndef __TETHER_SUBPROCESS_UTILS__
#define __TETHER_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace tether {
/**
 * @brief A forked child running in its own process group with stdout and
 * stderr captured on separate non-blocking pipes.
 *
 * The destructor kills and reaps the group if the owner never did, so a
 * ChildProcess never leaves a zombie behind.
 */
class ChildProcess {
 public:
  /**
   * @brief Forks and execs `argv` (PATH lookup) in `workingDirectory`.
   * The child inherits our environment with `environment` applied on top.
   * @throws std::runtime_error when the pipes cannot be created, fork fails
   * or the program cannot be executed.
   */
  static shared_ptr<ChildProcess> spawn(
      const vector<string>& argv, const string& workingDirectory = "",
      const map<string, string>& environment = {});

  ~ChildProcess();

  pid_t getPid() const { return pid; }

  int getStdoutFd() const { return stdoutFd; }

  int getStderrFd() const { return stderrFd; }

  void closeStdout();

  void closeStderr();

  /**
   * @brief Checks without reaping whether the group leader has exited. The
   * process group stays reserved until reap() is called.
   */
  bool hasLeaderExited();

  /**
   * @brief Kills any processes left in the group and reaps the leader.
   * @return The exit status, or 128+signal for a signalled child.
   */
  int reap();

  /**
   * @brief Sends SIGTERM to the whole process group, waits up to `grace`
   * for the leader to exit, then SIGKILLs the group and reaps.
   */
  void terminate(chrono::milliseconds grace);

 protected:
  ChildProcess(pid_t _pid, int _stdoutFd, int _stderrFd)
      : pid(_pid),
        stdoutFd(_stdoutFd),
        stderrFd(_stderrFd),
        reaped(false),
        exitCode(-1) {}

  void signalGroup(int signum);

  pid_t pid;
  int stdoutFd;
  int stderrFd;
  bool reaped;
  int exitCode;
};
}  // namespace tether

#endif  // __TETHER_SUBPROCESS_UTILS__
