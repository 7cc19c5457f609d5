#include "SubprocessUtils.hpp"

extern char** environ;

namespace tether {
namespace {
void closeIfOpen(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

int decodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

vector<string> mergeEnvironment(const map<string, string>& overrides) {
  vector<string> merged;
  for (char** it = environ; it != NULL && *it != NULL; ++it) {
    string entry(*it);
    if (overrides.find(entry.substr(0, entry.find('='))) == overrides.end()) {
      merged.push_back(entry);
    }
  }
  for (const auto& it : overrides) {
    merged.push_back(it.first + "=" + it.second);
  }
  return merged;
}
}  // namespace

shared_ptr<ChildProcess> ChildProcess::spawn(
    const vector<string>& argv, const string& workingDirectory,
    const map<string, string>& environment) {
  if (argv.empty() || argv[0].empty()) {
    throw std::runtime_error("Cannot run an empty command");
  }

  int outPipe[2];
  int errPipe[2];
  int statusPipe[2];
  if (::pipe2(outPipe, O_CLOEXEC) == -1) {
    throw std::runtime_error(string("pipe failed: ") + strerror(errno));
  }
  if (::pipe2(errPipe, O_CLOEXEC) == -1) {
    int savedErrno = errno;
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    throw std::runtime_error(string("pipe failed: ") + strerror(savedErrno));
  }
  if (::pipe2(statusPipe, O_CLOEXEC) == -1) {
    int savedErrno = errno;
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    ::close(errPipe[0]);
    ::close(errPipe[1]);
    throw std::runtime_error(string("pipe failed: ") + strerror(savedErrno));
  }

  // Build argv and envp before forking so the child does not allocate.
  vector<char*> argsArray;
  for (const auto& arg : argv) {
    argsArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argsArray.push_back(NULL);
  vector<string> envStrings;
  vector<char*> envArray;
  if (!environment.empty()) {
    envStrings = mergeEnvironment(environment);
    for (const auto& entry : envStrings) {
      envArray.push_back(const_cast<char*>(entry.c_str()));
    }
    envArray.push_back(NULL);
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    setpgid(0, 0);
    sigset_t allSignals;
    sigemptyset(&allSignals);
    sigprocmask(SIG_SETMASK, &allSignals, NULL);
    signal(SIGPIPE, SIG_DFL);

    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      ::close(devNull);
    }
    dup2(outPipe[1], STDOUT_FILENO);
    dup2(errPipe[1], STDERR_FILENO);

    int childErrno = 0;
    if (!workingDirectory.empty() && chdir(workingDirectory.c_str()) == -1) {
      childErrno = errno;
    } else {
      if (envArray.empty()) {
        execvp(argsArray[0], &argsArray[0]);
      } else {
        execvpe(argsArray[0], &argsArray[0], &envArray[0]);
      }
      childErrno = errno;
    }
    ssize_t written = ::write(statusPipe[1], &childErrno, sizeof(childErrno));
    (void)written;
    _exit(127);
  }

  int forkErrno = errno;
  ::close(outPipe[1]);
  ::close(errPipe[1]);
  ::close(statusPipe[1]);
  if (pid < 0) {
    ::close(outPipe[0]);
    ::close(errPipe[0]);
    ::close(statusPipe[0]);
    throw std::runtime_error(string("fork failed: ") + strerror(forkErrno));
  }
  // Also set the group from the parent so a signal sent right after spawn
  // cannot miss it.
  if (setpgid(pid, pid) == -1 && errno != EACCES && errno != ESRCH) {
    LOG(WARNING) << "setpgid failed for " << pid << ": " << strerror(errno);
  }

  int childErrno = 0;
  ssize_t bytesRead;
  do {
    bytesRead = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
  } while (bytesRead == -1 && errno == EINTR);
  ::close(statusPipe[0]);

  shared_ptr<ChildProcess> child(new ChildProcess(pid, outPipe[0], errPipe[0]));
  if (bytesRead == sizeof(childErrno)) {
    child->reap();
    throw std::runtime_error("Failed to start '" + argv[0] +
                             "': " + strerror(childErrno));
  }

  FATAL_FAIL(fcntl(child->stdoutFd, F_SETFL,
                   fcntl(child->stdoutFd, F_GETFL) | O_NONBLOCK));
  FATAL_FAIL(fcntl(child->stderrFd, F_SETFL,
                   fcntl(child->stderrFd, F_GETFL) | O_NONBLOCK));
  VLOG(1) << "Spawned pid " << pid << ": " << argv[0];
  return child;
}

ChildProcess::~ChildProcess() {
  if (!reaped) {
    terminate(chrono::milliseconds(0));
  }
  closeIfOpen(&stdoutFd);
  closeIfOpen(&stderrFd);
}

void ChildProcess::closeStdout() { closeIfOpen(&stdoutFd); }

void ChildProcess::closeStderr() { closeIfOpen(&stderrFd); }

void ChildProcess::signalGroup(int signum) {
  if (reaped) {
    return;
  }
  if (::kill(-pid, signum) == -1 && errno != ESRCH) {
    LOG(WARNING) << "kill(" << -pid << ", " << signum
                 << ") failed: " << strerror(errno);
  }
}

bool ChildProcess::hasLeaderExited() {
  if (reaped) {
    return true;
  }
  siginfo_t info;
  memset(&info, 0, sizeof(info));
  int rc;
  do {
    rc = waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT);
  } while (rc == -1 && errno == EINTR);
  if (rc == -1) {
    STERROR << "waitid failed for " << pid << ": " << strerror(errno);
    return true;
  }
  return info.si_pid == pid;
}

int ChildProcess::reap() {
  if (reaped) {
    return exitCode;
  }
  // Stragglers (background jobs of a shell) die with the leader.
  signalGroup(SIGKILL);
  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid, &status, 0);
  } while (rc == -1 && errno == EINTR);
  reaped = true;
  if (rc == -1) {
    STERROR << "waitpid failed for " << pid << ": " << strerror(errno);
    exitCode = -1;
  } else {
    exitCode = decodeWaitStatus(status);
  }
  VLOG(1) << "Reaped pid " << pid << " with status " << exitCode;
  return exitCode;
}

void ChildProcess::terminate(chrono::milliseconds grace) {
  if (reaped) {
    return;
  }
  signalGroup(SIGTERM);
  auto giveUp = chrono::steady_clock::now() + grace;
  while (!hasLeaderExited() && chrono::steady_clock::now() < giveUp) {
    this_thread::sleep_for(chrono::milliseconds(10));
  }
  reap();
}
}  // namespace tether
