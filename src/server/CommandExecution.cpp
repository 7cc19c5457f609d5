#include "CommandExecution.hpp"

namespace tether {
namespace {
const size_t MAX_ERROR_TAIL = 4096;
const size_t MAX_COLLECTED_OUTPUT = 4 * 1024 * 1024;
// Background jobs may keep the pipes open after the leader exits.
const chrono::milliseconds STRAGGLER_DRAIN(200);
const chrono::milliseconds REAP_POLL(20);
}  // namespace

string executionStatusName(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::PENDING:
      return "pending";
    case ExecutionStatus::RUNNING:
      return "running";
    case ExecutionStatus::COMPLETED:
      return "completed";
    case ExecutionStatus::FAILED:
      return "failed";
    case ExecutionStatus::TIMED_OUT:
      return "timed_out";
    case ExecutionStatus::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

CommandExecution::CommandExecution(shared_ptr<RelayCommand> _command,
                                   const string& _workingDirectory,
                                   MessageSink _sink,
                                   chrono::milliseconds _killGrace,
                                   chrono::milliseconds _idleFlush)
    : command(_command),
      workingDirectory(_workingDirectory),
      sink(_sink),
      killGrace(_killGrace),
      idleFlush(_idleFlush),
      id(sole::uuid4().str()),
      startedAtMs(currentTimeMillis()),
      status(ExecutionStatus::PENDING),
      cancelRequested(false),
      currentPid(-1),
      emissionClosed(false),
      finished(false) {
  FATAL_FAIL(::pipe2(wakePipe, O_CLOEXEC | O_NONBLOCK));
}

CommandExecution::~CommandExecution() {
  ::close(wakePipe[0]);
  ::close(wakePipe[1]);
}

void CommandExecution::start(
    function<void(shared_ptr<CommandExecution>)> onFinished) {
  finishedCallback = onFinished;
  startedAtMs = currentTimeMillis();
  auto self = shared_from_this();
  // The thread owns a reference, so the execution outlives its owner's
  // interest in it until the processes are reaped.
  thread supervisor([self]() {
    el::Helpers::setThreadName("exec-" + self->id.substr(0, 8));
    try {
      self->run();
    } catch (const std::exception& e) {
      STERROR << "Execution " << self->id << " failed: " << e.what();
      ExecutionResult result;
      result.startError = string("Internal error: ") + e.what();
      self->finish(ExecutionStatus::FAILED, self->command->makeResult(result));
    }
  });
  supervisor.detach();
}

void CommandExecution::cancel() {
  if (cancelRequested.exchange(true)) {
    return;
  }
  LOG(INFO) << "Cancelling execution " << id << " (" << describe() << ")";
  char c = 'c';
  if (::write(wakePipe[1], &c, 1) == -1 && errno != EAGAIN) {
    LOG(WARNING) << "Could not wake execution " << id << ": "
                 << strerror(errno);
  }
  lock_guard<mutex> guard(emitMutex);
  emissionClosed = true;
}

bool CommandExecution::isFinished() const {
  lock_guard<mutex> guard(finishedMutex);
  return finished;
}

bool CommandExecution::waitFor(chrono::milliseconds timeout) {
  unique_lock<mutex> guard(finishedMutex);
  return finishedCv.wait_for(guard, timeout, [this] { return finished; });
}

bool CommandExecution::emit(const Message& message) {
  lock_guard<mutex> guard(emitMutex);
  if (emissionClosed) {
    return false;
  }
  sink(message);
  return true;
}

void CommandExecution::finish(ExecutionStatus finalStatus,
                              const optional<Message>& terminal) {
  {
    lock_guard<mutex> guard(emitMutex);
    if (emissionClosed) {
      // cancel() won the race, nothing more goes out.
      status = ExecutionStatus::CANCELLED;
    } else {
      // The session slot is free before the client can see the terminal
      // message and send its next command.
      status = finalStatus;
      if (terminal) {
        sink(*terminal);
      }
      emissionClosed = true;
    }
    finalStatus = status;
  }
  LOG(INFO) << "Execution " << id << " (" << describe() << ") finished as "
            << executionStatusName(finalStatus);

  auto callback = finishedCallback;
  finishedCallback = nullptr;
  if (callback) {
    callback(shared_from_this());
  }
  {
    lock_guard<mutex> guard(finishedMutex);
    finished = true;
  }
  finishedCv.notify_all();
}

void CommandExecution::drainWakePipe() {
  char buf[64];
  while (::read(wakePipe[0], buf, sizeof(buf)) > 0) {
  }
}

void CommandExecution::run() {
  status = ExecutionStatus::RUNNING;
  auto deadline = chrono::steady_clock::now() + command->getTimeout();
  ExecutionResult result;
  string heldChunk;
  auto steps = command->getSteps();
  LOG(INFO) << "Execution " << id << " starting " << describe()
            << " with timeout " << command->getTimeout().count() << "s";

  for (size_t i = 0; i < steps.size(); i++) {
    if (cancelRequested) {
      finish(ExecutionStatus::CANCELLED, nullopt);
      return;
    }
    result.stepIndex = int(i);
    result.output.clear();

    shared_ptr<ChildProcess> child;
    try {
      child = ChildProcess::spawn(steps[i], workingDirectory,
                                  command->getEnvironment());
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Execution " << id << ": " << re.what();
      result.startError = re.what();
      finish(ExecutionStatus::FAILED, command->makeResult(result));
      return;
    }
    currentPid = child->getPid();

    StepOutcome outcome = superviseStep(child, deadline, &result, &heldChunk);
    if (outcome == StepOutcome::CANCELLED) {
      child->terminate(killGrace);
      currentPid = -1;
      finish(ExecutionStatus::CANCELLED, nullopt);
      return;
    }
    if (outcome == StepOutcome::TIMED_OUT) {
      LOG(WARNING) << "Execution " << id << " timed out, killing pid "
                   << child->getPid();
      child->terminate(killGrace);
      currentPid = -1;
      if (!heldChunk.empty()) {
        emit(command->makeChunk(heldChunk));
      }
      finish(ExecutionStatus::TIMED_OUT, command->makeTimeout());
      return;
    }
    result.exitCode = child->reap();
    currentPid = -1;
    if (result.exitCode != 0) {
      break;
    }
  }

  if (command->streamsOutput()) {
    if (result.exitCode == 0) {
      result.output = heldChunk;
    } else {
      if (!heldChunk.empty()) {
        emit(command->makeChunk(heldChunk));
      }
      result.output.clear();
    }
  }
  finish(result.exitCode == 0 ? ExecutionStatus::COMPLETED
                              : ExecutionStatus::FAILED,
         command->makeResult(result));
}

CommandExecution::StepOutcome CommandExecution::superviseStep(
    const shared_ptr<ChildProcess>& child,
    chrono::steady_clock::time_point deadline, ExecutionResult* result,
    string* heldChunk) {
  const bool streaming = command->streamsOutput();
  auto lastOutputAt = chrono::steady_clock::now();
  optional<chrono::steady_clock::time_point> leaderExitedAt;
  char buf[8192];

  while (true) {
    if (cancelRequested) {
      return StepOutcome::CANCELLED;
    }
    auto now = chrono::steady_clock::now();
    if (now >= deadline) {
      return StepOutcome::TIMED_OUT;
    }

    bool pipesOpen = child->getStdoutFd() >= 0 || child->getStderrFd() >= 0;
    if (!leaderExitedAt && child->hasLeaderExited()) {
      leaderExitedAt = now;
    }
    if (leaderExitedAt &&
        (!pipesOpen || now - *leaderExitedAt >= STRAGGLER_DRAIN)) {
      if (streaming && !heldChunk->empty() && pipesOpen) {
        VLOG(1) << "Execution " << id << " abandoning straggler output";
      }
      return StepOutcome::EXITED;
    }

    auto wait = chrono::duration_cast<chrono::milliseconds>(deadline - now) +
                chrono::milliseconds(1);
    if (streaming && !heldChunk->empty()) {
      auto untilFlush = chrono::duration_cast<chrono::milliseconds>(
          lastOutputAt + idleFlush - now);
      wait = std::min(wait, std::max(untilFlush, chrono::milliseconds(0)) +
                                chrono::milliseconds(1));
    }
    if (!pipesOpen || leaderExitedAt) {
      wait = std::min(wait, REAP_POLL);
    }

    pollfd fds[3];
    int count = 0;
    fds[count].fd = wakePipe[0];
    fds[count].events = POLLIN;
    fds[count].revents = 0;
    count++;
    for (int fd : {child->getStdoutFd(), child->getStderrFd()}) {
      if (fd >= 0) {
        fds[count].fd = fd;
        fds[count].events = POLLIN;
        fds[count].revents = 0;
        count++;
      }
    }

    int rc = ::poll(fds, count, int(wait.count()));
    if (rc == -1) {
      if (errno == EINTR) {
        continue;
      }
      FATAL_FAIL(rc);
    }
    if (fds[0].revents) {
      drainWakePipe();
      continue;
    }

    for (int i = 1; i < count; i++) {
      if (!fds[i].revents) {
        continue;
      }
      bool isStderr = fds[i].fd == child->getStderrFd();
      ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n > 0) {
        string chunk(buf, n);
        lastOutputAt = chrono::steady_clock::now();
        if (isStderr) {
          result->errorOutput += chunk;
          if (result->errorOutput.size() > MAX_ERROR_TAIL) {
            result->errorOutput = result->errorOutput.substr(
                result->errorOutput.size() - MAX_ERROR_TAIL);
          }
        }
        if (streaming) {
          if (!heldChunk->empty()) {
            emit(command->makeChunk(*heldChunk));
          }
          *heldChunk = chunk;
        } else if (result->output.size() < MAX_COLLECTED_OUTPUT) {
          result->output += chunk;
        }
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        if (isStderr) {
          child->closeStderr();
        } else {
          child->closeStdout();
        }
      }
    }

    if (streaming && !heldChunk->empty() &&
        chrono::steady_clock::now() - lastOutputAt >= idleFlush) {
      emit(command->makeChunk(*heldChunk));
      heldChunk->clear();
    }
  }
}
}  // namespace tether
