#ifndef __TETHER_COMMAND_EXECUTION__
#define __TETHER_COMMAND_EXECUTION__

#include "Headers.hpp"
#include "Message.hpp"
#include "RelayCommand.hpp"
#include "SubprocessUtils.hpp"

namespace tether {
enum class ExecutionStatus {
  PENDING,
  RUNNING,
  COMPLETED,
  FAILED,
  TIMED_OUT,
  CANCELLED
};

string executionStatusName(ExecutionStatus status);

typedef function<void(const Message&)> MessageSink;

/**
 * @brief Supervises the processes of one RelayCommand on its own thread.
 *
 * Guarantees:
 *  - exactly one terminal message reaches the sink, unless the execution is
 *    cancelled, in which case none does
 *  - nothing reaches the sink after the terminal message or after cancel()
 *    returns
 *  - on timeout or cancel the process group gets SIGTERM, then SIGKILL after
 *    the grace period, and is reaped
 */
class CommandExecution : public enable_shared_from_this<CommandExecution> {
 public:
  CommandExecution(shared_ptr<RelayCommand> _command,
                   const string& _workingDirectory, MessageSink _sink,
                   chrono::milliseconds _killGrace,
                   chrono::milliseconds _idleFlush);

  ~CommandExecution();

  /**
   * @brief Starts the supervisor thread. `onFinished` runs on that thread
   * after the terminal message (if any) was delivered. The status is
   * already terminal when the sink receives that message.
   */
  void start(function<void(shared_ptr<CommandExecution>)> onFinished);

  /**
   * @brief Requests termination. Safe from any thread, idempotent, never
   * blocks on the child.
   */
  void cancel();

  /**
   * @brief Blocks until the execution finished or `timeout` elapsed.
   * @return true if it finished.
   */
  bool waitFor(chrono::milliseconds timeout);

  ExecutionStatus getStatus() const { return status.load(); }

  /**
   * @brief True once the terminal status is decided. A settled execution no
   * longer occupies its session's slot, even while `onFinished` is pending.
   */
  bool isSettled() const {
    ExecutionStatus current = status.load();
    return current != ExecutionStatus::PENDING &&
           current != ExecutionStatus::RUNNING;
  }

  bool isFinished() const;

  const string& getId() const { return id; }

  const optional<string>& getRequestId() const {
    return command->getRequestId();
  }

  string describe() const { return command->describe(); }

  int64_t getStartedAtMs() const { return startedAtMs; }

  pid_t getPid() const { return currentPid.load(); }

 protected:
  enum class StepOutcome { EXITED, TIMED_OUT, CANCELLED };

  void run();
  StepOutcome superviseStep(const shared_ptr<ChildProcess>& child,
                            chrono::steady_clock::time_point deadline,
                            ExecutionResult* result, string* heldChunk);
  bool emit(const Message& message);
  void finish(ExecutionStatus finalStatus, const optional<Message>& terminal);
  void drainWakePipe();

  shared_ptr<RelayCommand> command;
  string workingDirectory;
  MessageSink sink;
  chrono::milliseconds killGrace;
  chrono::milliseconds idleFlush;
  string id;
  int64_t startedAtMs;

  atomic<ExecutionStatus> status;
  atomic<bool> cancelRequested;
  atomic<pid_t> currentPid;
  int wakePipe[2];

  mutex emitMutex;
  bool emissionClosed;

  mutable mutex finishedMutex;
  condition_variable finishedCv;
  bool finished;
  function<void(shared_ptr<CommandExecution>)> finishedCallback;
};
}  // namespace tether

#endif  // __TETHER_COMMAND_EXECUTION__
