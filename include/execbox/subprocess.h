#ifndef INCLUDE_EXECBOX_SUBPROCESS_H_
#define INCLUDE_EXECBOX_SUBPROCESS_H_

#include <string>
#include <vector>
#include <functional>
#include <sys/types.h>

// A child process in its own process group, with its three standard streams piped to us.
// All fds are close-on-exec so concurrent spawns never leak each other's pipes.
class Subprocess {
  pid_t pid_;
  int stdin_fd_, stdout_fd_, stderr_fd_;
  int exit_fd_; // pidfd; readable once the child exits, -1 if the kernel lacks pidfd_open
  bool reaped_;
  int status_;

  void CloseAll_();
  // kill and reap a child still running, then close every fd
  void Reset_();
 public:
  Subprocess() :
      pid_(-1), stdin_fd_(-1), stdout_fd_(-1), stderr_fd_(-1), exit_fd_(-1),
      reaped_(false), status_(0) {}
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  Subprocess(Subprocess&&) noexcept;
  Subprocess& operator=(Subprocess&&) noexcept;
  // kills the process group and reaps it if still running
  ~Subprocess();

  // argv[0] is searched in PATH; envs are appended to the inherited environment.
  // Returns false with errno set if the pipes, fork or exec failed.
  bool Spawn(const std::vector<std::string>& argv, const std::vector<std::string>& envs = {});

  pid_t Pid() const { return pid_; }
  bool Started() const { return pid_ > 0; }
  int StdinFd() const { return stdin_fd_; }
  int StdoutFd() const { return stdout_fd_; }
  int StderrFd() const { return stderr_fd_; }
  int ExitFd() const { return exit_fd_; }
  void CloseStdin();
  void CloseStdout();
  void CloseStderr();

  // signal the whole process group; no-op once reaped
  void Kill(int sig);
  // non-blocking; true if the child has been reaped
  bool TryWait();
  bool Wait();
  bool Reaped() const { return reaped_; }
  // exit status, or 128 + signal number; -1 if not reaped
  int ExitCode() const;
};

// Output of one stream, cut at a byte limit
struct CapturedStream {
  std::string data;
  bool truncated = false;

  // returns the number of bytes kept
  size_t Append(const char* buf, size_t len, size_t limit);
};

#define ENUM_STOP_CAUSE_ \
  X(EXITED) \
  X(TIMEOUT) \
  X(OUTPUT_LIMIT) \
  X(WATCH_ERROR)
enum class StopCause {
#define X(name) name,
  ENUM_STOP_CAUSE_
#undef X
};

struct WatchOptions {
  long time_limit_ms;
  long max_output_bytes; // per stream
  long output_grace_ms;
};

struct WatchResult {
  CapturedStream out, err;
  StopCause cause;
  bool timed_out;
  int exit_code; // -1 if the process could not be reaped
  long duration_ms;
};

// Feeds input to the process and reads both output streams as bytes arrive, racing
// the process exit against the wall-clock limit and the output cap.
// terminate is invoked at most once: when the time limit fires, or when the
// output grace period after hitting the cap runs out.
WatchResult WatchProcess(Subprocess&, const std::string& input, const WatchOptions&,
                         const std::function<void()>& terminate);

struct CommandResult {
  bool spawned;
  bool timed_out;
  int exit_code;
  std::string out, err;
};

// Run a helper command to completion, killing its process group after timeout_ms
CommandResult RunCommand(const std::vector<std::string>& argv, long timeout_ms, long max_output = 1 << 20);

const char* StopCauseName(StopCause);

#endif  // INCLUDE_EXECBOX_SUBPROCESS_H_
