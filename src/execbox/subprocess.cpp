#include <execbox/subprocess.h>

#include <poll.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/syscall.h>
#include <chrono>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kReadChunk = 65536;
// after terminate(), how long to wait for the streams to close before giving up on them
constexpr auto kKillWait = std::chrono::seconds(2);
// without pidfd we cannot block on process exit once both streams are closed
constexpr int kExitPollMs = 20;

inline void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

inline long ElapsedMs(Clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

int OpenPidfd(pid_t pid) {
#ifdef SYS_pidfd_open
  int fd = syscall(SYS_pidfd_open, pid, 0);
  if (fd >= 0) fcntl(fd, F_SETFD, FD_CLOEXEC);
  return fd;
#else
  (void)pid;
  return -1;
#endif
}

} // namespace

Subprocess::Subprocess(Subprocess&& x) noexcept :
    pid_(x.pid_), stdin_fd_(x.stdin_fd_), stdout_fd_(x.stdout_fd_), stderr_fd_(x.stderr_fd_),
    exit_fd_(x.exit_fd_), reaped_(x.reaped_), status_(x.status_) {
  x.pid_ = -1;
  x.stdin_fd_ = x.stdout_fd_ = x.stderr_fd_ = x.exit_fd_ = -1;
}

Subprocess& Subprocess::operator=(Subprocess&& x) noexcept {
  if (this == &x) return *this;
  Reset_();
  pid_ = x.pid_;
  stdin_fd_ = x.stdin_fd_;
  stdout_fd_ = x.stdout_fd_;
  stderr_fd_ = x.stderr_fd_;
  exit_fd_ = x.exit_fd_;
  reaped_ = x.reaped_;
  status_ = x.status_;
  x.pid_ = -1;
  x.stdin_fd_ = x.stdout_fd_ = x.stderr_fd_ = x.exit_fd_ = -1;
  return *this;
}

Subprocess::~Subprocess() {
  Reset_();
}

void Subprocess::Reset_() {
  if (Started() && !reaped_) {
    Kill(SIGKILL);
    Wait();
  }
  CloseAll_();
}

void Subprocess::CloseAll_() {
  CloseFd(stdin_fd_);
  CloseFd(stdout_fd_);
  CloseFd(stderr_fd_);
  CloseFd(exit_fd_);
}

void Subprocess::CloseStdin() { CloseFd(stdin_fd_); }
void Subprocess::CloseStdout() { CloseFd(stdout_fd_); }
void Subprocess::CloseStderr() { CloseFd(stderr_fd_); }

bool Subprocess::Spawn(const std::vector<std::string>& argv, const std::vector<std::string>& envs) {
  if (argv.empty()) {
    errno = EINVAL;
    return false;
  }
  // build everything before fork; the child may only make async-signal-safe calls
  std::vector<char*> argv_buf;
  for (auto& i : argv) argv_buf.push_back(const_cast<char*>(i.c_str()));
  argv_buf.push_back(nullptr);
  std::vector<char*> env_buf;
  for (char** e = environ; e && *e; e++) env_buf.push_back(*e);
  for (auto& i : envs) env_buf.push_back(const_cast<char*>(i.c_str()));
  env_buf.push_back(nullptr);

  int in[2] = {-1, -1}, out[2] = {-1, -1}, err[2] = {-1, -1}, exec_err[2] = {-1, -1};
  auto CloseAllPipes = [&]() {
    for (int* p : {in, out, err, exec_err}) CloseFd(p[0]), CloseFd(p[1]);
  };
  if (pipe2(in, O_CLOEXEC) < 0 || pipe2(out, O_CLOEXEC) < 0 ||
      pipe2(err, O_CLOEXEC) < 0 || pipe2(exec_err, O_CLOEXEC) < 0) {
    int saved = errno;
    CloseAllPipes();
    errno = saved;
    return false;
  }
  pid_t pid = fork();
  if (pid < 0) {
    int saved = errno;
    CloseAllPipes();
    errno = saved;
    return false;
  }
  if (pid == 0) {
    setpgid(0, 0);
    dup2(in[0], 0);
    dup2(out[1], 1);
    dup2(err[1], 2);
    CloexecFrom(3);
    signal(SIGPIPE, SIG_DFL);
    execvpe(argv_buf[0], argv_buf.data(), env_buf.data());
    int code = errno;
    IGNORE_RETURN(write(exec_err[1], &code, sizeof(code)));
    _exit(127);
  }
  // both sides call setpgid so that Kill() works even before the child gets scheduled
  setpgid(pid, pid);
  CloseFd(in[0]);
  CloseFd(out[1]);
  CloseFd(err[1]);
  CloseFd(exec_err[1]);
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(exec_err[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(exec_err[0]);
  if (n == sizeof(child_errno)) {
    waitpid(pid, nullptr, 0);
    CloseAllPipes();
    errno = child_errno;
    return false;
  }
  pid_ = pid;
  stdin_fd_ = in[1];
  stdout_fd_ = out[0];
  stderr_fd_ = err[0];
  exit_fd_ = OpenPidfd(pid);
  reaped_ = false;
  spdlog::debug("Spawned pid={} command={}", pid, argv[0]);
  return true;
}

void Subprocess::Kill(int sig) {
  if (!Started() || reaped_) return;
  if (kill(-pid_, sig) < 0 && errno != ESRCH) {
    spdlog::warn("Failed to signal process group {}: {}", pid_, strerror(errno));
  }
}

bool Subprocess::TryWait() {
  if (!Started()) return false;
  if (reaped_) return true;
  pid_t ret = waitpid(pid_, &status_, WNOHANG);
  if (ret == pid_) reaped_ = true;
  return reaped_;
}

bool Subprocess::Wait() {
  if (!Started()) return false;
  if (reaped_) return true;
  pid_t ret;
  do {
    ret = waitpid(pid_, &status_, 0);
  } while (ret < 0 && errno == EINTR);
  if (ret == pid_) reaped_ = true;
  return reaped_;
}

int Subprocess::ExitCode() const {
  if (!reaped_) return -1;
  if (WIFEXITED(status_)) return WEXITSTATUS(status_);
  if (WIFSIGNALED(status_)) return 128 + WTERMSIG(status_);
  return -1;
}

size_t CapturedStream::Append(const char* buf, size_t len, size_t limit) {
  size_t room = data.size() < limit ? limit - data.size() : 0;
  size_t kept = std::min(room, len);
  data.append(buf, kept);
  if (kept < len) truncated = true;
  return kept;
}

WatchResult WatchProcess(Subprocess& proc, const std::string& input, const WatchOptions& opt,
                         const std::function<void()>& terminate) {
  WatchResult ret{};
  ret.cause = StopCause::EXITED;
  ret.exit_code = -1;
  const auto start = Clock::now();
  const auto deadline = start + std::chrono::milliseconds(opt.time_limit_ms);
  const auto never = Clock::time_point::max();
  auto cap_deadline = never;   // output cap hit: the grace period ends here
  auto drain_deadline = never; // process exited: remaining pipe contents are read until here
  auto kill_deadline = never;  // terminated: stop waiting for the streams here
  bool exited = false, terminated = false;
  size_t input_pos = 0;
  const size_t max_output = opt.max_output_bytes > 0 ? opt.max_output_bytes : 0;

  if (input.empty() || !SetNonblock(proc.StdinFd())) proc.CloseStdin();
  auto Terminate = [&](StopCause cause) {
    if (terminated) return;
    terminated = true;
    ret.cause = cause;
    spdlog::debug("Terminating pid={} cause={}", proc.Pid(), StopCauseName(cause));
    terminate();
    kill_deadline = Clock::now() + kKillWait;
  };
  auto ReadStream = [&](int fd, CapturedStream& stream, bool is_stdout) {
    char buf[kReadChunk];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return;
    if (n <= 0) {
      is_stdout ? proc.CloseStdout() : proc.CloseStderr();
      return;
    }
    stream.Append(buf, n, max_output);
    if (stream.truncated && cap_deadline == never) {
      // keep reading (and discarding) so the writer never blocks on a full pipe
      cap_deadline = Clock::now() + std::chrono::milliseconds(opt.output_grace_ms);
    }
  };

  std::vector<struct pollfd> fds;
  while (true) {
    if (!exited && proc.TryWait()) {
      exited = true;
      drain_deadline = Clock::now() + std::chrono::milliseconds(std::max(opt.output_grace_ms, 100L));
    }
    bool streams_open = proc.StdoutFd() >= 0 || proc.StderrFd() >= 0;
    if (exited && !streams_open) break;

    auto now = Clock::now();
    if (!terminated && !exited) {
      if (now >= deadline) {
        ret.timed_out = true;
        Terminate(StopCause::TIMEOUT);
      } else if (now >= cap_deadline) {
        Terminate(StopCause::OUTPUT_LIMIT);
      }
    }
    now = Clock::now();
    if (now >= kill_deadline || now >= drain_deadline) break;

    auto wake = std::min(kill_deadline, drain_deadline);
    if (!terminated && !exited) wake = std::min({wake, deadline, cap_deadline});
    fds.clear();
    if (proc.StdoutFd() >= 0) fds.push_back({proc.StdoutFd(), POLLIN, 0});
    if (proc.StderrFd() >= 0) fds.push_back({proc.StderrFd(), POLLIN, 0});
    if (proc.StdinFd() >= 0) fds.push_back({proc.StdinFd(), POLLOUT, 0});
    if (!exited && proc.ExitFd() >= 0) fds.push_back({proc.ExitFd(), POLLIN, 0});
    long timeout_ms = wake == never ? -1 :
        std::max(0L, (long)std::chrono::duration_cast<std::chrono::milliseconds>(wake - now).count() + 1);
    if (!exited && proc.ExitFd() < 0 && (timeout_ms < 0 || timeout_ms > kExitPollMs)) {
      timeout_ms = kExitPollMs;
    }
    int res = poll(fds.data(), fds.size(), timeout_ms);
    if (res < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed while watching pid={}: {}", proc.Pid(), strerror(errno));
      ret.cause = StopCause::WATCH_ERROR;
      if (!terminated) {
        terminated = true;
        terminate();
      }
      break;
    }
    if (res == 0) continue;
    for (auto& pfd : fds) {
      if (!pfd.revents) continue;
      if (pfd.fd == proc.StdoutFd()) {
        ReadStream(pfd.fd, ret.out, true);
      } else if (pfd.fd == proc.StderrFd()) {
        ReadStream(pfd.fd, ret.err, false);
      } else if (pfd.fd == proc.StdinFd()) {
        if (pfd.revents & (POLLERR | POLLHUP)) {
          // reader is gone; the rest of the input is dropped
          proc.CloseStdin();
          continue;
        }
        ssize_t n = write(pfd.fd, input.data() + input_pos, input.size() - input_pos);
        if (n > 0) input_pos += n;
        if (input_pos == input.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) proc.CloseStdin();
      }
      // exit fd: handled by TryWait at the top of the loop
    }
  }
  proc.CloseStdin();
  if (!exited && terminated) {
    // terminate() has been sent; the process is dying
    proc.Wait();
  }
  ret.exit_code = proc.ExitCode();
  ret.duration_ms = ElapsedMs(start);
  spdlog::debug("Watch of pid={} finished: cause={} exit={} duration={}ms stdout={}B{} stderr={}B{}",
      proc.Pid(), StopCauseName(ret.cause), ret.exit_code, ret.duration_ms,
      ret.out.data.size(), ret.out.truncated ? "(truncated)" : "",
      ret.err.data.size(), ret.err.truncated ? "(truncated)" : "");
  return ret;
}

CommandResult RunCommand(const std::vector<std::string>& argv, long timeout_ms, long max_output) {
  CommandResult ret{};
  ret.exit_code = -1;
  Subprocess proc;
  if (!proc.Spawn(argv)) {
    ret.err = strerror(errno);
    spdlog::warn("Failed to start {}: {}", argv.empty() ? "" : argv[0], ret.err);
    return ret;
  }
  ret.spawned = true;
  WatchOptions opt{timeout_ms, max_output, 0};
  WatchResult res = WatchProcess(proc, "", opt, [&proc]() { proc.Kill(SIGKILL); });
  ret.timed_out = res.timed_out;
  ret.exit_code = res.exit_code;
  ret.out = std::move(res.out.data);
  ret.err = std::move(res.err.data);
  if (ret.timed_out) spdlog::warn("Command {} timed out after {}ms", argv[0], timeout_ms);
  return ret;
}
