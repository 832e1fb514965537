#include <execbox/docker.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <signal.h>
#include <unistd.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <execbox/utils.h>
#include <execbox/language.h>

const char kSandboxWorkdir[] = "/workdir";
const char kSandboxLabel[] = "execbox.sandbox";

namespace {

std::string Trim(const std::string& str) {
  size_t l = str.find_first_not_of(" \t\r\n");
  if (l == std::string::npos) return "";
  size_t r = str.find_last_not_of(" \t\r\n");
  return str.substr(l, r - l + 1);
}

// docker run exits with these when the container could not be created or its command started
constexpr int kRuntimeFaultMin = 125;
constexpr int kRuntimeFaultMax = 127;

bool StartsWith(const std::string& str, const std::string& prefix) {
  return str.compare(0, prefix.size(), prefix) == 0;
}

bool IsNoSuchContainer(const std::string& err) {
  return err.find("No such container") != std::string::npos ||
         err.find("no such container") != std::string::npos;
}

} // namespace

std::string NextSandboxId() {
  static std::atomic<unsigned long> seq(0);
  return fmt::format("execbox-{}-{}-{}", getpid(), ++seq, RandomHex().substr(0, 8));
}

ResourceLimits DockerLauncher::Limits(const LanguageProfile& profile, Phase) const {
  ResourceLimits ret;
  ret.memory = profile.memory_limit.size() ? profile.memory_limit : config_.memory_limit;
  ret.pids = config_.pids_limit;
  ret.cpu_shares = config_.cpu_shares;
  ret.no_network = true;
  ret.read_only_root = true;
  ret.scratch_size = config_.scratch_size;
  return ret;
}

std::vector<std::string> DockerLauncher::RunArgs(
    const std::string& id, const LanguageProfile& profile, Phase phase, const Workspace& ws) const {
  ResourceLimits limits = Limits(profile, phase);
  // the build artifact may only be written by the compile phase
  const char* mount_mode = phase == Phase::COMPILE ? "rw" : "ro";
  std::vector<std::string> ret = {
    config_.runtime, "run", "--rm", "-i",
    "--name", id,
    "--label", std::string(kSandboxLabel) + "=1",
    "--pull=never",
    "--read-only",
    "--tmpfs", "/tmp:rw,exec,nosuid,size=" + limits.scratch_size,
    "--cap-drop=ALL",
    "--security-opt=no-new-privileges",
    "--pids-limit=" + std::to_string(limits.pids),
    "--cpu-shares=" + std::to_string(limits.cpu_shares),
    "--memory=" + limits.memory,
    "--memory-swap=" + limits.memory,
    "--ulimit", "core=0",
    "--ulimit", "fsize=" + std::to_string(ParseByteSize(limits.scratch_size)),
    "--user", config_.sandbox_user,
    "--log-driver=none",
    "-w", kSandboxWorkdir,
    "-v", fmt::format("{}:{}:{}", ws.Path().string(), kSandboxWorkdir, mount_mode),
  };
  if (limits.no_network) ret.push_back("--network=none");
  for (auto& env : profile.envs) {
    ret.push_back("-e");
    ret.push_back(env);
  }
  ret.push_back(profile.image_ref);
  auto command = phase == Phase::COMPILE ?
      profile.CompileCommand(kSandboxWorkdir) : profile.RunCommand(kSandboxWorkdir);
  ret.insert(ret.end(), command.begin(), command.end());
  return ret;
}

void DockerLauncher::EnsureImage_(const std::string& image) const {
  CommandResult res = RunCommand(
      {config_.runtime, "image", "inspect", "--format", "{{.Id}}", image}, config_.runtime_call_timeout_ms);
  if (!res.spawned) {
    throw SandboxInfrastructureError(
        fmt::format("Container runtime {} cannot be started: {}", config_.runtime, res.err));
  }
  if (res.timed_out) {
    throw SandboxInfrastructureError(
        fmt::format("Container runtime {} did not answer within {}ms", config_.runtime,
                    config_.runtime_call_timeout_ms));
  }
  if (res.exit_code != 0) {
    throw SandboxInfrastructureError(
        fmt::format("Sandbox image {} unavailable: {}", image, Trim(res.err)));
  }
}

std::unique_ptr<SandboxHandle> DockerLauncher::Launch(
    const LanguageProfile& profile, Phase phase, const std::string& source, const Workspace& ws,
    long time_budget_ms) {
  EnsureImage_(profile.image_ref);
  if (!ws.WriteSource(profile, source)) {
    throw SandboxInfrastructureError("Cannot write source into " + ws.Path().string());
  }
  std::string id = NextSandboxId();
  auto argv = RunArgs(id, profile, phase, ws);
  Subprocess proc;
  if (!proc.Spawn(argv)) {
    throw SandboxInfrastructureError(
        fmt::format("Cannot start {}: {}", config_.runtime, strerror(errno)));
  }
  spdlog::debug("Sandbox {} launched: image={} phase={} budget={}ms pid={}",
      id, profile.image_ref, PhaseName(phase), time_budget_ms, proc.Pid());
  return std::make_unique<DockerSandboxHandle>(
      std::move(id), phase, Limits(profile, phase), std::move(proc), config_);
}

DockerSandboxHandle::DockerSandboxHandle(
    std::string id, Phase phase, ResourceLimits limits, Subprocess&& process, const Config& config) :
    SandboxHandle(std::move(id), phase, std::move(limits), std::move(process)),
    runtime_(config.runtime), call_timeout_ms_(config.runtime_call_timeout_ms), killed_(false) {}

void DockerSandboxHandle::Terminate() {
  if (!killed_) {
    killed_ = true;
    // killing only the client would leave the container running
    CommandResult res = RunCommand({runtime_, "kill", id_}, call_timeout_ms_);
    if (res.exit_code != 0 && !IsNoSuchContainer(res.err)) {
      spdlog::debug("{} kill {}: {}", runtime_, id_, Trim(res.err));
    }
  }
  process_.Kill(SIGKILL);
}

bool DockerSandboxHandle::RuntimeFault(const WatchResult& watch) const {
  if (watch.timed_out || watch.exit_code < kRuntimeFaultMin || watch.exit_code > kRuntimeFaultMax) {
    return false;
  }
  // a program exiting 125 by itself does not print what the client prints
  const std::string& err = watch.err.data;
  std::string client = fs::path(runtime_).filename().string();
  return StartsWith(err, "docker: ") || StartsWith(err, client + ": ") ||
         err.find("Error response from daemon") != std::string::npos;
}

DockerSandboxHandle::~DockerSandboxHandle() {
  if (process_.Started() && !process_.Reaped() && !process_.TryWait()) Terminate();
  process_.Wait();
  // --rm removes the container on exit, but not if the client died first
  CommandResult res = RunCommand({runtime_, "rm", "-f", id_}, call_timeout_ms_);
  if (res.timed_out || (res.exit_code != 0 && !IsNoSuchContainer(res.err))) {
    spdlog::warn("Failed to remove sandbox {}: {}", id_, res.timed_out ? "timed out" : Trim(res.err));
  }
  spdlog::debug("Sandbox {} torn down", id_);
}

bool PingRuntime(const Config& config) {
  CommandResult res = RunCommand(
      {config.runtime, "version", "--format", "{{.Server.Version}}"}, config.runtime_call_timeout_ms);
  if (!res.spawned || res.timed_out || res.exit_code != 0) return false;
  spdlog::info("Container runtime {} server version {}", config.runtime, Trim(res.out));
  return true;
}

bool ImageAvailable(const Config& config, const std::string& image) {
  CommandResult res = RunCommand(
      {config.runtime, "image", "inspect", "--format", "{{.Id}}", image}, config.runtime_call_timeout_ms);
  return res.spawned && !res.timed_out && res.exit_code == 0;
}

int CleanupStaleSandboxes(const Config& config) {
  CommandResult res = RunCommand(
      {config.runtime, "ps", "-aq", "--filter", fmt::format("label={}=1", kSandboxLabel)},
      config.runtime_call_timeout_ms);
  if (!res.spawned || res.timed_out || res.exit_code != 0) {
    spdlog::warn("Cannot list stale sandboxes: {}", Trim(res.err));
    return 0;
  }
  int count = 0;
  std::istringstream sin(res.out);
  for (std::string id; sin >> id;) {
    CommandResult rm = RunCommand({config.runtime, "rm", "-f", id}, config.runtime_call_timeout_ms);
    if (rm.exit_code == 0) {
      count++;
    } else if (!IsNoSuchContainer(rm.err)) {
      spdlog::warn("Failed to remove stale sandbox {}: {}", id, Trim(rm.err));
    }
  }
  if (count) spdlog::info("Removed {} stale sandboxes", count);
  return count;
}
