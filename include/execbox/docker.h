#ifndef INCLUDE_EXECBOX_DOCKER_H_
#define INCLUDE_EXECBOX_DOCKER_H_

#include <string>
#include <vector>

#include <execbox/config.h>
#include <execbox/sandbox.h>

// Work directory (the mounted workspace) as seen from inside a sandbox
extern const char kSandboxWorkdir[];
// Label carried by every sandbox this service creates
extern const char kSandboxLabel[];

// Runs each phase in a fresh container through the runtime's command-line client.
// The client process is the sandbox's Subprocess; its stdio is the container's.
class DockerLauncher : public SandboxLauncher {
  const Config& config_;

  void EnsureImage_(const std::string& image) const;
 public:
  explicit DockerLauncher(const Config& config) : config_(config) {}

  std::unique_ptr<SandboxHandle> Launch(
      const LanguageProfile&, Phase, const std::string& source, const Workspace&, long time_budget_ms) override;

  // the full command line of one phase; exposed for inspection
  std::vector<std::string> RunArgs(const std::string& id, const LanguageProfile&, Phase,
                                   const Workspace&) const;
  ResourceLimits Limits(const LanguageProfile&, Phase) const;
};

class DockerSandboxHandle : public SandboxHandle {
  std::string runtime_;
  long call_timeout_ms_;
  bool killed_;
 public:
  DockerSandboxHandle(std::string id, Phase phase, ResourceLimits limits, Subprocess&& process,
                      const Config& config);
  // terminate if needed, reap the client, remove the container
  ~DockerSandboxHandle() override;

  void Terminate() override;
  // exit status 125-127 together with the runtime client's own diagnostic
  bool RuntimeFault(const WatchResult&) const override;
};

std::string NextSandboxId();

// true if the runtime daemon answers
bool PingRuntime(const Config&);
bool ImageAvailable(const Config&, const std::string& image);
// Force-remove sandboxes left behind by a previous instance; returns how many were removed
int CleanupStaleSandboxes(const Config&);

#endif  // INCLUDE_EXECBOX_DOCKER_H_
