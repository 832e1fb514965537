#ifndef INCLUDE_EXECBOX_SANDBOX_H_
#define INCLUDE_EXECBOX_SANDBOX_H_

#include <chrono>
#include <memory>
#include <string>
#include <stdexcept>
#include <filesystem>

#include <execbox/subprocess.h>

class LanguageProfile;

#define ENUM_PHASE_ \
  X(COMPILE) \
  X(RUN)
enum class Phase {
#define X(name) name,
  ENUM_PHASE_
#undef X
};

// The container runtime is unreachable, an image is missing, or the host cannot
// prepare a sandbox. Never caused by the submitted code.
class SandboxInfrastructureError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ResourceLimits {
  std::string memory; // runtime syntax, e.g. "256m"
  int pids;
  int cpu_shares;
  bool no_network;
  bool read_only_root;
  std::string scratch_size;
};

// Per-request host directory holding the source and the build artifact.
// Removed on destruction; never shared between two requests.
class Workspace {
  std::filesystem::path path_;
 public:
  // throws SandboxInfrastructureError if the directory cannot be created
  explicit Workspace(const std::filesystem::path& root);
  ~Workspace();
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  const std::filesystem::path& Path() const { return path_; }
  std::filesystem::path SourcePath(const LanguageProfile&) const;
  // writes the source world-readable; returns false on I/O failure
  bool WriteSource(const LanguageProfile&, const std::string& code) const;
};

// One running phase. Destroying the handle terminates the process group if it is
// still alive and then releases everything the launcher allocated for it.
class SandboxHandle {
 protected:
  std::string id_;
  Phase phase_;
  ResourceLimits limits_;
  std::chrono::steady_clock::time_point started_at_;
  Subprocess process_;
 public:
  SandboxHandle(std::string id, Phase phase, ResourceLimits limits, Subprocess&& process);
  virtual ~SandboxHandle();
  SandboxHandle(const SandboxHandle&) = delete;
  SandboxHandle& operator=(const SandboxHandle&) = delete;

  const std::string& Id() const { return id_; }
  Phase GetPhase() const { return phase_; }
  const ResourceLimits& Limits() const { return limits_; }
  std::chrono::steady_clock::time_point StartedAt() const { return started_at_; }
  // stdio pipes live here
  Subprocess& Process() { return process_; }

  // Forcibly end every process of the sandbox. Safe to call more than once.
  virtual void Terminate();
  // True if the phase was ended by the sandbox runtime failing, not by the code it ran
  virtual bool RuntimeFault(const WatchResult&) const { return false; }
};

class SandboxLauncher {
 public:
  virtual ~SandboxLauncher() = default;
  // Materializes the source into the workspace and starts the phase's command.
  // Throws SandboxInfrastructureError on environment faults.
  virtual std::unique_ptr<SandboxHandle> Launch(
      const LanguageProfile&, Phase, const std::string& source, const Workspace&, long time_budget_ms) = 0;
};

const char* PhaseName(Phase);

#endif  // INCLUDE_EXECBOX_SANDBOX_H_
