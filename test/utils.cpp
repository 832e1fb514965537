#include "utils.h"

#include <unistd.h>
#include <thread>
#include <chrono>
#include <fmt/core.h>
#include <execbox/docker.h>

namespace {

class LocalSandboxHandle : public SandboxHandle {
  LocalLauncher& launcher_;
 public:
  LocalSandboxHandle(std::string id, Phase phase, Subprocess&& process, LocalLauncher& launcher) :
      SandboxHandle(std::move(id), phase, ResourceLimits{}, std::move(process)), launcher_(launcher) {}
  ~LocalSandboxHandle() override {
    if (process_.Reaped()) launcher_.teardowns_after_exit++;
    launcher_.teardowns++;
  }
  bool RuntimeFault(const WatchResult&) const override { return launcher_.runtime_fault; }
};

} // namespace

std::unique_ptr<SandboxHandle> LocalLauncher::Launch(
    const LanguageProfile& profile, Phase phase, const std::string& source, const Workspace& ws, long) {
  if (fail_launch) throw SandboxInfrastructureError("local runtime disabled");
  if (fail_run_launch && phase == Phase::RUN) throw SandboxInfrastructureError("local runtime gone");
  if (compile_delay_ms && phase == Phase::COMPILE) {
    std::this_thread::sleep_for(std::chrono::milliseconds(compile_delay_ms.load()));
  }
  if (!ws.WriteSource(profile, source)) throw SandboxInfrastructureError("cannot write source");
  auto argv = phase == Phase::COMPILE ?
      profile.CompileCommand(ws.Path().string()) : profile.RunCommand(ws.Path().string());
  Subprocess proc;
  if (!proc.Spawn(argv, profile.envs)) throw SandboxInfrastructureError("cannot spawn " + argv[0]);
  launches[(int)phase]++;
  return std::make_unique<LocalSandboxHandle>(NextSandboxId(), phase, std::move(proc), *this);
}

std::vector<LanguageProfile> ShellProfiles() {
  std::vector<LanguageProfile> ret(2);
  ret[0].id = Language::PYTHON;
  ret[0].image_ref = "host";
  ret[0].source_extension = ".sh";
  ret[0].run_command = {"/bin/sh", kSourcePlaceholder};
  ret[0].envs = {"EXECBOX_TEST=1"};
  ret[1] = ret[0];
  ret[1].id = Language::CPP;
  ret[1].compile_command = {"/bin/sh", "-n", kSourcePlaceholder};
  return ret;
}

fs::path TestBoxRoot() {
  return fs::temp_directory_path() / fmt::format("execbox-test-{}", getpid());
}

LocalSandbox::LocalSandbox() :
    registry(ShellProfiles()),
    orchestrator(config, registry, launcher) {
  config.box_root = TestBoxRoot();
  config.execution_timeout_ms = 2000;
  config.max_output_bytes = 4096;
  config.output_grace_ms = 100;
}

void LocalSandbox::TearDown() {
  // every workspace is gone once its request is answered
  EXPECT_TRUE(!fs::exists(config.box_root) || fs::is_empty(config.box_root));
}

ExecutionResult LocalSandbox::Run(const std::string& language, const std::string& code,
                                  std::optional<std::string> input) {
  return orchestrator.Execute(ExecutionRequest{code, language, std::move(input)});
}
