#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <atomic>
#include <optional>
#include <gtest/gtest.h>
#include <execbox/config.h>
#include <execbox/sandbox.h>
#include <execbox/language.h>
#include <execbox/execution.h>

// Runs phases as plain host processes inside the workspace. Counts what it does.
class LocalLauncher : public SandboxLauncher {
 public:
  std::atomic<int> launches[2];
  std::atomic<int> teardowns;
  // teardowns that found the process group already gone
  std::atomic<int> teardowns_after_exit;
  std::atomic<bool> fail_launch;
  // the run phase cannot be launched, after a compile phase that could
  std::atomic<bool> fail_run_launch;
  // every finished phase looks like the runtime killed it
  std::atomic<bool> runtime_fault;
  // sandbox startup time charged before a compile phase starts
  std::atomic<long> compile_delay_ms;

  LocalLauncher() :
      launches{0, 0}, teardowns(0), teardowns_after_exit(0), fail_launch(false),
      fail_run_launch(false), runtime_fault(false), compile_delay_ms(0) {}

  std::unique_ptr<SandboxHandle> Launch(
      const LanguageProfile&, Phase, const std::string& source, const Workspace&, long time_budget_ms) override;

  int Launches() const { return launches[0] + launches[1]; }
  int Launches(Phase phase) const { return launches[(int)phase]; }
};

// "python" runs the code as a shell script; "cpp" syntax-checks it first with sh -n
std::vector<LanguageProfile> ShellProfiles();

fs::path TestBoxRoot();

class LocalSandbox : public ::testing::Test {
 protected:
  Config config;
  LanguageRegistry registry;
  LocalLauncher launcher;
  Orchestrator orchestrator;

  LocalSandbox();
  void TearDown() override;

  ExecutionResult Run(const std::string& language, const std::string& code,
                      std::optional<std::string> input = std::nullopt);
};

#endif // TEST_UTILS_H_
