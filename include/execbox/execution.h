#ifndef INCLUDE_EXECBOX_EXECUTION_H_
#define INCLUDE_EXECBOX_EXECUTION_H_

#include <string>

#include <execbox/config.h>
#include <execbox/sandbox.h>
#include <execbox/language.h>
#include <execbox/validator.h>
#include <execbox/subprocess.h>

// Exit code of a timed-out execution; outside the range of real exit statuses
constexpr int kTimeoutExitCode = -124;
// Exit code when no process ever ran (validation / infrastructure)
constexpr int kNoExitCode = -1;

#define ENUM_ERROR_KIND_ \
  X(NONE, "none") \
  X(VALIDATION, "validation") \
  X(COMPILE, "compile") \
  X(RUNTIME, "runtime") \
  X(TIMEOUT, "timeout") \
  X(INFRASTRUCTURE, "infrastructure")
enum class ErrorKind {
#define X(name, str) name,
  ENUM_ERROR_KIND_
#undef X
};

class ExecutionResult {
 public:
  CapturedStream out, err;
  int exit_code;
  long duration_ms;
  bool timed_out;
  ErrorKind error_kind;
  // human-readable cause for outcomes other than a plain process exit
  std::string message;

  ExecutionResult() :
      exit_code(kNoExitCode), duration_ms(0), timed_out(false), error_kind(ErrorKind::NONE) {}
  bool Succeeded() const { return error_kind == ErrorKind::NONE; }
};

// What one sandbox phase produced, before classification
struct PhaseOutcome {
  Phase phase;
  WatchResult watch;
};

/// Result classification (pure)
ExecutionResult Classify(const PhaseOutcome&);
ExecutionResult ClassifyValidation(const ValidationError&);
ExecutionResult ClassifyInfrastructure(const std::string& message);

// Owns the sandbox lifecycle of every request it executes. Holds no mutable state,
// so one instance serves concurrent requests.
class Orchestrator {
  const Config& config_;
  const LanguageRegistry& registry_;
  SandboxLauncher& launcher_;

  PhaseOutcome RunPhase_(const LanguageProfile&, Phase, const ValidatedRequest&,
                         const Workspace&, long budget_ms) const;
 public:
  Orchestrator(const Config& config, const LanguageRegistry& registry, SandboxLauncher& launcher) :
      config_(config), registry_(registry), launcher_(launcher) {}

  // Never throws for anything the submitted code or the sandbox runtime does
  ExecutionResult Execute(const ExecutionRequest&) const;

  long TimeBudgetMs(const LanguageProfile&) const;
  long CompileBudgetMs(const LanguageProfile&) const;
};

const char* ErrorKindName(ErrorKind);

#endif  // INCLUDE_EXECBOX_EXECUTION_H_
