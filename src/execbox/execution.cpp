#include <execbox/execution.h>

#include <chrono>
#include <cmath>
#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <execbox/utils.h>

namespace {

long ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - since).count();
}

} // namespace

long Orchestrator::TimeBudgetMs(const LanguageProfile& profile) const {
  return profile.timeout_ms > 0 ? profile.timeout_ms : config_.execution_timeout_ms;
}

long Orchestrator::CompileBudgetMs(const LanguageProfile& profile) const {
  if (!profile.HasCompileStep()) return 0;
  if (profile.compile_timeout_ms > 0) return profile.compile_timeout_ms;
  long budget = std::lround(TimeBudgetMs(profile) * profile.compile_time_budget_fraction);
  return std::max(1L, budget);
}

PhaseOutcome Orchestrator::RunPhase_(const LanguageProfile& profile, Phase phase,
                                     const ValidatedRequest& req, const Workspace& ws,
                                     long budget_ms) const {
  std::unique_ptr<SandboxHandle> handle = launcher_.Launch(profile, phase, req.code, ws, budget_ms);
  // the compiler never reads the program's input
  const std::string& input = phase == Phase::RUN ? req.stdin_data : std::string();
  WatchOptions opt{budget_ms, config_.max_output_bytes, config_.output_grace_ms};
  PhaseOutcome ret{phase, WatchProcess(handle->Process(), input, opt, [&handle]() {
    handle->Terminate();
  })};
  spdlog::debug("Sandbox {} {} phase: {} exit={} {}ms", handle->Id(), PhaseName(phase),
      StopCauseName(ret.watch.cause), ret.watch.exit_code, ret.watch.duration_ms);
  if (handle->RuntimeFault(ret.watch)) {
    // the runtime's diagnostic may name host paths; it goes to the log only
    spdlog::error("Sandbox {} {} phase failed in the container runtime: {}", handle->Id(),
        PhaseName(phase), ret.watch.err.data);
    throw SandboxInfrastructureError(
        fmt::format("Container runtime failed to run the {} phase", PhaseName(phase)));
  }
  // handle is destroyed on return, after the watch has ended its processes
  return ret;
}

ExecutionResult Orchestrator::Execute(const ExecutionRequest& req) const {
  const auto start = std::chrono::steady_clock::now();
  auto validated = Validate(req, registry_, config_);
  if (auto err = std::get_if<ValidationError>(&validated)) {
    spdlog::info("Rejected request: {}", err->message);
    ExecutionResult ret = ClassifyValidation(*err);
    ret.duration_ms = ElapsedMs(start);
    return ret;
  }
  const ValidatedRequest& vreq = std::get<ValidatedRequest>(validated);
  const LanguageProfile& profile = *vreq.profile;
  const long budget = TimeBudgetMs(profile);

  ExecutionResult ret;
  try {
    Workspace ws(config_.box_root);
    long remaining = budget;
    PhaseOutcome last{Phase::RUN, WatchResult{}};
    bool run = true;
    if (profile.HasCompileStep()) {
      const auto compile_start = std::chrono::steady_clock::now();
      last = RunPhase_(profile, Phase::COMPILE, vreq, ws, CompileBudgetMs(profile));
      // a fractional compile budget is part of the total, sandbox startup included;
      // an absolute one comes on top of it
      if (profile.compile_timeout_ms <= 0) remaining -= ElapsedMs(compile_start);
      run = !last.watch.timed_out && last.watch.exit_code == 0;
      if (run && remaining <= 0) {
        // compiled, but nothing is left for running
        last.phase = Phase::RUN;
        last.watch.cause = StopCause::TIMEOUT;
        last.watch.timed_out = true;
        run = false;
      }
    }
    if (run) last = RunPhase_(profile, Phase::RUN, vreq, ws, remaining);
    ret = Classify(last);
  } catch (const SandboxInfrastructureError& e) {
    spdlog::error("Sandbox infrastructure failure ({}): {}", LanguageName(profile.id), e.what());
    ret = ClassifyInfrastructure(e.what());
  }
  ret.duration_ms = ElapsedMs(start);
  spdlog::info("Executed {} code: {} exit={} {}ms", LanguageName(profile.id),
      ErrorKindName(ret.error_kind), ret.exit_code, ret.duration_ms);
  return ret;
}
