#include <execbox/execution.h>

#include <fmt/core.h>

ExecutionResult Classify(const PhaseOutcome& outcome) {
  const WatchResult& watch = outcome.watch;
  ExecutionResult ret;
  ret.out = watch.out;
  ret.err = watch.err;
  ret.duration_ms = watch.duration_ms;
  if (watch.timed_out) {
    // the process was killed, so its status says nothing about the code
    ret.error_kind = ErrorKind::TIMEOUT;
    ret.exit_code = kTimeoutExitCode;
    ret.timed_out = true;
    ret.message = outcome.phase == Phase::COMPILE ?
        "Compilation timed out" : "Execution timed out";
    return ret;
  }
  ret.exit_code = watch.exit_code;
  if (watch.cause == StopCause::WATCH_ERROR && watch.exit_code < 0) {
    ret.error_kind = ErrorKind::INFRASTRUCTURE;
    ret.exit_code = kNoExitCode;
    ret.message = fmt::format("Lost track of the {} phase", PhaseName(outcome.phase));
    return ret;
  }
  if (watch.cause == StopCause::OUTPUT_LIMIT) {
    // stopped by us after the cap's grace period; the kill status is ours, not the program's
    ret.exit_code = kNoExitCode;
    if (outcome.phase == Phase::COMPILE) {
      ret.error_kind = ErrorKind::COMPILE;
      ret.message = "Compiler output limit reached";
    } else {
      ret.error_kind = ErrorKind::NONE;
      ret.message = "Output limit reached; process stopped";
    }
    return ret;
  }
  if (watch.exit_code == 0) {
    ret.error_kind = ErrorKind::NONE;
  } else if (outcome.phase == Phase::COMPILE) {
    ret.error_kind = ErrorKind::COMPILE;
  } else {
    ret.error_kind = ErrorKind::RUNTIME;
  }
  return ret;
}

ExecutionResult ClassifyValidation(const ValidationError& error) {
  ExecutionResult ret;
  ret.error_kind = ErrorKind::VALIDATION;
  ret.exit_code = kNoExitCode;
  ret.message = error.message;
  return ret;
}

ExecutionResult ClassifyInfrastructure(const std::string& message) {
  ExecutionResult ret;
  ret.error_kind = ErrorKind::INFRASTRUCTURE;
  ret.exit_code = kNoExitCode;
  ret.message = message;
  return ret;
}
