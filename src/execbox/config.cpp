#include <execbox/config.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <execbox/utils.h>
#include <execbox/language.h>

namespace {

bool ParseLong(const char* str, long& val) {
  char* end = nullptr;
  errno = 0;
  long ret = strtol(str, &end, 10);
  if (errno || end == str || *end) return false;
  val = ret;
  return true;
}

template <class T>
bool EnvNumber(const char* name, T& val) {
  const char* str = getenv(name);
  if (!str) return true;
  long parsed;
  if (!ParseLong(str, parsed)) {
    spdlog::error("Invalid value of {}: {}", name, str);
    return false;
  }
  val = parsed;
  return true;
}

void EnvString(const char* name, std::string& val) {
  if (const char* str = getenv(name); str && *str) val = str;
}

} // namespace

bool LoadConfigFile(const fs::path& conf_path, Config& config) {
  std::ifstream fin(conf_path);
  if (!fin) {
    spdlog::error("Cannot open configuration file {}", conf_path.c_str());
    return false;
  }
  tortellini::ini ini;
  fin >> ini;
  auto&& global = ini[""];
  config.execution_timeout_ms = global["execution_timeout_ms"] | config.execution_timeout_ms;
  config.memory_limit = global["memory_limit"] | config.memory_limit;
  config.max_code_size = global["max_code_size_bytes"] | config.max_code_size;
  config.max_output_bytes = global["max_output_bytes"] | config.max_output_bytes;
  config.max_input_bytes = global["max_input_bytes"] | config.max_input_bytes;
  config.output_grace_ms = global["output_grace_ms"] | config.output_grace_ms;
  config.runtime_call_timeout_ms = global["runtime_call_timeout_ms"] | config.runtime_call_timeout_ms;
  config.pids_limit = global["pids_limit"] | config.pids_limit;
  config.cpu_shares = global["cpu_shares"] | config.cpu_shares;
  config.scratch_size = global["scratch_size"] | config.scratch_size;
  config.sandbox_user = global["sandbox_user"] | config.sandbox_user;
  config.runtime = global["runtime"] | config.runtime;
  std::string box_root = global["box_root"] | "";
  if (box_root.size()) config.box_root = box_root;
  config.host = global["host"] | config.host;
  config.port = global["port"] | config.port;
  config.parallel = global["parallel"] | config.parallel;

  for (auto& profile : BuiltinProfiles()) {
    std::string name = LanguageName(profile.id);
    auto&& section = ini[name];
    LanguageOverride over;
    over.image = section["image"] | "";
    over.timeout_ms = section["timeout_ms"] | 0L;
    over.memory_limit = section["memory_limit"] | "";
    over.compile_time_budget_fraction = section["compile_time_budget_fraction"] | 0.0;
    over.compile_timeout_ms = section["compile_timeout_ms"] | 0L;
    if (over.image.empty() && !over.timeout_ms && over.memory_limit.empty() &&
        !over.compile_time_budget_fraction && !over.compile_timeout_ms) {
      continue;
    }
    config.language_overrides[name] = over;
  }
  return true;
}

bool LoadConfigEnv(Config& config) {
  bool ok = true;
  ok &= EnvNumber("EXECUTION_TIMEOUT_MS", config.execution_timeout_ms);
  ok &= EnvNumber("MAX_CODE_SIZE_BYTES", config.max_code_size);
  ok &= EnvNumber("MAX_OUTPUT_BYTES", config.max_output_bytes);
  ok &= EnvNumber("MAX_INPUT_BYTES", config.max_input_bytes);
  ok &= EnvNumber("PORT", config.port);
  EnvString("MEMORY_LIMIT", config.memory_limit);
  EnvString("CONTAINER_RUNTIME", config.runtime);
  return ok;
}

bool CheckConfig(const Config& config) {
  bool ok = true;
  auto Fail = [&ok](const std::string& msg) {
    spdlog::error("Invalid configuration: {}", msg);
    ok = false;
  };
  if (config.execution_timeout_ms <= 0) Fail("execution_timeout_ms must be positive");
  if (config.runtime_call_timeout_ms <= 0) Fail("runtime_call_timeout_ms must be positive");
  if (config.output_grace_ms < 0) Fail("output_grace_ms must not be negative");
  if (config.max_code_size <= 0) Fail("max_code_size_bytes must be positive");
  if (config.max_output_bytes <= 0) Fail("max_output_bytes must be positive");
  if (config.max_input_bytes < 0) Fail("max_input_bytes must not be negative");
  if (ParseByteSize(config.memory_limit) <= 0) Fail("bad memory_limit " + config.memory_limit);
  if (ParseByteSize(config.scratch_size) <= 0) Fail("bad scratch_size " + config.scratch_size);
  if (config.pids_limit <= 0) Fail("pids_limit must be positive");
  if (config.cpu_shares <= 0) Fail("cpu_shares must be positive");
  if (config.runtime.empty()) Fail("runtime must not be empty");
  if (config.box_root.empty()) Fail("box_root must not be empty");
  if (config.port <= 0 || config.port > 65535) Fail("port out of range");
  if (config.parallel <= 0) Fail("parallel must be positive");
  for (auto& [name, over] : config.language_overrides) {
    if (over.timeout_ms < 0) Fail(name + ".timeout_ms must be positive");
    if (over.compile_timeout_ms < 0) Fail(name + ".compile_timeout_ms must be positive");
    if (over.memory_limit.size() && ParseByteSize(over.memory_limit) <= 0) {
      Fail("bad " + name + ".memory_limit " + over.memory_limit);
    }
    if (over.compile_time_budget_fraction < 0 || over.compile_time_budget_fraction >= 1) {
      Fail(name + ".compile_time_budget_fraction must be in (0, 1)");
    }
  }
  return ok;
}
