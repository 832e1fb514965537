#ifndef INCLUDE_EXECBOX_CONFIG_H_
#define INCLUDE_EXECBOX_CONFIG_H_

#include <map>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Per-language values from the configuration file; zero/empty keeps the built-in value
struct LanguageOverride {
  std::string image;
  long timeout_ms = 0;
  std::string memory_limit;
  double compile_time_budget_fraction = 0;
  long compile_timeout_ms = 0;
};

class Config {
 public:
  // execution limits
  long execution_timeout_ms;
  std::string memory_limit; // container runtime syntax, e.g. "256m"
  long max_code_size;       // bytes
  long max_output_bytes;    // per stream
  long max_input_bytes;
  long output_grace_ms;     // time allowed to finish after the output cap is hit
  long runtime_call_timeout_ms; // bound on runtime CLI calls other than the sandboxed process itself

  // sandbox policy
  int pids_limit;
  int cpu_shares;
  std::string scratch_size;
  std::string sandbox_user;
  std::string runtime;
  fs::path box_root;

  // server
  std::string host;
  int port;
  int parallel;

  std::map<std::string, LanguageOverride> language_overrides;

  Config() :
      execution_timeout_ms(5000),
      memory_limit("256m"),
      max_code_size(50000),
      max_output_bytes(1000000),
      max_input_bytes(1000000),
      output_grace_ms(500),
      runtime_call_timeout_ms(10000),
      pids_limit(50),
      cpu_shares(512),
      scratch_size("64m"),
      sandbox_user("65534:65534"),
      runtime("docker"),
      box_root("/tmp/execbox"),
      host("0.0.0.0"),
      port(4000),
      parallel(8) {}
};

// Each loader only touches the keys it finds; return false on unreadable file or malformed value
bool LoadConfigFile(const fs::path&, Config&);
bool LoadConfigEnv(Config&);
bool CheckConfig(const Config&);

#endif  // INCLUDE_EXECBOX_CONFIG_H_
