#include <signal.h>
#include <iostream>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <execbox/config.h>
#include <execbox/docker.h>
#include <execbox/logger.h>
#include <execbox/language.h>
#include <execbox/execution.h>
#include "server.h"

namespace {

Config ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "execbox-server", EXECBOX_VERSION);
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Execution timeout in milliseconds");
  parser.add_argument("--memory")
    .help("Memory limit of each sandbox, e.g. 256m");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of requests served in parallel");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port to listen on");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }
  SetVerbosity(verbosity);

  Config config;
  if (auto conf_path = parser.present("--config")) {
    if (!LoadConfigFile(*conf_path, config)) {
      spdlog::error("Failed to parse configuration file {}", *conf_path);
      exit(1);
    }
  }
  if (!LoadConfigEnv(config)) exit(1);
  if (auto val = parser.present<long>("--timeout")) config.execution_timeout_ms = *val;
  if (auto val = parser.present("--memory")) config.memory_limit = *val;
  if (auto val = parser.present<int>("--parallel")) config.parallel = *val;
  if (auto val = parser.present("--host")) config.host = *val;
  if (auto val = parser.present<int>("--port")) config.port = *val;
  if (!CheckConfig(config)) exit(1);
  return config;
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  // a sandbox closing its stdin early must not kill the server
  signal(SIGPIPE, SIG_IGN);
  const Config config = ParseArgs(argc, argv);
  if (!PingRuntime(config)) {
    spdlog::warn("Container runtime {} is not reachable; executions will fail until it is", config.runtime);
  } else {
    CleanupStaleSandboxes(config);
  }
  const LanguageRegistry registry = BuildRegistry(config);
  DockerLauncher launcher(config);
  Orchestrator orchestrator(config, registry, launcher);
  httplib::Server svr;
  return ServerWorkLoop(svr, orchestrator, registry, config) ? 0 : 1;
}
