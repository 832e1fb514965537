#include <signal.h>
#include <fstream>
#include <sstream>
#include <iostream>

#include <httplib.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <execbox/config.h>
#include <execbox/docker.h>
#include <execbox/logger.h>
#include <execbox/execution.h>
#include "http_utils.h"

namespace {

constexpr int kRetries = 3;

bool ReadAll(const std::string& path, std::string& content) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  std::ostringstream ss;
  ss << fin.rdbuf();
  content = ss.str();
  return true;
}

int RunRemote(const std::string& url, const ExecutionRequest& req, long timeout_ms) {
  httplib::Client cli(url);
  // leave room for the sandbox's own timeout and teardown
  cli.set_read_timeout(timeout_ms / 1000 + 30, 0);
  nlohmann::json body{{"code", req.code}, {"language", req.language}};
  if (req.stdin_data) body["input"] = *req.stdin_data;
  auto res = RequestRetry<HTTPPost>(kRetries, cli, "/execute", body.dump(), "application/json");
  if (!res) {
    spdlog::error("Cannot reach {}: {}", url, httplib::to_string(res.error()));
    return 1;
  }
  std::cout << res->body << std::endl;
  try {
    auto data = nlohmann::json::parse(res->body);
    return data.value("errorKind", "") == ErrorKindName(ErrorKind::NONE) ? 0 : 1;
  } catch (nlohmann::json::exception& err) {
    spdlog::error("Unexpected response from {}: {}", url, err.what());
    return 1;
  }
}

int RunLocal(const Config& config, const ExecutionRequest& req) {
  const LanguageRegistry registry = BuildRegistry(config);
  DockerLauncher launcher(config);
  Orchestrator orchestrator(config, registry, launcher);
  ExecutionResult result = orchestrator.Execute(req);
  std::cout << result.out.data << std::flush;
  std::cerr << result.err.data << std::flush;
  if (!result.Succeeded()) {
    std::cerr << fmt::format("[{}] exit code {}{}{}\n", ErrorKindName(result.error_kind), result.exit_code,
                             result.message.empty() ? "" : ": ", result.message);
  }
  if (result.out.truncated || result.err.truncated) std::cerr << "[output truncated]\n";
  spdlog::info("Finished in {}ms", result.duration_ms);
  return result.Succeeded() ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  signal(SIGPIPE, SIG_IGN);
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "execbox-run", EXECBOX_VERSION);
  parser.add_argument("file")
    .help("Source file to run");
  parser.add_argument("-l", "--language")
    .required()
    .help("Language id, e.g. python or cpp");
  parser.add_argument("-i", "--input")
    .help("File fed to the program's standard input");
  parser.add_argument("--server")
    .help("URL of a running execbox-server; run locally if absent");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Execution timeout in milliseconds");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  SetVerbosity(verbosity);

  ExecutionRequest req;
  req.language = parser.get<std::string>("--language");
  std::string file = parser.get<std::string>("file");
  if (!ReadAll(file, req.code)) {
    spdlog::error("Cannot read {}", file);
    return 1;
  }
  if (auto input_file = parser.present("--input")) {
    std::string input;
    if (!ReadAll(*input_file, input)) {
      spdlog::error("Cannot read {}", *input_file);
      return 1;
    }
    req.stdin_data = std::move(input);
  }

  Config config;
  if (auto conf_path = parser.present("--config"); conf_path && !LoadConfigFile(*conf_path, config)) {
    return 1;
  }
  if (!LoadConfigEnv(config)) return 1;
  if (auto val = parser.present<long>("--timeout")) config.execution_timeout_ms = *val;
  if (!CheckConfig(config)) return 1;

  if (auto url = parser.present("--server")) return RunRemote(*url, req, config.execution_timeout_ms);
  return RunLocal(config, req);
}
