#include "server.h"

#include <ctime>
#include <chrono>
#include <fmt/core.h>
#include <fmt/chrono.h>
#include <spdlog/spdlog.h>
#include <execbox/utils.h>

namespace {

using nlohmann::json;

const char kJSONType[] = "application/json";
// escaping may blow a string up to six times its size
constexpr size_t kJSONExpansion = 6;
constexpr size_t kJSONOverhead = 4096;

std::string ISOTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  long ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", tm, ms);
}

void SetJSON(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), kJSONType);
}

void ErrorResponse(httplib::Response& res, int status, const std::string& msg) {
  ExecutionResult result;
  result.error_kind = status < 500 ? ErrorKind::VALIDATION : ErrorKind::INFRASTRUCTURE;
  result.message = msg;
  SetJSON(res, status, ResultToJSON(result));
}

template <class Func>
httplib::Server::Handler Guarded(Func&& func) {
  return [func = std::forward<Func>(func)](const httplib::Request& req, httplib::Response& res) {
    try {
      func(req, res);
    } catch (const std::exception& e) {
      spdlog::error("Unhandled error on {} {}: {}", req.method, req.path, e.what());
      ErrorResponse(res, 500, "Internal server error");
    }
  };
}

} // namespace

std::optional<std::string> ParseRequestBody(const std::string& body, ExecutionRequest& req) {
  json data;
  try {
    data = json::parse(body);
  } catch (json::exception& err) {
    spdlog::debug("JSON decoding error: {}", err.what());
    return "Invalid JSON body";
  }
  if (!data.is_object()) return "Request body must be an object";
  auto GetString = [&data](const char* key, std::string& val) -> std::optional<std::string> {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) return fmt::format("'{}' must be a string", key);
    val = it->get<std::string>();
    return std::nullopt;
  };
  if (auto err = GetString("code", req.code)) return err;
  if (auto err = GetString("language", req.language)) return err;
  std::string input;
  if (auto err = GetString("input", input)) return err;
  if (data.contains("input") && !data["input"].is_null()) req.stdin_data = std::move(input);
  return std::nullopt;
}

nlohmann::json ResultToJSON(const ExecutionResult& result) {
  json ret{
    {"stdout", result.out.data},
    {"stderr", result.err.data},
    {"executionTime", result.duration_ms},
    {"exitCode", result.exit_code},
    {"errorKind", ErrorKindName(result.error_kind)},
    {"stdoutTruncated", result.out.truncated},
    {"stderrTruncated", result.err.truncated},
  };
  if (result.timed_out) ret["timeout"] = true;
  switch (result.error_kind) {
    case ErrorKind::VALIDATION:
    case ErrorKind::TIMEOUT:
    case ErrorKind::INFRASTRUCTURE:
      ret["error"] = result.message;
      break;
    default: break;
  }
  return ret;
}

int HttpStatus(const ExecutionResult& result) {
  switch (result.error_kind) {
    case ErrorKind::VALIDATION: return 400;
    case ErrorKind::INFRASTRUCTURE: return 500;
    default: return 200;
  }
}

nlohmann::json HealthJSON() {
  return json{{"status", "ok"}, {"service", "code-execution"}, {"timestamp", ISOTimestamp()}};
}

nlohmann::json LanguagesJSON(const LanguageRegistry& registry) {
  return json{{"languages", registry.Keys()}};
}

size_t MaxPayloadLength(const Config& config) {
  return (config.max_code_size + config.max_input_bytes) * kJSONExpansion + kJSONOverhead;
}

void RegisterRoutes(httplib::Server& svr, const Orchestrator& orchestrator,
                    const LanguageRegistry& registry, const Config& config) {
  auto execute = Guarded([&orchestrator](const httplib::Request& req, httplib::Response& res) {
    ExecutionRequest request;
    if (auto err = ParseRequestBody(req.body, request)) {
      ErrorResponse(res, 400, "Invalid request body: " + *err);
      return;
    }
    ExecutionResult result = orchestrator.Execute(request);
    SetJSON(res, HttpStatus(result), ResultToJSON(result));
  });
  auto languages = Guarded([&registry](const httplib::Request&, httplib::Response& res) {
    SetJSON(res, 200, LanguagesJSON(registry));
  });
  auto health = Guarded([](const httplib::Request&, httplib::Response& res) {
    SetJSON(res, 200, HealthJSON());
  });
  svr.Post("/execute", execute);
  svr.Post("/api/execute", execute);
  svr.Get("/languages", languages);
  svr.Get("/api/execute/languages", languages);
  svr.Get("/health", health);
  svr.Get("/api/execute/health", health);
  svr.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
  });

  svr.set_default_headers({
    {"Access-Control-Allow-Origin", "*"},
    {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
    {"Access-Control-Allow-Headers", "Content-Type"},
  });
  svr.set_payload_max_length(MaxPayloadLength(config));
  // statuses set by httplib itself (unknown route, oversized payload) come without a body
  svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
    if (!res.body.empty()) return;
    ErrorResponse(res, res.status,
        fmt::format("{} {} failed with HTTP status {}", req.method, req.path, res.status));
  });
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {}", req.method, req.path, res.status);
  });
}

bool ServerWorkLoop(httplib::Server& svr, const Orchestrator& orchestrator,
                    const LanguageRegistry& registry, const Config& config) {
  const size_t parallel = config.parallel;
  svr.new_task_queue = [parallel] { return new httplib::ThreadPool(parallel); };
  RegisterRoutes(svr, orchestrator, registry, config);
  spdlog::info("Listening on {}:{} with {} workers", config.host, config.port, parallel);
  if (!svr.listen(config.host.c_str(), config.port)) {
    spdlog::error("Cannot listen on {}:{}", config.host, config.port);
    return false;
  }
  return true;
}
