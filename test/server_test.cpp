#include <thread>
#include <chrono>
#include <nlohmann/json.hpp>

#include "utils.h"
#include "server.h"
#include "http_utils.h"

using nlohmann::json;

TEST(ServerJSON, ParseRequestBody) {
  ExecutionRequest req;
  EXPECT_FALSE(ParseRequestBody(R"({"code": "print(1)", "language": "python", "input": "5"})", req));
  EXPECT_EQ(req.code, "print(1)");
  EXPECT_EQ(req.language, "python");
  ASSERT_TRUE(req.stdin_data);
  EXPECT_EQ(*req.stdin_data, "5");

  ExecutionRequest no_input;
  EXPECT_FALSE(ParseRequestBody(R"({"code": "x", "language": "c", "input": null})", no_input));
  EXPECT_FALSE(no_input.stdin_data);

  ExecutionRequest missing;
  EXPECT_FALSE(ParseRequestBody(R"({"language": "c"})", missing));
  EXPECT_TRUE(missing.code.empty());

  ExecutionRequest bad;
  EXPECT_TRUE(ParseRequestBody("{not json", bad));
  EXPECT_TRUE(ParseRequestBody("[1, 2]", bad));
  EXPECT_TRUE(ParseRequestBody(R"({"code": 5, "language": "c"})", bad));
  EXPECT_TRUE(ParseRequestBody(R"({"code": "x", "language": "c", "input": ["a"]})", bad));
}

TEST(ServerJSON, Result) {
  ExecutionResult res;
  res.out.data = "Hello\n";
  res.out.truncated = true;
  res.exit_code = 0;
  res.duration_ms = 42;
  json data = ResultToJSON(res);
  EXPECT_EQ(data["stdout"], "Hello\n");
  EXPECT_EQ(data["stderr"], "");
  EXPECT_EQ(data["executionTime"], 42);
  EXPECT_EQ(data["exitCode"], 0);
  EXPECT_EQ(data["errorKind"], "none");
  EXPECT_EQ(data["stdoutTruncated"], true);
  EXPECT_EQ(data["stderrTruncated"], false);
  EXPECT_FALSE(data.contains("timeout"));
  EXPECT_FALSE(data.contains("error"));
  EXPECT_EQ(HttpStatus(res), 200);
}

TEST(ServerJSON, TimeoutResult) {
  ExecutionResult res;
  res.error_kind = ErrorKind::TIMEOUT;
  res.timed_out = true;
  res.exit_code = kTimeoutExitCode;
  res.message = "Execution timed out";
  json data = ResultToJSON(res);
  EXPECT_EQ(data["timeout"], true);
  EXPECT_EQ(data["exitCode"], kTimeoutExitCode);
  EXPECT_EQ(data["error"], "Execution timed out");
  EXPECT_EQ(HttpStatus(res), 200);
}

TEST(ServerJSON, Status) {
  EXPECT_EQ(HttpStatus(ClassifyValidation({ValidationErrorKind::MISSING_CODE, "Code is required"})), 400);
  EXPECT_EQ(HttpStatus(ClassifyInfrastructure("down")), 500);
  ExecutionResult compile;
  compile.error_kind = ErrorKind::COMPILE;
  EXPECT_EQ(HttpStatus(compile), 200);
  EXPECT_FALSE(ResultToJSON(compile).contains("error"));
}

TEST(ServerJSON, Health) {
  json data = HealthJSON();
  EXPECT_EQ(data["status"], "ok");
  EXPECT_EQ(data["service"], "code-execution");
  std::string ts = data["timestamp"];
  // 2026-01-02T03:04:05.678Z
  EXPECT_EQ(ts.size(), 24u);
  EXPECT_EQ(ts.back(), 'Z');
}

class ServerTest : public LocalSandbox {
 protected:
  httplib::Server svr;
  std::thread thread;
  int port;

  void SetUp() override {
    svr.new_task_queue = [] { return new httplib::ThreadPool(4); };
    RegisterRoutes(svr, orchestrator, registry, config);
    port = svr.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    thread = std::thread([this]() { svr.listen_after_bind(); });
    for (int i = 0; i < 100 && !svr.is_running(); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  void TearDown() override {
    svr.stop();
    if (thread.joinable()) thread.join();
    LocalSandbox::TearDown();
  }

  httplib::Result Post(const std::string& path, const std::string& body) {
    httplib::Client cli("127.0.0.1", port);
    return HTTPRequest<HTTPPost>(cli, path, body, "application/json");
  }
  httplib::Result Get(const std::string& path) {
    httplib::Client cli("127.0.0.1", port);
    return HTTPRequest<HTTPGet>(cli, path);
  }
};

TEST_F(ServerTest, Execute) {
  for (const char* path : {"/execute", "/api/execute"}) {
    auto res = Post(path, R"({"code": "read x; echo hi $x", "language": "python", "input": "there"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json data = json::parse(res->body);
    EXPECT_EQ(data["stdout"], "hi there\n");
    EXPECT_EQ(data["exitCode"], 0);
    EXPECT_EQ(data["errorKind"], "none");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
  }
}

TEST_F(ServerTest, CompileErrorIs200) {
  auto res = Post("/execute", R"({"code": "if then fi", "language": "cpp"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json data = json::parse(res->body);
  EXPECT_EQ(data["errorKind"], "compile");
  EXPECT_NE(data["exitCode"], 0);
  EXPECT_NE(data["stderr"], "");
}

TEST_F(ServerTest, Timeout) {
  config.execution_timeout_ms = 300;
  auto res = Post("/execute", R"({"code": "sleep 10", "language": "python"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  json data = json::parse(res->body);
  EXPECT_EQ(data["timeout"], true);
  EXPECT_EQ(data["exitCode"], kTimeoutExitCode);
  EXPECT_EQ(data["errorKind"], "timeout");
}

TEST_F(ServerTest, BadRequests) {
  auto res = Post("/execute", "{oops");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["errorKind"], "validation");

  res = Post("/execute", R"({"code": "puts 1", "language": "ruby"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["error"], "Unsupported language: ruby");

  res = Post("/execute", R"({"language": "python"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["error"], "Code is required");
  EXPECT_EQ(launcher.Launches(), 0);
}

TEST_F(ServerTest, InfrastructureIs500) {
  launcher.fail_launch = true;
  auto res = Post("/execute", R"({"code": "echo 1", "language": "python"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  json data = json::parse(res->body);
  EXPECT_EQ(data["errorKind"], "infrastructure");
  EXPECT_TRUE(data.contains("error"));
}

TEST_F(ServerTest, Languages) {
  for (const char* path : {"/languages", "/api/execute/languages"}) {
    auto res = Get(path);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["languages"].get<std::vector<std::string>>(),
              (std::vector<std::string>{"cpp", "python"}));
  }
}

TEST_F(ServerTest, Health) {
  for (const char* path : {"/health", "/api/execute/health"}) {
    auto res = Get(path);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["status"], "ok");
  }
}

TEST_F(ServerTest, UnknownRouteIsStructured) {
  auto res = Get("/nope");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  json data = json::parse(res->body);
  EXPECT_EQ(data["errorKind"], "validation");
  EXPECT_NE(data["error"].get<std::string>().find("/nope"), std::string::npos);

  // the route exists for POST only
  res = Get("/execute");
  ASSERT_TRUE(res);
  EXPECT_GE(res->status, 400);
  EXPECT_EQ(json::parse(res->body)["errorKind"], "validation");
}

TEST_F(ServerTest, Preflight) {
  httplib::Client cli("127.0.0.1", port);
  auto res = cli.Options("/execute");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(ServerTest, OversizedPayloadRefused) {
  config.max_code_size = 10;
  config.max_input_bytes = 10;
  svr.set_payload_max_length(MaxPayloadLength(config));
  std::string body = json{{"code", std::string(200000, 'a')}, {"language", "python"}}.dump();
  auto res = Post("/execute", body);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 413);
  json data = json::parse(res->body);
  EXPECT_EQ(data["errorKind"], "validation");
  EXPECT_EQ(data["exitCode"], kNoExitCode);
  EXPECT_FALSE(data["error"].get<std::string>().empty());
  EXPECT_EQ(launcher.Launches(), 0);
}
