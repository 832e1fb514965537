#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Logged HTTP client requests

#include <chrono>
#include <memory>
#include <thread>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);
// 4xx: the same request will fail again
bool IsClientError(int code);

} // namespace http_utils

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Get(endpoint.c_str(), std::forward<T>(params)...);
  }
};
struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint.c_str(), std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  return Method()(cli, endpoint, std::forward<T>(params)...);
}

// Retries connection failures and server errors; a client error is returned at once
template <class Method, class... T>
httplib::Result RequestRetry(int retries, httplib::Client& cli, const std::string& endpoint, T&&... params) {
  using namespace std::chrono_literals;
  std::unique_ptr<httplib::Result> last_res;
  for (int i = 0; i < retries; i++) {
    last_res = std::make_unique<httplib::Result>(HTTPRequest<Method>(cli, endpoint, params...));
    if (*last_res && (http_utils::IsSuccess((*last_res)->status) ||
                      http_utils::IsClientError((*last_res)->status))) {
      return std::move(*last_res);
    }
    spdlog::debug("Error code={} status={}", (int)last_res->error(), *last_res ? (*last_res)->status : -1);
    if (i + 1 < retries) std::this_thread::sleep_for(1s);
  }
  spdlog::warn("Request {} {} failed after {} retries", Method::method_name, endpoint, retries);
  return std::move(*last_res);
}

#endif  // HTTP_UTILS_H_
