#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  // request bodies carry whole programs
  constexpr size_t kMaxShown = 256;
  if (str.size() <= kMaxShown) return str;
  return fmt::format("{}... ({} bytes)", str.substr(0, kMaxShown), str.size());
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers&) {
  return "";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

bool IsClientError(int code) {
  return code >= 400 && code < 500;
}

} // namespace http_utils
