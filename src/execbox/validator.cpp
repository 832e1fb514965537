#include <execbox/validator.h>

#include <regex>
#include <spdlog/spdlog.h>
#include <execbox/config.h>
#include <execbox/language.h>

namespace {

struct AuditPattern {
  const char* name;
  std::regex re;
};

const std::vector<AuditPattern>& AuditPatterns() {
  static const std::vector<AuditPattern> kPatterns = {
    {"eval(", std::regex(R"(\beval\s*\()")},
    {"exec(", std::regex(R"(\bexec\s*\()")},
    {"system(", std::regex(R"(\bsystem\s*\()")},
    {"__import__('os')", std::regex(R"(__import__\s*\(\s*['"]os['"]\s*\))")},
    {"subprocess", std::regex(R"(\bsubprocess\b)")},
    {"backtick", std::regex("`[^`]*`")},
    {"$(", std::regex(R"(\$\()")},
  };
  return kPatterns;
}

ValidationError MakeError(ValidationErrorKind kind) {
  return ValidationError{kind, ValidationErrorDesc(kind)};
}

} // namespace

std::vector<std::string> ScanDangerousPatterns(const std::string& code) {
  std::vector<std::string> ret;
  for (auto& pattern : AuditPatterns()) {
    if (std::regex_search(code, pattern.re)) ret.push_back(pattern.name);
  }
  return ret;
}

std::variant<ValidatedRequest, ValidationError> Validate(
    const ExecutionRequest& req, const LanguageRegistry& registry, const Config& config) {
  if (req.code.empty()) return MakeError(ValidationErrorKind::MISSING_CODE);
  if (req.language.empty()) return MakeError(ValidationErrorKind::MISSING_LANGUAGE);
  const LanguageProfile* profile = registry.Lookup(req.language);
  if (!profile) {
    ValidationError err = MakeError(ValidationErrorKind::UNSUPPORTED_LANGUAGE);
    err.message += ": " + req.language;
    return err;
  }
  if ((long)req.code.size() > config.max_code_size) {
    return MakeError(ValidationErrorKind::CODE_TOO_LARGE);
  }
  if (req.stdin_data && (long)req.stdin_data->size() > config.max_input_bytes) {
    return MakeError(ValidationErrorKind::INPUT_TOO_LARGE);
  }
  ValidatedRequest ret;
  ret.profile = profile;
  ret.code = req.code;
  ret.stdin_data = req.stdin_data.value_or("");
  ret.audit_flags = ScanDangerousPatterns(req.code);
  for (auto& flag : ret.audit_flags) {
    spdlog::info("Potentially dangerous pattern in {} code: {}", req.language, flag);
  }
  return ret;
}
