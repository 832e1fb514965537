#ifndef INCLUDE_EXECBOX_VALIDATOR_H_
#define INCLUDE_EXECBOX_VALIDATOR_H_

#include <string>
#include <vector>
#include <variant>
#include <optional>

class Config;
class LanguageProfile;
class LanguageRegistry;

struct ExecutionRequest {
  std::string code;
  std::string language;
  std::optional<std::string> stdin_data;
};

#define ENUM_VALIDATION_ERROR_ \
  X(MISSING_CODE, "Code is required") \
  X(MISSING_LANGUAGE, "Language is required") \
  X(UNSUPPORTED_LANGUAGE, "Unsupported language") \
  X(CODE_TOO_LARGE, "Code size exceeds maximum limit") \
  X(INPUT_TOO_LARGE, "Input size exceeds maximum limit")
enum class ValidationErrorKind {
#define X(name, desc) name,
  ENUM_VALIDATION_ERROR_
#undef X
};

struct ValidationError {
  ValidationErrorKind kind;
  std::string message;
};

struct ValidatedRequest {
  const LanguageProfile* profile; // owned by the registry
  std::string code;
  std::string stdin_data;
  std::vector<std::string> audit_flags; // dangerous patterns seen in the code; informational only
};

// No side effects besides logging. Audit hits never reject a request.
std::variant<ValidatedRequest, ValidationError> Validate(
    const ExecutionRequest&, const LanguageRegistry&, const Config&);

std::vector<std::string> ScanDangerousPatterns(const std::string& code);

const char* ValidationErrorDesc(ValidationErrorKind);

#endif  // INCLUDE_EXECBOX_VALIDATOR_H_
