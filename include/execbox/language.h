#ifndef INCLUDE_EXECBOX_LANGUAGE_H_
#define INCLUDE_EXECBOX_LANGUAGE_H_

#include <map>
#include <string>
#include <vector>

#define ENUM_LANGUAGE_ \
  X(PYTHON, "python") \
  X(JAVASCRIPT, "javascript") \
  X(TYPESCRIPT, "typescript") \
  X(JAVA, "java") \
  X(CPP, "cpp") \
  X(C, "c") \
  X(GO, "go") \
  X(HTML, "html") \
  X(CSS, "css")
enum class Language {
#define X(name, id) name,
  ENUM_LANGUAGE_
#undef X
};

class Config;

// Placeholders recognized in command templates
extern const char kBoxPlaceholder[];    // "{box}": work directory inside the sandbox
extern const char kSourcePlaceholder[]; // "{source}": materialized source file

class LanguageProfile {
 public:
  Language id;
  std::string image_ref;
  std::string source_name; // without extension; "code" unless the toolchain insists
  std::string source_extension;
  std::vector<std::string> compile_command; // empty if interpreted
  std::vector<std::string> run_command;
  std::vector<std::string> envs;
  double compile_time_budget_fraction;
  // absolute compile budget granted on top of the run budget; 0 = use the fraction
  long compile_timeout_ms;
  // 0 / empty = use the global configuration
  long timeout_ms;
  std::string memory_limit;

  LanguageProfile() :
      id(Language::PYTHON),
      source_name("code"),
      compile_time_budget_fraction(0.5),
      compile_timeout_ms(0),
      timeout_ms(0) {}

  bool HasCompileStep() const { return !compile_command.empty(); }
  std::string SourceFileName() const;

  // Substitute placeholders; box is the work directory as seen by the process
  std::vector<std::string> CompileCommand(const std::string& box) const;
  std::vector<std::string> RunCommand(const std::string& box) const;
};

// Read-only after construction; safe to share between request threads.
class LanguageRegistry {
  std::map<std::string, LanguageProfile> profiles_;
 public:
  // built-in table
  LanguageRegistry();
  explicit LanguageRegistry(std::vector<LanguageProfile>&& profiles);

  const LanguageProfile* Lookup(const std::string& language_id) const;
  std::vector<std::string> Keys() const;
  size_t Size() const { return profiles_.size(); }
};

std::vector<LanguageProfile> BuiltinProfiles();

// Built-in table with the per-language overrides of the configuration applied
LanguageRegistry BuildRegistry(const Config&);

std::vector<std::string> ExpandCommand(
    const std::vector<std::string>& command_template, const std::string& box, const std::string& source);

#endif  // INCLUDE_EXECBOX_LANGUAGE_H_
