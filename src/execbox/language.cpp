#include <execbox/language.h>

#include <spdlog/spdlog.h>
#include <execbox/utils.h>
#include <execbox/config.h>

const char kBoxPlaceholder[] = "{box}";
const char kSourcePlaceholder[] = "{source}";

namespace {

const std::string kScratch = "/tmp";
// JVM startup, tsc and a cold Go build cache (std is rebuilt per sandbox) all exceed
// half of the default time limit
constexpr long kSlowCompileMs = 10000;
constexpr long kGoCompileMs = 20000;

LanguageProfile MakeProfile(Language id, const std::string& image, const std::string& ext,
                            std::vector<std::string>&& compile, std::vector<std::string>&& run) {
  LanguageProfile ret;
  ret.id = id;
  ret.image_ref = image;
  ret.source_extension = ext;
  ret.compile_command = std::move(compile);
  ret.run_command = std::move(run);
  return ret;
}

// single pass, so substituted text is never scanned again
std::string ExpandArg(const std::string& arg, const std::string& box, const std::string& source) {
  const std::string box_key = kBoxPlaceholder, source_key = kSourcePlaceholder;
  std::string ret;
  for (size_t pos = 0; pos < arg.size();) {
    if (arg.compare(pos, box_key.size(), box_key) == 0) {
      ret += box;
      pos += box_key.size();
    } else if (arg.compare(pos, source_key.size(), source_key) == 0) {
      ret += source;
      pos += source_key.size();
    } else {
      ret += arg[pos++];
    }
  }
  return ret;
}

} // namespace

std::string LanguageProfile::SourceFileName() const {
  return source_name + source_extension;
}

std::vector<std::string> LanguageProfile::CompileCommand(const std::string& box) const {
  return ExpandCommand(compile_command, box, box + "/" + SourceFileName());
}

std::vector<std::string> LanguageProfile::RunCommand(const std::string& box) const {
  return ExpandCommand(run_command, box, box + "/" + SourceFileName());
}

std::vector<std::string> ExpandCommand(
    const std::vector<std::string>& command_template, const std::string& box, const std::string& source) {
  std::vector<std::string> ret;
  ret.reserve(command_template.size());
  for (auto& arg : command_template) ret.push_back(ExpandArg(arg, box, source));
  return ret;
}

std::vector<LanguageProfile> BuiltinProfiles() {
  const std::string box = kBoxPlaceholder, src = kSourcePlaceholder;
  std::vector<LanguageProfile> ret;
  ret.push_back(MakeProfile(Language::PYTHON, "code-executor-python", ".py",
      {}, {"python3", src}));
  ret.push_back(MakeProfile(Language::JAVASCRIPT, "code-executor-node", ".js",
      {}, {"node", src}));
  ret.push_back(MakeProfile(Language::TYPESCRIPT, "code-executor-node", ".ts",
      {"tsc", "--outDir", box, src}, {"node", box + "/code.js"}));
  ret.back().compile_timeout_ms = kSlowCompileMs;
  {
    auto& java = ret.emplace_back(MakeProfile(Language::JAVA, "code-executor-java", ".java",
        {"javac", "-d", box, src}, {"java", "-cp", box, "Main"}));
    // public class Main must live in Main.java
    java.source_name = "Main";
    java.compile_timeout_ms = kSlowCompileMs;
  }
  ret.push_back(MakeProfile(Language::CPP, "code-executor-cpp", ".cpp",
      {"g++", "-O2", "-o", box + "/program", src}, {box + "/program"}));
  ret.push_back(MakeProfile(Language::C, "code-executor-c", ".c",
      {"gcc", "-O2", "-o", box + "/program", src, "-lm"}, {box + "/program"}));
  {
    auto& go = ret.emplace_back(MakeProfile(Language::GO, "code-executor-go", ".go",
        {"go", "build", "-o", box + "/program", src}, {box + "/program"}));
    go.envs = {"HOME=" + kScratch, "GOCACHE=" + kScratch + "/go-cache"};
    go.compile_timeout_ms = kGoCompileMs;
  }
  ret.push_back(MakeProfile(Language::HTML, "code-executor-node", ".html",
      {}, {"cat", src}));
  ret.push_back(MakeProfile(Language::CSS, "code-executor-node", ".css",
      {}, {"cat", src}));
  return ret;
}

LanguageRegistry::LanguageRegistry() : LanguageRegistry(BuiltinProfiles()) {}

LanguageRegistry::LanguageRegistry(std::vector<LanguageProfile>&& profiles) {
  for (auto& profile : profiles) {
    if (profile.run_command.empty()) {
      spdlog::warn("Language {} has no run command; skipped", LanguageName(profile.id));
      continue;
    }
    std::string key = LanguageName(profile.id);
    if (!profiles_.emplace(key, std::move(profile)).second) {
      spdlog::warn("Duplicate profile for language {}; first one kept", key);
    }
  }
}

const LanguageProfile* LanguageRegistry::Lookup(const std::string& language_id) const {
  auto it = profiles_.find(language_id);
  return it == profiles_.end() ? nullptr : &it->second;
}

std::vector<std::string> LanguageRegistry::Keys() const {
  std::vector<std::string> ret;
  for (auto& i : profiles_) ret.push_back(i.first);
  return ret;
}

LanguageRegistry BuildRegistry(const Config& config) {
  auto profiles = BuiltinProfiles();
  for (auto& profile : profiles) {
    auto it = config.language_overrides.find(LanguageName(profile.id));
    if (it == config.language_overrides.end()) continue;
    const LanguageOverride& over = it->second;
    if (over.image.size()) profile.image_ref = over.image;
    if (over.timeout_ms > 0) profile.timeout_ms = over.timeout_ms;
    if (over.memory_limit.size()) profile.memory_limit = over.memory_limit;
    if (over.compile_time_budget_fraction > 0) {
      profile.compile_time_budget_fraction = over.compile_time_budget_fraction;
      // an explicit fraction replaces the built-in absolute budget
      profile.compile_timeout_ms = 0;
    }
    if (over.compile_timeout_ms > 0) profile.compile_timeout_ms = over.compile_timeout_ms;
    spdlog::info("Language {}: image={} timeout={}ms memory={} compile_fraction={} compile_timeout={}ms",
        it->first, profile.image_ref, profile.timeout_ms, profile.memory_limit,
        profile.compile_time_budget_fraction, profile.compile_timeout_ms);
  }
  return LanguageRegistry(std::move(profiles));
}
