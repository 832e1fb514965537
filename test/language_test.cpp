#include <gtest/gtest.h>
#include <execbox/utils.h>
#include <execbox/config.h>
#include <execbox/language.h>

TEST(LanguageRegistry, BuiltinKeys) {
  LanguageRegistry registry;
  EXPECT_EQ(registry.Keys(), (std::vector<std::string>{
      "c", "cpp", "css", "go", "html", "java", "javascript", "python", "typescript"}));
  EXPECT_EQ(registry.Size(), 9u);
  EXPECT_EQ(registry.Lookup("ruby"), nullptr);
  EXPECT_EQ(registry.Lookup(""), nullptr);
}

TEST(LanguageRegistry, EveryProfileRunnable) {
  LanguageRegistry registry;
  for (auto& key : registry.Keys()) {
    const LanguageProfile* profile = registry.Lookup(key);
    ASSERT_NE(profile, nullptr);
    EXPECT_EQ(LanguageName(profile->id), key);
    EXPECT_FALSE(profile->run_command.empty()) << key;
    EXPECT_FALSE(profile->image_ref.empty()) << key;
    EXPECT_GT(profile->compile_time_budget_fraction, 0) << key;
    EXPECT_LT(profile->compile_time_budget_fraction, 1) << key;
  }
}

TEST(LanguageRegistry, Shapes) {
  LanguageRegistry registry;
  EXPECT_FALSE(registry.Lookup("python")->HasCompileStep());
  EXPECT_FALSE(registry.Lookup("javascript")->HasCompileStep());
  EXPECT_TRUE(registry.Lookup("cpp")->HasCompileStep());
  EXPECT_TRUE(registry.Lookup("java")->HasCompileStep());
  EXPECT_TRUE(registry.Lookup("typescript")->HasCompileStep());
}

TEST(LanguageRegistry, ProfileWithoutRunCommandSkipped) {
  std::vector<LanguageProfile> profiles(1);
  profiles[0].id = Language::GO;
  LanguageRegistry registry(std::move(profiles));
  EXPECT_EQ(registry.Size(), 0u);
}

TEST(LanguageProfile, Commands) {
  LanguageRegistry registry;
  auto* cpp = registry.Lookup("cpp");
  EXPECT_EQ(cpp->SourceFileName(), "code.cpp");
  EXPECT_EQ(cpp->CompileCommand("/w"),
            (std::vector<std::string>{"g++", "-O2", "-o", "/w/program", "/w/code.cpp"}));
  EXPECT_EQ(cpp->RunCommand("/w"), (std::vector<std::string>{"/w/program"}));

  auto* java = registry.Lookup("java");
  EXPECT_EQ(java->SourceFileName(), "Main.java");
  EXPECT_EQ(java->RunCommand("/w"), (std::vector<std::string>{"java", "-cp", "/w", "Main"}));

  auto* python = registry.Lookup("python");
  EXPECT_EQ(python->RunCommand("/w"), (std::vector<std::string>{"python3", "/w/code.py"}));
}

TEST(LanguageProfile, ExpandCommand) {
  EXPECT_EQ(ExpandCommand({"x{box}y", "{source}", "{box}{box}", "plain"}, "/b", "/b/s.c"),
            (std::vector<std::string>{"x/by", "/b/s.c", "/b/b", "plain"}));
  // substituted text is never expanded again
  EXPECT_EQ(ExpandCommand({"{source}"}, "/b", "/{box}/s"), (std::vector<std::string>{"/{box}/s"}));
}

TEST(LanguageRegistry, ConfigOverrides) {
  Config config;
  config.language_overrides["python"] = LanguageOverride{"my-python", 9000, "512m", 0};
  config.language_overrides["cpp"] = LanguageOverride{"", 0, "", 0.7};
  LanguageRegistry registry = BuildRegistry(config);
  auto* python = registry.Lookup("python");
  EXPECT_EQ(python->image_ref, "my-python");
  EXPECT_EQ(python->timeout_ms, 9000);
  EXPECT_EQ(python->memory_limit, "512m");
  auto* cpp = registry.Lookup("cpp");
  EXPECT_EQ(cpp->image_ref, "code-executor-cpp");
  EXPECT_DOUBLE_EQ(cpp->compile_time_budget_fraction, 0.7);
  EXPECT_EQ(cpp->timeout_ms, 0);
}

TEST(LanguageRegistry, SlowCompilersGetAbsoluteBudget) {
  LanguageRegistry registry;
  EXPECT_GE(registry.Lookup("go")->compile_timeout_ms, 20000);
  EXPECT_GE(registry.Lookup("java")->compile_timeout_ms, 10000);
  EXPECT_GE(registry.Lookup("typescript")->compile_timeout_ms, 10000);
  EXPECT_EQ(registry.Lookup("cpp")->compile_timeout_ms, 0);
  EXPECT_EQ(registry.Lookup("python")->compile_timeout_ms, 0);
}

TEST(LanguageRegistry, CompileBudgetOverrides) {
  Config config;
  LanguageOverride go;
  go.compile_timeout_ms = 30000;
  config.language_overrides["go"] = go;
  LanguageOverride java;
  java.compile_time_budget_fraction = 0.6;
  config.language_overrides["java"] = java;
  LanguageRegistry registry = BuildRegistry(config);
  EXPECT_EQ(registry.Lookup("go")->compile_timeout_ms, 30000);
  // a configured fraction replaces the built-in absolute budget
  EXPECT_EQ(registry.Lookup("java")->compile_timeout_ms, 0);
  EXPECT_DOUBLE_EQ(registry.Lookup("java")->compile_time_budget_fraction, 0.6);
}

TEST(Language, Names) {
  Language lang;
  EXPECT_TRUE(GetLanguage("typescript", lang));
  EXPECT_EQ(lang, Language::TYPESCRIPT);
  EXPECT_FALSE(GetLanguage("cobol", lang));
  EXPECT_STREQ(LanguageName(Language::CPP), "cpp");
}
