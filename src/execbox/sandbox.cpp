#include <execbox/sandbox.h>

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <stdlib.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <execbox/language.h>
#include "utils.h"

Workspace::Workspace(const fs::path& root) {
  if (!CreateDirs(root)) {
    throw SandboxInfrastructureError("Cannot create box root " + root.string());
  }
  std::string templ = (root / "box.XXXXXX").string();
  char* res = mkdtemp(templ.data());
  if (!res) {
    throw SandboxInfrastructureError(
        fmt::format("Cannot create workspace in {}: {}", root.c_str(), strerror(errno)));
  }
  path_ = res;
  // the sandbox user is unprivileged and writes the build artifact here
  std::error_code ec;
  fs::permissions(path_, fs::perms::all, ec);
  if (ec) {
    RemoveAll(path_);
    throw SandboxInfrastructureError("Cannot set workspace permissions: " + ec.message());
  }
  spdlog::debug("Workspace {} created", path_.c_str());
}

Workspace::~Workspace() {
  if (!path_.empty()) RemoveAll(path_);
}

fs::path Workspace::SourcePath(const LanguageProfile& profile) const {
  return path_ / profile.SourceFileName();
}

bool Workspace::WriteSource(const LanguageProfile& profile, const std::string& code) const {
  return WriteFile(SourcePath(profile), code, kPerm644);
}

SandboxHandle::SandboxHandle(std::string id, Phase phase, ResourceLimits limits, Subprocess&& process) :
    id_(std::move(id)), phase_(phase), limits_(std::move(limits)),
    started_at_(std::chrono::steady_clock::now()), process_(std::move(process)) {}

SandboxHandle::~SandboxHandle() {
  if (process_.Started() && !process_.Reaped()) {
    process_.Kill(SIGKILL);
    process_.Wait();
  }
  spdlog::debug("Sandbox {} released", id_);
}

void SandboxHandle::Terminate() {
  process_.Kill(SIGKILL);
}
