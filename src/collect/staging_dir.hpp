#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace rgwbundle::collect {

// Per-bundle scratch workspace: `<scratch_root>/<component>_<bundle_id>`.
// Two runs with different bundle ids never share a workspace.
std::filesystem::path BuildStagingWorkspace(const std::filesystem::path& scratch_root,
                                            std::string_view component,
                                            std::string_view bundle_id);

// Owns the staging directory `<workspace>/<base_name>` for one collection.
//
// Create() purges whatever an aborted run left at the workspace and makes the
// staging directory fresh. The whole workspace is deleted by Remove() or, at
// the latest, by the destructor, so every exit path leaves nothing behind.
class ScopedStagingDir {
public:
  explicit ScopedStagingDir(core::logging::Logger* logger = nullptr) : logger_(logger) {}
  ~ScopedStagingDir();

  ScopedStagingDir(const ScopedStagingDir&) = delete;
  ScopedStagingDir& operator=(const ScopedStagingDir&) = delete;

  bool Create(const std::filesystem::path& workspace, std::string_view base_name,
              bool& purged_leftover, std::string& error);

  // Deletes the workspace now. Safe to call more than once.
  bool Remove(std::string& error);

  const std::filesystem::path& Path() const {
    return path_;
  }

  const std::filesystem::path& Workspace() const {
    return workspace_;
  }

private:
  std::filesystem::path workspace_;
  std::filesystem::path path_;
  bool owned_ = false;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace rgwbundle::collect
