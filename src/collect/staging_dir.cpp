#include "collect/staging_dir.hpp"

#include "core/fs_utils.hpp"

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace rgwbundle::collect {

fs::path BuildStagingWorkspace(const fs::path& scratch_root, std::string_view component,
                               std::string_view bundle_id) {
  return scratch_root / (std::string(component) + "_" + std::string(bundle_id));
}

ScopedStagingDir::~ScopedStagingDir() {
  std::string error;
  if (!Remove(error)) {
    if (logger_ != nullptr) {
      logger_->Warn("staging directory cleanup failed",
                    {{"workspace", workspace_.string()}, {"error", error}});
    } else {
      std::cerr << "warning: staging directory cleanup failed: " << error << '\n';
    }
  }
}

bool ScopedStagingDir::Create(const fs::path& workspace, std::string_view base_name,
                              bool& purged_leftover, std::string& error) {
  purged_leftover = false;
  if (workspace.empty() || base_name.empty()) {
    error = "staging workspace and directory name cannot be empty";
    return false;
  }
  if (owned_) {
    error = "staging directory already created: " + path_.string();
    return false;
  }

  std::error_code ec;
  if (fs::exists(workspace, ec)) {
    if (!core::RemoveTreeIfExists(workspace, error)) {
      return false;
    }
    purged_leftover = true;
  }

  const fs::path staging = workspace / std::string(base_name);
  if (!core::EnsureDirectory(staging, error)) {
    return false;
  }

  workspace_ = workspace;
  path_ = staging;
  owned_ = true;
  return true;
}

bool ScopedStagingDir::Remove(std::string& error) {
  if (!owned_) {
    return true;
  }
  if (!core::RemoveTreeIfExists(workspace_, error)) {
    return false;
  }
  owned_ = false;
  return true;
}

} // namespace rgwbundle::collect
