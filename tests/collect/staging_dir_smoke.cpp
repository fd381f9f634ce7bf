#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "collect/staging_dir.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using rgwbundle::collect::BuildStagingWorkspace;
  using rgwbundle::collect::ScopedStagingDir;
  using rgwbundle::tests::common::CreateUniqueTempDir;
  using rgwbundle::tests::common::Fail;
  using rgwbundle::tests::common::RemovePathBestEffort;
  using rgwbundle::tests::common::WriteFileOrFail;

  const fs::path root = CreateUniqueTempDir("rgwbundle-staging-dir-smoke");
  const fs::path workspace = BuildStagingWorkspace(root, "rgw", "SB1");
  if (workspace != root / "rgw_SB1") {
    Fail("unexpected staging workspace path");
  }
  if (BuildStagingWorkspace(root, "rgw", "SB2") == workspace) {
    Fail("different bundle ids must not share a workspace");
  }

  std::ostringstream log_output;
  rgwbundle::core::logging::Logger logger(rgwbundle::core::logging::LogLevel::kDebug, log_output);

  // Leftover content from an aborted run is purged.
  WriteFileOrFail(workspace / "rgw" / "stale.log", "stale\n");
  {
    ScopedStagingDir staging(&logger);
    bool purged = false;
    std::string error;
    if (!staging.Create(workspace, "rgw", purged, error)) {
      Fail("Create failed: " + error);
    }
    if (!purged) {
      Fail("leftover workspace must be reported as purged");
    }
    if (staging.Path() != workspace / "rgw" || !fs::is_directory(staging.Path())) {
      Fail("staging directory not created");
    }
    if (fs::exists(staging.Path() / "stale.log")) {
      Fail("stale content must be removed");
    }
    if (staging.Create(workspace, "rgw", purged, error)) {
      Fail("second Create on the same guard must fail");
    }
    WriteFileOrFail(staging.Path() / "rgw.conf", "x\n");
  }
  if (fs::exists(workspace)) {
    Fail("destructor must remove the workspace");
  }

  {
    ScopedStagingDir staging;
    bool purged = true;
    std::string error;
    if (!staging.Create(workspace, "rgw", purged, error) || purged) {
      Fail("fresh Create must succeed without purge");
    }
    if (!staging.Remove(error) || !staging.Remove(error)) {
      Fail("Remove must be idempotent");
    }
    if (fs::exists(workspace)) {
      Fail("Remove must delete the workspace");
    }
  }

  RemovePathBestEffort(root);
  return 0;
}
