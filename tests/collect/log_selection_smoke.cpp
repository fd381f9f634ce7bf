#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "collect/log_selector.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  using rgwbundle::collect::IsComponentLogName;
  using rgwbundle::tests::common::CreateUniqueTempDir;
  using rgwbundle::tests::common::Fail;
  using rgwbundle::tests::common::RemovePathBestEffort;
  using rgwbundle::tests::common::WriteFileOrFail;

  if (!IsComponentLogName("rgw", "rgw.client.1.log") || !IsComponentLogName("rgw", "rgw_setup.log") ||
      !IsComponentLogName("rgw", "rgw_setup.2024-01-01.log")) {
    Fail("component log names must match");
  }
  if (IsComponentLogName("rgw", "unrelated.txt") || IsComponentLogName("rgw", "rgw.client.1.log.gz") ||
      IsComponentLogName("rgw", "s3.client.log") || IsComponentLogName("rgw", ".rgw.client.log")) {
    Fail("non-component names must not match");
  }

  const fs::path root = CreateUniqueTempDir("rgwbundle-log-selection-smoke");
  WriteFileOrFail(root / "rgw.client.1.log", "a\n");
  WriteFileOrFail(root / "rgw_setup.log", "b\n");
  WriteFileOrFail(root / "unrelated.txt", "c\n");
  // Directories that happen to match, and anything below them, are ignored.
  WriteFileOrFail(root / "rgw.client.old.log" / "rgw.client.2.log", "d\n");

  std::vector<fs::path> selected;
  std::string error;
  if (!rgwbundle::collect::SelectComponentLogs(root, "rgw", selected, error)) {
    Fail("SelectComponentLogs failed: " + error);
  }
  if (selected.size() != 2U) {
    Fail("expected exactly two selected logs");
  }
  if (selected[0].filename() != "rgw.client.1.log" || selected[1].filename() != "rgw_setup.log") {
    Fail("selected logs must be sorted by name");
  }

  if (rgwbundle::collect::SelectComponentLogs(root / "absent", "rgw", selected, error)) {
    Fail("missing log directory must fail");
  }

  RemovePathBestEffort(root);
  return 0;
}
