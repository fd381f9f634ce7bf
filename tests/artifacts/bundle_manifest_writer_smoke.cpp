#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "artifacts/bundle_manifest_writer.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace {

std::size_t CountOccurrences(std::string_view text, std::string_view needle) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t match = text.find(needle, pos);
    if (match == std::string_view::npos) {
      break;
    }
    ++count;
    pos = match + needle.size();
  }
  return count;
}

} // namespace

int main() {
  using rgwbundle::tests::common::AssertContains;
  using rgwbundle::tests::common::AssertNotContains;
  using rgwbundle::tests::common::CreateUniqueTempDir;
  using rgwbundle::tests::common::Fail;
  using rgwbundle::tests::common::ReadFileToString;
  using rgwbundle::tests::common::RemovePathBestEffort;
  using rgwbundle::tests::common::WriteFileOrFail;

  const fs::path root = CreateUniqueTempDir("rgwbundle-manifest-writer-smoke");
  const fs::path staging = root / "rgw";
  WriteFileOrFail(staging / "rgw.conf", "abc");
  WriteFileOrFail(staging / "crash" / "dump-1" / "meta", "{}\n");
  WriteFileOrFail(staging / "cortx-rpms", "cortx-rgw-2.0.0\n");
  const fs::path manifest_path = root / "out" / "rgw_SB.manifest.json";

  rgwbundle::artifacts::BundleManifestInfo info;
  info.bundle_id = "SB\"quoted\"";
  info.component = "rgw";
  info.machine_id = "node-1";
  info.created_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'500));
  info.steps = {
      {"component_config", "collected", "/etc/cortx/config/rgw/node-1/rgw.conf"},
      {"logs", "skipped", "log directory not found"},
      {"crash_dumps", "collected", "/var/lib/ceph/crash\tdump\n"},
  };

  std::string error;
  if (!rgwbundle::artifacts::WriteBundleManifestJson(staging, manifest_path, info, error)) {
    Fail("WriteBundleManifestJson failed: " + error);
  }
  if (fs::exists(staging / "rgw_SB.manifest.json")) {
    Fail("manifest must not be written into the staging directory");
  }

  const std::string json = ReadFileToString(manifest_path);
  AssertContains(json, "\"schema_version\":\"1.0\"");
  AssertContains(json, "\"bundle_id\":\"SB\\\"quoted\\\"\"");
  AssertContains(json, "\"component\":\"rgw\"");
  AssertContains(json, "\"machine_id\":\"node-1\"");
  AssertContains(json, "\"created_at_utc\":\"1970-01-01T00:00:01.500Z\"");
  AssertContains(json, "\"hash_algorithm\":\"fnv1a_64\"");
  AssertContains(json, "{\"name\":\"logs\",\"status\":\"skipped\"");
  AssertContains(json, "\"detail\":\"/var/lib/ceph/crash\\tdump\\n\"");
  // FNV-1a 64 of "abc".
  AssertContains(json,
                 "{\"path\":\"rgw.conf\",\"size_bytes\":3,\"hash\":\"e71fa2190541574b\"}");
  AssertContains(json, "\"path\":\"crash/dump-1/meta\"");
  AssertNotContains(json, "manifest.json");
  if (CountOccurrences(json, "\"path\":") != 3U) {
    Fail("manifest should list exactly three staged files");
  }
  if (json.find("\"path\":\"cortx-rpms\"") > json.find("\"path\":\"rgw.conf\"")) {
    Fail("manifest files must be sorted by path");
  }

  if (rgwbundle::artifacts::WriteBundleManifestJson(root / "absent", manifest_path, info, error)) {
    Fail("missing staging directory must fail");
  }
  // A manifest inside the tree it describes would end up in the archive.
  if (rgwbundle::artifacts::WriteBundleManifestJson(staging, staging / "crash" / "m.json", info,
                                                    error)) {
    Fail("output path inside the staging directory must be rejected");
  }
  AssertContains(error, "outside the staging directory");
  if (fs::exists(staging / "crash" / "m.json")) {
    Fail("rejected manifest must not be written");
  }

  RemovePathBestEffort(root);
  return 0;
}
