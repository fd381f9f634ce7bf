#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace rgwbundle::artifacts {

struct ManifestStep {
  std::string name;
  std::string status;
  std::string detail;
};

struct BundleManifestInfo {
  std::string bundle_id;
  std::string component;
  std::string machine_id;
  std::chrono::system_clock::time_point created_at{};
  std::vector<ManifestStep> steps;
};

// Writes the JSON manifest describing a staged bundle to `output_path`.
//
// Contract:
// - every regular file under `staging_dir` (recursively) is listed with its
//   path relative to `staging_dir`, size and FNV-1a 64-bit hash
// - files are sorted by relative path; steps keep the order given
// - `output_path` must lie outside `staging_dir` so the manifest never
//   describes or archives itself
// - returns false on failure and populates `error`
bool WriteBundleManifestJson(const std::filesystem::path& staging_dir,
                             const std::filesystem::path& output_path,
                             const BundleManifestInfo& info, std::string& error);

} // namespace rgwbundle::artifacts
