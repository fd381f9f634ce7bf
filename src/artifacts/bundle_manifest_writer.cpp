#include "artifacts/bundle_manifest_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace rgwbundle::artifacts {

namespace {

constexpr std::uint64_t kFnv1a64OffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnv1a64Prime = 1099511628211ULL;

struct ManifestFile {
  std::string relative_path;
  std::uintmax_t size_bytes = 0;
  std::string hash_hex;
};

bool ComputeFileFnv1a64(const fs::path& file_path, std::string& hash_hex, std::string& error) {
  std::ifstream in_file(file_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open file for hashing: " + file_path.string();
    return false;
  }

  std::uint64_t hash = kFnv1a64OffsetBasis;
  char buffer[8192];
  while (in_file.good()) {
    in_file.read(buffer, sizeof(buffer));
    const std::streamsize read_count = in_file.gcount();
    for (std::streamsize i = 0; i < read_count; ++i) {
      hash ^= static_cast<std::uint64_t>(static_cast<std::uint8_t>(buffer[i]));
      hash *= kFnv1a64Prime;
    }
  }
  if (!in_file.eof()) {
    error = "failed while reading file for hashing: " + file_path.string();
    return false;
  }

  std::ostringstream out;
  out << std::hex << std::nouppercase << std::setw(16) << std::setfill('0') << hash;
  hash_hex = out.str();
  return true;
}

bool CollectManifestFiles(const fs::path& staging_dir, std::vector<ManifestFile>& files,
                          std::string& error) {
  files.clear();
  std::error_code ec;
  fs::recursive_directory_iterator it(staging_dir, ec);
  if (ec) {
    error = "failed to enumerate staging directory '" + staging_dir.string() +
            "': " + ec.message();
    return false;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }
    const fs::path relative = it->path().lexically_relative(staging_dir);

    ManifestFile file;
    file.relative_path = relative.generic_string();
    file.size_bytes = it->file_size(type_ec);
    if (type_ec) {
      error = "failed to read file size: " + it->path().string();
      return false;
    }
    if (!ComputeFileFnv1a64(it->path(), file.hash_hex, error)) {
      return false;
    }
    files.push_back(std::move(file));
  }
  if (ec) {
    error = "failed while enumerating staging directory '" + staging_dir.string() +
            "': " + ec.message();
    return false;
  }

  std::sort(files.begin(), files.end(), [](const ManifestFile& lhs, const ManifestFile& rhs) {
    return lhs.relative_path < rhs.relative_path;
  });
  return true;
}

} // namespace

bool WriteBundleManifestJson(const fs::path& staging_dir, const fs::path& output_path,
                             const BundleManifestInfo& info, std::string& error) {
  if (staging_dir.empty()) {
    error = "staging directory cannot be empty";
    return false;
  }
  if (output_path.empty()) {
    error = "manifest output path cannot be empty";
    return false;
  }
  std::error_code staging_ec;
  std::error_code output_ec;
  const fs::path staging_abs = fs::absolute(staging_dir, staging_ec).lexically_normal();
  const fs::path output_abs = fs::absolute(output_path, output_ec).lexically_normal();
  if (staging_ec || output_ec) {
    error = "failed to resolve manifest paths: " +
            (staging_ec ? staging_ec : output_ec).message();
    return false;
  }
  const fs::path output_rel = output_abs.lexically_relative(staging_abs);
  if (!output_rel.empty() && *output_rel.begin() != "..") {
    error = "manifest output path '" + output_path.string() +
            "' must be outside the staging directory";
    return false;
  }

  std::vector<ManifestFile> files;
  if (!CollectManifestFiles(staging_dir, files, error)) {
    return false;
  }

  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\":\"1.0\",\n"
      << "  \"bundle_id\":\"" << core::EscapeJson(info.bundle_id) << "\",\n"
      << "  \"component\":\"" << core::EscapeJson(info.component) << "\",\n"
      << "  \"machine_id\":\"" << core::EscapeJson(info.machine_id) << "\",\n"
      << "  \"created_at_utc\":\"" << core::FormatUtcTimestamp(info.created_at) << "\",\n"
      << "  \"hash_algorithm\":\"fnv1a_64\",\n"
      << "  \"steps\":[";
  for (std::size_t i = 0; i < info.steps.size(); ++i) {
    const auto& step = info.steps[i];
    out << (i == 0U ? "" : ",") << "\n    {\"name\":\"" << core::EscapeJson(step.name)
        << "\",\"status\":\"" << core::EscapeJson(step.status) << "\",\"detail\":\""
        << core::EscapeJson(step.detail) << "\"}";
  }
  out << "\n  ],\n"
      << "  \"files\":[";
  for (std::size_t i = 0; i < files.size(); ++i) {
    const auto& file = files[i];
    out << (i == 0U ? "" : ",") << "\n    {\"path\":\"" << core::EscapeJson(file.relative_path)
        << "\",\"size_bytes\":" << file.size_bytes << ",\"hash\":\"" << file.hash_hex << "\"}";
  }
  out << "\n  ]\n"
      << "}\n";

  return core::WriteTextFileAtomic(output_path, out.str(), error);
}

} // namespace rgwbundle::artifacts
