#ifndef RGWBUNDLE_CORE_FS_UTILS_HPP_
#define RGWBUNDLE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace rgwbundle::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }
  return EnsureDirectory(parent_dir, error);
}

// Recursive delete that treats "already gone" as success.
inline bool RemoveTreeIfExists(const std::filesystem::path& path, std::string& error) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    error = "failed to remove '" + path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Copies one regular file into `dest_dir`, keeping its file name. An existing
// destination is overwritten.
inline bool CopyFileInto(const std::filesystem::path& source, const std::filesystem::path& dest_dir,
                         std::string& error) {
  std::error_code ec;
  std::filesystem::copy_file(source, dest_dir / source.filename(),
                             std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    error = "failed to copy '" + source.string() + "' into '" + dest_dir.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

// Mirrors the tree under `source_dir` into `dest_dir` (created if missing).
// `source_dir` itself may be a symlink to a directory; links found below it
// are copied as links, not followed.
inline bool CopyTree(const std::filesystem::path& source_dir, const std::filesystem::path& dest_dir,
                     std::string& error) {
  std::error_code ec;
  const std::filesystem::path resolved = std::filesystem::canonical(source_dir, ec);
  if (ec) {
    error = "failed to resolve '" + source_dir.string() + "': " + ec.message();
    return false;
  }
  if (!EnsureDirectory(dest_dir, error)) {
    return false;
  }

  std::filesystem::copy(resolved, dest_dir,
                        std::filesystem::copy_options::recursive |
                            std::filesystem::copy_options::copy_symlinks |
                            std::filesystem::copy_options::overwrite_existing,
                        ec);
  if (ec) {
    error = "failed to copy tree '" + source_dir.string() + "' into '" + dest_dir.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

// Best-effort atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// If rename-over-existing fails we retry after removing the destination, and
// never leave the temporary file behind.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace rgwbundle::core

#endif // RGWBUNDLE_CORE_FS_UTILS_HPP_
