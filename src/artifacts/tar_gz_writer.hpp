#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace rgwbundle::artifacts {

struct TarGzWriteStats {
  std::uint64_t directories = 0;
  std::uint64_t files = 0;
  std::uint64_t symlinks = 0;
  std::uint64_t payload_bytes = 0;
  bool interrupted = false;
};

// Polled between entries; returning true abandons the archive.
using AbortCheck = std::function<bool()>;

// Writes `source_dir` as a gzip-compressed POSIX ustar archive.
//
// Contract:
// - every entry is named `<root_name>/<path relative to source_dir>`, and the
//   archive starts with a directory entry for `<root_name>/` itself, so
//   extraction reproduces one top-level folder
// - entries are emitted in sorted path order; directories, regular files and
//   symlinks are stored, other file types are rejected
// - names longer than ustar allows use GNU long-name records
// - `archive_path` is truncated, never appended to
// - on failure or abort the partial archive is deleted, `error` explains why
bool WriteDirectoryTarGz(const std::filesystem::path& source_dir,
                         const std::filesystem::path& archive_path, std::string_view root_name,
                         TarGzWriteStats& stats, std::string& error,
                         const AbortCheck& should_abort = {});

} // namespace rgwbundle::artifacts
