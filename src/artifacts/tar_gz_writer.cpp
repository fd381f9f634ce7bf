#include "artifacts/tar_gz_writer.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

#include <sys/stat.h>
#include <zlib.h>

namespace fs = std::filesystem;

namespace rgwbundle::artifacts {

namespace {

constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::size_t kNameFieldSize = 100;
constexpr std::size_t kPrefixFieldSize = 155;

// Window size of 31 selects gzip framing (16) on top of the default 15-bit
// window.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kDefaultMemLevel = 8;

constexpr char kTypeRegular = '0';
constexpr char kTypeSymlink = '2';
constexpr char kTypeDirectory = '5';
constexpr char kTypeGnuLongLink = 'K';
constexpr char kTypeGnuLongName = 'L';
constexpr std::string_view kGnuLongLinkName = "././@LongLink";

enum class EntryKind {
  kDirectory,
  kFile,
  kSymlink,
};

struct TarEntry {
  fs::path source;
  std::string name;
  EntryKind kind = EntryKind::kFile;
  std::string link_target;
  std::uint64_t size = 0;
  std::uint32_t mode = 0;
  std::uint32_t uid = 0;
  std::uint32_t gid = 0;
  std::int64_t mtime = 0;
};

// ustar header field offsets and widths (POSIX.1-1988).
struct HeaderField {
  std::size_t offset;
  std::size_t width;
};
constexpr HeaderField kName{0, 100};
constexpr HeaderField kMode{100, 8};
constexpr HeaderField kUid{108, 8};
constexpr HeaderField kGid{116, 8};
constexpr HeaderField kSize{124, 12};
constexpr HeaderField kMtime{136, 12};
constexpr HeaderField kChecksum{148, 8};
constexpr std::size_t kTypeflagOffset = 156;
constexpr HeaderField kLinkname{157, 100};
constexpr HeaderField kMagic{257, 6};
constexpr HeaderField kVersion{263, 2};
constexpr HeaderField kPrefix{345, 155};

using HeaderBlock = std::array<char, kBlockSize>;

std::string ErrnoText() {
  return std::strerror(errno);
}

class GzipFileSink {
public:
  GzipFileSink() : out_buffer_(kChunkSize) {}

  ~GzipFileSink() {
    Close();
  }

  GzipFileSink(const GzipFileSink&) = delete;
  GzipFileSink& operator=(const GzipFileSink&) = delete;

  bool Open(const fs::path& path, std::string& error) {
    file_ = std::fopen(path.c_str(), "wbe");
    if (file_ == nullptr) {
      error = "failed to open archive output '" + path.string() + "': " + ErrnoText();
      return false;
    }

    std::memset(&stream_, 0, sizeof(stream_));
    stream_.zalloc = Z_NULL;
    stream_.zfree = Z_NULL;
    const int result = deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits,
                                    kDefaultMemLevel, Z_DEFAULT_STRATEGY);
    if (result != Z_OK) {
      error = "failed to initialize gzip stream: zlib error " + std::to_string(result);
      return false;
    }
    deflate_ready_ = true;
    return true;
  }

  bool Write(const char* data, std::size_t size, std::string& error) {
    stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    stream_.avail_in = static_cast<uInt>(size);
    return Pump(Z_NO_FLUSH, error);
  }

  bool Finish(std::string& error) {
    stream_.next_in = Z_NULL;
    stream_.avail_in = 0;
    if (!Pump(Z_FINISH, error)) {
      return false;
    }
    deflateEnd(&stream_);
    deflate_ready_ = false;

    const int close_result = std::fclose(file_);
    file_ = nullptr;
    if (close_result != 0) {
      error = "failed to close archive output: " + ErrnoText();
      return false;
    }
    return true;
  }

  void Close() {
    if (deflate_ready_) {
      deflateEnd(&stream_);
      deflate_ready_ = false;
    }
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

private:
  bool Pump(int flush, std::string& error) {
    int result = Z_OK;
    do {
      stream_.next_out = out_buffer_.data();
      stream_.avail_out = static_cast<uInt>(out_buffer_.size());
      result = deflate(&stream_, flush);
      if (result == Z_STREAM_ERROR) {
        error = "gzip stream error while compressing archive";
        return false;
      }
      const std::size_t produced = out_buffer_.size() - stream_.avail_out;
      if (produced > 0U && std::fwrite(out_buffer_.data(), 1, produced, file_) != produced) {
        error = "failed while writing archive output: " + ErrnoText();
        return false;
      }
    } while (stream_.avail_out == 0U);

    if (flush == Z_FINISH && result != Z_STREAM_END) {
      error = "gzip stream did not complete";
      return false;
    }
    return true;
  }

  FILE* file_ = nullptr;
  z_stream stream_{};
  bool deflate_ready_ = false;
  std::vector<unsigned char> out_buffer_;
};

void PutString(HeaderBlock& block, HeaderField field, std::string_view value) {
  std::memcpy(block.data() + field.offset, value.data(), std::min(field.width, value.size()));
}

// Zero-padded octal followed by NUL. Returns false if the value does not fit.
bool PutOctal(HeaderBlock& block, HeaderField field, std::uint64_t value) {
  const std::size_t digits = field.width - 1U;
  if (digits < 22U && value >= (std::uint64_t{1} << (3U * digits))) {
    return false;
  }
  char text[32];
  std::snprintf(text, sizeof(text), "%0*llo", static_cast<int>(digits),
                static_cast<unsigned long long>(value));
  std::memcpy(block.data() + field.offset, text, digits);
  block[field.offset + digits] = '\0';
  return true;
}

// GNU base-256 encoding for values that overflow the octal field.
void PutBase256(HeaderBlock& block, HeaderField field, std::uint64_t value) {
  char* out = block.data() + field.offset;
  std::memset(out, 0, field.width);
  for (std::size_t i = field.width - 1U; i > 0U; --i) {
    out[i] = static_cast<char>(value & 0xFFU);
    value >>= 8;
  }
  out[0] = static_cast<char>(0x80);
}

void PutNumber(HeaderBlock& block, HeaderField field, std::uint64_t value) {
  if (!PutOctal(block, field, value)) {
    PutBase256(block, field, value);
  }
}

void PutChecksum(HeaderBlock& block) {
  std::memset(block.data() + kChecksum.offset, ' ', kChecksum.width);
  unsigned int sum = 0;
  for (const char c : block) {
    sum += static_cast<unsigned char>(c);
  }
  char text[16];
  std::snprintf(text, sizeof(text), "%06o", sum & 0777777U);
  std::memcpy(block.data() + kChecksum.offset, text, 6);
  block[kChecksum.offset + 6U] = '\0';
  block[kChecksum.offset + 7U] = ' ';
}

// Splits a path that is too long for the name field across prefix/name at a
// '/' boundary, as ustar allows.
bool SplitUstarName(const std::string& full, std::string& prefix, std::string& name) {
  if (full.size() <= kNameFieldSize) {
    prefix.clear();
    name = full;
    return true;
  }

  for (std::size_t pos = full.find('/'); pos != std::string::npos; pos = full.find('/', pos + 1U)) {
    const std::size_t rest = full.size() - pos - 1U;
    if (pos > kPrefixFieldSize) {
      break;
    }
    if (rest > 0U && rest <= kNameFieldSize) {
      prefix = full.substr(0, pos);
      name = full.substr(pos + 1U);
      return true;
    }
  }
  return false;
}

class TarStream {
public:
  explicit TarStream(GzipFileSink& sink) : sink_(sink) {}

  bool WriteEntryHeader(const TarEntry& entry, std::string& error) {
    std::string prefix;
    std::string name;
    if (!SplitUstarName(entry.name, prefix, name)) {
      if (!WriteLongRecord(kTypeGnuLongName, entry.name, error)) {
        return false;
      }
      prefix.clear();
      name = entry.name.substr(0, kNameFieldSize);
    }

    std::string link = entry.link_target;
    if (link.size() > kLinkname.width) {
      if (!WriteLongRecord(kTypeGnuLongLink, link, error)) {
        return false;
      }
      link.resize(kLinkname.width);
    }

    char typeflag = kTypeRegular;
    std::uint64_t size = entry.size;
    if (entry.kind == EntryKind::kDirectory) {
      typeflag = kTypeDirectory;
      size = 0;
    } else if (entry.kind == EntryKind::kSymlink) {
      typeflag = kTypeSymlink;
      size = 0;
    }

    HeaderBlock block{};
    PutString(block, kName, name);
    PutNumber(block, kMode, entry.mode & 07777U);
    PutNumber(block, kUid, entry.uid);
    PutNumber(block, kGid, entry.gid);
    PutNumber(block, kSize, size);
    PutNumber(block, kMtime, static_cast<std::uint64_t>(std::max<std::int64_t>(entry.mtime, 0)));
    block[kTypeflagOffset] = typeflag;
    PutString(block, kLinkname, link);
    PutString(block, kMagic, std::string_view("ustar\0", 6));
    PutString(block, kVersion, "00");
    PutString(block, kPrefix, prefix);
    PutChecksum(block);
    return sink_.Write(block.data(), block.size(), error);
  }

  bool WriteFileData(const TarEntry& entry, std::string& error) {
    std::ifstream input(entry.source, std::ios::binary);
    if (!input) {
      error = "failed to open file for archiving: " + entry.source.string();
      return false;
    }

    std::vector<char> buffer(kChunkSize);
    std::uint64_t total = 0;
    while (input.good()) {
      input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      const std::streamsize read_count = input.gcount();
      if (read_count <= 0) {
        continue;
      }
      total += static_cast<std::uint64_t>(read_count);
      if (total > entry.size) {
        error = "file grew while archiving: " + entry.source.string();
        return false;
      }
      if (!sink_.Write(buffer.data(), static_cast<std::size_t>(read_count), error)) {
        return false;
      }
    }
    if (!input.eof()) {
      error = "failed while reading file for archiving: " + entry.source.string();
      return false;
    }
    if (total != entry.size) {
      error = "file shrank while archiving: " + entry.source.string();
      return false;
    }
    return WritePadding(total, error);
  }

  bool WriteEndOfArchive(std::string& error) {
    const HeaderBlock zero{};
    return sink_.Write(zero.data(), zero.size(), error) &&
           sink_.Write(zero.data(), zero.size(), error);
  }

private:
  bool WriteLongRecord(char typeflag, const std::string& value, std::string& error) {
    HeaderBlock block{};
    PutString(block, kName, kGnuLongLinkName);
    PutNumber(block, kMode, 0);
    PutNumber(block, kUid, 0);
    PutNumber(block, kGid, 0);
    PutNumber(block, kSize, value.size() + 1U);
    PutNumber(block, kMtime, 0);
    block[kTypeflagOffset] = typeflag;
    PutString(block, kMagic, std::string_view("ustar ", 6));
    PutString(block, kVersion, " ");
    PutChecksum(block);
    if (!sink_.Write(block.data(), block.size(), error)) {
      return false;
    }
    if (!sink_.Write(value.c_str(), value.size() + 1U, error)) {
      return false;
    }
    return WritePadding(value.size() + 1U, error);
  }

  bool WritePadding(std::uint64_t written, std::string& error) {
    const std::size_t remainder = static_cast<std::size_t>(written % kBlockSize);
    if (remainder == 0U) {
      return true;
    }
    const HeaderBlock zero{};
    return sink_.Write(zero.data(), kBlockSize - remainder, error);
  }

  GzipFileSink& sink_;
};

bool StatEntry(const fs::path& path, TarEntry& entry, std::string& error) {
  struct stat info{};
  if (::lstat(path.c_str(), &info) != 0) {
    error = "failed to stat '" + path.string() + "': " + ErrnoText();
    return false;
  }

  entry.source = path;
  entry.mode = static_cast<std::uint32_t>(info.st_mode);
  entry.uid = static_cast<std::uint32_t>(info.st_uid);
  entry.gid = static_cast<std::uint32_t>(info.st_gid);
  entry.mtime = static_cast<std::int64_t>(info.st_mtime);

  if (S_ISDIR(info.st_mode)) {
    entry.kind = EntryKind::kDirectory;
    return true;
  }
  if (S_ISREG(info.st_mode)) {
    entry.kind = EntryKind::kFile;
    entry.size = static_cast<std::uint64_t>(info.st_size);
    return true;
  }
  if (S_ISLNK(info.st_mode)) {
    entry.kind = EntryKind::kSymlink;
    std::error_code ec;
    entry.link_target = fs::read_symlink(path, ec).string();
    if (ec) {
      error = "failed to read symlink '" + path.string() + "': " + ec.message();
      return false;
    }
    return true;
  }

  error = "unsupported file type for archiving: " + path.string();
  return false;
}

bool CollectEntries(const fs::path& source_dir, std::string_view root_name,
                    std::vector<TarEntry>& entries, std::string& error) {
  std::error_code ec;
  if (!fs::is_directory(source_dir, ec) || ec) {
    error = "archive source must be an existing directory: " + source_dir.string();
    return false;
  }

  entries.clear();
  TarEntry root;
  if (!StatEntry(source_dir, root, error)) {
    return false;
  }
  root.name = std::string(root_name) + "/";
  entries.push_back(std::move(root));

  fs::recursive_directory_iterator it(source_dir, ec);
  if (ec) {
    error = "failed to enumerate archive source '" + source_dir.string() + "': " + ec.message();
    return false;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    TarEntry entry;
    if (!StatEntry(it->path(), entry, error)) {
      return false;
    }
    entry.name = std::string(root_name) + "/" +
                 it->path().lexically_relative(source_dir).generic_string();
    if (entry.kind == EntryKind::kDirectory) {
      entry.name.push_back('/');
    }
    entries.push_back(std::move(entry));
  }
  if (ec) {
    error = "failed while enumerating archive source '" + source_dir.string() +
            "': " + ec.message();
    return false;
  }

  std::sort(entries.begin(), entries.end(),
            [](const TarEntry& lhs, const TarEntry& rhs) { return lhs.name < rhs.name; });
  return true;
}

bool IsInside(const fs::path& candidate, const fs::path& dir) {
  const fs::path relative = candidate.lexically_normal().lexically_relative(dir.lexically_normal());
  return !relative.empty() && *relative.begin() != "..";
}

bool WriteArchive(const std::vector<TarEntry>& entries, const fs::path& archive_path,
                  TarGzWriteStats& stats, std::string& error, const AbortCheck& should_abort) {
  GzipFileSink sink;
  if (!sink.Open(archive_path, error)) {
    return false;
  }
  TarStream tar(sink);

  for (const auto& entry : entries) {
    if (should_abort && should_abort()) {
      stats.interrupted = true;
      error = "archive creation interrupted";
      return false;
    }
    if (!tar.WriteEntryHeader(entry, error)) {
      return false;
    }
    switch (entry.kind) {
    case EntryKind::kDirectory:
      ++stats.directories;
      break;
    case EntryKind::kSymlink:
      ++stats.symlinks;
      break;
    case EntryKind::kFile:
      if (!tar.WriteFileData(entry, error)) {
        return false;
      }
      ++stats.files;
      stats.payload_bytes += entry.size;
      break;
    }
  }

  return tar.WriteEndOfArchive(error) && sink.Finish(error);
}

} // namespace

bool WriteDirectoryTarGz(const fs::path& source_dir, const fs::path& archive_path,
                         std::string_view root_name, TarGzWriteStats& stats, std::string& error,
                         const AbortCheck& should_abort) {
  stats = TarGzWriteStats{};
  if (root_name.empty() || root_name.find('/') != std::string_view::npos) {
    error = "archive root name must be a single path component";
    return false;
  }
  if (archive_path.empty()) {
    error = "archive path cannot be empty";
    return false;
  }
  if (IsInside(archive_path, source_dir)) {
    error = "archive path must not be inside the archived directory: " + archive_path.string();
    return false;
  }

  std::vector<TarEntry> entries;
  if (!CollectEntries(source_dir, root_name, entries, error)) {
    return false;
  }

  if (!WriteArchive(entries, archive_path, stats, error, should_abort)) {
    std::error_code ec;
    fs::remove(archive_path, ec);
    return false;
  }
  return true;
}

} // namespace rgwbundle::artifacts
