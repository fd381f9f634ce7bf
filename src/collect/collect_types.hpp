#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace rgwbundle::collect {

// Failure categories surfaced by the collector. The CLI maps each one to a
// process exit code.
enum class ErrorKind {
  kNone,
  kConfiguration,
  kNotFound,
  kArgument,
  kInterrupted,
  kIo,
};

// Result of one collection step.
enum class StepStatus {
  kCollected,
  kSkipped,
  kFatal,
};

struct StepOutcome {
  std::string step;
  StepStatus status = StepStatus::kCollected;
  std::string detail;
};

const char* ToString(ErrorKind kind);
const char* ToString(StepStatus status);

// Everything a caller needs to report one generate() call.
struct CollectResult {
  ErrorKind error_kind = ErrorKind::kNone;
  std::string error;
  // Set for ErrorKind::kNotFound: the source that was expected to exist.
  std::filesystem::path missing_path;
  std::filesystem::path archive_path;
  std::filesystem::path manifest_path;
  std::vector<StepOutcome> steps;

  bool ok() const {
    return error_kind == ErrorKind::kNone;
  }
};

} // namespace rgwbundle::collect
