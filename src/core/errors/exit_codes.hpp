#pragma once

namespace rgwbundle::core::errors {

// Process-exit contract for wrappers that collect bundles across nodes.
//
// - 0 success
// - 1 generic failure, including operator interrupt
// - 2 usage/argument failure
//
// The remaining values classify the fatal collection failures so orchestration
// scripts can branch without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigurationFailed = 10,
  kSourceNotFound = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace rgwbundle::core::errors
