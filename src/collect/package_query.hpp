#pragma once

#include <chrono>
#include <string>

namespace rgwbundle::collect {

inline constexpr const char* kDefaultPackageQueryCommand = "rpm -qa | grep cortx";
inline constexpr std::chrono::seconds kDefaultPackageQueryTimeout{60};

// Exit status reported by timeout(1) when the wrapped command ran too long.
inline constexpr int kTimeoutExitCode = 124;

struct PackageQueryResult {
  std::string output;
  int exit_code = -1;
  bool timed_out = false;
};

// Installed-package inventory source. The collector only depends on this
// contract so tests can substitute canned inventories.
class IPackageQuery {
public:
  virtual ~IPackageQuery() = default;

  // Returns false only when the query could not be launched at all; a
  // non-zero exit status is reported through `result`.
  virtual bool Run(PackageQueryResult& result, std::string& error) = 0;

  // Human-readable command text for logs.
  virtual std::string Describe() const = 0;
};

// Runs a shell pipeline through `/bin/sh -c`, bounded by timeout(1).
// Only standard output is captured; standard error is discarded.
class ShellPackageQuery : public IPackageQuery {
public:
  explicit ShellPackageQuery(std::string command = kDefaultPackageQueryCommand,
                             std::chrono::seconds timeout = kDefaultPackageQueryTimeout);

  bool Run(PackageQueryResult& result, std::string& error) override;
  std::string Describe() const override;

  // Full command line handed to popen(), exposed for tests.
  std::string BuildShellCommand() const;

private:
  std::string command_;
  std::chrono::seconds timeout_;
};

// Quotes `text` for safe use as a single POSIX shell word.
std::string ShellQuote(const std::string& text);

} // namespace rgwbundle::collect
