#include "collect/package_query.hpp"

#include <cstdio>
#include <memory>
#include <utility>

#include <sys/wait.h>

namespace rgwbundle::collect {

namespace {

struct PipeCloser {
  int* status = nullptr;
  void operator()(FILE* pipe) const {
    const int raw_status = pclose(pipe);
    if (status != nullptr) {
      *status = raw_status;
    }
  }
};

} // namespace

std::string ShellQuote(const std::string& text) {
  std::string quoted = "'";
  for (const char c : text) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

ShellPackageQuery::ShellPackageQuery(std::string command, std::chrono::seconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

std::string ShellPackageQuery::Describe() const {
  return command_;
}

std::string ShellPackageQuery::BuildShellCommand() const {
  return "timeout --kill-after=5s " + std::to_string(timeout_.count()) + "s /bin/sh -c " +
         ShellQuote(command_) + " 2>/dev/null";
}

bool ShellPackageQuery::Run(PackageQueryResult& result, std::string& error) {
  result = PackageQueryResult{};
  if (command_.empty()) {
    error = "package query command cannot be empty";
    return false;
  }

  const std::string shell_command = BuildShellCommand();
  int raw_status = -1;
  {
    std::unique_ptr<FILE, PipeCloser> pipe(popen(shell_command.c_str(), "r"),
                                           PipeCloser{&raw_status});
    if (!pipe) {
      error = "failed to execute package query: " + command_;
      return false;
    }

    char buffer[4096];
    std::size_t read_count = 0;
    while ((read_count = std::fread(buffer, 1, sizeof(buffer), pipe.get())) > 0U) {
      result.output.append(buffer, read_count);
    }
  }

  if (raw_status == -1) {
    error = "failed to collect package query status: " + command_;
    return false;
  }
  if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    result.exit_code = 128 + WTERMSIG(raw_status);
  } else {
    result.exit_code = raw_status;
  }
  // timeout(1) exits 124 on expiry and 137 when it had to SIGKILL.
  result.timed_out = result.exit_code == kTimeoutExitCode || result.exit_code == 137;
  return true;
}

} // namespace rgwbundle::collect
