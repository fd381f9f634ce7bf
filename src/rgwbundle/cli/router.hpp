#pragma once

#include "collect/bundle_collector.hpp"
#include "core/logging/logger.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rgwbundle::cli {

// Parsed command line. Only the bundle id, target, cluster configuration and
// coredumps switch influence collection; the remaining options are accepted so
// the orchestrator can pass one uniform argument set to every component.
struct CliOptions {
  std::string bundle_id;
  std::string target_path = collect::kDefaultTargetPath;
  std::string cluster_conf = collect::kDefaultClusterConf;
  std::vector<std::string> services;
  std::string duration = "P5D";
  std::string size_limit = "500MB";
  bool binlogs = false;
  bool coredumps = false;
  bool stacktrace = false;
  std::string modules;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  bool show_help = false;
};

// Accepts exactly `true` or `false` in any letter case.
bool ParseBoolFlag(std::string_view raw, bool& value, std::string& error);

bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     std::string& error);

// Runs one support bundle collection and returns the process exit code:
//   0  => archive written
//   1  => interrupted or failed after valid invocation
//   2  => usage error
//   10 => configuration could not be resolved
//   20 => a required source file is missing
int Dispatch(int argc, char** argv);

} // namespace rgwbundle::cli
