#include "rgwbundle/cli/router.hpp"

#include "collect/bundle_collector.hpp"
#include "collect/interrupt.hpp"
#include "core/errors/exit_codes.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace rgwbundle::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigurationFailed =
    core::errors::ToInt(core::errors::ExitCode::kConfigurationFailed);
constexpr int kExitSourceNotFound = core::errors::ToInt(core::errors::ExitCode::kSourceNotFound);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  rgw_support_bundle -b <bundle_id> [-t <target_dir>] [-c <cluster_conf_uri>]\n"
      << "                     [-s <service>...] [-d <duration>] [--size_limit <size>]\n"
      << "                     [--binlogs <true|false>] [--coredumps <true|false>]\n"
      << "                     [--stacktrace <true|false>] [--modules <list>]\n"
      << "                     [--log-level <debug|info|warn|error>]\n"
      << "\n"
      << "defaults:\n"
      << "  -t " << collect::kDefaultTargetPath << '\n'
      << "  -c " << collect::kDefaultClusterConf << '\n'
      << "  -d P5D, --size_limit 500MB, boolean flags false\n";
}

bool IsFlagToken(std::string_view token) {
  return token.size() > 1U && token.front() == '-';
}

// Options with a required value take the next token verbatim, so values such
// as `-42` or `-dir` are accepted.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

bool TakeBool(const std::vector<std::string_view>& args, std::size_t& i, bool& value,
              std::string& error) {
  std::string raw;
  if (!TakeValue(args, i, raw, error)) {
    return false;
  }
  if (!ParseBoolFlag(raw, value, error)) {
    error = "invalid value for " + std::string(args[i - 1]) + ": " + error;
    return false;
  }
  return true;
}

void AppendServices(std::string_view raw, std::vector<std::string>& services) {
  std::size_t start = 0;
  while (start <= raw.size()) {
    const std::size_t comma = raw.find(',', start);
    const std::size_t end = comma == std::string_view::npos ? raw.size() : comma;
    if (end > start) {
      services.emplace_back(raw.substr(start, end - start));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
}

int ExitCodeFor(collect::ErrorKind kind) {
  switch (kind) {
  case collect::ErrorKind::kNone:
    return kExitSuccess;
  case collect::ErrorKind::kConfiguration:
    return kExitConfigurationFailed;
  case collect::ErrorKind::kNotFound:
    return kExitSourceNotFound;
  case collect::ErrorKind::kArgument:
    return kExitUsage;
  case collect::ErrorKind::kInterrupted:
  case collect::ErrorKind::kIo:
    return kExitFailure;
  }
  return kExitFailure;
}

} // namespace

bool ParseBoolFlag(std::string_view raw, bool& value, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "true") {
    value = true;
    return true;
  }
  if (normalized == "false") {
    value = false;
    return true;
  }
  error = "expected true or false, got '" + std::string(raw) + "'";
  return false;
}

bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "-h" || token == "--help") {
      options.show_help = true;
      continue;
    }
    if (token == "-b") {
      if (!TakeValue(args, i, options.bundle_id, error)) {
        return false;
      }
      continue;
    }
    if (token == "-t") {
      if (!TakeValue(args, i, options.target_path, error)) {
        return false;
      }
      continue;
    }
    if (token == "-c") {
      if (!TakeValue(args, i, options.cluster_conf, error)) {
        return false;
      }
      continue;
    }
    if (token == "-s" || token == "--services") {
      // Consumes every following non-flag token.
      bool any = false;
      while (i + 1 < args.size() && !IsFlagToken(args[i + 1])) {
        AppendServices(args[i + 1], options.services);
        any = true;
        ++i;
      }
      if (!any) {
        error = "missing value for " + std::string(token);
        return false;
      }
      continue;
    }
    if (token == "-d" || token == "--duration") {
      if (!TakeValue(args, i, options.duration, error)) {
        return false;
      }
      continue;
    }
    if (token == "--size_limit") {
      if (!TakeValue(args, i, options.size_limit, error)) {
        return false;
      }
      continue;
    }
    if (token == "--binlogs") {
      if (!TakeBool(args, i, options.binlogs, error)) {
        return false;
      }
      continue;
    }
    if (token == "--coredumps") {
      if (!TakeBool(args, i, options.coredumps, error)) {
        return false;
      }
      continue;
    }
    if (token == "--stacktrace") {
      if (!TakeBool(args, i, options.stacktrace, error)) {
        return false;
      }
      continue;
    }
    if (token == "--modules") {
      if (!TakeValue(args, i, options.modules, error)) {
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      std::string raw;
      if (!TakeValue(args, i, raw, error)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(raw, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (IsFlagToken(token)) {
      error = "unknown option: " + std::string(token);
    } else {
      error = "unexpected argument: " + std::string(token);
    }
    return false;
  }

  if (options.show_help) {
    return true;
  }
  if (options.bundle_id.empty()) {
    error = "missing required option -b <bundle_id>";
    return false;
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  CliOptions options;
  std::string error;
  if (!ParseCliOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetBundleId(options.bundle_id);
  logger.Debug("accepted pass-through options",
               {{"services", std::to_string(options.services.size())},
                {"duration", options.duration},
                {"size_limit", options.size_limit},
                {"binlogs", options.binlogs ? "true" : "false"},
                {"stacktrace", options.stacktrace ? "true" : "false"},
                {"modules", options.modules}});

  collect::BundleRequest request;
  request.bundle_id = options.bundle_id;
  request.target_path = options.target_path;
  request.cluster_conf = options.cluster_conf;
  request.include_coredumps = options.coredumps;

  // Handlers stay installed until the collector has cleaned up after itself.
  collect::ScopedInterruptHandler interrupt_guard;
  collect::BundleCollector collector(collect::DefaultCollectorSettings(), logger);
  const collect::CollectResult result = collector.Generate(request);

  if (result.ok()) {
    std::cout << "support bundle: " << result.archive_path.string() << '\n';
    std::cout << "manifest: " << result.manifest_path.string() << '\n';
    return kExitSuccess;
  }

  if (result.error_kind == collect::ErrorKind::kInterrupted) {
    logger.Warn("support bundle generation interrupted, staged data and partial archive removed");
    std::cerr << "caution: support bundle generation was interrupted; no archive was produced "
                 "and the collected data is incomplete. Re-run to obtain a complete bundle.\n";
    return kExitFailure;
  }

  if (result.error_kind == collect::ErrorKind::kNotFound) {
    std::cerr << "error: required file not found: " << result.missing_path.string() << '\n';
  } else {
    std::cerr << "error: " << result.error << '\n';
  }
  return ExitCodeFor(result.error_kind);
}

} // namespace rgwbundle::cli
