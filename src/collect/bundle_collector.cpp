#include "collect/bundle_collector.hpp"

#include "artifacts/bundle_manifest_writer.hpp"
#include "artifacts/tar_gz_writer.hpp"
#include "collect/interrupt.hpp"
#include "collect/log_selector.hpp"
#include "collect/staging_dir.hpp"
#include "config/conf_store.hpp"
#include "config/machine_id.hpp"
#include "core/fs_utils.hpp"

#include <cstdlib>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace rgwbundle::collect {

namespace {

constexpr std::string_view kStepResolveConfiguration = "resolve_configuration";
constexpr std::string_view kStepPrepareStaging = "prepare_staging";
constexpr std::string_view kStepComponentConfig = "component_config";
constexpr std::string_view kStepLogs = "logs";
constexpr std::string_view kStepCrashDumps = "crash_dumps";
constexpr std::string_view kStepPackageInventory = "package_inventory";
constexpr std::string_view kStepManifest = "manifest";
constexpr std::string_view kStepArchive = "archive";
constexpr std::string_view kStepCleanup = "cleanup";

const char* EnvOrNull(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return nullptr;
  }
  return raw;
}

bool IsValidBundleId(std::string_view bundle_id) {
  return !bundle_id.empty() && bundle_id != "." && bundle_id != ".." &&
         bundle_id.find('/') == std::string_view::npos &&
         bundle_id.find('\0') == std::string_view::npos;
}

std::string CountDetail(std::size_t count, std::string_view noun) {
  return std::to_string(count) + " " + std::string(noun) + (count == 1U ? "" : "s");
}

} // namespace

const char* ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kConfiguration:
    return "configuration_error";
  case ErrorKind::kNotFound:
    return "not_found";
  case ErrorKind::kArgument:
    return "argument_error";
  case ErrorKind::kInterrupted:
    return "interrupted";
  case ErrorKind::kIo:
    return "io_error";
  }
  return "unknown";
}

const char* ToString(StepStatus status) {
  switch (status) {
  case StepStatus::kCollected:
    return "collected";
  case StepStatus::kSkipped:
    return "skipped";
  case StepStatus::kFatal:
    return "fatal";
  }
  return "unknown";
}

CollectorSettings DefaultCollectorSettings() {
  CollectorSettings settings;
  settings.machine_id_path = config::kDefaultMachineIdPath;

  std::error_code ec;
  fs::path temp_root = fs::temp_directory_path(ec);
  if (ec) {
    temp_root = "/tmp";
  }
  settings.scratch_root = temp_root / kScratchDirName;

  if (const char* value = EnvOrNull(kMachineIdFileEnv); value != nullptr) {
    settings.machine_id_path = value;
  }
  if (const char* value = EnvOrNull(kCrashDirEnv); value != nullptr) {
    settings.crash_dump_dir = value;
  }
  if (const char* value = EnvOrNull(kScratchRootEnv); value != nullptr) {
    settings.scratch_root = value;
  }
  if (const char* value = EnvOrNull(kPackageQueryEnv); value != nullptr) {
    settings.package_query_command = value;
  }
  return settings;
}

fs::path BuildArchivePath(const fs::path& target_path, std::string_view component,
                          std::string_view bundle_id) {
  return target_path / std::string(component) /
         (std::string(component) + "_" + std::string(bundle_id) + ".tar.gz");
}

fs::path BuildManifestPath(const fs::path& target_path, std::string_view component,
                           std::string_view bundle_id) {
  return target_path / std::string(component) /
         (std::string(component) + "_" + std::string(bundle_id) + ".manifest.json");
}

BundleCollector::BundleCollector(CollectorSettings settings, core::logging::Logger& logger,
                                 std::unique_ptr<IPackageQuery> package_query)
    : settings_(std::move(settings)), logger_(logger), package_query_(std::move(package_query)) {
  if (!package_query_) {
    package_query_ = std::make_unique<ShellPackageQuery>(settings_.package_query_command,
                                                         settings_.package_query_timeout);
  }
}

CollectResult BundleCollector::Generate(const BundleRequest& request) {
  CollectResult result;
  logger_.SetBundleId(request.bundle_id);

  if (!IsValidBundleId(request.bundle_id)) {
    Fail(result, kStepResolveConfiguration, ErrorKind::kArgument,
         "bundle id must be a non-empty file name component: '" + request.bundle_id + "'");
    return result;
  }
  if (request.target_path.empty()) {
    Fail(result, kStepResolveConfiguration, ErrorKind::kArgument, "target path cannot be empty");
    return result;
  }

  logger_.Info("support bundle generation requested",
               {{"component", settings_.component},
                {"target_path", request.target_path.string()},
                {"cluster_conf", request.cluster_conf},
                {"coredumps", request.include_coredumps ? "true" : "false"}});

  ResolvedPaths paths;
  if (!ResolveConfiguration(request, paths, result)) {
    return result;
  }
  if (!StopIfInterrupted(kStepPrepareStaging, result)) {
    return result;
  }

  ScopedStagingDir staging(&logger_);
  {
    bool purged_leftover = false;
    std::string error;
    const fs::path workspace =
        BuildStagingWorkspace(settings_.scratch_root, settings_.component, request.bundle_id);
    if (!staging.Create(workspace, settings_.component, purged_leftover, error)) {
      Fail(result, kStepPrepareStaging, ErrorKind::kIo, error);
      return result;
    }
    if (purged_leftover) {
      logger_.Warn("removed staging directory left behind by an earlier run",
                   {{"workspace", workspace.string()}});
    }
    Record(result, kStepPrepareStaging, StepStatus::kCollected, staging.Path().string());
  }

  const fs::path& staging_path = staging.Path();
  const bool collected = CopyComponentConfig(paths, staging_path, result) &&
                         StopIfInterrupted(kStepLogs, result) &&
                         CopyLogs(paths, staging_path, result) &&
                         StopIfInterrupted(kStepCrashDumps, result) &&
                         CopyCrashDumps(request.include_coredumps, staging_path, result) &&
                         StopIfInterrupted(kStepPackageInventory, result) &&
                         CapturePackageInventory(staging_path, result) &&
                         StopIfInterrupted(kStepArchive, result) &&
                         WriteArchive(request, staging_path, result) &&
                         StopIfInterrupted(kStepManifest, result) &&
                         WriteManifest(request, paths, staging_path, result);
  if (!collected) {
    DiscardOutputs(request, result);
  }

  std::string cleanup_error;
  if (!staging.Remove(cleanup_error)) {
    logger_.Error("failed to remove staging directory",
                  {{"workspace", staging.Workspace().string()}, {"error", cleanup_error}});
    if (collected) {
      DiscardOutputs(request, result);
      Fail(result, kStepCleanup, ErrorKind::kIo, cleanup_error);
    }
    return result;
  }

  if (collected) {
    logger_.Info("support bundle generated", {{"archive", result.archive_path.string()},
                                              {"manifest", result.manifest_path.string()}});
  }
  return result;
}

bool BundleCollector::ResolveConfiguration(const BundleRequest& request, ResolvedPaths& paths,
                                           CollectResult& result) {
  std::string error;
  if (!config::ReadMachineId(settings_.machine_id_path, paths.machine_id, error)) {
    return Fail(result, kStepResolveConfiguration, ErrorKind::kConfiguration, error);
  }

  config::ConfStore store;
  if (!config::ConfStore::Open(request.cluster_conf, store, error)) {
    return Fail(result, kStepResolveConfiguration, ErrorKind::kConfiguration,
                "unable to open cluster configuration '" + request.cluster_conf + "': " + error);
  }

  std::string log_base;
  std::string config_base;
  if (!store.Get(settings_.log_base_key, log_base, error) ||
      !store.Get(settings_.config_base_key, config_base, error)) {
    return Fail(result, kStepResolveConfiguration, ErrorKind::kConfiguration, error);
  }
  paths.log_base = log_base;
  paths.config_base = config_base;

  logger_.Debug("configuration resolved", {{"machine_id", paths.machine_id},
                                           {"log_base", log_base},
                                           {"config_base", config_base}});
  Record(result, kStepResolveConfiguration, StepStatus::kCollected, paths.machine_id);
  return true;
}

bool BundleCollector::CopyComponentConfig(const ResolvedPaths& paths, const fs::path& staging,
                                          CollectResult& result) {
  const fs::path config_dir = paths.config_base / settings_.component / paths.machine_id;
  const fs::path source = config_dir / (settings_.component + ".conf");

  std::error_code ec;
  if (!fs::is_regular_file(source, ec) || ec) {
    result.missing_path = source;
    return Fail(result, kStepComponentConfig, ErrorKind::kNotFound,
                "component configuration file not found: " + source.string());
  }

  std::string error;
  if (!core::CopyFileInto(source, staging, error)) {
    return Fail(result, kStepComponentConfig, ErrorKind::kIo, error);
  }
  Record(result, kStepComponentConfig, StepStatus::kCollected, source.string());
  return true;
}

bool BundleCollector::CopyLogs(const ResolvedPaths& paths, const fs::path& staging,
                               CollectResult& result) {
  const fs::path log_dir = paths.log_base / settings_.component / paths.machine_id;

  std::error_code ec;
  if (!fs::is_directory(log_dir, ec) || ec) {
    logger_.Warn("log directory not found, skipping log collection",
                 {{"log_dir", log_dir.string()}});
    Record(result, kStepLogs, StepStatus::kSkipped, "log directory not found: " + log_dir.string());
    return true;
  }

  std::vector<fs::path> logs;
  std::string error;
  if (!SelectComponentLogs(log_dir, settings_.component, logs, error)) {
    return Fail(result, kStepLogs, ErrorKind::kIo, error);
  }
  for (const auto& log : logs) {
    if (!core::CopyFileInto(log, staging, error)) {
      return Fail(result, kStepLogs, ErrorKind::kIo, error);
    }
  }

  logger_.Info("log files collected",
               {{"log_dir", log_dir.string()}, {"count", std::to_string(logs.size())}});
  Record(result, kStepLogs, StepStatus::kCollected, CountDetail(logs.size(), "file"));
  return true;
}

bool BundleCollector::CopyCrashDumps(bool requested, const fs::path& staging,
                                     CollectResult& result) {
  if (!requested) {
    Record(result, kStepCrashDumps, StepStatus::kSkipped, "not requested");
    return true;
  }

  std::error_code ec;
  if (!fs::is_directory(settings_.crash_dump_dir, ec) || ec) {
    logger_.Info("crash dump directory not found, nothing to collect",
                 {{"crash_dir", settings_.crash_dump_dir.string()}});
    Record(result, kStepCrashDumps, StepStatus::kSkipped,
           "crash dump directory not found: " + settings_.crash_dump_dir.string());
    return true;
  }

  std::string error;
  if (!core::CopyTree(settings_.crash_dump_dir, staging / kCrashDumpSubdir, error)) {
    return Fail(result, kStepCrashDumps, ErrorKind::kIo, error);
  }
  logger_.Info("crash dumps collected", {{"crash_dir", settings_.crash_dump_dir.string()}});
  Record(result, kStepCrashDumps, StepStatus::kCollected, settings_.crash_dump_dir.string());
  return true;
}

bool BundleCollector::CapturePackageInventory(const fs::path& staging, CollectResult& result) {
  PackageQueryResult query;
  std::string error;
  if (!package_query_->Run(query, error)) {
    logger_.Warn("package inventory query could not be started",
                 {{"command", package_query_->Describe()}, {"error", error}});
    Record(result, kStepPackageInventory, StepStatus::kSkipped, error);
    return true;
  }
  if (query.timed_out) {
    logger_.Warn("package inventory query timed out",
                 {{"command", package_query_->Describe()}});
    Record(result, kStepPackageInventory, StepStatus::kSkipped, "timed out");
    return true;
  }
  if (query.exit_code != 0) {
    logger_.Debug("package inventory query returned non-zero exit code",
                  {{"command", package_query_->Describe()},
                   {"exit_code", std::to_string(query.exit_code)}});
    Record(result, kStepPackageInventory, StepStatus::kSkipped,
           "exit code " + std::to_string(query.exit_code));
    return true;
  }

  if (!core::WriteTextFileAtomic(staging / kPackageInventoryFileName, query.output, error)) {
    return Fail(result, kStepPackageInventory, ErrorKind::kIo, error);
  }
  Record(result, kStepPackageInventory, StepStatus::kCollected, kPackageInventoryFileName);
  return true;
}

bool BundleCollector::WriteArchive(const BundleRequest& request, const fs::path& staging,
                                   CollectResult& result) {
  std::string error;
  const fs::path archive_dir = request.target_path / settings_.component;
  if (!core::EnsureDirectory(archive_dir, error)) {
    return Fail(result, kStepArchive, ErrorKind::kIo, error);
  }

  const fs::path archive_path =
      BuildArchivePath(request.target_path, settings_.component, request.bundle_id);
  artifacts::TarGzWriteStats stats;
  if (!artifacts::WriteDirectoryTarGz(staging, archive_path, staging.filename().string(), stats,
                                      error, [] { return InterruptRequested(); })) {
    if (stats.interrupted) {
      logger_.Warn("archive creation interrupted, partial archive removed",
                   {{"archive", archive_path.string()}});
      return Fail(result, kStepArchive, ErrorKind::kInterrupted, error);
    }
    return Fail(result, kStepArchive, ErrorKind::kIo, error);
  }

  result.archive_path = archive_path;
  Record(result, kStepArchive, StepStatus::kCollected,
         CountDetail(static_cast<std::size_t>(stats.files), "file") + ", " +
             std::to_string(stats.payload_bytes) + " bytes");
  return true;
}

bool BundleCollector::WriteManifest(const BundleRequest& request, const ResolvedPaths& paths,
                                    const fs::path& staging, CollectResult& result) {
  artifacts::BundleManifestInfo info;
  info.bundle_id = request.bundle_id;
  info.component = settings_.component;
  info.machine_id = paths.machine_id;
  info.created_at = std::chrono::system_clock::now();
  for (const auto& step : result.steps) {
    info.steps.push_back({step.step, ToString(step.status), step.detail});
  }

  const fs::path manifest_path =
      BuildManifestPath(request.target_path, settings_.component, request.bundle_id);
  std::string error;
  if (!artifacts::WriteBundleManifestJson(staging, manifest_path, info, error)) {
    return Fail(result, kStepManifest, ErrorKind::kIo, error);
  }
  result.manifest_path = manifest_path;
  Record(result, kStepManifest, StepStatus::kCollected, manifest_path.filename().string());
  return true;
}

// Removes whatever this run already placed in the target directory. Nothing
// is touched unless the archive step of this run completed.
void BundleCollector::DiscardOutputs(const BundleRequest& request, CollectResult& result) {
  if (result.archive_path.empty()) {
    return;
  }
  const fs::path outputs[] = {
      BuildArchivePath(request.target_path, settings_.component, request.bundle_id),
      BuildManifestPath(request.target_path, settings_.component, request.bundle_id),
  };
  for (const auto& output : outputs) {
    std::error_code ec;
    (void)fs::remove(output, ec);
    if (ec) {
      logger_.Warn("failed to remove output of an unfinished run",
                   {{"path", output.string()}, {"error", ec.message()}});
    }
  }
  result.archive_path.clear();
  result.manifest_path.clear();
}

bool BundleCollector::StopIfInterrupted(std::string_view next_step, CollectResult& result) {
  if (!InterruptRequested()) {
    return true;
  }
  return Fail(result, next_step, ErrorKind::kInterrupted,
              "collection interrupted before step '" + std::string(next_step) + "'");
}

void BundleCollector::Record(CollectResult& result, std::string_view step, StepStatus status,
                             std::string detail) {
  logger_.Debug("collection step finished",
                {{"step", step}, {"status", ToString(status)}, {"detail", detail}});
  result.steps.push_back({std::string(step), status, std::move(detail)});
}

bool BundleCollector::Fail(CollectResult& result, std::string_view step, ErrorKind kind,
                           std::string error) {
  logger_.Error("collection step failed",
                {{"step", step}, {"kind", ToString(kind)}, {"error", error}});
  result.error_kind = kind;
  result.error = error;
  result.steps.push_back({std::string(step), StepStatus::kFatal, std::move(error)});
  return false;
}

} // namespace rgwbundle::collect
