#pragma once

#include "collect/collect_types.hpp"
#include "collect/package_query.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace rgwbundle::collect {

inline constexpr const char* kComponentName = "rgw";
inline constexpr const char* kDefaultTargetPath = "/var/cortx/support_bundle/";
inline constexpr const char* kDefaultClusterConf = "yaml:///etc/cortx/cluster.conf";
inline constexpr const char* kLogBaseKey = "cortx>common>storage>log";
inline constexpr const char* kConfigBaseKey = "cortx>common>storage>config";
inline constexpr const char* kDefaultCrashDumpDir = "/var/lib/ceph/crash";
inline constexpr const char* kCrashDumpSubdir = "crash";
inline constexpr const char* kPackageInventoryFileName = "cortx-rpms";
inline constexpr const char* kScratchDirName = "rgw_support_bundle";

// Environment overrides for the fixed host paths, mainly for tests and for
// operators running against a relocated install.
inline constexpr const char* kMachineIdFileEnv = "RGW_SUPPORT_BUNDLE_MACHINE_ID_FILE";
inline constexpr const char* kCrashDirEnv = "RGW_SUPPORT_BUNDLE_CRASH_DIR";
inline constexpr const char* kScratchRootEnv = "RGW_SUPPORT_BUNDLE_SCRATCH_ROOT";
inline constexpr const char* kPackageQueryEnv = "RGW_SUPPORT_BUNDLE_PACKAGE_QUERY";

// Caller-supplied description of one bundle.
struct BundleRequest {
  std::string bundle_id;
  std::filesystem::path target_path = kDefaultTargetPath;
  std::string cluster_conf = kDefaultClusterConf;
  bool include_coredumps = false;
};

// Host paths and keys the collector reads. Defaults match a production node.
struct CollectorSettings {
  std::string component = kComponentName;
  std::filesystem::path machine_id_path;
  std::filesystem::path crash_dump_dir = kDefaultCrashDumpDir;
  std::filesystem::path scratch_root;
  std::string log_base_key = kLogBaseKey;
  std::string config_base_key = kConfigBaseKey;
  std::string package_query_command = kDefaultPackageQueryCommand;
  std::chrono::seconds package_query_timeout = kDefaultPackageQueryTimeout;
};

// Production defaults with the RGW_SUPPORT_BUNDLE_* environment overrides
// applied.
CollectorSettings DefaultCollectorSettings();

// `<target_path>/<component>/<component>_<bundle_id>.tar.gz`
std::filesystem::path BuildArchivePath(const std::filesystem::path& target_path,
                                       std::string_view component, std::string_view bundle_id);

// `<target_path>/<component>/<component>_<bundle_id>.manifest.json`, written
// beside the archive rather than inside it.
std::filesystem::path BuildManifestPath(const std::filesystem::path& target_path,
                                        std::string_view component, std::string_view bundle_id);

// Collects one support bundle per Generate() call.
//
// Steps run strictly in order: resolve configuration, prepare staging, copy
// the component config (fatal if absent), copy logs (skipped with a warning
// if the log directory is absent), copy crash dumps (only when requested),
// capture the package inventory (best effort), archive, then write the
// manifest beside the archive. The staging directory never outlives the call.
// When any step after archiving starts fails or is interrupted, neither the
// archive nor the manifest is left in the target directory.
class BundleCollector {
public:
  // A null `package_query` selects a ShellPackageQuery built from `settings`.
  BundleCollector(CollectorSettings settings, core::logging::Logger& logger,
                  std::unique_ptr<IPackageQuery> package_query = nullptr);

  CollectResult Generate(const BundleRequest& request);

private:
  struct ResolvedPaths {
    std::string machine_id;
    std::filesystem::path log_base;
    std::filesystem::path config_base;
  };

  bool ResolveConfiguration(const BundleRequest& request, ResolvedPaths& paths,
                            CollectResult& result);
  bool CopyComponentConfig(const ResolvedPaths& paths, const std::filesystem::path& staging,
                           CollectResult& result);
  bool CopyLogs(const ResolvedPaths& paths, const std::filesystem::path& staging,
                CollectResult& result);
  bool CopyCrashDumps(bool requested, const std::filesystem::path& staging,
                      CollectResult& result);
  bool CapturePackageInventory(const std::filesystem::path& staging, CollectResult& result);
  bool WriteArchive(const BundleRequest& request, const std::filesystem::path& staging,
                    CollectResult& result);
  bool WriteManifest(const BundleRequest& request, const ResolvedPaths& paths,
                     const std::filesystem::path& staging, CollectResult& result);
  void DiscardOutputs(const BundleRequest& request, CollectResult& result);

  bool StopIfInterrupted(std::string_view next_step, CollectResult& result);
  void Record(CollectResult& result, std::string_view step, StepStatus status,
              std::string detail);
  bool Fail(CollectResult& result, std::string_view step, ErrorKind kind, std::string error);

  CollectorSettings settings_;
  core::logging::Logger& logger_;
  std::unique_ptr<IPackageQuery> package_query_;
};

} // namespace rgwbundle::collect
