#include "../common/assertions.hpp"
#include "../common/node_fixture.hpp"
#include "../common/tar_gz_reader.hpp"
#include "../common/temp_dir.hpp"
#include "collect/bundle_collector.hpp"
#include "collect/interrupt.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace {

using rgwbundle::collect::BundleCollector;
using rgwbundle::collect::BundleRequest;
using rgwbundle::collect::CollectResult;
using rgwbundle::collect::ErrorKind;
using rgwbundle::collect::StepStatus;
using rgwbundle::tests::common::AssertContains;
using rgwbundle::tests::common::AssertNotContains;
using rgwbundle::tests::common::Fail;
using rgwbundle::tests::common::NodeFixture;

// Canned inventory so the smoke does not depend on rpm being installed.
class FakePackageQuery : public rgwbundle::collect::IPackageQuery {
public:
  FakePackageQuery(int exit_code, std::string output)
      : exit_code_(exit_code), output_(std::move(output)) {}

  bool Run(rgwbundle::collect::PackageQueryResult& result, std::string& error) override {
    (void)error;
    result.exit_code = exit_code_;
    result.output = output_;
    result.timed_out = false;
    return true;
  }

  std::string Describe() const override {
    return "fake package query";
  }

private:
  int exit_code_;
  std::string output_;
};

struct RunOutput {
  CollectResult result;
  std::string log;
};

RunOutput Generate(const NodeFixture& node, std::string_view bundle_id, bool coredumps,
                   int query_exit_code = 0) {
  std::ostringstream log_stream;
  rgwbundle::core::logging::Logger logger(rgwbundle::core::logging::LogLevel::kDebug, log_stream);
  BundleCollector collector(node.Settings(), logger,
                            std::make_unique<FakePackageQuery>(query_exit_code,
                                                               "cortx-rgw-2.0.0-1.x86_64\n"));

  BundleRequest request;
  request.bundle_id = std::string(bundle_id);
  request.target_path = node.target_dir;
  request.cluster_conf = node.ClusterConfUri();
  request.include_coredumps = coredumps;

  RunOutput output;
  output.result = collector.Generate(request);
  output.log = log_stream.str();
  return output;
}

fs::path ExpectedArchive(const NodeFixture& node, std::string_view bundle_id) {
  return node.target_dir / "rgw" / ("rgw_" + std::string(bundle_id) + ".tar.gz");
}

fs::path ExpectedManifest(const NodeFixture& node, std::string_view bundle_id) {
  return node.target_dir / "rgw" / ("rgw_" + std::string(bundle_id) + ".manifest.json");
}

void AssertNoStaging(const NodeFixture& node) {
  if (!fs::exists(node.scratch_root)) {
    return;
  }
  if (!fs::is_empty(node.scratch_root)) {
    Fail("staging workspace must not outlive the run: " + node.scratch_root.string());
  }
}

StepStatus RequireStep(const CollectResult& result, std::string_view step) {
  for (const auto& outcome : result.steps) {
    if (outcome.step == step) {
      return outcome.status;
    }
  }
  Fail("step missing from result: " + std::string(step));
}

std::map<std::string, rgwbundle::tests::common::TarMember> ReadArchive(const fs::path& archive) {
  return rgwbundle::tests::common::IndexTarMembers(
      rgwbundle::tests::common::ReadTarGzMembers(archive));
}

void ScenarioFullCollection() {
  const NodeFixture node = rgwbundle::tests::common::CreateNodeFixture("rgwbundle-generate-full");
  rgwbundle::tests::common::AddComponentConfig(node);
  rgwbundle::tests::common::AddComponentLogs(node);
  rgwbundle::tests::common::AddCrashDump(node);

  const RunOutput run = Generate(node, "SB_full", true);
  if (!run.result.ok()) {
    Fail("full collection failed: " + run.result.error);
  }
  const fs::path archive = ExpectedArchive(node, "SB_full");
  if (run.result.archive_path != archive || !fs::is_regular_file(archive)) {
    Fail("archive missing at expected path: " + archive.string());
  }
  AssertNoStaging(node);
  AssertContains(run.log, "bundle_id=\"SB_full\"");
  AssertContains(run.log, "msg=\"support bundle generated\"");

  const auto members = ReadArchive(archive);
  for (const auto& [name, member] : members) {
    (void)member;
    if (name.rfind("rgw/", 0) != 0U) {
      Fail("archive must have a single rgw/ top-level directory: " + name);
    }
  }
  for (const char* required : {"rgw/", "rgw/rgw.conf", "rgw/rgw.client.1.log", "rgw/rgw_setup.log",
                               "rgw/cortx-rpms", "rgw/crash/"}) {
    if (members.find(required) == members.end()) {
      Fail(std::string("archive entry missing: ") + required);
    }
  }
  if (members.find("rgw/unrelated.txt") != members.end()) {
    Fail("unrelated log file must not be collected");
  }
  if (members.at("rgw/cortx-rpms").content != "cortx-rgw-2.0.0-1.x86_64\n") {
    Fail("package inventory content mismatch");
  }
  for (const auto& [name, member] : members) {
    (void)member;
    if (name.find("manifest") != std::string::npos) {
      Fail("manifest must not be packed into the archive: " + name);
    }
  }

  const fs::path manifest_path = ExpectedManifest(node, "SB_full");
  if (run.result.manifest_path != manifest_path || !fs::is_regular_file(manifest_path)) {
    Fail("manifest missing beside the archive: " + manifest_path.string());
  }
  const std::string manifest = rgwbundle::tests::common::ReadFileToString(manifest_path);
  AssertContains(manifest, "\"bundle_id\":\"SB_full\"");
  AssertContains(manifest, std::string("\"machine_id\":\"") +
                               std::string(rgwbundle::tests::common::kFixtureMachineId) + "\"");
  AssertContains(manifest, "{\"name\":\"crash_dumps\",\"status\":\"collected\"");
  AssertContains(manifest, "{\"name\":\"archive\",\"status\":\"collected\"");
  AssertContains(manifest, "\"path\":\"rgw.conf\"");

  bool has_crash_file = false;
  for (const auto& [name, member] : members) {
    (void)member;
    if (name.rfind("rgw/crash/", 0) == 0U && name.size() > 10U && name.back() != '/') {
      has_crash_file = true;
    }
  }
  if (!has_crash_file) {
    Fail("crash subtree must contain the crash dump files");
  }

  rgwbundle::tests::common::RemovePathBestEffort(node.root);
}

void ScenarioCoredumpsDisabled() {
  const NodeFixture node = rgwbundle::tests::common::CreateNodeFixture("rgwbundle-generate-nocore");
  rgwbundle::tests::common::AddComponentConfig(node);
  rgwbundle::tests::common::AddComponentLogs(node);
  rgwbundle::tests::common::AddCrashDump(node);

  const RunOutput run = Generate(node, "SB_nocore", false, 1);
  if (!run.result.ok()) {
    Fail("collection without coredumps failed: " + run.result.error);
  }
  if (RequireStep(run.result, "crash_dumps") != StepStatus::kSkipped) {
    Fail("crash dumps must be skipped when not requested");
  }
  if (RequireStep(run.result, "package_inventory") != StepStatus::kSkipped) {
    Fail("non-zero package query must be skipped");
  }

  const auto members = ReadArchive(run.result.archive_path);
  for (const auto& [name, member] : members) {
    (void)member;
    if (name.rfind("rgw/crash", 0) == 0U) {
      Fail("crash subtree must be absent when coredumps=false: " + name);
    }
  }
  if (members.find("rgw/cortx-rpms") != members.end()) {
    Fail("package inventory must be absent when the query fails");
  }
  AssertNoStaging(node);
  rgwbundle::tests::common::RemovePathBestEffort(node.root);
}

void ScenarioMissingConfig() {
  const NodeFixture node = rgwbundle::tests::common::CreateNodeFixture("rgwbundle-generate-noconf");
  rgwbundle::tests::common::AddComponentLogs(node);

  const RunOutput run = Generate(node, "SB_noconf", false);
  if (run.result.error_kind != ErrorKind::kNotFound) {
    Fail("missing component config must be a not-found error");
  }
  if (run.result.missing_path != node.config_dir / "rgw.conf") {
    Fail("not-found error must carry the missing path");
  }
  if (fs::exists(ExpectedArchive(node, "SB_noconf"))) {
    Fail("no archive may be produced when the component config is missing");
  }
  if (RequireStep(run.result, "component_config") != StepStatus::kFatal) {
    Fail("component_config step must be fatal");
  }
  AssertContains(run.log, "level=ERROR");
  AssertNoStaging(node);
  rgwbundle::tests::common::RemovePathBestEffort(node.root);
}

void ScenarioMissingLogDirectory() {
  const NodeFixture node = rgwbundle::tests::common::CreateNodeFixture("rgwbundle-generate-nologs");
  rgwbundle::tests::common::AddComponentConfig(node);

  const RunOutput run = Generate(node, "SB_nologs", false);
  if (!run.result.ok()) {
    Fail("missing log directory must not fail the run: " + run.result.error);
  }
  AssertContains(run.log, "level=WARN");
  AssertContains(run.log, "log directory not found");
  if (RequireStep(run.result, "logs") != StepStatus::kSkipped) {
    Fail("logs step must be skipped");
  }
  const auto members = ReadArchive(run.result.archive_path);
  for (const char* required : {"rgw/", "rgw/rgw.conf", "rgw/cortx-rpms"}) {
    if (members.find(required) == members.end()) {
      Fail(std::string("archive entry missing: ") + required);
    }
  }
  if (members.size() != 3U) {
    std::string names;
    for (const auto& [name, member] : members) {
      (void)member;
      names += name + " ";
    }
    Fail("archive must hold only the config and the package inventory, got: " + names);
  }
  AssertNoStaging(node);
  rgwbundle::tests::common::RemovePathBestEffort(node.root);
}

void ScenarioSymlinkedCrashDirectory() {
  const NodeFixture node = rgwbundle::tests::common::CreateNodeFixture("rgwbundle-generate-crashlink");
  rgwbundle::tests::common::AddComponentConfig(node);

  // The crash directory is a link to the real dump store, as on hosts where
  // /var/lib/ceph lives on another volume.
  const fs::path dump_store = node.root / "crash_store";
  rgwbundle::tests::common::WriteFileOrFail(dump_store / "abcd" / "meta", "{\"crash_id\":\"abcd\"}\n");
  fs::create_directories(node.crash_dir.parent_path());
  fs::create_directory_symlink(dump_store, node.crash_dir);

  const RunOutput run = Generate(node, "SB_crashlink", true);
  if (!run.result.ok()) {
    Fail("linked crash directory must be collected: " + run.result.error);
  }
  if (RequireStep(run.result, "crash_dumps") != StepStatus::kCollected) {
    Fail("crash_dumps step must be collected through the link");
  }
  const auto members = ReadArchive(run.result.archive_path);
  if (members.find("rgw/crash/abcd/meta") == members.end() ||
      members.at("rgw/crash/abcd/meta").content != "{\"crash_id\":\"abcd\"}\n") {
    Fail("crash dump behind the link must be archived");
  }
  AssertNoStaging(node);
  rgwbundle::tests::common::RemovePathBestEffort(node.root);
}

void ScenarioManifestWriteFailure() {
  const NodeFixture node = rgwbundle::tests::common::CreateNodeFixture("rgwbundle-generate-nomanifest");
  rgwbundle::tests::common::AddComponentConfig(node);
  // A non-empty directory occupying the manifest path cannot be replaced.
  rgwbundle::tests::common::WriteFileOrFail(ExpectedManifest(node, "SB_nomanifest") / "blocker",
                                            "x");

  const RunOutput run = Generate(node, "SB_nomanifest", false);
  if (run.result.error_kind != ErrorKind::kIo) {
    Fail("manifest write failure must be an io error");
  }
  if (RequireStep(run.result, "manifest") != StepStatus::kFatal) {
    Fail("manifest step must be fatal");
  }
  if (fs::exists(ExpectedArchive(node, "SB_nomanifest")) || !run.result.archive_path.empty()) {
    Fail("archive must be removed when its manifest cannot be written");
  }
  AssertNotContains(run.log, "msg=\"support bundle generated\"");
  AssertNoStaging(node);
  rgwbundle::tests::common::RemovePathBestEffort(node.root);
}

void ScenarioLeftoverStagingPurged() {
  const NodeFixture node = rgwbundle::tests::common::CreateNodeFixture("rgwbundle-generate-leftover");
  rgwbundle::tests::common::AddComponentConfig(node);
  rgwbundle::tests::common::WriteFileOrFail(
      node.scratch_root / "rgw_SB_leftover" / "rgw" / "stale.log", "from an aborted run\n");

  const RunOutput run = Generate(node, "SB_leftover", false);
  if (!run.result.ok()) {
    Fail("run with leftover staging failed: " + run.result.error);
  }
  AssertContains(run.log, "removed staging directory left behind by an earlier run");
  const auto members = ReadArchive(run.result.archive_path);
  if (members.find("rgw/stale.log") != members.end()) {
    Fail("leftover staging content must not reach the archive");
  }
  AssertNoStaging(node);
  rgwbundle::tests::common::RemovePathBestEffort(node.root);
}

void ScenarioConfigurationErrors() {
  const NodeFixture node = rgwbundle::tests::common::CreateNodeFixture("rgwbundle-generate-badconf");
  rgwbundle::tests::common::AddComponentConfig(node);

  rgwbundle::tests::common::WriteFileOrFail(node.cluster_conf_file, "cortx:\n  common: {}\n");
  RunOutput run = Generate(node, "SB_badkey", false);
  if (run.result.error_kind != ErrorKind::kConfiguration) {
    Fail("missing configuration key must be a configuration error");
  }
  AssertContains(run.result.error, "cortx>common>storage>log");

  fs::remove(node.machine_id_file);
  run = Generate(node, "SB_noid", false);
  if (run.result.error_kind != ErrorKind::kConfiguration) {
    Fail("missing machine id must be a configuration error");
  }

  run = Generate(node, "", false);
  if (run.result.error_kind != ErrorKind::kArgument) {
    Fail("empty bundle id must be an argument error");
  }
  run = Generate(node, "a/b", false);
  if (run.result.error_kind != ErrorKind::kArgument) {
    Fail("bundle id with a separator must be an argument error");
  }
  AssertNoStaging(node);
  rgwbundle::tests::common::RemovePathBestEffort(node.root);
}

void ScenarioInterrupted() {
  const NodeFixture node = rgwbundle::tests::common::CreateNodeFixture("rgwbundle-generate-interrupt");
  rgwbundle::tests::common::AddComponentConfig(node);
  rgwbundle::tests::common::AddComponentLogs(node);

  rgwbundle::collect::RequestInterrupt();
  const RunOutput run = Generate(node, "SB_interrupt", false);
  rgwbundle::collect::ClearInterrupt();

  if (run.result.error_kind != ErrorKind::kInterrupted) {
    Fail("interrupt must surface as an interrupted error");
  }
  if (fs::exists(ExpectedArchive(node, "SB_interrupt")) ||
      fs::exists(ExpectedManifest(node, "SB_interrupt"))) {
    Fail("interrupted run must not leave an archive or manifest");
  }
  AssertNotContains(run.log, "msg=\"support bundle generated\"");
  AssertNoStaging(node);
  rgwbundle::tests::common::RemovePathBestEffort(node.root);
}

} // namespace

int main() {
  ScenarioFullCollection();
  ScenarioCoredumpsDisabled();
  ScenarioMissingConfig();
  ScenarioMissingLogDirectory();
  ScenarioSymlinkedCrashDirectory();
  ScenarioManifestWriteFailure();
  ScenarioLeftoverStagingPurged();
  ScenarioConfigurationErrors();
  ScenarioInterrupted();
  return 0;
}
