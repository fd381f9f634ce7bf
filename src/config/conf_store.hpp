#pragma once

#include "config/conf_node.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace rgwbundle::config {

// Separator between path segments in store keys, e.g.
// `cortx>common>storage>log`.
inline constexpr char kKeySeparator = '>';

// Parsed `<scheme>://<path>` store locator.
struct ConfUri {
  std::string scheme;
  std::filesystem::path path;
};

// Accepts `yaml://<path>` and `json://<path>`. The scheme is case-insensitive.
bool ParseConfUri(std::string_view uri, ConfUri& parsed, std::string& error);

// Read-only key-value view over a cluster configuration file.
//
// Keys walk nested mappings with `>`; a segment may carry one or more `[N]`
// suffixes to index sequences (`node>hosts[0]`). Lookups only succeed for
// scalar leaves; mappings, sequences and null values are reported as errors.
class ConfStore {
public:
  ConfStore() = default;

  // Loads the document behind `uri`. On failure `store` is left unchanged.
  static bool Open(std::string_view uri, ConfStore& store, std::string& error);

  // Builds a store over an already parsed tree (used by tests and callers
  // that assemble configuration in memory).
  static ConfStore FromTree(ConfNode root, std::string uri = "memory://");

  bool Get(std::string_view key, std::string& value, std::string& error) const;
  bool Contains(std::string_view key) const;

  const std::string& Uri() const {
    return uri_;
  }

private:
  const ConfNode* Find(std::string_view key, std::string& error) const;

  ConfNode root_;
  std::string uri_;
};

} // namespace rgwbundle::config
