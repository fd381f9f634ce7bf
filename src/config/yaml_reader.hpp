#pragma once

#include "config/conf_node.hpp"

#include <string>
#include <string_view>

namespace rgwbundle::config {

// Parses the block-style YAML subset used by cluster configuration files.
//
// Supported:
// - nested block mappings and block sequences (including `- key: value` items)
// - plain, 'single' and "double" quoted scalars
// - literal (`|`) and folded (`>`) block scalars
// - `#` comments, `---` / `...` document markers
// Flow collections (`[a, b]`, `{a: b}`) are kept verbatim as scalars.
// Anchors, aliases, tags and multi-document streams are rejected.
bool ParseYamlDocument(std::string_view input, ConfNode& root, std::string& error);

} // namespace rgwbundle::config
