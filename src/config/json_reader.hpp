#pragma once

#include "config/conf_node.hpp"

#include <string>
#include <string_view>

namespace rgwbundle::config {

// Parses a JSON document into a ConfNode tree.
//
// - objects become mappings, arrays become sequences
// - strings, numbers and booleans become scalars (numbers keep their text)
// - errors report line/column so a broken cluster file is easy to locate
bool ParseJsonDocument(std::string_view input, ConfNode& root, std::string& error);

} // namespace rgwbundle::config
