#pragma once

#include <filesystem>
#include <string>

namespace rgwbundle::config {

inline constexpr const char* kDefaultMachineIdPath = "/etc/machine-id";

// Reads the node identifier from a machine-id style file: the first line,
// trimmed. Fails if the file is missing, unreadable, or the line is empty.
bool ReadMachineId(const std::filesystem::path& path, std::string& machine_id, std::string& error);

} // namespace rgwbundle::config
