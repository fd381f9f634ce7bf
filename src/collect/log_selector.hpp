#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rgwbundle::collect {

// Shell-glob patterns naming the log files that belong to `component`:
// `<component>.client*.log` and `<component>_setup*.log`.
std::vector<std::string> ComponentLogPatterns(std::string_view component);

bool IsComponentLogName(std::string_view component, std::string_view file_name);

// Lists regular files directly inside `log_dir` whose names match the
// component patterns, sorted by name. Subdirectories are not descended.
bool SelectComponentLogs(const std::filesystem::path& log_dir, std::string_view component,
                         std::vector<std::filesystem::path>& selected, std::string& error);

} // namespace rgwbundle::collect
