#include "collect/log_selector.hpp"

#include <algorithm>
#include <system_error>

#include <fnmatch.h>

namespace fs = std::filesystem;

namespace rgwbundle::collect {

std::vector<std::string> ComponentLogPatterns(std::string_view component) {
  const std::string name(component);
  return {name + ".client*.log", name + "_setup*.log"};
}

bool IsComponentLogName(std::string_view component, std::string_view file_name) {
  const std::string name(file_name);
  for (const auto& pattern : ComponentLogPatterns(component)) {
    if (fnmatch(pattern.c_str(), name.c_str(), FNM_PERIOD) == 0) {
      return true;
    }
  }
  return false;
}

bool SelectComponentLogs(const fs::path& log_dir, std::string_view component,
                         std::vector<fs::path>& selected, std::string& error) {
  selected.clear();

  std::error_code ec;
  fs::directory_iterator it(log_dir, ec);
  if (ec) {
    error = "failed to list log directory '" + log_dir.string() + "': " + ec.message();
    return false;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      error = "failed while listing log directory '" + log_dir.string() + "': " + ec.message();
      return false;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }
    if (IsComponentLogName(component, it->path().filename().string())) {
      selected.push_back(it->path());
    }
  }
  if (ec) {
    error = "failed while listing log directory '" + log_dir.string() + "': " + ec.message();
    return false;
  }

  std::sort(selected.begin(), selected.end());
  return true;
}

} // namespace rgwbundle::collect
