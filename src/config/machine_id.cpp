#include "config/machine_id.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace rgwbundle::config {

bool ReadMachineId(const fs::path& path, std::string& machine_id, std::string& error) {
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "machine id file not found: " + path.string();
    return false;
  }

  std::ifstream input(path);
  if (!input) {
    error = "unable to open machine id file: " + path.string();
    return false;
  }

  std::string line;
  std::getline(input, line);
  const std::size_t first = line.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    error = "machine id file is empty: " + path.string();
    return false;
  }
  const std::size_t last = line.find_last_not_of(" \t\r");
  const std::string value = line.substr(first, last - first + 1U);
  if (value.find('/') != std::string::npos) {
    error = "machine id must not contain '/': " + path.string();
    return false;
  }

  machine_id = value;
  return true;
}

} // namespace rgwbundle::config
