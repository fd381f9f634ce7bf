#include "config/conf_store.hpp"

#include "config/json_reader.hpp"
#include "config/yaml_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace rgwbundle::config {

namespace {

constexpr std::string_view kSchemeSeparator = "://";

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

bool ReadFileText(const fs::path& path, std::string& text, std::string& error) {
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "configuration file not found: " + path.string();
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "configuration path must be a regular file: " + path.string();
    return false;
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open configuration file: " + path.string();
    return false;
  }
  text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading configuration file: " + path.string();
    return false;
  }
  return true;
}

// Splits `name[0][2]` into `name` plus the indices.
bool SplitSegment(std::string_view segment, std::string& name, std::vector<std::size_t>& indices) {
  indices.clear();
  const std::size_t bracket = segment.find('[');
  name.assign(segment.substr(0, bracket));
  if (bracket == std::string_view::npos) {
    return !name.empty();
  }

  std::string_view rest = segment.substr(bracket);
  while (!rest.empty()) {
    if (rest.front() != '[') {
      return false;
    }
    const std::size_t close = rest.find(']');
    if (close == std::string_view::npos || close == 1U) {
      return false;
    }
    const std::string_view digits = rest.substr(1, close - 1U);
    std::size_t index = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
      return false;
    }
    indices.push_back(index);
    rest.remove_prefix(close + 1U);
  }
  return true;
}

} // namespace

const char* ToString(ConfNode::Type type) {
  switch (type) {
  case ConfNode::Type::kNull:
    return "null";
  case ConfNode::Type::kScalar:
    return "scalar";
  case ConfNode::Type::kMapping:
    return "mapping";
  case ConfNode::Type::kSequence:
    return "sequence";
  }
  return "unknown";
}

bool ParseConfUri(std::string_view uri, ConfUri& parsed, std::string& error) {
  const std::size_t separator = uri.find(kSchemeSeparator);
  if (separator == std::string_view::npos || separator == 0U) {
    error = "configuration URI must look like <scheme>://<path>: " + std::string(uri);
    return false;
  }

  ConfUri result;
  result.scheme = ToLower(uri.substr(0, separator));
  if (result.scheme != "yaml" && result.scheme != "json") {
    error = "unsupported configuration store scheme '" + result.scheme +
            "' (expected yaml|json)";
    return false;
  }

  const std::string_view path = uri.substr(separator + kSchemeSeparator.size());
  if (path.empty()) {
    error = "configuration URI has an empty path: " + std::string(uri);
    return false;
  }
  result.path = fs::path(std::string(path));

  parsed = std::move(result);
  return true;
}

bool ConfStore::Open(std::string_view uri, ConfStore& store, std::string& error) {
  ConfUri parsed;
  if (!ParseConfUri(uri, parsed, error)) {
    return false;
  }

  std::string text;
  if (!ReadFileText(parsed.path, text, error)) {
    return false;
  }

  ConfNode root;
  const bool ok = parsed.scheme == "json" ? ParseJsonDocument(text, root, error)
                                          : ParseYamlDocument(text, root, error);
  if (!ok) {
    error = parsed.path.string() + ": " + error;
    return false;
  }
  if (root.type != ConfNode::Type::kMapping) {
    error = parsed.path.string() + ": configuration document root must be a mapping";
    return false;
  }

  store = FromTree(std::move(root), std::string(uri));
  return true;
}

ConfStore ConfStore::FromTree(ConfNode root, std::string uri) {
  ConfStore store;
  store.root_ = std::move(root);
  store.uri_ = std::move(uri);
  return store;
}

const ConfNode* ConfStore::Find(std::string_view key, std::string& error) const {
  if (key.empty()) {
    error = "configuration key cannot be empty";
    return nullptr;
  }

  const ConfNode* node = &root_;
  std::string walked;
  std::size_t start = 0;
  while (start <= key.size()) {
    std::size_t end = key.find(kKeySeparator, start);
    if (end == std::string_view::npos) {
      end = key.size();
    }
    const std::string_view segment = key.substr(start, end - start);
    start = end + 1U;

    std::string name;
    std::vector<std::size_t> indices;
    if (!SplitSegment(segment, name, indices)) {
      error = "malformed configuration key '" + std::string(key) + "'";
      return nullptr;
    }
    if (!walked.empty()) {
      walked.push_back(kKeySeparator);
    }
    walked.append(segment);

    if (node->type != ConfNode::Type::kMapping) {
      error = "configuration key not found: " + std::string(key);
      return nullptr;
    }
    const auto it = node->mapping.find(name);
    if (it == node->mapping.end()) {
      error = "configuration key not found: " + std::string(key);
      return nullptr;
    }
    node = &it->second;

    for (const std::size_t index : indices) {
      if (node->type != ConfNode::Type::kSequence || index >= node->sequence.size()) {
        error = "configuration key not found: " + std::string(key) + " (no element at '" +
                walked + "')";
        return nullptr;
      }
      node = &node->sequence[index];
    }

    if (end == key.size()) {
      break;
    }
  }
  return node;
}

bool ConfStore::Get(std::string_view key, std::string& value, std::string& error) const {
  const ConfNode* node = Find(key, error);
  if (node == nullptr) {
    return false;
  }
  if (node->type == ConfNode::Type::kNull) {
    error = "configuration key has no value: " + std::string(key);
    return false;
  }
  if (node->type != ConfNode::Type::kScalar) {
    error = "configuration key '" + std::string(key) + "' holds a " + ToString(node->type) +
            ", expected a scalar";
    return false;
  }
  value = node->scalar;
  return true;
}

bool ConfStore::Contains(std::string_view key) const {
  std::string ignored;
  return Find(key, ignored) != nullptr;
}

} // namespace rgwbundle::config
