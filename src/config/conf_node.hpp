#pragma once

#include <map>
#include <string>
#include <vector>

namespace rgwbundle::config {

// Format-neutral document tree produced by the YAML and JSON readers.
// Leaf values are kept as their source text; the store hands out strings and
// callers interpret them.
struct ConfNode {
  enum class Type {
    kNull,
    kScalar,
    kMapping,
    kSequence,
  };

  using Mapping = std::map<std::string, ConfNode>;
  using Sequence = std::vector<ConfNode>;

  Type type = Type::kNull;
  std::string scalar;
  Mapping mapping;
  Sequence sequence;

  static ConfNode Scalar(std::string text) {
    ConfNode node;
    node.type = Type::kScalar;
    node.scalar = std::move(text);
    return node;
  }
};

const char* ToString(ConfNode::Type type);

} // namespace rgwbundle::config
