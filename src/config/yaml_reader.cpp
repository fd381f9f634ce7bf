#include "config/yaml_reader.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace rgwbundle::config {

namespace {

struct YamlLine {
  std::size_t number = 0;
  std::size_t indent = 0;
  bool blank = true;
  // Content after indentation with comments and trailing spaces removed.
  std::string text;
  // Untouched source line, needed for block scalars.
  std::string raw;
};

bool IsSpace(char c) {
  return c == ' ' || c == '\t';
}

std::string Trim(std::string_view text) {
  std::size_t first = 0;
  while (first < text.size() && IsSpace(text[first])) {
    ++first;
  }
  std::size_t last = text.size();
  while (last > first && IsSpace(text[last - 1U])) {
    --last;
  }
  return std::string(text.substr(first, last - first));
}

std::size_t LeadingSpaces(std::string_view text) {
  std::size_t count = 0;
  while (count < text.size() && text[count] == ' ') {
    ++count;
  }
  return count;
}

// A quote only opens a quoted scalar at the start of a token, so apostrophes
// inside plain text ("it's") do not hide a trailing comment.
std::string StripComment(std::string_view text) {
  bool in_single = false;
  bool in_double = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    const bool token_start = i == 0U || IsSpace(text[i - 1U]);
    if (in_double) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        in_double = false;
      }
      continue;
    }
    if (in_single) {
      if (c == '\'') {
        in_single = false;
      }
      continue;
    }
    if (c == '"' && token_start) {
      in_double = true;
    } else if (c == '\'' && token_start) {
      in_single = true;
    } else if (c == '#' && token_start) {
      return std::string(text.substr(0, i));
    }
  }
  return std::string(text);
}

bool SplitLines(std::string_view input, std::vector<YamlLine>& lines, std::string& error) {
  lines.clear();
  bool seen_content = false;
  std::size_t number = 0;
  std::size_t start = 0;
  while (start <= input.size()) {
    std::size_t end = input.find('\n', start);
    if (end == std::string_view::npos) {
      end = input.size();
    }
    std::string_view raw = input.substr(start, end - start);
    if (!raw.empty() && raw.back() == '\r') {
      raw.remove_suffix(1);
    }
    ++number;
    start = end + 1U;

    YamlLine line;
    line.number = number;
    line.raw = std::string(raw);
    line.indent = LeadingSpaces(raw);
    line.text = Trim(StripComment(raw.substr(line.indent)));
    line.blank = line.text.empty();

    if (!line.blank) {
      if (line.indent < raw.size() && raw[line.indent] == '\t') {
        error = "yaml parse error at line " + std::to_string(number) +
                ": tab characters are not allowed for indentation";
        return false;
      }
      if (line.indent == 0U && line.text == "---") {
        if (seen_content) {
          error = "yaml parse error at line " + std::to_string(number) +
                  ": multiple documents are not supported";
          return false;
        }
        continue;
      }
      if (line.indent == 0U && line.text == "...") {
        break;
      }
      seen_content = true;
    }
    lines.push_back(std::move(line));

    if (end == input.size()) {
      break;
    }
  }
  return true;
}

bool IsSequenceItem(const std::string& text) {
  return text == "-" || text.rfind("- ", 0) == 0U;
}

// Position of the ':' that separates a mapping key from its value, or npos.
std::size_t FindMappingColon(const std::string& text) {
  if (text.empty() || text.front() == '[' || text.front() == '{') {
    return std::string::npos;
  }

  std::size_t i = 0;
  if (text.front() == '"' || text.front() == '\'') {
    const char quote = text.front();
    i = 1;
    while (i < text.size() && text[i] != quote) {
      if (quote == '"' && text[i] == '\\') {
        ++i;
      }
      ++i;
    }
    if (i >= text.size()) {
      return std::string::npos;
    }
    ++i;
  }

  for (; i < text.size(); ++i) {
    if (text[i] == ':' && (i + 1U == text.size() || IsSpace(text[i + 1U]))) {
      return i;
    }
  }
  return std::string::npos;
}

class YamlParser {
public:
  explicit YamlParser(std::vector<YamlLine> lines) : lines_(std::move(lines)) {}

  bool Parse(ConfNode& root, std::string& error) {
    SkipBlank();
    if (AtEnd()) {
      root = ConfNode{};
      return true;
    }
    if (!ParseBlock(lines_[pos_].indent, root, error)) {
      return false;
    }
    SkipBlank();
    if (!AtEnd()) {
      return Fail(lines_[pos_], "content is indented less than the document root", error);
    }
    return true;
  }

private:
  bool ParseBlock(std::size_t indent, ConfNode& node, std::string& error) {
    if (IsSequenceItem(lines_[pos_].text)) {
      return ParseSequence(indent, node, error);
    }
    return ParseMapping(indent, node, error);
  }

  bool ParseMapping(std::size_t indent, ConfNode& node, std::string& error) {
    node = ConfNode{};
    node.type = ConfNode::Type::kMapping;

    while (true) {
      SkipBlank();
      if (AtEnd()) {
        return true;
      }
      const YamlLine& line = lines_[pos_];
      if (line.indent < indent) {
        return true;
      }
      if (line.indent > indent) {
        return Fail(line, "unexpected indentation inside mapping", error);
      }
      if (IsSequenceItem(line.text)) {
        return Fail(line, "sequence item found where a mapping key was expected", error);
      }

      const std::size_t colon = FindMappingColon(line.text);
      if (colon == std::string::npos) {
        return Fail(line, "expected 'key: value'", error);
      }
      std::string key;
      if (!ParseKey(line.text.substr(0, colon), key)) {
        return Fail(line, "invalid mapping key", error);
      }
      if (node.mapping.find(key) != node.mapping.end()) {
        return Fail(line, "duplicate mapping key '" + key + "'", error);
      }

      const std::string rest = Trim(std::string_view(line.text).substr(colon + 1U));
      const std::size_t key_line = pos_;
      ++pos_;

      ConfNode value;
      if (rest.empty()) {
        if (!ParseNestedOrNull(indent, value, error)) {
          return false;
        }
      } else if (!ParseInlineValue(indent, rest, lines_[key_line], value, error)) {
        return false;
      }
      node.mapping.emplace(std::move(key), std::move(value));
    }
  }

  bool ParseSequence(std::size_t indent, ConfNode& node, std::string& error) {
    node = ConfNode{};
    node.type = ConfNode::Type::kSequence;

    while (true) {
      SkipBlank();
      if (AtEnd()) {
        return true;
      }
      YamlLine& line = lines_[pos_];
      if (line.indent < indent) {
        return true;
      }
      if (line.indent > indent) {
        return Fail(line, "unexpected indentation inside sequence", error);
      }
      if (!IsSequenceItem(line.text)) {
        // A key at the same column closes a sequence nested under its sibling.
        return true;
      }

      ConfNode item;
      if (line.text == "-") {
        ++pos_;
        if (!ParseNestedOrNull(indent, item, error)) {
          return false;
        }
        node.sequence.push_back(std::move(item));
        continue;
      }

      // Re-read the item body as if it started on its own line at the column
      // following "- ", so "- key: value" opens a mapping at that column.
      std::size_t offset = 1;
      while (offset < line.text.size() && line.text[offset] == ' ') {
        ++offset;
      }
      line.indent += offset;
      line.text.erase(0, offset);

      if (IsSequenceItem(line.text) || FindMappingColon(line.text) != std::string::npos) {
        if (!ParseBlock(line.indent, item, error)) {
          return false;
        }
      } else {
        const std::size_t item_line = pos_;
        ++pos_;
        if (!ParseInlineValue(indent, lines_[item_line].text, lines_[item_line], item, error)) {
          return false;
        }
      }
      node.sequence.push_back(std::move(item));
    }
  }

  // Value of a key (or "-") with nothing after it on the same line: a deeper
  // block, a sequence at the key's own column, or null.
  bool ParseNestedOrNull(std::size_t parent_indent, ConfNode& node, std::string& error) {
    SkipBlank();
    node = ConfNode{};
    if (AtEnd()) {
      return true;
    }
    const YamlLine& next = lines_[pos_];
    if (next.indent > parent_indent) {
      return ParseBlock(next.indent, node, error);
    }
    if (next.indent == parent_indent && IsSequenceItem(next.text)) {
      return ParseSequence(parent_indent, node, error);
    }
    return true;
  }

  bool ParseInlineValue(std::size_t parent_indent, const std::string& text, const YamlLine& line,
                        ConfNode& node, std::string& error) {
    const char lead = text.front();
    if (lead == '|' || lead == '>') {
      return ReadBlockScalar(parent_indent, text, line, node, error);
    }
    if (lead == '&' || lead == '*' || lead == '!') {
      return Fail(line, "anchors, aliases and tags are not supported", error);
    }
    if (lead == '"') {
      node = ConfNode::Scalar("");
      return ReadDoubleQuoted(text, line, node.scalar, error);
    }
    if (lead == '\'') {
      node = ConfNode::Scalar("");
      return ReadSingleQuoted(text, line, node.scalar, error);
    }
    if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
      node = ConfNode{};
      return true;
    }
    node = ConfNode::Scalar(text);
    return true;
  }

  bool ReadBlockScalar(std::size_t parent_indent, const std::string& header, const YamlLine& line,
                       ConfNode& node, std::string& error) {
    const bool literal = header.front() == '|';
    const std::string chomp = header.substr(1);
    if (!chomp.empty() && chomp != "-" && chomp != "+") {
      return Fail(line, "unsupported block scalar header '" + header + "'", error);
    }

    std::vector<std::string> body;
    std::size_t content_indent = 0;
    while (!AtEnd()) {
      const YamlLine& candidate = lines_[pos_];
      const bool whitespace_only = Trim(candidate.raw).empty();
      if (!whitespace_only) {
        const std::size_t raw_indent = LeadingSpaces(candidate.raw);
        if (raw_indent <= parent_indent) {
          break;
        }
        if (content_indent == 0U) {
          content_indent = raw_indent;
        }
        if (raw_indent < content_indent) {
          return Fail(candidate, "block scalar line is indented less than its first line", error);
        }
        body.push_back(candidate.raw.substr(content_indent));
      } else {
        body.emplace_back();
      }
      ++pos_;
    }

    std::size_t trailing_blank = 0;
    while (!body.empty() && body.back().empty()) {
      body.pop_back();
      ++trailing_blank;
    }

    std::string value;
    for (std::size_t i = 0; i < body.size(); ++i) {
      if (i != 0U) {
        value.push_back(literal || body[i].empty() || body[i - 1U].empty() ? '\n' : ' ');
      }
      value += body[i];
    }
    if (chomp != "-" && !body.empty()) {
      value.push_back('\n');
    }
    if (chomp == "+") {
      value.append(trailing_blank, '\n');
    }

    node = ConfNode::Scalar(std::move(value));
    return true;
  }

  bool ReadDoubleQuoted(const std::string& text, const YamlLine& line, std::string& out,
                        std::string& error) {
    out.clear();
    for (std::size_t i = 1; i < text.size(); ++i) {
      const char c = text[i];
      if (c == '"') {
        if (i + 1U != text.size()) {
          return Fail(line, "unexpected content after closing quote", error);
        }
        return true;
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (++i >= text.size()) {
        break;
      }
      switch (text[i]) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '0':
        out.push_back('\0');
        break;
      case '"':
      case '\\':
      case '/':
        out.push_back(text[i]);
        break;
      default:
        return Fail(line, "unsupported escape sequence in double-quoted scalar", error);
      }
    }
    return Fail(line, "unterminated double-quoted scalar", error);
  }

  bool ReadSingleQuoted(const std::string& text, const YamlLine& line, std::string& out,
                        std::string& error) {
    out.clear();
    for (std::size_t i = 1; i < text.size(); ++i) {
      if (text[i] != '\'') {
        out.push_back(text[i]);
        continue;
      }
      if (i + 1U < text.size() && text[i + 1U] == '\'') {
        out.push_back('\'');
        ++i;
        continue;
      }
      if (i + 1U != text.size()) {
        return Fail(line, "unexpected content after closing quote", error);
      }
      return true;
    }
    return Fail(line, "unterminated single-quoted scalar", error);
  }

  static bool ParseKey(std::string_view raw, std::string& key) {
    const std::string trimmed = Trim(raw);
    if (trimmed.size() >= 2U &&
        (trimmed.front() == '"' || trimmed.front() == '\'') && trimmed.back() == trimmed.front()) {
      key = trimmed.substr(1, trimmed.size() - 2U);
    } else {
      key = trimmed;
    }
    return !key.empty();
  }

  void SkipBlank() {
    while (!AtEnd() && lines_[pos_].blank) {
      ++pos_;
    }
  }

  bool AtEnd() const {
    return pos_ >= lines_.size();
  }

  static bool Fail(const YamlLine& line, std::string_view message, std::string& error) {
    error = "yaml parse error at line " + std::to_string(line.number) + ": " +
            std::string(message);
    return false;
  }

  std::vector<YamlLine> lines_;
  std::size_t pos_ = 0;
};

} // namespace

bool ParseYamlDocument(std::string_view input, ConfNode& root, std::string& error) {
  root = ConfNode{};
  std::vector<YamlLine> lines;
  if (!SplitLines(input, lines, error)) {
    return false;
  }
  YamlParser parser(std::move(lines));
  return parser.Parse(root, error);
}

} // namespace rgwbundle::config
