#include "config/json_reader.hpp"

#include <cctype>
#include <cstddef>

namespace rgwbundle::config {

namespace {

class JsonReader {
public:
  explicit JsonReader(std::string_view input) : input_(input) {}

  bool Read(ConfNode& root, std::string& error) {
    SkipWhitespace();
    if (!ReadValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ReadValue(ConfNode& node, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while reading value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ReadObject(node, error);
    }
    if (c == '[') {
      return ReadArray(node, error);
    }
    if (c == '"') {
      node = ConfNode::Scalar("");
      return ReadString(node.scalar, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      node = ConfNode::Scalar("");
      return ReadNumberText(node.scalar, error);
    }
    if (ConsumeKeyword("true")) {
      node = ConfNode::Scalar("true");
      return true;
    }
    if (ConsumeKeyword("false")) {
      node = ConfNode::Scalar("false");
      return true;
    }
    if (ConsumeKeyword("null")) {
      node = ConfNode{};
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ReadObject(ConfNode& node, std::string& error) {
    node = ConfNode{};
    node.type = ConfNode::Type::kMapping;
    Advance(); // '{'
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (AtEnd() || Peek() != '"') {
        return Fail("expected string key in object", error);
      }
      if (!ReadString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!Match(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipWhitespace();
      ConfNode child;
      if (!ReadValue(child, error)) {
        return false;
      }
      node.mapping[key] = std::move(child);

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' between object entries", error);
      }
    }
  }

  bool ReadArray(ConfNode& node, std::string& error) {
    node = ConfNode{};
    node.type = ConfNode::Type::kSequence;
    Advance(); // '['
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      ConfNode child;
      if (!ReadValue(child, error)) {
        return false;
      }
      node.sequence.push_back(std::move(child));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!Match(',')) {
        return Fail("expected ',' between array items", error);
      }
    }
  }

  bool ReadString(std::string& output, std::string& error) {
    output.clear();
    Advance(); // opening quote

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c != '\\') {
        if (static_cast<unsigned char>(c) < 0x20U) {
          return Fail("control character in string is not allowed", error);
        }
        output.push_back(c);
        continue;
      }

      if (AtEnd()) {
        return Fail("unterminated escape sequence in string", error);
      }
      const char esc = Advance();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        output.push_back(esc);
        break;
      case 'b':
        output.push_back('\b');
        break;
      case 'f':
        output.push_back('\f');
        break;
      case 'n':
        output.push_back('\n');
        break;
      case 'r':
        output.push_back('\r');
        break;
      case 't':
        output.push_back('\t');
        break;
      default:
        return Fail("unsupported escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Numbers stay as text: configuration values are consumed as strings.
  bool ReadNumberText(std::string& output, std::string& error) {
    const std::size_t start = pos_;
    Match('-');
    if (!Match('0') && !ConsumeDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !ConsumeDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }
    output.assign(input_.substr(start, pos_ - start));
    return true;
  }

  bool ConsumeKeyword(std::string_view keyword) {
    if (input_.substr(pos_, keyword.size()) != keyword) {
      return false;
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
      Advance();
    }
    return true;
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "json parse error at line " + std::to_string(line_) + ", col " +
            std::to_string(col_) + ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

} // namespace

bool ParseJsonDocument(std::string_view input, ConfNode& root, std::string& error) {
  root = ConfNode{};
  JsonReader reader(input);
  return reader.Read(root, error);
}

} // namespace rgwbundle::config
