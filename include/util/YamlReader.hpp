#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gadgetimg::util {

// Node of the block-style YAML subset used by gadget layout files.
class YamlNode {
public:
  enum class Kind { Null, Scalar, Map, Seq };

  YamlNode() = default;

  [[nodiscard]] Kind kind() const { return kind_; }
  [[nodiscard]] bool is_null() const { return kind_ == Kind::Null; }
  [[nodiscard]] bool is_scalar() const { return kind_ == Kind::Scalar; }
  [[nodiscard]] bool is_map() const { return kind_ == Kind::Map; }
  [[nodiscard]] bool is_seq() const { return kind_ == Kind::Seq; }

  // 1-based source line the node started on (0 for synthesized nodes).
  [[nodiscard]] int line() const { return line_; }

  [[nodiscard]] const std::string& scalar() const { return scalar_; }
  [[nodiscard]] const std::vector<std::pair<std::string, YamlNode>>& entries() const { return entries_; }
  [[nodiscard]] const std::vector<YamlNode>& items() const { return items_; }

  // Map lookup; nullptr if this is not a map or the key is absent.
  [[nodiscard]] const YamlNode* find(std::string_view key) const;

private:
  friend class YamlReader;

  Kind kind_{Kind::Null};
  int line_{0};
  std::string scalar_;
  std::vector<std::pair<std::string, YamlNode>> entries_;
  std::vector<YamlNode> items_;
};

// Parser for block mappings, block sequences (including compact "- key: v"
// items), plain and quoted scalars, empty flow collections ("[]", "{}"),
// flow sequences of scalars and '#' comments. Anchors, tags, multi-document
// streams and block scalars are rejected.
class YamlReader {
public:
  bool parse(std::string_view text);

  [[nodiscard]] const YamlNode& root() const { return root_; }

  // "line N: message" for the first error, empty after a successful parse.
  [[nodiscard]] const std::string& error() const { return error_; }

private:
  struct Line {
    int indent{0};
    int number{0};
    std::string text;
  };

  bool split_lines(std::string_view text);
  bool parse_block(size_t& i, int indent, YamlNode& out);
  bool parse_map(size_t& i, int indent, YamlNode& out);
  bool parse_seq(size_t& i, int indent, YamlNode& out);
  bool parse_inline_value(std::string_view text, int line, YamlNode& out);
  bool parse_nested_value(size_t& i, int parent_indent, bool allow_same_indent_seq, YamlNode& out);
  bool fail(int line, const std::string& message);

  std::vector<Line> lines_;
  YamlNode root_;
  std::string error_;
};

} // namespace gadgetimg::util
