#include "util/YamlReader.hpp"

#include <cctype>

namespace gadgetimg::util {

const YamlNode* YamlNode::find(std::string_view key) const {
  if (kind_ != Kind::Map) return nullptr;
  for (const auto& [k, v] : entries_)
    if (k == key) return &v;
  return nullptr;
}

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

// Position of a trailing comment ("#" at line start or after whitespace,
// outside quotes), or npos.
static size_t comment_start(std::string_view s) {
  char quote = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (quote) {
      if (c == quote) quote = 0;
      else if (c == '\\' && quote == '"' && i + 1 < s.size()) ++i;
      continue;
    }
    if (c == '"' || c == '\'') { quote = c; continue; }
    if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(s[i - 1])))) return i;
  }
  return std::string_view::npos;
}

// Position of the "key: value" separator (a ':' followed by space or end of
// line, outside quotes), or npos.
static size_t key_separator(std::string_view s) {
  char quote = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (quote) {
      if (c == quote) quote = 0;
      continue;
    }
    if ((c == '"' || c == '\'') && i == 0) { quote = c; continue; }
    if (c == ':' && (i + 1 == s.size() || s[i + 1] == ' ')) return i;
  }
  return std::string_view::npos;
}

static bool is_seq_entry(std::string_view s) {
  return s == "-" || (s.size() >= 2 && s[0] == '-' && s[1] == ' ');
}

static bool unquote(std::string_view s, std::string& out) {
  out.clear();
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
    s = s.substr(1, s.size() - 2);
    for (size_t i = 0; i < s.size(); ++i) {
      if (s[i] != '\\') { out += s[i]; continue; }
      if (++i >= s.size()) return false;
      switch (s[i]) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        default: return false;
      }
    }
    return true;
  }
  if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'') {
    s = s.substr(1, s.size() - 2);
    for (size_t i = 0; i < s.size(); ++i) {
      out += s[i];
      if (s[i] == '\'' && i + 1 < s.size() && s[i + 1] == '\'') ++i;
    }
    return true;
  }
  if (!s.empty() && (s.front() == '"' || s.front() == '\'')) return false;
  out.assign(s);
  return true;
}

bool YamlReader::fail(int line, const std::string& message) {
  if (error_.empty()) error_ = "line " + std::to_string(line) + ": " + message;
  return false;
}

bool YamlReader::split_lines(std::string_view text) {
  int number = 0;
  while (!text.empty()) {
    auto nl = text.find('\n');
    std::string_view raw = text.substr(0, nl);
    text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
    ++number;
    if (!raw.empty() && raw.back() == '\r') raw.remove_suffix(1);

    size_t indent = 0;
    while (indent < raw.size() && raw[indent] == ' ') ++indent;
    if (indent < raw.size() && raw[indent] == '\t') return fail(number, "tab used for indentation");

    std::string_view body = raw.substr(indent);
    auto hash = comment_start(body);
    if (hash != std::string_view::npos) body = body.substr(0, hash);
    body = trim(body);
    if (body.empty()) continue;
    if (body == "---") {
      if (!lines_.empty()) return fail(number, "multiple documents are not supported");
      continue;
    }
    if (body == "...") break;
    lines_.push_back(Line{static_cast<int>(indent), number, std::string(body)});
  }
  return true;
}

bool YamlReader::parse(std::string_view text) {
  lines_.clear();
  error_.clear();
  root_ = YamlNode{};
  if (!split_lines(text)) return false;
  if (lines_.empty()) return true;

  size_t i = 0;
  if (!parse_block(i, lines_[0].indent, root_)) return false;
  if (i < lines_.size()) return fail(lines_[i].number, "unexpected indentation");
  return true;
}

bool YamlReader::parse_block(size_t& i, int indent, YamlNode& out) {
  if (is_seq_entry(lines_[i].text)) return parse_seq(i, indent, out);
  if (key_separator(lines_[i].text) != std::string_view::npos) return parse_map(i, indent, out);
  // A lone scalar occupying the whole block.
  const Line& line = lines_[i];
  ++i;
  return parse_inline_value(line.text, line.number, out);
}

// Value of a key or sequence entry whose inline part was empty: the nested
// block on the following lines, or null.
bool YamlReader::parse_nested_value(size_t& i, int parent_indent, bool allow_same_indent_seq,
                                    YamlNode& out) {
  if (i < lines_.size() && lines_[i].indent > parent_indent)
    return parse_block(i, lines_[i].indent, out);
  if (allow_same_indent_seq && i < lines_.size() && lines_[i].indent == parent_indent &&
      is_seq_entry(lines_[i].text))
    return parse_seq(i, parent_indent, out);
  out.kind_ = YamlNode::Kind::Null;
  return true;
}

bool YamlReader::parse_map(size_t& i, int indent, YamlNode& out) {
  out.kind_ = YamlNode::Kind::Map;
  out.line_ = lines_[i].number;
  while (i < lines_.size() && lines_[i].indent == indent) {
    const Line line = lines_[i];
    if (is_seq_entry(line.text)) return fail(line.number, "sequence entry inside a mapping");
    auto sep = key_separator(line.text);
    if (sep == std::string_view::npos) return fail(line.number, "expected 'key: value'");

    std::string key;
    if (!unquote(trim(std::string_view(line.text).substr(0, sep)), key) || key.empty())
      return fail(line.number, "malformed key");
    if (out.find(key)) return fail(line.number, "duplicate key '" + key + "'");

    std::string_view rest = trim(std::string_view(line.text).substr(sep + 1));
    YamlNode value;
    ++i;
    if (rest.empty()) {
      if (!parse_nested_value(i, indent, true, value)) return false;
      if (value.line_ == 0) value.line_ = line.number;
    } else {
      if (!parse_inline_value(rest, line.number, value)) return false;
    }
    out.entries_.emplace_back(std::move(key), std::move(value));
  }
  if (i < lines_.size() && lines_[i].indent > indent)
    return fail(lines_[i].number, "unexpected indentation");
  return true;
}

bool YamlReader::parse_seq(size_t& i, int indent, YamlNode& out) {
  out.kind_ = YamlNode::Kind::Seq;
  out.line_ = lines_[i].number;
  while (i < lines_.size() && lines_[i].indent == indent && is_seq_entry(lines_[i].text)) {
    Line& line = lines_[i];
    std::string_view rest = trim(std::string_view(line.text).substr(1));
    YamlNode item;
    if (rest.empty()) {
      ++i;
      if (!parse_nested_value(i, indent, false, item)) return false;
      if (item.line_ == 0) item.line_ = line.number;
    } else if (is_seq_entry(rest) || key_separator(rest) != std::string_view::npos) {
      // Compact form "- key: value" / "- - x": re-read the remainder of the
      // line as the first line of a nested block at its own column.
      auto offset = static_cast<int>(line.text.size() - rest.size());
      line.indent += offset;
      line.text = std::string(rest);
      if (!parse_block(i, line.indent, item)) return false;
    } else {
      ++i;
      if (!parse_inline_value(rest, line.number, item)) return false;
    }
    out.items_.push_back(std::move(item));
  }
  if (i < lines_.size() && lines_[i].indent > indent)
    return fail(lines_[i].number, "unexpected indentation");
  return true;
}

bool YamlReader::parse_inline_value(std::string_view text, int line, YamlNode& out) {
  out.line_ = line;
  if (text.empty() || text == "~" || text == "null") {
    out.kind_ = YamlNode::Kind::Null;
    return true;
  }
  char first = text.front();
  if (first == '&' || first == '*' || first == '!') return fail(line, "anchors, aliases and tags are not supported");
  if (first == '|' || first == '>') return fail(line, "block scalars are not supported");
  if (first == '{') {
    if (trim(text.substr(1)) != "}") return fail(line, "only empty flow mappings are supported");
    out.kind_ = YamlNode::Kind::Map;
    return true;
  }
  if (first == '[') {
    if (text.back() != ']') return fail(line, "unterminated flow sequence");
    out.kind_ = YamlNode::Kind::Seq;
    std::string_view body = trim(text.substr(1, text.size() - 2));
    while (!body.empty()) {
      auto comma = body.find(',');
      std::string_view part = trim(body.substr(0, comma));
      body = (comma == std::string_view::npos) ? std::string_view{} : trim(body.substr(comma + 1));
      if (part.empty()) return fail(line, "empty flow sequence entry");
      YamlNode item;
      item.kind_ = YamlNode::Kind::Scalar;
      item.line_ = line;
      if (!unquote(part, item.scalar_)) return fail(line, "malformed quoted scalar");
      out.items_.push_back(std::move(item));
    }
    return true;
  }
  out.kind_ = YamlNode::Kind::Scalar;
  if (!unquote(text, out.scalar_)) return fail(line, "malformed quoted scalar");
  return true;
}

} // namespace gadgetimg::util
