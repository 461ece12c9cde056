#include "yamlet/emitter.hh"
#include "yamlet/composer.hh"
#include "tokenizer.hh"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace yamlet {
namespace yaml {

namespace {

constexpr std::string_view kIndicators = "-?:,[]{}#&*!|>'\"%@`";
constexpr std::size_t kMaxSimpleKeyLength = 1024;

bool is_flow_char(char c) { return c == ',' || c == '[' || c == ']' || c == '{' || c == '}'; }

// Words that YAML 1.1 readers take as booleans or null
bool is_yaml11_keyword(std::string_view s) {
  static constexpr std::string_view words[] = {"y",    "n",     "yes", "no", "on", "off",
                                               "true", "false", "null"};
  if (s.size() > 5)
    return false;
  std::string lower;
  for (char c : s)
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return std::find(std::begin(words), std::end(words), lower) != std::end(words);
}

// 1_000, 1:30, 0b101 and friends are numbers to YAML 1.1 readers
bool is_yaml11_number(std::string_view s) {
  if (s.empty())
    return false;
  std::size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
  if (i >= s.size() || !(std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.'))
    return false;
  bool separator = false;
  for (; i < s.size(); ++i) {
    char c = s[i];
    if (c == '_' || c == ':') {
      separator = true;
    } else if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.') {
      return false;
    }
  }
  return separator || (s.size() > 2 && s[0] == '0' && (s[1] == 'b' || s[1] == 'B'));
}

bool has_unicode_break(std::string_view s) {
  return s.find("\xC2\x85") != std::string_view::npos || s.find("\xE2\x80\xA8") != std::string_view::npos ||
         s.find("\xE2\x80\xA9") != std::string_view::npos || s.find("\xEF\xBB\xBF") != std::string_view::npos;
}

// Decodes the well-formed UTF-8 sequence at s[i], advancing i past it
char32_t decode_utf8(std::string_view s, std::size_t &i) {
  std::size_t length = utf8_sequence_length(s, i);
  auto lead = static_cast<unsigned char>(s[i]);
  char32_t cp = length == 1 ? lead : lead & (0x7F >> length);
  for (std::size_t k = 1; k < length; ++k)
    cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
  i += length;
  return cp;
}

// Strings are emitted as text, so bytes that are not UTF-8 have no representation a reader would accept
void require_utf8(std::string_view s) {
  for (std::size_t i = 0; i < s.size();) {
    std::size_t length = utf8_sequence_length(s, i);
    if (length == 0)
      throw ValidationError("cannot emit a string holding invalid UTF-8 (byte " + std::to_string(i) + ")");
    i += length;
  }
}

void append_hex(std::string &out, char kind, char32_t value, int digits) {
  static constexpr char hex[] = "0123456789ABCDEF";
  out += '\\';
  out += kind;
  for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
    out += hex[(value >> shift) & 0xF];
  }
}

bool is_plain_safe(std::string_view s, bool flow, bool allow_unicode) {
  if (s.empty())
    return false;
  if (!resolve_plain_scalar(s).IsString() || is_yaml11_keyword(s) || is_yaml11_number(s))
    return false;
  if (s.starts_with("---") || s.starts_with("..."))
    return false;

  char first = s[0];
  if (kIndicators.find(first) != std::string_view::npos) {
    if (first != '-' && first != '?' && first != ':')
      return false;
    if (s.size() == 1 || s[1] == ' ' || s[1] == '\t')
      return false;
    if (flow && (first != '-' || is_flow_char(s[1])))
      return false;
  }
  if (first == ' ' || first == '\t' || s.back() == ' ' || s.back() == '\t' || s.back() == ':')
    return false;

  for (std::size_t i = 0; i < s.size(); ++i) {
    auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x20 || c == 0x7F)
      return false;
    if (c >= 0x80 && !allow_unicode)
      return false;
    if (c == ':' && i + 1 < s.size() && (s[i + 1] == ' ' || s[i + 1] == '\t'))
      return false;
    if (c == '#' && (s[i - 1] == ' ' || s[i - 1] == '\t'))
      return false;
    if (flow && (is_flow_char(static_cast<char>(c)) || c == ':'))
      return false;
  }
  return !has_unicode_break(s);
}

// Single line text that needs no escapes can be single-quoted
bool is_single_quotable(std::string_view s, bool allow_unicode) {
  for (char ch : s) {
    auto c = static_cast<unsigned char>(ch);
    if (c < 0x20 || c == 0x7F || (c >= 0x80 && !allow_unicode))
      return false;
  }
  return !has_unicode_break(s);
}

std::string single_quoted(std::string_view s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += '\'';
    out += c;
  }
  out += '\'';
  return out;
}

std::string double_quoted(std::string_view s, bool allow_unicode) {
  std::string out = "\"";
  std::size_t i = 0;
  while (i < s.size()) {
    auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) {
      ++i;
      switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\0':
        out += "\\0";
        break;
      case 0x07:
        out += "\\a";
        break;
      case 0x08:
        out += "\\b";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\n':
        out += "\\n";
        break;
      case 0x0B:
        out += "\\v";
        break;
      case 0x0C:
        out += "\\f";
        break;
      case '\r':
        out += "\\r";
        break;
      case 0x1B:
        out += "\\e";
        break;
      default:
        if (c < 0x20 || c == 0x7F)
          append_hex(out, 'x', c, 2);
        else
          out += static_cast<char>(c);
      }
      continue;
    }

    std::size_t start = i;
    char32_t cp = decode_utf8(s, i);
    if (cp == 0x85) {
      out += "\\N";
    } else if (cp == 0x2028) {
      out += "\\L";
    } else if (cp == 0x2029) {
      out += "\\P";
    } else if (cp == 0xFEFF) {
      append_hex(out, 'u', cp, 4);
    } else if (allow_unicode) {
      out.append(s.substr(start, i - start));
    } else if (cp <= 0xFF) {
      append_hex(out, 'x', cp, 2);
    } else if (cp <= 0xFFFF) {
      append_hex(out, 'u', cp, 4);
    } else {
      append_hex(out, 'U', cp, 8);
    }
  }
  out += '"';
  return out;
}

class Emitter {
public:
  explicit Emitter(const EmitOptions &options) : options_(options) {}

  void document(const Node &node, bool explicit_start);

  std::string take() { return std::move(out_); }

private:
  const EmitOptions &options_;
  std::string out_;

  int step() const { return options_.indent; }

  void spaces(int n) { out_.append(static_cast<std::size_t>(std::max(n, 0)), ' '); }

  int current_column() const {
    auto nl = out_.rfind('\n');
    return static_cast<int>(nl == std::string::npos ? out_.size() : out_.size() - nl - 1);
  }

  bool is_block_collection(const Node &node) const {
    return !options_.default_flow_style && node.IsSequence() ? !node.asSequence().empty()
           : !options_.default_flow_style && node.IsMap()    ? !node.asMap().empty()
                                                             : false;
  }

  bool is_literal_candidate(const Node &node) const;

  std::vector<const Map::entry *> entries(const Map &map) const;
  std::string scalar_text(const Node &node, bool flow) const;
  std::string flow_key(const Node &key) const;
  std::string flow_text(const Node &node) const;

  void literal(const std::string &s, int parent_col);
  void flow(const Node &node, int wrap_indent);
  void value_part(const Node &node, int parent_col);
  void block_sequence(const Sequence &seq, int col, bool first_inline);
  void block_mapping(const Map &map, int col, bool first_inline);
};

std::vector<const Map::entry *> Emitter::entries(const Map &map) const {
  std::vector<const Map::entry *> out;
  out.reserve(map.size());
  for (const auto &e : map)
    out.push_back(&e);
  if (options_.sort_keys) {
    std::stable_sort(out.begin(), out.end(),
                     [](const Map::entry *a, const Map::entry *b) { return compare_nodes(a->key, b->key) < 0; });
  }
  return out;
}

std::string Emitter::scalar_text(const Node &node, bool flow) const {
  return vswitch(
      node.value, [](const std::monostate &) -> std::string { return "null"; },
      [](const bool &b) -> std::string { return b ? "true" : "false"; },
      [](const int64_t &i) -> std::string { return std::to_string(i); },
      [](const double &d) -> std::string { return format_float(d); },
      [&](const std::string &s) -> std::string {
        require_utf8(s);
        if (is_plain_safe(s, flow, options_.allow_unicode))
          return s;
        if (is_single_quotable(s, options_.allow_unicode))
          return single_quoted(s);
        return double_quoted(s, options_.allow_unicode);
      },
      [&](const Sequence &) -> std::string { return flow_text(node); },
      [&](const Map &) -> std::string { return flow_text(node); });
}

bool Emitter::is_literal_candidate(const Node &node) const {
  if (!node.IsString())
    return false;
  const std::string &s = node.asString();
  if (s.find('\n') == std::string::npos || s.find_first_not_of('\n') == std::string::npos)
    return false;
  for (char ch : s) {
    auto c = static_cast<unsigned char>(ch);
    if ((c < 0x20 && c != '\n' && c != '\t') || c == 0x7F || (c >= 0x80 && !options_.allow_unicode))
      return false;
  }
  return !has_unicode_break(s);
}

std::string Emitter::flow_key(const Node &key) const {
  std::string text = scalar_text(key, true);
  if (!key.IsScalar() || text.size() > kMaxSimpleKeyLength)
    return "? " + text;
  return text;
}

std::string Emitter::flow_text(const Node &node) const {
  if (node.IsSequence()) {
    std::string out = "[";
    bool first = true;
    for (const auto &item : node.asSequence()) {
      if (!first)
        out += ", ";
      first = false;
      out += scalar_text(item, true);
    }
    return out + "]";
  }
  if (node.IsMap()) {
    std::string out = "{";
    bool first = true;
    for (const auto *e : entries(node.asMap())) {
      if (!first)
        out += ", ";
      first = false;
      out += flow_key(e->key) + ": " + scalar_text(e->value, true);
    }
    return out + "}";
  }
  return scalar_text(node, true);
}

void Emitter::flow(const Node &node, int wrap_indent) {
  std::vector<std::string> parts;
  char open, close;
  if (node.IsSequence()) {
    open = '[';
    close = ']';
    for (const auto &item : node.asSequence())
      parts.push_back(scalar_text(item, true));
  } else if (node.IsMap()) {
    open = '{';
    close = '}';
    for (const auto *e : entries(node.asMap()))
      parts.push_back(flow_key(e->key) + ": " + scalar_text(e->value, true));
  } else {
    out_ += scalar_text(node, true);
    return;
  }

  out_ += open;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    std::string part = parts[i] + (i + 1 < parts.size() ? ',' : close);
    if (i > 0) {
      if (current_column() + 1 + static_cast<int>(part.size()) > options_.width) {
        out_ += '\n';
        spaces(wrap_indent);
      } else {
        out_ += ' ';
      }
    }
    out_ += part;
  }
  if (parts.empty())
    out_ += close;
}

void Emitter::literal(const std::string &s, int parent_col) {
  require_utf8(s);
  std::size_t body_end = s.find_last_not_of('\n') + 1;
  std::size_t trailing = s.size() - body_end;
  std::string_view body(s.data(), body_end);

  int content_col = parent_col < 0 ? step() : parent_col + step();

  // Content starting with whitespace would be mistaken for deeper indentation
  std::size_t first_text = body.find_first_not_of('\n');
  bool needs_indicator = body[first_text] == ' ' || body[first_text] == '\t';

  out_ += '|';
  if (needs_indicator)
    out_ += static_cast<char>('0' + step());
  if (trailing == 0)
    out_ += '-';
  else if (trailing > 1)
    out_ += '+';
  out_ += '\n';

  std::size_t pos = 0;
  while (pos <= body.size()) {
    std::size_t nl = body.find('\n', pos);
    std::string_view line = body.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    if (!line.empty()) {
      spaces(content_col);
      out_.append(line);
    }
    out_ += '\n';
    if (nl == std::string_view::npos)
      break;
    pos = nl + 1;
  }
  for (std::size_t k = 1; k < trailing; ++k)
    out_ += '\n';
}

void Emitter::value_part(const Node &node, int parent_col) {
  if (is_literal_candidate(node)) {
    out_ += ' ';
    literal(node.asString(), parent_col);
  } else if (node.IsScalar()) {
    out_ += ' ';
    out_ += scalar_text(node, false);
    out_ += '\n';
  } else if (!is_block_collection(node)) {
    out_ += ' ';
    flow(node, parent_col + step());
    out_ += '\n';
  } else if (node.IsSequence()) {
    out_ += '\n';
    block_sequence(node.asSequence(), parent_col + step(), false);
  } else {
    out_ += '\n';
    block_mapping(node.asMap(), parent_col + step(), false);
  }
}

void Emitter::block_sequence(const Sequence &seq, int col, bool first_inline) {
  const int content_col = col + std::max(step(), 2);
  bool first = true;
  for (const auto &item : seq) {
    if (!(first && first_inline))
      spaces(col);
    first = false;
    out_ += '-';
    if (is_block_collection(item)) {
      spaces(content_col - col - 1);
      if (item.IsSequence())
        block_sequence(item.asSequence(), content_col, true);
      else
        block_mapping(item.asMap(), content_col, true);
    } else {
      value_part(item, col);
    }
  }
}

void Emitter::block_mapping(const Map &map, int col, bool first_inline) {
  bool first = true;
  for (const auto *e : entries(map)) {
    if (!(first && first_inline))
      spaces(col);
    first = false;

    const Node &key = e->key;
    std::string key_text = key.IsScalar() ? scalar_text(key, false) : std::string();
    if (key.IsScalar() && key_text.size() <= kMaxSimpleKeyLength) {
      out_ += key_text;
      out_ += ':';
    } else {
      // Complex key: `? key` on its own line, then `: value`
      out_ += "? ";
      if (key.IsScalar())
        out_ += key_text;
      else
        flow(key, col + step());
      out_ += '\n';
      spaces(col);
      out_ += ':';
    }
    value_part(e->value, col);
  }
}

void Emitter::document(const Node &node, bool explicit_start) {
  if (explicit_start)
    out_ += "---";

  if (is_block_collection(node)) {
    if (explicit_start)
      out_ += '\n';
    if (node.IsSequence())
      block_sequence(node.asSequence(), 0, false);
    else
      block_mapping(node.asMap(), 0, false);
    return;
  }

  if (explicit_start)
    out_ += ' ';
  if (is_literal_candidate(node)) {
    literal(node.asString(), -1);
  } else if (node.IsScalar()) {
    out_ += scalar_text(node, false);
    out_ += '\n';
  } else {
    flow(node, step());
    out_ += '\n';
  }
}

void validate(const EmitOptions &options) {
  if (options.indent < 1 || options.indent > 9) {
    throw ValidationError("indent must be between 1 and 9, got " + std::to_string(options.indent));
  }
  if (options.width < 20) {
    throw ValidationError("width must be at least 20, got " + std::to_string(options.width));
  }
}

} // namespace

std::string format_float(double value) {
  if (std::isnan(value))
    return ".nan";
  if (std::isinf(value))
    return value < 0 ? "-.inf" : ".inf";

  char buffer[64];
  auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  std::string text(buffer, ptr);
  // Keep a float looking like a float: 3 would read back as an integer
  if (text.find_first_of(".e") == std::string::npos)
    text += ".0";
  return text;
}

std::string serialize(const Node &value, const EmitOptions &options) {
  validate(options);
  Emitter emitter(options);
  emitter.document(value, options.explicit_start);
  return emitter.take();
}

std::string serialize_all(const std::vector<Node> &values, const EmitOptions &options) {
  validate(options);
  Emitter emitter(options);
  for (std::size_t i = 0; i < values.size(); ++i) {
    emitter.document(values[i], i > 0 || options.explicit_start);
  }
  return emitter.take();
}

std::string format_yaml(std::string_view source, const EmitOptions &options) {
  std::vector<Node> values;
  for (auto &document : parse_documents(source)) {
    values.push_back(document.value());
  }
  return serialize_all(values, options);
}

} // namespace yaml
} // namespace yamlet
