#include "tokenizer.hh"

#include <algorithm>
#include <cctype>

namespace yamlet {
namespace yaml {

namespace {

constexpr std::size_t kMaxSimpleKeyLength = 1024;

bool is_alnum_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string hex_byte(char c) {
  static constexpr char digits[] = "0123456789ABCDEF";
  auto b = static_cast<unsigned char>(c);
  return {digits[b >> 4], digits[b & 0xF]};
}

std::string describe(char c) {
  if (c == '\t')
    return "'\\t'";
  if (static_cast<unsigned char>(c) < 0x20)
    return "control character";
  return std::string("'") + c + "'";
}

} // namespace

void append_utf8(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

std::size_t utf8_sequence_length(std::string_view s, std::size_t i) {
  auto byte = [&](std::size_t k) -> unsigned { return i + k < s.size() ? static_cast<unsigned char>(s[i + k]) : 0; };
  unsigned lead = byte(0);
  if (i >= s.size())
    return 0;
  if (lead < 0x80)
    return 1;

  std::size_t length;
  unsigned low = 0x80, high = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0)
      low = 0xA0;
    else if (lead == 0xED)
      high = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0)
      low = 0x90;
    else if (lead == 0xF4)
      high = 0x8F;
  } else {
    return 0;
  }

  // The second byte carries the range restrictions, the rest are plain continuation bytes
  if (byte(1) < low || byte(1) > high)
    return 0;
  for (std::size_t k = 2; k < length; ++k) {
    if (byte(k) < 0x80 || byte(k) > 0xBF)
      return 0;
  }
  return length;
}

Tokenizer::Tokenizer(std::string_view input, Location base, const std::string &filename)
    : input_(input), filename_(filename), mark_(base) {
  // A byte order mark takes no column
  if (input_.substr(0, 3) == "\xEF\xBB\xBF") {
    pos_ = 3;
    mark_.offset += 3;
  }
}

void Tokenizer::fail(const std::string &message) const { fail(message, mark_); }

void Tokenizer::fail(const std::string &message, const Location &at) const {
  throw SyntaxError(message, at, filename_);
}

bool Tokenizer::is_flow_indicator(std::size_t k) const {
  if (eof(k))
    return false;
  char c = at(k);
  return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
}

bool Tokenizer::is_document_indicator() const {
  if (column() != 0)
    return false;
  std::string_view head = input_.substr(pos_, 3);
  return (head == "---" || head == "...") && is_blankz(3);
}

bool Tokenizer::in_leading_whitespace() const {
  std::size_t start = pos_ - static_cast<std::size_t>(column());
  for (std::size_t i = start; i < pos_; ++i) {
    if (input_[i] != ' ' && input_[i] != '\t')
      return false;
  }
  return true;
}

bool Tokenizer::rest_of_line_empty() const {
  std::size_t k = 0;
  while (is_blank(k))
    ++k;
  return is_breakz(k) || at(k) == '#';
}

void Tokenizer::skip() {
  if (utf8_pending_ > 0) {
    --utf8_pending_;
  } else if (static_cast<unsigned char>(at()) >= 0x80) {
    std::size_t length = utf8_sequence_length(input_, pos_);
    if (length == 0)
      fail("invalid UTF-8 byte 0x" + hex_byte(at()));
    utf8_pending_ = length - 1;
  }
  ++pos_;
  ++mark_.column;
  ++mark_.offset;
}

void Tokenizer::skip_line() {
  std::size_t width = (at() == '\r' && at(1) == '\n') ? 2 : 1;
  pos_ += width;
  mark_.offset += width;
  ++mark_.line;
  mark_.column = 1;
}

std::string Tokenizer::read_line() {
  skip_line();
  return "\n";
}

void Tokenizer::copy_char(std::string &out) {
  out += at();
  skip();
}

// Token queue -------------------------------------------------------------

const Token &Tokenizer::peek() {
  fetch_more_tokens();
  return tokens_.front();
}

Token Tokenizer::take() {
  fetch_more_tokens();
  Token token = std::move(tokens_.front());
  tokens_.pop_front();
  ++tokens_parsed_;
  return token;
}

bool Tokenizer::need_more_tokens() {
  if (tokens_.empty())
    return true;
  stale_simple_keys();
  for (const auto &key : simple_keys_) {
    if (key.possible && key.token_number == tokens_parsed_)
      return true;
  }
  return false;
}

void Tokenizer::fetch_more_tokens() {
  while (true) {
    if (stream_end_produced_) {
      if (tokens_.empty())
        push(TokenType::StreamEnd, mark_);
      return;
    }
    if (!need_more_tokens())
      return;
    fetch_next_token();
  }
}

void Tokenizer::fetch_next_token() {
  if (!stream_start_produced_) {
    fetch_stream_start();
    return;
  }

  scan_to_next_token();
  stale_simple_keys();
  unroll_indent(column());

  if (eof()) {
    fetch_stream_end();
    return;
  }

  char c = at();

  if (column() == 0 && c == '%') {
    if (flow_level_ > 0)
      fail("found directive inside a flow collection");
    fetch_directive();
    return;
  }

  if (is_document_indicator()) {
    if (flow_level_ > 0)
      fail("found document marker inside a flow collection");
    fetch_document_indicator(c == '-' ? TokenType::DocumentStart : TokenType::DocumentEnd);
    return;
  }

  switch (c) {
  case '[':
    fetch_flow_collection_start(TokenType::FlowSequenceStart);
    return;
  case '{':
    fetch_flow_collection_start(TokenType::FlowMappingStart);
    return;
  case ']':
    fetch_flow_collection_end(TokenType::FlowSequenceEnd);
    return;
  case '}':
    fetch_flow_collection_end(TokenType::FlowMappingEnd);
    return;
  case ',':
    fetch_flow_entry();
    return;
  case '*':
    fetch_anchor(TokenType::Alias);
    return;
  case '&':
    fetch_anchor(TokenType::Anchor);
    return;
  case '!':
    fetch_tag();
    return;
  case '\'':
    fetch_flow_scalar(true);
    return;
  case '"':
    fetch_flow_scalar(false);
    return;
  default:
    break;
  }

  if (c == '-' && is_blankz(1)) {
    fetch_block_entry();
    return;
  }
  if (c == '?' && (flow_level_ > 0 || is_blankz(1))) {
    fetch_key();
    return;
  }
  if (c == ':' && (flow_level_ > 0 || is_blankz(1))) {
    fetch_value();
    return;
  }
  if ((c == '|' || c == '>') && flow_level_ == 0) {
    fetch_block_scalar(c == '|');
    return;
  }

  static constexpr std::string_view indicators = "-?:,[]{}#&*!|>'\"%@`";
  bool plain_start = (!is_blankz() && indicators.find(c) == std::string_view::npos) ||
                     (c == '-' && !is_blankz(1)) || (flow_level_ == 0 && (c == '?' || c == ':') && !is_blankz(1));
  if (plain_start) {
    fetch_plain_scalar();
    return;
  }

  fail("found character " + describe(c) + " that cannot start any token");
}

void Tokenizer::scan_to_next_token() {
  bool crossed_line = false;
  while (true) {
    while (at() == ' ' || at() == '\t') {
      if (at() == '\t' && flow_level_ == 0 && in_leading_whitespace() && !rest_of_line_empty()) {
        fail("found a tab character used as indentation");
      }
      skip();
    }
    if (at() == '#') {
      while (!is_breakz())
        skip();
    }
    if (!is_break())
      break;
    skip_line();
    crossed_line = true;
    if (flow_level_ == 0)
      simple_key_allowed_ = true;
  }

  if (crossed_line && flow_level_ > 0 && !eof() && column() <= indent_) {
    fail("wrong indentation of flow collection content");
  }
}

// Simple keys and indentation ----------------------------------------------

void Tokenizer::stale_simple_keys() {
  for (auto &key : simple_keys_) {
    if (key.possible && (key.mark.line < mark_.line || key.mark.offset + kMaxSimpleKeyLength < mark_.offset)) {
      if (key.required)
        fail("could not find expected ':'", key.mark);
      key.possible = false;
    }
  }
}

void Tokenizer::save_simple_key() {
  bool required = flow_level_ == 0 && indent_ == column();
  if (simple_key_allowed_) {
    remove_simple_key();
    auto &key = simple_keys_.back();
    key.possible = true;
    key.required = required;
    key.token_number = tokens_parsed_ + tokens_.size();
    key.mark = mark_;
  }
}

void Tokenizer::remove_simple_key() {
  auto &key = simple_keys_.back();
  if (key.possible && key.required)
    fail("could not find expected ':'", key.mark);
  key.possible = false;
}

void Tokenizer::increase_flow_level() {
  simple_keys_.emplace_back();
  ++flow_level_;
}

void Tokenizer::decrease_flow_level() {
  if (flow_level_ > 0) {
    --flow_level_;
    simple_keys_.pop_back();
  }
}

void Tokenizer::roll_indent(int column, std::ptrdiff_t number, TokenType type, const Location &at) {
  if (flow_level_ > 0)
    return;
  if (indent_ < column) {
    indents_.push_back(indent_);
    indent_ = column;
    Token token{type, Span(at)};
    if (number < 0) {
      tokens_.push_back(std::move(token));
    } else {
      tokens_.insert(tokens_.begin() + (number - static_cast<std::ptrdiff_t>(tokens_parsed_)), std::move(token));
    }
  }
}

void Tokenizer::unroll_indent(int column) {
  if (flow_level_ > 0)
    return;
  while (indent_ > column) {
    push(TokenType::BlockEnd, mark_);
    indent_ = indents_.back();
    indents_.pop_back();
  }
}

void Tokenizer::push(TokenType type, const Location &start) { tokens_.push_back(Token{type, Span(start, mark_)}); }

// Fetchers -------------------------------------------------------------------

void Tokenizer::fetch_stream_start() {
  indent_ = -1;
  simple_keys_.emplace_back();
  simple_key_allowed_ = true;
  stream_start_produced_ = true;
  push(TokenType::StreamStart, mark_);
}

void Tokenizer::fetch_stream_end() {
  unroll_indent(-1);
  remove_simple_key();
  simple_key_allowed_ = false;
  stream_end_produced_ = true;
  push(TokenType::StreamEnd, mark_);
}

void Tokenizer::fetch_directive() {
  unroll_indent(-1);
  remove_simple_key();
  simple_key_allowed_ = false;
  if (auto token = scan_directive()) {
    tokens_.push_back(std::move(*token));
  }
}

void Tokenizer::fetch_document_indicator(TokenType type) {
  unroll_indent(-1);
  remove_simple_key();
  simple_key_allowed_ = false;
  Location start = mark_;
  skip();
  skip();
  skip();
  push(type, start);
}

void Tokenizer::fetch_flow_collection_start(TokenType type) {
  save_simple_key();
  increase_flow_level();
  simple_key_allowed_ = true;
  Location start = mark_;
  skip();
  push(type, start);
}

void Tokenizer::fetch_flow_collection_end(TokenType type) {
  if (flow_level_ == 0)
    fail("found unexpected " + describe(at()) + " outside a flow collection");
  remove_simple_key();
  decrease_flow_level();
  simple_key_allowed_ = false;
  Location start = mark_;
  skip();
  push(type, start);
}

void Tokenizer::fetch_flow_entry() {
  if (flow_level_ == 0)
    fail("found unexpected ',' outside a flow collection");
  remove_simple_key();
  simple_key_allowed_ = true;
  Location start = mark_;
  skip();
  push(TokenType::FlowEntry, start);
}

void Tokenizer::fetch_block_entry() {
  if (flow_level_ > 0)
    fail("block sequence entries are not allowed inside a flow collection");
  if (!simple_key_allowed_)
    fail("block sequence entries are not allowed in this context");
  roll_indent(column(), -1, TokenType::BlockSequenceStart, mark_);
  remove_simple_key();
  simple_key_allowed_ = true;
  Location start = mark_;
  skip();
  push(TokenType::BlockEntry, start);
}

void Tokenizer::fetch_key() {
  if (flow_level_ == 0) {
    if (!simple_key_allowed_)
      fail("mapping keys are not allowed in this context");
    roll_indent(column(), -1, TokenType::BlockMappingStart, mark_);
  }
  remove_simple_key();
  simple_key_allowed_ = flow_level_ == 0;
  Location start = mark_;
  skip();
  push(TokenType::Key, start);
}

void Tokenizer::fetch_value() {
  auto &key = simple_keys_.back();
  if (key.possible) {
    // The scalar or collection just scanned turned out to be a mapping key
    auto position = static_cast<std::ptrdiff_t>(key.token_number - tokens_parsed_);
    tokens_.insert(tokens_.begin() + position, Token{TokenType::Key, Span(key.mark)});
    roll_indent(static_cast<int>(key.mark.column) - 1, static_cast<std::ptrdiff_t>(key.token_number),
                TokenType::BlockMappingStart, key.mark);
    key.possible = false;
    simple_key_allowed_ = false;
  } else {
    if (flow_level_ == 0) {
      if (!simple_key_allowed_)
        fail("mapping values are not allowed in this context");
      roll_indent(column(), -1, TokenType::BlockMappingStart, mark_);
    }
    simple_key_allowed_ = flow_level_ == 0;
  }
  Location start = mark_;
  skip();
  push(TokenType::Value, start);
}

void Tokenizer::fetch_anchor(TokenType type) {
  save_simple_key();
  simple_key_allowed_ = false;

  Location start = mark_;
  skip();
  std::string name;
  while (!is_blankz() && !is_flow_indicator()) {
    copy_char(name);
  }
  if (name.empty()) {
    fail(type == TokenType::Anchor ? "found an anchor without a name" : "found an alias without a name", start);
  }
  Token token{type, Span(start, mark_)};
  token.value = std::move(name);
  tokens_.push_back(std::move(token));
}

void Tokenizer::fetch_tag() {
  save_simple_key();
  simple_key_allowed_ = false;

  Location start = mark_;
  std::string handle;
  std::string suffix;

  if (at(1) == '<') {
    skip();
    skip();
    suffix = scan_tag_uri(true, "", start);
    if (at() != '>')
      fail("did not find the expected '>' closing a verbatim tag", start);
    skip();
    if (suffix.empty())
      fail("found an empty verbatim tag", start);
  } else {
    handle = scan_tag_handle(false, start);
    if (handle.size() > 1 && handle.back() == '!') {
      suffix = scan_tag_uri(false, "", start);
    } else {
      // `!local`: the handle is the primary `!`, everything after it is the suffix
      suffix = scan_tag_uri(false, handle.substr(1), start);
      handle = "!";
      if (suffix.empty()) {
        // Non-specific tag
        handle.clear();
        suffix = "!";
      }
    }
  }

  if (!is_blankz() && !(flow_level_ > 0 && at() == ',')) {
    fail("did not find expected whitespace or line break after a tag", start);
  }

  Token token{TokenType::Tag, Span(start, mark_)};
  token.value = std::move(suffix);
  token.extra = std::move(handle);
  tokens_.push_back(std::move(token));
}

void Tokenizer::fetch_block_scalar(bool literal) {
  remove_simple_key();
  simple_key_allowed_ = true;
  tokens_.push_back(scan_block_scalar(literal));
}

void Tokenizer::fetch_flow_scalar(bool single) {
  save_simple_key();
  simple_key_allowed_ = false;
  tokens_.push_back(scan_flow_scalar(single));
}

void Tokenizer::fetch_plain_scalar() {
  save_simple_key();
  simple_key_allowed_ = false;
  tokens_.push_back(scan_plain_scalar());
}

// Scanners ---------------------------------------------------------------------

std::optional<Token> Tokenizer::scan_directive() {
  Location start = mark_;
  skip();

  std::string name;
  while (is_alnum_char(at()))
    copy_char(name);
  if (name.empty())
    fail("could not find expected directive name", start);
  if (!is_blankz())
    fail("found unexpected non-alphabetical character in directive name", start);

  std::optional<Token> token;
  if (name == "YAML") {
    while (is_blank())
      skip();
    std::string major, minor;
    while (is_digit(at()))
      copy_char(major);
    if (major.empty() || at() != '.')
      fail("did not find expected version number in %YAML directive", start);
    skip();
    while (is_digit(at()))
      copy_char(minor);
    if (minor.empty() || major.size() > 9 || minor.size() > 9)
      fail("found invalid version number in %YAML directive", start);
    token = Token{TokenType::VersionDirective, Span(start, mark_)};
    token->value = major + "." + minor;
  } else if (name == "TAG") {
    while (is_blank())
      skip();
    std::string handle = scan_tag_handle(true, start);
    if (!is_blank())
      fail("did not find expected whitespace after %TAG handle", start);
    while (is_blank())
      skip();
    std::string prefix = scan_tag_uri(true, "", start);
    if (prefix.empty())
      fail("did not find expected tag prefix in %TAG directive", start);
    if (!is_blankz())
      fail("did not find expected whitespace or line break after %TAG prefix", start);
    token = Token{TokenType::TagDirective, Span(start, mark_)};
    token->value = std::move(handle);
    token->extra = std::move(prefix);
  } else {
    // Reserved directives are ignored
    while (!is_breakz())
      skip();
  }

  while (is_blank())
    skip();
  if (at() == '#') {
    while (!is_breakz())
      skip();
  }
  if (!is_breakz())
    fail("did not find expected comment or line break after directive", start);
  return token;
}

std::string Tokenizer::scan_tag_handle(bool directive, const Location &start) {
  if (at() != '!')
    fail("did not find expected '!' starting a tag", start);
  std::string handle = "!";
  skip();
  while (is_alnum_char(at()))
    copy_char(handle);
  if (at() == '!') {
    copy_char(handle);
  } else if (directive && handle != "!") {
    fail("did not find expected '!' closing a tag handle", start);
  }
  return handle;
}

std::string Tokenizer::scan_tag_uri(bool verbatim, std::string head, const Location &start) {
  static constexpr std::string_view uri_marks = ";/?:@&=+$.~*'()#_-";
  std::string uri = std::move(head);
  while (!eof()) {
    char c = at();
    bool accepted = std::isalnum(static_cast<unsigned char>(c)) || uri_marks.find(c) != std::string_view::npos ||
                    (verbatim && (c == '!' || c == ',' || c == '[' || c == ']'));
    if (c == '%') {
      int hi = hex_value(at(1)), lo = hex_value(at(2));
      if (hi < 0 || lo < 0)
        fail("found invalid URI escape in tag", start);
      uri += static_cast<char>(hi * 16 + lo);
      skip();
      skip();
      skip();
      continue;
    }
    if (!accepted)
      break;
    copy_char(uri);
  }
  return uri;
}

Token Tokenizer::scan_block_scalar(bool literal) {
  Location start = mark_;
  skip();

  int chomping = 0;
  int increment = 0;
  auto read_indicator = [&]() {
    if (at() == '0')
      fail("found an indentation indicator equal to 0", start);
    increment = at() - '0';
    skip();
  };
  if (at() == '+' || at() == '-') {
    chomping = at() == '+' ? 1 : -1;
    skip();
    if (is_digit(at()))
      read_indicator();
  } else if (is_digit(at())) {
    read_indicator();
    if (at() == '+' || at() == '-') {
      chomping = at() == '+' ? 1 : -1;
      skip();
    }
  }

  while (is_blank())
    skip();
  if (at() == '#') {
    while (!is_breakz())
      skip();
  }
  if (!is_breakz())
    fail("did not find expected comment or line break after block scalar header", start);
  if (is_break())
    skip_line();

  Location end = mark_;
  int indent = 0;
  if (increment) {
    indent = indent_ >= 0 ? indent_ + increment : increment;
  }

  std::string value;
  std::string leading_break;
  std::string trailing_breaks;
  bool leading_blank = false;

  scan_block_scalar_breaks(indent, trailing_breaks, end);

  while (column() == indent && !eof()) {
    bool trailing_blank = is_blank();
    if (!literal && !leading_break.empty() && !leading_blank && !trailing_blank) {
      // Folding: a single line break between two text lines becomes a space
      if (trailing_breaks.empty())
        value += ' ';
      leading_break.clear();
    } else {
      value += leading_break;
      leading_break.clear();
    }
    value += trailing_breaks;
    trailing_breaks.clear();

    leading_blank = is_blank();
    while (!is_breakz())
      copy_char(value);
    end = mark_;
    if (eof())
      break;
    leading_break = read_line();
    scan_block_scalar_breaks(indent, trailing_breaks, end);
  }

  if (chomping != -1)
    value += leading_break;
  if (chomping == 1)
    value += trailing_breaks;

  Token token{TokenType::Scalar, Span(start, end)};
  token.value = std::move(value);
  token.style = literal ? ScalarStyle::Literal : ScalarStyle::Folded;
  return token;
}

void Tokenizer::scan_block_scalar_breaks(int &indent, std::string &breaks, Location &end) {
  int max_indent = 0;
  int empty_max = -1;
  bool detecting = indent == 0;
  while (true) {
    while ((detecting || column() < indent) && at() == ' ')
      skip();
    max_indent = std::max(max_indent, column());
    if ((detecting || column() < indent) && at() == '\t') {
      fail("found a tab character where an indentation space is expected");
    }
    if (!is_break())
      break;
    if (detecting)
      empty_max = std::max(empty_max, column());
    breaks += read_line();
    end = mark_;
  }

  if (detecting) {
    indent = eof() ? max_indent : column();
    indent = std::max({indent, indent_ + 1, 1});
    if (!eof() && column() >= indent && empty_max > indent) {
      fail("leading empty lines of a block scalar are more indented than its content");
    }
  }
}

Token Tokenizer::scan_flow_scalar(bool single) {
  Location start = mark_;
  skip();

  std::string value;
  std::string leading_break;
  std::string trailing_breaks;
  std::string whitespaces;
  const char quote = single ? '\'' : '"';

  while (true) {
    if (is_document_indicator())
      fail("found unexpected document indicator while scanning a quoted scalar", start);
    if (eof())
      fail("found unexpected end of stream while scanning a quoted scalar", start);

    bool leading_blanks = false;
    while (!is_blankz()) {
      if (single && at() == '\'' && at(1) == '\'') {
        value += '\'';
        skip();
        skip();
      } else if (at() == quote) {
        break;
      } else if (!single && at() == '\\' && is_break(1)) {
        // Escaped line break: the break and the next line's indentation are dropped
        skip();
        skip_line();
        leading_blanks = true;
        break;
      } else if (!single && at() == '\\') {
        scan_escape(value);
      } else {
        copy_char(value);
      }
    }

    if (at() == quote)
      break;

    while (is_blank() || is_break()) {
      if (is_blank()) {
        if (!leading_blanks)
          whitespaces += at();
        skip();
      } else if (!leading_blanks) {
        whitespaces.clear();
        leading_break = read_line();
        leading_blanks = true;
      } else {
        trailing_breaks += read_line();
      }
    }

    if (leading_blanks) {
      if (!leading_break.empty()) {
        if (trailing_breaks.empty())
          value += ' ';
        else
          value += trailing_breaks;
      } else {
        value += trailing_breaks;
      }
      leading_break.clear();
      trailing_breaks.clear();
    } else {
      value += whitespaces;
      whitespaces.clear();
    }
  }

  skip();
  Token token{TokenType::Scalar, Span(start, mark_)};
  token.value = std::move(value);
  token.style = single ? ScalarStyle::SingleQuoted : ScalarStyle::DoubleQuoted;
  return token;
}

void Tokenizer::scan_escape(std::string &out) {
  Location escape_at = mark_;
  skip();
  char c = at();
  int digits = 0;
  switch (c) {
  case '0':
    out += '\0';
    break;
  case 'a':
    out += '\x07';
    break;
  case 'b':
    out += '\x08';
    break;
  case 't':
  case '\t':
    out += '\t';
    break;
  case 'n':
    out += '\n';
    break;
  case 'v':
    out += '\x0B';
    break;
  case 'f':
    out += '\x0C';
    break;
  case 'r':
    out += '\r';
    break;
  case 'e':
    out += '\x1B';
    break;
  case ' ':
    out += ' ';
    break;
  case '"':
    out += '"';
    break;
  case '/':
    out += '/';
    break;
  case '\\':
    out += '\\';
    break;
  case 'N':
    append_utf8(out, 0x85);
    break;
  case '_':
    append_utf8(out, 0xA0);
    break;
  case 'L':
    append_utf8(out, 0x2028);
    break;
  case 'P':
    append_utf8(out, 0x2029);
    break;
  case 'x':
    digits = 2;
    break;
  case 'u':
    digits = 4;
    break;
  case 'U':
    digits = 8;
    break;
  default:
    fail("found unknown escape character " + describe(c) + " while scanning a double-quoted scalar", escape_at);
  }
  skip();

  if (digits) {
    char32_t cp = 0;
    for (int i = 0; i < digits; ++i) {
      int v = hex_value(at());
      if (v < 0)
        fail("did not find expected hexadecimal number in escape sequence", escape_at);
      cp = cp * 16 + static_cast<char32_t>(v);
      skip();
    }
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
      fail("found invalid Unicode character escape code", escape_at);
    append_utf8(out, cp);
  }
}

Token Tokenizer::scan_plain_scalar() {
  Location start = mark_;
  Location end = mark_;
  const int indent = indent_ + 1;

  std::string value;
  std::string leading_break;
  std::string trailing_breaks;
  std::string whitespaces;
  bool leading_blanks = false;

  while (true) {
    if (is_document_indicator())
      break;
    if (at() == '#')
      break;

    while (!is_blankz()) {
      if (at() == ':' && (is_blankz(1) || (flow_level_ > 0 && is_flow_indicator(1))))
        break;
      if (flow_level_ > 0 && is_flow_indicator())
        break;

      if (leading_blanks || !whitespaces.empty()) {
        if (leading_blanks) {
          if (trailing_breaks.empty())
            value += ' ';
          else
            value += trailing_breaks;
          leading_break.clear();
          trailing_breaks.clear();
          leading_blanks = false;
        } else {
          value += whitespaces;
          whitespaces.clear();
        }
      }
      copy_char(value);
      end = mark_;
    }

    if (!(is_blank() || is_break()))
      break;

    while (is_blank() || is_break()) {
      if (is_blank()) {
        if (leading_blanks && flow_level_ == 0 && column() < indent && at() == '\t' && !rest_of_line_empty()) {
          fail("found a tab character that violates indentation");
        }
        if (!leading_blanks)
          whitespaces += at();
        skip();
      } else if (!leading_blanks) {
        whitespaces.clear();
        leading_break = read_line();
        leading_blanks = true;
      } else {
        trailing_breaks += read_line();
      }
    }

    if (flow_level_ == 0 && column() < indent)
      break;
  }

  Token token{TokenType::Scalar, Span(start, end)};
  token.value = std::move(value);
  token.style = ScalarStyle::Plain;

  if (leading_blanks)
    simple_key_allowed_ = true;
  return token;
}

} // namespace yaml
} // namespace yamlet
