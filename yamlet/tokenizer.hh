#pragma once

#include "yamlet/prelude.hh"
#include "yamlet/scanner.hh"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace yamlet {
namespace yaml {

enum class TokenType {
  StreamStart,
  StreamEnd,
  VersionDirective,
  TagDirective,
  DocumentStart,
  DocumentEnd,
  BlockSequenceStart,
  BlockMappingStart,
  BlockEnd,
  FlowSequenceStart,
  FlowSequenceEnd,
  FlowMappingStart,
  FlowMappingEnd,
  BlockEntry,
  FlowEntry,
  Key,
  Value,
  Alias,
  Anchor,
  Tag,
  Scalar,
};

struct Token {
  TokenType type;
  Span span;

  // Scalar text, anchor or alias name, tag suffix, directive version or tag handle
  std::string value;
  // Tag handle, or the prefix of a %TAG directive
  std::string extra;
  ScalarStyle style = ScalarStyle::Plain;
};

// Splits YAML text into tokens, tracking indentation, flow nesting and
// candidate simple keys the way YAML 1.2 section 9 describes the grammar
class Tokenizer {
public:
  Tokenizer(std::string_view input, Location base, const std::string &filename);

  const Token &peek();
  Token take();

private:
  struct SimpleKey {
    bool possible = false;
    bool required = false;
    std::size_t token_number = 0;
    Location mark;
  };

  std::string_view input_;
  const std::string &filename_;
  std::size_t pos_ = 0;
  Location mark_;

  std::deque<Token> tokens_;
  std::size_t tokens_parsed_ = 0;
  bool stream_start_produced_ = false;
  bool stream_end_produced_ = false;

  int indent_ = -1;
  std::vector<int> indents_;
  int flow_level_ = 0;
  bool simple_key_allowed_ = false;
  std::vector<SimpleKey> simple_keys_;

  // Continuation bytes of a UTF-8 sequence already checked at its lead byte
  std::size_t utf8_pending_ = 0;

  [[noreturn]] void fail(const std::string &message) const;
  [[noreturn]] void fail(const std::string &message, const Location &at) const;

  // Character classes at pos_ + k
  char at(std::size_t k = 0) const { return pos_ + k < input_.size() ? input_[pos_ + k] : '\0'; }
  bool eof(std::size_t k = 0) const { return pos_ + k >= input_.size(); }
  bool is_break(std::size_t k = 0) const { return !eof(k) && (at(k) == '\n' || at(k) == '\r'); }
  bool is_blank(std::size_t k = 0) const { return !eof(k) && (at(k) == ' ' || at(k) == '\t'); }
  bool is_breakz(std::size_t k = 0) const { return eof(k) || is_break(k); }
  bool is_blankz(std::size_t k = 0) const { return is_blank(k) || is_breakz(k); }
  bool is_flow_indicator(std::size_t k = 0) const;
  bool is_document_indicator() const;
  int column() const { return static_cast<int>(mark_.column) - 1; }
  // True when only spaces and tabs precede pos_ on its line
  bool in_leading_whitespace() const;
  // True when the rest of the current line is blank or a comment
  bool rest_of_line_empty() const;

  void skip();
  void skip_line();
  std::string read_line();
  void copy_char(std::string &out);

  void fetch_more_tokens();
  bool need_more_tokens();
  void fetch_next_token();

  void stale_simple_keys();
  void save_simple_key();
  void remove_simple_key();
  void increase_flow_level();
  void decrease_flow_level();
  void roll_indent(int column, std::ptrdiff_t number, TokenType type, const Location &at);
  void unroll_indent(int column);

  void push(TokenType type, const Location &start);
  void scan_to_next_token();

  void fetch_stream_start();
  void fetch_stream_end();
  void fetch_directive();
  void fetch_document_indicator(TokenType type);
  void fetch_flow_collection_start(TokenType type);
  void fetch_flow_collection_end(TokenType type);
  void fetch_flow_entry();
  void fetch_block_entry();
  void fetch_key();
  void fetch_value();
  void fetch_anchor(TokenType type);
  void fetch_tag();
  void fetch_block_scalar(bool literal);
  void fetch_flow_scalar(bool single);
  void fetch_plain_scalar();

  // Empty for a directive that is ignored
  std::optional<Token> scan_directive();
  std::string scan_tag_handle(bool directive, const Location &start);
  std::string scan_tag_uri(bool verbatim, std::string head, const Location &start);
  Token scan_block_scalar(bool literal);
  void scan_block_scalar_breaks(int &indent, std::string &breaks, Location &end);
  Token scan_flow_scalar(bool single);
  void scan_escape(std::string &out);
  Token scan_plain_scalar();
};

void append_utf8(std::string &out, char32_t cp);

// Length of the well-formed UTF-8 sequence at s[i], 0 when it is ill-formed:
// overlong forms, surrogates, code points above U+10FFFF, stray continuation
// bytes and sequences cut short all count as ill-formed
std::size_t utf8_sequence_length(std::string_view s, std::size_t i);

} // namespace yaml
} // namespace yamlet
