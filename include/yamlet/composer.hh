#pragma once

#include "./prelude.hh"
#include "./scanner.hh"

#include <cstddef>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace yamlet {
namespace yaml {

enum class ErrorMode {
  FailFast, // throw the first SemanticError
  Collect,  // record SemanticErrors and keep composing
};

struct ComposeOptions {
  ErrorMode mode = ErrorMode::FailFast;
  std::size_t max_depth = 256;
  std::size_t max_nodes = 1'000'000;
};

// Core Schema resolution of an untagged plain scalar
Node resolve_plain_scalar(std::string_view text);

// Core Schema integer grammar: decimal, 0o octal or 0x hexadecimal. Values
// beyond the int64 range come back as Float.
std::optional<Node> parse_core_int(std::string_view text);

// Core Schema float grammar, including .inf and .nan spellings
std::optional<double> parse_core_float(std::string_view text);

// Builds value graphs from an event stream, one document at a time
class Composer {
public:
  // With ErrorMode::Collect, semantic problems are appended to `issues`
  explicit Composer(EventSource &events, std::string filename = "", ComposeOptions options = {},
                    std::vector<SemanticError> *issues = nullptr);

  // The next document, or nullopt once StreamEnd is reached
  std::optional<Document> next_document();

private:
  struct AnchorEntry {
    std::optional<Node> value; // empty while the anchored node is being composed
    Span defined_at;
    std::size_t node_count = 0;
  };

  EventSource &events_;
  std::string filename_;
  ComposeOptions options_;
  std::vector<SemanticError> *issues_;

  bool started_ = false;
  bool finished_ = false;
  std::unordered_map<std::string, AnchorEntry> anchors_;
  std::size_t node_count_ = 0;

  Node compose_node(Event event, std::size_t depth, Span *span_out);
  Node compose_scalar(const Event &event);
  Node compose_sequence(const Event &start, std::size_t depth);
  Node compose_mapping(const Event &start, std::size_t depth);
  Node compose_alias(const Event &event);

  void check_collection_tag(const Event &start, std::string_view expected);
  void count_nodes(std::size_t n, const Span &at);
  // Throws in FailFast mode, records otherwise
  void report(SemanticError error);
  [[noreturn]] void unexpected(const Event &event, const char *expected) const;
};

// Parses a stream holding at most one document. Empty input and a lone `---` yield Null.
Node parse(std::string_view source, std::string filename = "");

// Parses every document of a stream eagerly
std::vector<Document> parse_documents(std::string_view source, std::string filename = "");

// Lazy, single-pass sequence of document values; a syntax or semantic error
// surfaces from the step that reaches the offending document
class DocumentStream {
public:
  explicit DocumentStream(std::string source, std::string filename = "");
  ~DocumentStream();

  DocumentStream(DocumentStream &&) noexcept;
  DocumentStream &operator=(DocumentStream &&) noexcept;
  DocumentStream(const DocumentStream &) = delete;
  DocumentStream &operator=(const DocumentStream &) = delete;

  // The next document's value, or nullopt at the end of the stream
  std::optional<Node> next();

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Node;
    using difference_type = std::ptrdiff_t;
    using pointer = const Node *;
    using reference = const Node &;

    iterator() = default;
    explicit iterator(DocumentStream *stream) : stream_(stream) { advance(); }

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    iterator &operator++() {
      advance();
      return *this;
    }
    void operator++(int) { advance(); }

    bool operator==(const iterator &other) const { return stream_ == other.stream_; }

  private:
    DocumentStream *stream_ = nullptr;
    Node current_;

    void advance() {
      if (auto node = stream_->next()) {
        current_ = std::move(*node);
      } else {
        stream_ = nullptr;
      }
    }
  };

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  struct State;
  std::unique_ptr<State> state_;
};

DocumentStream parse_all(std::string source, std::string filename = "");

class YamlStream;

// Result type for noexcept YAML parsing
using ParseResult = std::variant<YamlStream, SyntaxError, SemanticError>;

// Owning, fully parsed YAML stream
class YamlStream {
private:
  std::string filename_;
  std::string source_;
  std::vector<Document> documents_;

  static std::string read_file(const std::string &filename) {
    std::ifstream file(filename);
    if (!file) {
      throw ParseError("Failed to open file for reading", filename);
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }

public:
  // Constructor for parsing from source - THROWS SyntaxError / SemanticError on failure
  YamlStream(std::string filename, std::string source);

  // Constructor for parsing from file - THROWS ParseError on failure
  explicit YamlStream(std::string filename) : YamlStream(filename, read_file(filename)) {}

  const std::string &filename() const noexcept { return filename_; }
  const std::string &source() const noexcept { return source_; }
  const std::vector<Document> &documents() const noexcept { return documents_; }

  // Root of the first document; Null for an empty stream
  Node root() const { return documents_.empty() ? Node() : documents_[0].value(); }

  Node root(std::size_t index) const {
    if (index >= documents_.size())
      throw RangeError("Document index out of range: " + std::to_string(index));
    return documents_[index].value();
  }

  bool isMultiDocument() const noexcept { return documents_.size() > 1; }
  std::size_t documentCount() const noexcept { return documents_.size(); }

  // Static parsing function - noexcept version that returns ParseResult
  static ParseResult Parse(std::string filename, std::string source) noexcept;
};

} // namespace yaml
} // namespace yamlet
