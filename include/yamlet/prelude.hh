#pragma once

#include "./iopd.hh"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace yamlet {

template <class Variant, class... Fs> decltype(auto) vswitch(Variant &&v, Fs &&...fs) {
  struct visitor : Fs... {
    using Fs::operator()...;
  };
  return std::visit(visitor{std::forward<Fs>(fs)...}, std::forward<Variant>(v));
}

namespace yaml {

// Position in source text: 1-based line and column, 0-based byte offset
struct Location {
  std::size_t line = 1;
  std::size_t column = 1;
  std::size_t offset = 0;

  bool operator==(const Location &other) const = default;
  auto operator<=>(const Location &other) const { return offset <=> other.offset; }
};

// Half-open source range [start, end)
struct Span {
  Location start;
  Location end;

  Span() = default;
  Span(Location s, Location e) : start(s), end(e) {}
  explicit Span(Location at) : start(at), end(at) {}

  bool operator==(const Span &other) const = default;

  bool empty() const noexcept { return end.offset <= start.offset; }
  std::size_t length() const noexcept { return empty() ? 0 : end.offset - start.offset; }
};

std::string to_string(const Location &loc);

// YAML exception hierarchy
class Exception : public std::runtime_error {
private:
  std::vector<void *> frames_;
  mutable std::string stack_trace_;

public:
  // Captures the call stack at the throw site; symbolization is deferred
  // until stack_trace() is first asked for
  explicit Exception(const std::string &message);

  const std::string &stack_trace() const;
};

class ParseError : public Exception {
private:
  std::string filename_;
  std::size_t line_;
  std::size_t column_;
  std::string message_;

public:
  ParseError(std::string message, std::string filename = "", std::size_t line = 0, std::size_t column = 0)
      : Exception(FormatErrorMessage(filename, line, column, message)), filename_(std::move(filename)), line_(line),
        column_(column), message_(std::move(message)) {}

  const std::string &filename() const noexcept { return filename_; }
  std::size_t line() const noexcept { return line_; }
  std::size_t column() const noexcept { return column_; }
  const std::string &message() const noexcept { return message_; }

private:
  static std::string FormatErrorMessage(const std::string &filename, std::size_t line, std::size_t column,
                                        const std::string &message) {
    std::string where = filename.empty() ? std::string("<input>") : filename;
    if (line == 0) {
      return filename.empty() ? message : filename + ": " + message;
    }
    return where + ":" + std::to_string(line) + ":" + std::to_string(column) + ": " + message;
  }
};

// Malformed grammar detected while scanning
class SyntaxError : public ParseError {
private:
  Location location_;

public:
  SyntaxError(std::string message, Location location, std::string filename = "")
      : ParseError(std::move(message), std::move(filename), location.line, location.column), location_(location) {}

  const Location &location() const noexcept { return location_; }
};

// Well-formed text that cannot be composed into a value graph
class SemanticError : public ParseError {
public:
  enum class Kind {
    DuplicateKey,
    UndefinedAlias,
    RecursiveAlias,
    DuplicateAnchor,
    InvalidValue,
    LimitExceeded,
  };

private:
  Kind kind_;
  Span span_;
  std::optional<Span> previous_;

public:
  SemanticError(Kind kind, std::string message, Span span, std::optional<Span> previous = std::nullopt,
                std::string filename = "")
      : ParseError(std::move(message), std::move(filename), span.start.line, span.start.column), kind_(kind),
        span_(span), previous_(previous) {}

  Kind kind() const noexcept { return kind_; }
  const Span &span() const noexcept { return span_; }
  // Where the clashing key or anchor was first defined
  const std::optional<Span> &previous() const noexcept { return previous_; }
};

// Failure of one document inside a multi-document dispatch
class DocumentError : public ParseError {
private:
  std::size_t index_;
  std::string cause_;

public:
  DocumentError(std::size_t index, const ParseError &cause)
      : ParseError("document #" + std::to_string(index) + ": " + cause.message(), cause.filename(), cause.line(),
                   cause.column()),
        index_(index), cause_(cause.message()) {}

  std::size_t index() const noexcept { return index_; }
  const std::string &cause() const noexcept { return cause_; }
};

// Input or option rejected before any work starts
class ValidationError : public Exception {
private:
  std::string limit_name_;
  std::uint64_t limit_;
  std::uint64_t observed_;

public:
  explicit ValidationError(const std::string &message) : Exception(message), limit_(0), observed_(0) {}

  ValidationError(std::string limit_name, std::uint64_t limit, std::uint64_t observed)
      : Exception(limit_name + " exceeded: limit is " + std::to_string(limit) + ", observed " +
                  std::to_string(observed)),
        limit_name_(std::move(limit_name)), limit_(limit), observed_(observed) {}

  const std::string &limit_name() const noexcept { return limit_name_; }
  std::uint64_t limit() const noexcept { return limit_; }
  std::uint64_t observed() const noexcept { return observed_; }
};

class TypeError : public Exception {
public:
  using Exception::Exception;
};

class RangeError : public Exception {
public:
  using Exception::Exception;
};

// Forward declarations
struct Node;

struct NodeHash {
  std::size_t operator()(const Node &node) const;
};

using Sequence = std::vector<Node>;
using Map = iopd<Node, Node, NodeHash>;

// Complete YAML value graph node
struct Node {
  using Value = std::variant<std::monostate, // null
                             bool, int64_t, double, std::string, Sequence, Map>;

  Value value;

  Node() = default;
  Node(const Node &other) = default;
  Node(Node &&other) = default;
  Node &operator=(const Node &other) = default;
  Node &operator=(Node &&other) = default;
  explicit Node(Value v) : value(std::move(v)) {}

  // Helper constructors
  Node(std::nullptr_t) : value(std::monostate{}) {}
  explicit Node(bool b) : value(b) {}
  explicit Node(int i) : value(static_cast<int64_t>(i)) {}
  explicit Node(int64_t i) : value(i) {}
  explicit Node(double d) : value(d) {}
  explicit Node(std::string s) : value(std::move(s)) {}
  explicit Node(std::string_view s) : value(std::string(s)) {}
  explicit Node(const char *s) : value(std::string(s)) {}
  explicit Node(Sequence seq) : value(std::move(seq)) {}
  explicit Node(Map map) : value(std::move(map)) {}

  // Type checking methods
  bool IsNull() const { return std::holds_alternative<std::monostate>(value); }
  bool IsBool() const { return std::holds_alternative<bool>(value); }
  bool IsInt() const { return std::holds_alternative<int64_t>(value); }
  bool IsFloat() const { return std::holds_alternative<double>(value); }
  bool IsString() const { return std::holds_alternative<std::string>(value); }
  bool IsSequence() const { return std::holds_alternative<Sequence>(value); }
  bool IsMap() const { return std::holds_alternative<Map>(value); }
  bool IsScalar() const { return !IsSequence() && !IsMap(); }

  // Size method for sequences and maps
  std::size_t size() const {
    if (auto seq = std::get_if<Sequence>(&value)) {
      return seq->size();
    } else if (auto map = std::get_if<Map>(&value)) {
      return map->size();
    }
    return 0;
  }

  // "null", "bool", "integer", "float", "string", "sequence" or "map"
  std::string type_name() const;

  const Map &asMap() const;
  const Sequence &asSequence() const;
  const std::string &asString() const;
  bool asBool() const;
  int64_t asInt64() const;
  double asDouble() const;

  const Node &operator[](std::string_view key) const;
  const Node &operator[](std::size_t index) const;

  // nullptr when this is not a map or the key is absent
  const Node *find(const Node &key) const;
  bool contains(std::string_view key) const;

  // Authoring helpers for callers that build graphs by hand
  void push_back(Node item);
  bool insert(Node key, Node item);
};

// Structural equality: map entry order is ignored, NaN equals NaN
bool operator==(const Node &a, const Node &b);

// Total order used for sorted emission: null < bool < int < float < string < sequence < map
std::weak_ordering compare_nodes(const Node &a, const Node &b);

struct NodeLess {
  bool operator()(const Node &a, const Node &b) const { return compare_nodes(a, b) < 0; }
};

// One parsed unit of a YAML stream
struct Document {
  std::optional<Node> root; // empty for a document without content
  Span range;

  // The root, or Null for an empty document
  Node value() const { return root ? *root : Node(); }
};

} // namespace yaml

} // namespace yamlet
