#include "yamlet/composer.hh"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace yamlet {
namespace yaml {

namespace {

constexpr std::string_view kCoreTagPrefix = "tag:yaml.org,2002:";

bool all_of(std::string_view s, bool (*pred)(char)) {
  if (s.empty())
    return false;
  for (char c : s) {
    if (!pred(c))
      return false;
  }
  return true;
}

bool is_dec(char c) { return c >= '0' && c <= '9'; }
bool is_oct(char c) { return c >= '0' && c <= '7'; }
bool is_hex(char c) { return is_dec(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }

// Digits that do not fit int64 still denote a finite Float
std::optional<Node> wide_integer(std::string_view digits, int base, bool negative) {
  double value = 0.0;
  for (char c : digits) {
    int d = is_dec(c) ? c - '0' : (c | 0x20) - 'a' + 10;
    value = value * base + d;
  }
  if (!std::isfinite(value))
    return std::nullopt;
  return Node(negative ? -value : value);
}

std::optional<Node> unsigned_integer(std::string_view digits, int base) {
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
  if (ec == std::errc() && ptr == digits.data() + digits.size() &&
      value <= static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max())) {
    return Node(static_cast<int64_t>(value));
  }
  return wide_integer(digits, base, false);
}

std::string describe_key(const Node &key) {
  return vswitch(
      key.value, [](const std::monostate &) -> std::string { return "null"; },
      [](const bool &b) -> std::string { return b ? "true" : "false"; },
      [](const int64_t &i) -> std::string { return std::to_string(i); },
      [](const double &d) -> std::string {
        std::ostringstream os;
        os << d;
        return os.str();
      },
      [](const std::string &s) -> std::string { return s; },
      [](const Sequence &) -> std::string { return "<sequence>"; }, [](const Map &) -> std::string { return "<map>"; });
}

const char *short_tag(std::string_view tag) {
  if (tag == "tag:yaml.org,2002:seq")
    return "!!seq";
  if (tag == "tag:yaml.org,2002:map")
    return "!!map";
  return "!!str";
}

} // namespace

std::optional<Node> parse_core_int(std::string_view text) {
  if (text.size() > 2 && text[0] == '0' && text[1] == 'o') {
    std::string_view digits = text.substr(2);
    return all_of(digits, is_oct) ? unsigned_integer(digits, 8) : std::nullopt;
  }
  if (text.size() > 2 && text[0] == '0' && text[1] == 'x') {
    std::string_view digits = text.substr(2);
    return all_of(digits, is_hex) ? unsigned_integer(digits, 16) : std::nullopt;
  }

  bool negative = false;
  std::string_view digits = text;
  if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
    negative = digits[0] == '-';
    digits.remove_prefix(1);
  }
  if (!all_of(digits, is_dec))
    return std::nullopt;

  int64_t value = 0;
  // from_chars takes the sign but not a leading '+'
  std::string_view signed_digits = negative ? text : digits;
  auto [ptr, ec] = std::from_chars(signed_digits.data(), signed_digits.data() + signed_digits.size(), value);
  if (ec == std::errc() && ptr == signed_digits.data() + signed_digits.size()) {
    return Node(value);
  }
  return wide_integer(digits, 10, negative);
}

std::optional<double> parse_core_float(std::string_view text) {
  if (text.size() == 4 && text[0] == '.') {
    std::string lower;
    for (char c : text)
      lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == ".nan")
      return std::numeric_limits<double>::quiet_NaN();
  }

  std::size_t i = 0;
  bool negative = false;
  if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
    negative = text[i] == '-';
    ++i;
  }
  std::string_view body = text.substr(i);
  if (body == ".inf" || body == ".Inf" || body == ".INF") {
    return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
  }

  // [0-9]* ( \. [0-9]* )? ( [eE] [-+]? [0-9]+ )?, with at least one mantissa digit
  std::size_t int_digits = 0, frac_digits = 0;
  while (i < text.size() && is_dec(text[i])) {
    ++i;
    ++int_digits;
  }
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && is_dec(text[i])) {
      ++i;
      ++frac_digits;
    }
  }
  if (int_digits == 0 && frac_digits == 0)
    return std::nullopt;
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < text.size() && (text[i] == '-' || text[i] == '+'))
      ++i;
    std::size_t exp_digits = 0;
    while (i < text.size() && is_dec(text[i])) {
      ++i;
      ++exp_digits;
    }
    if (exp_digits == 0)
      return std::nullopt;
  }
  if (i != text.size())
    return std::nullopt;

  std::string buffer(text);
  return std::strtod(buffer.c_str(), nullptr);
}

Node resolve_plain_scalar(std::string_view text) {
  if (text.empty() || text == "~" || text == "null")
    return Node();
  if (text == "true")
    return Node(true);
  if (text == "false")
    return Node(false);
  if (auto integer = parse_core_int(text))
    return std::move(*integer);
  if (auto real = parse_core_float(text)) {
    // Integers too long even for a double stay strings
    if (std::isinf(*real) && text.find_first_of(".eE") == std::string_view::npos)
      return Node(text);
    return Node(*real);
  }
  return Node(text);
}

// Composer ------------------------------------------------------------------

Composer::Composer(EventSource &events, std::string filename, ComposeOptions options,
                   std::vector<SemanticError> *issues)
    : events_(events), filename_(std::move(filename)), options_(options), issues_(issues) {}

void Composer::report(SemanticError error) {
  if (options_.mode == ErrorMode::FailFast || !issues_) {
    throw error;
  }
  issues_->push_back(std::move(error));
}

void Composer::unexpected(const Event &event, const char *expected) const {
  throw SyntaxError(std::string("unexpected ") + to_string(event.type) + " event, expected " + expected,
                    event.span.start, filename_);
}

void Composer::count_nodes(std::size_t n, const Span &at) {
  node_count_ += n;
  if (node_count_ > options_.max_nodes) {
    // Resource limits stop composition in every error mode
    throw SemanticError(SemanticError::Kind::LimitExceeded,
                        "document exceeds the limit of " + std::to_string(options_.max_nodes) + " nodes", at,
                        std::nullopt, filename_);
  }
}

std::optional<Document> Composer::next_document() {
  if (finished_)
    return std::nullopt;

  if (!started_) {
    Event start = events_.next();
    if (start.type != EventType::StreamStart)
      unexpected(start, "StreamStart");
    started_ = true;
  }

  Event event = events_.next();
  if (event.type == EventType::StreamEnd) {
    finished_ = true;
    return std::nullopt;
  }
  if (event.type != EventType::DocumentStart)
    unexpected(event, "DocumentStart");

  // Anchors never cross a document boundary
  anchors_.clear();
  node_count_ = 0;

  Document document;
  document.range.start = event.span.start;

  Event next = events_.next();
  if (next.type != EventType::DocumentEnd) {
    document.root = compose_node(std::move(next), 1, nullptr);
    next = events_.next();
  }
  if (next.type != EventType::DocumentEnd)
    unexpected(next, "DocumentEnd");
  document.range.end = next.span.end;
  return document;
}

Node Composer::compose_node(Event event, std::size_t depth, Span *span_out) {
  std::optional<Event> anchor;
  if (event.type == EventType::Anchor) {
    anchor = std::move(event);
    event = events_.next();
  }
  if (span_out)
    *span_out = event.span;

  if (depth > options_.max_depth) {
    throw SemanticError(SemanticError::Kind::LimitExceeded,
                        "maximum nesting depth of " + std::to_string(options_.max_depth) + " exceeded", event.span,
                        std::nullopt, filename_);
  }

  if (event.type == EventType::Alias)
    return compose_alias(event);

  std::size_t nodes_before = node_count_;
  if (anchor) {
    auto it = anchors_.find(anchor->value);
    if (it != anchors_.end()) {
      report(SemanticError(SemanticError::Kind::DuplicateAnchor,
                           "anchor '&" + anchor->value + "' is already defined (first defined at line " +
                               std::to_string(it->second.defined_at.start.line) + ")",
                           anchor->span, it->second.defined_at, filename_));
    }
    // Registered before the children so an alias inside can be recognized as recursive
    anchors_[anchor->value] = AnchorEntry{std::nullopt, anchor->span, 0};
  }

  Node node;
  switch (event.type) {
  case EventType::Scalar:
    node = compose_scalar(event);
    break;
  case EventType::SequenceStart:
    node = compose_sequence(event, depth);
    break;
  case EventType::MappingStart:
    node = compose_mapping(event, depth);
    break;
  default:
    unexpected(event, "a node");
  }

  if (anchor) {
    auto &entry = anchors_[anchor->value];
    entry.value = node;
    entry.node_count = node_count_ - nodes_before;
  }
  return node;
}

Node Composer::compose_alias(const Event &event) {
  auto it = anchors_.find(event.value);
  if (it == anchors_.end()) {
    report(SemanticError(SemanticError::Kind::UndefinedAlias, "undefined alias '*" + event.value + "'", event.span,
                         std::nullopt, filename_));
    return Node();
  }
  if (!it->second.value) {
    report(SemanticError(SemanticError::Kind::RecursiveAlias,
                         "alias '*" + event.value + "' refers to a node that contains it", event.span,
                         it->second.defined_at, filename_));
    return Node();
  }
  count_nodes(it->second.node_count, event.span);
  return *it->second.value;
}

Node Composer::compose_scalar(const Event &event) {
  count_nodes(1, event.span);

  const std::string &tag = event.tag;
  const std::string &text = event.value;
  bool plain = event.scalar_style == ScalarStyle::Plain;

  if (tag == "!")
    return Node(text);
  if (!tag.starts_with(kCoreTagPrefix))
    return plain ? resolve_plain_scalar(text) : Node(text);

  std::string_view kind = std::string_view(tag).substr(kCoreTagPrefix.size());
  std::optional<Node> resolved;
  if (kind == "str") {
    resolved = Node(text);
  } else if (kind == "null") {
    if (text.empty() || text == "~" || text == "null")
      resolved = Node();
  } else if (kind == "bool") {
    if (text == "true" || text == "false")
      resolved = Node(text == "true");
  } else if (kind == "int") {
    resolved = parse_core_int(text);
    if (resolved && !resolved->IsInt())
      resolved = std::nullopt;
  } else if (kind == "float") {
    if (auto real = parse_core_float(text)) {
      resolved = Node(*real);
    } else if (auto integer = parse_core_int(text)) {
      resolved = Node(integer->asDouble());
    }
  } else if (kind == "seq" || kind == "map") {
    report(SemanticError(SemanticError::Kind::InvalidValue, "!!" + std::string(kind) + " cannot tag a scalar",
                         event.span, std::nullopt, filename_));
    return Node(text);
  } else {
    // Other global tags are accepted without affecting resolution
    return plain ? resolve_plain_scalar(text) : Node(text);
  }

  if (!resolved) {
    report(SemanticError(SemanticError::Kind::InvalidValue, "invalid !!" + std::string(kind) + " value '" + text + "'",
                         event.span, std::nullopt, filename_));
    return Node(text);
  }
  return std::move(*resolved);
}

void Composer::check_collection_tag(const Event &start, std::string_view expected) {
  const std::string &tag = start.tag;
  if (tag.empty() || tag == "!" || !tag.starts_with(kCoreTagPrefix))
    return;
  std::string_view kind = std::string_view(tag).substr(kCoreTagPrefix.size());
  if (kind == expected)
    return;
  if (kind == "str" || kind == "int" || kind == "float" || kind == "bool" || kind == "null" || kind == "seq" ||
      kind == "map") {
    std::string what = start.type == EventType::SequenceStart ? "a sequence" : "a mapping";
    std::string shown = (kind == "seq" || kind == "map") ? short_tag(tag) : "!!" + std::string(kind);
    report(SemanticError(SemanticError::Kind::InvalidValue, shown + " cannot tag " + what, start.span, std::nullopt,
                         filename_));
  }
}

Node Composer::compose_sequence(const Event &start, std::size_t depth) {
  count_nodes(1, start.span);
  check_collection_tag(start, "seq");

  Sequence items;
  while (true) {
    Event event = events_.next();
    if (event.type == EventType::SequenceEnd)
      break;
    items.push_back(compose_node(std::move(event), depth + 1, nullptr));
  }
  return Node(std::move(items));
}

Node Composer::compose_mapping(const Event &start, std::size_t depth) {
  count_nodes(1, start.span);
  check_collection_tag(start, "map");

  Map entries;
  std::vector<Span> key_spans;
  while (true) {
    Event event = events_.next();
    if (event.type == EventType::MappingEnd)
      break;

    Span key_span;
    Node key = compose_node(std::move(event), depth + 1, &key_span);
    Node value = compose_node(events_.next(), depth + 1, nullptr);

    auto position = entries.index_of(key);
    if (position != Map::npos) {
      const Span &first = key_spans[position];
      report(SemanticError(SemanticError::Kind::DuplicateKey,
                           "duplicate key '" + describe_key(key) + "' (first defined at line " +
                               std::to_string(first.start.line) + ")",
                           key_span, first, filename_));
      // Collect mode keeps the first value
      continue;
    }
    entries.insert(std::move(key), std::move(value));
    key_spans.push_back(key_span);
  }
  return Node(std::move(entries));
}

// Entry points ------------------------------------------------------------------

Node parse(std::string_view source, std::string filename) {
  Scanner scanner(source, {}, filename);
  Composer composer(scanner, filename);
  auto first = composer.next_document();
  if (!first)
    return Node();
  // A second document is an error for the single-document entry point
  if (auto second = composer.next_document()) {
    throw SyntaxError("expected a single document in the stream, found another", second->range.start, filename);
  }
  return first->value();
}

std::vector<Document> parse_documents(std::string_view source, std::string filename) {
  Scanner scanner(source, {}, filename);
  Composer composer(scanner, filename);
  std::vector<Document> documents;
  while (auto document = composer.next_document()) {
    documents.push_back(std::move(*document));
  }
  return documents;
}

struct DocumentStream::State {
  std::string source;
  Scanner scanner;
  Composer composer;

  State(std::string text, std::string filename)
      : source(std::move(text)), scanner(source, {}, filename), composer(scanner, std::move(filename)) {}
};

DocumentStream::DocumentStream(std::string source, std::string filename)
    : state_(std::make_unique<State>(std::move(source), std::move(filename))) {}

DocumentStream::~DocumentStream() = default;
DocumentStream::DocumentStream(DocumentStream &&) noexcept = default;
DocumentStream &DocumentStream::operator=(DocumentStream &&) noexcept = default;

std::optional<Node> DocumentStream::next() {
  if (!state_)
    return std::nullopt;
  auto document = state_->composer.next_document();
  if (!document) {
    state_.reset();
    return std::nullopt;
  }
  return document->value();
}

DocumentStream parse_all(std::string source, std::string filename) {
  return DocumentStream(std::move(source), std::move(filename));
}

YamlStream::YamlStream(std::string filename, std::string source)
    : filename_(std::move(filename)), source_(std::move(source)) {
  documents_ = parse_documents(source_, filename_);
}

ParseResult YamlStream::Parse(std::string filename, std::string source) noexcept {
  try {
    return ParseResult(std::in_place_type<YamlStream>, std::move(filename), std::move(source));
  } catch (const SyntaxError &e) {
    return e;
  } catch (const SemanticError &e) {
    return e;
  }
}

} // namespace yaml
} // namespace yamlet
