#include "yamlet/lint.hh"

#include <algorithm>
#include <iostream>

namespace yamlet {
namespace yaml {

const char *to_string(Severity severity) noexcept {
  switch (severity) {
  case Severity::Error:
    return "error";
  case Severity::Warning:
    return "warning";
  case Severity::Info:
    return "info";
  case Severity::Hint:
    return "hint";
  }
  return "unknown";
}

std::optional<Severity> parse_severity(std::string_view text) {
  if (text == "error")
    return Severity::Error;
  if (text == "warning")
    return Severity::Warning;
  if (text == "info")
    return Severity::Info;
  if (text == "hint")
    return Severity::Hint;
  return std::nullopt;
}

bool LintConfig::is_enabled(const LintRule &rule) const {
  if (enabled_rules)
    return enabled_rules->contains(std::string(rule.id()));
  return rule.enabled_by_default();
}

Severity LintConfig::severity_of(const LintRule &rule) const {
  auto it = severity.find(std::string(rule.id()));
  return it == severity.end() ? rule.default_severity() : it->second;
}

// LintContext ---------------------------------------------------------------

LintContext::LintContext(std::string_view source, const LintConfig &config) : source_(source), config_(config) {
  line_starts_.push_back(0);
  for (std::size_t i = 0; i < source_.size(); ++i) {
    if (source_[i] == '\n' && i + 1 < source_.size())
      line_starts_.push_back(i + 1);
  }

  std::vector<DocumentRange> ranges = split_documents(source_);
  if (ranges.empty() && !source_.empty()) {
    // Nothing looked like a document; let the scanner judge the whole text
    ranges.push_back(DocumentRange{0, source_.size(), 1});
  }

  for (const auto &range : ranges) {
    LintedDocument document;
    document.range = range;

    Scanner scanner(source_.substr(range.offset, range.length), Location{range.line, 1, range.offset});
    RecordingSource events(scanner);
    Composer composer(events, "", ComposeOptions{ErrorMode::Collect}, &document.issues);
    try {
      while (auto composed = composer.next_document()) {
        document.values.push_back(composed->value());
      }
    } catch (const SyntaxError &e) {
      // The rest of this document is skipped; linting resumes at the next one
      document.syntax_error = e;
    } catch (const SemanticError &e) {
      // Resource limits stop composition even in collect mode
      document.issues.push_back(e);
    }
    document.events = events.events();
    documents_.push_back(std::move(document));
  }
}

std::string_view LintContext::line(std::size_t number) const {
  if (number == 0 || number > line_starts_.size())
    throw RangeError("line number out of range: " + std::to_string(number));
  std::size_t start = line_starts_[number - 1];
  std::size_t end = source_.find('\n', start);
  std::string_view text = source_.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
  if (text.ends_with('\r'))
    text.remove_suffix(1);
  return text;
}

std::size_t LintContext::line_offset(std::size_t number) const {
  if (number == 0 || number > line_starts_.size())
    throw RangeError("line number out of range: " + std::to_string(number));
  return line_starts_[number - 1];
}

Location LintContext::location_at(std::size_t offset) const {
  offset = std::min(offset, source_.size());
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  std::size_t index = static_cast<std::size_t>(it - line_starts_.begin()) - 1;
  std::size_t start = line_starts_[index];
  // An offset just past a final line break starts a line of its own
  if (offset == source_.size() && offset > 0 && source_[offset - 1] == '\n') {
    return Location{line_starts_.size() + 1, 1, offset};
  }
  return Location{index + 1, offset - start + 1, offset};
}

Span LintContext::span_of(std::size_t offset, std::size_t length) const {
  return Span(location_at(offset), location_at(offset + length));
}

// Built-in rules -------------------------------------------------------------

namespace {

Diagnostic make_diagnostic(const LintRule &rule, std::string message, Span span) {
  return Diagnostic{std::string(rule.id()), rule.default_severity(), std::move(message), span, {}, {}};
}

std::size_t count_code_points(std::string_view text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

class SyntaxErrorRule : public LintRule {
public:
  std::string_view id() const override { return "syntax-error"; }
  std::string_view description() const override { return "Reports text that is not well-formed YAML"; }
  Severity default_severity() const override { return Severity::Error; }
  bool structural() const override { return true; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    for (const auto &document : context.documents()) {
      if (!document.syntax_error)
        continue;
      const Location &at = document.syntax_error->location();
      std::size_t length = at.offset < context.source().size() ? 1 : 0;
      out.push_back(make_diagnostic(*this, document.syntax_error->message(), context.span_of(at.offset, length)));
    }
  }
};

// Reports the composer's semantic findings of the given kinds
class ComposeIssueRule : public LintRule {
public:
  ComposeIssueRule(std::string_view id, std::string_view description, std::vector<SemanticError::Kind> kinds)
      : id_(id), description_(description), kinds_(std::move(kinds)) {}

  std::string_view id() const override { return id_; }
  std::string_view description() const override { return description_; }
  Severity default_severity() const override { return Severity::Error; }
  bool structural() const override { return true; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    for (const auto &document : context.documents()) {
      for (const auto &issue : document.issues) {
        if (std::find(kinds_.begin(), kinds_.end(), issue.kind()) == kinds_.end())
          continue;
        Diagnostic diagnostic = make_diagnostic(*this, issue.message(), issue.span());
        switch (issue.kind()) {
        case SemanticError::Kind::DuplicateKey:
          diagnostic.labels.push_back(Label{*issue.previous(), "first defined here"});
          diagnostic.suggestions.push_back(
              Suggestion{"remove this duplicate key or rename it", issue.span(), std::nullopt});
          break;
        case SemanticError::Kind::DuplicateAnchor:
          diagnostic.labels.push_back(Label{*issue.previous(), "first defined here"});
          diagnostic.suggestions.push_back(Suggestion{"rename one of the anchors", issue.span(), std::nullopt});
          break;
        case SemanticError::Kind::RecursiveAlias:
          if (issue.previous())
            diagnostic.labels.push_back(Label{*issue.previous(), "anchor defined here"});
          break;
        case SemanticError::Kind::UndefinedAlias:
          diagnostic.suggestions.push_back(
              Suggestion{"define the anchor before this alias", issue.span(), std::nullopt});
          break;
        default:
          break;
        }
        out.push_back(std::move(diagnostic));
      }
    }
  }

private:
  std::string_view id_;
  std::string_view description_;
  std::vector<SemanticError::Kind> kinds_;
};

class TrailingWhitespaceRule : public LintRule {
public:
  std::string_view id() const override { return "trailing-whitespace"; }
  std::string_view description() const override { return "Forbids spaces and tabs at the end of a line"; }
  Severity default_severity() const override { return Severity::Warning; }
  bool structural() const override { return false; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    for (std::size_t n = 1; n <= context.line_count(); ++n) {
      std::string_view text = context.line(n);
      auto last = text.find_last_not_of(" \t");
      std::size_t begin = last == std::string_view::npos ? 0 : last + 1;
      if (begin == text.size())
        continue;
      Span span = context.span_of(context.line_offset(n) + begin, text.size() - begin);
      Diagnostic diagnostic = make_diagnostic(*this, "trailing spaces", span);
      diagnostic.suggestions.push_back(Suggestion{"remove trailing whitespace", span, std::string()});
      out.push_back(std::move(diagnostic));
    }
  }
};

class TabIndentationRule : public LintRule {
public:
  std::string_view id() const override { return "tab-indentation"; }
  std::string_view description() const override { return "Forbids tab characters in indentation"; }
  Severity default_severity() const override { return Severity::Warning; }
  bool structural() const override { return false; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    std::size_t width = context.config().indent_size.value_or(2);
    for (std::size_t n = 1; n <= context.line_count(); ++n) {
      std::string_view text = context.line(n);
      auto content = text.find_first_not_of(" \t");
      if (content == std::string_view::npos)
        continue;
      std::string_view indent = text.substr(0, content);
      auto tabs = static_cast<std::size_t>(std::count(indent.begin(), indent.end(), '\t'));
      if (tabs == 0)
        continue;
      Span span = context.span_of(context.line_offset(n), indent.size());
      Diagnostic diagnostic = make_diagnostic(*this, "tab character used for indentation", span);
      diagnostic.suggestions.push_back(
          Suggestion{"indent with spaces", span, std::string(indent.size() - tabs + tabs * width, ' ')});
      out.push_back(std::move(diagnostic));
    }
  }
};

class LineLengthRule : public LintRule {
public:
  std::string_view id() const override { return "line-length"; }
  std::string_view description() const override { return "Limits the number of characters per line"; }
  Severity default_severity() const override { return Severity::Warning; }
  bool structural() const override { return false; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    std::size_t limit = context.config().max_line_length;
    for (std::size_t n = 1; n <= context.line_count(); ++n) {
      std::string_view text = context.line(n);
      std::size_t length = count_code_points(text);
      if (length <= limit)
        continue;

      // Byte position of the first character over the limit
      std::size_t seen = 0, cut = 0;
      for (; cut < text.size(); ++cut) {
        if ((static_cast<unsigned char>(text[cut]) & 0xC0) != 0x80) {
          if (seen == limit)
            break;
          ++seen;
        }
      }
      Span span = context.span_of(context.line_offset(n) + cut, text.size() - cut);
      out.push_back(make_diagnostic(
          *this, "line too long (" + std::to_string(length) + " > " + std::to_string(limit) + " characters)", span));
    }
  }
};

class NewLineAtEndOfFileRule : public LintRule {
public:
  std::string_view id() const override { return "new-line-at-end-of-file"; }
  std::string_view description() const override { return "Requires a line break after the last line"; }
  Severity default_severity() const override { return Severity::Warning; }
  bool structural() const override { return false; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    std::string_view source = context.source();
    if (source.empty() || source.back() == '\n')
      return;
    Span span = context.span_of(source.size(), 0);
    Diagnostic diagnostic = make_diagnostic(*this, "no new line character at the end of file", span);
    diagnostic.suggestions.push_back(Suggestion{"add a line break", span, std::string("\n")});
    out.push_back(std::move(diagnostic));
  }
};

class EmptyValuesRule : public LintRule {
public:
  std::string_view id() const override { return "empty-values"; }
  std::string_view description() const override {
    return "Forbids mapping keys with implicit null values (missing explicit 'null' or '~')";
  }
  Severity default_severity() const override { return Severity::Warning; }
  bool structural() const override { return false; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    struct Frame {
      bool mapping;
      bool expect_key = true;
      std::optional<std::string> key;
      Span key_span;
    };

    for (const auto &document : context.documents()) {
      std::vector<Frame> stack;
      bool anchored = false;
      for (const auto &event : document.events) {
        switch (event.type) {
        case EventType::Anchor:
          anchored = true;
          continue;
        case EventType::Scalar:
        case EventType::Alias:
        case EventType::MappingStart:
        case EventType::SequenceStart:
          if (!stack.empty() && stack.back().mapping) {
            Frame &frame = stack.back();
            if (frame.expect_key) {
              frame.key = event.type == EventType::Scalar && !event.span.empty() ? std::optional(event.value)
                                                                                  : std::nullopt;
              frame.key_span = event.span;
              frame.expect_key = false;
            } else {
              frame.expect_key = true;
              if (frame.key && event.type == EventType::Scalar && event.span.empty() &&
                  event.scalar_style == ScalarStyle::Plain && event.tag.empty() && !anchored) {
                Diagnostic diagnostic =
                    make_diagnostic(*this, "empty value for key '" + *frame.key + "'", frame.key_span);
                diagnostic.suggestions.push_back(
                    Suggestion{"add an explicit null", Span(event.span.start), std::string(" null")});
                out.push_back(std::move(diagnostic));
              }
            }
          }
          anchored = false;
          if (event.type == EventType::MappingStart)
            stack.push_back(Frame{true});
          else if (event.type == EventType::SequenceStart)
            stack.push_back(Frame{false});
          break;
        case EventType::MappingEnd:
        case EventType::SequenceEnd:
          if (!stack.empty())
            stack.pop_back();
          break;
        default:
          break;
        }
      }
    }
  }
};

class IndentationRule : public LintRule {
public:
  std::string_view id() const override { return "indentation"; }
  std::string_view description() const override {
    return "Requires nested block collections to be indented by a consistent step";
  }
  Severity default_severity() const override { return Severity::Warning; }
  bool structural() const override { return false; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    struct Frame {
      bool block;
      bool mapping;
      std::size_t column; // 0-based
    };

    for (const auto &document : context.documents()) {
      std::optional<std::size_t> step = context.config().indent_size;
      std::vector<Frame> stack;
      for (const auto &event : document.events) {
        if (event.type == EventType::MappingEnd || event.type == EventType::SequenceEnd) {
          if (!stack.empty())
            stack.pop_back();
          continue;
        }
        if (event.type != EventType::MappingStart && event.type != EventType::SequenceStart)
          continue;

        bool mapping = event.type == EventType::MappingStart;
        bool block = event.collection_style == CollectionStyle::Block;
        std::size_t column = event.span.start.column - 1;
        if (block && !stack.empty() && stack.back().block && column > 0) {
          const Frame &parent = stack.back();
          std::string_view text = context.line(event.span.start.line);
          // Collections that share a line with their parent's indicator (`- a: 1`) are not checked
          bool compact = text.substr(0, std::min(column, text.size())).find_first_not_of(' ') != std::string_view::npos;
          if (!compact && column > parent.column) {
            std::size_t delta = column - parent.column;
            if (!step)
              step = delta;
            if (delta != *step)
              out.push_back(misindented(context, event, parent.column + *step, column));
          } else if (!compact && !(column == parent.column && !mapping && parent.mapping)) {
            if (step)
              out.push_back(misindented(context, event, parent.column + *step, column));
          }
        }
        stack.push_back(Frame{block, mapping, column});
      }
    }
  }

private:
  Diagnostic misindented(const LintContext &context, const Event &event, std::size_t expected,
                         std::size_t found) const {
    Span span = context.span_of(context.line_offset(event.span.start.line), found);
    Diagnostic diagnostic = make_diagnostic(
        *this, "wrong indentation: expected " + std::to_string(expected) + " but found " + std::to_string(found),
        span);
    diagnostic.suggestions.push_back(Suggestion{"indent by " + std::to_string(expected) + " spaces", span,
                                                std::string(expected, ' ')});
    return diagnostic;
  }
};

class DocumentStartRule : public LintRule {
public:
  std::string_view id() const override { return "document-start"; }
  std::string_view description() const override { return "Requires an explicit '---' at each document start"; }
  Severity default_severity() const override { return Severity::Info; }
  bool structural() const override { return false; }
  bool enabled_by_default() const override { return false; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    for (const auto &document : context.documents()) {
      for (const auto &event : document.events) {
        if (event.type != EventType::DocumentStart || !event.implicit)
          continue;
        Span span(event.span.start);
        Diagnostic diagnostic = make_diagnostic(*this, "missing document start \"---\"", span);
        diagnostic.suggestions.push_back(Suggestion{"start the document with '---'", span, std::string("---\n")});
        out.push_back(std::move(diagnostic));
      }
    }
  }
};

class DocumentEndRule : public LintRule {
public:
  std::string_view id() const override { return "document-end"; }
  std::string_view description() const override { return "Requires an explicit '...' at each document end"; }
  Severity default_severity() const override { return Severity::Info; }
  bool structural() const override { return false; }
  bool enabled_by_default() const override { return false; }

  void check(const LintContext &context, std::vector<Diagnostic> &out) const override {
    for (const auto &document : context.documents()) {
      for (const auto &event : document.events) {
        if (event.type != EventType::DocumentEnd || !event.implicit)
          continue;
        out.push_back(make_diagnostic(*this, "missing document end \"...\"", Span(event.span.start)));
      }
    }
  }
};

} // namespace

std::vector<std::unique_ptr<LintRule>> builtin_rules() {
  using Kind = SemanticError::Kind;
  std::vector<std::unique_ptr<LintRule>> rules;
  rules.push_back(std::make_unique<SyntaxErrorRule>());
  rules.push_back(std::make_unique<ComposeIssueRule>(
      "duplicate-key", "Detects duplicate keys in mappings", std::vector<Kind>{Kind::DuplicateKey}));
  rules.push_back(std::make_unique<ComposeIssueRule>("undefined-alias",
                                                     "Detects aliases to undefined or enclosing anchors",
                                                     std::vector<Kind>{Kind::UndefinedAlias, Kind::RecursiveAlias}));
  rules.push_back(std::make_unique<ComposeIssueRule>(
      "duplicate-anchor", "Detects anchors defined twice in one document", std::vector<Kind>{Kind::DuplicateAnchor}));
  rules.push_back(std::make_unique<ComposeIssueRule>("invalid-value",
                                                     "Detects values that do not fit their tag or exceed limits",
                                                     std::vector<Kind>{Kind::InvalidValue, Kind::LimitExceeded}));
  rules.push_back(std::make_unique<IndentationRule>());
  rules.push_back(std::make_unique<TrailingWhitespaceRule>());
  rules.push_back(std::make_unique<TabIndentationRule>());
  rules.push_back(std::make_unique<LineLengthRule>());
  rules.push_back(std::make_unique<NewLineAtEndOfFileRule>());
  rules.push_back(std::make_unique<EmptyValuesRule>());
  rules.push_back(std::make_unique<DocumentStartRule>());
  rules.push_back(std::make_unique<DocumentEndRule>());
  return rules;
}

// Linter -----------------------------------------------------------------------

Linter::Linter() : Linter(LintConfig{}) {}

Linter::Linter(LintConfig config) : config_(std::move(config)), rules_(builtin_rules()) {}

void Linter::add_rule(std::unique_ptr<LintRule> rule) { rules_.push_back(std::move(rule)); }

std::vector<Diagnostic> Linter::lint(std::string_view source) const {
  LintContext context(source, config_);
  if (config_.verbose) {
    std::cerr << "[DEBUG] lint: " << context.documents().size() << " document(s), " << context.line_count()
              << " line(s)" << std::endl;
  }

  std::vector<Diagnostic> diagnostics;
  for (const auto &rule : rules_) {
    if (!config_.is_enabled(*rule))
      continue;
    std::vector<Diagnostic> found;
    rule->check(context, found);
    Severity severity = config_.severity_of(*rule);
    for (auto &diagnostic : found) {
      diagnostic.severity = severity;
      diagnostics.push_back(std::move(diagnostic));
    }
    if (config_.verbose && !found.empty()) {
      std::cerr << "[DEBUG] lint: rule '" << rule->id() << "' reported " << found.size() << " diagnostic(s)"
                << std::endl;
    }
  }

  std::stable_sort(diagnostics.begin(), diagnostics.end(), [](const Diagnostic &a, const Diagnostic &b) {
    if (a.span.start.offset != b.span.start.offset)
      return a.span.start.offset < b.span.start.offset;
    if (a.severity != b.severity)
      return a.severity < b.severity;
    return a.code < b.code;
  });

  if (config_.max_diagnostics && diagnostics.size() > *config_.max_diagnostics) {
    if (config_.verbose) {
      std::cerr << "[DEBUG] lint: dropping " << diagnostics.size() - *config_.max_diagnostics
                << " diagnostic(s) beyond max-diagnostics" << std::endl;
    }
    diagnostics.erase(diagnostics.begin() + static_cast<std::ptrdiff_t>(*config_.max_diagnostics), diagnostics.end());
  }
  return diagnostics;
}

std::vector<Diagnostic> lint(std::string_view source, const LintConfig &config) {
  return Linter(config).lint(source);
}

} // namespace yaml
} // namespace yamlet
