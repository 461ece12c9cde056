#pragma once

#include "./composer.hh"
#include "./parallel.hh"
#include "./prelude.hh"
#include "./scanner.hh"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace yamlet {
namespace yaml {

enum class Severity { Error, Warning, Info, Hint };

// "error", "warning", "info" or "hint"
const char *to_string(Severity severity) noexcept;
std::optional<Severity> parse_severity(std::string_view text);

// Secondary span with an explanation, e.g. where a duplicated key first appeared
struct Label {
  Span span;
  std::string message;

  bool operator==(const Label &other) const = default;
};

// Proposed fix; no replacement means the fix needs a human decision
struct Suggestion {
  std::string message;
  Span span;
  std::optional<std::string> replacement;

  bool operator==(const Suggestion &other) const = default;
};

struct Diagnostic {
  std::string code; // rule id
  Severity severity;
  std::string message;
  Span span;
  std::vector<Label> labels;
  std::vector<Suggestion> suggestions;

  bool operator==(const Diagnostic &other) const = default;
};

class LintRule;

struct LintConfig {
  // Rules to run; unset means every rule that is on by default
  std::optional<std::set<std::string>> enabled_rules;
  // Severity overrides keyed by rule id
  std::map<std::string, Severity> severity;
  std::optional<std::size_t> max_diagnostics;
  std::size_t max_line_length = 80;
  // Spaces per indentation level; unset learns it from each document
  std::optional<std::size_t> indent_size;
  bool verbose = false;

  bool is_enabled(const LintRule &rule) const;
  Severity severity_of(const LintRule &rule) const;

  // Reads the kebab-case keys `enabled-rules`, `severity`, `max-diagnostics`,
  // `max-line-length`, `indent-size` and `verbose`. Throws ValidationError on
  // unknown keys, unknown rule ids or severities, and wrongly typed values.
  static LintConfig from_yaml(const Node &node);
};

// Reads a LintConfig from a YAML file; throws ParseError when it cannot be read
LintConfig load_lint_config(const std::string &path);

// One document of the linted source after a tolerant parse
struct LintedDocument {
  DocumentRange range;
  // Events recorded up to the end of the document or the syntax error
  std::vector<Event> events;
  std::vector<Node> values;
  std::vector<SemanticError> issues;
  std::optional<SyntaxError> syntax_error;
};

// Everything a rule may look at
class LintContext {
public:
  LintContext(std::string_view source, const LintConfig &config);

  std::string_view source() const noexcept { return source_; }
  const LintConfig &config() const noexcept { return config_; }
  const std::vector<LintedDocument> &documents() const noexcept { return documents_; }

  std::size_t line_count() const noexcept { return line_starts_.size(); }
  // Text of a 1-based line without its line break
  std::string_view line(std::size_t number) const;
  // Byte offset where a 1-based line begins
  std::size_t line_offset(std::size_t number) const;
  // Location of a byte offset, clamped to the end of the source
  Location location_at(std::size_t offset) const;
  Span span_of(std::size_t offset, std::size_t length) const;

private:
  std::string_view source_;
  const LintConfig &config_;
  std::vector<std::size_t> line_starts_;
  std::vector<LintedDocument> documents_;
};

class LintRule {
public:
  virtual ~LintRule() = default;

  virtual std::string_view id() const = 0;
  virtual std::string_view description() const = 0;
  virtual Severity default_severity() const = 0;
  // Structural rules report problems of the document itself, style rules report taste
  virtual bool structural() const = 0;
  virtual bool enabled_by_default() const { return true; }

  // Appends findings with the rule's default severity; the Linter applies overrides
  virtual void check(const LintContext &context, std::vector<Diagnostic> &out) const = 0;
};

// Every built-in rule, in registry order
std::vector<std::unique_ptr<LintRule>> builtin_rules();

class Linter {
public:
  Linter();
  explicit Linter(LintConfig config);

  void add_rule(std::unique_ptr<LintRule> rule);
  const std::vector<std::unique_ptr<LintRule>> &rules() const noexcept { return rules_; }
  const LintConfig &config() const noexcept { return config_; }

  // Diagnostics sorted by position, then severity, then rule id, capped at max_diagnostics
  std::vector<Diagnostic> lint(std::string_view source) const;

private:
  LintConfig config_;
  std::vector<std::unique_ptr<LintRule>> rules_;
};

std::vector<Diagnostic> lint(std::string_view source, const LintConfig &config = {});

enum class DiagnosticFormat { Text, Json };

// Text shows each diagnostic with its source line, a caret underline and help
// lines; Json is an array of diagnostic objects
std::string format_diagnostics(const std::vector<Diagnostic> &diagnostics, std::string_view source,
                               DiagnosticFormat format = DiagnosticFormat::Text, bool use_colors = false);

// `format` is "text" or "json"; anything else throws ValidationError
std::string format_diagnostics(const std::vector<Diagnostic> &diagnostics, std::string_view source,
                               std::string_view format, bool use_colors = false);

} // namespace yaml
} // namespace yamlet
