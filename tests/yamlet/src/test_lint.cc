#include "test_support.hh"

#include <memory>
#include <set>

using namespace yamlet;
using yamlet_test::contains;
using yamlet_test::expect_error;

const yaml::Diagnostic *find_code(const std::vector<yaml::Diagnostic> &diagnostics, const std::string &code) {
  for (const auto &d : diagnostics) {
    if (d.code == code)
      return &d;
  }
  return nullptr;
}

yaml::LintConfig only(std::initializer_list<std::string> rules) {
  yaml::LintConfig config;
  config.enabled_rules = std::set<std::string>(rules);
  return config;
}

void test_duplicate_key_diagnostic() {
  std::cout << "Testing duplicate key diagnostics..." << std::endl;

  auto diagnostics = yaml::lint("a: 1\nb: 2\na: 3\n");
  assert(diagnostics.size() == 1);
  const yaml::Diagnostic &d = diagnostics[0];
  assert(d.code == "duplicate-key");
  assert(d.severity == yaml::Severity::Error);
  assert(contains(d.message, "duplicate key 'a'"));
  assert(d.span.start.line == 3);
  assert(d.span.start.column == 1);
  assert(d.labels.size() == 1);
  assert(d.labels[0].message == "first defined here");
  assert(d.labels[0].span.start.line == 1);
  assert(d.suggestions.size() == 1);
  assert(!d.suggestions[0].replacement);

  // Anchors and aliases are checked as well
  auto anchors = yaml::lint("a: &x 1\nb: &x 2\nc: *y\n");
  assert(find_code(anchors, "duplicate-anchor"));
  assert(find_code(anchors, "undefined-alias"));
  assert(find_code(anchors, "undefined-alias")->span.start.line == 3);

  assert(yaml::lint("a: 1\nb: [x, y]\nc: {d: e}\n").empty());
  assert(yaml::lint("").empty());

  std::cout << "✓ Duplicate key diagnostic test passed" << std::endl;
}

void test_style_rules() {
  std::cout << "Testing style rules..." << std::endl;

  auto trailing = yaml::lint("a: 1  \nb: 2\n");
  assert(trailing.size() == 1);
  assert(trailing[0].code == "trailing-whitespace");
  assert(trailing[0].severity == yaml::Severity::Warning);
  assert(trailing[0].span.start.line == 1);
  assert(trailing[0].span.start.column == 5);
  assert(trailing[0].span.end.column == 7);
  assert(trailing[0].suggestions[0].replacement == std::string());

  auto tabs = yaml::lint("a:\n\tb: 1\n");
  const yaml::Diagnostic *tab = find_code(tabs, "tab-indentation");
  assert(tab);
  assert(tab->span.start.line == 2);
  assert(tab->span.start.column == 1);
  assert(tab->suggestions[0].replacement == std::string("  "));

  std::string long_line = "key: " + std::string(90, 'x') + "\n";
  auto length = yaml::lint(long_line);
  assert(length.size() == 1);
  assert(length[0].code == "line-length");
  assert(length[0].message == "line too long (95 > 80 characters)");
  assert(length[0].span.start.column == 81);
  yaml::LintConfig relaxed;
  relaxed.max_line_length = 120;
  assert(yaml::lint(long_line, relaxed).empty());

  // Characters are counted, not bytes
  std::string accents = "k: ";
  for (int i = 0; i < 70; ++i)
    accents += "\xC3\xA9";
  assert(!find_code(yaml::lint(accents + "\n"), "line-length"));

  auto eof = yaml::lint("a: 1");
  assert(eof.size() == 1);
  assert(eof[0].code == "new-line-at-end-of-file");
  assert(eof[0].span.start.line == 1);
  assert(eof[0].span.start.column == 5);
  assert(eof[0].suggestions[0].replacement == std::string("\n"));

  auto empty = yaml::lint("a:\nb: 1\n");
  assert(empty.size() == 1);
  assert(empty[0].code == "empty-values");
  assert(empty[0].message == "empty value for key 'a'");
  assert(empty[0].span.start.line == 1);
  assert(empty[0].span.start.column == 1);
  assert(find_code(yaml::lint("- a:\n"), "empty-values"));
  assert(yaml::lint("a: ~\nb: null\nc: !!null\n").empty());

  std::cout << "✓ Style rule test passed" << std::endl;
}

void test_indentation() {
  std::cout << "Testing the indentation rule..." << std::endl;

  // The first nested level sets the step for the document
  auto mixed = yaml::lint("a:\n    b: 1\nc:\n  d: 2\n");
  assert(mixed.size() == 1);
  assert(mixed[0].code == "indentation");
  assert(mixed[0].message == "wrong indentation: expected 4 but found 2");
  assert(mixed[0].span.start.line == 4);
  assert(mixed[0].suggestions[0].replacement == std::string(4, ' '));

  yaml::LintConfig two;
  two.indent_size = 2;
  auto fixed = yaml::lint("a:\n    b: 1\nc:\n  d: 2\n", two);
  assert(fixed.size() == 1);
  assert(fixed[0].message == "wrong indentation: expected 2 but found 4");
  assert(fixed[0].span.start.line == 2);

  // Compact nesting and indentless sequences are fine
  assert(yaml::lint("- a: 1\n  b: 2\n- - x\n  - y\n").empty());
  assert(yaml::lint("a:\n- x\n- y\nb:\n  - z\n").empty());

  std::cout << "✓ Indentation rule test passed" << std::endl;
}

void test_configuration() {
  std::cout << "Testing lint configuration..." << std::endl;

  // Document markers are only checked on request
  assert(yaml::lint("a: 1\n").empty());
  auto start = yaml::lint("a: 1\n", only({"document-start"}));
  assert(start.size() == 1);
  assert(start[0].code == "document-start");
  assert(start[0].severity == yaml::Severity::Info);
  assert(yaml::lint("---\na: 1\n", only({"document-start"})).empty());
  assert(yaml::lint("a: 1\n", only({"document-end"})).size() == 1);
  assert(yaml::lint("---\na: 1\n...\n", only({"document-end"})).empty());

  // Disabled rules stay silent
  assert(yaml::lint("a: 1  \n", only({"duplicate-key"})).empty());

  yaml::LintConfig severe;
  severe.severity["trailing-whitespace"] = yaml::Severity::Error;
  auto promoted = yaml::lint("a: 1 \n", severe);
  assert(promoted.size() == 1);
  assert(promoted[0].severity == yaml::Severity::Error);

  yaml::LintConfig capped;
  capped.max_diagnostics = 2;
  auto first_two = yaml::lint("a: 1 \nb: 2 \nc: 3 \nd: 4 \n", capped);
  assert(first_two.size() == 2);
  assert(first_two[0].span.start.line == 1);
  assert(first_two[1].span.start.line == 2);
  capped.max_diagnostics = 0;
  assert(yaml::lint("a: 1 \n", capped).empty());

  // Output is sorted by position and stable from run to run
  const std::string messy = "a: 1 \nb:\n\tc: 2\na: 3\n" + std::string(100, 'z');
  auto once = yaml::lint(messy);
  auto twice = yaml::lint(messy);
  assert(once == twice);
  assert(once.size() > 3);
  for (std::size_t i = 1; i < once.size(); ++i) {
    assert(once[i - 1].span.start.offset <= once[i].span.start.offset);
  }

  std::set<std::string> ids;
  for (const auto &rule : yaml::builtin_rules()) {
    assert(ids.insert(std::string(rule->id())).second);
  }
  for (const char *id : {"syntax-error", "duplicate-key", "undefined-alias", "duplicate-anchor", "invalid-value",
                         "indentation", "trailing-whitespace", "tab-indentation", "line-length",
                         "new-line-at-end-of-file", "empty-values", "document-start", "document-end"}) {
    assert(ids.contains(id));
  }

  std::cout << "✓ Lint configuration test passed" << std::endl;
}

// Flags any occurrence of the word "foo"
class NoFooRule : public yaml::LintRule {
public:
  std::string_view id() const override { return "no-foo"; }
  std::string_view description() const override { return "Forbids foo"; }
  yaml::Severity default_severity() const override { return yaml::Severity::Hint; }
  bool structural() const override { return false; }

  void check(const yaml::LintContext &context, std::vector<yaml::Diagnostic> &out) const override {
    std::string_view source = context.source();
    for (auto at = source.find("foo"); at != std::string_view::npos; at = source.find("foo", at + 3)) {
      out.push_back(yaml::Diagnostic{std::string(id()), default_severity(), "avoid foo", context.span_of(at, 3), {}, {}});
    }
  }
};

void test_custom_rule() {
  std::cout << "Testing custom rules..." << std::endl;

  yaml::Linter linter;
  linter.add_rule(std::make_unique<NoFooRule>());
  auto found = linter.lint("a: foo\nb: bar\nc: [foo]\n");
  assert(found.size() == 2);
  assert(found[0].code == "no-foo");
  assert(found[0].severity == yaml::Severity::Hint);
  assert(found[0].span.start.line == 1);
  assert(found[0].span.start.column == 4);
  assert(found[1].span.start.line == 3);

  yaml::Linter restricted(only({"trailing-whitespace"}));
  restricted.add_rule(std::make_unique<NoFooRule>());
  assert(restricted.lint("a: foo\n").empty());

  std::cout << "✓ Custom rule test passed" << std::endl;
}

void test_lint_context() {
  std::cout << "Testing LintContext..." << std::endl;

  yaml::LintConfig config;
  yaml::LintContext context("a: 1\r\nb: 2", config);
  assert(context.line_count() == 2);
  assert(context.line(1) == "a: 1");
  assert(context.line(2) == "b: 2");
  assert(context.line_offset(2) == 6);
  assert(context.location_at(6) == (yaml::Location{2, 1, 6}));
  assert(context.location_at(100).offset == 10);
  expect_error<yaml::RangeError>([&] { context.line(3); }, "line past the end");
  assert(context.documents().size() == 1);
  assert(context.documents()[0].values.size() == 1);

  std::cout << "✓ LintContext test passed" << std::endl;
}

void test_broken_documents() {
  std::cout << "Testing linting past syntax errors..." << std::endl;

  const std::string source = "a: b: c\n---\nb: 2\nb: 3\n";
  auto diagnostics = yaml::lint(source);
  const yaml::Diagnostic *syntax = find_code(diagnostics, "syntax-error");
  assert(syntax);
  assert(syntax->span.start.line == 1);
  const yaml::Diagnostic *duplicate = find_code(diagnostics, "duplicate-key");
  assert(duplicate);
  assert(duplicate->span.start.line == 4);

  yaml::LintConfig config;
  yaml::LintContext context(source, config);
  assert(context.documents().size() == 2);
  assert(context.documents()[0].syntax_error);
  assert(!context.documents()[1].syntax_error);
  assert(context.documents()[1].values.size() == 1);
  assert(context.documents()[1].values[0]["b"].asInt64() == 2);

  std::cout << "✓ Syntax error recovery test passed" << std::endl;
}

void test_formatting() {
  std::cout << "Testing diagnostic formatting..." << std::endl;

  const std::string source = "a: 1\nb: 2\na: 3\n";
  auto diagnostics = yaml::lint(source);

  std::string text = yaml::format_diagnostics(diagnostics, source);
  assert(text.starts_with("error[duplicate-key]: duplicate key 'a'"));
  assert(contains(text, "  --> 3:1\n"));
  assert(contains(text, " 3 | a: 3\n"));
  assert(contains(text, "   | ^\n"));
  assert(contains(text, " 1 | a: 1\n"));
  assert(contains(text, "   | - first defined here\n"));
  assert(contains(text, "   = help: remove this duplicate key or rename it\n"));
  assert(!contains(text, "\033["));

  std::string colored = yaml::format_diagnostics(diagnostics, source, yaml::DiagnosticFormat::Text, true);
  assert(contains(colored, "\033[1;31m"));

  std::string json = yaml::format_diagnostics(diagnostics, source, "json");
  assert(json.starts_with("["));
  assert(contains(json, "\"code\": \"duplicate-key\""));
  assert(contains(json, "\"severity\": \"error\""));
  assert(contains(json, "\"message\": \"first defined here\""));
  assert(contains(json, "\"replacement\": null"));
  assert(yaml::format_diagnostics({}, source, "json") == "[]");
  assert(yaml::format_diagnostics({}, source, "text").empty());

  auto fix = yaml::lint("a: 1 \n");
  assert(contains(yaml::format_diagnostics(fix, "a: 1 \n"), "help: remove trailing whitespace (remove it)"));

  auto bad = expect_error<yaml::ValidationError>([&] { yaml::format_diagnostics(diagnostics, source, "xml"); },
                                                 "xml format");
  assert(contains(bad.what(), "xml"));

  std::cout << "✓ Diagnostic formatting test passed" << std::endl;
}

void test_multiline_snippet() {
  std::cout << "Testing snippets spanning several lines..." << std::endl;

  const std::string source = "key: |\n  one\n  two\nnext: 1\n";
  yaml::Diagnostic block{"block-scalar",
                         yaml::Severity::Warning,
                         "block scalar",
                         yaml::Span{{1, 6, 5}, {3, 6, 18}},
                         {yaml::Label{yaml::Span{{2, 3, 9}, {4, 1, 19}}, "body ends here"}},
                         {}};
  std::string text = yaml::format_diagnostics({block}, source);

  assert(contains(text, " 1 | key: |\n   |      ^\n"));
  assert(contains(text, " 2 |   one\n   | ^^^^^\n"));
  assert(contains(text, " 3 |   two\n   | ^^^^^\n"));
  // The label covers the rest of line 2 and all of line 3, but not line 4 where it ends
  assert(contains(text, " 2 |   one\n   |   ---\n 3 |   two\n   | ----- body ends here\n"));
  assert(!contains(text, "next: 1"));

  std::cout << "✓ Multi-line snippet test passed" << std::endl;
}

int main() {
  std::cout << "Starting lint tests..." << std::endl;
  try {
    test_duplicate_key_diagnostic();
    test_style_rules();
    test_indentation();
    test_configuration();
    test_custom_rule();
    test_lint_context();
    test_broken_documents();
    test_formatting();
    test_multiline_snippet();

    std::cout << "\033[0;32m✓ Lint tests passed\033[0m" << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
    return 1;
  }
}
