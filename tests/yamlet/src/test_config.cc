#include "test_support.hh"

#include <filesystem>
#include <fstream>

using namespace yamlet;
using yamlet_test::contains;
using yamlet_test::expect_error;

yaml::ValidationError lint_config_error(const std::string &text) {
  return expect_error<yaml::ValidationError>([&] { yaml::LintConfig::from_yaml(yaml::parse(text)); }, text.c_str());
}

void test_lint_config() {
  std::cout << "Testing lint configuration loading..." << std::endl;

  // An empty document means defaults
  yaml::LintConfig defaults = yaml::LintConfig::from_yaml(yaml::Node());
  assert(!defaults.enabled_rules);
  assert(defaults.severity.empty());
  assert(!defaults.max_diagnostics);
  assert(defaults.max_line_length == 80);
  assert(!defaults.indent_size);
  assert(!defaults.verbose);

  yaml::LintConfig config = yaml::LintConfig::from_yaml(yaml::parse("enabled-rules: [duplicate-key, line-length]\n"
                                                                    "severity:\n"
                                                                    "  line-length: error\n"
                                                                    "  duplicate-key: hint\n"
                                                                    "max-diagnostics: 10\n"
                                                                    "max-line-length: 100\n"
                                                                    "indent-size: 4\n"
                                                                    "verbose: false\n"));
  assert(config.enabled_rules);
  assert(config.enabled_rules->size() == 2);
  assert(config.enabled_rules->contains("line-length"));
  assert(config.severity.at("line-length") == yaml::Severity::Error);
  assert(config.severity.at("duplicate-key") == yaml::Severity::Hint);
  assert(config.max_diagnostics == 10u);
  assert(config.max_line_length == 100);
  assert(config.indent_size == 4u);

  // Null leaves an optional limit unset, zero is allowed for the diagnostic cap
  assert(!yaml::LintConfig::from_yaml(yaml::parse("max-diagnostics: ~\n")).max_diagnostics);
  assert(yaml::LintConfig::from_yaml(yaml::parse("max-diagnostics: 0\n")).max_diagnostics == 0u);

  // The loaded configuration drives the linter
  yaml::LintConfig markers = yaml::LintConfig::from_yaml(yaml::parse("enabled-rules: [document-start]\n"));
  auto found = yaml::lint("a: 1\n", markers);
  assert(found.size() == 1);
  assert(found[0].code == "document-start");

  std::cout << "✓ Lint configuration loading test passed" << std::endl;
}

void test_lint_config_errors() {
  std::cout << "Testing rejected lint configurations..." << std::endl;

  assert(contains(lint_config_error("colour: red\n").what(), "unknown lint configuration key 'colour'"));
  assert(contains(lint_config_error("[1, 2]\n").what(), "must be a mapping, got sequence"));
  assert(contains(lint_config_error("1: x\n").what(), "keys must be strings"));
  assert(contains(lint_config_error("enabled-rules: [no-such-rule]\n").what(), "unknown lint rule 'no-such-rule'"));
  assert(contains(lint_config_error("enabled-rules: duplicate-key\n").what(), "must be a sequence"));
  assert(contains(lint_config_error("severity: {line-length: fatal}\n").what(), "must be one of"));
  assert(contains(lint_config_error("severity: {made-up: error}\n").what(), "unknown lint rule 'made-up'"));
  assert(contains(lint_config_error("max-line-length: long\n").what(), "must be an integer, got string"));
  assert(contains(lint_config_error("max-line-length: 0\n").what(), "must be positive"));
  assert(contains(lint_config_error("max-diagnostics: -1\n").what(), "must be non-negative"));
  // `yes` is a plain string, not a boolean
  assert(contains(lint_config_error("verbose: yes\n").what(), "must be a boolean, got string"));

  std::cout << "✓ Rejected lint configuration test passed" << std::endl;
}

void test_lint_config_file() {
  std::cout << "Testing lint configuration files..." << std::endl;

  auto missing = expect_error<yaml::ParseError>([] { yaml::load_lint_config("/nonexistent/yamlet/lint.yaml"); },
                                                "missing config file");
  assert(missing.filename() == "/nonexistent/yamlet/lint.yaml");

  std::filesystem::path path = std::filesystem::temp_directory_path() / "yamlet_test_lint_config.yaml";
  {
    std::ofstream out(path);
    out << "# project lint settings\nmax-line-length: 120\nseverity:\n  trailing-whitespace: info\n";
  }
  yaml::LintConfig config = yaml::load_lint_config(path.string());
  assert(config.max_line_length == 120);
  assert(config.severity.at("trailing-whitespace") == yaml::Severity::Info);

  {
    std::ofstream out(path);
    out << "max-line-length: 120\nmax-line-length: 90\n";
  }
  auto duplicate = expect_error<yaml::SemanticError>([&] { yaml::load_lint_config(path.string()); },
                                                     "duplicate key in config file");
  assert(duplicate.filename() == path.string());
  std::filesystem::remove(path);

  std::cout << "✓ Lint configuration file test passed" << std::endl;
}

void test_parallel_config() {
  std::cout << "Testing parallel configuration loading..." << std::endl;

  yaml::ParallelConfig defaults = yaml::ParallelConfig::from_yaml(yaml::Node());
  assert(defaults.thread_count == yaml::ParallelConfig::default_thread_count());
  assert(defaults.max_input_size == 100u * 1024 * 1024);
  assert(defaults.max_document_count == 100000u);
  assert(defaults.min_chunk_size == 4096u);
  assert(defaults.max_chunk_size == 10u * 1024 * 1024);
  assert(!defaults.verbose);

  yaml::ParallelConfig config = yaml::ParallelConfig::from_yaml(
      yaml::parse("thread-count: 4\nmax-input-size: 1024\nmax-document-count: ~\nverbose: true\n"));
  assert(config.thread_count == 4);
  assert(config.max_input_size == 1024);
  assert(!config.max_document_count);
  assert(config.verbose);

  yaml::ParallelConfig chunked =
      yaml::ParallelConfig::from_yaml(yaml::parse("min-chunk-size: 2048\nmax-chunk-size: 5242880\n"));
  assert(chunked.min_chunk_size == 2048);
  assert(chunked.max_chunk_size == 5242880);

  auto inverted = expect_error<yaml::ValidationError>(
      [] { yaml::ParallelConfig::from_yaml(yaml::parse("min-chunk-size: 10000\nmax-chunk-size: 1000\n")); },
      "maximum chunk below minimum");
  assert(contains(inverted.what(), "max-chunk-size must be at least min-chunk-size (10000), got 1000"));
  // The maximum is checked against the default minimum too
  expect_error<yaml::ValidationError>([] { yaml::ParallelConfig::from_yaml(yaml::parse("max-chunk-size: 100\n")); },
                                      "maximum chunk below default minimum");
  auto zero_chunk = expect_error<yaml::ValidationError>(
      [] { yaml::ParallelConfig::from_yaml(yaml::parse("min-chunk-size: 0\n")); }, "zero chunk size");
  assert(contains(zero_chunk.what(), "'min-chunk-size' must be positive"));

  auto unknown = expect_error<yaml::ValidationError>(
      [] { yaml::ParallelConfig::from_yaml(yaml::parse("threads: 4\n")); }, "unknown key");
  assert(contains(unknown.what(), "unknown parallel configuration key 'threads'"));

  expect_error<yaml::ValidationError>([] { yaml::ParallelConfig::from_yaml(yaml::parse("thread-count: 0\n")); },
                                      "zero threads");
  expect_error<yaml::ValidationError>([] { yaml::ParallelConfig::from_yaml(yaml::parse("thread-count: '4'\n")); },
                                      "quoted thread count");
  auto too_many = expect_error<yaml::ValidationError>(
      [] { yaml::ParallelConfig::from_yaml(yaml::parse("thread-count: 500\n")); }, "500 threads");
  assert(too_many.limit_name() == "thread-count");
  assert(too_many.observed() == 500);

  std::cout << "✓ Parallel configuration loading test passed" << std::endl;
}

int main() {
  std::cout << "Starting configuration tests..." << std::endl;
  try {
    test_lint_config();
    test_lint_config_errors();
    test_lint_config_file();
    test_parallel_config();

    std::cout << "\033[0;32m✓ Configuration tests passed\033[0m" << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
    return 1;
  }
}
