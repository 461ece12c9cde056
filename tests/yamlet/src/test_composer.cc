#include "test_support.hh"

#include <variant>

using namespace yamlet;
using yamlet_test::contains;
using yamlet_test::expect_error;

void test_duplicate_keys() {
  std::cout << "Testing duplicate key detection..." << std::endl;

  auto e = expect_error<yaml::SemanticError>([] { yaml::parse("a: 1\nb: 2\na: 3\n", "dup.yaml"); }, "duplicate key");
  assert(e.kind() == yaml::SemanticError::Kind::DuplicateKey);
  assert(e.span().start.line == 3);
  assert(e.span().start.column == 1);
  assert(e.span().start.offset == 10);
  assert(e.previous());
  assert(e.previous()->start.line == 1);
  assert(e.previous()->start.offset == 0);
  assert(e.filename() == "dup.yaml");
  assert(contains(e.message(), "duplicate key 'a'"));

  // Keys compare by value, not by spelling
  auto numeric = expect_error<yaml::SemanticError>([] { yaml::parse("{1: a, 0x1: b}"); }, "1 and 0x1");
  assert(numeric.kind() == yaml::SemanticError::Kind::DuplicateKey);
  auto null_keys = expect_error<yaml::SemanticError>([] { yaml::parse("~: a\nnull: b\n"); }, "~ and null");
  assert(null_keys.kind() == yaml::SemanticError::Kind::DuplicateKey);

  // Different types are different keys
  assert(yaml::parse("1: a\n'1': b\n").size() == 2);

  // Nested mappings are checked too
  auto nested = expect_error<yaml::SemanticError>([] { yaml::parse("outer:\n  x: 1\n  x: 2\n"); }, "nested");
  assert(nested.span().start.line == 3);
  assert(nested.span().start.column == 3);

  std::cout << "✓ Duplicate key test passed" << std::endl;
}

void test_aliases() {
  std::cout << "Testing anchors and aliases..." << std::endl;

  yaml::Node doc = yaml::parse("base: &b {x: 1, y: [2, 3]}\ncopy: *b\n");
  assert(doc["copy"] == doc["base"]);
  assert(doc["copy"]["y"][1].asInt64() == 3);

  // Redefinition in a later document is fine: anchors are scoped per document
  auto docs = yaml::parse_documents("a: &x 1\n---\nb: &x 2\nc: *x\n");
  assert(docs.size() == 2);
  assert(docs[1].value()["c"].asInt64() == 2);

  auto undefined = expect_error<yaml::SemanticError>([] { yaml::parse("a: *missing\n"); }, "undefined alias");
  assert(undefined.kind() == yaml::SemanticError::Kind::UndefinedAlias);
  assert(undefined.span().start.column == 4);
  assert(contains(undefined.message(), "*missing"));

  // An alias in a later document cannot see anchors of an earlier one
  auto crossing = expect_error<yaml::SemanticError>([] { yaml::parse_documents("a: &x 1\n---\nb: *x\n"); },
                                                    "alias across documents");
  assert(crossing.kind() == yaml::SemanticError::Kind::UndefinedAlias);

  auto recursive = expect_error<yaml::SemanticError>([] { yaml::parse("a: &r [1, *r]\n"); }, "recursive alias");
  assert(recursive.kind() == yaml::SemanticError::Kind::RecursiveAlias);
  assert(recursive.previous());
  assert(recursive.previous()->start.column == 4);

  auto duplicate = expect_error<yaml::SemanticError>([] { yaml::parse("a: &x 1\nb: &x 2\n"); }, "duplicate anchor");
  assert(duplicate.kind() == yaml::SemanticError::Kind::DuplicateAnchor);
  assert(duplicate.span().start.line == 2);
  assert(duplicate.previous()->start.line == 1);

  std::cout << "✓ Anchor and alias test passed" << std::endl;
}

void test_collect_mode() {
  std::cout << "Testing collect mode..." << std::endl;

  std::string text = "a: 1\na: 2\nb: *nope\nc: &d x\ne: &d y\n";
  yaml::Scanner scanner(text);
  std::vector<yaml::SemanticError> issues;
  yaml::Composer composer(scanner, "", yaml::ComposeOptions{yaml::ErrorMode::Collect}, &issues);
  auto document = composer.next_document();
  assert(document);
  assert(!composer.next_document());

  yaml::Node value = document->value();
  // First value wins, unresolved aliases become null
  assert(value["a"].asInt64() == 1);
  assert(value["b"].IsNull());
  assert(value["e"].asString() == "y");

  assert(issues.size() == 3);
  assert(issues[0].kind() == yaml::SemanticError::Kind::DuplicateKey);
  assert(issues[1].kind() == yaml::SemanticError::Kind::UndefinedAlias);
  assert(issues[2].kind() == yaml::SemanticError::Kind::DuplicateAnchor);

  std::cout << "✓ Collect mode test passed" << std::endl;
}

void test_limits() {
  std::cout << "Testing resource limits..." << std::endl;

  std::string deep = std::string(300, '[') + std::string(300, ']');
  auto depth = expect_error<yaml::SemanticError>([&] { yaml::parse(deep); }, "deep nesting");
  assert(depth.kind() == yaml::SemanticError::Kind::LimitExceeded);

  // Exactly at the limit is fine
  std::string ok = std::string(256, '[') + std::string(256, ']');
  assert(yaml::parse(ok).IsSequence());

  std::string laughs = "a: &a [lol, lol, lol, lol, lol, lol, lol, lol, lol, lol]\n";
  const char *names = "abcdefg";
  for (int level = 1; level < 7; ++level) {
    std::string name(1, names[level]);
    std::string prev(1, names[level - 1]);
    laughs += name + ": &" + name + " [";
    for (int i = 0; i < 10; ++i)
      laughs += (i ? ", *" : "*") + prev;
    laughs += "]\n";
  }
  auto bomb = expect_error<yaml::SemanticError>([&] { yaml::parse(laughs); }, "alias expansion bomb");
  assert(bomb.kind() == yaml::SemanticError::Kind::LimitExceeded);
  assert(contains(bomb.message(), "1000000 nodes"));

  // Limits also stop collect mode
  yaml::Scanner scanner(laughs);
  std::vector<yaml::SemanticError> issues;
  yaml::ComposeOptions small{yaml::ErrorMode::Collect, 256, 1000};
  yaml::Composer composer(scanner, "", small, &issues);
  auto limited = expect_error<yaml::SemanticError>([&] { composer.next_document(); }, "collect mode limit");
  assert(limited.kind() == yaml::SemanticError::Kind::LimitExceeded);
  assert(contains(limited.message(), "1000 nodes"));

  std::cout << "✓ Resource limit test passed" << std::endl;
}

void test_multi_document() {
  std::cout << "Testing multi-document streams..." << std::endl;

  const std::string stream = "a: 1\n---\nb: 2\n---\n- 3\n";

  auto single = expect_error<yaml::SyntaxError>([&] { yaml::parse(stream); }, "parse of a stream");
  assert(contains(single.message(), "expected a single document"));
  assert(single.line() == 2);

  auto docs = yaml::parse_documents(stream);
  assert(docs.size() == 3);
  assert(docs[0].value()["a"].asInt64() == 1);
  assert(docs[1].value()["b"].asInt64() == 2);
  assert(docs[2].value()[0].asInt64() == 3);
  assert(docs[1].range.start.line == 2);

  // Lazy stream through the iterator interface
  std::vector<yaml::Node> values;
  for (const auto &value : yaml::parse_all(stream)) {
    values.push_back(value);
  }
  assert(values.size() == 3);
  assert(values[2] == docs[2].value());

  // An error in the second document surfaces only when that document is reached
  yaml::DocumentStream lazy = yaml::parse_all("ok: 1\n---\nbad: [\n");
  auto first = lazy.next();
  assert(first && (*first)["ok"].asInt64() == 1);
  expect_error<yaml::SyntaxError>([&] { lazy.next(); }, "second document");

  // Empty documents keep their place
  auto empties = yaml::parse_documents("---\n---\nx\n");
  assert(empties.size() == 2);
  assert(!empties[0].root);
  assert(empties[0].value().IsNull());
  assert(empties[1].value().asString() == "x");

  assert(yaml::parse_documents("").empty());
  assert(yaml::parse_documents("# just a comment\n").empty());

  std::cout << "✓ Multi-document test passed" << std::endl;
}

void test_yaml_stream() {
  std::cout << "Testing YamlStream..." << std::endl;

  yaml::YamlStream stream("inline.yaml", "name: demo\n---\nname: second\n");
  assert(stream.isMultiDocument());
  assert(stream.documentCount() == 2);
  assert(stream.root()["name"].asString() == "demo");
  assert(stream.root(1)["name"].asString() == "second");
  expect_error<yaml::RangeError>([&] { stream.root(2); }, "document index");

  auto ok = yaml::YamlStream::Parse("ok.yaml", "k: v\n");
  assert(std::holds_alternative<yaml::YamlStream>(ok));
  assert(std::get<yaml::YamlStream>(ok).root()["k"].asString() == "v");

  auto syntax = yaml::YamlStream::Parse("bad.yaml", "k: [v\n");
  assert(std::holds_alternative<yaml::SyntaxError>(syntax));
  assert(std::get<yaml::SyntaxError>(syntax).filename() == "bad.yaml");

  auto semantic = yaml::YamlStream::Parse("dup.yaml", "k: 1\nk: 2\n");
  assert(std::holds_alternative<yaml::SemanticError>(semantic));
  assert(std::get<yaml::SemanticError>(semantic).kind() == yaml::SemanticError::Kind::DuplicateKey);

  auto missing = expect_error<yaml::ParseError>([] { yaml::YamlStream("/nonexistent/yamlet/input.yaml"); },
                                                "missing file");
  assert(missing.filename() == "/nonexistent/yamlet/input.yaml");

  std::cout << "✓ YamlStream test passed" << std::endl;
}

int main() {
  std::cout << "Starting composer tests..." << std::endl;
  try {
    test_duplicate_keys();
    test_aliases();
    test_collect_mode();
    test_limits();
    test_multi_document();
    test_yaml_stream();

    std::cout << "\033[0;32m✓ Composer tests passed\033[0m" << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
    return 1;
  }
}
