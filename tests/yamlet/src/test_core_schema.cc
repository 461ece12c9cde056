#include "test_support.hh"

#include <limits>

using namespace yamlet;
using yamlet_test::expect_error;
using yamlet_test::near;

void test_null_and_bool() {
  std::cout << "Testing null and boolean resolution..." << std::endl;

  assert(yaml::parse("").IsNull());
  assert(yaml::parse("   \n\n").IsNull());
  assert(yaml::parse("# only a comment\n").IsNull());
  assert(yaml::parse("---\n").IsNull());
  assert(yaml::parse("null").IsNull());
  assert(yaml::parse("~").IsNull());

  assert(yaml::parse("true") == yaml::Node(true));
  assert(yaml::parse("false") == yaml::Node(false));

  // Only the lowercase spellings are special in the Core Schema
  for (const char *text : {"True", "TRUE", "yes", "on", "No", "off", "Null", "NULL", "FALSE"}) {
    yaml::Node node = yaml::parse(text);
    assert(node.IsString());
    assert(node.asString() == text);
  }

  std::cout << "✓ Null and boolean resolution test passed" << std::endl;
}

void test_integers() {
  std::cout << "Testing integer resolution..." << std::endl;

  assert(yaml::parse("0").asInt64() == 0);
  assert(yaml::parse("-42").asInt64() == -42);
  assert(yaml::parse("+7").asInt64() == 7);
  assert(yaml::parse("007").asInt64() == 7);
  assert(yaml::parse("0o14").asInt64() == 12);
  assert(yaml::parse("0xFF").asInt64() == 255);
  assert(yaml::parse("0xff").asInt64() == 255);
  assert(yaml::parse("9223372036854775807").asInt64() == std::numeric_limits<int64_t>::max());
  assert(yaml::parse("-9223372036854775808").asInt64() == std::numeric_limits<int64_t>::min());

  // Out of the int64 range the value widens to Float
  yaml::Node wide = yaml::parse("99999999999999999999");
  assert(wide.IsFloat());
  assert(near(wide.asDouble(), 1e20));
  yaml::Node wide_hex = yaml::parse("0xFFFFFFFFFFFFFFFFFF");
  assert(wide_hex.IsFloat());

  // Not integers at all
  for (const char *text : {"0o19", "0x", "0xG1", "1_000", "12abc", "+"}) {
    yaml::Node node = yaml::parse(text);
    assert(node.IsString());
    assert(node.asString() == text);
  }

  assert(yaml::parse_core_int("0o777")->asInt64() == 511);
  assert(!yaml::parse_core_int("0b101"));
  assert(!yaml::parse_core_int(""));

  std::cout << "✓ Integer resolution test passed" << std::endl;
}

void test_floats() {
  std::cout << "Testing float resolution..." << std::endl;

  assert(near(yaml::parse("1.23e+3").asDouble(), 1230.0));
  assert(yaml::parse("1.23e+3").IsFloat());
  assert(near(yaml::parse("1e3").asDouble(), 1000.0));
  assert(yaml::parse("1e3").IsFloat());
  assert(near(yaml::parse("-.5").asDouble(), -0.5));
  assert(near(yaml::parse("1.").asDouble(), 1.0));
  assert(near(yaml::parse("3.14159").asDouble(), 3.14159));

  double inf = yaml::parse(".inf").asDouble();
  assert(std::isinf(inf) && inf > 0);
  double ninf = yaml::parse("-.Inf").asDouble();
  assert(std::isinf(ninf) && ninf < 0);
  assert(std::isinf(yaml::parse("+.INF").asDouble()));
  assert(std::isnan(yaml::parse(".NaN").asDouble()));
  assert(std::isnan(yaml::parse(".nan").asDouble()));

  for (const char *text : {".", "1e", "e3", ".e3", "1.2.3", ".infinity", "nan"}) {
    yaml::Node node = yaml::parse(text);
    assert(node.IsString());
  }

  assert(!yaml::parse_core_float("abc"));
  assert(*yaml::parse_core_float("2.5") == 2.5);

  std::cout << "✓ Float resolution test passed" << std::endl;
}

void test_quoted_and_tagged() {
  std::cout << "Testing quoted and explicitly tagged scalars..." << std::endl;

  // Quoted scalars never resolve
  assert(yaml::parse("'true'") == yaml::Node("true"));
  assert(yaml::parse("\"123\"") == yaml::Node("123"));
  assert(yaml::parse("''") == yaml::Node(""));
  assert(yaml::parse("'null'").IsString());

  assert(yaml::parse("!!str 123") == yaml::Node("123"));
  assert(yaml::parse("!!str true") == yaml::Node("true"));

  yaml::Node one = yaml::parse("!!float 1");
  assert(one.IsFloat());
  assert(one.asDouble() == 1.0);

  assert(yaml::parse("!!int 0x1A").asInt64() == 26);
  assert(yaml::parse("!!bool false") == yaml::Node(false));
  assert(yaml::parse("!!null ''").IsNull());
  assert(yaml::parse("!!null").IsNull());

  // The non-specific tag forces a string, application tags leave resolution alone
  assert(yaml::parse("! 12") == yaml::Node("12"));
  assert(yaml::parse("!custom 12").asInt64() == 12);
  assert(yaml::parse("!<tag:yaml.org,2002:str> 5") == yaml::Node("5"));

  auto bad_bool = expect_error<yaml::SemanticError>([] { yaml::parse("!!bool yes"); }, "!!bool yes");
  assert(bad_bool.kind() == yaml::SemanticError::Kind::InvalidValue);
  assert(bad_bool.line() == 1);

  auto bad_int = expect_error<yaml::SemanticError>([] { yaml::parse("value: !!int 1.5"); }, "!!int 1.5");
  assert(bad_int.kind() == yaml::SemanticError::Kind::InvalidValue);
  assert(bad_int.column() == 14);

  auto seq_on_scalar = expect_error<yaml::SemanticError>([] { yaml::parse("!!seq abc"); }, "!!seq abc");
  assert(seq_on_scalar.kind() == yaml::SemanticError::Kind::InvalidValue);

  auto map_on_seq = expect_error<yaml::SemanticError>([] { yaml::parse("!!map [1]"); }, "!!map [1]");
  assert(map_on_seq.kind() == yaml::SemanticError::Kind::InvalidValue);

  // Explicit collection tags that match are fine
  assert(yaml::parse("!!seq [1, 2]").size() == 2);
  assert(yaml::parse("!!map {a: 1}")["a"].asInt64() == 1);

  std::cout << "✓ Quoted and tagged scalar test passed" << std::endl;
}

void test_node_api() {
  std::cout << "Testing Node accessors and equality..." << std::endl;

  yaml::Node doc = yaml::parse("name: yamlet\nitems: [1, 2.5, x]\nnested: {k: v}\n");
  assert(doc.IsMap());
  assert(doc.size() == 3);
  assert(doc["name"].asString() == "yamlet");
  assert(doc["items"][1].asDouble() == 2.5);
  assert(doc["items"][2].asString() == "x");
  assert(doc.contains("nested"));
  assert(!doc.contains("missing"));
  assert(doc.find(yaml::Node("missing")) == nullptr);
  assert(doc.find(yaml::Node("nested")) != nullptr);

  // Map entries keep document order
  const yaml::Map &map = doc.asMap();
  auto it = map.begin();
  assert(it->key == yaml::Node("name"));
  ++it;
  assert(it->key == yaml::Node("items"));

  auto type_error = expect_error<yaml::TypeError>([&] { doc["name"].asInt64(); }, "asInt64 on a string");
  assert(yamlet_test::contains(type_error.what(), "Expected integer value, got string"));
  expect_error<yaml::RangeError>([&] { doc["missing"]; }, "missing key");
  expect_error<yaml::RangeError>([&] { doc["items"][3]; }, "index past the end");
  expect_error<yaml::TypeError>([&] { doc["items"]["x"]; }, "key lookup on a sequence");

  // Integers widen to double on request
  assert(doc["items"][0].asDouble() == 1.0);

  // Equality ignores mapping order and treats NaN as equal to itself
  assert(yaml::parse("{a: 1, b: 2}") == yaml::parse("{b: 2, a: 1}"));
  assert(!(yaml::parse("[1, 2]") == yaml::parse("[2, 1]")));
  assert(yaml::parse(".nan") == yaml::parse(".NaN"));
  assert(!(yaml::Node(1) == yaml::Node(1.0)));
  assert(!(yaml::Node("1") == yaml::Node(1)));

  // Keys of different types stay distinct
  yaml::Node mixed = yaml::parse("1: int\n'1': str\ntrue: bool\n~: nothing\n");
  assert(mixed.size() == 4);
  assert(mixed.find(yaml::Node(1))->asString() == "int");
  assert(mixed.find(yaml::Node("1"))->asString() == "str");
  assert(mixed.find(yaml::Node(true))->asString() == "bool");
  assert(mixed.find(yaml::Node())->asString() == "nothing");

  // Hand-built graphs
  yaml::Node built(yaml::Map{});
  assert(built.insert(yaml::Node("a"), yaml::Node(1)));
  assert(!built.insert(yaml::Node("a"), yaml::Node(2)));
  yaml::Node list(yaml::Sequence{});
  list.push_back(yaml::Node("x"));
  assert(built.insert(yaml::Node("list"), list));
  assert(built == yaml::parse("a: 1\nlist: [x]"));
  expect_error<yaml::TypeError>([&] { list.insert(yaml::Node("k"), yaml::Node()); }, "insert into a sequence");

  assert(yaml::Node().type_name() == "null");
  assert(yaml::Node(2.0).type_name() == "float");
  assert(list.type_name() == "sequence");

  std::cout << "✓ Node accessor and equality test passed" << std::endl;
}

int main() {
  std::cout << "Starting Core Schema tests..." << std::endl;
  try {
    test_null_and_bool();
    test_integers();
    test_floats();
    test_quoted_and_tagged();
    test_node_api();

    std::cout << "\033[0;32m✓ Core Schema tests passed\033[0m" << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
    return 1;
  }
}
