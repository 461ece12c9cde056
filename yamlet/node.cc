#include "yamlet/prelude.hh"

#include <algorithm>
#include <cmath>
#include <functional>

namespace yamlet {
namespace yaml {

std::string to_string(const Location &loc) { return std::to_string(loc.line) + ":" + std::to_string(loc.column); }

namespace {

inline std::size_t mix(std::size_t seed, std::size_t h) {
  return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

std::size_t hash_double(double d) {
  if (std::isnan(d))
    return 0x7ff8000000000000ULL;
  if (d == 0.0)
    return std::hash<double>{}(0.0); // -0.0 hashes like 0.0
  return std::hash<double>{}(d);
}

bool doubles_equal(double a, double b) { return (std::isnan(a) && std::isnan(b)) || a == b; }

std::weak_ordering compare_doubles(double a, double b) {
  bool a_nan = std::isnan(a), b_nan = std::isnan(b);
  if (a_nan || b_nan) {
    if (a_nan && b_nan)
      return std::weak_ordering::equivalent;
    return a_nan ? std::weak_ordering::greater : std::weak_ordering::less;
  }
  if (a < b)
    return std::weak_ordering::less;
  if (a > b)
    return std::weak_ordering::greater;
  return std::weak_ordering::equivalent;
}

std::vector<const Map::entry *> sorted_entries(const Map &map) {
  std::vector<const Map::entry *> out;
  out.reserve(map.size());
  for (const auto &e : map) {
    out.push_back(&e);
  }
  std::sort(out.begin(), out.end(), [](const Map::entry *a, const Map::entry *b) {
    auto c = compare_nodes(a->key, b->key);
    if (c != 0)
      return c < 0;
    return compare_nodes(a->value, b->value) < 0;
  });
  return out;
}

} // namespace

std::size_t NodeHash::operator()(const Node &node) const {
  std::size_t seed = node.value.index();
  return vswitch(
      node.value, [&](const std::monostate &) { return mix(seed, 0); },
      [&](const bool &b) { return mix(seed, std::hash<bool>{}(b)); },
      [&](const int64_t &i) { return mix(seed, std::hash<int64_t>{}(i)); },
      [&](const double &d) { return mix(seed, hash_double(d)); },
      [&](const std::string &s) { return mix(seed, std::hash<std::string>{}(s)); },
      [&](const Sequence &seq) {
        std::size_t h = seed;
        for (const auto &item : seq) {
          h = mix(h, (*this)(item));
        }
        return h;
      },
      [&](const Map &map) {
        // Entry order must not affect the hash, so combine commutatively
        std::size_t sum = 0;
        for (const auto &e : map) {
          sum += mix((*this)(e.key), (*this)(e.value));
        }
        return mix(seed, sum);
      });
}

bool operator==(const Node &a, const Node &b) {
  if (a.value.index() != b.value.index())
    return false;

  return vswitch(
      a.value, [](const std::monostate &) { return true; },
      [&](const bool &x) { return x == std::get<bool>(b.value); },
      [&](const int64_t &x) { return x == std::get<int64_t>(b.value); },
      [&](const double &x) { return doubles_equal(x, std::get<double>(b.value)); },
      [&](const std::string &x) { return x == std::get<std::string>(b.value); },
      [&](const Sequence &x) {
        const auto &y = std::get<Sequence>(b.value);
        if (x.size() != y.size())
          return false;
        for (std::size_t i = 0; i < x.size(); ++i) {
          if (!(x[i] == y[i]))
            return false;
        }
        return true;
      },
      [&](const Map &x) {
        const auto &y = std::get<Map>(b.value);
        if (x.size() != y.size())
          return false;
        for (const auto &e : x) {
          auto it = y.find(e.key);
          if (it == y.end() || !(it->value == e.value))
            return false;
        }
        return true;
      });
}

std::weak_ordering compare_nodes(const Node &a, const Node &b) {
  if (a.value.index() != b.value.index()) {
    return a.value.index() < b.value.index() ? std::weak_ordering::less : std::weak_ordering::greater;
  }

  return vswitch(
      a.value, [](const std::monostate &) { return std::weak_ordering::equivalent; },
      [&](const bool &x) -> std::weak_ordering { return x <=> std::get<bool>(b.value); },
      [&](const int64_t &x) -> std::weak_ordering { return x <=> std::get<int64_t>(b.value); },
      [&](const double &x) { return compare_doubles(x, std::get<double>(b.value)); },
      [&](const std::string &x) -> std::weak_ordering {
        int c = x.compare(std::get<std::string>(b.value));
        return c < 0 ? std::weak_ordering::less : c > 0 ? std::weak_ordering::greater : std::weak_ordering::equivalent;
      },
      [&](const Sequence &x) -> std::weak_ordering {
        const auto &y = std::get<Sequence>(b.value);
        std::size_t n = std::min(x.size(), y.size());
        for (std::size_t i = 0; i < n; ++i) {
          auto c = compare_nodes(x[i], y[i]);
          if (c != 0)
            return c;
        }
        return x.size() <=> y.size();
      },
      [&](const Map &x) -> std::weak_ordering {
        const auto &y = std::get<Map>(b.value);
        if (x.size() != y.size())
          return x.size() <=> y.size();
        auto xs = sorted_entries(x);
        auto ys = sorted_entries(y);
        for (std::size_t i = 0; i < xs.size(); ++i) {
          auto c = compare_nodes(xs[i]->key, ys[i]->key);
          if (c != 0)
            return c;
          c = compare_nodes(xs[i]->value, ys[i]->value);
          if (c != 0)
            return c;
        }
        return std::weak_ordering::equivalent;
      });
}

std::string Node::type_name() const {
  if (std::holds_alternative<std::monostate>(value))
    return "null";
  if (std::holds_alternative<bool>(value))
    return "bool";
  if (std::holds_alternative<int64_t>(value))
    return "integer";
  if (std::holds_alternative<double>(value))
    return "float";
  if (std::holds_alternative<std::string>(value))
    return "string";
  if (std::holds_alternative<Sequence>(value))
    return "sequence";
  return "map";
}

const Map &Node::asMap() const {
  if (auto map = std::get_if<Map>(&value)) {
    return *map;
  }
  throw TypeError("Expected map value, got " + type_name());
}

const Sequence &Node::asSequence() const {
  if (auto seq = std::get_if<Sequence>(&value)) {
    return *seq;
  }
  throw TypeError("Expected sequence value, got " + type_name());
}

const std::string &Node::asString() const {
  if (auto s = std::get_if<std::string>(&value)) {
    return *s;
  }
  throw TypeError("Expected string value, got " + type_name());
}

bool Node::asBool() const {
  if (auto b = std::get_if<bool>(&value)) {
    return *b;
  }
  throw TypeError("Expected bool value, got " + type_name());
}

int64_t Node::asInt64() const {
  if (auto i = std::get_if<int64_t>(&value)) {
    return *i;
  }
  throw TypeError("Expected integer value, got " + type_name());
}

double Node::asDouble() const {
  if (auto d = std::get_if<double>(&value)) {
    return *d;
  }
  // Integers widen silently, as they do in the Core Schema's numeric tower
  if (auto i = std::get_if<int64_t>(&value)) {
    return static_cast<double>(*i);
  }
  throw TypeError("Expected float value, got " + type_name());
}

const Node &Node::operator[](std::string_view key) const {
  const auto &map = asMap();
  auto it = map.find(Node(key));
  if (it == map.end()) {
    throw RangeError("Key not found: " + std::string(key));
  }
  return it->value;
}

const Node &Node::operator[](std::size_t index) const {
  const auto &seq = asSequence();
  if (index >= seq.size()) {
    throw RangeError("Index out of range: " + std::to_string(index));
  }
  return seq[index];
}

const Node *Node::find(const Node &key) const {
  if (auto map = std::get_if<Map>(&value)) {
    auto it = map->find(key);
    return it == map->end() ? nullptr : &it->value;
  }
  return nullptr;
}

bool Node::contains(std::string_view key) const { return asMap().contains(Node(key)); }

void Node::push_back(Node item) {
  if (auto seq = std::get_if<Sequence>(&value)) {
    seq->push_back(std::move(item));
    return;
  }
  throw TypeError("Expected sequence value, got " + type_name());
}

bool Node::insert(Node key, Node item) {
  if (auto map = std::get_if<Map>(&value)) {
    return map->insert(std::move(key), std::move(item)).second;
  }
  throw TypeError("Expected map value, got " + type_name());
}

} // namespace yaml
} // namespace yamlet
