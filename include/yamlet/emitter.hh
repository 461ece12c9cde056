#pragma once

#include "./prelude.hh"

#include <string>
#include <string_view>
#include <vector>

namespace yamlet {
namespace yaml {

struct EmitOptions {
  bool sort_keys = false;
  bool allow_unicode = false;
  // Write every collection in flow style (`[a, b]`, `{k: v}`)
  bool default_flow_style = false;
  // Spaces per nesting level, 1 to 9
  int indent = 2;
  // Preferred line width for flow collections, at least 20
  int width = 80;
  // Start the first document with `---`
  bool explicit_start = false;
};

// Shortest text that reads back as the same double: 1.5, 1e+20, .inf, -.inf, .nan
std::string format_float(double value);

// Throws ValidationError for out-of-range indent or width
std::string serialize(const Node &value, const EmitOptions &options = {});

// Documents after the first start with `---`
std::string serialize_all(const std::vector<Node> &values, const EmitOptions &options = {});

// Re-emits every document of a YAML stream with the given style
std::string format_yaml(std::string_view source, const EmitOptions &options = {});

} // namespace yaml
} // namespace yamlet
