#include "yamlet/composer.hh"
#include "yamlet/lint.hh"
#include "yamlet/parallel.hh"

#include <algorithm>

namespace yamlet {
namespace yaml {

namespace {

// Checks the node is a mapping whose keys are all strings from `known`
const Map *config_map(const Node &node, const char *what, std::initializer_list<std::string_view> known) {
  if (node.IsNull())
    return nullptr;
  if (!node.IsMap())
    throw ValidationError(std::string(what) + " must be a mapping, got " + node.type_name());
  const Map &map = node.asMap();
  for (const auto &entry : map) {
    if (!entry.key.IsString())
      throw ValidationError(std::string(what) + " keys must be strings, got " + entry.key.type_name());
    if (std::find(known.begin(), known.end(), entry.key.asString()) == known.end())
      throw ValidationError("unknown " + std::string(what) + " key '" + entry.key.asString() + "'");
  }
  return &map;
}

bool fetch_bool(const std::string &key, const Node &value) {
  if (!value.IsBool())
    throw ValidationError("'" + key + "' must be a boolean, got " + value.type_name());
  return value.asBool();
}

std::size_t fetch_count(const std::string &key, const Node &value, bool allow_zero) {
  if (!value.IsInt())
    throw ValidationError("'" + key + "' must be an integer, got " + value.type_name());
  int64_t n = value.asInt64();
  if (n < 0 || (n == 0 && !allow_zero))
    throw ValidationError("'" + key + "' must be " + (allow_zero ? "non-negative" : "positive") + ", got " +
                          std::to_string(n));
  return static_cast<std::size_t>(n);
}

std::optional<std::size_t> fetch_optional_count(const std::string &key, const Node &value, bool allow_zero) {
  if (value.IsNull())
    return std::nullopt;
  return fetch_count(key, value, allow_zero);
}

const LintRule &known_rule(const std::vector<std::unique_ptr<LintRule>> &rules, const Node &id) {
  if (!id.IsString())
    throw ValidationError("rule ids must be strings, got " + id.type_name());
  auto it = std::find_if(rules.begin(), rules.end(), [&](const auto &rule) { return rule->id() == id.asString(); });
  if (it == rules.end())
    throw ValidationError("unknown lint rule '" + id.asString() + "'");
  return **it;
}

} // namespace

LintConfig LintConfig::from_yaml(const Node &node) {
  LintConfig config;
  const Map *map = config_map(node, "lint configuration",
                              {"enabled-rules", "severity", "max-diagnostics", "max-line-length", "indent-size",
                               "verbose"});
  if (!map)
    return config;

  auto rules = builtin_rules();
  for (const auto &entry : *map) {
    const std::string &key = entry.key.asString();
    const Node &value = entry.value;
    if (key == "enabled-rules") {
      if (!value.IsSequence())
        throw ValidationError("'enabled-rules' must be a sequence of rule ids, got " + value.type_name());
      std::set<std::string> enabled;
      for (const auto &id : value.asSequence()) {
        enabled.insert(std::string(known_rule(rules, id).id()));
      }
      config.enabled_rules = std::move(enabled);
    } else if (key == "severity") {
      if (!value.IsMap())
        throw ValidationError("'severity' must map rule ids to severities, got " + value.type_name());
      for (const auto &override_entry : value.asMap()) {
        const LintRule &rule = known_rule(rules, override_entry.key);
        std::optional<Severity> severity;
        if (override_entry.value.IsString())
          severity = parse_severity(override_entry.value.asString());
        if (!severity) {
          throw ValidationError("severity of '" + std::string(rule.id()) +
                                "' must be one of error, warning, info, hint");
        }
        config.severity[std::string(rule.id())] = *severity;
      }
    } else if (key == "max-diagnostics") {
      config.max_diagnostics = fetch_optional_count(key, value, true);
    } else if (key == "max-line-length") {
      config.max_line_length = fetch_count(key, value, false);
    } else if (key == "indent-size") {
      config.indent_size = fetch_optional_count(key, value, false);
    } else if (key == "verbose") {
      config.verbose = fetch_bool(key, value);
    }
  }
  return config;
}

LintConfig load_lint_config(const std::string &path) {
  YamlStream stream(path);
  return LintConfig::from_yaml(stream.root());
}

ParallelConfig ParallelConfig::from_yaml(const Node &node) {
  ParallelConfig config;
  const Map *map = config_map(node, "parallel configuration",
                              {"thread-count", "max-input-size", "max-document-count", "min-chunk-size",
                               "max-chunk-size", "verbose"});
  if (map) {
    for (const auto &entry : *map) {
      const std::string &key = entry.key.asString();
      const Node &value = entry.value;
      if (key == "thread-count") {
        config.thread_count = fetch_count(key, value, false);
      } else if (key == "max-input-size") {
        config.max_input_size = fetch_count(key, value, false);
      } else if (key == "max-document-count") {
        config.max_document_count = fetch_optional_count(key, value, true);
      } else if (key == "min-chunk-size") {
        config.min_chunk_size = fetch_count(key, value, false);
      } else if (key == "max-chunk-size") {
        config.max_chunk_size = fetch_count(key, value, false);
      } else if (key == "verbose") {
        config.verbose = fetch_bool(key, value);
      }
    }
  }
  config.validate();
  return config;
}

} // namespace yaml
} // namespace yamlet
