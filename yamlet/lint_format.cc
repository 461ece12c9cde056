#include "yamlet/lint.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>

namespace yamlet {
namespace yaml {

namespace {

constexpr const char *kReset = "\033[0m";
constexpr const char *kGutter = "\033[1;34m";

const char *severity_color(Severity severity) {
  switch (severity) {
  case Severity::Error:
    return "\033[1;31m";
  case Severity::Warning:
    return "\033[1;33m";
  case Severity::Info:
    return "\033[1;36m";
  case Severity::Hint:
    return "\033[1;32m";
  }
  return kReset;
}

// Display width of UTF-8 text, one column per code point
std::size_t display_width(std::string_view text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

// The source line holding `offset`, and the offset it starts at
std::pair<std::string_view, std::size_t> line_at(std::string_view source, std::size_t offset) {
  offset = std::min(offset, source.size());
  std::size_t start = 0;
  if (offset > 0) {
    auto nl = source.rfind('\n', offset - 1);
    if (nl != std::string_view::npos)
      start = nl + 1;
  }
  std::size_t end = source.find('\n', start);
  std::string_view text = source.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
  if (text.ends_with('\r'))
    text.remove_suffix(1);
  return {text, start};
}

class TextWriter {
public:
  TextWriter(std::string_view source, bool use_colors) : source_(source), colors_(use_colors) {}

  void write(const Diagnostic &d, std::size_t gutter) {
    out_ << paint(severity_color(d.severity)) << to_string(d.severity) << "[" << d.code << "]" << paint(kReset)
         << ": " << d.message << "\n";
    out_ << std::string(gutter, ' ') << paint(kGutter) << "--> " << paint(kReset) << d.span.start.line << ":"
         << d.span.start.column << "\n";
    out_ << std::string(gutter + 1, ' ') << paint(kGutter) << "|" << paint(kReset) << "\n";

    snippet(d.span, '^', "", severity_color(d.severity), gutter);
    for (const auto &label : d.labels) {
      snippet(label.span, '-', label.message, kGutter, gutter);
    }

    for (const auto &suggestion : d.suggestions) {
      out_ << std::string(gutter + 1, ' ') << paint(kGutter) << "= " << paint(kReset)
           << "help: " << suggestion.message;
      if (suggestion.replacement) {
        if (suggestion.replacement->empty())
          out_ << " (remove it)";
        else
          out_ << ": `" << escape(*suggestion.replacement) << "`";
      }
      out_ << "\n";
    }
  }

  void write_separator() { out_ << "\n"; }

  std::string str() const { return out_.str(); }

private:
  std::string_view source_;
  bool colors_;
  std::ostringstream out_;

  const char *paint(const char *code) const { return colors_ ? code : ""; }

  static std::string escape(const std::string &text) {
    std::string out;
    for (char c : text) {
      if (c == '\n')
        out += "\\n";
      else
        out += c;
    }
    return out;
  }

  // Prints every source line the span touches, each with its covered part underlined; the note goes on the last
  void snippet(const Span &span, char mark, const std::string &note, const char *color, std::size_t gutter) {
    std::size_t last_line = span.end.line;
    // A half-open span ending at a line start does not touch that line
    if (last_line > span.start.line && span.end.column <= 1)
      --last_line;
    last_line = std::max(last_line, span.start.line);

    std::size_t offset = span.start.offset;
    for (std::size_t line = span.start.line; line <= last_line; ++line) {
      auto [text, start] = line_at(source_, offset);
      std::string number = std::to_string(line);
      out_ << paint(kGutter) << std::string(gutter - std::min(gutter, number.size()), ' ') << number << " |"
           << paint(kReset) << " " << text << "\n";

      std::size_t column = line == span.start.line ? std::min(span.start.offset - start, text.size()) : 0;
      std::size_t stop = line == span.end.line ? std::min(span.end.offset - start, text.size()) : text.size();
      std::size_t width = stop > column ? display_width(text.substr(column, stop - column)) : 0;

      out_ << std::string(gutter + 1, ' ') << paint(kGutter) << "|" << paint(kReset) << " "
           << std::string(display_width(text.substr(0, column)), ' ') << paint(color)
           << std::string(std::max<std::size_t>(width, 1), mark);
      if (line == last_line && !note.empty())
        out_ << " " << note;
      out_ << paint(kReset) << "\n";

      std::size_t next = source_.find('\n', start);
      if (next == std::string_view::npos)
        break;
      offset = next + 1;
    }
  }
};

nlohmann::json location_json(const Location &loc) {
  return nlohmann::json{{"line", loc.line}, {"column", loc.column}, {"offset", loc.offset}};
}

nlohmann::json span_json(const Span &span) {
  return nlohmann::json{{"start", location_json(span.start)}, {"end", location_json(span.end)}};
}

std::string format_json(const std::vector<Diagnostic> &diagnostics) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &d : diagnostics) {
    nlohmann::json labels = nlohmann::json::array();
    for (const auto &label : d.labels) {
      labels.push_back({{"message", label.message}, {"span", span_json(label.span)}});
    }
    nlohmann::json suggestions = nlohmann::json::array();
    for (const auto &suggestion : d.suggestions) {
      nlohmann::json item{{"message", suggestion.message}, {"span", span_json(suggestion.span)}};
      item["replacement"] = suggestion.replacement ? nlohmann::json(*suggestion.replacement) : nlohmann::json();
      suggestions.push_back(std::move(item));
    }
    out.push_back({{"code", d.code},
                   {"severity", to_string(d.severity)},
                   {"message", d.message},
                   {"span", span_json(d.span)},
                   {"labels", std::move(labels)},
                   {"suggestions", std::move(suggestions)}});
  }
  return out.dump(2);
}

} // namespace

std::string format_diagnostics(const std::vector<Diagnostic> &diagnostics, std::string_view source,
                               DiagnosticFormat format, bool use_colors) {
  if (format == DiagnosticFormat::Json)
    return format_json(diagnostics);

  std::size_t max_line = 1;
  for (const auto &d : diagnostics) {
    max_line = std::max(max_line, d.span.end.line);
    for (const auto &label : d.labels)
      max_line = std::max(max_line, label.span.end.line);
  }
  std::size_t gutter = std::to_string(max_line).size() + 1;

  TextWriter writer(source, use_colors);
  bool first = true;
  for (const auto &d : diagnostics) {
    if (!first)
      writer.write_separator();
    first = false;
    writer.write(d, gutter);
  }
  return writer.str();
}

std::string format_diagnostics(const std::vector<Diagnostic> &diagnostics, std::string_view source,
                               std::string_view format, bool use_colors) {
  if (format == "text")
    return format_diagnostics(diagnostics, source, DiagnosticFormat::Text, use_colors);
  if (format == "json")
    return format_diagnostics(diagnostics, source, DiagnosticFormat::Json, use_colors);
  throw ValidationError("unknown diagnostic format '" + std::string(format) + "', expected 'text' or 'json'");
}

} // namespace yaml
} // namespace yamlet
