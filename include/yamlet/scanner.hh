#pragma once

#include "./prelude.hh"

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace yamlet {
namespace yaml {

enum class ScalarStyle { Plain, SingleQuoted, DoubleQuoted, Literal, Folded };

enum class CollectionStyle { Block, Flow };

enum class EventType {
  StreamStart,
  StreamEnd,
  DocumentStart,
  DocumentEnd,
  MappingStart,
  MappingEnd,
  SequenceStart,
  SequenceEnd,
  Scalar,
  Alias,
  Anchor,
};

const char *to_string(EventType type) noexcept;

// One lexical event of a YAML stream
struct Event {
  EventType type;
  Span span;

  // Scalar content, or the name for Alias and Anchor events
  std::string value;

  // Resolved tag of a node event: empty when untagged, "!" for the
  // non-specific tag, otherwise the full tag such as "tag:yaml.org,2002:str"
  std::string tag;

  ScalarStyle scalar_style = ScalarStyle::Plain;
  CollectionStyle collection_style = CollectionStyle::Block;

  // DocumentStart without `---`, DocumentEnd without `...`
  bool implicit = false;
};

// Pull interface over an event stream; once StreamEnd has been delivered,
// further calls keep returning StreamEnd
class EventSource {
public:
  virtual ~EventSource() = default;
  virtual Event next() = 0;
};

class Tokenizer;
struct Token;

// Turns YAML text into events. Locations are reported relative to `base`,
// which lets a scanner over a sub-range of a larger buffer report positions
// in that buffer; `base` must denote the beginning of a line.
class Scanner : public EventSource {
public:
  explicit Scanner(std::string_view source, Location base = {}, std::string filename = "");
  ~Scanner() override;

  Scanner(const Scanner &) = delete;
  Scanner &operator=(const Scanner &) = delete;

  // Throws SyntaxError on malformed input
  Event next() override;

  const std::string &filename() const noexcept { return filename_; }

private:
  enum class State {
    StreamStart,
    ImplicitDocumentStart,
    DocumentStart,
    DocumentContent,
    DocumentEnd,
    BlockNode,
    BlockSequenceFirstEntry,
    BlockSequenceEntry,
    IndentlessSequenceEntry,
    BlockMappingFirstKey,
    BlockMappingKey,
    BlockMappingValue,
    FlowSequenceFirstEntry,
    FlowSequenceEntry,
    FlowSequenceEntryMappingKey,
    FlowSequenceEntryMappingValue,
    FlowSequenceEntryMappingEnd,
    FlowMappingFirstKey,
    FlowMappingKey,
    FlowMappingValue,
    FlowMappingEmptyValue,
    End,
  };

  std::string filename_;
  std::unique_ptr<Tokenizer> tokenizer_;

  State state_ = State::StreamStart;
  std::vector<State> states_;
  std::deque<Event> pending_;

  std::map<std::string, std::string> tag_directives_;
  bool version_seen_ = false;
  bool last_document_explicit_end_ = true;

  [[noreturn]] void fail(const std::string &message, const Location &at) const;

  Event produce();
  Event parse_stream_start();
  Event parse_document_start(bool implicit);
  Event parse_document_content();
  Event parse_document_end();
  Event parse_node(bool block, bool indentless_sequence);
  Event parse_block_sequence_entry(bool first);
  Event parse_indentless_sequence_entry();
  Event parse_block_mapping_key(bool first);
  Event parse_block_mapping_value();
  Event parse_flow_sequence_entry(bool first);
  Event parse_flow_sequence_entry_mapping_key();
  Event parse_flow_sequence_entry_mapping_value();
  Event parse_flow_sequence_entry_mapping_end();
  Event parse_flow_mapping_key(bool first);
  Event parse_flow_mapping_value(bool empty);

  void process_directives();
  std::string resolve_tag(const Token &token) const;
  State pop_state();
  static Event empty_scalar(const Location &at);
};

// Forwards events from another source while keeping a copy of each
class RecordingSource : public EventSource {
public:
  explicit RecordingSource(EventSource &inner) : inner_(inner) {}

  Event next() override {
    Event event = inner_.next();
    events_.push_back(event);
    return event;
  }

  const std::vector<Event> &events() const noexcept { return events_; }

private:
  EventSource &inner_;
  std::vector<Event> events_;
};

} // namespace yaml
} // namespace yamlet
