#include "yamlet/scanner.hh"
#include "tokenizer.hh"

namespace yamlet {
namespace yaml {

namespace {

const std::map<std::string, std::string> &default_tag_directives() {
  static const std::map<std::string, std::string> directives = {
      {"!", "!"},
      {"!!", "tag:yaml.org,2002:"},
  };
  return directives;
}

} // namespace

const char *to_string(EventType type) noexcept {
  switch (type) {
  case EventType::StreamStart:
    return "StreamStart";
  case EventType::StreamEnd:
    return "StreamEnd";
  case EventType::DocumentStart:
    return "DocumentStart";
  case EventType::DocumentEnd:
    return "DocumentEnd";
  case EventType::MappingStart:
    return "MappingStart";
  case EventType::MappingEnd:
    return "MappingEnd";
  case EventType::SequenceStart:
    return "SequenceStart";
  case EventType::SequenceEnd:
    return "SequenceEnd";
  case EventType::Scalar:
    return "Scalar";
  case EventType::Alias:
    return "Alias";
  case EventType::Anchor:
    return "Anchor";
  }
  return "Unknown";
}

Scanner::Scanner(std::string_view source, Location base, std::string filename)
    : filename_(std::move(filename)), tokenizer_(std::make_unique<Tokenizer>(source, base, filename_)) {}

Scanner::~Scanner() = default;

void Scanner::fail(const std::string &message, const Location &at) const { throw SyntaxError(message, at, filename_); }

Event Scanner::next() {
  if (!pending_.empty()) {
    Event event = std::move(pending_.front());
    pending_.pop_front();
    return event;
  }
  return produce();
}

Scanner::State Scanner::pop_state() {
  State state = states_.back();
  states_.pop_back();
  return state;
}

Event Scanner::empty_scalar(const Location &at) {
  Event event{EventType::Scalar, Span(at)};
  event.scalar_style = ScalarStyle::Plain;
  return event;
}

Event Scanner::produce() {
  switch (state_) {
  case State::StreamStart:
    return parse_stream_start();
  case State::ImplicitDocumentStart:
    return parse_document_start(true);
  case State::DocumentStart:
    return parse_document_start(false);
  case State::DocumentContent:
    return parse_document_content();
  case State::DocumentEnd:
    return parse_document_end();
  case State::BlockNode:
    return parse_node(true, false);
  case State::BlockSequenceFirstEntry:
    return parse_block_sequence_entry(true);
  case State::BlockSequenceEntry:
    return parse_block_sequence_entry(false);
  case State::IndentlessSequenceEntry:
    return parse_indentless_sequence_entry();
  case State::BlockMappingFirstKey:
    return parse_block_mapping_key(true);
  case State::BlockMappingKey:
    return parse_block_mapping_key(false);
  case State::BlockMappingValue:
    return parse_block_mapping_value();
  case State::FlowSequenceFirstEntry:
    return parse_flow_sequence_entry(true);
  case State::FlowSequenceEntry:
    return parse_flow_sequence_entry(false);
  case State::FlowSequenceEntryMappingKey:
    return parse_flow_sequence_entry_mapping_key();
  case State::FlowSequenceEntryMappingValue:
    return parse_flow_sequence_entry_mapping_value();
  case State::FlowSequenceEntryMappingEnd:
    return parse_flow_sequence_entry_mapping_end();
  case State::FlowMappingFirstKey:
    return parse_flow_mapping_key(true);
  case State::FlowMappingKey:
    return parse_flow_mapping_key(false);
  case State::FlowMappingValue:
    return parse_flow_mapping_value(false);
  case State::FlowMappingEmptyValue:
    return parse_flow_mapping_value(true);
  case State::End:
    break;
  }
  const Token &token = tokenizer_->peek();
  return Event{EventType::StreamEnd, token.span};
}

// Documents ----------------------------------------------------------------

Event Scanner::parse_stream_start() {
  Token token = tokenizer_->take();
  if (token.type != TokenType::StreamStart)
    fail("did not find expected <stream-start>", token.span.start);
  state_ = State::ImplicitDocumentStart;
  return Event{EventType::StreamStart, token.span};
}

Event Scanner::parse_document_start(bool implicit) {
  if (!implicit) {
    // Stray `...` markers between documents
    while (tokenizer_->peek().type == TokenType::DocumentEnd) {
      tokenizer_->take();
      last_document_explicit_end_ = true;
    }
  }

  const Token &token = tokenizer_->peek();

  // A bare document may open the stream or follow an explicit `...`
  if ((implicit || last_document_explicit_end_) && token.type != TokenType::VersionDirective &&
      token.type != TokenType::TagDirective && token.type != TokenType::DocumentStart &&
      token.type != TokenType::StreamEnd) {
    // Bare document without `---`
    tag_directives_ = default_tag_directives();
    version_seen_ = false;
    states_.push_back(State::DocumentEnd);
    state_ = State::BlockNode;
    Event event{EventType::DocumentStart, Span(token.span.start)};
    event.implicit = true;
    return event;
  }

  if (token.type == TokenType::StreamEnd) {
    Token end = tokenizer_->take();
    state_ = State::End;
    return Event{EventType::StreamEnd, end.span};
  }

  if (!implicit && !last_document_explicit_end_ &&
      (token.type == TokenType::VersionDirective || token.type == TokenType::TagDirective)) {
    fail("missing document end marker '...' before directives", token.span.start);
  }

  Location start = token.span.start;
  process_directives();
  const Token &marker = tokenizer_->peek();
  if (marker.type != TokenType::DocumentStart) {
    fail("did not find expected <document start>", marker.span.start);
  }
  Token taken = tokenizer_->take();
  states_.push_back(State::DocumentEnd);
  state_ = State::DocumentContent;
  return Event{EventType::DocumentStart, Span(start, taken.span.end)};
}

Event Scanner::parse_document_content() {
  TokenType type = tokenizer_->peek().type;
  if (type == TokenType::VersionDirective || type == TokenType::TagDirective || type == TokenType::DocumentStart ||
      type == TokenType::DocumentEnd || type == TokenType::StreamEnd) {
    // `---` with no content: no node event at all
    state_ = pop_state();
    return produce();
  }
  return parse_node(true, false);
}

Event Scanner::parse_document_end() {
  const Token &token = tokenizer_->peek();
  Span span(token.span.start);
  bool implicit = true;
  if (token.type == TokenType::DocumentEnd) {
    span = tokenizer_->take().span;
    implicit = false;
  }
  last_document_explicit_end_ = !implicit;
  state_ = State::DocumentStart;
  Event event{EventType::DocumentEnd, span};
  event.implicit = implicit;
  return event;
}

void Scanner::process_directives() {
  tag_directives_ = default_tag_directives();
  version_seen_ = false;
  std::map<std::string, std::string> declared;

  while (true) {
    const Token &token = tokenizer_->peek();
    if (token.type == TokenType::VersionDirective) {
      if (version_seen_)
        fail("found duplicate %YAML directive", token.span.start);
      version_seen_ = true;
      if (token.value.substr(0, token.value.find('.')) != "1")
        fail("found incompatible YAML document version " + token.value, token.span.start);
    } else if (token.type == TokenType::TagDirective) {
      if (declared.count(token.value))
        fail("found duplicate %TAG directive for handle " + token.value, token.span.start);
      declared[token.value] = token.extra;
      tag_directives_[token.value] = token.extra;
    } else {
      break;
    }
    tokenizer_->take();
  }
}

std::string Scanner::resolve_tag(const Token &token) const {
  const std::string &handle = token.extra;
  if (handle.empty()) {
    // Verbatim or non-specific
    return token.value;
  }
  auto it = tag_directives_.find(handle);
  if (it == tag_directives_.end()) {
    fail("found undefined tag handle " + handle, token.span.start);
  }
  return it->second + token.value;
}

// Nodes --------------------------------------------------------------------

Event Scanner::parse_node(bool block, bool indentless_sequence) {
  const Token *token = &tokenizer_->peek();

  if (token->type == TokenType::Alias) {
    state_ = pop_state();
    Token alias = tokenizer_->take();
    Event event{EventType::Alias, alias.span};
    event.value = std::move(alias.value);
    return event;
  }

  Location start = token->span.start;
  Location end = start;
  std::optional<Token> anchor;
  std::string tag;
  bool tagged = false;

  auto take_tag = [&]() {
    Token tag_token = tokenizer_->take();
    tag = resolve_tag(tag_token);
    tagged = true;
    end = tag_token.span.end;
  };

  if (token->type == TokenType::Anchor) {
    anchor = tokenizer_->take();
    end = anchor->span.end;
    if (tokenizer_->peek().type == TokenType::Tag)
      take_tag();
  } else if (token->type == TokenType::Tag) {
    take_tag();
    if (tokenizer_->peek().type == TokenType::Anchor) {
      anchor = tokenizer_->take();
      end = anchor->span.end;
    }
  }

  token = &tokenizer_->peek();
  if (token->type == TokenType::Alias && (anchor || tagged)) {
    fail("an alias node cannot carry an anchor or a tag", token->span.start);
  }

  // The anchor is announced right before the node it names
  auto announce = [&](Event node) {
    if (anchor) {
      Event named{EventType::Anchor, anchor->span};
      named.value = std::move(anchor->value);
      pending_.push_back(std::move(node));
      return named;
    }
    return node;
  };

  if (indentless_sequence && token->type == TokenType::BlockEntry) {
    state_ = State::IndentlessSequenceEntry;
    Event event{EventType::SequenceStart, Span(token->span.start)};
    event.tag = tag;
    event.collection_style = CollectionStyle::Block;
    return announce(std::move(event));
  }

  if (token->type == TokenType::Scalar) {
    state_ = pop_state();
    Token scalar = tokenizer_->take();
    Event event{EventType::Scalar, scalar.span};
    event.value = std::move(scalar.value);
    event.scalar_style = scalar.style;
    event.tag = tag;
    return announce(std::move(event));
  }

  if (token->type == TokenType::FlowSequenceStart || token->type == TokenType::FlowMappingStart) {
    bool sequence = token->type == TokenType::FlowSequenceStart;
    state_ = sequence ? State::FlowSequenceFirstEntry : State::FlowMappingFirstKey;
    Event event{sequence ? EventType::SequenceStart : EventType::MappingStart, Span(token->span.start)};
    event.tag = tag;
    event.collection_style = CollectionStyle::Flow;
    return announce(std::move(event));
  }

  if (block && (token->type == TokenType::BlockSequenceStart || token->type == TokenType::BlockMappingStart)) {
    bool sequence = token->type == TokenType::BlockSequenceStart;
    state_ = sequence ? State::BlockSequenceFirstEntry : State::BlockMappingFirstKey;
    Event event{sequence ? EventType::SequenceStart : EventType::MappingStart, Span(token->span.start)};
    event.tag = tag;
    event.collection_style = CollectionStyle::Block;
    return announce(std::move(event));
  }

  if (anchor || tagged) {
    // Properties with no content: an empty plain scalar
    state_ = pop_state();
    Event event = empty_scalar(end);
    event.tag = tag;
    return announce(std::move(event));
  }

  fail(block ? "did not find expected node content while parsing a block node"
             : "did not find expected node content while parsing a flow node",
       token->span.start);
}

// Block collections ----------------------------------------------------------

Event Scanner::parse_block_sequence_entry(bool first) {
  if (first)
    tokenizer_->take();

  const Token &token = tokenizer_->peek();
  if (token.type == TokenType::BlockEntry) {
    Location after = token.span.end;
    tokenizer_->take();
    TokenType type = tokenizer_->peek().type;
    if (type != TokenType::BlockEntry && type != TokenType::BlockEnd) {
      states_.push_back(State::BlockSequenceEntry);
      return parse_node(true, false);
    }
    state_ = State::BlockSequenceEntry;
    return empty_scalar(after);
  }
  if (token.type == TokenType::BlockEnd) {
    state_ = pop_state();
    Token end = tokenizer_->take();
    return Event{EventType::SequenceEnd, end.span};
  }
  fail("did not find expected '-' indicator while parsing a block collection", token.span.start);
}

Event Scanner::parse_indentless_sequence_entry() {
  const Token &token = tokenizer_->peek();
  if (token.type == TokenType::BlockEntry) {
    Location after = token.span.end;
    tokenizer_->take();
    TokenType type = tokenizer_->peek().type;
    if (type != TokenType::BlockEntry && type != TokenType::Key && type != TokenType::Value &&
        type != TokenType::BlockEnd) {
      states_.push_back(State::IndentlessSequenceEntry);
      return parse_node(true, false);
    }
    state_ = State::IndentlessSequenceEntry;
    return empty_scalar(after);
  }
  state_ = pop_state();
  return Event{EventType::SequenceEnd, Span(token.span.start)};
}

Event Scanner::parse_block_mapping_key(bool first) {
  if (first)
    tokenizer_->take();

  const Token &token = tokenizer_->peek();
  if (token.type == TokenType::Key) {
    Location after = token.span.end;
    tokenizer_->take();
    TokenType type = tokenizer_->peek().type;
    if (type != TokenType::Key && type != TokenType::Value && type != TokenType::BlockEnd) {
      states_.push_back(State::BlockMappingValue);
      return parse_node(true, true);
    }
    state_ = State::BlockMappingValue;
    return empty_scalar(after);
  }
  if (token.type == TokenType::Value) {
    // `: value` with the key omitted
    state_ = State::BlockMappingValue;
    return empty_scalar(token.span.start);
  }
  if (token.type == TokenType::BlockEnd) {
    state_ = pop_state();
    Token end = tokenizer_->take();
    return Event{EventType::MappingEnd, end.span};
  }
  fail("did not find expected key while parsing a block mapping", token.span.start);
}

Event Scanner::parse_block_mapping_value() {
  const Token &token = tokenizer_->peek();
  if (token.type == TokenType::Value) {
    Location after = token.span.end;
    tokenizer_->take();
    TokenType type = tokenizer_->peek().type;
    if (type != TokenType::Key && type != TokenType::Value && type != TokenType::BlockEnd) {
      states_.push_back(State::BlockMappingKey);
      return parse_node(true, true);
    }
    state_ = State::BlockMappingKey;
    return empty_scalar(after);
  }
  state_ = State::BlockMappingKey;
  return empty_scalar(token.span.start);
}

// Flow collections -------------------------------------------------------------

Event Scanner::parse_flow_sequence_entry(bool first) {
  if (first)
    tokenizer_->take();

  const Token *token = &tokenizer_->peek();
  if (token->type != TokenType::FlowSequenceEnd) {
    if (!first) {
      if (token->type != TokenType::FlowEntry)
        fail("did not find expected ',' or ']' while parsing a flow sequence", token->span.start);
      tokenizer_->take();
      token = &tokenizer_->peek();
    }
    if (token->type == TokenType::Key) {
      // Single pair mapping inside a flow sequence: [a: b]
      Location start = token->span.start;
      tokenizer_->take();
      state_ = State::FlowSequenceEntryMappingKey;
      Event event{EventType::MappingStart, Span(start)};
      event.collection_style = CollectionStyle::Flow;
      return event;
    }
    if (token->type != TokenType::FlowSequenceEnd) {
      states_.push_back(State::FlowSequenceEntry);
      return parse_node(false, false);
    }
  }
  state_ = pop_state();
  Token end = tokenizer_->take();
  return Event{EventType::SequenceEnd, end.span};
}

Event Scanner::parse_flow_sequence_entry_mapping_key() {
  const Token &token = tokenizer_->peek();
  if (token.type != TokenType::Value && token.type != TokenType::FlowEntry &&
      token.type != TokenType::FlowSequenceEnd) {
    states_.push_back(State::FlowSequenceEntryMappingValue);
    return parse_node(false, false);
  }
  state_ = State::FlowSequenceEntryMappingValue;
  return empty_scalar(token.span.start);
}

Event Scanner::parse_flow_sequence_entry_mapping_value() {
  const Token &token = tokenizer_->peek();
  if (token.type == TokenType::Value) {
    Location after = token.span.end;
    tokenizer_->take();
    TokenType type = tokenizer_->peek().type;
    if (type != TokenType::FlowEntry && type != TokenType::FlowSequenceEnd) {
      states_.push_back(State::FlowSequenceEntryMappingEnd);
      return parse_node(false, false);
    }
    state_ = State::FlowSequenceEntryMappingEnd;
    return empty_scalar(after);
  }
  state_ = State::FlowSequenceEntryMappingEnd;
  return empty_scalar(token.span.start);
}

Event Scanner::parse_flow_sequence_entry_mapping_end() {
  state_ = State::FlowSequenceEntry;
  const Token &token = tokenizer_->peek();
  return Event{EventType::MappingEnd, Span(token.span.start)};
}

Event Scanner::parse_flow_mapping_key(bool first) {
  if (first)
    tokenizer_->take();

  const Token *token = &tokenizer_->peek();
  if (token->type != TokenType::FlowMappingEnd) {
    if (!first) {
      if (token->type != TokenType::FlowEntry)
        fail("did not find expected ',' or '}' while parsing a flow mapping", token->span.start);
      tokenizer_->take();
      token = &tokenizer_->peek();
    }
    if (token->type == TokenType::Key) {
      Location after = token->span.end;
      tokenizer_->take();
      TokenType type = tokenizer_->peek().type;
      if (type != TokenType::Value && type != TokenType::FlowEntry && type != TokenType::FlowMappingEnd) {
        states_.push_back(State::FlowMappingValue);
        return parse_node(false, false);
      }
      state_ = State::FlowMappingValue;
      return empty_scalar(after);
    }
    if (token->type != TokenType::FlowMappingEnd) {
      // A lone key without ':' maps to an empty value
      states_.push_back(State::FlowMappingEmptyValue);
      return parse_node(false, false);
    }
  }
  state_ = pop_state();
  Token end = tokenizer_->take();
  return Event{EventType::MappingEnd, end.span};
}

Event Scanner::parse_flow_mapping_value(bool empty) {
  const Token &token = tokenizer_->peek();
  if (empty) {
    state_ = State::FlowMappingKey;
    return empty_scalar(token.span.start);
  }
  if (token.type == TokenType::Value) {
    Location after = token.span.end;
    tokenizer_->take();
    TokenType type = tokenizer_->peek().type;
    if (type != TokenType::FlowEntry && type != TokenType::FlowMappingEnd) {
      states_.push_back(State::FlowMappingKey);
      return parse_node(false, false);
    }
    state_ = State::FlowMappingKey;
    return empty_scalar(after);
  }
  state_ = State::FlowMappingKey;
  return empty_scalar(token.span.start);
}

} // namespace yaml
} // namespace yamlet
