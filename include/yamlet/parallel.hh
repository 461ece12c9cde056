#pragma once

#include "./prelude.hh"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace yamlet {
namespace yaml {

// Byte range of one document inside a stream; always starts at a line beginning
struct DocumentRange {
  std::size_t offset = 0;
  std::size_t length = 0;
  std::size_t line = 1; // 1-based line of `offset`

  bool operator==(const DocumentRange &other) const = default;
};

// Locates top-level document boundaries in one sequential pass. A `---` or
// `...` inside a flow collection, a quoted scalar or a block scalar body does
// not split. Quotes and flow brackets count only where a node can begin, not
// inside a plain scalar such as `title: it 'works`. Directives and comments between `...` and the next `---` belong
// to the following document; trailing comments after the last `...` are no
// document at all.
std::vector<DocumentRange> split_documents(std::string_view source);

// Adjacent documents handed to one worker as a unit
struct DocumentChunk {
  std::size_t first = 0; // index of the first range
  std::size_t count = 0;
  std::size_t bytes = 0;

  bool operator==(const DocumentChunk &other) const = default;
};

// Groups ranges in order: a chunk grows until it holds at least `min_chunk_size`
// bytes, and never grows past `max_chunk_size` unless a single range is larger.
std::vector<DocumentChunk> plan_chunks(const std::vector<DocumentRange> &ranges, std::size_t min_chunk_size,
                                       std::size_t max_chunk_size);

constexpr std::size_t kMaxThreadCount = 128;

struct ParallelConfig {
  // Worker threads; defaults to the available hardware parallelism
  std::size_t thread_count = default_thread_count();
  std::size_t max_input_size = 100 * 1024 * 1024;
  std::optional<std::size_t> max_document_count = 100'000;
  // Bounds on the bytes of one worker task
  std::size_t min_chunk_size = 4096;
  std::size_t max_chunk_size = 10 * 1024 * 1024;
  // Log dispatch decisions to stderr
  bool verbose = false;

  static std::size_t default_thread_count();

  // Reads `thread-count`, `max-input-size`, `max-document-count`,
  // `min-chunk-size`, `max-chunk-size` and `verbose`; throws ValidationError
  // on unknown keys or wrong types
  static ParallelConfig from_yaml(const Node &node);

  // Throws ValidationError for a zero or oversized thread count, a zero size
  // cap, a zero minimum chunk size or a maximum below the minimum
  void validate() const;
};

// Parses every document of `source`, distributing chunks of them over a worker pool.
// Size and count caps are checked before any parsing begins. Values come
// back in stream order; the lowest failing document index is reported as
// a DocumentError.
std::vector<Node> split_and_parse(std::string_view source, const ParallelConfig &config = {},
                                  const std::string &filename = "");

} // namespace yaml
} // namespace yamlet
