#include "yamlet/parallel.hh"
#include "yamlet/composer.hh"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>

namespace yamlet {
namespace yaml {

namespace {

bool is_marker(std::string_view line, std::string_view marker) {
  if (!line.starts_with(marker))
    return false;
  return line.size() == marker.size() || line[marker.size()] == ' ' || line[marker.size()] == '\t';
}

// Block scalar header remainder: indicators, then blanks and an optional comment
bool is_block_header(std::string_view rest) {
  std::size_t i = 0;
  while (i < rest.size() && (std::isdigit(static_cast<unsigned char>(rest[i])) || rest[i] == '+' || rest[i] == '-'))
    ++i;
  if (i == rest.size())
    return true;
  if (rest[i] != ' ' && rest[i] != '\t')
    return false;
  auto next = rest.find_first_not_of(" \t", i);
  return next == std::string_view::npos || rest[next] == '#';
}

bool is_blank_or_end(std::string_view line, std::size_t i) {
  return i >= line.size() || line[i] == ' ' || line[i] == '\t';
}

bool is_flow_indicator(char c) { return c == ',' || c == '[' || c == ']' || c == '{' || c == '}'; }

// Context carried from line to line while looking for document markers.
// Quotes, flow collections and block scalar headers only count where a node
// may begin, so `it 'works` or `x [y` inside a plain scalar change nothing.
class BoundaryTracker {
public:
  bool at_top_level() const { return quote_ == 0 && flow_depth_ == 0; }

  void reset() {
    quote_ = 0;
    flow_depth_ = 0;
    block_parent_.reset();
    in_plain_ = false;
  }

  // Scans `line` from column `from`; returns whether it holds anything but blanks and comments
  bool scan(std::string_view line, std::size_t from) {
    if (block_parent_) {
      auto first = line.find_first_not_of(' ');
      if (first == std::string_view::npos)
        return false;
      if (static_cast<long>(first) > *block_parent_)
        return true;
      block_parent_.reset();
    }

    auto first = line.find_first_not_of(" \t", from);
    if (first == std::string_view::npos)
      return quote_ != 0;
    if (quote_ == 0 && line[first] == '#') {
      in_plain_ = false;
      return false;
    }

    // A plain scalar left open on the previous line continues on a deeper line or inside a flow
    long indent = static_cast<long>(std::min(line.find_first_not_of(' '), line.size()));
    bool at_node = true;
    if (in_plain_ && (flow_depth_ > 0 || (from == 0 && indent > plain_indent_)))
      at_node = false;
    else
      in_plain_ = false;

    bool content = false;
    char prev = from > 0 ? ' ' : '\0';
    for (std::size_t i = first; i < line.size(); ++i) {
      char c = line[i];
      if (quote_ == '\'') {
        content = true;
        if (c == '\'') {
          if (i + 1 < line.size() && line[i + 1] == '\'')
            ++i;
          else
            quote_ = 0;
        }
        prev = c;
        continue;
      }
      if (quote_ == '"') {
        content = true;
        if (c == '\\')
          ++i;
        else if (c == '"')
          quote_ = 0;
        prev = c;
        continue;
      }
      if (c == ' ' || c == '\t') {
        prev = c;
        continue;
      }
      if (c == '#' && (prev == '\0' || prev == ' ' || prev == '\t'))
        break;

      content = true;
      if (at_node) {
        if (c == '\'' || c == '"') {
          quote_ = c;
          at_node = false;
        } else if (c == '[' || c == '{') {
          ++flow_depth_;
        } else if (flow_depth_ > 0 && (c == ']' || c == '}')) {
          --flow_depth_;
          at_node = false;
        } else if (flow_depth_ > 0 && c == ',') {
          // empty entry, still at a node start
        } else if ((c == '-' || c == '?' || c == ':') && is_blank_or_end(line, i + 1)) {
          // block entry, explicit key or value indicator
        } else if (c == '&' || c == '!' || c == '*') {
          // anchors and tags precede a node, an alias is one
          while (i + 1 < line.size() && !is_blank_or_end(line, i + 1) &&
                 !(flow_depth_ > 0 && is_flow_indicator(line[i + 1])))
            ++i;
          at_node = c != '*';
        } else if (flow_depth_ == 0 && (c == '|' || c == '>') && is_block_header(line.substr(i + 1))) {
          block_parent_ = header_parent(line, i, from);
          break;
        } else {
          at_node = false;
          in_plain_ = true;
          plain_indent_ = indent;
        }
      } else if (c == ':' && (is_blank_or_end(line, i + 1) ||
                              (flow_depth_ > 0 && (is_flow_indicator(line[i + 1]) || prev == '"' ||
                                                   prev == '\'' || prev == ']' || prev == '}')))) {
        at_node = true;
        in_plain_ = false;
      } else if (flow_depth_ > 0 && c == ',') {
        at_node = true;
        in_plain_ = false;
      } else if (flow_depth_ > 0 && (c == ']' || c == '}')) {
        --flow_depth_;
        in_plain_ = false;
      }
      prev = c;
    }
    return content;
  }

private:
  char quote_ = 0;
  int flow_depth_ = 0;
  // Indentation the body of an open block scalar must exceed
  std::optional<long> block_parent_;
  // The last line ended inside a plain scalar that started on a line indented by plain_indent_
  bool in_plain_ = false;
  long plain_indent_ = 0;

  static long header_parent(std::string_view line, std::size_t indicator, std::size_t from) {
    std::size_t p = line.find_first_not_of(' ', from);
    long last_entry = -1;
    while (p < indicator && (line[p] == '-' || line[p] == '?') && p + 1 < line.size() && line[p + 1] == ' ') {
      last_entry = static_cast<long>(p);
      p = line.find_first_not_of(' ', p + 1);
    }
    if (p != indicator)
      return static_cast<long>(p);
    if (last_entry >= 0)
      return last_entry;
    // `--- |` at the top of a document
    return from > 0 ? -1 : static_cast<long>(p) - 1;
  }
};

// Fixed-size pool of workers draining a shared task queue
class WorkerPool {
public:
  explicit WorkerPool(std::size_t capacity) {
    workers_.reserve(capacity);
    for (std::size_t i = 0; i < capacity; ++i) {
      workers_.emplace_back([this] {
        for (;;) {
          std::unique_lock<std::mutex> lock(queue_mtx_);
          cond_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
          if (stop_ && tasks_.empty())
            break;
          auto task = std::move(tasks_.front());
          tasks_.pop();
          lock.unlock();
          task();
        }
      });
    }
  }

  ~WorkerPool() {
    {
      std::lock_guard<std::mutex> lock(queue_mtx_);
      stop_ = true;
    }
    cond_.notify_all();
    for (auto &worker : workers_) {
      if (worker.joinable())
        worker.join();
    }
  }

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  template <typename F> auto submit(F &&f) -> std::future<std::invoke_result_t<F>> {
    using result_type = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(f));
    std::future<result_type> result = task->get_future();
    {
      std::lock_guard<std::mutex> lock(queue_mtx_);
      tasks_.emplace([task] { (*task)(); });
    }
    cond_.notify_one();
    return result;
  }

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex queue_mtx_;
  std::condition_variable cond_;
  bool stop_ = false;
};

std::vector<Node> parse_range(std::string_view source, const DocumentRange &range, const std::string &filename) {
  Scanner scanner(source.substr(range.offset, range.length), Location{range.line, 1, range.offset}, filename);
  Composer composer(scanner, filename);
  std::vector<Node> values;
  while (auto document = composer.next_document()) {
    values.push_back(document->value());
  }
  return values;
}

// Parses the ranges of one chunk in order; a failure names its index in the whole stream
std::vector<Node> parse_chunk(std::string_view source, const std::vector<DocumentRange> &ranges,
                              const DocumentChunk &chunk, const std::string &filename) {
  std::vector<Node> values;
  for (std::size_t i = chunk.first; i < chunk.first + chunk.count; ++i) {
    try {
      for (auto &value : parse_range(source, ranges[i], filename)) {
        values.push_back(std::move(value));
      }
    } catch (const ParseError &e) {
      throw DocumentError(i, e);
    }
  }
  return values;
}

} // namespace

std::vector<DocumentRange> split_documents(std::string_view source) {
  std::vector<DocumentRange> ranges;
  BoundaryTracker tracker;

  std::size_t open_start = 0;
  std::size_t open_line = 1;
  bool in_document = false;

  auto close = [&](std::size_t end) { ranges.push_back(DocumentRange{open_start, end - open_start, open_line}); };

  std::size_t pos = 0;
  std::size_t line_no = 1;
  while (pos < source.size()) {
    std::size_t nl = source.find('\n', pos);
    std::size_t end = nl == std::string_view::npos ? source.size() : nl;
    std::size_t next = nl == std::string_view::npos ? source.size() : nl + 1;
    std::string_view line = source.substr(pos, end - pos);
    if (line.ends_with('\r'))
      line.remove_suffix(1);

    if (tracker.at_top_level() && is_marker(line, "---")) {
      tracker.reset();
      if (in_document) {
        close(pos);
        open_start = pos;
        open_line = line_no;
      }
      in_document = true;
      tracker.scan(line, 3);
    } else if (tracker.at_top_level() && is_marker(line, "...")) {
      tracker.reset();
      if (in_document) {
        close(next);
        open_start = next;
        open_line = line_no + 1;
        in_document = false;
      }
    } else if (!in_document && line.starts_with('%')) {
      // Directive of the next document
    } else if (tracker.scan(line, 0)) {
      in_document = true;
    }

    pos = next;
    ++line_no;
  }
  if (in_document)
    close(source.size());
  return ranges;
}

std::vector<DocumentChunk> plan_chunks(const std::vector<DocumentRange> &ranges, std::size_t min_chunk_size,
                                       std::size_t max_chunk_size) {
  std::vector<DocumentChunk> chunks;
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    std::size_t bytes = ranges[i].length;
    if (chunks.empty() || chunks.back().bytes >= min_chunk_size || chunks.back().bytes + bytes > max_chunk_size) {
      chunks.push_back(DocumentChunk{i, 1, bytes});
    } else {
      chunks.back().count += 1;
      chunks.back().bytes += bytes;
    }
  }
  return chunks;
}

std::size_t ParallelConfig::default_thread_count() {
  std::size_t n = std::thread::hardware_concurrency();
  return std::clamp<std::size_t>(n, 1, kMaxThreadCount);
}

void ParallelConfig::validate() const {
  if (thread_count == 0)
    throw ValidationError("thread-count must be positive");
  if (thread_count > kMaxThreadCount)
    throw ValidationError("thread-count", kMaxThreadCount, thread_count);
  if (max_input_size == 0)
    throw ValidationError("max-input-size must be positive");
  if (min_chunk_size == 0)
    throw ValidationError("min-chunk-size must be positive");
  if (max_chunk_size < min_chunk_size)
    throw ValidationError("max-chunk-size must be at least min-chunk-size (" + std::to_string(min_chunk_size) +
                          "), got " + std::to_string(max_chunk_size));
}

std::vector<Node> split_and_parse(std::string_view source, const ParallelConfig &config, const std::string &filename) {
  config.validate();
  if (source.size() > config.max_input_size)
    throw ValidationError("max-input-size", config.max_input_size, source.size());

  std::vector<DocumentRange> ranges = split_documents(source);
  if (config.max_document_count && ranges.size() > *config.max_document_count)
    throw ValidationError("max-document-count", *config.max_document_count, ranges.size());

  std::vector<DocumentChunk> chunks = plan_chunks(ranges, config.min_chunk_size, config.max_chunk_size);
  std::size_t workers = std::min(config.thread_count, chunks.size());
  if (config.verbose) {
    std::cerr << "[DEBUG] split_and_parse: " << ranges.size() << " document(s) in " << source.size() << " bytes, "
              << chunks.size() << " chunk(s), " << (chunks.size() > 1 ? workers : 0) << " worker(s)" << std::endl;
  }

  std::vector<Node> values;
  if (chunks.empty())
    return values;

  if (chunks.size() == 1)
    return parse_chunk(source, ranges, chunks[0], filename);

  std::vector<std::future<std::vector<Node>>> results;
  results.reserve(chunks.size());
  {
    WorkerPool pool(workers);
    for (const auto &chunk : chunks) {
      results.push_back(pool.submit(
          [source, &ranges, chunk, &filename] { return parse_chunk(source, ranges, chunk, filename); }));
    }
    // Leaving this scope joins every worker, so no chunk is still running below
  }

  values.reserve(ranges.size());
  for (auto &result : results) {
    try {
      for (auto &value : result.get()) {
        values.push_back(std::move(value));
      }
    } catch (const DocumentError &e) {
      if (config.verbose) {
        std::cerr << "[DEBUG] split_and_parse: document #" << e.index() << " at line " << ranges[e.index()].line
                  << " failed: " << e.cause() << std::endl;
      }
      throw;
    }
  }
  return values;
}

} // namespace yaml
} // namespace yamlet
