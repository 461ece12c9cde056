#include "yamlet/di.hh"
#include "yamlet/prelude.hh"

#include <execinfo.h>
#include <sstream>

namespace yamlet {
namespace yaml {

namespace {
constexpr int kMaxFrames = 64;
// Frames for this constructor and the backtrace() call itself
constexpr int kSkipFrames = 1;
} // namespace

Exception::Exception(const std::string &message) : std::runtime_error(message) {
  void *buffer[kMaxFrames];
  int depth = backtrace(buffer, kMaxFrames);
  if (depth > kSkipFrames) {
    frames_.assign(buffer + kSkipFrames, buffer + depth);
  }
}

const std::string &Exception::stack_trace() const {
  if (stack_trace_.empty() && !frames_.empty()) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < frames_.size(); ++i) {
      formatBacktraceFrame(static_cast<int>(i), frames_[i], oss);
      oss << "\n";
    }
    stack_trace_ = oss.str();
  }
  return stack_trace_;
}

} // namespace yaml
} // namespace yamlet
