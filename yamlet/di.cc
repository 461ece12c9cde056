#include "yamlet/di.hh"
#include "yamlet.hh"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cxxabi.h>
#include <dlfcn.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unistd.h>
#include <unordered_map>

// LLVM DWARF debug info for enhanced stack traces
#include "llvm/DebugInfo/DIContext.h"
#include "llvm/DebugInfo/DWARF/DWARFContext.h"
#include "llvm/Object/ObjectFile.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/MemoryBuffer.h"

namespace yamlet {

namespace {

// Cached debug information for one loaded module
struct ModuleDebugInfo {
  std::unique_ptr<llvm::MemoryBuffer> buffer;
  std::unique_ptr<llvm::object::ObjectFile> object;
  std::unique_ptr<llvm::DWARFContext> context;
};

// Keyed by the module's file path; a null context records a module without usable debug info
std::unordered_map<std::string, ModuleDebugInfo> debug_info_cache;
std::mutex cache_mutex;

std::string demangle(const char *symbol) {
  if (!symbol) {
    return {};
  }
  int status = 0;
  char *demangled = abi::__cxa_demangle(symbol, nullptr, nullptr, &status);
  if (status == 0 && demangled) {
    std::string result(demangled);
    std::free(demangled);
    return result;
  }
  return symbol;
}

std::string debugFilePathFor(std::string_view dli_fname) {
  std::string debug_file_path(dli_fname);
#ifdef __APPLE__
  // On macOS, debug info is stored in a separate dSYM bundle
  auto last_slash = dli_fname.find_last_of('/');
  std::string_view filename_view = (last_slash != std::string_view::npos) ? dli_fname.substr(last_slash + 1) : dli_fname;
  std::string dsym_path = debug_file_path + ".dSYM/Contents/Resources/DWARF/" + std::string(filename_view);
  if (std::ifstream(dsym_path).good()) {
    debug_file_path = dsym_path;
  }
#endif
  return debug_file_path;
}

std::unique_ptr<llvm::MemoryBuffer> loadModuleBuffer(std::string_view dli_fname) {
  auto buffer_or = llvm::MemoryBuffer::getFile(debugFilePathFor(dli_fname), /*IsText=*/false,
                                               /*RequiresNullTerminator=*/false);
  if (buffer_or) {
    return std::move(buffer_or.get());
  }
#ifdef __linux__
  // The main executable may be reported by a name that cannot be opened
  if (dli_fname.ends_with(".so") || dli_fname.find(".so.") != std::string_view::npos) {
    return nullptr;
  }
  char buf[PATH_MAX];
  ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (len == -1) {
    return nullptr;
  }
  buf[len] = '\0';
  auto exe_buffer_or = llvm::MemoryBuffer::getFile(buf, /*IsText=*/false, /*RequiresNullTerminator=*/false);
  if (exe_buffer_or) {
    return std::move(exe_buffer_or.get());
  }
#endif
  return nullptr;
}

llvm::DWARFContext *getModuleDebugInfo(const Dl_info &info) {
  std::string key(info.dli_fname ? info.dli_fname : "");

  std::lock_guard<std::mutex> lock(cache_mutex);
  auto it = debug_info_cache.find(key);
  if (it != debug_info_cache.end()) {
    return it->second.context.get();
  }

  ModuleDebugInfo entry;
  entry.buffer = loadModuleBuffer(key);
  if (entry.buffer) {
    auto object_or = llvm::object::ObjectFile::createObjectFile(entry.buffer->getMemBufferRef());
    if (object_or) {
      entry.object = std::move(object_or.get());
      entry.context = llvm::DWARFContext::create(*entry.object);
    } else {
      llvm::consumeError(object_or.takeError());
    }
  }

  auto *context = entry.context.get();
  debug_info_cache.emplace(std::move(key), std::move(entry));
  return context;
}

struct ResolvedFrame {
  bool has_module = false;
  Dl_info info{};
  llvm::DWARFContext *context = nullptr;
  llvm::DILineInfo line_info;
};

ResolvedFrame resolveAddress(void *address, bool step_back_to_call) {
  ResolvedFrame frame;
  if (!dladdr(address, &frame.info) || !frame.info.dli_fname) {
    return frame;
  }
  frame.has_module = true;
  frame.context = getModuleDebugInfo(frame.info);
  if (!frame.context) {
    return frame;
  }

  uint64_t debug_address = (uintptr_t)(address) - (uintptr_t)(frame.info.dli_fbase);
#ifdef __APPLE__
  // The dSYM file would contain addresses with an assumed 0x100000000 base
  debug_address += 0x100000000;
#endif
  // Return addresses point one instruction past the call
  if (step_back_to_call && debug_address > 0) {
    debug_address -= 1;
  }

  llvm::DILineInfoSpecifier spec(llvm::DILineInfoSpecifier::FileLineInfoKind::AbsoluteFilePath,
                                 llvm::DILineInfoSpecifier::FunctionNameKind::LinkageName);
  llvm::object::SectionedAddress sectioned = {debug_address, llvm::object::SectionedAddress::UndefSection};
  frame.line_info = frame.context->getLineInfoForAddress(sectioned, spec);
  return frame;
}

bool isKnown(const std::string &s) { return !s.empty() && s != "<invalid>"; }

} // namespace

void clearDebugInfoCache() {
  std::lock_guard<std::mutex> lock(cache_mutex);
  debug_info_cache.clear();
}

void formatBacktraceFrame(int btDepth, void *address, std::ostringstream &os) {
  os << "#" << std::setw(2) << std::setfill(' ') << btDepth << " ";

  ResolvedFrame frame = resolveAddress(address, true);
  if (!frame.has_module) {
    os << "📍 <unknown-src-location>";
    return;
  }

  std::string_view dli_sname(frame.info.dli_sname ? frame.info.dli_sname : "");
  if (dli_sname.empty() && !frame.context) {
    os << "📦 " << frame.info.dli_fname;
    return;
  }

  std::string function_name;
  if (frame.context && isKnown(frame.line_info.FunctionName)) {
    function_name = demangle(frame.line_info.FunctionName.c_str());
  } else if (!dli_sname.empty() && dli_sname != "<invalid>") {
    function_name = demangle(frame.info.dli_sname);
  }

  if (!function_name.empty()) {
    os << "🌀  " << function_name << "\n";
  }

  // vscode-clickable source location
  if (frame.context && isKnown(frame.line_info.FileName)) {
    os << "   👉 " << frame.line_info.FileName << ":" << frame.line_info.Line;
    if (frame.line_info.Column > 0) {
      os << ":" << frame.line_info.Column;
    }
    os << "\n";
  }

  os << "📦 " << frame.info.dli_fname;
}

std::string getSourceLocation(void *address) {
  ResolvedFrame frame = resolveAddress(address, false);
  if (!frame.context || !isKnown(frame.line_info.FileName)) {
    return {};
  }
  std::string location = frame.line_info.FileName + ":" + std::to_string(frame.line_info.Line);
  if (frame.line_info.Column > 0) {
    location += ":" + std::to_string(frame.line_info.Column);
  }
  return location;
}

void dumpDebugInfo(void *address, std::ostream &os) {
  os << "=== Debug Info Dump for address " << address << " ===" << std::endl;

  ResolvedFrame frame = resolveAddress(address, false);
  if (!frame.has_module) {
    os << "  Failed to get module info for address" << std::endl;
    os << "=== End Debug Info Dump ===" << std::endl;
    return;
  }
  if (!frame.context) {
    os << "  No debug context available for module" << std::endl;
    os << "=== End Debug Info Dump ===" << std::endl;
    return;
  }

  const auto &line_info = frame.line_info;
  os << "  Function: " << (line_info.FunctionName.empty() ? "<unknown>" : line_info.FunctionName) << std::endl;
  os << "  File: " << (line_info.FileName.empty() ? "<unknown>" : line_info.FileName) << std::endl;
  os << "  Line: " << line_info.Line << std::endl;
  os << "  Column: " << line_info.Column << std::endl;
  os << "  Start Line: " << line_info.StartLine << std::endl;

  std::string symbol = frame.info.dli_sname ? demangle(frame.info.dli_sname) : std::string("<unknown>");
  os << "  Symbol (dladdr): " << symbol << std::endl;
  os << "  Module: " << frame.info.dli_fname << std::endl;

  os << "=== End Debug Info Dump ===" << std::endl;
}

namespace yaml {

void initialize_llvm_components() {
  static std::once_flag once;
  std::call_once(once, [] {
    // Load and cache the DWARF context of the module holding the library
    Dl_info info;
    if (dladdr(reinterpret_cast<void *>(&initialize_llvm_components), &info) && info.dli_fname) {
      getModuleDebugInfo(info);
    }
  });
}

} // namespace yaml

} // namespace yamlet
