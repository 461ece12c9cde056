#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace yamlet {

// Append one formatted backtrace frame, resolved through DWARF debug info when available
void formatBacktraceFrame(int btDepth, void *address, std::ostringstream &oss);

// "file:line[:column]" for a code address, or an empty string when unknown
std::string getSourceLocation(void *address);

// Dump comprehensive debug information from an address to the specified output stream
void dumpDebugInfo(void *address, std::ostream &os = std::cerr);

// Drop cached per-module DWARF contexts
void clearDebugInfoCache();

} // namespace yamlet
