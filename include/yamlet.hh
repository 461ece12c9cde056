#pragma once

#include "yamlet/prelude.hh" // IWYU pragma: keep

#include "yamlet/composer.hh" // IWYU pragma: keep
#include "yamlet/emitter.hh"  // IWYU pragma: keep
#include "yamlet/scanner.hh"  // IWYU pragma: keep

#include "yamlet/lint.hh"     // IWYU pragma: keep
#include "yamlet/parallel.hh" // IWYU pragma: keep

namespace yamlet {
namespace yaml {
// Initialize LLVM components required for DWARF debug info handling
// Call once before the first exception is thrown so stack traces resolve
// to source locations without a cold-cache stall
void initialize_llvm_components();
} // namespace yaml
} // namespace yamlet
