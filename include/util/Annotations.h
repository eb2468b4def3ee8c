#pragma once

//
// util/Annotations.h
// -------------------
// Compiler-agnostic attribute shims.  Some helpers only light up in the
// headless example or in one layout version, and static analysis complains
// about the other build.  Headers opt in through these macros instead of
// tool-specific pragmas.

#if defined(__has_cpp_attribute)
  #if __has_cpp_attribute(maybe_unused)
    #define FLICKER_MAYBE_UNUSED [[maybe_unused]]
  #else
    #define FLICKER_MAYBE_UNUSED
  #endif
#else
  #define FLICKER_MAYBE_UNUSED
#endif
