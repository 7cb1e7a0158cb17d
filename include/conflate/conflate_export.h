#pragma once

// Symbol visibility for the compiled part of the library (CMake defines conflate_EXPORTS
// while building a shared conflate target; CONFLATE_STATIC is set for static builds).

#if defined CONFLATE_STATIC
#  define CONFLATE_EXPORT
#elif defined _WIN32 || defined __CYGWIN__
#  ifdef conflate_EXPORTS
#    define CONFLATE_EXPORT __declspec(dllexport)
#  else
#    define CONFLATE_EXPORT __declspec(dllimport)
#  endif
#elif __GNUC__ >= 4
#  define CONFLATE_EXPORT __attribute__((visibility("default")))
#else
#  define CONFLATE_EXPORT
#endif
