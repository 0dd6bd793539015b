#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   DICON_BUILDING  — defined when compiling the dicon library itself
///   DICON_STATIC    — define when building/linking dicon as a static lib

#if defined(DICON_STATIC)
  #define DICON_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef DICON_BUILDING
    #define DICON_EXPORT __declspec(dllexport)
  #else
    #define DICON_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define DICON_EXPORT __attribute__((visibility("default")))
#else
  #define DICON_EXPORT
#endif
