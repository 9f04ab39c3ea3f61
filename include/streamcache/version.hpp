/*
 * Version macros for streamcache
 *
 * The build system defines STREAMCACHE_VERSION_* from the CMake project version; the defaults
 * below only apply when this header is used outside that build.
 */

#pragma once

#ifndef STREAMCACHE_VERSION_MAJOR
#define STREAMCACHE_VERSION_MAJOR 0
#endif

#ifndef STREAMCACHE_VERSION_MINOR
#define STREAMCACHE_VERSION_MINOR 0
#endif

#ifndef STREAMCACHE_VERSION_PATCH
#define STREAMCACHE_VERSION_PATCH 0
#endif

#ifndef STREAMCACHE_VERSION_STRING
#define STREAMCACHE_VERSION_STRING "0.0.0+dev"
#endif

#ifndef STREAMCACHE_BUILD_DATE
#define STREAMCACHE_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z (built: <date>)"
#define STREAMCACHE_VERSION_LONG_STRING                                                            \
    STREAMCACHE_VERSION_STRING " (built: " STREAMCACHE_BUILD_DATE ")"

#if defined(__cplusplus)
namespace streamcache {
namespace version {
constexpr const char* long_string_v = STREAMCACHE_VERSION_LONG_STRING;
} // namespace version
} // namespace streamcache
#endif
