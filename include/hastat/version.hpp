/*
 * Fallback version header for hastat
 *
 * The build system passes HASTAT_VERSION_* as compile definitions from the
 * project() version. These defaults keep the header usable on its own.
 */

#pragma once

#ifndef HASTAT_VERSION_MAJOR
#define HASTAT_VERSION_MAJOR 0
#endif

#ifndef HASTAT_VERSION_MINOR
#define HASTAT_VERSION_MINOR 0
#endif

#ifndef HASTAT_VERSION_PATCH
#define HASTAT_VERSION_PATCH 0
#endif

#ifndef HASTAT_VERSION_STRING
#define HASTAT_VERSION_STRING "0.0.0+dev"
#endif

#ifndef HASTAT_BUILD_DATE
#define HASTAT_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z (built: Mmm dd yyyy hh:mm:ss)"
#ifndef HASTAT_VERSION_LONG_STRING
#define HASTAT_VERSION_LONG_STRING HASTAT_VERSION_STRING " (built: " HASTAT_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace hastat {
namespace version {
constexpr int major_v = HASTAT_VERSION_MAJOR;
constexpr int minor_v = HASTAT_VERSION_MINOR;
constexpr int patch_v = HASTAT_VERSION_PATCH;
constexpr const char* string_v = HASTAT_VERSION_STRING;
constexpr const char* long_string_v = HASTAT_VERSION_LONG_STRING;
} // namespace version
} // namespace hastat
#endif
