/*
 * Fallback version header for rangedb
 *
 * The build system passes the real values as compile definitions; these defaults keep the
 * header usable without them.
 */

#pragma once

#ifndef RANGEDB_VERSION_MAJOR
#define RANGEDB_VERSION_MAJOR 0
#endif

#ifndef RANGEDB_VERSION_MINOR
#define RANGEDB_VERSION_MINOR 0
#endif

#ifndef RANGEDB_VERSION_PATCH
#define RANGEDB_VERSION_PATCH 0
#endif

#ifndef RANGEDB_VERSION_STRING
#define RANGEDB_VERSION_STRING "0.0.0+dev"
#endif

#ifndef RANGEDB_BUILD_DATE
#define RANGEDB_BUILD_DATE __DATE__ " " __TIME__
#endif

#define RANGEDB_VERSION_LONG_STRING RANGEDB_VERSION_STRING " (built: " RANGEDB_BUILD_DATE ")"

#if defined(__cplusplus)
namespace rangedb {
namespace version {
constexpr int major_v = RANGEDB_VERSION_MAJOR;
constexpr int minor_v = RANGEDB_VERSION_MINOR;
constexpr int patch_v = RANGEDB_VERSION_PATCH;
constexpr const char* string_v = RANGEDB_VERSION_STRING;
constexpr const char* long_string_v = RANGEDB_VERSION_LONG_STRING;
} // namespace version
} // namespace rangedb
#endif
