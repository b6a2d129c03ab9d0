#pragma once

// Overridden by the build (see CMakeLists.txt)
#ifndef SHIPLOT_VERSION
#define SHIPLOT_VERSION "dev"
#endif

#ifndef SHIPLOT_BUILD_TARGET
#define SHIPLOT_BUILD_TARGET "unknown"
#endif

#ifndef SHIPLOT_BUILD_DATE
#define SHIPLOT_BUILD_DATE "unknown"
#endif

namespace shiplot {

constexpr const char* kVersion = SHIPLOT_VERSION;
constexpr const char* kBuildTarget = SHIPLOT_BUILD_TARGET;
constexpr const char* kBuildDate = SHIPLOT_BUILD_DATE;

} // namespace shiplot
