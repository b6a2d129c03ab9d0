#pragma once

#ifdef _WIN32
    #define SHIPLOT_PLATFORM_WINDOWS
#elif defined(__linux__)
    #define SHIPLOT_PLATFORM_LINUX
#else
    #define SHIPLOT_PLATFORM_POSIX
#endif

namespace shiplot {

enum class Platform {
    Windows,
    Linux,
    Posix
};

inline Platform get_platform() {
#ifdef SHIPLOT_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(SHIPLOT_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return Platform::Posix;
#endif
}

inline const char* platform_name() {
    switch (get_platform()) {
        case Platform::Windows: return "windows";
        case Platform::Linux: return "linux";
        default: return "posix";
    }
}

inline const char* architecture_name() {
#if defined(__x86_64__) || defined(_M_X64)
    return "amd64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__i386__) || defined(_M_IX86)
    return "386";
#elif defined(__arm__) || defined(_M_ARM)
    return "arm";
#else
    return "unknown";
#endif
}

} // namespace shiplot
