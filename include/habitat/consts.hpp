#ifndef HABITAT_CONSTS_HPP
#define HABITAT_CONSTS_HPP

#include <string_view>

#if defined(__APPLE__)
#   include <TargetConditionals.h>
#endif

namespace habitat {

    struct platform_constants
    {
        std::string_view arch;
        std::string_view family;
        std::string_view os;
        std::string_view dll_prefix;
        std::string_view dll_suffix;
        std::string_view dll_extension;
        std::string_view exe_suffix;
        std::string_view exe_extension;
    };

} // namespace habitat

// values of the build target
namespace habitat::consts {

inline constexpr std::string_view arch =
#if defined(__x86_64__) || defined(_M_X64)
    "x86_64";
#elif defined(__i386__) || defined(_M_IX86)
    "x86";
#elif defined(__aarch64__) || defined(_M_ARM64)
    "aarch64";
#elif defined(__arm__) || defined(_M_ARM)
    "arm";
#elif defined(__mips64)
    "mips64";
#elif defined(__mips__)
    "mips";
#elif defined(__powerpc64__)
    "powerpc64";
#elif defined(__powerpc__)
    "powerpc";
#elif defined(__s390x__)
    "s390x";
#elif defined(__sparc__) && defined(__arch64__)
    "sparc64";
#elif defined(__le32__)
    "le32";
#elif defined(__asmjs__)
    "asmjs";
#elif defined(__wasm32__)
    "wasm32";
#else
#   error "unknown architecture"
#endif

#if defined(_WIN32)
inline constexpr std::string_view family = "windows";
inline constexpr std::string_view os = "windows";
inline constexpr std::string_view dll_prefix = "";
inline constexpr std::string_view dll_suffix = ".dll";
inline constexpr std::string_view dll_extension = "dll";
inline constexpr std::string_view exe_suffix = ".exe";
inline constexpr std::string_view exe_extension = "exe";
#else
inline constexpr std::string_view family = "unix";

inline constexpr std::string_view os =
#   if defined(__ANDROID__)
    "android";
#   elif defined(__linux__)
    "linux";
#   elif defined(__APPLE__) && defined(__MACH__)
#       if TARGET_OS_IPHONE
    "ios";
#       else
    "macos";
#       endif
#   elif defined(__DragonFly__)
    "dragonfly";
#   elif defined(__FreeBSD__)
    "freebsd";
#   elif defined(__NetBSD__)
    "netbsd";
#   elif defined(__OpenBSD__)
    "openbsd";
#   elif defined(__sun)
    "solaris";
#   elif defined(__EMSCRIPTEN__)
    "emscripten";
#   else
#       error "unknown platform"
#   endif

inline constexpr std::string_view dll_prefix = "lib";
#   if defined(__APPLE__)
inline constexpr std::string_view dll_suffix = ".dylib";
inline constexpr std::string_view dll_extension = "dylib";
#   else
inline constexpr std::string_view dll_suffix = ".so";
inline constexpr std::string_view dll_extension = "so";
#   endif

#   if defined(__EMSCRIPTEN__)
inline constexpr std::string_view exe_suffix = ".js";
inline constexpr std::string_view exe_extension = "js";
#   else
inline constexpr std::string_view exe_suffix = "";
inline constexpr std::string_view exe_extension = "";
#   endif
#endif

inline constexpr platform_constants target = {
    arch, family, os, dll_prefix, dll_suffix, dll_extension, exe_suffix, exe_extension
};

} // namespace habitat::consts

#endif // HABITAT_CONSTS_HPP
