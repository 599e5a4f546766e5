#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define FXC_LIKELY(x) __builtin_expect(!!(x), 1)
#define FXC_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define FXC_LIKELY(x) (x)
#define FXC_UNLIKELY(x) (x)
#endif

#define FXC_STRINGIFY(x) #x
#define FXC_VER_STRING(major, minor, patch) FXC_STRINGIFY(major) "." FXC_STRINGIFY(minor) "." FXC_STRINGIFY(patch)

#if defined(__clang__)
#define FXC_COMPILER_VERSION "clang " FXC_VER_STRING(__clang_major__, __clang_minor__, __clang_patchlevel__)
#elif defined(__GNUC__)
#define FXC_COMPILER_VERSION "g++ " FXC_VER_STRING(__GNUC__, __GNUC_MINOR__, __GNUC_PATCHLEVEL__)
#elif defined(_MSC_VER)
#define FXC_COMPILER_VERSION "MSVC " FXC_STRINGIFY(_MSC_FULL_VER)
#else
#error "Unknown compiler. Only clang, gcc and MSVC are supported."
#endif
