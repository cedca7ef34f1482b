#ifndef __HECLOG_DEF_H__
#define __HECLOG_DEF_H__

// clang settings
#ifdef __clang__
#define HECLOG_CLANG
#if defined(_WIN32) || defined(_WIN64)
// NOTE: on Windows platform we treat clang compiler as MSVC compiler due to clang compatibility
// frontend clang-cl
#define HECLOG_MSVC
#define HECLOG_WINDOWS
#elif defined(__linux__)
#define HECLOG_LINUX
#elif defined(__APPLE__)
#define HECLOG_APPLE
#endif

// Windows/MSVC settings
#elif defined(_MSC_VER)
#define HECLOG_WINDOWS
#define HECLOG_MSVC

// MinGW settings
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define HECLOG_WINDOWS
#define HECLOG_MINGW
#define HECLOG_GCC

// Linux settings
#elif defined(__linux__)
#define HECLOG_LINUX
#define HECLOG_GCC
#else
#error "Unsupported platform"
#endif

#if defined(HECLOG_MSVC) && defined(HECLOG_DLL)
#define HECLOG_API __declspec(dllexport)
#elif defined(HECLOG_MSVC) && defined(HECLOG_USE_DLL)
#define HECLOG_API __declspec(dllimport)
#else
#define HECLOG_API
#endif

// define strcasecmp for MSVC
#ifdef HECLOG_MSVC
#ifndef strncasecmp
#define strncasecmp _strnicmp
#endif
#ifndef strcasecmp
#define strcasecmp _stricmp
#endif
#endif

/** @def Define a unified function name macro */
#ifdef HECLOG_GCC
#define HECLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(HECLOG_MSVC) && !defined(HECLOG_CLANG)
#define HECLOG_FUNCTION __FUNCSIG__
#else
#define HECLOG_FUNCTION __func__
#endif

/** @def HTTP status OK. */
#define HECLOG_HTTP_STATUS_OK 200

/** @def HTTP status BAD REQUEST (used for transport failures without server response). */
#define HECLOG_HTTP_STATUS_BAD_REQUEST 400

/** @def HTTP status NOT ACCEPTABLE (used for overridden certificate validation errors). */
#define HECLOG_HTTP_STATUS_NOT_ACCEPTABLE 406

#endif  // __HECLOG_DEF_H__
