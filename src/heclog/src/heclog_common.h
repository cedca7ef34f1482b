#ifndef __HECLOG_COMMON_H__
#define __HECLOG_COMMON_H__

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

#include "heclog_def.h"

#ifdef HECLOG_WINDOWS
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#else
#include <sys/syscall.h>
#include <unistd.h>
#endif

namespace heclog {

/** @typedef Platform-independent thread id type. */
#ifdef HECLOG_WINDOWS
typedef unsigned long heclog_thread_id_t;
#define HecLogPRItid "lu"
#else
typedef long heclog_thread_id_t;
#define HecLogPRItid "ld"
#endif

inline heclog_thread_id_t getCurrentThreadId() {
#ifdef HECLOG_WINDOWS
    return GetCurrentThreadId();
#else
    return syscall(SYS_gettid);
#endif  // HECLOG_WINDOWS
}

/** @brief Trims a string's prefix from the left side (in-place). */
inline void ltrim(std::string& s) { s.erase(0, s.find_first_not_of(" \n\r\t")); }

/** @brief Trims a string suffix from the right side (in-place). */
inline void rtrim(std::string& s) { s.erase(s.find_last_not_of(" \n\r\t") + 1); }

/** @brief Trims a string from both sides. */
inline std::string trim(const std::string& s) {
    std::string res = s;
    ltrim(res);
    rtrim(res);
    return res;
}

inline std::string toLower(const std::string& s) {
    std::string res = s;
    std::transform(res.begin(), res.end(), res.begin(),
                   [](char c) { return (char)std::tolower((unsigned char)c); });
    return res;
}

/** @brief Helper function for parsing an integer property */
extern bool parseIntProp(const char* propName, const std::string& cfg, const std::string& prop,
                         int32_t& value, bool issueError = true);

/** @brief Helper function for parsing an integer property */
extern bool parseIntProp(const char* propName, const std::string& cfg, const std::string& prop,
                         uint32_t& value, bool issueError = true);

/** @brief Helper function for parsing a boolean property (yes/no/true/false). */
extern bool parseBoolProp(const char* propName, const std::string& cfg, const std::string& prop,
                          bool& value, bool issueError = true);

/**
 * @brief Helper function for parsing a timeout property, with optional suffix ms or s. A value
 * without suffix is taken as milliseconds.
 */
extern bool parseTimeoutProp(const char* propName, const std::string& cfg, const std::string& prop,
                             uint32_t& timeoutMillis, bool issueError = true);

/**
 * @brief Retrieves environment variable value.
 *
 * @param envVarName The environment variable name.
 * @param envVarValue The resulting environment variable value.
 * @return true If variable was found, otherwise false.
 */
extern bool heclog_getenv(const char* envVarName, std::string& envVarValue);

/**
 * @brief Prepares an environment variable name from configuration name. Essentially adds
 * "HECLOG_" prefix, and turns to uppercase.
 */
inline void prepareEnvVarName(const char* configName, std::string& envVarName) {
    const std::string heclogEnvPrefix = "HECLOG_";
    envVarName = heclogEnvPrefix + configName;
    std::transform(envVarName.begin(), envVarName.end(), envVarName.begin(),
                   [](int c) { return (char)::toupper(c); });
}

/** @brief Retrieves an environment variable value by configuration name. */
inline bool getStringEnv(const char* configName, std::string& value) {
    std::string envVarName;
    prepareEnvVarName(configName, envVarName);
    return heclog_getenv(envVarName.c_str(), value);
}

}  // namespace heclog

#endif  // __HECLOG_COMMON_H__
