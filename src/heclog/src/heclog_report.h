#ifndef __HECLOG_REPORT_H__
#define __HECLOG_REPORT_H__

#include <cerrno>

#include "heclog_def.h"
#include "heclog_level.h"
#include "heclog_report_handler.h"

namespace heclog {

/** @brief Helper macro for declaring internal logger by name. */
#define HECLOG_DECLARE_REPORT_LOGGER(name) static HecLogReportLogger sLogger(#name);

/** @brief Helper macro for getting a reference to the internal logger. */
#define HECLOG_REPORT_LOGGER sLogger

/** @brief Generic reporting macro. */
#define HECLOG_REPORT_EX(logger, level, fmt, ...)                                            \
    heclog::HecLogReport::report(logger, level, __FILE__, __LINE__, HECLOG_FUNCTION, fmt, \
                                 ##__VA_ARGS__)

/** @brief Generic reporting macro. */
#define HECLOG_REPORT(level, fmt, ...) HECLOG_REPORT_EX(sLogger, level, fmt, ##__VA_ARGS__)

/** @brief Report message to enclosing application/library. */
#define HECLOG_REPORT_FATAL(fmt, ...) HECLOG_REPORT(heclog::HLEVEL_FATAL, fmt, ##__VA_ARGS__)
#define HECLOG_REPORT_ERROR(fmt, ...) HECLOG_REPORT(heclog::HLEVEL_ERROR, fmt, ##__VA_ARGS__)
#define HECLOG_REPORT_WARN(fmt, ...) HECLOG_REPORT(heclog::HLEVEL_WARN, fmt, ##__VA_ARGS__)
#define HECLOG_REPORT_NOTICE(fmt, ...) HECLOG_REPORT(heclog::HLEVEL_NOTICE, fmt, ##__VA_ARGS__)
#define HECLOG_REPORT_INFO(fmt, ...) HECLOG_REPORT(heclog::HLEVEL_INFO, fmt, ##__VA_ARGS__)
#define HECLOG_REPORT_TRACE(fmt, ...) HECLOG_REPORT(heclog::HLEVEL_TRACE, fmt, ##__VA_ARGS__)
#define HECLOG_REPORT_DEBUG(fmt, ...) HECLOG_REPORT(heclog::HLEVEL_DEBUG, fmt, ##__VA_ARGS__)

/** @brief Report system call failure with error code to enclosing application/library. */
#define HECLOG_REPORT_SYS_ERROR_NUM(sysCall, sysErr, fmt, ...)                \
    HECLOG_REPORT_ERROR("System call " #sysCall "() failed: %d (%s)", sysErr, \
                        heclog::HecLogReport::sysErrorToStr(sysErr));         \
    HECLOG_REPORT_ERROR(fmt, ##__VA_ARGS__);

/**
 * @brief Report system call failure (error code taken from errno) to enclosing
 * application/library.
 */
#define HECLOG_REPORT_SYS_ERROR(sysCall, fmt, ...)                        \
    {                                                                     \
        int sysErr = errno;                                               \
        HECLOG_REPORT_SYS_ERROR_NUM(sysCall, sysErr, fmt, ##__VA_ARGS__); \
    }

}  // namespace heclog

#endif  // __HECLOG_REPORT_H__
