#ifndef __HECLOG_LEVEL_H__
#define __HECLOG_LEVEL_H__

#include <cstdint>
#include <cstdlib>

#include "heclog_def.h"

namespace heclog {

/** @enum Report level constants (used for the library's own diagnostics). */
enum HecLogLevel : uint32_t {
    /** @var Fatal report level. The library cannot continue operating. */
    HLEVEL_FATAL,

    /** @var Error report level. An error condition occurred, operation continues. */
    HLEVEL_ERROR,

    /** @var Warning report level. Some error condition, not as severe as error. */
    HLEVEL_WARN,

    /** @var Notice report level. A condition worth noting, not an error. */
    HLEVEL_NOTICE,

    /** @var Informative report level. Infrequent important details. */
    HLEVEL_INFO,

    /** @var Trace report level. Used for debugging the library. */
    HLEVEL_TRACE,

    /** @var Debug report level. Used for debugging noisy components (e.g. payload dumps). */
    HLEVEL_DEBUG
};

/** @def The number of defined report levels. */
#define HLEVEL_COUNT ((uint32_t)HLEVEL_DEBUG + 1)

/** @brief Converts report level constant to string. */
extern HECLOG_API const char* heclogLevelToStr(HecLogLevel logLevel);

/**
 * @brief Converts report level string to report level constant (case insensitive).
 * @param logLevelStr The input report level string.
 * @param[out] logLevel The resulting report level.
 * @return True if parsing succeeded, otherwise false.
 */
extern HECLOG_API bool heclogLevelFromStr(const char* logLevelStr, HecLogLevel& logLevel);

}  // namespace heclog

#endif  // __HECLOG_LEVEL_H__
