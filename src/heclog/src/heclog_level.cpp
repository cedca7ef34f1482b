#include "heclog_level.h"

#include <cstring>
#ifndef HECLOG_WINDOWS
#include <strings.h>
#endif

namespace heclog {

static HecLogLevel gLogLevels[] = {HLEVEL_FATAL, HLEVEL_ERROR, HLEVEL_WARN, HLEVEL_NOTICE,
                                   HLEVEL_INFO,  HLEVEL_TRACE, HLEVEL_DEBUG};

static const char* gLogLevelStr[] = {"FATAL", "ERROR", "WARN", "NOTICE", "INFO", "TRACE", "DEBUG"};

static const uint32_t gLogLevelCount = sizeof(gLogLevels) / sizeof(gLogLevels[0]);
static const uint32_t gLogLevelStrCount = sizeof(gLogLevelStr) / sizeof(gLogLevelStr[0]);

static_assert(gLogLevelCount == gLogLevelStrCount, "level name table mismatch");
static_assert(gLogLevelCount == HLEVEL_COUNT, "level count mismatch");

const char* heclogLevelToStr(HecLogLevel logLevel) {
    if (static_cast<uint32_t>(logLevel) < gLogLevelCount) {
        return gLogLevelStr[logLevel];
    }
    return "N/A";
}

bool heclogLevelFromStr(const char* logLevelStr, HecLogLevel& logLevel) {
    if (logLevelStr == nullptr) {
        return false;
    }
    for (uint32_t i = 0; i < gLogLevelCount; ++i) {
        if (strcasecmp(logLevelStr, gLogLevelStr[i]) == 0) {
            logLevel = gLogLevels[i];
            return true;
        }
    }
    return false;
}

}  // namespace heclog
