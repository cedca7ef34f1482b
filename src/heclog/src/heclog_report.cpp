#include "heclog_report.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

#include "heclog_common.h"

namespace heclog {

/** @def The maximum size of a single formatted report message. */
#define HECLOG_REPORT_BUFFER_SIZE 1024

HECLOG_DECLARE_REPORT_LOGGER(HecLogReport)

static thread_local bool sIsReporting = false;

class HecLogDefaultReportHandler : public HecLogReportHandler {
public:
    HecLogDefaultReportHandler() {}
    HecLogDefaultReportHandler(const HecLogDefaultReportHandler&) = delete;
    HecLogDefaultReportHandler(HecLogDefaultReportHandler&&) = delete;
    HecLogDefaultReportHandler& operator=(const HecLogDefaultReportHandler&) = delete;
    ~HecLogDefaultReportHandler() final {}

    void onReport(const HecLogReportLogger& reportLogger, HecLogLevel logLevel, const char* file,
                  int line, const char* function, const char* msg) override {
        // NOTE: the entire message is formatted first and then emitted in one call, in order to
        // avoid intermixing messages from several threads
        std::string logLine;
        logLine.reserve(HECLOG_REPORT_BUFFER_SIZE);
        formatTime(logLine);
        char prefix[128];
        snprintf(prefix, sizeof(prefix), " %-6s [%" HecLogPRItid "] heclog.",
                 heclogLevelToStr(logLevel), getCurrentThreadId());
        logLine += "<HECLOG> ";
        logLine += prefix;
        logLine += reportLogger.getName();
        logLine += ": ";
        logLine += msg;
        logLine += '\n';
        if (logLevel <= HLEVEL_ERROR) {
            char location[HECLOG_REPORT_BUFFER_SIZE];
            snprintf(location, sizeof(location),
                     "Error location: file: %s, line: %d, function: %s\n", file, line, function);
            logLine += location;
        }
        fputs(logLine.c_str(), stderr);
        fflush(stderr);
    }

private:
    static void formatTime(std::string& logLine) {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
            1000;
        struct tm localTime;
#ifdef HECLOG_WINDOWS
        localtime_s(&localTime, &seconds);
#else
        localtime_r(&seconds, &localTime);
#endif
        char timeBuf[64];
        size_t len = strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &localTime);
        snprintf(timeBuf + len, sizeof(timeBuf) - len, ".%03d", (int)millis);
        logLine += timeBuf;
    }
};

static HecLogDefaultReportHandler sDefaultReportHandler;
static std::atomic<HecLogReportHandler*> sReportHandler(&sDefaultReportHandler);
static std::atomic<HecLogLevel> sReportLevel(HLEVEL_WARN);

void HecLogReport::setReportHandler(HecLogReportHandler* reportHandler) {
    if (reportHandler != nullptr) {
        sReportHandler.store(reportHandler, std::memory_order_release);
    } else {
        sReportHandler.store(&sDefaultReportHandler, std::memory_order_release);
    }
}

HecLogReportHandler* HecLogReport::getReportHandler() {
    return sReportHandler.load(std::memory_order_acquire);
}

void HecLogReport::setReportLevel(HecLogLevel reportLevel) {
    sReportLevel.store(reportLevel, std::memory_order_relaxed);
}

HecLogLevel HecLogReport::getReportLevel() { return sReportLevel.load(std::memory_order_relaxed); }

bool HecLogReport::canReport(HecLogLevel logLevel) {
    return logLevel <= sReportLevel.load(std::memory_order_relaxed);
}

bool HecLogReport::loadReportLevelEnv() {
    std::string levelStr;
    if (!heclog_getenv("HECLOG_REPORT_LEVEL", levelStr) || levelStr.empty()) {
        return true;
    }
    HecLogLevel reportLevel = HLEVEL_WARN;
    if (!heclogLevelFromStr(trim(levelStr).c_str(), reportLevel)) {
        HECLOG_REPORT_ERROR("Invalid report level in environment variable HECLOG_REPORT_LEVEL: %s",
                            levelStr.c_str());
        return false;
    }
    setReportLevel(reportLevel);
    return true;
}

void HecLogReport::report(const HecLogReportLogger& reportLogger, HecLogLevel logLevel,
                          const char* file, int line, const char* function, const char* fmt, ...) {
    if (!canReport(logLevel)) {
        return;
    }

    char msg[HECLOG_REPORT_BUFFER_SIZE];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, HECLOG_REPORT_BUFFER_SIZE, fmt, args);
    va_end(args);

    // any report raised from within a user handler is redirected to the default handler, otherwise
    // we might get endless recurrence
    if (sIsReporting) {
        sDefaultReportHandler.onReport(reportLogger, logLevel, file, line, function, msg);
        return;
    }
    sIsReporting = true;
    getReportHandler()->onReport(reportLogger, logLevel, file, line, function, msg);
    sIsReporting = false;
}

const char* HecLogReport::sysErrorToStr(int sysErrorCode) {
    const int BUF_LEN = 256;
    static thread_local char buf[BUF_LEN];
#ifdef HECLOG_WINDOWS
    (void)strerror_s(buf, BUF_LEN, sysErrorCode);
    return buf;
#else
#if (_POSIX_C_SOURCE >= 200112L) && !_GNU_SOURCE
    (void)strerror_r(sysErrorCode, buf, BUF_LEN);
    return buf;
#else
    return strerror_r(sysErrorCode, buf, BUF_LEN);
#endif
#endif
}

}  // namespace heclog
