#ifndef __HECLOG_REPORT_HANDLER_H__
#define __HECLOG_REPORT_HANDLER_H__

#include <string>

#include "heclog_def.h"
#include "heclog_level.h"

namespace heclog {

/** @brief Named reporting logger, one per library module. */
class HECLOG_API HecLogReportLogger {
public:
    HecLogReportLogger(const char* name) : m_name(name) {}
    HecLogReportLogger(const HecLogReportLogger&) = delete;
    HecLogReportLogger(HecLogReportLogger&&) = delete;
    HecLogReportLogger& operator=(const HecLogReportLogger&) = delete;
    ~HecLogReportLogger() {}

    /** @brief Retrieves the name of the logger. */
    inline const char* getName() const { return m_name.c_str(); }

private:
    std::string m_name;
};

/**
 * @brief Internal message report handling interface. Users may derive, implement and install it
 * with @ref HecLogReport::setReportHandler() in order to redirect library diagnostics (e.g. into
 * the host's own internal log).
 */
class HECLOG_API HecLogReportHandler {
public:
    /** @brief Disable copy constructor. */
    HecLogReportHandler(const HecLogReportHandler&) = delete;

    /** @brief Disable move constructor. */
    HecLogReportHandler(HecLogReportHandler&&) = delete;

    /** @brief Disable assignment operator. */
    HecLogReportHandler& operator=(const HecLogReportHandler&) = delete;

    /** @brief Destructor. */
    virtual ~HecLogReportHandler() {}

    /**
     * @brief Reports an internal log message.
     * @param reportLogger The reporting module logger.
     * @param logLevel The report level.
     * @param file The source file issuing the report.
     * @param line The source line issuing the report.
     * @param function The function issuing the report.
     * @param msg The fully formatted message.
     */
    virtual void onReport(const HecLogReportLogger& reportLogger, HecLogLevel logLevel,
                          const char* file, int line, const char* function, const char* msg) = 0;

protected:
    /** @brief Constructor. */
    HecLogReportHandler() {}
};

/** @brief Report facility interface (global configuration). */
class HECLOG_API HecLogReport {
public:
    /** @brief Installs a report handler. Passing null restores the default stderr handler. */
    static void setReportHandler(HecLogReportHandler* reportHandler);

    /** @brief Retrieves the installed report handler. */
    static HecLogReportHandler* getReportHandler();

    /** @brief Configures the report level (default is WARN). */
    static void setReportLevel(HecLogLevel reportLevel);

    /** @brief Retrieves the report level. */
    static HecLogLevel getReportLevel();

    /** @brief Queries whether reports of the given level are currently emitted. */
    static bool canReport(HecLogLevel logLevel);

    /**
     * @brief Loads the report level from the environment variable HECLOG_REPORT_LEVEL, if defined.
     * @return False if the variable is defined but does not hold a valid level name.
     */
    static bool loadReportLevelEnv();

    /** @brief Reports an internal log message (printf-style). */
    static void report(const HecLogReportLogger& logger, HecLogLevel logLevel, const char* file,
                       int line, const char* function, const char* fmt, ...)
#ifdef HECLOG_GCC
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    /** @brief Converts system error code to string. */
    static const char* sysErrorToStr(int sysErrorCode);

private:
    HecLogReport() {}
};

}  // namespace heclog

#endif  // __HECLOG_REPORT_HANDLER_H__
