#ifndef __HECLOG_FORMATTER_H__
#define __HECLOG_FORMATTER_H__

#include "heclog_def.h"
#include "heclog_event_info.h"

namespace heclog {

/**
 * @brief Event format override. When installed on a sender, the formatter is invoked for each
 * event before serialization, and its result is sent as the "event" field in place of the
 * structured event object. The envelope fields (time, index, source, sourcetype, host) are kept.
 */
class HECLOG_API HecLogFormatter {
public:
    HecLogFormatter(const HecLogFormatter&) = delete;
    HecLogFormatter(HecLogFormatter&&) = delete;
    HecLogFormatter& operator=(const HecLogFormatter&) = delete;
    virtual ~HecLogFormatter() {}

    /**
     * @brief Transforms an event record into the value sent as its "event" field.
     * @note Any value is allowed, including scalars and null. Exceptions thrown here are treated
     * as serialization failures of the event.
     */
    virtual HecLogJson transform(const HecLogEventInfo& eventInfo) = 0;

protected:
    HecLogFormatter() {}
};

}  // namespace heclog

#endif  // __HECLOG_FORMATTER_H__
