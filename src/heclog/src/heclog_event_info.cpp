#include "heclog_event_info.h"

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <typeinfo>

#ifdef HECLOG_GCC
#include <cxxabi.h>
#endif

namespace heclog {

HecLogJson HecLogEventInfo::buildStructuredEvent() const {
    HecLogJson event = HecLogJson::object();
    if (!m_id.empty()) {
        event["id"] = m_id;
    }
    if (!m_messageTemplate.empty()) {
        event["message-template"] = m_messageTemplate;
    }
    event["message"] = m_renderedMessage;
    event["level"] = m_level;
    if (!m_exception.is_null()) {
        event["exception"] = m_exception;
    }
    if (!m_properties.is_null() && !m_properties.empty()) {
        event["properties"] = m_properties;
    }
    return event;
}

std::string HecLogEventInfo::formatEpochTime(HecLogTime time) {
    int64_t millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    // sign applies to the whole value (-750 ms is -0.750)
    const char* sign = millis < 0 ? "-" : "";
    uint64_t absMillis = millis < 0 ? (uint64_t)0 - (uint64_t)millis : (uint64_t)millis;
    char buf[64];
    snprintf(buf, sizeof(buf), "%s%" PRIu64 ".%03" PRIu64, sign, absMillis / 1000,
             absMillis % 1000);
    return buf;
}

HecLogJson HecLogEventInfo::exceptionToJson(const std::exception& e) {
    HecLogJson exception = HecLogJson::object();
    const char* typeName = typeid(e).name();
#ifdef HECLOG_GCC
    int status = 0;
    char* demangled = abi::__cxa_demangle(typeName, nullptr, nullptr, &status);
    if (status == 0 && demangled != nullptr) {
        exception["type"] = demangled;
    } else {
        exception["type"] = typeName;
    }
    free(demangled);
#else
    exception["type"] = typeName;
#endif
    exception["message"] = e.what();
    return exception;
}

}  // namespace heclog
