#include "heclog_event_serializer.h"

namespace heclog {

bool HecLogEventSerializer::serialize(const HecLogEventInfo& eventInfo,
                                      HecLogBatchBuffer& buffer) {
    const HecLogMetadataPtr& metadata = eventInfo.getMetadata();

    if (!buffer.append("{\"time\":", 8) ||
        !buffer.append(HecLogEventInfo::formatEpochTime(eventInfo.getTime()))) {
        return false;
    }
    if (metadata != nullptr) {
        if (!metadata->getIndex().empty() &&
            !appendStringField("index", metadata->getIndex(), buffer)) {
            return false;
        }
        if (!metadata->getSource().empty() &&
            !appendStringField("source", metadata->getSource(), buffer)) {
            return false;
        }
        if (!appendStringField("sourcetype", metadata->getSourceType(), buffer)) {
            return false;
        }
        if (!metadata->getHost().empty() &&
            !appendStringField("host", metadata->getHost(), buffer)) {
            return false;
        }
    } else if (!appendStringField("sourcetype", HECLOG_DEFAULT_SOURCETYPE, buffer)) {
        // sourcetype is always present on the wire
        return false;
    }

    // exactly one of the override or the structured fields goes out
    if (eventInfo.hasEvent()) {
        if (!appendJsonField("event", eventInfo.getEvent(), buffer)) {
            return false;
        }
    } else if (!appendJsonField("event", eventInfo.buildStructuredEvent(), buffer)) {
        return false;
    }

    if (!buffer.append("}\n", 2)) {
        return false;
    }
    ++m_serializedCount;
    return true;
}

bool HecLogEventSerializer::appendStringField(const char* name, const std::string& value,
                                              HecLogBatchBuffer& buffer) {
    // dump() validates UTF-8 and throws on invalid input
    m_fieldText = HecLogJson(value).dump();
    return buffer.append(',') && buffer.append('"') && buffer.append(name, strlen(name)) &&
           buffer.append("\":", 2) && buffer.append(m_fieldText);
}

bool HecLogEventSerializer::appendJsonField(const char* name, const HecLogJson& value,
                                            HecLogBatchBuffer& buffer) {
    if (!buffer.append(',') || !buffer.append('"') || !buffer.append(name, strlen(name)) ||
        !buffer.append("\":", 2)) {
        return false;
    }
    m_fieldText = value.dump();
    return buffer.append(m_fieldText);
}

}  // namespace heclog
