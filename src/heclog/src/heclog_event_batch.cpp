#include "heclog_event_batch.h"

#include <cinttypes>
#include <exception>

#include "heclog_event_serializer.h"
#include "heclog_report.h"

namespace heclog {

HECLOG_DECLARE_REPORT_LOGGER(HecLogEventBatch)

HecLogEventBatch::HecLogEventBatch(const HecLogPostFunc& postFunc,
                                   const HecLogMetadataPtr& metadata,
                                   HecLogFormatter* formatter /* = nullptr */)
    : m_postFunc(postFunc),
      m_metadata(metadata),
      m_formatter(formatter),
      m_serializer(new HecLogEventSerializer()),
      m_eventCount(0) {}

HecLogEventBatch::~HecLogEventBatch() {
    if (m_eventCount > 0) {
        HECLOG_REPORT_TRACE("Discarding batch with %u unsent events", m_eventCount);
    }
}

bool HecLogEventBatch::addEvent(HecLogTime time, const std::string& id /* = "" */,
                                const std::string& level /* = "" */,
                                const std::string& messageTemplate /* = "" */,
                                const std::string& renderedMessage /* = "" */,
                                const HecLogJson& exception /* = nullptr */,
                                const HecLogJson& properties /* = nullptr */,
                                const HecLogMetadataPtr& metadataOverride /* = nullptr */) {
    HecLogEventInfo eventInfo(time, id, level, messageTemplate, renderedMessage, exception,
                              properties, metadataOverride ? metadataOverride : m_metadata);
    return doSerialization(eventInfo);
}

bool HecLogEventBatch::addEvent(const HecLogEventInfo& eventInfo) {
    HecLogEventInfo eventInfoCopy(eventInfo);
    return doSerialization(eventInfoCopy);
}

int HecLogEventBatch::send(const HecLogCancelToken* cancelToken /* = nullptr */) {
    // take a snapshot and empty the batch, so it can be refilled while the payload is in flight
    std::string payload = m_buffer.toString();
    uint32_t eventCount = m_eventCount;
    m_buffer.reset();
    m_eventCount = 0;

    if (payload.empty()) {
        HECLOG_REPORT_TRACE("Batch is empty, skipping send");
        return HECLOG_HTTP_STATUS_OK;
    }
    HECLOG_REPORT_TRACE("Sending batch of %u events (%zu bytes)", eventCount, payload.size());
    return m_postFunc(payload, cancelToken);
}

bool HecLogEventBatch::doSerialization(HecLogEventInfo& eventInfo) {
    // record rollback checkpoint
    uint64_t orgLength = m_buffer.getOffset();
    const char* failure = nullptr;
    std::string errorText;
    try {
        if (m_formatter != nullptr) {
            eventInfo.setEvent(m_formatter->transform(eventInfo));
        }
        if (m_serializer->serialize(eventInfo, m_buffer)) {
            ++m_eventCount;
            return true;
        }
        failure = "batch buffer full";
    } catch (std::exception& e) {
        failure = "encoding error";
        errorText = e.what();
    }

    // unwind any partial output and start over with a fresh serializer, so that one bad event
    // does not affect events before or after it
    m_buffer.truncate(orgLength);
    m_serializer.reset(new HecLogEventSerializer());
    HECLOG_REPORT_ERROR("Failed to serialize log event (%s%s%s), event dropped", failure,
                        errorText.empty() ? "" : ": ", errorText.c_str());
    return false;
}

}  // namespace heclog
