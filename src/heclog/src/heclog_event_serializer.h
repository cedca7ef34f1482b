#ifndef __HECLOG_EVENT_SERIALIZER_H__
#define __HECLOG_EVENT_SERIALIZER_H__

#include <cstdint>

#include "heclog_batch_buffer.h"
#include "heclog_def.h"
#include "heclog_event_info.h"

namespace heclog {

/**
 * @brief Writes a single event record into a batch buffer as one HEC JSON object followed by a
 * newline. The envelope is written field by field directly into the buffer, so a failure while
 * encoding a later field leaves a partial object behind. Callers are expected to truncate the
 * buffer back to the offset recorded before the call.
 */
class HecLogEventSerializer {
public:
    HecLogEventSerializer() : m_serializedCount(0) {}
    HecLogEventSerializer(const HecLogEventSerializer&) = delete;
    HecLogEventSerializer(HecLogEventSerializer&&) = delete;
    HecLogEventSerializer& operator=(const HecLogEventSerializer&) = delete;
    ~HecLogEventSerializer() {}

    /**
     * @brief Serializes the event record into the buffer.
     * @return False if the buffer could not grow. Encoding failures are thrown as
     * nlohmann::json::exception (e.g. invalid UTF-8 in a string value).
     */
    bool serialize(const HecLogEventInfo& eventInfo, HecLogBatchBuffer& buffer);

    /** @brief Retrieves the number of records serialized by this instance. */
    inline uint64_t getSerializedCount() const { return m_serializedCount; }

private:
    // scratch space reused between calls
    std::string m_fieldText;
    uint64_t m_serializedCount;

    bool appendStringField(const char* name, const std::string& value, HecLogBatchBuffer& buffer);
    bool appendJsonField(const char* name, const HecLogJson& value, HecLogBatchBuffer& buffer);
};

}  // namespace heclog

#endif  // __HECLOG_EVENT_SERIALIZER_H__
