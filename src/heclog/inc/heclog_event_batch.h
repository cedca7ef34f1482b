#ifndef __HECLOG_EVENT_BATCH_H__
#define __HECLOG_EVENT_BATCH_H__

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "heclog_batch_buffer.h"
#include "heclog_cancel_token.h"
#include "heclog_def.h"
#include "heclog_event_info.h"
#include "heclog_formatter.h"
#include "heclog_metadata.h"

namespace heclog {

// forward declaration
class HecLogEventSerializer;

/**
 * @typedef Function posting a serialized payload. Returns the resulting HTTP status code and never
 * throws.
 */
typedef std::function<int(const std::string& payload, const HecLogCancelToken* cancelToken)>
    HecLogPostFunc;

/**
 * @brief Accumulates serialized events for a single flush cycle. Events are serialized at the
 * time they are added, in call order, and sent as one newline-delimited JSON payload. A batch is
 * not thread-safe, and is expected to be filled and sent by a single thread.
 */
class HECLOG_API HecLogEventBatch {
public:
    /**
     * @brief Constructs a batch.
     * @param postFunc The function used for sending the payload.
     * @param metadata Default metadata for events added without a metadata override.
     * @param formatter Optional event format override (not owned).
     */
    HecLogEventBatch(const HecLogPostFunc& postFunc, const HecLogMetadataPtr& metadata,
                     HecLogFormatter* formatter = nullptr);
    HecLogEventBatch(const HecLogEventBatch&) = delete;
    HecLogEventBatch(HecLogEventBatch&&) = delete;
    HecLogEventBatch& operator=(const HecLogEventBatch&) = delete;
    ~HecLogEventBatch();

    /**
     * @brief Serializes an event into the batch.
     * @param time The event time.
     * @param id Optional event identifier.
     * @param level The event level label.
     * @param messageTemplate The event message template.
     * @param renderedMessage The rendered event message.
     * @param exception Optional attached error object.
     * @param properties Optional event properties object.
     * @param metadataOverride Metadata to use for this event instead of the batch default.
     * @return True if the event was serialized. On failure the batch contents are left exactly
     * as they were before the call, the failure is reported, and the batch remains usable.
     */
    bool addEvent(HecLogTime time, const std::string& id = "", const std::string& level = "",
                  const std::string& messageTemplate = "", const std::string& renderedMessage = "",
                  const HecLogJson& exception = nullptr, const HecLogJson& properties = nullptr,
                  const HecLogMetadataPtr& metadataOverride = nullptr);

    /** @brief Serializes a prepared event record into the batch (see above). */
    bool addEvent(const HecLogEventInfo& eventInfo);

    /**
     * @brief Sends all events accumulated so far. The batch is emptied before the payload is
     * posted, so it may be refilled right away. An empty batch is not sent, and yields HTTP 200.
     * @param cancelToken Optional cancellation token.
     * @return The resulting HTTP status code.
     */
    int send(const HecLogCancelToken* cancelToken = nullptr);

    /** @brief Retrieves the number of events currently held in the batch. */
    inline uint32_t getEventCount() const { return m_eventCount; }

    /** @brief Retrieves the serialized batch contents (not yet sent). */
    inline const HecLogBatchBuffer& getBuffer() const { return m_buffer; }

private:
    HecLogPostFunc m_postFunc;
    HecLogMetadataPtr m_metadata;
    HecLogFormatter* m_formatter;
    HecLogBatchBuffer m_buffer;
    std::unique_ptr<HecLogEventSerializer> m_serializer;
    uint32_t m_eventCount;

    bool doSerialization(HecLogEventInfo& eventInfo);
};

}  // namespace heclog

#endif  // __HECLOG_EVENT_BATCH_H__
