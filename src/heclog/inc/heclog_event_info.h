#ifndef __HECLOG_EVENT_INFO_H__
#define __HECLOG_EVENT_INFO_H__

#include <chrono>
#include <exception>
#include <nlohmann/json.hpp>
#include <string>

#include "heclog_def.h"
#include "heclog_metadata.h"

namespace heclog {

/** @typedef JSON value type used for properties, exceptions and event overrides. */
typedef nlohmann::ordered_json HecLogJson;

/** @typedef Event time type. */
typedef std::chrono::system_clock::time_point HecLogTime;

/**
 * @brief A single log occurrence together with its destination metadata. Either the structured
 * fields or the event override (installed by a formatter) is serialized, never both.
 */
class HECLOG_API HecLogEventInfo {
public:
    /**
     * @brief Constructs an event record.
     * @param time The event time.
     * @param id Optional correlation identifier (empty for none).
     * @param level The severity label.
     * @param messageTemplate The raw unformatted message (empty for none).
     * @param renderedMessage The fully formatted message.
     * @param exception Attached error object (null for none).
     * @param properties Ordered properties object (null or empty object for none).
     * @param metadata The destination metadata.
     */
    HecLogEventInfo(HecLogTime time, const std::string& id, const std::string& level,
                    const std::string& messageTemplate, const std::string& renderedMessage,
                    const HecLogJson& exception, const HecLogJson& properties,
                    const HecLogMetadataPtr& metadata)
        : m_time(time),
          m_id(id),
          m_level(level),
          m_messageTemplate(messageTemplate),
          m_renderedMessage(renderedMessage),
          m_exception(exception),
          m_properties(properties),
          m_metadata(metadata),
          m_hasEvent(false) {}

    HecLogEventInfo(const HecLogEventInfo&) = default;
    HecLogEventInfo& operator=(const HecLogEventInfo&) = delete;
    ~HecLogEventInfo() {}

    inline HecLogTime getTime() const { return m_time; }
    inline const std::string& getId() const { return m_id; }
    inline const std::string& getLevel() const { return m_level; }
    inline const std::string& getMessageTemplate() const { return m_messageTemplate; }
    inline const std::string& getRenderedMessage() const { return m_renderedMessage; }
    inline const HecLogJson& getException() const { return m_exception; }
    inline const HecLogJson& getProperties() const { return m_properties; }
    inline const HecLogMetadataPtr& getMetadata() const { return m_metadata; }

    /** @brief Replaces the structured event payload with an arbitrary value. */
    inline void setEvent(HecLogJson event) {
        m_event = std::move(event);
        m_hasEvent = true;
    }

    /** @brief Queries whether the structured payload has been overridden. */
    inline bool hasEvent() const { return m_hasEvent; }

    /** @brief Retrieves the event override (valid only if @ref hasEvent() returns true). */
    inline const HecLogJson& getEvent() const { return m_event; }

    /** @brief Builds the structured "event" object from the record fields. */
    HecLogJson buildStructuredEvent() const;

    /** @brief Formats event time as fractional unix epoch seconds (millisecond precision). */
    static std::string formatEpochTime(HecLogTime time);

    /** @brief Converts a caught exception to a structured error object (type and message). */
    static HecLogJson exceptionToJson(const std::exception& e);

private:
    HecLogTime m_time;
    std::string m_id;
    std::string m_level;
    std::string m_messageTemplate;
    std::string m_renderedMessage;
    HecLogJson m_exception;
    HecLogJson m_properties;
    HecLogMetadataPtr m_metadata;
    HecLogJson m_event;
    bool m_hasEvent;
};

}  // namespace heclog

#endif  // __HECLOG_EVENT_INFO_H__
