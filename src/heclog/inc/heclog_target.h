#ifndef __HECLOG_TARGET_H__
#define __HECLOG_TARGET_H__

#include <chrono>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "heclog_cancel_token.h"
#include "heclog_config.h"
#include "heclog_def.h"
#include "heclog_error_reporter.h"
#include "heclog_event_info.h"
#include "heclog_formatter.h"
#include "heclog_metadata.h"
#include "heclog_sender.h"

namespace heclog {

/** @brief A log event as handed over by the host logging framework. */
struct HECLOG_API HecLogEvent {
    /** @brief The event time. */
    HecLogTime m_time;

    /** @brief Optional event identifier. */
    std::string m_id;

    /** @brief The event level label (e.g. "Info"). */
    std::string m_level;

    /** @brief The name of the logger that issued the event. */
    std::string m_loggerName;

    /** @brief The raw message template. */
    std::string m_messageTemplate;

    /** @brief Positional message parameters. */
    std::vector<HecLogJson> m_parameters;

    /** @brief The fully rendered message. */
    std::string m_renderedMessage;

    /** @brief Attached error object (null if none). See @ref HecLogEventInfo::exceptionToJson(). */
    HecLogJson m_exception;

    /** @brief Event properties object (null if none). */
    HecLogJson m_properties;

    HecLogEvent() : m_time(std::chrono::system_clock::now()) {}
};

/**
 * @brief The collector log target, driven by the host logging framework. The host decides when to
 * write and how many events to pass in each call. Each write call sends a single batch.
 */
class HECLOG_API HecLogTarget {
public:
    /**
     * @brief Constructs a target.
     * @param config The target configuration.
     * @param formatter Optional event format override (not owned).
     * @param hostResolver Optional host resolver (default chain if none).
     */
    explicit HecLogTarget(const HecLogTargetConfig& config, HecLogFormatter* formatter = nullptr,
                          const HecLogHostResolver* hostResolver = nullptr);
    HecLogTarget(const HecLogTarget&) = delete;
    HecLogTarget(HecLogTarget&&) = delete;
    HecLogTarget& operator=(const HecLogTarget&) = delete;
    ~HecLogTarget();

    /** @brief Starts the target. Fails if the configuration is invalid. */
    bool start();

    /** @brief Stops the target, waiting for outstanding sends and closing the sender. */
    bool stop();

    /** @brief Queries whether the target is started. */
    inline bool isStarted() const { return m_sender != nullptr; }

    /**
     * @brief Sends a single event.
     * @return In sequential mode, true if the event was accepted by the server. In parallel mode,
     * true if the event was dispatched (see @ref flush()).
     */
    bool writeLogEvent(const HecLogEvent& event, const HecLogCancelToken* cancelToken = nullptr);

    /**
     * @brief Sends a list of events in one batch. The cancel token is checked after each event is
     * added. Once cancelled, the batch is abandoned without sending and false is returned.
     * @note In parallel mode the cancel token must remain valid until @ref flush() returns.
     */
    bool writeLogEvents(const std::vector<HecLogEvent>& events,
                        const HecLogCancelToken* cancelToken = nullptr);

    /**
     * @brief Waits for all outstanding parallel sends.
     * @return False if any send issued since the previous flush was not accepted.
     */
    bool flush();

    /** @brief Retrieves the target configuration. */
    inline const HecLogTargetConfig& getConfig() const { return m_config; }

    /** @brief Retrieves the underlying sender (null if not started). */
    inline HecLogSender* getSender() { return m_sender.get(); }

    /** @brief Builds the properties object of an event (null if there are no properties). */
    HecLogJson buildProperties(const HecLogEvent& event) const;

    /** @brief Retrieves the source used for an event (empty for none). */
    std::string getEventSource(const HecLogEvent& event) const;

private:
    class TargetErrorListener : public HecLogErrorListener {
    public:
        explicit TargetErrorListener(HecLogTarget* target) : m_target(target) {}
        ~TargetErrorListener() final {}

        void onDeliveryError(const HecLogDeliveryError& error) final;

    private:
        HecLogTarget* m_target;
    };

    HecLogTargetConfig m_config;
    HecLogFormatter* m_formatter;
    std::unique_ptr<HecLogHostResolver> m_hostResolver;
    std::unique_ptr<HecLogSender> m_sender;
    TargetErrorListener m_errorListener;

    std::list<std::future<int>> m_pendingSends;
    uint32_t m_failedSends;
    std::mutex m_lock;

    bool sendBatch(std::unique_ptr<HecLogEventBatch> batch, const HecLogCancelToken* cancelToken);
    void reapPendingSends(bool wait);
};

}  // namespace heclog

#endif  // __HECLOG_TARGET_H__
