#ifndef __HECLOG_SENDER_H__
#define __HECLOG_SENDER_H__

#include <atomic>
#include <memory>
#include <string>

#include "heclog_cancel_token.h"
#include "heclog_def.h"
#include "heclog_error_reporter.h"
#include "heclog_event_batch.h"
#include "heclog_formatter.h"
#include "heclog_http_client.h"
#include "heclog_http_config.h"
#include "heclog_metadata.h"

/** @def The event collector endpoint, appended to the server base URL. */
#define HECLOG_EVENT_ENDPOINT "/services/collector/event/1.0"

/** @def The content type used for posting event payloads. */
#define HECLOG_CONTENT_TYPE "application/json; charset=utf-8"

namespace heclog {

/** @enum Batch dispatching mode. */
enum class HecLogSendMode : uint32_t {
    /** @var Batches are sent concurrently, with no ordering guarantee between batches. */
    SM_PARALLEL,

    /** @var Each batch is sent and awaited before the next one is started. */
    SM_SEQUENTIAL
};

/** @brief Converts send mode to string. */
extern HECLOG_API const char* sendModeToString(HecLogSendMode sendMode);

/** @brief Parses send mode from string (case-insensitive). */
extern HECLOG_API bool sendModeFromString(const char* sendModeStr, HecLogSendMode& sendMode);

/** @brief Sender configuration. */
struct HECLOG_API HecLogSenderConfig {
    /** @brief The server base URL: http[s]://host[:port][/base]. */
    std::string m_serverUrl;

    /** @brief The collector authentication token. */
    std::string m_token;

    /** @brief Optional data channel identifier (sent as X-Splunk-Request-Channel). */
    std::string m_channel;

    /** @brief Default destination index (empty for none). */
    std::string m_index;

    /** @brief Default source (empty for none). */
    std::string m_source;

    /** @brief Default source type. */
    std::string m_sourceType;

    /** @brief Batch dispatching mode. */
    HecLogSendMode m_sendMode;

    /** @brief HTTP transport configuration. */
    HecLogHttpConfig m_httpConfig;

    HecLogSenderConfig()
        : m_sourceType(HECLOG_DEFAULT_SOURCETYPE), m_sendMode(HecLogSendMode::SM_SEQUENTIAL) {}
};

/**
 * @brief Delivers serialized event payloads to a Splunk HTTP Event Collector. The sender owns the
 * HTTP transport, which is shared by all batches and all concurrent posts.
 *
 * Delivery failures are never raised to the caller of @ref post(). They are published through the
 * error reporter, and a best-effort status code is returned.
 */
class HECLOG_API HecLogSender : public HecLogHttpClientAssistant {
public:
    /**
     * @brief Creates a sender.
     * @param config The sender configuration.
     * @param formatter Optional event format override applied to all batches (not owned).
     * @param hostResolver Optional host resolver used for metadata (default chain if none).
     * @return The sender, or null if the configuration is invalid (the error is reported). No
     * network call is made.
     */
    static std::unique_ptr<HecLogSender> create(const HecLogSenderConfig& config,
                                                HecLogFormatter* formatter = nullptr,
                                                const HecLogHostResolver* hostResolver = nullptr);

    ~HecLogSender() final;

    /** @brief Starts a new batch using the configured default metadata. */
    std::unique_ptr<HecLogEventBatch> startBatch();

    /** @brief Starts a new batch with specific default metadata. */
    std::unique_ptr<HecLogEventBatch> startBatch(const HecLogMetadataPtr& metadata);

    /**
     * @brief Posts a serialized payload to the event collector.
     * @param payload The newline-delimited JSON payload.
     * @param cancelToken Optional cancellation token.
     * @return HTTP 200 on success, the server status on server rejection, or HTTP 400 when no
     * response was obtained. Every failure is published to the error reporter.
     */
    int post(const std::string& payload, const HecLogCancelToken* cancelToken = nullptr);

    /** @brief Closes the sender, releasing the transport and unsubscribing all listeners. */
    void close();

    /** @brief Queries whether the sender was closed. */
    inline bool isClosed() const { return m_closed.load(std::memory_order_acquire); }

    /** @brief Retrieves the delivery failure reporter. */
    inline HecLogErrorReporter& getErrorReporter() { return m_errorReporter; }

    /** @brief Retrieves the metadata cache. */
    inline HecLogMetadataCache& getMetadataCache() { return m_metadataCache; }

    /** @brief Retrieves the configured default metadata. */
    HecLogMetadataPtr getDefaultMetadata();

    /** @brief Retrieves the sender configuration. */
    inline const HecLogSenderConfig& getConfig() const { return m_config; }

    /** @brief Retrieves the full endpoint path used for posting. */
    inline const std::string& getEndpoint() const { return m_endpoint; }

    /** @brief Retrieves the server address (scheme://host[:port]). */
    inline const std::string& getServerAddress() const { return m_serverAddress; }

    void embedHeaders(httplib::Headers& headers) final;

    /**
     * @brief Splits a server URL into server address and endpoint base path.
     * @param serverUrl The URL to parse: http[s]://host[:port][/base].
     * @param[out] serverAddress The scheme://host[:port] part.
     * @param[out] basePath The base path without trailing slash (may be empty).
     * @return True if the URL is valid.
     */
    static bool parseServerUrl(const std::string& serverUrl, std::string& serverAddress,
                               std::string& basePath);

private:
    HecLogSender(const HecLogSenderConfig& config, HecLogFormatter* formatter,
                 const HecLogHostResolver& hostResolver);

    HecLogSenderConfig m_config;
    HecLogFormatter* m_formatter;
    std::string m_serverAddress;
    std::string m_endpoint;
    std::string m_authHeader;
    HecLogHttpClient m_httpClient;
    HecLogErrorReporter m_errorReporter;
    HecLogMetadataCache m_metadataCache;
    std::atomic<bool> m_closed;

    void publishError(HecLogDeliveryError& error, const std::string& payload);
};

}  // namespace heclog

#endif  // __HECLOG_SENDER_H__
