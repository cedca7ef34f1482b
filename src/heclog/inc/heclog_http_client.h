#ifndef __HECLOG_HTTP_CLIENT_H__
#define __HECLOG_HTTP_CLIENT_H__

#include <httplib.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "heclog_cancel_token.h"
#include "heclog_def.h"
#include "heclog_http_config.h"

/** @def Interval for checking cancellation of in-flight requests (milliseconds). */
#define HECLOG_HTTP_CANCEL_POLL_MILLIS 20

namespace heclog {

/** @brief An assistant to carry out HTTP client operations. */
class HECLOG_API HecLogHttpClientAssistant {
public:
    virtual ~HecLogHttpClientAssistant() {}
    HecLogHttpClientAssistant(const HecLogHttpClientAssistant&) = delete;
    HecLogHttpClientAssistant(HecLogHttpClientAssistant&&) = delete;
    HecLogHttpClientAssistant& operator=(const HecLogHttpClientAssistant&) = delete;

    /** @brief Embed headers in outgoing HTTP message. */
    virtual void embedHeaders(httplib::Headers& headers) {}

protected:
    HecLogHttpClientAssistant() {}
};

/** @brief The outcome of a single HTTP request. */
struct HECLOG_API HecLogHttpResult {
    /** @brief Specifies whether any response was received from the server. */
    bool m_responded;

    /** @brief The response status (valid only if a response was received). */
    int m_status;

    /** @brief Response reason phrase. */
    std::string m_reason;

    /** @brief Response body. */
    std::string m_body;

    /** @brief Response headers. */
    httplib::Headers m_headers;

    /** @brief Transport error description (valid only if no response was received). */
    std::string m_transportError;

    /** @brief Specifies whether the request was aborted due to cancellation. */
    bool m_cancelled;

    /** @brief Server certificate validation failures that were overridden during the request. */
    std::vector<std::string> m_certificateWarnings;

    HecLogHttpResult() : m_responded(false), m_status(0), m_cancelled(false) {}
};

/**
 * @brief HTTP client used for posting payloads to a single server. The client maintains a pool of
 * underlying connections (bounded by the configured maximum connections per server), so it can be
 * shared by any number of concurrent callers.
 */
class HECLOG_API HecLogHttpClient {
public:
    HecLogHttpClient()
        : m_assistant(nullptr),
          m_maxClients(0),
          m_clientCount(0),
          m_busyCount(0),
          m_watchCount(0),
          m_started(false) {}
    HecLogHttpClient(const HecLogHttpClient&) = delete;
    HecLogHttpClient(HecLogHttpClient&&) = delete;
    HecLogHttpClient& operator=(const HecLogHttpClient&) = delete;
    ~HecLogHttpClient() { stop(); }

    /**
     * @brief Initializes the HTTP client.
     *
     * @param serverAddress The HTTP server address, in the form scheme://host[:port].
     * @param serverName The server name (for logging purposes).
     * @param httpConfig Timeouts, proxy and TLS configuration.
     * @param assistant Optional assistant in carrying out client operations.
     */
    void initialize(const char* serverAddress, const char* serverName,
                    const HecLogHttpConfig& httpConfig,
                    HecLogHttpClientAssistant* assistant = nullptr);

    /** @brief Starts the HTTP client. */
    bool start();

    /**
     * @brief Stops the HTTP client, releasing all connections. Waits for in-flight requests.
     * Requests whose cancel token fires in the meantime are aborted.
     */
    bool stop();

    /**
     * @brief Sends HTTP message to a given endpoint (using HTTP POST).
     *
     * @param endpoint The endpoint. Expected resource path starting with forward slash.
     * @param body The message's body.
     * @param len The message's length.
     * @param contentType The message's content type.
     * @param cancelToken Optional cancellation token.
     * @return The request outcome. This call does not throw.
     */
    HecLogHttpResult post(const char* endpoint, const char* body, size_t len,
                          const char* contentType = "application/json",
                          const HecLogCancelToken* cancelToken = nullptr);

    /** @brief Retrieves the server address. */
    inline const std::string& getServerAddress() const { return m_serverAddress; }

    /** @brief Retrieves the number of connections created so far. */
    size_t getClientCount();

private:
    // a single pooled connection, along with per-request certificate override notes and the
    // cancel token of the request currently using it
    struct PooledClient {
        std::unique_ptr<httplib::Client> m_client;
        std::vector<std::string> m_certificateWarnings;
        const HecLogCancelToken* m_cancelToken;

        PooledClient() : m_cancelToken(nullptr) {}
    };

    std::string m_serverAddress;
    std::string m_serverName;
    std::string m_serverHost;
    HecLogHttpConfig m_config;
    HecLogHttpClientAssistant* m_assistant;

    std::vector<PooledClient*> m_freeClients;
    std::vector<std::unique_ptr<PooledClient>> m_allClients;
    size_t m_maxClients;
    size_t m_clientCount;
    size_t m_busyCount;
    size_t m_watchCount;
    bool m_started;
    std::mutex m_lock;
    std::condition_variable m_cv;
    std::condition_variable m_watchCv;
    std::thread m_cancelWatcher;

    PooledClient* acquireClient(const HecLogCancelToken* cancelToken);
    void releaseClient(PooledClient* pooledClient);

    // expects the lock to be held
    void setCancelToken(PooledClient* pooledClient, const HecLogCancelToken* cancelToken);

    // aborts in-flight requests whose cancel token fired
    void watchCancellation();

    PooledClient* createClient();
    bool configureClient(PooledClient* pooledClient);
    bool configureProxy(httplib::Client* client);
    void configureCertificateOverride(PooledClient* pooledClient);
};

}  // namespace heclog

#endif  // __HECLOG_HTTP_CLIENT_H__
