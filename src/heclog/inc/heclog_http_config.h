#ifndef __HECLOG_HTTP_CONFIG_H__
#define __HECLOG_HTTP_CONFIG_H__

#include <cstdint>
#include <string>

#include "heclog_def.h"

/** @def By default wait for 5 seconds before declaring connection failure. */
#define HECLOG_HTTP_DEFAULT_CONNECT_TIMEOUT_MILLIS 5000

/** @def By default wait for 5 seconds before declaring write failure. */
#define HECLOG_HTTP_DEFAULT_WRITE_TIMEOUT_MILLIS 5000

/** @def By default wait for 30 seconds before declaring read failure. */
#define HECLOG_HTTP_DEFAULT_READ_TIMEOUT_MILLIS 30000

/** @def Number of connections per server used when none is configured. */
#define HECLOG_HTTP_DEFAULT_MAX_CONNECTIONS 10

namespace heclog {

/** @brief Pack all HTTP transport configuration in one place. */
struct HECLOG_API HecLogHttpConfig {
    /** @brief The timeout for HTTP connect to be declared as failed. */
    uint32_t m_connectTimeoutMillis;

    /** @brief The timeout for HTTP write to be declared as failed. */
    uint32_t m_writeTimeoutMillis;

    /** @brief The timeout for HTTP read to be declared as failed. */
    uint32_t m_readTimeoutMillis;

    /**
     * @brief Specifies whether to send through a proxy. When no explicit proxy URL is given, the
     * proxy is taken from the https_proxy/http_proxy environment variables.
     */
    bool m_useProxy;

    /** @brief Explicit proxy URL (http://host:port). */
    std::string m_proxyUrl;

    /** @brief Proxy basic authentication user (optional). */
    std::string m_proxyUser;

    /** @brief Proxy basic authentication password (optional). */
    std::string m_proxyPassword;

    /**
     * @brief Accept server certificates that fail validation. Each overridden failure is still
     * published as a delivery error.
     */
    bool m_ignoreSslErrors;

    /** @brief Optional CA bundle file used for server certificate validation. */
    std::string m_caCertPath;

    /** @brief Maximum concurrent connections per server (0 selects the default). */
    uint32_t m_maxConnectionsPerServer;

    /** @brief Keep connections alive explicitly, for servers that only speak HTTP/1.0. */
    bool m_useHttpVersion10Hack;

    HecLogHttpConfig()
        : m_connectTimeoutMillis(HECLOG_HTTP_DEFAULT_CONNECT_TIMEOUT_MILLIS),
          m_writeTimeoutMillis(HECLOG_HTTP_DEFAULT_WRITE_TIMEOUT_MILLIS),
          m_readTimeoutMillis(HECLOG_HTTP_DEFAULT_READ_TIMEOUT_MILLIS),
          m_useProxy(false),
          m_ignoreSslErrors(false),
          m_maxConnectionsPerServer(0),
          m_useHttpVersion10Hack(false) {}
};

}  // namespace heclog

#endif  // __HECLOG_HTTP_CONFIG_H__
