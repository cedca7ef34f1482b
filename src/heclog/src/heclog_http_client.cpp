#include "heclog_http_client.h"

#include <chrono>
#include <exception>

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#endif

#include "heclog_common.h"
#include "heclog_report.h"

namespace heclog {

HECLOG_DECLARE_REPORT_LOGGER(HecLogHttpClient)

// extracts host name from scheme://host[:port][/path]
static std::string extractHost(const std::string& address) {
    std::string::size_type hostPos = address.find("://");
    hostPos = (hostPos == std::string::npos) ? 0 : hostPos + 3;
    std::string::size_type endPos = address.find_first_of(":/", hostPos);
    if (address.compare(hostPos, 1, "[") == 0) {
        // IPv6 literal
        std::string::size_type closePos = address.find(']', hostPos);
        if (closePos != std::string::npos) {
            return address.substr(hostPos + 1, closePos - hostPos - 1);
        }
    }
    return address.substr(hostPos, endPos == std::string::npos ? endPos : endPos - hostPos);
}

void HecLogHttpClient::initialize(const char* serverAddress, const char* serverName,
                                  const HecLogHttpConfig& httpConfig,
                                  HecLogHttpClientAssistant* assistant /* = nullptr */) {
    // save configuration
    m_serverAddress = serverAddress;
    m_serverName = serverName;
    m_serverHost = extractHost(m_serverAddress);
    m_config = httpConfig;
    m_assistant = assistant;
    m_maxClients = m_config.m_maxConnectionsPerServer > 0 ? m_config.m_maxConnectionsPerServer
                                                          : HECLOG_HTTP_DEFAULT_MAX_CONNECTIONS;
}

bool HecLogHttpClient::start() {
    std::unique_lock<std::mutex> lock(m_lock);
    if (m_started) {
        HECLOG_REPORT_ERROR("HTTP client to %s server already started", m_serverName.c_str());
        return false;
    }
    m_started = true;
    m_cancelWatcher = std::thread(&HecLogHttpClient::watchCancellation, this);
    HECLOG_REPORT_TRACE("HTTP client to %s server at %s started (max connections: %zu)",
                        m_serverName.c_str(), m_serverAddress.c_str(), m_maxClients);
    return true;
}

bool HecLogHttpClient::stop() {
    {
        std::unique_lock<std::mutex> lock(m_lock);
        if (!m_started && m_allClients.empty() && !m_cancelWatcher.joinable()) {
            return true;
        }
        m_started = false;
        m_cv.notify_all();
        m_watchCv.notify_all();

        // wait for all in-flight requests to return their connection
        m_cv.wait(lock, [this] { return m_busyCount == 0; });
        m_freeClients.clear();
        m_allClients.clear();
        m_clientCount = 0;
    }
    if (m_cancelWatcher.joinable()) {
        m_cancelWatcher.join();
    }
    HECLOG_REPORT_TRACE("HTTP client to %s server stopped", m_serverName.c_str());
    return true;
}

size_t HecLogHttpClient::getClientCount() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_clientCount;
}

HecLogHttpResult HecLogHttpClient::post(const char* endpoint, const char* body, size_t len,
                                        const char* contentType /* = "application/json" */,
                                        const HecLogCancelToken* cancelToken /* = nullptr */) {
    HecLogHttpResult result;
    if (isCancelled(cancelToken)) {
        result.m_cancelled = true;
        result.m_transportError = "Request cancelled before it was issued";
        return result;
    }

    PooledClient* pooledClient = acquireClient(cancelToken);
    if (pooledClient == nullptr) {
        result.m_transportError = "HTTP client is not available";
        return result;
    }
    pooledClient->m_certificateWarnings.clear();

    // prepare request
    HECLOG_REPORT_TRACE("POST log data to %s at HTTP address/endpoint: %s%s", m_serverName.c_str(),
                        m_serverAddress.c_str(), endpoint);
    httplib::Request req;
    req.method = "POST";
    req.path = endpoint;
    if (m_assistant != nullptr) {
        m_assistant->embedHeaders(req.headers);
    }
    if (m_config.m_useHttpVersion10Hack) {
        req.headers.insert(httplib::Headers::value_type("Connection", "keep-alive"));
    }
    req.headers.insert(httplib::Headers::value_type("Content-Type", contentType));
    req.body.assign(body, len);
    req.progress = [cancelToken](uint64_t, uint64_t) { return !isCancelled(cancelToken); };

    // send and collect outcome
    try {
        httplib::Result res = pooledClient->m_client->send(req);
        if (res) {
            result.m_responded = true;
            result.m_status = res->status;
            result.m_reason = res->reason;
            result.m_body = res->body;
            result.m_headers = res->headers;
            HECLOG_REPORT_TRACE("%s server returned HTTP status: %d", m_serverName.c_str(),
                                res->status);
        } else {
            result.m_transportError = httplib::to_string(res.error());
            result.m_cancelled = (res.error() == httplib::Error::Canceled);
            HECLOG_REPORT_TRACE("Failed to POST HTTP request to %s: %s", m_serverName.c_str(),
                                result.m_transportError.c_str());
        }
    } catch (std::exception& e) {
        result.m_transportError = e.what();
        HECLOG_REPORT_TRACE("HTTP request to %s failed with exception: %s", m_serverName.c_str(),
                            e.what());
    }
    if (!result.m_responded && isCancelled(cancelToken)) {
        result.m_cancelled = true;
    }
    result.m_certificateWarnings.swap(pooledClient->m_certificateWarnings);
    releaseClient(pooledClient);
    return result;
}

HecLogHttpClient::PooledClient* HecLogHttpClient::acquireClient(
    const HecLogCancelToken* cancelToken) {
    {
        std::unique_lock<std::mutex> lock(m_lock);
        m_cv.wait(lock, [this] {
            return !m_started || !m_freeClients.empty() || m_clientCount < m_maxClients;
        });
        if (!m_started) {
            HECLOG_REPORT_ERROR("Cannot send HTTP request to %s server: client is not started",
                                m_serverName.c_str());
            return nullptr;
        }
        if (!m_freeClients.empty()) {
            PooledClient* pooledClient = m_freeClients.back();
            m_freeClients.pop_back();
            ++m_busyCount;
            setCancelToken(pooledClient, cancelToken);
            return pooledClient;
        }

        // reserve a slot for a new connection, and build it outside the lock
        ++m_clientCount;
        ++m_busyCount;
    }

    PooledClient* pooledClient = createClient();
    std::unique_lock<std::mutex> lock(m_lock);
    if (pooledClient == nullptr) {
        --m_clientCount;
        --m_busyCount;
        m_cv.notify_all();
        return nullptr;
    }
    m_allClients.emplace_back(pooledClient);
    setCancelToken(pooledClient, cancelToken);
    return pooledClient;
}

void HecLogHttpClient::releaseClient(PooledClient* pooledClient) {
    std::unique_lock<std::mutex> lock(m_lock);
    setCancelToken(pooledClient, nullptr);
    m_freeClients.push_back(pooledClient);
    --m_busyCount;
    m_cv.notify_all();
    m_watchCv.notify_all();
}

void HecLogHttpClient::setCancelToken(PooledClient* pooledClient,
                                      const HecLogCancelToken* cancelToken) {
    if (pooledClient->m_cancelToken != nullptr) {
        --m_watchCount;
    }
    pooledClient->m_cancelToken = cancelToken;
    if (cancelToken != nullptr) {
        ++m_watchCount;
        m_watchCv.notify_all();
    }
}

void HecLogHttpClient::watchCancellation() {
    std::unique_lock<std::mutex> lock(m_lock);
    while (m_started || m_busyCount > 0) {
        if (m_watchCount == 0) {
            m_watchCv.wait(lock, [this] {
                return m_watchCount > 0 || (!m_started && m_busyCount == 0);
            });
            continue;
        }
        m_watchCv.wait_for(lock, std::chrono::milliseconds(HECLOG_HTTP_CANCEL_POLL_MILLIS));
        for (const std::unique_ptr<PooledClient>& pooledClient : m_allClients) {
            if (isCancelled(pooledClient->m_cancelToken)) {
                // shuts down the socket, so a pending read or write fails right away
                HECLOG_REPORT_TRACE("Aborting cancelled HTTP request to %s server",
                                    m_serverName.c_str());
                pooledClient->m_client->stop();
            }
        }
    }
}

HecLogHttpClient::PooledClient* HecLogHttpClient::createClient() {
    HECLOG_REPORT_TRACE("Creating HTTP client to %s server at: %s", m_serverName.c_str(),
                        m_serverAddress.c_str());
    std::unique_ptr<PooledClient> pooledClient(new PooledClient());
    bool configured = false;
    try {
        pooledClient->m_client.reset(new httplib::Client(m_serverAddress));
        configured = pooledClient->m_client->is_valid() && configureClient(pooledClient.get());
    } catch (std::exception& e) {
        HECLOG_REPORT_WARN("Failed to build HTTP transport to %s server at %s: %s",
                           m_serverName.c_str(), m_serverAddress.c_str(), e.what());
    }

    if (!configured) {
        // fall back to a default transport
        HECLOG_REPORT_WARN("Using default HTTP transport to %s server at %s",
                           m_serverName.c_str(), m_serverAddress.c_str());
        try {
            pooledClient->m_client.reset(new httplib::Client(m_serverAddress));
        } catch (std::exception& e) {
            HECLOG_REPORT_ERROR("Failed to create HTTP client to %s server at %s: %s",
                                m_serverName.c_str(), m_serverAddress.c_str(), e.what());
            return nullptr;
        }
        if (!pooledClient->m_client->is_valid()) {
            HECLOG_REPORT_ERROR("HTTP connection to %s server at %s is not valid",
                                m_serverName.c_str(), m_serverAddress.c_str());
            return nullptr;
        }
    }
    HECLOG_REPORT_TRACE("%s HTTP client created", m_serverName.c_str());
    return pooledClient.release();
}

bool HecLogHttpClient::configureClient(PooledClient* pooledClient) {
    httplib::Client* client = pooledClient->m_client.get();

    // set connection timeouts
    client->set_connection_timeout(std::chrono::milliseconds(m_config.m_connectTimeoutMillis));
    client->set_write_timeout(std::chrono::milliseconds(m_config.m_writeTimeoutMillis));
    client->set_read_timeout(std::chrono::milliseconds(m_config.m_readTimeoutMillis));

    // servers speaking HTTP/1.0 close the connection unless asked explicitly to keep it
    if (m_config.m_useHttpVersion10Hack) {
        client->set_keep_alive(true);
    }

    if (m_config.m_useProxy && !configureProxy(client)) {
        return false;
    }

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (m_serverAddress.compare(0, 8, "https://") == 0) {
        client->enable_server_certificate_verification(true);
        if (!m_config.m_caCertPath.empty()) {
            client->set_ca_cert_path(m_config.m_caCertPath.c_str());
        }
        if (m_config.m_ignoreSslErrors) {
            configureCertificateOverride(pooledClient);
        }
    }
#endif
    return true;
}

bool HecLogHttpClient::configureProxy(httplib::Client* client) {
    std::string proxyUrl = m_config.m_proxyUrl;
    if (proxyUrl.empty()) {
        // take system proxy settings
        const char* envNames[] = {"https_proxy", "HTTPS_PROXY", "http_proxy", "HTTP_PROXY"};
        for (const char* envName : envNames) {
            if (heclog_getenv(envName, proxyUrl) && !proxyUrl.empty()) {
                break;
            }
        }
        if (proxyUrl.empty()) {
            HECLOG_REPORT_TRACE("No system proxy defined, connecting directly to %s server",
                                m_serverName.c_str());
            return true;
        }
    }

    // parse [scheme://][user:password@]host[:port][/]
    std::string hostPort = proxyUrl;
    std::string::size_type schemePos = hostPort.find("://");
    if (schemePos != std::string::npos) {
        hostPort = hostPort.substr(schemePos + 3);
    }
    std::string proxyUser = m_config.m_proxyUser;
    std::string proxyPassword = m_config.m_proxyPassword;
    std::string::size_type atPos = hostPort.rfind('@');
    if (atPos != std::string::npos) {
        std::string userInfo = hostPort.substr(0, atPos);
        hostPort = hostPort.substr(atPos + 1);
        if (proxyUser.empty()) {
            std::string::size_type colonPos = userInfo.find(':');
            proxyUser = userInfo.substr(0, colonPos);
            if (colonPos != std::string::npos) {
                proxyPassword = userInfo.substr(colonPos + 1);
            }
        }
    }
    std::string::size_type slashPos = hostPort.find('/');
    if (slashPos != std::string::npos) {
        hostPort = hostPort.substr(0, slashPos);
    }
    std::string proxyHost = hostPort;
    int proxyPort = 80;
    std::string::size_type colonPos = hostPort.rfind(':');
    if (colonPos != std::string::npos && hostPort.find(']', colonPos) == std::string::npos) {
        proxyHost = hostPort.substr(0, colonPos);
        if (!parseIntProp("proxy port", proxyUrl, hostPort.substr(colonPos + 1), proxyPort)) {
            HECLOG_REPORT_ERROR("Invalid proxy URL: %s", proxyUrl.c_str());
            return false;
        }
    }
    if (proxyHost.empty()) {
        HECLOG_REPORT_ERROR("Invalid proxy URL, missing host name: %s", proxyUrl.c_str());
        return false;
    }

    client->set_proxy(proxyHost, proxyPort);
    if (!proxyUser.empty()) {
        client->set_proxy_basic_auth(proxyUser, proxyPassword);
    }
    HECLOG_REPORT_TRACE("Sending to %s server via proxy %s:%d", m_serverName.c_str(),
                        proxyHost.c_str(), proxyPort);
    return true;
}

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
static std::string getX509Name(X509_NAME* name) {
    if (name == nullptr) {
        return "";
    }
    char buf[512];
    X509_NAME_oneline(name, buf, sizeof(buf));
    return buf;
}
#endif

void HecLogHttpClient::configureCertificateOverride(PooledClient* pooledClient) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    std::string serverHost = m_serverHost;
    pooledClient->m_client->set_server_certificate_verifier(
        [pooledClient, serverHost](SSL* ssl) -> httplib::SSLVerifierResponse {
            std::string errors;
            std::string subject;
            std::string issuer;
            X509* cert = SSL_get_peer_certificate(ssl);
            if (cert == nullptr) {
                errors = "RemoteCertificateNotAvailable";
            } else {
                subject = getX509Name(X509_get_subject_name(cert));
                issuer = getX509Name(X509_get_issuer_name(cert));
                long verifyResult = SSL_get_verify_result(ssl);
                if (verifyResult != X509_V_OK) {
                    errors = std::string("RemoteCertificateChainErrors (") +
                             X509_verify_cert_error_string(verifyResult) + ")";
                }
                int nameMatch = X509_check_ip_asc(cert, serverHost.c_str(), 0);
                if (nameMatch == -2) {
                    // not an IP address
                    nameMatch =
                        X509_check_host(cert, serverHost.c_str(), serverHost.size(), 0, nullptr);
                }
                if (nameMatch != 1) {
                    if (!errors.empty()) {
                        errors += ", ";
                    }
                    errors += "RemoteCertificateNameMismatch";
                }
                X509_free(cert);
            }
            if (!errors.empty()) {
                std::string warning =
                    "The following certificate errors were encountered when establishing the "
                    "HTTPS connection to the server: " +
                    errors + ", Certificate subject: " + subject +
                    ", Certificate issuer: " + issuer;
                HECLOG_REPORT_TRACE("Overriding certificate validation failure: %s",
                                    warning.c_str());
                pooledClient->m_certificateWarnings.push_back(warning);
            }
            return httplib::SSLVerifierResponse::CertificateAccepted;
        });
#else
    HECLOG_REPORT_WARN("TLS support is not available, ignoring certificate override for %s server",
                       m_serverName.c_str());
#endif
}

}  // namespace heclog
