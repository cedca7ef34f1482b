#include "heclog_sender.h"

#include <cstring>
#ifndef HECLOG_WINDOWS
#include <strings.h>
#endif

#include "heclog_common.h"
#include "heclog_report.h"

namespace heclog {

HECLOG_DECLARE_REPORT_LOGGER(HecLogSender)

const char* sendModeToString(HecLogSendMode sendMode) {
    switch (sendMode) {
        case HecLogSendMode::SM_PARALLEL:
            return "parallel";
        case HecLogSendMode::SM_SEQUENTIAL:
            return "sequential";
        default:
            return "N/A";
    }
}

bool sendModeFromString(const char* sendModeStr, HecLogSendMode& sendMode) {
    if (strcasecmp(sendModeStr, "parallel") == 0) {
        sendMode = HecLogSendMode::SM_PARALLEL;
    } else if (strcasecmp(sendModeStr, "sequential") == 0) {
        sendMode = HecLogSendMode::SM_SEQUENTIAL;
    } else {
        return false;
    }
    return true;
}

std::unique_ptr<HecLogSender> HecLogSender::create(
    const HecLogSenderConfig& config, HecLogFormatter* formatter /* = nullptr */,
    const HecLogHostResolver* hostResolver /* = nullptr */) {
    if (trim(config.m_serverUrl).empty()) {
        HECLOG_REPORT_ERROR("Cannot create event collector sender: server URL is empty");
        return nullptr;
    }
    if (trim(config.m_token).empty()) {
        HECLOG_REPORT_ERROR("Cannot create event collector sender: token is empty");
        return nullptr;
    }

    std::string serverAddress;
    std::string basePath;
    if (!parseServerUrl(trim(config.m_serverUrl), serverAddress, basePath)) {
        HECLOG_REPORT_ERROR("Cannot create event collector sender: invalid server URL '%s'",
                            config.m_serverUrl.c_str());
        return nullptr;
    }

    std::unique_ptr<HecLogSender> sender(new HecLogSender(
        config, formatter, hostResolver != nullptr ? *hostResolver : HecLogHostResolver()));
    sender->m_serverAddress = serverAddress;
    sender->m_endpoint = basePath + HECLOG_EVENT_ENDPOINT;
    sender->m_httpClient.initialize(serverAddress.c_str(), "Splunk HEC", config.m_httpConfig,
                                    sender.get());
    if (!sender->m_httpClient.start()) {
        HECLOG_REPORT_ERROR("Cannot create event collector sender: failed to start HTTP client");
        return nullptr;
    }
    HECLOG_REPORT_TRACE("Event collector sender created for %s%s (send mode: %s)",
                        serverAddress.c_str(), sender->m_endpoint.c_str(),
                        sendModeToString(config.m_sendMode));
    return sender;
}

HecLogSender::HecLogSender(const HecLogSenderConfig& config, HecLogFormatter* formatter,
                           const HecLogHostResolver& hostResolver)
    : m_config(config),
      m_formatter(formatter),
      m_authHeader("Splunk " + trim(config.m_token)),
      m_metadataCache(hostResolver),
      m_closed(false) {
    if (m_config.m_sourceType.empty()) {
        m_config.m_sourceType = HECLOG_DEFAULT_SOURCETYPE;
    }
}

HecLogSender::~HecLogSender() { close(); }

std::unique_ptr<HecLogEventBatch> HecLogSender::startBatch() {
    return startBatch(getDefaultMetadata());
}

std::unique_ptr<HecLogEventBatch> HecLogSender::startBatch(const HecLogMetadataPtr& metadata) {
    return std::unique_ptr<HecLogEventBatch>(new HecLogEventBatch(
        [this](const std::string& payload, const HecLogCancelToken* cancelToken) {
            return post(payload, cancelToken);
        },
        metadata, m_formatter));
}

HecLogMetadataPtr HecLogSender::getDefaultMetadata() {
    return m_metadataCache.get(m_config.m_index, m_config.m_source, m_config.m_sourceType);
}

int HecLogSender::post(const std::string& payload,
                       const HecLogCancelToken* cancelToken /* = nullptr */) {
    if (isClosed()) {
        HECLOG_REPORT_ERROR("Cannot post %zu bytes: event collector sender is closed",
                            payload.size());
        return HECLOG_HTTP_STATUS_BAD_REQUEST;
    }

    HecLogHttpResult result = m_httpClient.post(m_endpoint.c_str(), payload.data(),
                                                payload.size(), HECLOG_CONTENT_TYPE, cancelToken);

    // certificate failures that were let through are still made visible
    for (const std::string& warning : result.m_certificateWarnings) {
        HecLogDeliveryError error(HecLogDeliveryErrorKind::DE_CERTIFICATE_OVERRIDE,
                                  HECLOG_HTTP_STATUS_NOT_ACCEPTABLE);
        error.m_serverReply = warning;
        publishError(error, payload);
    }

    if (!result.m_responded) {
        HecLogDeliveryError error(HecLogDeliveryErrorKind::DE_TRANSPORT,
                                  HECLOG_HTTP_STATUS_BAD_REQUEST);
        error.m_transportError = result.m_transportError;
        error.m_cancelled = result.m_cancelled;
        publishError(error, payload);
        return HECLOG_HTTP_STATUS_BAD_REQUEST;
    }

    if (result.m_status != HECLOG_HTTP_STATUS_OK) {
        HecLogDeliveryError error(HecLogDeliveryErrorKind::DE_HTTP_STATUS, result.m_status);
        error.m_serverReply = result.m_body;
        error.m_reason = result.m_reason;
        error.m_responseHeaders.insert(result.m_headers.begin(), result.m_headers.end());
        publishError(error, payload);
        return result.m_status;
    }
    return HECLOG_HTTP_STATUS_OK;
}

void HecLogSender::close() {
    bool expected = false;
    if (!m_closed.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    m_httpClient.stop();
    m_errorReporter.clear();
    HECLOG_REPORT_TRACE("Event collector sender for %s closed", m_serverAddress.c_str());
}

void HecLogSender::embedHeaders(httplib::Headers& headers) {
    headers.insert(httplib::Headers::value_type("Authorization", m_authHeader));
    if (!m_config.m_channel.empty()) {
        headers.insert(
            httplib::Headers::value_type("X-Splunk-Request-Channel", m_config.m_channel));
    }
}

bool HecLogSender::parseServerUrl(const std::string& serverUrl, std::string& serverAddress,
                                  std::string& basePath) {
    std::string::size_type schemeEnd = serverUrl.find("://");
    if (schemeEnd == std::string::npos) {
        HECLOG_REPORT_ERROR("Missing scheme in server URL: %s", serverUrl.c_str());
        return false;
    }
    std::string scheme = toLower(serverUrl.substr(0, schemeEnd));
    if (scheme != "http" && scheme != "https") {
        HECLOG_REPORT_ERROR("Unsupported scheme '%s' in server URL: %s", scheme.c_str(),
                            serverUrl.c_str());
        return false;
    }

    std::string::size_type hostPos = schemeEnd + 3;
    std::string::size_type pathPos = serverUrl.find('/', hostPos);
    std::string hostPort = serverUrl.substr(
        hostPos, pathPos == std::string::npos ? std::string::npos : pathPos - hostPos);
    if (hostPort.find_first_of("?#@ ") != std::string::npos) {
        HECLOG_REPORT_ERROR("Invalid host specification '%s' in server URL: %s", hostPort.c_str(),
                            serverUrl.c_str());
        return false;
    }

    // separate port, taking care of IPv6 literals
    std::string host = hostPort;
    std::string::size_type colonPos = hostPort.rfind(':');
    if (colonPos != std::string::npos && hostPort.find(']', colonPos) == std::string::npos) {
        host = hostPort.substr(0, colonPos);
        uint32_t port = 0;
        if (!parseIntProp("port", serverUrl, hostPort.substr(colonPos + 1), port) || port == 0 ||
            port > 65535) {
            HECLOG_REPORT_ERROR("Invalid port in server URL: %s", serverUrl.c_str());
            return false;
        }
    }
    if (host.empty() || host == "[]") {
        HECLOG_REPORT_ERROR("Missing host name in server URL: %s", serverUrl.c_str());
        return false;
    }

    serverAddress = scheme + "://" + hostPort;
    basePath = (pathPos == std::string::npos) ? "" : serverUrl.substr(pathPos);
    while (!basePath.empty() && basePath.back() == '/') {
        basePath.pop_back();
    }
    return true;
}

void HecLogSender::publishError(HecLogDeliveryError& error, const std::string& payload) {
    error.m_serializedEvents = payload;
    HECLOG_REPORT_TRACE("Publishing delivery error: %s", error.toString().c_str());
    m_errorReporter.publish(error);
}

}  // namespace heclog
