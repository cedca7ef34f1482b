#include "heclog_target.h"

#include <exception>

#include "heclog_report.h"

namespace heclog {

HECLOG_DECLARE_REPORT_LOGGER(HecLogTarget)

HecLogTarget::HecLogTarget(const HecLogTargetConfig& config,
                           HecLogFormatter* formatter /* = nullptr */,
                           const HecLogHostResolver* hostResolver /* = nullptr */)
    : m_config(config), m_formatter(formatter), m_errorListener(this), m_failedSends(0) {
    if (hostResolver != nullptr) {
        m_hostResolver.reset(new HecLogHostResolver(*hostResolver));
    }
}

HecLogTarget::~HecLogTarget() {
    if (isStarted()) {
        (void)stop();
    }
}

bool HecLogTarget::start() {
    if (isStarted()) {
        HECLOG_REPORT_ERROR("HecLogTarget(Name=%s): Target already started",
                            m_config.m_name.c_str());
        return false;
    }
    m_sender = HecLogSender::create(m_config.m_senderConfig, m_formatter, m_hostResolver.get());
    if (m_sender == nullptr) {
        HECLOG_REPORT_ERROR("HecLogTarget(Name=%s): Failed to start target, invalid configuration",
                            m_config.m_name.c_str());
        return false;
    }
    m_sender->getErrorReporter().subscribe(&m_errorListener);

    // resolve host identity and default metadata up front
    HecLogMetadataPtr metadata = m_sender->getDefaultMetadata();
    HECLOG_REPORT_TRACE("HecLogTarget(Name=%s): Started, host='%s', sourcetype='%s'",
                        m_config.m_name.c_str(), metadata->getHost().c_str(),
                        metadata->getSourceType().c_str());
    return true;
}

bool HecLogTarget::stop() {
    if (!isStarted()) {
        HECLOG_REPORT_ERROR("HecLogTarget(Name=%s): Target not started", m_config.m_name.c_str());
        return false;
    }
    bool res = flush();
    m_sender->close();
    m_sender.reset();
    HECLOG_REPORT_TRACE("HecLogTarget(Name=%s): Stopped", m_config.m_name.c_str());
    return res;
}

bool HecLogTarget::writeLogEvent(const HecLogEvent& event,
                                 const HecLogCancelToken* cancelToken /* = nullptr */) {
    return writeLogEvents(std::vector<HecLogEvent>(1, event), cancelToken);
}

bool HecLogTarget::writeLogEvents(const std::vector<HecLogEvent>& events,
                                  const HecLogCancelToken* cancelToken /* = nullptr */) {
    if (!isStarted()) {
        HECLOG_REPORT_ERROR(
            "HecLogTarget(Name=%s): Cannot write %zu log events, target not started",
            m_config.m_name.c_str(), events.size());
        return false;
    }

    const HecLogSenderConfig& senderConfig = m_config.m_senderConfig;
    HecLogMetadataCache& metadataCache = m_sender->getMetadataCache();
    std::unique_ptr<HecLogEventBatch> batch = m_sender->startBatch();
    bool allSerialized = true;
    for (const HecLogEvent& event : events) {
        HecLogMetadataPtr metadata = metadataCache.get(senderConfig.m_index, getEventSource(event),
                                                       senderConfig.m_sourceType);
        if (!batch->addEvent(event.m_time, event.m_id, event.m_level, event.m_messageTemplate,
                             event.m_renderedMessage, event.m_exception, buildProperties(event),
                             metadata)) {
            HECLOG_REPORT_ERROR("HecLogTarget(Name=%s): Dropped log event from logger %s",
                                m_config.m_name.c_str(), event.m_loggerName.c_str());
            allSerialized = false;
        }
        if (isCancelled(cancelToken)) {
            HECLOG_REPORT_TRACE("HecLogTarget(Name=%s): Write cancelled, abandoning batch of %u "
                                "events",
                                m_config.m_name.c_str(), batch->getEventCount());
            return false;
        }
    }
    if (batch->getEventCount() == 0) {
        return allSerialized;
    }
    return sendBatch(std::move(batch), cancelToken) && allSerialized;
}

bool HecLogTarget::flush() {
    reapPendingSends(true);
    std::unique_lock<std::mutex> lock(m_lock);
    uint32_t failedSends = m_failedSends;
    m_failedSends = 0;
    if (failedSends > 0) {
        HECLOG_REPORT_TRACE("HecLogTarget(Name=%s): %u batches failed since last flush",
                            m_config.m_name.c_str(), failedSends);
    }
    return failedSends == 0;
}

HecLogJson HecLogTarget::buildProperties(const HecLogEvent& event) const {
    HecLogJson properties = HecLogJson::object();
    if (m_config.m_includeEventProperties && event.m_properties.is_object()) {
        for (const auto& item : event.m_properties.items()) {
            properties[item.key()] = item.value();
        }
    }
    for (const auto& contextProp : m_config.m_contextProperties) {
        properties[contextProp.first] = contextProp.second;
    }
    if (m_config.m_includePositionalParameters) {
        for (size_t i = 0; i < event.m_parameters.size(); ++i) {
            properties["{" + std::to_string(i) + "}"] = event.m_parameters[i];
        }
    }
    if (properties.empty()) {
        return nullptr;
    }
    return properties;
}

std::string HecLogTarget::getEventSource(const HecLogEvent& event) const {
    const std::string& source = m_config.m_senderConfig.m_source;
    if (source.empty() && m_config.m_sourceFromLogger) {
        return event.m_loggerName;
    }
    return source;
}

bool HecLogTarget::sendBatch(std::unique_ptr<HecLogEventBatch> batch,
                             const HecLogCancelToken* cancelToken) {
    if (m_config.m_senderConfig.m_sendMode == HecLogSendMode::SM_SEQUENTIAL) {
        return batch->send(cancelToken) == HECLOG_HTTP_STATUS_OK;
    }

    // parallel mode: dispatch and track, results are collected during flush
    reapPendingSends(false);
    std::shared_ptr<HecLogEventBatch> sharedBatch(batch.release());
    std::future<int> pendingSend;
    try {
        pendingSend = std::async(std::launch::async, [sharedBatch, cancelToken]() {
            return sharedBatch->send(cancelToken);
        });
    } catch (std::exception& e) {
        // could not spawn a thread, so send in the caller's context
        HECLOG_REPORT_WARN("HecLogTarget(Name=%s): Failed to dispatch batch asynchronously (%s), "
                           "sending synchronously",
                           m_config.m_name.c_str(), e.what());
        return sharedBatch->send(cancelToken) == HECLOG_HTTP_STATUS_OK;
    }
    std::unique_lock<std::mutex> lock(m_lock);
    m_pendingSends.push_back(std::move(pendingSend));
    return true;
}

void HecLogTarget::reapPendingSends(bool wait) {
    std::list<std::future<int>> doneSends;
    {
        std::unique_lock<std::mutex> lock(m_lock);
        std::list<std::future<int>>::iterator itr = m_pendingSends.begin();
        while (itr != m_pendingSends.end()) {
            if (wait || itr->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                doneSends.push_back(std::move(*itr));
                itr = m_pendingSends.erase(itr);
            } else {
                ++itr;
            }
        }
    }

    // collect results outside the lock
    uint32_t failedSends = 0;
    for (std::future<int>& doneSend : doneSends) {
        if (doneSend.get() != HECLOG_HTTP_STATUS_OK) {
            ++failedSends;
        }
    }
    std::unique_lock<std::mutex> lock(m_lock);
    m_failedSends += failedSends;
}

void HecLogTarget::TargetErrorListener::onDeliveryError(const HecLogDeliveryError& error) {
    if (error.m_kind == HecLogDeliveryErrorKind::DE_CERTIFICATE_OVERRIDE) {
        HECLOG_REPORT_WARN("HecLogTarget(Name=%s): %s", m_target->m_config.m_name.c_str(),
                           error.m_serverReply.c_str());
        return;
    }
    HECLOG_REPORT_ERROR("HecLogTarget(Name=%s): Failed to send log events to Splunk server '%s' "
                        "(%s)",
                        m_target->m_config.m_name.c_str(),
                        m_target->m_config.m_senderConfig.m_serverUrl.c_str(),
                        error.toString().c_str());
}

}  // namespace heclog
