#include "heclog_error_reporter.h"

#include <algorithm>

#include "heclog_report.h"

namespace heclog {

HECLOG_DECLARE_REPORT_LOGGER(HecLogErrorReporter)

const char* deliveryErrorKindToString(HecLogDeliveryErrorKind kind) {
    switch (kind) {
        case HecLogDeliveryErrorKind::DE_HTTP_STATUS:
            return "HTTP status";
        case HecLogDeliveryErrorKind::DE_TRANSPORT:
            return "transport";
        case HecLogDeliveryErrorKind::DE_CERTIFICATE_OVERRIDE:
            return "certificate override";
        default:
            return "N/A";
    }
}

std::string HecLogDeliveryError::toString() const {
    std::string res = deliveryErrorKindToString(m_kind);
    res += " error, status ";
    res += std::to_string(m_status);
    if (!m_reason.empty()) {
        res += " (" + m_reason + ")";
    }
    if (m_cancelled) {
        res += ", request cancelled";
    }
    if (!m_transportError.empty()) {
        res += ", transport error: " + m_transportError;
    }
    if (!m_serverReply.empty()) {
        res += ", reply: " + m_serverReply;
    }
    return res;
}

void HecLogErrorReporter::subscribe(HecLogErrorListener* listener) {
    if (listener == nullptr) {
        return;
    }
    std::unique_lock<std::mutex> lock(m_lock);
    if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
        m_listeners.push_back(listener);
    }
}

void HecLogErrorReporter::unsubscribe(HecLogErrorListener* listener) {
    std::unique_lock<std::mutex> lock(m_lock);
    m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener),
                      m_listeners.end());
}

void HecLogErrorReporter::clear() {
    std::unique_lock<std::mutex> lock(m_lock);
    m_listeners.clear();
}

size_t HecLogErrorReporter::getListenerCount() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_listeners.size();
}

void HecLogErrorReporter::publish(const HecLogDeliveryError& error) {
    // copy listener list, so that listeners are not invoked while holding the lock
    std::vector<HecLogErrorListener*> listeners;
    {
        std::unique_lock<std::mutex> lock(m_lock);
        listeners = m_listeners;
    }
    if (listeners.empty()) {
        HECLOG_REPORT_TRACE("No error listener subscribed, dropping delivery error: %s",
                            error.toString().c_str());
        return;
    }
    for (HecLogErrorListener* listener : listeners) {
        listener->onDeliveryError(error);
    }
}

}  // namespace heclog
