#ifndef __HECLOG_DELIVERY_ERROR_H__
#define __HECLOG_DELIVERY_ERROR_H__

#include <map>
#include <string>

#include "heclog_def.h"

namespace heclog {

/** @enum Delivery failure classification. */
enum class HecLogDeliveryErrorKind : uint32_t {
    /** @var The server replied with a status other than 200 OK. */
    DE_HTTP_STATUS,

    /** @var No response was obtained (DNS, connect, TLS, I/O failure or cancellation). */
    DE_TRANSPORT,

    /** @var Server certificate errors were encountered but overridden by configuration. */
    DE_CERTIFICATE_OVERRIDE
};

/** @brief Converts delivery error kind to string. */
extern HECLOG_API const char* deliveryErrorKindToString(HecLogDeliveryErrorKind kind);

/**
 * @brief Describes a single delivery failure. Delivery failures are never thrown, they are
 * published to error listeners (see @ref HecLogErrorReporter).
 */
struct HECLOG_API HecLogDeliveryError {
    /** @brief Failure classification. */
    HecLogDeliveryErrorKind m_kind;

    /** @brief The HTTP status code (server status, or best-effort status for other failures). */
    int m_status;

    /** @brief Server reply text (response body), or a descriptive warning text. */
    std::string m_serverReply;

    /** @brief The HTTP reason phrase of the response (if any). */
    std::string m_reason;

    /** @brief Response headers (if a response was received). */
    std::multimap<std::string, std::string> m_responseHeaders;

    /** @brief Description of the underlying transport error (transport failures only). */
    std::string m_transportError;

    /** @brief Specifies whether the request was aborted by cancellation. */
    bool m_cancelled;

    /** @brief The UTF-8 payload that failed to be delivered (for diagnostics or replay). */
    std::string m_serializedEvents;

    HecLogDeliveryError(HecLogDeliveryErrorKind kind = HecLogDeliveryErrorKind::DE_HTTP_STATUS,
                        int status = 0)
        : m_kind(kind), m_status(status), m_cancelled(false) {}

    /** @brief Formats a one-line description of the failure (excluding the payload). */
    std::string toString() const;
};

}  // namespace heclog

#endif  // __HECLOG_DELIVERY_ERROR_H__
