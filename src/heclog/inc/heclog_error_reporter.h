#ifndef __HECLOG_ERROR_REPORTER_H__
#define __HECLOG_ERROR_REPORTER_H__

#include <mutex>
#include <vector>

#include "heclog_def.h"
#include "heclog_delivery_error.h"

namespace heclog {

/** @brief Receives delivery failure notifications. */
class HECLOG_API HecLogErrorListener {
public:
    HecLogErrorListener(const HecLogErrorListener&) = delete;
    HecLogErrorListener(HecLogErrorListener&&) = delete;
    HecLogErrorListener& operator=(const HecLogErrorListener&) = delete;
    virtual ~HecLogErrorListener() {}

    /**
     * @brief Notifies of a delivery failure. Called on the thread that attempted delivery.
     * @note Implementations must not throw, and must not subscribe or unsubscribe listeners of the
     * notifying reporter from within this call.
     */
    virtual void onDeliveryError(const HecLogDeliveryError& error) = 0;

protected:
    HecLogErrorListener() {}
};

/**
 * @brief Fan-out notification point for delivery failures.
 *
 * Failures are announced to all subscribed listeners, in subscription order. When no listener is
 * subscribed, failures are dropped silently (only a trace report is issued). This is deliberate:
 * delivery failures are never raised to the caller, so a host that wants to see them must
 * subscribe.
 */
class HECLOG_API HecLogErrorReporter {
public:
    HecLogErrorReporter() {}
    HecLogErrorReporter(const HecLogErrorReporter&) = delete;
    HecLogErrorReporter(HecLogErrorReporter&&) = delete;
    HecLogErrorReporter& operator=(const HecLogErrorReporter&) = delete;
    ~HecLogErrorReporter() {}

    /** @brief Subscribes a listener (not owned). Duplicate subscriptions are ignored. */
    void subscribe(HecLogErrorListener* listener);

    /** @brief Unsubscribes a listener. */
    void unsubscribe(HecLogErrorListener* listener);

    /** @brief Removes all listeners. */
    void clear();

    /** @brief Retrieves the number of subscribed listeners. */
    size_t getListenerCount();

    /** @brief Publishes a delivery failure to all listeners. */
    void publish(const HecLogDeliveryError& error);

private:
    std::vector<HecLogErrorListener*> m_listeners;
    std::mutex m_lock;
};

}  // namespace heclog

#endif  // __HECLOG_ERROR_REPORTER_H__
