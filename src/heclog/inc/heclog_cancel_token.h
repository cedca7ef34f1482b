#ifndef __HECLOG_CANCEL_TOKEN_H__
#define __HECLOG_CANCEL_TOKEN_H__

#include <atomic>

#include "heclog_def.h"

namespace heclog {

/**
 * @brief Cooperative cancellation flag. Once cancelled, requests that have not been issued yet are
 * skipped and in-flight requests are aborted.
 */
class HECLOG_API HecLogCancelToken {
public:
    HecLogCancelToken() : m_cancelled(false) {}
    HecLogCancelToken(const HecLogCancelToken&) = delete;
    HecLogCancelToken(HecLogCancelToken&&) = delete;
    HecLogCancelToken& operator=(const HecLogCancelToken&) = delete;
    ~HecLogCancelToken() {}

    /** @brief Signals cancellation. */
    inline void cancel() { m_cancelled.store(true, std::memory_order_release); }

    /** @brief Queries whether cancellation was signaled. */
    inline bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

    /** @brief Clears the cancellation flag (so the token can be reused). */
    inline void reset() { m_cancelled.store(false, std::memory_order_release); }

private:
    std::atomic<bool> m_cancelled;
};

/** @brief Helper for checking an optional cancel token. */
inline bool isCancelled(const HecLogCancelToken* cancelToken) {
    return cancelToken != nullptr && cancelToken->isCancelled();
}

}  // namespace heclog

#endif  // __HECLOG_CANCEL_TOKEN_H__
