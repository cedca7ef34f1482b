#include "heclog_batch_buffer.h"

#include <cinttypes>
#include <cstdlib>

#include "heclog_report.h"

namespace heclog {

HECLOG_DECLARE_REPORT_LOGGER(HecLogBatchBuffer)

bool HecLogBatchBuffer::resize(uint64_t newSize) {
    if (m_bufferSize >= newSize) {
        return true;
    }
    if (newSize > HECLOG_BATCH_BUFFER_MAX_SIZE) {
        HECLOG_REPORT_ERROR("Cannot resize batch buffer to size %" PRIu64
                            ", exceeding maximum allowed %" PRIu64,
                            newSize, HECLOG_BATCH_BUFFER_MAX_SIZE);
        return false;
    }

    // allocate a bit more so we avoid another realloc and copy if possible
    uint64_t actualNewSize = m_bufferSize > 0 ? m_bufferSize : HECLOG_BATCH_BUFFER_INIT_SIZE;
    while (actualNewSize < newSize) {
        actualNewSize *= 2;
    }
    if (actualNewSize > HECLOG_BATCH_BUFFER_MAX_SIZE) {
        actualNewSize = HECLOG_BATCH_BUFFER_MAX_SIZE;
    }
    char* newBuffer = (char*)realloc(m_buffer, (size_t)actualNewSize);
    if (newBuffer == nullptr) {
        HECLOG_REPORT_ERROR("Failed to allocate %" PRIu64 " bytes for batch buffer, out of memory",
                            actualNewSize);
        return false;
    }
    m_buffer = newBuffer;
    m_bufferSize = actualNewSize;
    return true;
}

bool HecLogBatchBuffer::append(const char* data, size_t len) {
    if (len == 0) {
        return true;
    }
    if (m_bufferSize - m_offset < len && !resize(m_offset + len)) {
        return false;
    }
    memcpy(m_buffer + m_offset, data, len);
    m_offset += len;
    return true;
}

void HecLogBatchBuffer::release() {
    if (m_buffer != nullptr) {
        free(m_buffer);
        m_buffer = nullptr;
    }
    m_bufferSize = 0;
    m_offset = 0;
}

}  // namespace heclog
