#ifndef __HECLOG_BATCH_BUFFER_H__
#define __HECLOG_BATCH_BUFFER_H__

#include <cstdint>
#include <cstring>
#include <string>

#include "heclog_def.h"

/** @def The initial capacity of a batch buffer. */
#define HECLOG_BATCH_BUFFER_INIT_SIZE ((uint64_t)4096)

/** @def The maximum size allowed for a single batch payload. */
#define HECLOG_BATCH_BUFFER_MAX_SIZE ((uint64_t)(256 * 1024 * 1024))

namespace heclog {

/**
 * @brief Append-only byte buffer holding the serialized events of a batch. The buffer supports
 * truncation back to a previously recorded offset (used for rolling back a failed serialization).
 * Resetting keeps the allocated memory, so the buffer can be reused across flush cycles.
 */
class HECLOG_API HecLogBatchBuffer {
public:
    HecLogBatchBuffer() : m_buffer(nullptr), m_bufferSize(0), m_offset(0) {}
    HecLogBatchBuffer(const HecLogBatchBuffer&) = delete;
    HecLogBatchBuffer(HecLogBatchBuffer&&) = delete;
    HecLogBatchBuffer& operator=(const HecLogBatchBuffer&) = delete;

    /** @brief Destructor (releases memory). */
    ~HecLogBatchBuffer() { release(); }

    /** @brief Returns a reference to the internal buffer (may be null if nothing was written). */
    inline const char* getRef() const { return m_buffer; }

    /** @brief Retrieves the current capacity of the buffer. */
    inline uint64_t size() const { return m_bufferSize; }

    /** @brief Retrieves the number of bytes written so far. */
    inline uint64_t getOffset() const { return m_offset; }

    /** @brief Queries whether the buffer holds no data. */
    inline bool empty() const { return m_offset == 0; }

    /**
     * @brief Increases the current capacity of the buffer. If the buffer's size is already
     * greater than the required size then no action takes place.
     * @param newSize The required new size.
     * @return true If operation succeeded, otherwise false.
     */
    bool resize(uint64_t newSize);

    /** @brief Appends raw data to the buffer. */
    bool append(const char* data, size_t len);

    /** @brief Appends a string to the buffer (without terminating null). */
    inline bool append(const std::string& str) { return append(str.data(), str.size()); }

    /** @brief Appends a single character to the buffer. */
    inline bool append(char c) { return append(&c, 1); }

    /**
     * @brief Truncates the buffer back to a previously recorded offset. Offsets beyond the current
     * offset are ignored.
     */
    inline void truncate(uint64_t offset) {
        if (offset < m_offset) {
            m_offset = offset;
        }
    }

    /** @brief Copies the buffer contents into a string. */
    inline std::string toString() const {
        return m_offset == 0 ? std::string() : std::string(m_buffer, (size_t)m_offset);
    }

    /** @brief Empties the buffer, keeping allocated memory for reuse. */
    inline void reset() { m_offset = 0; }

    /** @brief Empties the buffer and releases allocated memory. */
    void release();

private:
    char* m_buffer;
    uint64_t m_bufferSize;
    uint64_t m_offset;
};

}  // namespace heclog

#endif  // __HECLOG_BATCH_BUFFER_H__
