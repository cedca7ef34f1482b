#ifndef __HECLOG_METADATA_H__
#define __HECLOG_METADATA_H__

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "heclog_def.h"

/** @def The default Splunk source type. */
#define HECLOG_DEFAULT_SOURCETYPE "_json"

/** @def Metadata cache entry count beyond which the cache is cleared entirely. */
#define HECLOG_METADATA_CACHE_LIMIT 1000

namespace heclog {

/**
 * @brief Immutable destination metadata attached to each event. An empty index or source means
 * the field is not set and is omitted from the wire payload.
 */
class HECLOG_API HecLogMetadata {
public:
    HecLogMetadata(const std::string& index, const std::string& source,
                   const std::string& sourceType, const std::string& host)
        : m_index(index), m_source(source), m_sourceType(sourceType), m_host(host) {}

    inline const std::string& getIndex() const { return m_index; }
    inline const std::string& getSource() const { return m_source; }
    inline const std::string& getSourceType() const { return m_sourceType; }
    inline const std::string& getHost() const { return m_host; }

private:
    const std::string m_index;
    const std::string m_source;
    const std::string m_sourceType;
    const std::string m_host;
};

typedef std::shared_ptr<const HecLogMetadata> HecLogMetadataPtr;

/**
 * @brief Resolves the machine identity used as the "host" metadata field. The identity is taken
 * from an ordered chain of lookups, where the first non-empty trimmed result wins. A lookup that
 * throws is treated as empty. When all lookups come up empty, the resolved host is the empty
 * string.
 */
class HECLOG_API HecLogHostResolver {
public:
    /** @typedef A single host-name lookup function. */
    typedef std::function<std::string()> Lookup;

    /** @brief Creates a resolver with the default lookup chain. */
    HecLogHostResolver();

    /** @brief Creates a resolver with a custom lookup chain (name, lookup function). */
    explicit HecLogHostResolver(const std::vector<std::pair<std::string, Lookup>>& lookups)
        : m_lookups(lookups) {}

    HecLogHostResolver(const HecLogHostResolver&) = default;
    ~HecLogHostResolver() {}

    /** @brief Runs the lookup chain and returns the first non-empty result. */
    std::string resolve() const;

    /** @brief Environment variable COMPUTERNAME. */
    static std::string lookupComputerNameEnv();

    /** @brief Environment variable HOSTNAME. */
    static std::string lookupHostNameEnv();

    /** @brief Machine name as reported by the operating system. */
    static std::string lookupMachineName();

    /** @brief Canonical name of the local host as resolved by DNS. */
    static std::string lookupDnsHostName();

private:
    std::vector<std::pair<std::string, Lookup>> m_lookups;
};

/**
 * @brief Memoizes metadata tuples by source. On a cache hit the index and source type arguments
 * are ignored and the first-seen values are returned. The host identity is resolved once, on first
 * use, and fixed afterwards.
 */
class HECLOG_API HecLogMetadataCache {
public:
    HecLogMetadataCache() : m_hostResolved(false) {}
    explicit HecLogMetadataCache(const HecLogHostResolver& hostResolver)
        : m_hostResolver(hostResolver), m_hostResolved(false) {}
    HecLogMetadataCache(const HecLogMetadataCache&) = delete;
    HecLogMetadataCache(HecLogMetadataCache&&) = delete;
    HecLogMetadataCache& operator=(const HecLogMetadataCache&) = delete;
    ~HecLogMetadataCache() {}

    /**
     * @brief Retrieves the metadata for the given source, creating it on first use.
     * @param index The destination index (empty for none).
     * @param source The source label (empty for none). Used as the cache key.
     * @param sourceType The source type. An empty value is replaced with the default "_json".
     */
    HecLogMetadataPtr get(const std::string& index, const std::string& source,
                          const std::string& sourceType);

    /** @brief Retrieves the resolved host identity (resolving it if needed). */
    const std::string& getHostName();

    /** @brief Retrieves the number of cached entries. */
    size_t size();

    /** @brief Drops all cached entries (the resolved host name is kept). */
    void clear();

private:
    HecLogHostResolver m_hostResolver;
    std::string m_hostName;
    bool m_hostResolved;
    std::unordered_map<std::string, HecLogMetadataPtr> m_metadataMap;
    std::mutex m_lock;

    const std::string& resolveHostNameLocked();
};

}  // namespace heclog

#endif  // __HECLOG_METADATA_H__
