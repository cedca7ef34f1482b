#include "heclog_metadata.h"

#include <cstring>
#include <exception>

#ifdef HECLOG_WINDOWS
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <unistd.h>
#endif

#include "heclog_common.h"
#include "heclog_report.h"

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 256
#endif

namespace heclog {

HECLOG_DECLARE_REPORT_LOGGER(HecLogMetadataCache)

HecLogHostResolver::HecLogHostResolver()
    : m_lookups({{"COMPUTERNAME", &HecLogHostResolver::lookupComputerNameEnv},
                 {"HOSTNAME", &HecLogHostResolver::lookupHostNameEnv},
                 {"MachineName", &HecLogHostResolver::lookupMachineName},
                 {"DnsHostName", &HecLogHostResolver::lookupDnsHostName}}) {}

std::string HecLogHostResolver::resolve() const {
    for (const auto& lookup : m_lookups) {
        std::string value;
        try {
            value = trim(lookup.second());
        } catch (std::exception& e) {
            HECLOG_REPORT_WARN("Failed to lookup %s: %s", lookup.first.c_str(), e.what());
            continue;
        }
        if (!value.empty()) {
            HECLOG_REPORT_TRACE("Host name resolved by %s: %s", lookup.first.c_str(),
                                value.c_str());
            return value;
        }
    }
    HECLOG_REPORT_WARN("Could not resolve host name, events will carry an empty host");
    return "";
}

std::string HecLogHostResolver::lookupComputerNameEnv() {
    std::string value;
    (void)heclog_getenv("COMPUTERNAME", value);
    return value;
}

std::string HecLogHostResolver::lookupHostNameEnv() {
    std::string value;
    (void)heclog_getenv("HOSTNAME", value);
    return value;
}

std::string HecLogHostResolver::lookupMachineName() {
#ifdef HECLOG_WINDOWS
    char name[MAX_COMPUTERNAME_LENGTH + 1];
    DWORD len = sizeof(name);
    if (!GetComputerNameA(name, &len)) {
        HECLOG_REPORT_WARN("GetComputerNameA() failed: %lu", GetLastError());
        return "";
    }
    return std::string(name, len);
#else
    struct utsname info;
    if (uname(&info) != 0) {
        HECLOG_REPORT_SYS_ERROR(uname, "Failed to retrieve machine name");
        return "";
    }
    return info.nodename;
#endif
}

std::string HecLogHostResolver::lookupDnsHostName() {
    char name[HOST_NAME_MAX + 1];
    if (gethostname(name, sizeof(name)) != 0) {
        HECLOG_REPORT_SYS_ERROR(gethostname, "Failed to retrieve host name for DNS lookup");
        return "";
    }
    name[HOST_NAME_MAX] = 0;

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_flags = AI_CANONNAME;
    struct addrinfo* addrList = nullptr;
    int res = getaddrinfo(name, nullptr, &hints, &addrList);
    if (res != 0) {
        HECLOG_REPORT_WARN("DNS lookup of host %s failed: %s", name, gai_strerror(res));
        // the host name itself is still the best answer DNS could give
        return name;
    }
    std::string canonName = name;
    if (addrList != nullptr && addrList->ai_canonname != nullptr) {
        canonName = addrList->ai_canonname;
    }
    freeaddrinfo(addrList);
    return canonName;
}

HecLogMetadataPtr HecLogMetadataCache::get(const std::string& index, const std::string& source,
                                           const std::string& sourceType) {
    std::unique_lock<std::mutex> lock(m_lock);
    const std::string& hostName = resolveHostNameLocked();
    auto itr = m_metadataMap.find(source);
    if (itr != m_metadataMap.end()) {
        return itr->second;
    }

    // extreme case that should never happen, distinct sources are normally few
    if (m_metadataMap.size() > HECLOG_METADATA_CACHE_LIMIT) {
        HECLOG_REPORT_NOTICE("Metadata cache exceeded %u entries, clearing",
                             (unsigned)HECLOG_METADATA_CACHE_LIMIT);
        m_metadataMap.clear();
    }
    HecLogMetadataPtr metadata = std::make_shared<const HecLogMetadata>(
        index, source, sourceType.empty() ? HECLOG_DEFAULT_SOURCETYPE : sourceType, hostName);
    m_metadataMap.insert(std::make_pair(source, metadata));
    return metadata;
}

const std::string& HecLogMetadataCache::getHostName() {
    std::unique_lock<std::mutex> lock(m_lock);
    return resolveHostNameLocked();
}

size_t HecLogMetadataCache::size() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_metadataMap.size();
}

void HecLogMetadataCache::clear() {
    std::unique_lock<std::mutex> lock(m_lock);
    m_metadataMap.clear();
}

const std::string& HecLogMetadataCache::resolveHostNameLocked() {
    if (!m_hostResolved) {
        m_hostName = m_hostResolver.resolve();
        m_hostResolved = true;
    }
    return m_hostName;
}

}  // namespace heclog
