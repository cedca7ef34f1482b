#ifndef __HECLOG_CONFIG_H__
#define __HECLOG_CONFIG_H__

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "heclog_def.h"
#include "heclog_sender.h"

/** @def The URL scheme of a collector target specification. */
#define HECLOG_TARGET_SCHEME "splunk"

namespace heclog {

/** @typedef Ordered list of static context properties (name, value). */
typedef std::vector<std::pair<std::string, std::string>> HecLogContextProps;

/** @brief Collector target configuration. */
struct HECLOG_API HecLogTargetConfig {
    /** @brief The target name (for diagnostics). */
    std::string m_name;

    /** @brief Sender configuration. */
    HecLogSenderConfig m_senderConfig;

    /** @brief Add positional message parameters to event properties, under keys {0}, {1}, ... */
    bool m_includePositionalParameters;

    /** @brief Add the log event's own properties to event properties. */
    bool m_includeEventProperties;

    /** @brief Use the logger name as event source when no source is configured. */
    bool m_sourceFromLogger;

    /** @brief Static context properties attached to every event. */
    HecLogContextProps m_contextProperties;

    HecLogTargetConfig()
        : m_name("splunk"),
          m_includePositionalParameters(false),
          m_includeEventProperties(true),
          m_sourceFromLogger(true) {}
};

/** @brief Loads collector target configuration from a URL-style specification. */
class HECLOG_API HecLogConfigLoader {
public:
    /**
     * @brief Loads target configuration from a specification string of the form:
     *
     * splunk://host[:port][/base]?token=...&channel=...&index=...&source=...&sourcetype=...&
     * ssl=yes/no&ignore_ssl_errors=yes/no&ca_cert_path=...&use_proxy=yes/no&proxy_url=...&
     * proxy_user=...&proxy_password=...&max_connections=N&http10_hack=yes/no&
     * send_mode=parallel/sequential&connect_timeout=...&write_timeout=...&read_timeout=...&
     * positional_params=yes/no&include_properties=yes/no&source_from_logger=yes/no&name=...&
     * ctx.<name>=<value>
     *
     * After parsing, the environment variables HECLOG_TOKEN, HECLOG_SERVER_URL, HECLOG_CHANNEL,
     * HECLOG_INDEX, HECLOG_SOURCE and HECLOG_SOURCETYPE override the loaded values when set and
     * not empty.
     *
     * @param cfg The specification string.
     * @param[out] targetConfig The resulting configuration. Only fields specified in the
     * configuration string are modified.
     * @return The operation result. Errors are reported.
     */
    static bool loadTargetConfig(const char* cfg, HecLogTargetConfig& targetConfig);

    /** @brief Applies environment variable overrides to a loaded configuration. */
    static void applyEnvOverrides(HecLogSenderConfig& senderConfig);

private:
    HecLogConfigLoader() {}
    HecLogConfigLoader(const HecLogConfigLoader&) = delete;
    HecLogConfigLoader(HecLogConfigLoader&&) = delete;
    ~HecLogConfigLoader() {}

    typedef std::map<std::string, std::string> PropertyMap;

    static bool parseTargetUrl(const std::string& cfg, std::string& authorityPath,
                               PropertyMap& props, HecLogContextProps& contextProps);

    static bool loadHttpConfig(const std::string& cfg, PropertyMap& props,
                               HecLogHttpConfig& httpConfig);

    static void getStringProp(PropertyMap& props, const char* propName, std::string& value);
    static bool getBoolProp(const std::string& cfg, PropertyMap& props, const char* propName,
                            bool& value);
    static bool getIntProp(const std::string& cfg, PropertyMap& props, const char* propName,
                           uint32_t& value);
    static bool getTimeoutProp(const std::string& cfg, PropertyMap& props, const char* propName,
                               uint32_t& value);
};

}  // namespace heclog

#endif  // __HECLOG_CONFIG_H__
