#include <cstring>

#include "heclog_common.h"
#include "heclog_config.h"
#include "heclog_report.h"

#ifndef HECLOG_WINDOWS
#include <strings.h>
#endif

#define HECLOG_CONTEXT_PROP_PREFIX "ctx."
#define HECLOG_CONTEXT_PROP_PREFIX_LEN (sizeof(HECLOG_CONTEXT_PROP_PREFIX) - 1)

namespace heclog {

HECLOG_DECLARE_REPORT_LOGGER(HecLogConfigLoader)

bool HecLogConfigLoader::loadTargetConfig(const char* cfg, HecLogTargetConfig& targetConfig) {
    // expected url is as follows:
    // splunk://host:port/base?
    //  token=<token>&
    //  channel=<guid>&
    //  index=<name>&
    //  source=<name>&
    //  sourcetype=<name>&
    //  ssl=yes/no&
    //  ignore_ssl_errors=yes/no&
    //  ca_cert_path=<path>&
    //  use_proxy=yes/no&
    //  proxy_url=http://host:port&
    //  proxy_user=<user>&
    //  proxy_password=<password>&
    //  max_connections=value&
    //  http10_hack=yes/no&
    //  send_mode=parallel/sequential&
    //  connect_timeout=value&
    //  write_timeout=value&
    //  read_timeout=value&
    //  positional_params=yes/no&
    //  include_properties=yes/no&
    //  source_from_logger=yes/no&
    //  name=<target name>&
    //  ctx.<name>=<value>
    if (cfg == nullptr) {
        HECLOG_REPORT_ERROR("Invalid collector target specification: null string");
        return false;
    }
    std::string cfgStr = trim(cfg);
    std::string authorityPath;
    PropertyMap props;
    HecLogContextProps contextProps;
    if (!parseTargetUrl(cfgStr, authorityPath, props, contextProps)) {
        return false;
    }

    HecLogSenderConfig& senderConfig = targetConfig.m_senderConfig;
    bool useSsl = senderConfig.m_serverUrl.compare(0, 8, "https://") == 0;
    if (!getBoolProp(cfgStr, props, "ssl", useSsl)) {
        return false;
    }
    if (!authorityPath.empty()) {
        senderConfig.m_serverUrl = std::string(useSsl ? "https://" : "http://") + authorityPath;
    }

    getStringProp(props, "name", targetConfig.m_name);
    getStringProp(props, "token", senderConfig.m_token);
    getStringProp(props, "channel", senderConfig.m_channel);
    getStringProp(props, "index", senderConfig.m_index);
    getStringProp(props, "source", senderConfig.m_source);
    getStringProp(props, "sourcetype", senderConfig.m_sourceType);

    std::string sendMode;
    getStringProp(props, "send_mode", sendMode);
    if (!sendMode.empty() && !sendModeFromString(sendMode.c_str(), senderConfig.m_sendMode)) {
        HECLOG_REPORT_ERROR(
            "Invalid send_mode value '%s', expecting parallel or sequential (context: %s)",
            sendMode.c_str(), cfgStr.c_str());
        return false;
    }

    if (!loadHttpConfig(cfgStr, props, senderConfig.m_httpConfig)) {
        return false;
    }

    if (!getBoolProp(cfgStr, props, "positional_params",
                     targetConfig.m_includePositionalParameters)) {
        return false;
    }
    if (!getBoolProp(cfgStr, props, "include_properties", targetConfig.m_includeEventProperties)) {
        return false;
    }
    if (!getBoolProp(cfgStr, props, "source_from_logger", targetConfig.m_sourceFromLogger)) {
        return false;
    }
    for (const auto& prop : contextProps) {
        targetConfig.m_contextProperties.push_back(prop);
    }

    // whatever is left was not recognized
    for (const auto& entry : props) {
        HECLOG_REPORT_WARN("Ignoring unknown collector target property '%s' (context: %s)",
                           entry.first.c_str(), cfgStr.c_str());
    }

    applyEnvOverrides(senderConfig);
    return true;
}

void HecLogConfigLoader::applyEnvOverrides(HecLogSenderConfig& senderConfig) {
    struct EnvOverride {
        const char* m_configName;
        std::string* m_value;
    };
    EnvOverride overrides[] = {{"token", &senderConfig.m_token},
                               {"server_url", &senderConfig.m_serverUrl},
                               {"channel", &senderConfig.m_channel},
                               {"index", &senderConfig.m_index},
                               {"source", &senderConfig.m_source},
                               {"sourcetype", &senderConfig.m_sourceType}};
    for (const EnvOverride& envOverride : overrides) {
        std::string value;
        if (getStringEnv(envOverride.m_configName, value)) {
            value = trim(value);
            if (!value.empty()) {
                HECLOG_REPORT_TRACE("Configuration %s overridden from environment",
                                    envOverride.m_configName);
                *envOverride.m_value = value;
            }
        }
    }
}

bool HecLogConfigLoader::parseTargetUrl(const std::string& cfg, std::string& authorityPath,
                                        PropertyMap& props, HecLogContextProps& contextProps) {
    // find scheme separator
    std::string::size_type schemeSepPos = cfg.find("://");
    if (schemeSepPos == std::string::npos) {
        HECLOG_REPORT_ERROR(
            "Invalid collector target specification, missing scheme separator '://': %s",
            cfg.c_str());
        return false;
    }
    std::string scheme = cfg.substr(0, schemeSepPos);
    if (strcasecmp(scheme.c_str(), HECLOG_TARGET_SCHEME) != 0) {
        HECLOG_REPORT_ERROR(
            "Invalid collector target specification, unexpected scheme '%s' (expecting %s): %s",
            scheme.c_str(), HECLOG_TARGET_SCHEME, cfg.c_str());
        return false;
    }

    // parse until first '?'
    std::string::size_type pathPos = schemeSepPos + 3;
    std::string::size_type qmarkPos = cfg.find('?', pathPos);
    authorityPath = (qmarkPos == std::string::npos) ? cfg.substr(pathPos)
                                                    : cfg.substr(pathPos, qmarkPos - pathPos);
    authorityPath = trim(authorityPath);
    if (qmarkPos == std::string::npos) {
        return true;
    }

    // parse properties, separated by ampersand
    std::string::size_type prevPos = qmarkPos + 1;
    std::string::size_type sepPos = cfg.find('&', prevPos);
    do {
        std::string prop = (sepPos == std::string::npos) ? cfg.substr(prevPos)
                                                         : cfg.substr(prevPos, sepPos - prevPos);

        // parse to key=value (could be there is no value specified)
        std::string key = prop;
        std::string value;
        std::string::size_type equalPos = prop.find('=');
        if (equalPos != std::string::npos) {
            key = prop.substr(0, equalPos);
            value = trim(prop.substr(equalPos + 1));
        }
        key = trim(key);
        if (key.compare(0, HECLOG_CONTEXT_PROP_PREFIX_LEN, HECLOG_CONTEXT_PROP_PREFIX) == 0) {
            std::string ctxName = key.substr(HECLOG_CONTEXT_PROP_PREFIX_LEN);
            if (ctxName.empty()) {
                HECLOG_REPORT_ERROR(
                    "Invalid collector target specification, empty context property name: %s",
                    cfg.c_str());
                return false;
            }
            contextProps.push_back({ctxName, value});
        } else if (!key.empty()) {
            // later occurrence overrides earlier one
            props[key] = value;
        }

        // find next token separator
        if (sepPos != std::string::npos) {
            prevPos = sepPos + 1;
            sepPos = cfg.find('&', prevPos);
        } else {
            prevPos = sepPos;
        }
    } while (prevPos != std::string::npos);

    return true;
}

bool HecLogConfigLoader::loadHttpConfig(const std::string& cfg, PropertyMap& props,
                                        HecLogHttpConfig& httpConfig) {
    if (!getTimeoutProp(cfg, props, "connect_timeout", httpConfig.m_connectTimeoutMillis)) {
        return false;
    }
    if (!getTimeoutProp(cfg, props, "write_timeout", httpConfig.m_writeTimeoutMillis)) {
        return false;
    }
    if (!getTimeoutProp(cfg, props, "read_timeout", httpConfig.m_readTimeoutMillis)) {
        return false;
    }
    if (!getBoolProp(cfg, props, "use_proxy", httpConfig.m_useProxy)) {
        return false;
    }
    getStringProp(props, "proxy_url", httpConfig.m_proxyUrl);
    getStringProp(props, "proxy_user", httpConfig.m_proxyUser);
    getStringProp(props, "proxy_password", httpConfig.m_proxyPassword);
    if (!getBoolProp(cfg, props, "ignore_ssl_errors", httpConfig.m_ignoreSslErrors)) {
        return false;
    }
    getStringProp(props, "ca_cert_path", httpConfig.m_caCertPath);
    if (!getIntProp(cfg, props, "max_connections", httpConfig.m_maxConnectionsPerServer)) {
        return false;
    }
    if (!getBoolProp(cfg, props, "http10_hack", httpConfig.m_useHttpVersion10Hack)) {
        return false;
    }
    return true;
}

void HecLogConfigLoader::getStringProp(PropertyMap& props, const char* propName,
                                       std::string& value) {
    PropertyMap::iterator itr = props.find(propName);
    if (itr != props.end()) {
        value = itr->second;
        props.erase(itr);
    }
}

bool HecLogConfigLoader::getBoolProp(const std::string& cfg, PropertyMap& props,
                                     const char* propName, bool& value) {
    PropertyMap::iterator itr = props.find(propName);
    if (itr == props.end()) {
        return true;
    }
    std::string prop = itr->second;
    props.erase(itr);
    return parseBoolProp(propName, cfg, prop, value);
}

bool HecLogConfigLoader::getIntProp(const std::string& cfg, PropertyMap& props,
                                    const char* propName, uint32_t& value) {
    PropertyMap::iterator itr = props.find(propName);
    if (itr == props.end()) {
        return true;
    }
    std::string prop = itr->second;
    props.erase(itr);
    return parseIntProp(propName, cfg, prop, value);
}

bool HecLogConfigLoader::getTimeoutProp(const std::string& cfg, PropertyMap& props,
                                        const char* propName, uint32_t& value) {
    PropertyMap::iterator itr = props.find(propName);
    if (itr == props.end()) {
        return true;
    }
    std::string prop = itr->second;
    props.erase(itr);
    return parseTimeoutProp(propName, cfg, prop, value);
}

}  // namespace heclog
