#include "heclog_common.h"

#include <cstdlib>
#include <exception>

#include "heclog_report.h"

namespace heclog {

HECLOG_DECLARE_REPORT_LOGGER(HecLogCommon)

bool parseIntProp(const char* propName, const std::string& cfg, const std::string& prop,
                  int32_t& value, bool issueError /* = true */) {
    std::size_t pos = 0;
    try {
        value = std::stoi(prop, &pos);
    } catch (std::exception& e) {
        if (issueError) {
            HECLOG_REPORT_ERROR("Invalid %s value %s: %s (%s)", propName, prop.c_str(),
                                cfg.c_str(), e.what());
        }
        return false;
    }
    if (pos != prop.length()) {
        if (issueError) {
            HECLOG_REPORT_ERROR("Excess characters at %s value %s: %s", propName, prop.c_str(),
                                cfg.c_str());
        }
        return false;
    }
    return true;
}

bool parseIntProp(const char* propName, const std::string& cfg, const std::string& prop,
                  uint32_t& value, bool issueError /* = true */) {
    std::size_t pos = 0;
    unsigned long parsed = 0;
    if (!prop.empty() && prop[0] == '-') {
        if (issueError) {
            HECLOG_REPORT_ERROR("Invalid %s value %s, expecting non-negative integer: %s",
                                propName, prop.c_str(), cfg.c_str());
        }
        return false;
    }
    try {
        parsed = std::stoul(prop, &pos);
    } catch (std::exception& e) {
        if (issueError) {
            HECLOG_REPORT_ERROR("Invalid %s value %s: %s (%s)", propName, prop.c_str(),
                                cfg.c_str(), e.what());
        }
        return false;
    }
    if (pos != prop.length()) {
        if (issueError) {
            HECLOG_REPORT_ERROR("Excess characters at %s value %s: %s", propName, prop.c_str(),
                                cfg.c_str());
        }
        return false;
    }
    if (parsed > UINT32_MAX) {
        if (issueError) {
            HECLOG_REPORT_ERROR("Value of %s out of range: %s (%s)", propName, prop.c_str(),
                                cfg.c_str());
        }
        return false;
    }
    value = (uint32_t)parsed;
    return true;
}

bool parseBoolProp(const char* propName, const std::string& cfg, const std::string& prop,
                   bool& value, bool issueError /* = true */) {
    std::string lowerProp = toLower(prop);
    if (lowerProp.compare("true") == 0 || lowerProp.compare("yes") == 0) {
        value = true;
    } else if (lowerProp.compare("false") == 0 || lowerProp.compare("no") == 0) {
        value = false;
    } else {
        if (issueError) {
            HECLOG_REPORT_ERROR("Invalid boolean property %s value %s: %s", propName,
                                prop.c_str(), cfg.c_str());
        }
        return false;
    }
    return true;
}

bool parseTimeoutProp(const char* propName, const std::string& cfg, const std::string& prop,
                      uint32_t& timeoutMillis, bool issueError /* = true */) {
    std::string numPart = prop;
    uint32_t factor = 1;
    if (prop.size() > 2 && prop.compare(prop.size() - 2, 2, "ms") == 0) {
        numPart = prop.substr(0, prop.size() - 2);
    } else if (prop.size() > 1 && prop.back() == 's') {
        numPart = prop.substr(0, prop.size() - 1);
        factor = 1000;
    }
    uint32_t value = 0;
    if (!parseIntProp(propName, cfg, trim(numPart), value, issueError)) {
        return false;
    }
    if (value > UINT32_MAX / factor) {
        if (issueError) {
            HECLOG_REPORT_ERROR("Timeout %s value too large: %s (%s)", propName, prop.c_str(),
                                cfg.c_str());
        }
        return false;
    }
    timeoutMillis = value * factor;
    return true;
}

bool heclog_getenv(const char* envVarName, std::string& envVarValue) {
#ifdef HECLOG_WINDOWS
    const size_t ENV_BUF_SIZE = 256;
    char envBuf[ENV_BUF_SIZE];
    size_t retSize = 0;
    errno_t res = getenv_s(&retSize, envBuf, ENV_BUF_SIZE, envVarName);
    if (res != 0) {
        HECLOG_REPORT_ERROR("Failed to get environment variable %s, security error %d",
                            envVarName, res);
        return false;
    }
    if (retSize == 0) {
        return false;
    }
    envVarValue = envBuf;
    return true;
#else
    char* envVarValueLocal = getenv(envVarName);
    if (envVarValueLocal == nullptr) {
        return false;
    }
    envVarValue = envVarValueLocal;
    return true;
#endif
}

}  // namespace heclog
