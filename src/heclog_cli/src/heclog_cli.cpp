#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "heclog_config.h"
#include "heclog_level.h"
#include "heclog_report_handler.h"
#include "heclog_target.h"

#define HECLOG_CLI_VER_MAJOR 0
#define HECLOG_CLI_VER_MINOR 1

#define HECLOG_CLI_LOGGER_NAME "heclog.cli"

// error codes
#define ERR_SEND 1
#define ERR_INIT 2
#define ERR_MISSING_ARG 3
#define ERR_INVALID_ARG 4

static heclog::HecLogReportLogger sLogger("HecLogCli");

#define CLI_REPORT_ERROR(fmt, ...)                                                        \
    heclog::HecLogReport::report(sLogger, heclog::HLEVEL_ERROR, __FILE__, __LINE__, __func__, \
                                 fmt, ##__VA_ARGS__)
#define CLI_REPORT_INFO(fmt, ...)                                                        \
    heclog::HecLogReport::report(sLogger, heclog::HLEVEL_INFO, __FILE__, __LINE__, __func__, \
                                 fmt, ##__VA_ARGS__)

static void printUsage() {
    fprintf(stderr,
            "heclog_cli %d.%d - forward standard input lines to a Splunk HTTP Event Collector\n\n"
            "Usage: heclog_cli [options] <target-cfg>\n\n"
            "  <target-cfg>            splunk://host:port[/base]?token=...&...\n"
            "Options:\n"
            "  -b, --batch N           number of lines sent in each batch (default 1)\n"
            "  -l, --level LEVEL       event level label (default Info)\n"
            "  -r, --report-level LVL  library diagnostics level (FATAL..DEBUG, default WARN)\n"
            "  -h, --help              print this help message\n",
            HECLOG_CLI_VER_MAJOR, HECLOG_CLI_VER_MINOR);
}

static int parseArgs(int argc, char* argv[], std::string& cfg, uint32_t& batchSize,
                     std::string& level) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage();
            exit(0);
        } else if (strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--batch") == 0) {
            if (++i >= argc) {
                CLI_REPORT_ERROR("Missing batch size parameter");
                return ERR_MISSING_ARG;
            }
            char* endPtr = nullptr;
            long value = std::strtol(argv[i], &endPtr, 10);
            if (endPtr == argv[i] || *endPtr != 0 || value <= 0 || value > 100000) {
                CLI_REPORT_ERROR("Invalid batch size parameter: %s", argv[i]);
                return ERR_INVALID_ARG;
            }
            batchSize = (uint32_t)value;
        } else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--level") == 0) {
            if (++i >= argc) {
                CLI_REPORT_ERROR("Missing level parameter");
                return ERR_MISSING_ARG;
            }
            level = argv[i];
        } else if (strcmp(argv[i], "-r") == 0 || strcmp(argv[i], "--report-level") == 0) {
            if (++i >= argc) {
                CLI_REPORT_ERROR("Missing report level parameter");
                return ERR_MISSING_ARG;
            }
            heclog::HecLogLevel reportLevel = heclog::HLEVEL_WARN;
            if (!heclog::heclogLevelFromStr(argv[i], reportLevel)) {
                CLI_REPORT_ERROR("Invalid report level parameter: %s", argv[i]);
                return ERR_INVALID_ARG;
            }
            heclog::HecLogReport::setReportLevel(reportLevel);
        } else if (argv[i][0] == '-') {
            CLI_REPORT_ERROR("Invalid argument: %s", argv[i]);
            return ERR_INVALID_ARG;
        } else if (cfg.empty()) {
            cfg = argv[i];
        } else {
            CLI_REPORT_ERROR("Unexpected argument: %s", argv[i]);
            return ERR_INVALID_ARG;
        }
    }
    if (cfg.empty()) {
        CLI_REPORT_ERROR("Missing target configuration");
        printUsage();
        return ERR_MISSING_ARG;
    }
    return 0;
}

static bool sendLines(heclog::HecLogTarget& target, std::vector<heclog::HecLogEvent>& events) {
    if (events.empty()) {
        return true;
    }
    bool res = target.writeLogEvents(events);
    events.clear();
    return res;
}

int main(int argc, char* argv[]) {
    // environment may only set the initial report level, command line takes precedence
    (void)heclog::HecLogReport::loadReportLevelEnv();

    std::string cfg;
    uint32_t batchSize = 1;
    std::string level = "Info";
    int res = parseArgs(argc, argv, cfg, batchSize, level);
    if (res != 0) {
        return res;
    }

    heclog::HecLogTargetConfig targetConfig;
    targetConfig.m_name = "heclog_cli";
    if (!heclog::HecLogConfigLoader::loadTargetConfig(cfg.c_str(), targetConfig)) {
        CLI_REPORT_ERROR("Failed to load target configuration: %s", cfg.c_str());
        return ERR_INIT;
    }
    heclog::HecLogTarget target(targetConfig);
    if (!target.start()) {
        CLI_REPORT_ERROR("Failed to start collector target");
        return ERR_INIT;
    }

    std::vector<heclog::HecLogEvent> events;
    uint64_t lineCount = 0;
    bool allSent = true;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        heclog::HecLogEvent event;
        event.m_level = level;
        event.m_loggerName = HECLOG_CLI_LOGGER_NAME;
        event.m_renderedMessage = line;
        events.push_back(event);
        ++lineCount;
        if (events.size() >= batchSize && !sendLines(target, events)) {
            allSent = false;
        }
    }
    if (!sendLines(target, events)) {
        allSent = false;
    }
    if (!target.stop()) {
        allSent = false;
    }

    CLI_REPORT_INFO("Forwarded %" PRIu64 " lines (%s)", lineCount,
                    allSent ? "all accepted" : "some failed");
    return allSent ? 0 : ERR_SEND;
}
