#ifndef __HECLOG_TEST_COMMON_H__
#define __HECLOG_TEST_COMMON_H__

#include <gtest/gtest.h>
#include <httplib.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "heclog_error_reporter.h"
#include "heclog_event_info.h"
#include "heclog_metadata.h"
#include "heclog_report_handler.h"
#include "heclog_sender.h"

#define TEST_HOST_NAME "test-host"
#define TEST_TOKEN "00000000-0000-0000-0000-000000000000"
#define TEST_CHANNEL "11111111-2222-3333-4444-555555555555"

/** @brief A request received by the fake collector. */
struct RecordedRequest {
    std::string m_method;
    std::string m_path;
    std::string m_body;
    httplib::Headers m_headers;

    std::string getHeader(const char* name) const {
        httplib::Headers::const_iterator itr = m_headers.find(name);
        return itr == m_headers.end() ? "" : itr->second;
    }
};

/**
 * @brief A local fake HTTP Event Collector. Records all requests and replies with a configurable
 * status and body.
 */
class FakeHecServer {
public:
    FakeHecServer()
        : m_port(-1),
          m_status(200),
          m_replyBody(R"({"text":"Success","code":0})"),
          m_delayMillis(0),
          m_stopping(false) {}
    FakeHecServer(const FakeHecServer&) = delete;
    FakeHecServer(FakeHecServer&&) = delete;
    FakeHecServer& operator=(const FakeHecServer&) = delete;
    ~FakeHecServer() { stop(); }

    /** @brief Starts listening on an ephemeral port of the loopback interface. */
    bool start();

    /** @brief Stops the server. */
    void stop();

    inline int getPort() const { return m_port; }

    /** @brief Retrieves the server base URL (http://127.0.0.1:port). */
    std::string getUrl() const;

    /** @brief Sets the reply sent for all following requests. */
    void setReply(int status, const std::string& body);

    /** @brief Delays all following replies (cut short when the server stops). */
    void setReplyDelayMillis(uint32_t delayMillis);

    std::vector<RecordedRequest> getRequests();
    size_t getRequestCount();
    void clearRequests();

    /** @brief Waits until the given number of requests was received. */
    bool waitRequestCount(size_t count, uint32_t timeoutMillis = 5000);

private:
    httplib::Server m_server;
    std::thread m_serverThread;
    int m_port;
    int m_status;
    std::string m_replyBody;
    std::atomic<uint32_t> m_delayMillis;
    bool m_stopping;
    std::vector<RecordedRequest> m_requests;
    std::mutex m_lock;
    std::condition_variable m_cv;

    void handleRequest(const httplib::Request& req, httplib::Response& res);
};

/** @brief Collects delivery errors. */
class RecordingErrorListener : public heclog::HecLogErrorListener {
public:
    RecordingErrorListener() {}
    ~RecordingErrorListener() final {}

    void onDeliveryError(const heclog::HecLogDeliveryError& error) final;

    std::vector<heclog::HecLogDeliveryError> getErrors();
    size_t getErrorCount();

private:
    std::vector<heclog::HecLogDeliveryError> m_errors;
    std::mutex m_lock;
};

/** @brief Collects library reports (installed for the duration of a scope). */
class RecordingReportHandler : public heclog::HecLogReportHandler {
public:
    RecordingReportHandler();
    ~RecordingReportHandler() final;

    void onReport(const heclog::HecLogReportLogger& logger, heclog::HecLogLevel logLevel,
                  const char* file, int line, const char* function, const char* msg) final;

    /** @brief Counts reports at the given level containing the given text. */
    size_t countReports(heclog::HecLogLevel logLevel, const char* text);

private:
    heclog::HecLogReportHandler* m_prevHandler;
    heclog::HecLogLevel m_prevLevel;
    std::vector<std::pair<heclog::HecLogLevel, std::string>> m_reports;
    std::mutex m_lock;
};

/** @brief Host resolver returning a fixed host name. */
extern heclog::HecLogHostResolver makeTestHostResolver(const char* hostName = TEST_HOST_NAME);

/** @brief Builds a sender configuration pointing at the given server URL. */
extern heclog::HecLogSenderConfig makeSenderConfig(const std::string& serverUrl);

/** @brief Splits a newline-delimited payload and parses each record. */
extern std::vector<heclog::HecLogJson> parsePayload(const std::string& payload);

/** @brief Builds a fixed point in time (seconds + millis since the epoch). */
extern heclog::HecLogTime makeTime(int64_t seconds, int64_t millis = 0);

#endif  // __HECLOG_TEST_COMMON_H__
