#include "heclog_test_common.h"

#include <chrono>
#include <sstream>

bool FakeHecServer::start() {
    m_server.Post(R"(/.*)", [this](const httplib::Request& req, httplib::Response& res) {
        handleRequest(req, res);
    });
    m_port = m_server.bind_to_any_port("127.0.0.1");
    if (m_port <= 0) {
        return false;
    }
    m_serverThread = std::thread([this]() { m_server.listen_after_bind(); });
    m_server.wait_until_ready();
    return true;
}

void FakeHecServer::stop() {
    if (m_serverThread.joinable()) {
        {
            std::unique_lock<std::mutex> lock(m_lock);
            m_stopping = true;
            m_cv.notify_all();
        }
        m_server.stop();
        m_serverThread.join();
    }
}

std::string FakeHecServer::getUrl() const { return "http://127.0.0.1:" + std::to_string(m_port); }

void FakeHecServer::setReply(int status, const std::string& body) {
    std::unique_lock<std::mutex> lock(m_lock);
    m_status = status;
    m_replyBody = body;
}

void FakeHecServer::setReplyDelayMillis(uint32_t delayMillis) {
    m_delayMillis.store(delayMillis, std::memory_order_relaxed);
}

std::vector<RecordedRequest> FakeHecServer::getRequests() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_requests;
}

size_t FakeHecServer::getRequestCount() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_requests.size();
}

void FakeHecServer::clearRequests() {
    std::unique_lock<std::mutex> lock(m_lock);
    m_requests.clear();
}

bool FakeHecServer::waitRequestCount(size_t count, uint32_t timeoutMillis /* = 5000 */) {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_cv.wait_for(lock, std::chrono::milliseconds(timeoutMillis),
                         [this, count] { return m_requests.size() >= count; });
}

void FakeHecServer::handleRequest(const httplib::Request& req, httplib::Response& res) {
    uint32_t delayMillis = m_delayMillis.load(std::memory_order_relaxed);
    std::unique_lock<std::mutex> lock(m_lock);
    if (delayMillis > 0) {
        m_cv.wait_for(lock, std::chrono::milliseconds(delayMillis), [this] { return m_stopping; });
    }
    RecordedRequest recordedRequest;
    recordedRequest.m_method = req.method;
    recordedRequest.m_path = req.path;
    recordedRequest.m_body = req.body;
    recordedRequest.m_headers = req.headers;
    m_requests.push_back(recordedRequest);
    res.status = m_status;
    res.set_content(m_replyBody, "application/json");
    m_cv.notify_all();
}

void RecordingErrorListener::onDeliveryError(const heclog::HecLogDeliveryError& error) {
    std::unique_lock<std::mutex> lock(m_lock);
    m_errors.push_back(error);
}

std::vector<heclog::HecLogDeliveryError> RecordingErrorListener::getErrors() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_errors;
}

size_t RecordingErrorListener::getErrorCount() {
    std::unique_lock<std::mutex> lock(m_lock);
    return m_errors.size();
}

RecordingReportHandler::RecordingReportHandler()
    : m_prevHandler(heclog::HecLogReport::getReportHandler()),
      m_prevLevel(heclog::HecLogReport::getReportLevel()) {
    heclog::HecLogReport::setReportHandler(this);
    heclog::HecLogReport::setReportLevel(heclog::HLEVEL_DEBUG);
}

RecordingReportHandler::~RecordingReportHandler() {
    heclog::HecLogReport::setReportLevel(m_prevLevel);
    heclog::HecLogReport::setReportHandler(m_prevHandler);
}

void RecordingReportHandler::onReport(const heclog::HecLogReportLogger& logger,
                                      heclog::HecLogLevel logLevel, const char* file, int line,
                                      const char* function, const char* msg) {
    std::unique_lock<std::mutex> lock(m_lock);
    m_reports.push_back({logLevel, std::string(logger.getName()) + ": " + msg});
}

size_t RecordingReportHandler::countReports(heclog::HecLogLevel logLevel, const char* text) {
    std::unique_lock<std::mutex> lock(m_lock);
    size_t count = 0;
    for (const auto& report : m_reports) {
        if (report.first == logLevel && report.second.find(text) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

heclog::HecLogHostResolver makeTestHostResolver(const char* hostName /* = TEST_HOST_NAME */) {
    std::string host = hostName;
    std::vector<std::pair<std::string, heclog::HecLogHostResolver::Lookup>> lookups;
    lookups.push_back({"test", [host]() { return host; }});
    return heclog::HecLogHostResolver(lookups);
}

heclog::HecLogSenderConfig makeSenderConfig(const std::string& serverUrl) {
    heclog::HecLogSenderConfig config;
    config.m_serverUrl = serverUrl;
    config.m_token = TEST_TOKEN;
    config.m_httpConfig.m_connectTimeoutMillis = 2000;
    config.m_httpConfig.m_readTimeoutMillis = 5000;
    config.m_httpConfig.m_writeTimeoutMillis = 2000;
    return config;
}

std::vector<heclog::HecLogJson> parsePayload(const std::string& payload) {
    std::vector<heclog::HecLogJson> records;
    std::istringstream s(payload);
    std::string line;
    while (std::getline(s, line)) {
        if (!line.empty()) {
            records.push_back(heclog::HecLogJson::parse(line));
        }
    }
    return records;
}

heclog::HecLogTime makeTime(int64_t seconds, int64_t millis /* = 0 */) {
    return heclog::HecLogTime(
        std::chrono::duration_cast<heclog::HecLogTime::duration>(
            std::chrono::milliseconds(seconds * 1000 + millis)));
}
