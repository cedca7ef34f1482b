#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "heclog_sender.h"
#include "heclog_test_common.h"

using heclog::HecLogDeliveryError;
using heclog::HecLogDeliveryErrorKind;
using heclog::HecLogSender;
using heclog::HecLogSenderConfig;

// fixture running a fake collector for each test
class HecLogSenderTest : public testing::Test {
protected:
    FakeHecServer m_server;
    heclog::HecLogHostResolver m_hostResolver;

    HecLogSenderTest() : m_hostResolver(makeTestHostResolver()) {}

    void SetUp() override { ASSERT_TRUE(m_server.start()); }
    void TearDown() override { m_server.stop(); }

    std::unique_ptr<HecLogSender> createSender(const HecLogSenderConfig& config) {
        return HecLogSender::create(config, nullptr, &m_hostResolver);
    }

    std::unique_ptr<HecLogSender> createSender() {
        return createSender(makeSenderConfig(m_server.getUrl()));
    }
};

TEST(HecLogSenderUrl, ParseServerUrl) {
    std::string serverAddress;
    std::string basePath;
    EXPECT_TRUE(HecLogSender::parseServerUrl("http://host:8088", serverAddress, basePath));
    EXPECT_EQ(serverAddress, "http://host:8088");
    EXPECT_EQ(basePath, "");

    EXPECT_TRUE(HecLogSender::parseServerUrl("HTTPS://host/base/path//", serverAddress, basePath));
    EXPECT_EQ(serverAddress, "https://host");
    EXPECT_EQ(basePath, "/base/path");

    EXPECT_TRUE(HecLogSender::parseServerUrl("http://[::1]:8088/hec", serverAddress, basePath));
    EXPECT_EQ(serverAddress, "http://[::1]:8088");
    EXPECT_EQ(basePath, "/hec");
}

TEST(HecLogSenderUrl, InvalidServerUrl) {
    RecordingReportHandler reportHandler;
    std::string serverAddress;
    std::string basePath;
    EXPECT_FALSE(HecLogSender::parseServerUrl("host:8088", serverAddress, basePath));
    EXPECT_FALSE(HecLogSender::parseServerUrl("ftp://host:8088", serverAddress, basePath));
    EXPECT_FALSE(HecLogSender::parseServerUrl("http://:8088", serverAddress, basePath));
    EXPECT_FALSE(HecLogSender::parseServerUrl("http://host:0", serverAddress, basePath));
    EXPECT_FALSE(HecLogSender::parseServerUrl("http://host:70000", serverAddress, basePath));
    EXPECT_FALSE(HecLogSender::parseServerUrl("http://host:port", serverAddress, basePath));
    EXPECT_FALSE(HecLogSender::parseServerUrl("http://user@host", serverAddress, basePath));
}

TEST(HecLogSenderCreate, InvalidConfig) {
    RecordingReportHandler reportHandler;
    HecLogSenderConfig config = makeSenderConfig("");
    EXPECT_EQ(HecLogSender::create(config), nullptr);
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "server URL is empty"), 1u);

    config = makeSenderConfig("http://localhost:8088");
    config.m_token = "  ";
    EXPECT_EQ(HecLogSender::create(config), nullptr);
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "token is empty"), 1u);

    config = makeSenderConfig("tcp://localhost:8088");
    EXPECT_EQ(HecLogSender::create(config), nullptr);
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "invalid server URL"), 1u);
}

TEST(HecLogSenderCreate, Endpoint) {
    heclog::HecLogHostResolver hostResolver = makeTestHostResolver();
    std::unique_ptr<HecLogSender> sender = HecLogSender::create(
        makeSenderConfig("https://splunk.example.com:8088/custom/"), nullptr, &hostResolver);
    ASSERT_NE(sender, nullptr);
    EXPECT_EQ(sender->getServerAddress(), "https://splunk.example.com:8088");
    EXPECT_EQ(sender->getEndpoint(), "/custom/services/collector/event/1.0");
    sender->close();
}

TEST_F(HecLogSenderTest, PostSuccess) {
    HecLogSenderConfig config = makeSenderConfig(m_server.getUrl() + "/base");
    config.m_channel = TEST_CHANNEL;
    std::unique_ptr<HecLogSender> sender = createSender(config);
    ASSERT_NE(sender, nullptr);
    RecordingErrorListener errorListener;
    sender->getErrorReporter().subscribe(&errorListener);

    const std::string payload = "{\"time\":1.000,\"sourcetype\":\"_json\",\"event\":1}\n";
    EXPECT_EQ(sender->post(payload), 200);

    std::vector<RecordedRequest> requests = m_server.getRequests();
    ASSERT_EQ(requests.size(), 1u);
    const RecordedRequest& request = requests[0];
    EXPECT_EQ(request.m_method, "POST");
    EXPECT_EQ(request.m_path, "/base/services/collector/event/1.0");
    EXPECT_EQ(request.m_body, payload);
    EXPECT_EQ(request.getHeader("Authorization"), "Splunk " TEST_TOKEN);
    EXPECT_EQ(request.getHeader("X-Splunk-Request-Channel"), TEST_CHANNEL);
    EXPECT_EQ(request.getHeader("Content-Type"), HECLOG_CONTENT_TYPE);
    EXPECT_EQ(errorListener.getErrorCount(), 0u);
    sender->close();
}

TEST_F(HecLogSenderTest, NoChannelHeader) {
    std::unique_ptr<HecLogSender> sender = createSender();
    ASSERT_NE(sender, nullptr);
    EXPECT_EQ(sender->post("{}\n"), 200);
    std::vector<RecordedRequest> requests = m_server.getRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].m_headers.count("X-Splunk-Request-Channel"), 0u);
    sender->close();
}

TEST_F(HecLogSenderTest, ServerRejection) {
    const std::string reply = R"({"text":"Invalid token","code":4})";
    m_server.setReply(403, reply);
    std::unique_ptr<HecLogSender> sender = createSender();
    ASSERT_NE(sender, nullptr);
    RecordingErrorListener errorListener;
    sender->getErrorReporter().subscribe(&errorListener);

    const std::string payload = "{\"event\":\"x\"}\n";
    EXPECT_EQ(sender->post(payload), 403);
    std::vector<HecLogDeliveryError> errors = errorListener.getErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].m_kind, HecLogDeliveryErrorKind::DE_HTTP_STATUS);
    EXPECT_EQ(errors[0].m_status, 403);
    EXPECT_EQ(errors[0].m_serverReply, reply);
    EXPECT_EQ(errors[0].m_serializedEvents, payload);
    EXPECT_FALSE(errors[0].m_cancelled);
    EXPECT_NE(errors[0].toString().find("403"), std::string::npos);
    sender->close();
}

TEST_F(HecLogSenderTest, RejectionWithEmptyBody) {
    m_server.setReply(503, "");
    std::unique_ptr<HecLogSender> sender = createSender();
    ASSERT_NE(sender, nullptr);
    RecordingErrorListener errorListener;
    sender->getErrorReporter().subscribe(&errorListener);
    EXPECT_EQ(sender->post("{}\n"), 503);
    std::vector<HecLogDeliveryError> errors = errorListener.getErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].m_status, 503);
    EXPECT_TRUE(errors[0].m_serverReply.empty());
    sender->close();
}

TEST_F(HecLogSenderTest, AllListenersNotified) {
    m_server.setReply(500, "oops");
    std::unique_ptr<HecLogSender> sender = createSender();
    ASSERT_NE(sender, nullptr);
    RecordingErrorListener listener1;
    RecordingErrorListener listener2;
    sender->getErrorReporter().subscribe(&listener1);
    sender->getErrorReporter().subscribe(&listener2);
    // duplicate subscription has no effect
    sender->getErrorReporter().subscribe(&listener1);
    EXPECT_EQ(sender->getErrorReporter().getListenerCount(), 2u);

    EXPECT_EQ(sender->post("{}\n"), 500);
    EXPECT_EQ(listener1.getErrorCount(), 1u);
    EXPECT_EQ(listener2.getErrorCount(), 1u);

    sender->getErrorReporter().unsubscribe(&listener2);
    EXPECT_EQ(sender->post("{}\n"), 500);
    EXPECT_EQ(listener1.getErrorCount(), 2u);
    EXPECT_EQ(listener2.getErrorCount(), 1u);
    sender->close();
}

TEST(HecLogSenderTransport, ConnectionRefused) {
    heclog::HecLogHostResolver hostResolver = makeTestHostResolver();
    HecLogSenderConfig config = makeSenderConfig("http://127.0.0.1:1");
    config.m_httpConfig.m_connectTimeoutMillis = 500;
    std::unique_ptr<HecLogSender> sender = HecLogSender::create(config, nullptr, &hostResolver);
    ASSERT_NE(sender, nullptr);
    RecordingErrorListener errorListener;
    sender->getErrorReporter().subscribe(&errorListener);

    EXPECT_EQ(sender->post("{}\n"), 400);
    std::vector<HecLogDeliveryError> errors = errorListener.getErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].m_kind, HecLogDeliveryErrorKind::DE_TRANSPORT);
    EXPECT_EQ(errors[0].m_status, 400);
    EXPECT_FALSE(errors[0].m_transportError.empty());
    EXPECT_FALSE(errors[0].m_cancelled);
    sender->close();
}

TEST_F(HecLogSenderTest, CancelledBeforeSend) {
    std::unique_ptr<HecLogSender> sender = createSender();
    ASSERT_NE(sender, nullptr);
    RecordingErrorListener errorListener;
    sender->getErrorReporter().subscribe(&errorListener);

    heclog::HecLogCancelToken cancelToken;
    cancelToken.cancel();
    EXPECT_EQ(sender->post("{}\n", &cancelToken), 400);
    std::vector<HecLogDeliveryError> errors = errorListener.getErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].m_kind, HecLogDeliveryErrorKind::DE_TRANSPORT);
    EXPECT_TRUE(errors[0].m_cancelled);
    EXPECT_EQ(m_server.getRequestCount(), 0u);
    sender->close();
}

TEST_F(HecLogSenderTest, CancelledInFlight) {
    std::unique_ptr<HecLogSender> sender = createSender();
    ASSERT_NE(sender, nullptr);
    RecordingErrorListener errorListener;
    sender->getErrorReporter().subscribe(&errorListener);

    // server holds back the status line, so the request waits for the response
    m_server.setReplyDelayMillis(10000);
    heclog::HecLogCancelToken cancelToken;
    std::thread cancelThread([&cancelToken]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancelToken.cancel();
    });

    std::chrono::steady_clock::time_point startTime = std::chrono::steady_clock::now();
    int status = sender->post("{}\n", &cancelToken);
    std::chrono::milliseconds elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    cancelThread.join();

    EXPECT_EQ(status, 400);
    EXPECT_LT(elapsed.count(), 5000);
    std::vector<HecLogDeliveryError> errors = errorListener.getErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].m_kind, HecLogDeliveryErrorKind::DE_TRANSPORT);
    EXPECT_TRUE(errors[0].m_cancelled);

    // the connection is usable again once the token is reset
    m_server.setReplyDelayMillis(0);
    cancelToken.reset();
    EXPECT_EQ(sender->post("{}\n", &cancelToken), 200);
    EXPECT_EQ(errorListener.getErrorCount(), 1u);
    sender->close();
}

TEST_F(HecLogSenderTest, PostAfterClose) {
    RecordingReportHandler reportHandler;
    std::unique_ptr<HecLogSender> sender = createSender();
    ASSERT_NE(sender, nullptr);
    RecordingErrorListener errorListener;
    sender->getErrorReporter().subscribe(&errorListener);

    sender->close();
    EXPECT_TRUE(sender->isClosed());
    EXPECT_EQ(sender->getErrorReporter().getListenerCount(), 0u);
    // closing twice is harmless
    sender->close();

    EXPECT_EQ(sender->post("{}\n"), 400);
    EXPECT_EQ(errorListener.getErrorCount(), 0u);
    EXPECT_EQ(m_server.getRequestCount(), 0u);
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "sender is closed"), 1u);
}

TEST_F(HecLogSenderTest, BatchThroughSender) {
    std::unique_ptr<HecLogSender> sender = createSender();
    ASSERT_NE(sender, nullptr);
    std::unique_ptr<heclog::HecLogEventBatch> batch = sender->startBatch();
    EXPECT_TRUE(batch->addEvent(makeTime(1700000000, 1), "", "Info", "", "one"));
    EXPECT_TRUE(batch->addEvent(makeTime(1700000000, 2), "", "Info", "", "two"));
    EXPECT_EQ(batch->send(), 200);

    std::vector<RecordedRequest> requests = m_server.getRequests();
    ASSERT_EQ(requests.size(), 1u);
    std::vector<heclog::HecLogJson> records = parsePayload(requests[0].m_body);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["host"], TEST_HOST_NAME);
    EXPECT_EQ(records[0]["sourcetype"], "_json");
    EXPECT_EQ(records[0]["event"]["message"], "one");
    EXPECT_EQ(records[1]["event"]["message"], "two");

    // empty batch does not hit the network
    EXPECT_EQ(batch->send(), 200);
    EXPECT_EQ(m_server.getRequestCount(), 1u);
    batch.reset();
    sender->close();
}

TEST_F(HecLogSenderTest, ConcurrentPosts) {
    HecLogSenderConfig config = makeSenderConfig(m_server.getUrl());
    config.m_httpConfig.m_maxConnectionsPerServer = 2;
    std::unique_ptr<HecLogSender> sender = createSender(config);
    ASSERT_NE(sender, nullptr);

    const int threadCount = 4;
    const int postsPerThread = 5;
    std::atomic<int> okCount(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < threadCount; ++i) {
        threads.emplace_back([&sender, &okCount, i, postsPerThread]() {
            for (int j = 0; j < postsPerThread; ++j) {
                std::string payload = "{\"event\":\"" + std::to_string(i) + "-" +
                                      std::to_string(j) + "\"}\n";
                if (sender->post(payload) == 200) {
                    ++okCount;
                }
            }
        });
    }
    for (std::thread& t : threads) {
        t.join();
    }
    EXPECT_EQ(okCount.load(), threadCount * postsPerThread);
    EXPECT_EQ(m_server.getRequestCount(), (size_t)(threadCount * postsPerThread));
    sender->close();
}
