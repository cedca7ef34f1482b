#include <stdexcept>
#include <string>
#include <vector>

#include "heclog_target.h"
#include "heclog_test_common.h"

using heclog::HecLogEvent;
using heclog::HecLogJson;
using heclog::HecLogSendMode;
using heclog::HecLogTarget;
using heclog::HecLogTargetConfig;

static HecLogEvent makeEvent(const char* msg, const char* loggerName = "test.logger") {
    HecLogEvent event;
    event.m_time = makeTime(1700000000, 500);
    event.m_level = "Info";
    event.m_loggerName = loggerName;
    event.m_renderedMessage = msg;
    return event;
}

class HecLogTargetTest : public testing::Test {
protected:
    FakeHecServer m_server;
    heclog::HecLogHostResolver m_hostResolver;

    HecLogTargetTest() : m_hostResolver(makeTestHostResolver()) {}

    void SetUp() override { ASSERT_TRUE(m_server.start()); }
    void TearDown() override { m_server.stop(); }

    HecLogTargetConfig makeTargetConfig() {
        HecLogTargetConfig config;
        config.m_name = "test-target";
        config.m_senderConfig = makeSenderConfig(m_server.getUrl());
        return config;
    }

    std::vector<HecLogJson> getAllRecords() {
        std::vector<HecLogJson> allRecords;
        for (const RecordedRequest& request : m_server.getRequests()) {
            std::vector<HecLogJson> records = parsePayload(request.m_body);
            allRecords.insert(allRecords.end(), records.begin(), records.end());
        }
        return allRecords;
    }
};

TEST_F(HecLogTargetTest, StartStop) {
    HecLogTarget target(makeTargetConfig(), nullptr, &m_hostResolver);
    EXPECT_FALSE(target.isStarted());
    ASSERT_TRUE(target.start());
    EXPECT_TRUE(target.isStarted());
    EXPECT_NE(target.getSender(), nullptr);
    EXPECT_EQ(target.getSender()->getErrorReporter().getListenerCount(), 1u);
    EXPECT_TRUE(target.stop());
    EXPECT_FALSE(target.isStarted());
    EXPECT_EQ(target.getSender(), nullptr);
}

TEST_F(HecLogTargetTest, StartFailsWithoutToken) {
    RecordingReportHandler reportHandler;
    HecLogTargetConfig config = makeTargetConfig();
    config.m_senderConfig.m_token.clear();
    HecLogTarget target(config, nullptr, &m_hostResolver);
    EXPECT_FALSE(target.start());
    EXPECT_FALSE(target.isStarted());
    EXPECT_FALSE(target.writeLogEvent(makeEvent("lost")));
    EXPECT_EQ(m_server.getRequestCount(), 0u);
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "target not started"), 1u);
}

TEST_F(HecLogTargetTest, BatchOrder) {
    HecLogTarget target(makeTargetConfig(), nullptr, &m_hostResolver);
    ASSERT_TRUE(target.start());
    std::vector<HecLogEvent> events;
    for (int i = 0; i < 5; ++i) {
        events.push_back(makeEvent(("msg-" + std::to_string(i)).c_str()));
    }
    EXPECT_TRUE(target.writeLogEvents(events));
    ASSERT_EQ(m_server.getRequestCount(), 1u);
    std::vector<HecLogJson> records = getAllRecords();
    ASSERT_EQ(records.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(records[i]["event"]["message"], "msg-" + std::to_string(i));
        EXPECT_EQ(records[i]["source"], "test.logger");
        EXPECT_EQ(records[i]["host"], TEST_HOST_NAME);
        EXPECT_DOUBLE_EQ(records[i]["time"].get<double>(), 1700000000.5);
    }
    EXPECT_TRUE(target.stop());
}

TEST_F(HecLogTargetTest, ConfiguredMetadata) {
    HecLogTargetConfig config = makeTargetConfig();
    config.m_senderConfig.m_index = "main";
    config.m_senderConfig.m_source = "configured";
    config.m_senderConfig.m_sourceType = "app_log";
    HecLogTarget target(config, nullptr, &m_hostResolver);
    ASSERT_TRUE(target.start());
    EXPECT_TRUE(target.writeLogEvent(makeEvent("hello", "some.logger")));
    std::vector<HecLogJson> records = getAllRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["index"], "main");
    EXPECT_EQ(records[0]["source"], "configured");
    EXPECT_EQ(records[0]["sourcetype"], "app_log");
    EXPECT_TRUE(target.stop());
}

TEST_F(HecLogTargetTest, SourceFromLoggerDisabled) {
    HecLogTargetConfig config = makeTargetConfig();
    config.m_sourceFromLogger = false;
    HecLogTarget target(config, nullptr, &m_hostResolver);
    EXPECT_EQ(target.getEventSource(makeEvent("x", "a.logger")), "");
    ASSERT_TRUE(target.start());
    EXPECT_TRUE(target.writeLogEvent(makeEvent("x", "a.logger")));
    std::vector<HecLogJson> records = getAllRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].contains("source"));
    EXPECT_TRUE(target.stop());
}

TEST_F(HecLogTargetTest, PerLoggerSource) {
    HecLogTarget target(makeTargetConfig(), nullptr, &m_hostResolver);
    ASSERT_TRUE(target.start());
    std::vector<HecLogEvent> events = {makeEvent("1", "orders"), makeEvent("2", "payments"),
                                       makeEvent("3", "orders")};
    EXPECT_TRUE(target.writeLogEvents(events));
    std::vector<HecLogJson> records = getAllRecords();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0]["source"], "orders");
    EXPECT_EQ(records[1]["source"], "payments");
    EXPECT_EQ(records[2]["source"], "orders");
    // default metadata plus one entry per logger
    EXPECT_EQ(target.getSender()->getMetadataCache().size(), 3u);
    EXPECT_TRUE(target.stop());
}

TEST_F(HecLogTargetTest, Properties) {
    HecLogTargetConfig config = makeTargetConfig();
    config.m_includePositionalParameters = true;
    config.m_contextProperties.push_back({"env", "prod"});
    HecLogTarget target(config, nullptr, &m_hostResolver);

    HecLogEvent event = makeEvent("user joe logged in 3 times");
    event.m_messageTemplate = "user {0} logged in {1} times";
    event.m_parameters = {"joe", 3};
    event.m_properties = HecLogJson::object();
    event.m_properties["session"] = "s-1";

    HecLogJson properties = target.buildProperties(event);
    std::vector<std::string> keys;
    for (const auto& item : properties.items()) {
        keys.push_back(item.key());
    }
    std::vector<std::string> expectedKeys = {"session", "env", "{0}", "{1}"};
    EXPECT_EQ(keys, expectedKeys);

    ASSERT_TRUE(target.start());
    EXPECT_TRUE(target.writeLogEvent(event));
    std::vector<HecLogJson> records = getAllRecords();
    ASSERT_EQ(records.size(), 1u);
    const HecLogJson& sentEvent = records[0]["event"];
    EXPECT_EQ(sentEvent["message-template"], "user {0} logged in {1} times");
    EXPECT_EQ(sentEvent["properties"]["session"], "s-1");
    EXPECT_EQ(sentEvent["properties"]["env"], "prod");
    EXPECT_EQ(sentEvent["properties"]["{0}"], "joe");
    EXPECT_EQ(sentEvent["properties"]["{1}"], 3);
    EXPECT_TRUE(target.stop());
}

TEST_F(HecLogTargetTest, PropertiesExcluded) {
    HecLogTargetConfig config = makeTargetConfig();
    config.m_includeEventProperties = false;
    HecLogTarget target(config, nullptr, &m_hostResolver);
    HecLogEvent event = makeEvent("x");
    event.m_parameters = {1};
    event.m_properties = HecLogJson::object();
    event.m_properties["hidden"] = true;
    EXPECT_TRUE(target.buildProperties(event).is_null());
}

TEST_F(HecLogTargetTest, ExceptionAttached) {
    HecLogTarget target(makeTargetConfig(), nullptr, &m_hostResolver);
    ASSERT_TRUE(target.start());
    HecLogEvent event = makeEvent("failed");
    event.m_level = "Error";
    event.m_exception = heclog::HecLogEventInfo::exceptionToJson(std::runtime_error("disk full"));
    EXPECT_TRUE(target.writeLogEvent(event));
    std::vector<HecLogJson> records = getAllRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["event"]["level"], "Error");
    EXPECT_EQ(records[0]["event"]["exception"]["message"], "disk full");
    EXPECT_TRUE(target.stop());
}

TEST_F(HecLogTargetTest, SequentialFailure) {
    RecordingReportHandler reportHandler;
    m_server.setReply(503, R"({"text":"Server is busy","code":9})");
    HecLogTarget target(makeTargetConfig(), nullptr, &m_hostResolver);
    ASSERT_TRUE(target.start());
    EXPECT_FALSE(target.writeLogEvent(makeEvent("x")));
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR,
                                         "HecLogTarget(Name=test-target): Failed to send log "
                                         "events to Splunk server"),
              1u);
    EXPECT_TRUE(target.stop());
}

TEST_F(HecLogTargetTest, ParallelFlush) {
    HecLogTargetConfig config = makeTargetConfig();
    config.m_senderConfig.m_sendMode = HecLogSendMode::SM_PARALLEL;
    HecLogTarget target(config, nullptr, &m_hostResolver);
    ASSERT_TRUE(target.start());
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(target.writeLogEvent(makeEvent(("p-" + std::to_string(i)).c_str())));
    }
    EXPECT_TRUE(target.flush());
    EXPECT_EQ(m_server.getRequestCount(), 4u);

    // failures surface on the next flush, and only once
    m_server.setReply(503, "");
    EXPECT_TRUE(target.writeLogEvent(makeEvent("doomed")));
    EXPECT_FALSE(target.flush());
    EXPECT_TRUE(target.flush());
    EXPECT_TRUE(target.stop());
}

TEST_F(HecLogTargetTest, CancelAbandonsBatch) {
    HecLogTarget target(makeTargetConfig(), nullptr, &m_hostResolver);
    ASSERT_TRUE(target.start());
    heclog::HecLogCancelToken cancelToken;
    cancelToken.cancel();
    std::vector<HecLogEvent> events = {makeEvent("a"), makeEvent("b")};
    EXPECT_FALSE(target.writeLogEvents(events, &cancelToken));
    EXPECT_EQ(m_server.getRequestCount(), 0u);

    cancelToken.reset();
    EXPECT_TRUE(target.writeLogEvents(events, &cancelToken));
    EXPECT_EQ(m_server.getRequestCount(), 1u);
    EXPECT_TRUE(target.stop());
}

TEST_F(HecLogTargetTest, DroppedEventDoesNotBlockBatch) {
    RecordingReportHandler reportHandler;
    HecLogTarget target(makeTargetConfig(), nullptr, &m_hostResolver);
    ASSERT_TRUE(target.start());
    HecLogEvent badEvent = makeEvent("bad");
    badEvent.m_properties = HecLogJson::object();
    badEvent.m_properties["bytes"] = std::string("\xc3\x28");
    std::vector<HecLogEvent> events = {makeEvent("before"), badEvent, makeEvent("after")};

    // the batch is still sent, but the call reports the dropped event
    EXPECT_FALSE(target.writeLogEvents(events));
    std::vector<HecLogJson> records = getAllRecords();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["event"]["message"], "before");
    EXPECT_EQ(records[1]["event"]["message"], "after");
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "Dropped log event"), 1u);
    EXPECT_TRUE(target.stop());
}
