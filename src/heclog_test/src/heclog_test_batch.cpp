#include <memory>
#include <stdexcept>

#include "heclog_event_batch.h"
#include "heclog_test_common.h"

using heclog::HecLogEventBatch;
using heclog::HecLogJson;
using heclog::HecLogMetadata;
using heclog::HecLogMetadataPtr;

// captures posted payloads instead of sending them
struct PostCapture {
    std::vector<std::string> m_payloads;
    int m_status = 200;

    heclog::HecLogPostFunc getPostFunc() {
        return [this](const std::string& payload, const heclog::HecLogCancelToken*) {
            m_payloads.push_back(payload);
            return m_status;
        };
    }
};

static HecLogMetadataPtr makeMetadata(const char* index = "", const char* source = "") {
    return std::make_shared<const HecLogMetadata>(index, source, "_json", TEST_HOST_NAME);
}

class ConstantFormatter : public heclog::HecLogFormatter {
public:
    explicit ConstantFormatter(const HecLogJson& value) : m_value(value) {}
    ~ConstantFormatter() final {}

    HecLogJson transform(const heclog::HecLogEventInfo& eventInfo) final { return m_value; }

private:
    HecLogJson m_value;
};

// fails on events whose rendered message is "bad"
class FailingFormatter : public heclog::HecLogFormatter {
public:
    FailingFormatter() {}
    ~FailingFormatter() final {}

    HecLogJson transform(const heclog::HecLogEventInfo& eventInfo) final {
        if (eventInfo.getRenderedMessage() == "bad") {
            throw std::runtime_error("cannot format event");
        }
        HecLogJson event = HecLogJson::object();
        event["msg"] = eventInfo.getRenderedMessage();
        return event;
    }
};

TEST(HecLogBatch, EventOrder) {
    PostCapture capture;
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata());
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000, 1), "", "Info", "", "a"));
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000, 2), "", "Error", "", "b"));
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000, 3), "", "Info", "", "c"));
    EXPECT_EQ(batch.getEventCount(), 3u);

    EXPECT_EQ(batch.send(), 200);
    ASSERT_EQ(capture.m_payloads.size(), 1u);
    std::vector<HecLogJson> records = parsePayload(capture.m_payloads[0]);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0]["event"]["message"], "a");
    EXPECT_EQ(records[0]["event"]["level"], "Info");
    EXPECT_EQ(records[1]["event"]["message"], "b");
    EXPECT_EQ(records[1]["event"]["level"], "Error");
    EXPECT_EQ(records[2]["event"]["message"], "c");
    EXPECT_EQ(records[2]["event"]["level"], "Info");

    // batch is emptied by send
    EXPECT_EQ(batch.getEventCount(), 0u);
    EXPECT_EQ(batch.getBuffer().getOffset(), 0u);
}

TEST(HecLogBatch, WireShape) {
    PostCapture capture;
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata("main", "app"));
    HecLogJson exception = HecLogJson::object();
    exception["type"] = "std::runtime_error";
    exception["message"] = "boom";
    HecLogJson properties = HecLogJson::object();
    properties["user"] = "joe";
    properties["count"] = 3;
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000, 123), "42", "Warn", "Hello {0}",
                               "Hello world", exception, properties));
    EXPECT_EQ(batch.send(), 200);
    ASSERT_EQ(capture.m_payloads.size(), 1u);

    const std::string& payload = capture.m_payloads[0];
    EXPECT_EQ(payload.compare(0, 23, "{\"time\":1700000000.123,"), 0) << payload;
    EXPECT_EQ(payload.back(), '\n');

    std::vector<HecLogJson> records = parsePayload(payload);
    ASSERT_EQ(records.size(), 1u);
    const HecLogJson& record = records[0];
    EXPECT_DOUBLE_EQ(record["time"].get<double>(), 1700000000.123);
    EXPECT_EQ(record["index"], "main");
    EXPECT_EQ(record["source"], "app");
    EXPECT_EQ(record["sourcetype"], "_json");
    EXPECT_EQ(record["host"], TEST_HOST_NAME);

    // field order on the wire
    std::vector<std::string> keys;
    for (const auto& item : record.items()) {
        keys.push_back(item.key());
    }
    std::vector<std::string> expectedKeys = {"time", "index", "source", "sourcetype", "host",
                                             "event"};
    EXPECT_EQ(keys, expectedKeys);

    const HecLogJson& event = record["event"];
    EXPECT_EQ(event["id"], "42");
    EXPECT_EQ(event["message-template"], "Hello {0}");
    EXPECT_EQ(event["message"], "Hello world");
    EXPECT_EQ(event["level"], "Warn");
    EXPECT_EQ(event["exception"]["message"], "boom");
    EXPECT_EQ(event["properties"]["user"], "joe");
    EXPECT_EQ(event["properties"]["count"], 3);
}

TEST(HecLogBatch, OptionalFieldsOmitted) {
    PostCapture capture;
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata());
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "plain", nullptr,
                               HecLogJson::object()));
    EXPECT_EQ(batch.send(), 200);
    std::vector<HecLogJson> records = parsePayload(capture.m_payloads[0]);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].contains("index"));
    EXPECT_FALSE(records[0].contains("source"));
    EXPECT_EQ(records[0]["sourcetype"], "_json");
    const HecLogJson& event = records[0]["event"];
    EXPECT_FALSE(event.contains("id"));
    EXPECT_FALSE(event.contains("message-template"));
    EXPECT_FALSE(event.contains("exception"));
    EXPECT_FALSE(event.contains("properties"));
    EXPECT_EQ(event["message"], "plain");
}

TEST(HecLogBatch, MissingMetadata) {
    PostCapture capture;
    HecLogEventBatch batch(capture.getPostFunc(), nullptr);
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "bare"));
    EXPECT_EQ(batch.send(), 200);
    ASSERT_EQ(capture.m_payloads.size(), 1u);
    EXPECT_EQ(capture.m_payloads[0].find("{\"time\":1700000000.000,\"sourcetype\":\"_json\","),
              0u);
    std::vector<HecLogJson> records = parsePayload(capture.m_payloads[0]);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].contains("index"));
    EXPECT_FALSE(records[0].contains("source"));
    EXPECT_FALSE(records[0].contains("host"));
    EXPECT_EQ(records[0]["sourcetype"], HECLOG_DEFAULT_SOURCETYPE);
    EXPECT_EQ(records[0]["event"]["message"], "bare");
}

TEST(HecLogBatch, MetadataOverride) {
    PostCapture capture;
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata("main", "default-source"));
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "first"));
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "second", nullptr, nullptr,
                               makeMetadata("other", "override-source")));
    EXPECT_EQ(batch.send(), 200);
    std::vector<HecLogJson> records = parsePayload(capture.m_payloads[0]);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["source"], "default-source");
    EXPECT_EQ(records[1]["index"], "other");
    EXPECT_EQ(records[1]["source"], "override-source");
}

TEST(HecLogBatch, RollbackOnEncodingError) {
    RecordingReportHandler reportHandler;
    PostCapture capture;
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata());
    HecLogEventBatch referenceBatch(capture.getPostFunc(), makeMetadata());

    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "good-1"));
    EXPECT_TRUE(referenceBatch.addEvent(makeTime(1700000000), "", "Info", "", "good-1"));

    // invalid UTF-8 cannot be encoded, and fails after part of the record was written
    HecLogJson properties = HecLogJson::object();
    properties["bad"] = std::string("\xff\xfe\xfd");
    EXPECT_FALSE(batch.addEvent(makeTime(1700000000), "", "Info", "", "bad", nullptr, properties));
    EXPECT_EQ(batch.getEventCount(), 1u);
    EXPECT_EQ(batch.getBuffer().toString(), referenceBatch.getBuffer().toString());
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "Failed to serialize log event"),
              1u);

    // batch remains usable
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "good-2"));
    EXPECT_EQ(batch.send(), 200);
    std::vector<HecLogJson> records = parsePayload(capture.m_payloads[0]);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["event"]["message"], "good-1");
    EXPECT_EQ(records[1]["event"]["message"], "good-2");
}

TEST(HecLogBatch, RollbackOnFormatterError) {
    RecordingReportHandler reportHandler;
    PostCapture capture;
    FailingFormatter formatter;
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata(), &formatter);
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "one"));
    std::string before = batch.getBuffer().toString();
    EXPECT_FALSE(batch.addEvent(makeTime(1700000000), "", "Info", "", "bad"));
    EXPECT_EQ(batch.getBuffer().toString(), before);
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "cannot format event"), 1u);
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "two"));

    EXPECT_EQ(batch.send(), 200);
    std::vector<HecLogJson> records = parsePayload(capture.m_payloads[0]);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["event"]["msg"], "one");
    EXPECT_EQ(records[1]["event"]["msg"], "two");
}

TEST(HecLogBatch, FormatterOverride) {
    PostCapture capture;
    ConstantFormatter formatter(42);
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata(), &formatter);
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "7", "Info", "tmpl", "msg"));
    EXPECT_EQ(batch.send(), 200);
    ASSERT_EQ(capture.m_payloads.size(), 1u);
    EXPECT_NE(capture.m_payloads[0].find(",\"event\":42}"), std::string::npos);

    std::vector<HecLogJson> records = parsePayload(capture.m_payloads[0]);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0]["event"].is_number());
    EXPECT_EQ(records[0]["event"], 42);
    EXPECT_EQ(records[0]["host"], TEST_HOST_NAME);
}

TEST(HecLogBatch, FormatterNullOverride) {
    PostCapture capture;
    ConstantFormatter formatter(nullptr);
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata(), &formatter);
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "msg"));
    EXPECT_EQ(batch.send(), 200);
    std::vector<HecLogJson> records = parsePayload(capture.m_payloads[0]);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0]["event"].is_null());
}

TEST(HecLogBatch, EmptyBatchSkipsSend) {
    PostCapture capture;
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata());
    EXPECT_EQ(batch.send(), 200);
    EXPECT_TRUE(capture.m_payloads.empty());
}

TEST(HecLogBatch, ReuseAfterSend) {
    PostCapture capture;
    capture.m_status = 503;
    HecLogEventBatch batch(capture.getPostFunc(), makeMetadata());
    EXPECT_TRUE(batch.addEvent(makeTime(1700000000), "", "Info", "", "cycle-1"));
    EXPECT_EQ(batch.send(), 503);

    // a failed send still empties the batch
    capture.m_status = 200;
    EXPECT_TRUE(batch.addEvent(makeTime(1700000001), "", "Info", "", "cycle-2"));
    EXPECT_EQ(batch.send(), 200);
    ASSERT_EQ(capture.m_payloads.size(), 2u);
    std::vector<HecLogJson> records = parsePayload(capture.m_payloads[1]);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["event"]["message"], "cycle-2");
}

TEST(HecLogBatch, EpochTimeFormat) {
    EXPECT_EQ(heclog::HecLogEventInfo::formatEpochTime(makeTime(1700000000, 5)),
              "1700000000.005");
    EXPECT_EQ(heclog::HecLogEventInfo::formatEpochTime(makeTime(0)), "0.000");
    // times before the epoch carry the sign on the whole value
    EXPECT_EQ(heclog::HecLogEventInfo::formatEpochTime(makeTime(-1, 250)), "-0.750");
    EXPECT_EQ(heclog::HecLogEventInfo::formatEpochTime(makeTime(-2, 500)), "-1.500");
    EXPECT_EQ(heclog::HecLogEventInfo::formatEpochTime(makeTime(-1)), "-1.000");
    EXPECT_EQ(heclog::HecLogEventInfo::formatEpochTime(makeTime(0, -5)), "-0.005");
}

TEST(HecLogBatch, ExceptionToJson) {
    std::invalid_argument e("bad argument");
    HecLogJson exception = heclog::HecLogEventInfo::exceptionToJson(e);
    EXPECT_EQ(exception["message"], "bad argument");
    EXPECT_NE(exception["type"].get<std::string>().find("invalid_argument"), std::string::npos);
}
