#include <cstdlib>
#include <string>

#include "heclog_batch_buffer.h"
#include "heclog_common.h"
#include "heclog_error_reporter.h"
#include "heclog_level.h"
#include "heclog_test_common.h"

using heclog::HecLogLevel;

TEST(HecLogLevel, FromString) {
    HecLogLevel logLevel = heclog::HLEVEL_INFO;
    EXPECT_TRUE(heclog::heclogLevelFromStr("debug", logLevel));
    EXPECT_EQ(logLevel, heclog::HLEVEL_DEBUG);
    EXPECT_TRUE(heclog::heclogLevelFromStr("WARN", logLevel));
    EXPECT_EQ(logLevel, heclog::HLEVEL_WARN);
    EXPECT_FALSE(heclog::heclogLevelFromStr("verbose", logLevel));
    EXPECT_FALSE(heclog::heclogLevelFromStr(nullptr, logLevel));
    EXPECT_EQ(logLevel, heclog::HLEVEL_WARN);
    EXPECT_STREQ(heclog::heclogLevelToStr(heclog::HLEVEL_NOTICE), "NOTICE");
    EXPECT_STREQ(heclog::heclogLevelToStr((HecLogLevel)100), "N/A");
}

TEST(HecLogReport, ReportLevelFilter) {
    RecordingReportHandler reportHandler;
    heclog::HecLogReport::setReportLevel(heclog::HLEVEL_WARN);
    EXPECT_TRUE(heclog::HecLogReport::canReport(heclog::HLEVEL_ERROR));
    EXPECT_FALSE(heclog::HecLogReport::canReport(heclog::HLEVEL_TRACE));

    // trace reports are dropped at WARN level
    heclog::HecLogErrorReporter errorReporter;
    errorReporter.publish(heclog::HecLogDeliveryError(
        heclog::HecLogDeliveryErrorKind::DE_TRANSPORT, HECLOG_HTTP_STATUS_BAD_REQUEST));
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_TRACE, "dropping delivery error"), 0u);

    heclog::HecLogReport::setReportLevel(heclog::HLEVEL_DEBUG);
    errorReporter.publish(heclog::HecLogDeliveryError(
        heclog::HecLogDeliveryErrorKind::DE_TRANSPORT, HECLOG_HTTP_STATUS_BAD_REQUEST));
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_TRACE, "dropping delivery error"), 1u);
}

TEST(HecLogReport, ReportLevelEnv) {
    HecLogLevel prevLevel = heclog::HecLogReport::getReportLevel();
    setenv("HECLOG_REPORT_LEVEL", "notice", 1);
    EXPECT_TRUE(heclog::HecLogReport::loadReportLevelEnv());
    EXPECT_EQ(heclog::HecLogReport::getReportLevel(), heclog::HLEVEL_NOTICE);

    {
        RecordingReportHandler reportHandler;
        setenv("HECLOG_REPORT_LEVEL", "loud", 1);
        EXPECT_FALSE(heclog::HecLogReport::loadReportLevelEnv());
        EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "loud"), 1u);
    }

    unsetenv("HECLOG_REPORT_LEVEL");
    EXPECT_TRUE(heclog::HecLogReport::loadReportLevelEnv());
    heclog::HecLogReport::setReportLevel(prevLevel);
}

TEST(HecLogCommon, ParseTimeout) {
    RecordingReportHandler reportHandler;
    uint32_t timeoutMillis = 0;
    EXPECT_TRUE(heclog::parseTimeoutProp("t", "", "250", timeoutMillis));
    EXPECT_EQ(timeoutMillis, 250u);
    EXPECT_TRUE(heclog::parseTimeoutProp("t", "", "250ms", timeoutMillis));
    EXPECT_EQ(timeoutMillis, 250u);
    EXPECT_TRUE(heclog::parseTimeoutProp("t", "", "5s", timeoutMillis));
    EXPECT_EQ(timeoutMillis, 5000u);
    EXPECT_FALSE(heclog::parseTimeoutProp("t", "", "5m", timeoutMillis));
    EXPECT_FALSE(heclog::parseTimeoutProp("t", "", "s", timeoutMillis));
    EXPECT_FALSE(heclog::parseTimeoutProp("t", "", "-3s", timeoutMillis));
    EXPECT_FALSE(heclog::parseTimeoutProp("t", "", "5000000s", timeoutMillis));
    EXPECT_EQ(timeoutMillis, 5000u);
}

TEST(HecLogCommon, ParseBool) {
    bool value = false;
    EXPECT_TRUE(heclog::parseBoolProp("b", "", "Yes", value));
    EXPECT_TRUE(value);
    EXPECT_TRUE(heclog::parseBoolProp("b", "", "FALSE", value));
    EXPECT_FALSE(value);
    EXPECT_FALSE(heclog::parseBoolProp("b", "", "1", value, false));
}

TEST(HecLogCommon, Trim) {
    EXPECT_EQ(heclog::trim("  a b\t\r\n"), "a b");
    EXPECT_EQ(heclog::trim(" \t "), "");
    EXPECT_EQ(heclog::toLower("HeLLo"), "hello");
}

TEST(HecLogBatchBuffer, AppendTruncate) {
    heclog::HecLogBatchBuffer buffer;
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.getRef(), nullptr);
    EXPECT_TRUE(buffer.append("hello"));
    EXPECT_TRUE(buffer.append(' '));
    uint64_t checkpoint = buffer.getOffset();
    EXPECT_TRUE(buffer.append(std::string("world")));
    EXPECT_EQ(buffer.toString(), "hello world");
    buffer.truncate(checkpoint);
    EXPECT_EQ(buffer.toString(), "hello ");
    // offset beyond the end is ignored
    buffer.truncate(1000);
    EXPECT_EQ(buffer.getOffset(), checkpoint);

    buffer.reset();
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.size(), HECLOG_BATCH_BUFFER_INIT_SIZE);
    buffer.release();
    EXPECT_EQ(buffer.size(), 0u);
}

TEST(HecLogBatchBuffer, Growth) {
    heclog::HecLogBatchBuffer buffer;
    std::string chunk(1000, 'x');
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(buffer.append(chunk));
    }
    EXPECT_EQ(buffer.getOffset(), 10000u);
    EXPECT_EQ(buffer.size(), 16384u);
    EXPECT_EQ(buffer.toString(), std::string(10000, 'x'));
}

TEST(HecLogBatchBuffer, MaxSize) {
    RecordingReportHandler reportHandler;
    heclog::HecLogBatchBuffer buffer;
    EXPECT_FALSE(buffer.resize(HECLOG_BATCH_BUFFER_MAX_SIZE + 1));
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "exceeding maximum"), 1u);
    EXPECT_TRUE(buffer.empty());
}

TEST(HecLogDeliveryError, ToString) {
    heclog::HecLogDeliveryError error(heclog::HecLogDeliveryErrorKind::DE_HTTP_STATUS, 403);
    error.m_reason = "Forbidden";
    error.m_serverReply = R"({"text":"Invalid token","code":4})";
    std::string text = error.toString();
    EXPECT_NE(text.find("HTTP status error, status 403 (Forbidden)"), std::string::npos);
    EXPECT_NE(text.find("Invalid token"), std::string::npos);

    heclog::HecLogDeliveryError cancelled(heclog::HecLogDeliveryErrorKind::DE_TRANSPORT, 400);
    cancelled.m_cancelled = true;
    EXPECT_NE(cancelled.toString().find("request cancelled"), std::string::npos);
    EXPECT_STREQ(heclog::deliveryErrorKindToString(
                     heclog::HecLogDeliveryErrorKind::DE_CERTIFICATE_OVERRIDE),
                 "certificate override");
}

TEST(HecLogErrorReporter, SubscribeUnsubscribe) {
    heclog::HecLogErrorReporter errorReporter;
    RecordingErrorListener listener;
    errorReporter.subscribe(nullptr);
    EXPECT_EQ(errorReporter.getListenerCount(), 0u);
    errorReporter.subscribe(&listener);
    errorReporter.subscribe(&listener);
    EXPECT_EQ(errorReporter.getListenerCount(), 1u);

    heclog::HecLogDeliveryError error(heclog::HecLogDeliveryErrorKind::DE_HTTP_STATUS, 500);
    errorReporter.publish(error);
    EXPECT_EQ(listener.getErrorCount(), 1u);

    errorReporter.unsubscribe(&listener);
    errorReporter.publish(error);
    EXPECT_EQ(listener.getErrorCount(), 1u);

    errorReporter.subscribe(&listener);
    errorReporter.clear();
    EXPECT_EQ(errorReporter.getListenerCount(), 0u);
}
