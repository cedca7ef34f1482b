#include <cstdlib>

#include "heclog_config.h"
#include "heclog_test_common.h"

using heclog::HecLogConfigLoader;
using heclog::HecLogSendMode;
using heclog::HecLogTargetConfig;

static const char* sEnvOverrideVars[] = {"HECLOG_TOKEN",  "HECLOG_SERVER_URL", "HECLOG_CHANNEL",
                                         "HECLOG_INDEX",  "HECLOG_SOURCE",     "HECLOG_SOURCETYPE"};

// all tests start with a clean environment, so values set outside do not leak in
class HecLogConfigTest : public testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* envVar : sEnvOverrideVars) {
            unsetenv(envVar);
        }
    }
};

TEST_F(HecLogConfigTest, FullSpecification) {
    HecLogTargetConfig config;
    ASSERT_TRUE(HecLogConfigLoader::loadTargetConfig(
        "splunk://splunk.example.com:8088/hec?token=abc-123&channel=" TEST_CHANNEL
        "&index=main&source=payments&sourcetype=app_json&ssl=yes&ignore_ssl_errors=yes&"
        "ca_cert_path=/etc/ssl/ca.pem&use_proxy=yes&proxy_url=http://proxy:3128&"
        "proxy_user=bob&proxy_password=secret&max_connections=4&http10_hack=yes&"
        "send_mode=parallel&connect_timeout=1500&write_timeout=2s&read_timeout=750ms&"
        "positional_params=yes&include_properties=no&source_from_logger=no&name=audit&"
        "ctx.env=prod&ctx.region=eu-west",
        config));

    const heclog::HecLogSenderConfig& senderConfig = config.m_senderConfig;
    EXPECT_EQ(config.m_name, "audit");
    EXPECT_EQ(senderConfig.m_serverUrl, "https://splunk.example.com:8088/hec");
    EXPECT_EQ(senderConfig.m_token, "abc-123");
    EXPECT_EQ(senderConfig.m_channel, TEST_CHANNEL);
    EXPECT_EQ(senderConfig.m_index, "main");
    EXPECT_EQ(senderConfig.m_source, "payments");
    EXPECT_EQ(senderConfig.m_sourceType, "app_json");
    EXPECT_EQ(senderConfig.m_sendMode, HecLogSendMode::SM_PARALLEL);

    const heclog::HecLogHttpConfig& httpConfig = senderConfig.m_httpConfig;
    EXPECT_TRUE(httpConfig.m_ignoreSslErrors);
    EXPECT_EQ(httpConfig.m_caCertPath, "/etc/ssl/ca.pem");
    EXPECT_TRUE(httpConfig.m_useProxy);
    EXPECT_EQ(httpConfig.m_proxyUrl, "http://proxy:3128");
    EXPECT_EQ(httpConfig.m_proxyUser, "bob");
    EXPECT_EQ(httpConfig.m_proxyPassword, "secret");
    EXPECT_EQ(httpConfig.m_maxConnectionsPerServer, 4u);
    EXPECT_TRUE(httpConfig.m_useHttpVersion10Hack);
    EXPECT_EQ(httpConfig.m_connectTimeoutMillis, 1500u);
    EXPECT_EQ(httpConfig.m_writeTimeoutMillis, 2000u);
    EXPECT_EQ(httpConfig.m_readTimeoutMillis, 750u);

    EXPECT_TRUE(config.m_includePositionalParameters);
    EXPECT_FALSE(config.m_includeEventProperties);
    EXPECT_FALSE(config.m_sourceFromLogger);
    ASSERT_EQ(config.m_contextProperties.size(), 2u);
    EXPECT_EQ(config.m_contextProperties[0].first, "env");
    EXPECT_EQ(config.m_contextProperties[0].second, "prod");
    EXPECT_EQ(config.m_contextProperties[1].first, "region");
    EXPECT_EQ(config.m_contextProperties[1].second, "eu-west");
}

TEST_F(HecLogConfigTest, Defaults) {
    HecLogTargetConfig config;
    ASSERT_TRUE(HecLogConfigLoader::loadTargetConfig("splunk://localhost:8088?token=t", config));
    const heclog::HecLogSenderConfig& senderConfig = config.m_senderConfig;
    EXPECT_EQ(config.m_name, "splunk");
    EXPECT_EQ(senderConfig.m_serverUrl, "http://localhost:8088");
    EXPECT_EQ(senderConfig.m_token, "t");
    EXPECT_TRUE(senderConfig.m_channel.empty());
    EXPECT_TRUE(senderConfig.m_index.empty());
    EXPECT_TRUE(senderConfig.m_source.empty());
    EXPECT_EQ(senderConfig.m_sourceType, "_json");
    EXPECT_EQ(senderConfig.m_sendMode, HecLogSendMode::SM_SEQUENTIAL);

    const heclog::HecLogHttpConfig& httpConfig = senderConfig.m_httpConfig;
    EXPECT_EQ(httpConfig.m_connectTimeoutMillis, 5000u);
    EXPECT_EQ(httpConfig.m_writeTimeoutMillis, 5000u);
    EXPECT_EQ(httpConfig.m_readTimeoutMillis, 30000u);
    EXPECT_FALSE(httpConfig.m_ignoreSslErrors);
    EXPECT_FALSE(httpConfig.m_useHttpVersion10Hack);
    EXPECT_EQ(httpConfig.m_maxConnectionsPerServer, 0u);

    EXPECT_FALSE(config.m_includePositionalParameters);
    EXPECT_TRUE(config.m_includeEventProperties);
    EXPECT_TRUE(config.m_sourceFromLogger);
    EXPECT_TRUE(config.m_contextProperties.empty());
}

TEST_F(HecLogConfigTest, SchemeIsCaseInsensitive) {
    HecLogTargetConfig config;
    EXPECT_TRUE(HecLogConfigLoader::loadTargetConfig("  SPLUNK://host:1234?token=t  ", config));
    EXPECT_EQ(config.m_senderConfig.m_serverUrl, "http://host:1234");
}

TEST_F(HecLogConfigTest, InvalidSpecification) {
    RecordingReportHandler reportHandler;
    HecLogTargetConfig config;
    EXPECT_FALSE(HecLogConfigLoader::loadTargetConfig(nullptr, config));
    EXPECT_FALSE(HecLogConfigLoader::loadTargetConfig("host:8088?token=t", config));
    EXPECT_FALSE(HecLogConfigLoader::loadTargetConfig("http://host:8088?token=t", config));
    EXPECT_FALSE(HecLogConfigLoader::loadTargetConfig("splunk://host?ssl=maybe", config));
    EXPECT_FALSE(HecLogConfigLoader::loadTargetConfig("splunk://host?max_connections=-1", config));
    EXPECT_FALSE(HecLogConfigLoader::loadTargetConfig("splunk://host?max_connections=4x", config));
    EXPECT_FALSE(HecLogConfigLoader::loadTargetConfig("splunk://host?read_timeout=soon", config));
    EXPECT_FALSE(HecLogConfigLoader::loadTargetConfig("splunk://host?send_mode=random", config));
    EXPECT_FALSE(HecLogConfigLoader::loadTargetConfig("splunk://host?ctx.=value", config));
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "send_mode"), 1u);
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_ERROR, "unexpected scheme"), 1u);
}

TEST_F(HecLogConfigTest, UnknownPropertyIgnored) {
    RecordingReportHandler reportHandler;
    HecLogTargetConfig config;
    EXPECT_TRUE(HecLogConfigLoader::loadTargetConfig(
        "splunk://host:8088?token=t&colour=blue&index=main", config));
    EXPECT_EQ(config.m_senderConfig.m_index, "main");
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_WARN, "unknown collector target property "
                                                              "'colour'"),
              1u);
}

TEST_F(HecLogConfigTest, LaterPropertyWins) {
    HecLogTargetConfig config;
    EXPECT_TRUE(
        HecLogConfigLoader::loadTargetConfig("splunk://host?token=first&token=second", config));
    EXPECT_EQ(config.m_senderConfig.m_token, "second");
}

TEST_F(HecLogConfigTest, EnvironmentOverride) {
    setenv("HECLOG_TOKEN", "env-token", 1);
    setenv("HECLOG_INDEX", " env-index ", 1);
    setenv("HECLOG_SOURCE", "", 1);
    HecLogTargetConfig config;
    ASSERT_TRUE(HecLogConfigLoader::loadTargetConfig(
        "splunk://host:8088?token=cfg-token&index=cfg-index&source=cfg-source", config));
    EXPECT_EQ(config.m_senderConfig.m_token, "env-token");
    EXPECT_EQ(config.m_senderConfig.m_index, "env-index");
    // empty environment values do not override
    EXPECT_EQ(config.m_senderConfig.m_source, "cfg-source");
}

TEST_F(HecLogConfigTest, EnvironmentServerUrl) {
    setenv("HECLOG_SERVER_URL", "https://env-host:9088", 1);
    HecLogTargetConfig config;
    ASSERT_TRUE(HecLogConfigLoader::loadTargetConfig("splunk://cfg-host:8088?token=t", config));
    EXPECT_EQ(config.m_senderConfig.m_serverUrl, "https://env-host:9088");
}

TEST_F(HecLogConfigTest, SendModeNames) {
    HecLogSendMode sendMode = HecLogSendMode::SM_SEQUENTIAL;
    EXPECT_TRUE(heclog::sendModeFromString("Parallel", sendMode));
    EXPECT_EQ(sendMode, HecLogSendMode::SM_PARALLEL);
    EXPECT_TRUE(heclog::sendModeFromString("SEQUENTIAL", sendMode));
    EXPECT_EQ(sendMode, HecLogSendMode::SM_SEQUENTIAL);
    EXPECT_FALSE(heclog::sendModeFromString("batch", sendMode));
    EXPECT_STREQ(heclog::sendModeToString(HecLogSendMode::SM_PARALLEL), "parallel");
    EXPECT_STREQ(heclog::sendModeToString(HecLogSendMode::SM_SEQUENTIAL), "sequential");
}
