#include <stdexcept>
#include <string>

#include "heclog_common.h"
#include "heclog_metadata.h"
#include "heclog_test_common.h"

using heclog::HecLogHostResolver;
using heclog::HecLogMetadataCache;
using heclog::HecLogMetadataPtr;

TEST(HecLogMetadata, CacheBySource) {
    HecLogMetadataCache cache(makeTestHostResolver());
    HecLogMetadataPtr first = cache.get("main", "app", "custom");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->getIndex(), "main");
    EXPECT_EQ(first->getSource(), "app");
    EXPECT_EQ(first->getSourceType(), "custom");
    EXPECT_EQ(first->getHost(), TEST_HOST_NAME);

    // later lookups with the same source return the first-seen tuple
    HecLogMetadataPtr second = cache.get("other", "app", "other-type");
    EXPECT_EQ(second.get(), first.get());
    EXPECT_EQ(second->getIndex(), "main");
    EXPECT_EQ(second->getSourceType(), "custom");

    HecLogMetadataPtr third = cache.get("main", "worker", "custom");
    EXPECT_NE(third.get(), first.get());
    EXPECT_EQ(cache.size(), 2u);
}

TEST(HecLogMetadata, DefaultSourceType) {
    HecLogMetadataCache cache(makeTestHostResolver());
    HecLogMetadataPtr metadata = cache.get("", "", "");
    EXPECT_EQ(metadata->getSourceType(), HECLOG_DEFAULT_SOURCETYPE);
    EXPECT_EQ(metadata->getSourceType(), "_json");
    EXPECT_TRUE(metadata->getIndex().empty());
    EXPECT_TRUE(metadata->getSource().empty());
}

TEST(HecLogMetadata, CacheOverflow) {
    HecLogMetadataCache cache(makeTestHostResolver());
    for (int i = 0; i <= HECLOG_METADATA_CACHE_LIMIT; ++i) {
        cache.get("", "source-" + std::to_string(i), "");
    }
    EXPECT_EQ(cache.size(), (size_t)HECLOG_METADATA_CACHE_LIMIT + 1);

    // the next distinct source clears everything before being inserted
    HecLogMetadataPtr metadata = cache.get("", "one-too-many", "");
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(metadata->getSource(), "one-too-many");

    // existing entries are still served from the cache without clearing
    cache.get("", "one-too-many", "");
    EXPECT_EQ(cache.size(), 1u);
}

TEST(HecLogMetadata, HostResolvedOnce) {
    int callCount = 0;
    std::vector<std::pair<std::string, HecLogHostResolver::Lookup>> lookups;
    lookups.push_back({"counting", [&callCount]() {
                           ++callCount;
                           return std::string("host-") + std::to_string(callCount);
                       }});
    HecLogMetadataCache cache((HecLogHostResolver(lookups)));
    EXPECT_EQ(callCount, 0);
    EXPECT_EQ(cache.get("", "a", "")->getHost(), "host-1");
    EXPECT_EQ(cache.get("", "b", "")->getHost(), "host-1");
    cache.clear();
    EXPECT_EQ(cache.get("", "c", "")->getHost(), "host-1");
    EXPECT_EQ(cache.getHostName(), "host-1");
    EXPECT_EQ(callCount, 1);
}

TEST(HecLogMetadata, ResolverChain) {
    RecordingReportHandler reportHandler;
    std::vector<std::pair<std::string, HecLogHostResolver::Lookup>> lookups;
    lookups.push_back({"throwing", []() -> std::string {
                           throw std::runtime_error("lookup unavailable");
                       }});
    lookups.push_back({"empty", []() { return std::string(); }});
    lookups.push_back({"blank", []() { return std::string("  \t "); }});
    lookups.push_back({"padded", []() { return std::string("  box-7 \n"); }});
    lookups.push_back({"never", []() { return std::string("not-reached"); }});
    HecLogHostResolver resolver(lookups);
    EXPECT_EQ(resolver.resolve(), "box-7");
    EXPECT_EQ(reportHandler.countReports(heclog::HLEVEL_WARN, "lookup unavailable"), 1u);
}

TEST(HecLogMetadata, ResolverAllEmpty) {
    RecordingReportHandler reportHandler;
    std::vector<std::pair<std::string, HecLogHostResolver::Lookup>> lookups;
    lookups.push_back({"empty", []() { return std::string(); }});
    lookups.push_back({"throwing", []() -> std::string {
                           throw std::runtime_error("no network");
                       }});
    HecLogHostResolver resolver(lookups);
    EXPECT_EQ(resolver.resolve(), "");

    HecLogMetadataCache cache(resolver);
    EXPECT_EQ(cache.get("", "app", "")->getHost(), "");
}

TEST(HecLogMetadata, DefaultResolver) {
    // whatever the machine reports, the result is trimmed and resolution does not fail
    HecLogHostResolver resolver;
    std::string hostName = resolver.resolve();
    EXPECT_EQ(hostName, heclog::trim(hostName));
}
