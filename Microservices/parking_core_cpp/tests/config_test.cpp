#include "config.h"
#include "logger.h"
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

using namespace nprpark;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnvironment(); }
    void TearDown() override { clearEnvironment(); }

    static void clearEnvironment() {
        for (const char* name : {"HOST", "PORT", "DATASET_PATH", "ZONE_MAPPING_PATH",
                                 "TIMEZONE", "TIMEZONE_DB", "MAX_SPAN_DAYS", "LOG_LEVEL"}) {
            unsetenv(name);
        }
    }
};

} // namespace

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    Config config;
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 5001);
    EXPECT_EQ(config.dataset_path, "data/dataset.json");
    EXPECT_EQ(config.zone_mapping_path, "data/zone_mapping.json");
    EXPECT_EQ(config.timezone, "Europe/Amsterdam");
    EXPECT_EQ(config.timezone_db_path, "data/timezones.csv");
    EXPECT_EQ(config.max_span_days, 31);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST_F(ConfigTest, ReadsEnvironment) {
    setenv("HOST", "127.0.0.1", 1);
    setenv("PORT", "8080", 1);
    setenv("DATASET_PATH", "/srv/npr/dataset.json", 1);
    setenv("TIMEZONE", "Europe/Brussels", 1);
    setenv("TIMEZONE_DB", "/etc/npr/timezones.csv", 1);
    setenv("MAX_SPAN_DAYS", "7", 1);
    setenv("LOG_LEVEL", "debug", 1);

    Config config;
    EXPECT_EQ(config.timezone, "Europe/Brussels");
    EXPECT_EQ(config.timezone_db_path, "/etc/npr/timezones.csv");
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.dataset_path, "/srv/npr/dataset.json");
    EXPECT_EQ(config.max_span_days, 7);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST_F(ConfigTest, InvalidValuesFallBackToDefaults) {
    setenv("PORT", "http", 1);
    setenv("MAX_SPAN_DAYS", "-3", 1);
    setenv("LOG_LEVEL", "loud", 1);

    Config config;
    EXPECT_EQ(config.port, 5001);
    EXPECT_EQ(config.max_span_days, 31);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST(LoggerTest, ParsesLevelNames) {
    LogLevel level;
    EXPECT_TRUE(parseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parseLogLevel("ERROR", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_STREQ(logLevelName(LogLevel::DEBUG), "DEBUG");
}

TEST(LoggerTest, GeneratesVersion4Uuids) {
    std::string uuid = generateUUID();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
    EXPECT_NE(uuid, generateUUID());
}

TEST(LoggerTest, TimestampIsUtcIso8601) {
    std::string ts = getCurrentTimestamp();
    ASSERT_EQ(ts.size(), 20u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}
