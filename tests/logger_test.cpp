#include <sluice/logger.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace sluice;

namespace
{

struct record
{
    LogLevel level;
    std::string component;
    std::string message;
};

class LoggerTest : public ::testing::Test {
protected:
    std::vector<record> records;
    LogLevel saved_level{LogLevel::Info};

    void SetUp() override
    {
        saved_level = Logger::instance().level();
        Logger::instance().set_sink([this](LogLevel level, std::string_view component, std::string_view message) {
            records.push_back({level, std::string(component), std::string(message)});
        });
    }

    void TearDown() override
    {
        Logger::instance().set_sink({});
        Logger::instance().set_level(saved_level);
    }
};

} // namespace

TEST_F(LoggerTest, RoutesToSinkWithComponent)
{
    Logger::instance().set_level(LogLevel::Debug);
    log_info("STREAMING_MANAGER", "hello");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Info);
    EXPECT_EQ(records[0].component, "STREAMING_MANAGER");
    EXPECT_EQ(records[0].message, "hello");
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel)
{
    Logger::instance().set_level(LogLevel::Warning);
    log_debug("c", "dropped");
    log_info("c", "dropped");
    log_warning("c", "kept");
    log_error("c", "kept");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].level, LogLevel::Warning);
    EXPECT_EQ(records[1].level, LogLevel::Error);
    EXPECT_FALSE(Logger::instance().enabled(LogLevel::Info));
}

TEST_F(LoggerTest, SinkMayLogThroughLogger)
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().set_sink([this](LogLevel level, std::string_view component, std::string_view message) {
        records.push_back({level, std::string(component), std::string(message)});
        if (component != "sink")
            log_info("sink", "forwarded");
    });

    log_error("c", "original");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].message, "original");
    EXPECT_EQ(records[1].component, "sink");
    EXPECT_EQ(records[1].message, "forwarded");
}

TEST(LogLevelNames, AllLevelsNamed)
{
    EXPECT_EQ(to_string(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(to_string(LogLevel::Info), "INFO");
    EXPECT_EQ(to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(to_string(LogLevel::Error), "ERROR");
}
