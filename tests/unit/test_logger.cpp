#include <gtest/gtest.h>

#include <tether/logger.hpp>

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tether;

namespace tether::test
{

struct WorkerId
{
    int value;
};

std::string to_string(const WorkerId& id)
{
    return "worker#" + std::to_string(id.value);
}

struct Unprintable
{
};

std::string to_string(const Unprintable&)
{
    throw std::runtime_error("no text form");
}

}   // namespace tether::test

namespace
{

// Installs a capturing sink for one test and restores the logger afterwards.
class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(
            [this](const Logger::LogEntry& e)
            {
                std::lock_guard lock(mu_);
                entries_.push_back(e);
            });
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    std::vector<Logger::LogEntry> entries()
    {
        std::lock_guard lock(mu_);
        return entries_;
    }

   private:
    LogLevel                      saved_level_ = LogLevel::Info;
    std::mutex                    mu_;
    std::vector<Logger::LogEntry> entries_;
};

}   // namespace

TEST_F(LoggerTest, FormatsPlaceholders)
{
    Logger::instance().set_level(LogLevel::Trace);
    std::string surface = "overlay";
    TETHER_LOG_INFO("router", "{} ready after {} ms (flushed={})", surface, 42, true);

    auto e = entries();
    ASSERT_EQ(e.size(), 1u);
    EXPECT_EQ(e[0].category, "router");
    EXPECT_EQ(e[0].message, "overlay ready after 42 ms (flushed=true)");
    EXPECT_EQ(e[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, ExtraPlaceholdersStayVerbatim)
{
    Logger::instance().set_level(LogLevel::Trace);
    TETHER_LOG_WARN("codec", "{} and {}", "one");
    ASSERT_EQ(entries().size(), 1u);
    EXPECT_EQ(entries()[0].message, "one and {}");
}

TEST_F(LoggerTest, LevelFilters)
{
    Logger::instance().set_level(LogLevel::Warning);
    TETHER_LOG_DEBUG("supervisor", "hidden");
    TETHER_LOG_INFO("supervisor", "hidden");
    TETHER_LOG_ERROR("supervisor", "shown");
    ASSERT_EQ(entries().size(), 1u);
    EXPECT_EQ(entries()[0].message, "shown");
}

TEST(LoggerLevels, ParseLevel)
{
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(Logger::parse_level("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(Logger::parse_level("warn", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(Logger::parse_level("WARNING", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_FALSE(Logger::parse_level("verbose", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST_F(LoggerTest, DomainTypesFormatThroughToString)
{
    TETHER_LOG_INFO("supervisor", "started {}", test::WorkerId{3});

    auto e = entries();
    ASSERT_EQ(e.size(), 1u);
    EXPECT_EQ(e[0].message, "started worker#3");
}

TEST_F(LoggerTest, FormattingFailureIsLoggedNotThrown)
{
    EXPECT_NO_THROW(TETHER_LOG_WARN("router", "payload {}", test::Unprintable{}));

    auto e = entries();
    ASSERT_EQ(e.size(), 1u);
    EXPECT_EQ(e[0].level, LogLevel::Error);
    EXPECT_EQ(e[0].category, "logger");
    EXPECT_EQ(e[0].message, "Format error: no text form");
}
