#include <gtest/gtest.h>

#include "log.h"

using namespace bpocv;

TEST(LogLevelTest, KnownNames)
{
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
}

TEST(LogLevelTest, UnsetAndUnknownUseBuildDefault)
{
    const spdlog::level::level_enum def = parse_log_level(nullptr);
#ifdef NDEBUG
    EXPECT_EQ(def, spdlog::level::info);
#else
    EXPECT_EQ(def, spdlog::level::debug);
#endif
    EXPECT_EQ(parse_log_level("warning"), def);
    EXPECT_EQ(parse_log_level("verbose"), def);
    EXPECT_EQ(parse_log_level("ERROR"), def);
    EXPECT_EQ(parse_log_level(""), def);
}

TEST(LogLevelTest, LoggerIsNamedAndShared)
{
    auto log = logger();
    ASSERT_TRUE(log);
    EXPECT_EQ(log->name(), "bpocv");
    EXPECT_EQ(logger(), log);
}
