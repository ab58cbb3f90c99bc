#include "logger/Logger.h"
#include "logger/PruneSpam.h"
#include <cstring>
#include <gtest/gtest.h>

namespace
{
class LevelGuard
{
public:
    LevelGuard() : _saved(logger::_logLevel.load()) {}
    ~LevelGuard() { logger::setLevel(_saved); }

private:
    const logger::Level _saved;
};
} // namespace

TEST(LoggerTest, parseLevelNames)
{
    logger::Level level = logger::Level::INFO;
    EXPECT_TRUE(logger::parseLevel("ERROR", level));
    EXPECT_EQ(level, logger::Level::ERROR);
    EXPECT_TRUE(logger::parseLevel("DBG", level));
    EXPECT_EQ(level, logger::Level::DBG);
    EXPECT_TRUE(logger::parseLevel("DEBUG", level));
    EXPECT_EQ(level, logger::Level::DBG);

    EXPECT_FALSE(logger::parseLevel("verbose", level));
    EXPECT_EQ(level, logger::Level::DBG);
    EXPECT_STREQ(logger::toString(logger::Level::WARN), "WARN");
}

TEST(LoggerTest, levelFiltersLines)
{
    LevelGuard guard;
    logger::setLevel(logger::Level::WARN);
    EXPECT_TRUE(logger::isEnabled(logger::Level::ERROR));
    EXPECT_FALSE(logger::isEnabled(logger::Level::INFO));

    const auto before = logger::getLineCount();
    logger::debug("not written %d", "LoggerTest", 1);
    logger::info("not written %d", "LoggerTest", 2);
    EXPECT_EQ(logger::getLineCount(), before);

    logger::warn("written %d", "LoggerTest", 3);
    logger::error("written %d", "LoggerTest", 4);
    EXPECT_EQ(logger::getLineCount(), before + 2);
}

TEST(LoggerTest, loggableIdsAreUnique)
{
    logger::LoggableId a("Sctp");
    logger::LoggableId b("Sctp");
    EXPECT_NE(a.getInstanceId(), b.getInstanceId());
    EXPECT_EQ(std::strncmp(a.c_str(), "Sctp-", 5), 0);

    logger::LoggableId fixed("Dtls", 42);
    EXPECT_STREQ(fixed.c_str(), "Dtls-42");
}

TEST(LoggerTest, pruneSpamPassesFirstThenEveryNth)
{
    logger::PruneSpam prune(2, 5);
    int logged = 0;
    for (int i = 0; i < 22; ++i)
    {
        if (prune.canLog())
        {
            ++logged;
        }
    }
    // events 0, 1 then 2, 7, 12, 17
    EXPECT_EQ(logged, 6);
    EXPECT_EQ(prune.getEventCount(), 22u);
}
