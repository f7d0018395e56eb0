#include <agentbridge/version.hpp>
#include <gtest/gtest.h>

TEST(VersionTest, VersionString)
{
    std::string version = agentbridge::version_string();
    EXPECT_FALSE(version.empty());
    std::string expected = std::to_string(agentbridge::VERSION_MAJOR) + "." +
                           std::to_string(agentbridge::VERSION_MINOR) + "." +
                           std::to_string(agentbridge::VERSION_PATCH);
    EXPECT_EQ(version, expected);
}

TEST(VersionTest, VersionConstants)
{
    EXPECT_GE(agentbridge::VERSION_MAJOR, 0);
    EXPECT_GE(agentbridge::VERSION_MINOR, 0);
    EXPECT_GE(agentbridge::VERSION_PATCH, 0);
}
