#include <vector>

#include <gtest/gtest.h>

#include "os/ProcessLoader.hpp"

TEST(ProcessLoaderTest, HeaderRowIsSkipped)
{
    const auto processes = Os::parse_processes_csv("name, burst, arrival, priority\nP1, 5, 0, 1\nP2, 3, 1, 2\n");
    ASSERT_TRUE(processes.has_value());

    const auto expected = std::vector<Os::Process> {
        { .name = "P1", .arrival = 0, .burst = 5, .priority = 1 },
        { .name = "P2", .arrival = 1, .burst = 3, .priority = 2 },
    };
    EXPECT_EQ(*processes, expected);
}

TEST(ProcessLoaderTest, TableWithoutHeader)
{
    const auto processes = Os::parse_processes_csv("A,2,0,0\r\n\r\nB,4,3,1\r\n");
    ASSERT_TRUE(processes.has_value());
    ASSERT_EQ(processes->size(), 2UZ);
    EXPECT_EQ(processes->front().name, "A");
    EXPECT_EQ(processes->back().arrival, 3);
}

TEST(ProcessLoaderTest, NegativeValuesAreLoadedAndLeftToValidation)
{
    const auto processes = Os::parse_processes_csv("X, -2, -1, 0");
    ASSERT_TRUE(processes.has_value());
    EXPECT_EQ(processes->front().burst, -2);
    EXPECT_EQ(processes->front().arrival, -1);
}

TEST(ProcessLoaderTest, MalformedRowsFail)
{
    EXPECT_FALSE(Os::parse_processes_csv("P1, 5, 0").has_value());
    EXPECT_FALSE(Os::parse_processes_csv("P1, 5, 0, 1, 9").has_value());
    EXPECT_FALSE(Os::parse_processes_csv("P1, 5, 0, 1\nP2, five, 0, 1").has_value());
    EXPECT_FALSE(Os::parse_processes_csv("P1, 5, 0, 1\n, 5, 0, 1").has_value());
    EXPECT_FALSE(Os::parse_processes_csv("P1, 5, 0, 1.5").has_value());
}

TEST(ProcessLoaderTest, TypoInFirstRowIsNotTakenForHeader)
{
    EXPECT_FALSE(Os::parse_processes_csv("P1, 5x, 0, 1\nP2, 3, 1, 2").has_value());
    EXPECT_FALSE(Os::parse_processes_csv("P1, 5, zero, 1").has_value());
}

TEST(ProcessLoaderTest, EmptyTable)
{
    const auto processes = Os::parse_processes_csv("name, burst, arrival, priority\n");
    ASSERT_TRUE(processes.has_value());
    EXPECT_TRUE(processes->empty());
}

TEST(ProcessLoaderTest, MissingFileFails)
{
    EXPECT_FALSE(Os::load_processes_from_csv("/nonexistent/processes.csv").has_value());
}
