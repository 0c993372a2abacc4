#include <array>
#include <optional>
#include <span>
#include <vector>

#include <gtest/gtest.h>

#include "cli/CommandLine.hpp"

using Scheduling::Batch;
using Scheduling::Compatibility;
using Scheduling::SchedulePolicy;

namespace
{

template<std::size_t N>
[[nodiscard]] auto parse(const std::array<const char*, N>& args) -> std::optional<Cli::CommandLine>
{
    return Cli::parse_command_line(std::span<const char* const> { args });
}

[[nodiscard]] auto script_batch() -> Batch
{
    auto batch                  = Batch {};
    batch.schedule_policy       = SchedulePolicy::RoundRobin;
    batch.options.quantum       = 2;
    batch.options.compatibility = Compatibility::Reference;
    return batch;
}

} // namespace

TEST(CommandLineTest, BatchPathAndFlags)
{
    const auto command_line = parse(std::array {
      "batch-sched", "--policy", "sjf", "--policy", "rr", "--quantum", "3", "--corrected", "--permissive-ids",
      "--output", "report.txt", "batch.sl",
    });
    ASSERT_TRUE(command_line.has_value());

    EXPECT_FALSE(command_line->help);
    EXPECT_EQ(command_line->batch_path.string(), "batch.sl");
    EXPECT_EQ(
      command_line->policies, (std::vector { SchedulePolicy::ShortestJobFirst, SchedulePolicy::RoundRobin })
    );
    EXPECT_EQ(command_line->quantum, 3);
    ASSERT_TRUE(command_line->output_path.has_value());
    EXPECT_EQ(command_line->output_path->string(), "report.txt");
    EXPECT_TRUE(command_line->corrected);
    EXPECT_TRUE(command_line->permissive);
}

TEST(CommandLineTest, HelpIsNotAnError)
{
    const auto command_line = parse(std::array { "batch-sched", "--help" });
    ASSERT_TRUE(command_line.has_value());
    EXPECT_TRUE(command_line->help);
}

TEST(CommandLineTest, BadArgumentsFail)
{
    EXPECT_FALSE(parse(std::array { "batch-sched" }).has_value());
    EXPECT_FALSE(parse(std::array { "batch-sched", "--corrected" }).has_value());
    EXPECT_FALSE(parse(std::array { "batch-sched", "--fast", "batch.sl" }).has_value());
    EXPECT_FALSE(parse(std::array { "batch-sched", "--policy", "lottery", "batch.sl" }).has_value());
    EXPECT_FALSE(parse(std::array { "batch-sched", "--quantum", "two", "batch.sl" }).has_value());
    EXPECT_FALSE(parse(std::array { "batch-sched", "batch.sl", "--quantum" }).has_value());
    EXPECT_FALSE(parse(std::array { "batch-sched", "a.sl", "b.sl" }).has_value());
}

TEST(CommandLineTest, ScriptConfigurationIsKeptWithoutFlags)
{
    const auto command_line = parse(std::array { "batch-sched", "batch.sl" });
    ASSERT_TRUE(command_line.has_value());

    const auto plan = Cli::resolve_run(*command_line, script_batch());
    EXPECT_EQ(plan.policies, (std::vector { SchedulePolicy::RoundRobin }));
    EXPECT_EQ(plan.options.quantum, 2);
    EXPECT_EQ(plan.options.compatibility, Compatibility::Reference);
    EXPECT_TRUE(plan.options.strict_ids);
}

TEST(CommandLineTest, FlagsOverrideScriptConfiguration)
{
    const auto command_line = parse(std::array {
      "batch-sched", "--quantum", "5", "--corrected", "--permissive-ids", "--policy", "fcfs", "batch.sl",
    });
    ASSERT_TRUE(command_line.has_value());

    const auto plan = Cli::resolve_run(*command_line, script_batch());
    EXPECT_EQ(plan.policies, (std::vector { SchedulePolicy::FirstComeFirstServed }));
    EXPECT_EQ(plan.options.quantum, 5);
    EXPECT_EQ(plan.options.compatibility, Compatibility::Corrected);
    EXPECT_FALSE(plan.options.strict_ids);
}

TEST(CommandLineTest, AllPoliciesRunWhenNoneIsSelected)
{
    const auto command_line = parse(std::array { "batch-sched", "batch.csv" });
    ASSERT_TRUE(command_line.has_value());

    const auto plan = Cli::resolve_run(*command_line, Batch {});
    EXPECT_EQ(plan.policies, (std::vector<SchedulePolicy>(Scheduling::ALL_POLICIES.begin(), Scheduling::ALL_POLICIES.end())));
    EXPECT_EQ(plan.options.quantum, 4);
}
