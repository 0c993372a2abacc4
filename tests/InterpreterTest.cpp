#include <memory>
#include <string_view>
#include <unordered_set>

#include <gtest/gtest.h>

#include "lang/Interpreter.hpp"
#include "scheduling/Batch.hpp"
#include "scheduling/BatchLoader.hpp"

using Scheduling::Batch;

namespace
{

[[nodiscard]] auto eval(const std::string_view source, const std::shared_ptr<Batch>& batch) -> bool
{
    return Interpreter::Interpreter<Batch>::eval(source, batch);
}

} // namespace

TEST(InterpreterTest, SpawnProcess)
{
    auto batch = std::make_shared<Batch>();
    ASSERT_TRUE(eval("spawn_process(\"P1\", 0, 5, 1)\nspawn_process(P2, 1, 3, 2)", batch));

    ASSERT_EQ(batch->processes.size(), 2UZ);
    EXPECT_EQ(batch->processes[0], (Os::Process { .name = "P1", .arrival = 0, .burst = 5, .priority = 1 }));
    EXPECT_EQ(batch->processes[1], (Os::Process { .name = "P2", .arrival = 1, .burst = 3, .priority = 2 }));
}

TEST(InterpreterTest, ConstantsConfigureTheBatch)
{
    auto batch = std::make_shared<Batch>();
    ASSERT_TRUE(eval(
      "quantum :: 7\ncorrected :: 1\nmax_processes :: 3\nmax_arrival_time :: 4\nmax_burst_duration :: 5\n"
      "max_priority :: 6",
      batch
    ));

    EXPECT_EQ(batch->options.quantum, 7);
    EXPECT_EQ(batch->options.compatibility, Scheduling::Compatibility::Corrected);
    EXPECT_EQ(batch->max_processes, 3UZ);
    EXPECT_EQ(batch->max_arrival_time, 4UZ);
    EXPECT_EQ(batch->max_burst_duration, 5UZ);
    EXPECT_EQ(batch->max_priority, 6UZ);
}

TEST(InterpreterTest, SchedulePolicyAcceptsStringsAndIdentifiers)
{
    auto batch = std::make_shared<Batch>();
    ASSERT_TRUE(eval("schedule_policy(\"sjf_idle\")", batch));
    EXPECT_EQ(batch->schedule_policy, Scheduling::SchedulePolicy::ShortestJobFirstIdle);

    ASSERT_TRUE(eval("schedule_policy(rr)", batch));
    EXPECT_EQ(batch->schedule_policy, Scheduling::SchedulePolicy::RoundRobin);
}

TEST(InterpreterTest, RandomProcessesStayWithinBounds)
{
    auto batch = std::make_shared<Batch>();
    ASSERT_TRUE(eval(
      "max_processes :: 20\nmax_arrival_time :: 6\nmax_burst_duration :: 4\nmax_priority :: 2\n"
      "for 0..20 { spawn_random_process() }",
      batch
    ));

    ASSERT_EQ(batch->processes.size(), 20UZ);

    std::unordered_set<std::string> names;
    for (const auto& process : batch->processes) {
        EXPECT_TRUE(names.insert(process.name).second) << process.name;
        EXPECT_GE(process.arrival, 0);
        EXPECT_LE(process.arrival, 6);
        EXPECT_GE(process.burst, 1);
        EXPECT_LE(process.burst, 4);
        EXPECT_GE(process.priority, 0);
        EXPECT_LE(process.priority, 2);
    }
}

TEST(InterpreterTest, RandomNamesSkipTakenOnes)
{
    auto batch = std::make_shared<Batch>();
    ASSERT_TRUE(eval("spawn_process(P1, 0, 1, 0)\nspawn_random_process()", batch));

    ASSERT_EQ(batch->processes.size(), 2UZ);
    EXPECT_EQ(batch->processes[1].name, "P2");
}

TEST(InterpreterTest, RandomProcessLimitIsEnforced)
{
    auto batch = std::make_shared<Batch>();
    EXPECT_FALSE(eval("max_processes :: 2\nfor 0..3 { spawn_random_process() }", batch));
    EXPECT_EQ(batch->processes.size(), 2UZ);
}

TEST(InterpreterTest, RandomProcessLimitIgnoresSkippedNames)
{
    auto batch = std::make_shared<Batch>();
    ASSERT_TRUE(eval("max_processes :: 2\nspawn_process(P1, 0, 1, 0)\nspawn_random_process()\nspawn_random_process()", batch));

    ASSERT_EQ(batch->processes.size(), 3UZ);
    EXPECT_EQ(batch->processes[1].name, "P2");
    EXPECT_EQ(batch->processes[2].name, "P3");
    EXPECT_FALSE(eval("spawn_random_process()", batch));
}

TEST(InterpreterTest, ErrorsAreReported)
{
    EXPECT_FALSE(eval("unknown_builtin()", std::make_shared<Batch>()));
    EXPECT_FALSE(eval("spawn_process(\"P1\", 0, 5)", std::make_shared<Batch>()));
    EXPECT_FALSE(eval("spawn_process(1, 0, 5, 1)", std::make_shared<Batch>()));
    EXPECT_FALSE(eval("spawn_process(\"P1\", \"zero\", 5, 1)", std::make_shared<Batch>()));
    EXPECT_FALSE(eval("schedule_policy(lottery)", std::make_shared<Batch>()));
    EXPECT_FALSE(eval("timer :: 10", std::make_shared<Batch>()));
    EXPECT_FALSE(eval("quantum :: \"fast\"", std::make_shared<Batch>()));
}

TEST(InterpreterTest, ExampleScriptsLoad)
{
    const auto simple = Scheduling::load_batch(BATCH_SCHED_EXAMPLES_DIR "/simple.sl");
    ASSERT_TRUE(simple.has_value());
    ASSERT_EQ((*simple)->processes.size(), 3UZ);
    EXPECT_EQ((*simple)->processes[1], (Os::Process { .name = "P2", .arrival = 1, .burst = 3, .priority = 2 }));
    EXPECT_FALSE((*simple)->schedule_policy.has_value());

    const auto random = Scheduling::load_batch(BATCH_SCHED_EXAMPLES_DIR "/random.sl");
    ASSERT_TRUE(random.has_value());
    EXPECT_EQ((*random)->processes.size(), 8UZ);
    EXPECT_EQ((*random)->schedule_policy, Scheduling::SchedulePolicy::RoundRobin);
    EXPECT_EQ((*random)->options.quantum, 2);
    EXPECT_EQ((*random)->options.compatibility, Scheduling::Compatibility::Corrected);

    const auto table = Scheduling::load_batch(BATCH_SCHED_EXAMPLES_DIR "/processes.csv");
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ((*table)->processes.size(), 4UZ);
}

TEST(InterpreterTest, MissingBatchFileFails)
{
    EXPECT_FALSE(Scheduling::load_batch(BATCH_SCHED_EXAMPLES_DIR "/does_not_exist.sl").has_value());
}
