#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "report/Report.hpp"

namespace
{

[[nodiscard]] auto three_process_batch() -> std::vector<Os::Process>
{
    return {
        Os::Process { .name = "P1", .arrival = 0, .burst = 5, .priority = 1 },
        Os::Process { .name = "P2", .arrival = 1, .burst = 3, .priority = 2 },
        Os::Process { .name = "P3", .arrival = 2, .burst = 8, .priority = 3 },
    };
}

} // namespace

TEST(ReportTest, TitleIsCenteredBetweenRules)
{
    std::ostringstream sink;
    Report::render_title(sink, "FCFS");

    const auto rule = std::string(Report::RULE_WIDTH, '-');
    EXPECT_EQ(sink.str(), rule + "\n" + std::string(30, ' ') + "FCFS\n" + rule + "\n");
}

TEST(ReportTest, GanttLabelsAndTimes)
{
    const auto timeline = std::vector<Os::TimeSlice> {
        { .name = "P1", .start = 0, .stop = 5 },
        { .name = "P2", .start = 5, .stop = 8 },
        { .name = "P3", .start = 8, .stop = 16 },
    };

    std::ostringstream sink;
    Report::render_gantt(sink, timeline);

    EXPECT_EQ(
      sink.str(),
      "Gantt schedule\n"
      "|   P1   |   P2   |   P3   |\n"
      "0        5        8        16\n"
      "\n"
    );
}

TEST(ReportTest, GanttWidensCellsForLongNames)
{
    const auto timeline = std::vector<Os::TimeSlice> { { .name = "compiler", .start = 0, .stop = 3 } };

    std::ostringstream sink;
    Report::render_gantt(sink, timeline);

    EXPECT_NE(sink.str().find("| compiler |"), std::string::npos);
    EXPECT_NE(sink.str().find("0          3"), std::string::npos);
}

TEST(ReportTest, EmptyTimelineWritesNothing)
{
    std::ostringstream sink;
    Report::render_gantt(sink, {});
    EXPECT_TRUE(sink.str().empty());
}

TEST(ReportTest, MetricsTableWithAverages)
{
    const auto batch    = three_process_batch();
    const auto schedule = Scheduling::first_come_first_served(batch);
    ASSERT_TRUE(schedule.has_value());

    std::ostringstream sink;
    Report::render_table(
      sink, schedule->rows, schedule->average_waiting_time, schedule->average_turnaround_time, schedule->throughput
    );

    EXPECT_EQ(
      sink.str(),
      "+----+----------+-------+---------+------+------------+--------+\n"
      "| ID | Priority | Burst | Arrival | Wait | Turnaround |   Exit |\n"
      "+----+----------+-------+---------+------+------------+--------+\n"
      "| P1 |        1 |     5 |       0 |    0 |          5 |      5 |\n"
      "| P2 |        2 |     3 |       1 |    4 |          7 |      8 |\n"
      "| P3 |        3 |     8 |       2 |    6 |         14 |     16 |\n"
      "+----+----------+-------+---------+------+------------+--------+\n"
      "|    |          |       | Average | 3.33 |       8.67 | 0.19/t |\n"
      "+----+----------+-------+---------+------+------------+--------+\n"
      "\n"
    );
}

TEST(ReportTest, PrintScheduleRendersEverySection)
{
    const auto batch = three_process_batch();

    std::ostringstream sink;
    const auto         result = Report::print_schedule(sink, "Shortest Job First", Scheduling::SchedulePolicy::ShortestJobFirst, batch);
    ASSERT_TRUE(result.has_value());

    const auto output = sink.str();
    EXPECT_NE(output.find("Shortest Job First"), std::string::npos);
    EXPECT_NE(output.find("|   P2   |   P1   |   P3   |"), std::string::npos);
    EXPECT_NE(output.find("| Average | 2.00 |"), std::string::npos);
}

TEST(ReportTest, PrintScheduleWritesNothingOnError)
{
    const auto batch = std::vector<Os::Process> { { .name = "bad", .arrival = 0, .burst = -1, .priority = 0 } };

    std::ostringstream sink;
    const auto         result = Report::print_schedule(sink, "FCFS", Scheduling::SchedulePolicy::FirstComeFirstServed, batch);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, Scheduling::ScheduleErrorKind::InvalidBurst);
    EXPECT_TRUE(sink.str().empty());
}
