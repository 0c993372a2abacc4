#pragma once

#include <expected>
#include <ostream>
#include <span>
#include <string_view>

#include "os/Os.hpp"
#include "scheduling/Scheduler.hpp"

namespace Report
{

constexpr static auto RULE_WIDTH     = 64UZ;
constexpr static auto MIN_CELL_WIDTH = 8UZ;

void render_title(std::ostream& sink, std::string_view title);

// Writes nothing for an empty timeline.
void render_gantt(std::ostream& sink, std::span<const Os::TimeSlice> timeline);

void render_table(
  std::ostream&                   sink,
  std::span<const Os::MetricsRow> rows,
  double                          average_waiting_time,
  double                          average_turnaround_time,
  double                          throughput
);

void render(std::ostream& sink, std::string_view title, const Scheduling::Schedule& schedule);

// Runs `policy` over `processes` and renders the outcome; nothing is written when validation fails.
[[nodiscard]] auto print_schedule(
  std::ostream&                sink,
  std::string_view             title,
  Scheduling::SchedulePolicy   policy,
  std::span<const Os::Process> processes,
  const Scheduling::Options&   options = {}
) -> std::expected<void, Scheduling::ScheduleError>;

} // namespace Report
