#include "Report.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <iterator>
#include <print>
#include <string>
#include <vector>

namespace Report
{

namespace
{

constexpr static auto TABLE_HEADERS = std::array<std::string_view, 7> {
    "ID", "Priority", "Burst", "Arrival", "Wait", "Turnaround", "Exit",
};

using TableRow = std::array<std::string, TABLE_HEADERS.size()>;

[[nodiscard]] auto row_cells(const Os::MetricsRow& row) -> TableRow
{
    return TableRow {
        row.name,
        std::format("{}", row.priority),
        std::format("{}", row.burst),
        std::format("{}", row.arrival),
        std::format("{}", row.waiting),
        std::format("{}", row.turnaround),
        std::format("{}", row.completion),
    };
}

void render_separator(std::ostream& sink, const std::span<const std::size_t> widths)
{
    std::print(sink, "+");
    for (const auto width : widths) { std::print(sink, "{}+", std::string(width + 2, '-')); }
    std::println(sink, "");
}

void render_cells(std::ostream& sink, const std::span<const std::string> cells, const std::span<const std::size_t> widths)
{
    std::print(sink, "|");
    for (std::size_t column = 0; column < cells.size(); ++column) {
        // First column is the process name, left aligned; the rest are numbers.
        if (column == 0) {
            std::print(sink, " {:<{}} |", cells[column], widths[column]);
        } else {
            std::print(sink, " {:>{}} |", cells[column], widths[column]);
        }
    }
    std::println(sink, "");
}

} // namespace

void render_title(std::ostream& sink, const std::string_view title)
{
    const auto rule    = std::string(RULE_WIDTH, '-');
    const auto padding = title.size() < RULE_WIDTH ? (RULE_WIDTH - title.size()) / 2 : 0;

    std::println(sink, "{}", rule);
    std::println(sink, "{}{}", std::string(padding, ' '), title);
    std::println(sink, "{}", rule);
}

void render_gantt(std::ostream& sink, const std::span<const Os::TimeSlice> timeline)
{
    if (timeline.empty()) { return; }

    std::vector<std::size_t> widths;
    widths.reserve(timeline.size());
    for (const auto& slice : timeline) { widths.push_back(std::max(MIN_CELL_WIDTH, slice.name.size() + 2)); }

    std::println(sink, "Gantt schedule");

    std::print(sink, "|");
    for (std::size_t idx = 0; idx < timeline.size(); ++idx) {
        std::print(sink, "{:^{}}|", timeline[idx].name, widths[idx]);
    }
    std::println(sink, "");

    for (std::size_t idx = 0; idx < timeline.size(); ++idx) {
        std::print(sink, "{:<{}}", timeline[idx].start, widths[idx] + 1);
    }
    std::println(sink, "{}", timeline.back().stop);
    std::println(sink, "");
}

void render_table(
  std::ostream&                         sink,
  const std::span<const Os::MetricsRow> rows,
  const double                          average_waiting_time,
  const double                          average_turnaround_time,
  const double                          throughput
)
{
    std::vector<TableRow> body;
    body.reserve(rows.size());
    std::ranges::transform(rows, std::back_inserter(body), row_cells);

    const auto footer = TableRow {
        "",
        "",
        "",
        "Average",
        std::format("{:.2f}", average_waiting_time),
        std::format("{:.2f}", average_turnaround_time),
        std::format("{:.2f}/t", throughput),
    };

    std::array<std::size_t, TABLE_HEADERS.size()> widths {};
    for (std::size_t column = 0; column < TABLE_HEADERS.size(); ++column) {
        widths[column] = std::max(TABLE_HEADERS[column].size(), footer[column].size());
        for (const auto& cells : body) { widths[column] = std::max(widths[column], cells[column].size()); }
    }

    TableRow header;
    std::ranges::transform(TABLE_HEADERS, header.begin(), [](const auto& title) { return std::string { title }; });

    render_separator(sink, widths);
    render_cells(sink, header, widths);
    render_separator(sink, widths);
    for (const auto& cells : body) { render_cells(sink, cells, widths); }
    render_separator(sink, widths);
    render_cells(sink, footer, widths);
    render_separator(sink, widths);
    std::println(sink, "");
}

void render(std::ostream& sink, const std::string_view title, const Scheduling::Schedule& schedule)
{
    render_title(sink, title);
    render_gantt(sink, schedule.timeline);
    render_table(
      sink, schedule.rows, schedule.average_waiting_time, schedule.average_turnaround_time, schedule.throughput
    );
}

auto print_schedule(
  std::ostream&                      sink,
  const std::string_view             title,
  const Scheduling::SchedulePolicy   policy,
  const std::span<const Os::Process> processes,
  const Scheduling::Options&         options
) -> std::expected<void, Scheduling::ScheduleError>
{
    const auto schedule = Scheduling::run(policy, processes, options);
    if (!schedule) { return std::unexpected(schedule.error()); }

    render(sink, title, *schedule);
    return {};
}

} // namespace Report
