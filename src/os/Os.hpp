#pragma once

#include <cassert>
#include <cstdint>
#include <format>
#include <print>
#include <string>
#include <utility>

namespace Os
{

struct [[nodiscard]] Process final
{
    std::string  name;
    std::int64_t arrival  = 0;
    std::int64_t burst    = 0;
    std::int64_t priority = 0;

    [[nodiscard]] auto operator==(const Process&) const -> bool = default;
};

// One contiguous interval during which `name` owns the CPU.
struct [[nodiscard]] TimeSlice final
{
    std::string  name;
    std::int64_t start = 0;
    std::int64_t stop  = 0;

    [[nodiscard]] auto operator==(const TimeSlice&) const -> bool = default;
};

struct [[nodiscard]] MetricsRow final
{
    std::string  name;
    std::int64_t priority   = 0;
    std::int64_t burst      = 0;
    std::int64_t arrival    = 0;
    std::int64_t waiting    = 0;
    std::int64_t turnaround = 0;
    std::int64_t completion = 0;

    [[nodiscard]] auto operator==(const MetricsRow&) const -> bool = default;
};

} // namespace Os

template<>
struct std::formatter<Os::Process>
{
    constexpr auto parse(auto& ctx)
    {
        auto       it  = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it == 's') {
            line_mode = LineMode::SingleLine;
            ++it;
        } else if (it != end && *it == 'm') {
            line_mode = LineMode::Multiline;
            ++it;
        }

        if (it != end && *it != '}') { throw std::format_error("invalid format"); }

        return it;
    }

    auto format(const Os::Process& process, auto& ctx) const
    {
        switch (line_mode) {
            case LineMode::Multiline: {
                return std::format_to(
                  ctx.out(),
                  "Process {{\n    name: {},\n    arrival: {},\n    burst: {},\n    priority: {}\n}}",
                  process.name,
                  process.arrival,
                  process.burst,
                  process.priority
                );
            }
            case LineMode::SingleLine: {
                return std::format_to(
                  ctx.out(),
                  "Process {{ name: {}, arrival: {}, burst: {}, priority: {} }}",
                  process.name,
                  process.arrival,
                  process.burst,
                  process.priority
                );
            }
        }

        assert(false && "unreachable");
        return ctx.out();
    }

  private:
    enum class LineMode : std::uint8_t
    {
        SingleLine = 0,
        Multiline,
    };

    LineMode line_mode = LineMode::SingleLine;
};

template<>
struct std::formatter<Os::TimeSlice>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Os::TimeSlice& slice, auto& ctx) const
    {
        return std::format_to(ctx.out(), "TimeSlice {{ name: {}, start: {}, stop: {} }}", slice.name, slice.start, slice.stop);
    }
};

template<>
struct std::formatter<Os::MetricsRow>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Os::MetricsRow& row, auto& ctx) const
    {
        return std::format_to(
          ctx.out(),
          "MetricsRow {{ name: {}, priority: {}, burst: {}, arrival: {}, waiting: {}, turnaround: {}, completion: {} }}",
          row.name,
          row.priority,
          row.burst,
          row.arrival,
          row.waiting,
          row.turnaround,
          row.completion
        );
    }
};
