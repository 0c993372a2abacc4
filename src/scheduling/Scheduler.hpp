#pragma once

#include <array>
#include <cassert>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "os/Os.hpp"

namespace Scheduling
{

enum class [[nodiscard]] SchedulePolicy : std::uint8_t
{
    FirstComeFirstServed = 0,
    ShortestJobFirst,
    ShortestJobFirstIdle,
    RoundRobin,
    Count,
};

constexpr static auto ALL_POLICIES = std::array {
    SchedulePolicy::FirstComeFirstServed,
    SchedulePolicy::ShortestJobFirst,
    SchedulePolicy::ShortestJobFirstIdle,
    SchedulePolicy::RoundRobin,
};

[[nodiscard]] auto schedule_policy_try_from_str(std::string_view str) -> std::optional<SchedulePolicy>;
[[nodiscard]] auto schedule_policy_name(SchedulePolicy policy) -> std::string_view;

// Reference reproduces the historical arithmetic bit for bit, defects included.
enum class [[nodiscard]] Compatibility : std::uint8_t
{
    Reference = 0,
    Corrected,
};

enum class [[nodiscard]] ScheduleErrorKind : std::uint8_t
{
    EmptyBatch = 0,
    InvalidBurst,
    InvalidArrival,
    DuplicateProcessId,
    InvalidQuantum,
    Count,
};

struct [[nodiscard]] ScheduleError final
{
    ScheduleErrorKind kind;
    std::string       process = {};
    std::int64_t      value   = 0;

    [[nodiscard]] auto operator==(const ScheduleError&) const -> bool = default;
};

struct [[nodiscard]] Options final
{
    Compatibility compatibility = Compatibility::Reference;
    std::int64_t  quantum       = 4;
    bool          strict_ids    = true;
};

struct [[nodiscard]] Schedule final
{
    SchedulePolicy              policy;
    std::vector<Os::TimeSlice>  timeline;
    std::vector<Os::MetricsRow> rows;

    double average_waiting_time    = 0.0;
    double average_turnaround_time = 0.0;
    double throughput              = 0.0;
};

using ScheduleResult = std::expected<Schedule, ScheduleError>;

[[nodiscard]] auto validate(SchedulePolicy policy, std::span<const Os::Process> processes, const Options& options)
  -> std::optional<ScheduleError>;

// Stable: processes with equal bursts keep their input order.
[[nodiscard]] auto sorted_by_burst(std::span<const Os::Process> processes) -> std::vector<Os::Process>;

[[nodiscard]] auto first_come_first_served(std::span<const Os::Process> processes, const Options& options = {})
  -> ScheduleResult;
[[nodiscard]] auto shortest_job_first(std::span<const Os::Process> processes, const Options& options = {})
  -> ScheduleResult;
[[nodiscard]] auto shortest_job_first_idle(std::span<const Os::Process> processes, const Options& options = {})
  -> ScheduleResult;
[[nodiscard]] auto round_robin(std::span<const Os::Process> processes, const Options& options = {}) -> ScheduleResult;

[[nodiscard]] auto run(SchedulePolicy policy, std::span<const Os::Process> processes, const Options& options = {})
  -> ScheduleResult;

} // namespace Scheduling

template<>
struct std::formatter<Scheduling::SchedulePolicy>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Scheduling::SchedulePolicy policy, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}", Scheduling::schedule_policy_name(policy));
    }
};

template<>
struct std::formatter<Scheduling::Compatibility>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Scheduling::Compatibility compatibility, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "{}", compatibility == Scheduling::Compatibility::Reference ? "reference" : "corrected"
        );
    }
};

template<>
struct std::formatter<Scheduling::ScheduleError>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Scheduling::ScheduleError& error, auto& ctx) const
    {
        static_assert(
          std::to_underlying(Scheduling::ScheduleErrorKind::Count) == 5,
          "Exhaustive handling of all enum variants for ScheduleErrorKind is required."
        );

        using Scheduling::ScheduleErrorKind;
        switch (error.kind) {
            case ScheduleErrorKind::EmptyBatch: {
                return std::format_to(ctx.out(), "empty batch: at least one process is required");
            }
            case ScheduleErrorKind::InvalidBurst: {
                return std::format_to(
                  ctx.out(), "invalid burst duration {} for process `{}`: must be positive", error.value, error.process
                );
            }
            case ScheduleErrorKind::InvalidArrival: {
                return std::format_to(
                  ctx.out(), "invalid arrival time {} for process `{}`: must not be negative", error.value, error.process
                );
            }
            case ScheduleErrorKind::DuplicateProcessId: {
                return std::format_to(ctx.out(), "duplicate process id `{}`", error.process);
            }
            case ScheduleErrorKind::InvalidQuantum: {
                return std::format_to(ctx.out(), "invalid quantum {}: must be positive", error.value);
            }
            default: {
                assert(false && "unreachable");
                return ctx.out();
            }
        }
    }
};
