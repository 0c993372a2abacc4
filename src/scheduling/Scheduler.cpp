#include "Scheduler.hpp"

#include <algorithm>
#include <deque>
#include <numeric>
#include <print>
#include <ranges>
#include <unordered_set>
#include <utility>

#include "Util.hpp"

namespace Scheduling
{

namespace
{

struct [[nodiscard]] SequentialRules final
{
    bool sort_by_burst    = false;
    bool clamp_waiting    = false;
    bool wait_for_arrival = false;
};

[[nodiscard]] auto summarize(
  const SchedulePolicy          policy,
  std::vector<Os::TimeSlice>&&  timeline,
  std::vector<Os::MetricsRow>&& rows,
  const std::int64_t            last_completion
) -> Schedule
{
    const auto count = static_cast<double>(rows.size());

    const auto total_waiting = std::accumulate(rows.begin(), rows.end(), 0.0, [](double acc, const auto& row) {
        return acc + static_cast<double>(row.waiting);
    });
    const auto total_turnaround = std::accumulate(rows.begin(), rows.end(), 0.0, [](double acc, const auto& row) {
        return acc + static_cast<double>(row.turnaround);
    });

    // Stale waiting values can drive the reference completion to zero or below.
    const auto throughput = last_completion > 0 ? count / static_cast<double>(last_completion) : 0.0;

    return Schedule {
        .policy                  = policy,
        .timeline                = std::move(timeline),
        .rows                    = std::move(rows),
        .average_waiting_time    = total_waiting / count,
        .average_turnaround_time = total_turnaround / count,
        .throughput              = throughput,
    };
}

// Shared clock loop of FCFS, SJF and SJF-idle: every process runs once, in order.
[[nodiscard]] auto run_sequential(
  const SchedulePolicy               policy,
  const std::span<const Os::Process> processes,
  const Options&                     options,
  const SequentialRules              rules
) -> ScheduleResult
{
    if (auto error = validate(policy, processes, options); error) { return std::unexpected(std::move(*error)); }

    const auto ordered = rules.sort_by_burst ? sorted_by_burst(processes)
                                             : std::vector<Os::Process>(processes.begin(), processes.end());
    const bool corrected = options.compatibility == Compatibility::Corrected;

    std::vector<Os::TimeSlice>  timeline;
    std::vector<Os::MetricsRow> rows;
    timeline.reserve(ordered.size());
    rows.reserve(ordered.size());

    std::int64_t service_time    = 0;
    std::int64_t last_completion = 0;
    std::int64_t waiting         = 0;
    for (const auto& process : ordered) {
        if ((rules.wait_for_arrival || corrected) && service_time < process.arrival) { service_time = process.arrival; }

        if (corrected) {
            waiting = std::max<std::int64_t>(0, service_time - process.arrival);
        } else if (process.arrival > 0) {
            waiting = service_time - process.arrival;
            if (rules.clamp_waiting) { waiting = std::max<std::int64_t>(0, waiting); }
        }
        // Reference mode keeps the previous waiting value for processes arriving at 0.

        const auto start      = waiting + process.arrival;
        const auto turnaround = process.burst + waiting;
        const auto completion = process.burst + process.arrival + waiting;

        last_completion = corrected ? std::max(last_completion, completion) : completion;
        service_time += process.burst;

        rows.push_back(Os::MetricsRow {
          .name       = process.name,
          .priority   = process.priority,
          .burst      = process.burst,
          .arrival    = process.arrival,
          .waiting    = waiting,
          .turnaround = turnaround,
          .completion = completion,
        });

        timeline.push_back(Os::TimeSlice {
          .name  = process.name,
          .start = start,
          .stop  = corrected ? completion : service_time,
        });
    }

    return summarize(policy, std::move(timeline), std::move(rows), last_completion);
}

// Historical behaviour: sorted by burst, each process runs to completion in a single pass.
[[nodiscard]] auto round_robin_single_pass(const std::span<const Os::Process> processes) -> Schedule
{
    const auto ordered = sorted_by_burst(processes);

    std::vector<Os::TimeSlice>  timeline;
    std::vector<Os::MetricsRow> rows;
    timeline.reserve(ordered.size());
    rows.reserve(ordered.size());

    std::int64_t current_time = 0;
    for (const auto& process : ordered) {
        const auto start = current_time;
        current_time += process.burst;

        const auto turnaround = current_time - process.arrival;
        const auto waiting    = turnaround - process.burst;

        rows.push_back(Os::MetricsRow {
          .name       = process.name,
          .priority   = process.priority,
          .burst      = process.burst,
          .arrival    = process.arrival,
          .waiting    = waiting,
          .turnaround = turnaround,
          .completion = current_time,
        });

        timeline.push_back(Os::TimeSlice { .name = process.name, .start = start, .stop = current_time });
    }

    return summarize(SchedulePolicy::RoundRobin, std::move(timeline), std::move(rows), current_time);
}

[[nodiscard]] auto round_robin_quantum(const std::span<const Os::Process> processes, const std::int64_t quantum)
  -> Schedule
{
    auto arrivals = std::vector<Os::Process>(processes.begin(), processes.end());
    std::ranges::stable_sort(arrivals, std::ranges::less {}, &Os::Process::arrival);

    const auto count = arrivals.size();

    std::vector<std::int64_t> remaining(count);
    std::vector<std::int64_t> completion(count, 0);
    std::ranges::transform(arrivals, remaining.begin(), &Os::Process::burst);

    std::vector<Os::TimeSlice> timeline;
    std::deque<std::size_t>    ready;

    std::size_t  next_arrival = 0;
    std::size_t  finished     = 0;
    std::int64_t current_time = 0;

    const auto admit_arrived = [&] {
        while (next_arrival < count && arrivals[next_arrival].arrival <= current_time) {
            ready.push_back(next_arrival++);
        }
    };

    admit_arrived();
    while (finished < count) {
        if (ready.empty()) {
            assert(next_arrival < count && "idle CPU with nothing left to arrive");
            current_time = std::max(current_time, arrivals[next_arrival].arrival);
            admit_arrived();
            continue;
        }

        const auto idx = ready.front();
        ready.pop_front();

        const auto slice = std::min(quantum, remaining[idx]);
        timeline.push_back(Os::TimeSlice {
          .name  = arrivals[idx].name,
          .start = current_time,
          .stop  = current_time + slice,
        });

        current_time += slice;
        remaining[idx] -= slice;

        // Arrivals during the slice queue up ahead of the preempted process.
        admit_arrived();

        if (remaining[idx] > 0) {
            ready.push_back(idx);
        } else {
            completion[idx] = current_time;
            ++finished;
        }
    }

    std::vector<Os::MetricsRow> rows;
    rows.reserve(count);
    for (std::size_t idx = 0; idx < count; ++idx) {
        const auto& process    = arrivals[idx];
        const auto  turnaround = completion[idx] - process.arrival;

        rows.push_back(Os::MetricsRow {
          .name       = process.name,
          .priority   = process.priority,
          .burst      = process.burst,
          .arrival    = process.arrival,
          .waiting    = turnaround - process.burst,
          .turnaround = turnaround,
          .completion = completion[idx],
        });
    }

    return summarize(SchedulePolicy::RoundRobin, std::move(timeline), std::move(rows), current_time);
}

} // namespace

auto schedule_policy_try_from_str(const std::string_view str) -> std::optional<SchedulePolicy>
{
    static_assert(
      std::to_underlying(SchedulePolicy::Count) == 4,
      "Exhaustive handling of all enum variants for SchedulePolicy is required."
    );

    const auto lowered = Util::to_lower(str);
    if (lowered == "fcfs" || lowered == "first_come_first_served") { return SchedulePolicy::FirstComeFirstServed; }
    if (lowered == "sjf" || lowered == "shortest_job_first") { return SchedulePolicy::ShortestJobFirst; }
    if (lowered == "sjf_idle" || lowered == "sjf_priority" || lowered == "shortest_job_first_idle") {
        return SchedulePolicy::ShortestJobFirstIdle;
    }
    if (lowered == "rr" || lowered == "round_robin") { return SchedulePolicy::RoundRobin; }

    std::println(stderr, "[ERROR] Unknown schedule policy: {}", str);
    std::println(stderr, "[NOTE] available policies are: fcfs, sjf, sjf_idle, rr");
    return std::nullopt;
}

auto schedule_policy_name(const SchedulePolicy policy) -> std::string_view
{
    static_assert(
      std::to_underlying(SchedulePolicy::Count) == 4,
      "Exhaustive handling of all enum variants for SchedulePolicy is required."
    );

    switch (policy) {
        case SchedulePolicy::FirstComeFirstServed: {
            return "First Come First Served";
        }
        case SchedulePolicy::ShortestJobFirst: {
            return "Shortest Job First";
        }
        case SchedulePolicy::ShortestJobFirstIdle: {
            return "Shortest Job First (idle aware)";
        }
        case SchedulePolicy::RoundRobin: {
            return "Round Robin";
        }
        default: {
            assert(false && "unreachable");
            return "unreachable";
        }
    }
}

auto validate(const SchedulePolicy policy, const std::span<const Os::Process> processes, const Options& options)
  -> std::optional<ScheduleError>
{
    if (processes.empty()) { return ScheduleError { .kind = ScheduleErrorKind::EmptyBatch }; }

    for (const auto& process : processes) {
        if (process.burst <= 0) {
            return ScheduleError { .kind = ScheduleErrorKind::InvalidBurst, .process = process.name, .value = process.burst };
        }

        if (process.arrival < 0) {
            return ScheduleError {
                .kind    = ScheduleErrorKind::InvalidArrival,
                .process = process.name,
                .value   = process.arrival,
            };
        }
    }

    if (options.strict_ids) {
        std::unordered_set<std::string_view> seen;
        for (const auto& process : processes) {
            if (!seen.insert(process.name).second) {
                return ScheduleError { .kind = ScheduleErrorKind::DuplicateProcessId, .process = process.name };
            }
        }
    }

    if (policy == SchedulePolicy::RoundRobin && options.compatibility == Compatibility::Corrected
        && options.quantum <= 0) {
        return ScheduleError { .kind = ScheduleErrorKind::InvalidQuantum, .value = options.quantum };
    }

    return std::nullopt;
}

auto sorted_by_burst(const std::span<const Os::Process> processes) -> std::vector<Os::Process>
{
    auto result = std::vector<Os::Process>(processes.begin(), processes.end());
    std::ranges::stable_sort(result, std::ranges::less {}, &Os::Process::burst);
    return result;
}

auto first_come_first_served(const std::span<const Os::Process> processes, const Options& options) -> ScheduleResult
{
    return run_sequential(SchedulePolicy::FirstComeFirstServed, processes, options, SequentialRules {});
}

auto shortest_job_first(const std::span<const Os::Process> processes, const Options& options) -> ScheduleResult
{
    return run_sequential(
      SchedulePolicy::ShortestJobFirst,
      processes,
      options,
      SequentialRules { .sort_by_burst = true, .clamp_waiting = true }
    );
}

auto shortest_job_first_idle(const std::span<const Os::Process> processes, const Options& options) -> ScheduleResult
{
    return run_sequential(
      SchedulePolicy::ShortestJobFirstIdle,
      processes,
      options,
      SequentialRules { .sort_by_burst = true, .clamp_waiting = true, .wait_for_arrival = true }
    );
}

auto round_robin(const std::span<const Os::Process> processes, const Options& options) -> ScheduleResult
{
    if (auto error = validate(SchedulePolicy::RoundRobin, processes, options); error) {
        return std::unexpected(std::move(*error));
    }

    if (options.compatibility == Compatibility::Reference) { return round_robin_single_pass(processes); }

    return round_robin_quantum(processes, options.quantum);
}

auto run(const SchedulePolicy policy, const std::span<const Os::Process> processes, const Options& options)
  -> ScheduleResult
{
    static_assert(
      std::to_underlying(SchedulePolicy::Count) == 4,
      "Exhaustive handling of all enum variants for SchedulePolicy is required."
    );

    switch (policy) {
        case SchedulePolicy::FirstComeFirstServed: {
            return first_come_first_served(processes, options);
        }
        case SchedulePolicy::ShortestJobFirst: {
            return shortest_job_first(processes, options);
        }
        case SchedulePolicy::ShortestJobFirstIdle: {
            return shortest_job_first_idle(processes, options);
        }
        case SchedulePolicy::RoundRobin: {
            return round_robin(processes, options);
        }
        default: {
            assert(false && "unreachable");
            return std::unexpected(ScheduleError { .kind = ScheduleErrorKind::EmptyBatch });
        }
    }
}

} // namespace Scheduling
