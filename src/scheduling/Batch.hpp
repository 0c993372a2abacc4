#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "os/Os.hpp"
#include "scheduling/Scheduler.hpp"

namespace Scheduling
{

// A batch of processes together with the knobs a batch script may set.
struct [[nodiscard]] Batch final
{
    std::vector<Os::Process> processes;

    std::optional<SchedulePolicy> schedule_policy = std::nullopt;
    Options                       options         = {};

    // Bounds for randomly generated processes.
    std::size_t max_processes      = 10;
    std::size_t max_arrival_time   = 10;
    std::size_t max_burst_duration = 10;
    std::size_t max_priority       = 5;

    // Random processes spawned so far, and the last P<n> suffix handed out.
    std::size_t random_spawned = 0;
    std::size_t random_suffix  = 0;

    template<typename... Args>
    auto emplace_process(Args&&... args) -> Os::Process&
    {
        return processes.emplace_back(std::forward<Args>(args)...);
    }
};

} // namespace Scheduling
