#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "scheduling/Batch.hpp"
#include "scheduling/Scheduler.hpp"

namespace Cli
{

struct [[nodiscard]] CommandLine final
{
    std::filesystem::path                   batch_path;
    std::vector<Scheduling::SchedulePolicy> policies;
    std::optional<std::int64_t>             quantum     = std::nullopt;
    std::optional<std::filesystem::path>    output_path = std::nullopt;
    bool                                    corrected   = false;
    bool                                    permissive  = false;
    // Set by --help; nothing else is filled in.
    bool help = false;
};

// The policies to run and the options to run them with.
struct [[nodiscard]] RunPlan final
{
    std::vector<Scheduling::SchedulePolicy> policies;
    Scheduling::Options                     options;
};

void usage(std::string_view executable);

// `args` is argv, program name included. Errors are logged and yield std::nullopt.
[[nodiscard]] auto parse_command_line(std::span<const char* const> args) -> std::optional<CommandLine>;

// Command line values win over the batch script's configuration. Policies come from
// --policy, then the script's schedule_policy, then all four.
[[nodiscard]] auto resolve_run(const CommandLine& command_line, const Scheduling::Batch& batch) -> RunPlan;

} // namespace Cli
