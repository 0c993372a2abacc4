#include <format>
#include <fstream>
#include <iostream>
#include <print>
#include <span>

#include "cli/CommandLine.hpp"
#include "report/Report.hpp"
#include "scheduling/BatchLoader.hpp"

auto main(int argc, const char** argv) -> int
{
    const std::span<const char* const> args(argv, static_cast<std::size_t>(argc));
    const auto                         command_line = Cli::parse_command_line(args);
    if (!command_line) { return 1; }
    if (command_line->help) { return 0; }

    const auto maybe_batch = Scheduling::load_batch(command_line->batch_path);
    if (!maybe_batch) { return 1; }
    const auto& batch = *maybe_batch;

    const auto plan = Cli::resolve_run(*command_line, *batch);

    std::ofstream output_file;
    if (command_line->output_path) {
        output_file.open(*command_line->output_path, std::ios::out | std::ios::trunc);
        if (!output_file) {
            std::println(stderr, "[ERROR] Unable to open {} for writing", command_line->output_path->string());
            return 1;
        }
    }
    std::ostream& sink = command_line->output_path ? output_file : std::cout;

    std::println(
      stderr,
      "[INFO] scheduling {} processes from {} ({} arithmetic)",
      batch->processes.size(),
      command_line->batch_path.string(),
      plan.options.compatibility
    );

    for (const auto policy : plan.policies) {
        const auto title  = std::format("{}", policy);
        const auto result = Report::print_schedule(sink, title, policy, batch->processes, plan.options);
        if (!result) {
            std::println(stderr, "[ERROR] {}: {}", policy, result.error());
            return 1;
        }
    }

    return 0;
}
