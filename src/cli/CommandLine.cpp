#include "CommandLine.hpp"

#include <iterator>
#include <print>
#include <utility>

#include "Util.hpp"

namespace Cli
{

void usage(const std::string_view executable)
{
    std::println("usage: {} [options] <batch.sl | batch.csv>", executable);
    std::println("options:");
    std::println("    --policy <fcfs|sjf|sjf_idle|rr>  schedule with the given policy (repeatable, default: all)");
    std::println("    --quantum <n>                    time slice of corrected round robin");
    std::println("    --corrected                      use the corrected arithmetic instead of the reference one");
    std::println("    --permissive-ids                 accept duplicate process ids");
    std::println("    --output <path>                  write the report to a file instead of stdout");
    std::println("    --help                           print this message");
}

auto parse_command_line(const std::span<const char* const> args) -> std::optional<CommandLine>
{
    CommandLine result;
    if (args.empty()) { return std::nullopt; }

    const auto next_value = [&](auto& it, const std::string_view flag) -> std::optional<std::string_view> {
        if (std::next(it) == args.end()) {
            std::println(stderr, "[ERROR] missing value after {}", flag);
            return std::nullopt;
        }
        return std::string_view { *++it };
    };

    std::optional<std::filesystem::path> batch_path;
    for (auto it = std::next(args.begin()); it != args.end(); ++it) {
        const auto arg = std::string_view { *it };
        if (arg == "--help" || arg == "-h") {
            usage(args.front());
            return CommandLine { .help = true };
        }

        if (arg == "--policy") {
            const auto name = TRY(next_value(it, arg));
            result.policies.push_back(TRY(Scheduling::schedule_policy_try_from_str(name)));
        } else if (arg == "--quantum") {
            const auto value = TRY(next_value(it, arg));
            result.quantum   = TRY(Util::parse_integer(value));
        } else if (arg == "--output") {
            result.output_path = std::filesystem::path { TRY(next_value(it, arg)) };
        } else if (arg == "--corrected") {
            result.corrected = true;
        } else if (arg == "--permissive-ids") {
            result.permissive = true;
        } else if (arg.starts_with("--")) {
            std::println(stderr, "[ERROR] unknown option {}", arg);
            usage(args.front());
            return std::nullopt;
        } else if (batch_path) {
            std::println(stderr, "[ERROR] expected a single batch file but got {} and {}", batch_path->string(), arg);
            return std::nullopt;
        } else {
            batch_path = std::filesystem::path { arg };
        }
    }

    if (!batch_path) {
        std::println(stderr, "[ERROR] expected file path to batch script or csv table");
        usage(args.front());
        return std::nullopt;
    }

    result.batch_path = *batch_path;
    return result;
}

auto resolve_run(const CommandLine& command_line, const Scheduling::Batch& batch) -> RunPlan
{
    auto options = batch.options;
    if (command_line.quantum) { options.quantum = *command_line.quantum; }
    if (command_line.corrected) { options.compatibility = Scheduling::Compatibility::Corrected; }
    if (command_line.permissive) { options.strict_ids = false; }

    auto policies = command_line.policies;
    if (policies.empty() && batch.schedule_policy) { policies.push_back(*batch.schedule_policy); }
    if (policies.empty()) { policies.assign(Scheduling::ALL_POLICIES.begin(), Scheduling::ALL_POLICIES.end()); }

    return RunPlan { .policies = std::move(policies), .options = options };
}

} // namespace Cli
