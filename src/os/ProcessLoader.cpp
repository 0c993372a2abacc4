#include "ProcessLoader.hpp"

#include <algorithm>
#include <charconv>
#include <print>
#include <ranges>
#include <string>

#include "Util.hpp"

namespace Os
{

[[nodiscard]] static auto looks_like_integer(const std::string_view str) -> bool
{
    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    return ec == std::errc() && ptr == str.data() + str.size();
}

auto parse_processes_csv(const std::string_view content) -> std::optional<std::vector<Process>>
{
    constexpr static auto COLUMNS = 4UZ;

    std::vector<Process> processes;
    std::size_t          line_number = 0;
    bool                 first_row   = true;

    for (const auto& line_range : content | std::views::split('\n')) {
        ++line_number;
        const auto line = Util::trim(std::string_view { line_range });
        if (line.empty()) { continue; }

        // clang-format off
        const auto fields = line
            | std::views::split(',')
            | std::views::transform([](auto&& elem) { return Util::trim(std::string_view { elem }); })
            | std::ranges::to<std::vector<std::string_view>>();
        // clang-format on

        if (fields.size() != COLUMNS) {
            std::println(
              stderr,
              "[ERROR] (csv) line {}: expected (name, burst, arrival, priority) but got: {}",
              line_number,
              line
            );
            return std::nullopt;
        }

        // A header row has no numeric field at all.
        if (first_row) {
            first_row = false;
            if (std::ranges::none_of(fields | std::views::drop(1), looks_like_integer)) { continue; }
        }

        if (fields[0].empty()) {
            std::println(stderr, "[ERROR] (csv) line {}: process name must not be empty", line_number);
            return std::nullopt;
        }

        const auto burst    = Util::parse_integer(fields[1]);
        const auto arrival  = Util::parse_integer(fields[2]);
        const auto priority = Util::parse_integer(fields[3]);
        if (!burst || !arrival || !priority) {
            std::println(stderr, "[ERROR] (csv) line {}: malformed process row: {}", line_number, line);
            return std::nullopt;
        }

        processes.push_back(Process {
          .name     = std::string { fields[0] },
          .arrival  = *arrival,
          .burst    = *burst,
          .priority = *priority,
        });
    }

    return processes;
}

auto load_processes_from_csv(const std::filesystem::path& path) -> std::optional<std::vector<Process>>
{
    const auto content = TRY(Util::read_entire_file(path));
    return parse_processes_csv(content);
}

} // namespace Os
