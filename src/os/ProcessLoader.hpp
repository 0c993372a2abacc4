#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include "Os.hpp"

namespace Os
{

// Parses `name, burst, arrival, priority` rows. A leading row whose numeric columns are all
// non-numeric is taken as a header and skipped.
[[nodiscard]] auto parse_processes_csv(std::string_view content) -> std::optional<std::vector<Process>>;

[[nodiscard]] auto load_processes_from_csv(const std::filesystem::path& path) -> std::optional<std::vector<Process>>;

} // namespace Os
