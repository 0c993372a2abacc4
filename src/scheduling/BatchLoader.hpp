#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "scheduling/Batch.hpp"

namespace Scheduling
{

// `.csv` files hold a plain process table, anything else is evaluated as a batch script.
[[nodiscard]] auto load_batch(const std::filesystem::path& path) -> std::optional<std::shared_ptr<Batch>>;

} // namespace Scheduling
