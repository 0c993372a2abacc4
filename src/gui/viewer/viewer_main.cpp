#include <cstddef>
#include <filesystem>
#include <print>
#include <span>

#include "Application.hpp"
#include "scheduling/BatchLoader.hpp"

auto main(int argc, const char** argv) -> int
{
    const std::span<const char* const> args(argv, static_cast<std::size_t>(argc));
    if (args.size() != 2) {
        std::println(stderr, "[ERROR] expected file path to batch script or csv table");
        std::println("usage: {} <batch.sl | batch.csv>", args.front());
        return 1;
    }

    const auto batch_path  = std::filesystem::path { args[1] };
    const auto maybe_batch = Scheduling::load_batch(batch_path);
    if (!maybe_batch) { return 1; }

    auto app = Application::create(*maybe_batch, batch_path.filename().string());
    if (!app) { return 1; }
    app->render();
}
