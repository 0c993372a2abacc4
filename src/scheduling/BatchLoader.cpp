#include "BatchLoader.hpp"

#include <print>

#include "lang/Interpreter.hpp"
#include "os/ProcessLoader.hpp"
#include "Util.hpp"

namespace Scheduling
{

auto load_batch(const std::filesystem::path& path) -> std::optional<std::shared_ptr<Batch>>
{
    auto batch = std::make_shared<Batch>();

    if (Util::to_lower(path.extension().string()) == ".csv") {
        batch->processes = TRY(Os::load_processes_from_csv(path));
        return batch;
    }

    const auto script_content = TRY(Util::read_entire_file(path));
    if (!Interpreter::Interpreter<Batch>::eval(script_content, batch)) {
        std::println(stderr, "[ERROR] Could not correctly evaluate script {}", path.string());
        return std::nullopt;
    }

#ifdef DEBUG
    std::println("- Batch -");
    for (const auto& process : batch->processes) { std::println("{:m}", process); }
#endif

    return batch;
}

} // namespace Scheduling
