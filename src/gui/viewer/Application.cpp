#include "Application.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <format>
#include <fstream>
#include <functional>
#include <ranges>

#include "report/Report.hpp"

namespace
{

constexpr static auto TABLE_FLAGS = Gui::TableFlags::Borders | Gui::TableFlags::RowBackground;

[[nodiscard]] auto short_policy_name(const Scheduling::SchedulePolicy policy) -> std::string
{
    static_assert(
      std::to_underlying(Scheduling::SchedulePolicy::Count) == 4,
      "Exhaustive handling of all enum variants for SchedulePolicy is required."
    );

    switch (policy) {
        case Scheduling::SchedulePolicy::FirstComeFirstServed: return "FCFS";
        case Scheduling::SchedulePolicy::ShortestJobFirst: return "SJF";
        case Scheduling::SchedulePolicy::ShortestJobFirstIdle: return "SJF idle";
        case Scheduling::SchedulePolicy::RoundRobin: return "RR";
        default: return "?";
    }
}

void draw_schedule_error(const Scheduling::ScheduleError& error)
{
    ImGui::PushStyleColor(ImGuiCol_Text, Gui::hex_colour_to_imvec4(0xd23a3a));
    ImGui::TextWrapped("%s", std::format("{}", error).c_str());
    ImGui::PopStyleColor();
}

} // namespace

auto Application::create(const std::shared_ptr<Scheduling::Batch>& batch, const std::string& batch_name)
  -> std::unique_ptr<Application>
{
    const auto window = Gui::init_window(std::format("batch-sched: {}", batch_name), WINDOW_WIDTH, WINDOW_HEIGHT);
    if (!window) { return nullptr; }
    ImPlot::CreateContext();

    Gui::load_default_fonts();
    Gui::black_and_red_style();

    return std::unique_ptr<Application>(new Application { *window, batch, batch_name });
}

void Application::render()
{
    while (!quit) {
        if (glfwWindowShouldClose(window) == 1) { quit = true; }

        glfwPollEvents();
        if (glfwGetWindowAttrib(window, GLFW_ICONIFIED) != 0) { continue; }

        Gui::new_frame();

        ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
        ImGui::SetNextWindowPos(ImVec2(0, 0));
        Gui::window(
          "batch-sched: viewer",
          Gui::WindowFlags::NoDecoration | Gui::WindowFlags::NoResize | Gui::WindowFlags::NoMove,
          [this] {
              draw_save_button();

              ImGui::SameLine();

              draw_options();

              const std::array<std::function<void(const ImVec2&)>, 4> drawables = {
                  [this](const auto& size) { draw_gantt(size); },
                  [this](const auto& size) { draw_metrics(size); },
                  [this](const auto& size) { draw_comparison(size); },
                  [this](const auto& size) { draw_batch(size); },
              };

              const auto available_space = ImGui::GetContentRegionAvail();
              Gui::grid(2UZ, 2UZ, drawables.size(), available_space, [&](const auto& child_size, const auto& idx) {
                  drawables[idx](child_size);
              });
          }
        );

        Gui::draw_call(window, BACKGROUND_COLOR);
    }
}

void Application::draw_save_button()
{
    if (show_input_box) {
        const auto file_path = Gui::input_text_popup("Enter file path", show_input_box);
        if (file_path.has_value()) {
            std::ofstream file(*file_path, std::ios::out | std::ios::trunc);
            if (file_path->empty() || !file) {
                Gui::toast(
                  std::format("Failed to save report to `{}`: invalid path", *file_path),
                  std::chrono::seconds(3),
                  Gui::ToastLevel::Error
                );
                return;
            }

            Report::render(file, std::format("{}", policy), *selected());
            Gui::toast(std::format("Saved report to {}", *file_path), std::chrono::seconds(2), Gui::ToastLevel::Info);
        }
    }

    if (ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_S, false) && selected().has_value()) {
        show_input_box = true;
    }

    Gui::enabled_if(selected().has_value(), [&] {
        Gui::image_button(save_texture, BUTTON_SIZE, "[Ctrl+S]ave Report", [&] { show_input_box = true; });
    });
}

void Application::draw_options()
{
    ImGui::SetNextItemWidth(260.0F);
    Gui::combo<Scheduling::SchedulePolicy>(
      "Policy", Scheduling::ALL_POLICIES, policy, [this](const auto& item) { policy = item; }
    );

    ImGui::SameLine();

    bool corrected = options.compatibility == Scheduling::Compatibility::Corrected;
    if (ImGui::Checkbox("Corrected", &corrected)) {
        options.compatibility = corrected ? Scheduling::Compatibility::Corrected : Scheduling::Compatibility::Reference;
        reschedule();
    }

    ImGui::SameLine();

    // The quantum only matters for corrected round robin.
    Gui::enabled_if(corrected, [&] {
        int quantum = static_cast<int>(options.quantum);
        ImGui::SetNextItemWidth(120.0F);
        if (ImGui::InputInt("Quantum", &quantum) && quantum != options.quantum) {
            options.quantum = quantum;
            reschedule();
        }
    });
}

void Application::draw_gantt(const ImVec2& child_size) const
{
    Gui::title(std::format("Gantt: {}", policy), child_size, [&](const auto& size) {
        const auto& result = selected();
        if (!result) {
            draw_schedule_error(result.error());
            return;
        }

        const auto& timeline = result->timeline;
        const auto  earliest = std::ranges::min(timeline | std::views::transform(&Os::TimeSlice::start));
        const auto  latest   = std::ranges::max(timeline | std::views::transform(&Os::TimeSlice::stop));

        const auto plot_opts = Gui::Plotting::PlotOpts {
            .x_min   = static_cast<double>(std::min<std::int64_t>(0, earliest)),
            .x_max   = static_cast<double>(latest) + 1.0,
            .y_min   = -0.5,
            .y_max   = static_cast<double>(lanes.size()) - 0.5,
            .x_label = "time",
        };

        Gui::Plotting::plot("##Gantt", size, plot_opts, [&] { Gui::Plotting::gantt(lanes, timeline); });
    });
}

void Application::draw_metrics(const ImVec2& child_size) const
{
    Gui::title(std::format("Metrics: {}", policy), child_size, [&](const auto&) {
        const auto& result = selected();
        if (!result) {
            draw_schedule_error(result.error());
            return;
        }

        constexpr static auto HEADERS = std::array {
            "ID", "Priority", "Burst", "Arrival", "Wait", "Turnaround", "Exit",
        };
        Gui::draw_table("##MetricsTable", HEADERS, TABLE_FLAGS, [&] {
            for (const auto& row : result->rows) {
                Gui::draw_table_row(
                  [&] { Gui::text("{}", row.name); },
                  [&] { Gui::text("{}", row.priority); },
                  [&] { Gui::text("{}", row.burst); },
                  [&] { Gui::text("{}", row.arrival); },
                  [&] {
                      // Reference arithmetic may produce negative waiting times.
                      if (row.waiting < 0) {
                          ImGui::PushStyleColor(ImGuiCol_Text, Gui::hex_colour_to_imvec4(0xd23a3a));
                          Gui::text("{}", row.waiting);
                          ImGui::PopStyleColor();
                      } else {
                          Gui::text("{}", row.waiting);
                      }
                  },
                  [&] { Gui::text("{}", row.turnaround); },
                  [&] { Gui::text("{}", row.completion); }
                );
            }
        });

        ImGui::Separator();

        constexpr static auto AGGREGATE_HEADERS = std::array { "Key", "Value" };
        Gui::draw_table("##AggregatesTable", AGGREGATE_HEADERS, TABLE_FLAGS, [&] {
            const auto draw_key_value = [](const std::string_view key, const double value) {
                Gui::draw_table_row([&] { Gui::text("{}", key); }, [&] { Gui::text("{:.2f}", value); });
            };

            draw_key_value("Average waiting time", result->average_waiting_time);
            draw_key_value("Average turnaround time", result->average_turnaround_time);
            draw_key_value("Throughput", result->throughput);
        });
    });
}

void Application::draw_comparison(const ImVec2& child_size) const
{
    Gui::title("Policy comparison", child_size, [&](const auto& size) {
        std::vector<std::string> labels;
        std::vector<double>      waiting;
        std::vector<double>      turnaround;
        std::vector<double>      throughput;
        for (const auto& [candidate, result] : std::views::zip(Scheduling::ALL_POLICIES, schedules)) {
            if (!result) { continue; }
            labels.push_back(short_policy_name(candidate));
            waiting.push_back(result->average_waiting_time);
            turnaround.push_back(result->average_turnaround_time);
            throughput.push_back(result->throughput);
        }

        if (labels.empty()) {
            Gui::text("No policy could schedule this batch.");
            return;
        }

        const auto charts = std::array {
            std::pair { std::string { "Average waiting time" }, std::span<const double> { waiting } },
            std::pair { std::string { "Average turnaround time" }, std::span<const double> { turnaround } },
            std::pair { std::string { "Throughput" }, std::span<const double> { throughput } },
        };

        Gui::grid(1UZ, charts.size(), charts.size(), size, [&](const auto& subplot_size, const auto& idx) {
            const auto& [key, values] = charts[idx];

            const auto lowest  = std::ranges::min(values);
            const auto highest = std::ranges::max(values);

            const auto plot_opts = Gui::Plotting::PlotOpts {
                .x_axis_flags = Gui::Plotting::AxisFlags::NoTickMarks,
                .x_min        = -0.5,
                .x_max        = static_cast<double>(labels.size()) - 0.5,
                .y_min        = std::min(0.0, lowest * 1.1),
                .y_max        = highest > 0.0 ? highest * 1.1 : 1.0,
            };

            Gui::title(key, subplot_size, [&](const auto& plot_size) {
                Gui::Plotting::plot(std::format("##{}", key), plot_size, plot_opts, [&] {
                    Gui::Plotting::bars(labels, values);
                });
            });
        });
    });
}

void Application::draw_batch(const ImVec2& child_size) const
{
    Gui::title(std::format("Batch: {}", batch_name), child_size, [&](const auto&) {
        constexpr static auto HEADERS = std::array { "ID", "Arrival", "Burst", "Priority" };
        Gui::draw_table("##BatchTable", HEADERS, TABLE_FLAGS, [&] {
            for (const auto& process : batch->processes) {
                Gui::draw_table_row(
                  [&] { Gui::text("{}", process.name); },
                  [&] { Gui::text("{}", process.arrival); },
                  [&] { Gui::text("{}", process.burst); },
                  [&] { Gui::text("{}", process.priority); }
                );
            }
        });
    });
}

void Application::reschedule()
{
    schedules.clear();
    for (const auto candidate : Scheduling::ALL_POLICIES) {
        schedules.push_back(Scheduling::run(candidate, batch->processes, options));
    }
}

auto Application::selected() const -> const Scheduling::ScheduleResult&
{
    return schedules.at(std::to_underlying(policy));
}

Application::~Application()
{
    ImPlot::DestroyContext();
    Gui::shutdown(window);
}

Application::Application(
  GLFWwindow*                               window,
  const std::shared_ptr<Scheduling::Batch>& batch,
  const std::string&                        batch_name
)
  : window { window },
    batch { batch },
    batch_name { batch_name },
    policy { batch->schedule_policy.value_or(Scheduling::SchedulePolicy::FirstComeFirstServed) },
    options { batch->options },
    save_texture { Gui::Texture::load_from_file("resources/save.png") }
{
    for (const auto& process : batch->processes) {
        if (!std::ranges::contains(lanes, process.name)) { lanes.push_back(process.name); }
    }

    reschedule();
}
