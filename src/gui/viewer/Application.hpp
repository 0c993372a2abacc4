#pragma once

#include <memory>
#include <string>
#include <vector>

#include <GLFW/glfw3.h>
#include <imgui.h>

#include "gui/Gui.hpp"
#include "scheduling/Batch.hpp"
#include "scheduling/Scheduler.hpp"

class [[nodiscard]] Application final
{
  public:
    [[nodiscard]] static auto create(const std::shared_ptr<Scheduling::Batch>& batch, const std::string& batch_name)
      -> std::unique_ptr<Application>;

    void render();

    void draw_save_button();
    void draw_options();

    void draw_gantt(const ImVec2& child_size) const;
    void draw_metrics(const ImVec2& child_size) const;
    void draw_comparison(const ImVec2& child_size) const;
    void draw_batch(const ImVec2& child_size) const;

    ~Application();
    Application(const Application&)            = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&)                 = delete;
    Application& operator=(Application&&)      = delete;

  private:
    Application(GLFWwindow* window, const std::shared_ptr<Scheduling::Batch>& batch, const std::string& batch_name);

    // Re-runs every policy with the current options.
    void reschedule();

    [[nodiscard]] auto selected() const -> const Scheduling::ScheduleResult&;

  private:
    constexpr static auto WINDOW_WIDTH     = 1600;
    constexpr static auto WINDOW_HEIGHT    = 900;
    constexpr static auto BACKGROUND_COLOR = Gui::hex_colour_to_imvec4(0x181818);
    constexpr static auto BUTTON_SIZE      = ImVec2(16, 16);

  private:
    GLFWwindow* window = nullptr;
    bool        quit   = false;

    std::shared_ptr<Scheduling::Batch> batch;
    std::string                        batch_name;

    Scheduling::SchedulePolicy               policy;
    Scheduling::Options                      options;
    std::vector<Scheduling::ScheduleResult> schedules;
    std::vector<std::string>                 lanes;

    bool         show_input_box = false;
    Gui::Texture save_texture;
};
