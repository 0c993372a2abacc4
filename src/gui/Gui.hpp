#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <functional>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#include <GL/gl.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <implot.h>

#include "os/Os.hpp"

namespace Gui
{

constexpr static auto GLSL_VERSION = "#version 330";

[[nodiscard]] constexpr static auto hex_colour_to_imvec4(const std::uint32_t hex) -> ImVec4
{
    return ImVec4 {
        static_cast<float>((hex >> 16U) & 0xFFU) / 255.0F,
        static_cast<float>((hex >> 8U) & 0xFFU) / 255.0F,
        static_cast<float>(hex & 0xFFU) / 255.0F,
        1.0F,
    };
}

enum class WindowFlags : std::uint16_t
{
    None                    = 0,
    NoTitleBar              = 1 << 0,
    NoResize                = 1 << 1,
    NoMove                  = 1 << 2,
    NoScrollbar             = 1 << 3,
    NoCollapse              = 1 << 5,
    NoSavedSettings         = 1 << 8,
    AlwaysVerticalScrollbar = 1 << 14,
    NoDecoration            = NoTitleBar | NoResize | NoScrollbar | NoCollapse,
};

[[nodiscard]] constexpr static auto operator|(WindowFlags lhs, WindowFlags rhs) -> WindowFlags
{
    return static_cast<WindowFlags>(std::to_underlying(lhs) | std::to_underlying(rhs));
}

enum class TableFlags : std::uint32_t
{
    RowBackground          = 1 << 6,
    BordersInnerHorizontal = 1 << 7,
    BordersOuterHorizontal = 1 << 8,
    BordersInnerVertical   = 1 << 9,
    BordersOuterVertical   = 1 << 10,
    BordersInner           = BordersInnerVertical | BordersInnerHorizontal,
    BordersOuter           = BordersOuterVertical | BordersOuterHorizontal,
    Borders                = BordersInner | BordersOuter,
};

[[nodiscard]] constexpr static auto operator|(TableFlags lhs, TableFlags rhs) -> TableFlags
{
    return static_cast<TableFlags>(std::to_underlying(lhs) | std::to_underlying(rhs));
}

[[nodiscard]] auto init_window(const std::string& title, const int width, const int height)
  -> std::optional<GLFWwindow*>;
void               shutdown(GLFWwindow* window);
void               new_frame();
void               draw_call(GLFWwindow* window, const ImVec4& clear_color);

void load_default_fonts(const float regular_size = 16.0F, const float bold_size = 18.0F);
void black_and_red_style();

[[nodiscard]] auto input_text_popup(const std::string& label, bool& condition) -> std::optional<std::string>;

template<typename... Args>
void text(std::format_string<Args...> fmt, Args&&... args)
{
    ImGui::TextUnformatted(std::format(fmt, std::forward<Args>(args)...).c_str());
}

template<typename... Args>
void tooltip(std::format_string<Args...> fmt, Args&&... args)
{
    ImGui::BeginTooltip();
    Gui::text(fmt, std::forward<Args>(args)...);
    ImGui::EndTooltip();
}

template<std::invocable Callback>
void window(const std::string& title, WindowFlags window_flags, Callback&& callback)
{
    ImGui::Begin(title.c_str(), nullptr, std::to_underlying(window_flags));
    std::invoke(std::forward<Callback>(callback));
    ImGui::End();
}

template<std::invocable<ImVec2> Callback>
void title(const std::string& title, const ImVec2& child_size, Callback&& callback)
{
    constexpr static auto title_height = 24.0F;
    const auto            title_size   = ImVec2(child_size.x, title_height);

    ImGui::PushStyleColor(ImGuiCol_ChildBg, ImGui::GetStyleColorVec4(ImGuiCol_TitleBgActive));
    ImGui::BeginChild(std::format("{}_title", title).c_str(), title_size);

    ImGui::SetCursorPosX(8.0F);
    ImGui::SetCursorPosY((title_height - ImGui::GetTextLineHeight()) * 0.5F);
    ImGui::TextUnformatted(title.c_str());

    ImGui::EndChild();
    ImGui::PopStyleColor();

    const auto spacing = ImGui::GetStyle().ItemSpacing.y;
    std::invoke(std::forward<Callback>(callback), ImVec2(child_size.x, child_size.y - title_height - spacing));
}

template<std::invocable<ImVec2, std::size_t> Callback>
void grid(const std::size_t rows, const std::size_t cols, const std::size_t count, const ImVec2& available_space, Callback&& callback)
{
    const auto spacing   = ImGui::GetStyle().ItemSpacing;
    const auto cell_size = ImVec2 {
        (available_space.x - (spacing.x * static_cast<float>(cols - 1))) / static_cast<float>(cols),
        (available_space.y - (spacing.y * static_cast<float>(rows - 1))) / static_cast<float>(rows),
    };

    for (std::size_t idx = 0; idx < count; ++idx) {
        if (idx % cols != 0) { ImGui::SameLine(); }

        ImGui::BeginChild(std::format("##grid_cell_{}", idx).c_str(), cell_size);
        std::invoke(callback, cell_size, idx);
        ImGui::EndChild();
    }
}

template<typename Item, std::invocable<const Item&> Callback>
void combo(const std::string& label, const std::span<const Item> items, const Item& current, Callback&& callback)
{
    if (ImGui::BeginCombo(label.c_str(), std::format("{}", current).c_str())) {
        for (const auto& item : items) {
            const bool selected = item == current;
            if (ImGui::Selectable(std::format("{}", item).c_str(), selected)) {
                std::invoke(std::forward<Callback>(callback), item);
            }
            if (selected) { ImGui::SetItemDefaultFocus(); }
        }
        ImGui::EndCombo();
    }
}

template<std::invocable Callback>
void draw_table(const std::string& name, const std::span<const char* const> headers, TableFlags flags, Callback&& callback)
{
    if (ImGui::BeginTable(name.c_str(), static_cast<int>(headers.size()), static_cast<int>(std::to_underlying(flags)))) {
        for (const auto& header : headers) { ImGui::TableSetupColumn(header); }
        ImGui::TableHeadersRow();
        std::invoke(std::forward<Callback>(callback));
        ImGui::EndTable();
    }
}

template<typename... Callbacks>
void draw_table_row(Callbacks&&... callbacks)
{
    ImGui::TableNextRow();

    int column = 0;
    ((ImGui::TableSetColumnIndex(column++), std::invoke(std::forward<Callbacks>(callbacks))), ...);
}

template<std::invocable Callback>
void enabled_if(const bool control, Callback&& callback)
{
    ImGui::BeginDisabled(!control);
    std::invoke(std::forward<Callback>(callback));
    ImGui::EndDisabled();
}

class [[nodiscard]] Texture final
{
  public:
    static auto load_from_file(const std::filesystem::path& path) -> Texture;

    [[nodiscard]] auto loaded() const -> bool { return texture_id.has_value(); }

    [[nodiscard]] auto as_imgui_texture() const -> ImTextureID
    {
        // ImTextureID is a pointer or a 64 bit integer depending on the ImGui release.
        return (ImTextureID)(std::uintptr_t)texture_id.value(); // NOLINT(cppcoreguidelines-pro-type-cstyle-cast)
    }

    ~Texture();
    Texture(const Texture&)            = delete;
    Texture& operator=(const Texture&) = delete;
    Texture(Texture&& other) noexcept;
    Texture& operator=(Texture&& other) noexcept;

  private:
    explicit Texture(const std::optional<GLuint> texture_id_)
      : texture_id { texture_id_ }
    {}

    std::optional<GLuint> texture_id;
};

template<std::invocable Callback>
void image_button(const Texture& texture, const ImVec2& size, const std::string& fallback, Callback&& callback)
{
    if (!texture.loaded()) {
        if (ImGui::Button(fallback.c_str())) { std::invoke(std::forward<Callback>(callback)); }
        return;
    }

    if (ImGui::ImageButton(fallback.c_str(), texture.as_imgui_texture(), size)) {
        std::invoke(std::forward<Callback>(callback));
    }

    if (ImGui::IsItemHovered()) { Gui::tooltip("{}", fallback); }
}

enum class ToastLevel : std::uint8_t
{
    Info = 0,
    Error,
};

struct [[nodiscard]] Toast final
{
    std::string                  message;
    std::chrono::duration<float> duration;
    ToastLevel                   level;
};

class [[nodiscard]] ToastManager final
{
  public:
    static void add(const Toast& toast) { toasts.push_back(toast); }

    static void render();

  private:
    inline static std::vector<Toast> toasts;
};

void toast(const std::string& message, const std::chrono::duration<float> duration, ToastLevel level);

namespace Plotting
{

enum class AxisFlags : std::uint16_t
{
    None         = 0,
    NoTickMarks  = 1 << 2,
    NoTickLabels = 1 << 3,
    AutoFit      = 1 << 11,
};

[[nodiscard]] constexpr static auto operator|(AxisFlags lhs, AxisFlags rhs) -> AxisFlags
{
    return static_cast<AxisFlags>(std::to_underlying(lhs) | std::to_underlying(rhs));
}

struct [[nodiscard]] PlotOpts final
{
    AxisFlags x_axis_flags = AxisFlags::None;
    AxisFlags y_axis_flags = AxisFlags::None;

    std::optional<double> x_min = std::nullopt;
    std::optional<double> x_max = std::nullopt;
    std::optional<double> y_min = std::nullopt;
    std::optional<double> y_max = std::nullopt;

    std::optional<std::string> x_label = std::nullopt;
    std::optional<std::string> y_label = std::nullopt;
};

template<std::invocable Callback>
void plot(const std::string& title, const ImVec2& size, const PlotOpts& opts, Callback&& callback)
{
    if (ImPlot::BeginPlot(title.c_str(), size)) {
        ImPlot::SetupAxes(
          opts.x_label.has_value() ? opts.x_label->c_str() : nullptr,
          opts.y_label.has_value() ? opts.y_label->c_str() : nullptr,
          std::to_underlying(opts.x_axis_flags),
          std::to_underlying(opts.y_axis_flags)
        );

        const auto default_range = ImPlotRange(0, 1);
        ImPlot::SetupAxisLimits(
          ImAxis_X1, opts.x_min.value_or(default_range.Min), opts.x_max.value_or(default_range.Max), ImGuiCond_Always
        );
        ImPlot::SetupAxisLimits(
          ImAxis_Y1, opts.y_min.value_or(default_range.Min), opts.y_max.value_or(default_range.Max), ImGuiCond_Always
        );

        std::invoke(std::forward<Callback>(callback));

        ImPlot::EndPlot();
    }
}

void bars(const std::span<const std::string> labels, const std::span<const double> values);

// One lane per process name, one rectangle per slice.
void gantt(const std::span<const std::string> lanes, const std::span<const Os::TimeSlice> timeline);

} // namespace Plotting

} // namespace Gui
