#include "Gui.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <ranges>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace
{

ImFont* regular_font = nullptr;
ImFont* bold_font    = nullptr;

void glfw_error_callback(int error, const char* description)
{
    std::println(stderr, "[ERROR] (GLFW) error {}: {}", error, description);
}

[[nodiscard]] auto load_font(const std::filesystem::path& path, const float size) -> ImFont*
{
    auto& io = ImGui::GetIO();
    if (!std::filesystem::exists(path)) {
        std::println(stderr, "[NOTE] (gui) font {} not found, falling back to the builtin one", path.string());
        return io.Fonts->AddFontDefault();
    }

    return io.Fonts->AddFontFromFileTTF(path.string().c_str(), size);
}

[[nodiscard]] auto toast_level_to_color(const Gui::ToastLevel level) -> ImVec4
{
    switch (level) {
        case Gui::ToastLevel::Info: {
            return { 0.2F, 0.6F, 1.0F, 1.0F };
        }
        case Gui::ToastLevel::Error: {
            return { 1.0F, 0.2F, 0.2F, 1.0F };
        }
    }

    return { 1.0F, 0.2F, 0.2F, 1.0F };
}

} // namespace

namespace Gui
{

auto init_window(const std::string& title, const int width, const int height) -> std::optional<GLFWwindow*>
{
    glfwSetErrorCallback(glfw_error_callback);

    if (glfwInit() == 0) {
        std::println(stderr, "[ERROR] (GLFW) Failed to initialize");
        return std::nullopt;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (window == nullptr) {
        std::println(stderr, "[ERROR] (GLFW) Failed to create window");
        glfwTerminate();
        return std::nullopt;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(GLSL_VERSION);

    return window;
}

void shutdown(GLFWwindow* window)
{
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
}

void new_frame()
{
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void draw_call(GLFWwindow* window, const ImVec4& clear_color)
{
    ToastManager::render();
    ImGui::Render();
    int display_w = 0;
    int display_h = 0;
    glfwGetFramebufferSize(window, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    glClearColor(
      clear_color.x * clear_color.w, clear_color.y * clear_color.w, clear_color.z * clear_color.w, clear_color.w
    );
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
}

void load_default_fonts(const float regular_size, const float bold_size)
{
    auto& io = ImGui::GetIO();
    io.Fonts->Clear();

    regular_font   = load_font("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf", regular_size);
    io.FontDefault = regular_font;

    bold_font = load_font("/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf", bold_size);
}

void black_and_red_style()
{
    auto& style             = ImGui::GetStyle();
    style.WindowRounding    = 0.0F;
    style.ChildRounding     = 0.0F;
    style.FrameRounding     = 2.0F;
    style.GrabRounding      = 2.0F;
    style.WindowBorderSize  = 0.0F;
    style.FrameBorderSize   = 0.0F;
    style.ItemSpacing       = ImVec2(8.0F, 6.0F);
    style.ScrollbarRounding = 0.0F;

    auto* colors = style.Colors;

    constexpr static auto BLACK      = hex_colour_to_imvec4(0x181818);
    constexpr static auto DARK_GREY  = hex_colour_to_imvec4(0x232323);
    constexpr static auto GREY       = hex_colour_to_imvec4(0x2e2e2e);
    constexpr static auto LIGHT_GREY = hex_colour_to_imvec4(0x3a3a3a);
    constexpr static auto DARK_RED   = hex_colour_to_imvec4(0x7a1c1c);
    constexpr static auto RED        = hex_colour_to_imvec4(0xa82525);
    constexpr static auto LIGHT_RED  = hex_colour_to_imvec4(0xd23a3a);
    constexpr static auto WHITE      = hex_colour_to_imvec4(0xe6e6e6);

    colors[ImGuiCol_Text]                 = WHITE;
    colors[ImGuiCol_WindowBg]             = BLACK;
    colors[ImGuiCol_ChildBg]              = BLACK;
    colors[ImGuiCol_PopupBg]              = DARK_GREY;
    colors[ImGuiCol_Border]               = LIGHT_GREY;
    colors[ImGuiCol_FrameBg]              = DARK_GREY;
    colors[ImGuiCol_FrameBgHovered]       = GREY;
    colors[ImGuiCol_FrameBgActive]        = LIGHT_GREY;
    colors[ImGuiCol_TitleBg]              = DARK_RED;
    colors[ImGuiCol_TitleBgActive]        = DARK_RED;
    colors[ImGuiCol_TitleBgCollapsed]     = DARK_RED;
    colors[ImGuiCol_ScrollbarBg]          = BLACK;
    colors[ImGuiCol_ScrollbarGrab]        = GREY;
    colors[ImGuiCol_ScrollbarGrabHovered] = LIGHT_GREY;
    colors[ImGuiCol_ScrollbarGrabActive]  = RED;
    colors[ImGuiCol_CheckMark]            = LIGHT_RED;
    colors[ImGuiCol_SliderGrab]           = RED;
    colors[ImGuiCol_SliderGrabActive]     = LIGHT_RED;
    colors[ImGuiCol_Button]               = DARK_RED;
    colors[ImGuiCol_ButtonHovered]        = RED;
    colors[ImGuiCol_ButtonActive]         = LIGHT_RED;
    colors[ImGuiCol_Header]               = DARK_RED;
    colors[ImGuiCol_HeaderHovered]        = RED;
    colors[ImGuiCol_HeaderActive]         = LIGHT_RED;
    colors[ImGuiCol_TableHeaderBg]        = GREY;
    colors[ImGuiCol_TableRowBg]           = BLACK;
    colors[ImGuiCol_TableRowBgAlt]        = DARK_GREY;

    ImPlot::GetStyle().Colors[ImPlotCol_FrameBg] = BLACK;
    ImPlot::GetStyle().Colors[ImPlotCol_PlotBg]  = DARK_GREY;
}

[[nodiscard]] auto input_text_popup(const std::string& label, bool& condition) -> std::optional<std::string>
{
    auto center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5F, 0.5F));
    ImGui::SetNextWindowSize(ImVec2(300, 120), ImGuiCond_Appearing);

    std::array<char, 256> buffer {};
    ImGui::OpenPopup("##InputPopup");
    if (ImGui::BeginPopupModal("##InputPopup", &condition, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::SetKeyboardFocusHere();

        if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            condition = false;
            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return std::nullopt;
        }

        if (bold_font != nullptr) { ImGui::PushFont(bold_font); }
        Gui::text("{}: ", label);
        ImGui::SameLine();
        if (bold_font != nullptr) { ImGui::PopFont(); }

        if (ImGui::InputText("##InputText", buffer.data(), buffer.size(), ImGuiInputTextFlags_EnterReturnsTrue)) {
            condition = false;

            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return std::string(buffer.data());
        }

        ImGui::EndPopup();
    }

    return std::nullopt;
}

auto Texture::load_from_file(const std::filesystem::path& path) -> Texture
{
    int           width    = -1;
    int           height   = -1;
    int           channels = -1;
    std::uint8_t* bytes    = stbi_load(path.string().c_str(), &width, &height, &channels, 4);
    if (bytes == nullptr) {
        std::println(stderr, "[ERROR] (stb) Failed to load file: {}", path.string());
        return Texture(std::nullopt);
    }

    GLuint texture_id = 0;
    glGenTextures(1, &texture_id);
    glBindTexture(GL_TEXTURE_2D, texture_id);

    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, bytes);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);

    stbi_image_free(bytes);

    return Texture(texture_id);
}

Texture::~Texture()
{
    if (texture_id.has_value()) { glDeleteTextures(1, &texture_id.value()); }
}

Texture::Texture(Texture&& other) noexcept
  : texture_id { std::exchange(other.texture_id, std::nullopt) }
{}

Texture& Texture::operator=(Texture&& other) noexcept
{
    if (this != &other) {
        if (texture_id.has_value()) { glDeleteTextures(1, &texture_id.value()); }
        texture_id = std::exchange(other.texture_id, std::nullopt);
    }

    return *this;
}

void ToastManager::render()
{
    const auto delta_time    = std::chrono::duration<float>(ImGui::GetIO().DeltaTime);
    const auto spacing       = ImGui::GetStyle().ItemSpacing;
    const auto work_position = ImGui::GetMainViewport()->WorkPos;
    const auto work_size     = ImGui::GetMainViewport()->WorkSize;

    // Stacked upwards from the bottom right corner, newest last.
    float y_offset = 0.0F;
    for (auto it = toasts.begin(); it != toasts.end();) {
        auto& toast = *it;

        toast.duration -= delta_time;
        if (toast.duration <= std::chrono::seconds(0)) {
            it = toasts.erase(it);
            continue;
        }

        const auto toast_size = ImVec2(ImGui::CalcTextSize(toast.message.c_str()).x + (spacing.x * 2), 30);
        const auto position   = ImVec2 {
            work_position.x + work_size.x - toast_size.x - spacing.x,
            work_position.y + work_size.y - toast_size.y - spacing.y - y_offset,
        };

        constexpr static auto window_flags = Gui::WindowFlags::NoDecoration | Gui::WindowFlags::NoSavedSettings;

        ImGui::SetNextWindowPos(position);
        ImGui::SetNextWindowSize(toast_size);
        Gui::window(std::format("##Toast{}", std::distance(toasts.begin(), it)), window_flags, [&] {
            ImGui::PushStyleColor(ImGuiCol_Text, toast_level_to_color(toast.level));
            Gui::text("{}", toast.message);
            ImGui::PopStyleColor();
        });

        y_offset += toast_size.y + spacing.y;
        ++it;
    }
}

void toast(const std::string& message, const std::chrono::duration<float> duration, ToastLevel level)
{
    ToastManager::add(Toast {
      .message  = message,
      .duration = duration,
      .level    = level,
    });
}

namespace Plotting
{

void bars(const std::span<const std::string> labels, const std::span<const double> values)
{
    constexpr static auto BAR_WIDTH = 0.5F;

    std::vector<const char*> labels_cstr;
    for (const auto& label : labels) { labels_cstr.push_back(label.c_str()); }

    std::vector<double> positions {};
    positions.reserve(labels.size());
    for (std::size_t pos = 0; pos < labels.size(); ++pos) { positions.push_back(static_cast<double>(pos)); }

    ImPlot::SetupAxisTicks(ImAxis_X1, positions.data(), static_cast<int>(positions.size()), labels_cstr.data());

    const auto point = std::views::zip(positions, values);
    for (const auto& [idx, coords] : std::views::zip(std::views::iota(0UZ), point)) {
        const auto& [x, y] = coords;
        ImPlot::PushStyleColor(
          ImPlotCol_Fill, ImPlot::GetColormapColor(static_cast<int>(idx) % ImPlot::GetColormapSize())
        );
        ImPlot::PlotBars(labels_cstr[idx], &x, &y, 1, BAR_WIDTH);
        ImPlot::PopStyleColor();
    }

    // Hovering a bar shows its exact value.
    const ImPlotPoint mouse_position = ImPlot::GetPlotMousePos();
    for (const auto& [idx, position] : std::views::zip(std::views::iota(0UZ), positions)) {
        const auto half_width = BAR_WIDTH / 2.0;
        const auto x_range    = ImPlotRange(position - half_width, position + half_width);
        const auto y_range    = ImPlotRange(std::min(0.0, values[idx]), std::max(0.0, values[idx]));

        if (x_range.Contains(mouse_position.x) && y_range.Contains(mouse_position.y)) {
            if (ImPlot::IsPlotHovered()) { Gui::tooltip("{}: {:.3f}", labels[idx], values[idx]); }
        }
    }
}

void gantt(const std::span<const std::string> lanes, const std::span<const Os::TimeSlice> timeline)
{
    constexpr static auto HALF_HEIGHT = 0.35;

    std::vector<const char*> lanes_cstr;
    std::vector<double>      positions;
    for (const auto& [idx, lane] : std::views::zip(std::views::iota(0UZ), lanes)) {
        lanes_cstr.push_back(lane.c_str());
        positions.push_back(static_cast<double>(idx));
    }

    ImPlot::SetupAxisTicks(ImAxis_Y1, positions.data(), static_cast<int>(positions.size()), lanes_cstr.data());

    const auto lane_of = [&](const Os::TimeSlice& slice) -> std::optional<std::size_t> {
        const auto it = std::ranges::find(lanes, slice.name);
        if (it == lanes.end()) { return std::nullopt; }
        return static_cast<std::size_t>(std::distance(lanes.begin(), it));
    };

    ImPlot::PushPlotClipRect();
    auto* draw_list = ImPlot::GetPlotDrawList();
    for (const auto& slice : timeline) {
        const auto lane = lane_of(slice);
        if (!lane) { continue; }

        const auto y      = static_cast<double>(*lane);
        const auto top    = ImPlot::PlotToPixels(static_cast<double>(slice.start), y + HALF_HEIGHT);
        const auto bottom = ImPlot::PlotToPixels(static_cast<double>(slice.stop), y - HALF_HEIGHT);
        const auto colour = ImPlot::GetColormapColor(static_cast<int>(*lane) % ImPlot::GetColormapSize());

        draw_list->AddRectFilled(top, bottom, ImGui::GetColorU32(colour));
        draw_list->AddRect(top, bottom, ImGui::GetColorU32(ImGuiCol_Border));
    }
    ImPlot::PopPlotClipRect();

    if (!ImPlot::IsPlotHovered()) { return; }

    const ImPlotPoint mouse_position = ImPlot::GetPlotMousePos();
    for (const auto& slice : timeline) {
        const auto lane = lane_of(slice);
        if (!lane) { continue; }

        const auto y       = static_cast<double>(*lane);
        const auto x_range = ImPlotRange(static_cast<double>(slice.start), static_cast<double>(slice.stop));
        const auto y_range = ImPlotRange(y - HALF_HEIGHT, y + HALF_HEIGHT);
        if (x_range.Contains(mouse_position.x) && y_range.Contains(mouse_position.y)) {
            Gui::tooltip("{}: {} -> {}", slice.name, slice.start, slice.stop);
            break;
        }
    }
}

} // namespace Plotting

} // namespace Gui
