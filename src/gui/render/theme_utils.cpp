#include <socialgraph/gui/render/theme_utils.h>

namespace socialgraph {
namespace gui {
namespace ThemeUtils {

void applyDarkTheme() {
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 6.0f;
    style.FrameRounding = 4.0f;
    style.GrabRounding = 4.0f;
    style.ChildRounding = 4.0f;
    style.WindowBorderSize = 0.0f;
    style.ItemSpacing = ImVec2(8.0f, 6.0f);

    ImVec4* colors = style.Colors;
    colors[ImGuiCol_WindowBg] = ImVec4(0.07f, 0.08f, 0.12f, 1.00f);
    colors[ImGuiCol_ChildBg] = ImVec4(0.05f, 0.05f, 0.09f, 1.00f);
    colors[ImGuiCol_FrameBg] = ImVec4(0.14f, 0.16f, 0.22f, 1.00f);
    colors[ImGuiCol_Button] = ImVec4(0.16f, 0.20f, 0.28f, 1.00f);
    colors[ImGuiCol_ButtonHovered] = ImVec4(0.00f, 0.60f, 0.36f, 1.00f);
    colors[ImGuiCol_ButtonActive] = ImVec4(0.00f, 0.80f, 0.48f, 1.00f);
    colors[ImGuiCol_SliderGrab] = ImVec4(0.00f, 1.00f, 0.53f, 1.00f);
    colors[ImGuiCol_SliderGrabActive] = ImVec4(0.00f, 0.80f, 0.42f, 1.00f);
    colors[ImGuiCol_Header] = ImVec4(0.16f, 0.20f, 0.28f, 1.00f);
}

ImVec4 GetClearColor() {
    return ImVec4(0.04f, 0.05f, 0.08f, 1.00f);
}

ImU32 GetToastColor(bool is_error) {
    return is_error ? IM_COL32(180, 40, 50, 235) : IM_COL32(40, 90, 160, 235);
}

} // namespace ThemeUtils
} // namespace gui
} // namespace socialgraph
