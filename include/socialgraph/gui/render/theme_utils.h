#pragma once

#include <imgui.h> // For ImU32, ImVec4

namespace socialgraph {
namespace gui {
namespace ThemeUtils {

// Dark style matching the graph canvas background.
void applyDarkTheme();

ImVec4 GetClearColor();
ImU32 GetToastColor(bool is_error);

} // namespace ThemeUtils
} // namespace gui
} // namespace socialgraph
