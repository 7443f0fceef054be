#pragma once

#include <socialgraph/graph/render/draw_surface.h>

#include <imgui.h>

#include <optional>
#include <string>
#include <vector>

namespace socialgraph {
namespace gui {

/*
 * DrawSurface over an ImGui draw list, bound to the canvas rectangle of the
 * current frame with Begin()/End(). It also reads the rendered canvas back
 * from the OpenGL back buffer for export; ReadPixels() is only meaningful
 * after ImGui_ImplOpenGL3_RenderDrawData() and before the buffer swap.
 */
class ImGuiDrawSurface : public graph::DrawSurface, public graph::PixelSource {
public:
    void Begin(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size);
    void End();

    // --- DrawSurface ---
    bool IsAvailable() const override { return draw_list_ != nullptr; }
    void SetScale(float device_pixel_ratio) override;
    void Clear(ImU32 color) override;
    void StrokePath(const std::vector<ImVec2>& points, ImU32 color, float thickness) override;
    void FillCircle(const ImVec2& center, float radius, ImU32 color) override;
    void StrokeCircle(const ImVec2& center, float radius, ImU32 color, float thickness) override;
    void DrawText(const ImVec2& center, ImU32 color, const std::string& text) override;

    // --- PixelSource ---
    std::optional<graph::PixelBuffer> ReadPixels() override;

    float GetScale() const { return device_pixel_ratio_; }

private:
    ImVec2 ToScreen(const ImVec2& canvas_point) const {
        return ImVec2(canvas_pos_.x + canvas_point.x, canvas_pos_.y + canvas_point.y);
    }

    ImDrawList* draw_list_ = nullptr;
    ImVec2 canvas_pos_ = ImVec2(0.0f, 0.0f);
    ImVec2 canvas_size_ = ImVec2(0.0f, 0.0f);
    float device_pixel_ratio_ = 1.0f;
    std::vector<ImVec2> scratch_;

    // Canvas rectangle of the last completed frame, used by ReadPixels().
    bool has_frame_ = false;
    ImVec2 last_canvas_pos_ = ImVec2(0.0f, 0.0f);
    ImVec2 last_canvas_size_ = ImVec2(0.0f, 0.0f);
    float last_scale_ = 1.0f;
};

} // namespace gui
} // namespace socialgraph
