#include <socialgraph/gui/render/imgui_draw_surface.h>

#include <GLFW/glfw3.h> // pulls in the system OpenGL header

#include <algorithm>
#include <cmath>
#include <cstring>

namespace socialgraph {
namespace gui {

void ImGuiDrawSurface::Begin(ImDrawList* draw_list, const ImVec2& canvas_pos, const ImVec2& canvas_size) {
    draw_list_ = draw_list;
    canvas_pos_ = canvas_pos;
    canvas_size_ = canvas_size;
    if (draw_list_) {
        draw_list_->PushClipRect(canvas_pos_, ImVec2(canvas_pos_.x + canvas_size_.x, canvas_pos_.y + canvas_size_.y), true);
    }
}

void ImGuiDrawSurface::End() {
    if (draw_list_) {
        draw_list_->PopClipRect();
        has_frame_ = true;
        last_canvas_pos_ = canvas_pos_;
        last_canvas_size_ = canvas_size_;
        last_scale_ = device_pixel_ratio_;
    }
    draw_list_ = nullptr;
}

void ImGuiDrawSurface::SetScale(float device_pixel_ratio) {
    // The OpenGL backend applies DisplayFramebufferScale itself; keep the ratio
    // to map the canvas onto framebuffer pixels for read-back.
    device_pixel_ratio_ = device_pixel_ratio > 0.0f ? device_pixel_ratio : 1.0f;
}

void ImGuiDrawSurface::Clear(ImU32 color) {
    if (!draw_list_) return;
    draw_list_->AddRectFilled(canvas_pos_, ImVec2(canvas_pos_.x + canvas_size_.x, canvas_pos_.y + canvas_size_.y), color);
}

void ImGuiDrawSurface::StrokePath(const std::vector<ImVec2>& points, ImU32 color, float thickness) {
    if (!draw_list_ || points.size() < 2) return;
    scratch_.clear();
    for (const auto& p : points) {
        scratch_.push_back(ToScreen(p));
    }
    draw_list_->AddPolyline(scratch_.data(), static_cast<int>(scratch_.size()), color, ImDrawFlags_None, thickness);
}

void ImGuiDrawSurface::FillCircle(const ImVec2& center, float radius, ImU32 color) {
    if (!draw_list_) return;
    draw_list_->AddCircleFilled(ToScreen(center), radius, color);
}

void ImGuiDrawSurface::StrokeCircle(const ImVec2& center, float radius, ImU32 color, float thickness) {
    if (!draw_list_) return;
    draw_list_->AddCircle(ToScreen(center), radius, color, 0, thickness);
}

void ImGuiDrawSurface::DrawText(const ImVec2& center, ImU32 color, const std::string& text) {
    if (!draw_list_ || text.empty()) return;
    ImVec2 size = ImGui::CalcTextSize(text.c_str());
    ImVec2 screen = ToScreen(center);
    draw_list_->AddText(ImVec2(screen.x - size.x * 0.5f, screen.y - size.y * 0.5f), color, text.c_str());
}

std::optional<graph::PixelBuffer> ImGuiDrawSurface::ReadPixels() {
    if (!has_frame_) return std::nullopt;

    const ImGuiIO& io = ImGui::GetIO();
    const float fb_scale_x = io.DisplayFramebufferScale.x > 0.0f ? io.DisplayFramebufferScale.x : last_scale_;
    const float fb_scale_y = io.DisplayFramebufferScale.y > 0.0f ? io.DisplayFramebufferScale.y : last_scale_;
    const int fb_height = static_cast<int>(std::lround(io.DisplaySize.y * fb_scale_y));

    const int x = static_cast<int>(std::lround(last_canvas_pos_.x * fb_scale_x));
    const int width = static_cast<int>(std::lround(last_canvas_size_.x * fb_scale_x));
    const int height = static_cast<int>(std::lround(last_canvas_size_.y * fb_scale_y));
    // OpenGL's origin is the bottom-left corner.
    const int y = fb_height - static_cast<int>(std::lround((last_canvas_pos_.y + last_canvas_size_.y) * fb_scale_y));
    if (width <= 0 || height <= 0) return std::nullopt;

    graph::PixelBuffer buffer;
    buffer.width = width;
    buffer.height = height;
    buffer.rgba.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);

    while (glGetError() != GL_NO_ERROR) {} // drop errors raised earlier in the frame
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadBuffer(GL_BACK);
    glReadPixels(std::max(0, x), std::max(0, y), width, height, GL_RGBA, GL_UNSIGNED_BYTE, buffer.rgba.data());
    if (glGetError() != GL_NO_ERROR) {
        return std::nullopt;
    }

    // Flip to top-down rows.
    const size_t row_bytes = static_cast<size_t>(width) * 4;
    std::vector<unsigned char> row(row_bytes);
    for (int top = 0, bottom = height - 1; top < bottom; ++top, --bottom) {
        unsigned char* a = buffer.rgba.data() + static_cast<size_t>(top) * row_bytes;
        unsigned char* b = buffer.rgba.data() + static_cast<size_t>(bottom) * row_bytes;
        std::memcpy(row.data(), a, row_bytes);
        std::memcpy(a, b, row_bytes);
        std::memcpy(b, row.data(), row_bytes);
    }
    return buffer;
}

} // namespace gui
} // namespace socialgraph
