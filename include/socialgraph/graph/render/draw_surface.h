#pragma once

#include <imgui.h> // ImVec2, ImU32

#include <optional>
#include <string>
#include <vector>

namespace socialgraph {
namespace graph {

/*
 * Immediate-mode 2D drawing capability used by the renderer.
 * Coordinates are canvas-relative and logical; SetScale() tells the backend
 * the device pixel ratio the frame is rendered at.
 */
class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    // False when no drawing context could be acquired; the renderer then skips the frame.
    virtual bool IsAvailable() const = 0;

    virtual void SetScale(float device_pixel_ratio) = 0;
    virtual void Clear(ImU32 color) = 0;
    virtual void StrokePath(const std::vector<ImVec2>& points, ImU32 color, float thickness) = 0;
    virtual void FillCircle(const ImVec2& center, float radius, ImU32 color) = 0;
    virtual void StrokeCircle(const ImVec2& center, float radius, ImU32 color, float thickness) = 0;
    // Draws text horizontally and vertically centered on `center`.
    virtual void DrawText(const ImVec2& center, ImU32 color, const std::string& text) = 0;
};

// Surface for hosts without a display (console front end).
class NullDrawSurface : public DrawSurface {
public:
    bool IsAvailable() const override { return false; }
    void SetScale(float) override {}
    void Clear(ImU32) override {}
    void StrokePath(const std::vector<ImVec2>&, ImU32, float) override {}
    void FillCircle(const ImVec2&, float, ImU32) override {}
    void StrokeCircle(const ImVec2&, float, ImU32, float) override {}
    void DrawText(const ImVec2&, ImU32, const std::string&) override {}
};

// Top-down RGBA8 pixel rows at device resolution.
struct PixelBuffer {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> rgba;
};

// Source of the currently rendered pixels, read back verbatim.
class PixelSource {
public:
    virtual ~PixelSource() = default;
    virtual std::optional<PixelBuffer> ReadPixels() = 0;
};

} // namespace graph
} // namespace socialgraph
