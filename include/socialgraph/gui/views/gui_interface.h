#pragma once

#include <socialgraph/core/ui_interface.h>
#include <socialgraph/graph/graph_types.h>

#include <chrono>
#include <deque>
#include <optional>
#include <string>

// Forward declaration for GLFW window handle
struct GLFWwindow;

namespace socialgraph {
namespace gui {

struct Toast {
    std::string message;
    Severity severity = Severity::Info;
    std::chrono::steady_clock::time_point expires_at;
};

/*
 * Desktop host: owns the GLFW window, the OpenGL context and the Dear ImGui
 * context, and implements the UserInterface contract with toasts, a status
 * line and the node info panel state.
 */
class GuiInterface : public UserInterface {
public:
    GuiInterface() = default;
    ~GuiInterface() override;

    // Prevent copying/moving
    GuiInterface(const GuiInterface&)            = delete;
    GuiInterface& operator=(const GuiInterface&) = delete;
    GuiInterface(GuiInterface&&)                 = delete;
    GuiInterface& operator=(GuiInterface&&)      = delete;

    // Implementation of the UserInterface contract
    void displayOutput(const std::string& output) override;
    void displayStatus(const std::string& status) override;
    void notify(const std::string& message, Severity severity) override;
    void showNodeDetails(const graph::GraphNode* node) override;
    void initialize() override;
    void shutdown() override;

    GLFWwindow* getWindow() const { return window; }

    // Starts and finishes an ImGui frame around the view code.
    void beginFrame();
    void endFrame();   // renders draw data into the back buffer
    void present();    // swaps buffers

    void requestClose();
    bool shouldClose() const;

    void setContentScale(float scale) { m_content_scale = scale > 0.0f ? scale : 1.0f; }
    float getDevicePixelRatio() const;

    const std::string& getStatus() const { return m_status; }
    const std::deque<Toast>& getToasts() const { return m_toasts; }
    const std::optional<graph::GraphNode>& getSelectedNode() const { return m_selected_node; }
    void dropExpiredToasts();

private:
    GLFWwindow* window = nullptr;
    bool m_imgui_init_done = false;
    float m_content_scale = 1.0f;
    std::string m_status;
    std::deque<Toast> m_toasts;
    std::optional<graph::GraphNode> m_selected_node;
};

} // namespace gui
} // namespace socialgraph
