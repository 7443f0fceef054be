#include <socialgraph/core/event_dispatch.h>
#include <socialgraph/gui/views/gui_interface.h>
#include <iostream>

namespace socialgraph {
namespace EventDispatch {

void glfw_error_callback(int error, const char* description) {
    std::cerr << "GLFW Error " << error << ": " << description << std::endl;
}

void glfw_content_scale_callback(GLFWwindow* window, float xscale, float yscale) {
    auto* gui_ui = static_cast<gui::GuiInterface*>(glfwGetWindowUserPointer(window));
    if (gui_ui) {
        gui_ui->setContentScale(xscale > yscale ? xscale : yscale);
    }
}

} // namespace EventDispatch
} // namespace socialgraph
