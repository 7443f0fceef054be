#pragma once

#include <GLFW/glfw3.h>

namespace socialgraph {
namespace EventDispatch {

void glfw_error_callback(int error, const char* description);

// Keeps the viewer's device pixel ratio in sync when the window moves between monitors.
void glfw_content_scale_callback(GLFWwindow* window, float xscale, float yscale);

} // namespace EventDispatch
} // namespace socialgraph
