#include <socialgraph/gui/views/gui_interface.h>
#include <socialgraph/gui/render/theme_utils.h>
#include <socialgraph/core/event_dispatch.h>

#include <algorithm>
#include <iostream> // For error reporting during init/shutdown
#include <stdexcept>

// Include GUI library headers
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

namespace socialgraph {
namespace gui {

namespace {
constexpr auto kInfoToastLifetime = std::chrono::seconds(3);
constexpr auto kErrorToastLifetime = std::chrono::seconds(6);
constexpr std::size_t kMaxToasts = 4;
} // anonymous namespace

GuiInterface::~GuiInterface() {
    // Ensure shutdown is called, although it should be called explicitly
    if (window) {
        shutdown();
    }
}

void GuiInterface::initialize() {
    glfwSetErrorCallback(EventDispatch::glfw_error_callback);
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // Decide GL+GLSL versions
#if defined(__APPLE__)
    // GL 3.2 + GLSL 150
    const char* glsl_version = "#version 150";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#else
    // GL 3.3 + GLSL 330
    const char* glsl_version = "#version 330";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#endif

    window = glfwCreateWindow(1280, 800, "Social Network Graph", nullptr, nullptr);
    if (window == nullptr) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // Enable vsync

    glfwSetWindowUserPointer(window, this);
    glfwSetWindowContentScaleCallback(window, EventDispatch::glfw_content_scale_callback);

    float xscale = 1.0f;
    float yscale = 1.0f;
    glfwGetWindowContentScale(window, &xscale, &yscale);
    setContentScale(std::max(xscale, yscale));

    // --- Initialize ImGui ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ThemeUtils::applyDarkTheme();

    // Setup Platform/Renderer backends
    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        window = nullptr; // Prevent double free in destructor
        glfwTerminate();
        m_imgui_init_done = false;
        throw std::runtime_error("Failed to initialize ImGui GLFW backend");
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        window = nullptr; // Prevent double free in destructor
        glfwTerminate();
        m_imgui_init_done = false;
        throw std::runtime_error("Failed to initialize ImGui OpenGL3 backend");
    }

    m_imgui_init_done = true;
    std::cout << "GUI Initialized Successfully." << std::endl;
}

void GuiInterface::shutdown() {
    if (!window) return; // Prevent double shutdown

    std::cout << "Shutting down GUI..." << std::endl;

    if (m_imgui_init_done) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        m_imgui_init_done = false;
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    window = nullptr; // Mark as shut down
    std::cout << "GUI Shutdown Complete." << std::endl;
}

void GuiInterface::beginFrame() {
    glfwPollEvents();
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::GetIO().FontGlobalScale = m_content_scale;
    ImGui::NewFrame();
}

void GuiInterface::endFrame() {
    ImGui::Render();
    int display_w = 0;
    int display_h = 0;
    glfwGetFramebufferSize(window, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    const ImVec4 clear_color = ThemeUtils::GetClearColor();
    glClearColor(clear_color.x, clear_color.y, clear_color.z, clear_color.w);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

void GuiInterface::present() {
    glfwSwapBuffers(window);
}

void GuiInterface::requestClose() {
    if (window) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    }
}

bool GuiInterface::shouldClose() const {
    return window == nullptr || glfwWindowShouldClose(window);
}

float GuiInterface::getDevicePixelRatio() const {
    if (!m_imgui_init_done) {
        return m_content_scale;
    }
    const ImVec2 fb_scale = ImGui::GetIO().DisplayFramebufferScale;
    return std::max(fb_scale.x, 1.0f);
}

// --- Implementation of UserInterface contract ---

void GuiInterface::displayOutput(const std::string& output) {
    std::cout << output << std::endl;
}

void GuiInterface::displayStatus(const std::string& status) {
    m_status = status;
}

void GuiInterface::notify(const std::string& message, Severity severity) {
    Toast toast;
    toast.message = message;
    toast.severity = severity;
    toast.expires_at = std::chrono::steady_clock::now() +
        (severity == Severity::Error ? kErrorToastLifetime : kInfoToastLifetime);
    m_toasts.push_back(std::move(toast));
    while (m_toasts.size() > kMaxToasts) {
        m_toasts.pop_front();
    }
}

void GuiInterface::showNodeDetails(const graph::GraphNode* node) {
    if (node) {
        m_selected_node = *node;
    } else {
        m_selected_node.reset();
    }
}

void GuiInterface::dropExpiredToasts() {
    const auto now = std::chrono::steady_clock::now();
    m_toasts.erase(std::remove_if(m_toasts.begin(), m_toasts.end(),
                                  [now](const Toast& t) { return t.expires_at <= now; }),
                   m_toasts.end());
}

} // namespace gui
} // namespace socialgraph
