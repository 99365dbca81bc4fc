#ifdef TESSERA_USE_GLFW

    #include "glfw_host_window.hpp"

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
    #include <tessera/logger.hpp>

namespace tessera::ui
{

GlfwHostWindow::~GlfwHostWindow()
{
    shutdown();
}

bool GlfwHostWindow::init(uint32_t width, uint32_t height, const std::string& title)
{
    if (!glfwInit())
    {
        TESSERA_LOG_ERROR("host", "Failed to initialize GLFW");
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    window_ = glfwCreateWindow(static_cast<int>(width), static_cast<int>(height), title.c_str(),
                               nullptr, nullptr);
    if (!window_)
    {
        TESSERA_LOG_ERROR("host", "Failed to create GLFW window");
        glfwTerminate();
        return false;
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetFramebufferSizeCallback(window_, framebuffer_size_callback);
    glfwSetWindowFocusCallback(window_, focus_callback);
    glfwSetWindowCloseCallback(window_, close_callback);
    return true;
}

void GlfwHostWindow::shutdown()
{
    if (!window_)
        return;
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

void GlfwHostWindow::poll_events()
{
    glfwPollEvents();
}

bool GlfwHostWindow::should_close() const
{
    return !window_ || glfwWindowShouldClose(window_);
}

void GlfwHostWindow::framebuffer_size(int& width, int& height) const
{
    width  = 0;
    height = 0;
    if (window_)
        glfwGetFramebufferSize(window_, &width, &height);
}

bool GlfwHostWindow::is_focused() const
{
    return window_ && glfwGetWindowAttrib(window_, GLFW_FOCUSED) == GLFW_TRUE;
}

// ─── Trampolines ─────────────────────────────────────────────────────────────

void GlfwHostWindow::framebuffer_size_callback(GLFWwindow* window, int width, int height)
{
    auto* self = static_cast<GlfwHostWindow*>(glfwGetWindowUserPointer(window));
    if (self && self->callbacks_.on_resize)
        self->callbacks_.on_resize(width, height);
}

void GlfwHostWindow::focus_callback(GLFWwindow* window, int focused)
{
    auto* self = static_cast<GlfwHostWindow*>(glfwGetWindowUserPointer(window));
    if (self && self->callbacks_.on_focus)
        self->callbacks_.on_focus(focused == GLFW_TRUE);
}

void GlfwHostWindow::close_callback(GLFWwindow* window)
{
    auto* self = static_cast<GlfwHostWindow*>(glfwGetWindowUserPointer(window));
    if (self && self->callbacks_.on_close)
        self->callbacks_.on_close();
}

}   // namespace tessera::ui

#endif   // TESSERA_USE_GLFW
