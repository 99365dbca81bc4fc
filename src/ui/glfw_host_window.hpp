#pragma once

#ifdef TESSERA_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <string>

struct GLFWwindow;

namespace tessera::ui
{

struct HostCallbacks
{
    std::function<void(int width, int height)> on_resize;
    std::function<void(bool focused)>          on_focus;
    std::function<void()>                      on_close;
};

// The top-level workspace window.  Browser surfaces are composited over
// its client area by the view process.
class GlfwHostWindow
{
   public:
    GlfwHostWindow() = default;
    ~GlfwHostWindow();

    GlfwHostWindow(const GlfwHostWindow&)            = delete;
    GlfwHostWindow& operator=(const GlfwHostWindow&) = delete;

    bool init(uint32_t width, uint32_t height, const std::string& title);
    void shutdown();

    void poll_events();
    bool should_close() const;

    void framebuffer_size(int& width, int& height) const;
    bool is_focused() const;

    void set_callbacks(HostCallbacks callbacks) { callbacks_ = std::move(callbacks); }

   private:
    GLFWwindow*   window_ = nullptr;
    HostCallbacks callbacks_;

    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
    static void focus_callback(GLFWwindow* window, int focused);
    static void close_callback(GLFWwindow* window);
};

}   // namespace tessera::ui

#endif   // TESSERA_USE_GLFW
