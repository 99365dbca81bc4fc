#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tessera/fwd.hpp>
#include <tessera/geometry.hpp>

#include "../core/config.hpp"
#include "bounds_synchronizer.hpp"
#include "browser_window_controller.hpp"
#include "kv_store.hpp"
#include "state_reconciler.hpp"
#include "view_client.hpp"
#include "view_lifecycle.hpp"
#include "window_store.hpp"

namespace tessera::ui
{

/**
 * Workspace — composition root of the UI process.
 *
 * Owns the window store and the browser-view machinery, routes view
 * process events into the StateReconciler, creates one
 * BrowserWindowController per browser window, and autosaves the layout
 * through the key-value store.
 *
 * Usage:
 *   Workspace ws(client, kv, config);
 *   ws.restore();
 *   while (running) ws.frame(Clock::now());
 */
class Workspace
{
   public:
    using Clock = std::chrono::steady_clock;

    Workspace(ViewClient& client, KeyValueStore& kv, const Config& config, ChromeInsets insets = {});
    ~Workspace();

    Workspace(const Workspace&)            = delete;
    Workspace& operator=(const Workspace&) = delete;

    // Loads the persisted layout; every browser window in it is mounted.
    void restore(std::function<void(bool)> done = nullptr);
    void save(KeyValueStore::DoneHandler done = nullptr);

    WindowId open_browser(const RectF& bounds, const std::string& url = {});
    WindowId open_panel(WindowType type, const RectF& bounds, const std::string& title);
    bool     close_window(WindowId id);

    BrowserWindowController* controller(WindowId id);
    size_t                   controller_count() const { return controllers_.size(); }

    // Host window notifications.
    void on_host_resized(int width, int height);
    void on_host_focus(bool focused);

    // One UI frame: drain the channel, expire timeouts, flush geometry,
    // autosave.
    void frame(Clock::time_point now);

    // The chrome has drawn every pending snapshot in place of its live
    // view.  Returns how many windows moved on to FROZEN.
    size_t present();

    WindowStore&        store() { return store_; }
    BoundsSynchronizer& bounds() { return bounds_; }
    StateReconciler&    reconciler() { return reconciler_; }
    ViewLifecycle&      lifecycle() { return lifecycle_; }

   private:
    void on_change(const WindowChange& change);
    void attach_controller(WindowId id);

    ViewClient&               client_;
    KeyValueStore&            kv_;
    std::chrono::milliseconds capture_timeout_;

    WindowStore        store_;
    BoundsSynchronizer bounds_;
    StateReconciler    reconciler_;
    ViewLifecycle      lifecycle_;

    std::map<WindowId, std::unique_ptr<BrowserWindowController>> controllers_;

    std::optional<WindowId> focused_before_host_blur_;

    bool                      dirty_  = false;
    bool                      saving_ = false;
    Clock::time_point         last_save_{};
    std::chrono::milliseconds autosave_interval_{1000};
};

}   // namespace tessera::ui
