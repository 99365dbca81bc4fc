#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <tessera/fwd.hpp>
#include <tessera/tab_state.hpp>
#include <vector>

#include "../ipc/message.hpp"
#include "freeze_controller.hpp"
#include "view_client.hpp"
#include "window_store.hpp"

namespace tessera::ui
{

class BoundsSynchronizer;
class StateReconciler;
class ViewLifecycle;

// Shared collaborators of every browser window.
struct BrowserServices
{
    WindowStore&        store;
    ViewClient&         client;
    ViewLifecycle&      lifecycle;
    BoundsSynchronizer& bounds;
    StateReconciler&    reconciler;
};

/**
 * BrowserWindowController — the UI-side owner of one browser window.
 *
 * Mounts the window's view, restores its persisted tabs, and turns
 * store changes for the window into geometry, visibility and freeze
 * transitions.  Tab and navigation commands from the window chrome go
 * through here.
 */
class BrowserWindowController
{
   public:
    BrowserWindowController(WindowId                  window_id,
                            const BrowserServices&    services,
                            std::chrono::milliseconds capture_timeout);

    BrowserWindowController(const BrowserWindowController&)            = delete;
    BrowserWindowController& operator=(const BrowserWindowController&) = delete;

    WindowId window_id() const { return window_id_; }

    void mount();
    void unmount();
    bool is_mounted() const { return mounted_; }

    void on_window_changed(WindowChangeKind kind);
    void on_snapshot_painted(const std::string& image_name);
    void tick(FreezeController::Clock::time_point now);

    // ─── Chrome commands ─────────────────────────────────────────────────

    ipc::ErrorCode load_url(const std::string& input, ReplyHandler done = nullptr);
    ipc::ErrorCode navigate(NavigationAction action, ReplyHandler done = nullptr);
    ipc::ErrorCode create_tab(const std::optional<std::string>& url, ReplyHandler done = nullptr);
    ipc::ErrorCode switch_tab(TabId tab_id, ReplyHandler done = nullptr);
    ipc::ErrorCode close_tab(TabId tab_id, ReplyHandler done = nullptr);

    FreezeController&       freeze() { return freeze_; }
    const FreezeController& freeze() const { return freeze_; }

   private:
    void on_mounted(const Reply& reply);
    void restore_tabs();
    void push_visibility();

    WindowId         window_id_;
    BrowserServices  services_;
    FreezeController freeze_;

    bool   mounted_        = false;
    bool   last_focused_   = false;
    bool   last_minimized_ = false;
    size_t last_tab_count_ = 0;

    // Persisted tabs beyond the first, recreated after the view exists.
    std::vector<std::string> restore_urls_;
    size_t                   restore_active_ = 0;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}   // namespace tessera::ui
