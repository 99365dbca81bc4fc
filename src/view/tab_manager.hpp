#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tessera/fwd.hpp>
#include <tessera/geometry.hpp>
#include <tessera/tab_state.hpp>
#include <vector>

#include "../ipc/message.hpp"
#include "surface_host.hpp"

namespace tessera::view
{

class ViewRegistry;

struct CreateTabResult
{
    ipc::ErrorCode error  = ipc::ErrorCode::None;
    TabId          tab_id = INVALID_TAB_ID;
};

// Owns the ordered tab list and active-tab pointer of every browser
// window in the view process, and is the single writer of TabState.
// Every change is published as one full-window state snapshot.
//
// Only the active tab's surface is ever attached, so a window has at
// most one compositing surface regardless of its tab count.
class TabManager
{
   public:
    using StateHandler  = std::function<void(WindowId, const BrowserState&)>;
    using WindowHandler = std::function<void(WindowId)>;
    using CrashHandler  = std::function<void(WindowId, TabId)>;

    TabManager(ViewRegistry& registry, std::string default_url);
    ~TabManager();

    TabManager(const TabManager&)            = delete;
    TabManager& operator=(const TabManager&) = delete;

    // Idempotent: an existing window only has its bounds updated.
    // A new window starts with one tab at `initial_url`, or the default
    // new-tab URL when empty or unusable.
    ipc::ErrorCode create_view(WindowId window_id, const Rect& bounds, const std::string& initial_url);

    CreateTabResult create_tab(WindowId window_id, const std::optional<std::string>& url);
    ipc::ErrorCode  switch_tab(WindowId window_id, TabId tab_id);

    // Closing the last tab tears the window down and fires the
    // window-closed handler.
    ipc::ErrorCode close_tab(WindowId window_id, TabId tab_id);

    // Back/forward without history are successful no-ops.  Reload of a
    // crashed tab recreates its surface.
    ipc::ErrorCode navigate(WindowId window_id, NavigationAction action);

    ipc::ErrorCode load_url(WindowId window_id, const std::string& url, NavSeq nav_seq);

    ipc::ErrorCode set_bounds(WindowId window_id, const RectF& bounds);
    ipc::ErrorCode set_visibility(WindowId window_id, bool visible, bool focused);
    ipc::ErrorCode show_and_focus(WindowId window_id);
    ipc::ErrorCode set_tab_group_title(WindowId window_id, std::optional<std::string> title);

    // Tolerant: destroying an unknown window is a no-op.
    void destroy_view(WindowId window_id);

    // Entries ascending; frozen or minimized windows are detached.
    bool restack(const std::vector<ipc::RestackEntry>& windows);

    const BrowserState* state(WindowId window_id) const;
    bool                has_window(WindowId window_id) const;
    std::vector<WindowId> window_ids() const;
    size_t              window_count() const { return windows_.size(); }

    const TabState* active_tab(WindowId window_id) const;
    Surface*        active_surface(WindowId window_id) const;
    bool            is_crashed(WindowId window_id, TabId tab_id) const;

    void set_state_handler(StateHandler handler) { state_handler_ = std::move(handler); }
    void set_window_closed_handler(WindowHandler handler) { closed_handler_ = std::move(handler); }
    void set_focus_handler(WindowHandler handler) { focus_handler_ = std::move(handler); }
    void set_crash_handler(CrashHandler handler) { crash_handler_ = std::move(handler); }

    const std::string& default_url() const { return default_url_; }

   private:
    struct WindowState
    {
        BrowserState    browser;
        Rect            bounds;
        bool            visible = true;
        std::set<TabId> crashed;
    };

    WindowState* find_window(WindowId window_id);
    TabId        add_tab(WindowId window_id, WindowState& win, const std::string& url);
    void         activate(WindowId              window_id,
                          WindowState&          win,
                          TabId                 tab_id,
                          std::optional<size_t> slot = std::nullopt);
    void         show_active(WindowId window_id, WindowState& win, std::optional<size_t> slot);
    void         recreate_surface(WindowId window_id, WindowState& win, TabState& tab);
    void         publish(WindowId window_id);

    void on_surface_event(WindowId window_id, TabId tab_id, const SurfaceEvent& ev);
    void on_surface_crashed(WindowId window_id, TabId tab_id);

    ViewRegistry&                    registry_;
    std::string                      default_url_;
    std::map<WindowId, WindowState> windows_;
    TabId                            next_tab_id_ = 1;

    StateHandler  state_handler_;
    WindowHandler closed_handler_;
    WindowHandler focus_handler_;
    CrashHandler  crash_handler_;
};

}   // namespace tessera::view
