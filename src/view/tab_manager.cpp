#include "tab_manager.hpp"

#include <algorithm>
#include <tessera/logger.hpp>

#include "../core/url.hpp"
#include "view_registry.hpp"

namespace tessera::view
{

using ipc::ErrorCode;

namespace
{

RectF to_rectf(const Rect& r)
{
    return RectF{static_cast<double>(r.x),
                 static_cast<double>(r.y),
                 static_cast<double>(r.width),
                 static_cast<double>(r.height)};
}

}   // namespace

TabManager::TabManager(ViewRegistry& registry, std::string default_url)
    : registry_(registry), default_url_(std::move(default_url))
{
    registry_.set_event_handler([this](WindowId w, TabId t, const SurfaceEvent& ev)
                                { on_surface_event(w, t, ev); });
    registry_.set_crash_handler([this](WindowId w, TabId t) { on_surface_crashed(w, t); });
}

TabManager::~TabManager()
{
    registry_.set_event_handler(nullptr);
    registry_.set_crash_handler(nullptr);
}

// ─── Window lifecycle ────────────────────────────────────────────────────────

ErrorCode TabManager::create_view(WindowId           window_id,
                                  const Rect&        bounds,
                                  const std::string& initial_url)
{
    if (window_id == INVALID_WINDOW_ID)
        return ErrorCode::InvalidArgument;

    if (auto* win = find_window(window_id))
    {
        TESSERA_LOG_DEBUG("tabs", "create_view: window {} already exists", window_id);
        win->bounds = bounds;
        if (auto* tab = win->browser.active_tab())
            registry_.set_bounds(window_id, tab->id, to_rectf(bounds));
        publish(window_id);
        return ErrorCode::None;
    }

    auto url = normalize_url(initial_url);
    if (!url)
        url = default_url_;

    WindowState& win = windows_[window_id];
    win.bounds       = bounds;

    TabId tab_id = add_tab(window_id, win, *url);
    activate(window_id, win, tab_id);

    TESSERA_LOG_INFO("tabs", "Created view for window {} at {}", window_id, *url);
    publish(window_id);
    return ErrorCode::None;
}

void TabManager::destroy_view(WindowId window_id)
{
    size_t released = registry_.destroy_window(window_id);
    if (windows_.erase(window_id) == 0)
    {
        TESSERA_LOG_DEBUG("tabs", "destroy_view: window {} not found", window_id);
        return;
    }
    TESSERA_LOG_INFO("tabs", "Destroyed view for window {} ({} surfaces)", window_id, released);
}

// ─── Tabs ────────────────────────────────────────────────────────────────────

CreateTabResult TabManager::create_tab(WindowId window_id, const std::optional<std::string>& url)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return {ErrorCode::UnknownWindow, INVALID_TAB_ID};

    std::string target = default_url_;
    if (url)
    {
        auto normalized = normalize_url(*url);
        if (!normalized)
            return {ErrorCode::InvalidUrl, INVALID_TAB_ID};
        target = *normalized;
    }

    TabId tab_id = add_tab(window_id, *win, target);
    activate(window_id, *win, tab_id);
    publish(window_id);

    TESSERA_LOG_DEBUG("tabs", "Window {}: created tab {} at {}", window_id, tab_id, target);
    return {ErrorCode::None, tab_id};
}

ErrorCode TabManager::switch_tab(WindowId window_id, TabId tab_id)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return ErrorCode::UnknownWindow;
    if (!win->browser.find_tab(tab_id))
        return ErrorCode::UnknownTab;
    if (win->browser.active_tab_id == tab_id)
        return ErrorCode::None;

    activate(window_id, *win, tab_id);
    publish(window_id);
    return ErrorCode::None;
}

ErrorCode TabManager::close_tab(WindowId window_id, TabId tab_id)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return ErrorCode::UnknownWindow;

    auto& tabs = win->browser.tabs;
    auto  it = std::find_if(tabs.begin(), tabs.end(), [tab_id](const TabState& t) { return t.id == tab_id; });
    if (it == tabs.end())
        return ErrorCode::UnknownTab;

    size_t index      = static_cast<size_t>(it - tabs.begin());
    bool   was_active = win->browser.active_tab_id == tab_id;
    auto   slot       = registry_.stack_slot(window_id, tab_id);
    tabs.erase(it);
    win->crashed.erase(tab_id);
    registry_.destroy_surface(window_id, tab_id);

    if (tabs.empty())
    {
        windows_.erase(window_id);
        TESSERA_LOG_INFO("tabs", "Closed last tab of window {}, closing window", window_id);
        if (closed_handler_)
            closed_handler_(window_id);
        return ErrorCode::None;
    }

    if (was_active)
    {
        // Left neighbour, or the new leftmost tab when the closed one was first.
        size_t next = index > 0 ? index - 1 : 0;
        win->browser.active_tab_id = INVALID_TAB_ID;
        activate(window_id, *win, tabs[next].id, slot);
    }
    publish(window_id);
    return ErrorCode::None;
}

TabId TabManager::add_tab(WindowId window_id, WindowState& win, const std::string& url)
{
    TabState tab;
    tab.id         = next_tab_id_++;
    tab.url        = url;
    tab.is_loading = true;
    win.browser.tabs.push_back(tab);

    Surface* surface = registry_.create_surface(window_id, tab.id, url);
    if (surface)
    {
        // Created on top; stays hidden until activated.
        registry_.set_visible(window_id, tab.id, false);
    }
    return tab.id;
}

void TabManager::activate(WindowId              window_id,
                          WindowState&          win,
                          TabId                 tab_id,
                          std::optional<size_t> slot)
{
    TabId previous = win.browser.active_tab_id;
    if (previous != INVALID_TAB_ID && previous != tab_id)
    {
        if (auto prev_slot = registry_.stack_slot(window_id, previous))
            slot = prev_slot;
        registry_.set_visible(window_id, previous, false);
    }

    win.browser.active_tab_id = tab_id;
    registry_.set_bounds(window_id, tab_id, to_rectf(win.bounds));
    show_active(window_id, win, slot);
}

// The window's surface goes back where the window sits in the stack;
// only a window with no known slot is shown on top.
void TabManager::show_active(WindowId window_id, WindowState& win, std::optional<size_t> slot)
{
    TabId active = win.browser.active_tab_id;
    if (win.visible && slot)
        registry_.attach_at(window_id, active, *slot);
    else
        registry_.set_visible(window_id, active, win.visible);
}

// ─── Navigation ──────────────────────────────────────────────────────────────

ErrorCode TabManager::navigate(WindowId window_id, NavigationAction action)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return ErrorCode::UnknownWindow;
    TabState* tab = win->browser.find_tab(win->browser.active_tab_id);
    if (!tab)
        return ErrorCode::UnknownTab;

    Surface* surface = registry_.find(window_id, tab->id);
    if (action == NavigationAction::Reload && (!surface || win->crashed.count(tab->id) > 0))
    {
        recreate_surface(window_id, *win, *tab);
        publish(window_id);
        return ErrorCode::None;
    }
    if (!surface)
        return ErrorCode::Internal;

    switch (action)
    {
        case NavigationAction::Back:
            if (!tab->can_go_back)
            {
                TESSERA_LOG_DEBUG("tabs", "Window {}: back ignored, no history", window_id);
                return ErrorCode::None;
            }
            surface->go_back();
            break;
        case NavigationAction::Forward:
            if (!tab->can_go_forward)
            {
                TESSERA_LOG_DEBUG("tabs", "Window {}: forward ignored, no history", window_id);
                return ErrorCode::None;
            }
            surface->go_forward();
            break;
        case NavigationAction::Reload:
            surface->reload();
            break;
        case NavigationAction::Stop:
            surface->stop();
            break;
    }
    return ErrorCode::None;
}

ErrorCode TabManager::load_url(WindowId window_id, const std::string& url, NavSeq nav_seq)
{
    auto normalized = normalize_url(url);
    if (!normalized)
    {
        TESSERA_LOG_WARN("tabs", "Window {}: rejected empty URL", window_id);
        return ErrorCode::InvalidUrl;
    }

    WindowState* win = find_window(window_id);
    if (!win)
        return ErrorCode::UnknownWindow;
    TabState* tab = win->browser.find_tab(win->browser.active_tab_id);
    if (!tab)
        return ErrorCode::UnknownTab;

    // The address bar reflects the target right away; navigation events
    // refine it (redirects) or mark the failure.
    tab->url        = *normalized;
    tab->is_loading = true;
    tab->error.reset();
    if (nav_seq != 0)
        tab->nav_seq = nav_seq;

    if (win->crashed.count(tab->id) > 0 || !registry_.find(window_id, tab->id))
    {
        recreate_surface(window_id, *win, *tab);
    }
    else
    {
        registry_.find(window_id, tab->id)->load_url(*normalized);
    }

    TESSERA_LOG_DEBUG("tabs", "Window {}: loading {} (seq {})", window_id, *normalized, nav_seq);
    publish(window_id);
    return ErrorCode::None;
}

void TabManager::recreate_surface(WindowId window_id, WindowState& win, TabState& tab)
{
    TESSERA_LOG_INFO("tabs", "Window {}: recreating surface for tab {}", window_id, tab.id);
    auto slot = registry_.stack_slot(window_id, tab.id);
    registry_.destroy_surface(window_id, tab.id);
    win.crashed.erase(tab.id);
    tab.error.reset();
    tab.is_loading     = true;
    tab.can_go_back    = false;
    tab.can_go_forward = false;

    registry_.create_surface(window_id, tab.id, tab.url);
    if (win.browser.active_tab_id == tab.id)
    {
        registry_.set_bounds(window_id, tab.id, to_rectf(win.bounds));
        show_active(window_id, win, slot);
    }
    else
    {
        registry_.set_visible(window_id, tab.id, false);
    }
}

// ─── Geometry and visibility ─────────────────────────────────────────────────

ErrorCode TabManager::set_bounds(WindowId window_id, const RectF& bounds)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return ErrorCode::UnknownWindow;

    auto rect = validate_rect(bounds);
    if (!rect)
        return ErrorCode::InvalidArgument;

    win->bounds = *rect;
    if (win->browser.active_tab_id != INVALID_TAB_ID)
        registry_.set_bounds(window_id, win->browser.active_tab_id, bounds);
    return ErrorCode::None;
}

ErrorCode TabManager::set_visibility(WindowId window_id, bool visible, bool focused)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return ErrorCode::UnknownWindow;

    win->visible = visible;
    TabId active = win->browser.active_tab_id;
    registry_.set_visible(window_id, active, visible);
    if (visible && focused)
    {
        if (Surface* surface = registry_.find(window_id, active))
            surface->focus();
    }
    return ErrorCode::None;
}

ErrorCode TabManager::show_and_focus(WindowId window_id)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return ErrorCode::UnknownWindow;

    win->visible = true;
    TabId active = win->browser.active_tab_id;
    if (!registry_.set_visible(window_id, active, true))
    {
        TESSERA_LOG_WARN("tabs", "show_and_focus: window {} has no active surface", window_id);
        return ErrorCode::Internal;
    }
    registry_.find(window_id, active)->focus();
    return ErrorCode::None;
}

ErrorCode TabManager::set_tab_group_title(WindowId window_id, std::optional<std::string> title)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return ErrorCode::UnknownWindow;
    if (win->browser.tab_group_title == title)
        return ErrorCode::None;
    win->browser.tab_group_title = std::move(title);
    publish(window_id);
    return ErrorCode::None;
}

bool TabManager::restack(const std::vector<ipc::RestackEntry>& windows)
{
    std::vector<ViewRegistry::StackEntry> entries;
    entries.reserve(windows.size());
    for (const auto& w : windows)
    {
        WindowState* win = find_window(w.window_id);
        if (!win)
        {
            TESSERA_LOG_DEBUG("tabs", "restack: skipping unknown window {}", w.window_id);
            continue;
        }
        bool hidden  = w.is_frozen || w.is_minimized;
        win->visible = !hidden;
        entries.push_back({w.window_id, win->browser.active_tab_id, hidden});
    }
    return registry_.restack(entries);
}

// ─── Queries ─────────────────────────────────────────────────────────────────

const BrowserState* TabManager::state(WindowId window_id) const
{
    auto it = windows_.find(window_id);
    return it == windows_.end() ? nullptr : &it->second.browser;
}

bool TabManager::has_window(WindowId window_id) const
{
    return windows_.count(window_id) > 0;
}

std::vector<WindowId> TabManager::window_ids() const
{
    std::vector<WindowId> ids;
    ids.reserve(windows_.size());
    for (const auto& [id, win] : windows_)
        ids.push_back(id);
    return ids;
}

const TabState* TabManager::active_tab(WindowId window_id) const
{
    const BrowserState* s = state(window_id);
    return s ? s->active_tab() : nullptr;
}

Surface* TabManager::active_surface(WindowId window_id) const
{
    const BrowserState* s = state(window_id);
    return s ? registry_.find(window_id, s->active_tab_id) : nullptr;
}

bool TabManager::is_crashed(WindowId window_id, TabId tab_id) const
{
    auto it = windows_.find(window_id);
    return it != windows_.end() && it->second.crashed.count(tab_id) > 0;
}

TabManager::WindowState* TabManager::find_window(WindowId window_id)
{
    auto it = windows_.find(window_id);
    return it == windows_.end() ? nullptr : &it->second;
}

void TabManager::publish(WindowId window_id)
{
    auto it = windows_.find(window_id);
    if (it == windows_.end() || !state_handler_)
        return;
    state_handler_(window_id, it->second.browser);
}

// ─── Surface events ──────────────────────────────────────────────────────────

void TabManager::on_surface_event(WindowId window_id, TabId tab_id, const SurfaceEvent& ev)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return;
    TabState* tab = win->browser.find_tab(tab_id);
    if (!tab)
        return;

    switch (ev.type)
    {
        case SurfaceEventType::StartLoading:
            tab->is_loading = true;
            tab->error.reset();
            break;
        case SurfaceEventType::Navigated:
            tab->url            = ev.url;
            tab->can_go_back    = ev.can_go_back;
            tab->can_go_forward = ev.can_go_forward;
            tab->error.reset();
            break;
        case SurfaceEventType::TitleUpdated:
            tab->title = ev.title;
            break;
        case SurfaceEventType::FaviconUpdated:
            if (ev.favicons.empty())
                return;
            tab->favicon_url = ev.favicons.front();
            break;
        case SurfaceEventType::FailedLoad:
            // Sub-frame failures and superseded loads are not page errors.
            if (!ev.is_main_frame || ev.error_code == ERR_ABORTED)
                return;
            tab->is_loading = false;
            tab->error      = "Failed to load " + ev.url + ": " + ev.error_description;
            TESSERA_LOG_WARN("tabs", "Window {} tab {}: {}", window_id, tab_id, *tab->error);
            break;
        case SurfaceEventType::StopLoading:
        {
            tab->is_loading = false;
            if (Surface* surface = registry_.find(window_id, tab_id))
            {
                tab->can_go_back    = surface->can_go_back();
                tab->can_go_forward = surface->can_go_forward();
            }
            break;
        }
        case SurfaceEventType::Focused:
            if (focus_handler_)
                focus_handler_(window_id);
            return;
        case SurfaceEventType::Crashed:
            on_surface_crashed(window_id, tab_id);
            return;
    }
    publish(window_id);
}

void TabManager::on_surface_crashed(WindowId window_id, TabId tab_id)
{
    WindowState* win = find_window(window_id);
    if (!win)
        return;
    TabState* tab = win->browser.find_tab(tab_id);
    if (!tab)
        return;

    win->crashed.insert(tab_id);
    tab->is_loading = false;
    tab->error      = "The page crashed";

    if (crash_handler_)
        crash_handler_(window_id, tab_id);
    publish(window_id);
}

}   // namespace tessera::view
