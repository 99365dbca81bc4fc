#include "workspace.hpp"

#include <tessera/logger.hpp>
#include <utility>
#include <variant>
#include <vector>

namespace tessera::ui
{

Workspace::Workspace(ViewClient& client, KeyValueStore& kv, const Config& config, ChromeInsets insets)
    : client_(client),
      kv_(kv),
      capture_timeout_(config.capture_timeout_ms),
      bounds_(client, insets),
      reconciler_(store_, client),
      lifecycle_(client)
{
    store_.set_change_handler([this](const WindowChange& change) { on_change(change); });

    client_.set_state_handler([this](WindowId w, const BrowserState& state)
                              { reconciler_.apply_state(w, state); });
    client_.set_crash_handler([this](WindowId w, TabId t) { reconciler_.on_surface_crashed(w, t); });
    client_.set_window_closed_handler(
        [this](WindowId w)
        {
            lifecycle_.forget(w);
            reconciler_.on_window_closed(w);
        });
    client_.set_focus_handler([this](WindowId w) { store_.set_focused(w); });
    client_.set_disconnect_handler(
        []() { TESSERA_LOG_ERROR("workspace", "Lost the view process; browser windows are frozen in place"); });
}

Workspace::~Workspace()
{
    store_.set_change_handler(nullptr);
    client_.set_state_handler(nullptr);
    client_.set_crash_handler(nullptr);
    client_.set_window_closed_handler(nullptr);
    client_.set_focus_handler(nullptr);
    client_.set_disconnect_handler(nullptr);
}

// ─── Layout ──────────────────────────────────────────────────────────────────

void Workspace::restore(std::function<void(bool)> done)
{
    store_.load(kv_,
                [this, done = std::move(done)](bool ok)
                {
                    dirty_ = false;
                    TESSERA_LOG_INFO("workspace", "Layout restored: {} windows, {} browser",
                                     store_.count(), controllers_.size());
                    if (done)
                        done(ok);
                });
}

void Workspace::save(KeyValueStore::DoneHandler done)
{
    dirty_  = false;
    saving_ = true;
    store_.save(kv_,
                [this, done = std::move(done)](bool ok)
                {
                    saving_ = false;
                    if (!ok)
                        dirty_ = true;
                    if (done)
                        done(ok);
                });
}

WindowId Workspace::open_browser(const RectF& bounds, const std::string& url)
{
    WindowMeta meta;
    meta.type   = WindowType::Browser;
    meta.title  = "Browser";
    meta.bounds = bounds;

    // Placeholder tab with no id: mount() opens its URL, and the first state
    // from the view process replaces it.
    meta.browser.emplace();
    if (!url.empty())
    {
        TabState tab;
        tab.url        = url;
        tab.is_loading = true;
        meta.browser->state.tabs.push_back(std::move(tab));
    }

    WindowId id = store_.add(std::move(meta));
    store_.set_focused(id);
    return id;
}

WindowId Workspace::open_panel(WindowType type, const RectF& bounds, const std::string& title)
{
    WindowMeta meta;
    meta.type   = type;
    meta.title  = title;
    meta.bounds = bounds;
    WindowId id = store_.add(std::move(meta));
    store_.set_focused(id);
    return id;
}

bool Workspace::close_window(WindowId id)
{
    return store_.remove(id);
}

BrowserWindowController* Workspace::controller(WindowId id)
{
    auto it = controllers_.find(id);
    return it == controllers_.end() ? nullptr : it->second.get();
}

// ─── Store changes ───────────────────────────────────────────────────────────

void Workspace::attach_controller(WindowId id)
{
    BrowserServices services{store_, client_, lifecycle_, bounds_, reconciler_};
    auto            ctrl = std::make_unique<BrowserWindowController>(id, services, capture_timeout_);
    auto* raw        = ctrl.get();
    controllers_[id] = std::move(ctrl);
    raw->mount();
}

void Workspace::on_change(const WindowChange& change)
{
    const WindowMeta* w = store_.find(change.id);

    switch (change.kind)
    {
        case WindowChangeKind::Added:
            if (w && w->type == WindowType::Browser)
                attach_controller(change.id);
            break;
        case WindowChangeKind::Removed:
        {
            auto it = controllers_.find(change.id);
            if (it != controllers_.end())
            {
                auto ctrl = std::move(it->second);
                controllers_.erase(it);
                ctrl->unmount();
            }
            break;
        }
        default:
            if (auto* ctrl = controller(change.id))
                ctrl->on_window_changed(change.kind);
            break;
    }

    switch (change.kind)
    {
        case WindowChangeKind::Added:
        case WindowChangeKind::Removed:
        case WindowChangeKind::Minimized:
        case WindowChangeKind::ZOrder:
        case WindowChangeKind::Freeze:
            bounds_.sync_stacking(store_);
            break;
        default:
            break;
    }

    switch (change.kind)
    {
        case WindowChangeKind::Focus:
        case WindowChangeKind::Freeze:
            break;
        default:
            dirty_ = true;
            break;
    }
}

// ─── Host window ─────────────────────────────────────────────────────────────

void Workspace::on_host_resized(int width, int height)
{
    TESSERA_LOG_DEBUG("workspace", "Host window resized to {}x{}", width, height);
    for (const auto& w : store_.windows())
        bounds_.update_window(w);
}

void Workspace::on_host_focus(bool focused)
{
    if (!focused)
    {
        focused_before_host_blur_ = store_.focused_window();
        store_.clear_focus();
        return;
    }
    if (focused_before_host_blur_)
    {
        store_.set_focused(*focused_before_host_blur_);
        focused_before_host_blur_.reset();
    }
}

// ─── Frame ───────────────────────────────────────────────────────────────────

void Workspace::frame(Clock::time_point now)
{
    client_.poll();
    client_.tick(now);

    for (auto& [id, ctrl] : controllers_)
        ctrl->tick(now);

    bounds_.on_frame();

    if (dirty_ && !saving_ && now - last_save_ >= autosave_interval_)
    {
        last_save_ = now;
        save();
    }
}

size_t Workspace::present()
{
    std::vector<std::pair<WindowId, std::string>> painted;
    for (const auto& w : store_.windows())
    {
        if (!w.browser)
            continue;
        if (const auto* s = std::get_if<FreezeAwaitingRender>(&w.browser->freeze))
            painted.emplace_back(w.id, s->snapshot.name);
    }

    size_t frozen = 0;
    for (const auto& [id, name] : painted)
    {
        auto* ctrl = controller(id);
        if (!ctrl)
            continue;
        ctrl->on_snapshot_painted(name);
        if (is_frozen(ctrl->freeze().state()))
            ++frozen;
    }
    return frozen;
}

}   // namespace tessera::ui
